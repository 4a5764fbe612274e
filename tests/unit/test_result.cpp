#include <catch2/catch_test_macros.hpp>
#include "core/result.hpp"

#include <string>

using namespace arbor;

TEST_CASE("Result::ok creates a success result", "[result]") {
    auto result = Result<int>::ok(42);

    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.is_err());
    REQUIRE(result.unwrap() == 42);
}

TEST_CASE("Result::err creates an error result", "[result]") {
    auto result = Result<int>::err(Error::persistence("disk I/O error", 10));

    REQUIRE_FALSE(result.is_ok());
    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().kind == ErrorKind::Persistence);
    REQUIRE(result.unwrap_err().message == "disk I/O error");
    REQUIRE(result.unwrap_err().code == 10);
}

TEST_CASE("Error factories set the kind", "[result]") {
    REQUIRE(Error::validation("bad").kind == ErrorKind::Validation);
    REQUIRE(Error::persistence("lost").kind == ErrorKind::Persistence);
    REQUIRE(Error::invariant("broken").kind == ErrorKind::Invariant);
    REQUIRE(kind_name(ErrorKind::Invariant) == "invariant");
}

TEST_CASE("Result::unwrap throws on error", "[result]") {
    auto result = Result<int>::err(Error{"error"});

    REQUIRE_THROWS_AS(result.unwrap(), std::runtime_error);
}

TEST_CASE("Result::unwrap_err throws on success", "[result]") {
    auto result = Result<int>::ok(1);

    REQUIRE_THROWS_AS(result.unwrap_err(), std::runtime_error);
}

TEST_CASE("Result::value_or returns default on error", "[result]") {
    auto ok_result = Result<int>::ok(42);
    auto err_result = Result<int>::err(Error{"error"});

    REQUIRE(ok_result.value_or(0) == 42);
    REQUIRE(err_result.value_or(0) == 0);
}

TEST_CASE("Result::map transforms success value", "[result]") {
    auto result = Result<int>::ok(21);
    auto mapped = result.map([](int x) { return x * 2; });

    REQUIRE(mapped.is_ok());
    REQUIRE(mapped.unwrap() == 42);
}

TEST_CASE("Result::map propagates error", "[result]") {
    auto result = Result<int>::err(Error::validation("error"));
    auto mapped = result.map([](int x) { return x * 2; });

    REQUIRE(mapped.is_err());
    REQUIRE(mapped.unwrap_err().kind == ErrorKind::Validation);
    REQUIRE(mapped.unwrap_err().message == "error");
}

TEST_CASE("Result::and_then chains operations", "[result]") {
    auto divide = [](int x) -> Result<int> {
        if (x == 0) return Result<int>::err(Error{"division by zero"});
        return Result<int>::ok(100 / x);
    };

    REQUIRE(Result<int>::ok(5).and_then(divide).unwrap() == 20);
    REQUIRE(Result<int>::ok(0).and_then(divide).is_err());
}

TEST_CASE("Result::and_then short-circuits on error", "[result]") {
    bool called = false;
    auto result = Result<int>::err(Error{"initial error"}).and_then([&](int x) {
        called = true;
        return Result<int>::ok(x);
    });

    REQUIRE_FALSE(called);
    REQUIRE(result.unwrap_err().message == "initial error");
}

TEST_CASE("Result::inspect_err sees only errors", "[result]") {
    int seen = 0;
    (void)Result<int>::ok(1).inspect_err([&](const Error&) { ++seen; });
    (void)Result<int>::err(Error{"x"}).inspect_err([&](const Error&) { ++seen; });
    (void)Result<void>::err(Error{"y"}).inspect_err([&](const Error&) { ++seen; });

    REQUIRE(seen == 2);
}

TEST_CASE("Result::match handles both cases", "[result]") {
    auto ok_result = Result<int>::ok(42);
    auto err_result = Result<int>::err(Error{"error"});

    auto ok_value = ok_result.match(
        [](int x) { return x; },
        [](const Error&) { return -1; }
    );

    auto err_value = err_result.match(
        [](int x) { return x; },
        [](const Error&) { return -1; }
    );

    REQUIRE(ok_value == 42);
    REQUIRE(err_value == -1);
}

TEST_CASE("Result<void> works correctly", "[result]") {
    auto ok_result = Result<void>::ok();
    auto err_result = Result<void>::err(Error::invariant("error"));

    REQUIRE(ok_result.is_ok());
    REQUIRE(err_result.is_err());
    REQUIRE(err_result.unwrap_err().kind == ErrorKind::Invariant);

    REQUIRE_NOTHROW(ok_result.unwrap());
    REQUIRE_THROWS(err_result.unwrap());
}

TEST_CASE("Result<void>::and_then continues only on success", "[result]") {
    auto next = [] { return Result<std::string>::ok("done"); };

    REQUIRE(Result<void>::ok().and_then(next).unwrap() == "done");
    REQUIRE(Result<void>::err(Error{"stop"}).and_then(next).is_err());
}

TEST_CASE("Result chaining works with different types", "[result]") {
    auto result = Result<int>::ok(5)
        .map([](int x) { return std::to_string(x); })
        .map([](const std::string& s) { return s + " items"; });

    REQUIRE(result.is_ok());
    REQUIRE(result.unwrap() == "5 items");
}

TEST_CASE("Result may carry the same type on both sides", "[result]") {
    auto ok = Result<Error>::ok(Error{"payload"});
    auto err = Result<Error>::err(Error{"failure"});

    REQUIRE(ok.is_ok());
    REQUIRE(ok.unwrap().message == "payload");
    REQUIRE(err.is_err());
    REQUIRE(err.unwrap_err().message == "failure");
}
