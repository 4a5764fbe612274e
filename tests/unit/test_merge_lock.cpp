#include <catch2/catch_test_macros.hpp>
#include "engine/merge_lock.hpp"

#include <memory>

using arbor::engine::MergeLock;

TEST_CASE("MergeLock holds a pair", "[merge_lock]") {
    MergeLock lock;

    auto guard = lock.try_acquire("q", "p");
    REQUIRE(guard.has_value());
    REQUIRE(guard->owns_lock());
    REQUIRE(lock.is_locked("q"));
    REQUIRE(lock.is_locked("p"));
    REQUIRE_FALSE(lock.is_locked("other"));

    SECTION("Either id blocks another acquisition") {
        REQUIRE_FALSE(lock.try_acquire("q", "x").has_value());
        REQUIRE_FALSE(lock.try_acquire("y", "p").has_value());
        REQUIRE(lock.try_acquire("x", "y").has_value());
    }

    SECTION("Release is idempotent") {
        guard->release();
        guard->release();
        REQUIRE_FALSE(guard->owns_lock());
        REQUIRE_FALSE(lock.any_held());
    }

    SECTION("Destroying the guard releases") {
        guard.reset();
        REQUIRE_FALSE(lock.is_locked("q"));
        REQUIRE(lock.try_acquire("q", "p").has_value());
    }

    SECTION("Moving the guard moves ownership") {
        MergeLock::Guard moved = std::move(*guard);
        REQUIRE_FALSE(guard->owns_lock());
        REQUIRE(moved.owns_lock());

        guard.reset();
        REQUIRE(lock.is_locked("q"));
        moved.release();
        REQUIRE_FALSE(lock.is_locked("q"));
    }
}

TEST_CASE("MergeLock guard may outlive the lock", "[merge_lock]") {
    auto lock = std::make_unique<MergeLock>();
    auto guard = lock->try_acquire("a", "b");
    REQUIRE(guard.has_value());

    lock.reset();
    guard->release();
    REQUIRE_FALSE(guard->owns_lock());
}
