#include <catch2/catch_test_macros.hpp>
#include "engine/page_cache.hpp"

#include <chrono>

using namespace arbor;
using arbor::engine::PageCache;
using namespace std::chrono_literals;

namespace {

struct FakeClock {
    PageCache::Clock::time_point now = PageCache::Clock::time_point{} + 1h;

    PageCache::ClockFn fn() {
        return [this] { return now; };
    }
};

std::vector<blocks::Block> page_blocks(const PageId& page_id, const std::string& content) {
    return {blocks::Block{
        .id = page_id + "-root",
        .page_id = page_id,
        .content = content,
        .order_weight = FractionalIndex::first(),
    }};
}

} // namespace

TEST_CASE("PageCache hits and misses", "[cache]") {
    FakeClock clock;
    PageCache cache(3, 30min, clock.fn());

    REQUIRE_FALSE(cache.get("p1").has_value());
    cache.put("p1", page_blocks("p1", "hello"), 12ms);

    auto cached = cache.get("p1");
    REQUIRE(cached.has_value());
    REQUIRE(cached->front().content == "hello");

    auto stats = cache.stats();
    REQUIRE(stats.hits == 1);
    REQUIRE(stats.misses == 1);
    REQUIRE(stats.hit_rate() == 50.0);
    REQUIRE(stats.avg_load_time_ms == 12.0);

    SECTION("Putting again replaces the blocks") {
        cache.put("p1", page_blocks("p1", "changed"));
        REQUIRE(cache.get("p1")->front().content == "changed");
        REQUIRE(cache.size() == 1);
    }

    SECTION("Invalidation") {
        cache.invalidate("p1");
        cache.invalidate("never cached");
        REQUIRE_FALSE(cache.contains("p1"));
        REQUIRE(cache.stats().invalidations == 1);
    }

    SECTION("Reset keeps the entries") {
        cache.reset_stats();
        REQUIRE(cache.stats().hits == 0);
        REQUIRE(cache.contains("p1"));
    }
}

TEST_CASE("PageCache evicts the least recently used page", "[cache]") {
    PageCache cache(2);
    cache.put("a", page_blocks("a", "A"));
    cache.put("b", page_blocks("b", "B"));

    // Reading a makes b the oldest.
    REQUIRE(cache.get("a").has_value());
    cache.put("c", page_blocks("c", "C"));

    REQUIRE(cache.contains("a"));
    REQUIRE_FALSE(cache.contains("b"));
    REQUIRE(cache.contains("c"));
    REQUIRE(cache.stats().evictions == 1);
}

TEST_CASE("PageCache adaptive TTL", "[cache]") {
    SECTION("Grows with use") {
        PageCache cache(10, 30min);
        REQUIRE(cache.adaptive_ttl(0) == 30min);
        REQUIRE(cache.adaptive_ttl(1) == 45min);
        REQUIRE(cache.adaptive_ttl(3) == 60min);
    }

    SECTION("Is clamped") {
        REQUIRE(PageCache(10, 1min).adaptive_ttl(0) == PageCache::MIN_TTL);
        REQUIRE(PageCache(10, 10h).adaptive_ttl(0) == PageCache::MAX_TTL);
    }

    SECTION("Expired entries are misses") {
        FakeClock clock;
        PageCache cache(10, 30min, clock.fn());
        cache.put("p", page_blocks("p", "x"));

        clock.now += 29min;
        REQUIRE(cache.get("p").has_value());

        // One hit stretches the TTL to 45 minutes.
        clock.now += 15min;
        REQUIRE(cache.get("p").has_value());

        clock.now += 61min;
        REQUIRE_FALSE(cache.get("p").has_value());
        REQUIRE_FALSE(cache.contains("p"));
        REQUIRE(cache.stats().ttl_expirations == 1);
    }
}

TEST_CASE("PageCache statistics report", "[cache]") {
    FakeClock clock;
    PageCache cache(4, 30min, clock.fn());
    cache.put("old", page_blocks("old", "x"));
    clock.now += 10s;
    cache.put("new", page_blocks("new", "y"));
    clock.now += 2s;

    auto stats = cache.stats();
    REQUIRE(stats.size == 2);
    REQUIRE(stats.capacity == 4);
    REQUIRE(stats.oldest_entry_age == 12s);
    REQUIRE(stats.newest_entry_age == 2s);

    const auto report = cache.report();
    REQUIRE(report.find("Size: 2/4 entries (50.0% full)") != std::string::npos);
    REQUIRE(report.find("Oldest entry: 12.0s ago") != std::string::npos);

    cache.invalidate_all();
    REQUIRE(cache.size() == 0);
    REQUIRE(cache.stats().invalidations == 2);
}
