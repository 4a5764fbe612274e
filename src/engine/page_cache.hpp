#pragma once

#include "core/block_types.hpp"

#include <chrono>
#include <functional>
#include <list>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace arbor::engine {

/**
 * CacheStatistics - Counters of a PageCache since construction or the last
 * reset_stats().
 */
struct CacheStatistics {
    size_t size = 0;
    size_t capacity = 0;
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;
    uint64_t ttl_expirations = 0;
    uint64_t invalidations = 0;
    double avg_load_time_ms = 0.0;
    std::chrono::milliseconds oldest_entry_age{0};
    std::chrono::milliseconds newest_entry_age{0};

    [[nodiscard]] double hit_rate() const {
        const auto total = hits + misses;
        return total == 0 ? 0.0 : 100.0 * static_cast<double>(hits) / static_cast<double>(total);
    }
};

/**
 * PageCache - Least-recently-used cache of loaded pages.
 *
 * Entries expire after an adaptive TTL that grows with the number of hits:
 *   ttl = base * (1 + 0.5 * log2(1 + access_count)), clamped to [5 min, 2 h].
 * Any mutation of a page must invalidate it.
 */
class PageCache {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;

    static constexpr size_t DEFAULT_CAPACITY = 50;
    static constexpr std::chrono::minutes DEFAULT_TTL{30};
    static constexpr std::chrono::minutes MIN_TTL{5};
    static constexpr std::chrono::minutes MAX_TTL{120};

    explicit PageCache(size_t capacity = DEFAULT_CAPACITY,
                       std::chrono::milliseconds base_ttl = DEFAULT_TTL,
                       ClockFn clock = {});

    /**
     * Cached blocks of a page, or nullopt on a miss or an expired entry.
     */
    [[nodiscard]] std::optional<std::vector<blocks::Block>> get(const PageId& page_id);

    /**
     * Store a freshly loaded page. load_time feeds the average load time.
     */
    void put(const PageId& page_id,
             std::vector<blocks::Block> blocks,
             std::optional<std::chrono::milliseconds> load_time = std::nullopt);

    void invalidate(const PageId& page_id);
    void invalidate_all();

    [[nodiscard]] bool contains(const PageId& page_id) const { return entries_.contains(page_id); }
    [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }

    [[nodiscard]] std::chrono::milliseconds adaptive_ttl(uint32_t access_count) const;

    [[nodiscard]] CacheStatistics stats() const;
    void reset_stats();

    /**
     * Multi-line human readable summary of stats().
     */
    [[nodiscard]] std::string report() const;

private:
    struct Entry {
        std::vector<blocks::Block> blocks;
        Clock::time_point stored_at;
        uint32_t access_count = 0;
        std::list<PageId>::iterator lru_pos;
    };

    static constexpr size_t MAX_LOAD_SAMPLES = 100;

    [[nodiscard]] Clock::time_point now() const { return clock_ ? clock_() : Clock::now(); }
    void touch(Entry& entry);
    void erase(const PageId& page_id);

    size_t capacity_;
    std::chrono::milliseconds base_ttl_;
    ClockFn clock_;

    std::unordered_map<PageId, Entry> entries_;
    std::list<PageId> lru_;  // most recent first

    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
    uint64_t evictions_ = 0;
    uint64_t ttl_expirations_ = 0;
    uint64_t invalidations_ = 0;
    std::vector<double> load_times_ms_;
};

} // namespace arbor::engine
