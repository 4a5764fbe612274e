#include "engine/page_cache.hpp"

#include "app/logging.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <numeric>
#include <sstream>

namespace arbor::engine {

PageCache::PageCache(size_t capacity, std::chrono::milliseconds base_ttl, ClockFn clock)
    : capacity_(std::max<size_t>(capacity, 1))
    , base_ttl_(base_ttl)
    , clock_(std::move(clock)) {}

std::chrono::milliseconds PageCache::adaptive_ttl(uint32_t access_count) const {
    const auto scale = 1.0 + 0.5 * std::log2(1.0 + static_cast<double>(access_count));
    const auto scaled = std::chrono::milliseconds(
        static_cast<int64_t>(static_cast<double>(base_ttl_.count()) * scale));
    return std::clamp<std::chrono::milliseconds>(scaled, MIN_TTL, MAX_TTL);
}

std::optional<std::vector<blocks::Block>> PageCache::get(const PageId& page_id) {
    auto it = entries_.find(page_id);
    if (it == entries_.end()) {
        ++misses_;
        return std::nullopt;
    }

    auto& entry = it->second;
    const auto age = std::chrono::duration_cast<std::chrono::milliseconds>(now() - entry.stored_at);
    const auto ttl = adaptive_ttl(entry.access_count);
    if (age > ttl) {
        qCDebug(arborCacheLog) << "TTL expired for page" << page_id.c_str()
                               << "age" << age.count() << "ms ttl" << ttl.count() << "ms";
        erase(page_id);
        ++ttl_expirations_;
        ++misses_;
        return std::nullopt;
    }

    ++hits_;
    ++entry.access_count;
    touch(entry);
    qCDebug(arborCacheLog) << "Cache hit for page" << page_id.c_str()
                           << "hit rate" << stats().hit_rate();
    return entry.blocks;
}

void PageCache::put(const PageId& page_id,
                    std::vector<blocks::Block> blocks,
                    std::optional<std::chrono::milliseconds> load_time) {
    if (load_time) {
        load_times_ms_.push_back(static_cast<double>(load_time->count()));
        if (load_times_ms_.size() > MAX_LOAD_SAMPLES) {
            load_times_ms_.erase(load_times_ms_.begin());
        }
    }

    if (auto it = entries_.find(page_id); it != entries_.end()) {
        it->second.blocks = std::move(blocks);
        it->second.stored_at = now();
        touch(it->second);
        return;
    }

    if (entries_.size() >= capacity_) {
        const auto victim = lru_.back();
        erase(victim);
        ++evictions_;
        qCDebug(arborCacheLog) << "Evicted page" << victim.c_str()
                               << "size" << entries_.size() << "/" << capacity_;
    }

    lru_.push_front(page_id);
    entries_.emplace(page_id, Entry{
        .blocks = std::move(blocks),
        .stored_at = now(),
        .access_count = 0,
        .lru_pos = lru_.begin(),
    });
}

void PageCache::invalidate(const PageId& page_id) {
    if (!entries_.contains(page_id)) {
        return;
    }
    erase(page_id);
    ++invalidations_;
    qCDebug(arborCacheLog) << "Invalidated page" << page_id.c_str();
}

void PageCache::invalidate_all() {
    invalidations_ += entries_.size();
    entries_.clear();
    lru_.clear();
}

CacheStatistics PageCache::stats() const {
    CacheStatistics s{
        .size = entries_.size(),
        .capacity = capacity_,
        .hits = hits_,
        .misses = misses_,
        .evictions = evictions_,
        .ttl_expirations = ttl_expirations_,
        .invalidations = invalidations_,
    };

    if (!load_times_ms_.empty()) {
        s.avg_load_time_ms = std::accumulate(load_times_ms_.begin(), load_times_ms_.end(), 0.0) /
                             static_cast<double>(load_times_ms_.size());
    }

    if (!entries_.empty()) {
        const auto t = now();
        auto oldest = std::chrono::milliseconds::min();
        auto newest = std::chrono::milliseconds::max();
        for (const auto& [id, entry] : entries_) {
            const auto age = std::chrono::duration_cast<std::chrono::milliseconds>(t - entry.stored_at);
            oldest = std::max(oldest, age);
            newest = std::min(newest, age);
        }
        s.oldest_entry_age = oldest;
        s.newest_entry_age = newest;
    }
    return s;
}

void PageCache::reset_stats() {
    hits_ = 0;
    misses_ = 0;
    evictions_ = 0;
    ttl_expirations_ = 0;
    invalidations_ = 0;
    load_times_ms_.clear();
}

std::string PageCache::report() const {
    const auto s = stats();
    std::ostringstream out;
    out << std::fixed << std::setprecision(1);
    out << "=== Page cache ===\n";
    out << "Size: " << s.size << "/" << s.capacity << " entries ("
        << 100.0 * static_cast<double>(s.size) / static_cast<double>(s.capacity) << "% full)\n";
    out << "Hit rate: " << s.hits << " hits / " << s.misses << " misses = "
        << s.hit_rate() << "%\n";
    out << "Evictions: " << s.evictions << "\n";
    out << "TTL expirations: " << s.ttl_expirations << "\n";
    out << "Invalidations: " << s.invalidations << "\n";
    out << std::setprecision(2) << "Avg load time: " << s.avg_load_time_ms << "ms\n";
    out << std::setprecision(1)
        << "Oldest entry: " << static_cast<double>(s.oldest_entry_age.count()) / 1000.0 << "s ago\n";
    out << "Newest entry: " << static_cast<double>(s.newest_entry_age.count()) / 1000.0 << "s ago";
    return out.str();
}

void PageCache::touch(Entry& entry) {
    lru_.splice(lru_.begin(), lru_, entry.lru_pos);
    entry.lru_pos = lru_.begin();
}

void PageCache::erase(const PageId& page_id) {
    auto it = entries_.find(page_id);
    if (it == entries_.end()) {
        return;
    }
    lru_.erase(it->second.lru_pos);
    entries_.erase(it);
}

} // namespace arbor::engine
