#pragma once

#include <QString>

#include <chrono>

namespace arbor::app {

/**
 * EngineSettings - Tunables of the block engine and its page cache.
 *
 * Read from QSettings (keys under "engine/"), then overridden by
 * ARBOR_COMMIT_DEBOUNCE_MS and ARBOR_VERIFY_INVARIANTS when set.
 */
struct EngineSettings {
    std::chrono::milliseconds commit_debounce{300};
    int page_cache_capacity = 50;
    std::chrono::minutes page_cache_ttl{30};
    bool verify_invariants = false;
};

[[nodiscard]] int normalize_commit_debounce_ms(int ms);
[[nodiscard]] int normalize_page_cache_capacity(int capacity);
[[nodiscard]] int normalize_page_cache_ttl_minutes(int minutes);

[[nodiscard]] EngineSettings load_engine_settings();
void save_engine_settings(const EngineSettings& settings);

/**
 * Database location: ARBOR_DB_PATH if set, else arbor.db in the
 * application data directory (created on demand).
 */
[[nodiscard]] QString resolve_database_path();

} // namespace arbor::app
