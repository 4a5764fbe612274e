#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include <string>
#include <vector>

namespace arbor::storage {

/**
 * Migration - A database schema migration.
 */
struct Migration {
    int version;
    std::string name;
    std::string up_sql;
};

/**
 * All migrations in order.
 */
inline const std::vector<Migration> ALL_MIGRATIONS = {
    {
        .version = 1,
        .name = "initial_schema",
        .up_sql = R"SQL(
            CREATE TABLE IF NOT EXISTS pages (
                id TEXT PRIMARY KEY,
                title TEXT NOT NULL DEFAULT '',
                created_at INTEGER NOT NULL,
                updated_at INTEGER NOT NULL
            );

            -- Deleting a block deletes its subtree through parent_id.
            CREATE TABLE IF NOT EXISTS blocks (
                id TEXT PRIMARY KEY,
                page_id TEXT NOT NULL REFERENCES pages(id) ON DELETE CASCADE,
                parent_id TEXT REFERENCES blocks(id) ON DELETE CASCADE,
                content TEXT NOT NULL DEFAULT '',
                order_weight TEXT NOT NULL,
                is_collapsed INTEGER NOT NULL DEFAULT 0,
                block_type TEXT NOT NULL DEFAULT 'bullet',
                language TEXT,
                created_at INTEGER NOT NULL,
                updated_at INTEGER NOT NULL
            );
            CREATE INDEX IF NOT EXISTS idx_blocks_page ON blocks(page_id);
            CREATE INDEX IF NOT EXISTS idx_blocks_parent_order ON blocks(page_id, parent_id, order_weight);
        )SQL"
    },
    {
        .version = 2,
        .name = "block_metadata",
        .up_sql = R"SQL(
            CREATE TABLE IF NOT EXISTS block_metadata (
                block_id TEXT NOT NULL REFERENCES blocks(id) ON DELETE CASCADE,
                key TEXT NOT NULL,
                value TEXT NOT NULL,
                PRIMARY KEY (block_id, key)
            );
        )SQL"
    }
};

/**
 * MigrationRunner - Brings a database up to the latest schema version,
 * recording applied versions in schema_migrations.
 */
class MigrationRunner {
public:
    explicit MigrationRunner(Database& db) : db_(db) {}

    [[nodiscard]] Result<void> migrate();
    [[nodiscard]] Result<void> migrate_to(int target_version);
    [[nodiscard]] Result<int> current_version();

    [[nodiscard]] static int latest_version() {
        return ALL_MIGRATIONS.empty() ? 0 : ALL_MIGRATIONS.back().version;
    }

private:
    Database& db_;

    [[nodiscard]] Result<void> ensure_migrations_table();
    [[nodiscard]] Result<void> run_migration(const Migration& m);
    [[nodiscard]] Result<void> set_version(const Migration& m);
};

/**
 * Initialize a database with all migrations.
 */
[[nodiscard]] inline Result<void> initialize_database(Database& db) {
    MigrationRunner runner(db);
    return runner.migrate();
}

} // namespace arbor::storage
