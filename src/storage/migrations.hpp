#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include <string>
#include <vector>

namespace studysync::storage {

/**
 * Migration - A database schema migration.
 */
struct Migration {
    int version;
    std::string name;
    std::string up_sql;
    std::string down_sql;  // Optional - for rollback
};

/**
 * SyncedTable - a table mirrored on the backend.
 *
 * Every INSERT/UPDATE/DELETE on it is captured into pending_operations by
 * triggers, unless capture is switched off in sync_control.
 */
struct SyncedTable {
    std::string name;
    std::vector<std::string> columns;  // "id" first
    std::string watermark_column;      // newest-change column used by downloads
};

/**
 * Synced tables in dependency order (parents before children).
 */
[[nodiscard]] const std::vector<SyncedTable>& synced_tables();

[[nodiscard]] const SyncedTable* find_synced_table(const std::string& name);

/**
 * All migrations in order.
 */
[[nodiscard]] const std::vector<Migration>& all_migrations();

/**
 * MigrationRunner - Runs database migrations.
 */
class MigrationRunner {
public:
    explicit MigrationRunner(Database& db) : db_(db) {}

    /**
     * Run all pending migrations.
     */
    [[nodiscard]] Result<void, Error> migrate();

    [[nodiscard]] Result<void, Error> migrate_to(int target_version);

    /**
     * Rollback the last migration.
     */
    [[nodiscard]] Result<void, Error> rollback();

    [[nodiscard]] Result<void, Error> rollback_to(int target_version);

    [[nodiscard]] Result<int, Error> current_version();

    [[nodiscard]] static int latest_version() {
        const auto& all = all_migrations();
        return all.empty() ? 0 : all.back().version;
    }

private:
    Database& db_;

    [[nodiscard]] Result<void, Error> ensure_migrations_table();
    [[nodiscard]] Result<void, Error> run_migration(const Migration& m);
    [[nodiscard]] Result<void, Error> run_rollback(const Migration& m);
    [[nodiscard]] Result<void, Error> set_version(const Migration& m);
};

/**
 * Initialize a database with all migrations.
 */
[[nodiscard]] inline Result<void, Error> initialize_database(Database& db) {
    MigrationRunner runner(db);
    return runner.migrate();
}

} // namespace studysync::storage
