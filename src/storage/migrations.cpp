#include "storage/migrations.hpp"

#include "core/types.hpp"

namespace studysync::storage {

namespace {

std::string json_object_of(const SyncedTable& table, const std::string& alias) {
    std::string out = "json_object(";
    for (size_t i = 0; i < table.columns.size(); ++i) {
        if (i > 0) out += ", ";
        out += "'" + table.columns[i] + "', " + alias + "." + table.columns[i];
    }
    out += ")";
    return out;
}

// New row minus the columns an UPDATE left as they were. id and the
// watermark are always kept. Removing "$._" is a no-op.
std::string changed_fields_of(const SyncedTable& table) {
    std::string out = "json_remove(" + json_object_of(table, "new");
    for (const auto& column : table.columns) {
        if (column == "id" || column == table.watermark_column) continue;
        out += ", CASE WHEN new." + column + " IS old." + column + " THEN '$." + column +
               "' ELSE '$._' END";
    }
    out += ")";
    return out;
}

// AFTER INSERT -> PUT (full row), AFTER UPDATE -> PATCH (changed columns),
// AFTER DELETE -> DELETE (no payload).
std::string capture_triggers_sql(const SyncedTable& table) {
    const std::string& t = table.name;
    const std::string when =
        "WHEN (SELECT capture_enabled FROM sync_control WHERE id = 1) = 1";
    std::string sql;
    sql += "CREATE TRIGGER IF NOT EXISTS " + t + "_capture_insert AFTER INSERT ON " + t + " " +
           when + " BEGIN INSERT INTO pending_operations (op, table_name, record_id, data) "
           "VALUES ('PUT', '" + t + "', new.id, " + json_object_of(table, "new") + "); END;\n";
    sql += "CREATE TRIGGER IF NOT EXISTS " + t + "_capture_update AFTER UPDATE ON " + t + " " +
           when + " BEGIN INSERT INTO pending_operations (op, table_name, record_id, data) "
           "VALUES ('PATCH', '" + t + "', new.id, " + changed_fields_of(table) + "); END;\n";
    sql += "CREATE TRIGGER IF NOT EXISTS " + t + "_capture_delete AFTER DELETE ON " + t + " " +
           when + " BEGIN INSERT INTO pending_operations (op, table_name, record_id, data) "
           "VALUES ('DELETE', '" + t + "', old.id, NULL); END;\n";
    return sql;
}

std::string drop_capture_triggers_sql(const SyncedTable& table) {
    const std::string& t = table.name;
    return "DROP TRIGGER IF EXISTS " + t + "_capture_delete;\n"
           "DROP TRIGGER IF EXISTS " + t + "_capture_update;\n"
           "DROP TRIGGER IF EXISTS " + t + "_capture_insert;\n";
}

std::vector<Migration> build_migrations() {
    std::vector<Migration> out;

    out.push_back({
        .version = 1,
        .name = "initial_schema",
        .up_sql = R"SQL(
            CREATE TABLE IF NOT EXISTS decks (
                id TEXT PRIMARY KEY,
                user_id TEXT NOT NULL DEFAULT '',
                parent_id TEXT,
                name TEXT NOT NULL,
                description TEXT NOT NULL DEFAULT '',
                created_at TEXT NOT NULL,
                modified_at TEXT NOT NULL
            );
            CREATE INDEX IF NOT EXISTS idx_decks_parent ON decks(parent_id);

            CREATE TABLE IF NOT EXISTS cards (
                id TEXT PRIMARY KEY,
                user_id TEXT NOT NULL DEFAULT '',
                deck_id TEXT,
                front TEXT NOT NULL DEFAULT '',
                back TEXT NOT NULL DEFAULT '',
                stability REAL NOT NULL DEFAULT 0,
                difficulty REAL NOT NULL DEFAULT 0,
                state INTEGER NOT NULL DEFAULT 0,
                lapses INTEGER NOT NULL DEFAULT 0,
                next_review_date TEXT,
                last_review_date TEXT,
                total_reviews INTEGER NOT NULL DEFAULT 0,
                correct_reviews INTEGER NOT NULL DEFAULT 0,
                created_at TEXT NOT NULL,
                modified_at TEXT NOT NULL
            );
            CREATE INDEX IF NOT EXISTS idx_cards_deck ON cards(deck_id);
            CREATE INDEX IF NOT EXISTS idx_cards_next_review ON cards(next_review_date);

            CREATE TABLE IF NOT EXISTS media (
                id TEXT PRIMARY KEY,
                user_id TEXT NOT NULL DEFAULT '',
                hash TEXT NOT NULL,
                format TEXT NOT NULL,
                storage_path TEXT NOT NULL,
                size_bytes INTEGER NOT NULL DEFAULT 0,
                created_at TEXT NOT NULL
            );
            CREATE INDEX IF NOT EXISTS idx_media_hash ON media(hash);
        )SQL",
        .down_sql = R"SQL(
            DROP TABLE IF EXISTS media;
            DROP TABLE IF EXISTS cards;
            DROP TABLE IF EXISTS decks;
        )SQL"
    });

    std::string capture_up = R"SQL(
        CREATE TABLE IF NOT EXISTS pending_operations (
            position INTEGER PRIMARY KEY AUTOINCREMENT,
            op TEXT NOT NULL CHECK (op IN ('PUT', 'PATCH', 'DELETE')),
            table_name TEXT NOT NULL,
            record_id TEXT NOT NULL,
            data TEXT,
            created_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%fZ', 'now'))
        );
        CREATE INDEX IF NOT EXISTS idx_pending_record ON pending_operations(table_name, record_id);

        CREATE TABLE IF NOT EXISTS sync_control (
            id INTEGER PRIMARY KEY CHECK (id = 1),
            capture_enabled INTEGER NOT NULL DEFAULT 1
        );
        INSERT OR IGNORE INTO sync_control (id, capture_enabled) VALUES (1, 1);
    )SQL";
    std::string capture_down;
    for (const auto& table : synced_tables()) {
        capture_up += capture_triggers_sql(table);
        capture_down += drop_capture_triggers_sql(table);
    }
    capture_down += R"SQL(
        DROP TABLE IF EXISTS sync_control;
        DROP TABLE IF EXISTS pending_operations;
    )SQL";

    out.push_back({
        .version = 2,
        .name = "mutation_log",
        .up_sql = std::move(capture_up),
        .down_sql = std::move(capture_down)
    });

    out.push_back({
        .version = 3,
        .name = "sync_checkpoints",
        .up_sql = R"SQL(
            CREATE TABLE IF NOT EXISTS sync_checkpoints (
                table_name TEXT PRIMARY KEY,
                last_modified TEXT NOT NULL
            );
        )SQL",
        .down_sql = R"SQL(
            DROP TABLE IF EXISTS sync_checkpoints;
        )SQL"
    });

    return out;
}

} // namespace

const std::vector<SyncedTable>& synced_tables() {
    static const std::vector<SyncedTable> tables = {
        {
            .name = "decks",
            .columns = {"id", "user_id", "parent_id", "name", "description",
                        "created_at", "modified_at"},
            .watermark_column = "modified_at"
        },
        {
            .name = "cards",
            .columns = {"id", "user_id", "deck_id", "front", "back", "stability",
                        "difficulty", "state", "lapses", "next_review_date",
                        "last_review_date", "total_reviews", "correct_reviews",
                        "created_at", "modified_at"},
            .watermark_column = "modified_at"
        },
        {
            .name = "media",
            .columns = {"id", "user_id", "hash", "format", "storage_path",
                        "size_bytes", "created_at"},
            .watermark_column = "created_at"
        },
    };
    return tables;
}

const SyncedTable* find_synced_table(const std::string& name) {
    for (const auto& table : synced_tables()) {
        if (table.name == name) return &table;
    }
    return nullptr;
}

const std::vector<Migration>& all_migrations() {
    static const std::vector<Migration> migrations = build_migrations();
    return migrations;
}

Result<void, Error> MigrationRunner::ensure_migrations_table() {
    return db_.execute(R"SQL(
        CREATE TABLE IF NOT EXISTS schema_migrations (
            version INTEGER PRIMARY KEY,
            name TEXT NOT NULL,
            applied_at TEXT NOT NULL
        );
    )SQL");
}

Result<int, Error> MigrationRunner::current_version() {
    auto ensure_result = ensure_migrations_table();
    if (ensure_result.is_err()) {
        return Result<int, Error>::err(ensure_result.unwrap_err());
    }

    int version = 0;
    auto query_result = db_.query(
        "SELECT COALESCE(MAX(version), 0) FROM schema_migrations;", {},
        [&version](const Statement& stmt) {
            version = static_cast<int>(stmt.column_int64(0));
        });
    if (query_result.is_err()) {
        return Result<int, Error>::err(query_result.unwrap_err());
    }
    return Result<int, Error>::ok(version);
}

Result<void, Error> MigrationRunner::set_version(const Migration& m) {
    return db_.execute(
        "INSERT INTO schema_migrations (version, name, applied_at) VALUES (?, ?, ?);",
        {Value{static_cast<int64_t>(m.version)}, Value{m.name},
         Value{Timestamp::now().to_iso_string()}});
}

Result<void, Error> MigrationRunner::run_migration(const Migration& m) {
    auto exec_result = db_.execute(m.up_sql);
    if (exec_result.is_err()) {
        const auto& err = exec_result.unwrap_err();
        return Result<void, Error>::err(Error::database(
            "Migration " + std::to_string(m.version) + " (" + m.name + ") failed: " +
            err.message, err.code));
    }

    return set_version(m);
}

Result<void, Error> MigrationRunner::run_rollback(const Migration& m) {
    if (m.down_sql.empty()) {
        return Result<void, Error>::err(Error::database(
            "Migration " + std::to_string(m.version) + " has no rollback SQL"));
    }

    auto exec_result = db_.execute(m.down_sql);
    if (exec_result.is_err()) {
        const auto& err = exec_result.unwrap_err();
        return Result<void, Error>::err(Error::database(
            "Rollback of migration " + std::to_string(m.version) + " failed: " +
            err.message, err.code));
    }

    return db_.execute("DELETE FROM schema_migrations WHERE version = ?;",
                       {Value{static_cast<int64_t>(m.version)}});
}

Result<void, Error> MigrationRunner::migrate() {
    return migrate_to(latest_version());
}

Result<void, Error> MigrationRunner::migrate_to(int target_version) {
    auto current_result = current_version();
    if (current_result.is_err()) {
        return Result<void, Error>::err(current_result.unwrap_err());
    }

    const int current = current_result.unwrap();
    if (current >= target_version) {
        return Result<void, Error>::ok();
    }

    return db_.transaction([&]() -> Result<void, Error> {
        for (const auto& m : all_migrations()) {
            if (m.version > current && m.version <= target_version) {
                auto result = run_migration(m);
                if (result.is_err()) {
                    return result;
                }
            }
        }
        return Result<void, Error>::ok();
    });
}

Result<void, Error> MigrationRunner::rollback() {
    auto current_result = current_version();
    if (current_result.is_err()) {
        return Result<void, Error>::err(current_result.unwrap_err());
    }

    const int current = current_result.unwrap();
    if (current == 0) {
        return Result<void, Error>::ok();
    }

    return rollback_to(current - 1);
}

Result<void, Error> MigrationRunner::rollback_to(int target_version) {
    auto current_result = current_version();
    if (current_result.is_err()) {
        return Result<void, Error>::err(current_result.unwrap_err());
    }

    const int current = current_result.unwrap();
    if (current <= target_version) {
        return Result<void, Error>::ok();
    }

    const auto& all = all_migrations();
    return db_.transaction([&]() -> Result<void, Error> {
        for (auto it = all.rbegin(); it != all.rend(); ++it) {
            if (it->version <= current && it->version > target_version) {
                auto result = run_rollback(*it);
                if (result.is_err()) {
                    return result;
                }
            }
        }
        return Result<void, Error>::ok();
    });
}

} // namespace studysync::storage
