#include "storage/local_store.hpp"

#include "storage/migrations.hpp"
#include <algorithm>

namespace studysync::storage {

namespace {

constexpr const char* kMutationLogTable = "pending_operations";

Result<std::unique_ptr<LocalStore>, Error> finish_open(Result<Database, Error> opened) {
    if (opened.is_err()) {
        return Result<std::unique_ptr<LocalStore>, Error>::err(opened.unwrap_err());
    }
    auto db = std::move(opened).unwrap();
    auto migrated = initialize_database(db);
    if (migrated.is_err()) {
        return Result<std::unique_ptr<LocalStore>, Error>::err(migrated.unwrap_err());
    }
    return Result<std::unique_ptr<LocalStore>, Error>::ok(
        std::make_unique<LocalStore>(std::move(db)));
}

} // namespace

Result<void, Error> CrudBatch::complete() {
    if (operations_.empty()) {
        return Result<void, Error>::ok();
    }
    return store_->complete_through(operations_.back().position);
}

LocalStore::LocalStore(Database db) : db_(std::move(db)) {
    install_hook();
}

LocalStore::~LocalStore() {
    close();
}

Result<std::unique_ptr<LocalStore>, Error> LocalStore::open(const std::string& path) {
    return finish_open(Database::open(path));
}

Result<std::unique_ptr<LocalStore>, Error> LocalStore::open_memory() {
    return finish_open(Database::open_memory());
}

void LocalStore::close() {
    watches_.clear();
    listeners_.clear();
    touched_.clear();
    if (db_.is_open()) {
        db_.set_update_hook({});
        db_.close();
    }
}

void LocalStore::install_hook() {
    db_.set_update_hook([this](int op, const std::string& table, int64_t) {
        touched_.insert(table);
        if (op == SQLITE_INSERT && table == kMutationLogTable) {
            log_appended_ = true;
        }
    });
}

// ============================================================================
// Reads and writes
// ============================================================================

Result<std::vector<Row>, Error> LocalStore::get_rows(const std::string& sql,
                                                     const std::vector<Value>& params) {
    return db_.select_rows(sql, params);
}

Result<void, Error> LocalStore::execute(const std::string& sql, const std::vector<Value>& params) {
    auto result = db_.execute(sql, params);
    if (!db_.in_transaction()) {
        flush_notifications();
    }
    return result;
}

Result<void, Error> LocalStore::write_transaction(
    const std::function<Result<void, Error>(Database&)>& body
) {
    auto result = db_.transaction([&]() { return body(db_); });
    if (result.is_err()) {
        // Rolled back: nothing was committed.
        touched_.clear();
        log_appended_ = false;
        return result;
    }
    flush_notifications();
    return result;
}

// ============================================================================
// Watches
// ============================================================================

LocalStore::WatchId LocalStore::watch(
    std::string sql,
    std::vector<Value> params,
    std::set<std::string> tables,
    RowsCallback callback
) {
    const WatchId id = next_watch_id_++;
    watches_.emplace(id, Watch{
        .sql = std::move(sql),
        .params = std::move(params),
        .tables = std::move(tables),
        .callback = std::move(callback)
    });
    emit(id);
    return id;
}

void LocalStore::unwatch(WatchId id) {
    watches_.erase(id);
}

LocalStore::ListenerId LocalStore::add_mutation_listener(MutationListener listener) {
    const ListenerId id = next_listener_id_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

void LocalStore::remove_mutation_listener(ListenerId id) {
    listeners_.erase(id);
}

void LocalStore::emit(WatchId id) {
    auto it = watches_.find(id);
    if (it == watches_.end()) return;
    auto rows = db_.select_rows(it->second.sql, it->second.params);
    if (rows.is_err()) return;
    // Copy: the callback may unwatch itself.
    auto callback = it->second.callback;
    callback(rows.unwrap());
}

void LocalStore::flush_notifications() {
    if (flushing_) return;
    flushing_ = true;

    // Callbacks may write again; loop until quiet.
    while (!touched_.empty() || log_appended_) {
        auto touched = std::move(touched_);
        touched_.clear();
        const bool appended = log_appended_;
        log_appended_ = false;

        std::vector<WatchId> due;
        for (const auto& [id, w] : watches_) {
            const bool hit = std::any_of(w.tables.begin(), w.tables.end(),
                [&touched](const std::string& t) { return touched.count(t) > 0; });
            if (hit) due.push_back(id);
        }
        for (WatchId id : due) {
            emit(id);
        }

        if (appended) {
            std::vector<MutationListener> snapshot;
            snapshot.reserve(listeners_.size());
            for (const auto& [_, listener] : listeners_) snapshot.push_back(listener);
            for (const auto& listener : snapshot) listener();
        }
    }

    flushing_ = false;
}

// ============================================================================
// Mutation log
// ============================================================================

Result<Row, Error> LocalStore::decode_payload(const std::string& json) {
    Row out;
    auto result = db_.query("SELECT key, value FROM json_each(?);", {Value{json}},
        [&out](const Statement& stmt) {
            out.emplace(stmt.column_text(0), stmt.column_value(1));
        });
    if (result.is_err()) {
        return Result<Row, Error>::err(result.unwrap_err());
    }
    return Result<Row, Error>::ok(std::move(out));
}

Result<CrudBatch, Error> LocalStore::get_mutation_batch(size_t limit) {
    std::string sql =
        "SELECT position, op, table_name, record_id, data FROM pending_operations "
        "ORDER BY position";
    std::vector<Value> params;
    if (limit > 0) {
        sql += " LIMIT ?";
        params.emplace_back(static_cast<int64_t>(limit));
    }

    auto rows = db_.select_rows(sql, params);
    if (rows.is_err()) {
        return Result<CrudBatch, Error>::err(rows.unwrap_err());
    }

    std::vector<PendingOperation> ops;
    ops.reserve(rows.unwrap().size());
    for (const auto& row : rows.unwrap()) {
        auto kind = op_kind_from_string(get_text(row, "op").value_or(""));
        if (!kind) {
            return Result<CrudBatch, Error>::err(Error::database(
                "Unknown operation in mutation log: " + get_text(row, "op").value_or("")));
        }

        PendingOperation op{
            .position = get_int(row, "position").value_or(0),
            .kind = *kind,
            .table = get_text(row, "table_name").value_or(""),
            .record_id = get_text(row, "record_id").value_or(""),
            .data = {}
        };
        if (auto payload = get_text(row, "data")) {
            auto decoded = decode_payload(*payload);
            if (decoded.is_err()) {
                return Result<CrudBatch, Error>::err(decoded.unwrap_err());
            }
            op.data = std::move(decoded).unwrap();
        }
        ops.push_back(std::move(op));
    }

    return Result<CrudBatch, Error>::ok(CrudBatch(*this, std::move(ops)));
}

Result<void, Error> LocalStore::complete_through(int64_t last_position) {
    return execute("DELETE FROM pending_operations WHERE position <= ?;",
                   {Value{last_position}});
}

Result<void, Error> LocalStore::remove_operation(int64_t position) {
    return execute("DELETE FROM pending_operations WHERE position = ?;",
                   {Value{position}});
}

Result<int64_t, Error> LocalStore::pending_count() {
    auto rows = db_.select_rows("SELECT COUNT(*) AS n FROM pending_operations;");
    if (rows.is_err()) {
        return Result<int64_t, Error>::err(rows.unwrap_err());
    }
    const auto& list = rows.unwrap();
    return Result<int64_t, Error>::ok(list.empty() ? 0 : get_int(list.front(), "n").value_or(0));
}

Result<bool, Error> LocalStore::has_pending(const std::string& table, const std::string& record_id) {
    auto rows = db_.select_rows(
        "SELECT 1 FROM pending_operations WHERE table_name = ? AND record_id = ? LIMIT 1;",
        {Value{table}, Value{record_id}});
    if (rows.is_err()) {
        return Result<bool, Error>::err(rows.unwrap_err());
    }
    return Result<bool, Error>::ok(!rows.unwrap().empty());
}

// ============================================================================
// Downloads
// ============================================================================

Result<int64_t, Error> LocalStore::apply_remote(const std::string& table, const std::vector<Row>& rows) {
    const SyncedTable* schema = find_synced_table(table);
    if (!schema) {
        return Result<int64_t, Error>::err(Error::validation("Not a synced table: " + table));
    }
    if (rows.empty()) {
        return Result<int64_t, Error>::ok(0);
    }

    int64_t applied = 0;
    auto result = write_transaction([&](Database& db) -> Result<void, Error> {
        auto off = db.execute("UPDATE sync_control SET capture_enabled = 0 WHERE id = 1;");
        if (off.is_err()) return off;

        for (const auto& row : rows) {
            auto id = get_text(row, "id");
            if (!id) continue;

            auto pending = has_pending(table, *id);
            if (pending.is_err()) {
                return Result<void, Error>::err(pending.unwrap_err());
            }
            if (pending.unwrap()) continue;

            std::vector<std::string> columns;
            std::vector<Value> values;
            for (const auto& column : schema->columns) {
                auto it = row.find(column);
                if (it == row.end()) continue;
                columns.push_back(column);
                values.push_back(it->second);
            }

            std::string sql = "INSERT INTO " + table + " (";
            std::string placeholders;
            std::string updates;
            for (size_t i = 0; i < columns.size(); ++i) {
                if (i > 0) {
                    sql += ", ";
                    placeholders += ", ";
                }
                sql += columns[i];
                placeholders += "?";
                if (columns[i] != "id") {
                    if (!updates.empty()) updates += ", ";
                    updates += columns[i] + " = excluded." + columns[i];
                }
            }
            sql += ") VALUES (" + placeholders + ") ON CONFLICT(id) DO ";
            sql += updates.empty() ? "NOTHING;" : "UPDATE SET " + updates + ";";

            auto written = db.execute(sql, values);
            if (written.is_err()) return written;
            ++applied;
        }

        return db.execute("UPDATE sync_control SET capture_enabled = 1 WHERE id = 1;");
    });

    if (result.is_err()) {
        return Result<int64_t, Error>::err(result.unwrap_err());
    }
    return Result<int64_t, Error>::ok(applied);
}

Result<std::optional<std::string>, Error> LocalStore::checkpoint(const std::string& table) {
    auto rows = db_.select_rows(
        "SELECT last_modified FROM sync_checkpoints WHERE table_name = ?;", {Value{table}});
    if (rows.is_err()) {
        return Result<std::optional<std::string>, Error>::err(rows.unwrap_err());
    }
    const auto& list = rows.unwrap();
    if (list.empty()) {
        return Result<std::optional<std::string>, Error>::ok(std::nullopt);
    }
    return Result<std::optional<std::string>, Error>::ok(get_text(list.front(), "last_modified"));
}

Result<void, Error> LocalStore::set_checkpoint(const std::string& table, const std::string& value) {
    return execute(
        "INSERT INTO sync_checkpoints (table_name, last_modified) VALUES (?, ?) "
        "ON CONFLICT(table_name) DO UPDATE SET last_modified = excluded.last_modified;",
        {Value{table}, Value{value}});
}

} // namespace studysync::storage
