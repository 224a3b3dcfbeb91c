#pragma once

#include "core/result.hpp"
#include "core/row.hpp"
#include "core/sync_types.hpp"
#include "storage/database.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace studysync::storage {

class LocalStore;

/**
 * CrudBatch - snapshot of the mutation log.
 *
 * complete() removes every operation up to the snapshot's last position;
 * operations logged after the snapshot are kept for the next drain.
 */
class CrudBatch {
public:
    CrudBatch(LocalStore& store, std::vector<PendingOperation> operations)
        : store_(&store), operations_(std::move(operations)) {}

    [[nodiscard]] const std::vector<PendingOperation>& operations() const noexcept {
        return operations_;
    }

    [[nodiscard]] bool empty() const noexcept { return operations_.empty(); }

    [[nodiscard]] Result<void, Error> complete();

private:
    LocalStore* store_;
    std::vector<PendingOperation> operations_;
};

/**
 * LocalStore - the authoritative local database.
 *
 * Reads and writes are synchronous and never touch the network. Writes to
 * synced tables are captured into the mutation log by triggers. Watches
 * re-run their query after every committed write that touched one of their
 * tables and hand the fresh result to their callback.
 */
class LocalStore {
public:
    using WatchId = uint64_t;
    using ListenerId = uint64_t;
    using RowsCallback = std::function<void(const std::vector<Row>&)>;
    using MutationListener = std::function<void()>;

    explicit LocalStore(Database db);
    ~LocalStore();

    LocalStore(const LocalStore&) = delete;
    LocalStore& operator=(const LocalStore&) = delete;

    /**
     * Open (creating if needed) and migrate a database file.
     */
    [[nodiscard]] static Result<std::unique_ptr<LocalStore>, Error> open(const std::string& path);

    [[nodiscard]] static Result<std::unique_ptr<LocalStore>, Error> open_memory();

    [[nodiscard]] bool is_open() const { return db_.is_open(); }

    /**
     * Drop every watch and listener, then close the connection.
     */
    void close();

    // ========================================================================
    // Reads
    // ========================================================================

    [[nodiscard]] Result<std::vector<Row>, Error> get_rows(
        const std::string& sql, const std::vector<Value>& params = {});

    /**
     * Run a query and map each row. Rows the mapper rejects are skipped.
     */
    template<typename T, typename Mapper>
    [[nodiscard]] Result<std::vector<T>, Error> get_all(
        const std::string& sql, const std::vector<Value>& params, Mapper&& mapper) {
        auto rows = get_rows(sql, params);
        if (rows.is_err()) {
            return Result<std::vector<T>, Error>::err(rows.unwrap_err());
        }
        std::vector<T> out;
        out.reserve(rows.unwrap().size());
        for (const auto& row : rows.unwrap()) {
            auto mapped = mapper(row);
            if (mapped.is_ok()) {
                out.push_back(std::move(mapped).unwrap());
            }
        }
        return Result<std::vector<T>, Error>::ok(std::move(out));
    }

    // ========================================================================
    // Writes
    // ========================================================================

    [[nodiscard]] Result<void, Error> execute(
        const std::string& sql, const std::vector<Value>& params = {});

    /**
     * Run several writes atomically. Watches and listeners fire once, after
     * the commit.
     */
    [[nodiscard]] Result<void, Error> write_transaction(
        const std::function<Result<void, Error>(Database&)>& body);

    // ========================================================================
    // Watches
    // ========================================================================

    /**
     * Emit the query result now and again after each commit that touched
     * one of `tables`. A failing re-query is skipped for that round.
     */
    [[nodiscard]] WatchId watch(
        std::string sql,
        std::vector<Value> params,
        std::set<std::string> tables,
        RowsCallback callback);

    void unwatch(WatchId id);

    /**
     * Called after a commit that appended to the mutation log.
     */
    [[nodiscard]] ListenerId add_mutation_listener(MutationListener listener);
    void remove_mutation_listener(ListenerId id);

    // ========================================================================
    // Mutation log
    // ========================================================================

    /**
     * Snapshot of pending operations in position order.
     * A limit of 0 means the whole log.
     */
    [[nodiscard]] Result<CrudBatch, Error> get_mutation_batch(size_t limit = 0);

    /**
     * Remove every operation with position <= last_position.
     */
    [[nodiscard]] Result<void, Error> complete_through(int64_t last_position);

    [[nodiscard]] Result<void, Error> remove_operation(int64_t position);

    [[nodiscard]] Result<int64_t, Error> pending_count();

    [[nodiscard]] Result<bool, Error> has_pending(const std::string& table, const std::string& record_id);

    // ========================================================================
    // Downloads
    // ========================================================================

    /**
     * Upsert rows fetched from the backend without logging them. Rows with a
     * pending local operation are skipped so unsent edits are not
     * overwritten. Returns the number of rows written.
     */
    [[nodiscard]] Result<int64_t, Error> apply_remote(const std::string& table, const std::vector<Row>& rows);

    [[nodiscard]] Result<std::optional<std::string>, Error> checkpoint(const std::string& table);

    [[nodiscard]] Result<void, Error> set_checkpoint(const std::string& table, const std::string& value);

    [[nodiscard]] Database& database() noexcept { return db_; }

private:
    struct Watch {
        std::string sql;
        std::vector<Value> params;
        std::set<std::string> tables;
        RowsCallback callback;
    };

    void install_hook();
    void flush_notifications();
    void emit(WatchId id);

    [[nodiscard]] Result<Row, Error> decode_payload(const std::string& json);

    Database db_;
    std::map<WatchId, Watch> watches_;
    std::map<ListenerId, MutationListener> listeners_;
    WatchId next_watch_id_ = 1;
    ListenerId next_listener_id_ = 1;

    std::set<std::string> touched_;
    bool log_appended_ = false;
    bool flushing_ = false;
};

} // namespace studysync::storage
