#pragma once

#include "core/result.hpp"
#include "core/row.hpp"
#include <sqlite3.h>
#include <string>
#include <string_view>
#include <memory>
#include <functional>
#include <vector>

namespace studysync::storage {

/**
 * SQLite statement wrapper with RAII.
 */
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt, sqlite3_finalize) {}

    [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }
    [[nodiscard]] explicit operator bool() const { return stmt_ != nullptr; }

    // Bind helpers (1-based index)
    Result<void, Error> bind_text(int index, std::string_view text);
    Result<void, Error> bind_int64(int index, int64_t value);
    Result<void, Error> bind_double(int index, double value);
    Result<void, Error> bind_null(int index);
    Result<void, Error> bind_value(int index, const Value& value);
    Result<void, Error> bind_all(const std::vector<Value>& values);

    // Column getters (0-based index)
    [[nodiscard]] std::string column_text(int index) const;
    [[nodiscard]] int64_t column_int64(int index) const;
    [[nodiscard]] double column_double(int index) const;
    [[nodiscard]] bool column_is_null(int index) const;
    [[nodiscard]] Value column_value(int index) const;
    [[nodiscard]] int column_count() const;
    [[nodiscard]] std::string column_name(int index) const;

    /**
     * Current result row keyed by column name.
     */
    [[nodiscard]] Row row() const;

    // Execute
    Result<bool, Error> step();  // Returns true if there's a row
    Result<void, Error> reset();

private:
    std::shared_ptr<sqlite3_stmt> stmt_;
};

/**
 * Database - SQLite connection wrapper.
 *
 * RAII connection management, Result-based errors, transactions and an
 * optional row-change hook used for change notification.
 */
class Database {
public:
    // (operation, table, rowid); operation is SQLITE_INSERT/UPDATE/DELETE.
    using UpdateHook = std::function<void(int, const std::string&, int64_t)>;

    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    [[nodiscard]] static Result<Database, Error> open(const std::string& path);

    /**
     * Open an in-memory database (for testing).
     */
    [[nodiscard]] static Result<Database, Error> open_memory();

    [[nodiscard]] bool is_open() const { return db_ != nullptr; }

    void close();

    [[nodiscard]] sqlite3* handle() const { return db_; }

    [[nodiscard]] Result<Statement, Error> prepare(const std::string& sql);

    /**
     * Execute one or more SQL statements without parameters or results.
     */
    [[nodiscard]] Result<void, Error> execute(const std::string& sql);

    /**
     * Execute a single parameterized statement, discarding any rows.
     */
    [[nodiscard]] Result<void, Error> execute(const std::string& sql,
                                              const std::vector<Value>& params);

    /**
     * Run a parameterized query and hand each row to the callback.
     */
    template<typename F>
    [[nodiscard]] Result<void, Error> query(const std::string& sql,
                                            const std::vector<Value>& params,
                                            F&& callback) {
        auto stmt_result = prepare(sql);
        if (stmt_result.is_err()) {
            return Result<void, Error>::err(stmt_result.unwrap_err());
        }

        auto stmt = std::move(stmt_result).unwrap();
        auto bind_result = stmt.bind_all(params);
        if (bind_result.is_err()) {
            return bind_result;
        }
        while (true) {
            auto step_result = stmt.step();
            if (step_result.is_err()) {
                return Result<void, Error>::err(step_result.unwrap_err());
            }
            if (!step_result.unwrap()) break;
            callback(stmt);
        }

        return Result<void, Error>::ok();
    }

    [[nodiscard]] Result<std::vector<Row>, Error> select_rows(const std::string& sql,
                                                              const std::vector<Value>& params = {});

    [[nodiscard]] Result<void, Error> begin_transaction();
    [[nodiscard]] Result<void, Error> commit();
    [[nodiscard]] Result<void, Error> rollback();

    [[nodiscard]] bool in_transaction() const;

    /**
     * Execute a function within a transaction.
     * Commits on success, rolls back on failure.
     */
    template<typename F>
    [[nodiscard]] auto transaction(F&& f) -> decltype(f()) {
        using ResultType = decltype(f());

        auto begin_result = begin_transaction();
        if (begin_result.is_err()) {
            return ResultType::err(begin_result.unwrap_err());
        }

        auto result = f();

        if (result.is_err()) {
            auto rollback_result = rollback();
            if (rollback_result.is_err()) {
                auto err = result.unwrap_err();
                err.message += " (rollback failed: " + rollback_result.unwrap_err().message + ")";
                return ResultType::err(std::move(err));
            }
            return result;
        }

        auto commit_result = commit();
        if (commit_result.is_err()) {
            return ResultType::err(commit_result.unwrap_err());
        }

        return result;
    }

    /**
     * Install (or clear, with an empty function) the row-change hook.
     */
    void set_update_hook(UpdateHook hook);

    [[nodiscard]] int64_t last_insert_rowid() const;
    [[nodiscard]] int changes() const;
    [[nodiscard]] std::string last_error() const;

private:
    explicit Database(sqlite3* db) : db_(db) {}

    [[nodiscard]] Error make_error(int rc) const;

    sqlite3* db_ = nullptr;
    // Heap-allocated so the pointer handed to sqlite survives moves.
    std::unique_ptr<UpdateHook> hook_;
};

/**
 * Transaction RAII guard.
 * Rolls back if not explicitly committed.
 */
class TransactionGuard {
public:
    explicit TransactionGuard(Database& db);
    ~TransactionGuard();

    TransactionGuard(const TransactionGuard&) = delete;
    TransactionGuard& operator=(const TransactionGuard&) = delete;

    [[nodiscard]] Result<void, Error> commit();
    [[nodiscard]] Result<void, Error> rollback();

    [[nodiscard]] bool is_active() const { return active_; }

private:
    Database& db_;
    bool active_ = false;
};

} // namespace studysync::storage
