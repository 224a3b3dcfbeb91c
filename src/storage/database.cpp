#include "storage/database.hpp"

namespace studysync::storage {

namespace {

void update_hook_trampoline(void* user, int op, const char* /*db_name*/,
                            const char* table, sqlite3_int64 rowid) {
    auto* hook = static_cast<Database::UpdateHook*>(user);
    if (hook && *hook) {
        (*hook)(op, table ? std::string(table) : std::string(), rowid);
    }
}

Result<void, Error> check_bind(int rc, const char* what) {
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(Error::database(what, rc));
    }
    return Result<void, Error>::ok();
}

} // namespace

// ============================================================================
// Statement implementation
// ============================================================================

Result<void, Error> Statement::bind_text(int index, std::string_view text) {
    return check_bind(sqlite3_bind_text(stmt_.get(), index, text.data(),
                                        static_cast<int>(text.size()), SQLITE_TRANSIENT),
                      "Failed to bind text");
}

Result<void, Error> Statement::bind_int64(int index, int64_t value) {
    return check_bind(sqlite3_bind_int64(stmt_.get(), index, value), "Failed to bind int64");
}

Result<void, Error> Statement::bind_double(int index, double value) {
    return check_bind(sqlite3_bind_double(stmt_.get(), index, value), "Failed to bind double");
}

Result<void, Error> Statement::bind_null(int index) {
    return check_bind(sqlite3_bind_null(stmt_.get(), index), "Failed to bind null");
}

Result<void, Error> Statement::bind_value(int index, const Value& value) {
    return std::visit([&](const auto& v) -> Result<void, Error> {
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<V, std::monostate>) {
            return bind_null(index);
        } else if constexpr (std::is_same_v<V, int64_t>) {
            return bind_int64(index, v);
        } else if constexpr (std::is_same_v<V, double>) {
            return bind_double(index, v);
        } else {
            return bind_text(index, v);
        }
    }, value);
}

Result<void, Error> Statement::bind_all(const std::vector<Value>& values) {
    for (size_t i = 0; i < values.size(); ++i) {
        auto result = bind_value(static_cast<int>(i + 1), values[i]);
        if (result.is_err()) return result;
    }
    return Result<void, Error>::ok();
}

std::string Statement::column_text(int index) const {
    const unsigned char* text = sqlite3_column_text(stmt_.get(), index);
    if (!text) return "";
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_.get(), index)));
}

int64_t Statement::column_int64(int index) const {
    return sqlite3_column_int64(stmt_.get(), index);
}

double Statement::column_double(int index) const {
    return sqlite3_column_double(stmt_.get(), index);
}

bool Statement::column_is_null(int index) const {
    return sqlite3_column_type(stmt_.get(), index) == SQLITE_NULL;
}

Value Statement::column_value(int index) const {
    switch (sqlite3_column_type(stmt_.get(), index)) {
        case SQLITE_INTEGER: return column_int64(index);
        case SQLITE_FLOAT: return column_double(index);
        case SQLITE_NULL: return std::monostate{};
        default: return column_text(index);
    }
}

int Statement::column_count() const {
    return sqlite3_column_count(stmt_.get());
}

std::string Statement::column_name(int index) const {
    const char* name = sqlite3_column_name(stmt_.get(), index);
    return name ? name : "";
}

Row Statement::row() const {
    Row out;
    const int n = column_count();
    for (int i = 0; i < n; ++i) {
        out.emplace(column_name(i), column_value(i));
    }
    return out;
}

Result<bool, Error> Statement::step() {
    int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW) {
        return Result<bool, Error>::ok(true);
    }
    if (rc == SQLITE_DONE) {
        return Result<bool, Error>::ok(false);
    }
    sqlite3* db = sqlite3_db_handle(stmt_.get());
    return Result<bool, Error>::err(
        Error::database(db ? sqlite3_errmsg(db) : "Step failed", rc));
}

Result<void, Error> Statement::reset() {
    int rc = sqlite3_reset(stmt_.get());
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(Error::database("Reset failed", rc));
    }
    return Result<void, Error>::ok();
}

// ============================================================================
// Database implementation
// ============================================================================

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept
    : db_(other.db_), hook_(std::move(other.hook_)) {
    other.db_ = nullptr;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        hook_ = std::move(other.hook_);
        other.db_ = nullptr;
    }
    return *this;
}

Result<Database, Error> Database::open(const std::string& path) {
    sqlite3* raw = nullptr;
    int rc = sqlite3_open(path.c_str(), &raw);
    if (rc != SQLITE_OK) {
        std::string error = raw ? sqlite3_errmsg(raw) : "Unknown error";
        if (raw) sqlite3_close(raw);
        return Result<Database, Error>::err(Error::database(error, rc));
    }

    Database db(raw);
    // WAL is unavailable for :memory: and silently stays "memory" there.
    auto pragmas = db.execute("PRAGMA foreign_keys = ON; PRAGMA journal_mode = WAL;");
    if (pragmas.is_err()) {
        return Result<Database, Error>::err(pragmas.unwrap_err());
    }

    return Result<Database, Error>::ok(std::move(db));
}

Result<Database, Error> Database::open_memory() {
    return open(":memory:");
}

void Database::close() {
    if (db_) {
        sqlite3_update_hook(db_, nullptr, nullptr);
        sqlite3_close(db_);
        db_ = nullptr;
    }
    hook_.reset();
}

Error Database::make_error(int rc) const {
    return Error::database(last_error(), rc);
}

Result<Statement, Error> Database::prepare(const std::string& sql) {
    if (!db_) {
        return Result<Statement, Error>::err(Error::database("Database not open", SQLITE_MISUSE));
    }
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(),
                                static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<Statement, Error>::err(make_error(rc));
    }
    return Result<Statement, Error>::ok(Statement(stmt));
}

Result<void, Error> Database::execute(const std::string& sql) {
    if (!db_) {
        return Result<void, Error>::err(Error::database("Database not open", SQLITE_MISUSE));
    }
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : "Unknown error";
        sqlite3_free(error_msg);
        return Result<void, Error>::err(Error::database(error, rc));
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Database::execute(const std::string& sql, const std::vector<Value>& params) {
    return query(sql, params, [](const Statement&) {});
}

Result<std::vector<Row>, Error> Database::select_rows(const std::string& sql,
                                                      const std::vector<Value>& params) {
    std::vector<Row> rows;
    auto result = query(sql, params, [&rows](const Statement& stmt) {
        rows.push_back(stmt.row());
    });
    if (result.is_err()) {
        return Result<std::vector<Row>, Error>::err(result.unwrap_err());
    }
    return Result<std::vector<Row>, Error>::ok(std::move(rows));
}

Result<void, Error> Database::begin_transaction() {
    return execute("BEGIN IMMEDIATE TRANSACTION;");
}

Result<void, Error> Database::commit() {
    return execute("COMMIT;");
}

Result<void, Error> Database::rollback() {
    return execute("ROLLBACK;");
}

bool Database::in_transaction() const {
    return db_ && sqlite3_get_autocommit(db_) == 0;
}

void Database::set_update_hook(UpdateHook hook) {
    if (!db_) return;
    if (!hook) {
        sqlite3_update_hook(db_, nullptr, nullptr);
        hook_.reset();
        return;
    }
    hook_ = std::make_unique<UpdateHook>(std::move(hook));
    sqlite3_update_hook(db_, &update_hook_trampoline, hook_.get());
}

int64_t Database::last_insert_rowid() const {
    return sqlite3_last_insert_rowid(db_);
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

std::string Database::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "Database not open";
}

// ============================================================================
// TransactionGuard implementation
// ============================================================================

TransactionGuard::TransactionGuard(Database& db) : db_(db) {
    auto result = db_.begin_transaction();
    active_ = result.is_ok();
}

TransactionGuard::~TransactionGuard() {
    if (active_) {
        // A destructor cannot report; callers wanting the outcome use rollback().
        static_cast<void>(rollback());
    }
}

Result<void, Error> TransactionGuard::commit() {
    if (!active_) {
        return Result<void, Error>::err(Error::database("No active transaction"));
    }
    auto result = db_.commit();
    if (result.is_ok()) {
        active_ = false;
    }
    return result;
}

Result<void, Error> TransactionGuard::rollback() {
    if (!active_) {
        return Result<void, Error>::ok();
    }
    active_ = false;
    return db_.rollback();
}

} // namespace studysync::storage
