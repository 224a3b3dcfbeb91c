#pragma once

#include "core/result.hpp"
#include "core/row.hpp"
#include <functional>
#include <string>
#include <vector>

namespace studysync::sync {

/**
 * Credentials - session handed out by the backend.
 */
struct Credentials {
    std::string endpoint;
    std::string token;
    std::string account_id;
};

/**
 * SelectFilter - the two point queries the sync layer needs.
 */
struct SelectFilter {
    enum class Kind { ByIds, ModifiedSince };

    Kind kind{Kind::ByIds};
    std::vector<std::string> ids;
    std::string column;   // ModifiedSince only
    std::string since;    // ISO-8601; empty selects every row

    [[nodiscard]] static SelectFilter by_ids(std::vector<std::string> ids) {
        return SelectFilter{.kind = Kind::ByIds, .ids = std::move(ids), .column = {}, .since = {}};
    }

    [[nodiscard]] static SelectFilter modified_since(std::string column, std::string since) {
        return SelectFilter{
            .kind = Kind::ModifiedSince, .ids = {}, .column = std::move(column), .since = std::move(since)};
    }
};

/**
 * RemoteBackend - row-level CRUD service the sync engine uploads to.
 *
 * Every call completes exactly once through its callback, either later
 * from the event loop or synchronously before returning.
 */
class RemoteBackend {
public:
    using CredentialsCallback = std::function<void(Result<Credentials, Error>)>;
    using RowsCallback = std::function<void(Result<std::vector<Row>, Error>)>;
    using DoneCallback = std::function<void(Result<void, Error>)>;

    virtual ~RemoteBackend() = default;

    /**
     * Establish (or refresh) a session. An auth error here means the user
     * must sign in again.
     */
    virtual void fetch_credentials(CredentialsCallback done) = 0;

    virtual void select(const std::string& table, const SelectFilter& filter, RowsCallback done) = 0;

    /**
     * Insert or replace every row in one request.
     */
    virtual void upsert_batch(const std::string& table, std::vector<Row> rows, DoneCallback done) = 0;

    virtual void update(const std::string& table, const std::string& id, Row fields, DoneCallback done) = 0;

    virtual void remove(const std::string& table, const std::string& id, DoneCallback done) = 0;
};

} // namespace studysync::sync
