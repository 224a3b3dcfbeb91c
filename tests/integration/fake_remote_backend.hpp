#pragma once

#include "core/types.hpp"
#include "sync/remote_backend.hpp"

#include <QTimer>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace studysync::testing {

/**
 * In-memory backend. Replies arrive from the event loop unless
 * `synchronous` is set. Each failure slot, when set, fails every matching
 * call until cleared.
 */
class FakeRemoteBackend : public sync::RemoteBackend {
public:
    struct Call {
        std::string method;
        std::string table;
        std::vector<std::string> ids;
    };

    bool synchronous = false;
    std::optional<Error> credentials_error;
    std::optional<Error> select_error;
    std::optional<Error> upsert_error;
    std::optional<Error> update_error;
    std::optional<Error> remove_error;

    std::map<std::string, std::map<std::string, Row>> tables;
    std::vector<Call> calls;

    void fetch_credentials(CredentialsCallback done) override {
        calls.push_back({"credentials", {}, {}});
        if (credentials_error) {
            reply([done, error = *credentials_error]() {
                done(Result<sync::Credentials, Error>::err(error));
            });
            return;
        }
        reply([done]() {
            done(Result<sync::Credentials, Error>::ok(
                sync::Credentials{.endpoint = "memory://", .token = "token", .account_id = "user-1"}));
        });
    }

    void select(const std::string& table, const sync::SelectFilter& filter, RowsCallback done) override {
        calls.push_back({"select", table, filter.ids});
        if (select_error) {
            reply([done, error = *select_error]() {
                done(Result<std::vector<Row>, Error>::err(error));
            });
            return;
        }

        std::vector<Row> rows;
        const auto& stored = tables[table];
        if (filter.kind == sync::SelectFilter::Kind::ByIds) {
            for (const auto& id : filter.ids) {
                if (auto it = stored.find(id); it != stored.end()) rows.push_back(it->second);
            }
        } else {
            const auto since = Timestamp::from_iso_string(filter.since);
            for (const auto& [_, row] : stored) {
                const auto ts = get_timestamp(row, filter.column);
                if (!since || (ts && *ts > *since)) rows.push_back(row);
            }
        }
        reply([done, rows = std::move(rows)]() {
            done(Result<std::vector<Row>, Error>::ok(rows));
        });
    }

    void upsert_batch(const std::string& table, std::vector<Row> rows, DoneCallback done) override {
        std::vector<std::string> ids;
        for (const auto& row : rows) ids.push_back(get_text(row, "id").value_or(""));
        calls.push_back({"upsert", table, ids});
        if (upsert_error) {
            fail(done, *upsert_error);
            return;
        }
        for (auto& row : rows) {
            auto& stored = tables[table][get_text(row, "id").value_or("")];
            for (auto& [column, value] : row) stored[column] = value;
        }
        succeed(done);
    }

    void update(const std::string& table, const std::string& id, Row fields, DoneCallback done) override {
        calls.push_back({"update", table, {id}});
        if (update_error) {
            fail(done, *update_error);
            return;
        }
        auto& stored = tables[table][id];
        for (auto& [column, value] : fields) stored[column] = value;
        succeed(done);
    }

    void remove(const std::string& table, const std::string& id, DoneCallback done) override {
        calls.push_back({"remove", table, {id}});
        if (remove_error) {
            fail(done, *remove_error);
            return;
        }
        tables[table].erase(id);
        succeed(done);
    }

    [[nodiscard]] size_t count_calls(const std::string& method) const {
        size_t n = 0;
        for (const auto& call : calls) {
            if (call.method == method) ++n;
        }
        return n;
    }

private:
    template<typename F>
    void reply(F&& f) {
        if (synchronous) {
            f();
        } else {
            QTimer::singleShot(0, std::forward<F>(f));
        }
    }

    void succeed(const DoneCallback& done) {
        reply([done]() { done(Result<void, Error>::ok()); });
    }

    void fail(const DoneCallback& done, const Error& error) {
        reply([done, error]() { done(Result<void, Error>::err(error)); });
    }
};

} // namespace studysync::testing
