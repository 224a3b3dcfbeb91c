#include <catch2/catch_test_macros.hpp>

#include <QSignalSpy>
#include <QTest>

#include "sync/retry_manager.hpp"

using namespace studysync;
using namespace studysync::sync;
using namespace std::chrono_literals;

namespace {

RetryPolicy fast_policy(std::size_t max_queue = 50) {
    return RetryPolicy{.max_retries = 3, .base_delay = 1ms, .max_queue = max_queue, .max_history = 5};
}

SyncError error_of(const Error& error, const std::string& record = "c1") {
    PendingOperation op{.position = 1, .kind = OpKind::Put, .table = "cards", .record_id = record, .data = {}};
    return make_sync_error(error, op);
}

QString qid(const SyncError& error) {
    return QString::fromStdString(error.id.to_string());
}

} // namespace

TEST_CASE("Retry manager: reported errors are queued and announced", "[sync][retry]") {
    SyncStateMachine state;
    RetryManager retries(state, fast_policy());
    QSignalSpy notifications(&retries, &RetryManager::notification);

    const auto error = error_of(Error::network("timeout"));
    retries.report(error);

    REQUIRE(retries.errorCount() == 1);
    REQUIRE(retries.find(error.id).has_value());
    REQUIRE(retries.history().size() == 1);
    REQUIRE(notifications.count() == 1);
    const auto n = notifications.at(0).at(0).value<Notification>();
    REQUIRE(n.title == QStringLiteral("Sync Failed"));
    REQUIRE(n.can_retry);

    // Reporting alone never starts a retry
    REQUIRE_FALSE(retries.is_retrying(error.id));
}

TEST_CASE("Retry manager: validation errors only reach history", "[sync][retry]") {
    SyncStateMachine state;
    RetryManager retries(state, fast_policy());

    retries.report(error_of(Error::validation("bad payload")));
    REQUIRE(retries.errors().empty());
    REQUIRE(retries.history().size() == 1);
}

TEST_CASE("Retry manager: auth errors ask for sign in and are not retried", "[sync][retry]") {
    SyncStateMachine state;
    RetryManager retries(state, fast_policy());
    int runs = 0;
    retries.set_sync_runner([&runs](auto done) {
        ++runs;
        done(Result<void, Error>::ok());
    });
    QSignalSpy authSpy(&retries, &RetryManager::authenticationRequired);

    const auto error = error_of(Error::auth("session expired", 401));
    retries.report(error);
    REQUIRE(authSpy.count() == 1);
    REQUIRE(retries.errorCount() == 1);

    retries.retry(error.id);
    retries.retry_all();
    QTest::qWait(20);
    REQUIRE(runs == 0);
    REQUIRE(retries.errorCount() == 1);
}

TEST_CASE("Retry manager: the queue evicts its oldest error", "[sync][retry]") {
    SyncStateMachine state;
    RetryManager retries(state, fast_policy(3));

    std::vector<SyncError> reported;
    for (int i = 0; i < 4; ++i) {
        reported.push_back(error_of(Error::network("down"), "c" + std::to_string(i)));
        retries.report(reported.back());
    }

    REQUIRE(retries.errorCount() == 3);
    REQUIRE_FALSE(retries.find(reported[0].id).has_value());
    REQUIRE(retries.errors().front().id == reported[1].id);
    REQUIRE(retries.errors().back().id == reported[3].id);

    // History is bounded separately
    for (int i = 0; i < 4; ++i) retries.report(error_of(Error::network("down")));
    REQUIRE(retries.history().size() == 5);
}

TEST_CASE("Retry manager: a failing retry stops after max_retries attempts", "[sync][retry]") {
    SyncStateMachine state;
    RetryManager retries(state, fast_policy());
    int runs = 0;
    retries.set_sync_runner([&runs](auto done) {
        ++runs;
        done(Result<void, Error>::err(Error::network("still down")));
    });
    QSignalSpy exhausted(&retries, &RetryManager::retryExhausted);
    QSignalSpy notifications(&retries, &RetryManager::notification);

    const auto error = error_of(Error::network("down"));
    retries.report(error);
    notifications.clear();
    retries.retry(error.id);
    REQUIRE(retries.is_retrying(error.id));

    REQUIRE(exhausted.wait(2000));
    REQUIRE(exhausted.at(0).at(0).toString() == qid(error));
    REQUIRE(runs == 3);
    REQUIRE_FALSE(retries.is_retrying(error.id));
    REQUIRE(retries.find(error.id).has_value());

    const auto last = notifications.last().at(0).value<Notification>();
    REQUIRE(last.title == QStringLiteral("Sync Failed"));
    REQUIRE(last.message == QStringLiteral("Please try again later"));

    // No further automatic attempts
    QTest::qWait(30);
    REQUIRE(runs == 3);

    SECTION("a manual retry starts a fresh budget") {
        retries.retry(error.id);
        REQUIRE(exhausted.wait(2000));
        REQUIRE(runs == 6);
    }
}

TEST_CASE("Retry manager: a successful retry clears the error", "[sync][retry]") {
    SyncStateMachine state;
    RetryManager retries(state, fast_policy());
    int runs = 0;
    retries.set_sync_runner([&runs](auto done) {
        ++runs;
        if (runs < 2) {
            done(Result<void, Error>::err(Error::network("flaky")));
        } else {
            done(Result<void, Error>::ok());
        }
    });
    QSignalSpy succeeded(&retries, &RetryManager::retrySucceeded);

    const auto first = error_of(Error::network("down"), "a");
    const auto second = error_of(Error::network("down"), "b");
    retries.report(first);
    retries.report(second);
    state.set_phase(phase::Failed{.error = second});

    retries.retry(first.id);
    REQUIRE(succeeded.wait(2000));
    REQUIRE(retries.errorCount() == 1);
    REQUIRE(retries.attempts(first.id) == 0);
    // Another error is still queued
    REQUIRE(std::holds_alternative<phase::Failed>(state.phase()));

    retries.retry(second.id);
    REQUIRE(succeeded.wait(2000));
    REQUIRE(retries.errors().empty());
    REQUIRE(std::holds_alternative<phase::Completed>(state.phase()));
    REQUIRE(retries.history().size() == 2);
}

TEST_CASE("Retry manager: retry_all sweeps retryable errors only", "[sync][retry]") {
    SyncStateMachine state;
    RetryManager retries(state, fast_policy());
    retries.set_sync_runner([](auto done) { done(Result<void, Error>::ok()); });
    QSignalSpy succeeded(&retries, &RetryManager::retrySucceeded);

    retries.report(error_of(Error::network("a")));
    retries.report(error_of(Error{"unknown"}));
    retries.report(error_of(Error::auth("signed out")));

    retries.retry_all();
    REQUIRE(QTest::qWaitFor([&]() { return succeeded.count() == 2; }, 2000));
    REQUIRE(retries.errorCount() == 1);
    REQUIRE(retries.errors().front().kind == ErrorKind::Auth);
}

TEST_CASE("Retry manager: cancellation", "[sync][retry]") {
    SyncStateMachine state;
    RetryManager retries(state, RetryPolicy{.max_retries = 3, .base_delay = 50ms, .max_queue = 10, .max_history = 10});
    int runs = 0;
    retries.set_sync_runner([&runs](auto done) {
        ++runs;
        done(Result<void, Error>::ok());
    });

    const auto a = error_of(Error::network("a"));
    const auto b = error_of(Error::network("b"));
    retries.report(a);
    retries.report(b);

    SECTION("cancel keeps the error") {
        retries.retry(a.id);
        retries.cancel(a.id);
        QTest::qWait(120);
        REQUIRE(runs == 0);
        REQUIRE(retries.errorCount() == 2);
    }

    SECTION("remove drops the error and its task") {
        retries.retry(a.id);
        retries.remove(a.id);
        QTest::qWait(120);
        REQUIRE(runs == 0);
        REQUIRE(retries.errorCount() == 1);
    }

    SECTION("clear empties the queue and leaves Failed") {
        state.set_phase(phase::Failed{.error = a});
        retries.retry_all();
        retries.clear();
        QTest::qWait(120);
        REQUIRE(runs == 0);
        REQUIRE(retries.errors().empty());
        REQUIRE(std::holds_alternative<phase::Idle>(state.phase()));
    }

    SECTION("without a runner an attempt fails") {
        RetryManager bare(state, fast_policy());
        QSignalSpy exhausted(&bare, &RetryManager::retryExhausted);
        bare.report(a);
        bare.retry(a.id);
        REQUIRE(exhausted.wait(2000));
        REQUIRE(bare.errorCount() == 1);
    }
}
