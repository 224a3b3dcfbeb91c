#include <catch2/catch_test_macros.hpp>

#include <QSignalSpy>
#include <QTest>

#include "fake_remote_backend.hpp"
#include "storage/deck_repository.hpp"
#include "sync/sync_engine.hpp"

using namespace studysync;
using namespace studysync::sync;
using studysync::testing::FakeRemoteBackend;
using namespace std::chrono_literals;

namespace {

SyncConfig test_config() {
    SyncConfig config;
    config.retry = RetryPolicy{.max_retries = 2, .base_delay = 1ms, .max_queue = 10, .max_history = 10};
    config.upload_throttle = 20ms;
    config.reconnect_delay = 10s;
    config.connectivity_debounce = 10ms;
    return config;
}

struct EngineFixture {
    std::unique_ptr<storage::LocalStore> store = storage::LocalStore::open_memory().unwrap();
    FakeRemoteBackend backend;
    SyncEngine engine{*store, backend, test_config()};
    storage::DeckRepository decks{*store};
    Uuid user = Uuid::generate();

    bool start_and_wait() {
        QSignalSpy finished(&engine, &SyncEngine::cycleFinished);
        engine.start();
        if (!finished.wait(2000)) return false;
        return finished.at(0).at(0).toBool();
    }

    std::optional<Result<void, Error>> sync_and_wait() {
        std::optional<Result<void, Error>> out;
        engine.sync_now([&out](Result<void, Error> r) { out = std::move(r); });
        REQUIRE(QTest::qWaitFor([&]() { return out.has_value(); }, 2000));
        return out;
    }
};

} // namespace

TEST_CASE("Sync engine: a cycle uploads, then downloads", "[sync][engine]") {
    EngineFixture f;
    auto local = create_deck(Uuid::generate(), f.user, "Local");
    REQUIRE(f.decks.insert(local).is_ok());

    auto remote = create_deck(Uuid::generate(), f.user, "Remote");
    remote.modified_at = Timestamp::from_iso_string("2024-03-01T10:00:00+00:00").value();
    f.backend.tables["decks"][remote.id.to_string()] = deck_to_row(remote);

    REQUIRE(f.start_and_wait());

    REQUIRE(f.backend.tables["decks"].contains(local.id.to_string()));
    REQUIRE(f.decks.get(remote.id).unwrap().has_value());
    REQUIRE(f.store->pending_count().unwrap() == 0);
    REQUIRE(f.engine.credentials()->account_id == "user-1");

    auto& state = f.engine.state();
    REQUIRE(std::holds_alternative<phase::Completed>(state.phase()));
    REQUIRE(state.pendingCount() == 0);

    // The download checkpoint is the newest watermark seen
    const auto checkpoint = f.store->checkpoint("decks").unwrap();
    REQUIRE(checkpoint.has_value());
    REQUIRE(Timestamp::from_iso_string(*checkpoint) >= remote.modified_at);

    SECTION("the next download only asks for newer rows") {
        f.backend.calls.clear();
        REQUIRE(f.sync_and_wait()->is_ok());
        REQUIRE(f.backend.count_calls("select") == 3);
        REQUIRE(f.backend.count_calls("upsert") == 0);
    }
}

TEST_CASE("Sync engine: checkpoints keep backend microseconds", "[sync][engine]") {
    EngineFixture f;
    auto remote = create_deck(Uuid::generate(), f.user, "Remote");
    auto row = deck_to_row(remote);
    row["modified_at"] = std::string("2025-01-08T12:00:00.123456+00:00");
    f.backend.tables["decks"][remote.id.to_string()] = row;

    REQUIRE(f.start_and_wait());
    REQUIRE(f.decks.get(remote.id).unwrap().has_value());

    const auto checkpoint = f.store->checkpoint("decks").unwrap();
    REQUIRE(checkpoint == std::optional<std::string>("2025-01-08T12:00:00.123456Z"));

    // The row the checkpoint came from is not downloaded again
    f.backend.synchronous = true;
    std::optional<size_t> newer;
    f.backend.select("decks", SelectFilter::modified_since("modified_at", *checkpoint),
        [&newer](Result<std::vector<Row>, Error> rows) { newer = rows.unwrap().size(); });
    REQUIRE(newer == std::optional<size_t>(0));
}

TEST_CASE("Sync engine: requests during a cycle join it", "[sync][engine]") {
    EngineFixture f;
    REQUIRE(f.start_and_wait());
    f.backend.calls.clear();

    int completed = 0;
    f.engine.sync_now([&completed](Result<void, Error> r) { if (r.is_ok()) ++completed; });
    REQUIRE(f.engine.is_cycle_running());
    f.engine.sync_now([&completed](Result<void, Error> r) { if (r.is_ok()) ++completed; });
    f.engine.sync_now();

    REQUIRE(QTest::qWaitFor([&]() { return completed == 2; }, 2000));
    REQUIRE(f.backend.count_calls("credentials") == 1);
}

TEST_CASE("Sync engine: connection failure leaves the store usable", "[sync][engine]") {
    EngineFixture f;
    f.backend.credentials_error = Error::network("host unreachable");
    QSignalSpy notifications(&f.engine, &SyncEngine::notification);

    REQUIRE_FALSE(f.start_and_wait());
    REQUIRE(f.engine.is_running());
    REQUIRE_FALSE(f.engine.credentials().has_value());

    const auto* failed = std::get_if<phase::Failed>(&f.engine.state().phase());
    REQUIRE(failed != nullptr);
    REQUIRE(failed->error.operation == "connect");
    REQUIRE(f.engine.retries().errorCount() == 1);
    REQUIRE(notifications.count() >= 1);

    // Offline-first: local writes still work and are logged
    REQUIRE(f.decks.insert(create_deck(Uuid::generate(), f.user, "Offline")).is_ok());
    REQUIRE(f.store->pending_count().unwrap() == 1);
    REQUIRE(f.engine.state().pendingCount() == 1);

    SECTION("a retry after the backend recovers clears the error") {
        f.backend.credentials_error.reset();
        QSignalSpy recovered(&f.engine.retries(), &RetryManager::retrySucceeded);
        f.engine.retries().retry_all();
        REQUIRE(recovered.wait(2000));
        REQUIRE(f.engine.retries().errors().empty());
        REQUIRE(std::holds_alternative<phase::Completed>(f.engine.state().phase()));
        REQUIRE(f.store->pending_count().unwrap() == 0);
    }

    SECTION("failed retries are not reported again") {
        QSignalSpy exhausted(&f.engine.retries(), &RetryManager::retryExhausted);
        f.engine.retries().retry_all();
        REQUIRE(exhausted.wait(2000));
        REQUIRE(f.engine.retries().errorCount() == 1);
        REQUIRE(f.engine.retries().history().size() == 1);
    }
}

TEST_CASE("Sync engine: auth failure asks for sign in", "[sync][engine]") {
    EngineFixture f;
    f.backend.credentials_error = Error::auth("Not signed in");
    QSignalSpy auth(&f.engine.retries(), &RetryManager::authenticationRequired);

    REQUIRE_FALSE(f.start_and_wait());
    REQUIRE(auth.count() == 1);
    REQUIRE_FALSE(f.engine.retries().errors().front().retryable);
}

TEST_CASE("Sync engine: local writes trigger an upload", "[sync][engine]") {
    EngineFixture f;
    REQUIRE(f.start_and_wait());
    f.engine.monitor().set_reachable(true);
    QTest::qWait(50);

    auto deck = create_deck(Uuid::generate(), f.user, "Fresh");
    REQUIRE(f.decks.insert(deck).is_ok());

    REQUIRE(QTest::qWaitFor([&]() {
        return f.backend.tables["decks"].contains(deck.id.to_string());
    }, 2000));
    REQUIRE(QTest::qWaitFor([&]() { return f.store->pending_count().unwrap() == 0; }, 2000));
}

TEST_CASE("Sync engine: shutdown cancels the cycle in flight", "[sync][engine]") {
    EngineFixture f;
    REQUIRE(f.start_and_wait());

    std::optional<Result<void, Error>> waiter;
    f.engine.sync_now([&waiter](Result<void, Error> r) { waiter = std::move(r); });
    REQUIRE(f.engine.is_cycle_running());

    f.engine.shutdown();
    REQUIRE(waiter.has_value());
    REQUIRE(waiter->unwrap_err().message == "Sync engine stopped");
    REQUIRE_FALSE(f.engine.is_running());
    REQUIRE_FALSE(f.engine.is_cycle_running());
    REQUIRE(std::holds_alternative<phase::Idle>(f.engine.state().phase()));

    // Late replies are ignored and later requests are refused
    QTest::qWait(30);
    std::optional<Result<void, Error>> refused;
    f.engine.sync_now([&refused](Result<void, Error> r) { refused = std::move(r); });
    REQUIRE(refused.has_value());
    REQUIRE(refused->is_err());

    // Local writes no longer reach the engine
    REQUIRE(f.decks.insert(create_deck(Uuid::generate(), f.user, "After")).is_ok());
    QTest::qWait(50);
    REQUIRE(f.store->pending_count().unwrap() == 1);
}
