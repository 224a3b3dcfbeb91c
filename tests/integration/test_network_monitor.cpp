#include <catch2/catch_test_macros.hpp>

#include <QSignalSpy>
#include <QTest>

#include "sync/network_monitor.hpp"
#include "sync/retry_manager.hpp"

using namespace studysync;
using namespace studysync::sync;
using namespace std::chrono_literals;

namespace {

constexpr auto kDebounce = 40ms;

struct MonitorFixture {
    SyncStateMachine state;
    RetryManager retries{state, RetryPolicy{.max_retries = 3, .base_delay = 1ms, .max_queue = 10, .max_history = 10}};
    NetworkMonitor monitor{retries, state, kDebounce};
    int runs = 0;

    MonitorFixture() {
        retries.set_sync_runner([this](auto done) {
            ++runs;
            done(Result<void, Error>::ok());
        });
        monitor.start();
        // Whatever the platform reports, begin from a settled online state.
        monitor.set_reachable(true);
        QTest::qWait(static_cast<int>(kDebounce.count()) * 3);
    }
};

} // namespace

TEST_CASE("Network monitor: going offline is announced", "[sync][network]") {
    MonitorFixture f;
    QSignalSpy offline(&f.monitor, &NetworkMonitor::wentOffline);
    QSignalSpy notifications(&f.monitor, &NetworkMonitor::notification);

    f.monitor.set_reachable(false);
    REQUIRE_FALSE(f.monitor.is_reachable());
    REQUIRE_FALSE(f.state.isOnline());
    REQUIRE(offline.count() == 1);
    REQUIRE(notifications.count() == 1);
    REQUIRE(notifications.at(0).at(0).value<Notification>().title == QStringLiteral("You're Offline"));

    // Repeated observations are not transitions
    f.monitor.set_reachable(false);
    REQUIRE(offline.count() == 1);
}

TEST_CASE("Network monitor: reconnecting retries queued errors once", "[sync][network]") {
    MonitorFixture f;
    f.monitor.set_reachable(false);
    f.retries.report(make_sync_error(Error::network("down"), "connect"));

    QSignalSpy reconnected(&f.monitor, &NetworkMonitor::reconnected);
    QSignalSpy notifications(&f.monitor, &NetworkMonitor::notification);

    f.monitor.set_reachable(true);
    REQUIRE(f.state.isOnline());
    // Nothing happens before the debounce interval has passed
    REQUIRE(reconnected.count() == 0);

    REQUIRE(reconnected.wait(1000));
    REQUIRE(notifications.last().at(0).value<Notification>().title == QStringLiteral("Back Online"));
    REQUIRE(QTest::qWaitFor([&]() { return f.retries.errors().empty(); }, 1000));
    REQUIRE(f.runs == 1);
}

TEST_CASE("Network monitor: flapping collapses into one sweep", "[sync][network]") {
    MonitorFixture f;
    QSignalSpy reconnected(&f.monitor, &NetworkMonitor::reconnected);

    for (int i = 0; i < 3; ++i) {
        f.monitor.set_reachable(false);
        f.monitor.set_reachable(true);
        QTest::qWait(1);
    }
    QTest::qWait(static_cast<int>(kDebounce.count()) * 4);
    REQUIRE(reconnected.count() == 1);

    SECTION("dropping again inside the interval cancels the sweep") {
        f.monitor.set_reachable(false);
        f.monitor.set_reachable(true);
        f.monitor.set_reachable(false);
        QTest::qWait(static_cast<int>(kDebounce.count()) * 3);
        REQUIRE(reconnected.count() == 1);
    }
}

TEST_CASE("Network monitor: a stopped monitor ignores observations", "[sync][network]") {
    MonitorFixture f;
    f.monitor.stop();
    REQUIRE_FALSE(f.monitor.is_running());

    QSignalSpy offline(&f.monitor, &NetworkMonitor::wentOffline);
    f.monitor.set_reachable(false);
    REQUIRE(offline.count() == 0);
    REQUIRE(f.monitor.is_reachable());
}
