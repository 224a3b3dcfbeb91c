#include "sync/network_monitor.hpp"

#include "sync/logging.hpp"
#include "sync/retry_manager.hpp"
#include "sync/sync_state.hpp"

namespace studysync::sync {

namespace {

bool is_online(QNetworkInformation::Reachability reachability) {
    switch (reachability) {
        case QNetworkInformation::Reachability::Disconnected:
            return false;
        case QNetworkInformation::Reachability::Unknown:
        case QNetworkInformation::Reachability::Local:
        case QNetworkInformation::Reachability::Site:
        case QNetworkInformation::Reachability::Online:
            return true;
    }
    return true;
}

} // namespace

NetworkMonitor::NetworkMonitor(RetryManager& retries,
                               SyncStateMachine& state,
                               std::chrono::milliseconds debounce,
                               QObject* parent)
    : QObject(parent)
    , retries_(retries)
    , state_(state) {
    debounce_.setSingleShot(true);
    debounce_.setInterval(debounce);
    connect(&debounce_, &QTimer::timeout, this, &NetworkMonitor::onDebounceElapsed);
}

NetworkMonitor::~NetworkMonitor() {
    stop();
}

void NetworkMonitor::start() {
    if (running_) return;
    running_ = true;

    if (!QNetworkInformation::instance() &&
        !QNetworkInformation::loadBackendByFeatures(QNetworkInformation::Feature::Reachability)) {
        qCInfo(studysyncNetworkLog) << "no reachability backend, assuming online";
        return;
    }
    auto* info = QNetworkInformation::instance();
    if (!info) {
        qCInfo(studysyncNetworkLog) << "no reachability backend, assuming online";
        return;
    }

    qCInfo(studysyncNetworkLog) << "monitoring via" << info->backendName();
    reachability_connection_ = connect(info, &QNetworkInformation::reachabilityChanged,
                                       this, &NetworkMonitor::onReachabilityChanged);
    reachable_ = is_online(info->reachability());
    state_.set_online(reachable_);
}

void NetworkMonitor::stop() {
    if (!running_) return;
    running_ = false;
    if (reachability_connection_) {
        disconnect(reachability_connection_);
        reachability_connection_ = {};
    }
    debounce_.stop();
}

void NetworkMonitor::onReachabilityChanged(QNetworkInformation::Reachability reachability) {
    set_reachable(is_online(reachability));
}

void NetworkMonitor::set_reachable(bool reachable) {
    if (!running_ || reachable == reachable_) return;
    reachable_ = reachable;
    state_.set_online(reachable);

    if (!reachable) {
        qCInfo(studysyncNetworkLog) << "offline";
        debounce_.stop();
        emit wentOffline();
        emit notification(Notification{
            .kind = Notification::Kind::Warning,
            .title = QStringLiteral("You're Offline"),
            .message = QStringLiteral("Changes will sync when connected"),
            .can_retry = false
        });
        return;
    }

    qCInfo(studysyncNetworkLog) << "online, retrying after" << debounce_.interval() << "ms";
    debounce_.start();
}

void NetworkMonitor::onDebounceElapsed() {
    if (!running_ || !reachable_) return;
    emit notification(Notification{
        .kind = Notification::Kind::Info,
        .title = QStringLiteral("Back Online"),
        .message = QStringLiteral("Syncing your changes..."),
        .can_retry = false
    });
    emit reconnected();
    retries_.retry_all();
}

} // namespace studysync::sync
