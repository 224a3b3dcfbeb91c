#pragma once

#include "sync/notification.hpp"
#include <QNetworkInformation>
#include <QObject>
#include <QTimer>
#include <chrono>

namespace studysync::sync {

class RetryManager;
class SyncStateMachine;

/**
 * NetworkMonitor - follows device connectivity.
 *
 * Each unreachable -> reachable transition triggers one retry_all() once
 * connectivity has held for the debounce interval; flapping inside the
 * interval collapses into a single sweep.
 */
class NetworkMonitor : public QObject {
    Q_OBJECT

public:
    NetworkMonitor(RetryManager& retries,
                   SyncStateMachine& state,
                   std::chrono::milliseconds debounce,
                   QObject* parent = nullptr);
    ~NetworkMonitor() override;

    /**
     * Attach to the platform's reachability backend. Without one the device
     * is assumed to be online.
     */
    void start();
    void stop();

    [[nodiscard]] bool is_running() const noexcept { return running_; }
    [[nodiscard]] bool is_reachable() const noexcept { return reachable_; }

    /**
     * Feed a connectivity observation. Also used when no platform backend
     * is available.
     */
    void set_reachable(bool reachable);

signals:
    void reconnected();
    void wentOffline();
    void notification(const studysync::sync::Notification& notification);

private slots:
    void onReachabilityChanged(QNetworkInformation::Reachability reachability);
    void onDebounceElapsed();

private:
    RetryManager& retries_;
    SyncStateMachine& state_;
    QTimer debounce_;
    QMetaObject::Connection reachability_connection_;
    bool running_ = false;
    bool reachable_ = true;
};

} // namespace studysync::sync
