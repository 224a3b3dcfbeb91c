#pragma once

#include "core/result.hpp"
#include "storage/local_store.hpp"
#include "sync/config.hpp"
#include "sync/download_applier.hpp"
#include "sync/network_monitor.hpp"
#include "sync/notification.hpp"
#include "sync/remote_backend.hpp"
#include "sync/retry_manager.hpp"
#include "sync/sync_state.hpp"
#include "sync/upload_pipeline.hpp"
#include <QObject>
#include <QTimer>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace studysync::sync {

/**
 * SyncEngine - owns the sync services and runs sync cycles.
 *
 * A cycle is Connecting -> credentials -> upload drain -> Downloading ->
 * Completed, or Failed at the first step that breaks. Requests made while
 * a cycle runs wait for that cycle instead of starting another. The local
 * store stays usable whatever the cycle does.
 */
class SyncEngine : public QObject {
    Q_OBJECT

public:
    using CycleCallback = std::function<void(Result<void, Error>)>;

    SyncEngine(storage::LocalStore& store,
               RemoteBackend& backend,
               SyncConfig config,
               QObject* parent = nullptr);
    ~SyncEngine() override;

    /**
     * Start monitoring connectivity and local writes, then run the first
     * cycle. A connection failure here leaves the engine in offline mode.
     */
    void start();

    /**
     * Run a cycle now, or join the one in flight.
     */
    void sync_now(CycleCallback done = {});

    /**
     * Cancel every retry, stop monitoring and drop the session. Callers
     * waiting on a cycle get an error. The local store may be closed
     * afterwards.
     */
    void shutdown();

    [[nodiscard]] bool is_running() const noexcept { return running_; }
    [[nodiscard]] bool is_cycle_running() const noexcept { return cycle_running_; }
    [[nodiscard]] const std::optional<Credentials>& credentials() const noexcept { return credentials_; }

    [[nodiscard]] SyncStateMachine& state() noexcept { return *state_; }
    [[nodiscard]] RetryManager& retries() noexcept { return *retries_; }
    [[nodiscard]] NetworkMonitor& monitor() noexcept { return *monitor_; }
    [[nodiscard]] UploadPipeline& pipeline() noexcept { return *pipeline_; }
    [[nodiscard]] const SyncConfig& config() const noexcept { return config_; }

signals:
    void notification(const studysync::sync::Notification& notification);
    void cycleFinished(bool succeeded);

private:
    enum class Origin {
        Request,    // start(), sync_now(), local writes
        Retry,      // the retry manager re-running a failed cycle
        Reconnect   // scheduled after a connection failure
    };

    void run_cycle(Origin origin, CycleCallback done);
    void on_connected(uint64_t generation, Credentials credentials);
    void on_drained(uint64_t generation, DrainResult result);
    void on_downloaded(uint64_t generation, Result<int64_t, Error> result);
    void fail_cycle(const Error& error, const std::string& operation);
    void finish_cycle(Result<void, Error> result);

    void on_local_mutation();
    void refresh_pending_count();
    void schedule_reconnect();

    storage::LocalStore& store_;
    RemoteBackend& backend_;
    SyncConfig config_;

    std::unique_ptr<SyncStateMachine> state_;
    std::unique_ptr<RetryManager> retries_;
    std::unique_ptr<NetworkMonitor> monitor_;
    std::unique_ptr<UploadPipeline> pipeline_;
    std::unique_ptr<DownloadApplier> downloader_;

    QTimer upload_throttle_;
    QTimer reconnect_timer_;

    std::optional<Credentials> credentials_;
    std::optional<storage::LocalStore::ListenerId> listener_id_;
    std::vector<CycleCallback> waiters_;
    Origin origin_ = Origin::Request;
    uint64_t generation_ = 0;
    bool running_ = false;
    bool cycle_running_ = false;
    bool rerun_requested_ = false;
};

} // namespace studysync::sync
