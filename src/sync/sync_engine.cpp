#include "sync/sync_engine.hpp"

#include "sync/logging.hpp"

#include <QPointer>

namespace studysync::sync {

SyncEngine::SyncEngine(storage::LocalStore& store,
                       RemoteBackend& backend,
                       SyncConfig config,
                       QObject* parent)
    : QObject(parent)
    , store_(store)
    , backend_(backend)
    , config_(config)
    , state_(std::make_unique<SyncStateMachine>(config.max_conflict_history))
    , retries_(std::make_unique<RetryManager>(*state_, config.retry))
    , monitor_(std::make_unique<NetworkMonitor>(*retries_, *state_, config.connectivity_debounce))
    , pipeline_(std::make_unique<UploadPipeline>(store, backend, *state_, *retries_))
    , downloader_(std::make_unique<DownloadApplier>(store, backend)) {
    upload_throttle_.setSingleShot(true);
    upload_throttle_.setInterval(config_.upload_throttle);
    connect(&upload_throttle_, &QTimer::timeout, this, [this]() { sync_now(); });

    reconnect_timer_.setSingleShot(true);
    reconnect_timer_.setInterval(config_.reconnect_delay);
    connect(&reconnect_timer_, &QTimer::timeout, this, [this]() {
        if (running_) run_cycle(Origin::Reconnect, {});
    });

    retries_->set_sync_runner([this](std::function<void(Result<void, Error>)> done) {
        run_cycle(Origin::Retry, std::move(done));
    });

    connect(retries_.get(), &RetryManager::notification, this, &SyncEngine::notification);
    connect(monitor_.get(), &NetworkMonitor::notification, this, &SyncEngine::notification);
    connect(monitor_.get(), &NetworkMonitor::wentOffline, this, [this]() { reconnect_timer_.stop(); });
    connect(monitor_.get(), &NetworkMonitor::reconnected, this, [this]() {
        // Queued errors are retried by the retry manager; otherwise just sync.
        if (running_ && retries_->errors().empty()) sync_now();
    });
}

SyncEngine::~SyncEngine() {
    shutdown();
}

// ============================================================================
// Lifecycle
// ============================================================================

void SyncEngine::start() {
    if (running_) return;
    running_ = true;
    qCInfo(studysyncSyncLog) << "engine start";

    monitor_->start();
    listener_id_ = store_.add_mutation_listener([this]() { on_local_mutation(); });
    refresh_pending_count();
    run_cycle(Origin::Request, {});
}

void SyncEngine::shutdown() {
    if (!running_ && !cycle_running_) return;
    qCInfo(studysyncSyncLog) << "engine shutdown";
    running_ = false;

    retries_->cancel_all();
    monitor_->stop();
    upload_throttle_.stop();
    reconnect_timer_.stop();

    if (listener_id_ && store_.is_open()) {
        store_.remove_mutation_listener(*listener_id_);
    }
    listener_id_.reset();

    ++generation_;
    pipeline_->abort();
    downloader_->abort();
    credentials_.reset();

    if (cycle_running_) {
        cycle_running_ = false;
        rerun_requested_ = false;
        state_->set_phase(phase::Idle{});
        auto waiters = std::move(waiters_);
        waiters_.clear();
        for (auto& waiter : waiters) {
            if (waiter) waiter(Result<void, Error>::err(Error{"Sync engine stopped"}));
        }
    }
}

void SyncEngine::sync_now(CycleCallback done) {
    run_cycle(Origin::Request, std::move(done));
}

// ============================================================================
// Cycle
// ============================================================================

void SyncEngine::run_cycle(Origin origin, CycleCallback done) {
    if (!running_) {
        if (done) done(Result<void, Error>::err(Error{"Sync engine is not running"}));
        return;
    }
    if (done) waiters_.push_back(std::move(done));
    if (cycle_running_) {
        qCDebug(studysyncSyncLog) << "joining the cycle in flight";
        return;
    }

    cycle_running_ = true;
    origin_ = origin;
    reconnect_timer_.stop();
    upload_throttle_.stop();
    const auto generation = ++generation_;
    state_->set_phase(phase::Connecting{});

    QPointer<SyncEngine> self(this);
    backend_.fetch_credentials([self, generation](Result<Credentials, Error> result) {
        if (!self || self->generation_ != generation) return;
        if (result.is_err()) {
            self->fail_cycle(result.unwrap_err(), "connect");
            return;
        }
        self->on_connected(generation, std::move(result).unwrap());
    });
}

void SyncEngine::on_connected(uint64_t generation, Credentials credentials) {
    qCInfo(studysyncSyncLog) << "connected as" << QString::fromStdString(credentials.account_id);
    credentials_ = std::move(credentials);

    QPointer<SyncEngine> self(this);
    pipeline_->drain([self, generation](DrainResult result) {
        if (!self || self->generation_ != generation) return;
        self->on_drained(generation, std::move(result));
    });
}

void SyncEngine::on_drained(uint64_t generation, DrainResult result) {
    refresh_pending_count();
    if (!result.ok()) {
        // The pipeline already reported each failure and set Failed.
        const auto& last = result.failures.back();
        finish_cycle(Result<void, Error>::err(Error{last.message, 0, last.kind}));
        return;
    }

    state_->set_phase(phase::Downloading{});
    QPointer<SyncEngine> self(this);
    downloader_->run([self, generation](Result<int64_t, Error> downloaded) {
        if (!self || self->generation_ != generation) return;
        self->on_downloaded(generation, std::move(downloaded));
    });
}

void SyncEngine::on_downloaded(uint64_t /*generation*/, Result<int64_t, Error> result) {
    if (result.is_err()) {
        fail_cycle(result.unwrap_err(), "download");
        return;
    }
    state_->set_phase(phase::Completed{});
    finish_cycle(Result<void, Error>::ok());
}

void SyncEngine::fail_cycle(const Error& error, const std::string& operation) {
    auto sync_error = make_sync_error(error, operation);
    qCWarning(studysyncSyncLog) << operation.c_str() << "failed:" << QString::fromStdString(error.message)
                                << "kind=" << to_string(error.kind);

    // A retry's own failure is already represented by the error being retried.
    if (origin_ == Origin::Request) {
        retries_->report(sync_error);
    }
    state_->set_phase(phase::Failed{.error = sync_error});

    if (operation == "connect") {
        credentials_.reset();
        if (origin_ != Origin::Retry && sync_error.retryable) {
            schedule_reconnect();
        }
    }
    finish_cycle(Result<void, Error>::err(error));
}

void SyncEngine::finish_cycle(Result<void, Error> result) {
    cycle_running_ = false;
    auto waiters = std::move(waiters_);
    waiters_.clear();

    emit cycleFinished(result.is_ok());
    for (auto& waiter : waiters) {
        if (waiter) waiter(result);
    }

    if (running_ && rerun_requested_) {
        rerun_requested_ = false;
        upload_throttle_.start();
    }
}

// ============================================================================
// Local writes and reconnects
// ============================================================================

void SyncEngine::on_local_mutation() {
    refresh_pending_count();
    if (!running_ || !state_->isOnline()) return;
    if (cycle_running_) {
        rerun_requested_ = true;
        return;
    }
    if (!upload_throttle_.isActive()) {
        upload_throttle_.start();
    }
}

void SyncEngine::refresh_pending_count() {
    auto count = store_.pending_count();
    if (count.is_err()) {
        qCWarning(studysyncSyncLog) << "cannot count pending operations:"
                                    << QString::fromStdString(count.unwrap_err().message);
        return;
    }
    state_->reset_pending_count();
    state_->track_pending_change(count.unwrap());
}

void SyncEngine::schedule_reconnect() {
    if (!running_ || !monitor_->is_reachable()) return;
    if (!reconnect_timer_.isActive()) {
        qCInfo(studysyncSyncLog) << "reconnecting in" << reconnect_timer_.interval() << "ms";
        reconnect_timer_.start();
    }
}

} // namespace studysync::sync
