#include "sync/retry_manager.hpp"

#include "sync/logging.hpp"

#include <QPointer>

#include <algorithm>

namespace studysync::sync {

RetryManager::RetryManager(SyncStateMachine& state, RetryPolicy policy, QObject* parent)
    : QObject(parent)
    , state_(state)
    , policy_(policy) {
    if (policy_.max_queue == 0) policy_.max_queue = 1;
    if (policy_.max_history == 0) policy_.max_history = 1;
}

RetryManager::~RetryManager() {
    cancel_all();
}

// ============================================================================
// Queue
// ============================================================================

void RetryManager::report(const SyncError& error) {
    if (history_.size() >= policy_.max_history) {
        history_.pop_front();
    }
    history_.push_back(error);

    if (error.kind == ErrorKind::Validation) {
        qCWarning(studysyncRetryLog) << "dropping non-recoverable error"
                                     << QString::fromStdString(error.operation)
                                     << QString::fromStdString(error.message);
        emit errorsChanged();
        return;
    }

    if (queue_.size() >= policy_.max_queue) {
        const auto evicted = queue_.front().id;
        stop_task(evicted);
        queue_.pop_front();
        qCDebug(studysyncRetryLog) << "error queue full, evicted"
                                   << QString::fromStdString(evicted.to_string());
    }
    queue_.push_back(error);

    qCInfo(studysyncRetryLog) << "reported" << QString::fromStdString(error.operation)
                              << "kind=" << to_string(error.kind)
                              << "retryable=" << error.retryable
                              << QString::fromStdString(error.message);

    emit errorsChanged();
    emit notification(sync_failed_notification(QString::fromStdString(error.message), error.retryable));
    if (error.kind == ErrorKind::Auth) {
        emit authenticationRequired(QString::fromStdString(error.message));
    }
}

std::optional<SyncError> RetryManager::find(const Uuid& error_id) const {
    auto it = std::find_if(queue_.begin(), queue_.end(),
                           [&](const SyncError& e) { return e.id == error_id; });
    if (it == queue_.end()) return std::nullopt;
    return *it;
}

bool RetryManager::is_retrying(const Uuid& error_id) const {
    return tasks_.contains(error_id);
}

int RetryManager::attempts(const Uuid& error_id) const {
    auto it = tasks_.find(error_id);
    return it == tasks_.end() ? 0 : it->second.attempts;
}

void RetryManager::erase_from_queue(const Uuid& error_id) {
    queue_.erase(std::remove_if(queue_.begin(), queue_.end(),
                                [&](const SyncError& e) { return e.id == error_id; }),
                 queue_.end());
}

void RetryManager::remove(const Uuid& error_id) {
    stop_task(error_id);
    const auto before = queue_.size();
    erase_from_queue(error_id);
    if (queue_.size() != before) {
        emit errorsChanged();
    }
}

void RetryManager::cancel(const Uuid& error_id) {
    stop_task(error_id);
}

void RetryManager::cancel_all() {
    while (!tasks_.empty()) {
        drop_task(tasks_.begin());
    }
}

void RetryManager::clear() {
    cancel_all();
    queue_.clear();
    if (std::holds_alternative<phase::Failed>(state_.phase())) {
        state_.set_phase(phase::Idle{});
    }
    emit errorsChanged();
}

// ============================================================================
// Retry tasks
// ============================================================================

void RetryManager::retry(const Uuid& error_id) {
    auto error = find(error_id);
    if (!error || !error->retryable || policy_.max_retries <= 0) {
        return;
    }

    stop_task(error_id);
    RetryTask task;
    task.serial = next_serial_++;
    task.timer = new QTimer(this);
    task.timer->setSingleShot(true);
    connect(task.timer, &QTimer::timeout, this, [this, error_id]() { run_attempt(error_id); });
    tasks_.emplace(error_id, std::move(task));

    schedule_attempt(error_id);
}

void RetryManager::retry_all() {
    std::vector<Uuid> ids;
    for (const auto& error : queue_) {
        if (error.retryable) ids.push_back(error.id);
    }
    qCInfo(studysyncRetryLog) << "retrying" << ids.size() << "errors";
    for (const auto& id : ids) {
        retry(id);
    }
}

void RetryManager::schedule_attempt(const Uuid& error_id) {
    auto it = tasks_.find(error_id);
    if (it == tasks_.end()) return;
    auto& task = it->second;

    // 2s, 4s, 8s with the default policy.
    const auto delay = policy_.base_delay * (int64_t{1} << task.attempts);
    qCDebug(studysyncRetryLog) << "attempt" << task.attempts + 1 << "in" << delay.count() << "ms";
    task.timer->start(delay);
}

void RetryManager::run_attempt(const Uuid& error_id) {
    auto it = tasks_.find(error_id);
    if (it == tasks_.end()) return;
    auto& task = it->second;
    ++task.attempts;
    task.in_flight = true;

    const auto serial = task.serial;
    if (!runner_) {
        on_attempt_finished(error_id, serial,
                            Result<void, Error>::err(Error{"No sync runner configured"}));
        return;
    }
    QPointer<RetryManager> self(this);
    runner_([self, error_id, serial](Result<void, Error> result) {
        if (!self) return;
        self->on_attempt_finished(error_id, serial, std::move(result));
    });
}

void RetryManager::on_attempt_finished(const Uuid& error_id, uint64_t serial, Result<void, Error> result) {
    auto it = tasks_.find(error_id);
    if (it == tasks_.end() || it->second.serial != serial) {
        return;  // cancelled while the cycle ran
    }
    auto& task = it->second;
    task.in_flight = false;
    const auto id = QString::fromStdString(error_id.to_string());

    if (result.is_ok()) {
        drop_task(it);
        erase_from_queue(error_id);
        qCInfo(studysyncRetryLog) << "retry succeeded" << id;
        if (queue_.empty()) {
            state_.set_phase(phase::Completed{});
        }
        emit errorsChanged();
        emit retrySucceeded(id);
        emit notification(Notification{
            .kind = Notification::Kind::Success,
            .title = QStringLiteral("Sync Recovered"),
            .message = QStringLiteral("Changes have been synced"),
            .can_retry = false
        });
        return;
    }

    qCWarning(studysyncRetryLog) << "retry attempt" << task.attempts << "failed:"
                                 << QString::fromStdString(result.unwrap_err().message);
    if (task.attempts < policy_.max_retries) {
        schedule_attempt(error_id);
        return;
    }

    drop_task(it);
    qCWarning(studysyncRetryLog) << "retries exhausted" << id;
    emit retryExhausted(id);
    emit notification(Notification{
        .kind = Notification::Kind::Error,
        .title = QStringLiteral("Sync Failed"),
        .message = QStringLiteral("Please try again later"),
        .can_retry = true
    });
}

void RetryManager::stop_task(const Uuid& error_id) {
    auto it = tasks_.find(error_id);
    if (it != tasks_.end()) {
        drop_task(it);
    }
}

void RetryManager::drop_task(std::map<Uuid, RetryTask>::iterator it) {
    // The timer may be the sender of the signal currently being handled.
    it->second.timer->stop();
    it->second.timer->deleteLater();
    tasks_.erase(it);
}

} // namespace studysync::sync
