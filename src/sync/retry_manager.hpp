#pragma once

#include "core/result.hpp"
#include "core/sync_types.hpp"
#include "sync/config.hpp"
#include "sync/notification.hpp"
#include "sync/sync_state.hpp"
#include <QObject>
#include <QTimer>
#include <deque>
#include <functional>
#include <map>
#include <optional>

namespace studysync::sync {

/**
 * RetryManager - the error queue and its per-error retry tasks.
 *
 * Retrying an error runs a fresh sync cycle through the runner; it never
 * replays the original request. Each task backs off on its own timer
 * (base delay doubled per attempt) and gives up after max_retries
 * attempts, leaving the error queued for a manual retry.
 *
 * Validation errors are only recorded in history. Auth errors are queued
 * but never retried automatically.
 */
class RetryManager : public QObject {
    Q_OBJECT

    Q_PROPERTY(int errorCount READ errorCount NOTIFY errorsChanged)

public:
    using SyncRunner = std::function<void(std::function<void(Result<void, Error>)>)>;

    RetryManager(SyncStateMachine& state, RetryPolicy policy, QObject* parent = nullptr);
    ~RetryManager() override;

    void set_sync_runner(SyncRunner runner) { runner_ = std::move(runner); }

    void report(const SyncError& error);

    /**
     * Start (or restart) the backoff loop for one queued error.
     * Non-retryable and unknown errors are ignored.
     */
    void retry(const Uuid& error_id);

    /**
     * retry() every retryable error in the queue.
     */
    void retry_all();

    /**
     * Drop an error and stop its task.
     */
    void remove(const Uuid& error_id);

    /**
     * Stop an error's task but keep the error queued.
     */
    void cancel(const Uuid& error_id);

    /**
     * Stop every task, keeping the errors.
     */
    void cancel_all();

    /**
     * Stop every task and empty the queue. A Failed phase returns to Idle.
     */
    void clear();

    [[nodiscard]] const std::deque<SyncError>& errors() const noexcept { return queue_; }
    [[nodiscard]] const std::deque<SyncError>& history() const noexcept { return history_; }
    [[nodiscard]] std::optional<SyncError> find(const Uuid& error_id) const;
    [[nodiscard]] bool is_retrying(const Uuid& error_id) const;
    [[nodiscard]] int attempts(const Uuid& error_id) const;
    [[nodiscard]] const RetryPolicy& policy() const noexcept { return policy_; }

    [[nodiscard]] int errorCount() const { return static_cast<int>(queue_.size()); }

signals:
    void errorsChanged();
    void notification(const studysync::sync::Notification& notification);
    void retrySucceeded(const QString& error_id);
    void retryExhausted(const QString& error_id);
    void authenticationRequired(const QString& message);

private:
    struct RetryTask {
        QTimer* timer = nullptr;  // child of the manager
        int attempts = 0;
        bool in_flight = false;
        uint64_t serial = 0;
    };

    void schedule_attempt(const Uuid& error_id);
    void run_attempt(const Uuid& error_id);
    void on_attempt_finished(const Uuid& error_id, uint64_t serial, Result<void, Error> result);
    void stop_task(const Uuid& error_id);
    void drop_task(std::map<Uuid, RetryTask>::iterator it);
    void erase_from_queue(const Uuid& error_id);

    SyncStateMachine& state_;
    RetryPolicy policy_;
    SyncRunner runner_;

    std::deque<SyncError> queue_;
    std::deque<SyncError> history_;
    std::map<Uuid, RetryTask> tasks_;
    uint64_t next_serial_ = 1;
};

} // namespace studysync::sync
