#pragma once

#include "core/sync_types.hpp"
#include "core/types.hpp"
#include <QObject>
#include <QString>
#include <cstddef>
#include <deque>
#include <optional>

namespace studysync::sync {

/**
 * SyncStateMachine - current phase of the sync cycle plus its counters.
 *
 * Phases are flat and mutually exclusive; every set_phase() replaces the
 * previous value. Only the upload pipeline and the engine's connection
 * routine move the phase. Everything else reads it.
 */
class SyncStateMachine : public QObject {
    Q_OBJECT

    Q_PROPERTY(QString status READ status NOTIFY phaseChanged)
    Q_PROPERTY(bool busy READ isBusy NOTIFY phaseChanged)
    Q_PROPERTY(qint64 pendingCount READ pendingCount NOTIFY pendingCountChanged)
    Q_PROPERTY(bool online READ isOnline NOTIFY onlineChanged)
    Q_PROPERTY(qint64 conflictsResolved READ conflictsResolved NOTIFY conflictsChanged)

public:
    explicit SyncStateMachine(std::size_t max_conflict_history = 100, QObject* parent = nullptr);

    [[nodiscard]] const SyncPhase& phase() const noexcept { return phase_; }

    /**
     * Replace the phase. Entering Completed stamps last_synced().
     */
    void set_phase(SyncPhase next);

    /**
     * Uploading(completed, total) shortcut.
     */
    void update_upload_progress(int64_t completed, int64_t total);

    [[nodiscard]] std::optional<Timestamp> last_synced() const noexcept { return last_synced_; }

    // Pending local changes
    void track_pending_change(int64_t count = 1);
    void confirm_synced();
    void reset_pending_count();

    void set_online(bool online);

    // Conflict audit trail
    void log_conflict(const std::string& table, const std::string& record_id, const std::string& resolution);
    void clear_conflict_history();
    [[nodiscard]] const std::deque<ConflictRecord>& conflict_history() const noexcept { return conflicts_; }

    [[nodiscard]] QString status() const { return QString::fromStdString(describe(phase_)); }
    [[nodiscard]] bool isBusy() const { return is_active(phase_); }
    [[nodiscard]] qint64 pendingCount() const { return pending_count_; }
    [[nodiscard]] bool isOnline() const { return online_; }
    [[nodiscard]] qint64 conflictsResolved() const { return conflicts_resolved_; }

signals:
    void phaseChanged();
    void pendingCountChanged();
    void onlineChanged();
    void conflictsChanged();
    void syncCompleted();

private:
    SyncPhase phase_{phase::Idle{}};
    std::optional<Timestamp> last_synced_;
    int64_t pending_count_ = 0;
    bool online_ = true;

    std::size_t max_conflict_history_;
    std::deque<ConflictRecord> conflicts_;
    int64_t conflicts_resolved_ = 0;
};

} // namespace studysync::sync
