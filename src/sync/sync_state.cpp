#include "sync/sync_state.hpp"

#include "sync/logging.hpp"

namespace studysync::sync {

SyncStateMachine::SyncStateMachine(std::size_t max_conflict_history, QObject* parent)
    : QObject(parent)
    , max_conflict_history_(max_conflict_history == 0 ? 1 : max_conflict_history) {}

void SyncStateMachine::set_phase(SyncPhase next) {
    const bool completed = std::holds_alternative<phase::Completed>(next);
    if (completed) {
        last_synced_ = Timestamp::now();
    }
    if (next == phase_ && !completed) {
        return;
    }
    phase_ = std::move(next);
    qCDebug(studysyncSyncLog) << "phase" << status();
    emit phaseChanged();
    if (completed) {
        emit syncCompleted();
    }
}

void SyncStateMachine::update_upload_progress(int64_t completed, int64_t total) {
    set_phase(phase::Uploading{.completed = completed, .total = total});
}

void SyncStateMachine::track_pending_change(int64_t count) {
    if (count <= 0) return;
    pending_count_ += count;
    emit pendingCountChanged();
}

void SyncStateMachine::confirm_synced() {
    if (pending_count_ == 0) return;
    --pending_count_;
    emit pendingCountChanged();
}

void SyncStateMachine::reset_pending_count() {
    if (pending_count_ == 0) return;
    pending_count_ = 0;
    emit pendingCountChanged();
}

void SyncStateMachine::set_online(bool online) {
    if (online_ == online) return;
    online_ = online;
    emit onlineChanged();
}

void SyncStateMachine::log_conflict(const std::string& table,
                                    const std::string& record_id,
                                    const std::string& resolution) {
    ++conflicts_resolved_;
    if (conflicts_.size() >= max_conflict_history_) {
        conflicts_.pop_front();
    }
    conflicts_.push_back(ConflictRecord{
        .table = table,
        .record_id = record_id,
        .resolution = resolution,
        .timestamp = Timestamp::now()
    });
    qCInfo(studysyncSyncLog) << "conflict resolved" << QString::fromStdString(table)
                             << QString::fromStdString(record_id)
                             << QString::fromStdString(resolution);
    emit conflictsChanged();
}

void SyncStateMachine::clear_conflict_history() {
    conflicts_resolved_ = 0;
    conflicts_.clear();
    emit conflictsChanged();
}

} // namespace studysync::sync
