#include "sync/upload_pipeline.hpp"

#include "core/conflict_resolver.hpp"
#include "sync/logging.hpp"
#include "sync/retry_manager.hpp"
#include "sync/sync_state.hpp"

#include <QMetaObject>
#include <QPointer>

#include <algorithm>
#include <iterator>

namespace studysync::sync {

namespace {

QString q(const std::string& s) {
    return QString::fromStdString(s);
}

SyncError make_batch_error(const Error& error, const std::string& table, const std::vector<std::string>& ids) {
    auto sync_error = make_sync_error(error, std::string("PUT:") + table + ":" +
                                      (ids.size() == 1 ? ids.front() : std::to_string(ids.size()) + " records"));
    sync_error.table = table;
    if (ids.size() == 1) {
        sync_error.record_id = ids.front();
    }
    return sync_error;
}

} // namespace

UploadPipeline::UploadPipeline(storage::LocalStore& store,
                               RemoteBackend& backend,
                               SyncStateMachine& state,
                               RetryManager& retries,
                               QObject* parent)
    : QObject(parent)
    , store_(store)
    , backend_(backend)
    , state_(state)
    , retries_(retries) {}

UploadPipeline::~UploadPipeline() = default;

bool UploadPipeline::is_current(uint64_t serial) const {
    return current_ && current_->serial == serial;
}

void UploadPipeline::abort() {
    if (current_) {
        qCInfo(studysyncUploadLog) << "drain aborted after" << current_->settled << "operations";
    }
    current_.reset();
}

// ============================================================================
// Planning
// ============================================================================

void UploadPipeline::drain(DrainCallback done) {
    if (current_) {
        qCWarning(studysyncUploadLog) << "drain requested while one is running";
        DrainResult busy;
        busy.failures.push_back(make_sync_error(Error{"Upload already in progress"}, "drain"));
        done(std::move(busy));
        return;
    }

    auto batch = store_.get_mutation_batch();
    if (batch.is_err()) {
        const auto error = batch.unwrap_err();
        qCWarning(studysyncUploadLog) << "cannot read mutation log:" << q(error.message);
        auto sync_error = make_sync_error(error, "drain");
        retries_.report(sync_error);
        state_.set_phase(phase::Failed{.error = sync_error});
        DrainResult failed;
        failed.failures.push_back(std::move(sync_error));
        done(std::move(failed));
        return;
    }

    if (batch.unwrap().empty()) {
        qCDebug(studysyncUploadLog) << "nothing to upload";
        done(DrainResult{});
        return;
    }

    current_ = std::make_unique<Drain>();
    current_->serial = next_serial_++;
    current_->done = std::move(done);
    current_->batch.emplace(std::move(batch).unwrap());
    current_->result.total = static_cast<int64_t>(current_->batch->operations().size());
    plan(current_->batch->operations());

    qCInfo(studysyncUploadLog) << "draining" << current_->result.total << "operations in"
                               << current_->groups.size() << "put batches and"
                               << current_->singles.size() << "single requests";
    state_.update_upload_progress(0, current_->result.total);
    step();
}

void UploadPipeline::plan(const std::vector<PendingOperation>& operations) {
    auto& groups = current_->groups;
    for (const auto& op : operations) {
        if (op.kind != OpKind::Put) {
            current_->singles.push_back(op);
            continue;
        }

        auto group = std::find_if(groups.begin(), groups.end(),
                                  [&](const PutGroup& g) { return g.table == op.table; });
        if (group == groups.end()) {
            groups.push_back(PutGroup{.table = op.table, .ops = {}, .ids = {}, .latest = {}});
            group = std::prev(groups.end());
        }
        group->ops.push_back(op);
        if (!group->latest.contains(op.record_id)) {
            group->ids.push_back(op.record_id);
        }
        group->latest[op.record_id] = op.data;
    }
}

// ============================================================================
// Stepping
// ============================================================================

void UploadPipeline::continue_later() {
    // Backends may complete synchronously; hop through the event loop so a
    // long log does not recurse.
    const auto serial = current_->serial;
    QPointer<UploadPipeline> self(this);
    QMetaObject::invokeMethod(this, [self, serial]() {
        if (!self || !self->is_current(serial)) return;
        self->step();
    }, Qt::QueuedConnection);
}

void UploadPipeline::step() {
    auto& drain = *current_;
    if (drain.next_group < drain.groups.size()) {
        fetch_group(drain.groups[drain.next_group++]);
        return;
    }
    if (drain.next_single < drain.singles.size()) {
        send_single(drain.singles[drain.next_single++]);
        return;
    }
    finish();
}

// ============================================================================
// Put batches
// ============================================================================

void UploadPipeline::fetch_group(const PutGroup& group) {
    const auto serial = current_->serial;
    QPointer<UploadPipeline> self(this);
    qCDebug(studysyncUploadLog) << "fetching" << group.ids.size() << "remote rows of" << q(group.table);

    backend_.select(group.table, SelectFilter::by_ids(group.ids),
        [self, serial, &group](Result<std::vector<Row>, Error> rows) {
            if (!self || !self->is_current(serial)) return;
            if (rows.is_err()) {
                self->fail_group(group, rows.unwrap_err());
                return;
            }
            self->upload_group(group, rows.unwrap());
        });
}

void UploadPipeline::upload_group(const PutGroup& group, const std::vector<Row>& remote_rows) {
    std::map<std::string, const Row*> remote_by_id;
    for (const auto& row : remote_rows) {
        if (auto id = get_text(row, "id")) {
            remote_by_id[*id] = &row;
        }
    }

    std::vector<Row> payload;
    payload.reserve(group.ids.size());
    for (const auto& id : group.ids) {
        const auto& local = group.latest.at(id);
        auto remote = remote_by_id.find(id);
        if (remote == remote_by_id.end()) {
            payload.push_back(local);
            continue;
        }
        auto resolved = resolve_row(group.table, local, *remote->second);
        if (resolved.conflicted()) {
            state_.log_conflict(group.table, id, *resolved.tag);
        }
        payload.push_back(std::move(resolved.merged));
    }

    const auto serial = current_->serial;
    QPointer<UploadPipeline> self(this);
    backend_.upsert_batch(group.table, std::move(payload),
        [self, serial, &group](Result<void, Error> result) {
            if (!self || !self->is_current(serial)) return;
            if (result.is_err()) {
                self->fail_group(group, result.unwrap_err());
                return;
            }
            qCDebug(studysyncUploadLog) << "uploaded" << group.ids.size() << "rows of" << q(group.table);
            for (const auto& op : group.ops) {
                self->settle(op, true);
            }
            self->continue_later();
        });
}

void UploadPipeline::fail_group(const PutGroup& group, const Error& error) {
    qCWarning(studysyncUploadLog) << "put batch for" << q(group.table) << "failed:" << q(error.message);
    record_failure(make_batch_error(error, group.table, group.ids));
    for (const auto& op : group.ops) {
        settle(op, false);
    }
    continue_later();
}

// ============================================================================
// Patches and deletes
// ============================================================================

void UploadPipeline::send_single(const PendingOperation& op) {
    const auto serial = current_->serial;
    QPointer<UploadPipeline> self(this);
    auto on_done = [self, serial, op](Result<void, Error> result) {
        if (!self || !self->is_current(serial)) return;
        if (result.is_err()) {
            qCWarning(studysyncUploadLog) << q(op.describe()) << "failed:" << q(result.unwrap_err().message);
            self->record_failure(make_sync_error(result.unwrap_err(), op));
            self->settle(op, false);
        } else {
            self->settle(op, true);
        }
        self->continue_later();
    };

    switch (op.kind) {
        case OpKind::Patch:
            backend_.update(op.table, op.record_id, op.data, std::move(on_done));
            return;
        case OpKind::Delete:
            backend_.remove(op.table, op.record_id, std::move(on_done));
            return;
        case OpKind::Put:
            break;
    }
    // Puts are always batched.
    on_done(Result<void, Error>::err(Error::validation("Unexpected PUT outside a batch")));
}

// ============================================================================
// Settlement
// ============================================================================

void UploadPipeline::settle(const PendingOperation& op, bool succeeded) {
    auto& drain = *current_;
    auto removed = store_.remove_operation(op.position);
    if (removed.is_err()) {
        // complete() at the end of the drain removes it.
        qCWarning(studysyncUploadLog) << "could not remove" << q(op.describe()) << "from the log:"
                                      << q(removed.unwrap_err().message);
    }
    ++drain.settled;
    if (succeeded) {
        ++drain.result.succeeded;
        state_.confirm_synced();
    }
    state_.update_upload_progress(drain.settled, drain.result.total);
}

void UploadPipeline::record_failure(SyncError error) {
    retries_.report(error);
    current_->result.failures.push_back(std::move(error));
}

void UploadPipeline::finish() {
    auto drain = std::move(current_);

    auto completed = drain->batch->complete();
    if (completed.is_err()) {
        qCWarning(studysyncUploadLog) << "could not complete upload batch:" << q(completed.unwrap_err().message);
    }

    qCInfo(studysyncUploadLog) << "drain finished:" << drain->result.succeeded << "of"
                               << drain->result.total << "uploaded," << drain->result.failures.size()
                               << "failures";
    if (drain->result.ok()) {
        state_.set_phase(phase::Completed{});
    } else {
        state_.set_phase(phase::Failed{.error = drain->result.failures.back()});
    }
    drain->done(std::move(drain->result));
}

} // namespace studysync::sync
