#pragma once

#include "core/sync_types.hpp"
#include "storage/local_store.hpp"
#include "sync/remote_backend.hpp"
#include <QObject>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace studysync::sync {

class RetryManager;
class SyncStateMachine;

/**
 * DrainResult - outcome of one pass over the mutation log.
 */
struct DrainResult {
    int64_t total{0};       // operations in the snapshot
    int64_t succeeded{0};
    std::vector<SyncError> failures;

    [[nodiscard]] bool ok() const noexcept { return failures.empty(); }
    [[nodiscard]] bool was_empty() const noexcept { return total == 0; }
};

/**
 * UploadPipeline - drains the mutation log to the backend.
 *
 * Puts are batched per table: the current backend rows are fetched in one
 * select, each record goes through the conflict resolver, and the merged
 * rows are sent in one upsert. A failing select or upsert fails the whole
 * table batch with a single error. Patches and deletes are sent one at a
 * time in log order after the put batches.
 *
 * Every operation is removed from the log once settled, whether it
 * succeeded or not; failures go to the retry manager instead.
 */
class UploadPipeline : public QObject {
    Q_OBJECT

public:
    using DrainCallback = std::function<void(DrainResult)>;

    UploadPipeline(storage::LocalStore& store,
                   RemoteBackend& backend,
                   SyncStateMachine& state,
                   RetryManager& retries,
                   QObject* parent = nullptr);
    ~UploadPipeline() override;

    /**
     * Upload a snapshot of the log. An empty log completes immediately
     * without touching the phase.
     */
    void drain(DrainCallback done);

    [[nodiscard]] bool is_draining() const noexcept { return current_ != nullptr; }

    /**
     * Forget the in-flight drain. Late backend replies are ignored and its
     * callback never runs.
     */
    void abort();

private:
    struct PutGroup {
        std::string table;
        std::vector<PendingOperation> ops;      // every put, for settlement
        std::vector<std::string> ids;           // distinct records, first-seen order
        std::map<std::string, Row> latest;      // last put per record
    };

    struct Drain {
        uint64_t serial = 0;
        std::vector<PutGroup> groups;
        std::vector<PendingOperation> singles;  // patches and deletes, log order
        std::size_t next_group = 0;
        std::size_t next_single = 0;
        int64_t settled = 0;
        DrainResult result;
        DrainCallback done;
        std::optional<storage::CrudBatch> batch;
    };

    void plan(const std::vector<PendingOperation>& operations);
    void step();
    void continue_later();

    void fetch_group(const PutGroup& group);
    void upload_group(const PutGroup& group, const std::vector<Row>& remote_rows);
    void fail_group(const PutGroup& group, const Error& error);

    void send_single(const PendingOperation& op);

    void settle(const PendingOperation& op, bool succeeded);
    void record_failure(SyncError error);
    void finish();

    [[nodiscard]] bool is_current(uint64_t serial) const;

    storage::LocalStore& store_;
    RemoteBackend& backend_;
    SyncStateMachine& state_;
    RetryManager& retries_;

    std::unique_ptr<Drain> current_;
    uint64_t next_serial_ = 1;
};

} // namespace studysync::sync
