#pragma once

#include "core/result.hpp"
#include "storage/local_store.hpp"
#include "sync/remote_backend.hpp"
#include <QObject>
#include <functional>

namespace studysync::sync {

/**
 * DownloadApplier - pulls rows changed on the backend since the last
 * checkpoint into the local store, table by table in dependency order.
 *
 * Remote deletions are not detected.
 */
class DownloadApplier : public QObject {
    Q_OBJECT

public:
    using DoneCallback = std::function<void(Result<int64_t, Error>)>;

    DownloadApplier(storage::LocalStore& store, RemoteBackend& backend, QObject* parent = nullptr);

    /**
     * Completes with the number of rows written locally.
     */
    void run(DoneCallback done);

    void abort() { ++generation_; }

private:
    void pull_table(std::size_t index, int64_t applied, uint64_t generation, DoneCallback done);

    storage::LocalStore& store_;
    RemoteBackend& backend_;
    uint64_t generation_ = 0;
};

} // namespace studysync::sync
