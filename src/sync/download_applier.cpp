#include "sync/download_applier.hpp"

#include "storage/migrations.hpp"
#include "sync/logging.hpp"

#include <QPointer>

namespace studysync::sync {

DownloadApplier::DownloadApplier(storage::LocalStore& store, RemoteBackend& backend, QObject* parent)
    : QObject(parent)
    , store_(store)
    , backend_(backend) {}

void DownloadApplier::run(DoneCallback done) {
    pull_table(0, 0, ++generation_, std::move(done));
}

void DownloadApplier::pull_table(std::size_t index, int64_t applied, uint64_t generation, DoneCallback done) {
    const auto& tables = storage::synced_tables();
    if (index >= tables.size()) {
        qCInfo(studysyncSyncLog) << "download applied" << applied << "rows";
        done(Result<int64_t, Error>::ok(applied));
        return;
    }
    const auto& table = tables[index];

    auto since = store_.checkpoint(table.name);
    if (since.is_err()) {
        done(Result<int64_t, Error>::err(since.unwrap_err()));
        return;
    }

    QPointer<DownloadApplier> self(this);
    backend_.select(table.name,
                    SelectFilter::modified_since(table.watermark_column, since.unwrap().value_or("")),
        [self, index, applied, generation, &table, done = std::move(done)](
            Result<std::vector<Row>, Error> rows) mutable {
            if (!self || self->generation_ != generation) return;
            if (rows.is_err()) {
                qCWarning(studysyncSyncLog) << "download of" << QString::fromStdString(table.name)
                                            << "failed:" << QString::fromStdString(rows.unwrap_err().message);
                done(Result<int64_t, Error>::err(rows.unwrap_err()));
                return;
            }

            const auto& fetched = rows.unwrap();
            auto written = self->store_.apply_remote(table.name, fetched);
            if (written.is_err()) {
                done(Result<int64_t, Error>::err(written.unwrap_err()));
                return;
            }

            std::optional<Timestamp> newest;
            for (const auto& row : fetched) {
                auto ts = get_timestamp(row, table.watermark_column);
                if (ts && (!newest || *ts > *newest)) newest = ts;
            }
            if (newest) {
                auto saved = self->store_.set_checkpoint(table.name, newest->to_iso_string());
                if (saved.is_err()) {
                    done(Result<int64_t, Error>::err(saved.unwrap_err()));
                    return;
                }
            }

            qCDebug(studysyncSyncLog) << "pulled" << fetched.size() << "rows of"
                                      << QString::fromStdString(table.name);
            self->pull_table(index + 1, applied + written.unwrap(), generation, std::move(done));
        });
}

} // namespace studysync::sync
