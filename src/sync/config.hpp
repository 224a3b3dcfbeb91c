#pragma once

#include <QString>
#include <chrono>
#include <cstddef>

namespace studysync::sync {

/**
 * RetryPolicy - bounds of the error/retry subsystem.
 */
struct RetryPolicy {
    int max_retries = 3;
    std::chrono::milliseconds base_delay{2000};  // doubled per attempt
    std::size_t max_queue = 50;
    std::size_t max_history = 100;
};

/**
 * SyncConfig - tunables of the sync engine, read from the "sync/" settings group.
 */
struct SyncConfig {
    RetryPolicy retry;
    std::size_t max_conflict_history = 100;
    std::chrono::milliseconds upload_throttle{1000};
    std::chrono::milliseconds reconnect_delay{5000};
    std::chrono::milliseconds connectivity_debounce{500};
    double desired_retention = 0.9;

    [[nodiscard]] static SyncConfig load();
    void save() const;
};

/**
 * BackendConfig - where and as whom to sync.
 *
 * Read from the "backend/" settings group; STUDYSYNC_BACKEND_URL,
 * STUDYSYNC_API_KEY and STUDYSYNC_REFRESH_TOKEN override the stored values.
 */
struct BackendConfig {
    QString endpoint;
    QString api_key;
    QString refresh_token;
    QString account_id;

    [[nodiscard]] bool is_configured() const {
        return !endpoint.isEmpty() && !api_key.isEmpty();
    }

    [[nodiscard]] static BackendConfig load();
    void save() const;
};

/**
 * Database file path: `override_path` if given, else STUDYSYNC_DB_PATH,
 * else <AppLocalDataLocation>/studysync.sqlite. The parent directory is
 * created if missing.
 */
[[nodiscard]] QString resolve_database_path(const QString& override_path = {});

/**
 * Media directory beside the database file.
 */
[[nodiscard]] QString resolve_media_path(const QString& database_path);

} // namespace studysync::sync
