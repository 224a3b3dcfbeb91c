#include "sync/config.hpp"

#include <QDir>
#include <QFileInfo>
#include <QSettings>
#include <QStandardPaths>
#include <QtGlobal>

#include <algorithm>

namespace studysync::sync {

namespace {

constexpr const char* kSettingsMaxRetries = "sync/max_retries";
constexpr const char* kSettingsBaseDelayMs = "sync/base_delay_ms";
constexpr const char* kSettingsMaxQueue = "sync/max_error_queue";
constexpr const char* kSettingsMaxHistory = "sync/max_error_history";
constexpr const char* kSettingsMaxConflicts = "sync/max_conflict_history";
constexpr const char* kSettingsUploadThrottleMs = "sync/upload_throttle_ms";
constexpr const char* kSettingsReconnectDelayMs = "sync/reconnect_delay_ms";
constexpr const char* kSettingsDebounceMs = "sync/connectivity_debounce_ms";
constexpr const char* kSettingsRetention = "sync/desired_retention";

constexpr const char* kSettingsEndpoint = "backend/endpoint";
constexpr const char* kSettingsApiKey = "backend/api_key";
constexpr const char* kSettingsRefreshToken = "backend/refresh_token";
constexpr const char* kSettingsAccountId = "backend/account_id";

QString key(const char* k) {
    return QString::fromLatin1(k);
}

std::chrono::milliseconds read_ms(const QSettings& settings, const char* k,
                                  std::chrono::milliseconds fallback) {
    const auto value = settings.value(key(k), static_cast<qlonglong>(fallback.count())).toLongLong();
    return std::chrono::milliseconds(std::max<qlonglong>(0, value));
}

std::size_t read_bound(const QSettings& settings, const char* k, std::size_t fallback) {
    const auto value = settings.value(key(k), static_cast<qulonglong>(fallback)).toULongLong();
    return value == 0 ? fallback : static_cast<std::size_t>(value);
}

QString env_or(const char* name, const QString& fallback) {
    const auto value = qEnvironmentVariable(name);
    return value.isEmpty() ? fallback : value;
}

} // namespace

SyncConfig SyncConfig::load() {
    QSettings settings;
    SyncConfig config;
    config.retry.max_retries = std::max(0, settings.value(key(kSettingsMaxRetries),
                                                          config.retry.max_retries).toInt());
    config.retry.base_delay = read_ms(settings, kSettingsBaseDelayMs, config.retry.base_delay);
    config.retry.max_queue = read_bound(settings, kSettingsMaxQueue, config.retry.max_queue);
    config.retry.max_history = read_bound(settings, kSettingsMaxHistory, config.retry.max_history);
    config.max_conflict_history = read_bound(settings, kSettingsMaxConflicts, config.max_conflict_history);
    config.upload_throttle = read_ms(settings, kSettingsUploadThrottleMs, config.upload_throttle);
    config.reconnect_delay = read_ms(settings, kSettingsReconnectDelayMs, config.reconnect_delay);
    config.connectivity_debounce = read_ms(settings, kSettingsDebounceMs, config.connectivity_debounce);

    const auto retention = settings.value(key(kSettingsRetention), config.desired_retention).toDouble();
    if (retention > 0.0 && retention < 1.0) {
        config.desired_retention = retention;
    }
    return config;
}

void SyncConfig::save() const {
    QSettings settings;
    settings.setValue(key(kSettingsMaxRetries), retry.max_retries);
    settings.setValue(key(kSettingsBaseDelayMs), static_cast<qlonglong>(retry.base_delay.count()));
    settings.setValue(key(kSettingsMaxQueue), static_cast<qulonglong>(retry.max_queue));
    settings.setValue(key(kSettingsMaxHistory), static_cast<qulonglong>(retry.max_history));
    settings.setValue(key(kSettingsMaxConflicts), static_cast<qulonglong>(max_conflict_history));
    settings.setValue(key(kSettingsUploadThrottleMs), static_cast<qlonglong>(upload_throttle.count()));
    settings.setValue(key(kSettingsReconnectDelayMs), static_cast<qlonglong>(reconnect_delay.count()));
    settings.setValue(key(kSettingsDebounceMs), static_cast<qlonglong>(connectivity_debounce.count()));
    settings.setValue(key(kSettingsRetention), desired_retention);
}

BackendConfig BackendConfig::load() {
    QSettings settings;
    BackendConfig config;
    config.endpoint = env_or("STUDYSYNC_BACKEND_URL", settings.value(key(kSettingsEndpoint)).toString());
    config.api_key = env_or("STUDYSYNC_API_KEY", settings.value(key(kSettingsApiKey)).toString());
    config.refresh_token = env_or("STUDYSYNC_REFRESH_TOKEN",
                                  settings.value(key(kSettingsRefreshToken)).toString());
    config.account_id = settings.value(key(kSettingsAccountId)).toString();
    while (config.endpoint.endsWith(QLatin1Char('/'))) {
        config.endpoint.chop(1);
    }
    return config;
}

void BackendConfig::save() const {
    QSettings settings;
    settings.setValue(key(kSettingsEndpoint), endpoint);
    settings.setValue(key(kSettingsApiKey), api_key);
    settings.setValue(key(kSettingsRefreshToken), refresh_token);
    settings.setValue(key(kSettingsAccountId), account_id);
}

QString resolve_database_path(const QString& override_path) {
    const auto overridePath = override_path.isEmpty()
        ? qEnvironmentVariable("STUDYSYNC_DB_PATH")
        : override_path;
    if (!overridePath.isEmpty()) {
        QFileInfo info(overridePath);
        QDir dir(info.absolutePath());
        if (!dir.exists()) {
            dir.mkpath(".");
        }
        return info.absoluteFilePath();
    }

    QString dataPath = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    QDir dir(dataPath);
    if (!dir.exists()) {
        dir.mkpath(".");
    }
    return dir.filePath(QStringLiteral("studysync.sqlite"));
}

QString resolve_media_path(const QString& database_path) {
    QFileInfo info(database_path);
    QDir dir(info.absolutePath() + "/media");
    if (!dir.exists()) {
        dir.mkpath(".");
    }
    return dir.absolutePath();
}

} // namespace studysync::sync
