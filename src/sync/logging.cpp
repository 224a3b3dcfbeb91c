#include "sync/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QStandardPaths>
#include <QtGlobal>

Q_LOGGING_CATEGORY(studysyncSyncLog, "studysync.sync", QtInfoMsg)
Q_LOGGING_CATEGORY(studysyncUploadLog, "studysync.upload", QtInfoMsg)
Q_LOGGING_CATEGORY(studysyncRetryLog, "studysync.retry", QtInfoMsg)
Q_LOGGING_CATEGORY(studysyncNetworkLog, "studysync.network", QtInfoMsg)
Q_LOGGING_CATEGORY(studysyncBackendLog, "studysync.backend", QtInfoMsg)

namespace studysync::sync {
namespace {

QString compute_log_file_path() {
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        return QString{};
    }
    return QDir(base).filePath(QStringLiteral("logs/studysync.log"));
}

const char* level_tag(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return "D";
        case QtInfoMsg: return "I";
        case QtWarningMsg: return "W";
        case QtCriticalMsg: return "C";
        case QtFatalMsg: return "F";
    }
    return "?";
}

struct LoggerState {
    QMutex mu;
    QFile file;
    bool initialized = false;
    QtMessageHandler previous = nullptr;
};

LoggerState& state() {
    static LoggerState s{};
    return s;
}

void ensure_open(LoggerState& s) {
    if (s.initialized) return;
    s.initialized = true;

    const auto path = compute_log_file_path();
    if (path.isEmpty()) {
        return;
    }

    QDir dir(QFileInfo(path).absolutePath());
    if (!dir.mkpath(QStringLiteral("."))) {
        return;
    }

    s.file.setFileName(path);
    if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        s.file.setFileName(QString{});
    }
}

void message_handler(QtMsgType type,
                     const QMessageLogContext& ctx,
                     const QString& msg) {
    auto& s = state();
    QtMessageHandler previous = nullptr;
    {
        QMutexLocker lock(&s.mu);
        ensure_open(s);

        const auto ts = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
        const auto cat = ctx.category ? QString::fromLatin1(ctx.category) : QStringLiteral("");

        const auto line = QStringLiteral("%1 %2 %3 %4\n")
                              .arg(ts, QString::fromLatin1(level_tag(type)), cat, msg);

        if (s.file.isOpen()) {
            s.file.write(line.toUtf8());
            s.file.flush();
        }
        previous = s.previous;
    }

    // Still echo to the console for the CLI.
    if (previous) {
        previous(type, ctx, msg);
    }
}

} // namespace

void install_file_logging() {
    // Keep the pattern stable; our message handler already stamps time/level/category.
    qSetMessagePattern(QStringLiteral("%{category} %{message}"));
    auto& s = state();
    QMutexLocker lock(&s.mu);
    s.previous = qInstallMessageHandler(message_handler);
}

QString default_log_file_path() {
    return compute_log_file_path();
}

void enable_debug_logging() {
    QLoggingCategory::setFilterRules(QStringLiteral("studysync.*.debug=true"));
}

bool debug_logging_requested() {
    return qEnvironmentVariableIsSet("STUDYSYNC_DEBUG_SYNC");
}

} // namespace studysync::sync
