#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(studysyncSyncLog)
Q_DECLARE_LOGGING_CATEGORY(studysyncUploadLog)
Q_DECLARE_LOGGING_CATEGORY(studysyncRetryLog)
Q_DECLARE_LOGGING_CATEGORY(studysyncNetworkLog)
Q_DECLARE_LOGGING_CATEGORY(studysyncBackendLog)

namespace studysync::sync {

// Installs a Qt message handler that appends every log line to a file, so
// background sync failures can be inspected after the fact.
void install_file_logging();

// Returns the default log file path (may be empty if unavailable).
QString default_log_file_path();

// Turns on the debug level of every studysync.* category.
void enable_debug_logging();

// True when STUDYSYNC_DEBUG_SYNC is set in the environment.
bool debug_logging_requested();

} // namespace studysync::sync
