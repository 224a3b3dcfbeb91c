#pragma once

#include <QMetaType>
#include <QString>

namespace studysync::sync {

/**
 * Notification - a short user-facing message (shown as a toast by a UI,
 * printed by the CLI).
 */
struct Notification {
    enum class Kind { Success, Info, Warning, Error };

    Kind kind{Kind::Info};
    QString title;
    QString message;
    bool can_retry = false;
};

[[nodiscard]] inline Notification sync_failed_notification(const QString& message, bool can_retry) {
    return Notification{
        .kind = Notification::Kind::Error,
        .title = QStringLiteral("Sync Failed"),
        .message = message,
        .can_retry = can_retry
    };
}

} // namespace studysync::sync

Q_DECLARE_METATYPE(studysync::sync::Notification)
