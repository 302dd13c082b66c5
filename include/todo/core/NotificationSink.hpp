#pragma once

#include <QString>
#include <QStringList>

namespace todo {
namespace core {

constexpr int NotificationPreviewCount = 10;

struct ReminderNotification
{
    QString title;
    QString body;
};

ReminderNotification buildReminderNotification(const QString &listTitle, const QStringList &tasks);

/// Fire-and-forget delivery of a reminder. Returns false when the platform
/// could not show the notification; callers log and move on.
class NotificationSink
{
public:
    virtual ~NotificationSink() = default;
    virtual bool notify(const ReminderNotification &notification) = 0;
};

} // namespace core
} // namespace todo
