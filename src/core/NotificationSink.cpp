#include "todo/core/NotificationSink.hpp"

namespace todo {
namespace core {

ReminderNotification buildReminderNotification(const QString &listTitle, const QStringList &tasks)
{
    ReminderNotification notification;
    notification.title = QStringLiteral("Reminder — %1").arg(listTitle);

    QStringList lines;
    lines << QStringLiteral("You scheduled a reminder for '%1'.").arg(listTitle);
    lines << QStringLiteral("Tasks:");
    const int count = qMin(tasks.size(), NotificationPreviewCount);
    for (int i = 0; i < count; ++i) {
        lines << QStringLiteral("- %1").arg(tasks.at(i));
    }
    notification.body = lines.join(QLatin1Char('\n'));
    return notification;
}

} // namespace core
} // namespace todo
