#pragma once

#include <QDateTime>
#include <QString>
#include <QStringList>

namespace todo {
namespace data {

inline const QString DoneMarker = QStringLiteral("✔ ");

struct TaskList
{
    QString title;
    QStringList tasks;
    QString reminder; // ISO-8601 local date-time, empty when no reminder is set

    bool hasReminder() const { return !reminder.isEmpty(); }
};

QString formatReminder(const QDateTime &dateTime);
QDateTime parseReminder(const QString &value);

} // namespace data
} // namespace todo
