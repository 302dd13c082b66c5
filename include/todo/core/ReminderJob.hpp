#pragma once

#include <QDateTime>
#include <QString>

namespace todo {
namespace core {

struct ReminderJob
{
    QString id;
    QString title;
    QDateTime fireAt;
    quint64 token = 0; // distinguishes this registration from earlier ones under the same id
};

} // namespace core
} // namespace todo
