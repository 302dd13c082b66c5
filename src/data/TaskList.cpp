#include "todo/data/TaskList.hpp"

namespace todo {
namespace data {

QString formatReminder(const QDateTime &dateTime)
{
    if (!dateTime.isValid()) {
        return {};
    }
    return dateTime.toLocalTime().toString(Qt::ISODate);
}

QDateTime parseReminder(const QString &value)
{
    if (value.isEmpty()) {
        return {};
    }
    QDateTime dt = QDateTime::fromString(value, Qt::ISODateWithMs);
    if (!dt.isValid()) {
        dt = QDateTime::fromString(value, Qt::ISODate);
    }
    if (dt.isValid() && dt.timeSpec() != Qt::LocalTime) {
        dt = dt.toLocalTime();
    }
    return dt;
}

} // namespace data
} // namespace todo
