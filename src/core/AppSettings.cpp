#include "todo/core/AppSettings.hpp"

#include <QDir>
#include <QSettings>
#include <QStandardPaths>
#include <QVariant>

namespace todo {
namespace core {

namespace {
const QString DataFileKey = QStringLiteral("storage/dataFile");
const QString NotificationTimeoutKey = QStringLiteral("notifications/timeoutMs");
const QString SplitterSizesKey = QStringLiteral("ui/splitterSizes");
constexpr int DefaultNotificationTimeoutMs = 10000;
} // namespace

AppSettings::AppSettings() = default;

QString AppSettings::dataFilePath() const
{
    QSettings settings;
    const QString stored = settings.value(DataFileKey).toString();
    if (stored.isEmpty()) {
        return defaultDataFilePath();
    }
    return stored;
}

void AppSettings::setDataFilePath(const QString &path)
{
    QSettings settings;
    if (path.trimmed().isEmpty()) {
        settings.remove(DataFileKey);
        return;
    }
    settings.setValue(DataFileKey, path.trimmed());
}

int AppSettings::notificationTimeoutMs() const
{
    QSettings settings;
    const int stored = settings.value(NotificationTimeoutKey, DefaultNotificationTimeoutMs).toInt();
    return qBound(1000, stored, 120000);
}

void AppSettings::setNotificationTimeoutMs(int timeoutMs)
{
    QSettings settings;
    settings.setValue(NotificationTimeoutKey, qBound(1000, timeoutMs, 120000));
}

QList<int> AppSettings::splitterSizes() const
{
    QSettings settings;
    const auto list = settings.value(SplitterSizesKey).toList();
    QList<int> sizes;
    sizes.reserve(list.size());
    for (const auto &entry : list) {
        sizes << entry.toInt();
    }
    return sizes;
}

void AppSettings::setSplitterSizes(const QList<int> &sizes)
{
    QSettings settings;
    QVariantList serialized;
    for (int size : sizes) {
        serialized << size;
    }
    settings.setValue(SplitterSizesKey, serialized);
}

QString AppSettings::defaultDataFilePath()
{
    QString storageFolder = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (storageFolder.isEmpty()) {
        storageFolder = QDir::homePath() + QStringLiteral("/.local/share/todo-reminder");
    }
    return QDir(storageFolder).filePath(QStringLiteral("todo_data.json"));
}

} // namespace core
} // namespace todo
