#pragma once

#include <QList>
#include <QString>

namespace todo {
namespace core {

class AppSettings
{
public:
    AppSettings();

    QString dataFilePath() const;
    void setDataFilePath(const QString &path);

    int notificationTimeoutMs() const;
    void setNotificationTimeoutMs(int timeoutMs);

    QList<int> splitterSizes() const;
    void setSplitterSizes(const QList<int> &sizes);

    static QString defaultDataFilePath();
};

} // namespace core
} // namespace todo
