#pragma once

#include <QDateTime>
#include <QHash>
#include <QObject>
#include <QString>

class QTimer;

namespace todo {
namespace core {

/// Owns one single-shot timer per armed job. Lives in the scheduler's
/// background thread; all slots must be invoked through that thread's
/// event loop.
class ReminderTimeline : public QObject
{
    Q_OBJECT

public:
    explicit ReminderTimeline(QObject *parent = nullptr);
    ~ReminderTimeline() override;

    static constexpr qint64 MaxTimerChunkMs = 60 * 60 * 1000;

public slots:
    void arm(const QString &jobId, quint64 token, const QDateTime &fireAt);
    void disarm(const QString &jobId);
    void disarmAll();

signals:
    void elapsed(const QString &jobId, quint64 token);

private:
    struct Entry
    {
        QTimer *timer = nullptr;
        quint64 token = 0;
        QDateTime fireAt;
    };

    void startChunk(Entry &entry);
    void handleTimeout(const QString &jobId, quint64 token);

    QHash<QString, Entry> m_entries;
};

} // namespace core
} // namespace todo
