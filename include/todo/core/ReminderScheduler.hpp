#pragma once

#include <QDateTime>
#include <QHash>
#include <QMutex>
#include <QObject>
#include <QStringList>
#include <QThread>
#include <optional>

#include "todo/core/ReminderJob.hpp"

namespace todo {
namespace data {
class ListRepository;
}

namespace core {

class ReminderTimeline;

enum class ScheduleOutcome
{
    Scheduled,
    Replaced,
    InPast,
    Stopped,
    Conflict,
};

inline bool isScheduled(ScheduleOutcome outcome)
{
    return outcome == ScheduleOutcome::Scheduled || outcome == ScheduleOutcome::Replaced;
}

struct RearmSummary
{
    QStringList armed;
    QStringList dropped;
};

/// Keeps at most one pending one-shot job per list title and runs their
/// timers on a background thread. Elapsed timers come back as jobElapsed()
/// on the scheduler's own thread; the receiver claims the job with
/// claimElapsed(), which fails for jobs cancelled or replaced in between.
class ReminderScheduler : public QObject
{
    Q_OBJECT

public:
    explicit ReminderScheduler(QObject *parent = nullptr);
    ~ReminderScheduler() override;

    void start();
    void stop();
    bool isRunning() const;

    ScheduleOutcome schedule(const QString &title,
                             const QDateTime &fireAt,
                             const QDateTime &now = QDateTime::currentDateTime());
    bool cancel(const QString &title);
    void cancelAll();
    bool rescheduleForRename(const QString &oldTitle, const QString &newTitle);
    RearmSummary rearmAll(data::ListRepository &lists, const QDateTime &now = QDateTime::currentDateTime());

    std::optional<ReminderJob> claimElapsed(const QString &jobId, quint64 token);

    bool hasJob(const QString &title) const;
    std::optional<ReminderJob> job(const QString &title) const;
    int jobCount() const;

signals:
    void jobElapsed(const QString &jobId, quint64 token);

private:
    enum class AddJobResult
    {
        Added,
        AlreadyExists,
    };

    ScheduleOutcome armLocked(const QString &title, const QDateTime &fireAt);
    AddJobResult addJobLocked(const ReminderJob &job);
    bool removeJobLocked(const QString &jobId);
    void postArm(const ReminderJob &job);
    void postDisarm(const QString &jobId);

    mutable QMutex m_mutex;
    QHash<QString, ReminderJob> m_jobs;
    quint64 m_nextToken = 0;
    bool m_running = false;
    QThread m_thread;
    ReminderTimeline *m_timeline = nullptr;
};

} // namespace core
} // namespace todo
