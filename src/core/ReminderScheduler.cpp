#include "todo/core/ReminderScheduler.hpp"

#include <QMetaObject>
#include <QMutexLocker>
#include <QSet>

#include "todo/core/JobId.hpp"
#include "todo/core/Logging.hpp"
#include "todo/core/ReminderTimeline.hpp"
#include "todo/data/ListRepository.hpp"

namespace todo {
namespace core {

ReminderScheduler::ReminderScheduler(QObject *parent)
    : QObject(parent)
{
    m_thread.setObjectName(QStringLiteral("ReminderTimeline"));
}

ReminderScheduler::~ReminderScheduler()
{
    stop();
}

void ReminderScheduler::start()
{
    QMutexLocker locker(&m_mutex);
    if (m_running) {
        return;
    }
    m_timeline = new ReminderTimeline();
    m_timeline->moveToThread(&m_thread);
    connect(&m_thread, &QThread::finished, m_timeline, &QObject::deleteLater);
    connect(m_timeline, &ReminderTimeline::elapsed, this, &ReminderScheduler::jobElapsed, Qt::QueuedConnection);
    m_thread.start();
    m_running = true;
    qCInfo(lcScheduler) << "Reminder timeline started";
}

void ReminderScheduler::stop()
{
    ReminderTimeline *timeline = nullptr;
    {
        QMutexLocker locker(&m_mutex);
        if (!m_running) {
            return;
        }
        m_running = false;
        m_jobs.clear();
        timeline = m_timeline;
        m_timeline = nullptr;
    }
    // Timers must be destroyed from the thread that owns them.
    QMetaObject::invokeMethod(timeline, &ReminderTimeline::disarmAll, Qt::BlockingQueuedConnection);
    m_thread.quit();
    m_thread.wait();
    qCInfo(lcScheduler) << "Reminder timeline stopped";
}

bool ReminderScheduler::isRunning() const
{
    QMutexLocker locker(&m_mutex);
    return m_running;
}

ScheduleOutcome ReminderScheduler::schedule(const QString &title, const QDateTime &fireAt, const QDateTime &now)
{
    if (!fireAt.isValid() || fireAt <= now) {
        qCDebug(lcScheduler) << "Refusing to arm" << title << "for past time" << fireAt;
        return ScheduleOutcome::InPast;
    }
    QMutexLocker locker(&m_mutex);
    if (!m_running) {
        qCWarning(lcScheduler) << "Cannot schedule" << title << "- scheduler is stopped";
        return ScheduleOutcome::Stopped;
    }
    return armLocked(title, fireAt);
}

bool ReminderScheduler::cancel(const QString &title)
{
    const QString jobId = jobIdForTitle(title);
    QMutexLocker locker(&m_mutex);
    if (!removeJobLocked(jobId)) {
        return false;
    }
    postDisarm(jobId);
    qCDebug(lcScheduler) << "Cancelled" << jobId;
    return true;
}

void ReminderScheduler::cancelAll()
{
    QMutexLocker locker(&m_mutex);
    for (auto it = m_jobs.constBegin(); it != m_jobs.constEnd(); ++it) {
        postDisarm(it.key());
    }
    m_jobs.clear();
}

bool ReminderScheduler::rescheduleForRename(const QString &oldTitle, const QString &newTitle)
{
    const QString oldId = jobIdForTitle(oldTitle);
    QMutexLocker locker(&m_mutex);
    auto it = m_jobs.constFind(oldId);
    if (it == m_jobs.constEnd()) {
        return false;
    }
    const QDateTime fireAt = it->fireAt;
    removeJobLocked(oldId);
    postDisarm(oldId);
    if (!m_running) {
        return false;
    }
    // No past check: a job that is due right now must still fire under its new identity.
    const ScheduleOutcome outcome = armLocked(newTitle, fireAt);
    if (!isScheduled(outcome)) {
        qCWarning(lcScheduler) << "Could not move reminder from" << oldTitle << "to" << newTitle;
        return false;
    }
    qCDebug(lcScheduler) << "Moved reminder from" << oldTitle << "to" << newTitle;
    return true;
}

RearmSummary ReminderScheduler::rearmAll(data::ListRepository &lists, const QDateTime &now)
{
    RearmSummary summary;
    QSet<QString> armedIds;
    for (auto list : lists.fetchLists()) {
        if (!list.hasReminder()) {
            continue;
        }
        const QString jobId = jobIdForTitle(list.title);
        const QDateTime fireAt = data::parseReminder(list.reminder);
        if (armedIds.contains(jobId)) {
            qCWarning(lcScheduler) << "Reminder of" << list.title << "shares job id" << jobId << "with an armed list";
        } else if (fireAt.isValid() && fireAt > now) {
            const ScheduleOutcome outcome = schedule(list.title, fireAt, now);
            if (isScheduled(outcome)) {
                armedIds.insert(jobId);
                summary.armed << list.title;
                continue;
            }
            if (outcome == ScheduleOutcome::Stopped) {
                continue;
            }
        }
        qCInfo(lcScheduler) << "Dropping missed reminder" << list.reminder << "of" << list.title;
        list.reminder.clear();
        lists.updateList(list);
        summary.dropped << list.title;
    }
    qCInfo(lcScheduler) << "Rearmed" << summary.armed.size() << "reminders, dropped" << summary.dropped.size();
    return summary;
}

std::optional<ReminderJob> ReminderScheduler::claimElapsed(const QString &jobId, quint64 token)
{
    QMutexLocker locker(&m_mutex);
    auto it = m_jobs.find(jobId);
    if (it == m_jobs.end() || it->token != token) {
        qCDebug(lcScheduler) << "Ignoring stale timer for" << jobId;
        return std::nullopt;
    }
    ReminderJob job = it.value();
    m_jobs.erase(it);
    return job;
}

bool ReminderScheduler::hasJob(const QString &title) const
{
    QMutexLocker locker(&m_mutex);
    return m_jobs.contains(jobIdForTitle(title));
}

std::optional<ReminderJob> ReminderScheduler::job(const QString &title) const
{
    QMutexLocker locker(&m_mutex);
    auto it = m_jobs.constFind(jobIdForTitle(title));
    if (it == m_jobs.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

int ReminderScheduler::jobCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_jobs.size();
}

ScheduleOutcome ReminderScheduler::armLocked(const QString &title, const QDateTime &fireAt)
{
    ReminderJob job;
    job.id = jobIdForTitle(title);
    job.title = title;
    job.fireAt = fireAt;
    job.token = ++m_nextToken;

    bool replaced = false;
    if (addJobLocked(job) == AddJobResult::AlreadyExists) {
        removeJobLocked(job.id);
        replaced = true;
        if (addJobLocked(job) != AddJobResult::Added) {
            qCWarning(lcScheduler) << "Job id" << job.id << "still taken after removal";
            return ScheduleOutcome::Conflict;
        }
    }
    postArm(job);
    qCDebug(lcScheduler) << (replaced ? "Replaced" : "Scheduled") << job.id << "at" << fireAt;
    return replaced ? ScheduleOutcome::Replaced : ScheduleOutcome::Scheduled;
}

ReminderScheduler::AddJobResult ReminderScheduler::addJobLocked(const ReminderJob &job)
{
    if (m_jobs.contains(job.id)) {
        return AddJobResult::AlreadyExists;
    }
    m_jobs.insert(job.id, job);
    return AddJobResult::Added;
}

bool ReminderScheduler::removeJobLocked(const QString &jobId)
{
    return m_jobs.remove(jobId) > 0;
}

void ReminderScheduler::postArm(const ReminderJob &job)
{
    if (!m_timeline) {
        return;
    }
    ReminderTimeline *timeline = m_timeline;
    const QString jobId = job.id;
    const quint64 token = job.token;
    const QDateTime fireAt = job.fireAt;
    QMetaObject::invokeMethod(
        timeline, [timeline, jobId, token, fireAt]() { timeline->arm(jobId, token, fireAt); }, Qt::QueuedConnection);
}

void ReminderScheduler::postDisarm(const QString &jobId)
{
    if (!m_timeline) {
        return;
    }
    ReminderTimeline *timeline = m_timeline;
    QMetaObject::invokeMethod(
        timeline, [timeline, jobId]() { timeline->disarm(jobId); }, Qt::QueuedConnection);
}

} // namespace core
} // namespace todo
