#include "todo/core/TodoListService.hpp"

#include <QMutexLocker>
#include <exception>

#include "todo/core/JobId.hpp"
#include "todo/core/Logging.hpp"
#include "todo/core/NotificationSink.hpp"
#include "todo/core/ReminderScheduler.hpp"
#include "todo/data/JsonListStorage.hpp"
#include "todo/data/ListRepository.hpp"

namespace todo {
namespace core {

namespace {
OperationResult noSuchList()
{
    return OperationResult::failure(ListError::NoSuchList, QObject::tr("Please select a list first."));
}
} // namespace

TodoListService::TodoListService(data::ListRepository &lists,
                                 data::JsonListStorage &storage,
                                 ReminderScheduler &scheduler,
                                 NotificationSink &sink,
                                 QObject *parent)
    : QObject(parent)
    , m_lists(lists)
    , m_storage(storage)
    , m_scheduler(scheduler)
    , m_sink(sink)
{
    connect(&m_scheduler, &ReminderScheduler::jobElapsed, this, &TodoListService::handleJobElapsed);
}

TodoListService::~TodoListService() = default;

std::vector<data::TaskList> TodoListService::lists() const
{
    QMutexLocker locker(&m_mutex);
    return m_lists.fetchLists();
}

std::optional<data::TaskList> TodoListService::list(const QString &title) const
{
    QMutexLocker locker(&m_mutex);
    return m_lists.findByTitle(title);
}

OperationResult TodoListService::createList(const QString &title)
{
    const QString trimmed = title.trimmed();
    {
        QMutexLocker locker(&m_mutex);
        if (trimmed.isEmpty()) {
            return OperationResult::failure(ListError::EmptyTitle, tr("Please enter a list title."));
        }
        if (m_lists.contains(trimmed)) {
            return OperationResult::failure(ListError::DuplicateTitle, tr("A list with that title already exists."));
        }
        if (titleCollidesLocked(trimmed, QString())) {
            return OperationResult::failure(ListError::TitleCollision,
                                            tr("A list with a title differing only in spacing already exists."));
        }
        data::TaskList list;
        list.title = trimmed;
        m_lists.addList(std::move(list));
        m_modified = true;
    }
    qCDebug(lcService) << "Created list" << trimmed;
    emit listsChanged();
    return OperationResult::success();
}

OperationResult TodoListService::deleteList(const QString &title)
{
    {
        QMutexLocker locker(&m_mutex);
        if (!m_lists.contains(title)) {
            return noSuchList();
        }
        if (m_scheduler.cancel(title)) {
            qCDebug(lcService) << "Cancelled pending reminder of" << title;
        }
        m_lists.removeList(title);
        m_modified = true;
    }
    qCDebug(lcService) << "Deleted list" << title;
    emit listsChanged();
    return OperationResult::success(tr("Deleted list '%1'.").arg(title));
}

OperationResult TodoListService::renameList(const QString &oldTitle, const QString &newTitle)
{
    const QString trimmed = newTitle.trimmed();
    {
        QMutexLocker locker(&m_mutex);
        if (!m_lists.contains(oldTitle)) {
            return noSuchList();
        }
        if (trimmed.isEmpty()) {
            return OperationResult::failure(ListError::EmptyTitle, tr("Please enter a new title."));
        }
        if (trimmed == oldTitle) {
            return OperationResult::success();
        }
        if (m_lists.contains(trimmed)) {
            return OperationResult::failure(ListError::DuplicateTitle, tr("A list with that title already exists."));
        }
        if (titleCollidesLocked(trimmed, oldTitle)) {
            return OperationResult::failure(ListError::TitleCollision,
                                            tr("A list with a title differing only in spacing already exists."));
        }
        m_lists.renameList(oldTitle, trimmed);
        m_modified = true;
        const auto renamed = m_lists.findByTitle(trimmed);
        if (renamed && renamed->hasReminder() && !m_scheduler.rescheduleForRename(oldTitle, trimmed)) {
            qCDebug(lcService) << "No pending reminder moved for" << oldTitle;
        }
    }
    qCDebug(lcService) << "Renamed list" << oldTitle << "to" << trimmed;
    emit listsChanged();
    return OperationResult::success();
}

OperationResult TodoListService::addTask(const QString &title, const QString &text)
{
    const QString trimmed = text.trimmed();
    {
        QMutexLocker locker(&m_mutex);
        auto list = m_lists.findByTitle(title);
        if (!list) {
            return noSuchList();
        }
        if (trimmed.isEmpty()) {
            return OperationResult::failure(ListError::EmptyTask, tr("Please enter a task."));
        }
        list->tasks << trimmed;
        m_lists.updateList(*list);
        m_modified = true;
    }
    emit listsChanged();
    return OperationResult::success();
}

OperationResult TodoListService::removeTask(const QString &title, int index)
{
    QString removed;
    {
        QMutexLocker locker(&m_mutex);
        auto list = m_lists.findByTitle(title);
        if (!list) {
            return noSuchList();
        }
        if (index < 0 || index >= list->tasks.size()) {
            return OperationResult::failure(ListError::InvalidTaskIndex, tr("Please select a task first."));
        }
        removed = list->tasks.takeAt(index);
        m_lists.updateList(*list);
        m_modified = true;
    }
    emit listsChanged();
    return OperationResult::success(tr("Removed: %1").arg(removed));
}

OperationResult TodoListService::setReminder(const QString &title, const QDateTime &when, const QDateTime &now)
{
    {
        QMutexLocker locker(&m_mutex);
        auto list = m_lists.findByTitle(title);
        if (!list) {
            return noSuchList();
        }
        const ScheduleOutcome outcome = m_scheduler.schedule(title, when, now);
        if (outcome == ScheduleOutcome::InPast) {
            return OperationResult::failure(ListError::PastReminder, tr("Please select a future date/time."));
        }
        if (!isScheduled(outcome)) {
            return OperationResult::failure(ListError::SchedulerFailed, tr("Could not schedule the reminder."));
        }
        list->reminder = data::formatReminder(when);
        m_lists.updateList(*list);
        m_modified = true;
    }
    qCInfo(lcService) << "Reminder for" << title << "set to" << when;
    emit listsChanged();
    return OperationResult::success(
        tr("Reminder set for %1 at %2").arg(title, when.toString(QStringLiteral("yyyy-MM-dd HH:mm"))));
}

OperationResult TodoListService::clearReminder(const QString &title)
{
    {
        QMutexLocker locker(&m_mutex);
        auto list = m_lists.findByTitle(title);
        if (!list) {
            return noSuchList();
        }
        if (!list->hasReminder()) {
            return OperationResult::failure(ListError::NoReminder, tr("This list has no reminder."));
        }
        if (!m_scheduler.cancel(title)) {
            qCDebug(lcService) << "Reminder of" << title << "had no pending job";
        }
        list->reminder.clear();
        m_lists.updateList(*list);
        m_modified = true;
    }
    emit listsChanged();
    return OperationResult::success(tr("Reminder cleared."));
}

OperationResult TodoListService::markDone(const QString &title)
{
    {
        QMutexLocker locker(&m_mutex);
        auto list = m_lists.findByTitle(title);
        if (!list) {
            return noSuchList();
        }
        for (QString &task : list->tasks) {
            task.prepend(data::DoneMarker);
        }
        list->reminder.clear();
        if (m_scheduler.cancel(title)) {
            qCDebug(lcService) << "Cancelled pending reminder of" << title;
        }
        m_lists.updateList(*list);
        m_modified = true;
    }
    emit listsChanged();
    return OperationResult::success(tr("Marked '%1' as done.").arg(title));
}

OperationResult TodoListService::load()
{
    OperationResult result;
    {
        QMutexLocker locker(&m_mutex);
        m_scheduler.cancelAll();
        std::vector<data::TaskList> loaded;
        QString error;
        if (!m_storage.load(loaded, &error)) {
            qCWarning(lcService) << "Falling back to an empty list store:" << error;
            loaded.clear();
            result = OperationResult::failure(ListError::PersistenceFailed, error);
        }
        m_lists.replaceAll(std::move(loaded));
        m_modified = false;
    }
    emit listsChanged();
    return result;
}

OperationResult TodoListService::save()
{
    QMutexLocker locker(&m_mutex);
    OperationResult result = saveLocked();
    if (result.ok()) {
        result.message = tr("All lists saved to disk.");
    }
    return result;
}

OperationResult TodoListService::saveIfModified()
{
    QMutexLocker locker(&m_mutex);
    if (!m_modified) {
        qCDebug(lcService) << "No unsaved list changes";
        return OperationResult::success();
    }
    return saveLocked();
}

OperationResult TodoListService::rearmReminders(const QDateTime &now)
{
    RearmSummary summary;
    OperationResult result;
    {
        QMutexLocker locker(&m_mutex);
        summary = m_scheduler.rearmAll(m_lists, now);
        if (!summary.dropped.isEmpty()) {
            m_modified = true;
            result = saveLocked();
        }
    }
    if (!summary.dropped.isEmpty()) {
        emit listsChanged();
    }
    return result;
}

void TodoListService::handleJobElapsed(const QString &jobId, quint64 token)
{
    QString title;
    ReminderNotification notification;
    {
        QMutexLocker locker(&m_mutex);
        const auto job = m_scheduler.claimElapsed(jobId, token);
        if (!job) {
            return;
        }
        auto list = m_lists.findByTitle(job->title);
        if (!list) {
            qCWarning(lcService) << "Reminder fired for missing list" << job->title;
            return;
        }
        title = list->title;
        notification = buildReminderNotification(list->title, list->tasks);

        // The job is gone from the scheduler at this point, so the reminder
        // is cleared in the same critical section.
        list->reminder.clear();
        m_lists.updateList(*list);
        m_modified = true;
        const OperationResult saved = saveLocked();
        if (!saved.ok()) {
            qCWarning(lcService) << "Cleared reminder of" << title << "not persisted:" << saved.message;
        }
    }

    qCInfo(lcService) << "Reminder fired for" << title;
    deliver(notification);
    emit reminderFired(title);
    emit reminderCleared(title);
}

void TodoListService::deliver(const ReminderNotification &notification)
{
    try {
        if (!m_sink.notify(notification)) {
            qCWarning(lcNotify) << "Notification not delivered:" << notification.title;
        }
    } catch (const std::exception &e) {
        qCWarning(lcNotify) << "Notification sink failed:" << e.what();
    }
}

bool TodoListService::titleCollidesLocked(const QString &title, const QString &ignoredTitle) const
{
    const QString jobId = jobIdForTitle(title);
    for (const auto &list : m_lists.fetchLists()) {
        if (list.title == ignoredTitle || list.title == title) {
            continue;
        }
        if (jobIdForTitle(list.title) == jobId) {
            return true;
        }
    }
    return false;
}

OperationResult TodoListService::saveLocked()
{
    QString error;
    if (!m_storage.save(m_lists.fetchLists(), &error)) {
        return OperationResult::failure(ListError::PersistenceFailed, error);
    }
    m_modified = false;
    return OperationResult::success();
}

} // namespace core
} // namespace todo
