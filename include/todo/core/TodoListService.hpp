#pragma once

#include <QDateTime>
#include <QMutex>
#include <QObject>
#include <optional>
#include <vector>

#include "todo/core/OperationResult.hpp"
#include "todo/data/TaskList.hpp"

namespace todo {
namespace data {
class ListRepository;
class JsonListStorage;
}

namespace core {

class NotificationSink;
class ReminderScheduler;
struct ReminderNotification;

/// Entry point for every user-facing list operation. Each call is one
/// critical section over the list store and the reminder scheduler, so a
/// firing reminder never interleaves with a rename, delete or reschedule.
class TodoListService : public QObject
{
    Q_OBJECT

public:
    TodoListService(data::ListRepository &lists,
                    data::JsonListStorage &storage,
                    ReminderScheduler &scheduler,
                    NotificationSink &sink,
                    QObject *parent = nullptr);
    ~TodoListService() override;

    std::vector<data::TaskList> lists() const;
    std::optional<data::TaskList> list(const QString &title) const;

    OperationResult createList(const QString &title);
    OperationResult deleteList(const QString &title);
    OperationResult renameList(const QString &oldTitle, const QString &newTitle);
    OperationResult addTask(const QString &title, const QString &text);
    OperationResult removeTask(const QString &title, int index);
    OperationResult setReminder(const QString &title,
                                const QDateTime &when,
                                const QDateTime &now = QDateTime::currentDateTime());
    OperationResult clearReminder(const QString &title);
    OperationResult markDone(const QString &title);

    OperationResult load();
    OperationResult save();
    /// Saves only when a list was changed since the last load or save. A
    /// data file that failed to load is left untouched until then.
    OperationResult saveIfModified();
    /// Runs once at startup, after load(): arms future reminders, drops missed ones.
    OperationResult rearmReminders(const QDateTime &now = QDateTime::currentDateTime());

signals:
    void listsChanged();
    void reminderFired(const QString &title);
    void reminderCleared(const QString &title);

private:
    void handleJobElapsed(const QString &jobId, quint64 token);
    void deliver(const ReminderNotification &notification);
    bool titleCollidesLocked(const QString &title, const QString &ignoredTitle) const;
    OperationResult saveLocked();

    mutable QMutex m_mutex;
    data::ListRepository &m_lists;
    data::JsonListStorage &m_storage;
    ReminderScheduler &m_scheduler;
    NotificationSink &m_sink;
    bool m_modified = false;
};

} // namespace core
} // namespace todo
