#include <QtTest/QtTest>

#include <stdexcept>

#include "todo/core/NotificationSink.hpp"
#include "todo/core/ReminderScheduler.hpp"
#include "todo/core/TodoListService.hpp"
#include "todo/data/InMemoryListRepository.hpp"
#include "todo/data/JsonListStorage.hpp"

using namespace todo;

namespace {

class RecordingSink : public core::NotificationSink
{
public:
    bool notify(const core::ReminderNotification &notification) override
    {
        notifications.append(notification);
        if (throwOnNotify) {
            throw std::runtime_error("notification daemon unavailable");
        }
        return delivered;
    }

    QVector<core::ReminderNotification> notifications;
    bool delivered = true;
    bool throwOnNotify = false;
};

struct ServiceHarness
{
    ServiceHarness()
        : storage(dir.filePath(QStringLiteral("todo_data.json")))
        , service(repo, storage, scheduler, sink)
    {
        scheduler.start();
    }

    QString reminderOf(const QString &title) const
    {
        const auto list = service.list(title);
        return list ? list->reminder : QStringLiteral("<missing>");
    }

    QTemporaryDir dir;
    data::InMemoryListRepository repo;
    data::JsonListStorage storage;
    core::ReminderScheduler scheduler;
    RecordingSink sink;
    core::TodoListService service;
};

QDateTime wholeSeconds(const QDateTime &dt)
{
    const QTime time = dt.time();
    return QDateTime(dt.date(), QTime(time.hour(), time.minute(), time.second()));
}

} // namespace

class TodoListServiceTest : public QObject
{
    Q_OBJECT

private slots:
    void createListValidates();
    void addAndRemoveTasks();
    void setReminderRejectsPastTime();
    void setReminderArmsJob();
    void setReminderFailsWhenSchedulerStopped();
    void clearReminderCancelsJob();
    void deleteCancelsPendingJob();
    void renameMovesReminder();
    void renameRejectsCollidingTitle();
    void markDoneClearsReminder();
    void errandsReminderFiresOnce();
    void firingClearsReminderWhenSinkThrows();
    void firingClearsReminderWhenSinkFails();
    void rescheduleFiresOnlyAtLatestTime();
    void notificationReadsLiveTasks();
    void saveAndLoadRestoresLists();
    void malformedFileFallsBackToEmpty();
    void failedLoadLeavesFileUntilChanged();
    void rearmRestoresFutureReminders();
    void rearmKeepsOneOfCollidingReminders();
};

void TodoListServiceTest::createListValidates()
{
    ServiceHarness h;
    QCOMPARE(h.service.createList(QStringLiteral("   ")).error, core::ListError::EmptyTitle);
    QVERIFY(h.service.createList(QStringLiteral("Work")).ok());
    QCOMPARE(h.service.createList(QStringLiteral("Work")).error, core::ListError::DuplicateTitle);
    QCOMPARE(h.service.createList(QStringLiteral(" Work ")).error, core::ListError::DuplicateTitle);

    QVERIFY(h.service.createList(QStringLiteral("Buy milk")).ok());
    QCOMPARE(h.service.createList(QStringLiteral("Buy\tmilk")).error, core::ListError::TitleCollision);
    QCOMPARE(h.service.createList(QStringLiteral("Buy_milk")).error, core::ListError::TitleCollision);
    QCOMPARE(h.service.lists().size(), static_cast<size_t>(2));
}

void TodoListServiceTest::addAndRemoveTasks()
{
    ServiceHarness h;
    QCOMPARE(h.service.addTask(QStringLiteral("Missing"), QStringLiteral("a")).error, core::ListError::NoSuchList);

    QVERIFY(h.service.createList(QStringLiteral("Work")).ok());
    QCOMPARE(h.service.addTask(QStringLiteral("Work"), QStringLiteral("  ")).error, core::ListError::EmptyTask);
    QVERIFY(h.service.addTask(QStringLiteral("Work"), QStringLiteral("a")).ok());
    QVERIFY(h.service.addTask(QStringLiteral("Work"), QStringLiteral(" b ")).ok());
    QVERIFY(h.service.addTask(QStringLiteral("Work"), QStringLiteral("a")).ok());
    QCOMPARE(h.service.list(QStringLiteral("Work"))->tasks,
             QStringList({ QStringLiteral("a"), QStringLiteral("b"), QStringLiteral("a") }));

    QCOMPARE(h.service.removeTask(QStringLiteral("Work"), 3).error, core::ListError::InvalidTaskIndex);
    QCOMPARE(h.service.removeTask(QStringLiteral("Work"), -1).error, core::ListError::InvalidTaskIndex);

    const auto removed = h.service.removeTask(QStringLiteral("Work"), 0);
    QVERIFY(removed.ok());
    QCOMPARE(removed.message, QStringLiteral("Removed: a"));
    QCOMPARE(h.service.list(QStringLiteral("Work"))->tasks, QStringList({ QStringLiteral("b"), QStringLiteral("a") }));
}

void TodoListServiceTest::setReminderRejectsPastTime()
{
    ServiceHarness h;
    QVERIFY(h.service.createList(QStringLiteral("Work")).ok());
    const QDateTime now = QDateTime::currentDateTime();

    const auto result = h.service.setReminder(QStringLiteral("Work"), now.addSecs(-60), now);
    QCOMPARE(result.error, core::ListError::PastReminder);
    QVERIFY(h.reminderOf(QStringLiteral("Work")).isEmpty());
    QVERIFY(!h.scheduler.hasJob(QStringLiteral("Work")));
    QCOMPARE(h.service.setReminder(QStringLiteral("Missing"), now.addSecs(60), now).error, core::ListError::NoSuchList);
}

void TodoListServiceTest::setReminderArmsJob()
{
    ServiceHarness h;
    QVERIFY(h.service.createList(QStringLiteral("Work")).ok());
    const QDateTime when = wholeSeconds(QDateTime::currentDateTime().addSecs(3600));

    QVERIFY(h.service.setReminder(QStringLiteral("Work"), when).ok());
    QCOMPARE(h.reminderOf(QStringLiteral("Work")), data::formatReminder(when));
    const auto job = h.scheduler.job(QStringLiteral("Work"));
    QVERIFY(job.has_value());
    QCOMPARE(job->fireAt, when);
    QCOMPARE(data::parseReminder(h.reminderOf(QStringLiteral("Work"))), job->fireAt);
}

void TodoListServiceTest::setReminderFailsWhenSchedulerStopped()
{
    ServiceHarness h;
    QVERIFY(h.service.createList(QStringLiteral("Work")).ok());
    h.scheduler.stop();

    const auto result = h.service.setReminder(QStringLiteral("Work"), QDateTime::currentDateTime().addSecs(60));
    QCOMPARE(result.error, core::ListError::SchedulerFailed);
    QVERIFY(h.reminderOf(QStringLiteral("Work")).isEmpty());
}

void TodoListServiceTest::clearReminderCancelsJob()
{
    ServiceHarness h;
    QVERIFY(h.service.createList(QStringLiteral("Work")).ok());
    QCOMPARE(h.service.clearReminder(QStringLiteral("Work")).error, core::ListError::NoReminder);

    QVERIFY(h.service.setReminder(QStringLiteral("Work"), QDateTime::currentDateTime().addSecs(3600)).ok());
    QVERIFY(h.service.clearReminder(QStringLiteral("Work")).ok());
    QVERIFY(h.reminderOf(QStringLiteral("Work")).isEmpty());
    QVERIFY(!h.scheduler.hasJob(QStringLiteral("Work")));
}

void TodoListServiceTest::deleteCancelsPendingJob()
{
    ServiceHarness h;
    QVERIFY(h.service.createList(QStringLiteral("Work")).ok());
    QVERIFY(h.service.setReminder(QStringLiteral("Work"), QDateTime::currentDateTime().addMSecs(400)).ok());

    QVERIFY(h.service.deleteList(QStringLiteral("Work")).ok());
    QVERIFY(!h.scheduler.hasJob(QStringLiteral("Work")));
    QCOMPARE(h.service.deleteList(QStringLiteral("Work")).error, core::ListError::NoSuchList);

    QTest::qWait(900);
    QVERIFY(h.sink.notifications.isEmpty());
}

void TodoListServiceTest::renameMovesReminder()
{
    ServiceHarness h;
    QVERIFY(h.service.createList(QStringLiteral("Groceries")).ok());
    QVERIFY(h.service.createList(QStringLiteral("Work")).ok());
    const QDateTime when = wholeSeconds(QDateTime::currentDateTime().addSecs(3600));
    QVERIFY(h.service.setReminder(QStringLiteral("Groceries"), when).ok());
    const QString persisted = h.reminderOf(QStringLiteral("Groceries"));

    QCOMPARE(h.service.renameList(QStringLiteral("Groceries"), QStringLiteral("Work")).error,
             core::ListError::DuplicateTitle);
    QCOMPARE(h.service.renameList(QStringLiteral("Groceries"), QStringLiteral(" ")).error, core::ListError::EmptyTitle);
    QVERIFY(h.scheduler.hasJob(QStringLiteral("Groceries")));

    QVERIFY(h.service.renameList(QStringLiteral("Groceries"), QStringLiteral("Shopping")).ok());
    QVERIFY(!h.service.list(QStringLiteral("Groceries")).has_value());
    QVERIFY(!h.scheduler.hasJob(QStringLiteral("Groceries")));
    const auto job = h.scheduler.job(QStringLiteral("Shopping"));
    QVERIFY(job.has_value());
    QCOMPARE(job->fireAt, when);
    QCOMPARE(h.scheduler.jobCount(), 1);
    QCOMPARE(h.reminderOf(QStringLiteral("Shopping")), persisted);
}

void TodoListServiceTest::renameRejectsCollidingTitle()
{
    ServiceHarness h;
    QVERIFY(h.service.createList(QStringLiteral("Buy milk")).ok());
    QVERIFY(h.service.createList(QStringLiteral("Groceries")).ok());
    const QDateTime when = wholeSeconds(QDateTime::currentDateTime().addSecs(3600));
    QVERIFY(h.service.setReminder(QStringLiteral("Groceries"), when).ok());

    QCOMPARE(h.service.renameList(QStringLiteral("Groceries"), QStringLiteral("Buy\tmilk")).error,
             core::ListError::TitleCollision);
    QCOMPARE(h.service.renameList(QStringLiteral("Groceries"), QStringLiteral("Buy_milk")).error,
             core::ListError::TitleCollision);
    QVERIFY(h.service.list(QStringLiteral("Groceries")).has_value());
    QVERIFY(!h.service.list(QStringLiteral("Buy\tmilk")).has_value());
    const auto job = h.scheduler.job(QStringLiteral("Groceries"));
    QVERIFY(job.has_value());
    QCOMPARE(job->fireAt, when);
    QVERIFY(!h.scheduler.hasJob(QStringLiteral("Buy milk")));

    // A list may move to a spelling that only collides with itself.
    QVERIFY(h.service.renameList(QStringLiteral("Buy milk"), QStringLiteral("Buy_milk")).ok());
    QVERIFY(h.service.list(QStringLiteral("Buy_milk")).has_value());
}

void TodoListServiceTest::markDoneClearsReminder()
{
    ServiceHarness h;
    QVERIFY(h.service.createList(QStringLiteral("Work")).ok());
    QVERIFY(h.service.addTask(QStringLiteral("Work"), QStringLiteral("Report")).ok());
    QVERIFY(h.service.setReminder(QStringLiteral("Work"), QDateTime::currentDateTime().addSecs(3600)).ok());

    QVERIFY(h.service.markDone(QStringLiteral("Work")).ok());
    QCOMPARE(h.service.list(QStringLiteral("Work"))->tasks, QStringList{ QStringLiteral("✔ Report") });
    QVERIFY(h.reminderOf(QStringLiteral("Work")).isEmpty());
    QVERIFY(!h.scheduler.hasJob(QStringLiteral("Work")));
}

void TodoListServiceTest::errandsReminderFiresOnce()
{
    ServiceHarness h;
    QSignalSpy clearedSpy(&h.service, &core::TodoListService::reminderCleared);
    QVERIFY(h.service.createList(QStringLiteral("Errands")).ok());
    QVERIFY(h.service.addTask(QStringLiteral("Errands"), QStringLiteral("Buy milk")).ok());
    QVERIFY(h.service.addTask(QStringLiteral("Errands"), QStringLiteral("Pay bills")).ok());
    QVERIFY(h.service.setReminder(QStringLiteral("Errands"), QDateTime::currentDateTime().addSecs(2)).ok());

    QTest::qWait(3000);

    QCOMPARE(h.sink.notifications.size(), 1);
    const auto &notification = h.sink.notifications.first();
    QCOMPARE(notification.title, QStringLiteral("Reminder — Errands"));
    QVERIFY(notification.body.contains(QStringLiteral("- Buy milk")));
    QVERIFY(notification.body.contains(QStringLiteral("- Pay bills")));
    QVERIFY(h.reminderOf(QStringLiteral("Errands")).isEmpty());
    QVERIFY(!h.scheduler.hasJob(QStringLiteral("Errands")));
    QCOMPARE(clearedSpy.count(), 1);
    QCOMPARE(clearedSpy.first().at(0).toString(), QStringLiteral("Errands"));

    std::vector<data::TaskList> persisted;
    QVERIFY(h.storage.load(persisted));
    QCOMPARE(persisted.size(), static_cast<size_t>(1));
    QCOMPARE(persisted.front().title, QStringLiteral("Errands"));
    QVERIFY(persisted.front().reminder.isEmpty());
}

void TodoListServiceTest::firingClearsReminderWhenSinkThrows()
{
    ServiceHarness h;
    h.sink.throwOnNotify = true;
    QSignalSpy clearedSpy(&h.service, &core::TodoListService::reminderCleared);
    QVERIFY(h.service.createList(QStringLiteral("Work")).ok());
    QVERIFY(h.service.setReminder(QStringLiteral("Work"), QDateTime::currentDateTime().addMSecs(200)).ok());

    QTRY_COMPARE_WITH_TIMEOUT(clearedSpy.count(), 1, 3000);
    QCOMPARE(h.sink.notifications.size(), 1);
    QVERIFY(h.reminderOf(QStringLiteral("Work")).isEmpty());
    QVERIFY(!h.scheduler.hasJob(QStringLiteral("Work")));
}

void TodoListServiceTest::firingClearsReminderWhenSinkFails()
{
    ServiceHarness h;
    h.sink.delivered = false;
    QSignalSpy clearedSpy(&h.service, &core::TodoListService::reminderCleared);
    QVERIFY(h.service.createList(QStringLiteral("Work")).ok());
    QVERIFY(h.service.setReminder(QStringLiteral("Work"), QDateTime::currentDateTime().addMSecs(200)).ok());

    QTRY_COMPARE_WITH_TIMEOUT(clearedSpy.count(), 1, 3000);
    QVERIFY(h.reminderOf(QStringLiteral("Work")).isEmpty());
}

void TodoListServiceTest::rescheduleFiresOnlyAtLatestTime()
{
    ServiceHarness h;
    QVERIFY(h.service.createList(QStringLiteral("Work")).ok());
    const QDateTime now = QDateTime::currentDateTime();
    QVERIFY(h.service.setReminder(QStringLiteral("Work"), now.addMSecs(200), now).ok());
    const QDateTime later = now.addMSecs(900);
    QVERIFY(h.service.setReminder(QStringLiteral("Work"), later, now).ok());
    QCOMPARE(h.scheduler.jobCount(), 1);

    QTest::qWait(500);
    QVERIFY(h.sink.notifications.isEmpty());

    QTRY_COMPARE_WITH_TIMEOUT(h.sink.notifications.size(), 1, 3000);
    QVERIFY(QDateTime::currentDateTime() >= later);
    QTest::qWait(300);
    QCOMPARE(h.sink.notifications.size(), 1);
}

void TodoListServiceTest::notificationReadsLiveTasks()
{
    ServiceHarness h;
    QVERIFY(h.service.createList(QStringLiteral("Work")).ok());
    QVERIFY(h.service.setReminder(QStringLiteral("Work"), QDateTime::currentDateTime().addMSecs(300)).ok());
    QVERIFY(h.service.addTask(QStringLiteral("Work"), QStringLiteral("Added later")).ok());

    QTRY_COMPARE_WITH_TIMEOUT(h.sink.notifications.size(), 1, 3000);
    QVERIFY(h.sink.notifications.first().body.contains(QStringLiteral("- Added later")));
}

void TodoListServiceTest::saveAndLoadRestoresLists()
{
    ServiceHarness h;
    QVERIFY(h.service.createList(QStringLiteral("Work")).ok());
    QVERIFY(h.service.addTask(QStringLiteral("Work"), QStringLiteral("a")).ok());
    QVERIFY(h.service.addTask(QStringLiteral("Work"), QStringLiteral("b")).ok());
    QVERIFY(h.service.save().ok());

    QVERIFY(h.service.deleteList(QStringLiteral("Work")).ok());
    QVERIFY(h.service.lists().empty());

    QVERIFY(h.service.load().ok());
    const auto work = h.service.list(QStringLiteral("Work"));
    QVERIFY(work.has_value());
    QCOMPARE(work->tasks, QStringList({ QStringLiteral("a"), QStringLiteral("b") }));
    QVERIFY(work->reminder.isEmpty());
}

void TodoListServiceTest::malformedFileFallsBackToEmpty()
{
    ServiceHarness h;
    QVERIFY(h.service.createList(QStringLiteral("Work")).ok());

    QFile file(h.storage.filePath());
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("{ \"Work\": [ not json");
    file.close();

    const auto result = h.service.load();
    QCOMPARE(result.error, core::ListError::PersistenceFailed);
    QVERIFY(!result.message.isEmpty());
    QVERIFY(h.service.lists().empty());
}

void TodoListServiceTest::failedLoadLeavesFileUntilChanged()
{
    ServiceHarness h;
    const QByteArray damaged("{ \"Work\": { \"tasks\": [\"Report\"");
    QFile file(h.storage.filePath());
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write(damaged);
    file.close();

    QCOMPARE(h.service.load().error, core::ListError::PersistenceFailed);
    QVERIFY(h.service.rearmReminders().ok());
    QVERIFY(h.service.saveIfModified().ok());

    QVERIFY(file.open(QIODevice::ReadOnly));
    QCOMPARE(file.readAll(), damaged);
    file.close();

    QVERIFY(h.service.createList(QStringLiteral("Fresh")).ok());
    QVERIFY(h.service.saveIfModified().ok());
    std::vector<data::TaskList> persisted;
    QVERIFY(h.storage.load(persisted));
    QCOMPARE(persisted.size(), static_cast<size_t>(1));
    QCOMPARE(persisted.front().title, QStringLiteral("Fresh"));
}

void TodoListServiceTest::rearmRestoresFutureReminders()
{
    ServiceHarness h;
    const QDateTime now = wholeSeconds(QDateTime::currentDateTime());
    const QDateTime future = now.addSecs(3600);

    data::TaskList past;
    past.title = QStringLiteral("Past");
    past.reminder = data::formatReminder(now.addSecs(-1));
    data::TaskList upcoming;
    upcoming.title = QStringLiteral("Upcoming");
    upcoming.reminder = data::formatReminder(future);
    QVERIFY(h.storage.save({ past, upcoming }));

    QVERIFY(h.service.load().ok());
    QVERIFY(h.service.rearmReminders(now).ok());

    QVERIFY(h.reminderOf(QStringLiteral("Past")).isEmpty());
    QVERIFY(!h.scheduler.hasJob(QStringLiteral("Past")));
    QCOMPARE(h.scheduler.jobCount(), 1);
    QCOMPARE(h.scheduler.job(QStringLiteral("Upcoming"))->fireAt, future);

    std::vector<data::TaskList> persisted;
    QVERIFY(h.storage.load(persisted));
    for (const auto &list : persisted) {
        if (list.title == QStringLiteral("Past")) {
            QVERIFY(list.reminder.isEmpty());
        } else {
            QCOMPARE(list.reminder, data::formatReminder(future));
        }
    }
}

void TodoListServiceTest::rearmKeepsOneOfCollidingReminders()
{
    ServiceHarness h;
    const QDateTime now = wholeSeconds(QDateTime::currentDateTime());
    data::TaskList spaced;
    spaced.title = QStringLiteral("Buy milk");
    spaced.reminder = data::formatReminder(now.addSecs(3600));
    data::TaskList tabbed;
    tabbed.title = QStringLiteral("Buy\tmilk");
    tabbed.reminder = data::formatReminder(now.addSecs(7200));
    QVERIFY(h.storage.save({ spaced, tabbed }));

    QVERIFY(h.service.load().ok());
    QVERIFY(h.service.rearmReminders(now).ok());

    QCOMPARE(h.scheduler.jobCount(), 1);
    const auto job = h.scheduler.job(spaced.title);
    QVERIFY(job.has_value());

    const bool spacedKept = !h.reminderOf(spaced.title).isEmpty();
    const bool tabbedKept = !h.reminderOf(tabbed.title).isEmpty();
    QVERIFY(spacedKept != tabbedKept);
    const QString kept = spacedKept ? spaced.title : tabbed.title;
    const QString dropped = spacedKept ? tabbed.title : spaced.title;
    QCOMPARE(job->title, kept);
    QCOMPARE(job->fireAt, data::parseReminder(h.reminderOf(kept)));

    QCOMPARE(h.service.clearReminder(dropped).error, core::ListError::NoReminder);
    QCOMPARE(h.scheduler.jobCount(), 1);

    std::vector<data::TaskList> persisted;
    QVERIFY(h.storage.load(persisted));
    for (const auto &list : persisted) {
        QCOMPARE(list.reminder.isEmpty(), list.title == dropped);
    }
}

QTEST_GUILESS_MAIN(TodoListServiceTest)
#include "TodoListServiceTest.moc"
