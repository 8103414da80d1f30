#include <QtTest/QtTest>

#include "planner/data/CalendarStore.hpp"
#include "planner/data/DataProvider.hpp"
#include "planner/data/TaskStore.hpp"

using namespace planner::data;

class FilePlannerStorageTest : public QObject
{
    Q_OBJECT

private slots:
    void persistsEntriesAcrossReloads();
    void persistsTasksAcrossReloads();
    void continuesIdsAfterReload();
    void missingFileStartsEmpty();
};

void FilePlannerStorageTest::persistsEntriesAcrossReloads()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("planner.ics"));
    const QDateTime start(QDate(2024, 5, 6), QTime(9, 30));

    qint64 linkedId = 0;
    qint64 pathId = 0;
    {
        DataProvider provider(path);
        CalendarEntry manual;
        manual.label = QStringLiteral("Lunch; with Anna, Bob\nand the team");
        manual.start = start;
        provider.calendarStore().addEntry(manual);

        CalendarEntry linked;
        linked.label = QStringLiteral("Task#7 (45m): Write report");
        linked.start = start.addSecs(3600);
        linked.taskId = 7;
        linked.durationMinutes = 45;
        linkedId = provider.calendarStore().addEntry(linked).id;

        CalendarEntry path;
        path.label = QStringLiteral("Review C:\\notes\\New, then \\\\server");
        path.start = start.addSecs(7200);
        pathId = provider.calendarStore().addEntry(path).id;
    }
    QVERIFY(QFile::exists(path));

    DataProvider reloaded(path);
    const auto entries = reloaded.calendarStore().fetchEntries();
    QCOMPARE(entries.size(), static_cast<size_t>(3));
    QCOMPARE(entries.front().label, QStringLiteral("Lunch; with Anna, Bob\nand the team"));
    QCOMPARE(entries.front().start, start);
    QVERIFY(!entries.front().taskId.has_value());
    QCOMPARE(entries.front().durationMinutes, 0);

    const auto linked = reloaded.calendarStore().findById(linkedId);
    QVERIFY(linked.has_value());
    QVERIFY(linked->taskId.has_value());
    QCOMPARE(*linked->taskId, qint64(7));
    QCOMPARE(linked->durationMinutes, 45);
    QCOMPARE(reloaded.calendarStore().findByTaskId(7).size(), static_cast<size_t>(1));

    const auto withBackslashes = reloaded.calendarStore().findById(pathId);
    QVERIFY(withBackslashes.has_value());
    QCOMPARE(withBackslashes->label, QStringLiteral("Review C:\\notes\\New, then \\\\server"));
}

void FilePlannerStorageTest::persistsTasksAcrossReloads()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("planner.ics"));
    const QDateTime scheduled(QDate(2024, 5, 6), QTime(14, 0));

    qint64 scheduledId = 0;
    qint64 backlogId = 0;
    {
        DataProvider provider(path);
        Task task;
        task.title = QStringLiteral("Write report");
        task.mode = TaskMode::Work;
        task.userPriority = Priority::High;
        task.effectivePriority = Priority::Low;
        task.priorityReason = QStringLiteral("low energy mood");
        task.scheduledTime = scheduled;
        task.status = TaskStatus::InProgress;
        scheduledId = provider.taskStore().addTask(task).id;

        Task backlog;
        backlog.title = QStringLiteral("Call grandma");
        backlogId = provider.taskStore().addTask(backlog).id;
    }

    DataProvider reloaded(path);
    const auto task = reloaded.taskStore().findById(scheduledId);
    QVERIFY(task.has_value());
    QCOMPARE(task->title, QStringLiteral("Write report"));
    QCOMPARE(task->mode, TaskMode::Work);
    QCOMPARE(task->userPriority, Priority::High);
    QCOMPARE(task->effectivePriority, Priority::Low);
    QCOMPARE(task->priorityReason, QStringLiteral("low energy mood"));
    QCOMPARE(task->scheduledTime, scheduled);
    QCOMPARE(task->status, TaskStatus::InProgress);

    const auto backlog = reloaded.taskStore().findById(backlogId);
    QVERIFY(backlog.has_value());
    QVERIFY(!backlog->isScheduled());
    QCOMPARE(backlog->userPriority, Priority::Medium);
    QCOMPARE(backlog->status, TaskStatus::Planned);
}

void FilePlannerStorageTest::continuesIdsAfterReload()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("planner.ics"));

    qint64 firstId = 0;
    {
        DataProvider provider(path);
        Task task;
        task.title = QStringLiteral("First");
        firstId = provider.taskStore().addTask(task).id;
        Task removed;
        removed.title = QStringLiteral("Removed");
        const auto second = provider.taskStore().addTask(removed);
        QVERIFY(provider.taskStore().removeTask(second.id));
    }

    DataProvider reloaded(path);
    Task next;
    next.title = QStringLiteral("Next");
    const auto stored = reloaded.taskStore().addTask(next);
    QVERIFY(stored.id > firstId);
    QCOMPARE(reloaded.taskStore().fetchTasks().size(), static_cast<size_t>(2));
}

void FilePlannerStorageTest::missingFileStartsEmpty()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("nested/planner.ics"));

    DataProvider provider(path);
    QCOMPARE(provider.filePath(), path);
    QVERIFY(provider.taskStore().fetchTasks().empty());
    QVERIFY(provider.calendarStore().fetchEntries().empty());

    CalendarEntry entry;
    entry.label = QStringLiteral("Standup");
    entry.start = QDateTime(QDate(2024, 5, 6), QTime(9, 0));
    provider.calendarStore().addEntry(entry);
    QVERIFY(QFile::exists(path));
}

QTEST_GUILESS_MAIN(FilePlannerStorageTest)
#include "FilePlannerStorageTest.moc"
