#include <QtTest/QtTest>

#include "planner/core/PlannerService.hpp"
#include "planner/data/InMemoryCalendarStore.hpp"
#include "planner/data/InMemoryTaskStore.hpp"

using namespace planner;

namespace {

QDateTime at(int hour, int minute)
{
    return QDateTime(QDate(2024, 5, 6), QTime(hour, minute));
}

QString iso(int hour, int minute)
{
    return at(hour, minute).toString(Qt::ISODate);
}

core::TaskDraft draft(const QString &title, const QString &desired = QString())
{
    core::TaskDraft result;
    result.title = title;
    result.desiredTimeText = desired;
    return result;
}

} // namespace

class PlannerServiceTest : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void resolvesAroundStandup();
    void searchesFromNowWithoutTime();
    void keepsManualTasksUnscheduled();
    void napsKeepClearOfMeetings();
    void batchDoesNotCollideWithItself();
    void unschedulingDeletesOneEntry();
    void rescheduleInPlaceIsStable();
    void keepsScheduleOnUnparseableTime();
    void updateUnknownTask();
    void deleteTaskRemovesEntries();
    void removingEntryUnschedulesTask();
    void moodPersistsEffectivePriority();
    void suggestsDefaultOffsets();
    void syncsExternalTaskChanges();
    void removingLegacyEntryUnschedulesTask();
    void manualEntryCannotClaimTask();
    void storedTimesAreWholeMinutes();

private:
    data::InMemoryTaskStore *m_tasks = nullptr;
    data::InMemoryCalendarStore *m_calendar = nullptr;
    core::PlannerService *m_service = nullptr;
};

void PlannerServiceTest::init()
{
    m_tasks = new data::InMemoryTaskStore();
    m_calendar = new data::InMemoryCalendarStore();
    m_service = new core::PlannerService(*m_tasks, *m_calendar, core::SchedulerSettings(), [] { return at(8, 0); });
}

void PlannerServiceTest::cleanup()
{
    delete m_service;
    delete m_calendar;
    delete m_tasks;
    m_service = nullptr;
    m_calendar = nullptr;
    m_tasks = nullptr;
}

void PlannerServiceTest::resolvesAroundStandup()
{
    m_service->addCalendarEntry(QStringLiteral("Daily standup"), at(9, 0), 30);

    const auto resolution = m_service->resolveSchedule(iso(9, 10), 30, false);
    QCOMPARE(resolution.time, at(9, 30));
    QVERIFY(resolution.changed);

    const auto placement = m_service->createTask(draft(QStringLiteral("Write report"), iso(9, 10)));
    QCOMPARE(placement.task.scheduledTime, at(9, 30));
    QVERIFY(placement.rescheduled);
    QCOMPARE(placement.durationMinutes, 30);
    QCOMPARE(placement.calendarOps.size(), static_cast<size_t>(1));
    QCOMPARE(placement.calendarOps.front().kind, scheduling::CalendarOpKind::Created);
    QCOMPARE(placement.calendarOps.front().label,
             QStringLiteral("Task#%1 (30m): Write report").arg(placement.task.id));
    QCOMPARE(m_calendar->fetchEntries().size(), static_cast<size_t>(2));

    const auto stored = m_tasks->findById(placement.task.id);
    QVERIFY(stored.has_value());
    QCOMPARE(stored->scheduledTime, at(9, 30));
}

void PlannerServiceTest::searchesFromNowWithoutTime()
{
    const auto placement = m_service->createTask(draft(QStringLiteral("Stretch")));
    QCOMPARE(placement.task.scheduledTime, at(8, 15));
    QVERIFY(placement.rescheduled);
}

void PlannerServiceTest::keepsManualTasksUnscheduled()
{
    core::TaskDraft manual = draft(QStringLiteral("Someday"));
    manual.autoSchedule = false;
    const auto placement = m_service->createTask(manual);
    QVERIFY(!placement.task.isScheduled());
    QVERIFY(placement.calendarOps.empty());
    QVERIFY(m_calendar->fetchEntries().empty());

    // Without auto scheduling the requested time is stored as given.
    m_service->addCalendarEntry(QStringLiteral("Daily standup"), at(9, 0), 30);
    core::TaskDraft pinned = draft(QStringLiteral("Pinned"), iso(9, 10));
    pinned.autoSchedule = false;
    QCOMPARE(m_service->createTask(pinned).task.scheduledTime, at(9, 10));
}

void PlannerServiceTest::napsKeepClearOfMeetings()
{
    m_service->addCalendarEntry(QStringLiteral("Team meeting"), at(10, 0), 30);

    const auto placement = m_service->createTask(draft(QStringLiteral("Power nap"), iso(10, 10)));
    QCOMPARE(placement.durationMinutes, 10);
    QVERIFY(placement.rescheduled);
    QVERIFY(placement.task.scheduledTime >= at(10, 50));
}

void PlannerServiceTest::batchDoesNotCollideWithItself()
{
    const std::vector<core::TaskDraft> drafts = {
        draft(QStringLiteral("Inbox zero")),
        draft(QStringLiteral("Write report")),
        draft(QStringLiteral("Plan sprint")),
    };
    const auto placements = m_service->scheduleBatch(drafts, iso(10, 0));
    QCOMPARE(placements.size(), static_cast<size_t>(3));
    QCOMPARE(placements[0].task.scheduledTime, at(10, 0));

    for (std::size_t i = 0; i < placements.size(); ++i) {
        const QDateTime start = placements[i].task.scheduledTime;
        const QDateTime end = start.addSecs(placements[i].durationMinutes * 60);
        for (std::size_t j = i + 1; j < placements.size(); ++j) {
            const scheduling::BusyInterval other{placements[j].task.scheduledTime,
                                                 placements[j].task.scheduledTime.addSecs(
                                                     placements[j].durationMinutes * 60),
                                                 QString(), std::nullopt};
            QVERIFY(!scheduling::overlaps(start, end, other));
        }
    }
    QCOMPARE(m_calendar->fetchEntries().size(), static_cast<size_t>(3));
}

void PlannerServiceTest::unschedulingDeletesOneEntry()
{
    const auto placement = m_service->createTask(draft(QStringLiteral("Write report"), iso(11, 0)));
    QCOMPARE(m_calendar->fetchEntries().size(), static_cast<size_t>(1));

    core::TaskPatch patch;
    patch.scheduledTimeText = QStringLiteral("unscheduled");
    const auto update = m_service->updateTask(placement.task.id, patch);
    QVERIFY(update.has_value());
    QVERIFY(!update->task.isScheduled());
    QCOMPARE(update->calendarOps.size(), static_cast<size_t>(1));
    QCOMPARE(scheduling::calendarOpKindToString(update->calendarOps.front().kind), QStringLiteral("event_deleted"));
    QVERIFY(m_calendar->fetchEntries().empty());
    QVERIFY(!m_tasks->findById(placement.task.id)->isScheduled());
}

void PlannerServiceTest::rescheduleInPlaceIsStable()
{
    core::TaskDraft longTask = draft(QStringLiteral("Deep work"), iso(13, 0));
    longTask.durationMinutes = 90;
    const auto placement = m_service->createTask(longTask);
    QCOMPARE(placement.task.scheduledTime, at(13, 0));

    core::TaskPatch patch;
    patch.scheduledTimeText = iso(13, 0);
    patch.resolveConflicts = true;
    const auto same = m_service->updateTask(placement.task.id, patch);
    QVERIFY(same.has_value());
    QVERIFY(!same->rescheduled);
    QCOMPARE(same->task.scheduledTime, at(13, 0));
    QVERIFY(same->calendarOps.empty());

    // Moving into its own old slot does not count as a collision.
    patch.scheduledTimeText = iso(13, 30);
    const auto moved = m_service->updateTask(placement.task.id, patch);
    QVERIFY(moved.has_value());
    QVERIFY(!moved->rescheduled);
    QCOMPARE(moved->task.scheduledTime, at(13, 30));
    QCOMPARE(moved->calendarOps.size(), static_cast<size_t>(1));
    QCOMPARE(moved->calendarOps.front().kind, scheduling::CalendarOpKind::Updated);
    QCOMPARE(m_calendar->fetchEntries().front().durationMinutes, 90);
}

void PlannerServiceTest::keepsScheduleOnUnparseableTime()
{
    const auto placement = m_service->createTask(draft(QStringLiteral("Write report"), iso(11, 0)));

    core::TaskPatch patch;
    patch.title = QStringLiteral("Write final report");
    patch.scheduledTimeText = QStringLiteral("whenever");
    const auto update = m_service->updateTask(placement.task.id, patch);
    QVERIFY(update.has_value());
    QCOMPARE(update->task.scheduledTime, at(11, 0));
    QCOMPARE(update->task.title, QStringLiteral("Write final report"));
    QCOMPARE(update->calendarOps.size(), static_cast<size_t>(1));
    QCOMPARE(update->calendarOps.front().label,
             QStringLiteral("Task#%1 (30m): Write final report").arg(placement.task.id));
}

void PlannerServiceTest::updateUnknownTask()
{
    QVERIFY(!m_service->updateTask(404, core::TaskPatch()).has_value());
    QVERIFY(!m_service->deleteTask(404).has_value());
}

void PlannerServiceTest::deleteTaskRemovesEntries()
{
    const auto placement = m_service->createTask(draft(QStringLiteral("Write report"), iso(11, 0)));
    m_service->addCalendarEntry(QStringLiteral("Dentist appointment"), at(15, 0));

    const auto ops = m_service->deleteTask(placement.task.id);
    QVERIFY(ops.has_value());
    QCOMPARE(ops->size(), static_cast<size_t>(1));
    QCOMPARE(ops->front().kind, scheduling::CalendarOpKind::Deleted);
    QVERIFY(!m_tasks->findById(placement.task.id).has_value());
    QCOMPARE(m_calendar->fetchEntries().size(), static_cast<size_t>(1));
}

void PlannerServiceTest::removingEntryUnschedulesTask()
{
    const auto placement = m_service->createTask(draft(QStringLiteral("Write report"), iso(11, 0)));
    const qint64 entryId = placement.calendarOps.front().entryId;

    QVERIFY(m_service->removeCalendarEntry(entryId));
    QVERIFY(!m_tasks->findById(placement.task.id)->isScheduled());
    QVERIFY(!m_service->removeCalendarEntry(entryId));
}

void PlannerServiceTest::moodPersistsEffectivePriority()
{
    core::TaskDraft high = draft(QStringLiteral("Ship release"));
    high.userPriority = data::Priority::High;
    high.autoSchedule = false;
    const auto first = m_service->createTask(high).task;
    core::TaskDraft low = draft(QStringLiteral("Water plants"));
    low.userPriority = data::Priority::Low;
    low.autoSchedule = false;
    const auto second = m_service->createTask(low).task;

    const auto tired = m_service->applyMoodToBacklog({scheduling::MoodLabel::Tired, -0.5});
    QCOMPARE(tired.size(), static_cast<size_t>(2));
    QCOMPARE(m_tasks->findById(first.id)->effectivePriority, data::Priority::Low);
    QCOMPARE(m_tasks->findById(first.id)->priorityReason, QStringLiteral("low energy mood"));
    QCOMPARE(m_tasks->findById(first.id)->userPriority, data::Priority::High);

    const auto focused = m_service->applyMoodToBacklog({scheduling::MoodLabel::Motivated, 0.7});
    QCOMPARE(m_tasks->findById(second.id)->effectivePriority, data::Priority::High);

    m_service->applyMoodToBacklog({scheduling::MoodLabel::Neutral, 0.0});
    QCOMPARE(m_tasks->findById(first.id)->effectivePriority, data::Priority::High);
    QCOMPARE(m_tasks->findById(second.id)->effectivePriority, data::Priority::Low);
    QVERIFY(m_tasks->findById(second.id)->priorityReason.isEmpty());
    QCOMPARE(focused.size(), static_cast<size_t>(2));
}

void PlannerServiceTest::suggestsDefaultOffsets()
{
    m_service->addCalendarEntry(QStringLiteral("Client call"), at(9, 30), 30);
    const auto slots = m_service->suggestSlots(at(9, 0), {}, 30, false);
    // The first two offsets both land right after the call.
    QCOMPARE(slots.size(), static_cast<size_t>(3));
    QCOMPARE(slots[0], at(10, 0));
    QCOMPARE(slots[1], at(10, 45));
    QCOMPARE(slots[2], at(12, 15));
}

void PlannerServiceTest::syncsExternalTaskChanges()
{
    core::TaskDraft manual = draft(QStringLiteral("Read paper"));
    manual.autoSchedule = false;
    data::Task task = m_service->createTask(manual).task;

    task.scheduledTime = at(16, 0);
    QVERIFY(m_tasks->updateTask(task));
    const auto created = m_service->syncTaskCalendar(task, 60);
    QCOMPARE(created.size(), static_cast<size_t>(1));
    QCOMPARE(created.front().kind, scheduling::CalendarOpKind::Created);
    QCOMPARE(created.front().label, QStringLiteral("Task#%1 (60m): Read paper").arg(task.id));

    QVERIFY(m_service->syncTaskCalendar(task, 60).empty());
}

void PlannerServiceTest::removingLegacyEntryUnschedulesTask()
{
    const auto placement = m_service->createTask(draft(QStringLiteral("Gym"), iso(18, 0)));
    QVERIFY(m_calendar->removeEntry(placement.calendarOps.front().entryId));

    data::CalendarEntry legacy;
    legacy.label = QStringLiteral("Task#%1 (30m): Gym").arg(placement.task.id);
    legacy.start = at(18, 0);
    const qint64 legacyId = m_calendar->addEntry(legacy).id;

    QVERIFY(m_service->removeCalendarEntry(legacyId));
    QVERIFY(!m_tasks->findById(placement.task.id)->isScheduled());
}

void PlannerServiceTest::manualEntryCannotClaimTask()
{
    const auto placement = m_service->createTask(draft(QStringLiteral("Write report"), iso(11, 0)));
    const auto manual = m_service->addCalendarEntry(
        QStringLiteral("Task#%1 (45m): Borrowed label").arg(placement.task.id), at(15, 0));
    QCOMPARE(manual.label, QStringLiteral("(45m): Borrowed label"));
    QVERIFY(!manual.taskId.has_value());

    core::TaskPatch patch;
    patch.title = QStringLiteral("Write final report");
    const auto update = m_service->updateTask(placement.task.id, patch);
    QVERIFY(update.has_value());
    QCOMPARE(update->calendarOps.size(), static_cast<size_t>(1));
    QCOMPARE(update->calendarOps.front().kind, scheduling::CalendarOpKind::Updated);
    QVERIFY(m_calendar->findById(manual.id).has_value());

    // Removing the manual entry leaves the task alone.
    QVERIFY(m_service->removeCalendarEntry(manual.id));
    QCOMPARE(m_tasks->findById(placement.task.id)->scheduledTime, at(11, 0));
}

void PlannerServiceTest::storedTimesAreWholeMinutes()
{
    core::PlannerService service(*m_tasks, *m_calendar, core::SchedulerSettings(),
                                 [] { return at(8, 0).addMSecs(42500); });

    core::TaskDraft manual = draft(QStringLiteral("Stretch"), QStringLiteral("in 30 minutes"));
    manual.autoSchedule = false;
    const auto placement = service.createTask(manual);
    QCOMPARE(placement.task.scheduledTime, at(8, 30));
    QCOMPARE(m_calendar->fetchEntries().front().start, at(8, 30));

    core::TaskPatch patch;
    patch.scheduledTimeText = QStringLiteral("in 45 minutes");
    const auto update = service.updateTask(placement.task.id, patch);
    QVERIFY(update.has_value());
    QCOMPARE(update->task.scheduledTime, at(8, 45));
    QCOMPARE(m_tasks->findById(placement.task.id)->scheduledTime, at(8, 45));
}

QTEST_GUILESS_MAIN(PlannerServiceTest)
#include "PlannerServiceTest.moc"
