#pragma once

#include <functional>
#include <optional>
#include <vector>

#include <QDateTime>
#include <QString>

#include "planner/core/SchedulerSettings.hpp"
#include "planner/data/CalendarEntry.hpp"
#include "planner/data/Task.hpp"
#include "planner/scheduling/BusySnapshot.hpp"
#include "planner/scheduling/ConflictResolver.hpp"
#include "planner/scheduling/Reprioritization.hpp"
#include "planner/scheduling/TaskCalendarSync.hpp"

namespace planner {
namespace data {
class TaskStore;
class CalendarStore;
}

namespace core {

using Clock = std::function<QDateTime()>;

struct TaskDraft
{
    QString title;
    data::TaskMode mode = data::TaskMode::Personal;
    data::Priority userPriority = data::Priority::Medium;
    QString desiredTimeText;
    int durationMinutes = 0; // 0 picks the default for the title
    bool autoSchedule = true;
};

struct TaskPlacement
{
    data::Task task;
    int durationMinutes = 0;
    bool rescheduled = false;
    bool degraded = false;
    std::vector<scheduling::CalendarOp> calendarOps;
};

struct TaskPatch
{
    std::optional<QString> title;
    std::optional<data::Priority> userPriority;
    std::optional<QString> scheduledTimeText; // "unscheduled" clears the slot
    std::optional<data::TaskStatus> status;
    std::optional<int> durationMinutes;
    bool resolveConflicts = false;
};

struct TaskUpdate
{
    data::Task task;
    bool rescheduled = false;
    std::vector<scheduling::CalendarOp> calendarOps;
};

// Request-level orchestration over the task and calendar stores. Holds no
// state between calls; every request reads the stores afresh.
class PlannerService
{
public:
    PlannerService(data::TaskStore &tasks,
                   data::CalendarStore &calendar,
                   SchedulerSettings settings = SchedulerSettings(),
                   Clock clock = Clock());

    const SchedulerSettings &settings() const;
    scheduling::BusySnapshot readSnapshot() const;

    scheduling::Resolution resolveSchedule(const QString &desiredTimeText, int durationMinutes, bool avoidNaps) const;
    std::vector<QDateTime> suggestSlots(const QDateTime &base,
                                        const std::vector<int> &offsetsMinutes,
                                        int durationMinutes,
                                        bool avoidNaps) const;
    std::vector<scheduling::CalendarOp> syncTaskCalendar(const data::Task &task, int durationMinutes);
    std::vector<data::Task> applyMoodToBacklog(const scheduling::MoodSignal &signal);

    TaskPlacement createTask(const TaskDraft &draft);
    // All drafts share one snapshot; each placement is reserved before the
    // next one is computed. Drafts without their own time are staggered from
    // the anchor.
    std::vector<TaskPlacement> scheduleBatch(const std::vector<TaskDraft> &drafts,
                                             const QString &anchorText = QString());
    std::optional<TaskUpdate> updateTask(qint64 id, const TaskPatch &patch);
    std::optional<std::vector<scheduling::CalendarOp>> deleteTask(qint64 id);

    data::CalendarEntry addCalendarEntry(const QString &label, const QDateTime &start, int durationMinutes = 0);
    bool removeCalendarEntry(qint64 id);

    int durationFor(const QString &title, int requestedMinutes) const;

private:
    TaskPlacement place(const TaskDraft &draft,
                        const std::optional<QDateTime> &desired,
                        scheduling::BusySnapshot &snapshot);
    int currentDuration(qint64 taskId) const;
    QDateTime now() const;

    data::TaskStore &m_tasks;
    data::CalendarStore &m_calendar;
    SchedulerSettings m_settings;
    Clock m_clock;
    scheduling::TaskCalendarSync m_sync;
};

} // namespace core
} // namespace planner
