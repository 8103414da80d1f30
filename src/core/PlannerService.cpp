#include "planner/core/PlannerService.hpp"

#include "planner/core/Logging.hpp"
#include "planner/data/CalendarStore.hpp"
#include "planner/data/TaskStore.hpp"
#include "planner/scheduling/BusyInterval.hpp"
#include "planner/scheduling/DesiredTimeParser.hpp"
#include "planner/scheduling/StaggeredSlots.hpp"

namespace planner {
namespace core {

PlannerService::PlannerService(data::TaskStore &tasks,
                               data::CalendarStore &calendar,
                               SchedulerSettings settings,
                               Clock clock)
    : m_tasks(tasks)
    , m_calendar(calendar)
    , m_settings(std::move(settings))
    , m_clock(std::move(clock))
    , m_sync(calendar)
{
}

const SchedulerSettings &PlannerService::settings() const
{
    return m_settings;
}

scheduling::BusySnapshot PlannerService::readSnapshot() const
{
    const auto limit = static_cast<std::size_t>(qMax(1, m_settings.recentEntryLimit));
    scheduling::BusySnapshot snapshot(m_calendar.listRecentEntries(limit));
    qCDebug(lcService) << "Busy snapshot with" << snapshot.size() << "interval(s)";
    return snapshot;
}

scheduling::Resolution PlannerService::resolveSchedule(const QString &desiredTimeText,
                                                       int durationMinutes,
                                                       bool avoidNaps) const
{
    const QDateTime current = now();
    const auto desired = scheduling::parseDesiredTime(desiredTimeText, current);
    if (!desired && !desiredTimeText.trimmed().isEmpty()) {
        qCInfo(lcService) << "Ignoring unparseable desired time" << desiredTimeText;
    }
    const scheduling::BusySnapshot snapshot = readSnapshot();
    return scheduling::resolveConflict(desired, snapshot.intervals(),
                                       m_settings.searchOptions(scheduling::clampDuration(durationMinutes), avoidNaps),
                                       current);
}

std::vector<QDateTime> PlannerService::suggestSlots(const QDateTime &base,
                                                    const std::vector<int> &offsetsMinutes,
                                                    int durationMinutes,
                                                    bool avoidNaps) const
{
    const scheduling::BusySnapshot snapshot = readSnapshot();
    const QDateTime anchor = base.isValid() ? base : now();
    const std::vector<int> &offsets = offsetsMinutes.empty() ? m_settings.suggestionOffsets : offsetsMinutes;
    return scheduling::generateStaggeredSlots(snapshot.intervals(), anchor, offsets,
                                              m_settings.searchOptions(scheduling::clampDuration(durationMinutes),
                                                                       avoidNaps));
}

std::vector<scheduling::CalendarOp> PlannerService::syncTaskCalendar(const data::Task &task, int durationMinutes)
{
    return m_sync.sync(task, durationMinutes);
}

std::vector<data::Task> PlannerService::applyMoodToBacklog(const scheduling::MoodSignal &signal)
{
    const std::vector<data::Task> before = m_tasks.fetchTasks();
    std::vector<data::Task> after = scheduling::applyMoodToBacklog(signal, before);

    int changed = 0;
    for (std::size_t i = 0; i < after.size(); ++i) {
        if (after[i].effectivePriority == before[i].effectivePriority
            && after[i].priorityReason == before[i].priorityReason) {
            continue;
        }
        if (m_tasks.updateTask(after[i])) {
            ++changed;
        }
    }
    qCInfo(lcService) << "Mood" << scheduling::moodToString(signal.label) << "recolored" << changed << "of"
                      << after.size() << "task(s)";
    return after;
}

TaskPlacement PlannerService::createTask(const TaskDraft &draft)
{
    scheduling::BusySnapshot snapshot = readSnapshot();
    return place(draft, scheduling::parseDesiredTime(draft.desiredTimeText, now()), snapshot);
}

std::vector<TaskPlacement> PlannerService::scheduleBatch(const std::vector<TaskDraft> &drafts,
                                                         const QString &anchorText)
{
    const QDateTime current = now();
    const auto anchor = scheduling::parseDesiredTime(anchorText, current);
    scheduling::BusySnapshot snapshot = readSnapshot();

    std::vector<TaskPlacement> placements;
    placements.reserve(drafts.size());
    for (std::size_t i = 0; i < drafts.size(); ++i) {
        auto desired = scheduling::parseDesiredTime(drafts[i].desiredTimeText, current);
        if (!desired && anchor) {
            desired = anchor->addSecs(static_cast<qint64>(m_settings.batchStaggerMinutes) * 60 * static_cast<qint64>(i));
        }
        placements.push_back(place(drafts[i], desired, snapshot));
    }
    return placements;
}

std::optional<TaskUpdate> PlannerService::updateTask(qint64 id, const TaskPatch &patch)
{
    auto existing = m_tasks.findById(id);
    if (!existing) {
        return std::nullopt;
    }
    data::Task task = *existing;

    if (patch.title) {
        task.title = patch.title->simplified();
    }
    if (patch.userPriority) {
        task.userPriority = *patch.userPriority;
        task.effectivePriority = *patch.userPriority;
        task.priorityReason.clear();
    }
    if (patch.status) {
        task.status = *patch.status;
    }
    if (patch.scheduledTimeText) {
        const QString text = patch.scheduledTimeText->trimmed();
        if (text.isEmpty() || text.compare(QLatin1String("unscheduled"), Qt::CaseInsensitive) == 0) {
            task.scheduledTime = QDateTime();
        } else if (const auto parsed = scheduling::parseDesiredTime(text, now())) {
            task.scheduledTime = scheduling::truncateToMinute(*parsed);
        } else {
            qCWarning(lcService) << "Keeping schedule of task" << id << "- cannot parse" << text;
        }
    }

    const int duration = patch.durationMinutes ? scheduling::clampDuration(*patch.durationMinutes)
                                               : currentDuration(id);

    TaskUpdate update;
    if (patch.resolveConflicts && task.isScheduled()) {
        auto options = m_settings.searchOptions(duration, scheduling::isLowIntensityTitle(task.title));
        options.excludeTaskId = task.id;
        const auto resolution = scheduling::resolveConflict(task.scheduledTime, readSnapshot().intervals(), options,
                                                            now());
        task.scheduledTime = resolution.time;
        update.rescheduled = resolution.changed;
    }

    if (!m_tasks.updateTask(task)) {
        qCWarning(lcService) << "Task" << id << "disappeared during update";
        return std::nullopt;
    }
    update.task = task;
    update.calendarOps = m_sync.sync(task, duration);
    return update;
}

std::optional<std::vector<scheduling::CalendarOp>> PlannerService::deleteTask(qint64 id)
{
    if (!m_tasks.findById(id)) {
        return std::nullopt;
    }
    std::vector<scheduling::CalendarOp> ops = m_sync.detach(id);
    if (!m_tasks.removeTask(id)) {
        qCWarning(lcService) << "Task" << id << "was already removed";
    }
    qCInfo(lcService) << "Deleted task" << id << "and" << ops.size() << "calendar entry(s)";
    return ops;
}

data::CalendarEntry PlannerService::addCalendarEntry(const QString &label, const QDateTime &start, int durationMinutes)
{
    data::CalendarEntry entry;
    entry.label = scheduling::stripTaskLabelPrefix(label.simplified());
    if (entry.label != label.simplified()) {
        qCInfo(lcService) << "Dropped task prefix from manual entry label" << label;
    }
    entry.start = scheduling::truncateToMinute(start);
    entry.durationMinutes = durationMinutes > 0 ? scheduling::clampDuration(durationMinutes) : 0;
    return m_calendar.addEntry(std::move(entry));
}

bool PlannerService::removeCalendarEntry(qint64 id)
{
    const auto entry = m_calendar.findById(id);
    if (!entry || !m_calendar.removeEntry(id)) {
        return false;
    }
    const auto owner = scheduling::owningTaskId(*entry);
    if (!owner) {
        return true;
    }
    // The owning task loses its slot together with its entry.
    auto task = m_tasks.findById(*owner);
    if (task && task->isScheduled() && m_sync.ownedEntries(task->id).empty()) {
        task->scheduledTime = QDateTime();
        if (m_tasks.updateTask(*task)) {
            qCInfo(lcService) << "Task" << task->id << "unscheduled with its calendar entry" << id;
        }
    }
    return true;
}

int PlannerService::durationFor(const QString &title, int requestedMinutes) const
{
    if (requestedMinutes > 0) {
        return scheduling::clampDuration(requestedMinutes);
    }
    return scheduling::isLowIntensityTitle(title) ? m_settings.lowIntensityDurationMinutes
                                                  : m_settings.defaultDurationMinutes;
}

TaskPlacement PlannerService::place(const TaskDraft &draft,
                                    const std::optional<QDateTime> &desired,
                                    scheduling::BusySnapshot &snapshot)
{
    TaskPlacement placement;
    const QString title = draft.title.simplified();
    const bool avoidNaps = scheduling::isLowIntensityTitle(title);
    placement.durationMinutes = durationFor(title, draft.durationMinutes);

    data::Task task;
    task.title = title;
    task.mode = draft.mode;
    task.userPriority = draft.userPriority;
    task.effectivePriority = draft.userPriority;
    task.createdAt = now();

    if (draft.autoSchedule) {
        const auto resolution = scheduling::resolveConflict(
            desired, snapshot.intervals(), m_settings.searchOptions(placement.durationMinutes, avoidNaps), now());
        task.scheduledTime = resolution.time;
        placement.rescheduled = resolution.changed;
        placement.degraded = resolution.degraded;
    } else if (desired) {
        task.scheduledTime = scheduling::truncateToMinute(*desired);
    }

    placement.task = m_tasks.addTask(std::move(task));
    placement.calendarOps = m_sync.sync(placement.task, placement.durationMinutes);

    if (placement.task.isScheduled()) {
        snapshot.reserve(placement.task.scheduledTime, placement.durationMinutes,
                         scheduling::formatEntryLabel(placement.task.id, placement.task.title,
                                                      placement.durationMinutes),
                         placement.task.id);
    }
    qCDebug(lcService) << "Placed task" << placement.task.id << "at"
                       << data::scheduledTimeToString(placement.task.scheduledTime);
    return placement;
}

int PlannerService::currentDuration(qint64 taskId) const
{
    const auto owned = m_sync.ownedEntries(taskId);
    if (owned.empty()) {
        return m_settings.defaultDurationMinutes;
    }
    return scheduling::entryDurationMinutes(owned.front());
}

QDateTime PlannerService::now() const
{
    return m_clock ? m_clock() : QDateTime::currentDateTime();
}

} // namespace core
} // namespace planner
