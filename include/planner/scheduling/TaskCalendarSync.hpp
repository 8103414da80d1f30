#pragma once

#include <optional>
#include <vector>

#include <QDateTime>
#include <QString>

#include "planner/data/CalendarEntry.hpp"
#include "planner/data/Task.hpp"
#include "planner/scheduling/BusyInterval.hpp"

namespace planner {
namespace data {
class CalendarStore;
}

namespace scheduling {

constexpr int kMaxLabelTitleLength = 140;

enum class CalendarOpKind
{
    Created,
    Updated,
    Deleted,
};

struct CalendarOp
{
    CalendarOpKind kind = CalendarOpKind::Created;
    qint64 taskId = 0;
    qint64 entryId = 0;
    QDateTime startTime;
    QString label;
};

// "event_created", "event_updated" or "event_deleted".
QString calendarOpKindToString(CalendarOpKind kind);

// "Task#<id> (<duration>m): <title>" with the title whitespace-normalized and
// cut to 140 characters, and the duration clamped to [5, 240].
QString formatEntryLabel(qint64 taskId, const QString &title, int durationMinutes);
QString taskLabelPrefix(qint64 taskId);
// The taskId field, else the id of a leading "Task#<id> " in the label.
std::optional<qint64> owningTaskId(const data::CalendarEntry &entry);
// Drops a leading "Task#<id> " so a manual entry cannot pass for a task's.
QString stripTaskLabelPrefix(const QString &label);

// Mirrors a task's scheduled time into at most one calendar entry.
class TaskCalendarSync
{
public:
    explicit TaskCalendarSync(data::CalendarStore &store);

    // Creates, updates or deletes the owned entry so it matches the task.
    std::vector<CalendarOp> sync(const data::Task &task, int durationMinutes = kDefaultDurationMinutes);
    // Removes every entry owned by the task, used when the task is deleted.
    std::vector<CalendarOp> detach(qint64 taskId);

    // Entries linked through the taskId field, plus unlinked legacy entries
    // whose label starts with "Task#<id> ". Ascending by id.
    std::vector<data::CalendarEntry> ownedEntries(qint64 taskId) const;

private:
    void removeOwned(qint64 taskId, const data::CalendarEntry &entry, std::vector<CalendarOp> &ops);

    data::CalendarStore &m_store;
};

} // namespace scheduling
} // namespace planner
