#include "planner/scheduling/TaskCalendarSync.hpp"

#include "planner/core/Logging.hpp"
#include "planner/data/CalendarStore.hpp"

#include <QRegularExpression>

#include <algorithm>

namespace planner {
namespace scheduling {

QString calendarOpKindToString(CalendarOpKind kind)
{
    switch (kind) {
    case CalendarOpKind::Updated:
        return QStringLiteral("event_updated");
    case CalendarOpKind::Deleted:
        return QStringLiteral("event_deleted");
    case CalendarOpKind::Created:
    default:
        return QStringLiteral("event_created");
    }
}

QString taskLabelPrefix(qint64 taskId)
{
    return QStringLiteral("Task#%1 ").arg(taskId);
}

namespace {

const QRegularExpression &taskPrefixPattern()
{
    static const QRegularExpression pattern(QStringLiteral("^Task#(\\d+) "));
    return pattern;
}

} // namespace

std::optional<qint64> owningTaskId(const data::CalendarEntry &entry)
{
    if (entry.taskId) {
        return entry.taskId;
    }
    const QRegularExpressionMatch match = taskPrefixPattern().match(entry.label);
    if (!match.hasMatch()) {
        return std::nullopt;
    }
    bool ok = false;
    const qint64 id = match.captured(1).toLongLong(&ok);
    return ok ? std::optional<qint64>(id) : std::nullopt;
}

QString stripTaskLabelPrefix(const QString &label)
{
    QString stripped = label;
    while (taskPrefixPattern().match(stripped).hasMatch()) {
        stripped.remove(taskPrefixPattern());
    }
    return stripped;
}

QString formatEntryLabel(qint64 taskId, const QString &title, int durationMinutes)
{
    const QString safeTitle = title.simplified().left(kMaxLabelTitleLength);
    return QStringLiteral("Task#%1 (%2m): %3").arg(taskId).arg(clampDuration(durationMinutes)).arg(safeTitle);
}

TaskCalendarSync::TaskCalendarSync(data::CalendarStore &store)
    : m_store(store)
{
}

std::vector<data::CalendarEntry> TaskCalendarSync::ownedEntries(qint64 taskId) const
{
    std::vector<data::CalendarEntry> owned = m_store.findByTaskId(taskId);
    const QString prefix = taskLabelPrefix(taskId);
    for (const auto &entry : m_store.fetchEntries()) {
        if (!entry.taskId && entry.label.startsWith(prefix)) {
            owned.push_back(entry);
        }
    }
    std::sort(owned.begin(), owned.end(), [](const data::CalendarEntry &lhs, const data::CalendarEntry &rhs) {
        return lhs.id < rhs.id;
    });
    return owned;
}

std::vector<CalendarOp> TaskCalendarSync::sync(const data::Task &task, int durationMinutes)
{
    std::vector<CalendarOp> ops;
    std::vector<data::CalendarEntry> owned = ownedEntries(task.id);

    if (!task.isScheduled()) {
        for (const auto &entry : owned) {
            removeOwned(task.id, entry, ops);
        }
        return ops;
    }

    const int duration = clampDuration(durationMinutes);
    const QString label = formatEntryLabel(task.id, task.title, duration);

    bool mirrored = false;
    if (!owned.empty()) {
        data::CalendarEntry primary = owned.front();
        const bool unchanged = primary.start == task.scheduledTime && primary.label == label
            && primary.durationMinutes == duration && primary.taskId == task.id;
        if (unchanged) {
            mirrored = true;
        } else {
            primary.start = task.scheduledTime;
            primary.label = label;
            primary.durationMinutes = duration;
            primary.taskId = task.id;
            if (m_store.updateEntry(primary)) {
                ops.push_back({CalendarOpKind::Updated, task.id, primary.id, primary.start, primary.label});
                mirrored = true;
            } else {
                qCWarning(lcSync) << "Entry" << primary.id << "of task" << task.id << "vanished, recreating";
            }
        }
        // At most one entry per task: surplus entries are corruption.
        for (auto it = owned.begin() + 1; it != owned.end(); ++it) {
            qCWarning(lcSync) << "Removing duplicate entry" << it->id << "of task" << task.id;
            removeOwned(task.id, *it, ops);
        }
    }

    if (!mirrored) {
        data::CalendarEntry entry;
        entry.label = label;
        entry.start = task.scheduledTime;
        entry.taskId = task.id;
        entry.durationMinutes = duration;
        const data::CalendarEntry stored = m_store.addEntry(std::move(entry));
        ops.push_back({CalendarOpKind::Created, task.id, stored.id, stored.start, stored.label});
    }

    qCDebug(lcSync) << "Synchronized task" << task.id << "with" << ops.size() << "calendar operation(s)";
    return ops;
}

std::vector<CalendarOp> TaskCalendarSync::detach(qint64 taskId)
{
    std::vector<CalendarOp> ops;
    for (const auto &entry : ownedEntries(taskId)) {
        removeOwned(taskId, entry, ops);
    }
    return ops;
}

void TaskCalendarSync::removeOwned(qint64 taskId, const data::CalendarEntry &entry, std::vector<CalendarOp> &ops)
{
    if (!m_store.removeEntry(entry.id)) {
        qCDebug(lcSync) << "Entry" << entry.id << "already gone";
        return;
    }
    ops.push_back({CalendarOpKind::Deleted, taskId, entry.id, entry.start, entry.label});
}

} // namespace scheduling
} // namespace planner
