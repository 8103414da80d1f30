#include "planner/core/JsonFormat.hpp"

#include "planner/core/PlannerService.hpp"
#include "planner/scheduling/BusyInterval.hpp"

namespace planner {
namespace core {

QJsonObject toJson(const data::Task &task)
{
    QJsonObject object;
    object.insert(QStringLiteral("id"), task.id);
    object.insert(QStringLiteral("title"), task.title);
    object.insert(QStringLiteral("mode"), data::modeToString(task.mode));
    object.insert(QStringLiteral("user_priority"), data::priorityToString(task.userPriority));
    object.insert(QStringLiteral("effective_priority"), data::priorityToString(task.effectivePriority));
    if (!task.priorityReason.isEmpty()) {
        object.insert(QStringLiteral("priority_reason"), task.priorityReason);
    }
    object.insert(QStringLiteral("scheduled_time"), data::scheduledTimeToString(task.scheduledTime));
    object.insert(QStringLiteral("status"), data::statusToString(task.status));
    if (task.createdAt.isValid()) {
        object.insert(QStringLiteral("created_at"), task.createdAt.toString(Qt::ISODate));
    }
    return object;
}

QJsonObject toJson(const data::CalendarEntry &entry)
{
    QJsonObject object;
    object.insert(QStringLiteral("id"), entry.id);
    object.insert(QStringLiteral("label"), entry.label);
    object.insert(QStringLiteral("start_time"), entry.start.toString(Qt::ISODate));
    object.insert(QStringLiteral("duration_min"), scheduling::entryDurationMinutes(entry));
    if (entry.taskId) {
        object.insert(QStringLiteral("task_id"), *entry.taskId);
    }
    if (entry.createdAt.isValid()) {
        object.insert(QStringLiteral("created_at"), entry.createdAt.toString(Qt::ISODate));
    }
    return object;
}

QJsonObject toJson(const scheduling::CalendarOp &op)
{
    QJsonObject object;
    object.insert(QStringLiteral("op"), scheduling::calendarOpKindToString(op.kind));
    object.insert(QStringLiteral("task_id"), op.taskId);
    object.insert(QStringLiteral("event_id"), op.entryId);
    object.insert(QStringLiteral("start_time"), op.startTime.toString(Qt::ISODate));
    object.insert(QStringLiteral("label"), op.label);
    return object;
}

QJsonObject toJson(const scheduling::Resolution &resolution)
{
    QJsonObject object;
    object.insert(QStringLiteral("final_time"), data::scheduledTimeToString(resolution.time));
    object.insert(QStringLiteral("changed"), resolution.changed);
    if (resolution.degraded) {
        object.insert(QStringLiteral("degraded"), true);
    }
    return object;
}

QJsonObject toJson(const TaskPlacement &placement)
{
    QJsonObject object;
    object.insert(QStringLiteral("task"), toJson(placement.task));
    object.insert(QStringLiteral("duration_min"), placement.durationMinutes);
    object.insert(QStringLiteral("rescheduled"), placement.rescheduled);
    if (placement.degraded) {
        object.insert(QStringLiteral("degraded"), true);
    }
    object.insert(QStringLiteral("calendar_ops"), toJsonArray(placement.calendarOps));
    return object;
}

QJsonObject toJson(const TaskUpdate &update)
{
    QJsonObject object;
    object.insert(QStringLiteral("task"), toJson(update.task));
    object.insert(QStringLiteral("rescheduled"), update.rescheduled);
    object.insert(QStringLiteral("calendar_ops"), toJsonArray(update.calendarOps));
    return object;
}

QJsonArray toJsonArray(const std::vector<QDateTime> &times)
{
    QJsonArray array;
    for (const auto &time : times) {
        array.append(time.toString(Qt::ISODate));
    }
    return array;
}

} // namespace core
} // namespace planner
