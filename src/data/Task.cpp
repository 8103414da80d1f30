#include "planner/data/Task.hpp"

namespace planner {
namespace data {

namespace {
constexpr auto UNSCHEDULED = "unscheduled";
}

QString priorityToString(Priority priority)
{
    switch (priority) {
    case Priority::Low:
        return QStringLiteral("low");
    case Priority::High:
        return QStringLiteral("high");
    case Priority::Medium:
    default:
        return QStringLiteral("medium");
    }
}

Priority priorityFromString(const QString &value, Priority fallback)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("low")) {
        return Priority::Low;
    }
    if (normalized == QLatin1String("medium")) {
        return Priority::Medium;
    }
    if (normalized == QLatin1String("high")) {
        return Priority::High;
    }
    return fallback;
}

QString modeToString(TaskMode mode)
{
    return mode == TaskMode::Work ? QStringLiteral("work") : QStringLiteral("personal");
}

TaskMode modeFromString(const QString &value)
{
    return value.trimmed().compare(QLatin1String("work"), Qt::CaseInsensitive) == 0 ? TaskMode::Work
                                                                                     : TaskMode::Personal;
}

QString statusToString(TaskStatus status)
{
    switch (status) {
    case TaskStatus::InProgress:
        return QStringLiteral("in_progress");
    case TaskStatus::Done:
        return QStringLiteral("done");
    case TaskStatus::Planned:
    default:
        return QStringLiteral("planned");
    }
}

TaskStatus statusFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("done") || normalized == QLatin1String("completed")) {
        return TaskStatus::Done;
    }
    if (normalized == QLatin1String("in_progress") || normalized == QLatin1String("in-progress")) {
        return TaskStatus::InProgress;
    }
    return TaskStatus::Planned;
}

QString scheduledTimeToString(const QDateTime &time)
{
    if (!time.isValid()) {
        return QString::fromLatin1(UNSCHEDULED);
    }
    return time.toString(Qt::ISODate);
}

QDateTime scheduledTimeFromString(const QString &value)
{
    const QString trimmed = value.trimmed();
    if (trimmed.isEmpty() || trimmed == QLatin1String(UNSCHEDULED)) {
        return {};
    }
    return QDateTime::fromString(trimmed, Qt::ISODate);
}

} // namespace data
} // namespace planner
