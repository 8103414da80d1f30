#pragma once

#include <QDateTime>
#include <QString>
#include <QtGlobal>

namespace planner {
namespace data {

enum class Priority
{
    Low,
    Medium,
    High,
};

enum class TaskMode
{
    Work,
    Personal,
};

enum class TaskStatus
{
    Planned,
    InProgress,
    Done,
};

struct Task
{
    qint64 id = 0;
    QString title;
    TaskMode mode = TaskMode::Personal;
    Priority userPriority = Priority::Medium;
    Priority effectivePriority = Priority::Medium;
    QString priorityReason;
    QDateTime scheduledTime; // invalid means unscheduled
    TaskStatus status = TaskStatus::Planned;
    QDateTime createdAt;

    bool isScheduled() const { return scheduledTime.isValid(); }
};

QString priorityToString(Priority priority);
Priority priorityFromString(const QString &value, Priority fallback = Priority::Medium);

QString modeToString(TaskMode mode);
TaskMode modeFromString(const QString &value);

QString statusToString(TaskStatus status);
TaskStatus statusFromString(const QString &value);

// "unscheduled" or an ISO-8601 instant.
QString scheduledTimeToString(const QDateTime &time);
QDateTime scheduledTimeFromString(const QString &value);

} // namespace data
} // namespace planner
