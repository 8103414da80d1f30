#pragma once

#include <optional>

#include <QDateTime>
#include <QString>
#include <QtGlobal>

namespace planner {
namespace data {

struct CalendarEntry
{
    qint64 id = 0;
    QString label;
    QDateTime start;
    QDateTime createdAt;
    std::optional<qint64> taskId; // owning task, empty for manual entries
    int durationMinutes = 0;      // 0 when only the label tag carries it
};

} // namespace data
} // namespace planner
