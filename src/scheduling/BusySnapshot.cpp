#include "planner/scheduling/BusySnapshot.hpp"

#include <algorithm>

namespace planner {
namespace scheduling {

BusySnapshot::BusySnapshot(const std::vector<data::CalendarEntry> &entries)
    : m_intervals(buildBusyIntervals(entries))
{
}

const std::vector<BusyInterval> &BusySnapshot::intervals() const
{
    return m_intervals;
}

std::size_t BusySnapshot::size() const
{
    return m_intervals.size();
}

void BusySnapshot::reserve(const QDateTime &start,
                           int durationMinutes,
                           const QString &label,
                           std::optional<qint64> taskId)
{
    if (!start.isValid()) {
        return;
    }
    BusyInterval interval;
    interval.start = start;
    interval.end = start.addSecs(static_cast<qint64>(clampDuration(durationMinutes)) * 60);
    interval.label = label;
    interval.taskId = taskId;

    const auto position = std::upper_bound(m_intervals.begin(), m_intervals.end(), interval,
                                           [](const BusyInterval &lhs, const BusyInterval &rhs) {
                                               return lhs.start < rhs.start;
                                           });
    m_intervals.insert(position, std::move(interval));
}

} // namespace scheduling
} // namespace planner
