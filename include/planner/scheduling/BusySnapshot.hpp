#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "planner/scheduling/BusyInterval.hpp"

namespace planner {
namespace scheduling {

// Busy intervals read once for a whole request. Placements made during the
// request are reserved here so later placements in the same batch see them.
class BusySnapshot
{
public:
    BusySnapshot() = default;
    explicit BusySnapshot(const std::vector<data::CalendarEntry> &entries);

    const std::vector<BusyInterval> &intervals() const;
    std::size_t size() const;

    void reserve(const QDateTime &start,
                 int durationMinutes,
                 const QString &label,
                 std::optional<qint64> taskId = std::nullopt);

private:
    std::vector<BusyInterval> m_intervals;
};

} // namespace scheduling
} // namespace planner
