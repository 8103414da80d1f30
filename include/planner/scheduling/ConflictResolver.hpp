#pragma once

#include <optional>
#include <vector>

#include <QDateTime>

#include "planner/scheduling/BusyInterval.hpp"
#include "planner/scheduling/SlotFinder.hpp"

namespace planner {
namespace scheduling {

struct Resolution
{
    QDateTime time;        // whole minutes, never sub-minute precision
    bool changed = false;  // differs from the request, or no request was given
    bool degraded = false; // produced by a horizon fallback
};

QDateTime truncateToMinute(const QDateTime &time);

// Keeps a collision-free desired time, otherwise shifts it forward to the
// next free slot. Without a desired time the search starts at now.
Resolution resolveConflict(const std::optional<QDateTime> &desired,
                           const std::vector<BusyInterval> &busy,
                           const SlotSearchOptions &options,
                           const QDateTime &now);

} // namespace scheduling
} // namespace planner
