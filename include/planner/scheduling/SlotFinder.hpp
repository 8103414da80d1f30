#pragma once

#include <optional>
#include <vector>

#include <QDateTime>

#include "planner/scheduling/BusyInterval.hpp"

namespace planner {
namespace scheduling {

struct SlotSearchOptions
{
    int blockMinutes = 15;
    int durationMinutes = kDefaultDurationMinutes;
    int meetingBufferMinutes = 20; // only applied when avoidNaps is set
    bool avoidNaps = false;
    int horizonHours = 12;
    // Intervals owned by this task are ignored, so a task never collides
    // with its own reservation.
    std::optional<qint64> excludeTaskId;
};

struct SlotResult
{
    QDateTime start;
    bool degraded = false; // horizon exhausted, start may still collide
};

// Moves forward to the next whole minute that is a multiple of blockMinutes
// within the day. Never moves backward; aligned times are returned unchanged.
QDateTime roundUpToBlock(const QDateTime &time, int blockMinutes);

// Returns the point past which [start, end) must move to clear the first
// blocking interval (busy intervals first, then meeting buffers), or nullopt
// when the span is free.
std::optional<QDateTime> blockedUntil(const std::vector<BusyInterval> &busy,
                                      const QDateTime &start,
                                      const QDateTime &end,
                                      const SlotSearchOptions &options);

// First-fit forward scan from after + 1 minute. Never fails: on horizon
// exhaustion the rounded horizon is returned with degraded set.
SlotResult findNextSlot(const std::vector<BusyInterval> &busy,
                        const QDateTime &after,
                        const SlotSearchOptions &options = SlotSearchOptions());

} // namespace scheduling
} // namespace planner
