#include "planner/scheduling/SlotFinder.hpp"

#include "planner/core/Logging.hpp"

#include <QTime>

namespace planner {
namespace scheduling {

namespace {

bool isExcluded(const BusyInterval &interval, const SlotSearchOptions &options)
{
    return options.excludeTaskId && interval.taskId && *interval.taskId == *options.excludeTaskId;
}

} // namespace

QDateTime roundUpToBlock(const QDateTime &time, int blockMinutes)
{
    if (!time.isValid()) {
        return time;
    }
    const int block = qMax(1, blockMinutes);
    QDateTime rounded = time;
    const QTime clock = time.time();
    rounded.setTime(QTime(clock.hour(), clock.minute()));
    if (clock.second() != 0 || clock.msec() != 0) {
        rounded = rounded.addSecs(60);
    }

    const QTime aligned = rounded.time();
    const int remainder = (aligned.hour() * 60 + aligned.minute()) % block;
    if (remainder == 0) {
        return rounded;
    }
    return rounded.addSecs(static_cast<qint64>(block - remainder) * 60);
}

std::optional<QDateTime> blockedUntil(const std::vector<BusyInterval> &busy,
                                      const QDateTime &start,
                                      const QDateTime &end,
                                      const SlotSearchOptions &options)
{
    for (const auto &interval : busy) {
        if (isExcluded(interval, options)) {
            continue;
        }
        if (overlaps(start, end, interval)) {
            return interval.end;
        }
    }

    if (!options.avoidNaps) {
        return std::nullopt;
    }

    const qint64 buffer = static_cast<qint64>(qMax(0, options.meetingBufferMinutes)) * 60;
    for (const auto &interval : busy) {
        if (isExcluded(interval, options) || !isMeetingLabel(interval.label)) {
            continue;
        }
        BusyInterval zone = interval;
        zone.start = interval.start.addSecs(-buffer);
        zone.end = interval.end.addSecs(buffer);
        if (overlaps(start, end, zone)) {
            return zone.end;
        }
    }
    return std::nullopt;
}

SlotResult findNextSlot(const std::vector<BusyInterval> &busy,
                        const QDateTime &after,
                        const SlotSearchOptions &options)
{
    const int block = qMax(1, options.blockMinutes);
    const qint64 duration = static_cast<qint64>(qMax(1, options.durationMinutes)) * 60;
    const QDateTime horizon = after.addSecs(static_cast<qint64>(qMax(1, options.horizonHours)) * 3600);

    QDateTime candidate = roundUpToBlock(after.addSecs(60), block);
    while (candidate < horizon) {
        const QDateTime end = candidate.addSecs(duration);
        const auto blocked = blockedUntil(busy, candidate, end, options);
        if (!blocked) {
            return {candidate, false};
        }
        // Landing exactly on the blocking end is legal under half-open
        // semantics, and it always lies past the current candidate.
        candidate = roundUpToBlock(*blocked, block);
    }

    SlotResult fallback{roundUpToBlock(horizon, block), true};
    qCWarning(lcScheduling) << "No free slot within" << options.horizonHours << "h after"
                            << after.toString(Qt::ISODate) << "- falling back to"
                            << fallback.start.toString(Qt::ISODate);
    return fallback;
}

} // namespace scheduling
} // namespace planner
