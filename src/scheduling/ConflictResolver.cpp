#include "planner/scheduling/ConflictResolver.hpp"

#include "planner/core/Logging.hpp"

#include <QTime>

namespace planner {
namespace scheduling {

QDateTime truncateToMinute(const QDateTime &time)
{
    if (!time.isValid()) {
        return time;
    }
    QDateTime truncated = time;
    truncated.setTime(QTime(time.time().hour(), time.time().minute()));
    return truncated;
}

Resolution resolveConflict(const std::optional<QDateTime> &desired,
                           const std::vector<BusyInterval> &busy,
                           const SlotSearchOptions &options,
                           const QDateTime &now)
{
    if (!desired || !desired->isValid()) {
        const SlotResult slot = findNextSlot(busy, now, options);
        return {slot.start, true, slot.degraded};
    }

    const QDateTime requested = truncateToMinute(*desired);
    const QDateTime end = requested.addSecs(static_cast<qint64>(qMax(1, options.durationMinutes)) * 60);
    if (!blockedUntil(busy, requested, end, options)) {
        return {requested, false, false};
    }

    const SlotResult slot = findNextSlot(busy, requested, options);
    qCDebug(lcScheduling) << "Shifted" << requested.toString(Qt::ISODate) << "to"
                          << slot.start.toString(Qt::ISODate);
    return {slot.start, true, slot.degraded};
}

} // namespace scheduling
} // namespace planner
