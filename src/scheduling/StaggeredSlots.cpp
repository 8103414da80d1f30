#include "planner/scheduling/StaggeredSlots.hpp"

#include "planner/core/Logging.hpp"

#include <algorithm>

namespace planner {
namespace scheduling {

std::vector<QDateTime> generateStaggeredSlots(const std::vector<BusyInterval> &busy,
                                              const QDateTime &base,
                                              const std::vector<int> &offsetsMinutes,
                                              const SlotSearchOptions &options)
{
    std::vector<QDateTime> slots;
    for (int offset : offsetsMinutes) {
        if (slots.size() >= kMaxStaggeredSlots) {
            break;
        }
        const SlotResult slot = findNextSlot(busy, base.addSecs(static_cast<qint64>(offset) * 60), options);
        if (slot.degraded) {
            qCDebug(lcScheduling) << "Dropping suggestion for offset" << offset << "- no free slot within horizon";
            continue;
        }
        if (std::find(slots.begin(), slots.end(), slot.start) == slots.end()) {
            slots.push_back(slot.start);
        }
    }
    return slots;
}

} // namespace scheduling
} // namespace planner
