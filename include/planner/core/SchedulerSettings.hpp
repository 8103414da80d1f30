#pragma once

#include <cstddef>
#include <vector>

#include <QString>

#include "planner/scheduling/SlotFinder.hpp"

class QSettings;

namespace planner {
namespace core {

struct SchedulerSettings
{
    int blockMinutes = 15;
    int defaultDurationMinutes = 30;
    int lowIntensityDurationMinutes = 10;
    int meetingBufferMinutes = 20;
    int horizonHours = 12;
    int recentEntryLimit = 80;
    int batchStaggerMinutes = 15;
    std::vector<int> suggestionOffsets = {0, 30, 90, 180};
    QString dataFile; // empty selects the default location

    // Missing keys keep their defaults; out-of-range values are bounded.
    static SchedulerSettings load(const QSettings &settings);
    void save(QSettings &settings) const;

    scheduling::SlotSearchOptions searchOptions(int durationMinutes, bool avoidNaps) const;
};

} // namespace core
} // namespace planner
