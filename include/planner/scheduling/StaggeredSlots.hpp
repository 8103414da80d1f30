#pragma once

#include <cstddef>
#include <vector>

#include <QDateTime>

#include "planner/scheduling/BusyInterval.hpp"
#include "planner/scheduling/SlotFinder.hpp"

namespace planner {
namespace scheduling {

constexpr std::size_t kMaxStaggeredSlots = 5;

// One independent slot search per offset from base. Offsets are alternatives,
// not a sequence: results that land on the same free slot collapse into one.
// First-seen order is kept and at most kMaxStaggeredSlots are returned.
// Offsets whose search exhausts the horizon yield no suggestion.
std::vector<QDateTime> generateStaggeredSlots(const std::vector<BusyInterval> &busy,
                                              const QDateTime &base,
                                              const std::vector<int> &offsetsMinutes,
                                              const SlotSearchOptions &options);

} // namespace scheduling
} // namespace planner
