#pragma once

#include <optional>
#include <vector>

#include <QDateTime>
#include <QString>

#include "planner/data/CalendarEntry.hpp"

namespace planner {
namespace scheduling {

constexpr int kDefaultDurationMinutes = 30;
constexpr int kMinDurationMinutes = 5;
constexpr int kMaxDurationMinutes = 240;

// Half-open span [start, end) during which the user is already committed.
struct BusyInterval
{
    QDateTime start;
    QDateTime end;
    QString label;
    std::optional<qint64> taskId;
};

int clampDuration(int minutes);

// Reads a "(<N>m)" tag from an entry label. Missing or malformed tags yield
// defaultMinutes; parsed values are clamped to [5, 240].
int decodeDuration(const QString &label, int defaultMinutes = kDefaultDurationMinutes);

// Structured duration field first, label tag second.
int entryDurationMinutes(const data::CalendarEntry &entry);

BusyInterval toBusyInterval(const data::CalendarEntry &entry);

// Back-to-back spans do not overlap.
bool overlaps(const BusyInterval &a, const BusyInterval &b);
bool overlaps(const QDateTime &start, const QDateTime &end, const BusyInterval &interval);

// Skips entries without a valid start; stable sort by start.
std::vector<BusyInterval> buildBusyIntervals(const std::vector<data::CalendarEntry> &entries);

bool isMeetingLabel(const QString &label);
bool isLowIntensityTitle(const QString &title);

} // namespace scheduling
} // namespace planner
