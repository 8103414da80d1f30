#include "planner/scheduling/BusyInterval.hpp"

#include <QRegularExpression>
#include <QStringList>

#include <algorithm>

namespace planner {
namespace scheduling {

namespace {

const QStringList &meetingKeywords()
{
    static const QStringList keywords = {
        QStringLiteral("meeting"),   QStringLiteral("call"), QStringLiteral("sync"),
        QStringLiteral("standup"),   QStringLiteral("interview"), QStringLiteral("demo"),
        QStringLiteral("appointment"), QStringLiteral("review"),
    };
    return keywords;
}

const QStringList &lowIntensityKeywords()
{
    static const QStringList keywords = {
        QStringLiteral("nap"),
        QStringLiteral("power nap"),
        QStringLiteral("sleep"),
        QStringLiteral("rest"),
    };
    return keywords;
}

bool containsAny(const QString &text, const QStringList &keywords)
{
    for (const QString &keyword : keywords) {
        if (text.contains(keyword, Qt::CaseInsensitive)) {
            return true;
        }
    }
    return false;
}

} // namespace

int clampDuration(int minutes)
{
    return qBound(kMinDurationMinutes, minutes, kMaxDurationMinutes);
}

int decodeDuration(const QString &label, int defaultMinutes)
{
    static const QRegularExpression tag(QStringLiteral("\\((\\d+)\\s*m\\)"),
                                        QRegularExpression::CaseInsensitiveOption);
    if (label.isEmpty()) {
        return defaultMinutes;
    }
    const QRegularExpressionMatch match = tag.match(label);
    if (!match.hasMatch()) {
        return defaultMinutes;
    }
    bool ok = false;
    const int minutes = match.captured(1).toInt(&ok);
    if (!ok) {
        return defaultMinutes;
    }
    return clampDuration(minutes);
}

int entryDurationMinutes(const data::CalendarEntry &entry)
{
    if (entry.durationMinutes > 0) {
        return clampDuration(entry.durationMinutes);
    }
    return decodeDuration(entry.label);
}

BusyInterval toBusyInterval(const data::CalendarEntry &entry)
{
    BusyInterval interval;
    interval.start = entry.start;
    interval.end = entry.start.addSecs(static_cast<qint64>(entryDurationMinutes(entry)) * 60);
    interval.label = entry.label;
    interval.taskId = entry.taskId;
    return interval;
}

bool overlaps(const BusyInterval &a, const BusyInterval &b)
{
    return a.end > b.start && a.start < b.end;
}

bool overlaps(const QDateTime &start, const QDateTime &end, const BusyInterval &interval)
{
    return end > interval.start && start < interval.end;
}

std::vector<BusyInterval> buildBusyIntervals(const std::vector<data::CalendarEntry> &entries)
{
    std::vector<BusyInterval> intervals;
    intervals.reserve(entries.size());
    for (const auto &entry : entries) {
        if (!entry.start.isValid()) {
            continue;
        }
        intervals.push_back(toBusyInterval(entry));
    }
    std::stable_sort(intervals.begin(), intervals.end(), [](const BusyInterval &lhs, const BusyInterval &rhs) {
        return lhs.start < rhs.start;
    });
    return intervals;
}

bool isMeetingLabel(const QString &label)
{
    return containsAny(label, meetingKeywords());
}

bool isLowIntensityTitle(const QString &title)
{
    return containsAny(title, lowIntensityKeywords());
}

} // namespace scheduling
} // namespace planner
