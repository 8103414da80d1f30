#include "planner/core/SchedulerSettings.hpp"

#include <QSettings>
#include <QStringList>
#include <QVariant>

namespace planner {
namespace core {

namespace {

int boundedInt(const QSettings &settings, const QString &key, int fallback, int minimum, int maximum)
{
    bool ok = false;
    const int value = settings.value(key, fallback).toInt(&ok);
    if (!ok) {
        return fallback;
    }
    return qBound(minimum, value, maximum);
}

} // namespace

SchedulerSettings SchedulerSettings::load(const QSettings &settings)
{
    SchedulerSettings result;
    result.blockMinutes = boundedInt(settings, QStringLiteral("scheduler/blockMinutes"), result.blockMinutes, 1, 120);
    result.defaultDurationMinutes = boundedInt(settings, QStringLiteral("scheduler/defaultDurationMinutes"),
                                               result.defaultDurationMinutes, 5, 240);
    result.lowIntensityDurationMinutes = boundedInt(settings, QStringLiteral("scheduler/lowIntensityDurationMinutes"),
                                                    result.lowIntensityDurationMinutes, 5, 240);
    result.meetingBufferMinutes = boundedInt(settings, QStringLiteral("scheduler/meetingBufferMinutes"),
                                             result.meetingBufferMinutes, 0, 240);
    result.horizonHours = boundedInt(settings, QStringLiteral("scheduler/horizonHours"), result.horizonHours, 1, 168);
    result.recentEntryLimit = boundedInt(settings, QStringLiteral("scheduler/recentEntryLimit"),
                                         result.recentEntryLimit, 1, 10000);
    result.batchStaggerMinutes = boundedInt(settings, QStringLiteral("scheduler/batchStaggerMinutes"),
                                            result.batchStaggerMinutes, 0, 240);

    const QVariant offsets = settings.value(QStringLiteral("scheduler/suggestionOffsets"));
    if (offsets.isValid()) {
        std::vector<int> parsed;
        for (const QString &entry : offsets.toStringList()) {
            bool ok = false;
            const int offset = entry.trimmed().toInt(&ok);
            if (ok) {
                parsed.push_back(offset);
            }
        }
        if (!parsed.empty()) {
            result.suggestionOffsets = std::move(parsed);
        }
    }

    result.dataFile = settings.value(QStringLiteral("storage/dataFile")).toString();
    return result;
}

void SchedulerSettings::save(QSettings &settings) const
{
    settings.setValue(QStringLiteral("scheduler/blockMinutes"), blockMinutes);
    settings.setValue(QStringLiteral("scheduler/defaultDurationMinutes"), defaultDurationMinutes);
    settings.setValue(QStringLiteral("scheduler/lowIntensityDurationMinutes"), lowIntensityDurationMinutes);
    settings.setValue(QStringLiteral("scheduler/meetingBufferMinutes"), meetingBufferMinutes);
    settings.setValue(QStringLiteral("scheduler/horizonHours"), horizonHours);
    settings.setValue(QStringLiteral("scheduler/recentEntryLimit"), recentEntryLimit);
    settings.setValue(QStringLiteral("scheduler/batchStaggerMinutes"), batchStaggerMinutes);
    QStringList serialized;
    for (int offset : suggestionOffsets) {
        serialized << QString::number(offset);
    }
    settings.setValue(QStringLiteral("scheduler/suggestionOffsets"), serialized);
    settings.setValue(QStringLiteral("storage/dataFile"), dataFile);
}

scheduling::SlotSearchOptions SchedulerSettings::searchOptions(int durationMinutes, bool avoidNaps) const
{
    scheduling::SlotSearchOptions options;
    options.blockMinutes = blockMinutes;
    options.durationMinutes = durationMinutes;
    options.meetingBufferMinutes = meetingBufferMinutes;
    options.avoidNaps = avoidNaps;
    options.horizonHours = horizonHours;
    return options;
}

} // namespace core
} // namespace planner
