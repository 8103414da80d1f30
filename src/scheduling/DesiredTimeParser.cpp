#include "planner/scheduling/DesiredTimeParser.hpp"

#include <QRegularExpression>
#include <QTime>

namespace planner {
namespace scheduling {

namespace {

QDateTime atTime(const QDateTime &day, int hour, int minute)
{
    QDateTime result = day;
    result.setTime(QTime(hour, minute));
    return result;
}

std::optional<QDateTime> parseIso(const QString &text)
{
    QDateTime dt = QDateTime::fromString(text, Qt::ISODate);
    if (!dt.isValid()) {
        dt = QDateTime::fromString(text, QStringLiteral("yyyy-MM-dd HH:mm"));
    }
    if (!dt.isValid()) {
        return std::nullopt;
    }
    return dt;
}

} // namespace

std::optional<QDateTime> parseDesiredTime(const QString &text, const QDateTime &now)
{
    const QString trimmed = text.trimmed();
    if (trimmed.isEmpty() || trimmed.compare(QLatin1String("unscheduled"), Qt::CaseInsensitive) == 0) {
        return std::nullopt;
    }

    if (const auto iso = parseIso(trimmed)) {
        return iso;
    }

    const QString lowered = trimmed.toLower();

    static const QRegularExpression inMinutes(QStringLiteral("in\\s+(\\d+)\\s+minute"));
    static const QRegularExpression inHours(QStringLiteral("in\\s+(\\d+)\\s+hour"));
    static const QRegularExpression clockTime(QStringLiteral("(\\d{1,2})(?::(\\d{2}))?\\s*(am|pm)"));

    QRegularExpressionMatch match = inMinutes.match(lowered);
    if (match.hasMatch()) {
        bool ok = false;
        const int minutes = match.captured(1).toInt(&ok);
        return ok ? std::optional<QDateTime>(now.addSecs(static_cast<qint64>(minutes) * 60)) : std::nullopt;
    }

    match = inHours.match(lowered);
    if (match.hasMatch()) {
        bool ok = false;
        const int hours = match.captured(1).toInt(&ok);
        return ok ? std::optional<QDateTime>(now.addSecs(static_cast<qint64>(hours) * 3600)) : std::nullopt;
    }

    if (lowered.contains(QLatin1String("tomorrow"))) {
        return atTime(now.addDays(1), 9, 0);
    }

    if (lowered.contains(QLatin1String("today")) && lowered.contains(QLatin1String("evening"))) {
        return atTime(now, 18, 0);
    }

    match = clockTime.match(lowered);
    if (match.hasMatch()) {
        int hour = match.captured(1).toInt();
        const int minute = match.captured(2).isEmpty() ? 0 : match.captured(2).toInt();
        if (hour < 1 || hour > 12 || minute > 59) {
            return std::nullopt;
        }
        const bool pm = match.captured(3) == QLatin1String("pm");
        if (pm && hour < 12) {
            hour += 12;
        } else if (!pm && hour == 12) {
            hour = 0;
        }
        return atTime(now, hour, minute);
    }

    return std::nullopt;
}

} // namespace scheduling
} // namespace planner
