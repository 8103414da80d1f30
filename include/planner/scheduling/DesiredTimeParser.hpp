#pragma once

#include <optional>

#include <QDateTime>
#include <QString>

namespace planner {
namespace scheduling {

// Turns a caller's desired-time text into an instant. Recognizes ISO-8601,
// "in N minutes", "in N hours", "tomorrow" (09:00), "today ... evening"
// (18:00) and "H[:MM] am|pm" (today). Anything else, including an empty
// string or "unscheduled", means no desired time.
std::optional<QDateTime> parseDesiredTime(const QString &text, const QDateTime &now);

} // namespace scheduling
} // namespace planner
