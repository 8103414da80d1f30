#pragma once

#include <vector>

#include <QString>

#include "planner/data/Task.hpp"

namespace planner {
namespace scheduling {

enum class MoodLabel
{
    Neutral,
    Tired,
    Anxious,
    Overwhelmed,
    Focused,
    Motivated,
    Happy,
    Sad,
    Stressed,
};

struct MoodSignal
{
    MoodLabel label = MoodLabel::Neutral;
    double rawScore = 0.0;
};

QString moodToString(MoodLabel mood);
// Unknown labels read as neutral.
MoodLabel moodFromString(const QString &value);

// tired, anxious, overwhelmed -> low; focused, motivated -> high; anything
// else resets to the task's own baseline.
data::Priority reprioritize(const data::Task &task, const MoodSignal &signal);
QString priorityReasonFor(const MoodSignal &signal);

// Recolors every task of the backlog. Idempotent for a given signal.
std::vector<data::Task> applyMoodToBacklog(const MoodSignal &signal, std::vector<data::Task> tasks);

} // namespace scheduling
} // namespace planner
