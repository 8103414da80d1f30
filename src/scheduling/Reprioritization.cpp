#include "planner/scheduling/Reprioritization.hpp"

namespace planner {
namespace scheduling {

namespace {

bool isLowEnergy(MoodLabel mood)
{
    return mood == MoodLabel::Tired || mood == MoodLabel::Anxious || mood == MoodLabel::Overwhelmed;
}

bool isFocused(MoodLabel mood)
{
    return mood == MoodLabel::Focused || mood == MoodLabel::Motivated;
}

} // namespace

QString moodToString(MoodLabel mood)
{
    switch (mood) {
    case MoodLabel::Tired:
        return QStringLiteral("tired");
    case MoodLabel::Anxious:
        return QStringLiteral("anxious");
    case MoodLabel::Overwhelmed:
        return QStringLiteral("overwhelmed");
    case MoodLabel::Focused:
        return QStringLiteral("focused");
    case MoodLabel::Motivated:
        return QStringLiteral("motivated");
    case MoodLabel::Happy:
        return QStringLiteral("happy");
    case MoodLabel::Sad:
        return QStringLiteral("sad");
    case MoodLabel::Stressed:
        return QStringLiteral("stressed");
    case MoodLabel::Neutral:
    default:
        return QStringLiteral("neutral");
    }
}

MoodLabel moodFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    for (MoodLabel mood : {MoodLabel::Tired, MoodLabel::Anxious, MoodLabel::Overwhelmed, MoodLabel::Focused,
                           MoodLabel::Motivated, MoodLabel::Happy, MoodLabel::Sad, MoodLabel::Stressed}) {
        if (normalized == moodToString(mood)) {
            return mood;
        }
    }
    return MoodLabel::Neutral;
}

data::Priority reprioritize(const data::Task &task, const MoodSignal &signal)
{
    if (isLowEnergy(signal.label)) {
        return data::Priority::Low;
    }
    if (isFocused(signal.label)) {
        return data::Priority::High;
    }
    return task.userPriority;
}

QString priorityReasonFor(const MoodSignal &signal)
{
    if (isLowEnergy(signal.label)) {
        return QStringLiteral("low energy mood");
    }
    if (isFocused(signal.label)) {
        return QStringLiteral("focus window");
    }
    return {};
}

std::vector<data::Task> applyMoodToBacklog(const MoodSignal &signal, std::vector<data::Task> tasks)
{
    const QString reason = priorityReasonFor(signal);
    for (auto &task : tasks) {
        task.effectivePriority = reprioritize(task, signal);
        task.priorityReason = reason;
    }
    return tasks;
}

} // namespace scheduling
} // namespace planner
