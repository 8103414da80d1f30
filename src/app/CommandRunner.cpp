#include "planner/app/CommandRunner.hpp"

#include "planner/core/AppContext.hpp"
#include "planner/core/JsonFormat.hpp"
#include "planner/core/PlannerService.hpp"
#include "planner/data/CalendarStore.hpp"
#include "planner/data/TaskStore.hpp"
#include "planner/scheduling/BusyInterval.hpp"
#include "planner/scheduling/DesiredTimeParser.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QTextStream>

namespace planner {
namespace app {

namespace {

const QString COMMAND_SUMMARY = QStringLiteral(
    "Commands:\n"
    "  resolve [--at TIME] [--duration N] [--nap]      pick a collision-free start\n"
    "  suggest [--at TIME] [--offsets LIST] [--nap]    staggered candidate starts\n"
    "  add-task TITLE [--at TIME] [--auto]             create a task\n"
    "  plan TITLE... [--at ANCHOR]                     schedule several tasks at once\n"
    "  update-task ID [--title T] [--at TIME] ...      edit a task\n"
    "  delete-task ID                                  delete a task\n"
    "  tasks | events                                  list stored items\n"
    "  add-event LABEL --at TIME [--duration N]        add a manual calendar entry\n"
    "  delete-event ID                                 delete a calendar entry\n"
    "  mood LABEL [--score X]                          reprioritize the backlog\n");

} // namespace

CommandRunner::CommandRunner(QTextStream &out, QTextStream &err)
    : m_out(out)
    , m_err(err)
    , m_atOption(QStringLiteral("at"), QStringLiteral("Desired or base time (ISO-8601 or phrases like 'in 30 minutes')."),
                 QStringLiteral("time"))
    , m_durationOption(QStringLiteral("duration"), QStringLiteral("Duration in minutes (5-240)."),
                       QStringLiteral("minutes"))
    , m_napOption(QStringLiteral("nap"), QStringLiteral("Keep the slot clear of meeting buffer zones."))
    , m_offsetsOption(QStringLiteral("offsets"), QStringLiteral("Comma separated offsets in minutes."),
                      QStringLiteral("list"))
    , m_priorityOption(QStringLiteral("priority"), QStringLiteral("low, medium or high."), QStringLiteral("priority"))
    , m_modeOption(QStringLiteral("mode"), QStringLiteral("work or personal."), QStringLiteral("mode"))
    , m_statusOption(QStringLiteral("status"), QStringLiteral("planned, in_progress or done."),
                     QStringLiteral("status"))
    , m_titleOption(QStringLiteral("title"), QStringLiteral("Task title."), QStringLiteral("title"))
    , m_autoOption(QStringLiteral("auto"), QStringLiteral("Resolve conflicts before storing the time."))
    , m_scoreOption(QStringLiteral("score"), QStringLiteral("Raw mood score."), QStringLiteral("score"))
    , m_dataOption(QStringLiteral("data"), QStringLiteral("Planner data file (.ics)."), QStringLiteral("file"))
    , m_verboseOption(QStringLiteral("verbose"), QStringLiteral("Enable debug logging."))
{
    m_parser.setApplicationDescription(QStringLiteral("Mood-aware task and calendar planner.\n\n") + COMMAND_SUMMARY);
    m_parser.addHelpOption();
    m_parser.addVersionOption();
    m_parser.addOptions({m_atOption, m_durationOption, m_napOption, m_offsetsOption, m_priorityOption, m_modeOption,
                         m_statusOption, m_titleOption, m_autoOption, m_scoreOption, m_dataOption, m_verboseOption});
    m_parser.addPositionalArgument(QStringLiteral("command"), QStringLiteral("Command to run."));
    m_parser.addPositionalArgument(QStringLiteral("args"), QStringLiteral("Command arguments."),
                                   QStringLiteral("[args...]"));
}

int CommandRunner::run(const QStringList &arguments, core::SchedulerSettings settings)
{
    if (!m_parser.parse(arguments)) {
        return usageError(m_parser.errorText());
    }
    if (m_parser.isSet(QStringLiteral("help"))) {
        m_out << m_parser.helpText();
        m_out.flush();
        return ExitOk;
    }
    if (m_parser.isSet(QStringLiteral("version"))) {
        m_out << QCoreApplication::applicationName() << ' ' << QCoreApplication::applicationVersion() << '\n';
        m_out.flush();
        return ExitOk;
    }
    if (m_parser.isSet(m_verboseOption)) {
        QLoggingCategory::setFilterRules(QStringLiteral("planner.*.debug=true"));
    }

    QStringList positional = m_parser.positionalArguments();
    if (positional.isEmpty()) {
        return usageError(QStringLiteral("No command given."));
    }
    const QString command = positional.takeFirst();

    if (m_parser.isSet(m_dataOption)) {
        settings.dataFile = m_parser.value(m_dataOption);
    }
    core::AppContext context(std::move(settings));

    if (command == QLatin1String("resolve")) {
        return resolve(context);
    }
    if (command == QLatin1String("suggest")) {
        return suggest(context);
    }
    if (command == QLatin1String("add-task")) {
        return addTask(context, positional);
    }
    if (command == QLatin1String("plan")) {
        return plan(context, positional);
    }
    if (command == QLatin1String("update-task")) {
        return updateTask(context, positional);
    }
    if (command == QLatin1String("delete-task")) {
        return deleteTask(context, positional);
    }
    if (command == QLatin1String("tasks")) {
        return listTasks(context);
    }
    if (command == QLatin1String("events")) {
        return listEvents(context);
    }
    if (command == QLatin1String("add-event")) {
        return addEvent(context, positional);
    }
    if (command == QLatin1String("delete-event")) {
        return deleteEvent(context, positional);
    }
    if (command == QLatin1String("mood")) {
        return mood(context, positional);
    }
    return usageError(QStringLiteral("Unknown command '%1'.").arg(command));
}

int CommandRunner::resolve(core::AppContext &context)
{
    const QString title = m_parser.value(m_titleOption);
    const bool avoidNaps = m_parser.isSet(m_napOption) || scheduling::isLowIntensityTitle(title);
    int duration = 0;
    if (!readDuration(context.planner().durationFor(title, 0), duration)) {
        return ExitUsage;
    }
    const auto resolution = context.planner().resolveSchedule(m_parser.value(m_atOption), duration, avoidNaps);
    print(core::toJson(resolution));
    return ExitOk;
}

int CommandRunner::suggest(core::AppContext &context)
{
    const QString title = m_parser.value(m_titleOption);
    const bool avoidNaps = m_parser.isSet(m_napOption) || scheduling::isLowIntensityTitle(title);
    int duration = 0;
    if (!readDuration(context.planner().durationFor(title, 0), duration)) {
        return ExitUsage;
    }

    std::vector<int> offsets;
    if (m_parser.isSet(m_offsetsOption)) {
        for (const QString &part : m_parser.value(m_offsetsOption).split(',', Qt::SkipEmptyParts)) {
            bool ok = false;
            const int offset = part.trimmed().toInt(&ok);
            if (!ok) {
                return usageError(QStringLiteral("Invalid offset '%1'.").arg(part));
            }
            offsets.push_back(offset);
        }
    }

    QDateTime base;
    if (m_parser.isSet(m_atOption)) {
        const auto parsed = scheduling::parseDesiredTime(m_parser.value(m_atOption), QDateTime::currentDateTime());
        if (!parsed) {
            return usageError(QStringLiteral("Cannot parse base time '%1'.").arg(m_parser.value(m_atOption)));
        }
        base = *parsed;
    }
    print(core::toJsonArray(context.planner().suggestSlots(base, offsets, duration, avoidNaps)));
    return ExitOk;
}

int CommandRunner::addTask(core::AppContext &context, const QStringList &args)
{
    const QString title = args.join(QLatin1Char(' ')).simplified();
    if (title.isEmpty()) {
        return usageError(QStringLiteral("add-task needs a title."));
    }
    core::TaskDraft draft;
    draft.title = title;
    draft.desiredTimeText = m_parser.value(m_atOption);
    draft.autoSchedule = m_parser.isSet(m_autoOption);
    draft.userPriority = data::priorityFromString(m_parser.value(m_priorityOption));
    draft.mode = data::modeFromString(m_parser.value(m_modeOption));
    if (!readDuration(0, draft.durationMinutes)) {
        return ExitUsage;
    }
    print(core::toJson(context.planner().createTask(draft)));
    return ExitOk;
}

int CommandRunner::plan(core::AppContext &context, const QStringList &args)
{
    if (args.isEmpty()) {
        return usageError(QStringLiteral("plan needs at least one title."));
    }
    std::vector<core::TaskDraft> drafts;
    for (const QString &title : args) {
        core::TaskDraft draft;
        draft.title = title;
        draft.userPriority = data::priorityFromString(m_parser.value(m_priorityOption));
        draft.mode = data::modeFromString(m_parser.value(m_modeOption));
        drafts.push_back(draft);
    }
    print(core::toJsonArray(context.planner().scheduleBatch(drafts, m_parser.value(m_atOption))));
    return ExitOk;
}

int CommandRunner::updateTask(core::AppContext &context, const QStringList &args)
{
    qint64 id = 0;
    if (!readId(args, id)) {
        return ExitUsage;
    }
    core::TaskPatch patch;
    if (m_parser.isSet(m_titleOption)) {
        patch.title = m_parser.value(m_titleOption);
    }
    if (m_parser.isSet(m_priorityOption)) {
        patch.userPriority = data::priorityFromString(m_parser.value(m_priorityOption));
    }
    if (m_parser.isSet(m_statusOption)) {
        patch.status = data::statusFromString(m_parser.value(m_statusOption));
    }
    if (m_parser.isSet(m_atOption)) {
        patch.scheduledTimeText = m_parser.value(m_atOption);
    }
    if (m_parser.isSet(m_durationOption)) {
        int duration = 0;
        if (!readDuration(0, duration)) {
            return ExitUsage;
        }
        patch.durationMinutes = duration;
    }
    patch.resolveConflicts = m_parser.isSet(m_autoOption);

    const auto update = context.planner().updateTask(id, patch);
    if (!update) {
        m_err << "Task " << id << " not found\n";
        m_err.flush();
        return ExitNotFound;
    }
    print(core::toJson(*update));
    return ExitOk;
}

int CommandRunner::deleteTask(core::AppContext &context, const QStringList &args)
{
    qint64 id = 0;
    if (!readId(args, id)) {
        return ExitUsage;
    }
    const auto ops = context.planner().deleteTask(id);
    if (!ops) {
        m_err << "Task " << id << " not found\n";
        m_err.flush();
        return ExitNotFound;
    }
    QJsonObject result;
    result.insert(QStringLiteral("status"), QStringLiteral("deleted"));
    result.insert(QStringLiteral("calendar_ops"), core::toJsonArray(*ops));
    print(result);
    return ExitOk;
}

int CommandRunner::listTasks(core::AppContext &context)
{
    print(core::toJsonArray(context.taskStore().fetchTasks()));
    return ExitOk;
}

int CommandRunner::listEvents(core::AppContext &context)
{
    print(core::toJsonArray(context.calendarStore().fetchEntries()));
    return ExitOk;
}

int CommandRunner::addEvent(core::AppContext &context, const QStringList &args)
{
    const QString label = args.join(QLatin1Char(' ')).simplified();
    if (label.isEmpty()) {
        return usageError(QStringLiteral("add-event needs a label."));
    }
    const auto start = scheduling::parseDesiredTime(m_parser.value(m_atOption), QDateTime::currentDateTime());
    if (!start) {
        return usageError(QStringLiteral("add-event needs a valid --at time."));
    }
    int duration = 0;
    if (!readDuration(0, duration)) {
        return ExitUsage;
    }
    print(core::toJson(context.planner().addCalendarEntry(label, *start, duration)));
    return ExitOk;
}

int CommandRunner::deleteEvent(core::AppContext &context, const QStringList &args)
{
    qint64 id = 0;
    if (!readId(args, id)) {
        return ExitUsage;
    }
    if (!context.planner().removeCalendarEntry(id)) {
        m_err << "Calendar entry " << id << " not found\n";
        m_err.flush();
        return ExitNotFound;
    }
    QJsonObject result;
    result.insert(QStringLiteral("status"), QStringLiteral("deleted"));
    print(result);
    return ExitOk;
}

int CommandRunner::mood(core::AppContext &context, const QStringList &args)
{
    if (args.isEmpty()) {
        return usageError(QStringLiteral("mood needs a label."));
    }
    scheduling::MoodSignal signal;
    signal.label = scheduling::moodFromString(args.first());
    signal.rawScore = m_parser.value(m_scoreOption).toDouble();
    const auto tasks = context.planner().applyMoodToBacklog(signal);

    QJsonObject result;
    result.insert(QStringLiteral("mood"), scheduling::moodToString(signal.label));
    result.insert(QStringLiteral("tasks"), core::toJsonArray(tasks));
    print(result);
    return ExitOk;
}

bool CommandRunner::readDuration(int fallback, int &duration)
{
    if (!m_parser.isSet(m_durationOption)) {
        duration = fallback;
        return true;
    }
    bool ok = false;
    const int value = m_parser.value(m_durationOption).toInt(&ok);
    if (!ok || value <= 0) {
        usageError(QStringLiteral("Invalid duration '%1'.").arg(m_parser.value(m_durationOption)));
        return false;
    }
    duration = scheduling::clampDuration(value);
    return true;
}

bool CommandRunner::readId(const QStringList &args, qint64 &id)
{
    bool ok = false;
    id = args.isEmpty() ? 0 : args.first().toLongLong(&ok);
    if (!ok || id <= 0) {
        usageError(QStringLiteral("Expected a numeric id."));
        return false;
    }
    return true;
}

void CommandRunner::print(const QJsonValue &value)
{
    const QJsonDocument document = value.isArray() ? QJsonDocument(value.toArray()) : QJsonDocument(value.toObject());
    m_out << document.toJson(QJsonDocument::Indented);
    m_out.flush();
}

int CommandRunner::usageError(const QString &message)
{
    m_err << message << '\n' << "Run with --help for usage.\n";
    m_err.flush();
    return ExitUsage;
}

} // namespace app
} // namespace planner
