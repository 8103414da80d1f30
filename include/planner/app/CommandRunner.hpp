#pragma once

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QStringList>

#include "planner/core/SchedulerSettings.hpp"

class QJsonValue;
class QTextStream;

namespace planner {
namespace core {
class AppContext;
}

namespace app {

enum ExitCode
{
    ExitOk = 0,
    ExitUsage = 1,
    ExitNotFound = 2,
};

// Parses a command line and runs one planner command against the data file.
// Results are printed as JSON on the output stream, diagnostics on the error
// stream.
class CommandRunner
{
public:
    CommandRunner(QTextStream &out, QTextStream &err);

    int run(const QStringList &arguments, core::SchedulerSettings settings);

private:
    int resolve(core::AppContext &context);
    int suggest(core::AppContext &context);
    int addTask(core::AppContext &context, const QStringList &args);
    int plan(core::AppContext &context, const QStringList &args);
    int updateTask(core::AppContext &context, const QStringList &args);
    int deleteTask(core::AppContext &context, const QStringList &args);
    int listTasks(core::AppContext &context);
    int listEvents(core::AppContext &context);
    int addEvent(core::AppContext &context, const QStringList &args);
    int deleteEvent(core::AppContext &context, const QStringList &args);
    int mood(core::AppContext &context, const QStringList &args);

    bool readDuration(int fallback, int &duration);
    bool readId(const QStringList &args, qint64 &id);
    void print(const QJsonValue &value);
    int usageError(const QString &message);

    QTextStream &m_out;
    QTextStream &m_err;
    QCommandLineParser m_parser;
    QCommandLineOption m_atOption;
    QCommandLineOption m_durationOption;
    QCommandLineOption m_napOption;
    QCommandLineOption m_offsetsOption;
    QCommandLineOption m_priorityOption;
    QCommandLineOption m_modeOption;
    QCommandLineOption m_statusOption;
    QCommandLineOption m_titleOption;
    QCommandLineOption m_autoOption;
    QCommandLineOption m_scoreOption;
    QCommandLineOption m_dataOption;
    QCommandLineOption m_verboseOption;
};

} // namespace app
} // namespace planner
