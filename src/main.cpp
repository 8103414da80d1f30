#include <QCoreApplication>
#include <QSettings>
#include <QString>
#include <QTextStream>

#include <cstdio>

#include "version.h"

#include "planner/app/CommandRunner.hpp"
#include "planner/core/SchedulerSettings.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("Zellhoff"));
    QCoreApplication::setOrganizationDomain(QStringLiteral("zellhoff.at"));
    QCoreApplication::setApplicationName(QStringLiteral("planner"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kPlannerVersion));

    QCoreApplication app(argc, argv);

    QSettings settings;
    QTextStream out(stdout);
    QTextStream err(stderr);
    planner::app::CommandRunner runner(out, err);
    return runner.run(app.arguments(), planner::core::SchedulerSettings::load(settings));
}
