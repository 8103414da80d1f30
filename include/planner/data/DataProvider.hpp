#pragma once

#include <memory>
#include <QString>

namespace planner {
namespace data {

class TaskStore;
class CalendarStore;
class FilePlannerStorage;

class DataProvider
{
public:
    // An empty path selects planner.ics in the application data folder.
    explicit DataProvider(const QString &filePath = QString());
    ~DataProvider();

    TaskStore &taskStore();
    CalendarStore &calendarStore();
    QString filePath() const;

    static QString defaultFilePath();

private:
    std::shared_ptr<FilePlannerStorage> m_storage;
    std::unique_ptr<TaskStore> m_taskStore;
    std::unique_ptr<CalendarStore> m_calendarStore;
};

} // namespace data
} // namespace planner
