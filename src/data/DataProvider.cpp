#include "planner/data/DataProvider.hpp"

#include "planner/data/FileCalendarStore.hpp"
#include "planner/data/FilePlannerStorage.hpp"
#include "planner/data/FileTaskStore.hpp"

#include <QDir>
#include <QStandardPaths>

namespace planner {
namespace data {

DataProvider::DataProvider(const QString &filePath)
{
    const QString path = filePath.isEmpty() ? defaultFilePath() : filePath;
    m_storage = std::make_shared<FilePlannerStorage>(path);
    m_taskStore = std::make_unique<FileTaskStore>(m_storage);
    m_calendarStore = std::make_unique<FileCalendarStore>(m_storage);
}

DataProvider::~DataProvider() = default;

TaskStore &DataProvider::taskStore()
{
    return *m_taskStore;
}

CalendarStore &DataProvider::calendarStore()
{
    return *m_calendarStore;
}

QString DataProvider::filePath() const
{
    return m_storage->filePath();
}

QString DataProvider::defaultFilePath()
{
    QString storageFolder = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (storageFolder.isEmpty()) {
        storageFolder = QDir::homePath() + QStringLiteral("/.local/share/planner");
    }
    QDir dir(storageFolder);
    if (!dir.exists()) {
        dir.mkpath(QStringLiteral("."));
    }
    return dir.filePath(QStringLiteral("planner.ics"));
}

} // namespace data
} // namespace planner
