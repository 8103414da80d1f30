#pragma once

#include <QMap>
#include <QDateTime>
#include <QString>

#include "planner/data/CalendarEntry.hpp"
#include "planner/data/Task.hpp"

namespace planner {
namespace data {

class FilePlannerStorage
{
public:
    explicit FilePlannerStorage(QString filePath);
    ~FilePlannerStorage() = default;

    const QString &filePath() const;

    const QMap<qint64, CalendarEntry> &entries() const;
    const QMap<qint64, Task> &tasks() const;

    CalendarEntry addOrUpdateEntry(CalendarEntry entry);
    bool removeEntry(qint64 id);

    Task addOrUpdateTask(Task task);
    bool removeTask(qint64 id);

private:
    void load();
    void save() const;

    static QString encodeText(const QString &text);
    static QString decodeText(const QString &text);
    static QString formatDateTime(const QDateTime &dt);
    static QDateTime parseDateTime(const QString &value);
    static int priorityToIcal(Priority priority);
    static Priority priorityFromIcal(int value);
    static QString statusToIcal(TaskStatus status);
    static TaskStatus statusFromIcal(const QString &value);

    QString m_filePath;
    QMap<qint64, CalendarEntry> m_entries;
    QMap<qint64, Task> m_tasks;
    qint64 m_nextEntryId = 1;
    qint64 m_nextTaskId = 1;
};

} // namespace data
} // namespace planner
