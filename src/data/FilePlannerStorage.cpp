#include "planner/data/FilePlannerStorage.hpp"

#include "planner/core/Logging.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QTextStream>

namespace planner {
namespace data {

namespace {
constexpr auto DATE_TIME_FORMAT = "yyyyMMdd'T'hhmmss'Z'";

qint64 parseId(const QString &value)
{
    bool ok = false;
    const qint64 id = value.trimmed().toLongLong(&ok);
    return ok && id > 0 ? id : 0;
}
} // namespace

FilePlannerStorage::FilePlannerStorage(QString filePath)
    : m_filePath(std::move(filePath))
{
    load();
}

const QString &FilePlannerStorage::filePath() const
{
    return m_filePath;
}

const QMap<qint64, CalendarEntry> &FilePlannerStorage::entries() const
{
    return m_entries;
}

const QMap<qint64, Task> &FilePlannerStorage::tasks() const
{
    return m_tasks;
}

CalendarEntry FilePlannerStorage::addOrUpdateEntry(CalendarEntry entry)
{
    if (entry.id <= 0) {
        entry.id = m_nextEntryId;
    }
    m_nextEntryId = qMax(m_nextEntryId, entry.id + 1);
    if (!entry.createdAt.isValid()) {
        entry.createdAt = QDateTime::currentDateTimeUtc();
    }
    m_entries.insert(entry.id, entry);
    save();
    return entry;
}

bool FilePlannerStorage::removeEntry(qint64 id)
{
    if (m_entries.remove(id) > 0) {
        save();
        return true;
    }
    return false;
}

Task FilePlannerStorage::addOrUpdateTask(Task task)
{
    if (task.id <= 0) {
        task.id = m_nextTaskId;
    }
    m_nextTaskId = qMax(m_nextTaskId, task.id + 1);
    if (!task.createdAt.isValid()) {
        task.createdAt = QDateTime::currentDateTimeUtc();
    }
    m_tasks.insert(task.id, task);
    save();
    return task;
}

bool FilePlannerStorage::removeTask(qint64 id)
{
    if (m_tasks.remove(id) > 0) {
        save();
        return true;
    }
    return false;
}

void FilePlannerStorage::load()
{
    m_entries.clear();
    m_tasks.clear();

    QFile file(m_filePath);
    if (!file.exists()) {
        return;
    }
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qCWarning(lcStorage) << "Cannot open" << m_filePath << "for reading:" << file.errorString();
        return;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");

    enum class Section {
        None,
        Entry,
        Task
    };

    Section currentSection = Section::None;
    CalendarEntry currentEntry;
    Task currentTask;
    bool effectiveSeen = false;

    auto finalizeEntry = [&]() {
        if (currentEntry.id <= 0 || m_entries.contains(currentEntry.id)) {
            currentEntry.id = m_nextEntryId;
        }
        m_nextEntryId = qMax(m_nextEntryId, currentEntry.id + 1);
        if (currentEntry.start.isValid()) {
            m_entries.insert(currentEntry.id, currentEntry);
        } else {
            qCWarning(lcStorage) << "Dropping calendar entry without start:" << currentEntry.label;
        }
        currentEntry = CalendarEntry{};
    };

    auto finalizeTask = [&]() {
        if (currentTask.id <= 0 || m_tasks.contains(currentTask.id)) {
            currentTask.id = m_nextTaskId;
        }
        m_nextTaskId = qMax(m_nextTaskId, currentTask.id + 1);
        if (!effectiveSeen) {
            currentTask.effectivePriority = currentTask.userPriority;
        }
        m_tasks.insert(currentTask.id, currentTask);
        currentTask = Task{};
        effectiveSeen = false;
    };

    auto handleLine = [&](const QString &line) {
        if (line == QLatin1String("BEGIN:VEVENT")) {
            currentSection = Section::Entry;
            currentEntry = CalendarEntry{};
            return;
        }
        if (line == QLatin1String("END:VEVENT")) {
            finalizeEntry();
            currentSection = Section::None;
            return;
        }
        if (line == QLatin1String("BEGIN:VTODO")) {
            currentSection = Section::Task;
            currentTask = Task{};
            effectiveSeen = false;
            return;
        }
        if (line == QLatin1String("END:VTODO")) {
            finalizeTask();
            currentSection = Section::None;
            return;
        }

        if (currentSection == Section::None) {
            return;
        }

        const int colonIndex = line.indexOf(':');
        if (colonIndex <= 0) {
            return;
        }

        const QString property = line.left(colonIndex);
        const QString rawValue = line.mid(colonIndex + 1);
        const QString name = property.section(';', 0, 0).toUpper();
        const QString value = decodeText(rawValue);

        if (currentSection == Section::Entry) {
            if (name == QLatin1String("UID")) {
                currentEntry.id = parseId(value);
            } else if (name == QLatin1String("SUMMARY")) {
                currentEntry.label = value;
            } else if (name == QLatin1String("DTSTART")) {
                currentEntry.start = parseDateTime(rawValue);
            } else if (name == QLatin1String("CREATED")) {
                currentEntry.createdAt = parseDateTime(rawValue);
            } else if (name == QLatin1String("X-PLANNER-TASK")) {
                const qint64 taskId = parseId(rawValue);
                if (taskId > 0) {
                    currentEntry.taskId = taskId;
                }
            } else if (name == QLatin1String("X-PLANNER-DURATION")) {
                currentEntry.durationMinutes = qMax(0, rawValue.toInt());
            }
            return;
        }

        if (currentSection == Section::Task) {
            if (name == QLatin1String("UID")) {
                currentTask.id = parseId(value);
            } else if (name == QLatin1String("SUMMARY")) {
                currentTask.title = value;
            } else if (name == QLatin1String("DTSTART")) {
                currentTask.scheduledTime = parseDateTime(rawValue);
            } else if (name == QLatin1String("CREATED")) {
                currentTask.createdAt = parseDateTime(rawValue);
            } else if (name == QLatin1String("PRIORITY")) {
                currentTask.userPriority = priorityFromIcal(rawValue.toInt());
            } else if (name == QLatin1String("STATUS")) {
                currentTask.status = statusFromIcal(rawValue);
            } else if (name == QLatin1String("X-PLANNER-MODE")) {
                currentTask.mode = modeFromString(rawValue);
            } else if (name == QLatin1String("X-PLANNER-EFFECTIVE-PRIORITY")) {
                currentTask.effectivePriority = priorityFromString(rawValue, currentTask.userPriority);
                effectiveSeen = true;
            } else if (name == QLatin1String("X-PLANNER-PRIORITY-REASON")) {
                currentTask.priorityReason = value;
            }
        }
    };

    QString accumulator;
    bool hasAccumulator = false;
    while (!stream.atEnd()) {
        QString line = stream.readLine();
        if (!line.isEmpty() && (line.startsWith(' ') || line.startsWith('\t'))) {
            if (hasAccumulator) {
                accumulator += line.mid(1);
            }
        } else {
            if (hasAccumulator) {
                handleLine(accumulator);
            }
            accumulator = line;
            hasAccumulator = true;
        }
    }
    if (hasAccumulator) {
        handleLine(accumulator);
    }

    qCDebug(lcStorage) << "Loaded" << m_entries.size() << "calendar entries and" << m_tasks.size() << "tasks from"
                       << m_filePath;
}

void FilePlannerStorage::save() const
{
    if (m_filePath.isEmpty()) {
        return;
    }

    QFileInfo info(m_filePath);
    QDir dir = info.dir();
    if (!dir.exists()) {
        dir.mkpath(QStringLiteral("."));
    }

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        qCWarning(lcStorage) << "Cannot open" << m_filePath << "for writing:" << file.errorString();
        return;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");

    stream << "BEGIN:VCALENDAR\n";
    stream << "VERSION:2.0\n";
    stream << "PRODID:-//Planner//EN\n";

    for (const CalendarEntry &entry : m_entries) {
        stream << "BEGIN:VEVENT\n";
        stream << "UID:" << entry.id << '\n';
        stream << "SUMMARY:" << encodeText(entry.label) << '\n';
        stream << "DTSTART:" << formatDateTime(entry.start) << '\n';
        if (entry.createdAt.isValid()) {
            stream << "CREATED:" << formatDateTime(entry.createdAt) << '\n';
        }
        if (entry.taskId) {
            stream << "X-PLANNER-TASK:" << *entry.taskId << '\n';
        }
        if (entry.durationMinutes > 0) {
            stream << "X-PLANNER-DURATION:" << entry.durationMinutes << '\n';
        }
        stream << "END:VEVENT\n";
    }

    for (const Task &task : m_tasks) {
        stream << "BEGIN:VTODO\n";
        stream << "UID:" << task.id << '\n';
        stream << "SUMMARY:" << encodeText(task.title) << '\n';
        if (task.scheduledTime.isValid()) {
            stream << "DTSTART:" << formatDateTime(task.scheduledTime) << '\n';
        }
        if (task.createdAt.isValid()) {
            stream << "CREATED:" << formatDateTime(task.createdAt) << '\n';
        }
        stream << "PRIORITY:" << priorityToIcal(task.userPriority) << '\n';
        stream << "STATUS:" << statusToIcal(task.status) << '\n';
        stream << "X-PLANNER-MODE:" << modeToString(task.mode) << '\n';
        stream << "X-PLANNER-EFFECTIVE-PRIORITY:" << priorityToString(task.effectivePriority) << '\n';
        if (!task.priorityReason.isEmpty()) {
            stream << "X-PLANNER-PRIORITY-REASON:" << encodeText(task.priorityReason) << '\n';
        }
        stream << "END:VTODO\n";
    }

    stream << "END:VCALENDAR\n";

    stream.flush();
    if (!file.commit()) {
        qCWarning(lcStorage) << "Failed to commit" << m_filePath << ":" << file.errorString();
    }
}

QString FilePlannerStorage::encodeText(const QString &text)
{
    QString encoded = text;
    encoded.replace('\\', "\\\\");
    encoded.replace('\n', "\\n");
    encoded.replace(',', "\\,");
    encoded.replace(';', "\\;");
    return encoded;
}

QString FilePlannerStorage::decodeText(const QString &text)
{
    QString decoded;
    decoded.reserve(text.size());
    for (int i = 0; i < text.size(); ++i) {
        const QChar c = text.at(i);
        if (c != QLatin1Char('\\') || i + 1 == text.size()) {
            decoded.append(c);
            continue;
        }
        const QChar next = text.at(++i);
        if (next == QLatin1Char('n') || next == QLatin1Char('N')) {
            decoded.append(QLatin1Char('\n'));
        } else {
            // Any other escaped character stands for itself.
            decoded.append(next);
        }
    }
    return decoded;
}

QString FilePlannerStorage::formatDateTime(const QDateTime &dt)
{
    if (!dt.isValid()) {
        return {};
    }
    return dt.toUTC().toString(QLatin1String(DATE_TIME_FORMAT));
}

QDateTime FilePlannerStorage::parseDateTime(const QString &value)
{
    if (value.endsWith('Z')) {
        QDateTime dt = QDateTime::fromString(value, DATE_TIME_FORMAT);
        dt.setTimeSpec(Qt::UTC);
        return dt.toLocalTime();
    }
    QDateTime dt = QDateTime::fromString(value, "yyyyMMdd'T'hhmmss");
    if (!dt.isValid()) {
        dt = QDateTime::fromString(value, Qt::ISODate);
    }
    return dt;
}

int FilePlannerStorage::priorityToIcal(Priority priority)
{
    switch (priority) {
    case Priority::High:
        return 1;
    case Priority::Low:
        return 9;
    case Priority::Medium:
    default:
        return 5;
    }
}

Priority FilePlannerStorage::priorityFromIcal(int value)
{
    if (value >= 1 && value <= 4) {
        return Priority::High;
    }
    if (value >= 6 && value <= 9) {
        return Priority::Low;
    }
    return Priority::Medium;
}

QString FilePlannerStorage::statusToIcal(TaskStatus status)
{
    switch (status) {
    case TaskStatus::Done:
        return QStringLiteral("COMPLETED");
    case TaskStatus::InProgress:
        return QStringLiteral("IN-PROCESS");
    case TaskStatus::Planned:
    default:
        return QStringLiteral("NEEDS-ACTION");
    }
}

TaskStatus FilePlannerStorage::statusFromIcal(const QString &value)
{
    const QString normalized = value.toUpper();
    if (normalized == QLatin1String("COMPLETED")) {
        return TaskStatus::Done;
    }
    if (normalized == QLatin1String("IN-PROCESS")) {
        return TaskStatus::InProgress;
    }
    return TaskStatus::Planned;
}

} // namespace data
} // namespace planner
