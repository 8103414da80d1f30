#include "planner/data/FileCalendarStore.hpp"

namespace planner {
namespace data {

FileCalendarStore::FileCalendarStore(std::shared_ptr<FilePlannerStorage> storage)
    : m_storage(std::move(storage))
{
}

std::vector<CalendarEntry> FileCalendarStore::fetchEntries() const
{
    std::vector<CalendarEntry> result;
    if (!m_storage) {
        return result;
    }
    const auto &entries = m_storage->entries();
    result.reserve(static_cast<size_t>(entries.size()));
    for (auto it = entries.constBegin(); it != entries.constEnd(); ++it) {
        result.push_back(it.value());
    }
    return result;
}

std::vector<CalendarEntry> FileCalendarStore::listRecentEntries(std::size_t limit) const
{
    std::vector<CalendarEntry> result;
    if (!m_storage) {
        return result;
    }
    const auto &entries = m_storage->entries();
    for (auto it = entries.constEnd(); it != entries.constBegin() && result.size() < limit;) {
        --it;
        result.push_back(it.value());
    }
    return result;
}

std::optional<CalendarEntry> FileCalendarStore::findById(qint64 id) const
{
    if (!m_storage) {
        return std::nullopt;
    }
    const auto &entries = m_storage->entries();
    if (entries.contains(id)) {
        return entries.value(id);
    }
    return std::nullopt;
}

std::vector<CalendarEntry> FileCalendarStore::findByTaskId(qint64 taskId) const
{
    std::vector<CalendarEntry> result;
    if (!m_storage) {
        return result;
    }
    for (const auto &entry : m_storage->entries()) {
        if (entry.taskId && *entry.taskId == taskId) {
            result.push_back(entry);
        }
    }
    return result;
}

CalendarEntry FileCalendarStore::addEntry(CalendarEntry entry)
{
    if (!m_storage) {
        return entry;
    }
    if (m_storage->entries().contains(entry.id)) {
        entry.id = 0;
    }
    return m_storage->addOrUpdateEntry(std::move(entry));
}

bool FileCalendarStore::updateEntry(const CalendarEntry &entry)
{
    if (!m_storage) {
        return false;
    }
    if (!m_storage->entries().contains(entry.id)) {
        return false;
    }
    m_storage->addOrUpdateEntry(entry);
    return true;
}

bool FileCalendarStore::removeEntry(qint64 id)
{
    if (!m_storage) {
        return false;
    }
    return m_storage->removeEntry(id);
}

} // namespace data
} // namespace planner
