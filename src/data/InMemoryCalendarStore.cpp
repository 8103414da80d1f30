#include "planner/data/InMemoryCalendarStore.hpp"

namespace planner {
namespace data {

InMemoryCalendarStore::InMemoryCalendarStore() = default;
InMemoryCalendarStore::~InMemoryCalendarStore() = default;

std::vector<CalendarEntry> InMemoryCalendarStore::fetchEntries() const
{
    std::vector<CalendarEntry> entries;
    entries.reserve(static_cast<size_t>(m_entries.size()));
    for (const auto &entry : m_entries) {
        entries.push_back(entry);
    }
    return entries;
}

std::vector<CalendarEntry> InMemoryCalendarStore::listRecentEntries(std::size_t limit) const
{
    std::vector<CalendarEntry> entries;
    for (auto it = m_entries.constEnd(); it != m_entries.constBegin() && entries.size() < limit;) {
        --it;
        entries.push_back(it.value());
    }
    return entries;
}

std::optional<CalendarEntry> InMemoryCalendarStore::findById(qint64 id) const
{
    if (m_entries.contains(id)) {
        return m_entries.value(id);
    }
    return std::nullopt;
}

std::vector<CalendarEntry> InMemoryCalendarStore::findByTaskId(qint64 taskId) const
{
    std::vector<CalendarEntry> entries;
    for (const auto &entry : m_entries) {
        if (entry.taskId && *entry.taskId == taskId) {
            entries.push_back(entry);
        }
    }
    return entries;
}

CalendarEntry InMemoryCalendarStore::addEntry(CalendarEntry entry)
{
    if (entry.id <= 0 || m_entries.contains(entry.id)) {
        entry.id = m_nextId;
    }
    m_nextId = qMax(m_nextId, entry.id + 1);
    if (!entry.createdAt.isValid()) {
        entry.createdAt = QDateTime::currentDateTime();
    }
    m_entries.insert(entry.id, entry);
    return entry;
}

bool InMemoryCalendarStore::updateEntry(const CalendarEntry &entry)
{
    if (!m_entries.contains(entry.id)) {
        return false;
    }
    m_entries.insert(entry.id, entry);
    return true;
}

bool InMemoryCalendarStore::removeEntry(qint64 id)
{
    return m_entries.remove(id) > 0;
}

} // namespace data
} // namespace planner
