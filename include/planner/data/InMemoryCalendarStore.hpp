#pragma once

#include <QMap>

#include "planner/data/CalendarStore.hpp"

namespace planner {
namespace data {

class InMemoryCalendarStore : public CalendarStore
{
public:
    InMemoryCalendarStore();
    ~InMemoryCalendarStore() override;

    std::vector<CalendarEntry> fetchEntries() const override;
    std::vector<CalendarEntry> listRecentEntries(std::size_t limit) const override;
    std::optional<CalendarEntry> findById(qint64 id) const override;
    std::vector<CalendarEntry> findByTaskId(qint64 taskId) const override;
    CalendarEntry addEntry(CalendarEntry entry) override;
    bool updateEntry(const CalendarEntry &entry) override;
    bool removeEntry(qint64 id) override;

private:
    QMap<qint64, CalendarEntry> m_entries;
    qint64 m_nextId = 1;
};

} // namespace data
} // namespace planner
