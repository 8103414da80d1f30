#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "planner/data/CalendarEntry.hpp"

namespace planner {
namespace data {

class CalendarStore
{
public:
    virtual ~CalendarStore() = default;

    // All entries, ascending by id.
    virtual std::vector<CalendarEntry> fetchEntries() const = 0;
    // The newest `limit` entries, descending by id.
    virtual std::vector<CalendarEntry> listRecentEntries(std::size_t limit) const = 0;
    virtual std::optional<CalendarEntry> findById(qint64 id) const = 0;
    // Entries whose taskId field references the task, ascending by id.
    virtual std::vector<CalendarEntry> findByTaskId(qint64 taskId) const = 0;
    virtual CalendarEntry addEntry(CalendarEntry entry) = 0;
    virtual bool updateEntry(const CalendarEntry &entry) = 0;
    virtual bool removeEntry(qint64 id) = 0;
};

} // namespace data
} // namespace planner
