#pragma once

#include "planner/data/CalendarStore.hpp"
#include "planner/data/FilePlannerStorage.hpp"

#include <memory>

namespace planner {
namespace data {

class FileCalendarStore : public CalendarStore
{
public:
    explicit FileCalendarStore(std::shared_ptr<FilePlannerStorage> storage);
    ~FileCalendarStore() override = default;

    std::vector<CalendarEntry> fetchEntries() const override;
    std::vector<CalendarEntry> listRecentEntries(std::size_t limit) const override;
    std::optional<CalendarEntry> findById(qint64 id) const override;
    std::vector<CalendarEntry> findByTaskId(qint64 taskId) const override;
    CalendarEntry addEntry(CalendarEntry entry) override;
    bool updateEntry(const CalendarEntry &entry) override;
    bool removeEntry(qint64 id) override;

private:
    std::shared_ptr<FilePlannerStorage> m_storage;
};

} // namespace data
} // namespace planner
