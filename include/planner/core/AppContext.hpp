#pragma once

#include <memory>

#include "planner/core/SchedulerSettings.hpp"

namespace planner {
namespace data {
class DataProvider;
class TaskStore;
class CalendarStore;
}

namespace core {

class PlannerService;

class AppContext
{
public:
    explicit AppContext(SchedulerSettings settings = SchedulerSettings());
    ~AppContext();

    data::TaskStore &taskStore();
    data::CalendarStore &calendarStore();
    PlannerService &planner();
    const SchedulerSettings &settings() const;

private:
    SchedulerSettings m_settings;
    std::unique_ptr<data::DataProvider> m_dataProvider;
    std::unique_ptr<PlannerService> m_planner;
};

} // namespace core
} // namespace planner
