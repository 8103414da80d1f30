#include "planner/core/AppContext.hpp"

#include "planner/core/PlannerService.hpp"
#include "planner/data/DataProvider.hpp"

namespace planner {
namespace core {

AppContext::AppContext(SchedulerSettings settings)
    : m_settings(std::move(settings))
    , m_dataProvider(std::make_unique<data::DataProvider>(m_settings.dataFile))
    , m_planner(std::make_unique<PlannerService>(m_dataProvider->taskStore(), m_dataProvider->calendarStore(),
                                                 m_settings))
{
}

AppContext::~AppContext() = default;

data::TaskStore &AppContext::taskStore()
{
    return m_dataProvider->taskStore();
}

data::CalendarStore &AppContext::calendarStore()
{
    return m_dataProvider->calendarStore();
}

PlannerService &AppContext::planner()
{
    return *m_planner;
}

const SchedulerSettings &AppContext::settings() const
{
    return m_settings;
}

} // namespace core
} // namespace planner
