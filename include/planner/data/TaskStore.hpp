#pragma once

#include <optional>
#include <vector>

#include "planner/data/Task.hpp"

namespace planner {
namespace data {

class TaskStore
{
public:
    virtual ~TaskStore() = default;

    virtual std::vector<Task> fetchTasks() const = 0;
    virtual std::optional<Task> findById(qint64 id) const = 0;
    virtual Task addTask(Task task) = 0;
    virtual bool updateTask(const Task &task) = 0;
    virtual bool removeTask(qint64 id) = 0;
};

} // namespace data
} // namespace planner
