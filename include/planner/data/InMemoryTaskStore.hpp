#pragma once

#include <QMap>

#include "planner/data/TaskStore.hpp"

namespace planner {
namespace data {

class InMemoryTaskStore : public TaskStore
{
public:
    InMemoryTaskStore();
    ~InMemoryTaskStore() override;

    std::vector<Task> fetchTasks() const override;
    std::optional<Task> findById(qint64 id) const override;
    Task addTask(Task task) override;
    bool updateTask(const Task &task) override;
    bool removeTask(qint64 id) override;

private:
    QMap<qint64, Task> m_items;
    qint64 m_nextId = 1;
};

} // namespace data
} // namespace planner
