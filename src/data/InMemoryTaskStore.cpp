#include "planner/data/InMemoryTaskStore.hpp"

namespace planner {
namespace data {

InMemoryTaskStore::InMemoryTaskStore() = default;
InMemoryTaskStore::~InMemoryTaskStore() = default;

std::vector<Task> InMemoryTaskStore::fetchTasks() const
{
    std::vector<Task> tasks;
    tasks.reserve(static_cast<size_t>(m_items.size()));
    for (const auto &item : m_items) {
        tasks.push_back(item);
    }
    return tasks;
}

std::optional<Task> InMemoryTaskStore::findById(qint64 id) const
{
    if (m_items.contains(id)) {
        return m_items.value(id);
    }
    return std::nullopt;
}

Task InMemoryTaskStore::addTask(Task task)
{
    if (task.id <= 0 || m_items.contains(task.id)) {
        task.id = m_nextId;
    }
    m_nextId = qMax(m_nextId, task.id + 1);
    if (!task.createdAt.isValid()) {
        task.createdAt = QDateTime::currentDateTime();
    }
    m_items.insert(task.id, task);
    return task;
}

bool InMemoryTaskStore::updateTask(const Task &task)
{
    if (!m_items.contains(task.id)) {
        return false;
    }
    m_items.insert(task.id, task);
    return true;
}

bool InMemoryTaskStore::removeTask(qint64 id)
{
    return m_items.remove(id) > 0;
}

} // namespace data
} // namespace planner
