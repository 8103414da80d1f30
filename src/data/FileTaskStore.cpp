#include "planner/data/FileTaskStore.hpp"

namespace planner {
namespace data {

FileTaskStore::FileTaskStore(std::shared_ptr<FilePlannerStorage> storage)
    : m_storage(std::move(storage))
{
}

std::vector<Task> FileTaskStore::fetchTasks() const
{
    std::vector<Task> result;
    if (!m_storage) {
        return result;
    }
    const auto &tasks = m_storage->tasks();
    result.reserve(static_cast<size_t>(tasks.size()));
    for (auto it = tasks.constBegin(); it != tasks.constEnd(); ++it) {
        result.push_back(it.value());
    }
    return result;
}

std::optional<Task> FileTaskStore::findById(qint64 id) const
{
    if (!m_storage) {
        return std::nullopt;
    }
    const auto &tasks = m_storage->tasks();
    if (tasks.contains(id)) {
        return tasks.value(id);
    }
    return std::nullopt;
}

Task FileTaskStore::addTask(Task task)
{
    if (!m_storage) {
        return task;
    }
    if (m_storage->tasks().contains(task.id)) {
        task.id = 0;
    }
    return m_storage->addOrUpdateTask(std::move(task));
}

bool FileTaskStore::updateTask(const Task &task)
{
    if (!m_storage) {
        return false;
    }
    if (!m_storage->tasks().contains(task.id)) {
        return false;
    }
    m_storage->addOrUpdateTask(task);
    return true;
}

bool FileTaskStore::removeTask(qint64 id)
{
    if (!m_storage) {
        return false;
    }
    return m_storage->removeTask(id);
}

} // namespace data
} // namespace planner
