#pragma once

#include "planner/data/TaskStore.hpp"
#include "planner/data/FilePlannerStorage.hpp"

#include <memory>

namespace planner {
namespace data {

class FileTaskStore : public TaskStore
{
public:
    explicit FileTaskStore(std::shared_ptr<FilePlannerStorage> storage);
    ~FileTaskStore() override = default;

    std::vector<Task> fetchTasks() const override;
    std::optional<Task> findById(qint64 id) const override;
    Task addTask(Task task) override;
    bool updateTask(const Task &task) override;
    bool removeTask(qint64 id) override;

private:
    std::shared_ptr<FilePlannerStorage> m_storage;
};

} // namespace data
} // namespace planner
