#pragma once

#include <vector>

#include <QJsonArray>
#include <QJsonObject>

#include "planner/data/CalendarEntry.hpp"
#include "planner/data/Task.hpp"
#include "planner/scheduling/ConflictResolver.hpp"
#include "planner/scheduling/TaskCalendarSync.hpp"

namespace planner {
namespace core {

struct TaskPlacement;
struct TaskUpdate;

QJsonObject toJson(const data::Task &task);
QJsonObject toJson(const data::CalendarEntry &entry);
QJsonObject toJson(const scheduling::CalendarOp &op);
QJsonObject toJson(const scheduling::Resolution &resolution);
QJsonObject toJson(const TaskPlacement &placement);
QJsonObject toJson(const TaskUpdate &update);

template<typename T>
QJsonArray toJsonArray(const std::vector<T> &items)
{
    QJsonArray array;
    for (const auto &item : items) {
        array.append(toJson(item));
    }
    return array;
}

QJsonArray toJsonArray(const std::vector<QDateTime> &times);

} // namespace core
} // namespace planner
