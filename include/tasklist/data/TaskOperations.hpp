#pragma once

#include <QDate>
#include <QString>

#include <optional>

#include "tasklist/data/Task.hpp"

namespace tasklist {
namespace data {

constexpr auto DEADLINE_FORMAT = "yyyy-MM-dd";

struct TaskAddition
{
    TaskList tasks;
    qint64 id = 0;
};

struct TaskUpdate
{
    TaskList tasks;
    bool found = false;
};

// Empty when the largest id already sits at the qint64 limit.
std::optional<qint64> nextTaskId(const TaskList &tasks);

// Returns a null date unless text is a valid YYYY-MM-DD date.
QDate parseDeadline(const QString &text);
QString formatDeadline(const QDate &date);

// An unparseable deadline is dropped with a warning, the task is still added.
// Fails only when no identifier is left.
std::optional<TaskAddition> addTask(TaskList tasks, const QString &title, const QString &deadline = QString());
TaskUpdate removeTask(TaskList tasks, qint64 id);
TaskUpdate markTaskDone(TaskList tasks, qint64 id);
TaskList clearTasks();

} // namespace data
} // namespace tasklist
