#include "tasklist/data/TaskOperations.hpp"

#include "tasklist/core/Logging.hpp"

#include <algorithm>
#include <limits>

namespace tasklist {
namespace data {

namespace {
auto findTask(TaskList &tasks, qint64 id)
{
    return std::find_if(tasks.begin(), tasks.end(), [id](const TaskItem &task) {
        return task.id == id;
    });
}
} // namespace

std::optional<qint64> nextTaskId(const TaskList &tasks)
{
    if (tasks.empty()) {
        return 1;
    }
    const auto maxIt = std::max_element(tasks.begin(), tasks.end(), [](const TaskItem &lhs, const TaskItem &rhs) {
        return lhs.id < rhs.id;
    });
    if (maxIt->id == std::numeric_limits<qint64>::max()) {
        return std::nullopt;
    }
    return maxIt->id + 1;
}

QDate parseDeadline(const QString &text)
{
    if (text.size() != 10) {
        return {};
    }
    return QDate::fromString(text, QLatin1String(DEADLINE_FORMAT));
}

QString formatDeadline(const QDate &date)
{
    if (!date.isValid()) {
        return {};
    }
    return date.toString(QLatin1String(DEADLINE_FORMAT));
}

std::optional<TaskAddition> addTask(TaskList tasks, const QString &title, const QString &deadline)
{
    const auto id = nextTaskId(tasks);
    if (!id) {
        qCWarning(lcData, "No task identifier left after %lld", std::numeric_limits<qint64>::max());
        return std::nullopt;
    }

    TaskItem task;
    task.id = *id;
    task.title = title;
    if (!deadline.isEmpty()) {
        task.deadline = parseDeadline(deadline);
        if (!task.deadline.isValid()) {
            qCWarning(lcData, "Ignoring unparseable deadline \"%s\"", qUtf8Printable(deadline));
        }
    }

    tasks.push_back(std::move(task));
    return TaskAddition{std::move(tasks), *id};
}

TaskUpdate removeTask(TaskList tasks, qint64 id)
{
    const auto it = findTask(tasks, id);
    if (it == tasks.end()) {
        return {std::move(tasks), false};
    }
    tasks.erase(it);
    return {std::move(tasks), true};
}

TaskUpdate markTaskDone(TaskList tasks, qint64 id)
{
    const auto it = findTask(tasks, id);
    if (it == tasks.end()) {
        return {std::move(tasks), false};
    }
    it->done = true;
    return {std::move(tasks), true};
}

TaskList clearTasks()
{
    return {};
}

} // namespace data
} // namespace tasklist
