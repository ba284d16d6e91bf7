#include "tasklist/cli/CommandDispatcher.hpp"

#include "tasklist/core/Logging.hpp"
#include "tasklist/data/TaskOperations.hpp"
#include "tasklist/data/TaskStore.hpp"

namespace tasklist {
namespace cli {

std::optional<Command> commandFromName(const QString &name)
{
    if (name == QLatin1String("add")) {
        return Command::Add;
    }
    if (name == QLatin1String("list")) {
        return Command::List;
    }
    if (name == QLatin1String("delete")) {
        return Command::Delete;
    }
    if (name == QLatin1String("done")) {
        return Command::Done;
    }
    if (name == QLatin1String("clear")) {
        return Command::Clear;
    }
    return std::nullopt;
}

bool isMutating(Command command)
{
    return command != Command::List;
}

int exitCodeFor(CommandStatus status)
{
    return status == CommandStatus::Success ? 0 : 1;
}

CommandDispatcher::CommandDispatcher(data::TaskStore &store, QTextStream &out, OutputStyle style)
    : m_store(store)
    , m_out(out)
    , m_style(style)
{
}

CommandStatus CommandDispatcher::run(const QStringList &arguments)
{
    const auto invocation = parseInvocation(arguments);
    if (!invocation) {
        return CommandStatus::UsageError;
    }
    qCDebug(lcCli) << "Running" << arguments.front()
                   << (isMutating(invocation->command) ? "(mutating)" : "(read-only)");

    auto tasks = m_store.load();
    if (!tasks) {
        printLine(QStringLiteral("Error loading tasks: %1").arg(m_store.errorString()));
        return CommandStatus::DataCorruption;
    }
    return execute(*invocation, std::move(*tasks));
}

std::optional<CommandDispatcher::Invocation> CommandDispatcher::parseInvocation(const QStringList &arguments)
{
    const auto command = arguments.isEmpty() ? std::nullopt : commandFromName(arguments.front());
    if (!command) {
        printUsage();
        return std::nullopt;
    }

    Invocation invocation;
    invocation.command = *command;
    switch (*command) {
    case Command::Add:
        if (arguments.size() < 2 || arguments.at(1).isEmpty()) {
            printLine(QStringLiteral("Error: Task title is required"));
            printUsage();
            return std::nullopt;
        }
        invocation.title = arguments.at(1);
        invocation.deadline = arguments.value(2);
        break;
    case Command::Delete:
    case Command::Done: {
        const auto id = parseTaskId(arguments);
        if (!id) {
            return std::nullopt;
        }
        invocation.id = *id;
        break;
    }
    case Command::List:
    case Command::Clear:
        break;
    }
    return invocation;
}

std::optional<qint64> CommandDispatcher::parseTaskId(const QStringList &arguments)
{
    if (arguments.size() < 2) {
        printLine(QStringLiteral("Error: Task ID is required"));
        printUsage();
        return std::nullopt;
    }
    // toLongLong() tolerates surrounding whitespace, an id argument must not carry any.
    const QString &text = arguments.at(1);
    bool ok = false;
    const qint64 id = text.toLongLong(&ok);
    if (!ok || text != text.trimmed()) {
        printLine(QStringLiteral("Error: ID must be a number"));
        return std::nullopt;
    }
    return id;
}

CommandStatus CommandDispatcher::execute(const Invocation &invocation, data::TaskList tasks)
{
    switch (invocation.command) {
    case Command::Add: {
        auto added = data::addTask(std::move(tasks), invocation.title, invocation.deadline);
        if (!added) {
            printLine(QStringLiteral("Error: No task ID left"));
            return CommandStatus::IdExhausted;
        }
        if (!persist(added->tasks)) {
            return CommandStatus::IoError;
        }
        printLine(formatAdded(added->id, invocation.title, m_style));
        return CommandStatus::Success;
    }
    case Command::List:
        if (tasks.empty()) {
            printLine(formatEmptyList(m_style));
            return CommandStatus::Success;
        }
        printLine(QStringLiteral("Tasks:"));
        for (const auto &task : tasks) {
            printLine(formatTaskLine(task, m_style));
        }
        return CommandStatus::Success;
    case Command::Delete:
    case Command::Done: {
        const bool deleting = invocation.command == Command::Delete;
        auto update = deleting ? data::removeTask(std::move(tasks), invocation.id)
                               : data::markTaskDone(std::move(tasks), invocation.id);
        if (!update.found) {
            printLine(QStringLiteral("Error: Task #%1 not found").arg(invocation.id));
            return CommandStatus::NotFound;
        }
        if (!persist(update.tasks)) {
            return CommandStatus::IoError;
        }
        printLine(deleting ? formatDeleted(invocation.id, m_style) : formatMarkedDone(invocation.id, m_style));
        return CommandStatus::Success;
    }
    case Command::Clear:
        if (!persist(data::clearTasks())) {
            return CommandStatus::IoError;
        }
        printLine(formatCleared(m_style));
        return CommandStatus::Success;
    }
    return CommandStatus::UsageError;
}

bool CommandDispatcher::persist(const data::TaskList &tasks)
{
    if (m_store.save(tasks)) {
        return true;
    }
    printLine(QStringLiteral("Error saving tasks: %1").arg(m_store.errorString()));
    return false;
}

void CommandDispatcher::printLine(const QString &line)
{
    m_out << line << '\n';
    m_out.flush();
}

void CommandDispatcher::printUsage()
{
    m_out << usageText();
    m_out.flush();
}

} // namespace cli
} // namespace tasklist
