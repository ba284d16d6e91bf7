#pragma once

#include <optional>

#include <QString>
#include <QStringList>
#include <QTextStream>

#include "tasklist/cli/TaskFormatter.hpp"
#include "tasklist/data/Task.hpp"

namespace tasklist {
namespace data {
class TaskStore;
}

namespace cli {

enum class Command
{
    Add,
    List,
    Delete,
    Done,
    Clear,
};

enum class CommandStatus
{
    Success,
    UsageError,
    NotFound,
    DataCorruption,
    IoError,
    IdExhausted,
};

std::optional<Command> commandFromName(const QString &name);
bool isMutating(Command command);
int exitCodeFor(CommandStatus status);

class CommandDispatcher
{
public:
    CommandDispatcher(data::TaskStore &store, QTextStream &out, OutputStyle style = {});
    ~CommandDispatcher() = default;

    // arguments holds the command name followed by its arguments.
    CommandStatus run(const QStringList &arguments);

private:
    struct Invocation
    {
        Command command = Command::List;
        QString title;
        QString deadline;
        qint64 id = 0;
    };

    std::optional<Invocation> parseInvocation(const QStringList &arguments);
    std::optional<qint64> parseTaskId(const QStringList &arguments);
    CommandStatus execute(const Invocation &invocation, data::TaskList tasks);
    bool persist(const data::TaskList &tasks);

    void printLine(const QString &line);
    void printUsage();

    data::TaskStore &m_store;
    QTextStream &m_out;
    OutputStyle m_style;
};

} // namespace cli
} // namespace tasklist
