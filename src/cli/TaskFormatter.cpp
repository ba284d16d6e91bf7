#include "tasklist/cli/TaskFormatter.hpp"

#include "tasklist/data/TaskOperations.hpp"

#include <QStringList>

namespace tasklist {
namespace cli {

QString colorize(const QString &text, const char *color, const OutputStyle &style)
{
    if (!style.color) {
        return text;
    }
    return QString::fromLatin1(color) + text + QString::fromLatin1(ansi::Reset);
}

QString formatTaskLine(const data::TaskItem &task, const OutputStyle &style)
{
    const QString status = task.done ? colorize(QStringLiteral("Done"), ansi::Green, style)
                                     : colorize(QStringLiteral("Not Done"), ansi::Red, style);
    QString line = QStringLiteral("#%1: %2 [%3]").arg(task.id).arg(task.title, status);
    if (task.deadline.isValid()) {
        line += QStringLiteral(" (Deadline: %1)").arg(data::formatDeadline(task.deadline));
    }
    return line;
}

QString formatAdded(qint64 id, const QString &title, const OutputStyle &style)
{
    // Only the prefix is colored, the title is printed as entered.
    return colorize(QStringLiteral("Added task #%1:").arg(id), ansi::Green, style) + QChar(' ') + title;
}

QString formatDeleted(qint64 id, const OutputStyle &style)
{
    return colorize(QStringLiteral("Deleted task #%1").arg(id), ansi::Red, style);
}

QString formatMarkedDone(qint64 id, const OutputStyle &style)
{
    return colorize(QStringLiteral("Marked task #%1 as done").arg(id), ansi::Green, style);
}

QString formatCleared(const OutputStyle &style)
{
    return colorize(QStringLiteral("All tasks cleared!"), ansi::Yellow, style);
}

QString formatEmptyList(const OutputStyle &style)
{
    return colorize(QStringLiteral("No tasks found"), ansi::Yellow, style);
}

QString usageText()
{
    const QStringList lines = {
        QStringLiteral("Usage:"),
        QStringLiteral("  add \"task name\" [deadline YYYY-MM-DD] - Add a new task with optional deadline"),
        QStringLiteral("  list                                  - List all tasks"),
        QStringLiteral("  delete <id>                           - Delete a task by ID"),
        QStringLiteral("  done <id>                             - Mark a task as done by ID"),
        QStringLiteral("  clear                                 - Delete all tasks"),
    };
    return lines.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

} // namespace cli
} // namespace tasklist
