#include <QtTest/QtTest>

#include "tasklist/cli/TaskFormatter.hpp"

using namespace tasklist;

class TaskFormatterTest : public QObject
{
    Q_OBJECT

private slots:
    void plainTaskLines();
    void coloredStatus();
    void confirmations();
    void usageListsEveryCommand();
};

void TaskFormatterTest::plainTaskLines()
{
    const cli::OutputStyle plain{false};

    data::TaskItem task;
    task.id = 1;
    task.title = QStringLiteral("Buy milk");
    task.done = true;
    QCOMPARE(cli::formatTaskLine(task, plain), QStringLiteral("#1: Buy milk [Done]"));

    task.id = 2;
    task.title = QStringLiteral("Call dentist");
    task.done = false;
    task.deadline = QDate(2024, 3, 15);
    QCOMPARE(cli::formatTaskLine(task, plain), QStringLiteral("#2: Call dentist [Not Done] (Deadline: 2024-03-15)"));

    task.title = QStringLiteral("100% %1 sure");
    task.deadline = QDate();
    QCOMPARE(cli::formatTaskLine(task, plain), QStringLiteral("#2: 100% %1 sure [Not Done]"));
}

void TaskFormatterTest::coloredStatus()
{
    const cli::OutputStyle colored;

    data::TaskItem task;
    task.id = 3;
    task.title = QStringLiteral("Water plants");
    QCOMPARE(cli::formatTaskLine(task, colored), QStringLiteral("#3: Water plants [\033[31mNot Done\033[0m]"));

    task.done = true;
    QCOMPARE(cli::formatTaskLine(task, colored), QStringLiteral("#3: Water plants [\033[32mDone\033[0m]"));

    QCOMPARE(cli::colorize(QStringLiteral("x"), cli::ansi::Yellow, cli::OutputStyle{false}), QStringLiteral("x"));
}

void TaskFormatterTest::confirmations()
{
    const cli::OutputStyle plain{false};
    QCOMPARE(cli::formatAdded(4, QStringLiteral("Buy milk"), plain), QStringLiteral("Added task #4: Buy milk"));
    QCOMPARE(cli::formatDeleted(4, plain), QStringLiteral("Deleted task #4"));
    QCOMPARE(cli::formatMarkedDone(4, plain), QStringLiteral("Marked task #4 as done"));
    QCOMPARE(cli::formatCleared(plain), QStringLiteral("All tasks cleared!"));
    QCOMPARE(cli::formatEmptyList(plain), QStringLiteral("No tasks found"));

    const cli::OutputStyle colored;
    QCOMPARE(cli::formatAdded(4, QStringLiteral("Buy milk"), colored),
             QStringLiteral("\033[32mAdded task #4:\033[0m Buy milk"));
    QCOMPARE(cli::formatEmptyList(colored), QStringLiteral("\033[33mNo tasks found\033[0m"));
}

void TaskFormatterTest::usageListsEveryCommand()
{
    const QString usage = cli::usageText();
    QVERIFY(usage.startsWith(QStringLiteral("Usage:\n")));
    for (const char *command : {"add \"task name\"", "list", "delete <id>", "done <id>", "clear"}) {
        QVERIFY2(usage.contains(QLatin1String(command)), command);
    }
    QVERIFY(usage.endsWith(QLatin1Char('\n')));
}

QTEST_GUILESS_MAIN(TaskFormatterTest)
#include "TaskFormatterTest.moc"
