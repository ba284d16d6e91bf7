#include <QtTest/QtTest>

#include "tasklist/cli/GlobalOptions.hpp"

using namespace tasklist;

class GlobalOptionsTest : public QObject
{
    Q_OBJECT

private slots:
    void commandOnly();
    void noColorBeforeCommand();
    void versionFlag();
    void optionsAfterCommandArePositional();
    void unknownOptionFails();
};

void GlobalOptionsTest::commandOnly()
{
    const auto options = cli::parseGlobalOptions({QStringLiteral("tasklist"), QStringLiteral("list")});
    QVERIFY(options.has_value());
    QVERIFY(!options->noColor);
    QVERIFY(!options->showVersion);
    QCOMPARE(options->commandArguments, QStringList{QStringLiteral("list")});
}

void GlobalOptionsTest::noColorBeforeCommand()
{
    const auto options = cli::parseGlobalOptions(
        {QStringLiteral("tasklist"), QStringLiteral("--no-color"), QStringLiteral("done"), QStringLiteral("2")});
    QVERIFY(options.has_value());
    QVERIFY(options->noColor);
    const QStringList expected = {QStringLiteral("done"), QStringLiteral("2")};
    QCOMPARE(options->commandArguments, expected);
}

void GlobalOptionsTest::versionFlag()
{
    const auto options = cli::parseGlobalOptions({QStringLiteral("tasklist"), QStringLiteral("--version")});
    QVERIFY(options.has_value());
    QVERIFY(options->showVersion);
    QVERIFY(options->commandArguments.isEmpty());
}

void GlobalOptionsTest::optionsAfterCommandArePositional()
{
    const auto options = cli::parseGlobalOptions(
        {QStringLiteral("tasklist"), QStringLiteral("add"), QStringLiteral("-x"), QStringLiteral("--no-color")});
    QVERIFY(options.has_value());
    QVERIFY(!options->noColor);
    const QStringList expected = {QStringLiteral("add"), QStringLiteral("-x"), QStringLiteral("--no-color")};
    QCOMPARE(options->commandArguments, expected);
}

void GlobalOptionsTest::unknownOptionFails()
{
    QString errorText;
    const auto options = cli::parseGlobalOptions({QStringLiteral("tasklist"), QStringLiteral("--colour")}, &errorText);
    QVERIFY(!options.has_value());
    QVERIFY(errorText.contains(QStringLiteral("colour")));
}

QTEST_GUILESS_MAIN(GlobalOptionsTest)
#include "GlobalOptionsTest.moc"
