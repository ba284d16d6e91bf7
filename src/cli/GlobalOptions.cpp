#include "tasklist/cli/GlobalOptions.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QObject>

namespace tasklist {
namespace cli {

std::optional<GlobalOptions> parseGlobalOptions(const QStringList &arguments, QString *errorText)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QObject::tr("Keeps a to-do list in tasks.txt in the current directory."));
    parser.setOptionsAfterPositionalArgumentsMode(QCommandLineParser::ParseAsPositionalArguments);
    const QCommandLineOption versionOption = parser.addVersionOption();
    const QCommandLineOption noColorOption(QStringLiteral("no-color"), QObject::tr("Print without ANSI colors."));
    parser.addOption(noColorOption);
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QObject::tr("One of add, list, delete, done, clear."),
                                 QStringLiteral("<command> [args...]"));

    if (!parser.parse(arguments)) {
        if (errorText) {
            *errorText = parser.errorText();
        }
        return std::nullopt;
    }

    GlobalOptions options;
    options.showVersion = parser.isSet(versionOption);
    options.noColor = parser.isSet(noColorOption);
    options.commandArguments = parser.positionalArguments();
    return options;
}

} // namespace cli
} // namespace tasklist
