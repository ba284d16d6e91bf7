#pragma once

#include <optional>

#include <QString>
#include <QStringList>

namespace tasklist {
namespace cli {

struct GlobalOptions
{
    bool showVersion = false;
    bool noColor = false;
    // Command name followed by its arguments.
    QStringList commandArguments;
};

// arguments starts with the program name, as QCoreApplication::arguments() does.
// Options are only recognized before the command.
std::optional<GlobalOptions> parseGlobalOptions(const QStringList &arguments, QString *errorText = nullptr);

} // namespace cli
} // namespace tasklist
