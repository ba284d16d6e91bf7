#include <QCoreApplication>
#include <QObject>
#include <QString>
#include <QTextStream>

#include <cstdio>

#include "version.h"

#include "tasklist/cli/CommandDispatcher.hpp"
#include "tasklist/cli/GlobalOptions.hpp"
#include "tasklist/core/AppContext.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("Tasklist"));
    QCoreApplication::setApplicationName(QStringLiteral("tasklist"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kTasklistVersion));

    QCoreApplication app(argc, argv);

    QTextStream out(stdout);
    QString errorText;
    const auto options = tasklist::cli::parseGlobalOptions(app.arguments(), &errorText);
    if (!options) {
        out << QObject::tr("Error: %1").arg(errorText) << '\n';
        out << tasklist::cli::usageText();
        return 1;
    }
    if (options->showVersion) {
        out << QCoreApplication::applicationName() << ' ' << QCoreApplication::applicationVersion() << '\n';
        return 0;
    }

    tasklist::core::AppContext context;
    if (options->noColor) {
        context.setColorEnabled(false);
    }

    tasklist::cli::CommandDispatcher dispatcher(context.taskStore(), out, context.outputStyle());
    const auto status = dispatcher.run(options->commandArguments);
    return tasklist::cli::exitCodeFor(status);
}
