#include <QCoreApplication>
#include <QSettings>
#include <QString>
#include <QTextStream>

#include <cstdio>

#include "version.h"

#include "todo/cli/CommandLine.hpp"
#include "todo/cli/CommandRunner.hpp"
#include "todo/core/AppConfig.hpp"
#include "todo/core/AppContext.hpp"
#include "todo/core/Logging.hpp"
#include "todo/data/TaskList.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("todo"));
    QCoreApplication::setApplicationName(QStringLiteral("todo"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kTodoVersion));

    QCoreApplication app(argc, argv);
    qSetMessagePattern(QStringLiteral("%{category}: %{message}"));

    QTextStream out(stdout);
    QTextStream err(stderr);
    out.setCodec("UTF-8");
    err.setCodec("UTF-8");

    todo::cli::CommandLine commandLine;
    const auto parsed = commandLine.parse(app.arguments());
    switch (parsed.status) {
    case todo::cli::ParsedCommandLine::Status::HelpRequested:
        out << commandLine.helpText();
        return todo::cli::ExitSuccess;
    case todo::cli::ParsedCommandLine::Status::VersionRequested:
        out << QCoreApplication::applicationName() << ' ' << QCoreApplication::applicationVersion() << '\n';
        return todo::cli::ExitSuccess;
    case todo::cli::ParsedCommandLine::Status::Error:
        err << "todo: " << parsed.errorText << '\n' << commandLine.helpText();
        return todo::cli::ExitUsage;
    case todo::cli::ParsedCommandLine::Status::Ok:
        break;
    }

    if (parsed.verbose) {
        todo::core::enableVerboseLogging();
    }

    QSettings settings;
    QString configError;
    const auto config =
        todo::core::AppConfig::resolve(parsed.overrides, todo::core::ConfigSources::system(settings), &configError);
    if (!config) {
        err << "todo: " << configError << '\n';
        return todo::cli::ExitFailure;
    }

    todo::core::AppContext context(*config);
    todo::data::LoadError loadError;
    if (!context.open(&loadError)) {
        err << "todo: " << loadError.toString() << '\n';
        return todo::cli::ExitFailure;
    }

    todo::cli::CommandRunner runner(context.taskList(), context.palette(), out, err);
    return runner.run(parsed.command);
}
