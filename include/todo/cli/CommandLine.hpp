#pragma once

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QString>
#include <QStringList>

#include "todo/core/AppConfig.hpp"

namespace todo {
namespace cli {

struct Command
{
    enum class Kind
    {
        Add,
        List,
        Remove,
        Check,
        Undo,
        Cleanup,
        Clear,
    };

    Kind kind = Kind::List;
    QString note;
    int index = 0;
    bool listAll = false;
};

struct ParsedCommandLine
{
    enum class Status
    {
        Ok,
        Error,
        HelpRequested,
        VersionRequested,
    };

    Status status = Status::Ok;
    Command command;
    core::ConfigOverrides overrides;
    bool verbose = false;
    QString errorText;
};

// Accepts "todo <text>...", "todo ls [--all]", "todo check|undo|remove <index>",
// "todo cleanup" and "todo clear", plus the global options.
class CommandLine
{
public:
    CommandLine();

    // arguments[0] is the program name, as in QCoreApplication::arguments().
    ParsedCommandLine parse(const QStringList &arguments);

    QString helpText() const;

private:
    bool parseIndex(const QStringList &positionals, ParsedCommandLine &result) const;

    QCommandLineParser m_parser;
    QCommandLineOption m_helpOption;
    QCommandLineOption m_versionOption;
    QCommandLineOption m_fileOption;
    QCommandLineOption m_noColorOption;
    QCommandLineOption m_verboseOption;
    QCommandLineOption m_allOption;
};

} // namespace cli
} // namespace todo
