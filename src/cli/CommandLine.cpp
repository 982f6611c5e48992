#include "todo/cli/CommandLine.hpp"

#include <QCoreApplication>

#include <limits>

namespace todo {
namespace cli {

namespace {
const QString LS = QStringLiteral("ls");
const QString REMOVE = QStringLiteral("remove");
const QString CHECK = QStringLiteral("check");
const QString UNDO = QStringLiteral("undo");
const QString CLEANUP = QStringLiteral("cleanup");
const QString CLEAR = QStringLiteral("clear");

ParsedCommandLine fail(ParsedCommandLine result, const QString &message)
{
    result.status = ParsedCommandLine::Status::Error;
    result.errorText = message;
    return result;
}
} // namespace

CommandLine::CommandLine()
    : m_helpOption(m_parser.addHelpOption())
    , m_versionOption(m_parser.addVersionOption())
    , m_fileOption({QStringLiteral("f"), QStringLiteral("file")},
                   QCoreApplication::translate("CommandLine", "Use <path> as the todo file."),
                   QStringLiteral("path"))
    , m_noColorOption(QStringLiteral("no-color"),
                      QCoreApplication::translate("CommandLine", "Do not color the listing."))
    , m_verboseOption(QStringLiteral("verbose"),
                      QCoreApplication::translate("CommandLine", "Print debug output to stderr."))
    , m_allOption({QStringLiteral("a"), QStringLiteral("all")},
                  QCoreApplication::translate("CommandLine", "With ls: list checked tasks too."))
{
    m_parser.setApplicationDescription(QCoreApplication::translate("CommandLine", "CLI todo list tool"));
    m_parser.addOption(m_fileOption);
    m_parser.addOption(m_noColorOption);
    m_parser.addOption(m_verboseOption);
    m_parser.addOption(m_allOption);
    m_parser.addPositionalArgument(
        QStringLiteral("command"),
        QCoreApplication::translate("CommandLine",
                                    "Task text to add, or one of: ls, check <index>, undo <index>, "
                                    "remove <index>, cleanup, clear."),
        QStringLiteral("<task text>|<command>"));
}

ParsedCommandLine CommandLine::parse(const QStringList &arguments)
{
    ParsedCommandLine result;
    if (!m_parser.parse(arguments)) {
        return fail(result, m_parser.errorText());
    }
    if (m_parser.isSet(m_helpOption)) {
        result.status = ParsedCommandLine::Status::HelpRequested;
        return result;
    }
    if (m_parser.isSet(m_versionOption)) {
        result.status = ParsedCommandLine::Status::VersionRequested;
        return result;
    }

    result.overrides.filePath = m_parser.value(m_fileOption);
    result.overrides.noColor = m_parser.isSet(m_noColorOption);
    result.verbose = m_parser.isSet(m_verboseOption);

    const QStringList positionals = m_parser.positionalArguments();
    const QString name = positionals.value(0);
    const bool listAll = m_parser.isSet(m_allOption);
    if (listAll && name != LS) {
        return fail(result, QStringLiteral("--all is only valid with ls"));
    }

    if (positionals.isEmpty()) {
        result.command.kind = Command::Kind::List;
        return result;
    }

    if (name == LS) {
        if (positionals.size() > 1) {
            return fail(result, QStringLiteral("ls takes no arguments"));
        }
        result.command.kind = Command::Kind::List;
        result.command.listAll = listAll;
        return result;
    }

    if (name == CHECK || name == UNDO || name == REMOVE) {
        if (name == CHECK) {
            result.command.kind = Command::Kind::Check;
        } else if (name == UNDO) {
            result.command.kind = Command::Kind::Undo;
        } else {
            result.command.kind = Command::Kind::Remove;
        }
        if (!parseIndex(positionals, result)) {
            result.status = ParsedCommandLine::Status::Error;
        }
        return result;
    }

    if (name == CLEANUP || name == CLEAR) {
        if (positionals.size() > 1) {
            return fail(result, QStringLiteral("%1 takes no arguments").arg(name));
        }
        result.command.kind = name == CLEANUP ? Command::Kind::Cleanup : Command::Kind::Clear;
        return result;
    }

    result.command.kind = Command::Kind::Add;
    result.command.note = positionals.join(QLatin1Char(' '));
    return result;
}

QString CommandLine::helpText() const
{
    return m_parser.helpText();
}

bool CommandLine::parseIndex(const QStringList &positionals, ParsedCommandLine &result) const
{
    const QString &name = positionals.first();
    if (positionals.size() != 2) {
        result.errorText = QStringLiteral("%1 expects exactly one <index>").arg(name);
        return false;
    }

    bool ok = false;
    const qulonglong index = positionals.at(1).toULongLong(&ok);
    if (!ok) {
        result.errorText = QStringLiteral("invalid index \"%1\"").arg(positionals.at(1));
        return false;
    }
    // Indices past INT_MAX can never name a task; clamp so they stay out of range.
    const qulonglong limit = static_cast<qulonglong>(std::numeric_limits<int>::max());
    result.command.index = static_cast<int>(qMin(index, limit));
    return true;
}

} // namespace cli
} // namespace todo
