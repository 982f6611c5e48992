#include <QtTest/QtTest>

#include <limits>

#include "todo/cli/CommandLine.hpp"

using todo::cli::Command;
using todo::cli::CommandLine;
using todo::cli::ParsedCommandLine;

Q_DECLARE_METATYPE(todo::cli::Command::Kind)

namespace {

ParsedCommandLine parse(const QStringList &arguments)
{
    CommandLine commandLine;
    return commandLine.parse(QStringList{QStringLiteral("todo")} + arguments);
}

} // namespace

class CommandLineTest : public QObject
{
    Q_OBJECT

private slots:
    void bareTextAddsTask();
    void bareInvocationLists();
    void listCommands();
    void indexCommands_data();
    void indexCommands();
    void commandsWithoutArguments();
    void globalOptions();
    void helpAndVersion();
    void rejectsMalformedInput_data();
    void rejectsMalformedInput();
};

void CommandLineTest::bareTextAddsTask()
{
    const auto single = parse({QStringLiteral("buy milk")});
    QCOMPARE(single.status, ParsedCommandLine::Status::Ok);
    QCOMPARE(single.command.kind, Command::Kind::Add);
    QCOMPARE(single.command.note, QStringLiteral("buy milk"));

    const auto words = parse({QStringLiteral("buy"), QStringLiteral("oat"), QStringLiteral("milk")});
    QCOMPARE(words.command.kind, Command::Kind::Add);
    QCOMPARE(words.command.note, QStringLiteral("buy oat milk"));
}

void CommandLineTest::bareInvocationLists()
{
    const auto parsed = parse({});
    QCOMPARE(parsed.status, ParsedCommandLine::Status::Ok);
    QCOMPARE(parsed.command.kind, Command::Kind::List);
    QVERIFY(!parsed.command.listAll);
}

void CommandLineTest::listCommands()
{
    const auto ls = parse({QStringLiteral("ls")});
    QCOMPARE(ls.status, ParsedCommandLine::Status::Ok);
    QCOMPARE(ls.command.kind, Command::Kind::List);
    QVERIFY(!ls.command.listAll);

    const auto all = parse({QStringLiteral("ls"), QStringLiteral("--all")});
    QCOMPARE(all.status, ParsedCommandLine::Status::Ok);
    QVERIFY(all.command.listAll);

    const auto shortAll = parse({QStringLiteral("-a"), QStringLiteral("ls")});
    QVERIFY(shortAll.command.listAll);
}

void CommandLineTest::indexCommands_data()
{
    QTest::addColumn<QString>("name");
    QTest::addColumn<Command::Kind>("kind");

    QTest::newRow("check") << "check" << Command::Kind::Check;
    QTest::newRow("undo") << "undo" << Command::Kind::Undo;
    QTest::newRow("remove") << "remove" << Command::Kind::Remove;
}

void CommandLineTest::indexCommands()
{
    QFETCH(QString, name);
    QFETCH(Command::Kind, kind);

    const auto parsed = parse({name, QStringLiteral("3")});
    QCOMPARE(parsed.status, ParsedCommandLine::Status::Ok);
    QCOMPARE(parsed.command.kind, kind);
    QCOMPARE(parsed.command.index, 3);

    // Zero parses; the list treats it as out of range.
    const auto zero = parse({name, QStringLiteral("0")});
    QCOMPARE(zero.status, ParsedCommandLine::Status::Ok);
    QCOMPARE(zero.command.index, 0);

    const auto huge = parse({name, QStringLiteral("99999999999")});
    QCOMPARE(huge.status, ParsedCommandLine::Status::Ok);
    QCOMPARE(huge.command.index, std::numeric_limits<int>::max());
}

void CommandLineTest::commandsWithoutArguments()
{
    QCOMPARE(parse({QStringLiteral("cleanup")}).command.kind, Command::Kind::Cleanup);
    QCOMPARE(parse({QStringLiteral("clear")}).command.kind, Command::Kind::Clear);
}

void CommandLineTest::globalOptions()
{
    const auto parsed = parse({QStringLiteral("--file"),
                               QStringLiteral("/tmp/list.txt"),
                               QStringLiteral("--no-color"),
                               QStringLiteral("--verbose"),
                               QStringLiteral("ls")});
    QCOMPARE(parsed.status, ParsedCommandLine::Status::Ok);
    QCOMPARE(parsed.overrides.filePath, QStringLiteral("/tmp/list.txt"));
    QVERIFY(parsed.overrides.noColor);
    QVERIFY(parsed.verbose);

    const auto defaults = parse({QStringLiteral("ls")});
    QVERIFY(defaults.overrides.filePath.isEmpty());
    QVERIFY(!defaults.overrides.noColor);
    QVERIFY(!defaults.verbose);
}

void CommandLineTest::helpAndVersion()
{
    QCOMPARE(parse({QStringLiteral("--help")}).status, ParsedCommandLine::Status::HelpRequested);
    QCOMPARE(parse({QStringLiteral("--version")}).status, ParsedCommandLine::Status::VersionRequested);

    CommandLine commandLine;
    QVERIFY(commandLine.helpText().contains(QStringLiteral("--file")));
}

void CommandLineTest::rejectsMalformedInput_data()
{
    QTest::addColumn<QStringList>("arguments");

    QTest::newRow("check without index") << QStringList{QStringLiteral("check")};
    QTest::newRow("non-numeric index") << QStringList{QStringLiteral("undo"), QStringLiteral("two")};
    QTest::newRow("extra index") << QStringList{QStringLiteral("remove"), QStringLiteral("1"), QStringLiteral("2")};
    QTest::newRow("negative index") << QStringList{QStringLiteral("check"), QStringLiteral("-1")};
    QTest::newRow("ls with argument") << QStringList{QStringLiteral("ls"), QStringLiteral("extra")};
    QTest::newRow("cleanup with argument") << QStringList{QStringLiteral("cleanup"), QStringLiteral("1")};
    QTest::newRow("all without ls") << QStringList{QStringLiteral("--all"), QStringLiteral("buy milk")};
    QTest::newRow("unknown option") << QStringList{QStringLiteral("--bogus")};
    QTest::newRow("file without value") << QStringList{QStringLiteral("--file")};
}

void CommandLineTest::rejectsMalformedInput()
{
    QFETCH(QStringList, arguments);

    const auto parsed = parse(arguments);
    QCOMPARE(parsed.status, ParsedCommandLine::Status::Error);
    QVERIFY(!parsed.errorText.isEmpty());
}

QTEST_GUILESS_MAIN(CommandLineTest)
#include "CommandLineTest.moc"
