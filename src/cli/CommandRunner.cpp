#include "todo/cli/CommandRunner.hpp"

#include "todo/core/Logging.hpp"
#include "todo/core/Palette.hpp"

namespace todo {
namespace cli {

CommandRunner::CommandRunner(data::TaskList &taskList,
                             const core::Palette &palette,
                             QTextStream &out,
                             QTextStream &err)
    : m_taskList(taskList)
    , m_palette(palette)
    , m_out(out)
    , m_err(err)
{
}

int CommandRunner::run(const Command &command)
{
    if (command.kind == Command::Kind::List && command.listAll) {
        printListing(m_taskList.printAll(m_palette));
        return ExitSuccess;
    }

    switch (apply(command)) {
    case data::ChangeResult::WriteFailed:
        m_err << "todo: " << m_taskList.errorString() << '\n';
        m_err.flush();
        return ExitFailure;
    case data::ChangeResult::InvalidNote:
        m_err << "todo: a task must fit on one line\n";
        m_err.flush();
        return ExitUsage;
    case data::ChangeResult::IndexOutOfRange:
        qCDebug(core::lcCli) << "no task at index" << command.index << "of" << m_taskList.size();
        break;
    case data::ChangeResult::Applied:
        break;
    }

    printListing(m_taskList.printUnchecked(m_palette));
    return ExitSuccess;
}

data::ChangeResult CommandRunner::apply(const Command &command)
{
    switch (command.kind) {
    case Command::Kind::Add:
        return m_taskList.add(command.note);
    case Command::Kind::Remove:
        return m_taskList.remove(command.index);
    case Command::Kind::Check:
        return m_taskList.check(command.index);
    case Command::Kind::Undo:
        return m_taskList.undo(command.index);
    case Command::Kind::Cleanup:
        return m_taskList.cleanup();
    case Command::Kind::Clear:
        return m_taskList.clear();
    case Command::Kind::List:
        return data::ChangeResult::Applied;
    }
    return data::ChangeResult::Applied;
}

void CommandRunner::printListing(const data::TaskListing &listing)
{
    for (const QString &line : listing) {
        m_out << line << '\n';
    }
    m_out.flush();
}

} // namespace cli
} // namespace todo
