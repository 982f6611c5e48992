#pragma once

#include <QTextStream>

#include "todo/cli/CommandLine.hpp"
#include "todo/data/TaskList.hpp"

namespace todo {
namespace core {
class Palette;
}

namespace cli {

enum ExitCode
{
    ExitSuccess = 0,
    ExitFailure = 1,
    ExitUsage = 2,
};

class CommandRunner
{
public:
    CommandRunner(data::TaskList &taskList, const core::Palette &palette, QTextStream &out, QTextStream &err);

    // Applies the command, then prints the unchecked tasks unless the
    // command was "ls --all". Returns the process exit code.
    int run(const Command &command);

private:
    data::ChangeResult apply(const Command &command);
    void printListing(const data::TaskListing &listing);

    data::TaskList &m_taskList;
    const core::Palette &m_palette;
    QTextStream &m_out;
    QTextStream &m_err;
};

} // namespace cli
} // namespace todo
