#pragma once

#include <QString>
#include <QVector>
#include <optional>

#include "todo/data/Task.hpp"
#include "todo/data/TaskFile.hpp"
#include "todo/data/TaskListing.hpp"

namespace todo {
namespace core {
class Palette;
}

namespace data {

struct LoadError
{
    enum class Kind
    {
        Io,
        Parse,
    };

    Kind kind = Kind::Io;
    QString filePath;
    // 1-based; only set for parse errors.
    int lineNumber = 0;
    QString line;
    QString message;

    QString toString() const;
};

enum class ChangeResult
{
    Applied,
    IndexOutOfRange,
    InvalidNote,
    WriteFailed,
};

// Ordered, file-backed task list. Every mutation that changes the list
// rewrites the whole file before returning.
class TaskList
{
public:
    static std::optional<TaskList> load(const QString &filePath, LoadError *error = nullptr);

    const QString &filePath() const;
    const QVector<Task> &tasks() const;
    int size() const;
    bool isEmpty() const;

    bool save();
    QString errorString() const;

    ChangeResult add(const QString &note);

    // Indexes are 1-based. Out-of-range indexes leave list and file alone.
    ChangeResult check(int index);
    ChangeResult undo(int index);
    ChangeResult remove(int index);

    ChangeResult cleanup();
    ChangeResult clear();

    TaskListing printUnchecked(const core::Palette &palette) const;
    TaskListing printAll(const core::Palette &palette) const;

private:
    TaskList(TaskFile file, QVector<Task> tasks);

    bool isInRange(int index) const;

    template<typename Action>
    ChangeResult modify(Action action);

    TaskFile m_file;
    QVector<Task> m_tasks;
    QString m_errorString;
};

} // namespace data
} // namespace todo
