#include "todo/data/TaskList.hpp"

#include <QStringList>
#include <algorithm>

#include "todo/core/Logging.hpp"

namespace todo {
namespace data {

QString LoadError::toString() const
{
    if (kind == Kind::Parse) {
        return QStringLiteral("failed to parse line %1 of %2: \"%3\"").arg(lineNumber).arg(filePath, line);
    }
    return message;
}

TaskList::TaskList(TaskFile file, QVector<Task> tasks)
    : m_file(std::move(file))
    , m_tasks(std::move(tasks))
{
}

std::optional<TaskList> TaskList::load(const QString &filePath, LoadError *error)
{
    TaskFile file(filePath);
    QStringList lines;
    QString errorString;
    int invalidLineNumber = 0;
    QString invalidLine;
    if (!file.readLines(&lines, &errorString, &invalidLineNumber, &invalidLine)) {
        qCDebug(core::lcData) << "load failed:" << errorString;
        if (error) {
            error->kind = invalidLineNumber > 0 ? LoadError::Kind::Parse : LoadError::Kind::Io;
            error->filePath = filePath;
            error->lineNumber = invalidLineNumber;
            error->line = invalidLine;
            error->message = errorString;
        }
        return std::nullopt;
    }

    QVector<Task> tasks;
    tasks.reserve(lines.size());
    for (int i = 0; i < lines.size(); ++i) {
        const QString &line = lines.at(i);
        if (line.isEmpty()) {
            continue;
        }
        auto task = Task::parse(line);
        if (!task) {
            qCDebug(core::lcData) << "unparseable line" << i + 1 << "in" << filePath;
            if (error) {
                error->kind = LoadError::Kind::Parse;
                error->filePath = filePath;
                error->lineNumber = i + 1;
                error->line = line;
                error->message = QStringLiteral("line does not match \"- [x] note\" or \"- [ ] note\"");
            }
            return std::nullopt;
        }
        tasks.append(std::move(*task));
    }

    qCDebug(core::lcData) << "loaded" << tasks.size() << "tasks from" << filePath;
    return TaskList(std::move(file), std::move(tasks));
}

const QString &TaskList::filePath() const
{
    return m_file.filePath();
}

const QVector<Task> &TaskList::tasks() const
{
    return m_tasks;
}

int TaskList::size() const
{
    return m_tasks.size();
}

bool TaskList::isEmpty() const
{
    return m_tasks.isEmpty();
}

bool TaskList::save()
{
    QStringList lines;
    lines.reserve(m_tasks.size());
    for (const Task &task : m_tasks) {
        lines << task.render();
    }

    QString errorString;
    if (!m_file.writeLines(lines, &errorString)) {
        qCDebug(core::lcData) << "save failed:" << errorString;
        m_errorString = errorString;
        return false;
    }
    m_errorString.clear();
    return true;
}

QString TaskList::errorString() const
{
    return m_errorString;
}

template<typename Action>
ChangeResult TaskList::modify(Action action)
{
    action(m_tasks);
    return save() ? ChangeResult::Applied : ChangeResult::WriteFailed;
}

ChangeResult TaskList::add(const QString &note)
{
    if (!Task::isValidNote(note)) {
        qCDebug(core::lcData) << "rejecting note with a line break";
        return ChangeResult::InvalidNote;
    }
    return modify([&note](QVector<Task> &tasks) { tasks.append(Task(note)); });
}

bool TaskList::isInRange(int index) const
{
    return index >= 1 && index <= m_tasks.size();
}

ChangeResult TaskList::check(int index)
{
    if (!isInRange(index)) {
        qCDebug(core::lcData) << "check: index" << index << "out of range";
        return ChangeResult::IndexOutOfRange;
    }
    return modify([index](QVector<Task> &tasks) {
        Task &task = tasks[index - 1];
        task = task.check();
    });
}

ChangeResult TaskList::undo(int index)
{
    if (!isInRange(index)) {
        qCDebug(core::lcData) << "undo: index" << index << "out of range";
        return ChangeResult::IndexOutOfRange;
    }
    return modify([index](QVector<Task> &tasks) {
        Task &task = tasks[index - 1];
        task = task.undo();
    });
}

ChangeResult TaskList::remove(int index)
{
    if (!isInRange(index)) {
        qCDebug(core::lcData) << "remove: index" << index << "out of range";
        return ChangeResult::IndexOutOfRange;
    }
    return modify([index](QVector<Task> &tasks) { tasks.removeAt(index - 1); });
}

ChangeResult TaskList::cleanup()
{
    return modify([](QVector<Task> &tasks) {
        tasks.erase(std::remove_if(tasks.begin(), tasks.end(), [](const Task &task) { return task.isDone(); }),
                    tasks.end());
    });
}

ChangeResult TaskList::clear()
{
    return modify([](QVector<Task> &tasks) { tasks.clear(); });
}

TaskListing TaskList::printUnchecked(const core::Palette &palette) const
{
    return TaskListing(m_tasks, TaskListing::Filter::Unchecked, palette);
}

TaskListing TaskList::printAll(const core::Palette &palette) const
{
    return TaskListing(m_tasks, TaskListing::Filter::All, palette);
}

} // namespace data
} // namespace todo
