#pragma once

#include <QString>
#include <optional>

namespace todo {
namespace core {
class Palette;
}

namespace data {

enum class TaskStatus
{
    Todo,
    Done,
};

class Task
{
public:
    explicit Task(QString note = QString(), TaskStatus status = TaskStatus::Todo);

    TaskStatus status() const;
    const QString &note() const;
    bool isDone() const;

    // Both transitions are idempotent.
    Task check() const;
    Task undo() const;

    // Parses one line of the todo file: "- [x] note" or "- [ ] note".
    static std::optional<Task> parse(const QString &line);
    QString render() const;

    // Colored glyph and note, for terminal listings only.
    QString displayText(const core::Palette &palette) const;

    static bool isValidNote(const QString &note);

    bool operator==(const Task &other) const;
    bool operator!=(const Task &other) const;

private:
    QString m_note;
    TaskStatus m_status = TaskStatus::Todo;
};

} // namespace data
} // namespace todo
