#include "todo/data/Task.hpp"

#include <QChar>
#include <QRegularExpression>

#include "todo/core/Palette.hpp"

namespace todo {
namespace data {

namespace {
constexpr auto DONE_MARKER = "- [x] ";
constexpr auto TODO_MARKER = "- [ ] ";

const QRegularExpression &linePattern()
{
    static const QRegularExpression pattern(QStringLiteral("^- \\[(.)\\] (.*)$"),
                                            QRegularExpression::DotMatchesEverythingOption);
    return pattern;
}
} // namespace

Task::Task(QString note, TaskStatus status)
    : m_note(std::move(note))
    , m_status(status)
{
}

TaskStatus Task::status() const
{
    return m_status;
}

const QString &Task::note() const
{
    return m_note;
}

bool Task::isDone() const
{
    return m_status == TaskStatus::Done;
}

Task Task::check() const
{
    return Task(m_note, TaskStatus::Done);
}

Task Task::undo() const
{
    return Task(m_note, TaskStatus::Todo);
}

std::optional<Task> Task::parse(const QString &line)
{
    if (!isValidNote(line)) {
        return std::nullopt;
    }
    const QRegularExpressionMatch match = linePattern().match(line);
    if (!match.hasMatch()) {
        return std::nullopt;
    }

    const QString marker = match.captured(1);
    if (marker == QLatin1String("x")) {
        return Task(match.captured(2), TaskStatus::Done);
    }
    if (marker == QLatin1String(" ")) {
        return Task(match.captured(2), TaskStatus::Todo);
    }
    return std::nullopt;
}

QString Task::render() const
{
    return QLatin1String(isDone() ? DONE_MARKER : TODO_MARKER) + m_note;
}

QString Task::displayText(const core::Palette &palette) const
{
    const QString glyph = isDone() ? palette.paint(QStringLiteral("✓"), core::Palette::Color::Green)
                                   : palette.paint(QStringLiteral("✖"), core::Palette::Color::Red);
    return glyph + QLatin1Char(' ') + m_note;
}

bool Task::isValidNote(const QString &note)
{
    for (const QChar ch : note) {
        if (ch == QLatin1Char('\n') || ch == QLatin1Char('\r') || ch == QChar::LineSeparator
            || ch == QChar::ParagraphSeparator) {
            return false;
        }
    }
    return true;
}

bool Task::operator==(const Task &other) const
{
    return m_status == other.m_status && m_note == other.m_note;
}

bool Task::operator!=(const Task &other) const
{
    return !(*this == other);
}

} // namespace data
} // namespace todo
