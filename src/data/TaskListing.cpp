#include "todo/data/TaskListing.hpp"

#include <QStringList>

#include "todo/core/Palette.hpp"

namespace todo {
namespace data {

TaskListing::const_iterator::const_iterator(const TaskListing *listing, int position)
    : m_listing(listing)
    , m_position(position)
{
    skipFiltered();
}

QString TaskListing::const_iterator::operator*() const
{
    return m_listing->formatLine(m_position);
}

TaskListing::const_iterator &TaskListing::const_iterator::operator++()
{
    ++m_position;
    skipFiltered();
    return *this;
}

TaskListing::const_iterator TaskListing::const_iterator::operator++(int)
{
    const_iterator previous = *this;
    ++(*this);
    return previous;
}

bool TaskListing::const_iterator::operator==(const const_iterator &other) const
{
    return m_listing == other.m_listing && m_position == other.m_position;
}

bool TaskListing::const_iterator::operator!=(const const_iterator &other) const
{
    return !(*this == other);
}

void TaskListing::const_iterator::skipFiltered()
{
    if (!m_listing) {
        return;
    }
    const auto &tasks = *m_listing->m_tasks;
    while (m_position < tasks.size() && !m_listing->accepts(tasks.at(m_position))) {
        ++m_position;
    }
}

TaskListing::TaskListing(const QVector<Task> &tasks, Filter filter, const core::Palette &palette)
    : m_tasks(&tasks)
    , m_filter(filter)
    , m_palette(&palette)
{
}

TaskListing::const_iterator TaskListing::begin() const
{
    return const_iterator(this, 0);
}

TaskListing::const_iterator TaskListing::end() const
{
    return const_iterator(this, m_tasks->size());
}

bool TaskListing::isEmpty() const
{
    return begin() == end();
}

QStringList TaskListing::toStringList() const
{
    QStringList lines;
    for (const QString &line : *this) {
        lines << line;
    }
    return lines;
}

bool TaskListing::accepts(const Task &task) const
{
    switch (m_filter) {
    case Filter::Unchecked:
        return !task.isDone();
    case Filter::All:
        return true;
    }
    return true;
}

QString TaskListing::formatLine(int position) const
{
    const QString index = m_palette->dimmed(QStringLiteral("%1.").arg(position + 1));
    return QLatin1Char(' ') + index + QLatin1Char(' ') + m_tasks->at(position).displayText(*m_palette);
}

} // namespace data
} // namespace todo
