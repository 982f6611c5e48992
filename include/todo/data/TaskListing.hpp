#pragma once

#include <QString>
#include <QStringList>
#include <QVector>
#include <cstddef>
#include <iterator>

#include "todo/data/Task.hpp"

namespace todo {
namespace core {
class Palette;
}

namespace data {

// Lazily formatted listing lines over a task list. Each line reads
// " <index>. <glyph> <note>" where index is the position in the full list,
// so filtering never renumbers. Iteration can be restarted any number of
// times; the listing must not outlive the tasks it refers to.
class TaskListing
{
public:
    enum class Filter
    {
        All,
        Unchecked,
    };

    class const_iterator
    {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = QString;
        using difference_type = std::ptrdiff_t;
        using pointer = const QString *;
        using reference = QString;

        const_iterator() = default;

        QString operator*() const;
        const_iterator &operator++();
        const_iterator operator++(int);

        bool operator==(const const_iterator &other) const;
        bool operator!=(const const_iterator &other) const;

    private:
        friend class TaskListing;
        const_iterator(const TaskListing *listing, int position);

        void skipFiltered();

        const TaskListing *m_listing = nullptr;
        int m_position = 0;
    };

    TaskListing(const QVector<Task> &tasks, Filter filter, const core::Palette &palette);

    const_iterator begin() const;
    const_iterator end() const;

    bool isEmpty() const;
    QStringList toStringList() const;

private:
    bool accepts(const Task &task) const;
    QString formatLine(int position) const;

    const QVector<Task> *m_tasks = nullptr;
    Filter m_filter = Filter::All;
    const core::Palette *m_palette = nullptr;
};

} // namespace data
} // namespace todo
