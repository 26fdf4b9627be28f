#include "todos/data/SortKey.hpp"

#include <algorithm>
#include <iterator>

namespace todos {
namespace data {

int priorityRank(TodoPriority priority)
{
    switch (priority) {
    case TodoPriority::High: return 0;
    case TodoPriority::Medium: return 1;
    case TodoPriority::Low: return 2;
    }
    return 3;
}

int statusRank(TodoStatus status)
{
    const auto it = std::find(StatusSortOrder.begin(), StatusSortOrder.end(), status);
    return static_cast<int>(std::distance(StatusSortOrder.begin(), it));
}

SortKey SortKey::forTodo(const Todo &todo, const std::optional<QuerySort> &sort)
{
    SortKey key;
    key.m_id = todo.id;
    if (!sort.has_value()) {
        key.m_text = todo.title;
        return key;
    }

    switch (sort.value()) {
    case QuerySort::Priority:
        key.m_rank = priorityRank(todo.priority);
        break;
    case QuerySort::Status:
        key.m_rank = statusRank(todo.status);
        break;
    case QuerySort::Deadline:
        // Todos without a deadline go last.
        key.m_rank = todo.deadline.has_value() ? 0 : 1;
        key.m_value = todo.deadline.value_or(0);
        break;
    }
    return key;
}

bool SortKey::operator<(const SortKey &other) const
{
    if (m_rank != other.m_rank) {
        return m_rank < other.m_rank;
    }
    if (m_value != other.m_value) {
        return m_value < other.m_value;
    }
    const int textOrder = QString::compare(m_text, other.m_text, Qt::CaseSensitive);
    if (textOrder != 0) {
        return textOrder < 0;
    }
    return m_id < other.m_id;
}

bool SortKey::operator==(const SortKey &other) const
{
    return m_rank == other.m_rank
        && m_value == other.m_value
        && m_text == other.m_text
        && m_id == other.m_id;
}

} // namespace data
} // namespace todos
