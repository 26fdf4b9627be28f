#include "todos/data/Query.hpp"

namespace todos {
namespace data {

bool Query::matchesKeyword(const Todo &todo) const
{
    if (!keyword.has_value()) {
        return true;
    }
    return todo.title.contains(keyword.value(), Qt::CaseSensitive);
}

bool Query::matchesPriority(const Todo &todo) const
{
    return !priority.has_value() || todo.priority == priority.value();
}

bool Query::matchesStatus(const Todo &todo) const
{
    return !status.has_value() || todo.status == status.value();
}

bool Query::matchesDeadline(const std::optional<qint64> &bound, const Todo &todo)
{
    if (!bound.has_value()) {
        return true;
    }
    // Todos without a deadline always satisfy an upper bound.
    if (!todo.deadline.has_value()) {
        return true;
    }
    return todo.deadline.value() <= bound.value();
}

bool Query::matches(const Todo &todo, const std::optional<qint64> &deadlineBound) const
{
    return matchesKeyword(todo)
        && matchesPriority(todo)
        && matchesStatus(todo)
        && matchesDeadline(deadlineBound, todo);
}

} // namespace data
} // namespace todos
