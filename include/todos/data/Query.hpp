#pragma once

#include <QString>
#include <QtGlobal>
#include <optional>

#include "todos/data/DeadlineInput.hpp"
#include "todos/data/ResultLimit.hpp"
#include "todos/data/Todo.hpp"

namespace todos {
namespace data {

enum class QuerySort
{
    Deadline,
    Priority,
    Status,
};

// Unset criteria match every todo. Without a sort, results are ordered by title.
struct Query
{
    std::optional<QString> keyword;
    std::optional<TodoPriority> priority;
    std::optional<TodoStatus> status;
    DeadlineInput deadline;
    std::optional<QuerySort> sort;
    ResultLimit limit;

    bool matchesKeyword(const Todo &todo) const;
    bool matchesPriority(const Todo &todo) const;
    bool matchesStatus(const Todo &todo) const;
    static bool matchesDeadline(const std::optional<qint64> &bound, const Todo &todo);

    // deadlineBound is the already resolved value of `deadline`.
    bool matches(const Todo &todo, const std::optional<qint64> &deadlineBound) const;
};

} // namespace data
} // namespace todos
