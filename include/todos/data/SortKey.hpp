#pragma once

#include <QString>
#include <QUuid>
#include <QtGlobal>
#include <array>
#include <optional>

#include "todos/data/Query.hpp"
#include "todos/data/Todo.hpp"

namespace todos {
namespace data {

constexpr std::array<TodoStatus, 3> StatusSortOrder = {
    TodoStatus::InProgress,
    TodoStatus::Backlog,
    TodoStatus::Done,
};

int priorityRank(TodoPriority priority);
int statusRank(TodoStatus status);

// Smaller keys sort first. Equal dimension values are ordered by todo id.
class SortKey
{
public:
    static SortKey forTodo(const Todo &todo, const std::optional<QuerySort> &sort);

    bool operator<(const SortKey &other) const;
    bool operator==(const SortKey &other) const;

private:
    int m_rank = 0;
    qint64 m_value = 0;
    QString m_text;
    QUuid m_id;
};

} // namespace data
} // namespace todos
