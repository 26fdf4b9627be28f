#pragma once

#include <QSet>
#include <QUuid>
#include <cstddef>
#include <vector>

#include "todos/core/Result.hpp"
#include "todos/data/Query.hpp"
#include "todos/data/Todo.hpp"

namespace todos {
namespace data {

class TodoStore
{
public:
    virtual ~TodoStore() = default;

    virtual core::Result<Todo> add(const NewTodo &item) = 0;
    virtual core::Result<Todo> update(const QUuid &id, const UpdateTodo &change) = 0;

    virtual core::Result<std::vector<Todo>> search(const Query &query) const = 0;
    virtual core::Result<std::size_t> countBy(const Query &query) const = 0;
    virtual std::size_t countAll() const = 0;
    virtual core::Result<Todo> get(const QUuid &id) const = 0;

    virtual core::Result<void> remove(const QUuid &id) = 0;
    virtual core::Result<std::size_t> removeByIds(const QSet<QUuid> &ids) = 0;
    virtual core::Result<std::size_t> removeByPriorities(const QSet<TodoPriority> &priorities) = 0;
    virtual core::Result<std::size_t> removeByStatuses(const QSet<TodoStatus> &statuses) = 0;
    virtual std::size_t removeAll() = 0;

    std::size_t removeByStatus(TodoStatus status);
};

} // namespace data
} // namespace todos
