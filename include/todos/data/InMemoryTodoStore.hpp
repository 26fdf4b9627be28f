#pragma once

#include <QHash>
#include <QtGlobal>
#include <functional>

#include "todos/data/TodoStore.hpp"

namespace todos {
namespace data {

class InMemoryTodoStore : public TodoStore
{
public:
    // Returns the current time in unix seconds.
    using Clock = std::function<qint64()>;

    InMemoryTodoStore();
    explicit InMemoryTodoStore(Clock clock);
    ~InMemoryTodoStore() override;

    core::Result<Todo> add(const NewTodo &item) override;
    core::Result<Todo> update(const QUuid &id, const UpdateTodo &change) override;

    core::Result<std::vector<Todo>> search(const Query &query) const override;
    core::Result<std::size_t> countBy(const Query &query) const override;
    std::size_t countAll() const override;
    core::Result<Todo> get(const QUuid &id) const override;

    core::Result<void> remove(const QUuid &id) override;
    core::Result<std::size_t> removeByIds(const QSet<QUuid> &ids) override;
    core::Result<std::size_t> removeByPriorities(const QSet<TodoPriority> &priorities) override;
    core::Result<std::size_t> removeByStatuses(const QSet<TodoStatus> &statuses) override;
    std::size_t removeAll() override;

private:
    std::size_t removeWhere(const std::function<bool(const Todo &)> &shouldRemove);
    QUuid createId() const;

    Clock m_clock;
    QHash<QUuid, Todo> m_items;
};

} // namespace data
} // namespace todos
