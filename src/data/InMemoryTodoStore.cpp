#include "todos/data/InMemoryTodoStore.hpp"

#include <QDateTime>
#include <algorithm>
#include <optional>
#include <utility>

#include "todos/data/SortKey.hpp"

namespace todos {
namespace data {

namespace {

struct Candidate
{
    SortKey key;
    const Todo *todo = nullptr;
};

// Max-heap ordering: the worst candidate stays on top.
bool candidateLess(const Candidate &lhs, const Candidate &rhs)
{
    return lhs.key < rhs.key;
}

} // namespace

InMemoryTodoStore::InMemoryTodoStore()
    : InMemoryTodoStore([]() { return QDateTime::currentSecsSinceEpoch(); })
{
}

InMemoryTodoStore::InMemoryTodoStore(Clock clock)
    : m_clock(std::move(clock))
{
}

InMemoryTodoStore::~InMemoryTodoStore() = default;

core::Result<Todo> InMemoryTodoStore::add(const NewTodo &item)
{
    const auto deadline = item.deadline.resolve();
    if (!deadline) {
        return deadline.error();
    }
    const auto title = item.title.validate();
    if (!title) {
        return title.error();
    }

    const qint64 now = m_clock();

    Todo todo;
    todo.id = createId();
    todo.title = title.value();
    todo.priority = item.priority;
    todo.status = TodoStatus::Backlog;
    todo.createdTimestamp = now;
    todo.updatedTimestamp = now;
    todo.deadline = deadline.value();

    m_items.insert(todo.id, todo);
    return todo;
}

core::Result<Todo> InMemoryTodoStore::update(const QUuid &id, const UpdateTodo &change)
{
    if (!change.hasChanges()) {
        return core::AppError::updateHasNoChanges();
    }

    // Resolved before the lookup so a bad deadline wins over an unknown id.
    const auto deadline = change.deadline.resolve();
    if (!deadline) {
        return deadline.error();
    }

    auto it = m_items.find(id);
    if (it == m_items.end()) {
        return core::AppError::todoNotFound(id);
    }

    std::optional<QString> title;
    if (change.title.has_value()) {
        const auto validated = change.title->validate();
        if (!validated) {
            return validated.error();
        }
        title = validated.value();
    }

    Todo &todo = it.value();
    bool modified = false;

    if (title.has_value() && todo.title != title.value()) {
        todo.title = title.value();
        modified = true;
    }
    if (change.priority.has_value() && todo.priority != change.priority.value()) {
        todo.priority = change.priority.value();
        modified = true;
    }
    if (change.status.has_value() && todo.status != change.status.value()) {
        todo.status = change.status.value();
        modified = true;
    }
    if (todo.deadline != deadline.value()) {
        todo.deadline = deadline.value();
        modified = true;
    }

    if (modified) {
        todo.updatedTimestamp = std::max(m_clock(), todo.updatedTimestamp);
    }
    return todo;
}

core::Result<std::vector<Todo>> InMemoryTodoStore::search(const Query &query) const
{
    const auto deadline = query.deadline.resolve();
    if (!deadline) {
        return deadline.error();
    }
    const auto limit = query.limit.resolve();
    if (!limit) {
        return limit.error();
    }
    const std::size_t topN = limit.value();

    std::vector<Candidate> heap;
    heap.reserve(topN);

    for (auto it = m_items.constBegin(); it != m_items.constEnd(); ++it) {
        const Todo &todo = it.value();
        if (!query.matches(todo, deadline.value())) {
            continue;
        }

        Candidate candidate{ SortKey::forTodo(todo, query.sort), &todo };
        if (heap.size() < topN) {
            heap.push_back(std::move(candidate));
            std::push_heap(heap.begin(), heap.end(), candidateLess);
        } else if (candidate.key < heap.front().key) {
            std::pop_heap(heap.begin(), heap.end(), candidateLess);
            heap.back() = std::move(candidate);
            std::push_heap(heap.begin(), heap.end(), candidateLess);
        }
    }

    std::sort_heap(heap.begin(), heap.end(), candidateLess);

    std::vector<Todo> result;
    result.reserve(heap.size());
    for (const auto &candidate : heap) {
        result.push_back(*candidate.todo);
    }
    return result;
}

core::Result<std::size_t> InMemoryTodoStore::countBy(const Query &query) const
{
    const auto deadline = query.deadline.resolve();
    if (!deadline) {
        return deadline.error();
    }

    const auto count = std::count_if(m_items.constBegin(), m_items.constEnd(), [&](const Todo &todo) {
        return query.matches(todo, deadline.value());
    });
    return static_cast<std::size_t>(count);
}

std::size_t InMemoryTodoStore::countAll() const
{
    return static_cast<std::size_t>(m_items.size());
}

core::Result<Todo> InMemoryTodoStore::get(const QUuid &id) const
{
    const auto it = m_items.constFind(id);
    if (it == m_items.constEnd()) {
        return core::AppError::todoNotFound(id);
    }
    return it.value();
}

core::Result<void> InMemoryTodoStore::remove(const QUuid &id)
{
    if (m_items.remove(id) == 0) {
        return core::AppError::todoNotFound(id);
    }
    return core::success();
}

core::Result<std::size_t> InMemoryTodoStore::removeByIds(const QSet<QUuid> &ids)
{
    if (ids.isEmpty()) {
        return core::AppError::collectionIsEmpty();
    }
    return removeWhere([&ids](const Todo &todo) { return ids.contains(todo.id); });
}

core::Result<std::size_t> InMemoryTodoStore::removeByPriorities(const QSet<TodoPriority> &priorities)
{
    if (priorities.isEmpty()) {
        return core::AppError::collectionIsEmpty();
    }
    return removeWhere([&priorities](const Todo &todo) { return priorities.contains(todo.priority); });
}

core::Result<std::size_t> InMemoryTodoStore::removeByStatuses(const QSet<TodoStatus> &statuses)
{
    if (statuses.isEmpty()) {
        return core::AppError::collectionIsEmpty();
    }
    return removeWhere([&statuses](const Todo &todo) { return statuses.contains(todo.status); });
}

std::size_t InMemoryTodoStore::removeAll()
{
    const std::size_t count = countAll();
    m_items.clear();
    return count;
}

std::size_t InMemoryTodoStore::removeWhere(const std::function<bool(const Todo &)> &shouldRemove)
{
    std::size_t removed = 0;
    for (auto it = m_items.begin(); it != m_items.end();) {
        if (shouldRemove(it.value())) {
            it = m_items.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

QUuid InMemoryTodoStore::createId() const
{
    QUuid id = QUuid::createUuid();
    while (m_items.contains(id)) {
        id = QUuid::createUuid();
    }
    return id;
}

} // namespace data
} // namespace todos
