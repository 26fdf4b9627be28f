#include "todos/bridge/TodoBridge.hpp"

#include <QSet>
#include <QUuid>

#include "todos/bridge/Conversions.hpp"
#include "todos/bridge/ErrorText.hpp"
#include "todos/core/Logging.hpp"
#include "todos/data/TodoStore.hpp"
#include "version.h"

namespace todos {
namespace bridge {

namespace {

template <typename T>
core::Result<T> logged(const char *operation, core::Result<T> result)
{
    if (!result) {
        qCWarning(todosBridge) << operation << "failed:" << describe(result.error());
    }
    return result;
}

core::Result<quint64> removedCount(const char *operation, const core::Result<std::size_t> &removed)
{
    if (!removed) {
        return logged<quint64>(operation, removed.error());
    }
    qCInfo(todosBridge) << operation << "removed" << removed.value() << "todos";
    return logged(operation, u64From(removed.value()));
}

} // namespace

TodoBridge::TodoBridge(data::TodoStore &store)
    : m_store(store)
{
}

core::Result<TodoDto> TodoBridge::add(const NewTodoDto &item)
{
    const auto added = m_store.add(newTodoFromIncoming(item));
    if (!added) {
        return logged<TodoDto>("add", added.error());
    }
    qCInfo(todosBridge) << "Todo added:" << added.value().title
                        << "(id=" << added.value().id.toString(QUuid::WithoutBraces) << ")";
    return todoForOutgoing(added.value());
}

core::Result<TodoDto> TodoBridge::update(const QString &id, const UpdateTodoDto &change)
{
    const auto uuid = uuidFrom(id);
    if (!uuid) {
        return logged<TodoDto>("update", uuid.error());
    }
    const auto updated = m_store.update(uuid.value(), updateTodoFromIncoming(change));
    if (!updated) {
        return logged<TodoDto>("update", updated.error());
    }
    qCInfo(todosBridge) << "Todo updated (id=" << id << ")";
    return todoForOutgoing(updated.value());
}

core::Result<std::vector<TodoDto>> TodoBridge::search(const QueryDto &query) const
{
    const auto found = m_store.search(queryFromIncoming(query));
    if (!found) {
        return logged<std::vector<TodoDto>>("search", found.error());
    }

    std::vector<TodoDto> result;
    result.reserve(found.value().size());
    for (const auto &todo : found.value()) {
        result.push_back(todoForOutgoing(todo));
    }
    qCDebug(todosBridge) << "Search returned" << result.size() << "todos";
    return result;
}

core::Result<quint64> TodoBridge::countBy(const FilterDto &filter) const
{
    const auto count = m_store.countBy(filterFromIncoming(filter));
    if (!count) {
        return logged<quint64>("countBy", count.error());
    }
    return logged("countBy", u64From(count.value()));
}

core::Result<quint64> TodoBridge::countAll() const
{
    return logged("countAll", u64From(m_store.countAll()));
}

core::Result<TodoDto> TodoBridge::get(const QString &id) const
{
    const auto uuid = uuidFrom(id);
    if (!uuid) {
        return logged<TodoDto>("get", uuid.error());
    }
    const auto todo = m_store.get(uuid.value());
    if (!todo) {
        return logged<TodoDto>("get", todo.error());
    }
    return todoForOutgoing(todo.value());
}

core::Result<void> TodoBridge::remove(const QString &id)
{
    const auto uuid = uuidFrom(id);
    if (!uuid) {
        return logged<void>("remove", uuid.error());
    }
    const auto removed = m_store.remove(uuid.value());
    if (!removed) {
        return logged<void>("remove", removed.error());
    }
    qCInfo(todosBridge) << "Todo deleted (id=" << id << ")";
    return core::success();
}

core::Result<quint64> TodoBridge::removeDoneItems()
{
    const std::size_t removed = m_store.removeByStatus(data::TodoStatus::Done);
    qCInfo(todosBridge) << "removeDoneItems removed" << removed << "todos";
    return logged("removeDoneItems", u64From(removed));
}

core::Result<quint64> TodoBridge::removeAll()
{
    const std::size_t removed = m_store.removeAll();
    qCInfo(todosBridge) << "All todos deleted:" << removed;
    return logged("removeAll", u64From(removed));
}

core::Result<quint64> TodoBridge::removeByIds(const QStringList &ids)
{
    QSet<QUuid> targets;
    targets.reserve(ids.size());
    for (const QString &id : ids) {
        const auto uuid = uuidFrom(id);
        if (!uuid) {
            return logged<quint64>("removeByIds", uuid.error());
        }
        targets.insert(uuid.value());
    }
    return removedCount("removeByIds", m_store.removeByIds(targets));
}

core::Result<quint64> TodoBridge::removeByPriorities(const QList<PriorityDto> &priorities)
{
    QSet<data::TodoPriority> targets;
    for (const PriorityDto priority : priorities) {
        targets.insert(priorityFromIncoming(priority));
    }
    return removedCount("removeByPriorities", m_store.removeByPriorities(targets));
}

core::Result<quint64> TodoBridge::removeByStatuses(const QList<StatusDto> &statuses)
{
    QSet<data::TodoStatus> targets;
    for (const StatusDto status : statuses) {
        targets.insert(statusFromIncoming(status));
    }
    return removedCount("removeByStatuses", m_store.removeByStatuses(targets));
}

MetaData TodoBridge::meta() const
{
    MetaData meta;
    meta.componentVersion = QString::fromLatin1(kTodosVersion);
    meta.schemaVersion = SchemaVersion;
    return meta;
}

} // namespace bridge
} // namespace todos
