#pragma once

#include <QList>
#include <QString>
#include <QStringList>
#include <QtGlobal>
#include <vector>

#include "todos/bridge/Dto.hpp"
#include "todos/core/Result.hpp"

namespace todos {
namespace data {
class TodoStore;
}

namespace bridge {

// Adapts a store to external DTOs. The store is borrowed and must outlive the bridge.
class TodoBridge
{
public:
    static constexpr quint64 SchemaVersion = 1;

    explicit TodoBridge(data::TodoStore &store);

    core::Result<TodoDto> add(const NewTodoDto &item);
    core::Result<TodoDto> update(const QString &id, const UpdateTodoDto &change);
    core::Result<std::vector<TodoDto>> search(const QueryDto &query) const;
    core::Result<quint64> countBy(const FilterDto &filter) const;
    core::Result<quint64> countAll() const;
    core::Result<TodoDto> get(const QString &id) const;
    core::Result<void> remove(const QString &id);

    core::Result<quint64> removeDoneItems();
    core::Result<quint64> removeAll();
    core::Result<quint64> removeByIds(const QStringList &ids);
    core::Result<quint64> removeByPriorities(const QList<PriorityDto> &priorities);
    core::Result<quint64> removeByStatuses(const QList<StatusDto> &statuses);

    MetaData meta() const;

private:
    data::TodoStore &m_store;
};

} // namespace bridge
} // namespace todos
