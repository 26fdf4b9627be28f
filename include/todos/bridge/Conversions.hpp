#pragma once

#include <QString>
#include <QUuid>
#include <QtGlobal>
#include <cstddef>

#include "todos/bridge/Dto.hpp"
#include "todos/core/Result.hpp"
#include "todos/data/Query.hpp"
#include "todos/data/Todo.hpp"

namespace todos {
namespace bridge {

data::TodoPriority priorityFromIncoming(PriorityDto priority);
PriorityDto priorityForOutgoing(data::TodoPriority priority);

data::TodoStatus statusFromIncoming(StatusDto status);
StatusDto statusForOutgoing(data::TodoStatus status);

data::QuerySort querySortFromIncoming(QuerySortDto sort);

data::NewTodo newTodoFromIncoming(const NewTodoDto &item);
data::UpdateTodo updateTodoFromIncoming(const UpdateTodoDto &item);
data::Query queryFromIncoming(const QueryDto &query);
data::Query filterFromIncoming(const FilterDto &filter);
TodoDto todoForOutgoing(const data::Todo &todo);

// Accepts the 36-character hyphenated form, optionally wrapped in one pair of braces.
core::Result<QUuid> uuidFrom(const QString &raw);
core::Result<quint64> u64From(std::size_t value);

} // namespace bridge
} // namespace todos
