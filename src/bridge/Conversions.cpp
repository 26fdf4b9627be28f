#include "todos/bridge/Conversions.hpp"

#include <limits>

namespace todos {
namespace bridge {

data::TodoPriority priorityFromIncoming(PriorityDto priority)
{
    switch (priority) {
    case PriorityDto::High: return data::TodoPriority::High;
    case PriorityDto::Medium: return data::TodoPriority::Medium;
    case PriorityDto::Low: return data::TodoPriority::Low;
    }
    return data::TodoPriority::Medium;
}

PriorityDto priorityForOutgoing(data::TodoPriority priority)
{
    switch (priority) {
    case data::TodoPriority::High: return PriorityDto::High;
    case data::TodoPriority::Medium: return PriorityDto::Medium;
    case data::TodoPriority::Low: return PriorityDto::Low;
    }
    return PriorityDto::Medium;
}

data::TodoStatus statusFromIncoming(StatusDto status)
{
    switch (status) {
    case StatusDto::Done: return data::TodoStatus::Done;
    case StatusDto::InProgress: return data::TodoStatus::InProgress;
    case StatusDto::Backlog: return data::TodoStatus::Backlog;
    }
    return data::TodoStatus::Backlog;
}

StatusDto statusForOutgoing(data::TodoStatus status)
{
    switch (status) {
    case data::TodoStatus::Done: return StatusDto::Done;
    case data::TodoStatus::InProgress: return StatusDto::InProgress;
    case data::TodoStatus::Backlog: return StatusDto::Backlog;
    }
    return StatusDto::Backlog;
}

data::QuerySort querySortFromIncoming(QuerySortDto sort)
{
    switch (sort) {
    case QuerySortDto::Deadline: return data::QuerySort::Deadline;
    case QuerySortDto::Priority: return data::QuerySort::Priority;
    case QuerySortDto::Status: return data::QuerySort::Status;
    }
    return data::QuerySort::Priority;
}

data::NewTodo newTodoFromIncoming(const NewTodoDto &item)
{
    data::NewTodo todo;
    todo.title = data::Title(item.title);
    todo.priority = priorityFromIncoming(item.priority);
    todo.deadline = data::DeadlineInput(item.deadline);
    return todo;
}

data::UpdateTodo updateTodoFromIncoming(const UpdateTodoDto &item)
{
    data::UpdateTodo change;
    if (item.title) {
        change.title = data::Title(*item.title);
    }
    if (item.priority) {
        change.priority = priorityFromIncoming(*item.priority);
    }
    if (item.status) {
        change.status = statusFromIncoming(*item.status);
    }
    change.deadline = data::DeadlineInput(item.deadline);
    return change;
}

data::Query queryFromIncoming(const QueryDto &query)
{
    data::Query result;
    result.keyword = query.keyword;
    if (query.priority) {
        result.priority = priorityFromIncoming(*query.priority);
    }
    if (query.status) {
        result.status = statusFromIncoming(*query.status);
    }
    result.deadline = data::DeadlineInput(query.deadline);
    if (query.sort) {
        result.sort = querySortFromIncoming(*query.sort);
    }
    result.limit = data::ResultLimit(query.limit);
    return result;
}

data::Query filterFromIncoming(const FilterDto &filter)
{
    data::Query result;
    result.keyword = filter.keyword;
    if (filter.priority) {
        result.priority = priorityFromIncoming(*filter.priority);
    }
    if (filter.status) {
        result.status = statusFromIncoming(*filter.status);
    }
    result.deadline = data::DeadlineInput(filter.deadline);
    return result;
}

TodoDto todoForOutgoing(const data::Todo &todo)
{
    TodoDto dto;
    dto.id = todo.id.toString(QUuid::WithoutBraces);
    dto.title = todo.title;
    dto.priority = priorityForOutgoing(todo.priority);
    dto.status = statusForOutgoing(todo.status);
    dto.deadline = todo.deadline;
    dto.createdTimestamp = todo.createdTimestamp;
    dto.updatedTimestamp = todo.updatedTimestamp;
    return dto;
}

core::Result<QUuid> uuidFrom(const QString &raw)
{
    QString body = raw;
    if (body.size() == 38 && body.startsWith(QLatin1Char('{')) && body.endsWith(QLatin1Char('}'))) {
        body = body.mid(1, 36);
    }
    if (body.size() != 36) {
        return core::AppError::invalidUuid(raw);
    }

    // QUuid::fromString ignores anything past the hex digits, so the parsed id
    // must print back to the same text.
    const QUuid id = QUuid::fromString(body);
    if (id.isNull() || id.toString(QUuid::WithoutBraces).compare(body, Qt::CaseInsensitive) != 0) {
        return core::AppError::invalidUuid(raw);
    }
    return id;
}

core::Result<quint64> u64From(std::size_t value)
{
    if (static_cast<unsigned long long>(value) > std::numeric_limits<quint64>::max()) {
        return core::AppError::dataConversionUsizeToU64(static_cast<quint64>(value));
    }
    return static_cast<quint64>(value);
}

} // namespace bridge
} // namespace todos
