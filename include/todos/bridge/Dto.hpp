#pragma once

#include <QString>
#include <QtGlobal>
#include <optional>

namespace todos {
namespace bridge {

// External representations. Their enumerators are never assumed to share
// values with the data layer enums.
enum class PriorityDto
{
    High,
    Medium,
    Low,
};

enum class StatusDto
{
    Done,
    InProgress,
    Backlog,
};

enum class QuerySortDto
{
    Deadline,
    Priority,
    Status,
};

struct NewTodoDto
{
    QString title;
    PriorityDto priority = PriorityDto::Medium;
    std::optional<QString> deadline;
};

struct UpdateTodoDto
{
    std::optional<QString> title;
    std::optional<PriorityDto> priority;
    std::optional<StatusDto> status;
    std::optional<QString> deadline;
};

struct FilterDto
{
    std::optional<QString> keyword;
    std::optional<PriorityDto> priority;
    std::optional<StatusDto> status;
    std::optional<QString> deadline;
};

struct QueryDto
{
    std::optional<QString> keyword;
    std::optional<PriorityDto> priority;
    std::optional<StatusDto> status;
    std::optional<QString> deadline;
    std::optional<QuerySortDto> sort;
    std::optional<quint32> limit;
};

struct TodoDto
{
    QString id;
    QString title;
    PriorityDto priority = PriorityDto::Medium;
    StatusDto status = StatusDto::Backlog;
    std::optional<qint64> deadline;
    qint64 createdTimestamp = 0;
    qint64 updatedTimestamp = 0;
};

struct MetaData
{
    QString componentVersion;
    quint64 schemaVersion = 0;
};

} // namespace bridge
} // namespace todos
