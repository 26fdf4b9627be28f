#pragma once

#include <QString>
#include <QUuid>
#include <QtGlobal>
#include <optional>

#include "todos/data/DeadlineInput.hpp"
#include "todos/data/Title.hpp"

namespace todos {
namespace data {

enum class TodoPriority
{
    Low,
    Medium,
    High,
};

enum class TodoStatus
{
    Backlog,
    InProgress,
    Done,
};

inline uint qHash(TodoPriority priority, uint seed = 0) noexcept
{
    return ::qHash(static_cast<int>(priority), seed);
}

inline uint qHash(TodoStatus status, uint seed = 0) noexcept
{
    return ::qHash(static_cast<int>(status), seed);
}

struct Todo
{
    QUuid id;
    QString title;
    TodoPriority priority = TodoPriority::Medium;
    TodoStatus status = TodoStatus::Backlog;
    qint64 createdTimestamp = 0;
    qint64 updatedTimestamp = 0;
    std::optional<qint64> deadline;

    bool operator==(const Todo &other) const;
    bool operator!=(const Todo &other) const { return !(*this == other); }
};

struct NewTodo
{
    Title title;
    TodoPriority priority = TodoPriority::Medium;
    DeadlineInput deadline;
};

struct UpdateTodo
{
    std::optional<Title> title;
    std::optional<TodoPriority> priority;
    std::optional<TodoStatus> status;
    // Not presence-gated on apply: an absent deadline clears the stored one.
    DeadlineInput deadline;

    bool hasChanges() const;
};

} // namespace data
} // namespace todos
