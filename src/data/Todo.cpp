#include "todos/data/Todo.hpp"

namespace todos {
namespace data {

bool Todo::operator==(const Todo &other) const
{
    return id == other.id
        && title == other.title
        && priority == other.priority
        && status == other.status
        && createdTimestamp == other.createdTimestamp
        && updatedTimestamp == other.updatedTimestamp
        && deadline == other.deadline;
}

bool UpdateTodo::hasChanges() const
{
    return title.has_value()
        || priority.has_value()
        || status.has_value()
        || deadline.isPresent();
}

} // namespace data
} // namespace todos
