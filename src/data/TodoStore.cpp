#include "todos/data/TodoStore.hpp"

namespace todos {
namespace data {

std::size_t TodoStore::removeByStatus(TodoStatus status)
{
    // A single-element set is never empty, so this cannot fail.
    const auto removed = removeByStatuses(QSet<TodoStatus>{ status });
    return removed ? removed.value() : 0;
}

} // namespace data
} // namespace todos
