#pragma once

#include <QString>

#include "todos/core/AppError.hpp"

namespace todos {
namespace bridge {

// One line per error, prefixed with the kind name, e.g. "[EmptyTodoTitle] Title cannot be empty."
QString describe(const core::AppError &error);

} // namespace bridge
} // namespace todos
