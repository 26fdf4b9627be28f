#pragma once

#include <boost/outcome/result.hpp>
#include <boost/outcome/success_failure.hpp>

#include "todos/core/AppError.hpp"

namespace todos {
namespace core {

namespace outcome = BOOST_OUTCOME_V2_NAMESPACE;

// Accessing value() on a failed result throws bad_result_access_with<AppError>.
template <typename T>
using Result = outcome::checked<T, AppError>;

inline auto success()
{
    return outcome::success();
}

} // namespace core
} // namespace todos
