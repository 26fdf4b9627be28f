#include "todos/data/ResultLimit.hpp"

#include <limits>

namespace todos {
namespace data {

ResultLimit::ResultLimit(std::optional<quint32> value)
    : m_value(value)
{
}

core::Result<std::size_t> ResultLimit::resolve() const
{
    quint32 limit = m_value.value_or(DefaultLimit);
    if (limit < 1) {
        limit = DefaultLimit;
    } else if (limit > MaxLimit) {
        limit = MaxLimit;
    }

    if (static_cast<quint64>(limit) > static_cast<quint64>(std::numeric_limits<std::size_t>::max())) {
        return core::AppError::dataConversionU32ToUsize();
    }
    return static_cast<std::size_t>(limit);
}

} // namespace data
} // namespace todos
