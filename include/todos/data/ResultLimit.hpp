#pragma once

#include <QtGlobal>
#include <cstddef>
#include <optional>

#include "todos/core/Result.hpp"

namespace todos {
namespace data {

class ResultLimit
{
public:
    static constexpr quint32 DefaultLimit = 10;
    static constexpr quint32 MaxLimit = 100;

    ResultLimit() = default;
    explicit ResultLimit(std::optional<quint32> value);

    const std::optional<quint32> &value() const { return m_value; }

    // Absent or zero falls back to DefaultLimit, anything above MaxLimit is clamped.
    core::Result<std::size_t> resolve() const;

private:
    std::optional<quint32> m_value;
};

} // namespace data
} // namespace todos
