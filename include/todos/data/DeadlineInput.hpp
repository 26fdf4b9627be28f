#pragma once

#include <QString>
#include <QtGlobal>
#include <optional>

#include "todos/core/Result.hpp"

namespace todos {
namespace data {

class DeadlineInput
{
public:
    // Hour granularity, interpreted as UTC.
    static const QString UserFormat;

    DeadlineInput() = default;
    explicit DeadlineInput(std::optional<QString> raw);

    static DeadlineInput none();
    static DeadlineInput of(const QString &raw);

    bool isPresent() const { return m_raw.has_value(); }
    const std::optional<QString> &raw() const { return m_raw; }

    // Absent input resolves to std::nullopt; otherwise unix seconds at the top of the hour.
    core::Result<std::optional<qint64>> resolve() const;

private:
    std::optional<QString> m_raw;
};

} // namespace data
} // namespace todos
