#pragma once

#include <QString>

#include "todos/core/Result.hpp"

namespace todos {
namespace data {

class Title
{
public:
    static constexpr int MaxLength = 20;

    Title() = default;
    explicit Title(const QString &raw);

    const QString &text() const { return m_text; }

    // Yields the trimmed title, or EmptyTodoTitle / TooLongTodoTitle.
    core::Result<QString> validate() const;

private:
    QString m_text;
};

} // namespace data
} // namespace todos
