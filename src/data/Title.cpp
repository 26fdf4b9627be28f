#include "todos/data/Title.hpp"

namespace todos {
namespace data {

Title::Title(const QString &raw)
    : m_text(raw.trimmed())
{
}

core::Result<QString> Title::validate() const
{
    if (m_text.isEmpty()) {
        return core::AppError::emptyTodoTitle();
    }
    // Surrogate pairs count as one character.
    if (m_text.toUcs4().size() > MaxLength) {
        return core::AppError::tooLongTodoTitle(m_text, MaxLength);
    }
    return m_text;
}

} // namespace data
} // namespace todos
