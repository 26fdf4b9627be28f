#include "todos/core/AppError.hpp"

#include <utility>

namespace todos {
namespace core {

AppError::AppError(Kind kind)
    : m_kind(kind)
{
}

AppError AppError::collectionIsEmpty()
{
    return AppError(Kind::CollectionIsEmpty);
}

AppError AppError::dataConversionU32ToUsize()
{
    return AppError(Kind::DataConversionU32ToUsize);
}

AppError AppError::dataConversionUsizeToU64(quint64 value)
{
    AppError error(Kind::DataConversionUsizeToU64);
    error.m_value = value;
    return error;
}

AppError AppError::dateTimeParseError(QString input, QString expectedFormat)
{
    AppError error(Kind::DateTimeParseError);
    error.m_input = std::move(input);
    error.m_expectedFormat = std::move(expectedFormat);
    return error;
}

AppError AppError::emptyTodoTitle()
{
    return AppError(Kind::EmptyTodoTitle);
}

AppError AppError::invalidUuid(QString raw)
{
    AppError error(Kind::InvalidUuid);
    error.m_input = std::move(raw);
    return error;
}

AppError AppError::tooLongTodoTitle(QString input, int expectedLength)
{
    AppError error(Kind::TooLongTodoTitle);
    error.m_input = std::move(input);
    error.m_expectedLength = expectedLength;
    return error;
}

AppError AppError::todoNotFound(const QUuid &id)
{
    AppError error(Kind::TodoNotFound);
    error.m_id = id;
    return error;
}

AppError AppError::updateHasNoChanges()
{
    return AppError(Kind::UpdateHasNoChanges);
}

bool AppError::operator==(const AppError &other) const
{
    return m_kind == other.m_kind
        && m_input == other.m_input
        && m_expectedFormat == other.m_expectedFormat
        && m_expectedLength == other.m_expectedLength
        && m_id == other.m_id
        && m_value == other.m_value;
}

const char *kindName(AppError::Kind kind)
{
    using Kind = AppError::Kind;
    switch (kind) {
    case Kind::CollectionIsEmpty: return "CollectionIsEmpty";
    case Kind::DataConversionU32ToUsize: return "DataConversionU32ToUsize";
    case Kind::DataConversionUsizeToU64: return "DataConversionUsizeToU64";
    case Kind::DateTimeParseError: return "DateTimeParseError";
    case Kind::EmptyTodoTitle: return "EmptyTodoTitle";
    case Kind::InvalidUuid: return "InvalidUuid";
    case Kind::TooLongTodoTitle: return "TooLongTodoTitle";
    case Kind::TodoNotFound: return "TodoNotFound";
    case Kind::UpdateHasNoChanges: return "UpdateHasNoChanges";
    }
    return "Unknown";
}

} // namespace core
} // namespace todos
