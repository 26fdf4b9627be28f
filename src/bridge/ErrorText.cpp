#include "todos/bridge/ErrorText.hpp"

#include <QUuid>

namespace todos {
namespace bridge {

namespace {

QString messageFor(const core::AppError &error)
{
    using Kind = core::AppError::Kind;
    switch (error.kind()) {
    case Kind::CollectionIsEmpty:
        return QStringLiteral("At least one target must be provided.");
    case Kind::DataConversionU32ToUsize:
        return QStringLiteral("Error converting u32 to usize.");
    case Kind::DataConversionUsizeToU64:
        return QStringLiteral("Error converting %1 to unsigned-64.").arg(error.value());
    case Kind::DateTimeParseError:
        return QStringLiteral("'%1' is NOT in the required format of '%2'.")
            .arg(error.input(), error.expectedFormat());
    case Kind::EmptyTodoTitle:
        return QStringLiteral("Title cannot be empty.");
    case Kind::InvalidUuid:
        return QStringLiteral("'%1' is not a valid UUID.").arg(error.input());
    case Kind::TooLongTodoTitle:
        return QStringLiteral("The provided title '%1' exceeds max %2 characters.")
            .arg(error.input())
            .arg(error.expectedLength());
    case Kind::TodoNotFound:
        return QStringLiteral("Item with ID '%1' not found.")
            .arg(error.id().toString(QUuid::WithoutBraces));
    case Kind::UpdateHasNoChanges:
        return QStringLiteral("At least one change must be present.");
    }
    return QString();
}

} // namespace

QString describe(const core::AppError &error)
{
    return QStringLiteral("[%1] %2").arg(QLatin1String(core::kindName(error.kind())), messageFor(error));
}

} // namespace bridge
} // namespace todos
