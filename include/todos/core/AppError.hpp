#pragma once

#include <QString>
#include <QUuid>
#include <QtGlobal>

namespace todos {
namespace core {

class AppError
{
public:
    enum class Kind
    {
        CollectionIsEmpty,
        DataConversionU32ToUsize,
        DataConversionUsizeToU64,
        DateTimeParseError,
        EmptyTodoTitle,
        InvalidUuid,
        TooLongTodoTitle,
        TodoNotFound,
        UpdateHasNoChanges,
    };

    AppError() = default;

    static AppError collectionIsEmpty();
    static AppError dataConversionU32ToUsize();
    static AppError dataConversionUsizeToU64(quint64 value);
    static AppError dateTimeParseError(QString input, QString expectedFormat);
    static AppError emptyTodoTitle();
    static AppError invalidUuid(QString raw);
    static AppError tooLongTodoTitle(QString input, int expectedLength);
    static AppError todoNotFound(const QUuid &id);
    static AppError updateHasNoChanges();

    Kind kind() const { return m_kind; }

    // Offending raw text for DateTimeParseError, TooLongTodoTitle and InvalidUuid.
    const QString &input() const { return m_input; }
    const QString &expectedFormat() const { return m_expectedFormat; }
    int expectedLength() const { return m_expectedLength; }
    const QUuid &id() const { return m_id; }
    quint64 value() const { return m_value; }

    bool operator==(const AppError &other) const;
    bool operator!=(const AppError &other) const { return !(*this == other); }

private:
    explicit AppError(Kind kind);

    Kind m_kind = Kind::UpdateHasNoChanges;
    QString m_input;
    QString m_expectedFormat;
    int m_expectedLength = 0;
    QUuid m_id;
    quint64 m_value = 0;
};

const char *kindName(AppError::Kind kind);

} // namespace core
} // namespace todos
