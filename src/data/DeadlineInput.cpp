#include "todos/data/DeadlineInput.hpp"

#include <QDate>
#include <QDateTime>
#include <QStringList>
#include <QTime>
#include <utility>

namespace todos {
namespace data {

namespace {
constexpr auto DATE_FORMAT = "yyyy-MM-dd";
constexpr auto HOUR_FORMAT = "hh";
} // namespace

const QString DeadlineInput::UserFormat = QStringLiteral("yyyy-MM-dd hh");

DeadlineInput::DeadlineInput(std::optional<QString> raw)
    : m_raw(std::move(raw))
{
}

DeadlineInput DeadlineInput::none()
{
    return DeadlineInput();
}

DeadlineInput DeadlineInput::of(const QString &raw)
{
    return DeadlineInput(raw);
}

core::Result<std::optional<qint64>> DeadlineInput::resolve() const
{
    if (!m_raw.has_value()) {
        return std::optional<qint64>();
    }

    const QString &input = m_raw.value();
    const auto parseError = [&input]() {
        return core::AppError::dateTimeParseError(input, UserFormat);
    };

    const QStringList parts = input.trimmed().split(QLatin1Char(' '), Qt::SkipEmptyParts);
    if (parts.size() != 2) {
        return parseError();
    }

    const QDate date = QDate::fromString(parts.at(0), QLatin1String(DATE_FORMAT));
    if (!date.isValid()) {
        return parseError();
    }
    const QTime time = QTime::fromString(parts.at(1), QLatin1String(HOUR_FORMAT));
    if (!time.isValid()) {
        return parseError();
    }

    const QDateTime deadline(date, QTime(time.hour(), 0), Qt::UTC);
    if (!deadline.isValid()) {
        return parseError();
    }
    return std::optional<qint64>(deadline.toSecsSinceEpoch());
}

} // namespace data
} // namespace todos
