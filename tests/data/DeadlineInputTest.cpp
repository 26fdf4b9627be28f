#include <QtTest/QtTest>

#include "todos/data/DeadlineInput.hpp"

using namespace todos;

class DeadlineInputTest : public QObject
{
    Q_OBJECT

private slots:
    void resolvesToUnixTime_data();
    void resolvesToUnixTime();
    void absentInputResolvesToNone();
    void rejectsMalformedInput_data();
    void rejectsMalformedInput();
};

void DeadlineInputTest::resolvesToUnixTime_data()
{
    QTest::addColumn<QString>("input");
    QTest::addColumn<qint64>("expected");

    QTest::newRow("morning") << QStringLiteral("2022-01-01 09") << qint64(1641027600);
    QTest::newRow("epoch") << QStringLiteral("1970-01-01 00") << qint64(0);
    QTest::newRow("padded") << QStringLiteral("  2022-01-01 09 ") << qint64(1641027600);
    QTest::newRow("leap day") << QStringLiteral("2020-02-29 23") << qint64(1583017200);
}

void DeadlineInputTest::resolvesToUnixTime()
{
    QFETCH(QString, input);
    QFETCH(qint64, expected);

    const auto resolved = data::DeadlineInput::of(input).resolve();
    QVERIFY(resolved.has_value());
    QVERIFY(resolved.value().has_value());
    QCOMPARE(resolved.value().value(), expected);
}

void DeadlineInputTest::absentInputResolvesToNone()
{
    const auto deadline = data::DeadlineInput::none();
    QVERIFY(!deadline.isPresent());

    const auto resolved = deadline.resolve();
    QVERIFY(resolved.has_value());
    QVERIFY(!resolved.value().has_value());
}

void DeadlineInputTest::rejectsMalformedInput_data()
{
    QTest::addColumn<QString>("input");

    QTest::newRow("garbage") << QStringLiteral("abc");
    QTest::newRow("date only") << QStringLiteral("2022-01-01");
    QTest::newRow("not a leap year") << QStringLiteral("2021-02-29 01");
    QTest::newRow("february 30") << QStringLiteral("2024-02-30 10");
    QTest::newRow("hour out of range") << QStringLiteral("2022-01-01 24");
    QTest::newRow("minutes") << QStringLiteral("2022-01-01 09:30");
    QTest::newRow("empty") << QString();
}

void DeadlineInputTest::rejectsMalformedInput()
{
    QFETCH(QString, input);

    const auto resolved = data::DeadlineInput::of(input).resolve();
    QVERIFY(resolved.has_error());
    QVERIFY(resolved.error() == core::AppError::dateTimeParseError(input, data::DeadlineInput::UserFormat));
}

QTEST_GUILESS_MAIN(DeadlineInputTest)
#include "DeadlineInputTest.moc"
