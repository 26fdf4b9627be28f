#include <QtTest/QtTest>

#include <algorithm>
#include <vector>

#include "todos/data/Query.hpp"
#include "todos/data/SortKey.hpp"

using namespace todos;

namespace {

data::Todo makeTodo(const QString &title,
                    data::TodoPriority priority,
                    data::TodoStatus status,
                    std::optional<qint64> deadline = std::nullopt)
{
    data::Todo todo;
    todo.id = QUuid::createUuid();
    todo.title = title;
    todo.priority = priority;
    todo.status = status;
    todo.deadline = deadline;
    return todo;
}

std::vector<QString> orderedTitles(std::vector<data::Todo> todos, const std::optional<data::QuerySort> &sort)
{
    std::sort(todos.begin(), todos.end(), [&sort](const data::Todo &lhs, const data::Todo &rhs) {
        return data::SortKey::forTodo(lhs, sort) < data::SortKey::forTodo(rhs, sort);
    });
    std::vector<QString> titles;
    for (const auto &todo : todos) {
        titles.push_back(todo.title);
    }
    return titles;
}

} // namespace

class QueryTest : public QObject
{
    Q_OBJECT

private slots:
    void emptyQueryMatchesEverything();
    void keywordIsCaseSensitiveSubstring();
    void priorityAndStatusMustBeEqual();
    void deadlineBoundKeepsTodosWithoutDeadline();
    void criteriaAreCombined();
    void sortsByTitleByDefault();
    void sortsByPriorityFromHighToLow();
    void sortsByStatusOrder();
    void sortsByDeadlineWithMissingLast();
};

void QueryTest::emptyQueryMatchesEverything()
{
    const data::Query query;
    const auto todo = makeTodo(QStringLiteral("anything"), data::TodoPriority::Low, data::TodoStatus::Done, 5);
    QVERIFY(query.matches(todo, std::nullopt));
}

void QueryTest::keywordIsCaseSensitiveSubstring()
{
    data::Query query;
    query.keyword = QStringLiteral("milk");

    QVERIFY(query.matchesKeyword(makeTodo(QStringLiteral("buy milk"), data::TodoPriority::Low, data::TodoStatus::Backlog)));
    QVERIFY(!query.matchesKeyword(makeTodo(QStringLiteral("buy Milk"), data::TodoPriority::Low, data::TodoStatus::Backlog)));
    QVERIFY(!query.matchesKeyword(makeTodo(QStringLiteral("bread"), data::TodoPriority::Low, data::TodoStatus::Backlog)));
}

void QueryTest::priorityAndStatusMustBeEqual()
{
    data::Query query;
    query.priority = data::TodoPriority::High;
    query.status = data::TodoStatus::InProgress;

    const auto match = makeTodo(QStringLiteral("a"), data::TodoPriority::High, data::TodoStatus::InProgress);
    const auto wrongPriority = makeTodo(QStringLiteral("b"), data::TodoPriority::Medium, data::TodoStatus::InProgress);
    const auto wrongStatus = makeTodo(QStringLiteral("c"), data::TodoPriority::High, data::TodoStatus::Done);

    QVERIFY(query.matchesPriority(match));
    QVERIFY(query.matchesStatus(match));
    QVERIFY(!query.matchesPriority(wrongPriority));
    QVERIFY(!query.matchesStatus(wrongStatus));
}

void QueryTest::deadlineBoundKeepsTodosWithoutDeadline()
{
    const std::optional<qint64> bound = 100;

    QVERIFY(data::Query::matchesDeadline(bound, makeTodo(QStringLiteral("none"), data::TodoPriority::Low, data::TodoStatus::Backlog)));
    QVERIFY(data::Query::matchesDeadline(bound, makeTodo(QStringLiteral("equal"), data::TodoPriority::Low, data::TodoStatus::Backlog, 100)));
    QVERIFY(data::Query::matchesDeadline(bound, makeTodo(QStringLiteral("before"), data::TodoPriority::Low, data::TodoStatus::Backlog, 99)));
    QVERIFY(!data::Query::matchesDeadline(bound, makeTodo(QStringLiteral("after"), data::TodoPriority::Low, data::TodoStatus::Backlog, 101)));
    QVERIFY(data::Query::matchesDeadline(std::nullopt, makeTodo(QStringLiteral("after"), data::TodoPriority::Low, data::TodoStatus::Backlog, 101)));
}

void QueryTest::criteriaAreCombined()
{
    data::Query query;
    query.keyword = QStringLiteral("report");
    query.priority = data::TodoPriority::High;

    QVERIFY(query.matches(makeTodo(QStringLiteral("report"), data::TodoPriority::High, data::TodoStatus::Backlog), std::nullopt));
    QVERIFY(!query.matches(makeTodo(QStringLiteral("report"), data::TodoPriority::Low, data::TodoStatus::Backlog), std::nullopt));
    QVERIFY(!query.matches(makeTodo(QStringLiteral("slides"), data::TodoPriority::High, data::TodoStatus::Backlog), std::nullopt));
    QVERIFY(!query.matches(makeTodo(QStringLiteral("report"), data::TodoPriority::High, data::TodoStatus::Backlog, 50), 10));
}

void QueryTest::sortsByTitleByDefault()
{
    const std::vector<data::Todo> todos = {
        makeTodo(QStringLiteral("c"), data::TodoPriority::High, data::TodoStatus::Backlog),
        makeTodo(QStringLiteral("a"), data::TodoPriority::Low, data::TodoStatus::Done),
        makeTodo(QStringLiteral("b"), data::TodoPriority::Medium, data::TodoStatus::InProgress),
    };
    const std::vector<QString> expected = { QStringLiteral("a"), QStringLiteral("b"), QStringLiteral("c") };
    QVERIFY(orderedTitles(todos, std::nullopt) == expected);
}

void QueryTest::sortsByPriorityFromHighToLow()
{
    const std::vector<data::Todo> todos = {
        makeTodo(QStringLiteral("low"), data::TodoPriority::Low, data::TodoStatus::Backlog),
        makeTodo(QStringLiteral("high"), data::TodoPriority::High, data::TodoStatus::Backlog),
        makeTodo(QStringLiteral("medium"), data::TodoPriority::Medium, data::TodoStatus::Backlog),
    };
    const std::vector<QString> expected = { QStringLiteral("high"), QStringLiteral("medium"), QStringLiteral("low") };
    QVERIFY(orderedTitles(todos, data::QuerySort::Priority) == expected);
}

void QueryTest::sortsByStatusOrder()
{
    const std::vector<data::Todo> todos = {
        makeTodo(QStringLiteral("done"), data::TodoPriority::Low, data::TodoStatus::Done),
        makeTodo(QStringLiteral("backlog"), data::TodoPriority::Low, data::TodoStatus::Backlog),
        makeTodo(QStringLiteral("progress"), data::TodoPriority::Low, data::TodoStatus::InProgress),
    };
    const std::vector<QString> expected = { QStringLiteral("progress"), QStringLiteral("backlog"), QStringLiteral("done") };
    QVERIFY(orderedTitles(todos, data::QuerySort::Status) == expected);

    QCOMPARE(data::statusRank(data::StatusSortOrder.front()), 0);
    QCOMPARE(data::statusRank(data::TodoStatus::Done), 2);
}

void QueryTest::sortsByDeadlineWithMissingLast()
{
    const std::vector<data::Todo> todos = {
        makeTodo(QStringLiteral("none"), data::TodoPriority::Low, data::TodoStatus::Backlog),
        makeTodo(QStringLiteral("late"), data::TodoPriority::Low, data::TodoStatus::Backlog, 300),
        makeTodo(QStringLiteral("early"), data::TodoPriority::Low, data::TodoStatus::Backlog, -20),
    };
    const std::vector<QString> expected = { QStringLiteral("early"), QStringLiteral("late"), QStringLiteral("none") };
    QVERIFY(orderedTitles(todos, data::QuerySort::Deadline) == expected);
}

QTEST_GUILESS_MAIN(QueryTest)
#include "QueryTest.moc"
