#include <QtTest/QtTest>

#include <QFile>
#include <QSettings>
#include <QTemporaryDir>

#include "todos/bridge/TodoBridge.hpp"
#include "todos/core/AppContext.hpp"
#include "todos/core/Logging.hpp"
#include "todos/core/Settings.hpp"
#include "todos/data/TodoStore.hpp"

using namespace todos;

class AppContextTest : public QObject
{
    Q_OBJECT

private slots:
    void settingsDefaults();
    void settingsRoundTrip();
    void startsWithEmptyStore();
    void seedsDemoData();
    void writesLogFile();
};

void AppContextTest::settingsDefaults()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QSettings settings(dir.filePath(QStringLiteral("empty.ini")), QSettings::IniFormat);

    const auto loaded = core::Settings::load(settings);
    QVERIFY(loaded.logFilePath.isEmpty());
    QVERIFY(loaded.logFilterRules.isEmpty());
    QVERIFY(!loaded.seedDemoData);
}

void AppContextTest::settingsRoundTrip()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("todos.ini"));

    core::Settings saved;
    saved.logFilePath = dir.filePath(QStringLiteral("todos.log"));
    saved.logFilterRules = QStringLiteral("todos.bridge.debug=false");
    saved.seedDemoData = true;
    {
        QSettings settings(path, QSettings::IniFormat);
        saved.save(settings);
    }

    const QSettings settings(path, QSettings::IniFormat);
    const auto loaded = core::Settings::load(settings);
    QCOMPARE(loaded.logFilePath, saved.logFilePath);
    QCOMPARE(loaded.logFilterRules, saved.logFilterRules);
    QVERIFY(loaded.seedDemoData);
}

void AppContextTest::startsWithEmptyStore()
{
    core::AppContext context;
    QCOMPARE(context.store().countAll(), static_cast<std::size_t>(0));

    const auto count = context.bridge().countAll();
    QVERIFY(count.has_value());
    QCOMPARE(count.value(), quint64(0));
}

void AppContextTest::seedsDemoData()
{
    core::Settings settings;
    settings.seedDemoData = true;
    core::AppContext context(settings);

    QCOMPARE(context.store().countAll(), static_cast<std::size_t>(3));
    QVERIFY(context.settings().seedDemoData);

    bridge::QueryDto query;
    query.sort = bridge::QuerySortDto::Priority;
    const auto found = context.bridge().search(query);
    QVERIFY(found.has_value());
    QCOMPARE(found.value().size(), static_cast<std::size_t>(3));
    QVERIFY(found.value().front().priority == bridge::PriorityDto::High);
    QVERIFY(found.value().back().priority == bridge::PriorityDto::Low);
}

void AppContextTest::writesLogFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    core::Settings settings;
    settings.logFilePath = dir.filePath(QStringLiteral("todos.log"));
    {
        core::AppContext context(settings);
        bridge::NewTodoDto item;
        item.title = QString();
        QVERIFY(context.bridge().add(item).has_error());
    }
    qCWarning(todosCore) << "written after shutdown";

    QFile file(settings.logFilePath);
    QVERIFY(file.open(QIODevice::ReadOnly | QIODevice::Text));
    const QString contents = QString::fromUtf8(file.readAll());
    QVERIFY(contents.contains(QStringLiteral("Logging initialized")));
    QVERIFY(contents.contains(QStringLiteral("[EmptyTodoTitle]")));
    QVERIFY(contents.contains(QStringLiteral("Logging shut down")));
    QVERIFY(!contents.contains(QStringLiteral("written after shutdown")));
}

QTEST_GUILESS_MAIN(AppContextTest)
#include "AppContextTest.moc"
