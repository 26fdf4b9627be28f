#include "todos/core/AppContext.hpp"

#include <QObject>
#include <utility>

#include "todos/bridge/ErrorText.hpp"
#include "todos/bridge/TodoBridge.hpp"
#include "todos/core/Logging.hpp"
#include "todos/data/InMemoryTodoStore.hpp"

namespace todos {
namespace core {

AppContext::AppContext(Settings settings)
    : m_settings(std::move(settings))
{
    initLogging(m_settings.logFilePath, m_settings.logFilterRules);

    m_store = std::make_unique<data::InMemoryTodoStore>();
    m_bridge = std::make_unique<bridge::TodoBridge>(*m_store);

    if (m_settings.seedDemoData) {
        seedDemoData();
    }
}

AppContext::~AppContext()
{
    m_bridge.reset();
    m_store.reset();
    shutdownLogging();
}

const Settings &AppContext::settings() const
{
    return m_settings;
}

data::TodoStore &AppContext::store()
{
    return *m_store;
}

bridge::TodoBridge &AppContext::bridge()
{
    return *m_bridge;
}

void AppContext::seedDemoData()
{
    if (m_store->countAll() > 0) {
        return;
    }

    data::NewTodo review;
    review.title = data::Title(QObject::tr("Review backlog"));
    review.priority = data::TodoPriority::High;

    data::NewTodo triage;
    triage.title = data::Title(QObject::tr("Triage bug reports"));
    triage.priority = data::TodoPriority::Medium;

    data::NewTodo cleanup;
    cleanup.title = data::Title(QObject::tr("Archive old notes"));
    cleanup.priority = data::TodoPriority::Low;

    for (const auto &item : { review, triage, cleanup }) {
        const auto added = m_store->add(item);
        if (!added) {
            qCWarning(todosCore) << "Failed to seed demo todo:" << bridge::describe(added.error());
        }
    }
    qCInfo(todosCore) << "Seeded" << m_store->countAll() << "demo todos";
}

} // namespace core
} // namespace todos
