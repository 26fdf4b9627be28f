#pragma once

#include <memory>

#include "todos/core/Settings.hpp"

namespace todos {
namespace data {
class TodoStore;
}

namespace bridge {
class TodoBridge;
}

namespace core {

class AppContext
{
public:
    explicit AppContext(Settings settings = Settings());
    ~AppContext();

    const Settings &settings() const;
    data::TodoStore &store();
    bridge::TodoBridge &bridge();

private:
    void seedDemoData();

    Settings m_settings;
    std::unique_ptr<data::TodoStore> m_store;
    std::unique_ptr<bridge::TodoBridge> m_bridge;
};

} // namespace core
} // namespace todos
