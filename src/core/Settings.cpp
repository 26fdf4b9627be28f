#include "todos/core/Settings.hpp"

#include <QSettings>

namespace todos {
namespace core {

namespace {
const QString LOG_FILE_PATH_KEY = QStringLiteral("logging/filePath");
const QString LOG_FILTER_RULES_KEY = QStringLiteral("logging/filterRules");
const QString SEED_DEMO_DATA_KEY = QStringLiteral("store/seedDemoData");
} // namespace

Settings Settings::load(const QSettings &settings)
{
    Settings result;
    result.logFilePath = settings.value(LOG_FILE_PATH_KEY).toString();
    result.logFilterRules = settings.value(LOG_FILTER_RULES_KEY).toString();
    result.seedDemoData = settings.value(SEED_DEMO_DATA_KEY, false).toBool();
    return result;
}

void Settings::save(QSettings &settings) const
{
    settings.setValue(LOG_FILE_PATH_KEY, logFilePath);
    settings.setValue(LOG_FILTER_RULES_KEY, logFilterRules);
    settings.setValue(SEED_DEMO_DATA_KEY, seedDemoData);
}

} // namespace core
} // namespace todos
