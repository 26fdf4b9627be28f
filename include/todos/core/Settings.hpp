#pragma once

#include <QString>

class QSettings;

namespace todos {
namespace core {

struct Settings
{
    QString logFilePath;
    QString logFilterRules;
    bool seedDemoData = false;

    static Settings load(const QSettings &settings);
    void save(QSettings &settings) const;
};

} // namespace core
} // namespace todos
