#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(todosCore)
Q_DECLARE_LOGGING_CATEGORY(todosBridge)

namespace todos {
namespace core {

// Installs the message pattern and handler. Messages always go to stderr and
// are additionally appended to filePath when it is non-empty and writable.
void initLogging(const QString &filePath = QString(), const QString &filterRules = QString());

// Closes the log file and restores the handler that was active before
// initLogging, and clears the filter rules.
void shutdownLogging();

} // namespace core
} // namespace todos
