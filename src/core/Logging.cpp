#include "todos/core/Logging.hpp"

#include <QFile>
#include <QMutex>
#include <QMutexLocker>
#include <QTextStream>
#include <cstdio>
#include <memory>

Q_LOGGING_CATEGORY(todosCore, "todos.core")
Q_LOGGING_CATEGORY(todosBridge, "todos.bridge")

namespace todos {
namespace core {

namespace {

std::unique_ptr<QFile> g_logFile;
QMutex g_logMutex;
QtMessageHandler g_previousHandler = nullptr;

void messageHandler(QtMsgType type, const QMessageLogContext &context, const QString &message)
{
    const QString line = qFormatLogMessage(type, context, message) + QLatin1Char('\n');

    fprintf(stderr, "%s", line.toLocal8Bit().constData());

    QMutexLocker lock(&g_logMutex);
    if (g_logFile && g_logFile->isOpen()) {
        QTextStream stream(g_logFile.get());
        stream << line;
        stream.flush();
    }
}

} // namespace

void initLogging(const QString &filePath, const QString &filterRules)
{
    qSetMessagePattern(QStringLiteral("%{time yyyy-MM-dd hh:mm:ss.zzz} [%{type}] %{category} "
                                      "(%{if-debug}%{function}:%{line}%{endif}): %{message}"));

    if (!filterRules.isEmpty()) {
        QLoggingCategory::setFilterRules(filterRules);
    }

    {
        QMutexLocker lock(&g_logMutex);
        g_logFile.reset();
        if (!filePath.isEmpty()) {
            auto file = std::make_unique<QFile>(filePath);
            if (file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
                g_logFile = std::move(file);
            }
        }
    }

    const QtMessageHandler previous = qInstallMessageHandler(messageHandler);
    if (previous != messageHandler) {
        g_previousHandler = previous;
    }

    if (!filePath.isEmpty() && !g_logFile) {
        qCWarning(todosCore) << "Failed to open log file:" << filePath;
    }
    qCInfo(todosCore) << "Logging initialized"
                      << (g_logFile ? QStringLiteral("-> %1").arg(filePath) : QStringLiteral("(stderr only)"));
}

void shutdownLogging()
{
    qCInfo(todosCore) << "Logging shut down";

    qInstallMessageHandler(g_previousHandler);
    g_previousHandler = nullptr;
    QLoggingCategory::setFilterRules(QString());

    QMutexLocker lock(&g_logMutex);
    g_logFile.reset();
}

} // namespace core
} // namespace todos
