#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>

#include <unistd.h>

#include <atomic>
#include <cstdio>
#include <mutex>

namespace nodeos::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;

std::mutex g_logMutex;
LogOptions g_options;
std::atomic<quint64> g_corrCounter{0};

thread_local QString t_corrId;

QString levelToString(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return QStringLiteral("DEBUG");
    case LogLevel::Info:
        return QStringLiteral("INFO");
    case LogLevel::Warn:
        return QStringLiteral("WARN");
    case LogLevel::Error:
        return QStringLiteral("ERROR");
    }
    return QStringLiteral("INFO");
}

QString logsDirPath()
{
    if (!g_options.logDir.isEmpty()) {
        return g_options.logDir;
    }
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/nodeos/logs");
    }
    return home + QStringLiteral("/.local/share/nodeos/logs");
}

QString currentLogFilePath()
{
    const QString base = g_options.processName.isEmpty()
        ? defaultProcessName()
        : g_options.processName;
    return logsDirPath() + QDir::separator() + base + QStringLiteral(".log");
}

void rotateIfNeeded(const QString &path)
{
    QFileInfo info(path);
    if (!info.exists() || info.size() < kMaxLogSizeBytes) {
        return;
    }

    const QString rotated = path + QStringLiteral(".1");
    QFile::remove(rotated);
    QFile::rename(path, rotated);
}

void writeLine(const QString &path, const QByteArray &line)
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    rotateIfNeeded(path);

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        // Unwritable log dir must not take the agent down; stderr still works.
        fprintf(stderr, "%s\n", line.constData());
        return;
    }

    file.write(line);
    file.write("\n");
}

QString threadIdString()
{
    return QStringLiteral("0x%1")
        .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16);
}

} // namespace

void initLogging(const LogOptions &options)
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_options = options;
}

bool isDebugTraceEnabled()
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    return g_options.debugTrace;
}

QString logFilePath()
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    return currentLogFilePath();
}

void setCorrelationId(const QString &corrId)
{
    t_corrId = corrId;
}

QString currentCorrelationId()
{
    return t_corrId;
}

QString newCorrelationId(const QString &prefix)
{
    const quint64 seq = ++g_corrCounter;
    return QStringLiteral("%1-%2-%3")
        .arg(prefix)
        .arg(QDateTime::currentMSecsSinceEpoch())
        .arg(seq);
}

CorrelationScope::CorrelationScope(const QString &corrId)
    : m_prev(t_corrId)
{
    t_corrId = corrId;
}

CorrelationScope::~CorrelationScope()
{
    t_corrId = m_prev;
}

QString defaultProcessName()
{
    if (QCoreApplication::instance()) {
        const QString appName = QCoreApplication::applicationName();
        if (!appName.isEmpty()) {
            return appName;
        }
    }
    return QStringLiteral("nodeos");
}

void logEvent(LogLevel level,
              const QString &component,
              const QString &what,
              const QString &message,
              const nlohmann::json &context)
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    if (level == LogLevel::Debug && !g_options.debugTrace) {
        return;
    }

    const QString process = g_options.processName.isEmpty()
        ? defaultProcessName()
        : g_options.processName;

    nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelToString(level).toStdString()},
        {"process", process.toStdString()},
        {"pid", static_cast<long>(getpid())},
        {"thread", threadIdString().toStdString()},
        {"component", component.toStdString()},
        {"what", what.toStdString()},
        {"message", message.toStdString()},
        {"corr", t_corrId.toStdString()},
        {"context", context}
    };

    writeLine(currentLogFilePath(), QByteArray::fromStdString(
                  payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)));

    if (g_options.mirrorToStderr) {
        fprintf(stderr, "%s %s: %s\n",
                levelToString(level).toUtf8().constData(),
                component.toUtf8().constData(),
                message.toUtf8().constData());
    }
}

} // namespace nodeos::logging
