#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace nodeos::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

struct LogOptions {
    QString processName;
    QString logDir;
    bool debugTrace = false;
    bool mirrorToStderr = true;
};

// Initialize logging for the current process. Call early in main().
void initLogging(const LogOptions &options);

bool isDebugTraceEnabled();
QString logFilePath();

// Thread-local correlation support: every event logged while a scope is alive
// carries the same "corr" value, so one reconciliation pass can be grepped.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();
QString newCorrelationId(const QString &prefix);

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

    CorrelationScope(const CorrelationScope &) = delete;
    CorrelationScope &operator=(const CorrelationScope &) = delete;

private:
    QString m_prev;
};

void logEvent(LogLevel level,
              const QString &component,
              const QString &what,
              const QString &message,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultProcessName();

} // namespace nodeos::logging

#define NLOG_DEBUG(component, what, message, ctxJson) \
    ::nodeos::logging::logEvent(::nodeos::logging::LogLevel::Debug, \
                                (component), (what), (message), (ctxJson))

#define NLOG_INFO(component, what, message, ctxJson) \
    ::nodeos::logging::logEvent(::nodeos::logging::LogLevel::Info, \
                                (component), (what), (message), (ctxJson))

#define NLOG_WARN(component, what, message, ctxJson) \
    ::nodeos::logging::logEvent(::nodeos::logging::LogLevel::Warn, \
                                (component), (what), (message), (ctxJson))

#define NLOG_ERROR(component, what, message, ctxJson) \
    ::nodeos::logging::logEvent(::nodeos::logging::LogLevel::Error, \
                                (component), (what), (message), (ctxJson))
