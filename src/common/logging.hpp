#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace vita::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Thread-local correlation support for linking related log events.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

// Structured log event written as one JSON line. Empty strings are allowed for
// fields that do not apply; an empty correlation id falls back to the
// thread-local one.
void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultProcessName();
QString defaultWho();

// Correlation id for a new reasoning session, e.g. "session-3f2a9c".
QString newCorrelationId(const QString &prefix);

} // namespace vita::logging

#define VLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::vita::logging::logEvent(::vita::logging::LogLevel::Debug, \
                              ::vita::logging::defaultProcessName(), \
                              (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define VLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::vita::logging::logEvent(::vita::logging::LogLevel::Info, \
                              ::vita::logging::defaultProcessName(), \
                              (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define VLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::vita::logging::logEvent(::vita::logging::LogLevel::Warn, \
                              ::vita::logging::defaultProcessName(), \
                              (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define VLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::vita::logging::logEvent(::vita::logging::LogLevel::Error, \
                              ::vita::logging::defaultProcessName(), \
                              (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
