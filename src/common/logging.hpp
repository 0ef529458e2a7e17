#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace stratum::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Thread-local correlation support; a build uses its image id.
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

// Structured log event. All fields are required; use empty strings where unknown.
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
QString logsDirPath();

// <logs>/builds/<id>.log: every event of one build, keyed by its correlation id.
QString buildLogPath(const QString &buildId);

} // namespace stratum::logging

#define SLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::stratum::logging::logEvent(::stratum::logging::LogLevel::Debug, \
                                 ::stratum::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define SLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::stratum::logging::logEvent(::stratum::logging::LogLevel::Info, \
                                 ::stratum::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define SLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::stratum::logging::logEvent(::stratum::logging::LogLevel::Warn, \
                                 ::stratum::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define SLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::stratum::logging::logEvent(::stratum::logging::LogLevel::Error, \
                                 ::stratum::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
