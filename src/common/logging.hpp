#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace hostform::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
// Trace mode also records debug events and mirrors everything to
// <process>-trace.log.
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Directory the log files are written to. HOSTFORM_LOG_DIR overrides the
// default of $HOME/.local/share/hostform/logs.
QString logsDirPath();

// Correlation id shared by every event of one reconciliation run.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

    CorrelationScope(const CorrelationScope &) = delete;
    CorrelationScope &operator=(const CorrelationScope &) = delete;

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

} // namespace hostform::logging

#define HFLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::hostform::logging::logEvent(::hostform::logging::LogLevel::Debug, \
                                  ::hostform::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define HFLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::hostform::logging::logEvent(::hostform::logging::LogLevel::Info, \
                                  ::hostform::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define HFLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::hostform::logging::logEvent(::hostform::logging::LogLevel::Warn, \
                                  ::hostform::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define HFLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::hostform::logging::logEvent(::hostform::logging::LogLevel::Error, \
                                  ::hostform::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
