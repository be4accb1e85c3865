#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace nvdm::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Thread-local correlation support; an orchestration run uses its run id.
void setCorrelationId(const QString &corrId);
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

} // namespace nvdm::logging

#define NVDM_LOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::nvdm::logging::logEvent(::nvdm::logging::LogLevel::Debug, \
                              ::nvdm::logging::defaultProcessName(), \
                              (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define NVDM_LOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::nvdm::logging::logEvent(::nvdm::logging::LogLevel::Info, \
                              ::nvdm::logging::defaultProcessName(), \
                              (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define NVDM_LOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::nvdm::logging::logEvent(::nvdm::logging::LogLevel::Warn, \
                              ::nvdm::logging::defaultProcessName(), \
                              (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define NVDM_LOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::nvdm::logging::logEvent(::nvdm::logging::LogLevel::Error, \
                              ::nvdm::logging::defaultProcessName(), \
                              (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
