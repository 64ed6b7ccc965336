#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace kgnav::logging {

enum class LogLevel {
    Debug,
    Info,
    Error
};

// Initialize logging for the current process. Call early in main().
void initLogging(const QString &processName, bool traceEnabled);

// Thread-local correlation id. Records logged with an empty corr inside a
// CorrelationScope carry the scope's id.
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

QString logsDirPath();
QString defaultProcessName();
QString defaultWho();

} // namespace kgnav::logging

#define KGNAV_LOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::kgnav::logging::logEvent(::kgnav::logging::LogLevel::Debug, \
                               ::kgnav::logging::defaultProcessName(), \
                               (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define KGNAV_LOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::kgnav::logging::logEvent(::kgnav::logging::LogLevel::Info, \
                               ::kgnav::logging::defaultProcessName(), \
                               (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define KGNAV_LOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::kgnav::logging::logEvent(::kgnav::logging::LogLevel::Error, \
                               ::kgnav::logging::defaultProcessName(), \
                               (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
