#pragma once

#include <optional>

#include <QString>

#include <nlohmann/json.hpp>

namespace nudge::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

struct LoggingOptions {
    QString processName;
    // Lowers the threshold to Debug and mirrors every line into
    // <process>-trace.log.
    bool traceEnabled = false;
    // Empty means $HOME/.local/share/nudge/logs.
    QString directory;
    LogLevel minimumLevel = LogLevel::Info;
    qint64 maxFileBytes = 5 * 1024 * 1024;
    // Rotated generations kept as <file>.1 ... <file>.N.
    int maxRotatedFiles = 3;
};

// Initialize logging for the current process. Call early in main().
void initLogging(const LoggingOptions &options);
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// True when a line at `level` would reach any log file.
bool isLevelEnabled(LogLevel level);

QString logLevelName(LogLevel level);
std::optional<LogLevel> parseLogLevel(const QString &name);

// Thread-local correlation support for linking the log lines of one
// campaign creation or one analytics pass.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

QString logDirectory();

// Path of the main log file for a process name.
QString logFilePathFor(const QString &processName);

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

} // namespace nudge::logging

// Arguments are only evaluated when the level is enabled.
#define NLOG_EVENT(level, component, where, what, why, how, who, corr, ctxJson) \
    do { \
        if (::nudge::logging::isLevelEnabled(level)) { \
            ::nudge::logging::logEvent((level), \
                                       ::nudge::logging::defaultProcessName(), \
                                       (component), (where), (what), (why), (how), (who), (corr), \
                                       (ctxJson)); \
        } \
    } while (0)

#define NLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    NLOG_EVENT(::nudge::logging::LogLevel::Debug, component, where, what, why, how, who, corr, ctxJson)

#define NLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    NLOG_EVENT(::nudge::logging::LogLevel::Info, component, where, what, why, how, who, corr, ctxJson)

#define NLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    NLOG_EVENT(::nudge::logging::LogLevel::Warn, component, where, what, why, how, who, corr, ctxJson)

#define NLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    NLOG_EVENT(::nudge::logging::LogLevel::Error, component, where, what, why, how, who, corr, ctxJson)
