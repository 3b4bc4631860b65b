#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace btrsnap::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

struct LoggingOptions {
    bool quiet = false;
    bool trace = false;
    bool syslogEnabled = true;
    // JSON lines sink; empty disables it.
    QString logFilePath;
};

// Initialize logging for the current process. Call early in main().
void initLogging(const QString &processName, const LoggingOptions &options);

// Quiet and trace are only known once the command line has been resolved.
void setQuiet(bool quiet);
void setTraceEnabled(bool enabled);
bool isTraceEnabled();

// Thread-local correlation support for linking the events of one run.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

// Structured log event. `message` is the human readable line printed to the
// console; the remaining fields only go to syslog and the log file.
void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &message,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultProcessName();
QString defaultWho();

} // namespace btrsnap::logging

#define SNAPLOG_DEBUG(component, where, what, message, ctxJson) \
    ::btrsnap::logging::logEvent(::btrsnap::logging::LogLevel::Debug, \
                                 ::btrsnap::logging::defaultProcessName(), \
                                 (component), (where), (what), (message), (ctxJson))

#define SNAPLOG_INFO(component, where, what, message, ctxJson) \
    ::btrsnap::logging::logEvent(::btrsnap::logging::LogLevel::Info, \
                                 ::btrsnap::logging::defaultProcessName(), \
                                 (component), (where), (what), (message), (ctxJson))

#define SNAPLOG_WARN(component, where, what, message, ctxJson) \
    ::btrsnap::logging::logEvent(::btrsnap::logging::LogLevel::Warn, \
                                 ::btrsnap::logging::defaultProcessName(), \
                                 (component), (where), (what), (message), (ctxJson))

#define SNAPLOG_ERROR(component, where, what, message, ctxJson) \
    ::btrsnap::logging::logEvent(::btrsnap::logging::LogLevel::Error, \
                                 ::btrsnap::logging::defaultProcessName(), \
                                 (component), (where), (what), (message), (ctxJson))
