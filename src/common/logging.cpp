#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <syslog.h>
#include <unistd.h>

#include <iostream>
#include <mutex>

namespace btrsnap::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;

std::mutex g_logMutex;
bool g_quiet = false;
bool g_traceEnabled = false;
bool g_syslogEnabled = false;
bool g_syslogOpen = false;
QString g_processName;
QString g_logFilePath;
// openlog() keeps the pointer, so the ident must outlive the connection.
QByteArray g_syslogIdent;

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

int levelToSyslogPriority(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return LOG_DEBUG;
    case LogLevel::Info:
        return LOG_INFO;
    case LogLevel::Warn:
        return LOG_WARNING;
    case LogLevel::Error:
        return LOG_ERR;
    }
    return LOG_INFO;
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

void writeLine(const QString &path, const QString &line)
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    rotateIfNeeded(path);

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::cerr << line.toStdString() << std::endl;
        return;
    }

    file.write(line.toUtf8());
    file.write("\n");
}

void writeConsole(LogLevel level, const QString &process, const QString &message)
{
    if (message.isEmpty()) {
        return;
    }
    switch (level) {
    case LogLevel::Debug:
    case LogLevel::Info:
        if (!g_quiet) {
            std::cout << message.toStdString() << std::endl;
        }
        break;
    case LogLevel::Warn:
        std::cerr << process.toStdString() << ": warning: "
                  << message.toStdString() << std::endl;
        break;
    case LogLevel::Error:
        std::cerr << process.toStdString() << ": " << message.toStdString()
                  << std::endl;
        break;
    }
}

} // namespace

void initLogging(const QString &processName, const LoggingOptions &options)
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_processName = processName;
    g_quiet = options.quiet;
    g_traceEnabled = options.trace;
    g_syslogEnabled = options.syslogEnabled;
    g_logFilePath = options.logFilePath;

    if (g_syslogOpen) {
        closelog();
        g_syslogOpen = false;
    }
    if (g_syslogEnabled) {
        g_syslogIdent = processName.toLocal8Bit();
        openlog(g_syslogIdent.constData(), LOG_PID, LOG_USER);
        g_syslogOpen = true;
    }
}

void setQuiet(bool quiet)
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_quiet = quiet;
}

void setTraceEnabled(bool enabled)
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_traceEnabled = enabled;
}

bool isTraceEnabled()
{
    return g_traceEnabled;
}

void setCorrelationId(const QString &corrId)
{
    t_corrId = corrId;
}

QString currentCorrelationId()
{
    return t_corrId;
}

CorrelationScope::CorrelationScope(const QString &corrId)
    : m_prev(currentCorrelationId())
{
    setCorrelationId(corrId);
}

CorrelationScope::~CorrelationScope()
{
    setCorrelationId(m_prev);
}

QString defaultProcessName()
{
    if (!g_processName.isEmpty()) {
        return g_processName;
    }
    if (QCoreApplication::instance()) {
        const QString appName = QCoreApplication::applicationName();
        if (!appName.isEmpty()) {
            return appName;
        }
    }
    return QStringLiteral("btrsnap");
}

QString defaultWho()
{
    char hostname[256] = {};
    if (gethostname(hostname, sizeof(hostname)) != 0) {
        hostname[0] = '\0';
    }
    return QStringLiteral("host:%1,uid:%2")
        .arg(QString::fromUtf8(hostname))
        .arg(static_cast<int>(getuid()));
}

void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &message,
              const nlohmann::json &context)
{
    const QString process = processName.isEmpty() ? defaultProcessName() : processName;
    nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelToString(level).toStdString()},
        {"process", process.toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"message", message.toStdString()},
        {"who", defaultWho().toStdString()},
        {"corr", currentCorrelationId().toStdString()},
        {"context", context}
    };

    const std::string line = payload.dump();

    std::lock_guard<std::mutex> lock(g_logMutex);
    if (level == LogLevel::Debug && !isTraceEnabled()) {
        return;
    }

    writeConsole(level, process, message);

    if (g_syslogOpen) {
        syslog(levelToSyslogPriority(level), "%s", line.c_str());
    }

    if (!g_logFilePath.isEmpty()) {
        writeLine(g_logFilePath, QString::fromStdString(line));
    }
}

} // namespace btrsnap::logging
