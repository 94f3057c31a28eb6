#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>

#include <unistd.h>

#include <cstdio>
#include <mutex>

namespace nudge::logging {

namespace {

// Process-wide sink state. Guarded by m_mutex; the correlation id is
// per thread and lives outside.
class LogSink {
public:
    void configure(const LoggingOptions &options)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_options = options;
    }

    LoggingOptions options() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_options;
    }

    bool enabled(LogLevel level) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_options.traceEnabled
            || static_cast<int>(level) >= static_cast<int>(m_options.minimumLevel);
    }

    void write(LogLevel level, const QString &process, const QString &line)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const QString dir = directoryLocked();
        const QString base = process.isEmpty() ? QStringLiteral("nudge") : process;

        if (m_options.traceEnabled
            || static_cast<int>(level) >= static_cast<int>(m_options.minimumLevel)) {
            append(dir, base + QStringLiteral(".log"), line);
        }
        if (m_options.traceEnabled) {
            append(dir, base + QStringLiteral("-trace.log"), line);
        }
    }

    QString directory() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return directoryLocked();
    }

private:
    QString directoryLocked() const
    {
        if (!m_options.directory.isEmpty()) {
            return m_options.directory;
        }
        const QString home = qEnvironmentVariable("HOME");
        if (home.isEmpty()) {
            return QStringLiteral(".local/share/nudge/logs");
        }
        return home + QStringLiteral("/.local/share/nudge/logs");
    }

    void rotate(const QString &path)
    {
        const QFileInfo info(path);
        if (!info.exists() || info.size() < m_options.maxFileBytes) {
            return;
        }
        if (m_options.maxRotatedFiles <= 0) {
            QFile::remove(path);
            return;
        }

        const auto generation = [&path](int n) {
            return path + QLatin1Char('.') + QString::number(n);
        };
        QFile::remove(generation(m_options.maxRotatedFiles));
        for (int n = m_options.maxRotatedFiles - 1; n >= 1; --n) {
            if (QFile::exists(generation(n))) {
                QFile::rename(generation(n), generation(n + 1));
            }
        }
        QFile::rename(path, generation(1));
    }

    void append(const QString &dir, const QString &fileName, const QString &line)
    {
        QDir().mkpath(dir);
        const QString path = dir + QLatin1Char('/') + fileName;
        rotate(path);

        QFile file(path);
        if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            fprintf(stderr, "%s\n", line.toUtf8().constData());
            return;
        }
        file.write(line.toUtf8());
        file.write("\n");
    }

    mutable std::mutex m_mutex;
    LoggingOptions m_options;
};

LogSink &sink()
{
    static LogSink instance;
    return instance;
}

thread_local QString t_corrId;

QString threadIdString()
{
    return QStringLiteral("0x%1")
        .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16);
}

} // namespace

void initLogging(const LoggingOptions &options)
{
    sink().configure(options);
}

void initLogging(const QString &processName, bool traceEnabled)
{
    LoggingOptions options;
    options.processName = processName;
    options.traceEnabled = traceEnabled;
    initLogging(options);
}

bool isTraceEnabled()
{
    return sink().options().traceEnabled;
}

bool isLevelEnabled(LogLevel level)
{
    return sink().enabled(level);
}

QString logLevelName(LogLevel level)
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

std::optional<LogLevel> parseLogLevel(const QString &name)
{
    const QString upper = name.trimmed().toUpper();
    if (upper == QStringLiteral("DEBUG")) {
        return LogLevel::Debug;
    }
    if (upper == QStringLiteral("INFO")) {
        return LogLevel::Info;
    }
    if (upper == QStringLiteral("WARN") || upper == QStringLiteral("WARNING")) {
        return LogLevel::Warn;
    }
    if (upper == QStringLiteral("ERROR")) {
        return LogLevel::Error;
    }
    return std::nullopt;
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
    : m_prev(t_corrId)
{
    t_corrId = corrId;
}

CorrelationScope::~CorrelationScope()
{
    t_corrId = m_prev;
}

QString logDirectory()
{
    return sink().directory();
}

QString logFilePathFor(const QString &processName)
{
    const QString base = processName.isEmpty() ? QStringLiteral("nudge") : processName;
    return logDirectory() + QLatin1Char('/') + base + QStringLiteral(".log");
}

QString defaultProcessName()
{
    const QString configured = sink().options().processName;
    if (!configured.isEmpty()) {
        return configured;
    }
    if (QCoreApplication::instance()) {
        const QString appName = QCoreApplication::applicationName();
        if (!appName.isEmpty()) {
            return appName;
        }
    }
    return QStringLiteral("nudge");
}

QString defaultWho()
{
    static const QString who = [] {
        char hostname[256] = {};
        if (gethostname(hostname, sizeof(hostname)) != 0) {
            hostname[0] = '\0';
        }
        return QStringLiteral("host:%1,uid:%2")
            .arg(QString::fromUtf8(hostname))
            .arg(static_cast<int>(getuid()));
    }();
    return who;
}

void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context)
{
    if (!isLevelEnabled(level)) {
        return;
    }
    const QString process = processName.isEmpty() ? defaultProcessName() : processName;
    const QString corr = correlationId.isEmpty() ? currentCorrelationId() : correlationId;
    const nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", logLevelName(level).toStdString()},
        {"process", process.toStdString()},
        {"thread", threadIdString().toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", corr.toStdString()},
        {"context", context}
    };

    // Context strings may carry raw bytes from callers; never throw here.
    sink().write(level, process,
                 QString::fromStdString(payload.dump(-1, ' ', false,
                                                     nlohmann::json::error_handler_t::replace)));
}

} // namespace nudge::logging
