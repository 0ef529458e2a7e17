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

#include "common/config.hpp"

namespace stratum::logging {

namespace {

constexpr qint64 kRotateAtBytes = 5 * 1024 * 1024;
constexpr int kKeptGenerations = 3;

struct LoggingState {
    std::mutex mutex;
    QString processName;
    bool traceEnabled = false;
};

LoggingState &state()
{
    static LoggingState instance;
    return instance;
}

thread_local QString t_correlationId;

const char *levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

// name.log -> name.log.1 -> ... -> name.log.N; the oldest generation is dropped.
void rotate(const QString &path)
{
    const QFileInfo info(path);
    if (!info.exists() || info.size() < kRotateAtBytes) {
        return;
    }

    QFile::remove(QStringLiteral("%1.%2").arg(path).arg(kKeptGenerations));
    for (int generation = kKeptGenerations - 1; generation >= 1; --generation) {
        QFile::rename(QStringLiteral("%1.%2").arg(path).arg(generation),
                      QStringLiteral("%1.%2").arg(path).arg(generation + 1));
    }
    QFile::rename(path, path + QStringLiteral(".1"));
}

void append(const QString &path, const QByteArray &line)
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    rotate(path);

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append)) {
        // Unwritable log directory: the event still reaches stderr.
        std::fprintf(stderr, "%s\n", line.constData());
        return;
    }
    file.write(line);
    file.write("\n");
}

QString currentThreadTag()
{
    return QStringLiteral("0x%1")
        .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16);
}

nlohmann::json makeRecord(LogLevel level,
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
    return nlohmann::json{
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelName(level)},
        {"process", processName.toStdString()},
        {"thread", currentThreadTag().toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", correlationId.toStdString()},
        {"context", context}
    };
}

} // namespace

void initLogging(const QString &processName, bool traceEnabled)
{
    LoggingState &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.processName = processName;
    s.traceEnabled = traceEnabled;
}

bool isTraceEnabled()
{
    LoggingState &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.traceEnabled;
}

QString currentCorrelationId()
{
    return t_correlationId;
}

CorrelationScope::CorrelationScope(const QString &corrId)
    : m_prev(t_correlationId)
{
    t_correlationId = corrId;
}

CorrelationScope::~CorrelationScope()
{
    t_correlationId = m_prev;
}

QString logsDirPath()
{
    return defaultStateDir() + QStringLiteral("/logs");
}

QString buildLogPath(const QString &buildId)
{
    return logsDirPath() + QStringLiteral("/builds/") + buildId + QStringLiteral(".log");
}

QString defaultProcessName()
{
    {
        LoggingState &s = state();
        std::lock_guard<std::mutex> lock(s.mutex);
        if (!s.processName.isEmpty()) {
            return s.processName;
        }
    }
    if (QCoreApplication::instance() && !QCoreApplication::applicationName().isEmpty()) {
        return QCoreApplication::applicationName();
    }
    return QStringLiteral("stratum");
}

QString defaultWho()
{
    char hostname[256] = {};
    if (gethostname(hostname, sizeof(hostname) - 1) != 0) {
        hostname[0] = '\0';
    }
    return QStringLiteral("host:%1,uid:%2")
        .arg(QString::fromUtf8(hostname))
        .arg(static_cast<qulonglong>(getuid()));
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
    LoggingState &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (level == LogLevel::Debug && !s.traceEnabled) {
        return;
    }

    const QString process = processName.isEmpty() ? s.processName : processName;
    const QString corr = correlationId.isEmpty() ? t_correlationId : correlationId;

    // Sub-command output is arbitrary bytes; invalid UTF-8 is replaced, not thrown.
    const QByteArray line = QByteArray::fromStdString(
        makeRecord(level, process, component, where, what, why, how, who, corr, context)
            .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));

    const QString base = logsDirPath() + QLatin1Char('/')
        + (process.isEmpty() ? QStringLiteral("stratum") : process);
    append(base + QStringLiteral(".log"), line);
    if (s.traceEnabled) {
        append(base + QStringLiteral("-trace.log"), line);
    }
    if (!corr.isEmpty()) {
        append(buildLogPath(corr), line);
    }
}

} // namespace stratum::logging
