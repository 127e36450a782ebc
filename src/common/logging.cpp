#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <unistd.h>

#include <cstdio>
#include <mutex>

namespace hostform::logging {

namespace {

constexpr qint64 kRotateAtBytes = 5 * 1024 * 1024;
// <name>.log.1 is the newest rotated file, <name>.log.3 the oldest kept.
constexpr int kRotatedGenerations = 3;

struct LoggerState {
    std::mutex mutex;
    bool trace = false;
    QString processName;
    QString correlationId;
};

LoggerState &state()
{
    static LoggerState instance;
    return instance;
}

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

QString logFileFor(const QString &processName, const char *suffix)
{
    const QString stem = processName.isEmpty() ? QStringLiteral("hostform") : processName;
    return QDir(logsDirPath()).filePath(stem + QLatin1String(suffix));
}

void rotate(const QString &path)
{
    if (QFileInfo(path).size() < kRotateAtBytes) {
        return;
    }

    QFile::remove(path + QStringLiteral(".%1").arg(kRotatedGenerations));
    for (int generation = kRotatedGenerations - 1; generation >= 1; --generation) {
        QFile::rename(path + QStringLiteral(".%1").arg(generation),
                      path + QStringLiteral(".%1").arg(generation + 1));
    }
    QFile::rename(path, path + QStringLiteral(".1"));
}

// Falls back to stderr so an unwritable log dir never loses the event.
void append(const QString &path, const QByteArray &line)
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    rotate(path);

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append)) {
        std::fprintf(stderr, "%s\n", line.constData());
        return;
    }
    file.write(line);
    file.write("\n", 1);
}

QByteArray formatEvent(LogLevel level,
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
    nlohmann::json event;
    event["ts"] = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString();
    event["level"] = levelName(level);
    event["process"] = processName.toStdString();
    event["pid"] = static_cast<int>(getpid());
    event["component"] = component.toStdString();
    event["where"] = where.toStdString();
    event["what"] = what.toStdString();
    event["why"] = why.toStdString();
    event["how"] = how.toStdString();
    event["who"] = who.toStdString();
    event["corr"] = correlationId.toStdString();
    event["context"] = context;
    return QByteArray::fromStdString(event.dump());
}

} // namespace

void initLogging(const QString &processName, bool traceEnabled)
{
    LoggerState &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.processName = processName;
    s.trace = traceEnabled;
}

bool isTraceEnabled()
{
    return state().trace;
}

QString logsDirPath()
{
    const QString configured = qEnvironmentVariable("HOSTFORM_LOG_DIR");
    if (!configured.isEmpty()) {
        return configured;
    }
    const QString home = qEnvironmentVariable("HOME");
    const QString relative = QStringLiteral(".local/share/hostform/logs");
    return home.isEmpty() ? relative : home + QChar('/') + relative;
}

void setCorrelationId(const QString &corrId)
{
    state().correlationId = corrId;
}

QString currentCorrelationId()
{
    return state().correlationId;
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
    const QString configured = state().processName;
    if (!configured.isEmpty()) {
        return configured;
    }
    if (QCoreApplication::instance() && !QCoreApplication::applicationName().isEmpty()) {
        return QCoreApplication::applicationName();
    }
    return QStringLiteral("hostform");
}

QString defaultWho()
{
    char host[256] = {};
    if (gethostname(host, sizeof(host) - 1) != 0) {
        host[0] = '\0';
    }
    return QStringLiteral("host:%1,uid:%2")
        .arg(QString::fromUtf8(host))
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
    LoggerState &s = state();
    if (level == LogLevel::Debug && !s.trace) {
        return;
    }

    const QString process = processName.isEmpty() ? defaultProcessName() : processName;
    const QByteArray line = formatEvent(level, process, component, where, what, why, how, who,
                                        correlationId.isEmpty() ? s.correlationId : correlationId,
                                        context);

    std::lock_guard<std::mutex> lock(s.mutex);
    append(logFileFor(process, ".log"), line);
    if (s.trace) {
        append(logFileFor(process, "-trace.log"), line);
    }
}

} // namespace hostform::logging
