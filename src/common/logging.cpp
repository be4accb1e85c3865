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

#include "common/paths.hpp"

namespace nvdm::logging {

namespace {

constexpr qint64 kRotateAtBytes = 5 * 1024 * 1024;

struct LogState {
    std::mutex mutex;
    QString processName;
    bool trace = false;
};

LogState &state()
{
    static LogState instance;
    return instance;
}

thread_local QString t_correlation;

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

// <root>/logs/<process>.log and <root>/logs/<process>-trace.log
QString sinkPath(const QString &process, bool traceSink)
{
    const QString stem = process.isEmpty() ? QStringLiteral("nvdm") : process;
    const QString suffix = traceSink ? QStringLiteral("-trace.log") : QStringLiteral(".log");
    return QDir(logsDirPath()).filePath(stem + suffix);
}

void appendToSink(const QString &path, const QByteArray &line)
{
    if (!QDir().mkpath(QFileInfo(path).absolutePath())) {
        std::fprintf(stderr, "%s\n", line.constData());
        return;
    }

    const QFileInfo info(path);
    if (info.exists() && info.size() >= kRotateAtBytes) {
        const QString previous = path + QStringLiteral(".1");
        QFile::remove(previous);
        QFile::rename(path, previous);
    }

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "%s\n", line.constData());
        return;
    }
    file.write(line);
    file.write("\n");
}

std::string threadTag()
{
    const auto id = reinterpret_cast<quintptr>(QThread::currentThreadId());
    return QStringLiteral("0x%1").arg(id, 0, 16).toStdString();
}

} // namespace

void initLogging(const QString &processName, bool traceEnabled)
{
    LogState &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.processName = processName;
    s.trace = traceEnabled;
}

bool isTraceEnabled()
{
    LogState &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.trace;
}

void setCorrelationId(const QString &corrId)
{
    t_correlation = corrId;
}

QString currentCorrelationId()
{
    return t_correlation;
}

CorrelationScope::CorrelationScope(const QString &corrId)
    : m_prev(t_correlation)
{
    t_correlation = corrId;
}

CorrelationScope::~CorrelationScope()
{
    t_correlation = m_prev;
}

QString defaultProcessName()
{
    {
        LogState &s = state();
        std::lock_guard<std::mutex> lock(s.mutex);
        if (!s.processName.isEmpty()) {
            return s.processName;
        }
    }
    if (QCoreApplication::instance() && !QCoreApplication::applicationName().isEmpty()) {
        return QCoreApplication::applicationName();
    }
    return QStringLiteral("nvdm");
}

QString defaultWho()
{
    static const QString host = [] {
        char buffer[256] = {};
        if (gethostname(buffer, sizeof(buffer) - 1) != 0) {
            return QString();
        }
        return QString::fromUtf8(buffer);
    }();

    return QStringLiteral("host:%1,uid:%2,euid:%3")
        .arg(host)
        .arg(static_cast<int>(getuid()))
        .arg(static_cast<int>(geteuid()));
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
    const QString process = processName.isEmpty() ? defaultProcessName() : processName;

    nlohmann::json event;
    event["ts"] = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString();
    event["level"] = levelName(level);
    event["process"] = process.toStdString();
    event["thread"] = threadTag();
    event["component"] = component.toStdString();
    event["where"] = where.toStdString();
    event["what"] = what.toStdString();
    event["why"] = why.toStdString();
    event["how"] = how.toStdString();
    event["who"] = who.toStdString();
    event["corr"] = (correlationId.isEmpty() ? t_correlation : correlationId).toStdString();
    event["context"] = context.is_null() ? nlohmann::json::object() : context;

    const QByteArray line = QByteArray::fromStdString(event.dump());

    LogState &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (level == LogLevel::Debug && !s.trace) {
        return;
    }
    appendToSink(sinkPath(process, false), line);
    if (s.trace) {
        appendToSink(sinkPath(process, true), line);
    }
}

} // namespace nvdm::logging
