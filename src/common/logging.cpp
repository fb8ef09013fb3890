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

namespace cascade::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;

std::mutex g_logMutex;
bool g_traceEnabled = false;
QString g_processName;

thread_local BatchContext t_batch;

const char *levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

QString processName()
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
    return QStringLiteral("cascade");
}

// Keeps one previous generation as `<file>.1`.
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

void appendLine(const QString &path, const QByteArray &line)
{
    rotateIfNeeded(path);

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        fprintf(stderr, "%s\n", line.constData());
        return;
    }
    file.write(line);
    file.write("\n");
}

nlohmann::json batchFields()
{
    nlohmann::json fields = nlohmann::json::object();
    if (!t_batch.active()) {
        return fields;
    }
    fields["batch"] = t_batch.batch;
    fields["trigger"] = t_batch.trigger;
    if (!t_batch.rule.empty()) {
        fields["rule"] = t_batch.rule;
    }
    return fields;
}

} // namespace

QString logsDirPath()
{
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/cascade/logs");
    }
    return home + QStringLiteral("/.local/share/cascade/logs");
}

QString logFilePath(const QString &suffix)
{
    QString process;
    {
        std::lock_guard<std::mutex> lock(g_logMutex);
        process = processName();
    }
    return logsDirPath() + QDir::separator() + process + suffix;
}

void initLogging(const QString &name, bool traceEnabled)
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_processName = name;
    g_traceEnabled = traceEnabled;
}

bool isTraceEnabled()
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    return g_traceEnabled;
}

const BatchContext &currentBatch()
{
    return t_batch;
}

BatchScope::BatchScope(std::uint64_t batch, const std::string &trigger)
    : m_prev(t_batch)
{
    t_batch = BatchContext{batch, trigger, std::string()};
}

BatchScope::~BatchScope()
{
    t_batch = m_prev;
}

RuleScope::RuleScope(const std::string &rule)
    : m_prev(t_batch.rule)
{
    t_batch.rule = rule;
}

RuleScope::~RuleScope()
{
    t_batch.rule = m_prev;
}

void logEvent(LogLevel level,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const nlohmann::json &context)
{
    nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelName(level)},
        {"pid", static_cast<qint64>(getpid())},
        {"thread", QStringLiteral("0x%1")
                       .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16)
                       .toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"context", context}
    };
    payload.update(batchFields());

    std::lock_guard<std::mutex> lock(g_logMutex);
    const QString process = processName();
    payload["process"] = process.toStdString();
    const QByteArray line = QByteArray::fromStdString(payload.dump());

    const QString base = logsDirPath() + QDir::separator() + process;
    QDir().mkpath(logsDirPath());
    if (level != LogLevel::Trace) {
        appendLine(base + QStringLiteral(".log"), line);
    }
    // The trace file interleaves every level in order.
    if (g_traceEnabled) {
        appendLine(base + QStringLiteral("-trace.log"), line);
    }
}

void logRuleEvent(LogLevel level,
                  const QString &what,
                  const QString &why,
                  const nlohmann::json &context)
{
    logEvent(level,
             QStringLiteral("Rule"),
             QString::fromStdString(t_batch.rule),
             what,
             why,
             context);
}

} // namespace cascade::logging
