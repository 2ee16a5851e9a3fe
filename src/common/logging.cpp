#include "common/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <unistd.h>

#include <cstdio>
#include <mutex>
#include <string>

#include "common/config.hpp"

namespace rewind::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;

std::mutex g_logMutex;
LogSettings g_settings;

thread_local QString t_corrId;

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

// Keeps one generation: <log>.1.
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

void appendLine(const QString &path, const std::string &line)
{
    rotateIfNeeded(path);

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        fprintf(stderr, "%s\n", line.c_str());
        return;
    }

    file.write(line.data(), static_cast<qint64>(line.size()));
    file.write("\n");
}

} // namespace

void initLogging(const LogSettings &settings)
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_settings = settings;
    if (g_settings.processName.isEmpty()) {
        g_settings.processName = QStringLiteral("rewind");
    }
}

bool isTraceEnabled()
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    return g_settings.traceEnabled;
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

void logEvent(LogLevel level,
              const QString &component,
              const QString &operation,
              const QString &event,
              const QString &reason,
              const nlohmann::json &fields)
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    if (g_settings.rootDir.isEmpty()) {
        return;
    }
    if (level == LogLevel::Debug && !g_settings.traceEnabled) {
        return;
    }

    nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelName(level)},
        {"process", g_settings.processName.toStdString()},
        {"pid", static_cast<int>(getpid())},
        {"uid", static_cast<int>(getuid())},
        {"root", g_settings.rootDir.toStdString()},
        {"component", component.toStdString()},
        {"op", operation.toStdString()},
        {"event", event.toStdString()},
        {"reason", reason.toStdString()},
        {"corr", t_corrId.toStdString()},
        {"fields", fields.is_null() ? nlohmann::json::object() : fields}
    };
    const std::string line =
        payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    const QString dir = logsDirPath(g_settings.rootDir);
    QDir().mkpath(dir);
    appendLine(dir + QDir::separator() + g_settings.processName + QStringLiteral(".log"), line);
    if (g_settings.traceEnabled) {
        appendLine(dir + QDir::separator() + g_settings.processName
                       + QStringLiteral("-trace.log"),
                   line);
    }
}

} // namespace rewind::logging
