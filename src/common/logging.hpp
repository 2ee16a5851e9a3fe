#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace rewind::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

struct LogSettings {
    QString processName = QStringLiteral("rewind");
    // Storage root; log files go to <rootDir>/logs.
    QString rootDir;
    // Debug events are written, and every event is mirrored to <process>-trace.log.
    bool traceEnabled = false;
};

// Route events into the storage root's logs directory. Until this runs, or
// when rootDir is empty, events are dropped.
void initLogging(const LogSettings &settings);

bool isTraceEnabled();

// Thread-local correlation id, stamped on every event of one CLI invocation.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

// One JSON line. Never throws: strings that are not valid UTF-8 are written
// with replacement characters.
void logEvent(LogLevel level,
              const QString &component,
              const QString &operation,
              const QString &event,
              const QString &reason,
              const nlohmann::json &fields = nlohmann::json::object());

} // namespace rewind::logging

#define RLOG_DEBUG(component, operation, event, reason, fields) \
    ::rewind::logging::logEvent(::rewind::logging::LogLevel::Debug, \
                                (component), (operation), (event), (reason), (fields))

#define RLOG_INFO(component, operation, event, reason, fields) \
    ::rewind::logging::logEvent(::rewind::logging::LogLevel::Info, \
                                (component), (operation), (event), (reason), (fields))

#define RLOG_WARN(component, operation, event, reason, fields) \
    ::rewind::logging::logEvent(::rewind::logging::LogLevel::Warn, \
                                (component), (operation), (event), (reason), (fields))

#define RLOG_ERROR(component, operation, event, reason, fields) \
    ::rewind::logging::logEvent(::rewind::logging::LogLevel::Error, \
                                (component), (operation), (event), (reason), (fields))
