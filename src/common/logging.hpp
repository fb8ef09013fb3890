#pragma once

#include <QString>

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace cascade::logging {

// Trace events describe individual variable changes and batch hand-offs.
// They are only written when tracing is on.
enum class LogLevel {
    Trace,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

QString logsDirPath();

// `<logs dir>/<process><suffix>` for the process named in initLogging().
QString logFilePath(const QString &suffix);

// Rule batch the current thread is running, if any. Every line logged while
// a batch runs carries its id, the variable that triggered it and the rule
// being evaluated.
struct BatchContext {
    std::uint64_t batch = 0;
    std::string trigger;
    std::string rule;

    bool active() const { return batch != 0; }
};

const BatchContext &currentBatch();

class BatchScope {
public:
    BatchScope(std::uint64_t batch, const std::string &trigger);
    ~BatchScope();

    BatchScope(const BatchScope &) = delete;
    BatchScope &operator=(const BatchScope &) = delete;

private:
    BatchContext m_prev;
};

// Narrows the current batch to one rule.
class RuleScope {
public:
    explicit RuleScope(const std::string &rule);
    ~RuleScope();

    RuleScope(const RuleScope &) = delete;
    RuleScope &operator=(const RuleScope &) = delete;

private:
    std::string m_prev;
};

void logEvent(LogLevel level,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const nlohmann::json &context = nlohmann::json::object());

// Event raised on behalf of the rule in the current RuleScope. Logged under
// the "Rule" component with the rule name as `where`.
void logRuleEvent(LogLevel level,
                  const QString &what,
                  const QString &why,
                  const nlohmann::json &context = nlohmann::json::object());

} // namespace cascade::logging

#define CLOG_TRACE(component, where, what, why, ctxJson) \
    ::cascade::logging::logEvent(::cascade::logging::LogLevel::Trace, \
                                 (component), (where), (what), (why), (ctxJson))

#define CLOG_INFO(component, where, what, why, ctxJson) \
    ::cascade::logging::logEvent(::cascade::logging::LogLevel::Info, \
                                 (component), (where), (what), (why), (ctxJson))

#define CLOG_WARN(component, where, what, why, ctxJson) \
    ::cascade::logging::logEvent(::cascade::logging::LogLevel::Warn, \
                                 (component), (where), (what), (why), (ctxJson))

#define CLOG_ERROR(component, where, what, why, ctxJson) \
    ::cascade::logging::logEvent(::cascade::logging::LogLevel::Error, \
                                 (component), (where), (what), (why), (ctxJson))
