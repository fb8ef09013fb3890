#include "daemon/rule_manager.hpp"

#include <ctime>
#include <exception>
#include <limits>

#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "script/errors.hpp"

namespace cascade {

namespace {

struct ClockVariable {
    const char *name;
    std::int64_t value;
};

} // namespace

RuleManager::RuleManager(VariableManager &variables, QObject *parent)
    : RuleManager(variables, Options(), parent)
{
}

RuleManager::RuleManager(VariableManager &variables, Options options, QObject *parent)
    : QObject(parent)
    , m_variables(variables)
    , m_options(std::move(options))
{
    m_clock.setTimerType(Qt::PreciseTimer);
    connect(&m_clock, &QTimer::timeout, this, &RuleManager::publishClock);

    m_batchPool.setMaxThreadCount(m_options.maxConcurrentBatches > 0
                                      ? m_options.maxConcurrentBatches
                                      : std::numeric_limits<int>::max());
}

RuleManager::~RuleManager()
{
    stop();
}

int RuleManager::loadRules(const QString &directory)
{
    if (m_running) {
        CLOG_WARN(QStringLiteral("RuleManager"),
                  QStringLiteral("loadRules"),
                  QStringLiteral("rules_load_refused"),
                  QStringLiteral("manager_running"),
                  (nlohmann::json{{"directory", directory.toStdString()}}));
        return 0;
    }

    const QDir dir(directory);
    if (!dir.exists()) {
        CLOG_WARN(QStringLiteral("RuleManager"),
                  QStringLiteral("loadRules"),
                  QStringLiteral("rules_dir_missing"),
                  QStringLiteral("startup_load"),
                  (nlohmann::json{{"directory", directory.toStdString()}}));
        return 0;
    }

    int count = 0;
    const QFileInfoList entries = dir.entryInfoList(QDir::Files, QDir::Name);
    for (const QFileInfo &info : entries) {
        if (!info.fileName().endsWith(m_options.ruleSuffix)) {
            continue;
        }

        QFile file(info.absoluteFilePath());
        if (!file.open(QIODevice::ReadOnly)) {
            CLOG_WARN(QStringLiteral("RuleManager"),
                      QStringLiteral("loadRules"),
                      QStringLiteral("rule_open_failed"),
                      QStringLiteral("startup_load"),
                      (nlohmann::json{{"file", info.fileName().toStdString()},
                                      {"error", file.errorString().toStdString()}}));
            continue;
        }

        const QByteArray source = file.readAll();
        try {
            m_rules.push_back(std::make_unique<Rule>(info.fileName().toStdString(),
                                                     source.toStdString(),
                                                     m_variables));
        } catch (const script::ScriptError &error) {
            CLOG_WARN(QStringLiteral("RuleManager"),
                      QStringLiteral("loadRules"),
                      QStringLiteral("rule_parse_failed"),
                      QStringLiteral("startup_load"),
                      (nlohmann::json{{"file", info.fileName().toStdString()},
                                      {"error", error.what()}}));
            continue;
        }
        ++count;
    }

    CLOG_INFO(QStringLiteral("RuleManager"),
              QStringLiteral("loadRules"),
              QStringLiteral("rules_loaded"),
              QStringLiteral("startup_load"),
              (nlohmann::json{{"directory", directory.toStdString()},
                              {"count", count}}));
    return count;
}

std::vector<std::string> RuleManager::ruleNames() const
{
    std::vector<std::string> names;
    names.reserve(m_rules.size());
    for (const auto &rule : m_rules) {
        names.push_back(rule->name());
    }
    return names;
}

void RuleManager::start()
{
    if (m_running.exchange(true)) {
        return;
    }

    CLOG_INFO(QStringLiteral("RuleManager"),
              QStringLiteral("start"),
              QStringLiteral("rule_manager_start"),
              QStringLiteral("daemon_start"),
              (nlohmann::json{{"rules", m_rules.size()},
                              {"tickIntervalMs", m_options.tickIntervalMs},
                              {"maxConcurrentBatches", m_options.maxConcurrentBatches}}));

    m_dispatchThread = std::thread(&RuleManager::dispatchLoop, this);

    if (m_options.tickIntervalMs > 0) {
        m_clock.start(m_options.tickIntervalMs);
    }
}

void RuleManager::stop()
{
    if (!m_running.exchange(false)) {
        return;
    }

    m_clock.stop();
    // Releases the dispatch loop and every writer blocked in set().
    m_variables.updates().close();
    if (m_dispatchThread.joinable()) {
        m_dispatchThread.join();
    }
    m_batchPool.waitForDone();

    CLOG_INFO(QStringLiteral("RuleManager"),
              QStringLiteral("stop"),
              QStringLiteral("rule_manager_stop"),
              QStringLiteral("shutdown"),
              (nlohmann::json{{"processedEvents", m_processedEvents.load()},
                              {"completedBatches", m_completedBatches.load()}}));
}

bool RuleManager::isRunning() const
{
    return m_running;
}

std::uint64_t RuleManager::processedEvents() const
{
    return m_processedEvents;
}

std::uint64_t RuleManager::completedBatches() const
{
    return m_completedBatches;
}

void RuleManager::publishClock()
{
    const std::time_t raw = std::time(nullptr);
    std::tm localTime{};
#if defined(_WIN32)
    localtime_s(&localTime, &raw);
#else
    localtime_r(&raw, &localTime);
#endif

    const ClockVariable variables[] = {
        {"time:second", localTime.tm_sec},
        {"time:minute", localTime.tm_min},
        {"time:hour", localTime.tm_hour},
        {"date:day", localTime.tm_mday},
        {"date:month", localTime.tm_mon + 1},
        {"date:year", localTime.tm_year + 1900},
    };

    // Each write goes through the usual no-op check, so only the fields
    // that changed since the last tick produce events.
    for (const auto &variable : variables) {
        try {
            m_variables.set(variable.name, script::Value(variable.value));
        } catch (const std::exception &error) {
            CLOG_WARN(QStringLiteral("RuleManager"),
                      QStringLiteral("publishClock"),
                      QStringLiteral("clock_write_failed"),
                      QStringLiteral("clock_tick"),
                      (nlohmann::json{{"name", variable.name},
                                      {"error", error.what()}}));
        }
    }
}

void RuleManager::dispatchLoop()
{
    while (auto event = m_variables.updates().receive()) {
        const std::uint64_t batchId = ++m_processedEvents;
        ChangeEvent trigger = std::move(*event);

        CLOG_TRACE(QStringLiteral("RuleManager"),
                   QStringLiteral("dispatchLoop"),
                   QStringLiteral("change_received"),
                   QStringLiteral("variable_changed"),
                   (nlohmann::json{{"batch", batchId},
                                   {"name", trigger.name},
                                   {"value", trigger.value.toString()}}));

        m_batchPool.start([this, batchId, trigger]() {
            runBatch(batchId, trigger);
        });
    }
}

void RuleManager::runBatch(std::uint64_t batchId, const ChangeEvent &trigger)
{
    logging::BatchScope batch(batchId, trigger.name);

    for (const auto &rule : m_rules) {
        logging::RuleScope scope(rule->name());
        try {
            rule->run();
        } catch (const std::exception &error) {
            logging::logRuleEvent(logging::LogLevel::Warn,
                                  QStringLiteral("rule_failed"),
                                  QStringLiteral("rule_evaluation"),
                                  (nlohmann::json{{"error", error.what()}}));
        }
    }

    CLOG_TRACE(QStringLiteral("RuleManager"),
               QStringLiteral("runBatch"),
               QStringLiteral("batch_finished"),
               QStringLiteral("all_rules_run"),
               (nlohmann::json{{"rules", m_rules.size()}}));
    ++m_completedBatches;
}

} // namespace cascade
