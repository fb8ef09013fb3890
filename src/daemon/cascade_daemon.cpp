#include "daemon/cascade_daemon.hpp"

#include <QDebug>

#include <nlohmann/json.hpp>

#include "common/cascade_version.hpp"
#include "common/logging.hpp"

namespace cascade {

namespace {

std::unique_ptr<CascadeStore> openStore(const CascadeConfig &config)
{
    if (config.databasePath.isEmpty()) {
        return std::make_unique<CascadeStore>();
    }
    return std::make_unique<CascadeStore>(config.databasePath.toStdString());
}

RuleManager::Options ruleOptions(const CascadeConfig &config)
{
    RuleManager::Options options;
    options.tickIntervalMs = config.tickIntervalMs;
    options.maxConcurrentBatches = config.maxConcurrentBatches;
    options.ruleSuffix = config.ruleSuffix;
    return options;
}

} // namespace

CascadeDaemon::CascadeDaemon(const CascadeConfig &config, QObject *parent)
    : QObject(parent)
    , m_config(config)
    , m_store(openStore(config))
    , m_variables(std::make_unique<VariableManager>(*m_store))
    , m_rules(std::make_unique<RuleManager>(*m_variables, ruleOptions(config)))
{
}

CascadeDaemon::~CascadeDaemon()
{
    stop();
}

bool CascadeDaemon::start()
{
    qInfo() << "Cascade: daemon starting (version" << CASCADE_VERSION << ")";

    std::string integrityMessage;
    if (!m_store->integrityCheck(&integrityMessage)) {
        qWarning() << "Cascade: SQLite integrity check failed, database may be corrupt:"
                   << QString::fromStdString(integrityMessage);
        CLOG_ERROR(QStringLiteral("CascadeDaemon"),
                   QStringLiteral("start"),
                   QStringLiteral("store_integrity_failed"),
                   QStringLiteral("startup_check"),
                   (nlohmann::json{{"message", integrityMessage}}));
        return false;
    }

    const int loaded = m_rules->loadRules(m_config.rulesDir);
    qInfo() << "Cascade: loaded" << loaded << "rules from" << m_config.rulesDir;

    m_rules->start();
    return true;
}

void CascadeDaemon::stop()
{
    if (m_rules) {
        m_rules->stop();
    }
}

VariableManager &CascadeDaemon::variables()
{
    return *m_variables;
}

RuleManager &CascadeDaemon::rules()
{
    return *m_rules;
}

} // namespace cascade
