#pragma once

#include <memory>

#include <QObject>

#include "common/config.hpp"
#include "daemon/cascade_store.hpp"
#include "daemon/rule_manager.hpp"
#include "daemon/variable_manager.hpp"

namespace cascade {

/**
 * CascadeDaemon wires the engine together:
 * - the SQLite store holding the variables
 * - the VariableManager every rule reads and writes through
 * - the RuleManager loading rules and reacting to variable changes
 *
 * It is designed to be owned from main() and driven by Qt's event loop.
 */
class CascadeDaemon : public QObject
{
    Q_OBJECT
public:
    explicit CascadeDaemon(const CascadeConfig &config, QObject *parent = nullptr);
    ~CascadeDaemon() override;

    // Loads the rules and starts the clock and dispatch loop. Returns false
    // when the store fails its integrity check; nothing is started then.
    bool start();
    void stop();

    VariableManager &variables();
    RuleManager &rules();

private:
    CascadeConfig m_config;
    std::unique_ptr<CascadeStore> m_store;
    std::unique_ptr<VariableManager> m_variables;
    std::unique_ptr<RuleManager> m_rules;
};

} // namespace cascade
