#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <QObject>
#include <QString>
#include <QThreadPool>
#include <QTimer>

#include "daemon/change_channel.hpp"
#include "daemon/rule.hpp"
#include "daemon/variable_manager.hpp"

namespace cascade {

/**
 * RuleManager owns the loaded rules and drives them:
 * - a clock that publishes time:* and date:* variables every tick
 * - a dispatch thread that takes each change event off the variable
 *   manager's channel and submits one rule batch for it
 * - a thread pool running the batches; each batch runs every rule in load
 *   order, and batches for different events run concurrently
 *
 * Every change re-runs every rule. Rules are fixed once start() is called.
 */
class RuleManager : public QObject
{
    Q_OBJECT
public:
    struct Options {
        int tickIntervalMs = 1000;
        // 0 leaves the batch fan-out unbounded.
        int maxConcurrentBatches = 0;
        QString ruleSuffix = QStringLiteral(".rule");
    };

    explicit RuleManager(VariableManager &variables, QObject *parent = nullptr);
    RuleManager(VariableManager &variables, Options options, QObject *parent = nullptr);
    ~RuleManager() override;

    // Loads every rule file of the directory in filename order. Files that
    // cannot be read or parsed are skipped with a warning. Returns the number
    // of rules added.
    int loadRules(const QString &directory);

    std::vector<std::string> ruleNames() const;

    // Starts the clock and the dispatch loop. Must be called from the thread
    // owning this object; the manager cannot be restarted after stop().
    void start();
    // Stops the clock, closes the change channel and waits for running
    // batches to finish.
    void stop();
    bool isRunning() const;

    std::uint64_t processedEvents() const;
    std::uint64_t completedBatches() const;

public slots:
    // Writes the six clock variables for the current local time.
    void publishClock();

private:
    void dispatchLoop();
    void runBatch(std::uint64_t batchId, const ChangeEvent &trigger);

    VariableManager &m_variables;
    Options m_options;
    std::vector<std::unique_ptr<Rule>> m_rules;

    QTimer m_clock;
    QThreadPool m_batchPool;
    std::thread m_dispatchThread;

    std::atomic<bool> m_running{false};
    std::atomic<std::uint64_t> m_processedEvents{0};
    std::atomic<std::uint64_t> m_completedBatches{0};
};

} // namespace cascade
