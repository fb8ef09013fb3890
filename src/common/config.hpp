#pragma once

#include <optional>

#include <QString>
#include <QStringList>

namespace cascade {

struct CascadeConfig {
    QString rulesDir = QStringLiteral(".");
    // Empty selects the store's default location.
    QString databasePath;
    QString ruleSuffix = QStringLiteral(".rule");
    // 0 disables the clock.
    int tickIntervalMs = 1000;
    // 0 leaves the number of concurrently running rule batches unbounded.
    int maxConcurrentBatches = 0;
    // Writes TRACE events and the <process>-trace.log file.
    bool trace = false;
};

// True when CASCADE_TRACE is set to anything but "" or "0".
bool traceRequestedByEnvironment();

// Builds the configuration from defaults, then CASCADE_* environment
// variables, then the command line (arguments[0] is the program name).
// Returns std::nullopt and sets *error when a value is invalid.
std::optional<CascadeConfig> loadConfig(const QStringList &arguments, QString *error);

// Usage text for --help.
QString configHelpText();

} // namespace cascade
