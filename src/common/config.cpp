#include "common/config.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>

namespace cascade {

namespace {

const QString kRulesDirOption = QStringLiteral("rules-dir");
const QString kDbOption = QStringLiteral("db");
const QString kTickOption = QStringLiteral("tick-ms");
const QString kMaxBatchesOption = QStringLiteral("max-batches");
const QString kTraceOption = QStringLiteral("trace");

void setupParser(QCommandLineParser &parser)
{
    parser.setApplicationDescription(
        QStringLiteral("Runs rule programs whenever a variable changes."));
    parser.addHelpOption();
    parser.addOption(QCommandLineOption(kRulesDirOption,
                                        QStringLiteral("Directory scanned for rule files."),
                                        QStringLiteral("path")));
    parser.addOption(QCommandLineOption(kDbOption,
                                        QStringLiteral("SQLite database holding the variables."),
                                        QStringLiteral("path")));
    parser.addOption(QCommandLineOption(kTickOption,
                                        QStringLiteral("Clock interval in milliseconds, 0 disables it."),
                                        QStringLiteral("ms")));
    parser.addOption(QCommandLineOption(kMaxBatchesOption,
                                        QStringLiteral("Upper bound of concurrent rule batches, 0 for none."),
                                        QStringLiteral("count")));
    parser.addOption(QCommandLineOption(kTraceOption,
                                        QStringLiteral("Log every variable change and rule batch to <process>-trace.log.")));
}

bool parseCount(const QString &text, const QString &source, int *out, QString *error)
{
    bool ok = false;
    const int value = text.trimmed().toInt(&ok);
    if (!ok || value < 0) {
        if (error) {
            *error = QStringLiteral("%1 expects a non-negative integer, got '%2'")
                         .arg(source, text);
        }
        return false;
    }
    *out = value;
    return true;
}

} // namespace

bool traceRequestedByEnvironment()
{
    const QString value = qEnvironmentVariable("CASCADE_TRACE").trimmed();
    return !value.isEmpty() && value != QStringLiteral("0");
}

std::optional<CascadeConfig> loadConfig(const QStringList &arguments, QString *error)
{
    CascadeConfig config;

    const QString envRules = qEnvironmentVariable("CASCADE_RULES_DIR");
    if (!envRules.isEmpty()) {
        config.rulesDir = envRules;
    }
    const QString envDb = qEnvironmentVariable("CASCADE_DB_PATH");
    if (!envDb.isEmpty()) {
        config.databasePath = envDb;
    }
    const QString envTick = qEnvironmentVariable("CASCADE_TICK_MS");
    if (!envTick.isEmpty()
        && !parseCount(envTick, QStringLiteral("CASCADE_TICK_MS"), &config.tickIntervalMs, error)) {
        return std::nullopt;
    }
    const QString envBatches = qEnvironmentVariable("CASCADE_MAX_BATCHES");
    if (!envBatches.isEmpty()
        && !parseCount(envBatches, QStringLiteral("CASCADE_MAX_BATCHES"),
                       &config.maxConcurrentBatches, error)) {
        return std::nullopt;
    }
    config.trace = traceRequestedByEnvironment();

    QCommandLineParser parser;
    setupParser(parser);
    if (!parser.parse(arguments)) {
        if (error) {
            *error = parser.errorText();
        }
        return std::nullopt;
    }

    if (parser.isSet(kRulesDirOption)) {
        config.rulesDir = parser.value(kRulesDirOption);
    }
    if (parser.isSet(kDbOption)) {
        config.databasePath = parser.value(kDbOption);
    }
    if (parser.isSet(kTickOption)
        && !parseCount(parser.value(kTickOption), QStringLiteral("--tick-ms"),
                       &config.tickIntervalMs, error)) {
        return std::nullopt;
    }
    if (parser.isSet(kMaxBatchesOption)
        && !parseCount(parser.value(kMaxBatchesOption), QStringLiteral("--max-batches"),
                       &config.maxConcurrentBatches, error)) {
        return std::nullopt;
    }
    if (parser.isSet(kTraceOption)) {
        config.trace = true;
    }

    return config;
}

QString configHelpText()
{
    QCommandLineParser parser;
    setupParser(parser);
    return parser.helpText();
}

} // namespace cascade
