#include "cli/VarCli.hpp"

#include <exception>
#include <iostream>
#include <memory>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "daemon/cascade_store.hpp"
#include "daemon/variable_manager.hpp"

namespace cascade {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  cascade-var [--db PATH] get NAME\n"
        "  cascade-var [--db PATH] set NAME JSON\n"
        "  cascade-var [--db PATH] list\n"
        "Set CASCADE_TRACE=1 or pass --trace to also write cascade-var-trace.log.\n");
}

// Strips "--db PATH" and returns the remaining positional arguments.
QStringList positionalArgs(const QStringList &args, QString *dbPath)
{
    QStringList positional;
    for (int i = 1; i < args.size(); ++i) {
        if (args.at(i) == QStringLiteral("--db") && i + 1 < args.size()) {
            *dbPath = args.at(i + 1);
            ++i;
            continue;
        }
        positional.push_back(args.at(i));
    }
    return positional;
}

std::string renderValue(const script::Value &value)
{
    return nlohmann::json(value).dump();
}

} // namespace

int VarCli::run(int argc, char *argv[])
{
    // CLI entry: parse the subcommand and delegate to the handler.
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    QString dbPath;
    const QStringList positional = positionalArgs(args, &dbPath);
    if (positional.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString command = positional.at(0);
    CLOG_INFO(QStringLiteral("VarCli"),
              QStringLiteral("run"),
              QStringLiteral("var_cli_command"),
              QStringLiteral("user_invocation"),
              (nlohmann::json{{"command", command.toStdString()}}));

    std::unique_ptr<CascadeStore> store;
    try {
        store = dbPath.isEmpty() ? std::make_unique<CascadeStore>()
                                 : std::make_unique<CascadeStore>(dbPath.toStdString());
    } catch (const std::exception &ex) {
        std::cerr << "cascade-var: " << ex.what() << "\n";
        return 1;
    }

    VariableManager variables(*store);
    // No dispatch loop listens here; a closed channel drops notifications.
    variables.updates().close();

    if (command == QStringLiteral("get")) {
        return runGet(variables, positional);
    }
    if (command == QStringLiteral("set")) {
        return runSet(variables, positional);
    }
    if (command == QStringLiteral("list")) {
        return runList(*store, variables);
    }

    std::cerr << usageText().toStdString();
    return 1;
}

int VarCli::runGet(VariableManager &variables, const QStringList &args)
{
    if (args.size() != 2) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    try {
        const script::Value value = variables.get(args.at(1).toStdString());
        std::cout << renderValue(value) << std::endl;
    } catch (const std::exception &ex) {
        std::cerr << "cascade-var: " << ex.what() << "\n";
        return 1;
    }
    return 0;
}

int VarCli::runSet(VariableManager &variables, const QStringList &args)
{
    if (args.size() != 3) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    try {
        const auto parsed = nlohmann::json::parse(args.at(2).toStdString());
        variables.set(args.at(1).toStdString(), parsed.get<script::Value>());
    } catch (const nlohmann::json::parse_error &ex) {
        std::cerr << "cascade-var: value is not valid JSON: " << ex.what() << "\n";
        return 1;
    } catch (const std::exception &ex) {
        std::cerr << "cascade-var: " << ex.what() << "\n";
        return 1;
    }
    return 0;
}

int VarCli::runList(const CascadeStore &store, VariableManager &variables)
{
    const std::string &prefix = VariableManager::storagePrefix();
    int failures = 0;
    for (const auto &key : store.keysWithPrefix(prefix)) {
        const std::string name = key.substr(prefix.size());
        try {
            std::cout << name << " = " << renderValue(variables.get(name)) << "\n";
        } catch (const std::exception &ex) {
            std::cout << name << " = <" << ex.what() << ">\n";
            ++failures;
        }
    }
    std::cout.flush();
    return failures == 0 ? 0 : 1;
}

} // namespace cascade
