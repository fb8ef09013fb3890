#include "daemon/variable_scope.hpp"

#include <QProcess>
#include <QStringList>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "script/builtins.hpp"
#include "script/default_scope.hpp"
#include "script/errors.hpp"

namespace cascade {

namespace {

nlohmann::json commandContext(const QString &program, const QStringList &arguments)
{
    std::vector<std::string> args;
    args.reserve(static_cast<std::size_t>(arguments.size()));
    for (const QString &arg : arguments) {
        args.push_back(arg.toStdString());
    }
    return nlohmann::json{{"program", program.toStdString()}, {"args", args}};
}

script::Value runCommand(const std::vector<script::Value> &args)
{
    if (args.empty()) {
        throw script::ScriptError("run takes at least one argument");
    }

    QStringList arguments;
    for (const auto &arg : args) {
        if (!arg.isString()) {
            throw script::ScriptError(std::string("run only takes string arguments, got ")
                                      + arg.typeName());
        }
        arguments.push_back(QString::fromStdString(arg.asString()));
    }
    const QString program = arguments.takeFirst();

    // A failing command never aborts the rule; it is reported and the rule
    // carries on with a nil result.
    QProcess process;
    process.setStandardOutputFile(QProcess::nullDevice());
    process.setStandardErrorFile(QProcess::nullDevice());
    process.start(program, arguments);
    if (!process.waitForStarted(-1)) {
        auto context = commandContext(program, arguments);
        context["error"] = process.errorString().toStdString();
        CLOG_WARN(QStringLiteral("VariableScope"),
                  QStringLiteral("run"),
                  QStringLiteral("command_start_failed"),
                  QStringLiteral("rule_action"),
                  context);
        return script::Value();
    }

    process.waitForFinished(-1);
    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        auto context = commandContext(program, arguments);
        context["exitCode"] = process.exitCode();
        context["crashed"] = process.exitStatus() != QProcess::NormalExit;
        CLOG_WARN(QStringLiteral("VariableScope"),
                  QStringLiteral("run"),
                  QStringLiteral("command_failed"),
                  QStringLiteral("rule_action"),
                  context);
        return script::Value();
    }

    CLOG_TRACE(QStringLiteral("VariableScope"),
               QStringLiteral("run"),
               QStringLiteral("command_finished"),
               QStringLiteral("rule_action"),
               commandContext(program, arguments));
    return script::Value();
}

script::Value logMessage(const std::vector<script::Value> &args)
{
    if (args.size() != 1) {
        throw script::ScriptError("log takes a single string argument, got "
                                  + std::to_string(args.size()) + " arguments");
    }
    if (!args.front().isString()) {
        throw script::ScriptError(std::string("log takes a single string argument, got ")
                                  + args.front().typeName());
    }

    logging::logRuleEvent(logging::LogLevel::Info,
                          QStringLiteral("rule_log"),
                          QStringLiteral("rule_action"),
                          (nlohmann::json{{"message", args.front().asString()}}));
    return script::Value();
}

} // namespace

script::FunctionPtr makeRunAction()
{
    return script::makeNativeFunction("run", runCommand);
}

script::FunctionPtr makeLogAction()
{
    return script::makeNativeFunction("log", logMessage);
}

VariableScope::VariableScope(VariableManager &manager,
                             std::shared_ptr<const script::FileSet> fileSet)
    : m_manager(manager)
    , m_fileSet(std::move(fileSet))
{
}

void VariableScope::create(const std::string &symbol, script::Value /*value*/)
{
    throw script::UnsupportedScopeOperation("create " + symbol);
}

void VariableScope::set(const std::string &symbol, script::Value value)
{
    m_manager.set(symbol, value);
}

script::Value VariableScope::get(const std::string &symbol)
{
    return m_manager.get(symbol);
}

std::shared_ptr<script::Scope> VariableScope::branch()
{
    throw script::UnsupportedScopeOperation("branch");
}

void VariableScope::enclose(std::shared_ptr<script::Scope> /*parent*/)
{
    throw script::UnsupportedScopeOperation("enclose");
}

script::Value VariableScope::eval(const script::Node &node)
{
    auto scope = std::make_shared<script::DefaultScope>(m_fileSet);
    scope->enclose(shared_from_this());
    scope->create("run", script::Value(makeRunAction()));
    scope->create("log", script::Value(makeLogAction()));
    return scope->eval(node);
}

} // namespace cascade
