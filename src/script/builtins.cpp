#include "script/builtins.hpp"

#include <cmath>
#include <limits>

#include "script/errors.hpp"

namespace cascade::script {

namespace {

std::size_t argCount(const Node &call)
{
    return call.items.size() - 1;
}

const Node &argAt(const Node &call, std::size_t index)
{
    return call.items[index + 1];
}

void requireCount(const std::string &name, const std::vector<Value> &args, std::size_t count)
{
    if (args.size() != count) {
        throw ScriptError(name + " takes " + std::to_string(count) + " argument"
                          + (count == 1 ? "" : "s") + ", got " + std::to_string(args.size()));
    }
}

const std::string &symbolName(const std::string &form, const Node &node)
{
    if (node.kind != NodeKind::Symbol) {
        throw ScriptError(form + " expects a symbol name");
    }
    return node.text;
}

bool allInts(const std::vector<Value> &args)
{
    for (const auto &arg : args) {
        if (!arg.isInt()) {
            return false;
        }
    }
    return true;
}

void requireNumbers(const std::string &name, const std::vector<Value> &args)
{
    for (const auto &arg : args) {
        if (!arg.isNumber()) {
            throw ScriptError(name + " takes numbers, got " + arg.typeName());
        }
    }
}

std::int64_t checkedAdd(std::int64_t a, std::int64_t b)
{
    std::int64_t out = 0;
    if (__builtin_add_overflow(a, b, &out)) {
        throw ScriptError("integer overflow");
    }
    return out;
}

std::int64_t checkedSub(std::int64_t a, std::int64_t b)
{
    std::int64_t out = 0;
    if (__builtin_sub_overflow(a, b, &out)) {
        throw ScriptError("integer overflow");
    }
    return out;
}

std::int64_t checkedMul(std::int64_t a, std::int64_t b)
{
    std::int64_t out = 0;
    if (__builtin_mul_overflow(a, b, &out)) {
        throw ScriptError("integer overflow");
    }
    return out;
}

// Division and remainder share the zero and INT64_MIN / -1 checks.
void checkDivisor(std::int64_t dividend, std::int64_t divisor)
{
    if (divisor == 0) {
        throw ScriptError("integer division by zero");
    }
    if (divisor == -1 && dividend == std::numeric_limits<std::int64_t>::min()) {
        throw ScriptError("integer overflow");
    }
}

Value plusFn(const std::vector<Value> &args)
{
    if (args.empty()) {
        return Value(0);
    }

    if (args.front().isString()) {
        std::string out;
        for (const auto &arg : args) {
            if (!arg.isString()) {
                throw ScriptError(std::string("+ cannot mix string and ") + arg.typeName());
            }
            out += arg.asString();
        }
        return Value(std::move(out));
    }

    for (const auto &arg : args) {
        if (!arg.isNumber()) {
            throw ScriptError(std::string("+ takes numbers or strings, got ") + arg.typeName());
        }
    }
    if (allInts(args)) {
        std::int64_t sum = 0;
        for (const auto &arg : args) {
            sum = checkedAdd(sum, arg.asInt());
        }
        return Value(sum);
    }
    double sum = 0.0;
    for (const auto &arg : args) {
        sum += arg.toDouble();
    }
    return Value(sum);
}

Value minusFn(const std::vector<Value> &args)
{
    if (args.empty()) {
        throw ScriptError("- takes at least one argument");
    }
    requireNumbers("-", args);

    if (allInts(args)) {
        if (args.size() == 1) {
            return Value(checkedSub(0, args.front().asInt()));
        }
        std::int64_t result = args.front().asInt();
        for (std::size_t i = 1; i < args.size(); ++i) {
            result = checkedSub(result, args[i].asInt());
        }
        return Value(result);
    }

    if (args.size() == 1) {
        return Value(-args.front().toDouble());
    }
    double result = args.front().toDouble();
    for (std::size_t i = 1; i < args.size(); ++i) {
        result -= args[i].toDouble();
    }
    return Value(result);
}

Value mulFn(const std::vector<Value> &args)
{
    requireNumbers("*", args);
    if (allInts(args)) {
        std::int64_t product = 1;
        for (const auto &arg : args) {
            product = checkedMul(product, arg.asInt());
        }
        return Value(product);
    }
    double product = 1.0;
    for (const auto &arg : args) {
        product *= arg.toDouble();
    }
    return Value(product);
}

Value divFn(const std::vector<Value> &args)
{
    if (args.size() < 2) {
        throw ScriptError("/ takes at least two arguments");
    }
    requireNumbers("/", args);

    if (allInts(args)) {
        std::int64_t result = args.front().asInt();
        for (std::size_t i = 1; i < args.size(); ++i) {
            checkDivisor(result, args[i].asInt());
            result /= args[i].asInt();
        }
        return Value(result);
    }
    double result = args.front().toDouble();
    for (std::size_t i = 1; i < args.size(); ++i) {
        result /= args[i].toDouble();
    }
    return Value(result);
}

Value modFn(const std::vector<Value> &args)
{
    requireCount("%", args, 2);
    if (!allInts(args)) {
        throw ScriptError("% takes integers");
    }
    checkDivisor(args[0].asInt(), args[1].asInt());
    return Value(args[0].asInt() % args[1].asInt());
}

// Three-way comparison shared by <, >, <=, >=.
int compareValues(const std::string &name, const Value &a, const Value &b)
{
    if (a.isNumber() && b.isNumber()) {
        if (a.isInt() && b.isInt()) {
            return a.asInt() < b.asInt() ? -1 : (a.asInt() > b.asInt() ? 1 : 0);
        }
        const double x = a.toDouble();
        const double y = b.toDouble();
        if (std::isnan(x) || std::isnan(y)) {
            throw ScriptError(name + " cannot order NaN");
        }
        return x < y ? -1 : (x > y ? 1 : 0);
    }
    if (a.isString() && b.isString()) {
        return a.asString().compare(b.asString());
    }
    throw ScriptError(name + " cannot compare " + a.typeName() + " with " + b.typeName());
}

FunctionPtr comparison(const std::string &name, bool (*accept)(int))
{
    return makeNativeFunction(name, [name, accept](const std::vector<Value> &args) {
        requireCount(name, args, 2);
        return Value(accept(compareValues(name, args[0], args[1])));
    });
}

Value ifForm(Scope &scope, const Node &call)
{
    const std::size_t count = argCount(call);
    if (count != 2 && count != 3) {
        throw ScriptError("if takes two or three arguments");
    }
    if (scope.eval(argAt(call, 0)).truthy()) {
        return scope.eval(argAt(call, 1));
    }
    if (count == 3) {
        return scope.eval(argAt(call, 2));
    }
    return Value();
}

Value andForm(Scope &scope, const Node &call)
{
    Value last(true);
    for (std::size_t i = 0; i < argCount(call); ++i) {
        last = scope.eval(argAt(call, i));
        if (!last.truthy()) {
            return last;
        }
    }
    return last;
}

Value orForm(Scope &scope, const Node &call)
{
    Value last(false);
    for (std::size_t i = 0; i < argCount(call); ++i) {
        last = scope.eval(argAt(call, i));
        if (last.truthy()) {
            return last;
        }
    }
    return last;
}

Value varForm(Scope &scope, const Node &call)
{
    const std::size_t count = argCount(call);
    if (count != 1 && count != 2) {
        throw ScriptError("var takes one or two arguments");
    }
    const std::string &name = symbolName("var", argAt(call, 0));
    Value value = count == 2 ? scope.eval(argAt(call, 1)) : Value();
    scope.create(name, value);
    return value;
}

Value setForm(Scope &scope, const Node &call)
{
    if (argCount(call) != 2) {
        throw ScriptError("set takes two arguments");
    }
    const std::string &name = symbolName("set", argAt(call, 0));
    scope.set(name, scope.eval(argAt(call, 1)));
    return Value();
}

Value doForm(Scope &scope, const Node &call)
{
    auto inner = scope.branch();
    Value last;
    for (std::size_t i = 0; i < argCount(call); ++i) {
        last = inner->eval(argAt(call, i));
    }
    return last;
}

Value funcForm(Scope &scope, const Node &call)
{
    std::size_t next = 0;
    std::string name;
    if (next < argCount(call) && argAt(call, next).kind == NodeKind::Symbol) {
        name = argAt(call, next).text;
        ++next;
    }
    if (next >= argCount(call) || argAt(call, next).kind != NodeKind::List) {
        throw ScriptError("func takes an optional name, a parameter list and a body");
    }

    std::vector<std::string> params;
    for (const auto &param : argAt(call, next).items) {
        params.push_back(symbolName("func parameter list", param));
    }
    ++next;

    // The body is copied out of the call form so the function stays valid
    // on its own.
    std::vector<Node> body(call.items.begin() + static_cast<std::ptrdiff_t>(next + 1),
                           call.items.end());

    // A weak link to the defining scope: named functions are stored in that
    // very scope and a strong one would keep it alive forever.
    std::weak_ptr<Scope> defining = scope.shared_from_this();
    const std::string label = name.empty() ? std::string("anonymous") : name;

    auto fn = makeSpecialForm(label, [defining, params, body, label](Scope &caller, const Node &inner) {
        if (argCount(inner) != params.size()) {
            throw ScriptError(label + " takes " + std::to_string(params.size())
                              + " arguments, got " + std::to_string(argCount(inner)));
        }
        auto closure = defining.lock();
        if (!closure) {
            throw ScriptError(label + " called after its defining scope ended");
        }

        std::vector<Value> values;
        values.reserve(params.size());
        for (std::size_t i = 0; i < argCount(inner); ++i) {
            values.push_back(caller.eval(argAt(inner, i)));
        }

        auto local = closure->branch();
        for (std::size_t i = 0; i < params.size(); ++i) {
            local->create(params[i], std::move(values[i]));
        }
        Value last;
        for (const auto &form : body) {
            last = local->eval(form);
        }
        return last;
    });

    if (!name.empty()) {
        scope.create(name, Value(fn));
    }
    return Value(fn);
}

Value forForm(Scope &scope, const Node &call)
{
    if (argCount(call) < 3) {
        throw ScriptError("for takes an init, a test, a step and a body");
    }
    auto loop = scope.branch();
    loop->eval(argAt(call, 0));
    while (loop->eval(argAt(call, 1)).truthy()) {
        for (std::size_t i = 3; i < argCount(call); ++i) {
            loop->eval(argAt(call, i));
        }
        loop->eval(argAt(call, 2));
    }
    return Value();
}

std::vector<std::pair<std::string, Value>> buildGlobals()
{
    std::vector<std::pair<std::string, Value>> globals;

    globals.emplace_back("true", Value(true));
    globals.emplace_back("false", Value(false));
    globals.emplace_back("nil", Value());

    globals.emplace_back("error", Value(makeNativeFunction("error", [](const std::vector<Value> &args) -> Value {
        requireCount("error", args, 1);
        throw ScriptError(args[0].toString());
    })));

    globals.emplace_back("==", Value(makeNativeFunction("==", [](const std::vector<Value> &args) {
        requireCount("==", args, 2);
        return Value(args[0] == args[1]);
    })));
    globals.emplace_back("!=", Value(makeNativeFunction("!=", [](const std::vector<Value> &args) {
        requireCount("!=", args, 2);
        return Value(args[0] != args[1]);
    })));
    globals.emplace_back("<", Value(comparison("<", [](int c) { return c < 0; })));
    globals.emplace_back(">", Value(comparison(">", [](int c) { return c > 0; })));
    globals.emplace_back("<=", Value(comparison("<=", [](int c) { return c <= 0; })));
    globals.emplace_back(">=", Value(comparison(">=", [](int c) { return c >= 0; })));

    globals.emplace_back("+", Value(makeNativeFunction("+", plusFn)));
    globals.emplace_back("-", Value(makeNativeFunction("-", minusFn)));
    globals.emplace_back("*", Value(makeNativeFunction("*", mulFn)));
    globals.emplace_back("/", Value(makeNativeFunction("/", divFn)));
    globals.emplace_back("%", Value(makeNativeFunction("%", modFn)));

    globals.emplace_back("and", Value(makeSpecialForm("and", andForm)));
    globals.emplace_back("or", Value(makeSpecialForm("or", orForm)));
    globals.emplace_back("not", Value(makeNativeFunction("not", [](const std::vector<Value> &args) {
        requireCount("not", args, 1);
        return Value(!args[0].truthy());
    })));

    globals.emplace_back("if", Value(makeSpecialForm("if", ifForm)));
    globals.emplace_back("var", Value(makeSpecialForm("var", varForm)));
    globals.emplace_back("set", Value(makeSpecialForm("set", setForm)));
    globals.emplace_back("do", Value(makeSpecialForm("do", doForm)));
    globals.emplace_back("func", Value(makeSpecialForm("func", funcForm)));
    globals.emplace_back("for", Value(makeSpecialForm("for", forForm)));

    globals.emplace_back("list", Value(makeNativeFunction("list", [](const std::vector<Value> &args) {
        return Value(Value::List(args));
    })));
    globals.emplace_back("len", Value(makeNativeFunction("len", [](const std::vector<Value> &args) {
        requireCount("len", args, 1);
        if (args[0].isList()) {
            return Value(static_cast<std::int64_t>(args[0].asList().size()));
        }
        if (args[0].isString()) {
            return Value(static_cast<std::int64_t>(args[0].asString().size()));
        }
        throw ScriptError(std::string("len takes a list or a string, got ") + args[0].typeName());
    })));
    globals.emplace_back("nth", Value(makeNativeFunction("nth", [](const std::vector<Value> &args) {
        requireCount("nth", args, 2);
        if (!args[0].isList() || !args[1].isInt()) {
            throw ScriptError("nth takes a list and an integer index");
        }
        const auto &items = args[0].asList();
        const std::int64_t index = args[1].asInt();
        if (index < 0 || static_cast<std::size_t>(index) >= items.size()) {
            throw ScriptError("nth index " + std::to_string(index) + " out of range");
        }
        return items[static_cast<std::size_t>(index)];
    })));
    globals.emplace_back("str", Value(makeNativeFunction("str", [](const std::vector<Value> &args) {
        requireCount("str", args, 1);
        return Value(args[0].toString());
    })));

    return globals;
}

} // namespace

FunctionPtr makeNativeFunction(std::string name, NativeFunction fn)
{
    auto function = std::make_shared<Function>();
    function->name = std::move(name);
    function->invoke = [fn = std::move(fn)](Scope &scope, const Node &call) {
        std::vector<Value> args;
        args.reserve(argCount(call));
        for (std::size_t i = 0; i < argCount(call); ++i) {
            args.push_back(scope.eval(argAt(call, i)));
        }
        return fn(args);
    };
    return function;
}

FunctionPtr makeSpecialForm(std::string name, SpecialForm fn)
{
    auto function = std::make_shared<Function>();
    function->name = std::move(name);
    function->invoke = std::move(fn);
    return function;
}

const std::vector<std::pair<std::string, Value>> &builtinGlobals()
{
    static const std::vector<std::pair<std::string, Value>> globals = buildGlobals();
    return globals;
}

} // namespace cascade::script
