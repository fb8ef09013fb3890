#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "script/ast.hpp"

namespace cascade::script {

class Scope;
class Value;

// A callable bound in a scope. The invoker receives the calling scope and
// the whole call form (items[0] is the callee, the rest are the unevaluated
// arguments), so special forms (if, var, func, ...) and ordinary functions
// share one representation.
struct Function {
    std::string name;
    std::function<Value(Scope &scope, const Node &call)> invoke;
};

using FunctionPtr = std::shared_ptr<const Function>;

// Dynamically typed value of the rule language.
class Value {
public:
    enum class Type {
        Nil,
        Bool,
        Int,
        Float,
        String,
        List,
        Function
    };

    using List = std::vector<Value>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool value) : m_data(value) {}
    Value(int value) : m_data(static_cast<std::int64_t>(value)) {}
    Value(std::int64_t value) : m_data(value) {}
    Value(double value) : m_data(value) {}
    Value(const char *value) : m_data(std::string(value)) {}
    Value(std::string value) : m_data(std::move(value)) {}
    Value(List value) : m_data(std::move(value)) {}
    Value(FunctionPtr value) : m_data(std::move(value)) {}

    Type type() const;
    const char *typeName() const;

    bool isNil() const { return type() == Type::Nil; }
    bool isBool() const { return type() == Type::Bool; }
    bool isInt() const { return type() == Type::Int; }
    bool isFloat() const { return type() == Type::Float; }
    bool isNumber() const { return isInt() || isFloat(); }
    bool isString() const { return type() == Type::String; }
    bool isList() const { return type() == Type::List; }
    bool isFunction() const { return type() == Type::Function; }

    bool asBool() const { return std::get<bool>(m_data); }
    std::int64_t asInt() const { return std::get<std::int64_t>(m_data); }
    double asFloat() const { return std::get<double>(m_data); }
    const std::string &asString() const { return std::get<std::string>(m_data); }
    const List &asList() const { return std::get<List>(m_data); }
    const FunctionPtr &asFunction() const { return std::get<FunctionPtr>(m_data); }

    // Integer or float widened to double.
    double toDouble() const;

    // nil and false are false, everything else is true.
    bool truthy() const;

    // True when the value (recursively) holds no functions and no NaN or
    // infinite floats, so it can be stored.
    bool isPersistable() const;

    // Human readable form. Strings are returned as-is at the top level and
    // quoted inside lists.
    std::string toString() const;

    bool operator==(const Value &other) const;
    bool operator!=(const Value &other) const { return !(*this == other); }

private:
    std::variant<std::monostate, bool, std::int64_t, double, std::string, List, FunctionPtr> m_data;
};

// JSON mapping used by the persisted variable record. Functions cannot be
// encoded and unsupported JSON shapes cannot be decoded; both throw
// std::invalid_argument.
void to_json(nlohmann::json &j, const Value &value);
void from_json(const nlohmann::json &j, Value &value);

} // namespace cascade::script
