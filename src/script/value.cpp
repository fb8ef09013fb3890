#include "script/value.hpp"

#include <cmath>
#include <stdexcept>

namespace cascade::script {

Value::Type Value::type() const
{
    switch (m_data.index()) {
    case 0:
        return Type::Nil;
    case 1:
        return Type::Bool;
    case 2:
        return Type::Int;
    case 3:
        return Type::Float;
    case 4:
        return Type::String;
    case 5:
        return Type::List;
    case 6:
        return Type::Function;
    }
    return Type::Nil;
}

const char *Value::typeName() const
{
    switch (type()) {
    case Type::Nil:
        return "nil";
    case Type::Bool:
        return "bool";
    case Type::Int:
        return "int";
    case Type::Float:
        return "float";
    case Type::String:
        return "string";
    case Type::List:
        return "list";
    case Type::Function:
        return "function";
    }
    return "nil";
}

double Value::toDouble() const
{
    if (isInt()) {
        return static_cast<double>(asInt());
    }
    if (isFloat()) {
        return asFloat();
    }
    throw std::invalid_argument(std::string("expected a number, got ") + typeName());
}

bool Value::truthy() const
{
    if (isNil()) {
        return false;
    }
    if (isBool()) {
        return asBool();
    }
    return true;
}

bool Value::isPersistable() const
{
    if (isFunction()) {
        return false;
    }
    if (isFloat()) {
        return std::isfinite(asFloat());
    }
    if (isList()) {
        for (const auto &item : asList()) {
            if (!item.isPersistable()) {
                return false;
            }
        }
    }
    return true;
}

std::string Value::toString() const
{
    switch (type()) {
    case Type::Nil:
        return "nil";
    case Type::Bool:
        return asBool() ? "true" : "false";
    case Type::Int:
        return std::to_string(asInt());
    case Type::Float:
        // nlohmann renders the shortest representation that round-trips.
        return nlohmann::json(asFloat()).dump();
    case Type::String:
        return asString();
    case Type::List: {
        std::string out = "(";
        bool first = true;
        for (const auto &item : asList()) {
            if (!first) {
                out += " ";
            }
            first = false;
            out += item.isString() ? nlohmann::json(item.asString()).dump() : item.toString();
        }
        out += ")";
        return out;
    }
    case Type::Function: {
        const auto &fn = asFunction();
        return "<function " + (fn && !fn->name.empty() ? fn->name : std::string("anonymous")) + ">";
    }
    }
    return "nil";
}

bool Value::operator==(const Value &other) const
{
    if (type() != other.type()) {
        return false;
    }

    switch (type()) {
    case Type::Nil:
        return true;
    case Type::Bool:
        return asBool() == other.asBool();
    case Type::Int:
        return asInt() == other.asInt();
    case Type::Float:
        return asFloat() == other.asFloat();
    case Type::String:
        return asString() == other.asString();
    case Type::List:
        return asList() == other.asList();
    case Type::Function:
        return asFunction() == other.asFunction();
    }
    return false;
}

void to_json(nlohmann::json &j, const Value &value)
{
    switch (value.type()) {
    case Value::Type::Nil:
        j = nullptr;
        return;
    case Value::Type::Bool:
        j = value.asBool();
        return;
    case Value::Type::Int:
        j = value.asInt();
        return;
    case Value::Type::Float:
        if (!std::isfinite(value.asFloat())) {
            throw std::invalid_argument("non-finite floats cannot be serialized");
        }
        j = value.asFloat();
        return;
    case Value::Type::String:
        j = value.asString();
        return;
    case Value::Type::List: {
        j = nlohmann::json::array();
        for (const auto &item : value.asList()) {
            nlohmann::json element;
            to_json(element, item);
            j.push_back(std::move(element));
        }
        return;
    }
    case Value::Type::Function:
        break;
    }
    throw std::invalid_argument("functions cannot be serialized");
}

void from_json(const nlohmann::json &j, Value &value)
{
    if (j.is_null()) {
        value = Value();
    } else if (j.is_boolean()) {
        value = Value(j.get<bool>());
    } else if (j.is_number_integer()) {
        value = Value(j.get<std::int64_t>());
    } else if (j.is_number_float()) {
        value = Value(j.get<double>());
    } else if (j.is_string()) {
        value = Value(j.get<std::string>());
    } else if (j.is_array()) {
        Value::List items;
        items.reserve(j.size());
        for (const auto &element : j) {
            Value item;
            from_json(element, item);
            items.push_back(std::move(item));
        }
        value = Value(std::move(items));
    } else {
        throw std::invalid_argument(std::string("unsupported value of JSON type ") + j.type_name());
    }
}

} // namespace cascade::script
