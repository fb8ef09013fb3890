#pragma once

#include <stdexcept>
#include <string>

namespace cascade::script {

// Base of every error raised while parsing or evaluating a rule program.
// The position is filled in by the evaluator for errors raised without one.
class ScriptError : public std::runtime_error {
public:
    explicit ScriptError(const std::string &message)
        : std::runtime_error(message)
        , m_message(message)
    {
    }

    ScriptError(const std::string &position, const std::string &message)
        : std::runtime_error(position + ": " + message)
        , m_position(position)
        , m_message(message)
    {
    }

    const std::string &position() const
    {
        return m_position;
    }

    const std::string &message() const
    {
        return m_message;
    }

    bool hasPosition() const
    {
        return !m_position.empty();
    }

private:
    std::string m_position;
    std::string m_message;
};

class ParseError : public ScriptError {
public:
    ParseError(const std::string &position, const std::string &message)
        : ScriptError(position, message)
    {
    }
};

// Raised by scopes that sit at the root of a scope chain and cannot host
// lexical bindings of their own.
class UnsupportedScopeOperation : public ScriptError {
public:
    explicit UnsupportedScopeOperation(const std::string &operation)
        : ScriptError("operation not supported at global scope: " + operation)
    {
    }
};

} // namespace cascade::script
