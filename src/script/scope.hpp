#pragma once

#include <memory>
#include <string>

#include "script/ast.hpp"
#include "script/value.hpp"

namespace cascade::script {

// Symbol resolution and evaluation contract of the rule language. Scopes
// form a chain through enclose(); lookups fall back to the parent.
// Every operation reports failure by throwing a ScriptError (or an error
// raised by the scope's backing storage).
class Scope : public std::enable_shared_from_this<Scope> {
public:
    virtual ~Scope() = default;

    // Binds a new symbol in this scope.
    virtual void create(const std::string &symbol, Value value) = 0;
    // Assigns an existing symbol, wherever in the chain it is bound.
    virtual void set(const std::string &symbol, Value value) = 0;
    virtual Value get(const std::string &symbol) = 0;

    // Returns a fresh child scope whose parent is this scope.
    virtual std::shared_ptr<Scope> branch() = 0;
    virtual void enclose(std::shared_ptr<Scope> parent) = 0;

    virtual Value eval(const Node &node) = 0;
};

} // namespace cascade::script
