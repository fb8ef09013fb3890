#pragma once

#include <memory>
#include <string>

#include "daemon/variable_manager.hpp"
#include "script/scope.hpp"

namespace cascade {

// VariableScope is the root of every rule's scope chain. Symbols that are
// not bound lexically resolve to variables held by the VariableManager, so a
// rule's (set name value) persists the value and may trigger further rules.
//
// It cannot hold lexical bindings itself: create(), branch() and enclose()
// throw script::UnsupportedScopeOperation. eval() runs the program in a
// standard child scope that also provides the run and log actions.
class VariableScope : public script::Scope {
public:
    VariableScope(VariableManager &manager, std::shared_ptr<const script::FileSet> fileSet);

    void create(const std::string &symbol, script::Value value) override;
    void set(const std::string &symbol, script::Value value) override;
    script::Value get(const std::string &symbol) override;

    std::shared_ptr<script::Scope> branch() override;
    void enclose(std::shared_ptr<script::Scope> parent) override;

    script::Value eval(const script::Node &node) override;

private:
    VariableManager &m_manager;
    std::shared_ptr<const script::FileSet> m_fileSet;
};

// Actions bound by VariableScope::eval.
script::FunctionPtr makeRunAction();
script::FunctionPtr makeLogAction();

} // namespace cascade
