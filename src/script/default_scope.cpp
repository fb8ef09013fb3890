#include "script/default_scope.hpp"

#include "script/builtins.hpp"
#include "script/errors.hpp"

namespace cascade::script {

DefaultScope::DefaultScope(std::shared_ptr<const FileSet> fileSet, bool withGlobals)
    : m_fileSet(std::move(fileSet))
{
    if (withGlobals) {
        for (auto &entry : builtinGlobals()) {
            m_vars.emplace(entry.first, entry.second);
        }
    }
}

void DefaultScope::create(const std::string &symbol, Value value)
{
    if (m_vars.find(symbol) != m_vars.end()) {
        throw ScriptError("symbol already defined: " + symbol);
    }
    m_vars.emplace(symbol, std::move(value));
}

void DefaultScope::set(const std::string &symbol, Value value)
{
    auto it = m_vars.find(symbol);
    if (it != m_vars.end()) {
        it->second = std::move(value);
        return;
    }
    if (m_parent) {
        m_parent->set(symbol, std::move(value));
        return;
    }
    throw ScriptError("undefined symbol: " + symbol);
}

Value DefaultScope::get(const std::string &symbol)
{
    auto it = m_vars.find(symbol);
    if (it != m_vars.end()) {
        return it->second;
    }
    if (m_parent) {
        return m_parent->get(symbol);
    }
    throw ScriptError("undefined symbol: " + symbol);
}

std::shared_ptr<Scope> DefaultScope::branch()
{
    auto child = std::make_shared<DefaultScope>(m_fileSet, false);
    child->enclose(shared_from_this());
    return child;
}

void DefaultScope::enclose(std::shared_ptr<Scope> parent)
{
    m_parent = std::move(parent);
}

Value DefaultScope::eval(const Node &node)
{
    try {
        return evalNode(node);
    } catch (const ScriptError &error) {
        if (error.hasPosition() || node.pos == 0 || !m_fileSet) {
            throw;
        }
        const std::string position = m_fileSet->position(node.pos);
        if (position.empty()) {
            throw;
        }
        throw ScriptError(position, error.message());
    }
}

Value DefaultScope::evalNode(const Node &node)
{
    switch (node.kind) {
    case NodeKind::Int:
        return Value(node.intValue);
    case NodeKind::Float:
        return Value(node.floatValue);
    case NodeKind::String:
        return Value(node.text);
    case NodeKind::Symbol:
        return get(node.text);
    case NodeKind::List:
        return call(node);
    case NodeKind::Root: {
        Value last;
        for (const auto &form : node.items) {
            last = eval(form);
        }
        return last;
    }
    }
    return Value();
}

Value DefaultScope::call(const Node &list)
{
    if (list.items.empty()) {
        throw ScriptError("cannot evaluate empty list");
    }

    const Value head = eval(list.items.front());
    if (!head.isFunction()) {
        throw ScriptError(std::string("cannot call value of type ") + head.typeName());
    }

    return head.asFunction()->invoke(*this, list);
}

} // namespace cascade::script
