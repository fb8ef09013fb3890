#pragma once

#include <memory>
#include <string>
#include <unordered_map>

#include "script/scope.hpp"

namespace cascade::script {

// Standard lexical scope of the rule language. A scope built with globals
// carries the built-in functions; branches only hold their own locals.
class DefaultScope : public Scope {
public:
    explicit DefaultScope(std::shared_ptr<const FileSet> fileSet, bool withGlobals = true);

    void create(const std::string &symbol, Value value) override;
    void set(const std::string &symbol, Value value) override;
    Value get(const std::string &symbol) override;

    std::shared_ptr<Scope> branch() override;
    void enclose(std::shared_ptr<Scope> parent) override;

    Value eval(const Node &node) override;

private:
    Value evalNode(const Node &node);
    Value call(const Node &list);

    std::shared_ptr<const FileSet> m_fileSet;
    std::shared_ptr<Scope> m_parent;
    std::unordered_map<std::string, Value> m_vars;
};

} // namespace cascade::script
