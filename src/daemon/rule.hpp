#pragma once

#include <memory>
#include <string>

#include "daemon/variable_manager.hpp"
#include "daemon/variable_scope.hpp"
#include "script/ast.hpp"

namespace cascade {

// A rule program parsed once at load time and evaluated on every trigger.
// run() may be called from several rule batches at the same time.
class Rule {
public:
    // Throws script::ParseError when the source does not parse.
    Rule(std::string name, const std::string &source, VariableManager &manager);

    const std::string &name() const
    {
        return m_name;
    }

    // Evaluates the program. Errors propagate unchanged.
    void run();

private:
    std::string m_name;
    std::shared_ptr<script::FileSet> m_fileSet;
    script::Node m_program;
    std::shared_ptr<VariableScope> m_scope;
};

} // namespace cascade
