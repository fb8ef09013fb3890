#include "daemon/rule.hpp"

#include "script/parser.hpp"

namespace cascade {

Rule::Rule(std::string name, const std::string &source, VariableManager &manager)
    : m_name(std::move(name))
    , m_fileSet(std::make_shared<script::FileSet>())
{
    m_program = script::parse(*m_fileSet, m_name, source);
    m_scope = std::make_shared<VariableScope>(manager, m_fileSet);
}

void Rule::run()
{
    m_scope->eval(m_program);
}

} // namespace cascade
