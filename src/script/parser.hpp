#pragma once

#include <string>

#include "script/ast.hpp"
#include "script/errors.hpp"

namespace cascade::script {

// Parses a rule program. The returned root node holds every top-level form
// in source order. Throws ParseError with a "name:line:column" position.
Node parse(FileSet &fileSet, const std::string &name, const std::string &source);

} // namespace cascade::script
