#pragma once

#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "script/scope.hpp"
#include "script/value.hpp"

namespace cascade::script {

using NativeFunction = std::function<Value(const std::vector<Value> &args)>;
using SpecialForm = std::function<Value(Scope &scope, const Node &call)>;

// Wraps a function whose arguments are evaluated left to right in the
// calling scope before it runs.
FunctionPtr makeNativeFunction(std::string name, NativeFunction fn);

// Wraps a form that receives its arguments unevaluated.
FunctionPtr makeSpecialForm(std::string name, SpecialForm fn);

// Symbols pre-bound in every top-level DefaultScope.
const std::vector<std::pair<std::string, Value>> &builtinGlobals();

} // namespace cascade::script
