#ifndef SCRIPT_METHODS_HPP
#define SCRIPT_METHODS_HPP

#include <string>

#include "script/value.hpp"

namespace script {

// Looks up a method of a built-in container (list, dict, set, str) and returns
// it bound to the receiver. Throws an AttributeError for unknown names and
// for receivers without methods.
Value BindMethod(const Value& receiver, const std::string& name);

}  // namespace script

#endif
