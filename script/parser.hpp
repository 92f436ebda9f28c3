#ifndef SCRIPT_PARSER_HPP
#define SCRIPT_PARSER_HPP

#include <memory>
#include <string>

#include "script/ast.hpp"
#include "script/value.hpp"

namespace script {

// Parses a whole program. Throws SyntaxError, with the location of the
// offending token, for anything outside the supported language, including
// every form of import.
std::shared_ptr<const Program> Parse(const std::string& source);

// Parses a constant expression made of literals, list and dict displays and
// unary signs, and returns its value. Used to build bindings from text.
Value ParseLiteral(const std::string& text);

}  // namespace script

#endif
