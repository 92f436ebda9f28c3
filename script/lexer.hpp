#ifndef SCRIPT_LEXER_HPP
#define SCRIPT_LEXER_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace script {

struct Token {
  enum class Type { NAME, INT, FLOAT, STRING, OP, NEWLINE, INDENT, DEDENT, END };
  Type type = Type::END;
  // Identifier, operator or decoded string contents.
  std::string text;
  int64_t int_value = 0;
  double float_value = 0;
  uint32_t line = 0;
  uint32_t column = 0;
};

// Splits the source into tokens, producing INDENT/DEDENT tokens for block
// structure. Newlines inside brackets are ignored. Throws SyntaxError.
std::vector<Token> Tokenize(const std::string& source);

// True for reserved words of the language, including those it rejects.
bool IsKeyword(const std::string& name);

// True if name is a valid identifier and not a keyword.
bool IsIdentifier(const std::string& name);

}  // namespace script

#endif
