#include "script/lexer.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iterator>
#include <unordered_set>

#include "script/errors.hpp"

namespace script {
namespace {

const char* const kKeywords[] = {
    "False",  "None",     "True",  "and",    "as",     "assert", "async",
    "await",  "break",    "class", "continue", "def",  "del",    "elif",
    "else",   "except",   "finally", "for",  "from",   "global", "if",
    "import", "in",       "is",    "lambda", "nonlocal", "not",  "or",
    "pass",   "raise",    "return", "try",   "while",  "with",   "yield"};

const char* const kThreeCharOps[] = {"//=", "**="};
const char* const kTwoCharOps[] = {"**", "//", "==", "!=", "<=", ">=",
                                   "+=", "-=", "*=", "/=", "%=", "->"};
const char* const kOneCharOps = "+-*/%<>=()[]{},:.";

class Lexer {
 public:
  explicit Lexer(const std::string& source) : src_(source) {}

  std::vector<Token> Run() {
    while (pos_ < src_.size()) {
      if (at_line_start_ && depth_ == 0) {
        if (!HandleIndentation()) continue;
      }
      char c = src_[pos_];
      if (c == ' ' || c == '\t' || c == '\r' || c == '\f') {
        pos_++;
      } else if (c == '#') {
        SkipComment();
      } else if (c == '\\' && Peek(1) == '\n') {
        pos_ += 2;
        NewLine();
      } else if (c == '\n') {
        if (depth_ == 0) Emit(Token::Type::NEWLINE, "");
        pos_++;
        NewLine();
        at_line_start_ = depth_ == 0;
      } else if (isdigit(static_cast<unsigned char>(c)) ||
                 (c == '.' && isdigit(static_cast<unsigned char>(Peek(1))))) {
        LexNumber();
      } else if (isalpha(static_cast<unsigned char>(c)) || c == '_') {
        LexName();
      } else if (c == '\'' || c == '"') {
        LexString();
      } else {
        LexOperator();
      }
    }
    if (depth_ != 0) Fail("unexpected EOF: unclosed bracket");
    if (!tokens_.empty() && tokens_.back().type != Token::Type::NEWLINE &&
        tokens_.back().type != Token::Type::DEDENT) {
      Emit(Token::Type::NEWLINE, "");
    }
    while (indents_.size() > 1) {
      indents_.pop_back();
      Emit(Token::Type::DEDENT, "");
    }
    Emit(Token::Type::END, "");
    return std::move(tokens_);
  }

 private:
  char Peek(size_t off) const {
    return pos_ + off < src_.size() ? src_[pos_ + off] : '\0';
  }

  uint32_t Column() const { return pos_ - line_start_ + 1; }

  void NewLine() {
    line_++;
    line_start_ = pos_;
  }

  [[noreturn]] void Fail(const std::string& msg) {
    throw SyntaxError(msg, line_, Column());
  }

  void Emit(Token::Type type, std::string text) {
    Token tok;
    tok.type = type;
    tok.text = std::move(text);
    tok.line = line_;
    tok.column = Column();
    tokens_.push_back(std::move(tok));
  }

  void SkipComment() {
    while (pos_ < src_.size() && src_[pos_] != '\n') pos_++;
  }

  // Returns false if the line is blank and has been consumed.
  bool HandleIndentation() {
    size_t width = 0;
    while (pos_ < src_.size() && (src_[pos_] == ' ' || src_[pos_] == '\t')) {
      width = src_[pos_] == '\t' ? (width / 8 + 1) * 8 : width + 1;
      pos_++;
    }
    if (pos_ >= src_.size()) return false;
    char c = src_[pos_];
    if (c == '\n' || c == '\r' || c == '#') {
      SkipComment();
      if (pos_ < src_.size()) {
        pos_++;
        NewLine();
      }
      return false;
    }
    at_line_start_ = false;
    if (width > indents_.back()) {
      indents_.push_back(width);
      Emit(Token::Type::INDENT, "");
    } else {
      while (width < indents_.back()) {
        indents_.pop_back();
        Emit(Token::Type::DEDENT, "");
      }
      if (width != indents_.back()) {
        Fail("unindent does not match any outer indentation level");
      }
    }
    return true;
  }

  void LexNumber() {
    uint32_t column = Column();
    std::string digits;
    bool is_float = false;
    auto take_digits = [&]() {
      while (pos_ < src_.size() &&
             (isdigit(static_cast<unsigned char>(src_[pos_])) ||
              src_[pos_] == '_')) {
        if (src_[pos_] != '_') digits += src_[pos_];
        pos_++;
      }
    };
    take_digits();
    if (Peek(0) == '.') {
      is_float = true;
      digits += '.';
      pos_++;
      take_digits();
    }
    if (Peek(0) == 'e' || Peek(0) == 'E') {
      char sign = Peek(1);
      size_t off = (sign == '+' || sign == '-') ? 2 : 1;
      if (isdigit(static_cast<unsigned char>(Peek(off)))) {
        is_float = true;
        digits += 'e';
        if (off == 2) digits += sign;
        pos_ += off;
        take_digits();
      }
    }
    if (isalnum(static_cast<unsigned char>(Peek(0))) || Peek(0) == '_') {
      Fail("invalid decimal literal");
    }
    Token tok;
    tok.line = line_;
    tok.column = column;
    tok.text = digits;
    errno = 0;
    if (is_float) {
      tok.type = Token::Type::FLOAT;
      tok.float_value = strtod(digits.c_str(), nullptr);
    } else {
      tok.type = Token::Type::INT;
      tok.int_value = strtoll(digits.c_str(), nullptr, 10);
      if (errno == ERANGE) Fail("integer literal too large");
    }
    tokens_.push_back(std::move(tok));
  }

  void LexName() {
    uint32_t column = Column();
    size_t start = pos_;
    while (pos_ < src_.size() &&
           (isalnum(static_cast<unsigned char>(src_[pos_])) ||
            src_[pos_] == '_')) {
      pos_++;
    }
    Token tok;
    tok.type = Token::Type::NAME;
    tok.text = src_.substr(start, pos_ - start);
    tok.line = line_;
    tok.column = column;
    tokens_.push_back(std::move(tok));
  }

  void LexString() {
    uint32_t line = line_;
    uint32_t column = Column();
    char quote = src_[pos_];
    bool triple = Peek(1) == quote && Peek(2) == quote;
    pos_ += triple ? 3 : 1;
    std::string out;
    while (true) {
      if (pos_ >= src_.size()) Fail("unterminated string literal");
      char c = src_[pos_];
      if (c == quote) {
        if (!triple) {
          pos_++;
          break;
        }
        if (Peek(1) == quote && Peek(2) == quote) {
          pos_ += 3;
          break;
        }
      }
      if (c == '\n') {
        if (!triple) Fail("unterminated string literal");
        out += c;
        pos_++;
        NewLine();
        continue;
      }
      if (c == '\\') {
        char e = Peek(1);
        pos_ += 2;
        switch (e) {
          case 'n':
            out += '\n';
            break;
          case 't':
            out += '\t';
            break;
          case 'r':
            out += '\r';
            break;
          case '0':
            out += '\0';
            break;
          case '\\':
          case '\'':
          case '"':
            out += e;
            break;
          case '\n':
            NewLine();
            break;
          case 'x': {
            if (!isxdigit(static_cast<unsigned char>(Peek(0))) ||
                !isxdigit(static_cast<unsigned char>(Peek(1)))) {
              Fail("truncated \\xXX escape");
            }
            out += static_cast<char>(
                strtol(src_.substr(pos_, 2).c_str(), nullptr, 16));
            pos_ += 2;
            break;
          }
          case '\0':
            Fail("unterminated string literal");
          default:
            out += '\\';
            out += e;
        }
        continue;
      }
      out += c;
      pos_++;
    }
    Token tok;
    tok.type = Token::Type::STRING;
    tok.text = std::move(out);
    tok.line = line;
    tok.column = column;
    tokens_.push_back(std::move(tok));
  }

  void LexOperator() {
    for (const char* op : kThreeCharOps) {
      if (src_.compare(pos_, 3, op) == 0) {
        Emit(Token::Type::OP, op);
        pos_ += 3;
        return;
      }
    }
    for (const char* op : kTwoCharOps) {
      if (src_.compare(pos_, 2, op) == 0) {
        Emit(Token::Type::OP, op);
        pos_ += 2;
        return;
      }
    }
    char c = src_[pos_];
    if (c == '\0' || strchr(kOneCharOps, c) == nullptr) {
      Fail(std::string("invalid character '") + c + "'");
    }
    if (c == '(' || c == '[' || c == '{') depth_++;
    if (c == ')' || c == ']' || c == '}') {
      if (depth_ == 0) Fail(std::string("unmatched '") + c + "'");
      depth_--;
    }
    Emit(Token::Type::OP, std::string(1, c));
    pos_++;
  }

  const std::string& src_;
  size_t pos_ = 0;
  size_t line_start_ = 0;
  uint32_t line_ = 1;
  int depth_ = 0;
  bool at_line_start_ = true;
  std::vector<size_t> indents_ = {0};
  std::vector<Token> tokens_;
};

}  // namespace

std::vector<Token> Tokenize(const std::string& source) {
  return Lexer(source).Run();
}

bool IsKeyword(const std::string& name) {
  static const std::unordered_set<std::string> keywords(std::begin(kKeywords),
                                                        std::end(kKeywords));
  return keywords.count(name) != 0;
}

bool IsIdentifier(const std::string& name) {
  if (name.empty()) return false;
  if (!isalpha(static_cast<unsigned char>(name[0])) && name[0] != '_') {
    return false;
  }
  for (char c : name) {
    if (!isalnum(static_cast<unsigned char>(c)) && c != '_') return false;
  }
  return !IsKeyword(name);
}

}  // namespace script
