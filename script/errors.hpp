#ifndef SCRIPT_ERRORS_HPP
#define SCRIPT_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace script {

// An unhandled fault raised by a running script. The label is the
// Python-style classification ("NameError", "TypeError", ...).
class ScriptError : public std::runtime_error {
 public:
  ScriptError(std::string label, const std::string& message, uint32_t line = 0)
      : std::runtime_error(message), label_(std::move(label)), line_(line) {}

  const std::string& Label() const { return label_; }
  uint32_t Line() const { return line_; }
  // Attaches the line of the innermost statement, if none is known yet.
  void SetLineIfUnset(uint32_t line) {
    if (line_ == 0) line_ = line;
  }

 private:
  std::string label_;
  uint32_t line_;
};

// The program text could not be tokenized or parsed.
class SyntaxError : public std::runtime_error {
 public:
  SyntaxError(const std::string& message, uint32_t line, uint32_t column)
      : std::runtime_error(message), line_(line), column_(column) {}

  uint32_t Line() const { return line_; }
  uint32_t Column() const { return column_; }

 private:
  uint32_t line_;
  uint32_t column_;
};

inline ScriptError NameError(const std::string& msg) {
  return ScriptError("NameError", msg);
}
inline ScriptError TypeError(const std::string& msg) {
  return ScriptError("TypeError", msg);
}
inline ScriptError ValueError(const std::string& msg) {
  return ScriptError("ValueError", msg);
}
inline ScriptError IndexError(const std::string& msg) {
  return ScriptError("IndexError", msg);
}
inline ScriptError KeyError(const std::string& msg) {
  return ScriptError("KeyError", msg);
}
inline ScriptError AttributeError(const std::string& msg) {
  return ScriptError("AttributeError", msg);
}
inline ScriptError ZeroDivisionError(const std::string& msg) {
  return ScriptError("ZeroDivisionError", msg);
}
inline ScriptError OverflowError(const std::string& msg) {
  return ScriptError("OverflowError", msg);
}
inline ScriptError RecursionError(const std::string& msg) {
  return ScriptError("RecursionError", msg);
}
inline ScriptError RuntimeError(const std::string& msg) {
  return ScriptError("RuntimeError", msg);
}

}  // namespace script

#endif
