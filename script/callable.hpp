#ifndef SCRIPT_CALLABLE_HPP
#define SCRIPT_CALLABLE_HPP

#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "script/value.hpp"

namespace script {

class Interpreter;

struct CallArgs {
  std::vector<Value> positional;
  std::vector<std::pair<std::string, Value>> keyword;
};

// Anything that can appear on the left of a call expression.
class Callable {
 public:
  virtual ~Callable() = default;
  virtual const std::string& Name() const = 0;
  virtual bool IsBuiltin() const { return true; }
  virtual Value Call(Interpreter* interpreter, CallArgs args) const = 0;
};

// A native function exposed to scripts.
class Builtin : public Callable {
 public:
  using Fn = std::function<Value(Interpreter*, CallArgs&)>;
  Builtin(std::string name, Fn fn) : name_(std::move(name)), fn_(std::move(fn)) {}

  const std::string& Name() const override { return name_; }
  Value Call(Interpreter* interpreter, CallArgs args) const override {
    return fn_(interpreter, args);
  }

 private:
  std::string name_;
  Fn fn_;
};

// A library handle: a named, fixed set of members reachable through
// attribute access. Handles are immutable once built.
class Module {
 public:
  explicit Module(std::string name) : name_(std::move(name)) {}

  const std::string& Name() const { return name_; }
  const std::map<std::string, Value>& Members() const { return members_; }
  void Add(const std::string& name, Value value) { members_[name] = value; }
  void AddFunction(const std::string& name, Builtin::Fn fn);

 private:
  std::string name_;
  std::map<std::string, Value> members_;
};

// Helpers for argument checking inside builtins. Each throws a TypeError
// that names the function.
void ExpectArgs(const std::string& fn, const CallArgs& args, size_t min,
                size_t max);
void ExpectNoKeywords(const std::string& fn, const CallArgs& args);
// Removes and returns the keyword argument `name`, or `def` if absent.
Value TakeKeyword(CallArgs* args, const std::string& name, Value def = Value());
double NumberArg(const std::string& fn, const Value& v);
int64_t IntArg(const std::string& fn, const Value& v);

}  // namespace script

#endif
