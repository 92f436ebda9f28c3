#include "script/callable.hpp"

#include <memory>

#include "script/errors.hpp"

namespace script {

void Module::AddFunction(const std::string& name, Builtin::Fn fn) {
  members_[name] =
      Value::Function(std::make_shared<Builtin>(name_ + "." + name, std::move(fn)));
}

void ExpectArgs(const std::string& fn, const CallArgs& args, size_t min,
                size_t max) {
  size_t n = args.positional.size();
  if (n >= min && n <= max) return;
  std::string expected;
  if (min == max) {
    expected = "exactly " + std::to_string(min);
  } else if (n < min) {
    expected = "at least " + std::to_string(min);
  } else {
    expected = "at most " + std::to_string(max);
  }
  throw TypeError(fn + "() takes " + expected + " argument" +
                  (min == max && min == 1 ? "" : "s") + " (" +
                  std::to_string(n) + " given)");
}

void ExpectNoKeywords(const std::string& fn, const CallArgs& args) {
  if (!args.keyword.empty()) {
    throw TypeError(fn + "() got an unexpected keyword argument '" +
                    args.keyword.front().first + "'");
  }
}

Value TakeKeyword(CallArgs* args, const std::string& name, Value def) {
  for (auto it = args->keyword.begin(); it != args->keyword.end(); ++it) {
    if (it->first == name) {
      Value v = it->second;
      args->keyword.erase(it);
      return v;
    }
  }
  return def;
}

double NumberArg(const std::string& fn, const Value& v) {
  if (!v.IsNumber()) {
    throw TypeError(fn + "() expected a number, got '" + v.TypeName() + "'");
  }
  return v.ToDouble();
}

int64_t IntArg(const std::string& fn, const Value& v) {
  if (!v.IsInt() && !v.IsBool()) {
    throw TypeError(fn + "() expected an integer, got '" + v.TypeName() + "'");
  }
  return v.AsInt();
}

}  // namespace script
