#include "policy/primitives.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <memory>

#include "script/callable.hpp"
#include "script/errors.hpp"
#include "script/interpreter.hpp"
#include "script/operators.hpp"

namespace policy {
namespace {

using script::CallArgs;
using script::Interpreter;
using script::List;
using script::Value;

std::string Strip(const std::string& s) {
  size_t begin = s.find_first_not_of(" \t\n\r\f\v");
  if (begin == std::string::npos) return "";
  size_t end = s.find_last_not_of(" \t\n\r\f\v");
  return s.substr(begin, end - begin + 1);
}

std::string SeparatorArg(CallArgs* args, const std::string& name,
                         const std::string& def) {
  Value v = script::TakeKeyword(args, name);
  if (v.IsNone()) return def;
  if (!v.IsStr()) {
    throw script::TypeError(name + " must be None or a string, not " +
                            v.TypeName());
  }
  return v.AsStr();
}

// print and warn share their signature: print(*values, sep=' ', end='\n').
Value WriteValues(const std::string& fn, script::OutputSink* sink,
                  CallArgs& args) {
  std::string sep = SeparatorArg(&args, "sep", " ");
  std::string end = SeparatorArg(&args, "end", "\n");
  script::ExpectNoKeywords(fn, args);
  std::string line;
  for (size_t i = 0; i < args.positional.size(); i++) {
    if (i > 0) line += sep;
    line += args.positional[i].ToString();
  }
  line += end;
  sink->Write(line);
  return Value();
}

Value Print(Interpreter* interpreter, CallArgs& args) {
  return WriteValues("print", interpreter->Out(), args);
}

Value Warn(Interpreter* interpreter, CallArgs& args) {
  return WriteValues("warn", interpreter->Err(), args);
}

Value Len(Interpreter*, CallArgs& args) {
  script::ExpectNoKeywords("len", args);
  script::ExpectArgs("len", args, 1, 1);
  const Value& v = args.positional[0];
  switch (v.type()) {
    case Value::Type::STR:
      return Value::Int(v.AsStr().size());
    case Value::Type::LIST:
      return Value::Int(v.AsList().size());
    case Value::Type::DICT:
    case Value::Type::SET:
      return Value::Int(v.DictPtr()->Size());
    case Value::Type::RANGE:
      if (v.AsRange().count > static_cast<uint64_t>(INT64_MAX)) {
        throw script::OverflowError("range is too long for len()");
      }
      return Value::Int(v.AsRange().count);
    default:
      throw script::TypeError("object of type '" + v.TypeName() +
                              "' has no len()");
  }
}

Value Range(Interpreter*, CallArgs& args) {
  script::ExpectNoKeywords("range", args);
  script::ExpectArgs("range", args, 1, 3);
  int64_t start = 0, stop, step = 1;
  if (args.positional.size() == 1) {
    stop = script::IntArg("range", args.positional[0]);
  } else {
    start = script::IntArg("range", args.positional[0]);
    stop = script::IntArg("range", args.positional[1]);
    if (args.positional.size() == 3) {
      step = script::IntArg("range", args.positional[2]);
    }
  }
  if (step == 0) throw script::ValueError("range() arg 3 must not be zero");
  return Value::NewRange(start, stop, step);
}

Value Abs(Interpreter*, CallArgs& args) {
  script::ExpectNoKeywords("abs", args);
  script::ExpectArgs("abs", args, 1, 1);
  const Value& v = args.positional[0];
  if (v.IsFloat()) return Value::Float(std::fabs(v.AsFloat()));
  if (!v.IsNumber()) {
    throw script::TypeError("bad operand type for abs(): '" + v.TypeName() +
                            "'");
  }
  if (v.AsInt() < 0) {
    return script::UnaryOperation(script::UnaryOp::NEG, Value::Int(v.AsInt()));
  }
  return Value::Int(v.AsInt());
}

// Shared by min() and max(): one iterable argument or several values,
// with optional key= and default=.
Value Extreme(const std::string& fn, bool want_max, Interpreter* interpreter,
              CallArgs& args) {
  Value key = script::TakeKeyword(&args, "key");
  bool has_default = false;
  Value def;
  for (auto it = args.keyword.begin(); it != args.keyword.end(); ++it) {
    if (it->first == "default") {
      has_default = true;
      def = it->second;
      args.keyword.erase(it);
      break;
    }
  }
  script::ExpectNoKeywords(fn, args);
  if (args.positional.empty()) {
    throw script::TypeError(fn + " expected at least 1 argument, got 0");
  }
  Value values = args.positional.size() == 1
                     ? args.positional[0]
                     : Value::NewList(List(args.positional.begin(),
                                           args.positional.end()));
  auto key_of = [&](const Value& v) {
    if (key.IsNone()) return v;
    return interpreter->Call(key, CallArgs{{v}, {}});
  };
  script::Iterator it(values);
  Value best;
  if (!it.Next(&best)) {
    if (has_default) return def;
    throw script::ValueError(fn + "() arg is an empty sequence");
  }
  Value best_key = key_of(best);
  Value v;
  while (it.Next(&v)) {
    Value k = key_of(v);
    bool better = want_max ? script::Less(best_key, k)
                           : script::Less(k, best_key);
    if (better) {
      best = v;
      best_key = k;
    }
  }
  return best;
}

Value Min(Interpreter* interpreter, CallArgs& args) {
  return Extreme("min", false, interpreter, args);
}

Value Max(Interpreter* interpreter, CallArgs& args) {
  return Extreme("max", true, interpreter, args);
}

Value Sum(Interpreter*, CallArgs& args) {
  Value total = script::TakeKeyword(&args, "start", Value::Int(0));
  script::ExpectNoKeywords("sum", args);
  script::ExpectArgs("sum", args, 1, 2);
  if (args.positional.size() == 2) total = args.positional[1];
  if (total.IsStr()) {
    throw script::TypeError("sum() can't sum strings [use ''.join(seq) instead]");
  }
  script::Iterator it(args.positional[0]);
  Value v;
  while (it.Next(&v)) {
    total = script::BinaryOperation(script::BinaryOp::ADD, total, v);
  }
  return total;
}

Value Round(Interpreter*, CallArgs& args) {
  script::ExpectNoKeywords("round", args);
  script::ExpectArgs("round", args, 1, 2);
  const Value& v = args.positional[0];
  if (!v.IsNumber()) {
    throw script::TypeError("type " + v.TypeName() +
                            " doesn't define __round__ method");
  }
  bool has_digits = args.positional.size() == 2 && !args.positional[1].IsNone();
  if (!has_digits) {
    if (!v.IsFloat()) return Value::Int(v.AsInt());
    // nearbyint rounds half to even in the default rounding mode.
    return Value::Int(script::FloatToInt(std::nearbyint(v.AsFloat())));
  }
  int64_t digits = script::IntArg("round", args.positional[1]);
  if (!v.IsFloat()) {
    if (digits >= 0) return Value::Int(v.AsInt());
    if (digits < -18) return Value::Int(0);
    double scale = std::pow(10.0, static_cast<double>(-digits));
    return Value::Int(script::FloatToInt(
        std::nearbyint(static_cast<double>(v.AsInt()) / scale) * scale));
  }
  double d = v.AsFloat();
  if (!std::isfinite(d) || digits > 300) return Value::Float(d);
  if (digits < 0) {
    if (digits < -308) return Value::Float(std::copysign(0.0, d));
    double scale = std::pow(10.0, static_cast<double>(-digits));
    return Value::Float(std::nearbyint(d / scale) * scale);
  }
  // printf rounds the exact binary value, as Python does.
  char buf[400];
  snprintf(buf, sizeof(buf), "%.*f", static_cast<int>(digits), d);
  return Value::Float(strtod(buf, nullptr));
}

Value IntFn(Interpreter*, CallArgs& args) {
  script::ExpectNoKeywords("int", args);
  script::ExpectArgs("int", args, 0, 1);
  if (args.positional.empty()) return Value::Int(0);
  const Value& v = args.positional[0];
  if (v.IsFloat()) return Value::Int(script::FloatToInt(v.AsFloat()));
  if (v.IsNumber()) return Value::Int(v.AsInt());
  if (v.IsStr()) {
    std::string text = Strip(v.AsStr());
    std::string digits;
    for (size_t i = 0; i < text.size(); i++) {
      if (text[i] == '_' && i > 0 && i + 1 < text.size() &&
          isdigit(static_cast<unsigned char>(text[i - 1])) &&
          isdigit(static_cast<unsigned char>(text[i + 1]))) {
        continue;
      }
      digits += text[i];
    }
    char* end = nullptr;
    errno = 0;
    long long parsed = strtoll(digits.c_str(), &end, 10);
    bool valid = !digits.empty() && end == digits.c_str() + digits.size() &&
                 !isspace(static_cast<unsigned char>(digits[0]));
    if (!valid) {
      throw script::ValueError("invalid literal for int() with base 10: " +
                               v.Repr());
    }
    if (errno == ERANGE) {
      throw script::OverflowError("int too large to convert: " + v.Repr());
    }
    return Value::Int(parsed);
  }
  throw script::TypeError(
      "int() argument must be a string or a number, not '" + v.TypeName() +
      "'");
}

Value FloatFn(Interpreter*, CallArgs& args) {
  script::ExpectNoKeywords("float", args);
  script::ExpectArgs("float", args, 0, 1);
  if (args.positional.empty()) return Value::Float(0);
  const Value& v = args.positional[0];
  if (v.IsNumber()) return Value::Float(v.ToDouble());
  if (v.IsStr()) {
    std::string text = Strip(v.AsStr());
    char* end = nullptr;
    double parsed = strtod(text.c_str(), &end);
    // strtod also accepts hex floats, which Python's float() does not.
    bool hex = text.find('x') != std::string::npos ||
               text.find('X') != std::string::npos;
    if (text.empty() || hex || end != text.c_str() + text.size()) {
      throw script::ValueError("could not convert string to float: " +
                               v.Repr());
    }
    return Value::Float(parsed);
  }
  throw script::TypeError(
      "float() argument must be a string or a number, not '" + v.TypeName() +
      "'");
}

Value StrFn(Interpreter*, CallArgs& args) {
  script::ExpectNoKeywords("str", args);
  script::ExpectArgs("str", args, 0, 1);
  if (args.positional.empty()) return Value::Str("");
  return Value::Str(args.positional[0].ToString());
}

Value BoolFn(Interpreter*, CallArgs& args) {
  script::ExpectNoKeywords("bool", args);
  script::ExpectArgs("bool", args, 0, 1);
  if (args.positional.empty()) return Value::Bool(false);
  return Value::Bool(args.positional[0].Truthy());
}

// list() and tuple(); tuples are lists.
Value ListOf(const std::string& fn, CallArgs& args) {
  script::ExpectNoKeywords(fn, args);
  script::ExpectArgs(fn, args, 0, 1);
  if (args.positional.empty()) return Value::NewList();
  return Value::NewList(script::Iterate(args.positional[0]));
}

Value ListFn(Interpreter*, CallArgs& args) { return ListOf("list", args); }

Value SetFn(Interpreter*, CallArgs& args) {
  script::ExpectNoKeywords("set", args);
  script::ExpectArgs("set", args, 0, 1);
  Value set = Value::NewSet();
  if (args.positional.empty()) return set;
  script::Iterator it(args.positional[0]);
  Value v;
  while (it.Next(&v)) set.SetAdd(v);
  return set;
}
Value TupleFn(Interpreter*, CallArgs& args) { return ListOf("tuple", args); }

Value DictFn(Interpreter*, CallArgs& args) {
  script::ExpectArgs("dict", args, 0, 1);
  Value dict = Value::NewDict();
  if (!args.positional.empty()) {
    const Value& source = args.positional[0];
    if (source.IsDict()) {
      for (const auto& item : source.AsDict().Items()) {
        dict.AsDict().Set(item.first, item.second);
      }
    } else {
      List pairs = script::Iterate(source);
      for (size_t i = 0; i < pairs.size(); i++) {
        List pair = script::Iterate(pairs[i]);
        if (pair.size() != 2) {
          throw script::ValueError("dictionary update sequence element #" +
                                   std::to_string(i) + " has length " +
                                   std::to_string(pair.size()) +
                                   "; 2 is required");
        }
        dict.AsDict().Set(pair[0], pair[1]);
      }
    }
  }
  for (const auto& kw : args.keyword) {
    dict.AsDict().Set(Value::Str(kw.first), kw.second);
  }
  return dict;
}

Value Sorted(Interpreter* interpreter, CallArgs& args) {
  Value key = script::TakeKeyword(&args, "key");
  bool reverse = script::TakeKeyword(&args, "reverse", Value::Bool(false))
                     .Truthy();
  script::ExpectNoKeywords("sorted", args);
  script::ExpectArgs("sorted", args, 1, 1);
  List items = script::Iterate(args.positional[0]);
  std::vector<std::pair<Value, Value>> keyed;
  keyed.reserve(items.size());
  for (const Value& v : items) {
    keyed.emplace_back(
        key.IsNone() ? v : interpreter->Call(key, CallArgs{{v}, {}}), v);
  }
  // Stable in both directions: equal elements keep their original order.
  std::stable_sort(keyed.begin(), keyed.end(),
                   [reverse](const std::pair<Value, Value>& a,
                             const std::pair<Value, Value>& b) {
                     return reverse ? script::Less(b.first, a.first)
                                    : script::Less(a.first, b.first);
                   });
  List out;
  out.reserve(keyed.size());
  for (auto& entry : keyed) out.push_back(std::move(entry.second));
  return Value::NewList(std::move(out));
}

Value Reversed(Interpreter*, CallArgs& args) {
  script::ExpectNoKeywords("reversed", args);
  script::ExpectArgs("reversed", args, 1, 1);
  List items = script::Iterate(args.positional[0]);
  std::reverse(items.begin(), items.end());
  return Value::NewList(std::move(items));
}

Value Enumerate(Interpreter*, CallArgs& args) {
  Value start = script::TakeKeyword(&args, "start", Value::Int(0));
  script::ExpectNoKeywords("enumerate", args);
  script::ExpectArgs("enumerate", args, 1, 2);
  if (args.positional.size() == 2) start = args.positional[1];
  int64_t index = script::IntArg("enumerate", start);
  List out;
  for (const Value& v : script::Iterate(args.positional[0])) {
    out.push_back(Value::NewList({Value::Int(index), v}));
    index++;
  }
  return Value::NewList(std::move(out));
}

Value Zip(Interpreter*, CallArgs& args) {
  script::ExpectNoKeywords("zip", args);
  std::vector<List> columns;
  size_t rows = SIZE_MAX;
  for (const Value& v : args.positional) {
    columns.push_back(script::Iterate(v));
    rows = std::min(rows, columns.back().size());
  }
  if (columns.empty()) return Value::NewList();
  List out;
  for (size_t r = 0; r < rows; r++) {
    List row;
    for (const List& column : columns) row.push_back(column[r]);
    out.push_back(Value::NewList(std::move(row)));
  }
  return Value::NewList(std::move(out));
}

Value Map(Interpreter* interpreter, CallArgs& args) {
  script::ExpectNoKeywords("map", args);
  if (args.positional.size() < 2) {
    throw script::TypeError("map() must have at least two arguments.");
  }
  std::vector<List> columns;
  size_t rows = SIZE_MAX;
  for (size_t i = 1; i < args.positional.size(); i++) {
    columns.push_back(script::Iterate(args.positional[i]));
    rows = std::min(rows, columns.back().size());
  }
  List out;
  for (size_t r = 0; r < rows; r++) {
    CallArgs call;
    for (const List& column : columns) call.positional.push_back(column[r]);
    out.push_back(interpreter->Call(args.positional[0], std::move(call)));
  }
  return Value::NewList(std::move(out));
}

Value Filter(Interpreter* interpreter, CallArgs& args) {
  script::ExpectNoKeywords("filter", args);
  script::ExpectArgs("filter", args, 2, 2);
  const Value& predicate = args.positional[0];
  List out;
  for (const Value& v : script::Iterate(args.positional[1])) {
    bool keep = predicate.IsNone()
                    ? v.Truthy()
                    : interpreter->Call(predicate, CallArgs{{v}, {}}).Truthy();
    if (keep) out.push_back(v);
  }
  return Value::NewList(std::move(out));
}

Value Any(Interpreter*, CallArgs& args) {
  script::ExpectNoKeywords("any", args);
  script::ExpectArgs("any", args, 1, 1);
  script::Iterator it(args.positional[0]);
  Value v;
  while (it.Next(&v)) {
    if (v.Truthy()) return Value::Bool(true);
  }
  return Value::Bool(false);
}

Value All(Interpreter*, CallArgs& args) {
  script::ExpectNoKeywords("all", args);
  script::ExpectArgs("all", args, 1, 1);
  script::Iterator it(args.positional[0]);
  Value v;
  while (it.Next(&v)) {
    if (!v.Truthy()) return Value::Bool(false);
  }
  return Value::Bool(true);
}

// Names of the primitives that stand for a type in type() and isinstance().
// Tuples are lists.
bool IsTypePrimitive(const std::string& name) {
  static const char* const kTypes[] = {"bool", "int",  "float", "str",
                                       "list", "tuple", "dict", "set",
                                       "range"};
  for (const char* type : kTypes) {
    if (name == type) return true;
  }
  return false;
}

bool IsInstance(const Value& v, const std::string& type) {
  if (type == "tuple") return v.IsList();
  // Bools are integers.
  if (type == "int") return v.IsInt() || v.IsBool();
  return v.TypeName() == type;
}

// type(x) is the constructor bound under the type's name, so that
// `type(x) == float` holds. Types without one are named by a string.
Value TypeFn(Interpreter* interpreter, CallArgs& args) {
  script::ExpectNoKeywords("type", args);
  script::ExpectArgs("type", args, 1, 1);
  std::string name = args.positional[0].TypeName();
  const Value* constructor = interpreter->Lookup(name);
  if (IsTypePrimitive(name) && constructor != nullptr &&
      constructor->IsCallable() && constructor->AsCallable().IsBuiltin() &&
      constructor->AsCallable().Name() == name) {
    return *constructor;
  }
  return Value::Str("<class '" + name + "'>");
}

Value IsInstanceFn(Interpreter*, CallArgs& args) {
  script::ExpectNoKeywords("isinstance", args);
  script::ExpectArgs("isinstance", args, 2, 2);
  const Value& v = args.positional[0];
  const Value& types = args.positional[1];
  List candidates = types.IsList() ? types.AsList() : List{types};
  bool match = false;
  for (const Value& type : candidates) {
    if (!type.IsCallable() || !type.AsCallable().IsBuiltin() ||
        !IsTypePrimitive(type.AsCallable().Name())) {
      throw script::TypeError(
          "isinstance() arg 2 must be a type or tuple of types");
    }
    if (IsInstance(v, type.AsCallable().Name())) match = true;
  }
  return Value::Bool(match);
}

}  // namespace

void AddPrimitives(Names* names) {
  const std::pair<const char*, script::Builtin::Fn> kPrimitives[] = {
      {"print", Print},         {"warn", Warn},
      {"len", Len},             {"range", Range},
      {"abs", Abs},             {"min", Min},
      {"max", Max},             {"sum", Sum},
      {"round", Round},         {"int", IntFn},
      {"float", FloatFn},       {"str", StrFn},
      {"bool", BoolFn},         {"list", ListFn},
      {"dict", DictFn},         {"tuple", TupleFn},
      {"set", SetFn},           {"type", TypeFn},
      {"isinstance", IsInstanceFn},
      {"sorted", Sorted},       {"reversed", Reversed},
      {"enumerate", Enumerate}, {"zip", Zip},
      {"map", Map},             {"filter", Filter},
      {"any", Any},             {"all", All}};
  for (const auto& primitive : kPrimitives) {
    (*names)[primitive.first] = Value::Function(
        std::make_shared<script::Builtin>(primitive.first, primitive.second));
  }
}

}  // namespace policy
