#include "script/methods.hpp"

#include <cctype>
#include <map>
#include <memory>

#include "script/callable.hpp"
#include "script/errors.hpp"
#include "script/operators.hpp"

namespace script {
namespace {

using Method = Value (*)(const std::string& fn, const Value& self,
                         CallArgs& args);
using MethodTable = std::map<std::string, Method>;

const std::string& StrArg(const std::string& fn, const Value& v) {
  if (!v.IsStr()) {
    throw TypeError(fn + "() argument must be str, not " + v.TypeName());
  }
  return v.AsStr();
}

/*
 * list
 */

Value ListAppend(const std::string& fn, const Value& self, CallArgs& args) {
  ExpectArgs(fn, args, 1, 1);
  self.AsList().push_back(args.positional[0]);
  return Value();
}

Value ListPop(const std::string& fn, const Value& self, CallArgs& args) {
  ExpectArgs(fn, args, 0, 1);
  List& items = self.AsList();
  if (items.empty()) throw IndexError("pop from empty list");
  int64_t index = args.positional.empty()
                      ? -1
                      : IntArg(fn, args.positional[0]);
  int64_t len = items.size();
  if (index < 0) index += len;
  if (index < 0 || index >= len) throw IndexError("pop index out of range");
  Value v = items[index];
  items.erase(items.begin() + index);
  return v;
}

Value ListIndex(const std::string& fn, const Value& self, CallArgs& args) {
  ExpectArgs(fn, args, 1, 1);
  const List& items = self.AsList();
  for (size_t i = 0; i < items.size(); i++) {
    if (items[i].Equals(args.positional[0])) return Value::Int(i);
  }
  throw ValueError(args.positional[0].Repr() + " is not in list");
}

Value ListCount(const std::string& fn, const Value& self, CallArgs& args) {
  ExpectArgs(fn, args, 1, 1);
  int64_t n = 0;
  for (const Value& v : self.AsList()) {
    if (v.Equals(args.positional[0])) n++;
  }
  return Value::Int(n);
}

/*
 * set
 */

Value SetAddMethod(const std::string& fn, const Value& self, CallArgs& args) {
  ExpectArgs(fn, args, 1, 1);
  self.SetAdd(args.positional[0]);
  return Value();
}

Value SetRemove(const std::string& fn, const Value& self, CallArgs& args) {
  ExpectArgs(fn, args, 1, 1);
  if (!self.AsSet().Erase(args.positional[0])) {
    throw KeyError(args.positional[0].Repr());
  }
  return Value();
}

Value SetDiscard(const std::string& fn, const Value& self, CallArgs& args) {
  ExpectArgs(fn, args, 1, 1);
  self.AsSet().Erase(args.positional[0]);
  return Value();
}

// union, intersection and difference take any number of iterables.
Value SetUnion(const std::string&, const Value& self, CallArgs& args) {
  Value out = self.DeepCopy();
  for (const Value& other : args.positional) {
    for (const Value& v : Iterate(other)) out.SetAdd(v);
  }
  return out;
}

Value SetIntersection(const std::string&, const Value& self, CallArgs& args) {
  Value out = self.DeepCopy();
  for (const Value& other : args.positional) {
    Value keep = Value::NewSet();
    for (const Value& v : Iterate(other)) {
      if (out.AsSet().Find(v) != nullptr) keep.SetAdd(v);
    }
    Value next = Value::NewSet();
    for (const auto& item : out.AsSet().Items()) {
      if (keep.AsSet().Find(item.first) != nullptr) next.SetAdd(item.first);
    }
    out = next;
  }
  return out;
}

Value SetDifference(const std::string&, const Value& self, CallArgs& args) {
  Value out = self.DeepCopy();
  for (const Value& other : args.positional) {
    for (const Value& v : Iterate(other)) out.AsSet().Erase(v);
  }
  return out;
}

/*
 * dict
 */

Value DictGet(const std::string& fn, const Value& self, CallArgs& args) {
  ExpectArgs(fn, args, 1, 2);
  const Value* v = self.AsDict().Find(args.positional[0]);
  if (v != nullptr) return *v;
  return args.positional.size() > 1 ? args.positional[1] : Value();
}

Value DictKeys(const std::string& fn, const Value& self, CallArgs& args) {
  ExpectArgs(fn, args, 0, 0);
  return Value::NewList(Iterate(self));
}

Value DictValues(const std::string& fn, const Value& self, CallArgs& args) {
  ExpectArgs(fn, args, 0, 0);
  List values;
  for (const auto& item : self.AsDict().Items()) values.push_back(item.second);
  return Value::NewList(std::move(values));
}

Value DictItems(const std::string& fn, const Value& self, CallArgs& args) {
  ExpectArgs(fn, args, 0, 0);
  List items;
  for (const auto& item : self.AsDict().Items()) {
    items.push_back(Value::NewList({item.first, item.second}));
  }
  return Value::NewList(std::move(items));
}

Value DictPop(const std::string& fn, const Value& self, CallArgs& args) {
  ExpectArgs(fn, args, 1, 2);
  const Value& key = args.positional[0];
  const Value* v = self.AsDict().Find(key);
  if (v == nullptr) {
    if (args.positional.size() > 1) return args.positional[1];
    throw KeyError(key.Repr());
  }
  Value popped = *v;
  self.AsDict().Erase(key);
  return popped;
}

/*
 * str
 */

Value StrUpper(const std::string& fn, const Value& self, CallArgs& args) {
  ExpectArgs(fn, args, 0, 0);
  std::string s = self.AsStr();
  for (char& c : s) c = toupper(static_cast<unsigned char>(c));
  return Value::Str(std::move(s));
}

Value StrLower(const std::string& fn, const Value& self, CallArgs& args) {
  ExpectArgs(fn, args, 0, 0);
  std::string s = self.AsStr();
  for (char& c : s) c = tolower(static_cast<unsigned char>(c));
  return Value::Str(std::move(s));
}

Value StrStrip(const std::string& fn, const Value& self, CallArgs& args) {
  ExpectArgs(fn, args, 0, 1);
  std::string chars = " \t\n\r\f\v";
  if (!args.positional.empty() && !args.positional[0].IsNone()) {
    chars = StrArg(fn, args.positional[0]);
  }
  const std::string& s = self.AsStr();
  size_t begin = s.find_first_not_of(chars);
  if (begin == std::string::npos) return Value::Str("");
  size_t end = s.find_last_not_of(chars);
  return Value::Str(s.substr(begin, end - begin + 1));
}

Value StrSplit(const std::string& fn, const Value& self, CallArgs& args) {
  ExpectArgs(fn, args, 0, 1);
  const std::string& s = self.AsStr();
  List parts;
  if (args.positional.empty() || args.positional[0].IsNone()) {
    size_t i = 0;
    while (i < s.size()) {
      while (i < s.size() && isspace(static_cast<unsigned char>(s[i]))) i++;
      if (i >= s.size()) break;
      size_t start = i;
      while (i < s.size() && !isspace(static_cast<unsigned char>(s[i]))) i++;
      parts.push_back(Value::Str(s.substr(start, i - start)));
    }
    return Value::NewList(std::move(parts));
  }
  const std::string& sep = StrArg(fn, args.positional[0]);
  if (sep.empty()) throw ValueError("empty separator");
  size_t start = 0;
  while (true) {
    size_t pos = s.find(sep, start);
    if (pos == std::string::npos) break;
    parts.push_back(Value::Str(s.substr(start, pos - start)));
    start = pos + sep.size();
  }
  parts.push_back(Value::Str(s.substr(start)));
  return Value::NewList(std::move(parts));
}

Value StrJoin(const std::string& fn, const Value& self, CallArgs& args) {
  ExpectArgs(fn, args, 1, 1);
  std::string out;
  bool first = true;
  for (const Value& part : Iterate(args.positional[0])) {
    if (!part.IsStr()) {
      throw TypeError("sequence item: expected str instance, " +
                      part.TypeName() + " found");
    }
    if (!first) out += self.AsStr();
    first = false;
    out += part.AsStr();
  }
  return Value::Str(std::move(out));
}

Value StrStartsWith(const std::string& fn, const Value& self, CallArgs& args) {
  ExpectArgs(fn, args, 1, 1);
  const std::string& prefix = StrArg(fn, args.positional[0]);
  return Value::Bool(self.AsStr().compare(0, prefix.size(), prefix) == 0);
}

Value StrEndsWith(const std::string& fn, const Value& self, CallArgs& args) {
  ExpectArgs(fn, args, 1, 1);
  const std::string& s = self.AsStr();
  const std::string& suffix = StrArg(fn, args.positional[0]);
  return Value::Bool(s.size() >= suffix.size() &&
                     s.compare(s.size() - suffix.size(), suffix.size(),
                               suffix) == 0);
}

Value StrReplace(const std::string& fn, const Value& self, CallArgs& args) {
  ExpectArgs(fn, args, 2, 2);
  const std::string& s = self.AsStr();
  const std::string& from = StrArg(fn, args.positional[0]);
  const std::string& to = StrArg(fn, args.positional[1]);
  if (from.empty()) {
    std::string out = to;
    for (char c : s) {
      out += c;
      out += to;
    }
    return Value::Str(std::move(out));
  }
  std::string out;
  size_t start = 0;
  while (true) {
    size_t pos = s.find(from, start);
    if (pos == std::string::npos) break;
    out.append(s, start, pos - start);
    out += to;
    start = pos + from.size();
  }
  out.append(s, start, std::string::npos);
  return Value::Str(std::move(out));
}

const MethodTable& TableFor(const Value& receiver) {
  static const MethodTable kList = {{"append", ListAppend},
                                    {"pop", ListPop},
                                    {"index", ListIndex},
                                    {"count", ListCount}};
  static const MethodTable kDict = {{"get", DictGet},
                                    {"keys", DictKeys},
                                    {"values", DictValues},
                                    {"items", DictItems},
                                    {"pop", DictPop}};
  static const MethodTable kSet = {{"add", SetAddMethod},
                                   {"remove", SetRemove},
                                   {"discard", SetDiscard},
                                   {"union", SetUnion},
                                   {"intersection", SetIntersection},
                                   {"difference", SetDifference}};
  static const MethodTable kStr = {
      {"upper", StrUpper},           {"lower", StrLower},
      {"strip", StrStrip},           {"split", StrSplit},
      {"join", StrJoin},             {"startswith", StrStartsWith},
      {"endswith", StrEndsWith},     {"replace", StrReplace}};
  static const MethodTable kNone;
  switch (receiver.type()) {
    case Value::Type::LIST:
      return kList;
    case Value::Type::DICT:
      return kDict;
    case Value::Type::SET:
      return kSet;
    case Value::Type::STR:
      return kStr;
    default:
      return kNone;
  }
}

}  // namespace

Value BindMethod(const Value& receiver, const std::string& name) {
  const MethodTable& table = TableFor(receiver);
  auto it = table.find(name);
  if (it == table.end()) {
    throw AttributeError("'" + receiver.TypeName() +
                         "' object has no attribute '" + name + "'");
  }
  std::string qualified = receiver.TypeName() + "." + name;
  Method method = it->second;
  return Value::Function(std::make_shared<Builtin>(
      qualified, [qualified, method, receiver](Interpreter*, CallArgs& args) {
        ExpectNoKeywords(qualified, args);
        return method(qualified, receiver, args);
      }));
}

}  // namespace script
