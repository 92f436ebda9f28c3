#include "script/value.hpp"

#include <algorithm>
#include <cinttypes>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include "script/callable.hpp"
#include "script/errors.hpp"

namespace script {
namespace {

const constexpr int kMaxCompareDepth = 100;
const constexpr int kMaxReprDepth = 1000;

using Seen = std::vector<const void*>;

bool Contains(const Seen& seen, const void* p) {
  return std::find(seen.begin(), seen.end(), p) != seen.end();
}

std::string QuoteString(const std::string& s) {
  char quote = '\'';
  if (s.find('\'') != std::string::npos && s.find('"') == std::string::npos) {
    quote = '"';
  }
  std::string out(1, quote);
  for (unsigned char c : s) {
    switch (c) {
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (c == quote) {
          out += '\\';
          out += c;
        } else if (c < 0x20 || c == 0x7f) {
          char buf[8];
          snprintf(buf, sizeof(buf), "\\x%02x", c);
          out += buf;
        } else {
          out += c;
        }
    }
  }
  out += quote;
  return out;
}

void ReprInto(const Value& v, Seen* seen, std::string* out) {
  if ((v.IsList() || v.IsDict()) && seen->size() >= kMaxReprDepth) {
    throw RecursionError(
        "maximum recursion depth exceeded while getting the repr of an "
        "object");
  }
  switch (v.type()) {
    case Value::Type::LIST: {
      const void* p = &v.AsList();
      if (Contains(*seen, p)) {
        *out += "[...]";
        return;
      }
      seen->push_back(p);
      *out += '[';
      bool first = true;
      for (const Value& item : v.AsList()) {
        if (!first) *out += ", ";
        first = false;
        ReprInto(item, seen, out);
      }
      *out += ']';
      seen->pop_back();
      return;
    }
    case Value::Type::DICT: {
      const void* p = &v.AsDict();
      if (Contains(*seen, p)) {
        *out += "{...}";
        return;
      }
      seen->push_back(p);
      *out += '{';
      bool first = true;
      for (const auto& item : v.AsDict().Items()) {
        if (!first) *out += ", ";
        first = false;
        ReprInto(item.first, seen, out);
        *out += ": ";
        ReprInto(item.second, seen, out);
      }
      *out += '}';
      seen->pop_back();
      return;
    }
    default:
      *out += v.Repr();
  }
}

bool EqualsImpl(const Value& a, const Value& b, int depth) {
  if (depth > kMaxCompareDepth) {
    throw RecursionError("maximum recursion depth exceeded in comparison");
  }
  if (a.IsNumber() && b.IsNumber()) {
    if (!a.IsFloat() && !b.IsFloat()) return a.AsInt() == b.AsInt();
    return a.ToDouble() == b.ToDouble();
  }
  if (a.type() != b.type()) return false;
  switch (a.type()) {
    case Value::Type::NONE:
      return true;
    case Value::Type::STR:
      return a.AsStr() == b.AsStr();
    case Value::Type::LIST: {
      const List& l = a.AsList();
      const List& r = b.AsList();
      if (&l == &r) return true;
      if (l.size() != r.size()) return false;
      for (size_t i = 0; i < l.size(); i++) {
        if (!EqualsImpl(l[i], r[i], depth + 1)) return false;
      }
      return true;
    }
    case Value::Type::DICT: {
      const Dict& l = a.AsDict();
      const Dict& r = b.AsDict();
      if (&l == &r) return true;
      if (l.Size() != r.Size()) return false;
      for (const auto& item : l.Items()) {
        const Value* other = r.Find(item.first);
        if (other == nullptr) return false;
        if (!EqualsImpl(item.second, *other, depth + 1)) return false;
      }
      return true;
    }
    case Value::Type::SET: {
      const Dict& l = a.AsSet();
      const Dict& r = b.AsSet();
      if (l.Size() != r.Size()) return false;
      for (const auto& item : l.Items()) {
        if (r.Find(item.first) == nullptr) return false;
      }
      return true;
    }
    case Value::Type::RANGE: {
      // Ranges are equal when they produce the same values.
      const Range& l = a.AsRange();
      const Range& r = b.AsRange();
      if (l.count != r.count) return false;
      if (l.count == 0) return true;
      if (l.start != r.start) return false;
      return l.count == 1 || l.step == r.step;
    }
    case Value::Type::CALLABLE:
      return &a.AsCallable() == &b.AsCallable();
    case Value::Type::MODULE:
      return &a.AsModule() == &b.AsModule();
    default:
      return false;
  }
}

bool TransferableImpl(const Value& v, int depth, Seen* seen) {
  if (depth > Value::kMaxTransferDepth) return false;
  switch (v.type()) {
    case Value::Type::RANGE:
    case Value::Type::CALLABLE:
    case Value::Type::MODULE:
      return false;
    case Value::Type::SET:
      // Elements are scalars one level down.
      return v.AsSet().Size() == 0 || depth < Value::kMaxTransferDepth;
    case Value::Type::LIST: {
      const void* p = &v.AsList();
      if (Contains(*seen, p)) return false;
      seen->push_back(p);
      for (const Value& item : v.AsList()) {
        if (!TransferableImpl(item, depth + 1, seen)) return false;
      }
      seen->pop_back();
      return true;
    }
    case Value::Type::DICT: {
      const void* p = &v.AsDict();
      if (Contains(*seen, p)) return false;
      seen->push_back(p);
      for (const auto& item : v.AsDict().Items()) {
        if (!TransferableImpl(item.first, depth + 1, seen)) return false;
        if (!TransferableImpl(item.second, depth + 1, seen)) return false;
      }
      seen->pop_back();
      return true;
    }
    default:
      return true;
  }
}

}  // namespace

Value::~Value() {
  if (list_ || dict_) ReleaseContainers();
}

void Value::ReleaseContainers() {
  std::vector<std::shared_ptr<List>> lists;
  std::vector<std::shared_ptr<Dict>> dicts;
  // Only containers with no other owner are detached; shared ones just lose
  // a reference.
  auto take = [&lists, &dicts](Value* v) {
    if (v->list_ && v->list_.use_count() == 1) {
      lists.push_back(std::move(v->list_));
    }
    if (v->dict_ && v->dict_.use_count() == 1) {
      dicts.push_back(std::move(v->dict_));
    }
  };
  take(this);
  while (!lists.empty() || !dicts.empty()) {
    if (!lists.empty()) {
      std::shared_ptr<List> list = std::move(lists.back());
      lists.pop_back();
      for (Value& item : *list) take(&item);
    } else {
      std::shared_ptr<Dict> dict = std::move(dicts.back());
      dicts.pop_back();
      for (auto& item : dict->items_) {
        take(&item.first);
        take(&item.second);
      }
    }
  }
}

Value Value::Bool(bool b) {
  Value v;
  v.type_ = Type::BOOL;
  v.bool_ = b;
  return v;
}

Value Value::Int(int64_t i) {
  Value v;
  v.type_ = Type::INT;
  v.int_ = i;
  return v;
}

Value Value::Float(double d) {
  Value v;
  v.type_ = Type::FLOAT;
  v.float_ = d;
  return v;
}

Value Value::Str(std::string s) {
  Value v;
  v.type_ = Type::STR;
  v.str_ = std::move(s);
  return v;
}

Value Value::NewList(List items) {
  Value v;
  v.type_ = Type::LIST;
  v.list_ = std::make_shared<List>(std::move(items));
  return v;
}

Value Value::NewDict() { return NewDict(std::make_shared<Dict>()); }

Value Value::NewDict(std::shared_ptr<Dict> dict) {
  Value v;
  v.type_ = Type::DICT;
  v.dict_ = std::move(dict);
  return v;
}

Value Value::NewSet() {
  Value v;
  v.type_ = Type::SET;
  v.dict_ = std::make_shared<Dict>();
  return v;
}

Value Value::NewRange(int64_t start, int64_t stop, int64_t step) {
  auto range = std::make_shared<Range>();
  range->start = start;
  range->stop = stop;
  range->step = step;
  // Counted in unsigned arithmetic so bounds near the int64 limits do not
  // overflow.
  if (step > 0 && start < stop) {
    range->count =
        (static_cast<uint64_t>(stop) - static_cast<uint64_t>(start) - 1) /
            static_cast<uint64_t>(step) +
        1;
  } else if (step < 0 && start > stop) {
    range->count =
        (static_cast<uint64_t>(start) - static_cast<uint64_t>(stop) - 1) /
            (0 - static_cast<uint64_t>(step)) +
        1;
  }
  Value v;
  v.type_ = Type::RANGE;
  v.range_ = std::move(range);
  return v;
}

void Value::SetAdd(const Value& element) const {
  if (dict_->Find(element) == nullptr) dict_->Set(element, Value());
}

Value Value::Function(std::shared_ptr<const Callable> fn) {
  Value v;
  v.type_ = Type::CALLABLE;
  v.callable_ = std::move(fn);
  return v;
}

Value Value::Library(std::shared_ptr<const Module> module) {
  Value v;
  v.type_ = Type::MODULE;
  v.module_ = std::move(module);
  return v;
}

double Value::ToDouble() const {
  if (type_ == Type::FLOAT) return float_;
  return static_cast<double>(AsInt());
}

bool Value::Truthy() const {
  switch (type_) {
    case Type::NONE:
      return false;
    case Type::BOOL:
      return bool_;
    case Type::INT:
      return int_ != 0;
    case Type::FLOAT:
      return float_ != 0;
    case Type::STR:
      return !str_.empty();
    case Type::LIST:
      return !list_->empty();
    case Type::DICT:
    case Type::SET:
      return dict_->Size() != 0;
    case Type::RANGE:
      return range_->count != 0;
    default:
      return true;
  }
}

std::string Value::TypeName() const {
  switch (type_) {
    case Type::NONE:
      return "NoneType";
    case Type::BOOL:
      return "bool";
    case Type::INT:
      return "int";
    case Type::FLOAT:
      return "float";
    case Type::STR:
      return "str";
    case Type::LIST:
      return "list";
    case Type::DICT:
      return "dict";
    case Type::SET:
      return "set";
    case Type::RANGE:
      return "range";
    case Type::CALLABLE:
      return callable_->IsBuiltin() ? "builtin_function" : "function";
    case Type::MODULE:
      return "module";
  }
  return "object";
}

std::string Value::ToString() const {
  if (type_ == Type::STR) return str_;
  return Repr();
}

std::string Value::Repr() const {
  switch (type_) {
    case Type::NONE:
      return "None";
    case Type::BOOL:
      return bool_ ? "True" : "False";
    case Type::INT:
      return std::to_string(int_);
    case Type::FLOAT:
      return FormatFloat(float_);
    case Type::STR:
      return QuoteString(str_);
    case Type::LIST:
    case Type::DICT: {
      Seen seen;
      std::string out;
      ReprInto(*this, &seen, &out);
      return out;
    }
    case Type::SET: {
      if (dict_->Size() == 0) return "set()";
      std::string out = "{";
      for (const auto& item : dict_->Items()) {
        if (out.size() > 1) out += ", ";
        out += item.first.Repr();
      }
      return out + "}";
    }
    case Type::RANGE: {
      std::string out = "range(" + std::to_string(range_->start) + ", " +
                        std::to_string(range_->stop);
      if (range_->step != 1) out += ", " + std::to_string(range_->step);
      return out + ")";
    }
    case Type::CALLABLE:
      if (callable_->IsBuiltin()) {
        return "<built-in function " + callable_->Name() + ">";
      }
      return "<function " + callable_->Name() + ">";
    case Type::MODULE:
      return "<module '" + module_->Name() + "'>";
  }
  return "<object>";
}

bool Value::Equals(const Value& other) const {
  return EqualsImpl(*this, other, 0);
}

bool Value::IsTransferable() const {
  Seen seen;
  return TransferableImpl(*this, 0, &seen);
}

Value Value::DeepCopy() const {
  switch (type_) {
    case Type::LIST: {
      List items;
      items.reserve(list_->size());
      for (const Value& item : *list_) items.push_back(item.DeepCopy());
      return NewList(std::move(items));
    }
    case Type::DICT: {
      Value copy = NewDict();
      for (const auto& item : dict_->Items()) {
        copy.AsDict().Set(item.first.DeepCopy(), item.second.DeepCopy());
      }
      return copy;
    }
    case Type::SET: {
      Value copy = NewSet();
      for (const auto& item : dict_->Items()) copy.SetAdd(item.first);
      return copy;
    }
    default:
      return *this;
  }
}

std::string Dict::HashKey(const Value& key) {
  switch (key.type()) {
    case Value::Type::NONE:
      return "N";
    case Value::Type::BOOL:
    case Value::Type::INT:
      return "i" + std::to_string(key.AsInt());
    case Value::Type::FLOAT: {
      double d = key.AsFloat();
      if (std::isfinite(d) && d == std::floor(d) && std::fabs(d) < 9.2e18) {
        return "i" + std::to_string(static_cast<int64_t>(d));
      }
      return "f" + FormatFloat(d);
    }
    case Value::Type::STR:
      return "s" + key.AsStr();
    default:
      throw TypeError("unhashable type: '" + key.TypeName() + "'");
  }
}

Value* Dict::Find(const Value& key) {
  auto it = index_.find(HashKey(key));
  if (it == index_.end()) return nullptr;
  return &items_[it->second].second;
}

const Value* Dict::Find(const Value& key) const {
  auto it = index_.find(HashKey(key));
  if (it == index_.end()) return nullptr;
  return &items_[it->second].second;
}

void Dict::Set(const Value& key, Value value) {
  std::string hash = HashKey(key);
  auto it = index_.find(hash);
  if (it != index_.end()) {
    items_[it->second].second = std::move(value);
    return;
  }
  index_.emplace(std::move(hash), items_.size());
  items_.emplace_back(key, std::move(value));
}

bool Dict::Erase(const Value& key) {
  auto it = index_.find(HashKey(key));
  if (it == index_.end()) return false;
  size_t pos = it->second;
  index_.erase(it);
  items_.erase(items_.begin() + pos);
  for (auto& entry : index_) {
    if (entry.second > pos) entry.second--;
  }
  return true;
}

std::string FormatFloat(double d) {
  if (std::isnan(d)) return "nan";
  if (std::isinf(d)) return d > 0 ? "inf" : "-inf";
  if (d == 0) return std::signbit(d) ? "-0.0" : "0.0";
  // Find the shortest precision that round-trips.
  char buf[64];
  int precision = 1;
  for (; precision < 17; precision++) {
    snprintf(buf, sizeof(buf), "%.*e", precision - 1, d);
    if (strtod(buf, nullptr) == d) break;
  }
  snprintf(buf, sizeof(buf), "%.*e", precision - 1, d);
  const char* exp_pos = strchr(buf, 'e');
  int exponent = exp_pos ? atoi(exp_pos + 1) : 0;
  if (exponent >= -4 && exponent < 16) {
    int decimals = std::max(precision - 1 - exponent, 0);
    snprintf(buf, sizeof(buf), "%.*f", decimals, d);
    std::string out = buf;
    if (out.find('.') == std::string::npos) out += ".0";
    return out;
  }
  std::string out = buf;
  // Python writes at least two exponent digits, printf already does.
  return out;
}

}  // namespace script
