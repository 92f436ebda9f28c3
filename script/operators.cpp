#include "script/operators.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <vector>

#include "script/errors.hpp"

namespace script {
namespace {

const char* OpSymbol(BinaryOp op) {
  switch (op) {
    case BinaryOp::ADD:
      return "+";
    case BinaryOp::SUB:
      return "-";
    case BinaryOp::MUL:
      return "*";
    case BinaryOp::DIV:
      return "/";
    case BinaryOp::FLOOR_DIV:
      return "//";
    case BinaryOp::MOD:
      return "%";
    case BinaryOp::POW:
      return "**";
  }
  return "?";
}

const char* OpSymbol(CompareOp op) {
  switch (op) {
    case CompareOp::LT:
      return "<";
    case CompareOp::LE:
      return "<=";
    case CompareOp::GT:
      return ">";
    case CompareOp::GE:
      return ">=";
    default:
      return "==";
  }
}

[[noreturn]] void Unsupported(BinaryOp op, const Value& l, const Value& r) {
  throw TypeError(std::string("unsupported operand type(s) for ") +
                  OpSymbol(op) + ": '" + l.TypeName() + "' and '" +
                  r.TypeName() + "'");
}

[[noreturn]] void IntegerOverflow() {
  throw OverflowError("integer result does not fit in 64 bits");
}

int64_t IntPow(int64_t base, int64_t exp) {
  int64_t result = 1;
  while (exp > 0) {
    if (exp & 1) {
      if (__builtin_mul_overflow(result, base, &result)) IntegerOverflow();
    }
    exp >>= 1;
    if (exp > 0 && __builtin_mul_overflow(base, base, &base)) {
      IntegerOverflow();
    }
  }
  return result;
}

double FloatPow(double base, double exp) {
  if (base == 0 && exp < 0) {
    throw ZeroDivisionError("0.0 cannot be raised to a negative power");
  }
  if (base < 0 && std::isfinite(exp) && exp != std::floor(exp)) {
    throw ValueError("negative number cannot be raised to a fractional power");
  }
  double r = std::pow(base, exp);
  if (std::isinf(r) && std::isfinite(base) && std::isfinite(exp)) {
    throw OverflowError("numerical result out of range");
  }
  return r;
}

Value IntArithmetic(BinaryOp op, int64_t a, int64_t b) {
  int64_t r;
  switch (op) {
    case BinaryOp::ADD:
      if (__builtin_add_overflow(a, b, &r)) IntegerOverflow();
      return Value::Int(r);
    case BinaryOp::SUB:
      if (__builtin_sub_overflow(a, b, &r)) IntegerOverflow();
      return Value::Int(r);
    case BinaryOp::MUL:
      if (__builtin_mul_overflow(a, b, &r)) IntegerOverflow();
      return Value::Int(r);
    case BinaryOp::DIV:
      if (b == 0) throw ZeroDivisionError("division by zero");
      return Value::Float(static_cast<double>(a) / static_cast<double>(b));
    case BinaryOp::FLOOR_DIV: {
      if (b == 0) throw ZeroDivisionError("integer division or modulo by zero");
      if (a == INT64_MIN && b == -1) IntegerOverflow();
      int64_t q = a / b;
      if (a % b != 0 && ((a < 0) != (b < 0))) q--;
      return Value::Int(q);
    }
    case BinaryOp::MOD: {
      if (b == 0) throw ZeroDivisionError("integer division or modulo by zero");
      if (b == -1) return Value::Int(0);
      int64_t m = a % b;
      if (m != 0 && ((m < 0) != (b < 0))) m += b;
      return Value::Int(m);
    }
    case BinaryOp::POW:
      if (b < 0) {
        return Value::Float(
            FloatPow(static_cast<double>(a), static_cast<double>(b)));
      }
      return Value::Int(IntPow(a, b));
  }
  return Value();
}

Value FloatArithmetic(BinaryOp op, double a, double b) {
  switch (op) {
    case BinaryOp::ADD:
      return Value::Float(a + b);
    case BinaryOp::SUB:
      return Value::Float(a - b);
    case BinaryOp::MUL:
      return Value::Float(a * b);
    case BinaryOp::DIV:
      if (b == 0) throw ZeroDivisionError("float division by zero");
      return Value::Float(a / b);
    case BinaryOp::FLOOR_DIV:
      if (b == 0) throw ZeroDivisionError("float floor division by zero");
      return Value::Float(std::floor(a / b));
    case BinaryOp::MOD: {
      if (b == 0) throw ZeroDivisionError("float modulo");
      double m = std::fmod(a, b);
      if (m == 0) return Value::Float(std::copysign(0.0, b));
      if ((m < 0) != (b < 0)) m += b;
      return Value::Float(m);
    }
    case BinaryOp::POW:
      return Value::Float(FloatPow(a, b));
  }
  return Value();
}

size_t RepeatCount(size_t length, int64_t times) {
  if (times <= 0 || length == 0) return 0;
  size_t total;
  if (__builtin_mul_overflow(length, static_cast<uint64_t>(times), &total)) {
    throw OverflowError("repeated sequence is too long");
  }
  return static_cast<size_t>(times);
}

Value Repeat(const Value& seq, int64_t times) {
  if (seq.IsStr()) {
    const std::string& s = seq.AsStr();
    size_t n = RepeatCount(s.size(), times);
    std::string out;
    out.reserve(s.size() * n);
    for (size_t i = 0; i < n; i++) out += s;
    return Value::Str(std::move(out));
  }
  const List& items = seq.AsList();
  size_t n = RepeatCount(items.size(), times);
  List out;
  out.reserve(items.size() * n);
  for (size_t i = 0; i < n; i++) out.insert(out.end(), items.begin(), items.end());
  return Value::NewList(std::move(out));
}

bool IsSequence(const Value& v) { return v.IsStr() || v.IsList(); }
bool IsIntLike(const Value& v) { return v.IsInt() || v.IsBool(); }

bool OrderCompare(CompareOp op, const Value& a, const Value& b) {
  if (a.IsNumber() && b.IsNumber()) {
    if (!a.IsFloat() && !b.IsFloat()) {
      int64_t x = a.AsInt(), y = b.AsInt();
      switch (op) {
        case CompareOp::LT:
          return x < y;
        case CompareOp::LE:
          return x <= y;
        case CompareOp::GT:
          return x > y;
        default:
          return x >= y;
      }
    }
    double x = a.ToDouble(), y = b.ToDouble();
    switch (op) {
      case CompareOp::LT:
        return x < y;
      case CompareOp::LE:
        return x <= y;
      case CompareOp::GT:
        return x > y;
      default:
        return x >= y;
    }
  }
  if (a.IsStr() && b.IsStr()) {
    int c = a.AsStr().compare(b.AsStr());
    switch (op) {
      case CompareOp::LT:
        return c < 0;
      case CompareOp::LE:
        return c <= 0;
      case CompareOp::GT:
        return c > 0;
      default:
        return c >= 0;
    }
  }
  if (a.IsList() && b.IsList()) {
    const List& x = a.AsList();
    const List& y = b.AsList();
    for (size_t i = 0; i < x.size() && i < y.size(); i++) {
      if (!x[i].Equals(y[i])) return OrderCompare(op, x[i], y[i]);
    }
    return OrderCompare(op, Value::Int(x.size()), Value::Int(y.size()));
  }
  throw TypeError(std::string("'") + OpSymbol(op) +
                  "' not supported between instances of '" + a.TypeName() +
                  "' and '" + b.TypeName() + "'");
}

bool Contains(const Value& container, const Value& item) {
  switch (container.type()) {
    case Value::Type::LIST:
      for (const Value& v : container.AsList()) {
        if (v.Equals(item)) return true;
      }
      return false;
    case Value::Type::DICT:
      return container.AsDict().Find(item) != nullptr;
    case Value::Type::SET:
      return container.AsSet().Find(item) != nullptr;
    case Value::Type::RANGE: {
      if (!item.IsNumber()) return false;
      if (item.IsFloat() && item.AsFloat() != std::floor(item.AsFloat())) {
        return false;
      }
      const Range& r = container.AsRange();
      if (r.count == 0) return false;
      if (item.IsFloat() && std::fabs(item.AsFloat()) >= 9.2e18) return false;
      int64_t v = item.IsFloat() ? static_cast<int64_t>(item.AsFloat())
                                 : item.AsInt();
      int64_t last = r.At(r.count - 1);
      if (r.step > 0 ? (v < r.start || v > last) : (v > r.start || v < last)) {
        return false;
      }
      uint64_t offset = r.step > 0
                            ? static_cast<uint64_t>(v) -
                                  static_cast<uint64_t>(r.start)
                            : static_cast<uint64_t>(r.start) -
                                  static_cast<uint64_t>(v);
      uint64_t step = r.step > 0 ? static_cast<uint64_t>(r.step)
                                 : 0 - static_cast<uint64_t>(r.step);
      return offset % step == 0;
    }
    case Value::Type::STR:
      if (!item.IsStr()) {
        throw TypeError("'in <string>' requires string as left operand, not " +
                        item.TypeName());
      }
      return container.AsStr().find(item.AsStr()) != std::string::npos;
    default:
      throw TypeError("argument of type '" + container.TypeName() +
                      "' is not iterable");
  }
}

bool Identical(const Value& a, const Value& b) {
  if (a.type() != b.type()) return false;
  switch (a.type()) {
    case Value::Type::NONE:
      return true;
    case Value::Type::LIST:
      return &a.AsList() == &b.AsList();
    case Value::Type::DICT:
    case Value::Type::SET:
      return a.DictPtr() == b.DictPtr();
    case Value::Type::RANGE:
      return &a.AsRange() == &b.AsRange();
    case Value::Type::CALLABLE:
      return &a.AsCallable() == &b.AsCallable();
    case Value::Type::MODULE:
      return &a.AsModule() == &b.AsModule();
    default:
      return a.Equals(b);
  }
}

size_t NormalizeIndex(int64_t index, size_t size, const char* what) {
  int64_t len = static_cast<int64_t>(size);
  if (index < 0) index += len;
  if (index < 0 || index >= len) {
    throw IndexError(std::string(what) + " index out of range");
  }
  return static_cast<size_t>(index);
}

int64_t SliceBound(const Value& v, int64_t def) {
  if (v.IsNone()) return def;
  if (!IsIntLike(v)) {
    throw TypeError("slice indices must be integers or None");
  }
  return v.AsInt();
}

std::string FormatOne(const std::string& spec, char conv, const Value& arg) {
  std::string fmt = "%" + spec;
  std::vector<char> buf;
  auto print = [&](auto value) {
    int n = snprintf(nullptr, 0, fmt.c_str(), value);
    if (n < 0) throw ValueError("invalid format specification");
    buf.resize(n + 1);
    snprintf(buf.data(), buf.size(), fmt.c_str(), value);
    return std::string(buf.data(), n);
  };
  switch (conv) {
    case 's':
    case 'r': {
      fmt += 's';
      std::string s = conv == 's' ? arg.ToString() : arg.Repr();
      return print(s.c_str());
    }
    case 'd':
    case 'i':
    case 'x':
    case 'X':
    case 'o': {
      if (!arg.IsNumber()) {
        throw TypeError(std::string("%") + conv +
                        " format: a number is required, not " +
                        arg.TypeName());
      }
      int64_t v = arg.IsFloat() ? FloatToInt(arg.AsFloat()) : arg.AsInt();
      fmt += "ll";
      fmt += conv == 'i' ? 'd' : conv;
      return print(static_cast<long long>(v));
    }
    default: {
      if (!arg.IsNumber()) {
        throw TypeError(std::string("must be real number, not ") +
                        arg.TypeName());
      }
      fmt += conv;
      return print(arg.ToDouble());
    }
  }
}

}  // namespace

Value BinaryOperation(BinaryOp op, const Value& left, const Value& right) {
  if (left.IsNumber() && right.IsNumber()) {
    if (!left.IsFloat() && !right.IsFloat()) {
      return IntArithmetic(op, left.AsInt(), right.AsInt());
    }
    return FloatArithmetic(op, left.ToDouble(), right.ToDouble());
  }
  switch (op) {
    case BinaryOp::ADD:
      if (left.IsStr() && right.IsStr()) {
        return Value::Str(left.AsStr() + right.AsStr());
      }
      if (left.IsList() && right.IsList()) {
        List items = left.AsList();
        items.insert(items.end(), right.AsList().begin(), right.AsList().end());
        return Value::NewList(std::move(items));
      }
      break;
    case BinaryOp::MUL:
      if (IsSequence(left) && IsIntLike(right)) {
        return Repeat(left, right.AsInt());
      }
      if (IsIntLike(left) && IsSequence(right)) {
        return Repeat(right, left.AsInt());
      }
      break;
    case BinaryOp::SUB:
      if (left.IsSet() && right.IsSet()) {
        Value out = Value::NewSet();
        for (const auto& item : left.AsSet().Items()) {
          if (right.AsSet().Find(item.first) == nullptr) {
            out.SetAdd(item.first);
          }
        }
        return out;
      }
      break;
    case BinaryOp::MOD:
      if (left.IsStr()) return Value::Str(FormatPercent(left.AsStr(), right));
      break;
    default:
      break;
  }
  Unsupported(op, left, right);
}

Value UnaryOperation(UnaryOp op, const Value& operand) {
  if (op == UnaryOp::NOT) return Value::Bool(!operand.Truthy());
  if (!operand.IsNumber()) {
    throw TypeError(std::string("bad operand type for unary ") +
                    (op == UnaryOp::NEG ? "-" : "+") + ": '" +
                    operand.TypeName() + "'");
  }
  if (operand.IsFloat()) {
    return Value::Float(op == UnaryOp::NEG ? -operand.AsFloat()
                                           : operand.AsFloat());
  }
  int64_t v = operand.AsInt();
  if (op == UnaryOp::POS) return Value::Int(v);
  if (v == INT64_MIN) IntegerOverflow();
  return Value::Int(-v);
}

bool Compare(CompareOp op, const Value& left, const Value& right) {
  switch (op) {
    case CompareOp::EQ:
      return left.Equals(right);
    case CompareOp::NE:
      return !left.Equals(right);
    case CompareOp::IN:
      return Contains(right, left);
    case CompareOp::NOT_IN:
      return !Contains(right, left);
    case CompareOp::IS:
      return Identical(left, right);
    case CompareOp::IS_NOT:
      return !Identical(left, right);
    default:
      return OrderCompare(op, left, right);
  }
}

bool Less(const Value& left, const Value& right) {
  return OrderCompare(CompareOp::LT, left, right);
}

Iterator::Iterator(Value iterable) : iterable_(std::move(iterable)) {
  switch (iterable_.type()) {
    case Value::Type::DICT:
    case Value::Type::SET:
      initial_size_ = iterable_.DictPtr()->Size();
      break;
    case Value::Type::LIST:
    case Value::Type::STR:
    case Value::Type::RANGE:
      break;
    default:
      throw TypeError("'" + iterable_.TypeName() + "' object is not iterable");
  }
}

bool Iterator::Next(Value* item) {
  switch (iterable_.type()) {
    case Value::Type::LIST: {
      const List& items = iterable_.AsList();
      if (position_ >= items.size()) return false;
      *item = items[position_++];
      return true;
    }
    case Value::Type::STR: {
      const std::string& s = iterable_.AsStr();
      if (position_ >= s.size()) return false;
      *item = Value::Str(std::string(1, s[position_++]));
      return true;
    }
    case Value::Type::RANGE: {
      const Range& r = iterable_.AsRange();
      if (position_ >= r.count) return false;
      *item = Value::Int(r.At(position_++));
      return true;
    }
    default: {
      const Dict& dict = *iterable_.DictPtr();
      if (dict.Size() != initial_size_) {
        throw RuntimeError(
            std::string(iterable_.IsSet() ? "Set" : "dictionary") +
            " changed size during iteration");
      }
      if (position_ >= dict.Size()) return false;
      *item = dict.Items()[position_++].first;
      return true;
    }
  }
}

List Iterate(const Value& v) {
  if (v.IsList()) return v.AsList();
  List items;
  if (v.IsRange()) items.reserve(v.AsRange().count);
  Iterator it(v);
  Value item;
  while (it.Next(&item)) items.push_back(item);
  return items;
}

Value GetItem(const Value& object, const Value& index) {
  switch (object.type()) {
    case Value::Type::LIST:
      if (!IsIntLike(index)) {
        throw TypeError("list indices must be integers, not " +
                        index.TypeName());
      }
      return object.AsList()[NormalizeIndex(index.AsInt(),
                                            object.AsList().size(), "list")];
    case Value::Type::STR: {
      if (!IsIntLike(index)) {
        throw TypeError("string indices must be integers, not " +
                        index.TypeName());
      }
      const std::string& s = object.AsStr();
      return Value::Str(
          std::string(1, s[NormalizeIndex(index.AsInt(), s.size(), "string")]));
    }
    case Value::Type::DICT: {
      const Value* v = object.AsDict().Find(index);
      if (v == nullptr) throw KeyError(index.Repr());
      return *v;
    }
    case Value::Type::RANGE: {
      if (!IsIntLike(index)) {
        throw TypeError("range indices must be integers, not " +
                        index.TypeName());
      }
      const Range& r = object.AsRange();
      if (r.count > static_cast<uint64_t>(INT64_MAX)) {
        throw OverflowError("range is too long to index");
      }
      return Value::Int(r.At(NormalizeIndex(index.AsInt(), r.count, "range")));
    }
    default:
      throw TypeError("'" + object.TypeName() +
                      "' object is not subscriptable");
  }
}

void SetItem(const Value& object, const Value& index, Value value) {
  switch (object.type()) {
    case Value::Type::LIST: {
      if (!IsIntLike(index)) {
        throw TypeError("list indices must be integers, not " +
                        index.TypeName());
      }
      List& items = object.AsList();
      items[NormalizeIndex(index.AsInt(), items.size(), "list assignment")] =
          std::move(value);
      return;
    }
    case Value::Type::DICT:
      object.AsDict().Set(index, std::move(value));
      return;
    default:
      throw TypeError("'" + object.TypeName() +
                      "' object does not support item assignment");
  }
}

Value GetSlice(const Value& object, const Value& lower, const Value& upper,
               const Value& step_value) {
  if (!IsSequence(object)) {
    throw TypeError("'" + object.TypeName() + "' object is not subscriptable");
  }
  int64_t len = object.IsStr() ? object.AsStr().size() : object.AsList().size();
  int64_t step = SliceBound(step_value, 1);
  if (step == 0) throw ValueError("slice step cannot be zero");
  int64_t start, stop;
  if (step > 0) {
    start = SliceBound(lower, 0);
    stop = SliceBound(upper, len);
    if (start < 0) start = std::max<int64_t>(start + len, 0);
    if (stop < 0) stop = std::max<int64_t>(stop + len, 0);
    start = std::min(start, len);
    stop = std::min(stop, len);
  } else {
    start = SliceBound(lower, len - 1);
    stop = SliceBound(upper, -1);
    if (!upper.IsNone() && stop < 0) stop = std::max<int64_t>(stop + len, -1);
    if (!lower.IsNone() && start < 0) {
      start = std::max<int64_t>(start + len, -1);
    }
    start = std::min(start, len - 1);
    stop = std::min(stop, len - 1);
  }
  std::vector<int64_t> picks;
  for (int64_t i = start; step > 0 ? i < stop : i > stop; i += step) {
    picks.push_back(i);
  }
  if (object.IsStr()) {
    std::string out;
    for (int64_t i : picks) out += object.AsStr()[i];
    return Value::Str(std::move(out));
  }
  List out;
  out.reserve(picks.size());
  for (int64_t i : picks) out.push_back(object.AsList()[i]);
  return Value::NewList(std::move(out));
}

int64_t FloatToInt(double d) {
  if (std::isnan(d)) throw ValueError("cannot convert float NaN to integer");
  if (std::isinf(d)) {
    throw OverflowError("cannot convert float infinity to integer");
  }
  if (d >= 9.2233720368547758e18 || d < -9.2233720368547758e18) {
    IntegerOverflow();
  }
  return static_cast<int64_t>(d);
}

std::string FormatPercent(const std::string& format, const Value& args) {
  List values = args.IsList() ? args.AsList() : List{args};
  size_t next = 0;
  std::string out;
  for (size_t i = 0; i < format.size(); i++) {
    if (format[i] != '%') {
      out += format[i];
      continue;
    }
    if (++i >= format.size()) throw ValueError("incomplete format");
    if (format[i] == '%') {
      out += '%';
      continue;
    }
    std::string spec;
    while (i < format.size() && std::string("-+ 0#").find(format[i]) !=
                                    std::string::npos) {
      spec += format[i++];
    }
    while (i < format.size() && (isdigit(static_cast<unsigned char>(format[i])) ||
                                 format[i] == '.')) {
      spec += format[i++];
    }
    if (i >= format.size()) throw ValueError("incomplete format");
    char conv = format[i];
    if (std::string("sdifeEgGrxXo").find(conv) == std::string::npos) {
      throw ValueError(std::string("unsupported format character '") + conv +
                       "'");
    }
    if (next >= values.size()) {
      throw TypeError("not enough arguments for format string");
    }
    out += FormatOne(spec, conv, values[next++]);
  }
  if (next < values.size()) {
    throw TypeError("not all arguments converted during string formatting");
  }
  return out;
}

}  // namespace script
