#ifndef SCRIPT_OPERATORS_HPP
#define SCRIPT_OPERATORS_HPP

#include <cstdint>
#include <string>

#include "script/ast.hpp"
#include "script/value.hpp"

namespace script {

// Arithmetic with Python semantics on 64-bit ints and doubles. Integer
// overflow throws an OverflowError instead of wrapping.
Value BinaryOperation(BinaryOp op, const Value& left, const Value& right);

Value UnaryOperation(UnaryOp op, const Value& operand);

// A single comparison step of a (possibly chained) comparison.
bool Compare(CompareOp op, const Value& left, const Value& right);

// Ordering used by <, sorted(), min() and max(). Throws a TypeError for
// values that have no order between them.
bool Less(const Value& left, const Value& right);

// Walks an iterable one element at a time. Lists are read live by index, so
// items appended during the loop are visited. Dicts and sets raise a
// RuntimeError if their size changes between two steps. Ranges are never
// materialized.
class Iterator {
 public:
  // Throws a TypeError if v is not iterable.
  explicit Iterator(Value iterable);

  // Stores the next element in *item, returns false once exhausted.
  bool Next(Value* item);

 private:
  Value iterable_;
  size_t position_ = 0;
  size_t initial_size_ = 0;
};

// The elements produced by iterating over v: list items, characters of a
// string, keys of a dict, elements of a set or the values of a range.
List Iterate(const Value& v);

// v[index] and v[index] = value for lists, strings and dicts.
Value GetItem(const Value& object, const Value& index);
void SetItem(const Value& object, const Value& index, Value value);

// v[lower:upper:step]; null bounds are passed as None.
Value GetSlice(const Value& object, const Value& lower, const Value& upper,
               const Value& step);

// Truncates a float towards zero. Throws a ValueError for NaN and an
// OverflowError for values outside the int64 range.
int64_t FloatToInt(double d);

// printf-style formatting for `str % args`.
std::string FormatPercent(const std::string& format, const Value& args);

}  // namespace script

#endif
