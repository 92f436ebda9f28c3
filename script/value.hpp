#ifndef SCRIPT_VALUE_HPP
#define SCRIPT_VALUE_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace script {

class Value;
class Dict;
class Callable;
class Module;

using List = std::vector<Value>;

// The progression produced by range(): count values from start by step.
struct Range {
  int64_t start = 0;
  int64_t stop = 0;
  int64_t step = 1;
  uint64_t count = 0;

  int64_t At(uint64_t i) const {
    return static_cast<int64_t>(static_cast<uint64_t>(start) +
                                i * static_cast<uint64_t>(step));
  }
};

// Tagged variant holding every value a strategy script can manipulate.
// NONE..SET are data shapes that can cross the isolation boundary; RANGE,
// CALLABLE and MODULE only exist inside a run. Lists, dicts and sets have
// reference semantics: copying a Value shares the container, DeepCopy does
// not. A set is a Dict whose keys are the elements.
class Value {
 public:
  enum class Type {
    NONE,
    BOOL,
    INT,
    FLOAT,
    STR,
    LIST,
    DICT,
    SET,
    RANGE,
    CALLABLE,
    MODULE
  };

  Value() = default;
  Value(const Value&) = default;
  Value(Value&&) = default;
  Value& operator=(const Value&) = default;
  Value& operator=(Value&&) = default;
  // Containers this value owns alone are torn down without recursion, so
  // arbitrarily deep nesting cannot exhaust the native stack.
  ~Value();

  static Value None() { return Value(); }
  static Value Bool(bool b);
  static Value Int(int64_t i);
  static Value Float(double d);
  static Value Str(std::string s);
  static Value NewList(List items = {});
  static Value NewDict();
  static Value NewDict(std::shared_ptr<Dict> dict);
  static Value NewSet();
  // step must not be zero.
  static Value NewRange(int64_t start, int64_t stop, int64_t step);
  static Value Function(std::shared_ptr<const Callable> fn);
  static Value Library(std::shared_ptr<const Module> module);

  Type type() const { return type_; }
  bool IsNone() const { return type_ == Type::NONE; }
  bool IsBool() const { return type_ == Type::BOOL; }
  bool IsInt() const { return type_ == Type::INT; }
  bool IsFloat() const { return type_ == Type::FLOAT; }
  bool IsStr() const { return type_ == Type::STR; }
  bool IsList() const { return type_ == Type::LIST; }
  bool IsDict() const { return type_ == Type::DICT; }
  bool IsSet() const { return type_ == Type::SET; }
  bool IsRange() const { return type_ == Type::RANGE; }
  bool IsCallable() const { return type_ == Type::CALLABLE; }
  bool IsModule() const { return type_ == Type::MODULE; }
  // Bools count as integers, as in Python.
  bool IsNumber() const {
    return type_ == Type::BOOL || type_ == Type::INT || type_ == Type::FLOAT;
  }

  bool AsBool() const { return bool_; }
  int64_t AsInt() const { return type_ == Type::BOOL ? bool_ : int_; }
  double AsFloat() const { return float_; }
  const std::string& AsStr() const { return str_; }
  List& AsList() const { return *list_; }
  Dict& AsDict() const { return *dict_; }
  const std::shared_ptr<Dict>& DictPtr() const { return dict_; }
  Dict& AsSet() const { return *dict_; }
  // Adds an element to a set. Throws a TypeError for unhashable elements.
  void SetAdd(const Value& element) const;
  const Range& AsRange() const { return *range_; }
  const Callable& AsCallable() const { return *callable_; }
  const Module& AsModule() const { return *module_; }

  // Numeric value as a double; only valid if IsNumber().
  double ToDouble() const;

  // Python truthiness.
  bool Truthy() const;

  // Name of the type as shown in error messages ("int", "list", ...).
  std::string TypeName() const;

  // str() and repr() renderings.
  std::string ToString() const;
  std::string Repr() const;

  // Structural equality with Python semantics (1 == 1.0 == True).
  bool Equals(const Value& other) const;

  // True if this value is a pure data shape (no callables or library
  // handles, no cycles, nesting at most kMaxTransferDepth).
  bool IsTransferable() const;

  // Recursive copy that shares no container with this value.
  // Only valid on transferable values.
  Value DeepCopy() const;

  static const constexpr int kMaxTransferDepth = 32;

 private:
  void ReleaseContainers();

  Type type_ = Type::NONE;
  bool bool_ = false;
  int64_t int_ = 0;
  double float_ = 0;
  std::string str_;
  std::shared_ptr<List> list_;
  std::shared_ptr<Dict> dict_;
  std::shared_ptr<const Range> range_;
  std::shared_ptr<const Callable> callable_;
  std::shared_ptr<const Module> module_;
};

// Insertion-ordered mapping with scalar keys (None, bool, int, float, str).
class Dict {
 public:
  using Item = std::pair<Value, Value>;

  // Returns nullptr if the key is missing. Throws a TypeError for unhashable
  // keys.
  Value* Find(const Value& key);
  const Value* Find(const Value& key) const;
  void Set(const Value& key, Value value);
  // Removes the key, returns false if it was missing.
  bool Erase(const Value& key);

  const std::vector<Item>& Items() const { return items_; }
  size_t Size() const { return items_.size(); }

 private:
  friend class Value;
  static std::string HashKey(const Value& key);
  std::vector<Item> items_;
  std::unordered_map<std::string, size_t> index_;
};

// Formats a double the way Python's repr() does.
std::string FormatFloat(double d);

}  // namespace script

#endif
