#include "script/value.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "script/callable.hpp"
#include "script/errors.hpp"

namespace {

using script::Value;

Value Nested(int depth) {
  Value v = Value::Int(1);
  for (int i = 0; i < depth; i++) v = Value::NewList({v});
  return v;
}

// NOLINTNEXTLINE
TEST(Value, Repr) {
  EXPECT_EQ(Value::None().Repr(), "None");
  EXPECT_EQ(Value::Bool(true).Repr(), "True");
  EXPECT_EQ(Value::Int(-7).Repr(), "-7");
  EXPECT_EQ(Value::Float(1).Repr(), "1.0");
  EXPECT_EQ(Value::Float(0.1).Repr(), "0.1");
  EXPECT_EQ(Value::Float(1e20).Repr(), "1e+20");
  EXPECT_EQ(Value::Str("it's").Repr(), "\"it's\"");
  EXPECT_EQ(Value::Str("a\nb").Repr(), "'a\\nb'");
  Value dict = Value::NewDict();
  dict.AsDict().Set(Value::Str("px"), Value::NewList({Value::Float(1.5)}));
  EXPECT_EQ(dict.Repr(), "{'px': [1.5]}");
  EXPECT_EQ(Value::Str("x").ToString(), "x");
}

// NOLINTNEXTLINE
TEST(Value, CyclicRepr) {
  Value list = Value::NewList();
  list.AsList().push_back(list);
  EXPECT_EQ(list.Repr(), "[[...]]");
  list.AsList().clear();
}

// NOLINTNEXTLINE
TEST(Value, NumericEquality) {
  EXPECT_TRUE(Value::Int(1).Equals(Value::Float(1.0)));
  EXPECT_TRUE(Value::Bool(true).Equals(Value::Int(1)));
  EXPECT_FALSE(Value::Str("1").Equals(Value::Int(1)));
  EXPECT_TRUE(Value::NewList({Value::Int(2)})
                  .Equals(Value::NewList({Value::Float(2)})));
}

// NOLINTNEXTLINE
TEST(Value, Truthiness) {
  EXPECT_FALSE(Value::None().Truthy());
  EXPECT_FALSE(Value::Int(0).Truthy());
  EXPECT_FALSE(Value::Str("").Truthy());
  EXPECT_FALSE(Value::NewList().Truthy());
  EXPECT_TRUE(Value::Float(0.5).Truthy());
  EXPECT_TRUE(Value::NewList({Value::None()}).Truthy());
}

// NOLINTNEXTLINE
TEST(Value, DictKeysAreNumericAware) {
  Value dict = Value::NewDict();
  dict.AsDict().Set(Value::Int(1), Value::Str("a"));
  dict.AsDict().Set(Value::Float(1.0), Value::Str("b"));
  ASSERT_EQ(dict.AsDict().Size(), 1u);
  EXPECT_EQ(dict.AsDict().Find(Value::Bool(true))->AsStr(), "b");
  EXPECT_TRUE(dict.AsDict().Erase(Value::Int(1)));
  EXPECT_FALSE(dict.AsDict().Erase(Value::Int(1)));
  EXPECT_THROW(dict.AsDict().Set(Value::NewList(), Value()),
               script::ScriptError);
}

// NOLINTNEXTLINE
TEST(Value, DictKeepsInsertionOrder) {
  Value dict = Value::NewDict();
  dict.AsDict().Set(Value::Str("b"), Value::Int(1));
  dict.AsDict().Set(Value::Str("a"), Value::Int(2));
  dict.AsDict().Set(Value::Str("c"), Value::Int(3));
  dict.AsDict().Erase(Value::Str("a"));
  dict.AsDict().Set(Value::Str("a"), Value::Int(4));
  EXPECT_EQ(dict.Repr(), "{'b': 1, 'c': 3, 'a': 4}");
}

// NOLINTNEXTLINE
TEST(Value, Transferable) {
  EXPECT_TRUE(Value::None().IsTransferable());
  EXPECT_TRUE(Nested(Value::kMaxTransferDepth).IsTransferable());
  EXPECT_FALSE(Nested(Value::kMaxTransferDepth + 1).IsTransferable());

  auto fn = std::make_shared<script::Builtin>(
      "f", [](script::Interpreter*, script::CallArgs&) { return Value(); });
  EXPECT_FALSE(Value::Function(fn).IsTransferable());
  EXPECT_FALSE(Value::NewList({Value::Function(fn)}).IsTransferable());
  auto module = std::make_shared<script::Module>("m");
  EXPECT_FALSE(Value::Library(module).IsTransferable());

  Value cyclic = Value::NewList();
  cyclic.AsList().push_back(cyclic);
  EXPECT_FALSE(cyclic.IsTransferable());
  cyclic.AsList().clear();

  // Shared but acyclic containers are fine.
  Value shared = Value::NewList({Value::Int(1)});
  EXPECT_TRUE(Value::NewList({shared, shared}).IsTransferable());
}

// NOLINTNEXTLINE
TEST(Value, DeepCopySharesNothing) {
  Value inner = Value::NewList({Value::Int(1)});
  Value dict = Value::NewDict();
  dict.AsDict().Set(Value::Str("xs"), inner);
  Value copy = dict.DeepCopy();
  inner.AsList().push_back(Value::Int(2));
  EXPECT_EQ(copy.Repr(), "{'xs': [1]}");
  EXPECT_EQ(dict.Repr(), "{'xs': [1, 2]}");
}

// NOLINTNEXTLINE
TEST(Value, DeepNestingIsDestroyedIteratively) {
  {
    Value v = Nested(1000000);
    Value shared = v;
  }
  Value dict = Value::NewDict();
  for (int i = 0; i < 1000000; i++) {
    Value outer = Value::NewDict();
    outer.AsDict().Set(Value::Int(i), dict);
    dict = outer;
  }
  dict = Value::None();
  EXPECT_TRUE(dict.IsNone());
}

// NOLINTNEXTLINE
TEST(Value, Sets) {
  Value set = Value::NewSet();
  EXPECT_EQ(set.Repr(), "set()");
  EXPECT_FALSE(set.Truthy());
  set.SetAdd(Value::Int(2));
  set.SetAdd(Value::Str("a"));
  set.SetAdd(Value::Float(2.0));
  EXPECT_EQ(set.Repr(), "{2, 'a'}");
  EXPECT_EQ(set.TypeName(), "set");
  EXPECT_THROW(set.SetAdd(Value::NewList()), script::ScriptError);

  Value other = Value::NewSet();
  other.SetAdd(Value::Str("a"));
  other.SetAdd(Value::Bool(false));
  EXPECT_FALSE(set.Equals(other));
  other.AsSet().Erase(Value::Int(0));
  other.SetAdd(Value::Int(2));
  EXPECT_TRUE(set.Equals(other));
  EXPECT_TRUE(set.IsTransferable());
  Value copy = set.DeepCopy();
  copy.SetAdd(Value::None());
  EXPECT_EQ(set.AsSet().Size(), 2u);
}

// NOLINTNEXTLINE
TEST(Value, Ranges) {
  Value r = Value::NewRange(0, 10, 3);
  EXPECT_EQ(r.Repr(), "range(0, 10, 3)");
  EXPECT_EQ(Value::NewRange(2, 5, 1).Repr(), "range(2, 5)");
  EXPECT_EQ(r.AsRange().count, 4u);
  EXPECT_EQ(r.AsRange().At(3), 9);
  EXPECT_EQ(Value::NewRange(5, -5, -4).AsRange().count, 3u);
  EXPECT_EQ(Value::NewRange(INT64_MIN, INT64_MAX, 1).AsRange().count,
            UINT64_MAX);
  EXPECT_TRUE(r.Truthy());
  EXPECT_FALSE(Value::NewRange(3, 3, 1).Truthy());
  EXPECT_TRUE(r.Equals(Value::NewRange(0, 11, 3)));
  EXPECT_FALSE(r.Equals(Value::NewRange(0, 10, 2)));
  EXPECT_TRUE(Value::NewRange(0, 0, 1).Equals(Value::NewRange(4, 1, 1)));
  // Ranges do not leave the run.
  EXPECT_FALSE(r.IsTransferable());
}

// NOLINTNEXTLINE
TEST(Value, TypeNames) {
  EXPECT_EQ(Value::None().TypeName(), "NoneType");
  EXPECT_EQ(Value::NewDict().TypeName(), "dict");
  auto module = std::make_shared<script::Module>("math");
  EXPECT_EQ(Value::Library(module).TypeName(), "module");
  EXPECT_EQ(Value::Library(module).Repr(), "<module 'math'>");
}

}  // namespace
