#include "script/interpreter.hpp"

#include <algorithm>

#include "script/errors.hpp"
#include "script/methods.hpp"
#include "script/operators.hpp"

namespace script {
namespace {

// Bounds the native stack used by nested statements, expressions and calls.
const constexpr int kMaxNesting = 3000;

class NestingGuard {
 public:
  explicit NestingGuard(int* depth) : depth_(depth) {
    if (++*depth_ > kMaxNesting) {
      --*depth_;
      throw RecursionError("maximum recursion depth exceeded");
    }
  }
  ~NestingGuard() { --*depth_; }
  NestingGuard(const NestingGuard&) = delete;
  NestingGuard& operator=(const NestingGuard&) = delete;

 private:
  int* depth_;
};

void CollectNames(const Expr& target, std::vector<std::string>* names) {
  if (target.kind == Expr::Kind::NAME) {
    names->push_back(static_cast<const NameExpr&>(target).id);
  } else if (target.kind == Expr::Kind::LIST) {
    for (const auto& elt : static_cast<const ListExpr&>(target).elts) {
      CollectNames(*elt, names);
    }
  }
}

// Pushes a call frame for the lifetime of the guard.
template <typename Frames, typename Frame>
class FrameGuard {
 public:
  FrameGuard(Frames* frames, Frame frame) : frames_(frames) {
    frames_->push_back(std::move(frame));
  }
  ~FrameGuard() { frames_->pop_back(); }
  FrameGuard(const FrameGuard&) = delete;
  FrameGuard& operator=(const FrameGuard&) = delete;

 private:
  Frames* frames_;
};

}  // namespace

// A function defined by a `def` statement. Keeps the program alive so the
// body outlives the statement that created it.
class UserFunction : public Callable {
 public:
  UserFunction(std::shared_ptr<const Program> program, const DefStmt* def,
               std::vector<Value> defaults)
      : program_(std::move(program)),
        def_(def),
        defaults_(std::move(defaults)) {}

  const std::string& Name() const override { return def_->name; }
  bool IsBuiltin() const override { return false; }
  Value Call(Interpreter* interpreter, CallArgs args) const override {
    return interpreter->CallUser(*def_, defaults_, std::move(args));
  }

 private:
  std::shared_ptr<const Program> program_;
  const DefStmt* def_;
  std::vector<Value> defaults_;
};

const Value* Interpreter::Lookup(const std::string& name) const {
  auto it = globals_.find(name);
  if (it == globals_.end()) return nullptr;
  return &it->second;
}

void Interpreter::Run(const std::shared_ptr<const Program>& program) {
  program_ = program;
  ExecBlock(program->body);
}

Value Interpreter::Call(const Value& fn, CallArgs args) {
  if (!fn.IsCallable()) {
    throw TypeError("'" + fn.TypeName() + "' object is not callable");
  }
  return fn.AsCallable().Call(this, std::move(args));
}

Interpreter::ControlFlow Interpreter::ExecBlock(const Block& block) {
  for (const auto& stmt : block) {
    ControlFlow flow = Exec(*stmt);
    if (flow != ControlFlow::NEXT) return flow;
  }
  return ControlFlow::NEXT;
}

Interpreter::ControlFlow Interpreter::Exec(const Stmt& stmt) {
  NestingGuard guard(&depth_);
  try {
    switch (stmt.kind) {
      case Stmt::Kind::EXPR:
        Eval(*static_cast<const ExprStmt&>(stmt).value);
        return ControlFlow::NEXT;
      case Stmt::Kind::ASSIGN: {
        const auto& s = static_cast<const AssignStmt&>(stmt);
        Value value = Eval(*s.value);
        for (const auto& target : s.targets) Assign(*target, value);
        return ControlFlow::NEXT;
      }
      case Stmt::Kind::AUG_ASSIGN: {
        const auto& s = static_cast<const AugAssignStmt&>(stmt);
        if (s.target->kind == Expr::Kind::NAME) {
          const auto& name = static_cast<const NameExpr&>(*s.target);
          Value current = EvalName(name);
          Value rhs = Eval(*s.value);
          if (s.op == BinaryOp::ADD && current.IsList()) {
            List items = Iterate(rhs);
            current.AsList().insert(current.AsList().end(), items.begin(),
                                    items.end());
            return ControlFlow::NEXT;
          }
          Store(name.id, BinaryOperation(s.op, current, rhs));
          return ControlFlow::NEXT;
        }
        const auto& sub = static_cast<const SubscriptExpr&>(*s.target);
        Value object = Eval(*sub.object);
        Value index = Eval(*sub.index);
        Value current = GetItem(object, index);
        Value rhs = Eval(*s.value);
        SetItem(object, index, BinaryOperation(s.op, current, rhs));
        return ControlFlow::NEXT;
      }
      case Stmt::Kind::IF: {
        const auto& s = static_cast<const IfStmt&>(stmt);
        if (Eval(*s.test).Truthy()) return ExecBlock(s.body);
        return ExecBlock(s.orelse);
      }
      case Stmt::Kind::WHILE: {
        const auto& s = static_cast<const WhileStmt&>(stmt);
        while (Eval(*s.test).Truthy()) {
          ControlFlow flow = ExecBlock(s.body);
          if (flow == ControlFlow::BREAK) break;
          if (flow == ControlFlow::RETURN) return flow;
        }
        return ControlFlow::NEXT;
      }
      case Stmt::Kind::FOR: {
        const auto& s = static_cast<const ForStmt&>(stmt);
        Iterator it(Eval(*s.iter));
        Value item;
        while (it.Next(&item)) {
          Assign(*s.target, item);
          ControlFlow flow = ExecBlock(s.body);
          if (flow == ControlFlow::BREAK) break;
          if (flow == ControlFlow::RETURN) return flow;
        }
        return ControlFlow::NEXT;
      }
      case Stmt::Kind::BREAK:
        return ControlFlow::BREAK;
      case Stmt::Kind::CONTINUE:
        return ControlFlow::CONTINUE;
      case Stmt::Kind::PASS:
        return ControlFlow::NEXT;
      case Stmt::Kind::DEF:
        ExecDef(static_cast<const DefStmt&>(stmt));
        return ControlFlow::NEXT;
      case Stmt::Kind::RETURN: {
        const auto& s = static_cast<const ReturnStmt&>(stmt);
        Value value = s.value ? Eval(*s.value) : Value();
        frames_.back().return_value = std::move(value);
        return ControlFlow::RETURN;
      }
      case Stmt::Kind::ASSERT: {
        const auto& s = static_cast<const AssertStmt&>(stmt);
        if (!Eval(*s.test).Truthy()) {
          throw ScriptError("AssertionError",
                            s.msg ? Eval(*s.msg).ToString() : "");
        }
        return ControlFlow::NEXT;
      }
    }
  } catch (ScriptError& e) {
    e.SetLineIfUnset(stmt.line);
    throw;
  }
  return ControlFlow::NEXT;
}

void Interpreter::ExecDef(const DefStmt& stmt) {
  std::vector<Value> defaults;
  for (const auto& def : stmt.defaults) defaults.push_back(Eval(*def));
  Store(stmt.name, Value::Function(std::make_shared<UserFunction>(
                       program_, &stmt, std::move(defaults))));
}

Value Interpreter::Eval(const Expr& expr) {
  NestingGuard guard(&depth_);
  switch (expr.kind) {
    case Expr::Kind::CONSTANT:
      return static_cast<const ConstantExpr&>(expr).value;
    case Expr::Kind::NAME:
      return EvalName(static_cast<const NameExpr&>(expr));
    case Expr::Kind::LIST: {
      List items;
      for (const auto& elt : static_cast<const ListExpr&>(expr).elts) {
        items.push_back(Eval(*elt));
      }
      return Value::NewList(std::move(items));
    }
    case Expr::Kind::DICT: {
      const auto& e = static_cast<const DictExpr&>(expr);
      Value dict = Value::NewDict();
      for (size_t i = 0; i < e.keys.size(); i++) {
        Value key = Eval(*e.keys[i]);
        dict.AsDict().Set(key, Eval(*e.values[i]));
      }
      return dict;
    }
    case Expr::Kind::SET: {
      Value set = Value::NewSet();
      for (const auto& elt : static_cast<const SetExpr&>(expr).elts) {
        set.SetAdd(Eval(*elt));
      }
      return set;
    }
    case Expr::Kind::UNARY: {
      const auto& e = static_cast<const UnaryExpr&>(expr);
      return UnaryOperation(e.op, Eval(*e.operand));
    }
    case Expr::Kind::BINARY: {
      const auto& e = static_cast<const BinaryExpr&>(expr);
      Value left = Eval(*e.left);
      Value right = Eval(*e.right);
      return BinaryOperation(e.op, left, right);
    }
    case Expr::Kind::BOOL_OP: {
      const auto& e = static_cast<const BoolOpExpr&>(expr);
      Value left = Eval(*e.left);
      if (left.Truthy() != e.is_and) return left;
      return Eval(*e.right);
    }
    case Expr::Kind::COMPARE:
      return EvalCompare(static_cast<const CompareExpr&>(expr));
    case Expr::Kind::CALL:
      return EvalCall(static_cast<const CallExpr&>(expr));
    case Expr::Kind::ATTRIBUTE:
      return EvalAttribute(static_cast<const AttributeExpr&>(expr));
    case Expr::Kind::SUBSCRIPT: {
      const auto& e = static_cast<const SubscriptExpr&>(expr);
      Value object = Eval(*e.object);
      return GetItem(object, Eval(*e.index));
    }
    case Expr::Kind::SLICE: {
      const auto& e = static_cast<const SliceExpr&>(expr);
      Value object = Eval(*e.object);
      Value lower = e.lower ? Eval(*e.lower) : Value();
      Value upper = e.upper ? Eval(*e.upper) : Value();
      Value step = e.step ? Eval(*e.step) : Value();
      return GetSlice(object, lower, upper, step);
    }
    case Expr::Kind::IF_EXP: {
      const auto& e = static_cast<const IfExpr&>(expr);
      return Eval(*e.test).Truthy() ? Eval(*e.body) : Eval(*e.orelse);
    }
    case Expr::Kind::LIST_COMP:
      return EvalListComp(static_cast<const ListCompExpr&>(expr));
  }
  return Value();
}

Value Interpreter::EvalName(const NameExpr& expr) {
  if (!frames_.empty()) {
    auto it = frames_.back().locals.find(expr.id);
    if (it != frames_.back().locals.end()) return it->second;
  }
  auto it = globals_.find(expr.id);
  if (it == globals_.end()) {
    throw NameError("name '" + expr.id + "' is not defined");
  }
  return it->second;
}

Value Interpreter::EvalCall(const CallExpr& expr) {
  Value fn = Eval(*expr.func);
  CallArgs args;
  for (const auto& arg : expr.args) args.positional.push_back(Eval(*arg));
  for (const auto& kw : expr.keywords) {
    args.keyword.emplace_back(kw.first, Eval(*kw.second));
  }
  return Call(fn, std::move(args));
}

Value Interpreter::EvalCompare(const CompareExpr& expr) {
  Value left = Eval(*expr.first);
  for (size_t i = 0; i < expr.ops.size(); i++) {
    Value right = Eval(*expr.rest[i]);
    if (!Compare(expr.ops[i], left, right)) return Value::Bool(false);
    left = std::move(right);
  }
  return Value::Bool(true);
}

Value Interpreter::EvalAttribute(const AttributeExpr& expr) {
  Value object = Eval(*expr.object);
  if (object.IsModule()) {
    const auto& members = object.AsModule().Members();
    auto it = members.find(expr.attr);
    if (it == members.end()) {
      throw AttributeError("module '" + object.AsModule().Name() +
                           "' has no attribute '" + expr.attr + "'");
    }
    return it->second;
  }
  return BindMethod(object, expr.attr);
}

Value Interpreter::EvalListComp(const ListCompExpr& expr) {
  Iterator it(Eval(*expr.iter));
  // The loop variables are scoped to the comprehension.
  std::vector<std::string> names;
  CollectNames(*expr.target, &names);
  Namespace& scope = frames_.empty() ? globals_ : frames_.back().locals;
  std::vector<std::pair<std::string, std::unique_ptr<Value>>> saved;
  for (const auto& name : names) {
    auto it = scope.find(name);
    saved.emplace_back(name, it == scope.end()
                                 ? nullptr
                                 : std::make_unique<Value>(it->second));
  }
  auto restore = [&]() {
    Namespace& current = frames_.empty() ? globals_ : frames_.back().locals;
    for (auto& entry : saved) {
      if (entry.second) {
        current[entry.first] = *entry.second;
      } else {
        current.erase(entry.first);
      }
    }
  };
  List out;
  try {
    Value item;
    while (it.Next(&item)) {
      Assign(*expr.target, item);
      bool keep = true;
      for (const auto& cond : expr.conds) {
        if (!Eval(*cond).Truthy()) {
          keep = false;
          break;
        }
      }
      if (keep) out.push_back(Eval(*expr.elt));
    }
  } catch (ScriptError&) {
    restore();
    throw;
  }
  restore();
  return Value::NewList(std::move(out));
}

void Interpreter::Assign(const Expr& target, Value value) {
  switch (target.kind) {
    case Expr::Kind::NAME:
      Store(static_cast<const NameExpr&>(target).id, std::move(value));
      return;
    case Expr::Kind::SUBSCRIPT: {
      const auto& t = static_cast<const SubscriptExpr&>(target);
      Value object = Eval(*t.object);
      Value index = Eval(*t.index);
      SetItem(object, index, std::move(value));
      return;
    }
    case Expr::Kind::LIST: {
      const auto& t = static_cast<const ListExpr&>(target);
      List items = Iterate(value);
      if (items.size() < t.elts.size()) {
        throw ValueError("not enough values to unpack (expected " +
                         std::to_string(t.elts.size()) + ", got " +
                         std::to_string(items.size()) + ")");
      }
      if (items.size() > t.elts.size()) {
        throw ValueError("too many values to unpack (expected " +
                         std::to_string(t.elts.size()) + ")");
      }
      for (size_t i = 0; i < items.size(); i++) Assign(*t.elts[i], items[i]);
      return;
    }
    default:
      throw TypeError("cannot assign to expression");
  }
}

void Interpreter::Store(const std::string& name, Value value) {
  if (frames_.empty()) {
    globals_[name] = std::move(value);
  } else {
    frames_.back().locals[name] = std::move(value);
  }
}

Value Interpreter::CallUser(const DefStmt& def,
                            const std::vector<Value>& defaults,
                            CallArgs args) {
  if (frames_.size() >= kMaxCallDepth) {
    throw RecursionError("maximum recursion depth exceeded");
  }
  const std::vector<std::string>& params = def.params;
  if (args.positional.size() > params.size()) {
    throw TypeError(def.name + "() takes " + std::to_string(params.size()) +
                    " positional arguments but " +
                    std::to_string(args.positional.size()) + " were given");
  }
  Frame frame;
  for (size_t i = 0; i < args.positional.size(); i++) {
    frame.locals[params[i]] = std::move(args.positional[i]);
  }
  for (auto& kw : args.keyword) {
    if (std::find(params.begin(), params.end(), kw.first) == params.end()) {
      throw TypeError(def.name + "() got an unexpected keyword argument '" +
                      kw.first + "'");
    }
    if (frame.locals.count(kw.first) != 0) {
      throw TypeError(def.name + "() got multiple values for argument '" +
                      kw.first + "'");
    }
    frame.locals[kw.first] = std::move(kw.second);
  }
  size_t first_default = params.size() - defaults.size();
  for (size_t i = 0; i < params.size(); i++) {
    if (frame.locals.count(params[i]) != 0) continue;
    if (i < first_default) {
      throw TypeError(def.name + "() missing required positional argument: '" +
                      params[i] + "'");
    }
    frame.locals[params[i]] = defaults[i - first_default];
  }
  FrameGuard<std::vector<Frame>, Frame> guard(&frames_, std::move(frame));
  ExecBlock(def.body);
  return std::move(frames_.back().return_value);
}

}  // namespace script
