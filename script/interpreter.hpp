#ifndef SCRIPT_INTERPRETER_HPP
#define SCRIPT_INTERPRETER_HPP

#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "script/ast.hpp"
#include "script/callable.hpp"
#include "script/output.hpp"
#include "script/value.hpp"

namespace script {

using Namespace = std::unordered_map<std::string, Value>;

// Tree-walking evaluator for a parsed program. One interpreter runs one
// program against one namespace; it is not thread-safe. Faults raised by the
// program escape Run() as ScriptError, tagged with the line of the
// statement that raised them.
class Interpreter {
 public:
  static const constexpr size_t kMaxCallDepth = 200;

  Interpreter(OutputSink* out, OutputSink* err) : out_(out), err_(err) {}

  void Bind(const std::string& name, Value value) {
    globals_[name] = std::move(value);
  }
  // Returns nullptr if the global is not bound.
  const Value* Lookup(const std::string& name) const;
  const Namespace& Globals() const { return globals_; }

  void Run(const std::shared_ptr<const Program>& program);

  // Calls any callable value, builtin or user-defined.
  Value Call(const Value& fn, CallArgs args);

  OutputSink* Out() { return out_; }
  OutputSink* Err() { return err_; }

 private:
  friend class UserFunction;

  enum class ControlFlow { NEXT, BREAK, CONTINUE, RETURN };

  struct Frame {
    Namespace locals;
    Value return_value;
  };

  ControlFlow ExecBlock(const Block& block);
  ControlFlow Exec(const Stmt& stmt);
  void ExecDef(const DefStmt& stmt);

  Value Eval(const Expr& expr);
  Value EvalName(const NameExpr& expr);
  Value EvalCall(const CallExpr& expr);
  Value EvalCompare(const CompareExpr& expr);
  Value EvalAttribute(const AttributeExpr& expr);
  Value EvalListComp(const ListCompExpr& expr);

  void Assign(const Expr& target, Value value);
  void Store(const std::string& name, Value value);

  Value CallUser(const DefStmt& def, const std::vector<Value>& defaults,
                 CallArgs args);

  OutputSink* out_;
  OutputSink* err_;
  Namespace globals_;
  std::vector<Frame> frames_;
  int depth_ = 0;
  std::shared_ptr<const Program> program_;
};

}  // namespace script

#endif
