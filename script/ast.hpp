#ifndef SCRIPT_AST_HPP
#define SCRIPT_AST_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "script/value.hpp"

namespace script {

struct Expr {
  enum class Kind {
    CONSTANT,
    NAME,
    LIST,
    DICT,
    SET,
    UNARY,
    BINARY,
    BOOL_OP,
    COMPARE,
    CALL,
    ATTRIBUTE,
    SUBSCRIPT,
    SLICE,
    IF_EXP,
    LIST_COMP
  };
  Expr(Kind kind, uint32_t line) : kind(kind), line(line) {}
  virtual ~Expr() = default;
  const Kind kind;
  const uint32_t line;
};
using ExprPtr = std::unique_ptr<Expr>;

enum class UnaryOp { NEG, POS, NOT };
enum class BinaryOp { ADD, SUB, MUL, DIV, FLOOR_DIV, MOD, POW };
enum class CompareOp { LT, LE, GT, GE, EQ, NE, IN, NOT_IN, IS, IS_NOT };

struct ConstantExpr : Expr {
  ConstantExpr(uint32_t line, Value value)
      : Expr(Kind::CONSTANT, line), value(std::move(value)) {}
  Value value;
};

struct NameExpr : Expr {
  NameExpr(uint32_t line, std::string id)
      : Expr(Kind::NAME, line), id(std::move(id)) {}
  std::string id;
};

// List and tuple displays; also used as an unpacking target.
struct ListExpr : Expr {
  explicit ListExpr(uint32_t line) : Expr(Kind::LIST, line) {}
  std::vector<ExprPtr> elts;
};

struct DictExpr : Expr {
  explicit DictExpr(uint32_t line) : Expr(Kind::DICT, line) {}
  std::vector<ExprPtr> keys;
  std::vector<ExprPtr> values;
};

struct SetExpr : Expr {
  explicit SetExpr(uint32_t line) : Expr(Kind::SET, line) {}
  std::vector<ExprPtr> elts;
};

struct UnaryExpr : Expr {
  UnaryExpr(uint32_t line, UnaryOp op, ExprPtr operand)
      : Expr(Kind::UNARY, line), op(op), operand(std::move(operand)) {}
  UnaryOp op;
  ExprPtr operand;
};

struct BinaryExpr : Expr {
  BinaryExpr(uint32_t line, BinaryOp op, ExprPtr left, ExprPtr right)
      : Expr(Kind::BINARY, line),
        op(op),
        left(std::move(left)),
        right(std::move(right)) {}
  BinaryOp op;
  ExprPtr left;
  ExprPtr right;
};

struct BoolOpExpr : Expr {
  BoolOpExpr(uint32_t line, bool is_and, ExprPtr left, ExprPtr right)
      : Expr(Kind::BOOL_OP, line),
        is_and(is_and),
        left(std::move(left)),
        right(std::move(right)) {}
  bool is_and;
  ExprPtr left;
  ExprPtr right;
};

// a < b <= c is stored as first=a, ops={LT, LE}, rest={b, c}.
struct CompareExpr : Expr {
  explicit CompareExpr(uint32_t line) : Expr(Kind::COMPARE, line) {}
  ExprPtr first;
  std::vector<CompareOp> ops;
  std::vector<ExprPtr> rest;
};

struct CallExpr : Expr {
  explicit CallExpr(uint32_t line) : Expr(Kind::CALL, line) {}
  ExprPtr func;
  std::vector<ExprPtr> args;
  std::vector<std::pair<std::string, ExprPtr>> keywords;
};

struct AttributeExpr : Expr {
  AttributeExpr(uint32_t line, ExprPtr object, std::string attr)
      : Expr(Kind::ATTRIBUTE, line),
        object(std::move(object)),
        attr(std::move(attr)) {}
  ExprPtr object;
  std::string attr;
};

struct SubscriptExpr : Expr {
  SubscriptExpr(uint32_t line, ExprPtr object, ExprPtr index)
      : Expr(Kind::SUBSCRIPT, line),
        object(std::move(object)),
        index(std::move(index)) {}
  ExprPtr object;
  ExprPtr index;
};

// object[lower:upper:step]; missing bounds are null.
struct SliceExpr : Expr {
  explicit SliceExpr(uint32_t line) : Expr(Kind::SLICE, line) {}
  ExprPtr object;
  ExprPtr lower;
  ExprPtr upper;
  ExprPtr step;
};

struct IfExpr : Expr {
  explicit IfExpr(uint32_t line) : Expr(Kind::IF_EXP, line) {}
  ExprPtr test;
  ExprPtr body;
  ExprPtr orelse;
};

struct ListCompExpr : Expr {
  explicit ListCompExpr(uint32_t line) : Expr(Kind::LIST_COMP, line) {}
  ExprPtr elt;
  ExprPtr target;
  ExprPtr iter;
  std::vector<ExprPtr> conds;
};

struct Stmt {
  enum class Kind {
    EXPR,
    ASSIGN,
    AUG_ASSIGN,
    IF,
    WHILE,
    FOR,
    BREAK,
    CONTINUE,
    PASS,
    DEF,
    RETURN,
    ASSERT
  };
  Stmt(Kind kind, uint32_t line) : kind(kind), line(line) {}
  virtual ~Stmt() = default;
  const Kind kind;
  const uint32_t line;
};
using StmtPtr = std::unique_ptr<Stmt>;
using Block = std::vector<StmtPtr>;

struct ExprStmt : Stmt {
  ExprStmt(uint32_t line, ExprPtr value)
      : Stmt(Kind::EXPR, line), value(std::move(value)) {}
  ExprPtr value;
};

// t1 = t2 = value
struct AssignStmt : Stmt {
  explicit AssignStmt(uint32_t line) : Stmt(Kind::ASSIGN, line) {}
  std::vector<ExprPtr> targets;
  ExprPtr value;
};

struct AugAssignStmt : Stmt {
  AugAssignStmt(uint32_t line, ExprPtr target, BinaryOp op, ExprPtr value)
      : Stmt(Kind::AUG_ASSIGN, line),
        target(std::move(target)),
        op(op),
        value(std::move(value)) {}
  ExprPtr target;
  BinaryOp op;
  ExprPtr value;
};

// elif chains are nested IfStmts in orelse.
struct IfStmt : Stmt {
  explicit IfStmt(uint32_t line) : Stmt(Kind::IF, line) {}
  ExprPtr test;
  Block body;
  Block orelse;
};

struct WhileStmt : Stmt {
  explicit WhileStmt(uint32_t line) : Stmt(Kind::WHILE, line) {}
  ExprPtr test;
  Block body;
};

struct ForStmt : Stmt {
  explicit ForStmt(uint32_t line) : Stmt(Kind::FOR, line) {}
  ExprPtr target;
  ExprPtr iter;
  Block body;
};

struct SimpleStmt : Stmt {
  SimpleStmt(Kind kind, uint32_t line) : Stmt(kind, line) {}
};

struct DefStmt : Stmt {
  explicit DefStmt(uint32_t line) : Stmt(Kind::DEF, line) {}
  std::string name;
  std::vector<std::string> params;
  // Defaults for the last defaults.size() parameters.
  std::vector<ExprPtr> defaults;
  Block body;
};

struct ReturnStmt : Stmt {
  explicit ReturnStmt(uint32_t line) : Stmt(Kind::RETURN, line) {}
  ExprPtr value;  // may be null
};

struct AssertStmt : Stmt {
  explicit AssertStmt(uint32_t line) : Stmt(Kind::ASSERT, line) {}
  ExprPtr test;
  ExprPtr msg;  // may be null
};

struct Program {
  Block body;
};

}  // namespace script

#endif
