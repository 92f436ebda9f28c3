#include "script/parser.hpp"

#include <algorithm>
#include <cstdint>
#include <vector>

#include "script/errors.hpp"
#include "script/lexer.hpp"

namespace script {
namespace {

const constexpr int kMaxNestingDepth = 100;

const char* const kUnsupportedStatements[] = {
    "import", "from",     "class", "try",   "except", "finally", "with",
    "global", "nonlocal", "del",   "raise", "yield",  "async",   "await",
    "lambda"};

bool IsAugOp(const Token& tok, BinaryOp* op) {
  if (tok.type != Token::Type::OP) return false;
  static const std::pair<const char*, BinaryOp> kOps[] = {
      {"+=", BinaryOp::ADD},       {"-=", BinaryOp::SUB},
      {"*=", BinaryOp::MUL},       {"/=", BinaryOp::DIV},
      {"//=", BinaryOp::FLOOR_DIV}, {"%=", BinaryOp::MOD},
      {"**=", BinaryOp::POW}};
  for (const auto& entry : kOps) {
    if (tok.text == entry.first) {
      *op = entry.second;
      return true;
    }
  }
  return false;
}

class Parser {
 public:
  explicit Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

  std::shared_ptr<Program> ParseProgram() {
    auto program = std::make_shared<Program>();
    while (Cur().type != Token::Type::END) {
      ParseStatementInto(&program->body);
    }
    return program;
  }

  ExprPtr ParseStandaloneExpression() {
    ExprPtr e = ParseTest();
    while (Cur().type == Token::Type::NEWLINE) Advance();
    if (Cur().type != Token::Type::END) Fail("invalid syntax");
    return e;
  }

 private:
  class DepthGuard {
   public:
    explicit DepthGuard(Parser* parser) : parser_(*parser) {
      if (parser_.depth_ >= kMaxNestingDepth) {
        parser_.Fail("too many nested expressions or blocks");
      }
      parser_.depth_++;
    }
    ~DepthGuard() { parser_.depth_--; }
    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;

   private:
    Parser& parser_;
  };

  const Token& Cur() const { return tokens_[pos_]; }
  const Token& Ahead(size_t n) const {
    return tokens_[std::min(pos_ + n, tokens_.size() - 1)];
  }
  void Advance() {
    if (pos_ + 1 < tokens_.size()) pos_++;
  }

  bool IsOp(const char* op) const {
    return Cur().type == Token::Type::OP && Cur().text == op;
  }
  bool IsKeyword(const char* kw) const {
    return Cur().type == Token::Type::NAME && Cur().text == kw;
  }
  bool AcceptOp(const char* op) {
    if (!IsOp(op)) return false;
    Advance();
    return true;
  }
  bool AcceptKeyword(const char* kw) {
    if (!IsKeyword(kw)) return false;
    Advance();
    return true;
  }
  void ExpectOp(const char* op) {
    if (!AcceptOp(op)) Fail(std::string("expected '") + op + "'");
  }
  void ExpectKeyword(const char* kw) {
    if (!AcceptKeyword(kw)) Fail(std::string("expected '") + kw + "'");
  }
  void ExpectNewline() {
    if (Cur().type == Token::Type::END) return;
    if (Cur().type != Token::Type::NEWLINE) Fail("invalid syntax");
    Advance();
  }

  [[noreturn]] void Fail(const std::string& msg) const {
    throw SyntaxError(msg, Cur().line, Cur().column);
  }

  // True if the current token can begin an expression.
  bool StartsExpression() const {
    const Token& t = Cur();
    switch (t.type) {
      case Token::Type::INT:
      case Token::Type::FLOAT:
      case Token::Type::STRING:
        return true;
      case Token::Type::NAME:
        return !script::IsKeyword(t.text) || t.text == "True" ||
               t.text == "False" || t.text == "None" || t.text == "not";
      case Token::Type::OP:
        return t.text == "(" || t.text == "[" || t.text == "{" ||
               t.text == "-" || t.text == "+";
      default:
        return false;
    }
  }

  /*
   * Statements
   */

  void ParseStatementInto(Block* block) {
    const Token& tok = Cur();
    if (tok.type == Token::Type::NEWLINE) {
      Advance();
      return;
    }
    if (tok.type == Token::Type::INDENT) Fail("unexpected indent");
    if (tok.type == Token::Type::NAME) {
      for (const char* kw : kUnsupportedStatements) {
        if (tok.text == kw) {
          Fail(std::string("'") + kw + "' is not supported");
        }
      }
      if (tok.text == "if") {
        block->push_back(ParseIf());
        return;
      }
      if (tok.text == "while") {
        block->push_back(ParseWhile());
        return;
      }
      if (tok.text == "for") {
        block->push_back(ParseFor());
        return;
      }
      if (tok.text == "def") {
        block->push_back(ParseDef());
        return;
      }
      if (tok.text == "elif" || tok.text == "else") Fail("invalid syntax");
    }
    block->push_back(ParseSimple());
    ExpectNewline();
  }

  Block ParseBlock() {
    DepthGuard guard(this);
    ExpectOp(":");
    Block block;
    if (Cur().type != Token::Type::NEWLINE) {
      block.push_back(ParseSimple());
      ExpectNewline();
      return block;
    }
    Advance();
    if (Cur().type != Token::Type::INDENT) Fail("expected an indented block");
    Advance();
    while (Cur().type != Token::Type::DEDENT &&
           Cur().type != Token::Type::END) {
      ParseStatementInto(&block);
    }
    Advance();
    return block;
  }

  StmtPtr ParseIf() {
    auto stmt = std::make_unique<IfStmt>(Cur().line);
    Advance();  // 'if' or 'elif'
    stmt->test = ParseTest();
    stmt->body = ParseBlock();
    if (IsKeyword("elif")) {
      stmt->orelse.push_back(ParseIf());
    } else if (AcceptKeyword("else")) {
      stmt->orelse = ParseBlock();
    }
    return std::move(stmt);
  }

  StmtPtr ParseWhile() {
    auto stmt = std::make_unique<WhileStmt>(Cur().line);
    Advance();
    stmt->test = ParseTest();
    loop_depth_++;
    stmt->body = ParseBlock();
    loop_depth_--;
    if (IsKeyword("else")) Fail("'while ... else' is not supported");
    return std::move(stmt);
  }

  StmtPtr ParseFor() {
    auto stmt = std::make_unique<ForStmt>(Cur().line);
    Advance();
    stmt->target = ParseTargetList();
    ExpectKeyword("in");
    stmt->iter = ParseExprList();
    loop_depth_++;
    stmt->body = ParseBlock();
    loop_depth_--;
    if (IsKeyword("else")) Fail("'for ... else' is not supported");
    return std::move(stmt);
  }

  StmtPtr ParseDef() {
    auto stmt = std::make_unique<DefStmt>(Cur().line);
    Advance();
    if (Cur().type != Token::Type::NAME || script::IsKeyword(Cur().text)) {
      Fail("expected a function name");
    }
    stmt->name = Cur().text;
    Advance();
    ExpectOp("(");
    while (!IsOp(")")) {
      if (Cur().type != Token::Type::NAME || script::IsKeyword(Cur().text)) {
        Fail("expected a parameter name");
      }
      const std::string& param = Cur().text;
      if (std::find(stmt->params.begin(), stmt->params.end(), param) !=
          stmt->params.end()) {
        Fail("duplicate argument '" + param + "' in function definition");
      }
      stmt->params.push_back(param);
      Advance();
      if (AcceptOp("=")) {
        stmt->defaults.push_back(ParseTest());
      } else if (!stmt->defaults.empty()) {
        Fail("non-default argument follows default argument");
      }
      if (!AcceptOp(",")) break;
    }
    ExpectOp(")");
    int saved_loop_depth = loop_depth_;
    loop_depth_ = 0;
    function_depth_++;
    stmt->body = ParseBlock();
    function_depth_--;
    loop_depth_ = saved_loop_depth;
    return std::move(stmt);
  }

  StmtPtr ParseSimple() {
    uint32_t line = Cur().line;
    if (AcceptKeyword("pass")) {
      return std::make_unique<SimpleStmt>(Stmt::Kind::PASS, line);
    }
    if (IsKeyword("break") || IsKeyword("continue")) {
      bool is_break = Cur().text == "break";
      if (loop_depth_ == 0) Fail("'" + Cur().text + "' outside loop");
      Advance();
      return std::make_unique<SimpleStmt>(
          is_break ? Stmt::Kind::BREAK : Stmt::Kind::CONTINUE, line);
    }
    if (IsKeyword("return")) {
      if (function_depth_ == 0) Fail("'return' outside function");
      Advance();
      auto stmt = std::make_unique<ReturnStmt>(line);
      if (Cur().type != Token::Type::NEWLINE &&
          Cur().type != Token::Type::END) {
        stmt->value = ParseExprList();
      }
      return std::move(stmt);
    }
    if (AcceptKeyword("assert")) {
      auto stmt = std::make_unique<AssertStmt>(line);
      stmt->test = ParseTest();
      if (AcceptOp(",")) stmt->msg = ParseTest();
      return std::move(stmt);
    }
    ExprPtr expr = ParseExprList();
    BinaryOp op;
    if (IsAugOp(Cur(), &op)) {
      if (expr->kind != Expr::Kind::NAME &&
          expr->kind != Expr::Kind::SUBSCRIPT) {
        Fail("illegal expression for augmented assignment");
      }
      Advance();
      return std::make_unique<AugAssignStmt>(line, std::move(expr), op,
                                             ParseExprList());
    }
    if (IsOp("=")) {
      auto stmt = std::make_unique<AssignStmt>(line);
      while (AcceptOp("=")) {
        ValidateTarget(*expr);
        stmt->targets.push_back(std::move(expr));
        expr = ParseExprList();
      }
      stmt->value = std::move(expr);
      return std::move(stmt);
    }
    return std::make_unique<ExprStmt>(line, std::move(expr));
  }

  void ValidateTarget(const Expr& e) const {
    switch (e.kind) {
      case Expr::Kind::NAME:
      case Expr::Kind::SUBSCRIPT:
        return;
      case Expr::Kind::LIST:
        for (const auto& elt : static_cast<const ListExpr&>(e).elts) {
          ValidateTarget(*elt);
        }
        return;
      case Expr::Kind::CONSTANT:
        throw SyntaxError("cannot assign to literal", e.line, 0);
      case Expr::Kind::ATTRIBUTE:
        throw SyntaxError("cannot assign to attribute", e.line, 0);
      case Expr::Kind::SLICE:
        throw SyntaxError("slice assignment is not supported", e.line, 0);
      default:
        throw SyntaxError("cannot assign to expression", e.line, 0);
    }
  }

  // Targets of for loops and comprehensions: a, b[i], (c, d)
  ExprPtr ParseTargetList() {
    uint32_t line = Cur().line;
    ExprPtr first = ParseArith();
    if (!IsOp(",")) {
      ValidateTarget(*first);
      return first;
    }
    auto list = std::make_unique<ListExpr>(line);
    list->elts.push_back(std::move(first));
    while (AcceptOp(",")) {
      if (IsKeyword("in")) break;
      list->elts.push_back(ParseArith());
    }
    ValidateTarget(*list);
    return std::move(list);
  }

  /*
   * Expressions
   */

  // test (',' test)* [','] -- more than one element makes a tuple.
  ExprPtr ParseExprList() {
    uint32_t line = Cur().line;
    ExprPtr first = ParseTest();
    if (!IsOp(",")) return first;
    auto list = std::make_unique<ListExpr>(line);
    list->elts.push_back(std::move(first));
    while (AcceptOp(",")) {
      if (!StartsExpression()) break;
      list->elts.push_back(ParseTest());
    }
    return std::move(list);
  }

  ExprPtr ParseTest() {
    DepthGuard guard(this);
    uint32_t line = Cur().line;
    ExprPtr body = ParseOrTest();
    if (!AcceptKeyword("if")) return body;
    auto expr = std::make_unique<IfExpr>(line);
    expr->body = std::move(body);
    expr->test = ParseOrTest();
    ExpectKeyword("else");
    expr->orelse = ParseTest();
    return std::move(expr);
  }

  ExprPtr ParseOrTest() {
    ExprPtr left = ParseAndTest();
    while (IsKeyword("or")) {
      uint32_t line = Cur().line;
      Advance();
      left = std::make_unique<BoolOpExpr>(line, false, std::move(left),
                                          ParseAndTest());
    }
    return left;
  }

  ExprPtr ParseAndTest() {
    ExprPtr left = ParseNotTest();
    while (IsKeyword("and")) {
      uint32_t line = Cur().line;
      Advance();
      left = std::make_unique<BoolOpExpr>(line, true, std::move(left),
                                          ParseNotTest());
    }
    return left;
  }

  ExprPtr ParseNotTest() {
    if (IsKeyword("not")) {
      DepthGuard guard(this);
      uint32_t line = Cur().line;
      Advance();
      return std::make_unique<UnaryExpr>(line, UnaryOp::NOT, ParseNotTest());
    }
    return ParseComparison();
  }

  bool AcceptCompareOp(CompareOp* op) {
    static const std::pair<const char*, CompareOp> kOps[] = {
        {"<", CompareOp::LT},  {"<=", CompareOp::LE}, {">", CompareOp::GT},
        {">=", CompareOp::GE}, {"==", CompareOp::EQ}, {"!=", CompareOp::NE}};
    if (Cur().type == Token::Type::OP) {
      for (const auto& entry : kOps) {
        if (Cur().text == entry.first) {
          *op = entry.second;
          Advance();
          return true;
        }
      }
      return false;
    }
    if (IsKeyword("in")) {
      *op = CompareOp::IN;
      Advance();
      return true;
    }
    if (IsKeyword("not") && Ahead(1).type == Token::Type::NAME &&
        Ahead(1).text == "in") {
      *op = CompareOp::NOT_IN;
      Advance();
      Advance();
      return true;
    }
    if (AcceptKeyword("is")) {
      *op = AcceptKeyword("not") ? CompareOp::IS_NOT : CompareOp::IS;
      return true;
    }
    return false;
  }

  ExprPtr ParseComparison() {
    uint32_t line = Cur().line;
    ExprPtr first = ParseArith();
    CompareOp op;
    if (!AcceptCompareOp(&op)) return first;
    auto cmp = std::make_unique<CompareExpr>(line);
    cmp->first = std::move(first);
    do {
      cmp->ops.push_back(op);
      cmp->rest.push_back(ParseArith());
    } while (AcceptCompareOp(&op));
    return std::move(cmp);
  }

  ExprPtr ParseArith() {
    ExprPtr left = ParseTerm();
    while (IsOp("+") || IsOp("-")) {
      uint32_t line = Cur().line;
      BinaryOp op = Cur().text == "+" ? BinaryOp::ADD : BinaryOp::SUB;
      Advance();
      left = std::make_unique<BinaryExpr>(line, op, std::move(left),
                                          ParseTerm());
    }
    return left;
  }

  ExprPtr ParseTerm() {
    ExprPtr left = ParseFactor();
    while (true) {
      BinaryOp op;
      if (IsOp("*")) {
        op = BinaryOp::MUL;
      } else if (IsOp("/")) {
        op = BinaryOp::DIV;
      } else if (IsOp("//")) {
        op = BinaryOp::FLOOR_DIV;
      } else if (IsOp("%")) {
        op = BinaryOp::MOD;
      } else {
        return left;
      }
      uint32_t line = Cur().line;
      Advance();
      left = std::make_unique<BinaryExpr>(line, op, std::move(left),
                                          ParseFactor());
    }
  }

  ExprPtr ParseFactor() {
    if (IsOp("-") || IsOp("+")) {
      DepthGuard guard(this);
      uint32_t line = Cur().line;
      UnaryOp op = Cur().text == "-" ? UnaryOp::NEG : UnaryOp::POS;
      Advance();
      return std::make_unique<UnaryExpr>(line, op, ParseFactor());
    }
    return ParsePower();
  }

  ExprPtr ParsePower() {
    ExprPtr base = ParsePostfix();
    if (!IsOp("**")) return base;
    DepthGuard guard(this);
    uint32_t line = Cur().line;
    Advance();
    return std::make_unique<BinaryExpr>(line, BinaryOp::POW, std::move(base),
                                        ParseFactor());
  }

  ExprPtr ParsePostfix() {
    ExprPtr e = ParseAtom();
    while (true) {
      uint32_t line = Cur().line;
      if (AcceptOp("(")) {
        e = ParseCall(std::move(e), line);
      } else if (AcceptOp("[")) {
        e = ParseSubscript(std::move(e), line);
      } else if (AcceptOp(".")) {
        if (Cur().type != Token::Type::NAME) Fail("expected an attribute name");
        std::string attr = Cur().text;
        Advance();
        e = std::make_unique<AttributeExpr>(line, std::move(e), std::move(attr));
      } else {
        return e;
      }
    }
  }

  ExprPtr ParseCall(ExprPtr func, uint32_t line) {
    DepthGuard guard(this);
    auto call = std::make_unique<CallExpr>(line);
    call->func = std::move(func);
    while (!IsOp(")")) {
      if (Cur().type == Token::Type::NAME && Ahead(1).type == Token::Type::OP &&
          Ahead(1).text == "=") {
        std::string name = Cur().text;
        for (const auto& kw : call->keywords) {
          if (kw.first == name) Fail("keyword argument repeated: " + name);
        }
        Advance();
        Advance();
        call->keywords.emplace_back(std::move(name), ParseTest());
      } else {
        if (!call->keywords.empty()) {
          Fail("positional argument follows keyword argument");
        }
        uint32_t arg_line = Cur().line;
        ExprPtr arg = ParseTest();
        if (IsKeyword("for")) {
          if (!call->args.empty()) {
            Fail("generator expression must be parenthesized");
          }
          arg = ParseComprehension(std::move(arg), arg_line);
        }
        call->args.push_back(std::move(arg));
      }
      if (!AcceptOp(",")) break;
    }
    ExpectOp(")");
    return std::move(call);
  }

  ExprPtr ParseSubscript(ExprPtr object, uint32_t line) {
    DepthGuard guard(this);
    ExprPtr lower;
    if (!IsOp(":")) {
      lower = ParseTest();
      if (AcceptOp("]")) {
        return std::make_unique<SubscriptExpr>(line, std::move(object),
                                               std::move(lower));
      }
      if (IsOp(",")) Fail("multi-dimensional subscripts are not supported");
    }
    auto slice = std::make_unique<SliceExpr>(line);
    slice->object = std::move(object);
    slice->lower = std::move(lower);
    ExpectOp(":");
    if (!IsOp("]") && !IsOp(":")) slice->upper = ParseTest();
    if (AcceptOp(":")) {
      if (!IsOp("]")) slice->step = ParseTest();
    }
    ExpectOp("]");
    return std::move(slice);
  }

  // Called after the element expression, with the current token on 'for'.
  ExprPtr ParseComprehension(ExprPtr elt, uint32_t line) {
    auto comp = std::make_unique<ListCompExpr>(line);
    comp->elt = std::move(elt);
    ExpectKeyword("for");
    // Targets stop before 'in', and the iterable and filters are or_tests so
    // that 'if' starts a filter rather than a conditional expression.
    comp->target = ParseTargetList();
    ExpectKeyword("in");
    comp->iter = ParseOrTest();
    while (AcceptKeyword("if")) comp->conds.push_back(ParseOrTest());
    if (IsKeyword("for")) Fail("nested comprehensions are not supported");
    return std::move(comp);
  }

  ExprPtr ParseAtom() {
    const Token& tok = Cur();
    uint32_t line = tok.line;
    switch (tok.type) {
      case Token::Type::INT: {
        Value v = Value::Int(tok.int_value);
        Advance();
        return std::make_unique<ConstantExpr>(line, std::move(v));
      }
      case Token::Type::FLOAT: {
        Value v = Value::Float(tok.float_value);
        Advance();
        return std::make_unique<ConstantExpr>(line, std::move(v));
      }
      case Token::Type::STRING: {
        std::string s;
        while (Cur().type == Token::Type::STRING) {
          s += Cur().text;
          Advance();
        }
        return std::make_unique<ConstantExpr>(line, Value::Str(std::move(s)));
      }
      case Token::Type::NAME: {
        std::string name = tok.text;
        if (name == "True" || name == "False") {
          Advance();
          return std::make_unique<ConstantExpr>(line,
                                                Value::Bool(name == "True"));
        }
        if (name == "None") {
          Advance();
          return std::make_unique<ConstantExpr>(line, Value::None());
        }
        if (script::IsKeyword(name)) {
          if (name == "lambda") Fail("'lambda' is not supported");
          Fail("invalid syntax");
        }
        Advance();
        return std::make_unique<NameExpr>(line, std::move(name));
      }
      case Token::Type::OP:
        if (tok.text == "(") return ParseParen();
        if (tok.text == "[") return ParseListDisplay();
        if (tok.text == "{") return ParseDictDisplay();
        Fail("invalid syntax");
      default:
        Fail("invalid syntax");
    }
  }

  ExprPtr ParseParen() {
    DepthGuard guard(this);
    uint32_t line = Cur().line;
    Advance();
    if (AcceptOp(")")) return std::make_unique<ListExpr>(line);
    ExprPtr first = ParseTest();
    ExprPtr result;
    if (IsKeyword("for")) {
      result = ParseComprehension(std::move(first), line);
    } else if (IsOp(",")) {
      auto list = std::make_unique<ListExpr>(line);
      list->elts.push_back(std::move(first));
      while (AcceptOp(",")) {
        if (IsOp(")")) break;
        list->elts.push_back(ParseTest());
      }
      result = std::move(list);
    } else {
      result = std::move(first);
    }
    ExpectOp(")");
    return result;
  }

  ExprPtr ParseListDisplay() {
    DepthGuard guard(this);
    uint32_t line = Cur().line;
    Advance();
    auto list = std::make_unique<ListExpr>(line);
    if (AcceptOp("]")) return std::move(list);
    ExprPtr first = ParseTest();
    ExprPtr result;
    if (IsKeyword("for")) {
      result = ParseComprehension(std::move(first), line);
    } else {
      list->elts.push_back(std::move(first));
      while (AcceptOp(",")) {
        if (IsOp("]")) break;
        list->elts.push_back(ParseTest());
      }
      result = std::move(list);
    }
    ExpectOp("]");
    return result;
  }

  ExprPtr ParseDictDisplay() {
    DepthGuard guard(this);
    uint32_t line = Cur().line;
    Advance();
    auto dict = std::make_unique<DictExpr>(line);
    if (AcceptOp("}")) return std::move(dict);
    ExprPtr first = ParseTest();
    if (IsKeyword("for")) Fail("set comprehensions are not supported");
    if (!IsOp(":")) return ParseSetDisplay(std::move(first), line);
    dict->keys.push_back(std::move(first));
    while (true) {
      ExpectOp(":");
      dict->values.push_back(ParseTest());
      if (IsKeyword("for")) Fail("dict comprehensions are not supported");
      if (!AcceptOp(",") || IsOp("}")) break;
      dict->keys.push_back(ParseTest());
    }
    ExpectOp("}");
    return std::move(dict);
  }

  // {a, b, ...} once the first element has been read.
  ExprPtr ParseSetDisplay(ExprPtr first, uint32_t line) {
    auto set = std::make_unique<SetExpr>(line);
    set->elts.push_back(std::move(first));
    while (AcceptOp(",")) {
      if (IsOp("}")) break;
      set->elts.push_back(ParseTest());
    }
    ExpectOp("}");
    return std::move(set);
  }

  std::vector<Token> tokens_;
  size_t pos_ = 0;
  int depth_ = 0;
  int loop_depth_ = 0;
  int function_depth_ = 0;
};

Value EvalLiteral(const Expr& e) {
  switch (e.kind) {
    case Expr::Kind::CONSTANT:
      return static_cast<const ConstantExpr&>(e).value;
    case Expr::Kind::LIST: {
      List items;
      for (const auto& elt : static_cast<const ListExpr&>(e).elts) {
        items.push_back(EvalLiteral(*elt));
      }
      return Value::NewList(std::move(items));
    }
    case Expr::Kind::DICT: {
      const auto& d = static_cast<const DictExpr&>(e);
      Value dict = Value::NewDict();
      for (size_t i = 0; i < d.keys.size(); i++) {
        Value key = EvalLiteral(*d.keys[i]);
        if (key.IsList() || key.IsDict() || key.IsSet()) {
          throw SyntaxError("dict keys must be scalars", e.line, 0);
        }
        dict.AsDict().Set(key, EvalLiteral(*d.values[i]));
      }
      return dict;
    }
    case Expr::Kind::SET: {
      Value set = Value::NewSet();
      for (const auto& elt : static_cast<const SetExpr&>(e).elts) {
        Value element = EvalLiteral(*elt);
        if (element.IsList() || element.IsDict() || element.IsSet()) {
          throw SyntaxError("set elements must be scalars", e.line, 0);
        }
        set.SetAdd(element);
      }
      return set;
    }
    case Expr::Kind::UNARY: {
      const auto& u = static_cast<const UnaryExpr&>(e);
      Value v = EvalLiteral(*u.operand);
      if (u.op == UnaryOp::NOT || !v.IsNumber() || v.IsBool()) break;
      if (u.op == UnaryOp::POS) return v;
      if (v.IsFloat()) return Value::Float(-v.AsFloat());
      if (v.AsInt() == INT64_MIN) break;
      return Value::Int(-v.AsInt());
    }
    default:
      break;
  }
  throw SyntaxError("not a literal value", e.line, 0);
}

}  // namespace

std::shared_ptr<const Program> Parse(const std::string& source) {
  return Parser(Tokenize(source)).ParseProgram();
}

Value ParseLiteral(const std::string& text) {
  ExprPtr expr = Parser(Tokenize(text)).ParseStandaloneExpression();
  return EvalLiteral(*expr);
}

}  // namespace script
