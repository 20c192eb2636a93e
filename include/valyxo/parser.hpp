#pragma once
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <optional>

#include "valyxo/value.hpp"
#include "valyxo/error.hpp"
#include "valyxo/lexer.hpp"
#include "valyxo/options.hpp"

namespace vx {

struct Stmt;
struct Expr;
struct FunctionDef;

using StmtPtr = std::shared_ptr<Stmt>;
using ExprPtr = std::shared_ptr<Expr>;
using Block   = std::vector<StmtPtr>;

// Only these node kinds exist; nothing here can name a host function,
// a member, or a string to be executed.
struct Expr {
  enum Kind { Lit, Var, Unary, Bin, And, Or, ListLit, DictLit, Index } kind;
  int line{0};

  Value val;                   // Lit
  std::string name;            // Var

  TokKind op{TokKind::End};    // Unary (Minus, Plus, Not) / Bin
  ExprPtr left, right;         // Unary uses left; Index: left[right]

  std::vector<ExprPtr> items;  // ListLit elements, DictLit values
  std::vector<ExprPtr> keys;   // DictLit keys
};

struct Stmt {
  enum Kind {
    Set, Const, Print, If, For, ForEach, While, FuncDef, Call, Exit, Return, Vars, Unpack
  } kind{};
  int line{0};
  std::string text;            // source text of the header line, for diagnostics

  // SET / CONST target, FOR / FOREACH variable, CALL name
  std::string name;
  ExprPtr expr;                // SET / CONST / UNPACK value, IF / WHILE condition, FOR start, FOREACH sequence
  ExprPtr rangeEnd;            // FOR

  std::vector<std::string> names;  // UNPACK targets
  bool fromDict{false};            // UNPACK: set {a, b} = dict

  std::vector<ExprPtr> exprs;  // PRINT items, CALL arguments

  Block body;                  // IF then-block, loop body
  Block elseBody;              // IF
  bool hasElse{false};

  std::shared_ptr<const FunctionDef> func;  // FUNCDEF
};

struct ParseOut {
  Block stmts;
  std::optional<Error> err;
};

struct ExprOut {
  ExprPtr expr;
  std::optional<Error> err;
};

struct Parser {
  std::vector<Token> ts;
  int i{0};
  std::map<int, std::string> lines;  // source text by line number, for context
  int max_depth{Options{}.max_nesting};

  explicit Parser(std::vector<Token> toks) : ts(std::move(toks)) {}
  ParseOut parse();
  ExprOut parse_expr_only();

private:
  std::optional<Error> err;
  int depth{0};       // open parentheses, brackets, blocks and unary chains
  int func_depth{0};  // enclosing function bodies

  bool eof() const { return i >= (int)ts.size() || ts[i].k == TokKind::End; }
  const Token& peek() const { return ts[i]; }
  const Token& peek_at(int n) const;
  Token pop();
  bool match(TokKind k);
  bool expect(TokKind k, const char* what);
  void skip_newlines();
  bool at_stmt_end() const;
  void fail(int line, std::string msg, std::string suggestion = "");
  std::string text_of(int line) const;
  bool too_deep();
  bool parseNames(TokKind close, std::vector<std::string>& out);

  ExprPtr parseExpr();
  ExprPtr parseAnd();
  ExprPtr parseNot();
  ExprPtr parseCompare();
  ExprPtr parseAdd();
  ExprPtr parseMul();
  ExprPtr parsePower();
  ExprPtr parseUnary();
  ExprPtr parsePostfix();
  ExprPtr parsePrimary();
  ExprPtr parseBracketCond();

  StmtPtr parseStmt();
  StmtPtr parseSimpleStmt();
  StmtPtr parseIf();
  bool parseBlock(Block& out);
};

// Parse a whole program (already split into lines).
ParseOut parse_program(const std::vector<SourceLine>& lines, const Options& opts = Options{});
// Parse a single expression, e.g. for tools and tests.
ExprOut parse_expression(const std::string& text, int line = 1, const Options& opts = Options{});

} // namespace vx
