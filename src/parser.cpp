#include "valyxo/parser.hpp"
#include "valyxo/functions.hpp"
#include "valyxo/lexer.hpp"
#include "valyxo/utils.hpp"
#include <cerrno>
#include <cstdlib>
#include <memory>
#include <set>

namespace vx {

namespace {
  // Counts one level of nesting for the lifetime of a nested construct.
  struct NestScope {
    int& depth;
    explicit NestScope(int& d) : depth(d) { ++depth; }
    ~NestScope(){ --depth; }
  };
}

/* ------------------- basic stream utilities ------------------- */
Token Parser::pop() { return ts[i++]; }
bool  Parser::match(TokKind k) { if (!eof() && ts[i].k == k) { ++i; return true; } return false; }

const Token& Parser::peek_at(int n) const {
  int j = i + n;
  return j < (int)ts.size() ? ts[j] : ts.back();
}

bool Parser::expect(TokKind k, const char* what) {
  if (match(k)) return true;
  fail(peek().line, std::string("expected ") + what + ", found " + tok_name(peek().k));
  return false;
}

void Parser::skip_newlines() {
  while (!eof() && (peek().k == TokKind::Newline || peek().k == TokKind::Semi)) pop();
}

bool Parser::at_stmt_end() const {
  switch (peek().k) {
    case TokKind::End: case TokKind::Newline: case TokKind::Semi:
    case TokKind::RBrace: case TokKind::RBracket: return true;
    default: return false;
  }
}

std::string Parser::text_of(int line) const {
  auto it = lines.find(line);
  return it == lines.end() ? std::string() : it->second;
}

void Parser::fail(int line, std::string msg, std::string suggestion) {
  if (err) return;  // keep the first error
  err = make_error(ErrorKind::SyntaxError, line, std::move(msg), std::move(suggestion));
  err->context = text_of(line);
}

bool Parser::too_deep() {
  if (depth <= max_depth) return false;
  fail(peek().line, "nesting deeper than " + std::to_string(max_depth) + " levels",
       "split the expression or block into smaller steps");
  return true;
}

static inline bool is_cmp(TokKind k) {
  switch (k) {
    case TokKind::Eq: case TokKind::Ne: case TokKind::Lt:
    case TokKind::Le: case TokKind::Gt: case TokKind::Ge: return true;
    default: return false;
  }
}

static ExprPtr make_bin(Expr::Kind kind, TokKind op, ExprPtr l, ExprPtr r, int line) {
  auto b = std::make_shared<Expr>();
  b->kind = kind; b->op = op; b->left = std::move(l); b->right = std::move(r); b->line = line;
  return b;
}

/* ------------------- expression parsing ------------------- */
ExprPtr Parser::parseExpr() {
  auto left = parseAnd();
  while (left && !eof() && peek().k == TokKind::Or) {
    int line = pop().line;
    auto right = parseAnd();
    if (!right) return nullptr;
    left = make_bin(Expr::Or, TokKind::Or, left, right, line);
  }
  return left;
}

ExprPtr Parser::parseAnd() {
  auto left = parseNot();
  while (left && !eof() && peek().k == TokKind::And) {
    int line = pop().line;
    auto right = parseNot();
    if (!right) return nullptr;
    left = make_bin(Expr::And, TokKind::And, left, right, line);
  }
  return left;
}

ExprPtr Parser::parseNot() {
  if (!eof() && peek().k == TokKind::Not) {
    NestScope nest(depth);
    if (too_deep()) return nullptr;
    int line = pop().line;
    auto operand = parseNot();
    if (!operand) return nullptr;
    auto u = std::make_shared<Expr>();
    u->kind = Expr::Unary; u->op = TokKind::Not; u->left = operand; u->line = line;
    return u;
  }
  return parseCompare();
}

ExprPtr Parser::parseCompare() {
  auto left = parseAdd();
  if (!left) return nullptr;
  if (!eof() && is_cmp(peek().k)) {
    Token op = pop();
    auto right = parseAdd();
    if (!right) return nullptr;
    if (!eof() && is_cmp(peek().k)) {
      fail(peek().line, "comparison operators cannot be chained", "combine comparisons with 'and'");
      return nullptr;
    }
    left = make_bin(Expr::Bin, op.k, left, right, op.line);
  }
  return left;
}

ExprPtr Parser::parseAdd() {
  auto left = parseMul();
  while (left && !eof() && (peek().k == TokKind::Plus || peek().k == TokKind::Minus)) {
    Token op = pop();
    auto right = parseMul();
    if (!right) return nullptr;
    left = make_bin(Expr::Bin, op.k, left, right, op.line);
  }
  return left;
}

ExprPtr Parser::parseMul() {
  auto left = parsePower();
  while (left && !eof() && (peek().k == TokKind::Star || peek().k == TokKind::Slash ||
                            peek().k == TokKind::SlashSlash || peek().k == TokKind::Percent)) {
    Token op = pop();
    auto right = parsePower();
    if (!right) return nullptr;
    left = make_bin(Expr::Bin, op.k, left, right, op.line);
  }
  return left;
}

// right-associative; both operands are unary expressions, so -2 ** 2 == 4
ExprPtr Parser::parsePower() {
  auto base = parseUnary();
  if (!base) return nullptr;
  if (!eof() && peek().k == TokKind::StarStar) {
    NestScope nest(depth);
    if (too_deep()) return nullptr;
    int line = pop().line;
    auto exp = parsePower();
    if (!exp) return nullptr;
    return make_bin(Expr::Bin, TokKind::StarStar, base, exp, line);
  }
  return base;
}

ExprPtr Parser::parseUnary() {
  if (!eof() && (peek().k == TokKind::Minus || peek().k == TokKind::Plus)) {
    NestScope nest(depth);
    if (too_deep()) return nullptr;
    Token op = pop();
    auto operand = parseUnary();
    if (!operand) return nullptr;
    auto u = std::make_shared<Expr>();
    u->kind = Expr::Unary; u->op = op.k; u->left = operand; u->line = op.line;
    return u;
  }
  return parsePostfix();
}

ExprPtr Parser::parsePostfix() {
  auto e = parsePrimary();
  while (e && !eof() && peek().k == TokKind::LBracket) {
    NestScope nest(depth);
    if (too_deep()) return nullptr;
    int line = pop().line;
    auto idx = parseExpr();
    if (!idx || !expect(TokKind::RBracket, "']' after index")) return nullptr;
    e = make_bin(Expr::Index, TokKind::LBracket, e, idx, line);
  }
  return e;
}

ExprPtr Parser::parsePrimary() {
  const Token t = peek();
  auto lit = [&](Value v) {
    pop();
    auto n = std::make_shared<Expr>();
    n->kind = Expr::Lit; n->line = t.line; n->val = std::move(v);
    return n;
  };

  switch (t.k) {
    case TokKind::Int: {
      errno = 0;
      long long v = std::strtoll(t.text.c_str(), nullptr, 10);
      if (errno == ERANGE) { fail(t.line, "integer literal too large: " + t.text); return nullptr; }
      return lit(Value(static_cast<Int>(v)));
    }
    case TokKind::Float:   return lit(Value(std::strtod(t.text.c_str(), nullptr)));
    case TokKind::Str:     return lit(Value(t.text));
    case TokKind::True:    return lit(Value(true));
    case TokKind::False:   return lit(Value(false));
    case TokKind::NoneTok: return lit(Value());

    case TokKind::Id: {
      if (peek_at(1).k == TokKind::LParen) {
        fail(t.line, "function calls are not allowed in expressions",
             "call functions as a statement: " + t.text + "(...)");
        return nullptr;
      }
      pop();
      auto v = std::make_shared<Expr>();
      v->kind = Expr::Var; v->line = t.line; v->name = t.text;
      return v;
    }

    case TokKind::LParen: {
      NestScope nest(depth);
      if (too_deep()) return nullptr;
      pop();
      auto e = parseExpr();
      if (!e || !expect(TokKind::RParen, "')'")) return nullptr;
      return e;
    }

    case TokKind::LBracket: {
      NestScope nest(depth);
      if (too_deep()) return nullptr;
      pop();
      auto l = std::make_shared<Expr>();
      l->kind = Expr::ListLit; l->line = t.line;
      while (!match(TokKind::RBracket)) {
        auto e = parseExpr();
        if (!e) return nullptr;
        l->items.push_back(e);
        if (match(TokKind::RBracket)) break;
        if (!expect(TokKind::Comma, "',' or ']' in list")) return nullptr;
      }
      return l;
    }

    case TokKind::LBrace: {
      NestScope nest(depth);
      if (too_deep()) return nullptr;
      pop();
      auto d = std::make_shared<Expr>();
      d->kind = Expr::DictLit; d->line = t.line;
      while (!match(TokKind::RBrace)) {
        auto k = parseExpr();
        if (!k || !expect(TokKind::Colon, "':' after dict key")) return nullptr;
        auto v = parseExpr();
        if (!v) return nullptr;
        d->keys.push_back(k);
        d->items.push_back(v);
        if (match(TokKind::RBrace)) break;
        if (!expect(TokKind::Comma, "',' or '}' in dict")) return nullptr;
      }
      return d;
    }

    default:
      fail(t.line, std::string("expected an expression, found ") + tok_name(t.k));
      return nullptr;
  }
}

ExprPtr Parser::parseBracketCond() {
  if (!expect(TokKind::LBracket, "'[' before condition")) return nullptr;
  auto c = parseExpr();
  if (!c || !expect(TokKind::RBracket, "']' after condition")) return nullptr;
  return c;
}

/* ------------------- statement parsing ------------------- */
static const std::vector<std::string>& command_words() {
  static const std::vector<std::string> w = {
    "set", "const", "print", "if", "for", "while", "func", "exit", "return", "vars" };
  return w;
}

bool Parser::parseBlock(Block& out) {
  NestScope nest(depth);
  if (too_deep()) return false;
  int open = peek().line;
  if (!expect(TokKind::LBrace, "'{'")) return false;
  while (true) {
    skip_newlines();
    if (match(TokKind::RBrace)) return true;
    if (eof()) {
      fail(open, "unclosed block", "add a closing '}' for the block opened on line " + std::to_string(open));
      return false;
    }
    auto s = parseStmt();
    if (!s) return false;
    out.push_back(s);
    if (!at_stmt_end() || peek().k == TokKind::RBracket) {
      fail(peek().line, std::string("unexpected ") + tok_name(peek().k) + " after statement");
      return false;
    }
  }
}

StmtPtr Parser::parseIf() {
  NestScope nest(depth);
  if (too_deep()) return nullptr;
  const Token t = pop();  // 'if'
  auto s = std::make_shared<Stmt>();
  s->kind = Stmt::If; s->line = t.line; s->text = text_of(t.line);

  s->expr = parseBracketCond();
  if (!s->expr) return nullptr;
  if (!match(TokKind::Then)) {
    fail(peek().line, "expected 'then' after condition", "use: if [condition] then { ... }");
    return nullptr;
  }

  // then-branch: { block }, [statement] or a bare statement
  auto branch = [&](Block& out) -> bool {
    if (peek().k == TokKind::LBrace) return parseBlock(out);
    if (match(TokKind::LBracket)) {
      auto st = parseStmt();
      if (!st || !expect(TokKind::RBracket, "']' after statement")) return false;
      out.push_back(st);
      return true;
    }
    if (at_stmt_end()) { fail(peek().line, "missing statement after 'then'"); return false; }
    auto st = parseStmt();
    if (!st) return false;
    out.push_back(st);
    return true;
  };

  if (!branch(s->body)) return nullptr;

  // 'else' may follow on the same line or open the next one
  int j = i;
  while (j < (int)ts.size() && ts[j].k == TokKind::Newline) ++j;
  if (j < (int)ts.size() && ts[j].k == TokKind::Else) {
    i = j + 1;
    s->hasElse = true;
    if (peek().k == TokKind::If) {
      auto nested = parseIf();
      if (!nested) return nullptr;
      s->elseBody.push_back(nested);
    } else if (!branch(s->elseBody)) {
      return nullptr;
    }
  }
  return s;
}

StmtPtr Parser::parseStmt() {
  if (eof()) return nullptr;
  const Token t = peek();
  auto s = std::make_shared<Stmt>();
  s->line = t.line; s->text = text_of(t.line);

  switch (t.k) {
    case TokKind::Set:
    case TokKind::Const: {
      pop();
      const char* usage = t.k == TokKind::Set ? "use: set <variable> = <value>" : "use: const <NAME> = <value>";
      if (t.k == TokKind::Set && (peek().k == TokKind::LBracket || peek().k == TokKind::LBrace)) {
        s->kind = Stmt::Unpack;
        s->fromDict = pop().k == TokKind::LBrace;
        if (!parseNames(s->fromDict ? TokKind::RBrace : TokKind::RBracket, s->names)) return nullptr;
        if (!match(TokKind::Assign)) {
          fail(t.line, "expected '=' after unpacking pattern", "use: set [a, b] = list  or  set {x, y} = dict");
          return nullptr;
        }
        s->expr = parseExpr();
        return s->expr ? s : nullptr;
      }
      if (peek().k != TokKind::Id) {
        fail(t.line, std::string("expected a variable name after ") + tok_name(t.k), usage);
        return nullptr;
      }
      s->kind = t.k == TokKind::Set ? Stmt::Set : Stmt::Const;
      s->name = pop().text;
      if (!match(TokKind::Assign)) { fail(t.line, "expected '=' after '" + s->name + "'", usage); return nullptr; }
      s->expr = parseExpr();
      return s->expr ? s : nullptr;
    }

    case TokKind::Print: {
      pop();
      s->kind = Stmt::Print;
      // bare print -> empty line
      if (at_stmt_end()) return s;
      while (true) {
        auto e = parseExpr();
        if (!e) return nullptr;
        s->exprs.push_back(e);
        if (!match(TokKind::Comma)) break;
      }
      return s;
    }

    case TokKind::If:
      return parseIf();

    case TokKind::For: {
      pop();
      s->kind = Stmt::For;
      if (peek().k != TokKind::Id) { fail(t.line, "expected loop variable after 'for'", "use: for i in 1 to 10 { ... }"); return nullptr; }
      s->name = pop().text;
      if (!expect(TokKind::In, "'in' after loop variable")) return nullptr;
      s->expr = parseExpr();
      if (!s->expr) return nullptr;
      // without 'to' the loop walks a list or dict
      if (!match(TokKind::To)) {
        s->kind = Stmt::ForEach;
        if (peek().k != TokKind::LBrace) {
          fail(peek().line, "expected 'to' or '{' after loop sequence",
               "use: for i in 1 to 10 { ... }  or  for item in items { ... }");
          return nullptr;
        }
        return parseBlock(s->body) ? s : nullptr;
      }
      s->rangeEnd = parseExpr();
      if (!s->rangeEnd || !parseBlock(s->body)) return nullptr;
      return s;
    }

    case TokKind::While: {
      pop();
      s->kind = Stmt::While;
      s->expr = parseBracketCond();
      if (!s->expr || !parseBlock(s->body)) return nullptr;
      return s;
    }

    case TokKind::Func: {
      pop();
      s->kind = Stmt::FuncDef;
      if (peek().k != TokKind::Id) { fail(t.line, "expected function name after 'func'", "use: func name(a, b) { ... }"); return nullptr; }
      auto f = std::make_shared<FunctionDef>();
      f->name = pop().text; f->line = t.line;
      if (!expect(TokKind::LParen, "'(' after function name")) return nullptr;
      std::set<std::string> seen;
      while (!match(TokKind::RParen)) {
        if (peek().k != TokKind::Id) { fail(peek().line, std::string("expected parameter name, found ") + tok_name(peek().k)); return nullptr; }
        std::string p = pop().text;
        if (!seen.insert(p).second) { fail(t.line, "duplicate parameter '" + p + "' in function '" + f->name + "'"); return nullptr; }
        f->params.push_back(p);
        if (match(TokKind::RParen)) break;
        if (!expect(TokKind::Comma, "',' or ')' in parameter list")) return nullptr;
      }
      NestScope body(func_depth);
      if (!parseBlock(f->body)) return nullptr;
      s->name = f->name;
      s->func = f;
      return s;
    }

    case TokKind::Exit:   pop(); s->kind = Stmt::Exit;   return s;
    case TokKind::Return:
      if (func_depth == 0) {
        fail(t.line, "'return' outside a function", "use 'exit' to stop the script");
        return nullptr;
      }
      pop(); s->kind = Stmt::Return; return s;
    case TokKind::Vars:   pop(); s->kind = Stmt::Vars;   return s;

    case TokKind::Id: {
      if (peek_at(1).k != TokKind::LParen) {
        std::string hint;
        if (peek_at(1).k == TokKind::Assign) hint = "use: set " + t.text + " = <value>";
        else if (auto m = closest_match(t.text, command_words()); !m.empty()) hint = "did you mean '" + m + "'?";
        fail(t.line, "unknown command '" + t.text + "'", hint);
        return nullptr;
      }
      pop(); pop();
      s->kind = Stmt::Call; s->name = t.text;
      while (!match(TokKind::RParen)) {
        auto e = parseExpr();
        if (!e) return nullptr;
        s->exprs.push_back(e);
        if (match(TokKind::RParen)) break;
        if (!expect(TokKind::Comma, "',' or ')' in argument list")) return nullptr;
      }
      return s;
    }

    case TokKind::Else:
      fail(t.line, "'else' without matching 'if'", "write '} else {' on the line that closes the if-block");
      return nullptr;

    case TokKind::RBrace:
      fail(t.line, "unexpected closing brace '}'", "check that all blocks are properly opened");
      return nullptr;

    default:
      fail(t.line, std::string("unexpected ") + tok_name(t.k) + " at start of statement");
      return nullptr;
  }
}

// a, b, c  followed by the closing token
bool Parser::parseNames(TokKind close, std::vector<std::string>& out) {
  while (true) {
    if (peek().k != TokKind::Id) {
      fail(peek().line, std::string("expected a variable name in pattern, found ") + tok_name(peek().k));
      return false;
    }
    out.push_back(pop().text);
    if (match(close)) return true;
    if (!expect(TokKind::Comma, "',' between names")) return false;
  }
}

/* ------------------- toplevel ------------------- */
ParseOut Parser::parse() {
  ParseOut out;
  while (true) {
    skip_newlines();
    if (eof()) break;
    auto s = parseStmt();
    if (!s || err) break;
    out.stmts.push_back(s);
    if (!at_stmt_end() || peek().k == TokKind::RBracket || peek().k == TokKind::RBrace) {
      if (peek().k == TokKind::RBrace) fail(peek().line, "unexpected closing brace '}'", "check that all blocks are properly opened");
      else fail(peek().line, std::string("unexpected ") + tok_name(peek().k) + " after statement");
      break;
    }
  }
  if (err) { out.err = err; out.stmts.clear(); }
  return out;
}

ExprOut Parser::parse_expr_only() {
  ExprOut out;
  skip_newlines();
  auto e = parseExpr();
  if (e && !err) {
    skip_newlines();
    if (!eof()) fail(peek().line, std::string("unexpected ") + tok_name(peek().k) + " after expression");
  }
  if (err) out.err = err;
  else out.expr = e;
  return out;
}

ParseOut parse_program(const std::vector<SourceLine>& lines, const Options& opts) {
  auto lo = lex_lines(lines);
  if (lo.err) return ParseOut{ {}, lo.err };
  Parser p(std::move(lo.toks));
  p.max_depth = opts.max_nesting;
  for (const auto& sl : lines) p.lines[sl.line] = sl.text;
  return p.parse();
}

ExprOut parse_expression(const std::string& text, int line, const Options& opts) {
  Lexer lx(text, line);
  auto lo = lx.lex();
  if (lo.err) return ExprOut{ nullptr, lo.err };
  lo.toks.push_back({TokKind::End, "", line});
  Parser p(std::move(lo.toks));
  p.max_depth = opts.max_nesting;
  p.lines[line] = trim(text);
  return p.parse_expr_only();
}

} // namespace vx
