#pragma once
#include <optional>
#include <string>
#include <vector>

#include "valyxo/error.hpp"
#include "valyxo/splitter.hpp"


namespace vx {


enum class TokKind {
  End, Newline, Id, Int, Float, Str,
  Plus, Minus, Star, Slash, SlashSlash, Percent, StarStar,
  LParen, RParen, LBracket, RBracket, LBrace, RBrace,
  Comma, Colon, Semi, Assign,
  Eq, Ne, Lt, Le, Gt, Ge,
  Set, Print, If, Then, Else, For, In, To, While, Func,
  Exit, Return, Vars, Const,
  And, Or, Not, True, False, NoneTok,
};

const char* tok_name(TokKind k);


struct Token { TokKind k; std::string text; int line; };


struct LexOut {
  std::vector<Token> toks;
  std::optional<Error> err;
};


struct Lexer {
  std::string src; int pos{0}; int line{0};
  explicit Lexer(std::string s, int line0=0): src(std::move(s)), line(line0) {}

  // Tokens for one logical line, terminated by Newline (no End token).
  LexOut lex();
};

// Lex already-split lines into one stream ending in End.
LexOut lex_lines(const std::vector<SourceLine>& lines);


} // namespace vx
