#include "valyxo/lexer.hpp"
#include "valyxo/utils.hpp"
#include <cctype>
#include <unordered_map>

namespace vx {

static bool isid0(char c){ return std::isalpha((unsigned char)c) || c=='_'; }
static bool isid(char c){ return std::isalnum((unsigned char)c) || c=='_'; }

static const std::unordered_map<std::string, TokKind>& keywords(){
  static const std::unordered_map<std::string, TokKind> kw = {
    {"set", TokKind::Set},       {"print", TokKind::Print},   {"if", TokKind::If},
    {"then", TokKind::Then},     {"else", TokKind::Else},     {"for", TokKind::For},
    {"in", TokKind::In},         {"to", TokKind::To},         {"while", TokKind::While},
    {"func", TokKind::Func},     {"exit", TokKind::Exit},     {"return", TokKind::Return},
    {"vars", TokKind::Vars},     {"const", TokKind::Const},   {"and", TokKind::And},
    {"or", TokKind::Or},         {"not", TokKind::Not},
    {"true", TokKind::True},     {"True", TokKind::True},
    {"false", TokKind::False},   {"False", TokKind::False},
    {"none", TokKind::NoneTok},  {"None", TokKind::NoneTok},
  };
  return kw;
}

const char* tok_name(TokKind k){
  switch(k){
    case TokKind::End:        return "end of input";
    case TokKind::Newline:    return "end of line";
    case TokKind::Id:         return "identifier";
    case TokKind::Int:        return "integer";
    case TokKind::Float:      return "number";
    case TokKind::Str:        return "string";
    case TokKind::Plus:       return "'+'";
    case TokKind::Minus:      return "'-'";
    case TokKind::Star:       return "'*'";
    case TokKind::Slash:      return "'/'";
    case TokKind::SlashSlash: return "'//'";
    case TokKind::Percent:    return "'%'";
    case TokKind::StarStar:   return "'**'";
    case TokKind::LParen:     return "'('";
    case TokKind::RParen:     return "')'";
    case TokKind::LBracket:   return "'['";
    case TokKind::RBracket:   return "']'";
    case TokKind::LBrace:     return "'{'";
    case TokKind::RBrace:     return "'}'";
    case TokKind::Comma:      return "','";
    case TokKind::Colon:      return "':'";
    case TokKind::Semi:       return "';'";
    case TokKind::Assign:     return "'='";
    case TokKind::Eq:         return "'=='";
    case TokKind::Ne:         return "'!='";
    case TokKind::Lt:         return "'<'";
    case TokKind::Le:         return "'<='";
    case TokKind::Gt:         return "'>'";
    case TokKind::Ge:         return "'>='";
    case TokKind::Set:        return "'set'";
    case TokKind::Print:      return "'print'";
    case TokKind::If:         return "'if'";
    case TokKind::Then:       return "'then'";
    case TokKind::Else:       return "'else'";
    case TokKind::For:        return "'for'";
    case TokKind::In:         return "'in'";
    case TokKind::To:         return "'to'";
    case TokKind::While:      return "'while'";
    case TokKind::Func:       return "'func'";
    case TokKind::Exit:       return "'exit'";
    case TokKind::Return:     return "'return'";
    case TokKind::Vars:       return "'vars'";
    case TokKind::Const:      return "'const'";
    case TokKind::And:        return "'and'";
    case TokKind::Or:         return "'or'";
    case TokKind::Not:        return "'not'";
    case TokKind::True:       return "'True'";
    case TokKind::False:      return "'False'";
    case TokKind::NoneTok:    return "'None'";
  }
  return "token";
}

LexOut Lexer::lex(){
  LexOut out;
  auto push=[&](TokKind k, std::string t=""){ out.toks.push_back({k,std::move(t),line}); };
  auto fail=[&](std::string msg, std::string hint=""){
    out.err = make_error(ErrorKind::SyntaxError, line, std::move(msg), std::move(hint));
    out.err->context = trim(src);
  };
  auto at=[&](int p)->char{ return p<(int)src.size() ? src[p] : '\0'; };

  while(pos<(int)src.size()){
    char c = src[pos];

    // whitespace
    if(c=='\t' || c==' ' || c=='\r'){ ++pos; continue; }

    // '#' comment: ignore rest of line
    if(c=='#') break;

    // string
    if(c=='"' || c=='\''){
      char q = c; std::string s; ++pos;
      bool closed = false;
      while(pos<(int)src.size()){
        char d = src[pos++];
        if(d==q){ closed = true; break; }
        if(d=='\\' && pos<(int)src.size()){
          char e = src[pos++];
          switch(e){
            case 'n': s.push_back('\n'); break;
            case 't': s.push_back('\t'); break;
            case 'r': s.push_back('\r'); break;
            case '0': s.push_back('\0'); break;
            default:  s.push_back(e);    break;   // \\ \" \'
          }
          continue;
        }
        s.push_back(d);
      }
      if(!closed){ fail("unterminated string literal", std::string("close the string with ") + q); return out; }
      push(TokKind::Str, s);
      continue;
    }

    // number
    if(std::isdigit((unsigned char)c)){
      int start=pos; bool isFloat=false;
      while(std::isdigit((unsigned char)at(pos))) ++pos;
      if(at(pos)=='.' && std::isdigit((unsigned char)at(pos+1))){
        isFloat = true; ++pos;
        while(std::isdigit((unsigned char)at(pos))) ++pos;
      }
      if(at(pos)=='e' || at(pos)=='E'){
        int p = pos+1;
        if(at(p)=='+' || at(p)=='-') ++p;
        if(std::isdigit((unsigned char)at(p))){
          isFloat = true; pos = p;
          while(std::isdigit((unsigned char)at(pos))) ++pos;
        }
      }
      if(isid0(at(pos))){ fail("invalid number '" + src.substr(start, pos-start+1) + "'"); return out; }
      push(isFloat ? TokKind::Float : TokKind::Int, src.substr(start,pos-start));
      continue;
    }

    // identifier / keyword
    if(isid0(c)){
      int start=pos;
      while(pos<(int)src.size() && isid(src[pos])) ++pos;
      std::string id=src.substr(start,pos-start);
      auto it = keywords().find(id);
      push(it == keywords().end() ? TokKind::Id : it->second, id);
      continue;
    }

    // operators
    ++pos;
    switch(c){
      case '+': push(TokKind::Plus, "+"); break;
      case '-': push(TokKind::Minus, "-"); break;
      case '*':
        if(at(pos)=='*'){ ++pos; push(TokKind::StarStar, "**"); }
        else push(TokKind::Star, "*");
        break;
      case '/':
        if(at(pos)=='/'){ ++pos; push(TokKind::SlashSlash, "//"); }
        else push(TokKind::Slash, "/");
        break;
      case '%': push(TokKind::Percent, "%"); break;
      case '(': push(TokKind::LParen, "("); break;
      case ')': push(TokKind::RParen, ")"); break;
      case '[': push(TokKind::LBracket, "["); break;
      case ']': push(TokKind::RBracket, "]"); break;
      case '{': push(TokKind::LBrace, "{"); break;
      case '}': push(TokKind::RBrace, "}"); break;
      case ',': push(TokKind::Comma, ","); break;
      case ':': push(TokKind::Colon, ":"); break;
      case ';': push(TokKind::Semi, ";"); break;
      case '=':
        if(at(pos)=='='){ ++pos; push(TokKind::Eq, "=="); }
        else push(TokKind::Assign, "=");
        break;
      case '!':
        if(at(pos)=='='){ ++pos; push(TokKind::Ne, "!="); }
        else { fail("unexpected character '!'", "use 'not' for negation"); return out; }
        break;
      case '<':
        if(at(pos)=='='){ ++pos; push(TokKind::Le, "<="); }
        else push(TokKind::Lt, "<");
        break;
      case '>':
        if(at(pos)=='='){ ++pos; push(TokKind::Ge, ">="); }
        else push(TokKind::Gt, ">");
        break;
      case '.':
        fail("member access is not allowed"); return out;
      default:
        fail(std::string("unexpected character '") + c + "'"); return out;
    }
  }

  push(TokKind::Newline);
  return out;
}

LexOut lex_lines(const std::vector<SourceLine>& lines){
  LexOut all;
  int last = 0;
  for(const auto& sl : lines){
    Lexer lx(sl.text, sl.line);
    auto lo = lx.lex();
    if(lo.err){ all.err = lo.err; return all; }
    all.toks.insert(all.toks.end(), lo.toks.begin(), lo.toks.end());
    last = sl.line;
  }
  all.toks.push_back({TokKind::End, "", last});
  return all;
}

} // namespace vx
