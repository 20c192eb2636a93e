#include "valyxo/runtime.hpp"
#include "valyxo/evaluator.hpp"
#include "valyxo/lexer.hpp"
#include "valyxo/parser.hpp"
#include "valyxo/splitter.hpp"
#include "valyxo/utils.hpp"

#include <cstddef>
#include <string>
#include <utility>

namespace vx {

namespace {
  // Counts nested calls for the lifetime of one call.
  struct CallDepthScope {
    int& depth;
    explicit CallDepthScope(int& d) : depth(d) { ++depth; }
    ~CallDepthScope(){ --depth; }
  };
}

/* ---------------- Runtime: helpers ---------------- */

void Runtime::begin_run(){
  total_iterations = 0;
  exit_requested = false;
}

Result Runtime::eval(const ExprPtr& e, Value& v){
  auto r = evaluate(e, env, opts);
  if(r.err) return Result{ r.err };
  v = std::move(r.val);
  return {};
}

Result Runtime::tick(const Stmt& s, int& count){
  if(++count > opts.max_iterations){
    return Result{ make_error(ErrorKind::LoopLimitExceeded, s.line,
        "loop iteration limit exceeded - possible infinite loop",
        "maximum iterations per loop: " + std::to_string(opts.max_iterations)) };
  }
  if(++total_iterations > opts.max_total_iterations){
    return Result{ make_error(ErrorKind::LoopLimitExceeded, s.line,
        "total iteration budget exceeded",
        "maximum iterations per run: " + std::to_string(opts.max_total_iterations)) };
  }
  return {};
}

std::string Runtime::take_output(){
  std::string s;
  for(const auto& l : out){ s += l; s += '\n'; }
  out.clear();
  return s;
}

/* ---------------- Runtime: stmt exec ---------------- */

Result Runtime::exec_block(const Block& b, Flow& flow){
  for(const auto& st : b){
    auto r = exec(st, flow);
    if(r.err) return r;
    if(flow != Flow::Next) break;
  }
  return {};
}

Result Runtime::exec(const StmtPtr& sp, Flow& flow){
  const Stmt& s = *sp;
  Result r;

  switch(s.kind){
    case Stmt::Set: {
      Value v;
      r = eval(s.expr, v);
      if(!r.err) r = env.assign(s.name, std::move(v), s.line);
    } break;

    // missing items and keys bind None
    case Stmt::Unpack: {
      Value v;
      r = eval(s.expr, v);
      if(r.err) break;
      if(s.fromDict ? !v.is_dict() : !v.is_list()){
        r.err = make_error(ErrorKind::TypeError, s.line,
            std::string("cannot unpack '") + type_name(v) + "' with a " + (s.fromDict ? "dict" : "list") + " pattern");
        break;
      }
      for(size_t k=0;k<s.names.size() && !r.err;++k){
        Value item;
        if(s.fromDict){
          auto it = v.as_dict().find(s.names[k]);
          if(it != v.as_dict().end()) item = it->second;
        } else if(k < v.as_list().size()){
          item = v.as_list()[k];
        }
        r = env.assign(s.names[k], std::move(item), s.line);
      }
    } break;

    case Stmt::Const: {
      Value v;
      r = eval(s.expr, v);
      if(!r.err) r = env.define_const(s.name, std::move(v), s.line);
    } break;

    case Stmt::Print: {
      std::string line;
      for(size_t k=0;k<s.exprs.size();++k){
        Value v;
        r = eval(s.exprs[k], v);
        if(r.err) break;
        if(k) line += ' ';
        line += to_string(v);
      }
      if(!r.err) out.push_back(std::move(line));
    } break;

    case Stmt::If: {
      Value c;
      r = eval(s.expr, c);
      if(r.err) break;
      if(truthy(c))       r = exec_block(s.body, flow);
      else if(s.hasElse)  r = exec_block(s.elseBody, flow);
    } break;

    // inclusive of both bounds: for i in 1 to 5 visits 1..5
    case Stmt::For: {
      Value a, b;
      r = eval(s.expr, a);
      if(!r.err) r = eval(s.rangeEnd, b);
      if(r.err) break;
      if(!a.is_int() || !b.is_int()){
        r.err = make_error(ErrorKind::TypeError, s.line,
            std::string("loop bounds must be integers, got '") + type_name(a) + "' and '" + type_name(b) + "'");
        break;
      }
      Int lo = a.as_int(), hi = b.as_int();
      if(lo > hi){
        r.err = make_error(ErrorKind::RangeError, s.line, "invalid loop range",
            "loop start (" + std::to_string(lo) + ") cannot be greater than end (" + std::to_string(hi) + ")");
        break;
      }
      int count = 0;
      for(Int i = lo; ; ++i){
        r = tick(s, count);
        if(r.err) break;
        r = env.define(s.name, Value(i), s.line);
        if(r.err) break;
        r = exec_block(s.body, flow);
        if(r.err || flow != Flow::Next || i == hi) break;
      }
    } break;

    // lists yield their items, dicts yield [key, value] pairs in key order
    case Stmt::ForEach: {
      Value seq;
      r = eval(s.expr, seq);
      if(r.err) break;
      if(!seq.is_list() && !seq.is_dict()){
        r.err = make_error(ErrorKind::TypeError, s.line,
            std::string("cannot loop over a value of type '") + type_name(seq) + "'",
            "use: for i in 1 to n { ... } for a counted loop");
        break;
      }
      List items;
      if(seq.is_list()) items = seq.as_list();
      else for(const auto& kv : seq.as_dict()) items.push_back(Value(List{ Value(kv.first), kv.second }));

      int count = 0;
      for(const auto& item : items){
        r = tick(s, count);
        if(r.err) break;
        r = env.define(s.name, item, s.line);
        if(r.err) break;
        r = exec_block(s.body, flow);
        if(r.err || flow != Flow::Next) break;
      }
    } break;

    case Stmt::While: {
      int count = 0;
      while(true){
        Value c;
        r = eval(s.expr, c);
        if(r.err || !truthy(c)) break;
        r = tick(s, count);
        if(r.err) break;
        r = exec_block(s.body, flow);
        if(r.err || flow != Flow::Next) break;
      }
    } break;

    // last definition wins
    case Stmt::FuncDef: {
      functions.define(s.func);
    } break;

    case Stmt::Call: {
      r = call(s, flow);
    } break;

    case Stmt::Exit: {
      flow = Flow::Exit;
      exit_requested = true;
    } break;

    // the parser only accepts return inside a function body
    case Stmt::Return: {
      flow = Flow::Return;
    } break;

    case Stmt::Vars: {
      for(const auto& kv : env.globals()) out.push_back(kv.first + " = " + to_string(kv.second));
    } break;
  }

  if(r.err){
    if(r.err->line < 0) r.err->line = s.line;
    if(r.err->context.empty()) r.err->context = s.text;
  }
  return r;
}

Result Runtime::call(const Stmt& s, Flow& flow){
  auto f = functions.get(s.name);
  if(!f){
    std::string near = closest_match(s.name, functions.names());
    return Result{ make_error(ErrorKind::UndefinedFunction, s.line, "undefined function '" + s.name + "'",
        near.empty() ? "define it first: func " + s.name + "(...) { ... }" : "did you mean '" + near + "'?") };
  }
  if(s.exprs.size() != f->params.size()){
    return Result{ make_error(ErrorKind::ArityMismatch, s.line,
        "function '" + s.name + "' expects " + std::to_string(f->params.size()) +
        " argument(s), got " + std::to_string(s.exprs.size())) };
  }
  if(call_depth >= opts.max_call_depth){
    return Result{ make_error(ErrorKind::RecursionLimitExceeded, s.line,
        "maximum call depth of " + std::to_string(opts.max_call_depth) + " exceeded",
        "check for unbounded recursion in '" + s.name + "'") };
  }

  // arguments are evaluated in the caller's scope
  std::vector<Value> args; args.reserve(s.exprs.size());
  for(const auto& a : s.exprs){
    Value v;
    auto r = eval(a, v);
    if(r.err) return r;
    args.push_back(std::move(v));
  }

  FrameGuard frame(env);
  CallDepthScope depthScope(call_depth);
  for(size_t k=0;k<args.size();++k){
    auto r = env.define(f->params[k], std::move(args[k]), s.line);
    if(r.err) return r;
  }

  Flow inner = Flow::Next;
  auto r = exec_block(f->body, inner);
  if(inner == Flow::Exit) flow = Flow::Exit;
  return r;
}

/* ---------------- Runtime: single-line / program exec ---------------- */

Result Runtime::run_lines(const std::vector<SourceLine>& lines){
  auto po = parse_program(lines, opts);
  if(po.err) return Result{ po.err };
  Flow flow = Flow::Next;
  return exec_block(po.stmts, flow);
}

Result Runtime::run_line(const std::string& line){
  return run_line(line, next_line);
}

Result Runtime::run_line(const std::string& line, int lineNo){
  begin_run();
  next_line = lineNo + 1;

  std::string t = trim(line);
  if(t.empty() || t[0] == '#') return {};

  Lexer lx(t, lineNo);
  auto lo = lx.lex();
  if(lo.err){ reset_pending(); return Result{ lo.err }; }
  for(const auto& tok : lo.toks){
    if(tok.k == TokKind::LBrace) ++depth;
    else if(tok.k == TokKind::RBrace) --depth;
  }

  pending.push_back({lineNo, t});
  if(depth > 0) return {};

  std::vector<SourceLine> chunk;
  chunk.swap(pending);
  depth = 0;
  return run_lines(chunk);
}

RunOut Runtime::run_program(const std::string& source){
  begin_run();
  size_t start = out.size();

  RunOut ro;
  auto r = run_lines(split(source));
  ro.err = r.err;

  for(size_t k=start;k<out.size();++k){ ro.result.output += out[k]; ro.result.output += '\n'; }
  // handed to the caller; only lines from earlier run_line calls stay buffered
  out.erase(out.begin() + (std::ptrdiff_t)start, out.end());
  ro.result.variables = env.globals();
  return ro;
}

} // namespace vx
