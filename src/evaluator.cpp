#include "valyxo/evaluator.hpp"
#include "valyxo/utils.hpp"
#include <cmath>
#include <limits>


namespace vx {


/* ---------------- internal helpers ---------------- */

static EvalOut ok(Value v)        { return EvalOut{ std::move(v), std::nullopt }; }
static EvalOut fail(Error e)      { return EvalOut{ Value{}, std::move(e) }; }

static EvalOut type_error(const std::string& msg, int line, std::string hint = ""){
  return fail(make_error(ErrorKind::TypeError, line, msg, std::move(hint)));
}

static EvalOut div_zero(int line){
  return fail(make_error(ErrorKind::DivisionByZero, line, "division by zero", "check the divisor before dividing"));
}

static EvalOut overflow(int line){
  return fail(make_error(ErrorKind::ValueTooLarge, line, "integer overflow", "use a float operand for very large results"));
}

static bool too_large(std::size_t n, const Options& opts){ return n > opts.max_value_size; }

static EvalOut size_error(std::size_t n, int line, const Options& opts){
  return fail(make_error(ErrorKind::ValueTooLarge, line,
      "value of size " + std::to_string(n) + " exceeds the limit of " + std::to_string(opts.max_value_size)));
}

static EvalOut nest_check(Value v, int line, const Options& opts){
  if(v.nesting > opts.max_nesting)
    return fail(make_error(ErrorKind::ValueTooLarge, line,
        "value nested deeper than the limit of " + std::to_string(opts.max_nesting),
        "flatten the data instead of wrapping it repeatedly"));
  return ok(std::move(v));
}

static EvalOut repeat_error(int line, const Options& opts){
  return fail(make_error(ErrorKind::ValueTooLarge, line,
      "repeated value would exceed the size limit of " + std::to_string(opts.max_value_size)));
}

static const char* op_text(TokKind op){
  switch(op){
    case TokKind::Plus:       return "+";
    case TokKind::Minus:      return "-";
    case TokKind::Star:       return "*";
    case TokKind::Slash:      return "/";
    case TokKind::SlashSlash: return "//";
    case TokKind::Percent:    return "%";
    case TokKind::StarStar:   return "**";
    case TokKind::Eq:         return "==";
    case TokKind::Ne:         return "!=";
    case TokKind::Lt:         return "<";
    case TokKind::Le:         return "<=";
    case TokKind::Gt:         return ">";
    case TokKind::Ge:         return ">=";
    case TokKind::Not:        return "not";
    default:                  return "?";
  }
}

static EvalOut operand_error(TokKind op, const Value& l, const Value& r, int line){
  std::string msg = std::string("unsupported operand types for ") + op_text(op) + ": '" +
                    type_name(l) + "' and '" + type_name(r) + "'";
  std::string hint;
  if(op == TokKind::Plus && (l.is_str() != r.is_str())) hint = "strings can only be joined with strings";
  return type_error(msg, line, hint);
}

// x ** n for n >= 0, with overflow detection
static bool int_pow(Int base, Int exp, Int& out){
  Int result = 1;
  while(exp > 0){
    if(exp & 1){
      if(__builtin_mul_overflow(result, base, &result)) return false;
    }
    exp >>= 1;
    if(exp > 0 && __builtin_mul_overflow(base, base, &base)) return false;
  }
  out = result;
  return true;
}

static EvalOut repeat(const Value& seq, Int n, int line, const Options& opts){
  if(seq.is_str()){
    const std::string& s = seq.as_str();
    if(n <= 0 || s.empty()) return ok(Value(std::string()));
    if((std::size_t)n > opts.max_value_size / s.size()) return repeat_error(line, opts);
    std::string out; out.reserve(s.size() * (std::size_t)n);
    for(Int k=0;k<n;++k) out += s;
    return ok(Value(std::move(out)));
  }
  const List& l = seq.as_list();
  if(n <= 0 || l.empty()) return ok(Value(List{}));
  if((std::size_t)n > opts.max_value_size / l.size()) return repeat_error(line, opts);
  List out; out.reserve(l.size() * (std::size_t)n);
  for(Int k=0;k<n;++k) out.insert(out.end(), l.begin(), l.end());
  return ok(Value(std::move(out)));
}

static EvalOut compare(TokKind op, const Value& l, const Value& r, int line){
  if(op == TokKind::Eq) return ok(Value(equals(l, r)));
  if(op == TokKind::Ne) return ok(Value(!equals(l, r)));

  int c = 0;
  if(l.is_number() && r.is_number()){
    if(l.is_int() && r.is_int()) c = l.as_int() < r.as_int() ? -1 : (l.as_int() > r.as_int() ? 1 : 0);
    else {
      Float a = l.as_number(), b = r.as_number();
      if(std::isnan(a) || std::isnan(b)) return ok(Value(false));
      c = a < b ? -1 : (a > b ? 1 : 0);
    }
  } else if(l.is_str() && r.is_str()){
    int k = l.as_str().compare(r.as_str());
    c = k < 0 ? -1 : (k > 0 ? 1 : 0);
  } else {
    return type_error(std::string("'") + op_text(op) + "' not supported between '" +
                      type_name(l) + "' and '" + type_name(r) + "'", line);
  }

  switch(op){
    case TokKind::Lt: return ok(Value(c <  0));
    case TokKind::Le: return ok(Value(c <= 0));
    case TokKind::Gt: return ok(Value(c >  0));
    case TokKind::Ge: return ok(Value(c >= 0));
    default:          return operand_error(op, l, r, line);
  }
}

/* ---------------- operators ---------------- */

EvalOut unary_op(TokKind op, const Value& v, int line){
  if(op == TokKind::Not) return ok(Value(!truthy(v)));
  if(op == TokKind::Plus){
    if(v.is_number()) return ok(v);
  } else if(op == TokKind::Minus){
    if(v.is_int()){
      if(v.as_int() == std::numeric_limits<Int>::min()) return overflow(line);
      return ok(Value(-v.as_int()));
    }
    if(v.is_float()) return ok(Value(-v.as_float()));
  }
  return type_error(std::string("bad operand type for unary ") + op_text(op) + ": '" + type_name(v) + "'", line);
}

EvalOut binary_op(TokKind op, const Value& l, const Value& r, int line, const Options& opts){
  const bool ints = l.is_int() && r.is_int();
  const bool nums = l.is_number() && r.is_number();

  switch(op){
    case TokKind::Plus: {
      if(ints){
        Int out;
        if(__builtin_add_overflow(l.as_int(), r.as_int(), &out)) return overflow(line);
        return ok(Value(out));
      }
      if(nums) return ok(Value(l.as_number() + r.as_number()));
      if(l.is_str() && r.is_str()){
        std::size_t n = l.as_str().size() + r.as_str().size();
        if(too_large(n, opts)) return size_error(n, line, opts);
        return ok(Value(l.as_str() + r.as_str()));
      }
      if(l.is_list() && r.is_list()){
        std::size_t n = l.as_list().size() + r.as_list().size();
        if(too_large(n, opts)) return size_error(n, line, opts);
        List out = l.as_list();
        out.insert(out.end(), r.as_list().begin(), r.as_list().end());
        return ok(Value(std::move(out)));
      }
      return operand_error(op, l, r, line);
    }

    case TokKind::Minus: {
      if(ints){
        Int out;
        if(__builtin_sub_overflow(l.as_int(), r.as_int(), &out)) return overflow(line);
        return ok(Value(out));
      }
      if(nums) return ok(Value(l.as_number() - r.as_number()));
      return operand_error(op, l, r, line);
    }

    case TokKind::Star: {
      if(ints){
        Int out;
        if(__builtin_mul_overflow(l.as_int(), r.as_int(), &out)) return overflow(line);
        return ok(Value(out));
      }
      if(nums) return ok(Value(l.as_number() * r.as_number()));
      if((l.is_str() || l.is_list()) && r.is_int()) return repeat(l, r.as_int(), line, opts);
      if(l.is_int() && (r.is_str() || r.is_list())) return repeat(r, l.as_int(), line, opts);
      return operand_error(op, l, r, line);
    }

    case TokKind::Slash: {
      if(!nums) return operand_error(op, l, r, line);
      if(r.as_number() == 0.0) return div_zero(line);
      return ok(Value(l.as_number() / r.as_number()));
    }

    // truncates toward zero
    case TokKind::SlashSlash: {
      if(ints){
        if(r.as_int() == 0) return div_zero(line);
        if(l.as_int() == std::numeric_limits<Int>::min() && r.as_int() == -1) return overflow(line);
        return ok(Value(l.as_int() / r.as_int()));
      }
      if(!nums) return operand_error(op, l, r, line);
      if(r.as_number() == 0.0) return div_zero(line);
      return ok(Value(std::trunc(l.as_number() / r.as_number())));
    }

    // result takes the sign of the divisor
    case TokKind::Percent: {
      if(ints){
        Int a = l.as_int(), b = r.as_int();
        if(b == 0) return div_zero(line);
        if(b == -1) return ok(Value(Int{0}));
        Int m = a % b;
        if(m != 0 && ((m < 0) != (b < 0))) m += b;
        return ok(Value(m));
      }
      if(!nums) return operand_error(op, l, r, line);
      Float a = l.as_number(), b = r.as_number();
      if(b == 0.0) return div_zero(line);
      Float m = std::fmod(a, b);
      if(m != 0.0 && ((m < 0) != (b < 0))) m += b;
      return ok(Value(m));
    }

    case TokKind::StarStar: {
      if(ints && r.as_int() >= 0){
        Int out;
        if(!int_pow(l.as_int(), r.as_int(), out)) return overflow(line);
        return ok(Value(out));
      }
      if(!nums) return operand_error(op, l, r, line);
      Float a = l.as_number(), b = r.as_number();
      if(a == 0.0 && b < 0) return div_zero(line);
      if(a < 0 && std::trunc(b) != b)
        return fail(make_error(ErrorKind::RangeError, line, "negative number raised to a fractional power"));
      Float out = std::pow(a, b);
      if(std::isinf(out) && std::isfinite(a) && std::isfinite(b))
        return fail(make_error(ErrorKind::ValueTooLarge, line, "numeric result out of range"));
      return ok(Value(out));
    }

    case TokKind::Eq: case TokKind::Ne:
    case TokKind::Lt: case TokKind::Le:
    case TokKind::Gt: case TokKind::Ge:
      return compare(op, l, r, line);

    default:
      return operand_error(op, l, r, line);
  }
}

/* ---------------- indexing ---------------- */

static EvalOut index_value(const Value& c, const Value& idx, int line){
  if(c.is_dict()){
    if(!idx.is_str()) return type_error(std::string("dict keys must be strings, not '") + type_name(idx) + "'", line);
    const Dict& d = c.as_dict();
    auto it = d.find(idx.as_str());
    if(it == d.end()){
      std::vector<std::string> keys;
      for(const auto& kv : d) keys.push_back(kv.first);
      std::string near = closest_match(idx.as_str(), keys);
      return fail(make_error(ErrorKind::IndexError, line, "key " + repr(idx) + " not found",
                             near.empty() ? "" : "did you mean '" + near + "'?"));
    }
    return ok(it->second);
  }

  if(!c.is_list() && !c.is_str())
    return type_error(std::string("'") + type_name(c) + "' value is not indexable", line);
  if(!idx.is_int())
    return type_error(std::string(type_name(c)) + " indices must be integers, not '" + type_name(idx) + "'", line);

  Int size = c.is_list() ? (Int)c.as_list().size() : (Int)c.as_str().size();
  Int k = idx.as_int();
  if(k < 0) k += size;
  if(k < 0 || k >= size)
    return fail(make_error(ErrorKind::IndexError, line,
        std::string(type_name(c)) + " index " + std::to_string(idx.as_int()) + " out of range (size " + std::to_string(size) + ")"));
  if(c.is_list()) return ok(c.as_list()[(size_t)k]);
  return ok(Value(std::string(1, c.as_str()[(size_t)k])));
}

/* ---------------- tree walk ---------------- */

EvalOut evaluate(const ExprPtr& e, const Environment& env, const Options& opts){
  if(!e) return type_error("missing expression", -1);

  switch(e->kind){
    case Expr::Lit: return ok(e->val);

    case Expr::Var: {
      Value v;
      auto r = env.lookup(e->name, e->line, v);
      if(r.err) return fail(*r.err);
      return ok(std::move(v));
    }

    case Expr::Unary: {
      auto v = evaluate(e->left, env, opts);
      if(v.err) return v;
      return unary_op(e->op, v.val, e->line);
    }

    case Expr::And: {
      auto l = evaluate(e->left, env, opts);
      if(l.err) return l;
      if(!truthy(l.val)) return ok(Value(false));
      auto r = evaluate(e->right, env, opts);
      if(r.err) return r;
      return ok(Value(truthy(r.val)));
    }

    case Expr::Or: {
      auto l = evaluate(e->left, env, opts);
      if(l.err) return l;
      if(truthy(l.val)) return ok(Value(true));
      auto r = evaluate(e->right, env, opts);
      if(r.err) return r;
      return ok(Value(truthy(r.val)));
    }

    case Expr::Bin: {
      auto l = evaluate(e->left, env, opts);
      if(l.err) return l;
      auto r = evaluate(e->right, env, opts);
      if(r.err) return r;
      return binary_op(e->op, l.val, r.val, e->line, opts);
    }

    case Expr::ListLit: {
      if(too_large(e->items.size(), opts)) return size_error(e->items.size(), e->line, opts);
      List items; items.reserve(e->items.size());
      for(const auto& it : e->items){
        auto v = evaluate(it, env, opts);
        if(v.err) return v;
        items.push_back(std::move(v.val));
      }
      return nest_check(Value(std::move(items)), e->line, opts);
    }

    case Expr::DictLit: {
      if(too_large(e->items.size(), opts)) return size_error(e->items.size(), e->line, opts);
      Dict d;
      for(size_t k=0;k<e->keys.size();++k){
        auto key = evaluate(e->keys[k], env, opts);
        if(key.err) return key;
        if(!key.val.is_str())
          return type_error(std::string("dict keys must be strings, not '") + type_name(key.val) + "'", e->line);
        auto v = evaluate(e->items[k], env, opts);
        if(v.err) return v;
        d[key.val.as_str()] = std::move(v.val);  // later duplicates win
      }
      return nest_check(Value(std::move(d)), e->line, opts);
    }

    case Expr::Index: {
      auto c = evaluate(e->left, env, opts);
      if(c.err) return c;
      auto idx = evaluate(e->right, env, opts);
      if(idx.err) return idx;
      return index_value(c.val, idx.val, e->line);
    }
  }
  return type_error("unknown expression", e->line);
}


} // namespace vx
