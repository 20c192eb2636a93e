#pragma once
#include <optional>

#include "valyxo/environment.hpp"
#include "valyxo/error.hpp"
#include "valyxo/options.hpp"
#include "valyxo/parser.hpp"
#include "valyxo/value.hpp"


namespace vx {


struct EvalOut {
  Value val;
  std::optional<Error> err;
};

// Tree-walking evaluation of a parsed expression. Reads variables from env,
// never writes to it.
EvalOut evaluate(const ExprPtr& e, const Environment& env, const Options& opts = {});

// Operator implementations, shared with tests.
EvalOut binary_op(TokKind op, const Value& l, const Value& r, int line, const Options& opts = {});
EvalOut unary_op(TokKind op, const Value& v, int line);


} // namespace vx
