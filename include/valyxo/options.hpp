#pragma once
#include <cstddef>


namespace vx {


// Per-runtime resource limits. Instances never share budgets.
struct Options {
  int max_iterations{10000};                // per loop execution
  long long max_total_iterations{1000000};  // all loops in one run_line / run_program
  int max_call_depth{64};
  std::size_t max_value_size{1000000};      // string length, list length, dict size
  int max_nesting{256};                     // list/dict depth, syntactic nesting


  // Defaults overridden by VALYXO_MAX_ITERATIONS, VALYXO_MAX_TOTAL_ITERATIONS,
  // VALYXO_MAX_CALL_DEPTH, VALYXO_MAX_VALUE_SIZE and VALYXO_MAX_NESTING when
  // set to positive numbers.
  static Options from_env();
};

// Parses a positive decimal number; false on anything else.
bool parse_limit(const char* s, long long& out);


} // namespace vx
