#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "valyxo/environment.hpp"
#include "valyxo/error.hpp"
#include "valyxo/functions.hpp"
#include "valyxo/options.hpp"
#include "valyxo/parser.hpp"
#include "valyxo/splitter.hpp"
#include "valyxo/value.hpp"

namespace vx {

struct ExecutionResult {
  std::string output;                       // printed lines, each ending in '\n'
  std::map<std::string, Value> variables;   // global frame snapshot
};

struct RunOut {
  ExecutionResult result;
  std::optional<Error> err;
};

// One script execution context. Not thread-safe; separate instances share nothing.
struct Runtime {
  explicit Runtime(Options o = Options{}) : opts(o) {}

  Environment env;
  FunctionRegistry functions;
  Options opts;

  // REPL-style: feed one source line. Lines opening a block are buffered
  // until the braces balance, then the whole block runs.
  Result run_line(const std::string& line);
  Result run_line(const std::string& line, int lineNo);

  // Parse and run a whole script; stops at the first error.
  RunOut run_program(const std::string& source);

  bool pending_block() const { return !pending.empty(); }
  void reset_pending() { pending.clear(); depth = 0; }

  // Set once an `exit` statement has run; cleared by the next run call.
  bool exited() const { return exit_requested; }

  const std::vector<std::string>& output() const { return out; }
  std::string take_output();

  std::map<std::string, Value> variables() const { return env.globals(); }

private:
  enum class Flow { Next, Return, Exit };

  std::vector<std::string> out;
  std::vector<SourceLine> pending;
  int depth{0};
  int next_line{1};
  int call_depth{0};
  long long total_iterations{0};
  bool exit_requested{false};

  Result run_lines(const std::vector<SourceLine>& lines);
  Result exec(const StmtPtr& s, Flow& flow);
  Result exec_block(const Block& b, Flow& flow);
  Result eval(const ExprPtr& e, Value& v);
  Result call(const Stmt& s, Flow& flow);
  Result tick(const Stmt& s, int& count);
  void begin_run();
};

} // namespace vx
