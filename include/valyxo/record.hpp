#pragma once
#include <map>
#include <optional>
#include <string>

#include "valyxo/error.hpp"
#include "valyxo/options.hpp"
#include "valyxo/value.hpp"


namespace vx {


// What a host stores for one script execution.
struct ExecutionRecord {
  std::string status;                      // "success" or "error"
  std::string output;
  std::map<std::string, Value> variables;
  std::optional<Error> error;
  double duration_ms{0.0};
};

// Runs `source` on a fresh runtime and times it.
ExecutionRecord execute(const std::string& source, const Options& opts = Options{});

std::string to_json(const Value& v);
std::string to_json(const std::map<std::string, Value>& vars);
std::string to_json(const ExecutionRecord& r);


} // namespace vx
