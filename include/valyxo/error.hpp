#pragma once
#include <optional>
#include <string>


namespace vx {


enum class ErrorKind {
  SyntaxError,
  UndefinedVariable,
  UndefinedFunction,
  ArityMismatch,
  TypeError,
  DivisionByZero,
  LoopLimitExceeded,
  IndexError,
  RangeError,
  ConstAssignment,
  RecursionLimitExceeded,
  ValueTooLarge,
};

const char* kind_name(ErrorKind k);


struct Error {
  ErrorKind kind{ErrorKind::SyntaxError};
  int line{-1};
  std::string msg;
  std::string context;     // offending source text, if known
  std::string suggestion;  // optional hint
};

// "Error at 3: TypeError: ..." plus optional context / hint lines.
std::string format(const Error& e);


struct Result {
  std::optional<Error> err;
};

inline Error make_error(ErrorKind k, int line, std::string msg, std::string suggestion = ""){
  Error e; e.kind = k; e.line = line; e.msg = std::move(msg); e.suggestion = std::move(suggestion);
  return e;
}


} // namespace vx
