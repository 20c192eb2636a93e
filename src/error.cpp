#include "valyxo/error.hpp"
#include <sstream>


namespace vx {


const char* kind_name(ErrorKind k){
  switch(k){
    case ErrorKind::SyntaxError:            return "SyntaxError";
    case ErrorKind::UndefinedVariable:      return "UndefinedVariable";
    case ErrorKind::UndefinedFunction:      return "UndefinedFunction";
    case ErrorKind::ArityMismatch:          return "ArityMismatch";
    case ErrorKind::TypeError:              return "TypeError";
    case ErrorKind::DivisionByZero:         return "DivisionByZero";
    case ErrorKind::LoopLimitExceeded:      return "LoopLimitExceeded";
    case ErrorKind::IndexError:             return "IndexError";
    case ErrorKind::RangeError:             return "RangeError";
    case ErrorKind::ConstAssignment:        return "ConstAssignment";
    case ErrorKind::RecursionLimitExceeded: return "RecursionLimitExceeded";
    case ErrorKind::ValueTooLarge:          return "ValueTooLarge";
  }
  return "Error";
}


std::string format(const Error& e){
  std::ostringstream os;
  os << "Error";
  if(e.line >= 0) os << " at " << e.line;
  os << ": " << kind_name(e.kind) << ": " << e.msg;
  if(!e.context.empty())    os << "\n  Context: " << e.context;
  if(!e.suggestion.empty()) os << "\n  Hint: " << e.suggestion;
  return os.str();
}


} // namespace vx
