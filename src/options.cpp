#include "valyxo/options.hpp"
#include <cerrno>
#include <cstdlib>
#include <limits>


namespace vx {


bool parse_limit(const char* s, long long& out){
  if(!s || !*s) return false;
  errno = 0;
  char* end = nullptr;
  long long v = std::strtoll(s, &end, 10);
  if(errno != 0 || *end != '\0' || v <= 0) return false;
  out = v;
  return true;
}


Options Options::from_env(){
  Options o;
  long long v = 0;
  const long long int_max = std::numeric_limits<int>::max();
  if(parse_limit(std::getenv("VALYXO_MAX_ITERATIONS"), v) && v <= int_max)
    o.max_iterations = (int)v;
  if(parse_limit(std::getenv("VALYXO_MAX_TOTAL_ITERATIONS"), v))
    o.max_total_iterations = v;
  if(parse_limit(std::getenv("VALYXO_MAX_CALL_DEPTH"), v) && v <= int_max)
    o.max_call_depth = (int)v;
  if(parse_limit(std::getenv("VALYXO_MAX_VALUE_SIZE"), v))
    o.max_value_size = (std::size_t)v;
  if(parse_limit(std::getenv("VALYXO_MAX_NESTING"), v) && v <= int_max)
    o.max_nesting = (int)v;
  return o;
}


} // namespace vx
