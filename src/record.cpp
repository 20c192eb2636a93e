#include "valyxo/record.hpp"
#include "valyxo/runtime.hpp"
#include "valyxo/utils.hpp"

#include <chrono>
#include <cmath>
#include <iomanip>
#include <sstream>


namespace vx {


ExecutionRecord execute(const std::string& source, const Options& opts){
  ExecutionRecord rec;
  Runtime rt(opts);

  auto t0 = std::chrono::steady_clock::now();
  auto ro = rt.run_program(source);
  auto t1 = std::chrono::steady_clock::now();

  rec.duration_ms = std::chrono::duration<double, std::milli>(t1 - t0).count();
  rec.output      = std::move(ro.result.output);
  rec.variables   = std::move(ro.result.variables);
  rec.error       = ro.err;
  rec.status      = ro.err ? "error" : "success";
  return rec;
}


std::string to_json(const Value& v){
  switch(v.type()){
    case Value::None:    return "null";
    case Value::Bool:    return v.as_bool() ? "true" : "false";
    case Value::Integer: return std::to_string(v.as_int());
    case Value::Real: {
      double d = v.as_float();
      if(!std::isfinite(d)) return "null";  // JSON has no inf/nan
      std::ostringstream oss; oss << std::setprecision(17) << d;
      std::string s = oss.str();
      // keep integral floats distinct from ints: 3.0, not 3
      if(s.find_first_of(".e") == std::string::npos) s += ".0";
      return s;
    }
    case Value::Str:     return "\"" + json_escape(v.as_str()) + "\"";
    case Value::ListT: {
      std::ostringstream oss; oss << "[";
      const List& l = v.as_list();
      for(size_t i=0;i<l.size();++i){ if(i) oss << ","; oss << to_json(l[i]); }
      oss << "]"; return oss.str();
    }
    case Value::DictT:   return to_json(v.as_dict());
  }
  return "null";
}

std::string to_json(const std::map<std::string, Value>& vars){
  std::ostringstream oss; oss << "{";
  bool first = true;
  for(const auto& kv : vars){
    if(!first) oss << ",";
    first = false;
    oss << "\"" << json_escape(kv.first) << "\":" << to_json(kv.second);
  }
  oss << "}"; return oss.str();
}

std::string to_json(const ExecutionRecord& r){
  std::ostringstream oss;
  oss << "{\"status\":\"" << json_escape(r.status) << "\"";
  oss << ",\"output\":\"" << json_escape(r.output) << "\"";
  oss << ",\"variables\":" << to_json(r.variables);
  if(r.error){
    const Error& e = *r.error;
    oss << ",\"error\":{\"kind\":\"" << kind_name(e.kind) << "\""
        << ",\"line\":" << e.line
        << ",\"message\":\"" << json_escape(e.msg) << "\"";
    if(!e.context.empty())    oss << ",\"context\":\"" << json_escape(e.context) << "\"";
    if(!e.suggestion.empty()) oss << ",\"suggestion\":\"" << json_escape(e.suggestion) << "\"";
    oss << "}";
  }
  oss << ",\"duration_ms\":" << std::fixed << std::setprecision(3) << r.duration_ms;
  oss << "}";
  return oss.str();
}


} // namespace vx
