#include "valyxo/value.hpp"
#include <cmath>
#include <iomanip>
#include <ostream>
#include <sstream>


namespace vx {


Value::Value(List l){
  int d = 0;
  for(const auto& x : l) if(x.nesting > d) d = x.nesting;
  nesting = d + 1;
  data = std::make_shared<const List>(std::move(l));
}

Value::Value(Dict m){
  int d = 0;
  for(const auto& kv : m) if(kv.second.nesting > d) d = kv.second.nesting;
  nesting = d + 1;
  data = std::make_shared<const Dict>(std::move(m));
}


const char* type_name(const Value& v){
  switch(v.type()){
    case Value::None:    return "None";
    case Value::Bool:    return "bool";
    case Value::Integer: return "int";
    case Value::Real:    return "float";
    case Value::Str:     return "string";
    case Value::ListT:   return "list";
    case Value::DictT:   return "dict";
  }
  return "?";
}


static std::string float_string(Float d){
  if(std::isnan(d)) return "nan";
  if(std::isinf(d)) return d < 0 ? "-inf" : "inf";
  std::ostringstream oss; oss<<std::setprecision(15)<<d;
  std::string s = oss.str();
  // keep floats recognisable: 6.0 rather than 6
  if(s.find_first_of(".en") == std::string::npos) s += ".0";
  return s;
}


static std::string quote(const std::string& s){
  std::string out = "\"";
  for(char c : s){
    switch(c){
      case '"':  out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\t': out += "\\t"; break;
      default:   out += c;
    }
  }
  return out + "\"";
}


std::string to_string(const Value& v){
  switch(v.type()){
    case Value::None:    return "None";
    case Value::Bool:    return v.as_bool() ? "True" : "False";
    case Value::Integer: return std::to_string(v.as_int());
    case Value::Real:    return float_string(v.as_float());
    case Value::Str:     return v.as_str();
    case Value::ListT: {
      std::string s = "[";
      bool first = true;
      for(const auto& x : v.as_list()){
        if(!first) s += ", ";
        first = false;
        s += repr(x);
      }
      return s + "]";
    }
    case Value::DictT: {
      std::string s = "{";
      bool first = true;
      for(const auto& kv : v.as_dict()){
        if(!first) s += ", ";
        first = false;
        s += quote(kv.first) + ": " + repr(kv.second);
      }
      return s + "}";
    }
  }
  return "";
}


std::string repr(const Value& v){
  return v.is_str() ? quote(v.as_str()) : to_string(v);
}


bool truthy(const Value& v){
  switch(v.type()){
    case Value::None:    return false;
    case Value::Bool:    return v.as_bool();
    case Value::Integer: return v.as_int() != 0;
    case Value::Real:    return v.as_float() != 0.0;
    case Value::Str:     return !v.as_str().empty();
    case Value::ListT:   return !v.as_list().empty();
    case Value::DictT:   return !v.as_dict().empty();
  }
  return false;
}


bool equals(const Value& a, const Value& b){
  if(a.is_number() && b.is_number()){
    if(a.is_int() && b.is_int()) return a.as_int() == b.as_int();
    return a.as_number() == b.as_number();
  }
  if(a.type() != b.type()) return false;
  switch(a.type()){
    case Value::None:  return true;
    case Value::Bool:  return a.as_bool() == b.as_bool();
    case Value::Str:   return a.as_str() == b.as_str();
    case Value::ListT: {
      const List& x = a.as_list(); const List& y = b.as_list();
      if(x.size() != y.size()) return false;
      for(size_t i=0;i<x.size();++i) if(!equals(x[i], y[i])) return false;
      return true;
    }
    case Value::DictT: {
      const Dict& x = a.as_dict(); const Dict& y = b.as_dict();
      if(x.size() != y.size()) return false;
      auto it = y.begin();
      for(const auto& kv : x){
        if(kv.first != it->first || !equals(kv.second, it->second)) return false;
        ++it;
      }
      return true;
    }
    default: return false;
  }
}


std::ostream& operator<<(std::ostream& os, const Value& v){
  return os << repr(v);
}


} // namespace vx
