#include "valyxo/utils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>


namespace vx {


std::string trim(std::string s){
size_t a=0,b=s.size();
while(a<b && std::isspace((unsigned char)s[a])) ++a;
while(b>a && std::isspace((unsigned char)s[b-1])) --b;
return s.substr(a,b-a);
}


bool starts_with(const std::string& s, const std::string& p){
return s.rfind(p,0)==0;
}


bool iequals(const std::string& a, const std::string& b){
if(a.size()!=b.size()) return false; for(size_t i=0;i<a.size();++i){ if(std::tolower((unsigned char)a[i])!=std::tolower((unsigned char)b[i])) return false; } return true;
}


std::string json_escape(const std::string& in){
  std::string out; out.reserve(in.size()+8);
  for(unsigned char c: in){
    switch(c){
      case '\\': out += "\\\\"; break;
      case '"' : out += "\\\""; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if(c < 0x20){ char b[8]; std::snprintf(b,sizeof(b),"\\u%04x", c); out += b; }
        else out += (char)c;
    }
  }
  return out;
}


size_t edit_distance(const std::string& a, const std::string& b){
  std::vector<size_t> prev(b.size()+1), cur(b.size()+1);
  for(size_t j=0;j<=b.size();++j) prev[j]=j;
  for(size_t i=1;i<=a.size();++i){
    cur[0]=i;
    for(size_t j=1;j<=b.size();++j){
      size_t sub = prev[j-1] + (a[i-1]==b[j-1] ? 0 : 1);
      cur[j] = std::min({ prev[j]+1, cur[j-1]+1, sub });
    }
    std::swap(prev, cur);
  }
  return prev[b.size()];
}


std::string closest_match(const std::string& name, const std::vector<std::string>& candidates){
  // at most one edit for short names, two for longer ones
  size_t limit = name.size() <= 3 ? 1 : 2;
  std::string best; size_t bestD = limit+1;
  for(const auto& c : candidates){
    if(c == name) continue;
    size_t d = edit_distance(name, c);
    if(d < bestD){ bestD = d; best = c; }
  }
  return best;
}


} // namespace vx
