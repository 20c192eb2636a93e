#include "valyxo/splitter.hpp"
#include "valyxo/utils.hpp"


namespace vx {


std::vector<SourceLine> split(const std::string& source){
  std::vector<SourceLine> out;

  size_t start = 0;
  // Strip UTF-8 BOM if present
  if(starts_with(source, "\xEF\xBB\xBF")) start = 3;

  int lineNo = 1;
  while(start <= source.size()){
    size_t nl = source.find('\n', start);
    std::string raw = source.substr(start, nl == std::string::npos ? std::string::npos : nl - start);
    std::string t = trim(raw);   // also drops the '\r' of CRLF endings
    if(!t.empty() && t[0] != '#') out.push_back({lineNo, t});
    if(nl == std::string::npos) break;
    start = nl + 1;
    ++lineNo;
  }
  return out;
}


} // namespace vx
