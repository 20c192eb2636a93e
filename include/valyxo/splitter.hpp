#pragma once
#include <string>
#include <vector>


namespace vx {


struct SourceLine { int line; std::string text; };

// Split a script into trimmed logical lines, dropping blank lines and lines
// starting with '#'. Line numbers are 1-based and refer to the source text.
std::vector<SourceLine> split(const std::string& source);


} // namespace vx
