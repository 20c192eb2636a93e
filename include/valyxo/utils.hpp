#pragma once
#include <string>
#include <vector>


namespace vx {


// Simple string helpers
std::string trim(std::string s);
bool starts_with(const std::string& s, const std::string& p);
bool iequals(const std::string& a, const std::string& b);
std::string json_escape(const std::string& in);

// Levenshtein distance, used for "did you mean" hints.
size_t edit_distance(const std::string& a, const std::string& b);
// Closest candidate within a small distance of `name`, or "" if none is close.
std::string closest_match(const std::string& name, const std::vector<std::string>& candidates);


} // namespace vx
