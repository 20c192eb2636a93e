#pragma once
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "valyxo/parser.hpp"


namespace vx {


struct FunctionDef {
  std::string name;
  std::vector<std::string> params;
  Block body;
  int line{0};
};


// One definition per name; defining an existing name replaces it.
struct FunctionRegistry {
  void define(std::shared_ptr<const FunctionDef> f);
  const FunctionDef* find(const std::string& name) const;
  // Shared handle; stays valid if the name is redefined while the body runs.
  std::shared_ptr<const FunctionDef> get(const std::string& name) const;
  bool has(const std::string& name) const { return find(name) != nullptr; }
  std::vector<std::string> names() const;
  size_t size() const { return fns.size(); }
  void clear() { fns.clear(); }

private:
  std::map<std::string, std::shared_ptr<const FunctionDef>> fns;
};


} // namespace vx
