#include "valyxo/functions.hpp"


namespace vx {


void FunctionRegistry::define(std::shared_ptr<const FunctionDef> f){
  if(!f) return;
  fns[f->name] = std::move(f);
}

const FunctionDef* FunctionRegistry::find(const std::string& name) const {
  auto it = fns.find(name);
  return it == fns.end() ? nullptr : it->second.get();
}

std::shared_ptr<const FunctionDef> FunctionRegistry::get(const std::string& name) const {
  auto it = fns.find(name);
  return it == fns.end() ? nullptr : it->second;
}

std::vector<std::string> FunctionRegistry::names() const {
  std::vector<std::string> out;
  out.reserve(fns.size());
  for(const auto& kv : fns) out.push_back(kv.first);
  return out;
}


} // namespace vx
