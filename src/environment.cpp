#include "valyxo/environment.hpp"
#include "valyxo/utils.hpp"
#include <set>


namespace vx {


static Error const_error(const std::string& name, int line){
  return make_error(ErrorKind::ConstAssignment, line,
                    "cannot reassign constant '" + name + "'",
                    "declare a new name with: set <name> = value");
}


Binding* Environment::find_binding(const std::string& name){
  auto it = frames.back().find(name);
  if(it != frames.back().end()) return &it->second;
  if(frames.size() > 1){
    auto g = frames.front().find(name);
    if(g != frames.front().end()) return &g->second;
  }
  return nullptr;
}

const Binding* Environment::find_binding(const std::string& name) const {
  return const_cast<Environment*>(this)->find_binding(name);
}


Result Environment::define(const std::string& name, Value v, int line){
  Frame& f = frames.back();
  auto it = f.find(name);
  if(it != f.end() && it->second.is_const) return Result{ const_error(name, line) };
  f[name] = Binding{ std::move(v), false };
  return {};
}

Result Environment::define_const(const std::string& name, Value v, int line){
  Frame& f = frames.back();
  auto it = f.find(name);
  if(it != f.end() && it->second.is_const) return Result{ const_error(name, line) };
  f[name] = Binding{ std::move(v), true };
  return {};
}

Result Environment::assign(const std::string& name, Value v, int line){
  if(Binding* b = find_binding(name)){
    if(b->is_const) return Result{ const_error(name, line) };
    b->value = std::move(v);
    return {};
  }
  frames.back()[name] = Binding{ std::move(v), false };
  return {};
}


const Value* Environment::find(const std::string& name) const {
  const Binding* b = find_binding(name);
  return b ? &b->value : nullptr;
}

Result Environment::lookup(const std::string& name, int line, Value& out) const {
  if(const Value* v = find(name)){ out = *v; return {}; }

  std::string hint;
  std::string near = closest_match(name, visible_names());
  if(!near.empty()) hint = "did you mean '" + near + "'?";
  else              hint = "set it first: set " + name + " = value";
  return Result{ make_error(ErrorKind::UndefinedVariable, line, "undefined variable '" + name + "'", hint) };
}


void Environment::push_frame(){
  frames.emplace_back();
}

bool Environment::pop_frame(){
  if(frames.size() <= 1) return false;
  frames.pop_back();
  return true;
}


std::map<std::string, Value> Environment::globals() const {
  std::map<std::string, Value> out;
  for(const auto& kv : frames.front()) out.emplace(kv.first, kv.second.value);
  return out;
}

std::vector<std::string> Environment::visible_names() const {
  std::set<std::string> names;
  for(const auto& kv : frames.back()) names.insert(kv.first);
  for(const auto& kv : frames.front()) names.insert(kv.first);
  return std::vector<std::string>(names.begin(), names.end());
}


} // namespace vx
