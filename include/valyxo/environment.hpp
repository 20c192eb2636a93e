#pragma once
#include <map>
#include <string>
#include <vector>

#include "valyxo/error.hpp"
#include "valyxo/value.hpp"


namespace vx {


struct Binding {
  Value value;
  bool is_const{false};
};

using Frame = std::map<std::string, Binding>;


// Frame 0 is the global frame and lives as long as the environment.
// Name resolution is lexical: the innermost frame, then the global frame.
// Frames of callers are never visible to callees.
struct Environment {
  Environment() : frames(1) {}

  // Binds in the innermost frame.
  Result define(const std::string& name, Value v, int line = -1);
  Result define_const(const std::string& name, Value v, int line = -1);

  // Updates the nearest visible binding, or creates one in the innermost frame.
  Result assign(const std::string& name, Value v, int line = -1);

  // nullptr when the name is not visible.
  const Value* find(const std::string& name) const;
  Result lookup(const std::string& name, int line, Value& out) const;

  void push_frame();
  bool pop_frame();  // false if only the global frame is left
  size_t depth() const { return frames.size(); }

  std::map<std::string, Value> globals() const;
  std::vector<std::string> visible_names() const;

private:
  std::vector<Frame> frames;

  Binding* find_binding(const std::string& name);
  const Binding* find_binding(const std::string& name) const;
};


// Pushes a frame for its lifetime; the pop happens on every exit path.
struct FrameGuard {
  Environment& env;
  explicit FrameGuard(Environment& e) : env(e) { env.push_frame(); }
  ~FrameGuard(){ env.pop_frame(); }
  FrameGuard(const FrameGuard&) = delete;
  FrameGuard& operator=(const FrameGuard&) = delete;
};


} // namespace vx
