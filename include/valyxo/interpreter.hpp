#pragma once
#include <string>
#include "valyxo/options.hpp"
#include "valyxo/runtime.hpp"


namespace vx {


struct Interpreter {
Runtime rt;
explicit Interpreter(Options o = Options{}) : rt(o) {}
void repl(char const* prompt="vx> ");
int run_file(const std::string& path, bool json=false);
};


} // namespace vx
