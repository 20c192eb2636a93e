#include "valyxo/interpreter.hpp"
#include "valyxo/record.hpp"
#include "valyxo/runtime.hpp"
#include "valyxo/utils.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <string>

#ifdef USE_READLINE
extern "C" {
#include <readline/history.h>
#include <readline/readline.h>
extern int rl_catch_signals;
}
#endif

namespace vx {

// ---------------- SIGINT (Ctrl-C) handling ----------------
namespace {
  inline std::atomic_bool g_sigint{false};
  void on_sigint(int){ g_sigint.store(true, std::memory_order_relaxed); }
  void install_sig_handlers(){
    struct sigaction sa{}; sa.sa_handler = on_sigint; sigemptyset(&sa.sa_mask); sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    std::signal(SIGQUIT, SIG_IGN);
    std::signal(SIGPIPE, SIG_IGN);
  }
  inline bool take_interrupt(){ return g_sigint.exchange(false, std::memory_order_relaxed); }
}

// ---------------- helpers ----------------
static void flush_output(Runtime& rt){
  std::string s = rt.take_output();
  if(!s.empty()) std::cout << s << std::flush;
}

static void report(const Error& e){
  std::cerr << format(e) << "\n";
}

static void print_help(){
  std::cout <<
  "Statements:\n"
  "  set x = expr            const X = expr\n"
  "  print a, b, ...         vars\n"
  "  if [cond] then [stmt] else [stmt]\n"
  "  if [cond] then { ... } else { ... }\n"
  "  for i in 1 to 10 { ... }  for item in list { ... }\n"
  "  set [a, b] = list       set {x, y} = dict\n"
  "  while [cond] { ... }\n"
  "  func name(a, b) { ... }   name(1, 2)   return   exit\n"
  "Commands: help, reset, bye\n";
}

// ---------------- Interpreter ----------------
void Interpreter::repl(const char* prompt){
  install_sig_handlers();
#ifdef USE_READLINE
  rl_catch_signals = 0; // we handle SIGINT
#endif

  std::cout << "ValyxoScript (type help)\n";

  int lineNo = 1;
  while(true){
    std::string line;
    const char* ps = rt.pending_block() ? "... " : prompt;
#ifndef USE_READLINE
    std::cout << ps;
    if(!std::getline(std::cin, line)){
      if(take_interrupt()){
        std::cout << "\n"; rt.reset_pending();
        std::cin.clear(); std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
        continue;
      }
      break;
    }
#else
    char* in = readline(ps);
    if(!in){
      if(take_interrupt()){ std::cout << "\n"; rt.reset_pending(); continue; }
      break;
    }
    line.assign(in);
    if(!trim(line).empty()) add_history(in);
    free(in);
#endif
    if(take_interrupt()){ rt.reset_pending(); continue; }

    std::string s = trim(line);

    // Meta commands (only between statements)
    if(!rt.pending_block()){
      if(iequals(s,"help")){ print_help(); continue; }
      if(iequals(s,"bye") || iequals(s,"quit")){ break; }
      if(iequals(s,"reset")){ rt = Runtime(rt.opts); lineNo = 1; std::cout << "runtime reset\n"; continue; }
    }

    auto r = rt.run_line(line, lineNo++);
    flush_output(rt);
    if(r.err) report(*r.err);
    if(rt.exited()) break;
  }
}

// Run a file/script
int Interpreter::run_file(const std::string& path, bool json){
  std::ifstream f(path); if(!f){ std::cerr<<"No such file: "<<path<<"\n"; return 1; }
  std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());

  if(json){
    auto rec = execute(content, rt.opts);
    std::cout << to_json(rec) << "\n";
    return rec.error ? 2 : 0;
  }

  auto ro = rt.run_program(content);
  std::cout << ro.result.output << std::flush;
  if(ro.err){ report(*ro.err); return 2; }
  return 0;
}

} // namespace vx
