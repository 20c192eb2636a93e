#include "valyxo/interpreter.hpp"
#include "valyxo/options.hpp"
#include <iostream>
#include <string>


static void usage(const char* argv0){
  std::cout << "usage: " << argv0 << " [--max-iterations N] [--max-call-depth N] [--json] [script]\n"
               "  with no script, starts an interactive session\n";
}


int main(int argc, char** argv){
vx::Options opts = vx::Options::from_env();
bool json = false;
std::string script;

for(int i=1;i<argc;++i){
  std::string a = argv[i];
  long long v = 0;
  if(a=="-h" || a=="--help"){ usage(argv[0]); return 0; }
  else if(a=="--json") json = true;
  else if(a=="--max-iterations" || a=="--max-call-depth"){
    if(i+1>=argc || !vx::parse_limit(argv[i+1], v) || v > 1000000000){
      std::cerr << a << ": expected a positive number\n"; return 1;
    }
    if(a=="--max-iterations") opts.max_iterations = (int)v;
    else opts.max_call_depth = (int)v;
    ++i;
  }
  else if(!a.empty() && a[0]=='-'){ std::cerr << "unknown option: " << a << "\n"; usage(argv[0]); return 1; }
  else script = a;
}

vx::Interpreter I(opts);
if(!script.empty()) return I.run_file(script, json);
I.repl();
return 0;
}
