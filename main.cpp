// Entry point for the cellforge REPL or batch runner.
#include <fstream>
#include <iostream>
#include <string>

#include "repl/repl.h"

int main(int argc, char** argv) {
  // No args -> REPL; arg[1] -> run each line of the file as a REPL command.
  if (argc > 1) {
    std::ifstream in(argv[1]);
    if (!in) {
      std::cerr << "Could not open file: " << argv[1] << "\n";
      return 1;
    }
    cellforge::repl::Repl repl;
    std::string line;
    while (std::getline(in, line)) {
      if (repl.ProcessLine(line)) {
        break;
      }
    }
    return repl.error_count() == 0 ? 0 : 1;
  }
  cellforge::repl::Repl repl;
  repl.Run();
  return 0;
}
