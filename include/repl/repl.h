#ifndef CELLFORGE_REPL_REPL_H_
#define CELLFORGE_REPL_REPL_H_

#include <iostream>
#include <string>

#include "runtime/context.h"
#include "runtime/worksheet.h"

namespace cellforge::repl {

class Repl {
 public:
  /// Starts with an empty worksheet and options read from the environment.
  Repl();

  /// Starts the interactive loop until EOF or "exit".
  void Run();

  /// Processes one command; returns true when the loop should terminate. Output goes to
  /// std::cout.
  bool ProcessLine(const std::string& line);

  /// Formula results so far that were error values.
  int error_count() const { return error_count_; }

 private:
  void EvaluateAndPrint(const std::string& formula);
  void SetCell(const std::string& args);
  void DefineLambda(const std::string& args);
  void ListNames(const std::string& category);
  void Help(const std::string& name);

  runtime::MemoryWorksheet sheet_;
  runtime::EvaluationContext context_;
  int error_count_ = 0;
};

}  // namespace cellforge::repl

#endif  // CELLFORGE_REPL_REPL_H_
