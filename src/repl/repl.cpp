#include "repl/repl.h"

#include <iostream>
#include <string>
#include <vector>

#include "builtin/registry.h"
#include "runtime/address.h"
#include "runtime/coerce.h"
#include "runtime/options.h"
#include "runtime/runner.h"
#include "util/string.h"

namespace cellforge::repl {

namespace {

// Cell content typed after `set A1`: a formula, a quoted string, TRUE/FALSE, a number, or bare
// text.
runtime::Value ParseLiteral(const std::string& text) {
  if (text.size() >= 2 && text.front() == '"' && text.back() == '"') {
    return runtime::Value::Text(text.substr(1, text.size() - 2));
  }
  if (util::EqualsIgnoreCase(text, "TRUE")) return runtime::Value::Bool(true);
  if (util::EqualsIgnoreCase(text, "FALSE")) return runtime::Value::Bool(false);
  if (auto number = runtime::ParseNumberText(text)) return runtime::Value::Number(*number);
  return runtime::Value::Text(text);
}

}  // namespace

Repl::Repl() {
  context_.worksheet = &sheet_;
  context_.options = runtime::LoadEngineOptions();
}

void Repl::Run() {
  std::string line;
  while (true) {
    std::cout << "cellforge> " << std::flush;
    if (!std::getline(std::cin, line)) {
      std::cout << "\n";
      break;
    }
    if (ProcessLine(line)) {
      break;
    }
  }
}

bool Repl::ProcessLine(const std::string& line) {
  std::string trimmed = util::Trim(line);
  if (trimmed.empty() || trimmed[0] == '#') {
    return false;
  }
  if (trimmed == "exit") {
    return true;
  }
  if (trimmed[0] == '=') {
    EvaluateAndPrint(trimmed);
    return false;
  }
  auto [command, rest] = util::SplitHead(trimmed);
  command = util::ToLower(command);
  if (command == "set") {
    SetCell(rest);
  } else if (command == "define") {
    DefineLambda(rest);
  } else if (command == "names") {
    ListNames(rest);
  } else if (command == "help") {
    Help(rest);
  } else {
    std::cout << "Unknown command '" << command
              << "'. Commands: =formula, set <cell> <value>, define <name> =LAMBDA(...), "
                 "names [category], help <function>, exit\n";
  }
  return false;
}

void Repl::EvaluateAndPrint(const std::string& formula) {
  runtime::Value result = runtime::Evaluate(formula, context_);
  if (result.IsError()) {
    ++error_count_;
  }
  std::cout << result.ToString() << "\n";
}

void Repl::SetCell(const std::string& args) {
  auto [cell, content] = util::SplitHead(args);
  auto address = runtime::ParseA1(cell);
  if (!address) {
    std::cout << "Error: invalid cell address '" << cell << "'\n";
    return;
  }
  runtime::Value value;
  if (!content.empty() && content[0] == '=') {
    context_.current_cell = *address;
    value = runtime::Evaluate(content, context_);
  } else {
    value = ParseLiteral(content);
  }
  sheet_.SetCellValue(*address, value);
  std::cout << runtime::FormatA1(*address) << " = " << value.ToString() << "\n";
}

void Repl::DefineLambda(const std::string& args) {
  auto [name, formula] = util::SplitHead(args);
  util::Status status = runtime::DefineNamedLambda(&context_, name, formula);
  if (!status.ok()) {
    std::cout << "Error: " << status.message << "\n";
    return;
  }
  std::cout << "defined " << util::ToUpper(name) << "\n";
}

void Repl::ListNames(const std::string& category) {
  const builtin::FunctionRegistry& registry = builtin::DefaultRegistry();
  std::vector<std::string> names;
  if (category.empty()) {
    names = registry.AllNames();
  } else {
    auto parsed = builtin::ParseCategory(category);
    if (!parsed) {
      std::cout << "Error: unknown category '" << category << "'\n";
      return;
    }
    names = registry.NamesInCategory(*parsed);
  }
  for (size_t i = 0; i < names.size(); ++i) {
    std::cout << names[i] << (i + 1 == names.size() || (i + 1) % 8 == 0 ? "\n" : " ");
  }
}

void Repl::Help(const std::string& name) {
  const builtin::FunctionSpec* spec = builtin::DefaultRegistry().Lookup(name);
  if (spec == nullptr) {
    std::cout << "Error: unknown function '" << name << "'\n";
    return;
  }
  std::cout << spec->name << " [" << builtin::CategoryName(spec->category) << "]\n"
            << "  " << spec->syntax << "\n"
            << "  " << spec->description << "\n";
  if (spec->is_volatile) {
    std::cout << "  volatile\n";
  }
}

}  // namespace cellforge::repl
