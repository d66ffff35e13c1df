#ifndef CELLFORGE_UTIL_ERROR_H_
#define CELLFORGE_UTIL_ERROR_H_

#include <stdexcept>
#include <string>

namespace cellforge::util {

/// Syntax error raised by the lexer and parser; never escapes runtime::Evaluate.
class Error : public std::runtime_error {
 public:
  /// Creates an error with message and source location (1-based line/column).
  Error(const std::string& message, int line, int column)
      : std::runtime_error(message), line_(line), column_(column) {}

  /// Line where the error was detected.
  int line() const { return line_; }
  /// Column where the error was detected.
  int column() const { return column_; }

  /// Returns a human-readable string with location context.
  std::string formatted() const {
    return "Error at " + std::to_string(line_) + ":" + std::to_string(column_) + " - " + what();
  }

  /// Returns the formatted message followed by the source line and a caret under the column.
  std::string formatted(const std::string& source) const {
    std::string out = formatted();
    if (source.empty() || line_ != 1) {
      return out;
    }
    out += "\n  " + source + "\n  ";
    int caret = column_ > 0 ? column_ - 1 : 0;
    out.append(static_cast<size_t>(caret), ' ');
    out += "^";
    return out;
  }

 private:
  int line_;
  int column_;
};

}  // namespace cellforge::util

#endif  // CELLFORGE_UTIL_ERROR_H_
