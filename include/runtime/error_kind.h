#ifndef CELLFORGE_RUNTIME_ERROR_KIND_H_
#define CELLFORGE_RUNTIME_ERROR_KIND_H_

#include <optional>
#include <string_view>

namespace cellforge::runtime {

/// Spreadsheet error codes carried as values.
enum class ErrorKind {
  kNull,
  kDivByZero,
  kValue,
  kReference,
  kName,
  kNumber,
  kNotAvailable,
};

/// The display token, e.g. "#DIV/0!".
const char* ErrorKindToken(ErrorKind kind);

/// Parses a display token (case-insensitive); nullopt when the text is not an error token.
std::optional<ErrorKind> ParseErrorToken(std::string_view token);

/// The ERROR.TYPE code: #NULL! = 1 through #N/A = 7.
int ErrorTypeCode(ErrorKind kind);

}  // namespace cellforge::runtime

#endif  // CELLFORGE_RUNTIME_ERROR_KIND_H_
