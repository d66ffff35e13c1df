#include "runtime/error_kind.h"

#include "util/string.h"

namespace cellforge::runtime {

namespace {

constexpr ErrorKind kAllKinds[] = {
    ErrorKind::kNull,   ErrorKind::kDivByZero, ErrorKind::kValue,        ErrorKind::kReference,
    ErrorKind::kName,   ErrorKind::kNumber,    ErrorKind::kNotAvailable,
};

}  // namespace

const char* ErrorKindToken(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNull:
      return "#NULL!";
    case ErrorKind::kDivByZero:
      return "#DIV/0!";
    case ErrorKind::kValue:
      return "#VALUE!";
    case ErrorKind::kReference:
      return "#REF!";
    case ErrorKind::kName:
      return "#NAME?";
    case ErrorKind::kNumber:
      return "#NUM!";
    case ErrorKind::kNotAvailable:
      return "#N/A";
  }
  return "#VALUE!";
}

std::optional<ErrorKind> ParseErrorToken(std::string_view token) {
  for (ErrorKind kind : kAllKinds) {
    if (util::EqualsIgnoreCase(token, ErrorKindToken(kind))) {
      return kind;
    }
  }
  return std::nullopt;
}

int ErrorTypeCode(ErrorKind kind) {
  return static_cast<int>(kind) + 1;
}

}  // namespace cellforge::runtime
