#ifndef CELLFORGE_RUNTIME_COERCE_H_
#define CELLFORGE_RUNTIME_COERCE_H_

#include <optional>
#include <string_view>

#include "runtime/value.h"

namespace cellforge::runtime {

/// Parses numeric text such as " 12", "-1.5e3" or "25%". Empty text is not a number here.
std::optional<double> ParseNumberText(std::string_view text);

/// Number coercion: Empty and "" are 0, booleans are 1/0, numeric text parses, other text is
/// #VALUE!. Errors pass through.
Scalar ToNumber(const Scalar& value);

/// Text coercion: numbers use FormatNumber, booleans print TRUE/FALSE. Errors pass through.
Scalar ToText(const Scalar& value);

/// Logical coercion: numbers are nonzero, "TRUE"/"FALSE" text parses, other text is #VALUE!.
Scalar ToBoolean(const Scalar& value);

/// Orders two non-error scalars: number < text < boolean, text case-insensitively, Empty
/// standing in for 0, "" or FALSE as its counterpart requires. Returns -1, 0 or 1.
int CompareScalars(const Scalar& a, const Scalar& b);

/// Case-insensitive comparison of two strings; returns -1, 0 or 1.
int CompareText(std::string_view a, std::string_view b);

}  // namespace cellforge::runtime

#endif  // CELLFORGE_RUNTIME_COERCE_H_
