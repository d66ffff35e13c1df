#ifndef CELLFORGE_BUILTIN_COMPLEX_TEXT_H_
#define CELLFORGE_BUILTIN_COMPLEX_TEXT_H_

#include <complex>
#include <optional>
#include <string>
#include <string_view>

namespace cellforge::builtin {

struct ComplexText {
  std::complex<double> value;
  /// 'i' or 'j' when the text carried an imaginary part, '\0' for a plain real.
  char suffix = '\0';
};

/// Parses "3+4i", "-2.5-j", "5i", "i", "1e3+2j" or a plain real. nullopt when malformed.
std::optional<ComplexText> ParseComplex(std::string_view text);

/// Formats like the reference spreadsheet: "3+4i", "-i", "2.5"; a unit imaginary part is
/// written as the bare suffix.
std::string FormatComplex(const std::complex<double>& value, char suffix);

}  // namespace cellforge::builtin

#endif  // CELLFORGE_BUILTIN_COMPLEX_TEXT_H_
