#ifndef CELLFORGE_BUILTIN_NUMBER_FORMAT_H_
#define CELLFORGE_BUILTIN_NUMBER_FORMAT_H_

#include <optional>
#include <string>
#include <string_view>

namespace cellforge::builtin {

/// Inserts ',' every three digits of an unsigned digit string.
std::string GroupThousands(std::string_view digits);

/// `value` rounded to `decimals` places (negative rounds left of the point), optionally with
/// thousands separators: FormatFixed(-1234.567, 1, true) is "-1,234.6".
std::string FormatFixed(double value, int decimals, bool grouping);

/// Renders a number through a spreadsheet format code. Supported: General; up to three
/// ';'-separated sections (positive;negative;zero); digit placeholders 0 # ? with '.', ','
/// grouping and trailing ',' scaling; '%'; E+00 scientific; quoted and backslash literals; and
/// date/time codes (y, m, d, h, s, AM/PM, A/P). nullopt for a serial outside the calendar.
std::optional<std::string> FormatWithCode(double value, std::string_view code);

}  // namespace cellforge::builtin

#endif  // CELLFORGE_BUILTIN_NUMBER_FORMAT_H_
