#include "builtin/number_format.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

#include "builtin/date_serial.h"
#include "builtin/numeric.h"
#include "runtime/value.h"
#include "util/string.h"

namespace cellforge::builtin {

namespace {

const char* const kMonthNames[] = {"January", "February", "March",     "April",
                                   "May",     "June",     "July",      "August",
                                   "September", "October", "November", "December"};
const char* const kDayNames[] = {"Sunday",   "Monday", "Tuesday", "Wednesday",
                                 "Thursday", "Friday", "Saturday"};

// Splits on ';' outside quotes and escapes.
std::vector<std::string> Sections(std::string_view code) {
  std::vector<std::string> out(1);
  bool quoted = false;
  for (size_t i = 0; i < code.size(); ++i) {
    const char ch = code[i];
    if (ch == '"') {
      quoted = !quoted;
    } else if (ch == '\\' && !quoted && i + 1 < code.size()) {
      out.back().push_back(ch);
      out.back().push_back(code[++i]);
      continue;
    } else if (ch == ';' && !quoted) {
      out.emplace_back();
      continue;
    }
    out.back().push_back(ch);
  }
  return out;
}

// True when the section holds date or time codes rather than digit placeholders.
bool IsDateSection(std::string_view section) {
  bool quoted = false;
  bool date = false;
  for (size_t i = 0; i < section.size(); ++i) {
    const char ch = static_cast<char>(std::tolower(static_cast<unsigned char>(section[i])));
    if (ch == '"') {
      quoted = !quoted;
    } else if (quoted) {
      continue;
    } else if (ch == '\\') {
      ++i;
    } else if (ch == '0' || ch == '#' || ch == '?') {
      return false;
    } else if (ch == 'y' || ch == 'm' || ch == 'd' || ch == 'h' || ch == 's') {
      date = true;
    }
  }
  return date;
}

std::string Padded(int value, int width) {
  std::string digits = std::to_string(value);
  while (static_cast<int>(digits.size()) < width) digits.insert(digits.begin(), '0');
  return digits;
}

struct DateToken {
  // 'y', 'm' (month), 'n' (minute), 'd', 'h', 's', 'a' (AM/PM), 'p' (A/P) or 'l' (literal).
  char kind = 'l';
  int width = 0;
  std::string literal;
};

std::vector<DateToken> TokenizeDate(std::string_view section) {
  std::vector<DateToken> tokens;
  auto literal = [&tokens](std::string text) {
    tokens.push_back(DateToken{'l', 0, std::move(text)});
  };
  for (size_t i = 0; i < section.size();) {
    const char ch = section[i];
    const char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    if (ch == '"') {
      const size_t close = section.find('"', i + 1);
      const size_t end = close == std::string_view::npos ? section.size() : close;
      literal(std::string(section.substr(i + 1, end - i - 1)));
      i = end + 1;
    } else if (ch == '\\' && i + 1 < section.size()) {
      literal(std::string(1, section[i + 1]));
      i += 2;
    } else if (ch == '[' || ch == ']') {
      ++i;
    } else if (util::EqualsIgnoreCase(section.substr(i, 5), "AM/PM")) {
      tokens.push_back(DateToken{'a', 5, ""});
      i += 5;
    } else if (util::EqualsIgnoreCase(section.substr(i, 3), "A/P")) {
      tokens.push_back(DateToken{'p', 3, ""});
      i += 3;
    } else if (lower == 'y' || lower == 'm' || lower == 'd' || lower == 'h' || lower == 's') {
      size_t end = i;
      while (end < section.size() &&
             std::tolower(static_cast<unsigned char>(section[end])) == lower) {
        ++end;
      }
      tokens.push_back(DateToken{lower, static_cast<int>(end - i), ""});
      i = end;
    } else {
      literal(std::string(1, ch));
      ++i;
    }
  }
  // 'm' right after an hour or right before a second is a minute.
  int previous = -1;
  for (size_t i = 0; i < tokens.size(); ++i) {
    if (tokens[i].kind == 'l') continue;
    if (tokens[i].kind == 'm') {
      bool minute = previous >= 0 && tokens[previous].kind == 'h';
      for (size_t j = i + 1; j < tokens.size() && !minute; ++j) {
        if (tokens[j].kind == 'l') continue;
        minute = tokens[j].kind == 's';
        break;
      }
      if (minute) tokens[i].kind = 'n';
    }
    previous = static_cast<int>(i);
  }
  return tokens;
}

std::optional<std::string> FormatDate(double serial, std::string_view section) {
  if (serial < 0) return std::nullopt;
  double day = std::floor(serial);
  int64_t seconds = std::llround((serial - day) * 86400.0);
  if (seconds >= 86400) {
    seconds -= 86400;
    day += 1;
  }
  auto date = dates::SerialToDate(day);
  if (!date) return std::nullopt;
  const std::vector<DateToken> tokens = TokenizeDate(section);
  bool twelve_hour = false;
  for (const DateToken& t : tokens) twelve_hour = twelve_hour || t.kind == 'a' || t.kind == 'p';
  const int hour = static_cast<int>(seconds / 3600);
  const int weekday = dates::DayOfWeek(static_cast<int64_t>(day));

  std::string out;
  for (const DateToken& t : tokens) {
    switch (t.kind) {
      case 'y':
        out += t.width <= 2 ? Padded(date->year % 100, 2) : Padded(date->year, 4);
        break;
      case 'm':
        if (t.width <= 2) {
          out += Padded(date->month, t.width);
        } else if (t.width == 3) {
          out += std::string(kMonthNames[date->month - 1]).substr(0, 3);
        } else if (t.width == 5) {
          out += kMonthNames[date->month - 1][0];
        } else {
          out += kMonthNames[date->month - 1];
        }
        break;
      case 'd':
        if (t.width <= 2) {
          out += Padded(date->day, t.width);
        } else if (t.width == 3) {
          out += std::string(kDayNames[weekday]).substr(0, 3);
        } else {
          out += kDayNames[weekday];
        }
        break;
      case 'h': {
        int shown = hour;
        if (twelve_hour) {
          shown = hour % 12;
          if (shown == 0) shown = 12;
        }
        out += Padded(shown, std::min(t.width, 2));
        break;
      }
      case 'n':
        out += Padded(static_cast<int>(seconds / 60 % 60), std::min(t.width, 2));
        break;
      case 's':
        out += Padded(static_cast<int>(seconds % 60), std::min(t.width, 2));
        break;
      case 'a':
        out += hour < 12 ? "AM" : "PM";
        break;
      case 'p':
        out += hour < 12 ? "A" : "P";
        break;
      default:
        out += t.literal;
        break;
    }
  }
  return out;
}

// Digit-placeholder layout of one number section.
struct NumberPattern {
  std::string prefix;
  std::string suffix;
  int integer_zeros = 0;
  int fraction_zeros = 0;
  int fraction_places = 0;
  bool has_point = false;
  bool grouping = false;
  int thousands_scale = 0;
  int percent = 0;
  bool scientific = false;
  bool exponent_plus = false;
  int exponent_digits = 0;
};

bool IsPlaceholder(char ch) {
  return ch == '0' || ch == '#' || ch == '?';
}

NumberPattern ParseNumberPattern(std::string_view section) {
  NumberPattern p;
  bool seen_digit = false;
  auto literal = [&p, &seen_digit](const std::string& text) {
    (seen_digit ? p.suffix : p.prefix) += text;
  };
  for (size_t i = 0; i < section.size(); ++i) {
    const char ch = section[i];
    if (ch == '"') {
      const size_t close = section.find('"', i + 1);
      const size_t end = close == std::string_view::npos ? section.size() : close;
      literal(std::string(section.substr(i + 1, end - i - 1)));
      i = end;
    } else if (ch == '\\' && i + 1 < section.size()) {
      literal(std::string(1, section[++i]));
    } else if (ch == '_' && i + 1 < section.size()) {
      literal(" ");
      ++i;
    } else if (ch == '*' && i + 1 < section.size()) {
      ++i;
    } else if (IsPlaceholder(ch) && !p.scientific) {
      seen_digit = true;
      if (p.has_point) {
        ++p.fraction_places;
        if (ch == '0') ++p.fraction_zeros;
      } else if (ch == '0') {
        ++p.integer_zeros;
      }
    } else if (ch == '0' && p.scientific) {
      ++p.exponent_digits;
    } else if (ch == '.' && !p.has_point && !p.scientific &&
               (seen_digit || (i + 1 < section.size() && IsPlaceholder(section[i + 1])))) {
      p.has_point = true;
      seen_digit = true;
    } else if (ch == ',' && seen_digit && !p.scientific) {
      if (i + 1 < section.size() && IsPlaceholder(section[i + 1]) && !p.has_point) {
        p.grouping = true;
      } else {
        ++p.thousands_scale;
      }
    } else if (ch == '%') {
      ++p.percent;
      literal("%");
    } else if ((ch == 'E' || ch == 'e') && seen_digit && i + 1 < section.size() &&
               (section[i + 1] == '+' || section[i + 1] == '-')) {
      p.scientific = true;
      p.exponent_plus = section[i + 1] == '+';
      ++i;
    } else if (ch != '[' && ch != ']') {
      literal(std::string(1, ch));
    }
  }
  return p;
}

// Fixed-point digits of |value|: integer and fraction parts.
void SplitDigits(double magnitude, int places, std::string* integer, std::string* fraction) {
  char buffer[512];
  std::snprintf(buffer, sizeof(buffer), "%.*f", places, magnitude);
  const std::string text(buffer);
  const size_t point = text.find('.');
  *integer = text.substr(0, point);
  *fraction = point == std::string::npos ? "" : text.substr(point + 1);
}

std::string RenderFraction(std::string fraction, const NumberPattern& p) {
  while (static_cast<int>(fraction.size()) > p.fraction_zeros && !fraction.empty() &&
         fraction.back() == '0') {
    fraction.pop_back();
  }
  return p.has_point ? "." + fraction : "";
}

std::string FormatScientific(double magnitude, const NumberPattern& p) {
  const int integer_places = std::max(p.integer_zeros, 1);
  int exponent = 0;
  if (magnitude != 0) {
    exponent = static_cast<int>(std::floor(std::log10(magnitude))) - (integer_places - 1);
  }
  double mantissa = magnitude / std::pow(10.0, exponent);
  mantissa = numeric::RoundDigits(mantissa, p.fraction_places);
  if (mantissa >= std::pow(10.0, integer_places)) {
    mantissa /= 10;
    ++exponent;
  }
  std::string integer;
  std::string fraction;
  SplitDigits(mantissa, p.fraction_places, &integer, &fraction);
  std::string out = integer + RenderFraction(fraction, p) + "E";
  if (exponent < 0) {
    out += "-";
  } else if (p.exponent_plus) {
    out += "+";
  }
  return out + Padded(std::abs(exponent), std::max(p.exponent_digits, 1));
}

std::string FormatNumberSection(double value, std::string_view section, bool with_sign) {
  if (util::EqualsIgnoreCase(util::Trim(section), "General")) {
    return runtime::FormatNumber(with_sign ? value : std::fabs(value));
  }
  const NumberPattern p = ParseNumberPattern(section);
  double magnitude = std::fabs(value) * std::pow(100.0, p.percent) /
                     std::pow(1000.0, p.thousands_scale);
  std::string body;
  if (p.scientific) {
    body = FormatScientific(magnitude, p);
  } else {
    magnitude = numeric::RoundDigits(magnitude, p.fraction_places);
    std::string integer;
    std::string fraction;
    SplitDigits(magnitude, p.fraction_places, &integer, &fraction);
    if (integer == "0" && p.integer_zeros == 0) integer.clear();
    while (static_cast<int>(integer.size()) < p.integer_zeros) integer.insert(0, "0");
    if (p.grouping) integer = GroupThousands(integer);
    body = integer + RenderFraction(fraction, p);
    const bool zero = integer.find_first_not_of("0,") == std::string::npos &&
                      fraction.find_first_not_of('0') == std::string::npos;
    if (zero) with_sign = false;
  }
  const std::string sign = with_sign && value < 0 ? "-" : "";
  return sign + p.prefix + body + p.suffix;
}

}  // namespace

std::string GroupThousands(std::string_view digits) {
  std::string out;
  const size_t n = digits.size();
  for (size_t i = 0; i < n; ++i) {
    if (i > 0 && (n - i) % 3 == 0) out.push_back(',');
    out.push_back(digits[i]);
  }
  return out;
}

std::string FormatFixed(double value, int decimals, bool grouping) {
  const double rounded = numeric::RoundDigits(value, decimals);
  std::string integer;
  std::string fraction;
  SplitDigits(std::fabs(rounded), std::max(decimals, 0), &integer, &fraction);
  if (grouping) integer = GroupThousands(integer);
  std::string out = rounded < 0 ? "-" + integer : integer;
  if (!fraction.empty()) out += "." + fraction;
  return out;
}

std::optional<std::string> FormatWithCode(double value, std::string_view code) {
  const std::vector<std::string> sections = Sections(code);
  std::string section = sections[0];
  bool with_sign = true;
  if (value < 0 && sections.size() >= 2) {
    section = sections[1];
    with_sign = false;
  } else if (value == 0 && sections.size() >= 3) {
    section = sections[2];
  }
  if (IsDateSection(section)) return FormatDate(with_sign ? value : std::fabs(value), section);
  return FormatNumberSection(value, section, with_sign);
}

}  // namespace cellforge::builtin
