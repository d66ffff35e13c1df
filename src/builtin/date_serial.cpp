#include "builtin/date_serial.h"

#include <cmath>
#include <cstdlib>
#include <string>
#include <utility>

#include "util/string.h"

namespace cellforge::builtin::dates {

namespace {

int64_t FloorDiv(int64_t a, int64_t b) {
  int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
  return q;
}

// 1899-12-31 is serial 0 for dates before the phantom leap day, 1899-12-30 after it.
const int64_t kEarlyEpoch = DaysFromCivil(1899, 12, 31);
const int64_t kLateEpoch = DaysFromCivil(1899, 12, 30);
const int64_t kMarchFirst1900 = DaysFromCivil(1900, 3, 1);

// Parses an unsigned decimal field of 1..max_digits digits.
std::optional<int> Field(std::string_view text, size_t max_digits) {
  if (text.empty() || text.size() > max_digits) return std::nullopt;
  int value = 0;
  for (char ch : text) {
    if (ch < '0' || ch > '9') return std::nullopt;
    value = value * 10 + (ch - '0');
  }
  return value;
}

// Splits "a<sep>b<sep>c" into exactly three parts.
bool SplitThree(std::string_view text, char sep, std::string_view parts[3]) {
  for (int i = 0; i < 2; ++i) {
    const size_t pos = text.find(sep);
    if (pos == std::string_view::npos) return false;
    parts[i] = text.substr(0, pos);
    text.remove_prefix(pos + 1);
  }
  parts[2] = text;
  return text.find(sep) == std::string_view::npos;
}

bool IsLastOfFebruary(const CivilDate& d) {
  return d.month == 2 && d.day == DaysInMonth(d.year, 2);
}

// True when Feb 29 of a leap year lies within [start, end].
bool SpansLeapDay(int64_t start, int64_t end, const CivilDate& a, const CivilDate& b) {
  for (int year = a.year; year <= b.year; ++year) {
    if (!IsLeapYear(year)) continue;
    const auto leap_day = DateToSerial(year, 2, 29);
    if (leap_day && *leap_day >= start && *leap_day <= end) return true;
  }
  return false;
}

// Actual/actual year fraction.
double ActualActual(int64_t start, int64_t end, const CivilDate& a, const CivilDate& b) {
  const double days = static_cast<double>(end - start);
  if (a.year == b.year) return days / (IsLeapYear(a.year) ? 366.0 : 365.0);
  const auto anniversary = DateToSerial(a.year + 1, a.month, a.day);
  if (anniversary && end <= *anniversary) {
    return days / (SpansLeapDay(start, end, a, b) ? 366.0 : 365.0);
  }
  double total = 0.0;
  for (int year = a.year; year <= b.year; ++year) total += IsLeapYear(year) ? 366 : 365;
  return days / (total / (b.year - a.year + 1));
}

}  // namespace

bool IsLeapYear(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int DaysInMonth(int year, int month) {
  static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && IsLeapYear(year)) return 29;
  return kDays[month - 1];
}

// Howard Hinnant's days_from_civil.
int64_t DaysFromCivil(int64_t year, int month, int day) {
  year -= month <= 2 ? 1 : 0;
  const int64_t era = FloorDiv(year, 400);
  const int64_t yoe = year - era * 400;
  const int64_t mp = (month + 9) % 12;
  const int64_t doy = (153 * mp + 2) / 5 + day - 1;
  const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + doe - 719468;
}

CivilDate CivilFromDays(int64_t days) {
  days += 719468;
  const int64_t era = FloorDiv(days, 146097);
  const int64_t doe = days - era * 146097;
  const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const int64_t mp = (5 * doy + 2) / 153;
  CivilDate out;
  out.day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
  out.month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
  out.year = static_cast<int>(yoe + era * 400 + (out.month <= 2 ? 1 : 0));
  return out;
}

std::optional<int64_t> DateToSerial(int64_t year, int64_t month, int64_t day) {
  if (std::llabs(year) > 100000 || std::llabs(month) > 1200000 || std::llabs(day) > 100000000) {
    return std::nullopt;
  }
  const int64_t total_months = year * 12 + (month - 1);
  const int64_t y = FloorDiv(total_months, 12);
  const int m = static_cast<int>(total_months - y * 12 + 1);
  if (y == 1900 && m == 2 && day == 29) {
    return 60;
  }
  const int64_t days = DaysFromCivil(y, m, 1) + (day - 1);
  int64_t serial = days >= kMarchFirst1900 ? days - kLateEpoch : days - kEarlyEpoch;
  if (serial < 0 || serial > kMaxSerial) {
    return std::nullopt;
  }
  return serial;
}

std::optional<CivilDate> SerialToDate(double serial) {
  if (!std::isfinite(serial) || serial < 0 || serial >= kMaxSerial + 1) {
    return std::nullopt;
  }
  const int64_t whole = static_cast<int64_t>(std::floor(serial));
  if (whole == 0) {
    return CivilDate{1900, 1, 0};
  }
  if (whole == 60) {
    return CivilDate{1900, 2, 29};
  }
  if (whole < 60) {
    return CivilFromDays(kEarlyEpoch + whole);
  }
  return CivilFromDays(kLateEpoch + whole);
}

int DayOfWeek(int64_t serial) {
  // Serial 1 (1900-01-01) is reported as a Sunday, matching the reference spreadsheet.
  int64_t r = (serial - 1) % 7;
  if (r < 0) r += 7;
  return static_cast<int>(r);
}

std::optional<int64_t> ParseDateText(std::string_view text) {
  const std::string trimmed = util::Trim(text);
  std::string_view date = trimmed;
  const size_t space = date.find(' ');
  if (space != std::string_view::npos) date = date.substr(0, space);

  std::string_view parts[3];
  std::optional<int> year;
  std::optional<int> month;
  std::optional<int> day;
  if (SplitThree(date, '-', parts)) {
    year = Field(parts[0], 4);
    month = Field(parts[1], 2);
    day = Field(parts[2], 2);
  } else if (SplitThree(date, '/', parts)) {
    month = Field(parts[0], 2);
    day = Field(parts[1], 2);
    year = Field(parts[2], 4);
    if (year && parts[2].size() <= 2) *year += *year < 30 ? 2000 : 1900;
  } else {
    return std::nullopt;
  }
  if (!year || !month || !day || *month < 1 || *month > 12 || *day < 1) return std::nullopt;
  const bool phantom = *year == 1900 && *month == 2 && *day == 29;
  if (!phantom && *day > DaysInMonth(*year, *month)) return std::nullopt;
  return DateToSerial(*year, *month, *day);
}

std::optional<double> ParseTimeText(std::string_view text) {
  std::string upper = util::ToUpper(util::Trim(text));
  int meridiem = 0;
  if (upper.size() >= 2 && (upper.compare(upper.size() - 2, 2, "AM") == 0 ||
                            upper.compare(upper.size() - 2, 2, "PM") == 0)) {
    meridiem = upper[upper.size() - 2] == 'A' ? 1 : 2;
    upper = util::Trim(std::string_view(upper).substr(0, upper.size() - 2));
  }
  std::string_view clock = upper;
  const size_t space = clock.rfind(' ');
  if (space != std::string_view::npos) clock = clock.substr(space + 1);

  std::string_view fields[3];
  std::optional<int> hour;
  std::optional<int> minute;
  double second = 0.0;
  if (SplitThree(clock, ':', fields)) {
    hour = Field(fields[0], 2);
    minute = Field(fields[1], 2);
    const std::string seconds(fields[2]);
    char* end = nullptr;
    second = std::strtod(seconds.c_str(), &end);
    if (seconds.empty() || end != seconds.c_str() + seconds.size() || second < 0 || second >= 60) {
      return std::nullopt;
    }
  } else {
    const size_t colon = clock.find(':');
    if (colon == std::string_view::npos) return std::nullopt;
    hour = Field(clock.substr(0, colon), 2);
    minute = Field(clock.substr(colon + 1), 2);
  }
  if (!hour || !minute || *minute > 59) return std::nullopt;
  if (meridiem != 0) {
    if (*hour < 1 || *hour > 12) return std::nullopt;
    *hour %= 12;
    if (meridiem == 2) *hour += 12;
  } else if (*hour > 23) {
    return std::nullopt;
  }
  return (*hour * 3600.0 + *minute * 60.0 + second) / 86400.0;
}

int64_t Days360(CivilDate a, CivilDate b, bool european) {
  if (european) {
    if (a.day == 31) a.day = 30;
    if (b.day == 31) b.day = 30;
  } else {
    if (IsLastOfFebruary(a)) {
      if (IsLastOfFebruary(b)) b.day = 30;
      a.day = 30;
    }
    if (a.day == 31) a.day = 30;
    if (b.day == 31 && a.day >= 30) b.day = 30;
  }
  return (b.year - a.year) * 360 + (b.month - a.month) * 30 + (b.day - a.day);
}

std::optional<double> YearFraction(int64_t start, int64_t end, int64_t basis) {
  if (start > end) std::swap(start, end);
  auto a = SerialToDate(static_cast<double>(start));
  auto b = SerialToDate(static_cast<double>(end));
  if (!a || !b) return std::nullopt;
  const double days = static_cast<double>(end - start);
  switch (basis) {
    case 0:
      return static_cast<double>(Days360(*a, *b, false)) / 360.0;
    case 1:
      return ActualActual(start, end, *a, *b);
    case 2:
      return days / 360.0;
    case 3:
      return days / 365.0;
    case 4:
      return static_cast<double>(Days360(*a, *b, true)) / 360.0;
    default:
      return std::nullopt;
  }
}

}  // namespace cellforge::builtin::dates
