#ifndef CELLFORGE_BUILTIN_DATE_SERIAL_H_
#define CELLFORGE_BUILTIN_DATE_SERIAL_H_

#include <cstdint>
#include <optional>
#include <string_view>

// Serial dates: serial 1 is 1900-01-01 and serial 60 is the phantom 1900-02-29 the reference
// spreadsheet keeps, so serials from 61 on line up with it. The fraction is the time of day.

namespace cellforge::builtin::dates {

struct CivilDate {
  int year = 1900;
  int month = 1;
  int day = 1;
};

bool IsLeapYear(int year);
int DaysInMonth(int year, int month);

/// Days since 1970-01-01 in the proleptic Gregorian calendar.
int64_t DaysFromCivil(int64_t year, int month, int day);
CivilDate CivilFromDays(int64_t days);

/// Serial for a date whose month and day may overflow or underflow (month 13 is January of the
/// next year, day 0 is the last day of the previous month). nullopt outside 0..2958465.
std::optional<int64_t> DateToSerial(int64_t year, int64_t month, int64_t day);

/// Calendar date of the integer part of `serial`; nullopt for negative or too-large serials.
/// Serial 0 reads as 1900-01-00.
std::optional<CivilDate> SerialToDate(double serial);

/// 0 = Sunday ... 6 = Saturday.
int DayOfWeek(int64_t serial);

/// Serial of "yyyy-mm-dd" or "m/d/yyyy" (two-digit years below 30 are 20xx); a trailing time
/// part is ignored. nullopt when the text is not a valid date.
std::optional<int64_t> ParseDateText(std::string_view text);

/// Fraction of a day for "hh:mm", "hh:mm:ss" with optional AM/PM, possibly after a date part.
std::optional<double> ParseTimeText(std::string_view text);

/// 30/360 day count: US (NASD) rules unless `european`.
int64_t Days360(CivilDate a, CivilDate b, bool european);

/// Year fraction between two whole-day serials (either order) under a day-count basis: 0 US
/// 30/360, 1 actual/actual, 2 actual/360, 3 actual/365, 4 European 30/360. nullopt for any
/// other basis.
std::optional<double> YearFraction(int64_t start, int64_t end, int64_t basis);

/// Largest serial the calendar accepts (9999-12-31).
constexpr int64_t kMaxSerial = 2958465;

}  // namespace cellforge::builtin::dates

#endif  // CELLFORGE_BUILTIN_DATE_SERIAL_H_
