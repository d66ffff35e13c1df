#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <optional>
#include <set>
#include <string>
#include <utility>

#include "builtin/args.h"
#include "builtin/builtins.h"
#include "builtin/date_serial.h"
#include "util/string.h"

namespace cellforge::builtin {

namespace {

using dates::CivilDate;
using runtime::CallArgs;
using runtime::ErrorKind;
using runtime::Scalar;
using runtime::Value;

constexpr Category kCat = Category::kDateTime;
constexpr double kSecondsPerDay = 86400.0;

Value NumError() {
  return Value::Error(ErrorKind::kNumber);
}

// Serial argument; date or time text such as "2024-01-15" or "10:30" is accepted.
std::optional<Value> SerialArg(CallArgs& args, size_t i, double* out) {
  Scalar s = ScalarArg(args, i);
  if (s.IsText()) {
    if (auto serial = dates::ParseDateText(s.text)) {
      *out = static_cast<double>(*serial) + dates::ParseTimeText(s.text).value_or(0.0);
      return std::nullopt;
    }
    if (auto fraction = dates::ParseTimeText(s.text)) {
      *out = *fraction;
      return std::nullopt;
    }
  }
  if (auto err = NumberArg(args, i, out)) return err;
  if (*out < 0 || *out >= dates::kMaxSerial + 1) return NumError();
  return std::nullopt;
}

// Whole-day serial and its calendar date.
std::optional<Value> DateArg(CallArgs& args, size_t i, int64_t* serial, CivilDate* date) {
  double raw = 0.0;
  if (auto err = SerialArg(args, i, &raw)) return err;
  *serial = static_cast<int64_t>(std::floor(raw));
  auto civil = dates::SerialToDate(raw);
  if (!civil) return NumError();
  if (date != nullptr) *date = *civil;
  return std::nullopt;
}

Value SerialResult(std::optional<int64_t> serial) {
  if (!serial) return NumError();
  return Value::Number(static_cast<double>(*serial));
}

// Seconds into the day, rounded to the nearest second.
int64_t SecondOfDay(double serial) {
  const double fraction = serial - std::floor(serial);
  return static_cast<int64_t>(std::llround(fraction * kSecondsPerDay)) % 86400;
}

Value Date(CallArgs& args) {
  int64_t year = 0;
  int64_t month = 0;
  int64_t day = 0;
  if (auto err = IntArg(args, 0, &year)) return *err;
  if (auto err = IntArg(args, 1, &month)) return *err;
  if (auto err = IntArg(args, 2, &day)) return *err;
  if (year < 0 || year > 9999) return NumError();
  if (year < 1900) year += 1900;
  return SerialResult(dates::DateToSerial(year, month, day));
}

Value Time(CallArgs& args) {
  int64_t hour = 0;
  int64_t minute = 0;
  int64_t second = 0;
  if (auto err = IntArg(args, 0, &hour)) return *err;
  if (auto err = IntArg(args, 1, &minute)) return *err;
  if (auto err = IntArg(args, 2, &second)) return *err;
  const int64_t total = hour * 3600 + minute * 60 + second;
  if (total < 0) return NumError();
  return Value::Number(static_cast<double>(total % 86400) / kSecondsPerDay);
}

// Current local date and time as a serial.
double NowSerial() {
  const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm local{};
  localtime_r(&now, &local);
  const auto day = dates::DateToSerial(local.tm_year + 1900, local.tm_mon + 1, local.tm_mday);
  const double seconds = local.tm_hour * 3600.0 + local.tm_min * 60.0 + local.tm_sec;
  return static_cast<double>(day.value_or(0)) + seconds / kSecondsPerDay;
}

Value Today(CallArgs&) {
  return Value::Number(std::floor(NowSerial()));
}

Value Now(CallArgs&) {
  return Value::Number(NowSerial());
}

Value Year(CallArgs& args) {
  int64_t serial = 0;
  CivilDate date;
  if (auto err = DateArg(args, 0, &serial, &date)) return *err;
  return Value::Number(date.year);
}

Value Month(CallArgs& args) {
  int64_t serial = 0;
  CivilDate date;
  if (auto err = DateArg(args, 0, &serial, &date)) return *err;
  return Value::Number(date.month);
}

Value Day(CallArgs& args) {
  int64_t serial = 0;
  CivilDate date;
  if (auto err = DateArg(args, 0, &serial, &date)) return *err;
  return Value::Number(date.day);
}

Value TimePart(CallArgs& args, int64_t divisor, int64_t modulus) {
  double serial = 0.0;
  if (auto err = SerialArg(args, 0, &serial)) return *err;
  return Value::Number(static_cast<double>(SecondOfDay(serial) / divisor % modulus));
}

Value Hour(CallArgs& args) {
  return TimePart(args, 3600, 24);
}

Value Minute(CallArgs& args) {
  return TimePart(args, 60, 60);
}

Value Second(CallArgs& args) {
  return TimePart(args, 1, 60);
}

// First day of the week for WEEKDAY/WEEKNUM return types 11-17 (0 = Sunday).
std::optional<int> WeekStart(int64_t type) {
  if (type >= 11 && type <= 17) return static_cast<int>((type - 10) % 7);
  return std::nullopt;
}

Value Weekday(CallArgs& args) {
  int64_t serial = 0;
  int64_t type = 1;
  if (auto err = DateArg(args, 0, &serial, nullptr)) return *err;
  if (auto err = IntArgOr(args, 1, 1, &type)) return *err;
  const int dow = dates::DayOfWeek(serial);
  switch (type) {
    case 1:
      return Value::Number(dow + 1);
    case 2:
      return Value::Number((dow + 6) % 7 + 1);
    case 3:
      return Value::Number((dow + 6) % 7);
    default:
      break;
  }
  auto start = WeekStart(type);
  if (!start) return NumError();
  return Value::Number((dow - *start + 7) % 7 + 1);
}

// ISO 8601 week number: the week containing the year's first Thursday is week 1.
int IsoWeek(int64_t serial) {
  const int monday_based = (dates::DayOfWeek(serial) + 6) % 7;
  const int64_t thursday = serial - monday_based + 3;
  const auto date = dates::SerialToDate(static_cast<double>(std::max<int64_t>(thursday, 1)));
  if (!date) return 1;
  const int64_t jan1 = dates::DateToSerial(date->year, 1, 1).value_or(1);
  return static_cast<int>((thursday - jan1) / 7 + 1);
}

Value WeekNum(CallArgs& args) {
  int64_t serial = 0;
  CivilDate date;
  int64_t type = 1;
  if (auto err = DateArg(args, 0, &serial, &date)) return *err;
  if (auto err = IntArgOr(args, 1, 1, &type)) return *err;
  if (type == 21) return Value::Number(IsoWeek(serial));
  std::optional<int> start;
  if (type == 1) {
    start = 0;
  } else if (type == 2) {
    start = 1;
  } else {
    start = WeekStart(type);
  }
  if (!start) return NumError();
  const int64_t jan1 = dates::DateToSerial(date.year, 1, 1).value_or(1);
  const int shift = (dates::DayOfWeek(jan1) - *start + 7) % 7;
  return Value::Number(static_cast<double>((serial - jan1 + shift) / 7 + 1));
}

Value EoMonth(CallArgs& args) {
  int64_t serial = 0;
  CivilDate date;
  int64_t months = 0;
  if (auto err = DateArg(args, 0, &serial, &date)) return *err;
  if (auto err = IntArg(args, 1, &months)) return *err;
  return SerialResult(dates::DateToSerial(date.year, date.month + months + 1, 0));
}

Value EDate(CallArgs& args) {
  int64_t serial = 0;
  CivilDate date;
  int64_t months = 0;
  if (auto err = DateArg(args, 0, &serial, &date)) return *err;
  if (auto err = IntArg(args, 1, &months)) return *err;
  auto first = dates::DateToSerial(date.year, date.month + months, 1);
  if (!first) return NumError();
  const auto target = dates::SerialToDate(static_cast<double>(*first));
  const int day = std::min(date.day, dates::DaysInMonth(target->year, target->month));
  return SerialResult(dates::DateToSerial(target->year, target->month, day));
}

int FullMonths(const CivilDate& a, const CivilDate& b) {
  int months = (b.year - a.year) * 12 + (b.month - a.month);
  if (b.day < a.day) --months;
  return months;
}

/// DATEDIF(start, end, unit) with units Y, M, D, MD, YM and YD.
Value DateDif(CallArgs& args) {
  int64_t start = 0;
  int64_t end = 0;
  CivilDate a;
  CivilDate b;
  std::string unit;
  if (auto err = DateArg(args, 0, &start, &a)) return *err;
  if (auto err = DateArg(args, 1, &end, &b)) return *err;
  if (auto err = TextArg(args, 2, &unit)) return *err;
  if (start > end) return NumError();
  unit = util::ToUpper(util::Trim(unit));
  if (unit == "Y") return Value::Number(FullMonths(a, b) / 12);
  if (unit == "M") return Value::Number(FullMonths(a, b));
  if (unit == "D") return Value::Number(static_cast<double>(end - start));
  if (unit == "YM") return Value::Number(FullMonths(a, b) % 12);
  if (unit == "MD") {
    if (b.day >= a.day) return Value::Number(b.day - a.day);
    const int prev_month = b.month == 1 ? 12 : b.month - 1;
    const int prev_year = b.month == 1 ? b.year - 1 : b.year;
    return Value::Number(b.day - a.day + dates::DaysInMonth(prev_year, prev_month));
  }
  if (unit == "YD") {
    auto shifted = dates::DateToSerial(b.year, a.month, a.day);
    if (shifted && *shifted > end) shifted = dates::DateToSerial(b.year - 1, a.month, a.day);
    if (!shifted) return NumError();
    return Value::Number(static_cast<double>(end - *shifted));
  }
  return NumError();
}

Value Days(CallArgs& args) {
  int64_t end = 0;
  int64_t start = 0;
  if (auto err = DateArg(args, 0, &end, nullptr)) return *err;
  if (auto err = DateArg(args, 1, &start, nullptr)) return *err;
  return Value::Number(static_cast<double>(end - start));
}

Value Days360Fn(CallArgs& args) {
  int64_t start = 0;
  int64_t end = 0;
  CivilDate a;
  CivilDate b;
  bool european = false;
  if (auto err = DateArg(args, 0, &start, &a)) return *err;
  if (auto err = DateArg(args, 1, &end, &b)) return *err;
  if (auto err = BoolArgOr(args, 2, false, &european)) return *err;
  return Value::Number(static_cast<double>(dates::Days360(a, b, european)));
}

// Holiday serials from an optional list argument.
std::optional<Value> Holidays(CallArgs& args, size_t i, std::set<int64_t>* out) {
  if (!args.Has(i)) return std::nullopt;
  auto list = ArrayArg(args, i);
  for (const Scalar& cell : list->cells) {
    if (cell.IsError()) return Value::FromScalar(cell);
    if (cell.IsEmpty()) continue;
    if (!cell.IsNumber()) return Value::Error(ErrorKind::kValue);
    out->insert(static_cast<int64_t>(std::floor(cell.number)));
  }
  return std::nullopt;
}

bool IsWorkday(int64_t serial, const std::set<int64_t>& holidays) {
  const int dow = dates::DayOfWeek(serial);
  return dow != 0 && dow != 6 && holidays.count(serial) == 0;
}

Value NetworkDays(CallArgs& args) {
  int64_t start = 0;
  int64_t end = 0;
  std::set<int64_t> holidays;
  if (auto err = DateArg(args, 0, &start, nullptr)) return *err;
  if (auto err = DateArg(args, 1, &end, nullptr)) return *err;
  if (auto err = Holidays(args, 2, &holidays)) return *err;
  const int sign = start <= end ? 1 : -1;
  if (sign < 0) std::swap(start, end);
  int64_t count = 0;
  for (int64_t day = start; day <= end; ++day) {
    if (IsWorkday(day, holidays)) ++count;
  }
  return Value::Number(static_cast<double>(sign * count));
}

Value Workday(CallArgs& args) {
  int64_t start = 0;
  int64_t days = 0;
  std::set<int64_t> holidays;
  if (auto err = DateArg(args, 0, &start, nullptr)) return *err;
  if (auto err = IntArg(args, 1, &days)) return *err;
  if (auto err = Holidays(args, 2, &holidays)) return *err;
  const int step = days < 0 ? -1 : 1;
  int64_t serial = start;
  for (int64_t remaining = std::llabs(days); remaining > 0;) {
    serial += step;
    if (serial < 1 || serial > dates::kMaxSerial) return NumError();
    if (IsWorkday(serial, holidays)) --remaining;
  }
  return Value::Number(static_cast<double>(serial));
}

/// YEARFRAC(start, end, [basis]): 0 US 30/360, 1 actual/actual, 2 actual/360, 3 actual/365,
/// 4 European 30/360.
Value YearFrac(CallArgs& args) {
  int64_t start = 0;
  int64_t end = 0;
  int64_t basis = 0;
  if (auto err = DateArg(args, 0, &start, nullptr)) return *err;
  if (auto err = DateArg(args, 1, &end, nullptr)) return *err;
  if (auto err = IntArgOr(args, 2, 0, &basis)) return *err;
  auto fraction = dates::YearFraction(start, end, basis);
  if (!fraction) return NumError();
  return Value::Number(*fraction);
}

Value DateValue(CallArgs& args) {
  std::string text;
  if (auto err = TextArg(args, 0, &text)) return *err;
  auto serial = dates::ParseDateText(text);
  if (!serial) return Value::Error(ErrorKind::kValue);
  return Value::Number(static_cast<double>(*serial));
}

Value TimeValue(CallArgs& args) {
  std::string text;
  if (auto err = TextArg(args, 0, &text)) return *err;
  auto fraction = dates::ParseTimeText(text);
  if (!fraction) return Value::Error(ErrorKind::kValue);
  return Value::Number(*fraction);
}

}  // namespace

void RegisterDateTimeFunctions(FunctionRegistry* registry) {
  constexpr unsigned kEw = kElementwise;
  registry->Add(FunctionId::kDate, "DATE", kCat, 3, 3, Date, "DATE(year, month, day)",
                "Serial number of a calendar date.", kEw);
  registry->Add(FunctionId::kTime, "TIME", kCat, 3, 3, Time, "TIME(hour, minute, second)",
                "Fraction of a day for a time.", kEw);
  registry->Add(FunctionId::kToday, "TODAY", kCat, 0, 0, Today, "TODAY()", "Current date.",
                kVolatile);
  registry->Add(FunctionId::kNow, "NOW", kCat, 0, 0, Now, "NOW()", "Current date and time.",
                kVolatile);
  registry->Add(FunctionId::kYear, "YEAR", kCat, 1, 1, Year, "YEAR(serial)", "Year of a date.",
                kEw);
  registry->Add(FunctionId::kMonth, "MONTH", kCat, 1, 1, Month, "MONTH(serial)",
                "Month of a date.", kEw);
  registry->Add(FunctionId::kDay, "DAY", kCat, 1, 1, Day, "DAY(serial)", "Day of a date.", kEw);
  registry->Add(FunctionId::kHour, "HOUR", kCat, 1, 1, Hour, "HOUR(serial)", "Hour of a time.",
                kEw);
  registry->Add(FunctionId::kMinute, "MINUTE", kCat, 1, 1, Minute, "MINUTE(serial)",
                "Minute of a time.", kEw);
  registry->Add(FunctionId::kSecond, "SECOND", kCat, 1, 1, Second, "SECOND(serial)",
                "Second of a time.", kEw);
  registry->Add(FunctionId::kWeekday, "WEEKDAY", kCat, 1, 2, Weekday,
                "WEEKDAY(serial, [return_type])", "Day of the week.", kEw);
  registry->Add(FunctionId::kWeekNum, "WEEKNUM", kCat, 1, 2, WeekNum,
                "WEEKNUM(serial, [return_type])", "Week of the year.", kEw);
  registry->Add(FunctionId::kEoMonth, "EOMONTH", kCat, 2, 2, EoMonth,
                "EOMONTH(start_date, months)", "Last day of the month months away.", kEw);
  registry->Add(FunctionId::kEDate, "EDATE", kCat, 2, 2, EDate, "EDATE(start_date, months)",
                "Same day of the month months away.", kEw);
  registry->Add(FunctionId::kDateDif, "DATEDIF", kCat, 3, 3, DateDif,
                "DATEDIF(start_date, end_date, unit)", "Difference between dates in a unit.",
                kEw);
  registry->Add(FunctionId::kDays, "DAYS", kCat, 2, 2, Days, "DAYS(end_date, start_date)",
                "Days between two dates.", kEw);
  registry->Add(FunctionId::kDays360, "DAYS360", kCat, 2, 3, Days360Fn,
                "DAYS360(start_date, end_date, [method])", "Days between dates on a 360-day year.",
                kEw);
  registry->Add(FunctionId::kNetworkDays, "NETWORKDAYS", kCat, 2, 3, NetworkDays,
                "NETWORKDAYS(start_date, end_date, [holidays])",
                "Working days between two dates.");
  registry->Add(FunctionId::kWorkday, "WORKDAY", kCat, 2, 3, Workday,
                "WORKDAY(start_date, days, [holidays])", "Date a number of working days away.");
  registry->Add(FunctionId::kYearFrac, "YEARFRAC", kCat, 2, 3, YearFrac,
                "YEARFRAC(start_date, end_date, [basis])", "Fraction of a year between dates.",
                kEw);
  registry->Add(FunctionId::kDateValue, "DATEVALUE", kCat, 1, 1, DateValue,
                "DATEVALUE(date_text)", "Serial number of a date written as text.", kEw);
  registry->Add(FunctionId::kTimeValue, "TIMEVALUE", kCat, 1, 1, TimeValue,
                "TIMEVALUE(time_text)", "Fraction of a day of a time written as text.", kEw);
}

}  // namespace cellforge::builtin
