#include <cmath>

#include "builtin/date_serial.h"
#include "test_util.h"

namespace test {

namespace {

namespace dates = cellforge::builtin::dates;

void TestSerials(TestContext* ctx) {
  ExpectTrue(dates::DateToSerial(2024, 1, 15) == 45306, "serial_of_date", ctx);
  ExpectTrue(dates::DateToSerial(1900, 2, 29) == 60, "phantom_leap_day", ctx);
  ExpectTrue(dates::DateToSerial(1900, 3, 1) == 61, "march_first_1900", ctx);
  ExpectTrue(!dates::DateToSerial(10000, 1, 1).has_value(), "serial_out_of_range", ctx);
  auto civil = dates::SerialToDate(45351.75);
  ExpectTrue(civil && civil->year == 2024 && civil->month == 2 && civil->day == 29,
             "date_of_serial", ctx);
  ExpectTrue(dates::DayOfWeek(45306) == 1, "monday", ctx);
  ExpectTrue(dates::ParseDateText("1/15/24") == 45306, "parse_short_year", ctx);
  ExpectTrue(!dates::ParseDateText("2023-02-29").has_value(), "parse_rejects_bad_day", ctx);
  auto noon = dates::ParseTimeText("2024-01-15 12:00 PM");
  ExpectTrue(noon && *noon == 0.5, "parse_time_after_date", ctx);

  ExpectNumber("=DATE(2024, 1, 15)", 45306, ctx);
  ExpectNumber("=DATE(2024, 13, 1)", 45658, ctx);
  ExpectNumber("=DATE(2024, 3, 0)", 45351, ctx);
  ExpectNumber("=DATE(1900, 2, 29)", 60, ctx);
  ExpectNumber("=DATE(24, 1, 1)", 8767, ctx);
  ExpectError("=DATE(10000, 1, 1)", rt::ErrorKind::kNumber, ctx);
  ExpectError("=DATE(-1, 1, 1)", rt::ErrorKind::kNumber, ctx);

  // Splitting a serial into its parts and rebuilding it yields the same serial.
  for (int serial : {1, 59, 60, 61, 36526, 45351, 2958465}) {
    const std::string s = std::to_string(serial);
    ExpectNumber("=DATE(YEAR(" + s + "), MONTH(" + s + "), DAY(" + s + "))", serial, ctx);
  }

  ExpectNumber("=YEAR(\"2024-01-15\")", 2024, ctx);
  ExpectNumber("=MONTH(60)", 2, ctx);
  ExpectNumber("=DAY(60)", 29, ctx);
  ExpectError("=YEAR(-1)", rt::ErrorKind::kNumber, ctx);
  ExpectDisplay("=YEAR({45306,36526})", "{2024,2000}", ctx);
}

void TestTimes(TestContext* ctx) {
  ExpectNumber("=TIME(12, 0, 0)", 0.5, ctx);
  ExpectNumber("=TIME(25, 0, 0)", 1.0 / 24, ctx);
  ExpectNumber("=TIME(0, 90, 0)", 0.0625, ctx);
  ExpectError("=TIME(-1, 0, 0)", rt::ErrorKind::kNumber, ctx);
  ExpectNumber("=HOUR(0.75)", 18, ctx);
  ExpectNumber("=MINUTE(TIME(10, 30, 15))", 30, ctx);
  ExpectNumber("=SECOND(TIME(10, 30, 15))", 15, ctx);
  ExpectNumber("=HOUR(\"6:45 PM\")", 18, ctx);
  ExpectNumber("=TIMEVALUE(\"6:30 PM\")", 0.7708333333333334, ctx);
  ExpectNumber("=TIMEVALUE(\"06:30:30\")", (6 * 3600 + 30 * 60 + 30) / 86400.0, ctx);
  ExpectError("=TIMEVALUE(\"25:00\")", rt::ErrorKind::kValue, ctx);
  ExpectNumber("=DATEVALUE(\"2024-01-15\")", 45306, ctx);
  ExpectNumber("=DATEVALUE(\"1/15/2024\")", 45306, ctx);
  ExpectError("=DATEVALUE(\"2024-02-30\")", rt::ErrorKind::kValue, ctx);

  rt::Value today = EvalFormula("=TODAY()");
  rt::Value now = EvalFormula("=NOW()");
  ExpectTrue(today.IsNumber() && now.IsNumber() && today.number == std::floor(today.number) &&
                 now.number >= today.number && now.number - today.number < 1.0 + 1e-6,
             "today_and_now", ctx);
}

void TestCalendar(TestContext* ctx) {
  ExpectNumber("=WEEKDAY(DATE(2024, 1, 15))", 2, ctx);
  ExpectNumber("=WEEKDAY(DATE(2024, 1, 15), 2)", 1, ctx);
  ExpectNumber("=WEEKDAY(DATE(2024, 1, 15), 3)", 0, ctx);
  ExpectNumber("=WEEKDAY(DATE(2024, 1, 15), 11)", 1, ctx);
  ExpectNumber("=WEEKDAY(DATE(2024, 1, 15), 17)", 2, ctx);
  ExpectError("=WEEKDAY(DATE(2024, 1, 15), 4)", rt::ErrorKind::kNumber, ctx);
  ExpectNumber("=WEEKNUM(DATE(2024, 1, 15))", 3, ctx);
  ExpectNumber("=WEEKNUM(DATE(2024, 1, 15), 2)", 3, ctx);
  ExpectNumber("=WEEKNUM(DATE(2023, 1, 1), 21)", 52, ctx);
  ExpectNumber("=WEEKNUM(DATE(2024, 1, 15), 21)", 3, ctx);

  ExpectNumber("=EOMONTH(DATE(2024, 1, 15), 1)", 45351, ctx);
  ExpectNumber("=EOMONTH(DATE(2024, 1, 15), -1)", 45291, ctx);
  ExpectNumber("=EDATE(DATE(2024, 1, 31), 1)", 45351, ctx);
  ExpectNumber("=EDATE(DATE(2024, 3, 31), -12)", 45016, ctx);

  ExpectNumber("=DATEDIF(DATE(2020, 1, 15), DATE(2024, 1, 14), \"Y\")", 3, ctx);
  ExpectNumber("=DATEDIF(DATE(2020, 1, 15), DATE(2024, 1, 14), \"M\")", 47, ctx);
  ExpectNumber("=DATEDIF(DATE(2020, 1, 15), DATE(2024, 1, 14), \"d\")", 1460, ctx);
  ExpectNumber("=DATEDIF(DATE(2024, 1, 20), DATE(2024, 3, 5), \"MD\")", 14, ctx);
  ExpectNumber("=DATEDIF(DATE(2020, 5, 1), DATE(2024, 2, 1), \"YM\")", 9, ctx);
  ExpectNumber("=DATEDIF(DATE(2020, 5, 1), DATE(2024, 2, 1), \"YD\")", 276, ctx);
  ExpectError("=DATEDIF(DATE(2024, 1, 2), DATE(2024, 1, 1), \"D\")", rt::ErrorKind::kNumber,
              ctx);
  ExpectError("=DATEDIF(DATE(2024, 1, 1), DATE(2024, 1, 2), \"Q\")", rt::ErrorKind::kNumber,
              ctx);

  ExpectNumber("=DAYS(DATE(2024, 3, 1), DATE(2024, 1, 1))", 60, ctx);
  ExpectNumber("=DAYS360(DATE(2024, 1, 31), DATE(2024, 3, 31))", 60, ctx);
  ExpectNumber("=DAYS360(DATE(2024, 2, 29), DATE(2024, 3, 31))", 30, ctx);
  ExpectNumber("=DAYS360(DATE(2024, 2, 29), DATE(2024, 3, 31), TRUE)", 31, ctx);
}

void TestBusinessDays(TestContext* ctx) {
  ExpectNumber("=NETWORKDAYS(DATE(2024, 1, 1), DATE(2024, 1, 31))", 23, ctx);
  ExpectNumber("=NETWORKDAYS(DATE(2024, 1, 1), DATE(2024, 1, 31), DATE(2024, 1, 15))", 22, ctx);
  ExpectNumber("=NETWORKDAYS(DATE(2024, 1, 31), DATE(2024, 1, 1))", -23, ctx);
  ExpectError("=NETWORKDAYS(DATE(2024, 1, 1), DATE(2024, 1, 31), {\"x\"})",
              rt::ErrorKind::kValue, ctx);
  ExpectNumber("=WORKDAY(DATE(2024, 1, 5), 1)", 45299, ctx);
  ExpectNumber("=WORKDAY(DATE(2024, 1, 8), -1)", 45296, ctx);
  ExpectNumber("=WORKDAY(DATE(2024, 1, 5), 1, {45299})", 45300, ctx);
  ExpectNumber("=WORKDAY(DATE(2024, 1, 5), 0)", 45296, ctx);

  ExpectNumber("=YEARFRAC(DATE(2024, 1, 1), DATE(2024, 7, 1))", 0.5, ctx);
  ExpectNumber("=YEARFRAC(DATE(2024, 1, 1), DATE(2024, 7, 1), 1)", 182.0 / 366, ctx);
  ExpectNumber("=YEARFRAC(DATE(2024, 1, 1), DATE(2024, 7, 1), 2)", 182.0 / 360, ctx);
  ExpectNumber("=YEARFRAC(DATE(2024, 1, 1), DATE(2024, 7, 1), 3)", 182.0 / 365, ctx);
  ExpectNumber("=YEARFRAC(DATE(2024, 7, 1), DATE(2024, 1, 1), 3)", 182.0 / 365, ctx);
  ExpectError("=YEARFRAC(DATE(2024, 1, 1), DATE(2024, 7, 1), 5)", rt::ErrorKind::kNumber, ctx);
}

}  // namespace

void RunDateTimeTests(TestContext* ctx) {
  TestSerials(ctx);
  TestTimes(ctx);
  TestCalendar(ctx);
  TestBusinessDays(ctx);
}

}  // namespace test
