#include <algorithm>
#include <cmath>
#include <optional>
#include <string>
#include <vector>

#include "builtin/args.h"
#include "builtin/builtins.h"
#include "builtin/date_serial.h"
#include "builtin/numeric.h"

// Cash-flow conventions follow the reference spreadsheet: money paid out is negative, `type` 0
// means payments at period end and 1 at period start.

namespace cellforge::builtin {

namespace {

using runtime::CallArgs;
using runtime::ErrorKind;
using runtime::Value;

constexpr Category kCat = Category::kFinancial;
constexpr double kDaysPerYear = 365.0;

Value NumError() {
  return Value::Error(ErrorKind::kNumber);
}

double FvOf(double rate, double nper, double pmt, double pv, double type) {
  if (rate == 0) return -(pv + pmt * nper);
  const double growth = std::pow(1 + rate, nper);
  return -(pv * growth + pmt * (1 + rate * type) * (growth - 1) / rate);
}

double PvOf(double rate, double nper, double pmt, double fv, double type) {
  if (rate == 0) return -(fv + pmt * nper);
  const double growth = std::pow(1 + rate, nper);
  return -(fv + pmt * (1 + rate * type) * (growth - 1) / rate) / growth;
}

double PmtOf(double rate, double nper, double pv, double fv, double type) {
  if (rate == 0) return -(pv + fv) / nper;
  const double growth = std::pow(1 + rate, nper);
  return -rate * (fv + pv * growth) / ((1 + rate * type) * (growth - 1));
}

double IpmtOf(double rate, double per, double nper, double pv, double fv, double type) {
  if (type == 1 && per == 1) return 0.0;
  const double pmt = PmtOf(rate, nper, pv, fv, type);
  double interest = FvOf(rate, per - 1, pmt, pv, type) * rate;
  if (type == 1) interest /= 1 + rate;
  return interest;
}

// Reads the trailing [fv], [type] pair shared by the annuity functions.
std::optional<Value> FvAndType(CallArgs& args, size_t first, double* fv, double* type) {
  if (auto err = NumberArgOr(args, first, 0.0, fv)) return err;
  if (auto err = NumberArgOr(args, first + 1, 0.0, type)) return err;
  *type = *type != 0 ? 1.0 : 0.0;
  return std::nullopt;
}

Value Pv(CallArgs& args) {
  double rate = 0.0;
  double nper = 0.0;
  double pmt = 0.0;
  double fv = 0.0;
  double type = 0.0;
  if (auto err = NumberArg(args, 0, &rate)) return *err;
  if (auto err = NumberArg(args, 1, &nper)) return *err;
  if (auto err = NumberArg(args, 2, &pmt)) return *err;
  if (auto err = FvAndType(args, 3, &fv, &type)) return *err;
  return Value::Number(PvOf(rate, nper, pmt, fv, type));
}

Value Fv(CallArgs& args) {
  double rate = 0.0;
  double nper = 0.0;
  double pmt = 0.0;
  double pv = 0.0;
  double type = 0.0;
  if (auto err = NumberArg(args, 0, &rate)) return *err;
  if (auto err = NumberArg(args, 1, &nper)) return *err;
  if (auto err = NumberArg(args, 2, &pmt)) return *err;
  if (auto err = FvAndType(args, 3, &pv, &type)) return *err;
  return Value::Number(FvOf(rate, nper, pmt, pv, type));
}

Value Pmt(CallArgs& args) {
  double rate = 0.0;
  double nper = 0.0;
  double pv = 0.0;
  double fv = 0.0;
  double type = 0.0;
  if (auto err = NumberArg(args, 0, &rate)) return *err;
  if (auto err = NumberArg(args, 1, &nper)) return *err;
  if (auto err = NumberArg(args, 2, &pv)) return *err;
  if (auto err = FvAndType(args, 3, &fv, &type)) return *err;
  if (nper == 0) return NumError();
  return Value::Number(PmtOf(rate, nper, pv, fv, type));
}

// IPMT / PPMT: (rate, per, nper, pv, [fv], [type]).
Value PeriodPayment(CallArgs& args, bool principal) {
  double rate = 0.0;
  double per = 0.0;
  double nper = 0.0;
  double pv = 0.0;
  double fv = 0.0;
  double type = 0.0;
  if (auto err = NumberArg(args, 0, &rate)) return *err;
  if (auto err = NumberArg(args, 1, &per)) return *err;
  if (auto err = NumberArg(args, 2, &nper)) return *err;
  if (auto err = NumberArg(args, 3, &pv)) return *err;
  if (auto err = FvAndType(args, 4, &fv, &type)) return *err;
  if (per < 1 || per > nper) return NumError();
  const double interest = IpmtOf(rate, per, nper, pv, fv, type);
  if (!principal) return Value::Number(interest);
  return Value::Number(PmtOf(rate, nper, pv, fv, type) - interest);
}

Value Ipmt(CallArgs& args) {
  return PeriodPayment(args, false);
}

Value Ppmt(CallArgs& args) {
  return PeriodPayment(args, true);
}

Value Nper(CallArgs& args) {
  double rate = 0.0;
  double pmt = 0.0;
  double pv = 0.0;
  double fv = 0.0;
  double type = 0.0;
  if (auto err = NumberArg(args, 0, &rate)) return *err;
  if (auto err = NumberArg(args, 1, &pmt)) return *err;
  if (auto err = NumberArg(args, 2, &pv)) return *err;
  if (auto err = FvAndType(args, 3, &fv, &type)) return *err;
  if (rate == 0) {
    if (pmt == 0) return NumError();
    return Value::Number(-(pv + fv) / pmt);
  }
  const double z = pmt * (1 + rate * type) / rate;
  const double ratio = (z - fv) / (pv + z);
  if (ratio <= 0 || rate <= -1) return NumError();
  return Value::Number(std::log(ratio) / std::log1p(rate));
}

/// RATE(nper, pmt, pv, [fv], [type], [guess]): Newton from the guess, then bisection.
// A root inside the solver tolerance of zero is zero.
double SnapRate(double rate) {
  return std::fabs(rate) < numeric::NewtonOptions{}.tolerance ? 0.0 : rate;
}

Value Rate(CallArgs& args) {
  double nper = 0.0;
  double pmt = 0.0;
  double pv = 0.0;
  double fv = 0.0;
  double type = 0.0;
  double guess = 0.1;
  if (auto err = NumberArg(args, 0, &nper)) return *err;
  if (auto err = NumberArg(args, 1, &pmt)) return *err;
  if (auto err = NumberArg(args, 2, &pv)) return *err;
  if (auto err = FvAndType(args, 3, &fv, &type)) return *err;
  if (auto err = NumberArgOr(args, 5, 0.1, &guess)) return *err;
  if (nper <= 0) return NumError();
  auto f = [&](double r) {
    if (std::fabs(r) < 1e-12) return pv + pmt * nper + fv;
    const double growth = std::pow(1 + r, nper);
    return pv * growth + pmt * (1 + r * type) * (growth - 1) / r + fv;
  };
  auto df = [&](double r) {
    const double h = std::max(1e-8, std::fabs(r) * 1e-6);
    return (f(r + h) - f(r - h)) / (2 * h);
  };
  if (auto root = numeric::NewtonSolve(f, df, guess, numeric::NewtonOptions{}, "RATE")) {
    return Value::Number(SnapRate(*root));
  }
  double lo = -0.99;
  double hi = 1.0;
  while (f(lo) * f(hi) > 0 && hi < 1e3) hi *= 2;
  if (f(lo) * f(hi) > 0) return NumError();
  for (int i = 0; i < 200 && hi - lo > 1e-12; ++i) {
    const double mid = 0.5 * (lo + hi);
    if (f(lo) * f(mid) <= 0) {
      hi = mid;
    } else {
      lo = mid;
    }
  }
  return Value::Number(SnapRate(0.5 * (lo + hi)));
}

Value Npv(CallArgs& args) {
  double rate = 0.0;
  if (auto err = NumberArg(args, 0, &rate)) return *err;
  if (rate == -1) return Value::Error(ErrorKind::kDivByZero);
  std::vector<double> flows;
  if (auto err = CollectNumbers(args, 1, args.size(), &flows)) return *err;
  double total = 0.0;
  for (size_t i = 0; i < flows.size(); ++i) {
    total += flows[i] / std::pow(1 + rate, static_cast<double>(i + 1));
  }
  return Value::Number(total);
}

// Cash flows plus their dates, aligned, for XNPV and XIRR. Years are counted from the first
// date.
std::optional<Value> DatedFlows(CallArgs& args, size_t values_index, size_t dates_index,
                                std::vector<double>* flows, std::vector<double>* years) {
  auto values = ArrayArg(args, values_index);
  auto dates = ArrayArg(args, dates_index);
  if (auto err = FirstError(*values)) return err;
  if (auto err = FirstError(*dates)) return err;
  if (values->size() != dates->size()) return NumError();
  for (size_t i = 0; i < values->size(); ++i) {
    if (!values->cells[i].IsNumber() || !dates->cells[i].IsNumber()) {
      return Value::Error(ErrorKind::kValue);
    }
    const double day = std::floor(dates->cells[i].number);
    const double first = std::floor(dates->cells[0].number);
    if (day < first) return NumError();
    flows->push_back(values->cells[i].number);
    years->push_back((day - first) / kDaysPerYear);
  }
  return std::nullopt;
}

double DatedNpv(double rate, const std::vector<double>& flows, const std::vector<double>& years) {
  double total = 0.0;
  for (size_t i = 0; i < flows.size(); ++i) total += flows[i] / std::pow(1 + rate, years[i]);
  return total;
}

double DatedNpvSlope(double rate, const std::vector<double>& flows,
                     const std::vector<double>& years) {
  double total = 0.0;
  for (size_t i = 0; i < flows.size(); ++i) {
    total -= years[i] * flows[i] / std::pow(1 + rate, years[i] + 1);
  }
  return total;
}

/// XNPV(rate, values, dates); a discount base 1 + rate <= 0 is #NUM!.
Value Xnpv(CallArgs& args) {
  double rate = 0.0;
  if (auto err = NumberArg(args, 0, &rate)) return *err;
  if (1 + rate <= 0) return NumError();
  std::vector<double> flows;
  std::vector<double> years;
  if (auto err = DatedFlows(args, 1, 2, &flows, &years)) return *err;
  return Value::Number(DatedNpv(rate, flows, years));
}

bool HasSignChange(const std::vector<double>& flows) {
  bool positive = false;
  bool negative = false;
  for (double f : flows) {
    positive = positive || f > 0;
    negative = negative || f < 0;
  }
  return positive && negative;
}

// Newton root of a rate-of-return equation; #NUM! on too few flows, no sign change or no
// convergence.
Value SolveReturn(const std::vector<double>& flows, const std::vector<double>& years,
                  double guess, const char* label) {
  if (flows.size() < 2 || !HasSignChange(flows)) return NumError();
  auto root = numeric::NewtonSolve([&](double r) { return DatedNpv(r, flows, years); },
                                   [&](double r) { return DatedNpvSlope(r, flows, years); },
                                   guess, numeric::NewtonOptions{}, label);
  if (!root) return NumError();
  return Value::Number(SnapRate(*root));
}

Value Irr(CallArgs& args) {
  std::vector<double> flows;
  double guess = 0.1;
  if (auto err = CollectNumbersFrom(args.Get(0), true, &flows)) return *err;
  if (auto err = NumberArgOr(args, 1, 0.1, &guess)) return *err;
  std::vector<double> periods;
  for (size_t i = 0; i < flows.size(); ++i) periods.push_back(static_cast<double>(i));
  return SolveReturn(flows, periods, guess, "IRR");
}

Value Xirr(CallArgs& args) {
  std::vector<double> flows;
  std::vector<double> years;
  double guess = 0.1;
  if (auto err = DatedFlows(args, 0, 1, &flows, &years)) return *err;
  if (auto err = NumberArgOr(args, 2, 0.1, &guess)) return *err;
  return SolveReturn(flows, years, guess, "XIRR");
}

Value Mirr(CallArgs& args) {
  std::vector<double> flows;
  double finance_rate = 0.0;
  double reinvest_rate = 0.0;
  if (auto err = CollectNumbersFrom(args.Get(0), true, &flows)) return *err;
  if (auto err = NumberArg(args, 1, &finance_rate)) return *err;
  if (auto err = NumberArg(args, 2, &reinvest_rate)) return *err;
  if (flows.size() < 2 || !HasSignChange(flows)) return NumError();
  const double n = static_cast<double>(flows.size());
  double pv_negative = 0.0;
  double fv_positive = 0.0;
  for (size_t i = 0; i < flows.size(); ++i) {
    const double t = static_cast<double>(i);
    if (flows[i] < 0) {
      pv_negative += flows[i] / std::pow(1 + finance_rate, t);
    } else {
      fv_positive += flows[i] * std::pow(1 + reinvest_rate, n - 1 - t);
    }
  }
  return Value::Number(std::pow(fv_positive / -pv_negative, 1.0 / (n - 1)) - 1);
}

Value Effect(CallArgs& args) {
  double nominal = 0.0;
  double periods = 0.0;
  if (auto err = NumberArg(args, 0, &nominal)) return *err;
  if (auto err = NumberArg(args, 1, &periods)) return *err;
  periods = std::trunc(periods);
  if (nominal <= 0 || periods < 1) return NumError();
  return Value::Number(std::pow(1 + nominal / periods, periods) - 1);
}

Value Nominal(CallArgs& args) {
  double effect = 0.0;
  double periods = 0.0;
  if (auto err = NumberArg(args, 0, &effect)) return *err;
  if (auto err = NumberArg(args, 1, &periods)) return *err;
  periods = std::trunc(periods);
  if (effect <= 0 || periods < 1) return NumError();
  return Value::Number(periods * (std::pow(1 + effect, 1 / periods) - 1));
}

Value Sln(CallArgs& args) {
  double cost = 0.0;
  double salvage = 0.0;
  double life = 0.0;
  if (auto err = NumberArg(args, 0, &cost)) return *err;
  if (auto err = NumberArg(args, 1, &salvage)) return *err;
  if (auto err = NumberArg(args, 2, &life)) return *err;
  if (life == 0) return Value::Error(ErrorKind::kDivByZero);
  return Value::Number((cost - salvage) / life);
}

/// DB(cost, salvage, life, period, [month]): fixed-declining balance with the rate rounded to
/// three decimals and partial first and last years.
Value Db(CallArgs& args) {
  double cost = 0.0;
  double salvage = 0.0;
  double life = 0.0;
  double period = 0.0;
  double month = 12.0;
  if (auto err = NumberArg(args, 0, &cost)) return *err;
  if (auto err = NumberArg(args, 1, &salvage)) return *err;
  if (auto err = NumberArg(args, 2, &life)) return *err;
  if (auto err = NumberArg(args, 3, &period)) return *err;
  if (auto err = NumberArgOr(args, 4, 12.0, &month)) return *err;
  period = std::trunc(period);
  month = std::trunc(month);
  if (cost < 0 || salvage < 0 || life <= 0 || period < 1 || month < 1 || month > 12 ||
      period > life + (month < 12 ? 1 : 0)) {
    return NumError();
  }
  if (cost == 0) return Value::Number(0);
  const double rate = numeric::RoundDigits(1 - std::pow(salvage / cost, 1 / life), 3);
  double total = 0.0;
  double depreciation = 0.0;
  for (double p = 1; p <= period; ++p) {
    if (p == 1) {
      depreciation = cost * rate * month / 12;
    } else if (p == life + 1) {
      depreciation = (cost - total) * rate * (12 - month) / 12;
    } else {
      depreciation = (cost - total) * rate;
    }
    total += depreciation;
  }
  return Value::Number(depreciation);
}

Value Ddb(CallArgs& args) {
  double cost = 0.0;
  double salvage = 0.0;
  double life = 0.0;
  double period = 0.0;
  double factor = 2.0;
  if (auto err = NumberArg(args, 0, &cost)) return *err;
  if (auto err = NumberArg(args, 1, &salvage)) return *err;
  if (auto err = NumberArg(args, 2, &life)) return *err;
  if (auto err = NumberArg(args, 3, &period)) return *err;
  if (auto err = NumberArgOr(args, 4, 2.0, &factor)) return *err;
  if (cost < 0 || salvage < 0 || life <= 0 || period <= 0 || period > life || factor <= 0) {
    return NumError();
  }
  double book = cost;
  double depreciation = 0.0;
  for (double p = 1; p <= std::ceil(period); ++p) {
    depreciation = std::min(book * factor / life, std::max(0.0, book - salvage));
    book -= depreciation;
  }
  return Value::Number(depreciation);
}

Value Syd(CallArgs& args) {
  double cost = 0.0;
  double salvage = 0.0;
  double life = 0.0;
  double period = 0.0;
  if (auto err = NumberArg(args, 0, &cost)) return *err;
  if (auto err = NumberArg(args, 1, &salvage)) return *err;
  if (auto err = NumberArg(args, 2, &life)) return *err;
  if (auto err = NumberArg(args, 3, &period)) return *err;
  if (life <= 0 || period <= 0 || period > life) return NumError();
  return Value::Number((cost - salvage) * (life - period + 1) * 2 / (life * (life + 1)));
}

// Declining-balance depreciation of one period, never taking the book value below salvage.
double DecliningTerm(double cost, double salvage, double life, double period, double factor) {
  double rate = factor / life;
  double old_value = 0.0;
  if (rate >= 1) {
    rate = 1;
    old_value = period == 1 ? cost : 0;
  } else {
    old_value = cost * std::pow(1 - rate, period - 1);
  }
  const double new_value = cost * std::pow(1 - rate, period);
  const double term = new_value < salvage ? old_value - salvage : old_value - new_value;
  return std::max(term, 0.0);
}

// Depreciation over the first `period` periods of an asset with `remaining` life left,
// switching to straight line once that exceeds the declining-balance term.
double SwitchingDepreciation(double cost, double salvage, double life, double remaining,
                             double period, double factor) {
  const double last = std::ceil(period);
  double depreciable = cost - salvage;
  double straight = 0.0;
  bool switched = false;
  double total = 0.0;
  for (double i = 1; i <= last; ++i) {
    double term = 0.0;
    if (switched) {
      term = straight;
    } else {
      const double declining = DecliningTerm(cost, salvage, life, i, factor);
      straight = depreciable / (remaining - (i - 1));
      if (straight > declining) {
        term = straight;
        switched = true;
      } else {
        term = declining;
        depreciable -= declining;
      }
    }
    if (i == last) term *= period + 1 - last;
    total += term;
  }
  return total;
}

/// VDB(cost, salvage, life, start_period, end_period, [factor], [no_switch]): declining-balance
/// depreciation between two possibly fractional periods.
Value Vdb(CallArgs& args) {
  double cost = 0.0;
  double salvage = 0.0;
  double life = 0.0;
  double start = 0.0;
  double end = 0.0;
  double factor = 2.0;
  bool no_switch = false;
  if (auto err = NumberArg(args, 0, &cost)) return *err;
  if (auto err = NumberArg(args, 1, &salvage)) return *err;
  if (auto err = NumberArg(args, 2, &life)) return *err;
  if (auto err = NumberArg(args, 3, &start)) return *err;
  if (auto err = NumberArg(args, 4, &end)) return *err;
  if (auto err = NumberArgOr(args, 5, 2.0, &factor)) return *err;
  if (auto err = BoolArgOr(args, 6, false, &no_switch)) return *err;
  if (cost < 0 || salvage < 0 || salvage > cost || life <= 0 || start < 0 || end < start ||
      end > life || factor <= 0) {
    return NumError();
  }
  const double first = std::floor(start);
  const double last = std::ceil(end);
  if (no_switch) {
    double total = 0.0;
    for (double i = first + 1; i <= last; ++i) {
      double term = DecliningTerm(cost, salvage, life, i, factor);
      if (i == first + 1) {
        term *= std::min(end, first + 1) - start;
      } else if (i == last) {
        term *= end + 1 - last;
      }
      total += term;
    }
    return Value::Number(total);
  }
  double partial = 0.0;
  if (start != first) {
    const double book = cost - SwitchingDepreciation(cost, salvage, life, life, first, factor);
    partial += (start - first) *
               SwitchingDepreciation(book, salvage, life, life - first, 1, factor);
  }
  if (end != last) {
    const double before = last - 1;
    const double book = cost - SwitchingDepreciation(cost, salvage, life, life, before, factor);
    partial += (last - end) *
               SwitchingDepreciation(book, salvage, life, life - before, 1, factor);
  }
  const double book = cost - SwitchingDepreciation(cost, salvage, life, life, first, factor);
  return Value::Number(
      SwitchingDepreciation(book, salvage, life, life - first, last - first, factor) - partial);
}

Value FvSchedule(CallArgs& args) {
  double principal = 0.0;
  if (auto err = NumberArg(args, 0, &principal)) return *err;
  auto schedule = ArrayArg(args, 1);
  for (const runtime::Scalar& cell : schedule->cells) {
    if (cell.IsError()) return Value::FromScalar(cell);
    if (cell.IsEmpty()) continue;
    if (!cell.IsNumber()) return Value::Error(ErrorKind::kValue);
    principal *= 1 + cell.number;
  }
  return Value::Number(principal);
}

// Settlement and maturity serials plus the year fraction between them for DISC and INTRATE.
std::optional<Value> DiscountTerm(CallArgs& args, double* years) {
  double settlement = 0.0;
  double maturity = 0.0;
  int64_t basis = 0;
  if (auto err = NumberArg(args, 0, &settlement)) return err;
  if (auto err = NumberArg(args, 1, &maturity)) return err;
  if (auto err = IntArgOr(args, 4, 0, &basis)) return err;
  settlement = std::floor(settlement);
  maturity = std::floor(maturity);
  if (settlement < 0 || maturity > static_cast<double>(dates::kMaxSerial) ||
      settlement >= maturity) {
    return NumError();
  }
  auto fraction = dates::YearFraction(static_cast<int64_t>(settlement),
                                      static_cast<int64_t>(maturity), basis);
  if (!fraction || *fraction <= 0) return NumError();
  *years = *fraction;
  return std::nullopt;
}

/// DISC(settlement, maturity, pr, redemption, [basis]): discount rate of a security.
Value Disc(CallArgs& args) {
  double years = 0.0;
  double price = 0.0;
  double redemption = 0.0;
  if (auto err = DiscountTerm(args, &years)) return *err;
  if (auto err = NumberArg(args, 2, &price)) return *err;
  if (auto err = NumberArg(args, 3, &redemption)) return *err;
  if (price <= 0 || redemption <= 0) return NumError();
  return Value::Number((redemption - price) / redemption / years);
}

/// INTRATE(settlement, maturity, investment, redemption, [basis]): interest rate of a fully
/// invested security.
Value IntRate(CallArgs& args) {
  double years = 0.0;
  double investment = 0.0;
  double redemption = 0.0;
  if (auto err = DiscountTerm(args, &years)) return *err;
  if (auto err = NumberArg(args, 2, &investment)) return *err;
  if (auto err = NumberArg(args, 3, &redemption)) return *err;
  if (investment <= 0 || redemption <= 0) return NumError();
  return Value::Number((redemption - investment) / investment / years);
}

// CUMIPMT / CUMPRINC: (rate, nper, pv, start_period, end_period, type).
Value Cumulative(CallArgs& args, bool principal) {
  double rate = 0.0;
  double nper = 0.0;
  double pv = 0.0;
  double start = 0.0;
  double end = 0.0;
  double type = 0.0;
  if (auto err = NumberArg(args, 0, &rate)) return *err;
  if (auto err = NumberArg(args, 1, &nper)) return *err;
  if (auto err = NumberArg(args, 2, &pv)) return *err;
  if (auto err = NumberArg(args, 3, &start)) return *err;
  if (auto err = NumberArg(args, 4, &end)) return *err;
  if (auto err = NumberArg(args, 5, &type)) return *err;
  start = std::ceil(start);
  end = std::floor(end);
  if (rate <= 0 || nper <= 0 || pv <= 0 || start < 1 || end < start || end > nper ||
      (type != 0 && type != 1)) {
    return NumError();
  }
  const double pmt = PmtOf(rate, nper, pv, 0, type);
  double total = 0.0;
  for (double per = start; per <= end; ++per) {
    const double interest = IpmtOf(rate, per, nper, pv, 0, type);
    total += principal ? pmt - interest : interest;
  }
  return Value::Number(total);
}

Value CumIpmt(CallArgs& args) {
  return Cumulative(args, false);
}

Value CumPrinc(CallArgs& args) {
  return Cumulative(args, true);
}

}  // namespace

void RegisterFinancialFunctions(FunctionRegistry* registry) {
  registry->Add(FunctionId::kNpv, "NPV", kCat, 2, kVariadic, Npv,
                "NPV(rate, value1, [value2], ...)", "Net present value of periodic flows.");
  registry->Add(FunctionId::kXnpv, "XNPV", kCat, 3, 3, Xnpv, "XNPV(rate, values, dates)",
                "Net present value of dated flows.");
  registry->Add(FunctionId::kPv, "PV", kCat, 3, 5, Pv, "PV(rate, nper, pmt, [fv], [type])",
                "Present value of an annuity.");
  registry->Add(FunctionId::kFv, "FV", kCat, 3, 5, Fv, "FV(rate, nper, pmt, [pv], [type])",
                "Future value of an annuity.");
  registry->Add(FunctionId::kPmt, "PMT", kCat, 3, 5, Pmt, "PMT(rate, nper, pv, [fv], [type])",
                "Periodic payment of a loan.");
  registry->Add(FunctionId::kIpmt, "IPMT", kCat, 4, 6, Ipmt,
                "IPMT(rate, per, nper, pv, [fv], [type])", "Interest part of a payment.");
  registry->Add(FunctionId::kPpmt, "PPMT", kCat, 4, 6, Ppmt,
                "PPMT(rate, per, nper, pv, [fv], [type])", "Principal part of a payment.");
  registry->Add(FunctionId::kNper, "NPER", kCat, 3, 5, Nper, "NPER(rate, pmt, pv, [fv], [type])",
                "Number of payment periods.");
  registry->Add(FunctionId::kRate, "RATE", kCat, 3, 6, Rate,
                "RATE(nper, pmt, pv, [fv], [type], [guess])", "Interest rate per period.");
  registry->Add(FunctionId::kIrr, "IRR", kCat, 1, 2, Irr, "IRR(values, [guess])",
                "Internal rate of return of periodic flows.");
  registry->Add(FunctionId::kXirr, "XIRR", kCat, 2, 3, Xirr, "XIRR(values, dates, [guess])",
                "Internal rate of return of dated flows.");
  registry->Add(FunctionId::kMirr, "MIRR", kCat, 3, 3, Mirr,
                "MIRR(values, finance_rate, reinvest_rate)", "Modified internal rate of return.");
  registry->Add(FunctionId::kEffect, "EFFECT", kCat, 2, 2, Effect, "EFFECT(nominal_rate, npery)",
                "Effective annual rate.", kElementwise);
  registry->Add(FunctionId::kNominal, "NOMINAL", kCat, 2, 2, Nominal,
                "NOMINAL(effect_rate, npery)", "Nominal annual rate.", kElementwise);
  registry->Add(FunctionId::kSln, "SLN", kCat, 3, 3, Sln, "SLN(cost, salvage, life)",
                "Straight-line depreciation.");
  registry->Add(FunctionId::kDb, "DB", kCat, 4, 5, Db, "DB(cost, salvage, life, period, [month])",
                "Fixed-declining balance depreciation.");
  registry->Add(FunctionId::kDdb, "DDB", kCat, 4, 5, Ddb,
                "DDB(cost, salvage, life, period, [factor])",
                "Double-declining balance depreciation.");
  registry->Add(FunctionId::kSyd, "SYD", kCat, 4, 4, Syd, "SYD(cost, salvage, life, per)",
                "Sum-of-years' digits depreciation.");
  registry->Add(FunctionId::kVdb, "VDB", kCat, 5, 7, Vdb,
                "VDB(cost, salvage, life, start_period, end_period, [factor], [no_switch])",
                "Declining-balance depreciation between two periods.");
  registry->Add(FunctionId::kFvSchedule, "FVSCHEDULE", kCat, 2, 2, FvSchedule,
                "FVSCHEDULE(principal, schedule)", "Future value under a series of rates.");
  registry->Add(FunctionId::kDisc, "DISC", kCat, 4, 5, Disc,
                "DISC(settlement, maturity, pr, redemption, [basis])",
                "Discount rate of a security.");
  registry->Add(FunctionId::kIntRate, "INTRATE", kCat, 4, 5, IntRate,
                "INTRATE(settlement, maturity, investment, redemption, [basis])",
                "Interest rate of a fully invested security.");
  registry->Add(FunctionId::kCumIpmt, "CUMIPMT", kCat, 6, 6, CumIpmt,
                "CUMIPMT(rate, nper, pv, start_period, end_period, type)",
                "Interest paid between two periods.");
  registry->Add(FunctionId::kCumPrinc, "CUMPRINC", kCat, 6, 6, CumPrinc,
                "CUMPRINC(rate, nper, pv, start_period, end_period, type)",
                "Principal paid between two periods.");
}

}  // namespace cellforge::builtin
