#include <algorithm>
#include <cmath>
#include <optional>
#include <vector>

#include "builtin/args.h"
#include "builtin/builtins.h"
#include "builtin/numeric.h"
#include "builtin/stats.h"

namespace cellforge::builtin {

namespace {

using runtime::CallArgs;
using runtime::ErrorKind;
using runtime::Scalar;
using runtime::Value;

namespace num = numeric;

constexpr Category kCat = Category::kStatistical;
constexpr double kSearchLimit = 1e10;

Value NumError() {
  return Value::Error(ErrorKind::kNumber);
}

Value NormDist(CallArgs& args) {
  double x = 0.0;
  double mean = 0.0;
  double sd = 0.0;
  bool cumulative = false;
  if (auto err = NumberArg(args, 0, &x)) return *err;
  if (auto err = NumberArg(args, 1, &mean)) return *err;
  if (auto err = NumberArg(args, 2, &sd)) return *err;
  if (auto err = BoolArg(args, 3, &cumulative)) return *err;
  if (sd <= 0) return NumError();
  const double z = (x - mean) / sd;
  return Value::Number(cumulative ? num::NormSCdf(z) : num::NormSPdf(z) / sd);
}

Value NormInv(CallArgs& args) {
  double p = 0.0;
  double mean = 0.0;
  double sd = 0.0;
  if (auto err = NumberArg(args, 0, &p)) return *err;
  if (auto err = NumberArg(args, 1, &mean)) return *err;
  if (auto err = NumberArg(args, 2, &sd)) return *err;
  if (p <= 0 || p >= 1 || sd <= 0) return NumError();
  return Value::Number(mean + sd * num::NormSInv(p));
}

Value NormSDist(CallArgs& args) {
  double z = 0.0;
  bool cumulative = true;
  if (auto err = NumberArg(args, 0, &z)) return *err;
  if (auto err = BoolArgOr(args, 1, true, &cumulative)) return *err;
  return Value::Number(cumulative ? num::NormSCdf(z) : num::NormSPdf(z));
}

Value NormSInv(CallArgs& args) {
  double p = 0.0;
  if (auto err = NumberArg(args, 0, &p)) return *err;
  if (p <= 0 || p >= 1) return NumError();
  return Value::Number(num::NormSInv(p));
}

Value LognormDist(CallArgs& args) {
  double x = 0.0;
  double mean = 0.0;
  double sd = 0.0;
  bool cumulative = false;
  if (auto err = NumberArg(args, 0, &x)) return *err;
  if (auto err = NumberArg(args, 1, &mean)) return *err;
  if (auto err = NumberArg(args, 2, &sd)) return *err;
  if (auto err = BoolArg(args, 3, &cumulative)) return *err;
  if (x <= 0 || sd <= 0) return NumError();
  const double z = (std::log(x) - mean) / sd;
  return Value::Number(cumulative ? num::NormSCdf(z) : num::NormSPdf(z) / (x * sd));
}

Value LognormInv(CallArgs& args) {
  double p = 0.0;
  double mean = 0.0;
  double sd = 0.0;
  if (auto err = NumberArg(args, 0, &p)) return *err;
  if (auto err = NumberArg(args, 1, &mean)) return *err;
  if (auto err = NumberArg(args, 2, &sd)) return *err;
  if (p <= 0 || p >= 1 || sd <= 0) return NumError();
  return Value::Number(std::exp(mean + sd * num::NormSInv(p)));
}

double PoissonPmf(double k, double mean) {
  if (mean == 0) return k == 0 ? 1.0 : 0.0;
  return std::exp(-mean + k * std::log(mean) - num::LogGamma(k + 1.0));
}

Value PoissonDist(CallArgs& args) {
  double x = 0.0;
  double mean = 0.0;
  bool cumulative = false;
  if (auto err = NumberArg(args, 0, &x)) return *err;
  if (auto err = NumberArg(args, 1, &mean)) return *err;
  if (auto err = BoolArg(args, 2, &cumulative)) return *err;
  x = std::trunc(x);
  if (x < 0 || mean < 0) return NumError();
  if (!cumulative) return Value::Number(PoissonPmf(x, mean));
  double total = 0.0;
  for (double k = 0; k <= x; ++k) total += PoissonPmf(k, mean);
  return Value::Number(std::min(total, 1.0));
}

Value ExponDist(CallArgs& args) {
  double x = 0.0;
  double lambda = 0.0;
  bool cumulative = false;
  if (auto err = NumberArg(args, 0, &x)) return *err;
  if (auto err = NumberArg(args, 1, &lambda)) return *err;
  if (auto err = BoolArg(args, 2, &cumulative)) return *err;
  if (x < 0 || lambda <= 0) return NumError();
  return Value::Number(cumulative ? 1.0 - std::exp(-lambda * x) : lambda * std::exp(-lambda * x));
}

double BinomPmf(double k, double n, double p) {
  if (p == 0) return k == 0 ? 1.0 : 0.0;
  if (p == 1) return k == n ? 1.0 : 0.0;
  return std::exp(num::LogCombin(n, k) + k * std::log(p) + (n - k) * std::log1p(-p));
}

bool IsWhole(double x) {
  return std::floor(x) == x;
}

double BinomCdf(double k, double n, double p) {
  double total = 0.0;
  for (double i = 0; i <= k; ++i) total += BinomPmf(i, n, p);
  return std::min(total, 1.0);
}

Value BinomDist(CallArgs& args) {
  double k = 0.0;
  double n = 0.0;
  double p = 0.0;
  bool cumulative = false;
  if (auto err = NumberArg(args, 0, &k)) return *err;
  if (auto err = NumberArg(args, 1, &n)) return *err;
  if (auto err = NumberArg(args, 2, &p)) return *err;
  if (auto err = BoolArg(args, 3, &cumulative)) return *err;
  if (!IsWhole(k) || !IsWhole(n)) return NumError();
  if (k < 0 || n < 0 || k > n || p < 0 || p > 1) return NumError();
  return Value::Number(cumulative ? BinomCdf(k, n, p) : BinomPmf(k, n, p));
}

/// Smallest k whose cumulative binomial probability reaches alpha.
Value BinomInv(CallArgs& args) {
  double n = 0.0;
  double p = 0.0;
  double alpha = 0.0;
  if (auto err = NumberArg(args, 0, &n)) return *err;
  if (auto err = NumberArg(args, 1, &p)) return *err;
  if (auto err = NumberArg(args, 2, &alpha)) return *err;
  if (!IsWhole(n) || n < 0) return NumError();
  if (p <= 0 || p >= 1 || alpha <= 0 || alpha >= 1) return NumError();
  double cdf = 0.0;
  for (double k = 0; k <= n; ++k) {
    cdf += BinomPmf(k, n, p);
    if (cdf >= alpha - 1e-12) return Value::Number(k);
  }
  return Value::Number(n);
}

double GammaPdf(double x, double a, double b) {
  if (x == 0) {
    if (a < 1) return HUGE_VAL;
    return a == 1 ? 1.0 / b : 0.0;
  }
  return std::exp((a - 1) * std::log(x) - x / b - a * std::log(b) - num::LogGamma(a));
}

Value GammaDist(CallArgs& args) {
  double x = 0.0;
  double a = 0.0;
  double b = 0.0;
  bool cumulative = false;
  if (auto err = NumberArg(args, 0, &x)) return *err;
  if (auto err = NumberArg(args, 1, &a)) return *err;
  if (auto err = NumberArg(args, 2, &b)) return *err;
  if (auto err = BoolArg(args, 3, &cumulative)) return *err;
  if (x < 0 || a <= 0 || b <= 0) return NumError();
  return Value::Number(cumulative ? num::RegularizedGammaP(a, x / b) : GammaPdf(x, a, b));
}

Value GammaInv(CallArgs& args) {
  double p = 0.0;
  double a = 0.0;
  double b = 0.0;
  if (auto err = NumberArg(args, 0, &p)) return *err;
  if (auto err = NumberArg(args, 1, &a)) return *err;
  if (auto err = NumberArg(args, 2, &b)) return *err;
  if (p < 0 || p >= 1 || a <= 0 || b <= 0) return NumError();
  if (p == 0) return Value::Number(0);
  auto x = num::InvertCdf([&](double v) { return num::RegularizedGammaP(a, v / b); }, p, 0.0,
                          std::max(1.0, 2.0 * a * b), kSearchLimit);
  if (!x) return NumError();
  return Value::Number(*x);
}

Value GammaLn(CallArgs& args) {
  double x = 0.0;
  if (auto err = NumberArg(args, 0, &x)) return *err;
  if (x <= 0) return NumError();
  return Value::Number(num::LogGamma(x));
}

Value GammaFn(CallArgs& args) {
  double x = 0.0;
  if (auto err = NumberArg(args, 0, &x)) return *err;
  if (x <= 0 && x == std::floor(x)) return NumError();
  return Value::Number(num::Gamma(x));
}

// Reads the optional [A, B] bounds of BETA.DIST / BETA.INV.
std::optional<Value> BetaBounds(CallArgs& args, size_t first, double* lo, double* hi) {
  if (auto err = NumberArgOr(args, first, 0.0, lo)) return err;
  if (auto err = NumberArgOr(args, first + 1, 1.0, hi)) return err;
  if (*lo >= *hi) return NumError();
  return std::nullopt;
}

Value BetaDist(CallArgs& args) {
  double x = 0.0;
  double a = 0.0;
  double b = 0.0;
  bool cumulative = false;
  double lo = 0.0;
  double hi = 1.0;
  if (auto err = NumberArg(args, 0, &x)) return *err;
  if (auto err = NumberArg(args, 1, &a)) return *err;
  if (auto err = NumberArg(args, 2, &b)) return *err;
  if (auto err = BoolArg(args, 3, &cumulative)) return *err;
  if (auto err = BetaBounds(args, 4, &lo, &hi)) return *err;
  if (a <= 0 || b <= 0 || x < lo || x > hi) return NumError();
  const double y = (x - lo) / (hi - lo);
  if (cumulative) return Value::Number(num::RegularizedBeta(y, a, b));
  if ((y == 0 && a < 1) || (y == 1 && b < 1)) return NumError();
  const double log_pdf =
      (a - 1) * std::log(y) + (b - 1) * std::log1p(-y) - num::LogBeta(a, b);
  return Value::Number(std::exp(log_pdf) / (hi - lo));
}

Value BetaInv(CallArgs& args) {
  double p = 0.0;
  double a = 0.0;
  double b = 0.0;
  double lo = 0.0;
  double hi = 1.0;
  if (auto err = NumberArg(args, 0, &p)) return *err;
  if (auto err = NumberArg(args, 1, &a)) return *err;
  if (auto err = NumberArg(args, 2, &b)) return *err;
  if (auto err = BetaBounds(args, 3, &lo, &hi)) return *err;
  if (p < 0 || p > 1 || a <= 0 || b <= 0) return NumError();
  auto y = num::InvertCdf([&](double v) { return num::RegularizedBeta(v, a, b); }, p, 0.0, 1.0,
                          1.0);
  if (!y) return NumError();
  return Value::Number(lo + *y * (hi - lo));
}

std::optional<Value> ChiArgs(CallArgs& args, double* x, double* df) {
  if (auto err = NumberArg(args, 0, x)) return err;
  if (auto err = NumberArg(args, 1, df)) return err;
  *df = std::trunc(*df);
  if (*df < 1 || *df > 1e10) return NumError();
  return std::nullopt;
}

Value ChisqDist(CallArgs& args) {
  double x = 0.0;
  double df = 0.0;
  bool cumulative = false;
  if (auto err = ChiArgs(args, &x, &df)) return *err;
  if (auto err = BoolArg(args, 2, &cumulative)) return *err;
  if (x < 0) return NumError();
  return Value::Number(cumulative ? num::RegularizedGammaP(df / 2.0, x / 2.0)
                                  : GammaPdf(x, df / 2.0, 2.0));
}

Value ChisqDistRt(CallArgs& args) {
  double x = 0.0;
  double df = 0.0;
  if (auto err = ChiArgs(args, &x, &df)) return *err;
  if (x < 0) return NumError();
  return Value::Number(1.0 - num::RegularizedGammaP(df / 2.0, x / 2.0));
}

Value ChisqInv(CallArgs& args) {
  double p = 0.0;
  double df = 0.0;
  if (auto err = ChiArgs(args, &p, &df)) return *err;
  if (p < 0 || p >= 1) return NumError();
  if (p == 0) return Value::Number(0);
  auto x = num::InvertCdf([&](double v) { return num::RegularizedGammaP(df / 2.0, v / 2.0); }, p,
                          0.0, std::max(1.0, 2.0 * df), kSearchLimit);
  if (!x) return NumError();
  return Value::Number(*x);
}

Value ChisqInvRt(CallArgs& args) {
  double p = 0.0;
  double df = 0.0;
  if (auto err = ChiArgs(args, &p, &df)) return *err;
  if (p <= 0 || p > 1) return NumError();
  if (p == 1) return Value::Number(0);
  auto x = num::InvertCdf(
      [&](double v) { return num::RegularizedGammaP(df / 2.0, v / 2.0); }, 1.0 - p, 0.0,
      std::max(1.0, 2.0 * df), kSearchLimit);
  if (!x) return NumError();
  return Value::Number(*x);
}

double FCdf(double x, double d1, double d2) {
  if (x <= 0) return 0.0;
  return num::RegularizedBeta(d1 * x / (d1 * x + d2), d1 / 2.0, d2 / 2.0);
}

double FPdf(double x, double d1, double d2) {
  if (x == 0) return d1 < 2 ? HUGE_VAL : (d1 == 2 ? 1.0 : 0.0);
  const double log_pdf = 0.5 * (d1 * std::log(d1 * x) + d2 * std::log(d2) -
                                (d1 + d2) * std::log(d1 * x + d2)) -
                         std::log(x) - num::LogBeta(d1 / 2.0, d2 / 2.0);
  return std::exp(log_pdf);
}

// First argument plus the two truncated degrees of freedom of the F functions.
std::optional<Value> FArgs(CallArgs& args, double* x, double* d1, double* d2) {
  if (auto err = NumberArg(args, 0, x)) return err;
  if (auto err = NumberArg(args, 1, d1)) return err;
  if (auto err = NumberArg(args, 2, d2)) return err;
  *d1 = std::trunc(*d1);
  *d2 = std::trunc(*d2);
  if (*d1 < 1 || *d2 < 1 || *d1 >= kSearchLimit || *d2 >= kSearchLimit) return NumError();
  return std::nullopt;
}

Value FDist(CallArgs& args) {
  double x = 0.0;
  double d1 = 0.0;
  double d2 = 0.0;
  bool cumulative = false;
  if (auto err = FArgs(args, &x, &d1, &d2)) return *err;
  if (auto err = BoolArg(args, 3, &cumulative)) return *err;
  if (x < 0) return NumError();
  return Value::Number(cumulative ? FCdf(x, d1, d2) : FPdf(x, d1, d2));
}

Value FDistRt(CallArgs& args) {
  double x = 0.0;
  double d1 = 0.0;
  double d2 = 0.0;
  if (auto err = FArgs(args, &x, &d1, &d2)) return *err;
  if (x < 0) return NumError();
  return Value::Number(1.0 - FCdf(x, d1, d2));
}

std::optional<double> FInverse(double p, double d1, double d2) {
  if (p == 0) return 0.0;
  return num::InvertCdf([&](double v) { return FCdf(v, d1, d2); }, p, 0.0, 10.0, kSearchLimit);
}

Value FInv(CallArgs& args) {
  double p = 0.0;
  double d1 = 0.0;
  double d2 = 0.0;
  if (auto err = FArgs(args, &p, &d1, &d2)) return *err;
  if (p < 0 || p >= 1) return NumError();
  auto x = FInverse(p, d1, d2);
  if (!x) return NumError();
  return Value::Number(*x);
}

Value FInvRt(CallArgs& args) {
  double p = 0.0;
  double d1 = 0.0;
  double d2 = 0.0;
  if (auto err = FArgs(args, &p, &d1, &d2)) return *err;
  if (p <= 0 || p > 1) return NumError();
  auto x = FInverse(1.0 - p, d1, d2);
  if (!x) return NumError();
  return Value::Number(*x);
}

// Numbers of array argument `i`; cells that are not numbers are skipped.
std::optional<Value> Sample(CallArgs& args, size_t i, std::vector<double>* out) {
  return CollectNumbersFrom(args.Get(i), true, out);
}

/// T.TEST(array1, array2, tails, type): type 1 paired, 2 equal variance, 3 unequal variance
/// (Welch).
Value TTest(CallArgs& args) {
  double tails = 0.0;
  double type = 0.0;
  if (auto err = NumberArg(args, 2, &tails)) return *err;
  if (auto err = NumberArg(args, 3, &type)) return *err;
  tails = std::trunc(tails);
  type = std::trunc(type);
  if ((tails != 1 && tails != 2) || type < 1 || type > 3) return NumError();
  double t = 0.0;
  double df = 0.0;
  if (type == 1) {
    auto xa = ArrayArg(args, 0);
    auto ya = ArrayArg(args, 1);
    if (xa->size() != ya->size()) return Value::Error(ErrorKind::kNotAvailable);
    std::vector<std::optional<double>> xv;
    std::vector<std::optional<double>> yv;
    if (auto err = NumericCells(*xa, &xv)) return *err;
    if (auto err = NumericCells(*ya, &yv)) return *err;
    std::vector<double> diffs;
    for (size_t i = 0; i < xv.size(); ++i) {
      if (xv[i] && yv[i]) diffs.push_back(*xv[i] - *yv[i]);
    }
    auto var = stats::Variance(diffs, true);
    if (!var || *var == 0) return Value::Error(ErrorKind::kDivByZero);
    const double n = static_cast<double>(diffs.size());
    t = stats::Mean(diffs) / std::sqrt(*var / n);
    df = n - 1;
  } else {
    std::vector<double> xs;
    std::vector<double> ys;
    if (auto err = Sample(args, 0, &xs)) return *err;
    if (auto err = Sample(args, 1, &ys)) return *err;
    auto vx = stats::Variance(xs, true);
    auto vy = stats::Variance(ys, true);
    if (!vx || !vy) return Value::Error(ErrorKind::kDivByZero);
    const double nx = static_cast<double>(xs.size());
    const double ny = static_cast<double>(ys.size());
    double se2 = 0.0;
    if (type == 2) {
      df = nx + ny - 2;
      se2 = ((nx - 1) * *vx + (ny - 1) * *vy) / df * (1 / nx + 1 / ny);
    } else {
      const double ax = *vx / nx;
      const double ay = *vy / ny;
      se2 = ax + ay;
      df = se2 * se2 / (ax * ax / (nx - 1) + ay * ay / (ny - 1));
    }
    if (se2 == 0) return Value::Error(ErrorKind::kDivByZero);
    t = (stats::Mean(xs) - stats::Mean(ys)) / std::sqrt(se2);
  }
  return Value::Number(tails * (1.0 - num::StudentTCdf(std::fabs(t), df)));
}

/// F.TEST(array1, array2): two-tailed probability that the variances do not differ.
Value FTest(CallArgs& args) {
  std::vector<double> xs;
  std::vector<double> ys;
  if (auto err = Sample(args, 0, &xs)) return *err;
  if (auto err = Sample(args, 1, &ys)) return *err;
  auto vx = stats::Variance(xs, true);
  auto vy = stats::Variance(ys, true);
  if (!vx || !vy || *vx == 0 || *vy == 0) return Value::Error(ErrorKind::kDivByZero);
  const double cdf = FCdf(*vx / *vy, static_cast<double>(xs.size()) - 1,
                          static_cast<double>(ys.size()) - 1);
  return Value::Number(2.0 * std::min(cdf, 1.0 - cdf));
}

/// CHISQ.TEST(actual_range, expected_range): independence test over a contingency table.
Value ChisqTest(CallArgs& args) {
  auto actual = ArrayArg(args, 0);
  auto expected = ArrayArg(args, 1);
  if (actual->rows != expected->rows || actual->cols != expected->cols) {
    return Value::Error(ErrorKind::kNotAvailable);
  }
  const int rows = actual->rows;
  const int cols = actual->cols;
  const double df = rows == 1 ? cols - 1.0 : cols == 1 ? rows - 1.0 : (rows - 1.0) * (cols - 1.0);
  if (df < 1) return Value::Error(ErrorKind::kNotAvailable);
  double chi = 0.0;
  for (size_t i = 0; i < actual->cells.size(); ++i) {
    const Scalar& a = actual->cells[i];
    const Scalar& e = expected->cells[i];
    if (a.IsError()) return Value::FromScalar(a);
    if (e.IsError()) return Value::FromScalar(e);
    if (!a.IsNumber() || !e.IsNumber()) continue;
    if (e.number == 0) return Value::Error(ErrorKind::kDivByZero);
    if (e.number < 0) return NumError();
    chi += (a.number - e.number) * (a.number - e.number) / e.number;
  }
  return Value::Number(1.0 - num::RegularizedGammaP(df / 2.0, chi / 2.0));
}

double StudentTPdf(double t, double df) {
  const double log_norm = num::LogGamma((df + 1) / 2) - num::LogGamma(df / 2) -
                          0.5 * std::log(df * num::kPi);
  return std::exp(log_norm - (df + 1) / 2 * std::log1p(t * t / df));
}

std::optional<Value> TArgs(CallArgs& args, double* x, double* df) {
  if (auto err = NumberArg(args, 0, x)) return err;
  if (auto err = NumberArg(args, 1, df)) return err;
  *df = std::trunc(*df);
  if (*df < 1) return NumError();
  return std::nullopt;
}

Value TDist(CallArgs& args) {
  double t = 0.0;
  double df = 0.0;
  bool cumulative = false;
  if (auto err = TArgs(args, &t, &df)) return *err;
  if (auto err = BoolArg(args, 2, &cumulative)) return *err;
  return Value::Number(cumulative ? num::StudentTCdf(t, df) : StudentTPdf(t, df));
}

Value TDistRt(CallArgs& args) {
  double t = 0.0;
  double df = 0.0;
  if (auto err = TArgs(args, &t, &df)) return *err;
  return Value::Number(1.0 - num::StudentTCdf(t, df));
}

Value TDist2T(CallArgs& args) {
  double t = 0.0;
  double df = 0.0;
  if (auto err = TArgs(args, &t, &df)) return *err;
  if (t < 0) return NumError();
  return Value::Number(2.0 * (1.0 - num::StudentTCdf(t, df)));
}

std::optional<double> StudentTInv(double p, double df) {
  if (p < 0.5) {
    auto upper = StudentTInv(1.0 - p, df);
    if (!upper) return std::nullopt;
    return -*upper;
  }
  return num::InvertCdf([df](double t) { return num::StudentTCdf(t, df); }, p, 0.0, 10.0,
                        kSearchLimit);
}

Value TInv(CallArgs& args) {
  double p = 0.0;
  double df = 0.0;
  if (auto err = TArgs(args, &p, &df)) return *err;
  if (p <= 0 || p >= 1) return NumError();
  auto t = StudentTInv(p, df);
  if (!t) return NumError();
  return Value::Number(*t);
}

Value TInv2T(CallArgs& args) {
  double p = 0.0;
  double df = 0.0;
  if (auto err = TArgs(args, &p, &df)) return *err;
  if (p <= 0 || p > 1) return NumError();
  auto t = StudentTInv(1.0 - p / 2.0, df);
  if (!t) return NumError();
  return Value::Number(*t);
}

Value WeibullDist(CallArgs& args) {
  double x = 0.0;
  double alpha = 0.0;
  double beta = 0.0;
  bool cumulative = false;
  if (auto err = NumberArg(args, 0, &x)) return *err;
  if (auto err = NumberArg(args, 1, &alpha)) return *err;
  if (auto err = NumberArg(args, 2, &beta)) return *err;
  if (auto err = BoolArg(args, 3, &cumulative)) return *err;
  if (x < 0 || alpha <= 0 || beta <= 0) return NumError();
  const double scaled = std::pow(x / beta, alpha);
  if (cumulative) return Value::Number(1.0 - std::exp(-scaled));
  return Value::Number(alpha / std::pow(beta, alpha) * std::pow(x, alpha - 1) *
                       std::exp(-scaled));
}

Value HypgeomDist(CallArgs& args) {
  double k = 0.0;
  double n = 0.0;
  double successes = 0.0;
  double population = 0.0;
  bool cumulative = false;
  if (auto err = NumberArg(args, 0, &k)) return *err;
  if (auto err = NumberArg(args, 1, &n)) return *err;
  if (auto err = NumberArg(args, 2, &successes)) return *err;
  if (auto err = NumberArg(args, 3, &population)) return *err;
  if (auto err = BoolArg(args, 4, &cumulative)) return *err;
  k = std::trunc(k);
  n = std::trunc(n);
  successes = std::trunc(successes);
  population = std::trunc(population);
  if (k < 0 || n <= 0 || successes <= 0 || population <= 0 || n > population ||
      successes > population || k > n || k > successes ||
      k < std::max(0.0, n + successes - population)) {
    return NumError();
  }
  auto pmf = [&](double i) {
    return std::exp(num::LogCombin(successes, i) +
                    num::LogCombin(population - successes, n - i) -
                    num::LogCombin(population, n));
  };
  if (!cumulative) return Value::Number(pmf(k));
  double total = 0.0;
  for (double i = std::max(0.0, n + successes - population); i <= k; ++i) total += pmf(i);
  return Value::Number(std::min(total, 1.0));
}

Value Erf(CallArgs& args) {
  double lower = 0.0;
  if (auto err = NumberArg(args, 0, &lower)) return *err;
  if (!args.Has(1)) return Value::Number(num::Erf(lower));
  double upper = 0.0;
  if (auto err = NumberArg(args, 1, &upper)) return *err;
  return Value::Number(num::Erf(upper) - num::Erf(lower));
}

Value Erfc(CallArgs& args) {
  double x = 0.0;
  if (auto err = NumberArg(args, 0, &x)) return *err;
  return Value::Number(num::Erfc(x));
}

}  // namespace

void RegisterDistributionFunctions(FunctionRegistry* registry) {
  constexpr unsigned kEw = kElementwise;
  registry->Add(FunctionId::kNormDist, "NORM.DIST", kCat, 4, 4, NormDist,
                "NORM.DIST(x, mean, standard_dev, cumulative)", "Normal distribution.", kEw);
  registry->Add(FunctionId::kNormInv, "NORM.INV", kCat, 3, 3, NormInv,
                "NORM.INV(probability, mean, standard_dev)", "Inverse normal distribution.",
                kEw);
  registry->Add(FunctionId::kNormSDist, "NORM.S.DIST", kCat, 1, 2, NormSDist,
                "NORM.S.DIST(z, [cumulative])", "Standard normal distribution.", kEw);
  registry->Add(FunctionId::kNormSInv, "NORM.S.INV", kCat, 1, 1, NormSInv,
                "NORM.S.INV(probability)", "Inverse standard normal distribution.", kEw);
  registry->Add(FunctionId::kLognormDist, "LOGNORM.DIST", kCat, 4, 4, LognormDist,
                "LOGNORM.DIST(x, mean, standard_dev, cumulative)", "Lognormal distribution.",
                kEw);
  registry->Add(FunctionId::kLognormInv, "LOGNORM.INV", kCat, 3, 3, LognormInv,
                "LOGNORM.INV(probability, mean, standard_dev)",
                "Inverse lognormal distribution.", kEw);
  registry->Add(FunctionId::kPoissonDist, "POISSON.DIST", kCat, 3, 3, PoissonDist,
                "POISSON.DIST(x, mean, cumulative)", "Poisson distribution.", kEw);
  registry->Add(FunctionId::kPoisson, "POISSON", kCat, 3, 3, PoissonDist,
                "POISSON(x, mean, cumulative)", "Poisson distribution.", kEw);
  registry->Add(FunctionId::kExponDist, "EXPON.DIST", kCat, 3, 3, ExponDist,
                "EXPON.DIST(x, lambda, cumulative)", "Exponential distribution.", kEw);
  registry->Add(FunctionId::kExponDistLegacy, "EXPONDIST", kCat, 3, 3, ExponDist,
                "EXPONDIST(x, lambda, cumulative)", "Exponential distribution.", kEw);
  registry->Add(FunctionId::kBinomDist, "BINOM.DIST", kCat, 4, 4, BinomDist,
                "BINOM.DIST(number_s, trials, probability_s, cumulative)",
                "Binomial distribution.", kEw);
  registry->Add(FunctionId::kBinomInv, "BINOM.INV", kCat, 3, 3, BinomInv,
                "BINOM.INV(trials, probability_s, alpha)",
                "Smallest count whose cumulative binomial probability reaches alpha.", kEw);
  registry->Add(FunctionId::kGammaDist, "GAMMA.DIST", kCat, 4, 4, GammaDist,
                "GAMMA.DIST(x, alpha, beta, cumulative)", "Gamma distribution.", kEw);
  registry->Add(FunctionId::kGammaInv, "GAMMA.INV", kCat, 3, 3, GammaInv,
                "GAMMA.INV(probability, alpha, beta)", "Inverse gamma distribution.", kEw);
  registry->Add(FunctionId::kGammaLn, "GAMMALN", kCat, 1, 1, GammaLn, "GAMMALN(x)",
                "Natural logarithm of the gamma function.", kEw);
  registry->Add(FunctionId::kGamma, "GAMMA", kCat, 1, 1, GammaFn, "GAMMA(number)",
                "Gamma function.", kEw);
  registry->Add(FunctionId::kBetaDist, "BETA.DIST", kCat, 4, 6, BetaDist,
                "BETA.DIST(x, alpha, beta, cumulative, [A], [B])", "Beta distribution.", kEw);
  registry->Add(FunctionId::kBetaInv, "BETA.INV", kCat, 3, 5, BetaInv,
                "BETA.INV(probability, alpha, beta, [A], [B])", "Inverse beta distribution.",
                kEw);
  registry->Add(FunctionId::kChisqDist, "CHISQ.DIST", kCat, 3, 3, ChisqDist,
                "CHISQ.DIST(x, deg_freedom, cumulative)", "Chi-squared distribution.", kEw);
  registry->Add(FunctionId::kChisqDistRt, "CHISQ.DIST.RT", kCat, 2, 2, ChisqDistRt,
                "CHISQ.DIST.RT(x, deg_freedom)", "Right-tailed chi-squared probability.", kEw);
  registry->Add(FunctionId::kChisqInv, "CHISQ.INV", kCat, 2, 2, ChisqInv,
                "CHISQ.INV(probability, deg_freedom)", "Inverse chi-squared distribution.",
                kEw);
  registry->Add(FunctionId::kChisqInvRt, "CHISQ.INV.RT", kCat, 2, 2, ChisqInvRt,
                "CHISQ.INV.RT(probability, deg_freedom)",
                "Inverse of the right-tailed chi-squared probability.", kEw);
  registry->Add(FunctionId::kChisqTest, "CHISQ.TEST", kCat, 2, 2, ChisqTest,
                "CHISQ.TEST(actual_range, expected_range)", "Chi-squared independence test.");
  registry->Add(FunctionId::kFDist, "F.DIST", kCat, 4, 4, FDist,
                "F.DIST(x, deg_freedom1, deg_freedom2, cumulative)", "F distribution.", kEw);
  registry->Add(FunctionId::kFDistRt, "F.DIST.RT", kCat, 3, 3, FDistRt,
                "F.DIST.RT(x, deg_freedom1, deg_freedom2)", "Right-tailed F probability.", kEw);
  registry->Add(FunctionId::kFInv, "F.INV", kCat, 3, 3, FInv,
                "F.INV(probability, deg_freedom1, deg_freedom2)", "Inverse F distribution.",
                kEw);
  registry->Add(FunctionId::kFInvRt, "F.INV.RT", kCat, 3, 3, FInvRt,
                "F.INV.RT(probability, deg_freedom1, deg_freedom2)",
                "Inverse of the right-tailed F probability.", kEw);
  registry->Add(FunctionId::kFTest, "F.TEST", kCat, 2, 2, FTest, "F.TEST(array1, array2)",
                "Two-tailed F-test of two variances.");
  registry->Add(FunctionId::kTTest, "T.TEST", kCat, 4, 4, TTest,
                "T.TEST(array1, array2, tails, type)", "Student t-test probability.");
  registry->Add(FunctionId::kTDist, "T.DIST", kCat, 3, 3, TDist,
                "T.DIST(x, deg_freedom, cumulative)", "Student t distribution.", kEw);
  registry->Add(FunctionId::kTDistRt, "T.DIST.RT", kCat, 2, 2, TDistRt,
                "T.DIST.RT(x, deg_freedom)", "Right-tailed Student t probability.", kEw);
  registry->Add(FunctionId::kTDist2T, "T.DIST.2T", kCat, 2, 2, TDist2T,
                "T.DIST.2T(x, deg_freedom)", "Two-tailed Student t probability.", kEw);
  registry->Add(FunctionId::kTInv, "T.INV", kCat, 2, 2, TInv, "T.INV(probability, deg_freedom)",
                "Left-tailed inverse Student t.", kEw);
  registry->Add(FunctionId::kTInv2T, "T.INV.2T", kCat, 2, 2, TInv2T,
                "T.INV.2T(probability, deg_freedom)", "Two-tailed inverse Student t.", kEw);
  registry->Add(FunctionId::kWeibullDist, "WEIBULL.DIST", kCat, 4, 4, WeibullDist,
                "WEIBULL.DIST(x, alpha, beta, cumulative)", "Weibull distribution.", kEw);
  registry->Add(FunctionId::kHypgeomDist, "HYPGEOM.DIST", kCat, 5, 5, HypgeomDist,
                "HYPGEOM.DIST(sample_s, number_sample, population_s, number_pop, cumulative)",
                "Hypergeometric distribution.", kEw);
  registry->Add(FunctionId::kErf, "ERF", kCat, 1, 2, Erf, "ERF(lower_limit, [upper_limit])",
                "Error function.", kEw);
  registry->Add(FunctionId::kErfc, "ERFC", kCat, 1, 1, Erfc, "ERFC(x)",
                "Complementary error function.", kEw);
}

}  // namespace cellforge::builtin
