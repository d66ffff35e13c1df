#include "builtin/numeric.h"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>

#include "util/log.h"

namespace cellforge::builtin::numeric {

double Erf(double x) {
  constexpr double a1 = 0.254829592;
  constexpr double a2 = -0.284496736;
  constexpr double a3 = 1.421413741;
  constexpr double a4 = -1.453152027;
  constexpr double a5 = 1.061405429;
  constexpr double p = 0.3275911;
  const double sign = x < 0 ? -1.0 : 1.0;
  const double ax = std::fabs(x);
  const double t = 1.0 / (1.0 + p * ax);
  const double y = 1.0 - (((((a5 * t + a4) * t) + a3) * t + a2) * t + a1) * t * std::exp(-ax * ax);
  return sign * y;
}

double Erfc(double x) {
  return 1.0 - Erf(x);
}

double NormSPdf(double z) {
  return std::exp(-0.5 * z * z) / std::sqrt(2.0 * kPi);
}

double NormSCdf(double z) {
  return 0.5 * (1.0 + Erf(z / std::sqrt(2.0)));
}

double NormSInv(double p) {
  static const double a[] = {-3.969683028665376e+01, 2.209460984245205e+02,
                             -2.759285104469687e+02, 1.383577518672690e+02,
                             -3.066479806614716e+01, 2.506628277459239e+00};
  static const double b[] = {-5.447609879822406e+01, 1.615858368580409e+02,
                             -1.556989798598866e+02, 6.680131188771972e+01,
                             -1.328068155288572e+01};
  static const double c[] = {-7.784894002430293e-03, -3.223964580411365e-01,
                             -2.400758277161838e+00, -2.549732539343734e+00,
                             4.374664141464968e+00,  2.938163982698783e+00};
  static const double d[] = {7.784695709041462e-03, 3.224671290700398e-01,
                             2.445134137142996e+00, 3.754408661907416e+00};
  constexpr double p_low = 0.02425;
  constexpr double p_high = 1.0 - p_low;

  double x;
  if (p < p_low) {
    double q = std::sqrt(-2.0 * std::log(p));
    x = (((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
        ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
  } else if (p <= p_high) {
    double q = p - 0.5;
    double r = q * q;
    x = (((((a[0] * r + a[1]) * r + a[2]) * r + a[3]) * r + a[4]) * r + a[5]) * q /
        (((((b[0] * r + b[1]) * r + b[2]) * r + b[3]) * r + b[4]) * r + 1.0);
  } else {
    double q = std::sqrt(-2.0 * std::log(1.0 - p));
    x = -(((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
        ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
  }
  // Refine so NormSCdf(NormSInv(p)) round-trips within the Erf error ceiling.
  for (int i = 0; i < 4; ++i) {
    double pdf = NormSPdf(x);
    if (pdf < 1e-300) break;
    double step = (NormSCdf(x) - p) / pdf;
    x -= step;
    if (std::fabs(step) < 1e-12) break;
  }
  return x;
}

double LogGamma(double x) {
  static const double g[] = {0.99999999999980993,  676.5203681218851,     -1259.1392167224028,
                             771.32342877765313,   -176.61502916214059,   12.507343278686905,
                             -0.13857109526572012, 9.9843695780195716e-6, 1.5056327351493116e-7};
  if (x < 0.5) {
    return std::log(kPi / std::fabs(std::sin(kPi * x))) - LogGamma(1.0 - x);
  }
  x -= 1.0;
  double a = g[0];
  const double t = x + 7.5;
  for (int i = 1; i < 9; ++i) {
    a += g[i] / (x + i);
  }
  return 0.5 * std::log(2.0 * kPi) + (x + 0.5) * std::log(t) - t + std::log(a);
}

double Gamma(double x) {
  if (x == std::floor(x) && x > 0 && x < 171) {
    double result = 1.0;
    for (int i = 2; i < static_cast<int>(x); ++i) result *= i;
    return result;
  }
  if (x < 0.5) {
    return kPi / (std::sin(kPi * x) * Gamma(1.0 - x));
  }
  return std::exp(LogGamma(x));
}

double LogBeta(double a, double b) {
  return LogGamma(a) + LogGamma(b) - LogGamma(a + b);
}

double RegularizedGammaP(double a, double x) {
  if (x <= 0.0) return 0.0;
  if (x < a + 1.0) {
    // Series expansion.
    double ap = a;
    double sum = 1.0 / a;
    double del = sum;
    for (int n = 0; n < 500; ++n) {
      ap += 1.0;
      del *= x / ap;
      sum += del;
      if (std::fabs(del) < std::fabs(sum) * 1e-15) break;
    }
    return sum * std::exp(-x + a * std::log(x) - LogGamma(a));
  }
  // Continued fraction (modified Lentz).
  constexpr double tiny = 1e-300;
  double b = x + 1.0 - a;
  double c = 1.0 / tiny;
  double d = 1.0 / b;
  double h = d;
  for (int i = 1; i < 500; ++i) {
    double an = -i * (i - a);
    b += 2.0;
    d = an * d + b;
    if (std::fabs(d) < tiny) d = tiny;
    c = b + an / c;
    if (std::fabs(c) < tiny) c = tiny;
    d = 1.0 / d;
    double del = d * c;
    h *= del;
    if (std::fabs(del - 1.0) < 1e-15) break;
  }
  return 1.0 - std::exp(-x + a * std::log(x) - LogGamma(a)) * h;
}

namespace {

double BetaContinuedFraction(double x, double a, double b) {
  constexpr double tiny = 1e-300;
  const double qab = a + b;
  const double qap = a + 1.0;
  const double qam = a - 1.0;
  double c = 1.0;
  double d = 1.0 - qab * x / qap;
  if (std::fabs(d) < tiny) d = tiny;
  d = 1.0 / d;
  double h = d;
  for (int m = 1; m <= 500; ++m) {
    const int m2 = 2 * m;
    double aa = m * (b - m) * x / ((qam + m2) * (a + m2));
    d = 1.0 + aa * d;
    if (std::fabs(d) < tiny) d = tiny;
    c = 1.0 + aa / c;
    if (std::fabs(c) < tiny) c = tiny;
    d = 1.0 / d;
    h *= d * c;
    aa = -(a + m) * (qab + m) * x / ((a + m2) * (qap + m2));
    d = 1.0 + aa * d;
    if (std::fabs(d) < tiny) d = tiny;
    c = 1.0 + aa / c;
    if (std::fabs(c) < tiny) c = tiny;
    d = 1.0 / d;
    double del = d * c;
    h *= del;
    if (std::fabs(del - 1.0) < 1e-15) break;
  }
  return h;
}

}  // namespace

double RegularizedBeta(double x, double a, double b) {
  if (x <= 0.0) return 0.0;
  if (x >= 1.0) return 1.0;
  const double front =
      std::exp(a * std::log(x) + b * std::log(1.0 - x) - LogBeta(a, b));
  if (x < (a + 1.0) / (a + b + 2.0)) {
    return front * BetaContinuedFraction(x, a, b) / a;
  }
  return 1.0 - front * BetaContinuedFraction(1.0 - x, b, a) / b;
}

double StudentTCdf(double t, double df) {
  const double x = df / (df + t * t);
  const double tail = 0.5 * RegularizedBeta(x, df / 2.0, 0.5);
  return t >= 0 ? 1.0 - tail : tail;
}

double Snap15(double x) {
  if (!std::isfinite(x)) return x;
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.15g", x);
  return std::strtod(buf, nullptr);
}

double RoundDigits(double x, int digits) {
  const double scale = std::pow(10.0, digits);
  return std::round(Snap15(x * scale)) / scale;
}

double RoundUpDigits(double x, int digits) {
  const double scale = std::pow(10.0, digits);
  const double v = Snap15(std::fabs(x) * scale);
  const double r = std::ceil(v) / scale;
  return x < 0 ? -r : r;
}

double RoundDownDigits(double x, int digits) {
  const double scale = std::pow(10.0, digits);
  const double v = Snap15(std::fabs(x) * scale);
  const double r = std::floor(v) / scale;
  return x < 0 && r != 0 ? -r : r;
}

double LogCombin(double n, double k) {
  return LogGamma(n + 1.0) - LogGamma(k + 1.0) - LogGamma(n - k + 1.0);
}

std::optional<double> InvertCdf(const std::function<double(double)>& cdf, double p, double lo,
                                double hi, double max_hi) {
  while (cdf(hi) < p) {
    if (hi >= max_hi) {
      return std::nullopt;
    }
    lo = hi;
    hi = std::fmin(hi * 2.0 + 1.0, max_hi);
  }
  if (cdf(lo) > p) {
    return std::nullopt;
  }
  for (int i = 0; i < 200; ++i) {
    double mid = 0.5 * (lo + hi);
    if (cdf(mid) < p) {
      lo = mid;
    } else {
      hi = mid;
    }
    if (hi - lo <= 1e-14 * std::fmax(1.0, std::fabs(hi))) break;
  }
  return 0.5 * (lo + hi);
}

std::optional<double> NewtonSolve(const std::function<double(double)>& f,
                                  const std::function<double(double)>& df, double guess,
                                  const NewtonOptions& options, const std::string& label) {
  double x = guess;
  for (int i = 0; i < options.max_iterations; ++i) {
    const double fx = f(x);
    if (!std::isfinite(fx)) break;
    if (std::fabs(fx) < options.tolerance) {
      return x;
    }
    const double slope = df(x);
    if (!std::isfinite(slope) || std::fabs(slope) < options.min_derivative) break;
    const double next = x - fx / slope;
    if (!std::isfinite(next) || next < options.lower_bound) break;
    if (std::fabs(next - x) < options.tolerance) {
      return next;
    }
    x = next;
  }
  util::Log({util::LogLevel::kDebug, "numeric", "root finder did not converge", "", label,
             "guess=" + std::to_string(guess)});
  return std::nullopt;
}

}  // namespace cellforge::builtin::numeric
