#ifndef CELLFORGE_BUILTIN_NUMERIC_H_
#define CELLFORGE_BUILTIN_NUMERIC_H_

#include <functional>
#include <optional>
#include <string>

namespace cellforge::builtin::numeric {

constexpr double kPi = 3.14159265358979323846;

/// Abramowitz-Stegun 7.1.26; absolute error below 1.5e-7.
double Erf(double x);
double Erfc(double x);

double NormSPdf(double z);
double NormSCdf(double z);
/// Inverse standard normal CDF for p in (0, 1): Acklam's rational approximation refined by
/// Newton steps against NormSCdf.
double NormSInv(double p);

/// Lanczos approximation of ln|Gamma(x)| for x > 0.
double LogGamma(double x);
double Gamma(double x);
double LogBeta(double a, double b);

/// Regularized lower incomplete gamma P(a, x).
double RegularizedGammaP(double a, double x);
/// Regularized incomplete beta I_x(a, b).
double RegularizedBeta(double x, double a, double b);

/// Student t CDF with `df` degrees of freedom.
double StudentTCdf(double t, double df);

/// Drops binary noise below 15 significant digits, so 2.675*100 reads as 267.5.
double Snap15(double x);

/// Rounds half away from zero to `digits` decimals (negative digits round left of the point).
double RoundDigits(double x, int digits);
/// Rounds away from zero / toward zero at `digits` decimals.
double RoundUpDigits(double x, int digits);
double RoundDownDigits(double x, int digits);

/// ln(n choose k) for 0 <= k <= n.
double LogCombin(double n, double k);

/// Finds x in [lo, hi] with cdf(x) = p for a nondecreasing `cdf`, by bisection. The bracket is
/// widened upward (up to `max_hi`) when cdf(hi) < p. nullopt when p cannot be bracketed.
std::optional<double> InvertCdf(const std::function<double(double)>& cdf, double p, double lo,
                                double hi, double max_hi);

struct NewtonOptions {
  int max_iterations = 100;
  double tolerance = 1e-7;
  /// Iterates stop (failing) when |f'(x)| drops below this.
  double min_derivative = 1e-10;
  /// Iterates below this are rejected.
  double lower_bound = -0.99999;
};

/// Newton-Raphson root of f from `guess`. nullopt when the iteration leaves the domain, the
/// derivative vanishes or the iteration limit is reached. `label` names the caller in logs.
std::optional<double> NewtonSolve(const std::function<double(double)>& f,
                                  const std::function<double(double)>& df, double guess,
                                  const NewtonOptions& options, const std::string& label);

}  // namespace cellforge::builtin::numeric

#endif  // CELLFORGE_BUILTIN_NUMERIC_H_
