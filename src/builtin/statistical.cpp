#include <algorithm>
#include <cmath>
#include <map>
#include <optional>
#include <vector>

#include "builtin/args.h"
#include "builtin/builtins.h"
#include "builtin/numeric.h"
#include "builtin/stats.h"
#include "runtime/coerce.h"

namespace cellforge::builtin {

namespace {

using runtime::CallArgs;
using runtime::ErrorKind;
using runtime::Scalar;
using runtime::Value;

constexpr Category kCat = Category::kStatistical;

Value NumError() {
  return Value::Error(ErrorKind::kNumber);
}

Value DivError() {
  return Value::Error(ErrorKind::kDivByZero);
}

Value Average(CallArgs& args) {
  return stats::AggregateByCode(1, args, 0);
}

Value AverageA(CallArgs& args) {
  std::vector<double> xs;
  if (auto err = CollectNumbers(args, 0, args.size(), &xs, CollectMode::kAllValues)) return *err;
  if (xs.empty()) return DivError();
  return Value::Number(stats::Mean(xs));
}

// COUNT skips errors and, inside arrays and references, anything that is not a number.
Value Count(CallArgs& args) {
  double count = 0;
  for (size_t i = 0; i < args.size(); ++i) {
    if (!args.Has(i)) continue;
    Value v = args.Get(i);
    if (v.IsArray()) {
      for (const Scalar& cell : v.array->cells) {
        if (cell.IsNumber()) ++count;
      }
      continue;
    }
    Scalar s = v.ToScalar();
    if (s.IsNumber()) {
      ++count;
    } else if (!args.IsReference(i) &&
               (s.IsBoolean() || (s.IsText() && runtime::ParseNumberText(s.text)))) {
      ++count;
    }
  }
  return Value::Number(count);
}

Value CountA(CallArgs& args) {
  return Value::Number(stats::CountNonEmpty(args, 0));
}

Value CountBlank(CallArgs& args) {
  auto array = ArrayArg(args, 0);
  double count = 0;
  for (const Scalar& cell : array->cells) {
    if (cell.IsEmpty() || (cell.IsText() && cell.text.empty())) ++count;
  }
  return Value::Number(count);
}

Value Extreme(CallArgs& args, bool max, CollectMode mode) {
  std::vector<double> xs;
  if (auto err = CollectNumbers(args, 0, args.size(), &xs, mode)) return *err;
  if (xs.empty()) return Value::Number(0);
  return Value::Number(max ? *std::max_element(xs.begin(), xs.end())
                           : *std::min_element(xs.begin(), xs.end()));
}

Value Min(CallArgs& args) {
  return Extreme(args, false, CollectMode::kNumbersOnly);
}

Value Max(CallArgs& args) {
  return Extreme(args, true, CollectMode::kNumbersOnly);
}

Value MinA(CallArgs& args) {
  return Extreme(args, false, CollectMode::kAllValues);
}

Value MaxA(CallArgs& args) {
  return Extreme(args, true, CollectMode::kAllValues);
}

Value Median(CallArgs& args) {
  std::vector<double> xs;
  if (auto err = CollectNumbers(args, 0, args.size(), &xs)) return *err;
  if (xs.empty()) return NumError();
  return Value::Number(stats::Median(std::move(xs)));
}

/// Most frequent value; ties go to the value seen first.
Value Mode(CallArgs& args) {
  std::vector<double> xs;
  if (auto err = CollectNumbers(args, 0, args.size(), &xs)) return *err;
  std::map<double, int> counts;
  for (double x : xs) ++counts[x];
  int best = 1;
  std::optional<double> mode;
  for (double x : xs) {
    if (counts[x] > best) {
      best = counts[x];
      mode = x;
    }
  }
  if (!mode) return Value::Error(ErrorKind::kNotAvailable);
  return Value::Number(*mode);
}

/// Every value sharing the highest count, in order of first appearance, as a column.
Value ModeMult(CallArgs& args) {
  std::vector<double> xs;
  if (auto err = CollectNumbers(args, 0, args.size(), &xs)) return *err;
  std::map<double, int> counts;
  int best = 1;
  for (double x : xs) best = std::max(best, ++counts[x]);
  if (best < 2) return Value::Error(ErrorKind::kNotAvailable);
  std::vector<double> modes;
  for (double x : xs) {
    if (counts[x] == best) {
      modes.push_back(x);
      counts[x] = 0;
    }
  }
  runtime::Array out(static_cast<int>(modes.size()), 1);
  for (size_t i = 0; i < modes.size(); ++i) out.cells[i] = Scalar::Number(modes[i]);
  return GridResult(std::move(out));
}

Value Spread(CallArgs& args, bool sample, bool root,
             CollectMode mode = CollectMode::kNumbersOnly) {
  std::vector<double> xs;
  if (auto err = CollectNumbers(args, 0, args.size(), &xs, mode)) return *err;
  auto var = stats::Variance(xs, sample);
  if (!var) return DivError();
  return Value::Number(root ? std::sqrt(*var) : *var);
}

Value StdevS(CallArgs& args) {
  return Spread(args, true, true);
}

Value StdevP(CallArgs& args) {
  return Spread(args, false, true);
}

Value VarS(CallArgs& args) {
  return Spread(args, true, false);
}

Value VarP(CallArgs& args) {
  return Spread(args, false, false);
}

Value StdevA(CallArgs& args) {
  return Spread(args, true, true, CollectMode::kAllValues);
}

Value StdevPA(CallArgs& args) {
  return Spread(args, false, true, CollectMode::kAllValues);
}

Value VarA(CallArgs& args) {
  return Spread(args, true, false, CollectMode::kAllValues);
}

Value VarPA(CallArgs& args) {
  return Spread(args, false, false, CollectMode::kAllValues);
}

std::optional<Value> CollectArray(CallArgs& args, size_t i, std::vector<double>* out) {
  return CollectNumbersFrom(args.Get(i), true, out);
}

Value Kth(CallArgs& args, bool largest) {
  std::vector<double> xs;
  double k = 0.0;
  if (auto err = CollectArray(args, 0, &xs)) return *err;
  if (auto err = NumberArg(args, 1, &k)) return *err;
  k = std::ceil(k);
  if (k < 1 || k > static_cast<double>(xs.size())) return NumError();
  std::sort(xs.begin(), xs.end());
  const size_t index = static_cast<size_t>(k) - 1;
  return Value::Number(largest ? xs[xs.size() - 1 - index] : xs[index]);
}

Value Large(CallArgs& args) {
  return Kth(args, true);
}

Value Small(CallArgs& args) {
  return Kth(args, false);
}

Value RankImpl(CallArgs& args, bool average) {
  double x = 0.0;
  std::vector<double> xs;
  double order = 0.0;
  if (auto err = NumberArg(args, 0, &x)) return *err;
  if (auto err = CollectArray(args, 1, &xs)) return *err;
  if (auto err = NumberArgOr(args, 2, 0.0, &order)) return *err;
  double before = 0;
  double ties = 0;
  for (double v : xs) {
    if (v == x) {
      ++ties;
    } else if (order == 0.0 ? v > x : v < x) {
      ++before;
    }
  }
  if (ties == 0) return Value::Error(ErrorKind::kNotAvailable);
  if (average) return Value::Number(before + (ties + 1.0) / 2.0);
  return Value::Number(before + 1.0);
}

Value RankEq(CallArgs& args) {
  return RankImpl(args, false);
}

Value RankAvg(CallArgs& args) {
  return RankImpl(args, true);
}

Value PercentileInc(CallArgs& args) {
  std::vector<double> xs;
  double k = 0.0;
  if (auto err = CollectArray(args, 0, &xs)) return *err;
  if (auto err = NumberArg(args, 1, &k)) return *err;
  if (xs.empty() || k < 0 || k > 1) return NumError();
  return Value::Number(stats::PercentileInc(std::move(xs), k));
}

// Exclusive percentile; nullopt when k * (n + 1) falls outside [1, n].
std::optional<double> PercentileExcOf(std::vector<double> xs, double k) {
  const double n = static_cast<double>(xs.size());
  if (xs.empty() || k <= 0 || k >= 1) return std::nullopt;
  const double rank = k * (n + 1.0);
  if (rank < 1.0 || rank > n) return std::nullopt;
  std::sort(xs.begin(), xs.end());
  const size_t lo = static_cast<size_t>(std::floor(rank)) - 1;
  const size_t hi = std::min(lo + 1, xs.size() - 1);
  return xs[lo] + (rank - std::floor(rank)) * (xs[hi] - xs[lo]);
}

Value PercentileExc(CallArgs& args) {
  std::vector<double> xs;
  double k = 0.0;
  if (auto err = CollectArray(args, 0, &xs)) return *err;
  if (auto err = NumberArg(args, 1, &k)) return *err;
  auto value = PercentileExcOf(std::move(xs), k);
  if (!value) return NumError();
  return Value::Number(*value);
}

Value Quartile(CallArgs& args) {
  std::vector<double> xs;
  double quart = 0.0;
  if (auto err = CollectArray(args, 0, &xs)) return *err;
  if (auto err = NumberArg(args, 1, &quart)) return *err;
  quart = std::trunc(quart);
  if (xs.empty() || quart < 0 || quart > 4) return NumError();
  return Value::Number(stats::PercentileInc(std::move(xs), quart / 4.0));
}

Value QuartileExc(CallArgs& args) {
  std::vector<double> xs;
  double quart = 0.0;
  if (auto err = CollectArray(args, 0, &xs)) return *err;
  if (auto err = NumberArg(args, 1, &quart)) return *err;
  quart = std::trunc(quart);
  if (quart <= 0 || quart >= 4) return NumError();
  auto value = PercentileExcOf(std::move(xs), quart / 4.0);
  if (!value) return NumError();
  return Value::Number(*value);
}

// PERCENTRANK.INC / PERCENTRANK.EXC: position of x among the sorted values, interpolated
// between neighbours and truncated to `significance` digits.
Value PercentRank(CallArgs& args, bool exclusive) {
  std::vector<double> xs;
  double x = 0.0;
  double significance = 3.0;
  if (auto err = CollectArray(args, 0, &xs)) return *err;
  if (auto err = NumberArg(args, 1, &x)) return *err;
  if (auto err = NumberArgOr(args, 2, 3.0, &significance)) return *err;
  significance = std::trunc(significance);
  if (xs.empty() || significance < 1) return NumError();
  std::sort(xs.begin(), xs.end());
  if (x < xs.front() || x > xs.back()) return Value::Error(ErrorKind::kNotAvailable);
  const auto lower = std::lower_bound(xs.begin(), xs.end(), x);
  double position = static_cast<double>(lower - xs.begin());
  if (*lower != x) {
    const double below = *(lower - 1);
    position -= 1.0 - (x - below) / (*lower - below);
  }
  const double n = static_cast<double>(xs.size());
  double rank = 1.0;
  if (exclusive) {
    rank = (position + 1.0) / (n + 1.0);
  } else if (xs.size() > 1) {
    rank = position / (n - 1.0);
  }
  return Value::Number(numeric::RoundDownDigits(rank, static_cast<int>(significance)));
}

Value PercentRankInc(CallArgs& args) {
  return PercentRank(args, false);
}

Value PercentRankExc(CallArgs& args) {
  return PercentRank(args, true);
}

/// FREQUENCY(data_array, bins_array): count of data falling into each bin, where a bin holds
/// the values above the next smaller bin up to and including its own bound. The extra last
/// row counts values above every bin.
Value Frequency(CallArgs& args) {
  std::vector<double> data;
  std::vector<double> bins;
  if (auto err = CollectArray(args, 0, &data)) return *err;
  if (auto err = CollectArray(args, 1, &bins)) return *err;
  std::vector<size_t> order(bins.size());
  for (size_t i = 0; i < order.size(); ++i) order[i] = i;
  std::stable_sort(order.begin(), order.end(),
                   [&](size_t a, size_t b) { return bins[a] < bins[b]; });
  std::vector<double> counts(bins.size() + 1, 0.0);
  for (double x : data) {
    size_t slot = bins.size();
    for (size_t index : order) {
      if (x <= bins[index]) {
        slot = index;
        break;
      }
    }
    ++counts[slot];
  }
  runtime::Array out(static_cast<int>(counts.size()), 1);
  for (size_t i = 0; i < counts.size(); ++i) out.cells[i] = Scalar::Number(counts[i]);
  return GridResult(std::move(out));
}

// Pairs (x, y) of two same-sized arrays where both cells are numbers. Sizes that differ are
// #N/A.
std::optional<Value> Pairs(CallArgs& args, size_t xi, size_t yi, std::vector<double>* xs,
                           std::vector<double>* ys) {
  auto xa = ArrayArg(args, xi);
  auto ya = ArrayArg(args, yi);
  if (xa->size() != ya->size()) return Value::Error(ErrorKind::kNotAvailable);
  std::vector<std::optional<double>> xv;
  std::vector<std::optional<double>> yv;
  if (auto err = NumericCells(*xa, &xv)) return err;
  if (auto err = NumericCells(*ya, &yv)) return err;
  for (size_t i = 0; i < xv.size(); ++i) {
    if (xv[i] && yv[i]) {
      xs->push_back(*xv[i]);
      ys->push_back(*yv[i]);
    }
  }
  return std::nullopt;
}

struct Moments {
  double n = 0;
  double sxx = 0;
  double syy = 0;
  double sxy = 0;
  double mean_x = 0;
  double mean_y = 0;
};

Moments PairMoments(const std::vector<double>& xs, const std::vector<double>& ys) {
  Moments m;
  m.n = static_cast<double>(xs.size());
  if (xs.empty()) return m;
  m.mean_x = stats::Mean(xs);
  m.mean_y = stats::Mean(ys);
  for (size_t i = 0; i < xs.size(); ++i) {
    const double dx = xs[i] - m.mean_x;
    const double dy = ys[i] - m.mean_y;
    m.sxx += dx * dx;
    m.syy += dy * dy;
    m.sxy += dx * dy;
  }
  return m;
}

Value Correl(CallArgs& args) {
  std::vector<double> xs;
  std::vector<double> ys;
  if (auto err = Pairs(args, 0, 1, &xs, &ys)) return *err;
  Moments m = PairMoments(xs, ys);
  if (m.n < 2 || m.sxx == 0 || m.syy == 0) return DivError();
  return Value::Number(m.sxy / std::sqrt(m.sxx * m.syy));
}

Value Rsq(CallArgs& args) {
  Value r = Correl(args);
  if (r.IsError()) return r;
  return Value::Number(r.number * r.number);
}

Value Covariance(CallArgs& args, bool sample) {
  std::vector<double> xs;
  std::vector<double> ys;
  if (auto err = Pairs(args, 0, 1, &xs, &ys)) return *err;
  Moments m = PairMoments(xs, ys);
  if (m.n == 0 || (sample && m.n < 2)) return DivError();
  return Value::Number(m.sxy / (sample ? m.n - 1 : m.n));
}

Value CovarianceP(CallArgs& args) {
  return Covariance(args, false);
}

Value CovarianceS(CallArgs& args) {
  return Covariance(args, true);
}

// Least-squares fit of known_y (first) on known_x (second).
std::optional<Value> Fit(CallArgs& args, size_t yi, size_t xi, double* slope, double* intercept) {
  std::vector<double> xs;
  std::vector<double> ys;
  if (auto err = Pairs(args, xi, yi, &xs, &ys)) return err;
  Moments m = PairMoments(xs, ys);
  if (m.n == 0 || m.sxx == 0) return DivError();
  *slope = m.sxy / m.sxx;
  *intercept = m.mean_y - *slope * m.mean_x;
  return std::nullopt;
}

Value Slope(CallArgs& args) {
  double slope = 0.0;
  double intercept = 0.0;
  if (auto err = Fit(args, 0, 1, &slope, &intercept)) return *err;
  return Value::Number(slope);
}

Value Intercept(CallArgs& args) {
  double slope = 0.0;
  double intercept = 0.0;
  if (auto err = Fit(args, 0, 1, &slope, &intercept)) return *err;
  return Value::Number(intercept);
}

Value Forecast(CallArgs& args) {
  double x = 0.0;
  double slope = 0.0;
  double intercept = 0.0;
  if (auto err = NumberArg(args, 0, &x)) return *err;
  if (auto err = Fit(args, 1, 2, &slope, &intercept)) return *err;
  return Value::Number(intercept + slope * x);
}

/// STEYX(known_y, known_x): standard error of the predicted y in a linear fit.
Value Steyx(CallArgs& args) {
  std::vector<double> xs;
  std::vector<double> ys;
  if (auto err = Pairs(args, 1, 0, &xs, &ys)) return *err;
  Moments m = PairMoments(xs, ys);
  if (m.n < 3 || m.sxx == 0) return DivError();
  return Value::Number(std::sqrt((m.syy - m.sxy * m.sxy / m.sxx) / (m.n - 2)));
}

// Observations of LINEST, LOGEST, TREND and GROWTH. `points[i]` holds the predictors paired
// with `ys[i]`.
struct Regression {
  std::vector<double> ys;
  std::vector<std::vector<double>> points;
  size_t vars = 1;
  /// With several predictors: true when each predictor is a column of known_x.
  bool vars_in_columns = true;
  int rows = 0;
  int cols = 0;
};

std::optional<Value> AllNumbers(const runtime::Array& array, std::vector<double>* out) {
  for (const Scalar& cell : array.cells) {
    if (cell.IsError()) return Value::FromScalar(cell);
    if (!cell.IsNumber()) return Value::Error(ErrorKind::kValue);
    out->push_back(cell.number);
  }
  return std::nullopt;
}

// Reads known_y (argument 0) and known_x (argument 1, default 1..n). `log_y` fits ln(y), which
// requires every y to be positive.
std::optional<Value> ReadRegression(CallArgs& args, bool log_y, Regression* reg) {
  auto ya = ArrayArg(args, 0);
  if (auto err = AllNumbers(*ya, &reg->ys)) return err;
  reg->rows = ya->rows;
  reg->cols = ya->cols;
  if (log_y) {
    for (double& y : reg->ys) {
      if (y <= 0) return NumError();
      y = std::log(y);
    }
  }
  const size_t n = reg->ys.size();
  if (!args.Has(1)) {
    for (size_t i = 0; i < n; ++i) reg->points.push_back({static_cast<double>(i + 1)});
    return std::nullopt;
  }
  auto xa = ArrayArg(args, 1);
  std::vector<double> xs;
  if (auto err = AllNumbers(*xa, &xs)) return err;
  if (xs.size() == n) {
    for (double x : xs) reg->points.push_back({x});
    return std::nullopt;
  }
  if (ya->cols == 1 && static_cast<size_t>(xa->rows) == n) {
    reg->vars = static_cast<size_t>(xa->cols);
    for (int r = 0; r < xa->rows; ++r) {
      std::vector<double> point;
      for (int c = 0; c < xa->cols; ++c) point.push_back(xa->at(r, c).number);
      reg->points.push_back(std::move(point));
    }
    return std::nullopt;
  }
  if (ya->rows == 1 && static_cast<size_t>(xa->cols) == n) {
    reg->vars = static_cast<size_t>(xa->rows);
    reg->vars_in_columns = false;
    for (int c = 0; c < xa->cols; ++c) {
      std::vector<double> point;
      for (int r = 0; r < xa->rows; ++r) point.push_back(xa->at(r, c).number);
      reg->points.push_back(std::move(point));
    }
    return std::nullopt;
  }
  return Value::Error(ErrorKind::kReference);
}

struct LeastSquaresFit {
  std::vector<double> slopes;
  double intercept = 0.0;
  /// Diagonal of (X'X)^-1, slopes first then the intercept when one was fitted.
  std::vector<double> inverse_diagonal;
  double ss_resid = 0.0;
  double ss_total = 0.0;
  double df = 0.0;
};

double Predict(const LeastSquaresFit& fit, const std::vector<double>& point) {
  double y = fit.intercept;
  for (size_t j = 0; j < fit.slopes.size(); ++j) y += fit.slopes[j] * point[j];
  return y;
}

// Solves the normal equations by Gauss-Jordan elimination. Collinear predictors are #NUM!.
std::optional<Value> SolveLeastSquares(const Regression& reg, bool constant,
                                       LeastSquaresFit* fit) {
  const size_t n = reg.ys.size();
  const size_t p = reg.vars + (constant ? 1 : 0);
  if (n < p) return NumError();
  auto design = [&](size_t i, size_t j) { return j < reg.vars ? reg.points[i][j] : 1.0; };
  const size_t width = 2 * p + 1;
  std::vector<std::vector<double>> m(p, std::vector<double>(width, 0.0));
  for (size_t i = 0; i < n; ++i) {
    for (size_t j = 0; j < p; ++j) {
      for (size_t k = 0; k < p; ++k) m[j][k] += design(i, j) * design(i, k);
      m[j][width - 1] += design(i, j) * reg.ys[i];
    }
  }
  double scale = 0.0;
  for (size_t j = 0; j < p; ++j) {
    m[j][p + j] = 1.0;
    scale = std::max(scale, std::fabs(m[j][j]));
  }
  for (size_t col = 0; col < p; ++col) {
    size_t pivot = col;
    for (size_t r = col + 1; r < p; ++r) {
      if (std::fabs(m[r][col]) > std::fabs(m[pivot][col])) pivot = r;
    }
    if (std::fabs(m[pivot][col]) <= 1e-12 * scale) return NumError();
    std::swap(m[col], m[pivot]);
    const double lead = m[col][col];
    for (double& v : m[col]) v /= lead;
    for (size_t r = 0; r < p; ++r) {
      const double factor = m[r][col];
      if (r == col || factor == 0) continue;
      for (size_t k = 0; k < width; ++k) m[r][k] -= factor * m[col][k];
    }
  }
  for (size_t j = 0; j < p; ++j) {
    if (j < reg.vars) {
      fit->slopes.push_back(m[j][width - 1]);
    } else {
      fit->intercept = m[j][width - 1];
    }
    fit->inverse_diagonal.push_back(m[j][p + j]);
  }
  const double mean = stats::Mean(reg.ys);
  for (size_t i = 0; i < n; ++i) {
    const double residual = reg.ys[i] - Predict(*fit, reg.points[i]);
    fit->ss_resid += residual * residual;
    const double spread = constant ? reg.ys[i] - mean : reg.ys[i];
    fit->ss_total += spread * spread;
  }
  fit->df = static_cast<double>(n - p);
  return std::nullopt;
}

Scalar Statistic(double v) {
  return std::isfinite(v) ? Scalar::Number(v) : Scalar::Error(ErrorKind::kNumber);
}

/// LINEST / LOGEST(known_y, [known_x], [const], [stats]): coefficients m_k ... m_1, b in one
/// row; `stats` appends standard errors, r2 and se_y, F and df, ss_reg and ss_resid. LOGEST
/// fits ln(y) and reports e^m and e^b.
Value Estimate(CallArgs& args, bool exponential) {
  Regression reg;
  bool constant = true;
  bool with_stats = false;
  if (auto err = ReadRegression(args, exponential, &reg)) return *err;
  if (auto err = BoolArgOr(args, 2, true, &constant)) return *err;
  if (auto err = BoolArgOr(args, 3, false, &with_stats)) return *err;
  LeastSquaresFit fit;
  if (auto err = SolveLeastSquares(reg, constant, &fit)) return *err;
  const int width = static_cast<int>(reg.vars) + 1;
  runtime::Array out(with_stats ? 5 : 1, width, Scalar::Error(ErrorKind::kNotAvailable));
  auto coefficient = [&](double c) { return Scalar::Number(exponential ? std::exp(c) : c); };
  for (size_t j = 0; j < reg.vars; ++j) {
    out.at(0, width - 2 - static_cast<int>(j)) = coefficient(fit.slopes[j]);
  }
  out.at(0, width - 1) = coefficient(fit.intercept);
  if (!with_stats) return GridResult(std::move(out));
  const double residual_variance = fit.ss_resid / fit.df;
  for (size_t j = 0; j < fit.inverse_diagonal.size(); ++j) {
    const int col = j < reg.vars ? width - 2 - static_cast<int>(j) : width - 1;
    out.at(1, col) = Statistic(std::sqrt(fit.inverse_diagonal[j] * residual_variance));
  }
  const double ss_reg = fit.ss_total - fit.ss_resid;
  out.at(2, 0) = Statistic(fit.ss_total == 0 ? 1.0 : ss_reg / fit.ss_total);
  out.at(2, 1) = Statistic(std::sqrt(residual_variance));
  out.at(3, 0) = Statistic(ss_reg / static_cast<double>(reg.vars) / residual_variance);
  out.at(3, 1) = Scalar::Number(fit.df);
  out.at(4, 0) = Scalar::Number(ss_reg);
  out.at(4, 1) = Scalar::Number(fit.ss_resid);
  return GridResult(std::move(out));
}

Value Linest(CallArgs& args) {
  return Estimate(args, false);
}

Value Logest(CallArgs& args) {
  return Estimate(args, true);
}

/// TREND / GROWTH(known_y, [known_x], [new_x], [const]): fitted values at new_x, or at known_x
/// in the shape of known_y when new_x is omitted.
Value Project(CallArgs& args, bool exponential) {
  Regression reg;
  bool constant = true;
  if (auto err = ReadRegression(args, exponential, &reg)) return *err;
  if (auto err = BoolArgOr(args, 3, true, &constant)) return *err;
  LeastSquaresFit fit;
  if (auto err = SolveLeastSquares(reg, constant, &fit)) return *err;
  auto fitted = [&](const std::vector<double>& point) {
    const double y = Predict(fit, point);
    return Scalar::Number(exponential ? std::exp(y) : y);
  };
  if (!args.Has(2)) {
    runtime::Array out(reg.rows, reg.cols);
    for (size_t i = 0; i < reg.points.size(); ++i) out.cells[i] = fitted(reg.points[i]);
    return GridResult(std::move(out));
  }
  auto fresh = ArrayArg(args, 2);
  std::vector<double> xs;
  if (auto err = AllNumbers(*fresh, &xs)) return *err;
  if (reg.vars == 1) {
    runtime::Array out(fresh->rows, fresh->cols);
    for (size_t i = 0; i < xs.size(); ++i) out.cells[i] = fitted({xs[i]});
    return GridResult(std::move(out));
  }
  const int vars = static_cast<int>(reg.vars);
  if (reg.vars_in_columns) {
    if (fresh->cols != vars) return Value::Error(ErrorKind::kReference);
    runtime::Array out(fresh->rows, 1);
    for (int r = 0; r < fresh->rows; ++r) {
      std::vector<double> point;
      for (int c = 0; c < vars; ++c) point.push_back(fresh->at(r, c).number);
      out.at(r, 0) = fitted(point);
    }
    return GridResult(std::move(out));
  }
  if (fresh->rows != vars) return Value::Error(ErrorKind::kReference);
  runtime::Array out(1, fresh->cols);
  for (int c = 0; c < fresh->cols; ++c) {
    std::vector<double> point;
    for (int r = 0; r < vars; ++r) point.push_back(fresh->at(r, c).number);
    out.at(0, c) = fitted(point);
  }
  return GridResult(std::move(out));
}

Value Trend(CallArgs& args) {
  return Project(args, false);
}

Value Growth(CallArgs& args) {
  return Project(args, true);
}

Value GeoMean(CallArgs& args) {
  std::vector<double> xs;
  if (auto err = CollectNumbers(args, 0, args.size(), &xs)) return *err;
  if (xs.empty()) return NumError();
  double log_sum = 0.0;
  for (double x : xs) {
    if (x <= 0) return NumError();
    log_sum += std::log(x);
  }
  return Value::Number(std::exp(log_sum / static_cast<double>(xs.size())));
}

Value HarMean(CallArgs& args) {
  std::vector<double> xs;
  if (auto err = CollectNumbers(args, 0, args.size(), &xs)) return *err;
  if (xs.empty()) return NumError();
  double reciprocal_sum = 0.0;
  for (double x : xs) {
    if (x <= 0) return NumError();
    reciprocal_sum += 1.0 / x;
  }
  return Value::Number(static_cast<double>(xs.size()) / reciprocal_sum);
}

Value DevSq(CallArgs& args) {
  std::vector<double> xs;
  if (auto err = CollectNumbers(args, 0, args.size(), &xs)) return *err;
  if (xs.empty()) return NumError();
  return Value::Number(stats::DevSq(xs));
}

Value AveDev(CallArgs& args) {
  std::vector<double> xs;
  if (auto err = CollectNumbers(args, 0, args.size(), &xs)) return *err;
  if (xs.empty()) return NumError();
  const double mean = stats::Mean(xs);
  double total = 0.0;
  for (double x : xs) total += std::fabs(x - mean);
  return Value::Number(total / static_cast<double>(xs.size()));
}

Value Fisher(CallArgs& args) {
  double x = 0.0;
  if (auto err = NumberArg(args, 0, &x)) return *err;
  if (x <= -1 || x >= 1) return NumError();
  return Value::Number(0.5 * std::log((1 + x) / (1 - x)));
}

Value FisherInv(CallArgs& args) {
  double y = 0.0;
  if (auto err = NumberArg(args, 0, &y)) return *err;
  return Value::Number(std::tanh(y));
}

Value Standardize(CallArgs& args) {
  double x = 0.0;
  double mean = 0.0;
  double sd = 0.0;
  if (auto err = NumberArg(args, 0, &x)) return *err;
  if (auto err = NumberArg(args, 1, &mean)) return *err;
  if (auto err = NumberArg(args, 2, &sd)) return *err;
  if (sd <= 0) return NumError();
  return Value::Number((x - mean) / sd);
}

}  // namespace

void RegisterStatisticalFunctions(FunctionRegistry* registry) {
  registry->Add(FunctionId::kAverage, "AVERAGE", kCat, 1, kVariadic, Average,
                "AVERAGE(number1, [number2], ...)", "Arithmetic mean of numbers.");
  registry->Add(FunctionId::kAverageA, "AVERAGEA", kCat, 1, kVariadic, AverageA,
                "AVERAGEA(value1, [value2], ...)",
                "Mean counting text as 0 and logicals as 1/0.");
  registry->Add(FunctionId::kCount, "COUNT", kCat, 1, kVariadic, Count,
                "COUNT(value1, [value2], ...)", "Counts numbers.");
  registry->Add(FunctionId::kCountA, "COUNTA", kCat, 1, kVariadic, CountA,
                "COUNTA(value1, [value2], ...)", "Counts non-empty values.");
  registry->Add(FunctionId::kCountBlank, "COUNTBLANK", kCat, 1, 1, CountBlank,
                "COUNTBLANK(range)", "Counts blank cells and empty text.");
  registry->Add(FunctionId::kMin, "MIN", kCat, 1, kVariadic, Min, "MIN(number1, [number2], ...)",
                "Smallest number; 0 when there are none.");
  registry->Add(FunctionId::kMax, "MAX", kCat, 1, kVariadic, Max, "MAX(number1, [number2], ...)",
                "Largest number; 0 when there are none.");
  registry->Add(FunctionId::kMinA, "MINA", kCat, 1, kVariadic, MinA,
                "MINA(value1, [value2], ...)", "Smallest value counting text and logicals.");
  registry->Add(FunctionId::kMaxA, "MAXA", kCat, 1, kVariadic, MaxA,
                "MAXA(value1, [value2], ...)", "Largest value counting text and logicals.");
  registry->Add(FunctionId::kMedian, "MEDIAN", kCat, 1, kVariadic, Median,
                "MEDIAN(number1, [number2], ...)", "Middle value.");
  registry->Add(FunctionId::kMode, "MODE", kCat, 1, kVariadic, Mode,
                "MODE(number1, [number2], ...)", "Most frequent value.");
  registry->Add(FunctionId::kModeSngl, "MODE.SNGL", kCat, 1, kVariadic, Mode,
                "MODE.SNGL(number1, [number2], ...)", "Most frequent value.");
  registry->Add(FunctionId::kStdev, "STDEV", kCat, 1, kVariadic, StdevS,
                "STDEV(number1, [number2], ...)", "Sample standard deviation.");
  registry->Add(FunctionId::kStdevS, "STDEV.S", kCat, 1, kVariadic, StdevS,
                "STDEV.S(number1, [number2], ...)", "Sample standard deviation.");
  registry->Add(FunctionId::kStdevP, "STDEV.P", kCat, 1, kVariadic, StdevP,
                "STDEV.P(number1, [number2], ...)", "Population standard deviation.");
  registry->Add(FunctionId::kVar, "VAR", kCat, 1, kVariadic, VarS, "VAR(number1, [number2], ...)",
                "Sample variance.");
  registry->Add(FunctionId::kVarS, "VAR.S", kCat, 1, kVariadic, VarS,
                "VAR.S(number1, [number2], ...)", "Sample variance.");
  registry->Add(FunctionId::kVarP, "VAR.P", kCat, 1, kVariadic, VarP,
                "VAR.P(number1, [number2], ...)", "Population variance.");
  registry->Add(FunctionId::kLarge, "LARGE", kCat, 2, 2, Large, "LARGE(array, k)",
                "k-th largest value.");
  registry->Add(FunctionId::kSmall, "SMALL", kCat, 2, 2, Small, "SMALL(array, k)",
                "k-th smallest value.");
  registry->Add(FunctionId::kRank, "RANK", kCat, 2, 3, RankEq, "RANK(number, ref, [order])",
                "Rank of a number in a list.");
  registry->Add(FunctionId::kRankEq, "RANK.EQ", kCat, 2, 3, RankEq,
                "RANK.EQ(number, ref, [order])", "Rank of a number; ties share the top rank.");
  registry->Add(FunctionId::kRankAvg, "RANK.AVG", kCat, 2, 3, RankAvg,
                "RANK.AVG(number, ref, [order])", "Rank of a number; ties share the mean rank.");
  registry->Add(FunctionId::kPercentile, "PERCENTILE", kCat, 2, 2, PercentileInc,
                "PERCENTILE(array, k)", "k-th percentile, k in [0, 1].");
  registry->Add(FunctionId::kPercentileInc, "PERCENTILE.INC", kCat, 2, 2, PercentileInc,
                "PERCENTILE.INC(array, k)", "k-th percentile, k in [0, 1].");
  registry->Add(FunctionId::kPercentileExc, "PERCENTILE.EXC", kCat, 2, 2, PercentileExc,
                "PERCENTILE.EXC(array, k)", "k-th percentile, k in (0, 1) exclusive.");
  registry->Add(FunctionId::kQuartile, "QUARTILE", kCat, 2, 2, Quartile,
                "QUARTILE(array, quart)", "Quartile 0-4 of a data set.");
  registry->Add(FunctionId::kQuartileInc, "QUARTILE.INC", kCat, 2, 2, Quartile,
                "QUARTILE.INC(array, quart)", "Quartile 0-4 of a data set.");
  registry->Add(FunctionId::kCorrel, "CORREL", kCat, 2, 2, Correl, "CORREL(array1, array2)",
                "Pearson correlation coefficient.");
  registry->Add(FunctionId::kPearson, "PEARSON", kCat, 2, 2, Correl, "PEARSON(array1, array2)",
                "Pearson correlation coefficient.");
  registry->Add(FunctionId::kCovarianceP, "COVARIANCE.P", kCat, 2, 2, CovarianceP,
                "COVARIANCE.P(array1, array2)", "Population covariance.");
  registry->Add(FunctionId::kCovarianceS, "COVARIANCE.S", kCat, 2, 2, CovarianceS,
                "COVARIANCE.S(array1, array2)", "Sample covariance.");
  registry->Add(FunctionId::kRsq, "RSQ", kCat, 2, 2, Rsq, "RSQ(known_y, known_x)",
                "Square of the correlation coefficient.");
  registry->Add(FunctionId::kSlope, "SLOPE", kCat, 2, 2, Slope, "SLOPE(known_y, known_x)",
                "Slope of the least-squares line.");
  registry->Add(FunctionId::kIntercept, "INTERCEPT", kCat, 2, 2, Intercept,
                "INTERCEPT(known_y, known_x)", "Intercept of the least-squares line.");
  registry->Add(FunctionId::kForecast, "FORECAST", kCat, 3, 3, Forecast,
                "FORECAST(x, known_y, known_x)", "Linear-trend prediction at x.");
  registry->Add(FunctionId::kForecastLinear, "FORECAST.LINEAR", kCat, 3, 3, Forecast,
                "FORECAST.LINEAR(x, known_y, known_x)", "Linear-trend prediction at x.");
  registry->Add(FunctionId::kGeoMean, "GEOMEAN", kCat, 1, kVariadic, GeoMean,
                "GEOMEAN(number1, [number2], ...)", "Geometric mean of positive numbers.");
  registry->Add(FunctionId::kHarMean, "HARMEAN", kCat, 1, kVariadic, HarMean,
                "HARMEAN(number1, [number2], ...)", "Harmonic mean of positive numbers.");
  registry->Add(FunctionId::kDevSq, "DEVSQ", kCat, 1, kVariadic, DevSq,
                "DEVSQ(number1, [number2], ...)", "Sum of squared deviations from the mean.");
  registry->Add(FunctionId::kAveDev, "AVEDEV", kCat, 1, kVariadic, AveDev,
                "AVEDEV(number1, [number2], ...)", "Mean absolute deviation.");
  registry->Add(FunctionId::kModeMult, "MODE.MULT", kCat, 1, kVariadic, ModeMult,
                "MODE.MULT(number1, [number2], ...)", "Column of the most frequent values.");
  registry->Add(FunctionId::kStdevA, "STDEVA", kCat, 1, kVariadic, StdevA,
                "STDEVA(value1, [value2], ...)",
                "Sample standard deviation counting text as 0 and logicals as 1/0.");
  registry->Add(FunctionId::kStdevPA, "STDEVPA", kCat, 1, kVariadic, StdevPA,
                "STDEVPA(value1, [value2], ...)",
                "Population standard deviation counting text as 0 and logicals as 1/0.");
  registry->Add(FunctionId::kVarA, "VARA", kCat, 1, kVariadic, VarA, "VARA(value1, [value2], ...)",
                "Sample variance counting text as 0 and logicals as 1/0.");
  registry->Add(FunctionId::kVarPA, "VARPA", kCat, 1, kVariadic, VarPA,
                "VARPA(value1, [value2], ...)",
                "Population variance counting text as 0 and logicals as 1/0.");
  registry->Add(FunctionId::kQuartileExc, "QUARTILE.EXC", kCat, 2, 2, QuartileExc,
                "QUARTILE.EXC(array, quart)", "Quartile with exclusive interpolation.");
  registry->Add(FunctionId::kPercentRank, "PERCENTRANK", kCat, 2, 3, PercentRankInc,
                "PERCENTRANK(array, x, [significance])", "Inclusive percent rank of x.");
  registry->Add(FunctionId::kPercentRankInc, "PERCENTRANK.INC", kCat, 2, 3, PercentRankInc,
                "PERCENTRANK.INC(array, x, [significance])", "Inclusive percent rank of x.");
  registry->Add(FunctionId::kPercentRankExc, "PERCENTRANK.EXC", kCat, 2, 3, PercentRankExc,
                "PERCENTRANK.EXC(array, x, [significance])", "Exclusive percent rank of x.");
  registry->Add(FunctionId::kFrequency, "FREQUENCY", kCat, 2, 2, Frequency,
                "FREQUENCY(data_array, bins_array)", "Counts of values falling into each bin.");
  registry->Add(FunctionId::kSteyx, "STEYX", kCat, 2, 2, Steyx, "STEYX(known_y, known_x)",
                "Standard error of the regression prediction.");
  registry->Add(FunctionId::kLinest, "LINEST", kCat, 1, 4, Linest,
                "LINEST(known_y, [known_x], [const], [stats])", "Least-squares linear fit.");
  registry->Add(FunctionId::kLogest, "LOGEST", kCat, 1, 4, Logest,
                "LOGEST(known_y, [known_x], [const], [stats])", "Exponential curve fit.");
  registry->Add(FunctionId::kTrend, "TREND", kCat, 1, 4, Trend,
                "TREND(known_y, [known_x], [new_x], [const])", "Values along a linear fit.");
  registry->Add(FunctionId::kGrowth, "GROWTH", kCat, 1, 4, Growth,
                "GROWTH(known_y, [known_x], [new_x], [const])",
                "Values along an exponential fit.");
  registry->Add(FunctionId::kFisher, "FISHER", kCat, 1, 1, Fisher, "FISHER(x)",
                "Fisher transformation.", kElementwise);
  registry->Add(FunctionId::kFisherInv, "FISHERINV", kCat, 1, 1, FisherInv, "FISHERINV(y)",
                "Inverse Fisher transformation.", kElementwise);
  registry->Add(FunctionId::kStandardize, "STANDARDIZE", kCat, 3, 3, Standardize,
                "STANDARDIZE(x, mean, standard_dev)", "Normalized z-score.", kElementwise);
}

}  // namespace cellforge::builtin
