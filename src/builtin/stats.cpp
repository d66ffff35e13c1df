#include "builtin/stats.h"

#include <algorithm>
#include <cmath>

#include "builtin/args.h"

namespace cellforge::builtin::stats {

using runtime::ErrorKind;
using runtime::Value;

double Sum(const std::vector<double>& xs) {
  double total = 0.0;
  for (double x : xs) total += x;
  return total;
}

double Mean(const std::vector<double>& xs) {
  return Sum(xs) / static_cast<double>(xs.size());
}

double DevSq(const std::vector<double>& xs) {
  if (xs.empty()) return 0.0;
  const double mean = Mean(xs);
  double total = 0.0;
  for (double x : xs) total += (x - mean) * (x - mean);
  return total;
}

std::optional<double> Variance(const std::vector<double>& xs, bool sample) {
  const size_t n = xs.size();
  if (n == 0 || (sample && n < 2)) {
    return std::nullopt;
  }
  return DevSq(xs) / static_cast<double>(sample ? n - 1 : n);
}

double Median(std::vector<double> xs) {
  std::sort(xs.begin(), xs.end());
  const size_t n = xs.size();
  if (n % 2 == 1) return xs[n / 2];
  return (xs[n / 2 - 1] + xs[n / 2]) / 2.0;
}

double PercentileInc(std::vector<double> xs, double k) {
  std::sort(xs.begin(), xs.end());
  const double rank = k * static_cast<double>(xs.size() - 1);
  const size_t lo = static_cast<size_t>(std::floor(rank));
  const size_t hi = std::min(lo + 1, xs.size() - 1);
  return xs[lo] + (rank - static_cast<double>(lo)) * (xs[hi] - xs[lo]);
}

double CountNonEmpty(runtime::CallArgs& args, size_t first) {
  double count = 0;
  for (size_t i = first; i < args.size(); ++i) {
    if (!args.Has(i)) continue;
    Value v = args.Get(i);
    if (v.IsArray()) {
      for (const auto& cell : v.array->cells) {
        if (!cell.IsEmpty()) ++count;
      }
    } else if (!v.IsEmpty()) {
      ++count;
    }
  }
  return count;
}

Value AggregateByCode(int code, runtime::CallArgs& args, size_t first) {
  if (code == 3) {
    return Value::Number(CountNonEmpty(args, first));
  }
  std::vector<double> xs;
  if (auto err = CollectNumbers(args, first, args.size(), &xs)) return *err;
  switch (code) {
    case 1:
      if (xs.empty()) return Value::Error(ErrorKind::kDivByZero);
      return Value::Number(Mean(xs));
    case 2:
      return Value::Number(static_cast<double>(xs.size()));
    case 4:
      return Value::Number(xs.empty() ? 0.0 : *std::max_element(xs.begin(), xs.end()));
    case 5:
      return Value::Number(xs.empty() ? 0.0 : *std::min_element(xs.begin(), xs.end()));
    case 6: {
      if (xs.empty()) return Value::Number(0);
      double product = 1.0;
      for (double x : xs) product *= x;
      return Value::Number(product);
    }
    case 7:
    case 8: {
      auto var = Variance(xs, code == 7);
      if (!var) return Value::Error(ErrorKind::kDivByZero);
      return Value::Number(std::sqrt(*var));
    }
    case 9:
      return Value::Number(Sum(xs));
    case 10:
    case 11: {
      auto var = Variance(xs, code == 10);
      if (!var) return Value::Error(ErrorKind::kDivByZero);
      return Value::Number(*var);
    }
    default:
      return Value::Error(ErrorKind::kValue);
  }
}

std::mt19937_64& RandomEngine(const runtime::EngineOptions& options) {
  thread_local bool seeded = false;
  thread_local std::mt19937_64 engine;
  if (!seeded) {
    if (options.random_seed) {
      engine.seed(*options.random_seed);
    } else {
      std::random_device device;
      engine.seed((static_cast<uint64_t>(device()) << 32) ^ device());
    }
    seeded = true;
  }
  return engine;
}

}  // namespace cellforge::builtin::stats
