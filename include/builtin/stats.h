#ifndef CELLFORGE_BUILTIN_STATS_H_
#define CELLFORGE_BUILTIN_STATS_H_

#include <optional>
#include <random>
#include <vector>

#include "runtime/call_args.h"
#include "runtime/options.h"
#include "runtime/value.h"

namespace cellforge::builtin::stats {

double Sum(const std::vector<double>& xs);
/// Caller guarantees `xs` is not empty.
double Mean(const std::vector<double>& xs);
/// Sum of squared deviations from the mean.
double DevSq(const std::vector<double>& xs);
/// Sample (n-1) or population (n) variance; nullopt when there are too few values.
std::optional<double> Variance(const std::vector<double>& xs, bool sample);
double Median(std::vector<double> xs);
/// Inclusive percentile with linear interpolation; k in [0, 1].
double PercentileInc(std::vector<double> xs, double k);

/// Counts non-empty values across arguments [first, size).
double CountNonEmpty(runtime::CallArgs& args, size_t first);

/// SUBTOTAL/AGGREGATE kernel: code 1..11 selects AVERAGE, COUNT, COUNTA, MAX, MIN, PRODUCT,
/// STDEV.S, STDEV.P, SUM, VAR.S, VAR.P over arguments [first, size).
runtime::Value AggregateByCode(int code, runtime::CallArgs& args, size_t first);

/// Generator behind RAND, RANDBETWEEN and RANDARRAY. Seeded once per thread from
/// `options.random_seed` when set, otherwise from std::random_device.
std::mt19937_64& RandomEngine(const runtime::EngineOptions& options);

}  // namespace cellforge::builtin::stats

#endif  // CELLFORGE_BUILTIN_STATS_H_
