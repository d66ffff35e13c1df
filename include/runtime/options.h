#ifndef CELLFORGE_RUNTIME_OPTIONS_H_
#define CELLFORGE_RUNTIME_OPTIONS_H_

#include <cstdint>
#include <optional>

namespace cellforge::runtime {

struct EngineOptions {
  /// Nested lambda invocations allowed before an invocation yields #N/A.
  int max_lambda_depth = 100;
  /// Upper bound on cells produced by array generators.
  int64_t max_array_cells = 1000000;
  /// Seed for RAND/RANDBETWEEN/RANDARRAY; unset means nondeterministic.
  std::optional<uint64_t> random_seed;
};

/// Reads CELLFORGE_MAX_LAMBDA_DEPTH, CELLFORGE_MAX_ARRAY_CELLS and CELLFORGE_RANDOM_SEED.
/// Malformed or non-positive values keep the defaults.
EngineOptions LoadEngineOptions();

}  // namespace cellforge::runtime

#endif  // CELLFORGE_RUNTIME_OPTIONS_H_
