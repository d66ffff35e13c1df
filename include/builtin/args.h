#ifndef CELLFORGE_BUILTIN_ARGS_H_
#define CELLFORGE_BUILTIN_ARGS_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "runtime/call_args.h"
#include "runtime/value.h"

// Argument readers shared by the builtin handlers. Readers that can fail return the error Value
// the handler should return, or nullopt on success:
//
//   double x;
//   if (auto err = NumberArg(args, 0, &x)) return *err;

namespace cellforge::builtin {

/// Argument `i` as a scalar; arrays other than 1x1 are #VALUE!.
runtime::Scalar ScalarArg(runtime::CallArgs& args, size_t i);

std::optional<runtime::Value> NumberArg(runtime::CallArgs& args, size_t i, double* out);
/// Uses `fallback` when the argument is missing or omitted.
std::optional<runtime::Value> NumberArgOr(runtime::CallArgs& args, size_t i, double fallback,
                                          double* out);
/// Number truncated toward zero.
std::optional<runtime::Value> IntArg(runtime::CallArgs& args, size_t i, int64_t* out);
std::optional<runtime::Value> IntArgOr(runtime::CallArgs& args, size_t i, int64_t fallback,
                                       int64_t* out);
std::optional<runtime::Value> TextArg(runtime::CallArgs& args, size_t i, std::string* out);
std::optional<runtime::Value> TextArgOr(runtime::CallArgs& args, size_t i,
                                        const std::string& fallback, std::string* out);
std::optional<runtime::Value> BoolArg(runtime::CallArgs& args, size_t i, bool* out);
std::optional<runtime::Value> BoolArgOr(runtime::CallArgs& args, size_t i, bool fallback,
                                        bool* out);

/// Argument `i` as a grid; scalars become 1x1.
std::shared_ptr<const runtime::Array> ArrayArg(runtime::CallArgs& args, size_t i);

/// Lambda argument; #VALUE! (or the argument's own error) when it is not a lambda.
std::optional<runtime::Value> LambdaArg(runtime::CallArgs& args, size_t i,
                                        std::shared_ptr<const runtime::Lambda>* out);

enum class CollectMode {
  /// Cells inside arrays/references contribute only numbers.
  kNumbersOnly,
  /// Cells inside arrays/references also count text as 0 and booleans as 1/0 (the *A functions).
  kAllValues,
};

/// Gathers numbers for aggregates from arguments [first, last). Direct scalar arguments are
/// coerced (text that is not numeric is #VALUE!); array and reference arguments skip what their
/// mode excludes. The first error encountered is returned.
std::optional<runtime::Value> CollectNumbers(runtime::CallArgs& args, size_t first, size_t last,
                                             std::vector<double>* out,
                                             CollectMode mode = CollectMode::kNumbersOnly);

/// Same rules applied to a single value that was (or was not) written as a reference.
std::optional<runtime::Value> CollectNumbersFrom(const runtime::Value& value, bool is_reference,
                                                 std::vector<double>* out,
                                                 CollectMode mode = CollectMode::kNumbersOnly);

/// Numbers of an array argument in row-major order, keeping the positions of non-numbers as
/// nullopt. Errors are returned.
std::optional<runtime::Value> NumericCells(const runtime::Array& array,
                                           std::vector<std::optional<double>>* out);

/// True when a generated rows x cols result stays within the configured cell limit.
bool WithinCellLimit(const runtime::CallArgs& args, int64_t rows, int64_t cols);

/// Wraps a computed grid; a 1x1 grid collapses to its scalar.
runtime::Value GridResult(runtime::Array array);

/// First error scalar in `array`, if any.
std::optional<runtime::Value> FirstError(const runtime::Array& array);

}  // namespace cellforge::builtin

#endif  // CELLFORGE_BUILTIN_ARGS_H_
