#ifndef CELLFORGE_BUILTIN_CRITERIA_H_
#define CELLFORGE_BUILTIN_CRITERIA_H_

#include <optional>
#include <string>

#include "runtime/value.h"

namespace cellforge::builtin {

/// One condition of SUMIF-style functions: a value to match, an operator-prefixed string such
/// as ">5" or "<>north", or a wildcard pattern.
class Criterion {
 public:
  /// Builds a criterion from its argument value. Error arguments are returned as errors.
  static std::optional<Criterion> Parse(const runtime::Scalar& criterion);

  /// Error cells never match.
  bool Matches(const runtime::Scalar& cell) const;

 private:
  enum class Op { kEq, kNe, kLt, kLe, kGt, kGe };

  Op op_ = Op::kEq;
  std::optional<double> number_;
  std::optional<bool> boolean_;
  std::string text_;
  bool wildcard_ = false;
};

}  // namespace cellforge::builtin

#endif  // CELLFORGE_BUILTIN_CRITERIA_H_
