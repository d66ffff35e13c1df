#ifndef CELLFORGE_RUNTIME_CONTEXT_H_
#define CELLFORGE_RUNTIME_CONTEXT_H_

#include <memory>
#include <string>
#include <unordered_map>

#include "runtime/address.h"
#include "runtime/options.h"
#include "runtime/value.h"
#include "runtime/worksheet.h"

namespace cellforge::runtime {

/// Everything one evaluation reads. The engine never writes through it.
struct EvaluationContext {
  /// Cell source; null means every reference reads as Empty.
  const Worksheet* worksheet = nullptr;
  /// Cell hosting the formula, used by ROW() and COLUMN() without arguments.
  Address current_cell;
  /// User-defined closures keyed by upper-case name.
  std::unordered_map<std::string, std::shared_ptr<const Lambda>> named_lambdas;
  EngineOptions options;
};

}  // namespace cellforge::runtime

#endif  // CELLFORGE_RUNTIME_CONTEXT_H_
