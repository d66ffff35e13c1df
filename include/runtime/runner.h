#ifndef CELLFORGE_RUNTIME_RUNNER_H_
#define CELLFORGE_RUNTIME_RUNNER_H_

#include <memory>
#include <string>

#include "runtime/context.h"
#include "runtime/ops.h"
#include "util/status.h"

namespace cellforge::runtime {

/// Parses and evaluates one formula. Never throws for bad formula text: syntax errors come back
/// as #NAME?.
Value Evaluate(const std::string& formula, const EvaluationContext& context);

/// Compiles `=LAMBDA(...)` text into a closure over an empty scope.
util::StatusOr<std::shared_ptr<const Lambda>> CompileLambda(const std::string& formula);

/// Compiles `formula` and binds it under `name` (case-insensitive) in `context`.
util::Status DefineNamedLambda(EvaluationContext* context, const std::string& name,
                               const std::string& formula);

}  // namespace cellforge::runtime

#endif  // CELLFORGE_RUNTIME_RUNNER_H_
