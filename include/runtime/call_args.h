#ifndef CELLFORGE_RUNTIME_CALL_ARGS_H_
#define CELLFORGE_RUNTIME_CALL_ARGS_H_

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "runtime/address.h"
#include "runtime/context.h"
#include "runtime/deferred.h"
#include "runtime/value.h"

namespace cellforge::runtime {

class Evaluator;

/// One argument slot of a builtin call.
struct ArgSlot {
  std::unique_ptr<Deferred> value;
  /// Set when the argument was written as a cell or range reference.
  std::optional<Range> reference;
  /// True for an omitted argument such as the third in `f(a, b, , d)`.
  bool omitted = false;
};

/// Arguments handed to a builtin handler. Eager functions receive resolved slots; lazy ones
/// receive unevaluated expressions that run only when `Get` is called.
class CallArgs {
 public:
  CallArgs(std::string function, std::vector<ArgSlot> slots, Evaluator* evaluator);

  size_t size() const { return slots_.size(); }

  /// Forces argument `i`; missing and omitted arguments read as Empty.
  Value Get(size_t i);

  /// True when argument `i` was supplied and not omitted.
  bool Has(size_t i) const { return i < slots_.size() && !slots_[i].omitted; }

  bool IsReference(size_t i) const { return i < slots_.size() && slots_[i].reference.has_value(); }
  std::optional<Range> Reference(size_t i) const {
    return i < slots_.size() ? slots_[i].reference : std::nullopt;
  }

  /// Calls a lambda value with already-evaluated arguments.
  Value Invoke(const Lambda& lambda, const std::vector<Value>& arguments);

  const std::string& function() const { return function_; }
  const EvaluationContext& context() const;
  const EngineOptions& options() const { return context().options; }

 private:
  std::string function_;
  std::vector<ArgSlot> slots_;
  Evaluator* evaluator_;
};

}  // namespace cellforge::runtime

#endif  // CELLFORGE_RUNTIME_CALL_ARGS_H_
