#include "runtime/call_args.h"

#include <utility>

#include "runtime/ops.h"

namespace cellforge::runtime {

CallArgs::CallArgs(std::string function, std::vector<ArgSlot> slots, Evaluator* evaluator)
    : function_(std::move(function)), slots_(std::move(slots)), evaluator_(evaluator) {}

Value CallArgs::Get(size_t i) {
  if (!Has(i) || !slots_[i].value) {
    return Value::Empty();
  }
  return slots_[i].value->Force();
}

Value CallArgs::Invoke(const Lambda& lambda, const std::vector<Value>& arguments) {
  return evaluator_->InvokeLambda(lambda, arguments);
}

const EvaluationContext& CallArgs::context() const {
  return evaluator_->context();
}

}  // namespace cellforge::runtime
