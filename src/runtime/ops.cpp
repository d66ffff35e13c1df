#include "runtime/ops.h"

#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>

#include "runtime/operators.h"
#include "util/log.h"

namespace cellforge::runtime {

namespace {

/// Evaluates its expression on first Force and caches the result.
class ExpressionThunk : public Deferred {
 public:
  ExpressionThunk(const parser::Expression* expr, Evaluator* evaluator)
      : expr_(expr), evaluator_(evaluator) {}

  Value Force() override {
    if (!cached_) {
      cached_ = evaluator_->Evaluate(*expr_);
    }
    return *cached_;
  }

 private:
  const parser::Expression* expr_;
  Evaluator* evaluator_;
  std::optional<Value> cached_;
};

std::optional<Range> ReferenceOf(const parser::Expression& expr) {
  if (const auto* cell = dynamic_cast<const parser::CellReference*>(&expr)) {
    return Range{cell->address, cell->address};
  }
  if (const auto* range = dynamic_cast<const parser::RangeReference*>(&expr)) {
    return range->range.Normalized();
  }
  return std::nullopt;
}

bool IsOmitted(const parser::Expression& expr) {
  return dynamic_cast<const parser::EmptyArgument*>(&expr) != nullptr;
}

Scalar LiteralScalar(const parser::Expression& expr) {
  if (const auto* num = dynamic_cast<const parser::NumberLiteral*>(&expr)) {
    return Scalar::Number(num->value);
  }
  if (const auto* str = dynamic_cast<const parser::StringLiteral*>(&expr)) {
    return Scalar::Text(str->value);
  }
  if (const auto* boolean = dynamic_cast<const parser::BoolLiteral*>(&expr)) {
    return Scalar::Bool(boolean->value);
  }
  if (const auto* err = dynamic_cast<const parser::ErrorLiteral*>(&expr)) {
    return Scalar::Error(err->kind);
  }
  return Scalar::Error(ErrorKind::kValue);
}

}  // namespace

Evaluator::Evaluator(const EvaluationContext* context, std::shared_ptr<Environment> env, int depth)
    : context_(context), env_(env ? std::move(env) : std::make_shared<Environment>()),
      depth_(depth) {}

Value Evaluator::Evaluate(const parser::Expression& expr) {
  if (const auto* num = dynamic_cast<const parser::NumberLiteral*>(&expr)) {
    return Value::Number(num->value);
  }
  if (const auto* str = dynamic_cast<const parser::StringLiteral*>(&expr)) {
    return Value::Text(str->value);
  }
  if (const auto* boolean = dynamic_cast<const parser::BoolLiteral*>(&expr)) {
    return Value::Bool(boolean->value);
  }
  if (const auto* err = dynamic_cast<const parser::ErrorLiteral*>(&expr)) {
    return Value::Error(err->kind);
  }
  if (const auto* array = dynamic_cast<const parser::ArrayLiteral*>(&expr)) {
    return EvaluateArrayLiteral(*array);
  }
  if (dynamic_cast<const parser::EmptyArgument*>(&expr) != nullptr) {
    return Value::Empty();
  }
  if (const auto* cell = dynamic_cast<const parser::CellReference*>(&expr)) {
    return EvaluateCell(*cell);
  }
  if (const auto* range = dynamic_cast<const parser::RangeReference*>(&expr)) {
    return EvaluateRange(*range);
  }
  if (const auto* unary = dynamic_cast<const parser::UnaryExpression*>(&expr)) {
    return EvaluateUnary(*unary);
  }
  if (const auto* binary = dynamic_cast<const parser::BinaryExpression*>(&expr)) {
    return EvaluateBinary(*binary);
  }
  if (const auto* identifier = dynamic_cast<const parser::Identifier*>(&expr)) {
    return EvaluateIdentifier(*identifier);
  }
  if (const auto* call = dynamic_cast<const parser::CallExpression*>(&expr)) {
    return EvaluateCall(*call);
  }
  if (const auto* invoke = dynamic_cast<const parser::InvokeExpression*>(&expr)) {
    return EvaluateInvoke(*invoke);
  }
  if (const auto* lambda = dynamic_cast<const parser::LambdaExpression*>(&expr)) {
    return EvaluateLambda(*lambda);
  }
  if (const auto* let = dynamic_cast<const parser::LetExpression*>(&expr)) {
    return EvaluateLet(*let);
  }
  throw std::logic_error("Unknown expression node");
}

Value Evaluator::EvaluateArrayLiteral(const parser::ArrayLiteral& literal) {
  Array out(literal.rows, literal.cols);
  for (size_t i = 0; i < literal.elements.size() && i < out.cells.size(); ++i) {
    out.cells[i] = LiteralScalar(*literal.elements[i]);
  }
  return Value::FromArray(std::move(out));
}

Value Evaluator::EvaluateCell(const parser::CellReference& ref) {
  if (context_->worksheet == nullptr) {
    return Value::Empty();
  }
  return Value::FromScalar(context_->worksheet->GetCellValue(ref.address).ToScalar());
}

Value Evaluator::EvaluateRange(const parser::RangeReference& ref) {
  const Range range = ref.range.Normalized();
  const int64_t cells = static_cast<int64_t>(range.rows()) * range.cols();
  if (cells > context_->options.max_array_cells) {
    return Value::Error(ErrorKind::kNumber);
  }
  Array out(range.rows(), range.cols());
  if (context_->worksheet != nullptr) {
    for (int r = 0; r < out.rows; ++r) {
      for (int c = 0; c < out.cols; ++c) {
        Address address{range.start.row + r, range.start.col + c};
        out.at(r, c) = context_->worksheet->GetCellValue(address).ToScalar();
      }
    }
  }
  return Value::FromArray(std::move(out));
}

Value Evaluator::EvaluateUnary(const parser::UnaryExpression& expr) {
  return ApplyUnary(expr.op, Evaluate(*expr.operand));
}

Value Evaluator::EvaluateBinary(const parser::BinaryExpression& expr) {
  Value lhs = Evaluate(*expr.lhs);
  Value rhs = Evaluate(*expr.rhs);
  return ApplyBinary(expr.op, lhs, rhs);
}

Value Evaluator::EvaluateIdentifier(const parser::Identifier& identifier) {
  if (auto bound = env_->Get(identifier.name)) {
    return *bound;
  }
  auto it = context_->named_lambdas.find(util::ToUpper(identifier.name));
  if (it != context_->named_lambdas.end() && it->second) {
    return Value::FromLambda(it->second);
  }
  return Value::Error(ErrorKind::kName);
}

Value Evaluator::EvaluateCall(const parser::CallExpression& call) {
  if (auto bound = env_->Get(call.callee)) {
    if (bound->IsLambda()) {
      return CallLambda(*bound->lambda, call.args);
    }
    // A scope binding shadows builtins and named lambdas even when it is not callable.
    return bound->IsError() ? *bound : Value::Error(ErrorKind::kName);
  }
  if (const builtin::FunctionSpec* spec = builtin::DefaultRegistry().Lookup(call.callee)) {
    return CallBuiltin(*spec, call.args);
  }
  auto it = context_->named_lambdas.find(util::ToUpper(call.callee));
  if (it != context_->named_lambdas.end() && it->second) {
    return CallLambda(*it->second, call.args);
  }
  return Value::Error(ErrorKind::kName);
}

Value Evaluator::EvaluateInvoke(const parser::InvokeExpression& invoke) {
  Value target = Evaluate(*invoke.target);
  if (target.IsError()) {
    return target;
  }
  if (!target.IsLambda()) {
    return Value::Error(ErrorKind::kValue);
  }
  return CallLambda(*target.lambda, invoke.args);
}

Value Evaluator::EvaluateLambda(const parser::LambdaExpression& expr) {
  std::unordered_set<std::string> seen;
  for (const auto& param : expr.params) {
    if (!seen.insert(param).second) {
      return Value::Error(ErrorKind::kValue);
    }
  }
  auto lambda = std::make_shared<Lambda>();
  lambda->parameters = expr.params;
  lambda->body = expr.body;
  lambda->captured = env_;
  return Value::FromLambda(std::move(lambda));
}

// Each binding gets its own scope so a closure never captures the scope that holds it.
Value Evaluator::EvaluateLet(const parser::LetExpression& expr) {
  std::shared_ptr<Environment> scope = env_;
  std::unordered_set<std::string> seen;
  for (size_t i = 0; i < expr.names.size(); ++i) {
    if (!seen.insert(expr.names[i]).second) {
      return Value::Error(ErrorKind::kValue);
    }
    Evaluator inner(context_, scope, depth_);
    Value value = inner.Evaluate(*expr.values[i]);
    auto next = std::make_shared<Environment>(scope);
    next->Define(expr.names[i], value);
    scope = std::move(next);
  }
  Evaluator body(context_, scope, depth_);
  return body.Evaluate(*expr.body);
}

Value Evaluator::CallLambda(const Lambda& lambda,
                            const std::vector<std::unique_ptr<parser::Expression>>& args) {
  std::vector<Value> values;
  values.reserve(args.size());
  for (const auto& arg : args) {
    values.push_back(Evaluate(*arg));
  }
  return InvokeLambda(lambda, values);
}

Value Evaluator::InvokeLambda(const Lambda& lambda, const std::vector<Value>& arguments) {
  if (arguments.size() != lambda.parameters.size() || !lambda.body) {
    return Value::Error(ErrorKind::kValue);
  }
  if (depth_ + 1 > context_->options.max_lambda_depth) {
    util::Log({util::LogLevel::kWarn, "evaluator", "lambda recursion limit reached", "", "",
               "depth=" + std::to_string(depth_ + 1)});
    return Value::Error(ErrorKind::kNotAvailable);
  }
  auto scope = std::make_shared<Environment>(lambda.captured);
  for (size_t i = 0; i < arguments.size(); ++i) {
    scope->Define(lambda.parameters[i], arguments[i]);
  }
  Evaluator inner(context_, scope, depth_ + 1);
  return inner.Evaluate(*lambda.body);
}

Value Evaluator::CallBuiltin(const builtin::FunctionSpec& spec,
                             const std::vector<std::unique_ptr<parser::Expression>>& args) {
  if (!spec.AcceptsArgCount(args.size())) {
    return Value::Error(ErrorKind::kValue);
  }
  std::vector<ArgSlot> slots;
  slots.reserve(args.size());
  if (spec.mode == builtin::ArgMode::kLazy) {
    for (const auto& arg : args) {
      ArgSlot slot;
      slot.reference = ReferenceOf(*arg);
      slot.omitted = IsOmitted(*arg);
      slot.value = std::make_unique<ExpressionThunk>(arg.get(), this);
      slots.push_back(std::move(slot));
    }
    CallArgs call_args(spec.name, std::move(slots), this);
    return spec.handler(call_args);
  }

  std::vector<Value> values;
  values.reserve(args.size());
  for (const auto& arg : args) {
    ArgSlot slot;
    slot.reference = ReferenceOf(*arg);
    slot.omitted = IsOmitted(*arg);
    values.push_back(Evaluate(*arg));
    slots.push_back(std::move(slot));
  }

  if (spec.elementwise) {
    std::vector<const Value*> operands;
    for (const Value& v : values) operands.push_back(&v);
    if (AnyArray(operands)) {
      return CallElementwise(spec, values, slots);
    }
  }
  for (size_t i = 0; i < slots.size(); ++i) {
    slots[i].value = std::make_unique<ResolvedValue>(std::move(values[i]));
  }
  CallArgs call_args(spec.name, std::move(slots), this);
  return spec.handler(call_args);
}

Value Evaluator::CallElementwise(const builtin::FunctionSpec& spec,
                                 const std::vector<Value>& values,
                                 const std::vector<ArgSlot>& shape_slots) {
  std::vector<const Value*> operands;
  for (const Value& v : values) operands.push_back(&v);
  auto shape = BroadcastShape(operands);
  if (!shape) {
    return Value::Error(ErrorKind::kValue);
  }
  Array out(shape->rows, shape->cols);
  for (int r = 0; r < shape->rows; ++r) {
    for (int c = 0; c < shape->cols; ++c) {
      std::vector<ArgSlot> slots;
      slots.reserve(values.size());
      for (size_t i = 0; i < values.size(); ++i) {
        ArgSlot slot;
        slot.omitted = shape_slots[i].omitted;
        slot.value =
            std::make_unique<ResolvedValue>(Value::FromScalar(BroadcastAt(values[i], r, c)));
        slots.push_back(std::move(slot));
      }
      CallArgs call_args(spec.name, std::move(slots), this);
      out.at(r, c) = spec.handler(call_args).ToScalar();
    }
  }
  return Value::FromArray(std::move(out));
}

}  // namespace cellforge::runtime
