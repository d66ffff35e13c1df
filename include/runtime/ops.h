#ifndef CELLFORGE_RUNTIME_OPS_H_
#define CELLFORGE_RUNTIME_OPS_H_

#include <memory>
#include <optional>
#include <vector>

#include "builtin/registry.h"
#include "parser/ast.h"
#include "runtime/call_args.h"
#include "runtime/context.h"
#include "runtime/environment.h"
#include "runtime/value.h"

namespace cellforge::runtime {

class Evaluator {
 public:
  /// Evaluates AST nodes against `context` (not owned) inside scope `env`. `depth` counts the
  /// lambda invocations already on the stack.
  Evaluator(const EvaluationContext* context, std::shared_ptr<Environment> env, int depth = 0);

  /// Dispatches to the appropriate visitor for the expression kind.
  Value Evaluate(const parser::Expression& expr);

  /// Binds `arguments` to the lambda's parameters in a child of its captured scope and evaluates
  /// the body. Wrong argument count is #VALUE!; exceeding the depth limit is #N/A.
  Value InvokeLambda(const Lambda& lambda, const std::vector<Value>& arguments);

  const EvaluationContext& context() const { return *context_; }

 private:
  Value EvaluateArrayLiteral(const parser::ArrayLiteral& literal);
  Value EvaluateCell(const parser::CellReference& ref);
  Value EvaluateRange(const parser::RangeReference& ref);
  Value EvaluateUnary(const parser::UnaryExpression& expr);
  Value EvaluateBinary(const parser::BinaryExpression& expr);
  Value EvaluateIdentifier(const parser::Identifier& identifier);
  Value EvaluateCall(const parser::CallExpression& call);
  Value EvaluateInvoke(const parser::InvokeExpression& invoke);
  Value EvaluateLambda(const parser::LambdaExpression& expr);
  Value EvaluateLet(const parser::LetExpression& expr);

  Value CallBuiltin(const builtin::FunctionSpec& spec,
                    const std::vector<std::unique_ptr<parser::Expression>>& args);
  Value CallElementwise(const builtin::FunctionSpec& spec, const std::vector<Value>& values,
                        const std::vector<ArgSlot>& shape_slots);
  Value CallLambda(const Lambda& lambda,
                   const std::vector<std::unique_ptr<parser::Expression>>& args);

  const EvaluationContext* context_;
  std::shared_ptr<Environment> env_;
  int depth_;
};

}  // namespace cellforge::runtime

#endif  // CELLFORGE_RUNTIME_OPS_H_
