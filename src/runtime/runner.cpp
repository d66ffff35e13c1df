#include "runtime/runner.h"

#include <cctype>
#include <memory>
#include <string>
#include <utility>

#include "parser/parser.h"
#include "runtime/address.h"
#include "util/log.h"
#include "util/string.h"

namespace cellforge::runtime {

namespace {

const char* KindName(ValueKind kind) {
  switch (kind) {
    case ValueKind::kEmpty:
      return "empty";
    case ValueKind::kNumber:
      return "number";
    case ValueKind::kText:
      return "text";
    case ValueKind::kBoolean:
      return "boolean";
    case ValueKind::kError:
      return "error";
    case ValueKind::kArray:
      return "array";
    case ValueKind::kLambda:
      return "lambda";
  }
  return "empty";
}

bool IsValidName(const std::string& name) {
  if (name.empty() || !(std::isalpha(static_cast<unsigned char>(name[0])) || name[0] == '_')) {
    return false;
  }
  for (char ch : name) {
    if (!(std::isalnum(static_cast<unsigned char>(ch)) || ch == '_' || ch == '.')) {
      return false;
    }
  }
  return !ParseA1(name).has_value() && !util::EqualsIgnoreCase(name, "TRUE") &&
         !util::EqualsIgnoreCase(name, "FALSE");
}

}  // namespace

Value Evaluate(const std::string& formula, const EvaluationContext& context) {
  auto parsed = parser::ParseFormula(formula);
  if (!parsed.ok()) {
    util::Log({util::LogLevel::kWarn, "parser", "formula rejected", formula, "",
               parsed.status().message});
    return Value::Error(ErrorKind::kName);
  }
  Evaluator evaluator(&context, std::make_shared<Environment>());
  Value result = evaluator.Evaluate(*parsed.value());
  if (util::LogEnabled(util::LogLevel::kDebug)) {
    util::Log({util::LogLevel::kDebug, "evaluator", "evaluated", formula, "",
               std::string("kind=") + KindName(result.kind)});
  }
  return result;
}

util::StatusOr<std::shared_ptr<const Lambda>> CompileLambda(const std::string& formula) {
  auto parsed = parser::ParseFormula(formula);
  if (!parsed.ok()) {
    return parsed.status();
  }
  if (dynamic_cast<const parser::LambdaExpression*>(parsed.value().get()) == nullptr) {
    return util::Status::Invalid("named lambda must be a LAMBDA(...) formula");
  }
  EvaluationContext empty;
  Evaluator evaluator(&empty, std::make_shared<Environment>());
  Value value = evaluator.Evaluate(*parsed.value());
  if (!value.IsLambda()) {
    return util::Status::Invalid("LAMBDA parameters must be distinct");
  }
  return value.lambda;
}

util::Status DefineNamedLambda(EvaluationContext* context, const std::string& name,
                               const std::string& formula) {
  if (!IsValidName(name)) {
    return util::Status::Invalid("invalid lambda name '" + name + "'");
  }
  auto compiled = CompileLambda(formula);
  if (!compiled.ok()) {
    return compiled.status();
  }
  context->named_lambdas[util::ToUpper(name)] = compiled.value();
  return util::Status::OK();
}

}  // namespace cellforge::runtime
