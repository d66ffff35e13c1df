#include "test_util.h"

#include <cstdlib>
#include <iostream>

namespace test {

void ExpectNear(double actual, double expected, const std::string& name, TestContext* ctx,
                double tolerance) {
  if (std::fabs(actual - expected) <= tolerance) {
    ++ctx->passed;
    return;
  }
  ++ctx->failed;
  std::cerr << "[FAIL] " << name << " expected " << expected << " got " << actual << "\n";
}

void ExpectTrue(bool value, const std::string& name, TestContext* ctx) {
  if (value) {
    ++ctx->passed;
    return;
  }
  ++ctx->failed;
  std::cerr << "[FAIL] " << name << " expected true\n";
}

rt::Value EvalFormula(const std::string& formula, const rt::EvaluationContext* context) {
  if (context != nullptr) {
    return rt::Evaluate(formula, *context);
  }
  rt::EvaluationContext empty;
  return rt::Evaluate(formula, empty);
}

namespace {

void Fail(const std::string& formula, const std::string& expected, const rt::Value& actual,
          TestContext* ctx) {
  ++ctx->failed;
  std::cerr << "[FAIL] " << formula << " expected " << expected << " got " << actual.ToString()
            << "\n";
}

}  // namespace

void ExpectNumber(const std::string& formula, double expected, TestContext* ctx,
                  const rt::EvaluationContext* context, double tolerance) {
  rt::Value v = EvalFormula(formula, context);
  if (v.IsNumber() && std::fabs(v.number - expected) <= tolerance) {
    ++ctx->passed;
    return;
  }
  Fail(formula, rt::FormatNumber(expected), v, ctx);
}

void ExpectText(const std::string& formula, const std::string& expected, TestContext* ctx,
                const rt::EvaluationContext* context) {
  rt::Value v = EvalFormula(formula, context);
  if (v.IsText() && v.text == expected) {
    ++ctx->passed;
    return;
  }
  Fail(formula, "\"" + expected + "\"", v, ctx);
}

void ExpectBool(const std::string& formula, bool expected, TestContext* ctx,
                const rt::EvaluationContext* context) {
  rt::Value v = EvalFormula(formula, context);
  if (v.IsBoolean() && v.boolean == expected) {
    ++ctx->passed;
    return;
  }
  Fail(formula, expected ? "TRUE" : "FALSE", v, ctx);
}

void ExpectError(const std::string& formula, rt::ErrorKind expected, TestContext* ctx,
                 const rt::EvaluationContext* context) {
  rt::Value v = EvalFormula(formula, context);
  if (v.IsError() && v.error == expected) {
    ++ctx->passed;
    return;
  }
  Fail(formula, rt::Value::Error(expected).ToString(), v, ctx);
}

void ExpectDisplay(const std::string& formula, const std::string& expected, TestContext* ctx,
                   const rt::EvaluationContext* context) {
  rt::Value v = EvalFormula(formula, context);
  if (v.ToString() == expected) {
    ++ctx->passed;
    return;
  }
  Fail(formula, expected, v, ctx);
}

ScopedEnvVar::ScopedEnvVar(const std::string& name, const std::string& value) : name_(name) {
  if (const char* old = std::getenv(name.c_str())) {
    previous_ = old;
  }
  setenv(name.c_str(), value.c_str(), 1);
}

ScopedEnvVar::~ScopedEnvVar() {
  if (previous_) {
    setenv(name_.c_str(), previous_->c_str(), 1);
  } else {
    unsetenv(name_.c_str());
  }
}

}  // namespace test
