#ifndef CELLFORGE_TESTS_TEST_UTIL_H_
#define CELLFORGE_TESTS_TEST_UTIL_H_

#include <cmath>
#include <optional>
#include <string>

#include "builtin/builtins.h"
#include "lexer/lexer.h"
#include "parser/parser.h"
#include "runtime/context.h"
#include "runtime/runner.h"
#include "runtime/worksheet.h"
#include "util/error.h"

namespace test {

namespace rt = cellforge::runtime;
namespace lx = cellforge::lexer;
namespace ps = cellforge::parser;
namespace bt = cellforge::builtin;
namespace util = cellforge::util;

struct TestContext {
  int passed = 0;
  int failed = 0;
};

constexpr double kEpsilon = 1e-9;

void ExpectNear(double actual, double expected, const std::string& name, TestContext* ctx,
                double tolerance = kEpsilon);
void ExpectTrue(bool value, const std::string& name, TestContext* ctx);

/// Evaluates formula text against `context`, or against an empty worksheet when null.
rt::Value EvalFormula(const std::string& formula, const rt::EvaluationContext* context = nullptr);

void ExpectNumber(const std::string& formula, double expected, TestContext* ctx,
                  const rt::EvaluationContext* context = nullptr, double tolerance = kEpsilon);
void ExpectText(const std::string& formula, const std::string& expected, TestContext* ctx,
                const rt::EvaluationContext* context = nullptr);
void ExpectBool(const std::string& formula, bool expected, TestContext* ctx,
                const rt::EvaluationContext* context = nullptr);
void ExpectError(const std::string& formula, rt::ErrorKind expected, TestContext* ctx,
                 const rt::EvaluationContext* context = nullptr);
/// Compares the display form, e.g. "{1,2;3,4}".
void ExpectDisplay(const std::string& formula, const std::string& expected, TestContext* ctx,
                   const rt::EvaluationContext* context = nullptr);

/// Sets an environment variable for the lifetime of the object, restoring the old value after.
class ScopedEnvVar {
 public:
  ScopedEnvVar(const std::string& name, const std::string& value);
  ~ScopedEnvVar();

  ScopedEnvVar(const ScopedEnvVar&) = delete;
  ScopedEnvVar& operator=(const ScopedEnvVar&) = delete;

 private:
  std::string name_;
  std::optional<std::string> previous_;
};

}  // namespace test

#endif  // CELLFORGE_TESTS_TEST_UTIL_H_
