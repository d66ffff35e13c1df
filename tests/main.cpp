#include <iostream>

#include "test_util.h"

namespace test {
void RunLexerTests(TestContext* ctx);
void RunParserTests(TestContext* ctx);
void RunRuntimeTests(TestContext* ctx);
void RunUtilTests(TestContext* ctx);
void RunRegistryTests(TestContext* ctx);
void RunLogicalTests(TestContext* ctx);
void RunMathTests(TestContext* ctx);
void RunStatisticalTests(TestContext* ctx);
void RunCriteriaTests(TestContext* ctx);
void RunLookupTests(TestContext* ctx);
void RunArrayTests(TestContext* ctx);
void RunFinancialTests(TestContext* ctx);
void RunDateTimeTests(TestContext* ctx);
void RunTextTests(TestContext* ctx);
void RunEngineeringTests(TestContext* ctx);
void RunReplTests(TestContext* ctx);
}  // namespace test

int main() {
  test::TestContext ctx;
  test::RunLexerTests(&ctx);
  test::RunParserTests(&ctx);
  test::RunRuntimeTests(&ctx);
  test::RunUtilTests(&ctx);
  test::RunRegistryTests(&ctx);
  test::RunLogicalTests(&ctx);
  test::RunMathTests(&ctx);
  test::RunStatisticalTests(&ctx);
  test::RunCriteriaTests(&ctx);
  test::RunLookupTests(&ctx);
  test::RunArrayTests(&ctx);
  test::RunFinancialTests(&ctx);
  test::RunDateTimeTests(&ctx);
  test::RunTextTests(&ctx);
  test::RunEngineeringTests(&ctx);
  test::RunReplTests(&ctx);

  std::cout << "[RESULT] passed=" << ctx.passed << " failed=" << ctx.failed << "\n";
  return ctx.failed == 0 ? 0 : 1;
}
