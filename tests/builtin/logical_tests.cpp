#include "test_util.h"

namespace test {

namespace {

void TestConditionals(TestContext* ctx) {
  ExpectText("=IF(1>0, \"yes\", \"no\")", "yes", ctx);
  ExpectBool("=IF(FALSE, 1)", false, ctx);
  ExpectNumber("=IF(TRUE, , 5)", 0, ctx);
  ExpectNumber("=IF(\"true\", 3, 4)", 3, ctx);
  ExpectError("=IF(\"perhaps\", 3, 4)", rt::ErrorKind::kValue, ctx);
  // Only the taken branch is evaluated.
  ExpectNumber("=IF(TRUE, 1, 1/0)", 1, ctx);
  ExpectNumber("=IF(FALSE, NOSUCH(), 2)", 2, ctx);
  ExpectDisplay("=IF({1,0,1}, \"a\", \"b\")", "{\"a\",\"b\",\"a\"}", ctx);
  ExpectDisplay("=IF({TRUE,FALSE}, {1,2}, {10,20})", "{1,20}", ctx);

  ExpectText("=IFS(1>2, \"a\", 2>1, \"b\")", "b", ctx);
  ExpectError("=IFS(FALSE, 1)", rt::ErrorKind::kNotAvailable, ctx);
  ExpectError("=IFS(TRUE, 1, FALSE)", rt::ErrorKind::kValue, ctx);

  ExpectText("=SWITCH(2, 1, \"one\", 2, \"two\", \"other\")", "two", ctx);
  ExpectText("=SWITCH(9, 1, \"one\", \"other\")", "other", ctx);
  ExpectError("=SWITCH(9, 1, \"one\")", rt::ErrorKind::kNotAvailable, ctx);
  ExpectError("=SWITCH(\"1\", 1, \"number\")", rt::ErrorKind::kNotAvailable, ctx);

  ExpectNumber("=IFERROR(1/0, 7)", 7, ctx);
  ExpectNumber("=IFERROR(3, 1/0)", 3, ctx);
  ExpectNumber("=IFERROR(NA(), A1)", 0, ctx);
  ExpectDisplay("=IFERROR({1,0}/{0,1}, -1)", "{-1,0}", ctx);
  ExpectError("=IFNA(1/0, 0)", rt::ErrorKind::kDivByZero, ctx);
  ExpectText("=IFNA(NA(), \"missing\")", "missing", ctx);
}

void TestConnectives(TestContext* ctx) {
  ExpectBool("=AND(TRUE, 1, \"TRUE\")", true, ctx);
  ExpectBool("=AND(TRUE, 0)", false, ctx);
  ExpectBool("=AND({1,1,\"text\"})", true, ctx);
  ExpectError("=AND({\"a\",\"b\"})", rt::ErrorKind::kValue, ctx);
  ExpectError("=AND(\"maybe\")", rt::ErrorKind::kValue, ctx);
  // Evaluation stops at the first deciding argument.
  ExpectBool("=AND(FALSE, 1/0)", false, ctx);
  ExpectBool("=OR(TRUE, 1/0)", true, ctx);
  ExpectError("=OR(FALSE, 1/0)", rt::ErrorKind::kDivByZero, ctx);
  ExpectBool("=OR(0, 0, 2)", true, ctx);
  ExpectBool("=XOR(TRUE, TRUE, TRUE)", true, ctx);
  ExpectBool("=XOR({1,1})", false, ctx);
  ExpectBool("=NOT(0)", true, ctx);
  ExpectDisplay("=NOT({1,0})", "{FALSE,TRUE}", ctx);
  ExpectBool("=TRUE()", true, ctx);
  ExpectBool("=FALSE()", false, ctx);
}

void TestInformation(TestContext* ctx) {
  rt::MemoryWorksheet sheet;
  sheet.Set("A2", rt::Value::Text(""));
  rt::EvaluationContext context;
  context.worksheet = &sheet;

  ExpectBool("=ISBLANK(A1)", true, ctx, &context);
  ExpectBool("=ISBLANK(A2)", false, ctx, &context);
  ExpectBool("=ISREF(A1)", true, ctx, &context);
  ExpectBool("=ISREF(A1:B9)", true, ctx, &context);
  ExpectBool("=ISREF(\"A1\")", false, ctx);
  ExpectBool("=ISREF(1/0)", false, ctx);
  ExpectBool("=ISNUMBER(5)", true, ctx);
  ExpectBool("=ISNUMBER(\"5\")", false, ctx);
  ExpectBool("=ISTEXT(\"5\")", true, ctx);
  ExpectBool("=ISNONTEXT(5)", true, ctx);
  ExpectBool("=ISLOGICAL(FALSE)", true, ctx);
  ExpectBool("=ISERROR(1/0)", true, ctx);
  ExpectBool("=ISERR(NA())", false, ctx);
  ExpectBool("=ISERR(1/0)", true, ctx);
  ExpectBool("=ISNA(NA())", true, ctx);
  ExpectBool("=ISEVEN(-2.5)", true, ctx);
  ExpectBool("=ISODD(3)", true, ctx);
  ExpectError("=ISEVEN(\"x\")", rt::ErrorKind::kValue, ctx);
  ExpectError("=NA()", rt::ErrorKind::kNotAvailable, ctx);

  ExpectNumber("=TYPE(1)", 1, ctx);
  ExpectNumber("=TYPE(\"a\")", 2, ctx);
  ExpectNumber("=TYPE(TRUE)", 4, ctx);
  ExpectNumber("=TYPE(1/0)", 16, ctx);
  ExpectNumber("=TYPE({1,2})", 64, ctx);
  ExpectNumber("=ERROR.TYPE(#NULL!)", 1, ctx);
  ExpectNumber("=ERROR.TYPE(1/0)", 2, ctx);
  ExpectNumber("=ERROR.TYPE(NA())", 7, ctx);
  ExpectError("=ERROR.TYPE(1)", rt::ErrorKind::kNotAvailable, ctx);
  ExpectNumber("=N(TRUE)", 1, ctx);
  ExpectNumber("=N(\"7\")", 0, ctx);
  ExpectText("=T(\"abc\")", "abc", ctx);
  ExpectText("=T(12)", "", ctx);
}

}  // namespace

void RunLogicalTests(TestContext* ctx) {
  TestConditionals(ctx);
  TestConnectives(ctx);
  TestInformation(ctx);
}

}  // namespace test
