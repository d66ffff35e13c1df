#include "test_util.h"

namespace test {

namespace {

void TestSums(TestContext* ctx) {
  ExpectNumber("=SUM(1, \"2\", TRUE)", 4, ctx);
  ExpectNumber("=SUM({1,\"2\",TRUE})", 1, ctx);
  ExpectError("=SUM(\"x\")", rt::ErrorKind::kValue, ctx);
  ExpectNumber("=SUM(0.1, 0.2)", 0.3, ctx);
  ExpectNumber("=PRODUCT(2, 3, 4)", 24, ctx);
  ExpectNumber("=PRODUCT({2,\"a\"}, 5)", 10, ctx);

  rt::MemoryWorksheet sheet;
  sheet.Set("A1", rt::Value::Number(1));
  sheet.Set("A2", rt::Value::Text("5"));
  sheet.Set("A3", rt::Value::Bool(true));
  rt::EvaluationContext context;
  context.worksheet = &sheet;
  ExpectNumber("=SUM(A1:A3)", 1, ctx, &context);
  ExpectNumber("=SUM(A2)", 0, ctx, &context);
  ExpectNumber("=SUM(A1:A3, 10)", 11, ctx, &context);

  ExpectNumber("=SUMSQ(3, 4)", 25, ctx);
  ExpectNumber("=SUMPRODUCT({1,2,3}, {4,5,6})", 32, ctx);
  ExpectNumber("=SUMPRODUCT({1,\"x\"}, {3,4})", 3, ctx);
  ExpectError("=SUMPRODUCT({1,2}, {1,2,3})", rt::ErrorKind::kValue, ctx);
  ExpectNumber("=SUMX2MY2({2,3}, {1,1})", 11, ctx);
  ExpectNumber("=SUMX2PY2({2,3}, {1,1})", 15, ctx);
  ExpectNumber("=SUMXMY2({2,3}, {1,1})", 5, ctx);
  ExpectError("=SUMXMY2({2,3}, {1})", rt::ErrorKind::kNotAvailable, ctx);
}

void TestRounding(TestContext* ctx) {
  ExpectNumber("=ROUND(2.5, 0)", 3, ctx);
  ExpectNumber("=ROUND(-2.5, 0)", -3, ctx);
  ExpectNumber("=ROUND(1234.567, -2)", 1200, ctx);
  ExpectNumber("=ROUND(2.675, 2)", 2.68, ctx);
  ExpectNumber("=ROUNDUP(3.14159, 2)", 3.15, ctx);
  ExpectNumber("=ROUNDDOWN(-3.9, 0)", -3, ctx);
  ExpectNumber("=TRUNC(8.9)", 8, ctx);
  ExpectNumber("=TRUNC(-8.96, 1)", -8.9, ctx);
  ExpectNumber("=INT(-8.9)", -9, ctx);

  ExpectNumber("=MROUND(10, 3)", 9, ctx);
  ExpectError("=MROUND(10, -3)", rt::ErrorKind::kNumber, ctx);
  ExpectNumber("=MROUND(-10, -3)", -9, ctx);
  ExpectNumber("=MROUND(1.3, 0.2)", 1.4, ctx);
  ExpectNumber("=MROUND(5, 0)", 0, ctx);

  ExpectNumber("=CEILING(2.5, 1)", 3, ctx);
  ExpectNumber("=CEILING(-2.5, -2)", -4, ctx);
  ExpectError("=CEILING(2.5, -1)", rt::ErrorKind::kNumber, ctx);
  ExpectNumber("=FLOOR(3.7, 2)", 2, ctx);
  ExpectError("=FLOOR(1, 0)", rt::ErrorKind::kDivByZero, ctx);
  ExpectNumber("=CEILING.MATH(-5.5, 2)", -4, ctx);
  ExpectNumber("=CEILING.MATH(-5.5, 2, -1)", -6, ctx);
  ExpectNumber("=FLOOR.MATH(-5.5, 2)", -6, ctx);
  ExpectNumber("=FLOOR.MATH(-5.5, 2, -1)", -4, ctx);
  ExpectNumber("=CEILING.MATH(4.2)", 5, ctx);

  ExpectNumber("=EVEN(1.5)", 2, ctx);
  ExpectNumber("=EVEN(-1)", -2, ctx);
  ExpectNumber("=ODD(2)", 3, ctx);
  ExpectNumber("=ODD(-1.5)", -3, ctx);
  ExpectNumber("=ODD(0)", 1, ctx);
}

void TestArithmetic(TestContext* ctx) {
  ExpectNumber("=ABS(-4)", 4, ctx);
  ExpectNumber("=SIGN(-0.5)", -1, ctx);
  ExpectNumber("=MOD(-3, 2)", 1, ctx);
  ExpectNumber("=MOD(3, -2)", -1, ctx);
  ExpectError("=MOD(1, 0)", rt::ErrorKind::kDivByZero, ctx);
  ExpectNumber("=MOD(1E+20, 3)", 1, ctx);
  ExpectNumber("=MOD(-1E+20, 3)", 2, ctx);
  ExpectNumber("=MOD(1E+20, -7)", -5, ctx);
  ExpectNumber("=QUOTIENT(-10, 3)", -3, ctx);
  ExpectNumber("=POWER(2, 10)", 1024, ctx);
  ExpectError("=POWER(0, 0)", rt::ErrorKind::kNumber, ctx);
  ExpectError("=SQRT(-1)", rt::ErrorKind::kNumber, ctx);
  ExpectNumber("=SQRTPI(1)", 1.7724538509055159, ctx);
  ExpectNumber("=EXP(1)", 2.718281828459045, ctx);
  ExpectNumber("=LN(EXP(2))", 2, ctx);
  ExpectError("=LN(0)", rt::ErrorKind::kNumber, ctx);
  ExpectNumber("=LOG(8, 2)", 3, ctx);
  ExpectNumber("=LOG(100)", 2, ctx);
  ExpectError("=LOG(10, 1)", rt::ErrorKind::kDivByZero, ctx);
  ExpectNumber("=LOG10(1000)", 3, ctx);
}

void TestTrigonometry(TestContext* ctx) {
  ExpectNumber("=PI()", 3.141592653589793, ctx);
  ExpectNumber("=DEGREES(PI())", 180, ctx);
  ExpectNumber("=RADIANS(90)", 1.5707963267948966, ctx);
  ExpectNumber("=SIN(0)", 0, ctx);
  ExpectNumber("=COS(0)", 1, ctx);
  ExpectNumber("=TAN(PI()/4)", 1, ctx, nullptr, 1e-12);
  ExpectNumber("=COT(PI()/4)", 1, ctx, nullptr, 1e-12);
  ExpectError("=COT(0)", rt::ErrorKind::kDivByZero, ctx);
  ExpectNumber("=ASIN(1)", 1.5707963267948966, ctx);
  ExpectError("=ACOS(2)", rt::ErrorKind::kNumber, ctx);
  ExpectNumber("=ATAN(1)", 0.7853981633974483, ctx);
  ExpectNumber("=ATAN2(1, 1)", 0.7853981633974483, ctx);
  ExpectError("=ATAN2(0, 0)", rt::ErrorKind::kDivByZero, ctx);
  ExpectNumber("=SINH(0)", 0, ctx);
  ExpectNumber("=COSH(0)", 1, ctx);
  ExpectNumber("=TANH(0)", 0, ctx);
  ExpectNumber("=ASINH(0)", 0, ctx);
  ExpectError("=ACOSH(0.5)", rt::ErrorKind::kNumber, ctx);
  ExpectError("=ATANH(1)", rt::ErrorKind::kNumber, ctx);
}

void TestCombinatorics(TestContext* ctx) {
  ExpectNumber("=FACT(5)", 120, ctx);
  ExpectNumber("=FACT(5.9)", 120, ctx);
  ExpectError("=FACT(-1)", rt::ErrorKind::kNumber, ctx);
  ExpectNumber("=FACTDOUBLE(7)", 105, ctx);
  ExpectNumber("=COMBIN(5, 2)", 10, ctx);
  ExpectError("=COMBIN(2, 5)", rt::ErrorKind::kNumber, ctx);
  ExpectNumber("=PERMUT(5, 2)", 20, ctx);
  ExpectNumber("=GCD(12, 18)", 6, ctx);
  ExpectNumber("=GCD({24,36}, 8)", 4, ctx);
  ExpectError("=GCD(-4, 2)", rt::ErrorKind::kNumber, ctx);
  ExpectNumber("=LCM(4, 6)", 12, ctx);
  ExpectNumber("=LCM(4, 0)", 0, ctx);
  ExpectNumber("=MULTINOMIAL(2, 3, 4)", 1260, ctx);
}

void TestRandomAndAggregates(TestContext* ctx) {
  rt::Value r = EvalFormula("=RAND()");
  ExpectTrue(r.IsNumber() && r.number >= 0 && r.number < 1, "rand_in_unit_interval", ctx);
  ExpectNumber("=RANDBETWEEN(4, 4)", 4, ctx);
  rt::Value between = EvalFormula("=RANDBETWEEN(1, 6)");
  ExpectTrue(between.IsNumber() && between.number >= 1 && between.number <= 6 &&
                 between.number == static_cast<int>(between.number),
             "randbetween_integer_in_range", ctx);
  ExpectError("=RANDBETWEEN(5, 1)", rt::ErrorKind::kNumber, ctx);
  const auto* rand = bt::DefaultRegistry().Lookup("RAND");
  ExpectTrue(rand != nullptr && rand->is_volatile, "rand_is_volatile", ctx);

  ExpectNumber("=SUBTOTAL(9, {1,2,3})", 6, ctx);
  ExpectNumber("=SUBTOTAL(109, {1,2,3})", 6, ctx);
  ExpectNumber("=SUBTOTAL(1, {2,4})", 3, ctx);
  ExpectNumber("=SUBTOTAL(3, {1,\"a\",TRUE})", 3, ctx);
  ExpectNumber("=SUBTOTAL(4, {3,9,2}, 12)", 12, ctx);
  ExpectError("=SUBTOTAL(12, 1)", rt::ErrorKind::kValue, ctx);
  ExpectError("=SUBTOTAL(1, {\"a\"})", rt::ErrorKind::kDivByZero, ctx);
  ExpectNumber("=AGGREGATE(4, 0, {3,9,2})", 9, ctx);
  ExpectNumber("=AGGREGATE(5, 6, {3,9,2})", 2, ctx);
  ExpectError("=AGGREGATE(4, 8, {3,9,2})", rt::ErrorKind::kValue, ctx);
}

}  // namespace

void RunMathTests(TestContext* ctx) {
  TestSums(ctx);
  TestRounding(ctx);
  TestArithmetic(ctx);
  TestTrigonometry(ctx);
  TestCombinatorics(ctx);
  TestRandomAndAggregates(ctx);
}

}  // namespace test
