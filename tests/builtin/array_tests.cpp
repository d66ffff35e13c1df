#include "test_util.h"

namespace test {

namespace {

void TestGenerators(TestContext* ctx) {
  ExpectDisplay("=SEQUENCE(2, 3)", "{1,2,3;4,5,6}", ctx);
  ExpectDisplay("=SEQUENCE(3, 1, 10, -2)", "{10;8;6}", ctx);
  ExpectNumber("=SEQUENCE(1)", 1, ctx);
  ExpectError("=SEQUENCE(0)", rt::ErrorKind::kValue, ctx);
  rt::EvaluationContext small;
  small.options.max_array_cells = 10;
  ExpectError("=SEQUENCE(4, 4)", rt::ErrorKind::kNumber, ctx, &small);
  ExpectDisplay("=MUNIT(2)", "{1,0;0,1}", ctx);

  rt::Value grid = EvalFormula("=RANDARRAY(2, 3)");
  bool in_range = grid.IsArray() && grid.array->rows == 2 && grid.array->cols == 3;
  if (in_range) {
    for (const auto& cell : grid.array->cells) {
      in_range = in_range && cell.IsNumber() && cell.number >= 0 && cell.number < 1;
    }
  }
  ExpectTrue(in_range, "randarray_shape_and_range", ctx);
  ExpectNumber("=RANDARRAY(1, 1, 5, 5, TRUE)", 5, ctx);
  ExpectError("=RANDARRAY(1, 1, 5, 1)", rt::ErrorKind::kValue, ctx);
}

void TestReshaping(TestContext* ctx) {
  ExpectDisplay("=TRANSPOSE({1,2;3,4})", "{1,3;2,4}", ctx);
  ExpectDisplay("=TAKE(SEQUENCE(10), -3)", "{8;9;10}", ctx);
  ExpectDisplay("=TAKE({1,2;3,4}, 1)", "{1,2}", ctx);
  ExpectDisplay("=TAKE({1,2,3}, , 2)", "{1,2}", ctx);
  ExpectError("=TAKE({1,2,3}, 0)", rt::ErrorKind::kValue, ctx);
  ExpectDisplay("=DROP(SEQUENCE(5), 2)", "{3;4;5}", ctx);
  ExpectNumber("=DROP(SEQUENCE(5), -4)", 1, ctx);
  ExpectError("=DROP(SEQUENCE(2), 2)", rt::ErrorKind::kValue, ctx);

  ExpectDisplay("=CHOOSEROWS({1,2;3,4;5,6}, -1, 1)", "{5,6;1,2}", ctx);
  ExpectDisplay("=CHOOSECOLS({1,2,3}, {3,1})", "{3,1}", ctx);
  ExpectError("=CHOOSEROWS({1;2}, 0)", rt::ErrorKind::kValue, ctx);
  ExpectError("=CHOOSECOLS({1,2}, 3)", rt::ErrorKind::kValue, ctx);

  ExpectDisplay("=VSTACK({1,2}, {3})", "{1,2;3,#N/A}", ctx);
  ExpectDisplay("=HSTACK({1;2}, {3})", "{1,3;2,#N/A}", ctx);
  ExpectDisplay("=TOCOL({1,2;3,4})", "{1;2;3;4}", ctx);
  ExpectDisplay("=TOROW({1,2;3,4}, 0, TRUE)", "{1,3,2,4}", ctx);
  ExpectDisplay("=TOCOL(VSTACK({1,2}, {3}), 2)", "{1;2;3}", ctx);
  ExpectError("=TOROW({1}, 4)", rt::ErrorKind::kValue, ctx);

  ExpectDisplay("=WRAPROWS(SEQUENCE(5), 2)", "{1,2;3,4;5,#N/A}", ctx);
  ExpectDisplay("=WRAPROWS({1,2,3,4,5}, 2, 0)", "{1,2;3,4;5,0}", ctx);
  ExpectDisplay("=WRAPCOLS({1,2,3}, 2)", "{1,3;2,#N/A}", ctx);
  ExpectError("=WRAPROWS({1,2;3,4}, 2)", rt::ErrorKind::kValue, ctx);
  ExpectDisplay("=EXPAND({1,2}, 2, , \"x\")", "{1,2;\"x\",\"x\"}", ctx);
  ExpectError("=EXPAND({1,2;3,4}, 1)", rt::ErrorKind::kValue, ctx);
}

void TestOrdering(TestContext* ctx) {
  ExpectDisplay("=SORT({3;1;2})", "{1;2;3}", ctx);
  ExpectDisplay("=SORT({3;1;2}, 1, -1)", "{3;2;1}", ctx);
  ExpectDisplay("=SORT({\"b\",2;\"a\",1}, 2)", "{\"a\",1;\"b\",2}", ctx);
  ExpectDisplay("=SORT({3,1,2}, 1, 1, TRUE)", "{1,2,3}", ctx);
  ExpectDisplay("=SORT({\"b\";1;TRUE;\"a\"})", "{1;\"a\";\"b\";TRUE}", ctx);
  ExpectError("=SORT({1,2}, 3)", rt::ErrorKind::kValue, ctx);
  ExpectError("=SORT({1;2}, 1, 0)", rt::ErrorKind::kValue, ctx);

  rt::MemoryWorksheet sheet;
  sheet.Set("A1", rt::Value::Number(2));
  sheet.Set("A3", rt::Value::Number(1));
  rt::EvaluationContext context;
  context.worksheet = &sheet;
  ExpectDisplay("=SORT(A1:A3, 1, -1)", "{2;1;}", ctx, &context);

  ExpectDisplay("=SORTBY({\"a\";\"b\";\"c\"}, {3;1;2})", "{\"b\";\"c\";\"a\"}", ctx);
  ExpectDisplay("=SORTBY({\"a\";\"b\";\"c\"}, {3;1;2}, -1)", "{\"a\";\"c\";\"b\"}", ctx);
  ExpectDisplay("=SORTBY({\"x\";\"y\";\"z\"}, {1;1;0}, 1, {1;2;3}, -1)",
                "{\"z\";\"y\";\"x\"}", ctx);
  ExpectError("=SORTBY({\"a\";\"b\"}, {1;2;3})", rt::ErrorKind::kValue, ctx);

  ExpectDisplay("=UNIQUE({1;2;1;3})", "{1;2;3}", ctx);
  ExpectDisplay("=UNIQUE({1;2;1;3}, FALSE, TRUE)", "{2;3}", ctx);
  ExpectDisplay("=UNIQUE({1,2;1,2;3,4})", "{1,2;3,4}", ctx);
  ExpectDisplay("=UNIQUE({1,1,2}, TRUE)", "{1,2}", ctx);
  ExpectError("=UNIQUE({1;1}, FALSE, TRUE)", rt::ErrorKind::kValue, ctx);

  ExpectDisplay("=FILTER({1;2;3;4}, {1;0;1;0})", "{1;3}", ctx);
  ExpectDisplay("=FILTER({1,2;3,4;5,6}, {TRUE;FALSE;TRUE})", "{1,2;5,6}", ctx);
  ExpectDisplay("=FILTER({1,2,3}, {1,2,3}>1)", "{2,3}", ctx);
  ExpectText("=FILTER({1,2,3}, {FALSE,FALSE,FALSE}, \"none\")", "none", ctx);
  ExpectError("=FILTER({1,2,3}, {0,0,0})", rt::ErrorKind::kValue, ctx);
  ExpectError("=FILTER({1;2}, {1;0;1})", rt::ErrorKind::kValue, ctx);
}

void TestLambdaHelpers(TestContext* ctx) {
  ExpectDisplay("=MAP({1,2,3}, LAMBDA(x, x*2))", "{2,4,6}", ctx);
  ExpectDisplay("=MAP({1,2}, {10,20}, LAMBDA(a, b, a+b))", "{11,22}", ctx);
  ExpectDisplay("=MAP({1,0}, LAMBDA(x, 1/x))", "{1,#DIV/0!}", ctx);
  ExpectError("=MAP({1,2}, LAMBDA(a, b, a+b))", rt::ErrorKind::kValue, ctx);
  ExpectError("=MAP({1,2}, 3)", rt::ErrorKind::kValue, ctx);

  ExpectNumber("=REDUCE(0, {1,2,3}, LAMBDA(acc, v, acc+v))", 6, ctx);
  ExpectNumber("=REDUCE(1, SEQUENCE(5), LAMBDA(acc, v, acc*v))", 120, ctx);
  ExpectNumber("=REDUCE(, {4,5}, LAMBDA(acc, v, acc+v))", 9, ctx);
  ExpectDisplay("=SCAN(0, {1,2,3}, LAMBDA(acc, v, acc+v))", "{1,3,6}", ctx);
  ExpectDisplay("=SCAN(\"\", {\"a\",\"b\"}, LAMBDA(acc, v, acc&v))", "{\"a\",\"ab\"}", ctx);

  ExpectDisplay("=BYROW({1,2;3,4}, LAMBDA(r, SUM(r)))", "{3;7}", ctx);
  ExpectDisplay("=BYCOL({1,2;3,4}, LAMBDA(c, MAX(c)))", "{3,4}", ctx);
  ExpectError("=BYROW({1,2}, LAMBDA(a, b, a))", rt::ErrorKind::kValue, ctx);
  ExpectDisplay("=MAKEARRAY(2, 3, LAMBDA(r, c, r*c))", "{1,2,3;2,4,6}", ctx);
  ExpectError("=MAKEARRAY(0, 1, LAMBDA(r, c, r))", rt::ErrorKind::kValue, ctx);

  ExpectNumber("=LET(x, 2, y, x*3, x+y)", 8, ctx);
  ExpectNumber("=LET(sq, LAMBDA(n, n*n), sq(4) + sq(3))", 25, ctx);
  ExpectNumber("=LET(x, 1, LET(x, 5, x) + x)", 6, ctx);
  ExpectDisplay("=LET(data, SEQUENCE(6), FILTER(data, MOD(data, 2) = 0))", "{2;4;6}", ctx);
}

}  // namespace

void RunArrayTests(TestContext* ctx) {
  TestGenerators(ctx);
  TestReshaping(ctx);
  TestOrdering(ctx);
  TestLambdaHelpers(ctx);
}

}  // namespace test
