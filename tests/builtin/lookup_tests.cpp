#include "test_util.h"

namespace test {

namespace {

void TestXLookup(TestContext* ctx) {
  ExpectText("=XLOOKUP(\"Orange\", {\"Apple\",\"Banana\"}, {10,20}, \"Not Found\")", "Not Found",
             ctx);
  ExpectNumber("=XLOOKUP(\"banana\", {\"Apple\",\"Banana\"}, {10,20})", 20, ctx);
  ExpectError("=XLOOKUP(\"Orange\", {\"Apple\",\"Banana\"}, {10,20})",
              rt::ErrorKind::kNotAvailable, ctx);
  ExpectNumber("=XLOOKUP(25, {10;20;30}, {1;2;3}, , -1)", 2, ctx);
  ExpectNumber("=XLOOKUP(25, {10;20;30}, {1;2;3}, , 1)", 3, ctx);
  ExpectError("=XLOOKUP(35, {10;20;30}, {1;2;3}, , 1)", rt::ErrorKind::kNotAvailable, ctx);
  ExpectNumber("=XLOOKUP(\"b*\", {\"apple\",\"berry\",\"bean\"}, {1,2,3}, , 2)", 2, ctx);
  ExpectNumber("=XLOOKUP(\"b*\", {\"apple\",\"berry\",\"bean\"}, {1,2,3}, , 2, -1)", 3, ctx);
  ExpectNumber("=XLOOKUP(4, {1,3,4,7,9}, {10,30,40,70,90}, , 0, 2)", 40, ctx);
  ExpectNumber("=XLOOKUP(5, {9,7,4,3,1}, {90,70,40,30,10}, , -1, -2)", 40, ctx);
  ExpectDisplay("=XLOOKUP(2, {1;2}, {\"a\",\"b\";\"c\",\"d\"})", "{\"c\",\"d\"}", ctx);
  ExpectError("=XLOOKUP(1, {1,2}, {1,2,3})", rt::ErrorKind::kValue, ctx);
  ExpectError("=XLOOKUP(1, {1,2}, {1,2}, , 3)", rt::ErrorKind::kValue, ctx);
  // Numbers never equal numeric text.
  ExpectError("=XLOOKUP(\"1\", {1,2}, {3,4})", rt::ErrorKind::kNotAvailable, ctx);

  ExpectNumber("=XMATCH(\"c\", {\"a\",\"b\",\"c\"})", 3, ctx);
  ExpectNumber("=XMATCH(3.5, {1,2,3,4}, 1)", 4, ctx);
  ExpectNumber("=XMATCH(3.5, {1,2,3,4}, -1)", 3, ctx);
  ExpectError("=XMATCH(9, {1,2,3})", rt::ErrorKind::kNotAvailable, ctx);
}

void TestTableLookups(TestContext* ctx) {
  rt::MemoryWorksheet sheet;
  sheet.Set("A1", rt::Value::Number(1));
  sheet.Set("A2", rt::Value::Number(5));
  sheet.Set("A3", rt::Value::Number(10));
  sheet.Set("B1", rt::Value::Text("low"));
  sheet.Set("B2", rt::Value::Text("mid"));
  sheet.Set("B3", rt::Value::Text("high"));
  rt::EvaluationContext context;
  context.worksheet = &sheet;

  ExpectText("=VLOOKUP(7, A1:B3, 2)", "mid", ctx, &context);
  ExpectText("=VLOOKUP(10, A1:B3, 2, TRUE)", "high", ctx, &context);
  ExpectError("=VLOOKUP(0, A1:B3, 2)", rt::ErrorKind::kNotAvailable, ctx, &context);
  ExpectError("=VLOOKUP(7, A1:B3, 2, FALSE)", rt::ErrorKind::kNotAvailable, ctx, &context);
  ExpectText("=VLOOKUP(5, A1:B3, 2, FALSE)", "mid", ctx, &context);
  ExpectError("=VLOOKUP(5, A1:B3, 3, FALSE)", rt::ErrorKind::kReference, ctx, &context);
  ExpectError("=VLOOKUP(5, A1:B3, 0, FALSE)", rt::ErrorKind::kValue, ctx, &context);
  ExpectNumber("=VLOOKUP(\"M?D\", {\"low\",1;\"mid\",2}, 2, FALSE)", 2, ctx);
  ExpectText("=HLOOKUP(\"b\", {\"a\",\"b\";\"x\",\"y\"}, 2, FALSE)", "y", ctx);
  ExpectText("=HLOOKUP(3, {1,2,4;\"one\",\"two\",\"four\"}, 2)", "two", ctx);

  // Approximate match finds each element of a sorted vector at its own position.
  for (int i = 1; i <= 5; ++i) {
    ExpectNumber("=MATCH(INDEX({2,4,8,16,32}, " + std::to_string(i) + "), {2,4,8,16,32})", i,
                 ctx);
  }
  ExpectNumber("=MATCH(9, {2,4,8,16,32})", 3, ctx);
  ExpectNumber("=MATCH(\"B\", {\"a\",\"b\",\"c\"}, 0)", 2, ctx);
  ExpectNumber("=MATCH(9, {32,16,8,4}, -1)", 2, ctx);
  ExpectError("=MATCH(1, {2,4}, 1)", rt::ErrorKind::kNotAvailable, ctx);
}

void TestIndexAndPositions(TestContext* ctx) {
  ExpectText("=LOOKUP(4.2, {1,2,3,4,5}, {\"a\",\"b\",\"c\",\"d\",\"e\"})", "d", ctx);
  ExpectNumber("=LOOKUP(3, {1,2;3,4;5,6})", 4, ctx);
  ExpectNumber("=INDEX({1,2;3,4}, 2, 1)", 3, ctx);
  ExpectDisplay("=INDEX({1,2;3,4}, 0, 2)", "{2;4}", ctx);
  ExpectDisplay("=INDEX({1,2;3,4}, 1, 0)", "{1,2}", ctx);
  ExpectNumber("=INDEX({5,6,7}, 3)", 7, ctx);
  ExpectError("=INDEX({1,2;3,4}, 3, 1)", rt::ErrorKind::kReference, ctx);
  ExpectError("=INDEX({1,2;3,4}, -1, 1)", rt::ErrorKind::kValue, ctx);
  ExpectText("=CHOOSE(2, \"a\", \"b\", \"c\")", "b", ctx);
  ExpectNumber("=CHOOSE(1, 5, 1/0)", 5, ctx);
  ExpectError("=CHOOSE(4, 1, 2)", rt::ErrorKind::kValue, ctx);

  ExpectNumber("=ROWS({1,2;3,4;5,6})", 3, ctx);
  ExpectNumber("=COLUMNS(A1:D2)", 4, ctx);
  ExpectNumber("=ROW(C7)", 7, ctx);
  ExpectNumber("=COLUMN(C7)", 3, ctx);
  ExpectDisplay("=ROW(B2:B4)", "{2;3;4}", ctx);
  ExpectDisplay("=COLUMN(B2:D2)", "{2,3,4}", ctx);
  ExpectError("=ROW(5)", rt::ErrorKind::kValue, ctx);
  rt::EvaluationContext context;
  context.current_cell = {4, 1};
  ExpectNumber("=ROW()", 5, ctx, &context);
  ExpectNumber("=COLUMN()", 2, ctx, &context);

  ExpectText("=ADDRESS(2, 3)", "$C$2", ctx);
  ExpectText("=ADDRESS(2, 3, 2)", "C$2", ctx);
  ExpectText("=ADDRESS(2, 3, 4)", "C2", ctx);
  ExpectText("=ADDRESS(2, 3, 1, FALSE)", "R2C3", ctx);
  ExpectText("=ADDRESS(2, 3, 4, FALSE)", "R[2]C[3]", ctx);
  ExpectText("=ADDRESS(1, 28, 1, TRUE, \"Sheet 2\")", "'Sheet 2'!$AB$1", ctx);
  ExpectError("=ADDRESS(0, 1)", rt::ErrorKind::kValue, ctx);
}

// Approximate matches do not check the order of their keys. The forward scans stop at the first
// key past the search key; XLOOKUP's linear modes look at every key.
void TestUnsortedApproximate(TestContext* ctx) {
  ExpectNumber("=MATCH(4, {1,5,3,4})", 1, ctx);
  ExpectNumber("=MATCH(4, {1,5,3,4}, 1)", 1, ctx);
  ExpectError("=MATCH(4, {5,1,3,4}, 1)", rt::ErrorKind::kNotAvailable, ctx);
  ExpectNumber("=MATCH(2, {5,1,3}, -1)", 1, ctx);
  ExpectText("=VLOOKUP(4, {1,\"a\";5,\"b\";3,\"c\";4,\"d\"}, 2)", "a", ctx);
  ExpectText("=VLOOKUP(4, {1,\"a\";5,\"b\";3,\"c\";4,\"d\"}, 2, FALSE)", "d", ctx);
  ExpectText("=HLOOKUP(4, {1,5,3,4;\"a\",\"b\",\"c\",\"d\"}, 2)", "a", ctx);
  ExpectNumber("=LOOKUP(4, {1,5,3,4}, {10,20,30,40})", 10, ctx);
  ExpectNumber("=XLOOKUP(3.5, {1,5,3,4}, {10,20,30,40}, , -1)", 30, ctx);
  ExpectNumber("=XLOOKUP(3.5, {1,5,3,4}, {10,20,30,40}, , 1)", 40, ctx);
  ExpectNumber("=XMATCH(4.5, {4,1,6,5}, 1)", 4, ctx);
}

void TestComputedReferences(TestContext* ctx) {
  rt::MemoryWorksheet sheet;
  sheet.Set("A1", rt::Value::Number(1));
  sheet.Set("B1", rt::Value::Number(2));
  sheet.Set("A2", rt::Value::Number(3));
  sheet.Set("B2", rt::Value::Number(4));
  sheet.Set("C3", rt::Value::Text("end"));
  rt::EvaluationContext context;
  context.worksheet = &sheet;

  ExpectNumber("=OFFSET(A1, 1, 1)", 4, ctx, &context);
  ExpectNumber("=SUM(OFFSET(A1, 0, 0, 2, 2))", 10, ctx, &context);
  ExpectDisplay("=OFFSET(A1:B1, 1, 0)", "{3,4}", ctx, &context);
  ExpectText("=OFFSET(B2, 1, 1)", "end", ctx, &context);
  ExpectNumber("=OFFSET(B2, -1, -1)", 1, ctx, &context);
  ExpectError("=OFFSET(A1, -1, 0)", rt::ErrorKind::kReference, ctx, &context);
  ExpectError("=OFFSET(A1, 0, 0, 0, 1)", rt::ErrorKind::kReference, ctx, &context);
  ExpectError("=OFFSET(5, 1, 1)", rt::ErrorKind::kValue, ctx, &context);

  ExpectNumber("=INDIRECT(\"B2\")", 4, ctx, &context);
  ExpectNumber("=INDIRECT(\"$a$2\")", 3, ctx, &context);
  ExpectNumber("=SUM(INDIRECT(\"B2:A1\"))", 10, ctx, &context);
  ExpectNumber("=INDIRECT(\"R1C2\", FALSE)", 2, ctx, &context);
  ExpectError("=INDIRECT(\"not a ref\")", rt::ErrorKind::kReference, ctx, &context);
  context.current_cell = {0, 0};
  ExpectNumber("=INDIRECT(\"R[1]C[1]\", FALSE)", 4, ctx, &context);
  ExpectNumber("=INDIRECT(\"RC[1]\", FALSE)", 2, ctx, &context);
  ExpectError("=INDIRECT(\"R[-1]C\", FALSE)", rt::ErrorKind::kReference, ctx, &context);

  context.options.max_array_cells = 3;
  ExpectError("=INDIRECT(\"A1:B2\")", rt::ErrorKind::kNumber, ctx, &context);
}

}  // namespace

void RunLookupTests(TestContext* ctx) {
  TestXLookup(ctx);
  TestTableLookups(ctx);
  TestIndexAndPositions(ctx);
  TestUnsortedApproximate(ctx);
  TestComputedReferences(ctx);
}

}  // namespace test
