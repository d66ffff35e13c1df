#include "builtin/criteria.h"
#include "builtin/wildcard.h"
#include "test_util.h"

namespace test {

namespace {

void LoadSalesTable(rt::MemoryWorksheet* sheet) {
  struct Row {
    const char* product;
    const char* region;
    double amount;
    double quantity;
    const char* category;
  };
  static const Row kRows[] = {
      {"Widget", "North", 1000, 10, "Electronics"}, {"Gadget", "South", 2000, 20, "Electronics"},
      {"Widget", "North", 1500, 15, "Electronics"}, {"Tool", "East", 3000, 30, "Hardware"},
      {"Widget", "South", 2500, 25, "Electronics"}, {"Gadget", "North", 4000, 40, "Electronics"},
      {"Tool", "North", 3500, 35, "Hardware"},      {"Widget", "East", 5000, 50, "Electronics"},
      {"Gadget", "South", 6000, 60, "Electronics"}, {"Tool", "East", 7000, 70, "Hardware"},
  };
  sheet->Set("A1", rt::Value::Text("Product"));
  sheet->Set("B1", rt::Value::Text("Region"));
  sheet->Set("C1", rt::Value::Text("Amount"));
  sheet->Set("D1", rt::Value::Text("Quantity"));
  sheet->Set("E1", rt::Value::Text("Category"));
  int row = 1;
  for (const Row& r : kRows) {
    sheet->SetCellValue({row, 0}, rt::Value::Text(r.product));
    sheet->SetCellValue({row, 1}, rt::Value::Text(r.region));
    sheet->SetCellValue({row, 2}, rt::Value::Number(r.amount));
    sheet->SetCellValue({row, 3}, rt::Value::Number(r.quantity));
    sheet->SetCellValue({row, 4}, rt::Value::Text(r.category));
    ++row;
  }
}

bool Matches(const rt::Scalar& criterion, const rt::Scalar& cell) {
  auto parsed = bt::Criterion::Parse(criterion);
  return parsed && parsed->Matches(cell);
}

void TestWildcards(TestContext* ctx) {
  ExpectTrue(bt::HasWildcards("W*") && !bt::HasWildcards("~*"), "has_wildcards", ctx);
  ExpectTrue(bt::WildcardMatch("w*t", "Widget"), "star_matches_run", ctx);
  ExpectTrue(bt::WildcardMatch("?oo", "Foo") && !bt::WildcardMatch("?oo", "Fooo"),
             "question_matches_one", ctx);
  ExpectTrue(bt::WildcardMatch("5~*", "5*") && !bt::WildcardMatch("5~*", "55"),
             "tilde_escapes", ctx);
  ExpectTrue(bt::WildcardMatch("*", ""), "star_matches_empty", ctx);
  ExpectTrue(bt::WildcardFind("b?d", "abadbed", 0) == 1, "wildcard_find", ctx);
  ExpectTrue(bt::WildcardFind("b?d", "abadbed", 2) == 4, "wildcard_find_from", ctx);
  ExpectTrue(bt::WildcardFind("x", "abc", 0) == std::string::npos, "wildcard_find_none", ctx);
}

void TestCriterion(TestContext* ctx) {
  using S = rt::Scalar;
  ExpectTrue(Matches(S::Text(">5"), S::Number(6)), "gt_number", ctx);
  ExpectTrue(!Matches(S::Text(">5"), S::Number(5)), "gt_excludes_equal", ctx);
  ExpectTrue(Matches(S::Text("<>3"), S::Text("x")), "ne_matches_text", ctx);
  ExpectTrue(Matches(S::Number(3), S::Text("3")), "number_matches_numeric_text", ctx);
  ExpectTrue(Matches(S::Text("apple"), S::Text("APPLE")), "text_case_insensitive", ctx);
  ExpectTrue(Matches(S::Text("a*"), S::Text("avocado")), "wildcard_criterion", ctx);
  ExpectTrue(!Matches(S::Text("<>a*"), S::Text("avocado")), "negated_wildcard", ctx);
  ExpectTrue(Matches(S::Text(""), S::Empty()), "empty_matches_blank", ctx);
  ExpectTrue(Matches(S::Text("<>"), S::Number(0)), "ne_empty_matches_nonblank", ctx);
  ExpectTrue(Matches(S::Text("TRUE"), S::Bool(true)), "boolean_criterion", ctx);
  ExpectTrue(Matches(S::Text("<m"), S::Text("kiwi")), "text_ordering", ctx);
  ExpectTrue(!Matches(S::Text(">1"), S::Error(rt::ErrorKind::kValue)), "errors_never_match",
             ctx);
  ExpectTrue(!bt::Criterion::Parse(S::Error(rt::ErrorKind::kNotAvailable)).has_value(),
             "error_criterion_rejected", ctx);
}

void TestConditionalAggregates(TestContext* ctx) {
  rt::MemoryWorksheet sheet;
  LoadSalesTable(&sheet);
  rt::EvaluationContext context;
  context.worksheet = &sheet;

  ExpectNumber("=MAXIFS(C2:C11, A2:A11, \"Widget\", B2:B11, \"North\")", 1500, ctx, &context);
  ExpectNumber("=MAXIFS(C2:C11, C2:C11, \">3000\", B2:B11, \"North\")", 4000, ctx, &context);
  ExpectNumber("=MINIFS(C2:C11, A2:A11, \"Tool\")", 3000, ctx, &context);
  ExpectError("=MAXIFS(C2:C11, A2:A11, \"Nothing\")", rt::ErrorKind::kValue, ctx, &context);

  ExpectNumber("=COUNTIFS(A2:A11, \"Widget\", B2:B11, \"North\")", 2, ctx, &context);
  ExpectNumber("=COUNTIFS(C2:C11, \">2000\", D2:D11, \">30\")", 5, ctx, &context);
  ExpectNumber("=COUNTIFS(A2:A11, \"Gadget*\", E2:E11, \"Electronics\")", 3, ctx, &context);
  ExpectNumber("=COUNTIFS(A2:A11, \"Tool\", C2:C11, \">10000\")", 0, ctx, &context);
  ExpectError("=COUNTIFS(A2:A11, \"Widget\", B2:B10, \"North\")", rt::ErrorKind::kValue, ctx,
              &context);
  ExpectError("=COUNTIFS(A2:A11, \"Widget\", B2:B11)", rt::ErrorKind::kValue, ctx, &context);
  ExpectNumber("=COUNTIF(B2:B11, \"north\")", 4, ctx, &context);
  ExpectNumber("=COUNTIF(C2:C11, \">=5000\")", 3, ctx, &context);
  ExpectNumber("=COUNTIFS(SEQUENCE(1000), \">500\", SEQUENCE(1000), \"<900\")", 399, ctx);

  ExpectNumber("=SUMIFS(C2:C11, A2:A11, \"Widget\", B2:B11, \"North\")", 2500, ctx, &context);
  ExpectNumber("=SUMIFS(D2:D11, C2:C11, \">2000\", D2:D11, \">30\")", 255, ctx, &context);
  ExpectNumber("=SUMIFS(C2:C11, A2:A11, \"Nonexistent\")", 0, ctx, &context);
  ExpectNumber("=SUMIF(B2:B11, \"East\", C2:C11)", 15000, ctx, &context);
  ExpectNumber("=SUMIF(C2:C11, \"<2000\")", 2500, ctx, &context);
  ExpectError("=SUMIF(B2:B11, \"East\", C2:C10)", rt::ErrorKind::kValue, ctx, &context);

  ExpectNumber("=AVERAGEIFS(C2:C11, A2:A11, \"Widget\", B2:B11, \"North\")", 1250, ctx,
               &context);
  ExpectNumber("=AVERAGEIFS(D2:D11, C2:C11, \">3000\", E2:E11, \"Hardware\")", 52.5, ctx,
               &context);
  ExpectError("=AVERAGEIFS(C2:C11, A2:A11, \"Nonexistent\")", rt::ErrorKind::kDivByZero, ctx,
              &context);
  ExpectNumber("=AVERAGEIF(A2:A11, \"W*\", C2:C11)", 2500, ctx, &context);
  ExpectNumber("=SUMIFS(CHOOSECOLS(MAKEARRAY(5, 2, LAMBDA(r, c, r * c)), 1), "
               "CHOOSECOLS(MAKEARRAY(5, 2, LAMBDA(r, c, r * c)), 2), \">5\")",
               12, ctx);
}

void TestDatabase(TestContext* ctx) {
  rt::MemoryWorksheet sheet;
  LoadSalesTable(&sheet);
  sheet.Set("G1", rt::Value::Text("Region"));
  sheet.Set("G2", rt::Value::Text("North"));
  sheet.Set("H1", rt::Value::Text("Amount"));
  sheet.Set("H2", rt::Value::Text(">1000"));
  sheet.Set("J1", rt::Value::Text("Region"));
  sheet.Set("J2", rt::Value::Text("North"));
  sheet.Set("J3", rt::Value::Text("East"));
  sheet.Set("L1", rt::Value::Text("Amount"));
  sheet.Set("L2", rt::Value::Number(7000));
  rt::EvaluationContext context;
  context.worksheet = &sheet;

  ExpectNumber("=DSUM(A1:E11, \"Amount\", G1:H2)", 9000, ctx, &context);
  ExpectNumber("=DCOUNT(A1:E11, \"amount\", G1:G2)", 4, ctx, &context);
  ExpectNumber("=DAVERAGE(A1:E11, 3, G1:G2)", 2500, ctx, &context);
  ExpectNumber("=DMAX(A1:E11, \"Amount\", G1:G2)", 4000, ctx, &context);
  ExpectNumber("=DMIN(A1:E11, \"Amount\", G1:G2)", 1000, ctx, &context);
  ExpectNumber("=DPRODUCT(A1:E11, \"Quantity\", G1:G2)", 210000, ctx, &context);
  ExpectNumber("=DCOUNTA(A1:E11, \"Product\", J1:J3)", 7, ctx, &context);
  ExpectNumber("=DCOUNT(A1:E11, \"Product\", G1:G2)", 0, ctx, &context);
  ExpectText("=DGET(A1:E11, \"Product\", L1:L2)", "Tool", ctx, &context);
  ExpectError("=DGET(A1:E11, \"Product\", G1:G2)", rt::ErrorKind::kNumber, ctx, &context);
  ExpectError("=DSUM(A1:E11, \"Price\", G1:G2)", rt::ErrorKind::kValue, ctx, &context);
  ExpectError("=DSUM(A1:E11, 1E+20, G1:G2)", rt::ErrorKind::kValue, ctx, &context);
  ExpectError("=DSUM(A1:E11, -1E+20, G1:G2)", rt::ErrorKind::kValue, ctx, &context);
  ExpectError("=DSUM(A1:E11, 6, G1:G2)", rt::ErrorKind::kValue, ctx, &context);
  ExpectError("=DSUM(A1:E11, \"Amount\", G1:G1)", rt::ErrorKind::kValue, ctx, &context);
}

}  // namespace

void RunCriteriaTests(TestContext* ctx) {
  TestWildcards(ctx);
  TestCriterion(ctx);
  TestConditionalAggregates(ctx);
  TestDatabase(ctx);
}

}  // namespace test
