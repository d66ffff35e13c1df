#include "builtin/number_format.h"
#include "test_util.h"

namespace test {

namespace {

void TestJoiningAndSplitting(TestContext* ctx) {
  ExpectText("=CONCATENATE(\"a\", 1, TRUE)", "a1TRUE", ctx);
  ExpectText("=\"x\" & 2 & \"y\"", "x2y", ctx);
  ExpectText("=CONCAT({\"a\",\"b\"}, \"c\")", "abc", ctx);
  ExpectText("=TEXTJOIN(\", \", TRUE, \"a\", \"\", \"b\")", "a, b", ctx);
  ExpectText("=TEXTJOIN(\", \", FALSE, \"a\", \"\", \"b\")", "a, , b", ctx);
  ExpectText("=TEXTJOIN({\"-\",\"+\"}, FALSE, {1,2,3,4})", "1-2+3-4", ctx);
  ExpectError("=CONCAT(\"a\", 1/0)", rt::ErrorKind::kDivByZero, ctx);

  ExpectDisplay("=TEXTSPLIT(\"Apple,,Cherry\", \",\", , TRUE)", "{\"Apple\",\"Cherry\"}", ctx);
  ExpectDisplay("=TEXTSPLIT(\"Apple,,Cherry\", \",\")", "{\"Apple\",\"\",\"Cherry\"}", ctx);
  ExpectDisplay("=TEXTSPLIT(\"a,b;c\", \",\", \";\")", "{\"a\",\"b\";\"c\",#N/A}", ctx);
  ExpectDisplay("=TEXTSPLIT(\"a,b;c\", \",\", \";\", , , \"-\")", "{\"a\",\"b\";\"c\",\"-\"}",
                ctx);
  ExpectDisplay("=TEXTSPLIT(\"aXbxc\", \"x\", , , 1)", "{\"a\",\"b\",\"c\"}", ctx);
  ExpectDisplay("=TEXTSPLIT(\"1-2--3\", {\"-\",\"--\"})", "{\"1\",\"2\",\"3\"}", ctx);
  ExpectError("=TEXTSPLIT(\"abc\", \"\")", rt::ErrorKind::kValue, ctx);

  ExpectText("=TEXTBEFORE(\"a-b-c\", \"-\")", "a", ctx);
  ExpectText("=TEXTBEFORE(\"a-b-c\", \"-\", -1)", "a-b", ctx);
  ExpectText("=TEXTAFTER(\"a-b-c\", \"-\", 2)", "c", ctx);
  ExpectText("=TEXTAFTER(\"Hello World\", \"o\", 1)", " World", ctx);
  ExpectText("=TEXTAFTER(\"aXb\", \"x\", 1, 1)", "b", ctx);
  ExpectError("=TEXTAFTER(\"abc\", \"-\")", rt::ErrorKind::kNotAvailable, ctx);
  ExpectText("=TEXTAFTER(\"abc\", \"-\", 1, 0, FALSE, \"none\")", "none", ctx);
  ExpectText("=TEXTBEFORE(\"abc\", \"-\", 1, 0, TRUE)", "abc", ctx);
  ExpectText("=TEXTAFTER(\"abc\", \"-\", 1, 0, TRUE)", "", ctx);
  ExpectError("=TEXTBEFORE(\"a-b\", \"-\", 0)", rt::ErrorKind::kValue, ctx);
}

void TestSlicing(TestContext* ctx) {
  ExpectText("=LEFT(\"h\xC3\xA9llo\", 2)", "h\xC3\xA9", ctx);
  ExpectNumber("=LEN(\"h\xC3\xA9llo\")", 5, ctx);
  ExpectNumber("=LEN(123.5)", 5, ctx);
  ExpectText("=RIGHT(\"abc\")", "c", ctx);
  ExpectText("=RIGHT(\"abc\", 10)", "abc", ctx);
  ExpectText("=MID(\"abcdef\", 3, 2)", "cd", ctx);
  ExpectText("=MID(\"abc\", 5, 2)", "", ctx);
  ExpectError("=MID(\"abc\", 0, 1)", rt::ErrorKind::kValue, ctx);
  ExpectError("=LEFT(\"abc\", -1)", rt::ErrorKind::kValue, ctx);

  ExpectText("=UPPER(\"abc\")", "ABC", ctx);
  ExpectDisplay("=UPPER({\"a\",\"b\"})", "{\"A\",\"B\"}", ctx);
  ExpectText("=LOWER(\"AbC\")", "abc", ctx);
  ExpectText("=PROPER(\"hello wORLD o'neil\")", "Hello World O'Neil", ctx);
  ExpectText("=TRIM(\"  a   b  \")", "a b", ctx);
  ExpectText("=CLEAN(CHAR(7) & \"x\" & CHAR(10))", "x", ctx);

  ExpectText("=SUBSTITUTE(\"a-b-c\", \"-\", \"+\")", "a+b+c", ctx);
  ExpectText("=SUBSTITUTE(\"a-b-c\", \"-\", \"+\", 2)", "a-b+c", ctx);
  ExpectText("=SUBSTITUTE(\"a-b-c\", \"-\", \"+\", 3)", "a-b-c", ctx);
  ExpectText("=SUBSTITUTE(\"x\", \"\", \"y\")", "x", ctx);
  ExpectError("=SUBSTITUTE(\"x\", \"x\", \"y\", 0)", rt::ErrorKind::kValue, ctx);
  ExpectText("=REPLACE(\"abcdef\", 2, 3, \"XY\")", "aXYef", ctx);
  ExpectText("=REPLACE(\"abc\", 4, 0, \"d\")", "abcd", ctx);

  ExpectNumber("=FIND(\"b\", \"abcb\")", 2, ctx);
  ExpectNumber("=FIND(\"b\", \"abcb\", 3)", 4, ctx);
  ExpectError("=FIND(\"B\", \"abc\")", rt::ErrorKind::kValue, ctx);
  ExpectError("=FIND(\"a\", \"abc\", 5)", rt::ErrorKind::kValue, ctx);
  ExpectNumber("=SEARCH(\"B\", \"abc\")", 2, ctx);
  ExpectNumber("=SEARCH(\"c?\", \"abcd\")", 3, ctx);
  ExpectNumber("=SEARCH(\"\", \"abc\")", 1, ctx);
  ExpectNumber("=FIND(\"l\", \"h\xC3\xA9llo\")", 3, ctx);
  ExpectBool("=EXACT(\"a\", \"A\")", false, ctx);
  ExpectBool("=EXACT(\"a\", \"a\")", true, ctx);
  ExpectText("=REPT(\"ab\", 3)", "ababab", ctx);
  ExpectError("=REPT(\"a\", -1)", rt::ErrorKind::kValue, ctx);
  ExpectError("=REPT(\"ab\", 20000)", rt::ErrorKind::kValue, ctx);
}

void TestCodes(TestContext* ctx) {
  ExpectText("=CHAR(65)", "A", ctx);
  ExpectError("=CHAR(0)", rt::ErrorKind::kValue, ctx);
  ExpectNumber("=CODE(\"A\")", 65, ctx);
  ExpectNumber("=CODE(\"\xE2\x82\xAC\")", 63, ctx);
  ExpectError("=CODE(\"\")", rt::ErrorKind::kValue, ctx);
  ExpectText("=UNICHAR(8364)", "\xE2\x82\xAC", ctx);
  ExpectNumber("=UNICODE(\"\xE2\x82\xAC\")", 8364, ctx);
  ExpectError("=UNICHAR(55296)", rt::ErrorKind::kValue, ctx);

  ExpectNumber("=VALUE(\" 42 \")", 42, ctx);
  ExpectNumber("=VALUE(\"12%\")", 0.12, ctx);
  ExpectNumber("=VALUE(\"2024-01-15\")", 45306, ctx);
  ExpectNumber("=VALUE(\"10:30\")", 0.4375, ctx);
  ExpectError("=VALUE(\"abc\")", rt::ErrorKind::kValue, ctx);
  ExpectError("=VALUE(\"\")", rt::ErrorKind::kValue, ctx);
  ExpectNumber("=NUMBERVALUE(\"1.234,5\", \",\", \".\")", 1234.5, ctx);
  ExpectNumber("=NUMBERVALUE(\"25%%\")", 0.0025, ctx);
  ExpectNumber("=NUMBERVALUE(\"\")", 0, ctx);
  ExpectNumber("=NUMBERVALUE(\"1,2,3.4\")", 123.4, ctx);
  ExpectError("=NUMBERVALUE(\"1.2.3\")", rt::ErrorKind::kValue, ctx);
}

void TestFormatting(TestContext* ctx) {
  ExpectTrue(cellforge::builtin::GroupThousands("1234567") == "1,234,567", "group_thousands",
             ctx);
  ExpectTrue(cellforge::builtin::FormatFixed(-1234.567, 1, true) == "-1,234.6", "format_fixed",
             ctx);

  ExpectText("=TEXT(1234.567, \"#,##0.00\")", "1,234.57", ctx);
  ExpectText("=TEXT(0.256, \"0.0%\")", "25.6%", ctx);
  ExpectText("=TEXT(5, \"000\")", "005", ctx);
  ExpectText("=TEXT(2.5, \"0.###\")", "2.5", ctx);
  ExpectText("=TEXT(-5, \"0;(0)\")", "(5)", ctx);
  ExpectText("=TEXT(0, \"0;-0;\"\"zero\"\"\")", "zero", ctx);
  ExpectText("=TEXT(12345.678, \"0.00E+00\")", "1.23E+04", ctx);
  ExpectText("=TEXT(1234567, \"#,##0,\")", "1,235", ctx);
  ExpectText("=TEXT(9.5, \"$0.00\")", "$9.50", ctx);
  ExpectText("=TEXT(45306, \"yyyy-mm-dd\")", "2024-01-15", ctx);
  ExpectText("=TEXT(45306.75, \"dddd, mmmm d\")", "Monday, January 15", ctx);
  ExpectText("=TEXT(0.75, \"h:mm AM/PM\")", "6:00 PM", ctx);
  ExpectText("=TEXT(0.5625, \"hh:mm:ss\")", "13:30:00", ctx);
  ExpectText("=TEXT(1234.5, \"General\")", "1234.5", ctx);
  ExpectText("=TEXT(\"abc\", \"@!\")", "abc!", ctx);
  ExpectText("=TEXT(TRUE, \"0\")", "TRUE", ctx);
  ExpectError("=TEXT(-1, \"yyyy\")", rt::ErrorKind::kValue, ctx);

  ExpectText("=FIXED(1234.567, 1)", "1,234.6", ctx);
  ExpectText("=FIXED(1234.567)", "1,234.57", ctx);
  ExpectText("=FIXED(1234.567, -2, TRUE)", "1200", ctx);
  ExpectText("=DOLLAR(-1234.567)", "($1,234.57)", ctx);
  ExpectText("=DOLLAR(0.5, 0)", "$1", ctx);
}

}  // namespace

void RunTextTests(TestContext* ctx) {
  TestJoiningAndSplitting(ctx);
  TestSlicing(ctx);
  TestCodes(ctx);
  TestFormatting(ctx);
}

}  // namespace test
