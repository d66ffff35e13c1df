#include "builtin/numeric.h"
#include "test_util.h"

namespace test {

namespace {

constexpr double kLoose = 1e-6;

// Erf carries an absolute error of up to 1.5e-7, so an inverse CDF at z can drift by that much
// divided by the density at z, scaled by sigma.
double InverseTolerance(double z, double sigma = 1.0) {
  constexpr double kErfCeiling = 1.5e-7;
  return 2 * kErfCeiling * sigma / bt::numeric::NormSPdf(z);
}

void TestDescriptive(TestContext* ctx) {
  ExpectNumber("=AVERAGE(2, 4, 9)", 5, ctx);
  ExpectNumber("=AVERAGE({1,\"x\",3})", 2, ctx);
  ExpectError("=AVERAGE({\"x\"})", rt::ErrorKind::kDivByZero, ctx);
  ExpectNumber("=AVERAGEA({1,\"x\",TRUE})", 2.0 / 3.0, ctx);
  ExpectNumber("=COUNT(1, \"2\", \"x\", TRUE, {3,\"4\"})", 4, ctx);
  ExpectNumber("=COUNTA(1, \"\", {\"a\",2})", 4, ctx);

  rt::MemoryWorksheet sheet;
  sheet.Set("A1", rt::Value::Number(3));
  sheet.Set("A2", rt::Value::Text(""));
  sheet.Set("A4", rt::Value::Text("n"));
  rt::EvaluationContext context;
  context.worksheet = &sheet;
  ExpectNumber("=COUNTBLANK(A1:A4)", 2, ctx, &context);
  ExpectNumber("=COUNT(A1:A4)", 1, ctx, &context);
  ExpectNumber("=COUNTA(A1:A4)", 3, ctx, &context);

  ExpectNumber("=MIN(4, 2, 8)", 2, ctx);
  ExpectNumber("=MAX({1,5}, 3)", 5, ctx);
  ExpectNumber("=MAX({\"a\"})", 0, ctx);
  ExpectNumber("=MINA({5,TRUE})", 1, ctx);
  ExpectNumber("=MAXA({-5,\"t\"})", 0, ctx);
  ExpectError("=MAX(1, NA())", rt::ErrorKind::kNotAvailable, ctx);
  ExpectNumber("=MEDIAN(3, 1, 2, 10)", 2.5, ctx);
  ExpectNumber("=MEDIAN(5, 1, 3)", 3, ctx);
  ExpectNumber("=MODE({1,2,2,3,3})", 2, ctx);
  ExpectNumber("=MODE.SNGL(4, 7, 7, 4)", 4, ctx);
  ExpectError("=MODE(1, 2, 3)", rt::ErrorKind::kNotAvailable, ctx);
  ExpectDisplay("=MODE.MULT({1,2,3,4,3,2,1,2,3})", "{2;3}", ctx);
  ExpectNumber("=MODE.MULT(5, 1, 5)", 5, ctx);
  ExpectError("=MODE.MULT({1,2,3})", rt::ErrorKind::kNotAvailable, ctx);

  ExpectNumber("=STDEV.S(2, 4, 4, 4, 5, 5, 7, 9)", 2.138089935299395, ctx);
  ExpectNumber("=STDEV.P(2, 4, 4, 4, 5, 5, 7, 9)", 2, ctx);
  ExpectNumber("=STDEV(1, 3)", 1.4142135623730951, ctx);
  ExpectNumber("=VAR.S(1, 2, 3, 4)", 1.6666666666666667, ctx);
  ExpectNumber("=VAR.P(1, 2, 3, 4)", 1.25, ctx);
  ExpectNumber("=VAR({1,2,3,4})", 1.6666666666666667, ctx);
  ExpectError("=STDEV.S(5)", rt::ErrorKind::kDivByZero, ctx);
  ExpectNumber("=STDEVA({2,TRUE,\"x\"})", 1, ctx);
  ExpectNumber("=STDEVPA({2,TRUE,\"x\"})", 0.816496580927726, ctx);
  ExpectNumber("=VARA({2,TRUE,\"x\"})", 1, ctx);
  ExpectNumber("=VARPA({2,TRUE,\"x\"})", 2.0 / 3.0, ctx);
  ExpectError("=VAR.S({2,TRUE,\"x\"})", rt::ErrorKind::kDivByZero, ctx);
  ExpectError("=VARA(1, \"x\")", rt::ErrorKind::kValue, ctx);
  ExpectNumber("=DEVSQ(4, 5, 8, 7, 11, 4, 3)", 48, ctx);
  ExpectNumber("=AVEDEV(4, 5, 6, 7, 5, 4, 3)", 1.0204081632653061, ctx);
  ExpectNumber("=GEOMEAN(2, 8)", 4, ctx);
  ExpectError("=GEOMEAN(2, -8)", rt::ErrorKind::kNumber, ctx);
  ExpectNumber("=HARMEAN(1, 2, 4)", 12.0 / 7.0, ctx);
}

void TestOrderStatistics(TestContext* ctx) {
  ExpectNumber("=LARGE({3,5,3,5,4}, 2)", 5, ctx);
  ExpectNumber("=SMALL({3,5,3,5,4}, 3)", 4, ctx);
  ExpectError("=SMALL({1,2}, 3)", rt::ErrorKind::kNumber, ctx);
  ExpectNumber("=RANK(7, {7,3.5,3.5,1,2})", 1, ctx);
  ExpectNumber("=RANK.EQ(3.5, {7,3.5,3.5,1,2}, 1)", 3, ctx);
  ExpectNumber("=RANK.AVG(3.5, {7,3.5,3.5,1,2})", 2.5, ctx);
  ExpectError("=RANK(9, {1,2})", rt::ErrorKind::kNotAvailable, ctx);

  ExpectNumber("=PERCENTILE({1,2,3,4}, 0.3)", 1.9, ctx);
  ExpectNumber("=PERCENTILE.INC({1,3,2,4}, 1)", 4, ctx);
  ExpectError("=PERCENTILE.INC({1,2}, 1.5)", rt::ErrorKind::kNumber, ctx);
  ExpectNumber("=PERCENTILE.EXC({1,2,3,4,5,6,7,8,9}, 0.25)", 2.5, ctx);
  ExpectError("=PERCENTILE.EXC({1,2,3}, 0.1)", rt::ErrorKind::kNumber, ctx);
  ExpectNumber("=QUARTILE({1,2,4,7,8,9,10,12}, 1)", 3.5, ctx);
  ExpectNumber("=QUARTILE.INC({1,2,4,7,8,9,10,12}, 4)", 12, ctx);
  ExpectError("=QUARTILE({1,2}, 5)", rt::ErrorKind::kNumber, ctx);
  ExpectNumber("=QUARTILE.EXC({6,7,15,36,39,40,41,42,43,47,49}, 1)", 15, ctx);
  ExpectNumber("=QUARTILE.EXC({6,7,15,36,39,40,41,42,43,47,49}, 3)", 43, ctx);
  ExpectError("=QUARTILE.EXC({1,2,3}, 4)", rt::ErrorKind::kNumber, ctx);
  ExpectError("=QUARTILE.EXC({1,2}, 1)", rt::ErrorKind::kNumber, ctx);

  const std::string inc = "{13,12,11,8,4,3,2,1,1,1}";
  ExpectNumber("=PERCENTRANK.INC(" + inc + ", 2)", 0.333, ctx);
  ExpectNumber("=PERCENTRANK(" + inc + ", 4)", 0.555, ctx);
  ExpectNumber("=PERCENTRANK.INC(" + inc + ", 5)", 0.583, ctx);
  ExpectNumber("=PERCENTRANK.INC(" + inc + ", 5, 1)", 0.5, ctx);
  ExpectNumber("=PERCENTRANK.INC(" + inc + ", 1)", 0, ctx);
  ExpectError("=PERCENTRANK.INC(" + inc + ", 14)", rt::ErrorKind::kNotAvailable, ctx);
  ExpectError("=PERCENTRANK.INC(" + inc + ", 2, 0)", rt::ErrorKind::kNumber, ctx);
  const std::string exc = "{1,2,3,6,6,6,7,8,9}";
  ExpectNumber("=PERCENTRANK.EXC(" + exc + ", 7)", 0.7, ctx);
  ExpectNumber("=PERCENTRANK.EXC(" + exc + ", 5.43)", 0.381, ctx);
  ExpectNumber("=PERCENTRANK.EXC(" + exc + ", 5.43, 1)", 0.3, ctx);
  ExpectNumber("=PERCENTRANK.EXC(" + exc + ", 1)", 0.1, ctx);

  ExpectDisplay("=FREQUENCY({79,85,78,85,50,81,95,88,97}, {70,79,89})", "{1;2;4;2}", ctx);
  ExpectDisplay("=FREQUENCY({79,85,78,85,50,81,95,88,97}, {89,70,79})", "{4;1;2;2}", ctx);
  ExpectDisplay("=FREQUENCY({1,2,3}, {2,2})", "{2;0;1}", ctx);
}

void TestRegression(TestContext* ctx) {
  const std::string ys = "{2,3,9,1,8,7,5}";
  const std::string xs = "{6,5,11,7,5,4,4}";
  ExpectNumber("=SLOPE(" + ys + ", " + xs + ")", 0.3055555555555556, ctx);
  ExpectNumber("=INTERCEPT(" + ys + ", " + xs + ")", 3.1666666666666665, ctx);
  ExpectNumber("=FORECAST(30, {6,7,9,15,21}, {20,28,31,38,40})", 10.607253086419755, ctx);
  ExpectNumber("=FORECAST.LINEAR(30, {6,7,9,15,21}, {20,28,31,38,40})", 10.607253086419755, ctx);
  ExpectNumber("=CORREL({3,2,4,5,6}, {9,7,12,15,17})", 0.9970544855015815, ctx);
  ExpectNumber("=PEARSON({3,2,4,5,6}, {9,7,12,15,17})", 0.9970544855015815, ctx);
  ExpectNumber("=RSQ({2,3,9,1,8,7,5}, {6,5,11,7,5,4,4})", 0.05795019157088122, ctx);
  ExpectNumber("=COVARIANCE.P({3,2,4,5,6}, {9,7,12,15,17})", 5.2, ctx);
  ExpectNumber("=COVARIANCE.S({2,4,8}, {5,11,12})", 9.666666666666666, ctx);
  ExpectError("=CORREL({1,2}, {1,2,3})", rt::ErrorKind::kNotAvailable, ctx);
  ExpectError("=SLOPE({1,2}, {3,3})", rt::ErrorKind::kDivByZero, ctx);
  ExpectNumber("=STEYX(" + ys + ", " + xs + ")", 3.305718950210041, ctx);
  ExpectError("=STEYX({1,2}, {3,4})", rt::ErrorKind::kDivByZero, ctx);
}

void TestLeastSquares(TestContext* ctx) {
  const std::string fit = "{2,4,5,4,5}, {1,2,3,4,5}";
  ExpectNumber("=INDEX(LINEST(" + fit + "), 1, 1)", 0.6, ctx);
  ExpectNumber("=INDEX(LINEST(" + fit + "), 1, 2)", 2.2, ctx);
  ExpectNumber("=INDEX(LINEST({2,4,5,4,5}), 1, 1)", 0.6, ctx);
  ExpectNumber("=INDEX(LINEST(" + fit + ", FALSE), 1, 1)", 1.2, ctx);
  ExpectNumber("=INDEX(LINEST(" + fit + ", FALSE), 1, 2)", 0, ctx);
  ExpectNumber("=ROWS(LINEST(" + fit + ", TRUE, TRUE))", 5, ctx);
  ExpectNumber("=INDEX(LINEST(" + fit + ", TRUE, TRUE), 2, 1)", 0.282842712474619, ctx);
  ExpectNumber("=INDEX(LINEST(" + fit + ", TRUE, TRUE), 2, 2)", 0.9380831519646858, ctx);
  ExpectNumber("=INDEX(LINEST(" + fit + ", TRUE, TRUE), 3, 1)", 0.6, ctx);
  ExpectNumber("=INDEX(LINEST(" + fit + ", TRUE, TRUE), 3, 2)", 0.894427190999916, ctx);
  ExpectNumber("=INDEX(LINEST(" + fit + ", TRUE, TRUE), 4, 1)", 4.5, ctx);
  ExpectNumber("=INDEX(LINEST(" + fit + ", TRUE, TRUE), 4, 2)", 3, ctx);
  ExpectNumber("=INDEX(LINEST(" + fit + ", TRUE, TRUE), 5, 1)", 3.6, ctx);
  ExpectNumber("=INDEX(LINEST(" + fit + ", TRUE, TRUE), 5, 2)", 2.4, ctx);

  // y = 1 + 2 * x1 + 3 * x2, one observation per row.
  const std::string plane = "{3;8;10;18;17}, {1,0;2,1;3,1;4,3;5,2}";
  ExpectNumber("=INDEX(LINEST(" + plane + "), 1, 1)", 3, ctx);
  ExpectNumber("=INDEX(LINEST(" + plane + "), 1, 2)", 2, ctx);
  ExpectNumber("=INDEX(LINEST(" + plane + "), 1, 3)", 1, ctx);
  ExpectNumber("=TREND(" + plane + ", {6,4})", 25, ctx);
  ExpectError("=TREND(" + plane + ", {6,4,1})", rt::ErrorKind::kReference, ctx);

  ExpectError("=LINEST({1,\"a\",3})", rt::ErrorKind::kValue, ctx);
  ExpectError("=LINEST({1,2,3}, {1,2})", rt::ErrorKind::kReference, ctx);
  ExpectError("=LINEST({1,2,3}, {4,4,4})", rt::ErrorKind::kNumber, ctx);

  ExpectNumber("=INDEX(TREND(" + fit + "), 1, 3)", 4, ctx);
  ExpectNumber("=INDEX(TREND(" + fit + ", {6,7}), 1, 2)", 6.4, ctx);
  ExpectNumber("=TREND(" + fit + ", 6)", 5.8, ctx);

  const std::string growth = "{33100,47300,69000,102000,150000,220000}, {11,12,13,14,15,16}";
  ExpectNumber("=INDEX(LOGEST(" + growth + "), 1, 1)", 1.4632756281161756, ctx, nullptr, 1e-9);
  ExpectNumber("=INDEX(LOGEST(" + growth + "), 1, 2)", 495.3047701587274, ctx, nullptr, 1e-6);
  ExpectNumber("=INDEX(GROWTH(" + growth + ", {17,18}), 1, 1)", 320196.71836347267, ctx,
               nullptr, 1e-4);
  ExpectNumber("=INDEX(GROWTH(" + growth + ", {17,18}), 1, 2)", 468536.054184048, ctx,
               nullptr, 1e-4);
  ExpectError("=LOGEST({1,-2,3})", rt::ErrorKind::kNumber, ctx);
  ExpectError("=GROWTH({1,0,3}, {1,2,3}, 4)", rt::ErrorKind::kNumber, ctx);

  ExpectNumber("=FISHER(0.75)", 0.9729550745276566, ctx);
  ExpectNumber("=FISHERINV(0.9729550745276566)", 0.75, ctx);
  ExpectNumber("=STANDARDIZE(42, 40, 1.5)", 4.0 / 3.0, ctx);
  ExpectError("=STANDARDIZE(42, 40, 0)", rt::ErrorKind::kNumber, ctx);
}

void TestDistributions(TestContext* ctx) {
  ExpectNumber("=NORM.DIST(42, 40, 1.5, TRUE)", 0.9087887802741321, ctx, nullptr, kLoose);
  ExpectNumber("=NORM.DIST(42, 40, 1.5, FALSE)", 0.10934004978399577, ctx, nullptr, kLoose);
  ExpectError("=NORM.DIST(42, 40, 0, TRUE)", rt::ErrorKind::kNumber, ctx);
  ExpectNumber("=NORM.S.DIST(0)", 0.5, ctx);
  ExpectNumber("=NORM.S.DIST(1, FALSE)", 0.24197072451914337, ctx, nullptr, kLoose);
  ExpectNumber("=NORM.S.INV(0.975)", 1.959963984540054, ctx, nullptr,
               InverseTolerance(1.959963984540054));
  ExpectNumber("=NORM.INV(0.9087887802741321, 40, 1.5)", 42, ctx, nullptr,
               InverseTolerance(2 / 1.5, 1.5));
  ExpectError("=NORM.S.INV(1)", rt::ErrorKind::kNumber, ctx);
  ExpectNumber("=LOGNORM.DIST(4, 3.5, 1.2, TRUE)", 0.0390835557068, ctx, nullptr, kLoose);
  ExpectNumber("=LOGNORM.INV(0.0390835557068, 3.5, 1.2)", 4, ctx, nullptr, 1e-5);

  ExpectNumber("=POISSON.DIST(2, 5, FALSE)", 0.08422433748856832, ctx, nullptr, kLoose);
  ExpectNumber("=POISSON(2, 5, TRUE)", 0.12465201948308113, ctx, nullptr, kLoose);
  ExpectNumber("=EXPON.DIST(0.2, 10, TRUE)", 0.8646647167633873, ctx, nullptr, kLoose);
  ExpectNumber("=EXPONDIST(0.2, 10, FALSE)", 1.353352832366127, ctx, nullptr, kLoose);
  ExpectNumber("=BINOM.DIST(6, 10, 0.5, FALSE)", 0.205078125, ctx, nullptr, kLoose);
  ExpectNumber("=BINOM.DIST(6, 10, 0.5, TRUE)", 0.828125, ctx, nullptr, kLoose);
  ExpectNumber("=BINOM.INV(6, 0.5, 0.75)", 4, ctx);
  ExpectNumber("=BINOM.INV(100, 0.5, 0.95)", 58, ctx);
  ExpectError("=BINOM.DIST(3.5, 10, 0.5, FALSE)", rt::ErrorKind::kNumber, ctx);
  ExpectError("=BINOM.DIST(3, 10.5, 0.5, FALSE)", rt::ErrorKind::kNumber, ctx);
  ExpectError("=BINOM.DIST(3, 10, 1.5, FALSE)", rt::ErrorKind::kNumber, ctx);
  ExpectNumber("=BINOM.DIST(0, 10, 0, FALSE)", 1, ctx);
  ExpectError("=BINOM.INV(10.5, 0.5, 0.5)", rt::ErrorKind::kNumber, ctx);
  ExpectError("=BINOM.INV(10, 0, 0.5)", rt::ErrorKind::kNumber, ctx);
  ExpectError("=BINOM.INV(10, 1, 0.5)", rt::ErrorKind::kNumber, ctx);
  ExpectError("=BINOM.INV(10, 0.5, 0)", rt::ErrorKind::kNumber, ctx);
  ExpectError("=BINOM.INV(10, 0.5, 1)", rt::ErrorKind::kNumber, ctx);
  ExpectNumber("=HYPGEOM.DIST(1, 4, 8, 20, FALSE)", 1760.0 / 4845.0, ctx, nullptr, kLoose);
  ExpectNumber("=HYPGEOM.DIST(1, 4, 8, 20, TRUE)", 2255.0 / 4845.0, ctx, nullptr, kLoose);

  ExpectNumber("=GAMMA(5)", 24, ctx, nullptr, kLoose);
  ExpectNumber("=GAMMALN(10)", 12.801827480081469, ctx, nullptr, kLoose);
  ExpectError("=GAMMA(0)", rt::ErrorKind::kNumber, ctx);
  ExpectNumber("=GAMMA.DIST(10.00001131, 9, 2, TRUE)", 0.068094, ctx, nullptr, 1e-5);
  ExpectNumber("=GAMMA.DIST(10.00001131, 9, 2, FALSE)", 0.032639, ctx, nullptr, 1e-5);
  ExpectNumber("=GAMMA.INV(0.068094, 9, 2)", 10.0000112, ctx, nullptr, 1e-3);
  ExpectNumber("=BETA.DIST(2, 8, 10, TRUE, 1, 3)", 0.6854705810117458, ctx, nullptr, kLoose);
  ExpectNumber("=BETA.INV(0.6854705810117458, 8, 10, 1, 3)", 2, ctx, nullptr, 1e-5);

  ExpectNumber("=CHISQ.DIST(0.5, 1, TRUE)", 0.5204998778130465, ctx, nullptr, kLoose);
  ExpectNumber("=CHISQ.DIST.RT(18.307, 10)", 0.0500006, ctx, nullptr, 1e-6);
  ExpectNumber("=CHISQ.INV(0.93, 1)", 3.283020286759539, ctx, nullptr, 1e-5);
  ExpectNumber("=T.DIST(60, 1, TRUE)", 0.9946953263673721, ctx, nullptr, kLoose);
  ExpectNumber("=T.DIST.RT(1.959999998, 60)", 0.027322464988, ctx, nullptr, kLoose);
  ExpectNumber("=T.DIST.2T(1.959999998, 60)", 0.054644929976, ctx, nullptr, kLoose);
  ExpectNumber("=T.INV(0.75, 2)", 0.8164965809277259, ctx, nullptr, 1e-5);
  ExpectNumber("=T.INV.2T(0.546449, 60)", 0.606533, ctx, nullptr, 1e-5);
  ExpectError("=T.DIST.RT(1, 0)", rt::ErrorKind::kNumber, ctx);

  ExpectNumber("=WEIBULL.DIST(105, 20, 100, TRUE)", 0.9295813900692769, ctx, nullptr, kLoose);
  ExpectNumber("=WEIBULL.DIST(105, 20, 100, FALSE)", 0.03558886, ctx, nullptr, kLoose);
  ExpectNumber("=ERF(1)", 0.8427007929497149, ctx, nullptr, kLoose);
  ExpectNumber("=ERF(0, 1)", 0.8427007929497149, ctx, nullptr, kLoose);
  ExpectNumber("=ERFC(1)", 0.15729920705028513, ctx, nullptr, kLoose);

  ExpectNumber("=F.DIST(15.2069, 6, 4, TRUE)", 0.9900000430027627, ctx, nullptr, kLoose);
  ExpectNumber("=F.DIST(15.2069, 6, 4, FALSE)", 0.0012237917087831779, ctx, nullptr, kLoose);
  ExpectNumber("=F.DIST.RT(15.2069, 6, 4)", 0.009999956997237325, ctx, nullptr, kLoose);
  ExpectNumber("=F.INV(0.01, 6, 4)", 0.10930991412457852, ctx, nullptr, 1e-5);
  ExpectNumber("=F.INV.RT(0.01, 6, 4)", 15.206864861157474, ctx, nullptr, 1e-4);
  ExpectError("=F.DIST(-1, 6, 4, TRUE)", rt::ErrorKind::kNumber, ctx);
  ExpectError("=F.DIST(1, 0, 4, TRUE)", rt::ErrorKind::kNumber, ctx);
  ExpectError("=F.INV(1.5, 6, 4)", rt::ErrorKind::kNumber, ctx);
  ExpectNumber("=CHISQ.INV.RT(0.050001, 10)", 18.306973456961018, ctx, nullptr, 1e-4);
  ExpectNumber("=CHISQ.INV.RT(1, 10)", 0, ctx);
  ExpectError("=CHISQ.INV.RT(0, 10)", rt::ErrorKind::kNumber, ctx);
}

void TestHypothesisTests(TestContext* ctx) {
  const std::string samples = "{3,4,5,8,9,1,2,4,5}, {6,19,3,2,14,4,5,17,1}";
  ExpectNumber("=T.TEST(" + samples + ", 2, 1)", 0.1960157849252826, ctx, nullptr, kLoose);
  ExpectNumber("=T.TEST(" + samples + ", 2, 2)", 0.19199588676039614, ctx, nullptr, kLoose);
  ExpectNumber("=T.TEST(" + samples + ", 1, 2)", 0.09599794338019807, ctx, nullptr, kLoose);
  ExpectNumber("=T.TEST(" + samples + ", 2, 3)", 0.20229392336867802, ctx, nullptr, kLoose);
  ExpectError("=T.TEST(" + samples + ", 3, 1)", rt::ErrorKind::kNumber, ctx);
  ExpectError("=T.TEST({1,2,3}, {1,2}, 2, 1)", rt::ErrorKind::kNotAvailable, ctx);
  ExpectNumber("=F.TEST({6,7,9,15,21}, {20,28,31,38,40})", 0.648317846786175, ctx, nullptr,
               kLoose);
  ExpectError("=F.TEST({1}, {2,3})", rt::ErrorKind::kDivByZero, ctx);
  ExpectNumber("=CHISQ.TEST({58,35;11,25;10,23}, {45.35,47.65;17.56,18.44;16.09,16.91})",
               0.0003081920170082686, ctx, nullptr, 1e-9);
  ExpectError("=CHISQ.TEST({1,2}, {1,2,3})", rt::ErrorKind::kNotAvailable, ctx);
  ExpectError("=CHISQ.TEST({1,2}, {0,2})", rt::ErrorKind::kDivByZero, ctx);
}

}  // namespace

void RunStatisticalTests(TestContext* ctx) {
  TestDescriptive(ctx);
  TestOrderStatistics(ctx);
  TestRegression(ctx);
  TestLeastSquares(ctx);
  TestDistributions(ctx);
  TestHypothesisTests(ctx);
}

}  // namespace test
