#include <algorithm>
#include <cmath>
#include <cstdint>
#include <random>
#include <vector>

#include "builtin/args.h"
#include "builtin/builtins.h"
#include "builtin/numeric.h"
#include "builtin/stats.h"
#include "runtime/coerce.h"
#include "runtime/operators.h"

namespace cellforge::builtin {

namespace {

using runtime::Array;
using runtime::CallArgs;
using runtime::ErrorKind;
using runtime::Scalar;
using runtime::Value;

constexpr Category kCat = Category::kMath;

template <typename F>
Value MapNumber(CallArgs& args, F f) {
  double x = 0.0;
  if (auto err = NumberArg(args, 0, &x)) return *err;
  return f(x);
}

Value Num(double x) {
  return Value::Number(x);
}

Value NumError() {
  return Value::Error(ErrorKind::kNumber);
}

Value DivError() {
  return Value::Error(ErrorKind::kDivByZero);
}

Value Sum(CallArgs& args) {
  std::vector<double> xs;
  if (auto err = CollectNumbers(args, 0, args.size(), &xs)) return *err;
  return Num(stats::Sum(xs));
}

Value Product(CallArgs& args) {
  return stats::AggregateByCode(6, args, 0);
}

Value Abs(CallArgs& args) {
  return MapNumber(args, [](double x) { return Num(std::fabs(x)); });
}

Value Sign(CallArgs& args) {
  return MapNumber(args, [](double x) { return Num(x > 0 ? 1.0 : (x < 0 ? -1.0 : 0.0)); });
}

Value Int(CallArgs& args) {
  return MapNumber(args, [](double x) { return Num(std::floor(x)); });
}

// ROUND family: (number, digits) with digits truncated.
template <typename F>
Value RoundWith(CallArgs& args, int64_t default_digits, F f) {
  double x = 0.0;
  int64_t digits = 0;
  if (auto err = NumberArg(args, 0, &x)) return *err;
  if (auto err = IntArgOr(args, 1, default_digits, &digits)) return *err;
  digits = std::clamp<int64_t>(digits, -308, 308);
  return Num(f(x, static_cast<int>(digits)));
}

Value Trunc(CallArgs& args) {
  return RoundWith(args, 0, numeric::RoundDownDigits);
}

Value Round(CallArgs& args) {
  return RoundWith(args, 0, numeric::RoundDigits);
}

Value RoundUp(CallArgs& args) {
  return RoundWith(args, 0, numeric::RoundUpDigits);
}

Value RoundDown(CallArgs& args) {
  return RoundWith(args, 0, numeric::RoundDownDigits);
}

Value MRound(CallArgs& args) {
  double x = 0.0;
  double multiple = 0.0;
  if (auto err = NumberArg(args, 0, &x)) return *err;
  if (auto err = NumberArg(args, 1, &multiple)) return *err;
  if (multiple == 0.0) return Num(0);
  if ((x > 0 && multiple < 0) || (x < 0 && multiple > 0)) return NumError();
  return Num(numeric::Snap15(numeric::RoundDigits(x / multiple, 0) * multiple));
}

Value Ceiling(CallArgs& args) {
  double x = 0.0;
  double sig = 0.0;
  if (auto err = NumberArg(args, 0, &x)) return *err;
  if (auto err = NumberArg(args, 1, &sig)) return *err;
  if (sig == 0.0) return Num(0);
  if (x > 0 && sig < 0) return NumError();
  return Num(numeric::Snap15(std::ceil(numeric::Snap15(x / sig)) * sig));
}

Value Floor(CallArgs& args) {
  double x = 0.0;
  double sig = 0.0;
  if (auto err = NumberArg(args, 0, &x)) return *err;
  if (auto err = NumberArg(args, 1, &sig)) return *err;
  if (sig == 0.0) return x == 0.0 ? Num(0) : DivError();
  if (x > 0 && sig < 0) return NumError();
  return Num(numeric::Snap15(std::floor(numeric::Snap15(x / sig)) * sig));
}

// CEILING.MATH / FLOOR.MATH: significance sign is ignored; `mode` flips the direction for
// negative numbers.
Value RoundMath(CallArgs& args, bool up) {
  double x = 0.0;
  double sig = 1.0;
  double mode = 0.0;
  if (auto err = NumberArg(args, 0, &x)) return *err;
  if (auto err = NumberArgOr(args, 1, 1.0, &sig)) return *err;
  if (auto err = NumberArgOr(args, 2, 0.0, &mode)) return *err;
  sig = std::fabs(sig);
  if (sig == 0.0) return Num(0);
  const double q = numeric::Snap15(x / sig);
  double steps = 0.0;
  if (x < 0 && mode != 0.0) {
    // Negative numbers move away from zero for CEILING, toward zero for FLOOR.
    steps = up ? -std::ceil(std::fabs(q)) : -std::floor(std::fabs(q));
  } else {
    steps = up ? std::ceil(q) : std::floor(q);
  }
  return Num(numeric::Snap15(steps * sig));
}

Value CeilingMath(CallArgs& args) {
  return RoundMath(args, true);
}

Value FloorMath(CallArgs& args) {
  return RoundMath(args, false);
}

Value Even(CallArgs& args) {
  return MapNumber(args, [](double x) {
    const double v = std::ceil(numeric::Snap15(std::fabs(x)) / 2.0) * 2.0;
    return Num(x < 0 ? -v : v);
  });
}

Value Odd(CallArgs& args) {
  return MapNumber(args, [](double x) {
    double v = std::ceil(numeric::Snap15(std::fabs(x)));
    if (std::fmod(v, 2.0) == 0.0) v += 1.0;
    return Num(x < 0 ? -v : v);
  });
}

Value Mod(CallArgs& args) {
  double n = 0.0;
  double d = 0.0;
  if (auto err = NumberArg(args, 0, &n)) return *err;
  if (auto err = NumberArg(args, 1, &d)) return *err;
  if (d == 0.0) return DivError();
  // Past 2^53 the quotient has no fractional bits left, so floor(n / d) loses the remainder.
  if (std::fabs(n / d) >= 9007199254740992.0) {
    double r = std::fmod(n, d);
    if (r != 0.0 && (r < 0) != (d < 0)) r += d;
    return Num(r);
  }
  return Num(numeric::Snap15(n - d * std::floor(n / d)));
}

Value Quotient(CallArgs& args) {
  double n = 0.0;
  double d = 0.0;
  if (auto err = NumberArg(args, 0, &n)) return *err;
  if (auto err = NumberArg(args, 1, &d)) return *err;
  if (d == 0.0) return DivError();
  return Num(std::trunc(n / d));
}

Value Power(CallArgs& args) {
  Scalar base = ScalarArg(args, 0);
  Scalar exponent = ScalarArg(args, 1);
  return Value::FromScalar(runtime::ApplyBinaryScalar(parser::BinaryOp::kPow, base, exponent));
}

Value Sqrt(CallArgs& args) {
  return MapNumber(args, [](double x) { return x < 0 ? NumError() : Num(std::sqrt(x)); });
}

Value SqrtPi(CallArgs& args) {
  return MapNumber(args,
                   [](double x) { return x < 0 ? NumError() : Num(std::sqrt(x * numeric::kPi)); });
}

Value Exp(CallArgs& args) {
  return MapNumber(args, [](double x) { return Num(std::exp(x)); });
}

Value Ln(CallArgs& args) {
  return MapNumber(args, [](double x) { return x <= 0 ? NumError() : Num(std::log(x)); });
}

Value Log(CallArgs& args) {
  double x = 0.0;
  double base = 10.0;
  if (auto err = NumberArg(args, 0, &x)) return *err;
  if (auto err = NumberArgOr(args, 1, 10.0, &base)) return *err;
  if (x <= 0 || base <= 0) return NumError();
  if (base == 1.0) return DivError();
  return Num(numeric::Snap15(std::log(x) / std::log(base)));
}

Value Log10(CallArgs& args) {
  return MapNumber(args, [](double x) { return x <= 0 ? NumError() : Num(std::log10(x)); });
}

Value Pi(CallArgs&) {
  return Num(numeric::kPi);
}

Value Degrees(CallArgs& args) {
  return MapNumber(args, [](double x) { return Num(x * 180.0 / numeric::kPi); });
}

Value Radians(CallArgs& args) {
  return MapNumber(args, [](double x) { return Num(x * numeric::kPi / 180.0); });
}

Value Sin(CallArgs& args) {
  return MapNumber(args, [](double x) { return Num(std::sin(x)); });
}

Value Cos(CallArgs& args) {
  return MapNumber(args, [](double x) { return Num(std::cos(x)); });
}

Value Tan(CallArgs& args) {
  return MapNumber(args, [](double x) { return Num(std::tan(x)); });
}

Value Cot(CallArgs& args) {
  return MapNumber(args, [](double x) {
    const double t = std::tan(x);
    return t == 0.0 ? DivError() : Num(1.0 / t);
  });
}

Value Asin(CallArgs& args) {
  return MapNumber(args,
                   [](double x) { return std::fabs(x) > 1 ? NumError() : Num(std::asin(x)); });
}

Value Acos(CallArgs& args) {
  return MapNumber(args,
                   [](double x) { return std::fabs(x) > 1 ? NumError() : Num(std::acos(x)); });
}

Value Atan(CallArgs& args) {
  return MapNumber(args, [](double x) { return Num(std::atan(x)); });
}

/// ATAN2(x_num, y_num): angle of the point (x, y).
Value Atan2(CallArgs& args) {
  double x = 0.0;
  double y = 0.0;
  if (auto err = NumberArg(args, 0, &x)) return *err;
  if (auto err = NumberArg(args, 1, &y)) return *err;
  if (x == 0.0 && y == 0.0) return DivError();
  return Num(std::atan2(y, x));
}

Value Sinh(CallArgs& args) {
  return MapNumber(args, [](double x) { return Num(std::sinh(x)); });
}

Value Cosh(CallArgs& args) {
  return MapNumber(args, [](double x) { return Num(std::cosh(x)); });
}

Value Tanh(CallArgs& args) {
  return MapNumber(args, [](double x) { return Num(std::tanh(x)); });
}

Value Asinh(CallArgs& args) {
  return MapNumber(args, [](double x) { return Num(std::asinh(x)); });
}

Value Acosh(CallArgs& args) {
  return MapNumber(args, [](double x) { return x < 1 ? NumError() : Num(std::acosh(x)); });
}

Value Atanh(CallArgs& args) {
  return MapNumber(args,
                   [](double x) { return std::fabs(x) >= 1 ? NumError() : Num(std::atanh(x)); });
}

Value Fact(CallArgs& args) {
  return MapNumber(args, [](double x) {
    const double n = std::floor(x);
    if (n < 0) return NumError();
    if (n > 170) return NumError();
    double result = 1.0;
    for (double k = 2; k <= n; ++k) result *= k;
    return Num(result);
  });
}

Value FactDouble(CallArgs& args) {
  return MapNumber(args, [](double x) {
    const double n = std::floor(x);
    if (n < -1) return NumError();
    double result = 1.0;
    for (double k = n; k > 1; k -= 2) result *= k;
    return Num(result);
  });
}

Value Combin(CallArgs& args) {
  double n = 0.0;
  double k = 0.0;
  if (auto err = NumberArg(args, 0, &n)) return *err;
  if (auto err = NumberArg(args, 1, &k)) return *err;
  n = std::trunc(n);
  k = std::trunc(k);
  if (n < 0 || k < 0 || k > n) return NumError();
  k = std::min(k, n - k);
  double result = 1.0;
  for (double i = 1; i <= k; ++i) result = result * (n - k + i) / i;
  return Num(std::round(result));
}

Value Permut(CallArgs& args) {
  double n = 0.0;
  double k = 0.0;
  if (auto err = NumberArg(args, 0, &n)) return *err;
  if (auto err = NumberArg(args, 1, &k)) return *err;
  n = std::trunc(n);
  k = std::trunc(k);
  if (n < 0 || k < 0 || k > n) return NumError();
  double result = 1.0;
  for (double i = n - k + 1; i <= n; ++i) result *= i;
  return Num(result);
}

Value Gcd(CallArgs& args) {
  std::vector<double> xs;
  if (auto err = CollectNumbers(args, 0, args.size(), &xs)) return *err;
  uint64_t g = 0;
  for (double x : xs) {
    if (x < 0 || x > 9.0e15) return NumError();
    uint64_t v = static_cast<uint64_t>(std::trunc(x));
    while (v != 0) {
      uint64_t t = g % v;
      g = v;
      v = t;
    }
  }
  return Num(static_cast<double>(g));
}

Value Lcm(CallArgs& args) {
  std::vector<double> xs;
  if (auto err = CollectNumbers(args, 0, args.size(), &xs)) return *err;
  double l = 1.0;
  for (double x : xs) {
    if (x < 0 || x > 9.0e15) return NumError();
    const double v = std::trunc(x);
    if (v == 0) return Num(0);
    double a = l;
    double b = v;
    while (b != 0) {
      double t = std::fmod(a, b);
      a = b;
      b = t;
    }
    l = l / a * v;
  }
  return Num(l);
}

Value Multinomial(CallArgs& args) {
  std::vector<double> xs;
  if (auto err = CollectNumbers(args, 0, args.size(), &xs)) return *err;
  double total = 0.0;
  double log_denominator = 0.0;
  for (double x : xs) {
    const double v = std::trunc(x);
    if (v < 0) return NumError();
    total += v;
    log_denominator += numeric::LogGamma(v + 1.0);
  }
  return Num(std::round(std::exp(numeric::LogGamma(total + 1.0) - log_denominator)));
}

Value SumSq(CallArgs& args) {
  std::vector<double> xs;
  if (auto err = CollectNumbers(args, 0, args.size(), &xs)) return *err;
  double total = 0.0;
  for (double x : xs) total += x * x;
  return Num(total);
}

Value SumProduct(CallArgs& args) {
  std::vector<std::shared_ptr<const Array>> arrays;
  for (size_t i = 0; i < args.size(); ++i) {
    Value v = args.Get(i);
    if (v.IsError()) return v;
    arrays.push_back(v.ToArray());
    if (arrays.back()->rows != arrays.front()->rows ||
        arrays.back()->cols != arrays.front()->cols) {
      return Value::Error(ErrorKind::kValue);
    }
  }
  double total = 0.0;
  for (size_t cell = 0; cell < arrays.front()->size(); ++cell) {
    double product = 1.0;
    for (const auto& array : arrays) {
      const Scalar& s = array->cells[cell];
      if (s.IsError()) return Value::FromScalar(s);
      product *= s.IsNumber() ? s.number : 0.0;
    }
    total += product;
  }
  return Num(total);
}

// SUMX2MY2 and friends: pairs where both cells are numbers.
template <typename F>
Value SumPairs(CallArgs& args, F term) {
  auto xs = ArrayArg(args, 0);
  auto ys = ArrayArg(args, 1);
  if (xs->size() != ys->size()) return Value::Error(ErrorKind::kNotAvailable);
  std::vector<std::optional<double>> xv;
  std::vector<std::optional<double>> yv;
  if (auto err = NumericCells(*xs, &xv)) return *err;
  if (auto err = NumericCells(*ys, &yv)) return *err;
  double total = 0.0;
  for (size_t i = 0; i < xv.size(); ++i) {
    if (xv[i] && yv[i]) total += term(*xv[i], *yv[i]);
  }
  return Num(total);
}

Value SumX2MY2(CallArgs& args) {
  return SumPairs(args, [](double x, double y) { return x * x - y * y; });
}

Value SumX2PY2(CallArgs& args) {
  return SumPairs(args, [](double x, double y) { return x * x + y * y; });
}

Value SumXMY2(CallArgs& args) {
  return SumPairs(args, [](double x, double y) { return (x - y) * (x - y); });
}

Value Rand(CallArgs& args) {
  std::uniform_real_distribution<double> dist(0.0, 1.0);
  return Num(dist(stats::RandomEngine(args.options())));
}

Value RandBetween(CallArgs& args) {
  double lo = 0.0;
  double hi = 0.0;
  if (auto err = NumberArg(args, 0, &lo)) return *err;
  if (auto err = NumberArg(args, 1, &hi)) return *err;
  const int64_t a = static_cast<int64_t>(std::ceil(lo));
  const int64_t b = static_cast<int64_t>(std::floor(hi));
  if (a > b) return NumError();
  std::uniform_int_distribution<int64_t> dist(a, b);
  return Num(static_cast<double>(dist(stats::RandomEngine(args.options()))));
}

/// SUBTOTAL codes 101-111 behave as 1-11 (no hidden rows exist here).
Value Subtotal(CallArgs& args) {
  int64_t code = 0;
  if (auto err = IntArg(args, 0, &code)) return *err;
  if (code > 100) code -= 100;
  if (code < 1 || code > 11) return Value::Error(ErrorKind::kValue);
  return stats::AggregateByCode(static_cast<int>(code), args, 1);
}

Value Aggregate(CallArgs& args) {
  int64_t code = 0;
  int64_t options = 0;
  if (auto err = IntArg(args, 0, &code)) return *err;
  if (auto err = IntArg(args, 1, &options)) return *err;
  if (code < 1 || code > 11 || options < 0 || options > 7) {
    return Value::Error(ErrorKind::kValue);
  }
  return stats::AggregateByCode(static_cast<int>(code), args, 2);
}

}  // namespace

void RegisterMathFunctions(FunctionRegistry* registry) {
  constexpr unsigned kEw = kElementwise;
  registry->Add(FunctionId::kSum, "SUM", kCat, 1, kVariadic, Sum, "SUM(number1, [number2], ...)",
                "Adds its arguments.");
  registry->Add(FunctionId::kProduct, "PRODUCT", kCat, 1, kVariadic, Product,
                "PRODUCT(number1, [number2], ...)", "Multiplies its arguments.");
  registry->Add(FunctionId::kAbs, "ABS", kCat, 1, 1, Abs, "ABS(number)", "Absolute value.", kEw);
  registry->Add(FunctionId::kSign, "SIGN", kCat, 1, 1, Sign, "SIGN(number)",
                "1, 0 or -1 by the sign of a number.", kEw);
  registry->Add(FunctionId::kInt, "INT", kCat, 1, 1, Int, "INT(number)",
                "Rounds down to the nearest integer.", kEw);
  registry->Add(FunctionId::kTrunc, "TRUNC", kCat, 1, 2, Trunc, "TRUNC(number, [num_digits])",
                "Truncates a number toward zero.", kEw);
  registry->Add(FunctionId::kRound, "ROUND", kCat, 2, 2, Round, "ROUND(number, num_digits)",
                "Rounds half away from zero to a number of digits.", kEw);
  registry->Add(FunctionId::kRoundUp, "ROUNDUP", kCat, 2, 2, RoundUp,
                "ROUNDUP(number, num_digits)", "Rounds away from zero.", kEw);
  registry->Add(FunctionId::kRoundDown, "ROUNDDOWN", kCat, 2, 2, RoundDown,
                "ROUNDDOWN(number, num_digits)", "Rounds toward zero.", kEw);
  registry->Add(FunctionId::kMRound, "MROUND", kCat, 2, 2, MRound, "MROUND(number, multiple)",
                "Rounds to the nearest multiple.", kEw);
  registry->Add(FunctionId::kCeiling, "CEILING", kCat, 2, 2, Ceiling,
                "CEILING(number, significance)", "Rounds up to a multiple of significance.", kEw);
  registry->Add(FunctionId::kCeilingMath, "CEILING.MATH", kCat, 1, 3, CeilingMath,
                "CEILING.MATH(number, [significance], [mode])",
                "Rounds up to a multiple of significance.", kEw);
  registry->Add(FunctionId::kFloor, "FLOOR", kCat, 2, 2, Floor, "FLOOR(number, significance)",
                "Rounds down to a multiple of significance.", kEw);
  registry->Add(FunctionId::kFloorMath, "FLOOR.MATH", kCat, 1, 3, FloorMath,
                "FLOOR.MATH(number, [significance], [mode])",
                "Rounds down to a multiple of significance.", kEw);
  registry->Add(FunctionId::kEven, "EVEN", kCat, 1, 1, Even, "EVEN(number)",
                "Rounds away from zero to an even integer.", kEw);
  registry->Add(FunctionId::kOdd, "ODD", kCat, 1, 1, Odd, "ODD(number)",
                "Rounds away from zero to an odd integer.", kEw);
  registry->Add(FunctionId::kMod, "MOD", kCat, 2, 2, Mod, "MOD(number, divisor)",
                "Remainder with the sign of the divisor.", kEw);
  registry->Add(FunctionId::kQuotient, "QUOTIENT", kCat, 2, 2, Quotient,
                "QUOTIENT(numerator, denominator)", "Integer part of a division.", kEw);
  registry->Add(FunctionId::kPower, "POWER", kCat, 2, 2, Power, "POWER(number, power)",
                "Raises a number to a power.", kEw);
  registry->Add(FunctionId::kSqrt, "SQRT", kCat, 1, 1, Sqrt, "SQRT(number)",
                "Positive square root.", kEw);
  registry->Add(FunctionId::kSqrtPi, "SQRTPI", kCat, 1, 1, SqrtPi, "SQRTPI(number)",
                "Square root of number * pi.", kEw);
  registry->Add(FunctionId::kExp, "EXP", kCat, 1, 1, Exp, "EXP(number)", "e raised to a power.",
                kEw);
  registry->Add(FunctionId::kLn, "LN", kCat, 1, 1, Ln, "LN(number)", "Natural logarithm.", kEw);
  registry->Add(FunctionId::kLog, "LOG", kCat, 1, 2, Log, "LOG(number, [base])",
                "Logarithm to a base (10 by default).", kEw);
  registry->Add(FunctionId::kLog10, "LOG10", kCat, 1, 1, Log10, "LOG10(number)",
                "Base-10 logarithm.", kEw);
  registry->Add(FunctionId::kPi, "PI", kCat, 0, 0, Pi, "PI()", "The constant pi.");
  registry->Add(FunctionId::kDegrees, "DEGREES", kCat, 1, 1, Degrees, "DEGREES(angle)",
                "Converts radians to degrees.", kEw);
  registry->Add(FunctionId::kRadians, "RADIANS", kCat, 1, 1, Radians, "RADIANS(angle)",
                "Converts degrees to radians.", kEw);
  registry->Add(FunctionId::kSin, "SIN", kCat, 1, 1, Sin, "SIN(number)", "Sine.", kEw);
  registry->Add(FunctionId::kCos, "COS", kCat, 1, 1, Cos, "COS(number)", "Cosine.", kEw);
  registry->Add(FunctionId::kTan, "TAN", kCat, 1, 1, Tan, "TAN(number)", "Tangent.", kEw);
  registry->Add(FunctionId::kCot, "COT", kCat, 1, 1, Cot, "COT(number)", "Cotangent.", kEw);
  registry->Add(FunctionId::kAsin, "ASIN", kCat, 1, 1, Asin, "ASIN(number)", "Arcsine.", kEw);
  registry->Add(FunctionId::kAcos, "ACOS", kCat, 1, 1, Acos, "ACOS(number)", "Arccosine.", kEw);
  registry->Add(FunctionId::kAtan, "ATAN", kCat, 1, 1, Atan, "ATAN(number)", "Arctangent.", kEw);
  registry->Add(FunctionId::kAtan2, "ATAN2", kCat, 2, 2, Atan2, "ATAN2(x_num, y_num)",
                "Arctangent of the point (x, y).", kEw);
  registry->Add(FunctionId::kSinh, "SINH", kCat, 1, 1, Sinh, "SINH(number)", "Hyperbolic sine.",
                kEw);
  registry->Add(FunctionId::kCosh, "COSH", kCat, 1, 1, Cosh, "COSH(number)",
                "Hyperbolic cosine.", kEw);
  registry->Add(FunctionId::kTanh, "TANH", kCat, 1, 1, Tanh, "TANH(number)",
                "Hyperbolic tangent.", kEw);
  registry->Add(FunctionId::kAsinh, "ASINH", kCat, 1, 1, Asinh, "ASINH(number)",
                "Inverse hyperbolic sine.", kEw);
  registry->Add(FunctionId::kAcosh, "ACOSH", kCat, 1, 1, Acosh, "ACOSH(number)",
                "Inverse hyperbolic cosine.", kEw);
  registry->Add(FunctionId::kAtanh, "ATANH", kCat, 1, 1, Atanh, "ATANH(number)",
                "Inverse hyperbolic tangent.", kEw);
  registry->Add(FunctionId::kFact, "FACT", kCat, 1, 1, Fact, "FACT(number)", "Factorial.", kEw);
  registry->Add(FunctionId::kFactDouble, "FACTDOUBLE", kCat, 1, 1, FactDouble,
                "FACTDOUBLE(number)", "Double factorial.", kEw);
  registry->Add(FunctionId::kCombin, "COMBIN", kCat, 2, 2, Combin,
                "COMBIN(number, number_chosen)", "Number of combinations.", kEw);
  registry->Add(FunctionId::kPermut, "PERMUT", kCat, 2, 2, Permut,
                "PERMUT(number, number_chosen)", "Number of permutations.", kEw);
  registry->Add(FunctionId::kGcd, "GCD", kCat, 1, kVariadic, Gcd, "GCD(number1, [number2], ...)",
                "Greatest common divisor.");
  registry->Add(FunctionId::kLcm, "LCM", kCat, 1, kVariadic, Lcm, "LCM(number1, [number2], ...)",
                "Least common multiple.");
  registry->Add(FunctionId::kMultinomial, "MULTINOMIAL", kCat, 1, kVariadic, Multinomial,
                "MULTINOMIAL(number1, [number2], ...)",
                "Factorial of the sum over the product of factorials.");
  registry->Add(FunctionId::kSumSq, "SUMSQ", kCat, 1, kVariadic, SumSq,
                "SUMSQ(number1, [number2], ...)", "Sum of squares.");
  registry->Add(FunctionId::kSumProduct, "SUMPRODUCT", kCat, 1, kVariadic, SumProduct,
                "SUMPRODUCT(array1, [array2], ...)", "Sum of products of corresponding cells.");
  registry->Add(FunctionId::kSumX2MY2, "SUMX2MY2", kCat, 2, 2, SumX2MY2,
                "SUMX2MY2(array_x, array_y)", "Sum of x^2 - y^2.");
  registry->Add(FunctionId::kSumX2PY2, "SUMX2PY2", kCat, 2, 2, SumX2PY2,
                "SUMX2PY2(array_x, array_y)", "Sum of x^2 + y^2.");
  registry->Add(FunctionId::kSumXMY2, "SUMXMY2", kCat, 2, 2, SumXMY2,
                "SUMXMY2(array_x, array_y)", "Sum of (x - y)^2.");
  registry->Add(FunctionId::kRand, "RAND", kCat, 0, 0, Rand, "RAND()",
                "Uniform random number in [0, 1).", kVolatile);
  registry->Add(FunctionId::kRandBetween, "RANDBETWEEN", kCat, 2, 2, RandBetween,
                "RANDBETWEEN(bottom, top)", "Random integer between two bounds.", kVolatile);
  registry->Add(FunctionId::kSubtotal, "SUBTOTAL", kCat, 2, kVariadic, Subtotal,
                "SUBTOTAL(function_num, ref1, [ref2], ...)",
                "Aggregate chosen by code 1-11 or 101-111.");
  registry->Add(FunctionId::kAggregate, "AGGREGATE", kCat, 3, kVariadic, Aggregate,
                "AGGREGATE(function_num, options, ref1, [ref2], ...)",
                "Aggregate chosen by code 1-11.");
}

}  // namespace cellforge::builtin
