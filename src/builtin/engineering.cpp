#include <cmath>
#include <complex>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "builtin/args.h"
#include "builtin/builtins.h"
#include "builtin/complex_text.h"
#include "util/string.h"

namespace cellforge::builtin {

namespace {

using runtime::CallArgs;
using runtime::ErrorKind;
using runtime::Scalar;
using runtime::Value;

using Complex = std::complex<double>;

constexpr Category kCat = Category::kEngineering;
constexpr double kBitLimit = 281474976710656.0;  // 2^48

Value NumError() {
  return Value::Error(ErrorKind::kNumber);
}

// Complex operands of one call; they must agree on the 'i'/'j' suffix.
class ComplexOperands {
 public:
  explicit ComplexOperands(CallArgs& args) : args_(args) {}

  /// Reads a single operand: numbers are reals, text parses, malformed text is #NUM!.
  std::optional<Value> Read(size_t i, Complex* out) {
    Scalar s = ScalarArg(args_, i);
    return FromScalar(s, out);
  }

  /// Reads every cell of argument `i`; blanks are skipped.
  std::optional<Value> ReadAll(size_t i, std::vector<Complex>* out) {
    auto cells = ArrayArg(args_, i);
    for (const Scalar& cell : cells->cells) {
      if (cell.IsEmpty()) continue;
      Complex z;
      if (auto err = FromScalar(cell, &z)) return err;
      out->push_back(z);
    }
    return std::nullopt;
  }

  Value Result(const Complex& z) const {
    if (!std::isfinite(z.real()) || !std::isfinite(z.imag())) return NumError();
    return Value::Text(FormatComplex(z, suffix_ == '\0' ? 'i' : suffix_));
  }

 private:
  std::optional<Value> FromScalar(const Scalar& s, Complex* out) {
    if (s.IsError()) return Value::FromScalar(s);
    if (s.IsBoolean()) return Value::Error(ErrorKind::kValue);
    if (s.IsEmpty()) {
      *out = Complex(0, 0);
      return std::nullopt;
    }
    if (s.IsNumber()) {
      *out = Complex(s.number, 0);
      return std::nullopt;
    }
    auto parsed = ParseComplex(s.text);
    if (!parsed) return NumError();
    if (parsed->suffix != '\0') {
      if (suffix_ != '\0' && suffix_ != parsed->suffix) return Value::Error(ErrorKind::kValue);
      suffix_ = parsed->suffix;
    }
    *out = parsed->value;
    return std::nullopt;
  }

  CallArgs& args_;
  char suffix_ = '\0';
};

Value ComplexFn(CallArgs& args) {
  double real = 0.0;
  double imaginary = 0.0;
  std::string suffix = "i";
  if (auto err = NumberArg(args, 0, &real)) return *err;
  if (auto err = NumberArg(args, 1, &imaginary)) return *err;
  if (auto err = TextArgOr(args, 2, "i", &suffix)) return *err;
  if (suffix.empty()) suffix = "i";
  if (suffix != "i" && suffix != "j") return Value::Error(ErrorKind::kValue);
  return Value::Text(FormatComplex(Complex(real, imaginary), suffix[0]));
}

Value ImReal(CallArgs& args) {
  ComplexOperands ops(args);
  Complex z;
  if (auto err = ops.Read(0, &z)) return *err;
  return Value::Number(z.real());
}

Value Imaginary(CallArgs& args) {
  ComplexOperands ops(args);
  Complex z;
  if (auto err = ops.Read(0, &z)) return *err;
  return Value::Number(z.imag());
}

Value ImAbs(CallArgs& args) {
  ComplexOperands ops(args);
  Complex z;
  if (auto err = ops.Read(0, &z)) return *err;
  return Value::Number(std::abs(z));
}

Value ImArgument(CallArgs& args) {
  ComplexOperands ops(args);
  Complex z;
  if (auto err = ops.Read(0, &z)) return *err;
  if (z == Complex(0, 0)) return Value::Error(ErrorKind::kDivByZero);
  return Value::Number(std::arg(z));
}

// Single-operand complex functions; `fn` returns nullopt for a #NUM! domain error.
template <typename Fn>
Value MapComplex(CallArgs& args, Fn fn) {
  ComplexOperands ops(args);
  Complex z;
  if (auto err = ops.Read(0, &z)) return *err;
  std::optional<Complex> result = fn(z);
  if (!result) return NumError();
  return ops.Result(*result);
}

Value ImConjugate(CallArgs& args) {
  return MapComplex(args, [](Complex z) -> std::optional<Complex> { return std::conj(z); });
}

Value ImSqrt(CallArgs& args) {
  return MapComplex(args, [](Complex z) -> std::optional<Complex> { return std::sqrt(z); });
}

Value ImExp(CallArgs& args) {
  return MapComplex(args, [](Complex z) -> std::optional<Complex> { return std::exp(z); });
}

Value ImLn(CallArgs& args) {
  return MapComplex(args, [](Complex z) -> std::optional<Complex> {
    if (z == Complex(0, 0)) return std::nullopt;
    return std::log(z);
  });
}

Value ImLog10(CallArgs& args) {
  return MapComplex(args, [](Complex z) -> std::optional<Complex> {
    if (z == Complex(0, 0)) return std::nullopt;
    return std::log10(z);
  });
}

Value ImLog2(CallArgs& args) {
  return MapComplex(args, [](Complex z) -> std::optional<Complex> {
    if (z == Complex(0, 0)) return std::nullopt;
    return std::log(z) / std::log(2.0);
  });
}

Value ImSin(CallArgs& args) {
  return MapComplex(args, [](Complex z) -> std::optional<Complex> { return std::sin(z); });
}

Value ImCos(CallArgs& args) {
  return MapComplex(args, [](Complex z) -> std::optional<Complex> { return std::cos(z); });
}

Value ImTan(CallArgs& args) {
  return MapComplex(args, [](Complex z) -> std::optional<Complex> { return std::tan(z); });
}

Value ImSinh(CallArgs& args) {
  return MapComplex(args, [](Complex z) -> std::optional<Complex> { return std::sinh(z); });
}

Value ImCosh(CallArgs& args) {
  return MapComplex(args, [](Complex z) -> std::optional<Complex> { return std::cosh(z); });
}

Value ImSum(CallArgs& args) {
  ComplexOperands ops(args);
  std::vector<Complex> terms;
  for (size_t i = 0; i < args.size(); ++i) {
    if (auto err = ops.ReadAll(i, &terms)) return *err;
  }
  Complex total(0, 0);
  for (const Complex& z : terms) total += z;
  return ops.Result(total);
}

Value ImProduct(CallArgs& args) {
  ComplexOperands ops(args);
  std::vector<Complex> factors;
  for (size_t i = 0; i < args.size(); ++i) {
    if (auto err = ops.ReadAll(i, &factors)) return *err;
  }
  Complex total(1, 0);
  for (const Complex& z : factors) total *= z;
  return ops.Result(total);
}

Value ImSub(CallArgs& args) {
  ComplexOperands ops(args);
  Complex a;
  Complex b;
  if (auto err = ops.Read(0, &a)) return *err;
  if (auto err = ops.Read(1, &b)) return *err;
  return ops.Result(a - b);
}

Value ImDiv(CallArgs& args) {
  ComplexOperands ops(args);
  Complex a;
  Complex b;
  if (auto err = ops.Read(0, &a)) return *err;
  if (auto err = ops.Read(1, &b)) return *err;
  if (b == Complex(0, 0)) return NumError();
  return ops.Result(a / b);
}

Value ImPower(CallArgs& args) {
  ComplexOperands ops(args);
  Complex z;
  double n = 0.0;
  if (auto err = ops.Read(0, &z)) return *err;
  if (auto err = NumberArg(args, 1, &n)) return *err;
  if (z == Complex(0, 0)) {
    if (n <= 0) return NumError();
    return ops.Result(Complex(0, 0));
  }
  // Polar form keeps integer powers of real numbers free of spurious imaginary parts.
  const double r = std::pow(std::abs(z), n);
  const double theta = std::arg(z) * n;
  return ops.Result(Complex(r * std::cos(theta), r * std::sin(theta)));
}

// Width in bits of each radix's 10-digit two's complement representation.
struct Radix {
  int base;
  int bits;
};

constexpr Radix kBinary{2, 10};
constexpr Radix kOctal{8, 30};
constexpr Radix kHex{16, 40};

int DigitValue(char ch) {
  if (ch >= '0' && ch <= '9') return ch - '0';
  if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
  if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
  return 99;
}

// Signed value of up to 10 digits; the top bit of a full-width value is the sign.
std::optional<int64_t> ParseRadix(const std::string& text, Radix radix) {
  const std::string digits = util::Trim(text);
  if (digits.size() > 10) return std::nullopt;
  int64_t value = 0;
  for (char ch : digits) {
    const int d = DigitValue(ch);
    if (d >= radix.base) return std::nullopt;
    value = value * radix.base + d;
  }
  const int64_t half = int64_t{1} << (radix.bits - 1);
  if (value >= half) value -= half * 2;
  return value;
}

// Digits of `value`; negatives are written as 10-digit two's complement and ignore `places`.
std::optional<std::string> FormatRadix(int64_t value, Radix radix, std::optional<int64_t> places) {
  const int64_t half = int64_t{1} << (radix.bits - 1);
  if (value < -half || value >= half) return std::nullopt;
  if (places && (*places < 1 || *places > 10)) return std::nullopt;
  uint64_t magnitude = static_cast<uint64_t>(value < 0 ? value + half * 2 : value);
  std::string digits;
  do {
    digits.insert(digits.begin(), "0123456789ABCDEF"[magnitude % radix.base]);
    magnitude /= radix.base;
  } while (magnitude > 0);
  if (value < 0) return digits;
  if (places) {
    if (static_cast<int64_t>(digits.size()) > *places) return std::nullopt;
    digits.insert(0, static_cast<size_t>(*places) - digits.size(), '0');
  }
  return digits;
}

std::optional<Value> PlacesArg(CallArgs& args, size_t i, std::optional<int64_t>* out) {
  if (!args.Has(i)) return std::nullopt;
  int64_t places = 0;
  if (auto err = IntArg(args, i, &places)) return err;
  *out = places;
  return std::nullopt;
}

// X2DEC conversions.
Value ToDecimal(CallArgs& args, Radix radix) {
  std::string text;
  if (auto err = TextArg(args, 0, &text)) return *err;
  auto value = ParseRadix(text, radix);
  if (!value) return NumError();
  return Value::Number(static_cast<double>(*value));
}

// DEC2X conversions.
Value FromDecimal(CallArgs& args, Radix radix) {
  double number = 0.0;
  std::optional<int64_t> places;
  if (auto err = NumberArg(args, 0, &number)) return *err;
  if (auto err = PlacesArg(args, 1, &places)) return *err;
  if (std::fabs(number) > 1e13) return NumError();
  auto digits = FormatRadix(static_cast<int64_t>(std::trunc(number)), radix, places);
  if (!digits) return NumError();
  return Value::Text(*digits);
}

// Direct radix-to-radix conversions such as BIN2HEX.
Value Convert(CallArgs& args, Radix from, Radix to) {
  std::string text;
  std::optional<int64_t> places;
  if (auto err = TextArg(args, 0, &text)) return *err;
  if (auto err = PlacesArg(args, 1, &places)) return *err;
  auto value = ParseRadix(text, from);
  if (!value) return NumError();
  auto digits = FormatRadix(*value, to, places);
  if (!digits) return NumError();
  return Value::Text(*digits);
}

Value Bin2Dec(CallArgs& args) {
  return ToDecimal(args, kBinary);
}

Value Oct2Dec(CallArgs& args) {
  return ToDecimal(args, kOctal);
}

Value Hex2Dec(CallArgs& args) {
  return ToDecimal(args, kHex);
}

Value Dec2Bin(CallArgs& args) {
  return FromDecimal(args, kBinary);
}

Value Dec2Oct(CallArgs& args) {
  return FromDecimal(args, kOctal);
}

Value Dec2Hex(CallArgs& args) {
  return FromDecimal(args, kHex);
}

Value Bin2Hex(CallArgs& args) {
  return Convert(args, kBinary, kHex);
}

Value Hex2Bin(CallArgs& args) {
  return Convert(args, kHex, kBinary);
}

// Bitwise operand: a non-negative integer below 2^48.
std::optional<Value> BitArg(CallArgs& args, size_t i, uint64_t* out) {
  double x = 0.0;
  if (auto err = NumberArg(args, i, &x)) return err;
  if (x < 0 || x >= kBitLimit || x != std::floor(x)) return NumError();
  *out = static_cast<uint64_t>(x);
  return std::nullopt;
}

template <typename Op>
Value Bitwise(CallArgs& args, Op op) {
  uint64_t a = 0;
  uint64_t b = 0;
  if (auto err = BitArg(args, 0, &a)) return *err;
  if (auto err = BitArg(args, 1, &b)) return *err;
  return Value::Number(static_cast<double>(op(a, b)));
}

Value BitAnd(CallArgs& args) {
  return Bitwise(args, [](uint64_t a, uint64_t b) { return a & b; });
}

Value BitOr(CallArgs& args) {
  return Bitwise(args, [](uint64_t a, uint64_t b) { return a | b; });
}

Value BitXor(CallArgs& args) {
  return Bitwise(args, [](uint64_t a, uint64_t b) { return a ^ b; });
}

// Positive `shift` moves left; |shift| is at most 53.
Value Shift(CallArgs& args, int direction) {
  uint64_t value = 0;
  int64_t shift = 0;
  if (auto err = BitArg(args, 0, &value)) return *err;
  if (auto err = IntArg(args, 1, &shift)) return *err;
  shift *= direction;
  if (shift > 53 || shift < -53) return NumError();
  if (shift < 0) return Value::Number(static_cast<double>(value >> -shift));
  const double shifted = static_cast<double>(value) * std::ldexp(1.0, static_cast<int>(shift));
  if (shifted >= kBitLimit) return NumError();
  return Value::Number(shifted);
}

Value BitLShift(CallArgs& args) {
  return Shift(args, 1);
}

Value BitRShift(CallArgs& args) {
  return Shift(args, -1);
}

Value Delta(CallArgs& args) {
  double a = 0.0;
  double b = 0.0;
  if (auto err = NumberArg(args, 0, &a)) return *err;
  if (auto err = NumberArgOr(args, 1, 0.0, &b)) return *err;
  return Value::Number(a == b ? 1 : 0);
}

Value GeStep(CallArgs& args) {
  double number = 0.0;
  double step = 0.0;
  if (auto err = NumberArg(args, 0, &number)) return *err;
  if (auto err = NumberArgOr(args, 1, 0.0, &step)) return *err;
  return Value::Number(number >= step ? 1 : 0);
}

}  // namespace

void RegisterEngineeringFunctions(FunctionRegistry* registry) {
  constexpr unsigned kEw = kElementwise;
  registry->Add(FunctionId::kComplex, "COMPLEX", kCat, 2, 3, ComplexFn,
                "COMPLEX(real_num, i_num, [suffix])", "Builds a complex number.", kEw);
  registry->Add(FunctionId::kImReal, "IMREAL", kCat, 1, 1, ImReal, "IMREAL(inumber)",
                "Real part of a complex number.", kEw);
  registry->Add(FunctionId::kImaginary, "IMAGINARY", kCat, 1, 1, Imaginary,
                "IMAGINARY(inumber)", "Imaginary part of a complex number.", kEw);
  registry->Add(FunctionId::kImAbs, "IMABS", kCat, 1, 1, ImAbs, "IMABS(inumber)",
                "Modulus of a complex number.", kEw);
  registry->Add(FunctionId::kImArgument, "IMARGUMENT", kCat, 1, 1, ImArgument,
                "IMARGUMENT(inumber)", "Argument in radians.", kEw);
  registry->Add(FunctionId::kImConjugate, "IMCONJUGATE", kCat, 1, 1, ImConjugate,
                "IMCONJUGATE(inumber)", "Complex conjugate.", kEw);
  registry->Add(FunctionId::kImAdd, "IMADD", kCat, 1, kVariadic, ImSum,
                "IMADD(inumber1, [inumber2], ...)", "Sum of complex numbers.");
  registry->Add(FunctionId::kImSum, "IMSUM", kCat, 1, kVariadic, ImSum,
                "IMSUM(inumber1, [inumber2], ...)", "Sum of complex numbers.");
  registry->Add(FunctionId::kImSub, "IMSUB", kCat, 2, 2, ImSub, "IMSUB(inumber1, inumber2)",
                "Difference of two complex numbers.", kEw);
  registry->Add(FunctionId::kImProduct, "IMPRODUCT", kCat, 1, kVariadic, ImProduct,
                "IMPRODUCT(inumber1, [inumber2], ...)", "Product of complex numbers.");
  registry->Add(FunctionId::kImDiv, "IMDIV", kCat, 2, 2, ImDiv, "IMDIV(inumber1, inumber2)",
                "Quotient of two complex numbers.", kEw);
  registry->Add(FunctionId::kImPower, "IMPOWER", kCat, 2, 2, ImPower, "IMPOWER(inumber, number)",
                "Complex number raised to a power.", kEw);
  registry->Add(FunctionId::kImSqrt, "IMSQRT", kCat, 1, 1, ImSqrt, "IMSQRT(inumber)",
                "Principal square root.", kEw);
  registry->Add(FunctionId::kImExp, "IMEXP", kCat, 1, 1, ImExp, "IMEXP(inumber)",
                "Complex exponential.", kEw);
  registry->Add(FunctionId::kImLn, "IMLN", kCat, 1, 1, ImLn, "IMLN(inumber)",
                "Natural logarithm.", kEw);
  registry->Add(FunctionId::kImLog10, "IMLOG10", kCat, 1, 1, ImLog10, "IMLOG10(inumber)",
                "Base-10 logarithm.", kEw);
  registry->Add(FunctionId::kImLog2, "IMLOG2", kCat, 1, 1, ImLog2, "IMLOG2(inumber)",
                "Base-2 logarithm.", kEw);
  registry->Add(FunctionId::kImSin, "IMSIN", kCat, 1, 1, ImSin, "IMSIN(inumber)", "Sine.", kEw);
  registry->Add(FunctionId::kImCos, "IMCOS", kCat, 1, 1, ImCos, "IMCOS(inumber)", "Cosine.",
                kEw);
  registry->Add(FunctionId::kImTan, "IMTAN", kCat, 1, 1, ImTan, "IMTAN(inumber)", "Tangent.",
                kEw);
  registry->Add(FunctionId::kImSinh, "IMSINH", kCat, 1, 1, ImSinh, "IMSINH(inumber)",
                "Hyperbolic sine.", kEw);
  registry->Add(FunctionId::kImCosh, "IMCOSH", kCat, 1, 1, ImCosh, "IMCOSH(inumber)",
                "Hyperbolic cosine.", kEw);

  registry->Add(FunctionId::kBin2Dec, "BIN2DEC", kCat, 1, 1, Bin2Dec, "BIN2DEC(number)",
                "Binary to decimal.", kEw);
  registry->Add(FunctionId::kOct2Dec, "OCT2DEC", kCat, 1, 1, Oct2Dec, "OCT2DEC(number)",
                "Octal to decimal.", kEw);
  registry->Add(FunctionId::kHex2Dec, "HEX2DEC", kCat, 1, 1, Hex2Dec, "HEX2DEC(number)",
                "Hexadecimal to decimal.", kEw);
  registry->Add(FunctionId::kDec2Bin, "DEC2BIN", kCat, 1, 2, Dec2Bin, "DEC2BIN(number, [places])",
                "Decimal to binary.", kEw);
  registry->Add(FunctionId::kDec2Oct, "DEC2OCT", kCat, 1, 2, Dec2Oct, "DEC2OCT(number, [places])",
                "Decimal to octal.", kEw);
  registry->Add(FunctionId::kDec2Hex, "DEC2HEX", kCat, 1, 2, Dec2Hex, "DEC2HEX(number, [places])",
                "Decimal to hexadecimal.", kEw);
  registry->Add(FunctionId::kBin2Hex, "BIN2HEX", kCat, 1, 2, Bin2Hex, "BIN2HEX(number, [places])",
                "Binary to hexadecimal.", kEw);
  registry->Add(FunctionId::kHex2Bin, "HEX2BIN", kCat, 1, 2, Hex2Bin, "HEX2BIN(number, [places])",
                "Hexadecimal to binary.", kEw);

  registry->Add(FunctionId::kBitAnd, "BITAND", kCat, 2, 2, BitAnd, "BITAND(number1, number2)",
                "Bitwise AND.", kEw);
  registry->Add(FunctionId::kBitOr, "BITOR", kCat, 2, 2, BitOr, "BITOR(number1, number2)",
                "Bitwise OR.", kEw);
  registry->Add(FunctionId::kBitXor, "BITXOR", kCat, 2, 2, BitXor, "BITXOR(number1, number2)",
                "Bitwise exclusive OR.", kEw);
  registry->Add(FunctionId::kBitLShift, "BITLSHIFT", kCat, 2, 2, BitLShift,
                "BITLSHIFT(number, shift_amount)", "Shifts bits left.", kEw);
  registry->Add(FunctionId::kBitRShift, "BITRSHIFT", kCat, 2, 2, BitRShift,
                "BITRSHIFT(number, shift_amount)", "Shifts bits right.", kEw);
  registry->Add(FunctionId::kDelta, "DELTA", kCat, 1, 2, Delta, "DELTA(number1, [number2])",
                "1 when two numbers are equal.", kEw);
  registry->Add(FunctionId::kGeStep, "GESTEP", kCat, 1, 2, GeStep, "GESTEP(number, [step])",
                "1 when a number is at least step.", kEw);
}

}  // namespace cellforge::builtin
