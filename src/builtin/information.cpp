#include <cmath>

#include "builtin/args.h"
#include "builtin/builtins.h"
#include "runtime/coerce.h"

namespace cellforge::builtin {

namespace {

using runtime::CallArgs;
using runtime::ErrorKind;
using runtime::Scalar;
using runtime::Value;
using runtime::ValueKind;

constexpr Category kCat = Category::kInformation;

Value IsNumber(CallArgs& args) {
  return Value::Bool(ScalarArg(args, 0).IsNumber());
}

// Lazy, so the argument itself is never read.
Value IsRef(CallArgs& args) {
  return Value::Bool(args.IsReference(0));
}

Value IsText(CallArgs& args) {
  return Value::Bool(ScalarArg(args, 0).IsText());
}

Value IsNonText(CallArgs& args) {
  return Value::Bool(!ScalarArg(args, 0).IsText());
}

Value IsBlank(CallArgs& args) {
  return Value::Bool(ScalarArg(args, 0).IsEmpty());
}

Value IsLogical(CallArgs& args) {
  return Value::Bool(ScalarArg(args, 0).IsBoolean());
}

Value IsError(CallArgs& args) {
  return Value::Bool(ScalarArg(args, 0).IsError());
}

Value IsErr(CallArgs& args) {
  Scalar s = ScalarArg(args, 0);
  return Value::Bool(s.IsError() && s.error != ErrorKind::kNotAvailable);
}

Value IsNa(CallArgs& args) {
  Scalar s = ScalarArg(args, 0);
  return Value::Bool(s.IsError() && s.error == ErrorKind::kNotAvailable);
}

Value Parity(CallArgs& args, bool even) {
  double x = 0.0;
  if (auto err = NumberArg(args, 0, &x)) return *err;
  const bool is_even = std::fmod(std::trunc(x), 2.0) == 0.0;
  return Value::Bool(even ? is_even : !is_even);
}

Value IsEven(CallArgs& args) {
  return Parity(args, true);
}

Value IsOdd(CallArgs& args) {
  return Parity(args, false);
}

Value Na(CallArgs&) {
  return Value::Error(ErrorKind::kNotAvailable);
}

Value Type(CallArgs& args) {
  Value v = args.Get(0);
  switch (v.kind) {
    case ValueKind::kEmpty:
    case ValueKind::kNumber:
      return Value::Number(1);
    case ValueKind::kText:
      return Value::Number(2);
    case ValueKind::kBoolean:
      return Value::Number(4);
    case ValueKind::kError:
      return Value::Number(16);
    case ValueKind::kArray:
      return Value::Number(64);
    case ValueKind::kLambda:
      return Value::Number(128);
  }
  return Value::Number(1);
}

Value ErrorType(CallArgs& args) {
  Scalar s = ScalarArg(args, 0);
  if (!s.IsError()) {
    return Value::Error(ErrorKind::kNotAvailable);
  }
  return Value::Number(runtime::ErrorTypeCode(s.error));
}

Value N(CallArgs& args) {
  Scalar s = ScalarArg(args, 0);
  switch (s.kind) {
    case ValueKind::kNumber:
      return Value::Number(s.number);
    case ValueKind::kBoolean:
      return Value::Number(s.boolean ? 1 : 0);
    case ValueKind::kError:
      return Value::FromScalar(s);
    default:
      return Value::Number(0);
  }
}

Value T(CallArgs& args) {
  Scalar s = ScalarArg(args, 0);
  if (s.IsText() || s.IsError()) {
    return Value::FromScalar(s);
  }
  return Value::Text("");
}

}  // namespace

void RegisterInformationFunctions(FunctionRegistry* registry) {
  registry->Add(FunctionId::kIsNumber, "ISNUMBER", kCat, 1, 1, IsNumber, "ISNUMBER(value)",
                "TRUE when the value is a number.", kElementwise);
  registry->Add(FunctionId::kIsRef, "ISREF", kCat, 1, 1, IsRef, "ISREF(value)",
                "TRUE when the argument is written as a cell or range reference.", kLazy);
  registry->Add(FunctionId::kIsText, "ISTEXT", kCat, 1, 1, IsText, "ISTEXT(value)",
                "TRUE when the value is text.", kElementwise);
  registry->Add(FunctionId::kIsNonText, "ISNONTEXT", kCat, 1, 1, IsNonText, "ISNONTEXT(value)",
                "TRUE when the value is not text.", kElementwise);
  registry->Add(FunctionId::kIsBlank, "ISBLANK", kCat, 1, 1, IsBlank, "ISBLANK(value)",
                "TRUE when the value is an empty cell.", kElementwise);
  registry->Add(FunctionId::kIsLogical, "ISLOGICAL", kCat, 1, 1, IsLogical, "ISLOGICAL(value)",
                "TRUE when the value is a logical value.", kElementwise);
  registry->Add(FunctionId::kIsError, "ISERROR", kCat, 1, 1, IsError, "ISERROR(value)",
                "TRUE when the value is any error.", kElementwise);
  registry->Add(FunctionId::kIsErr, "ISERR", kCat, 1, 1, IsErr, "ISERR(value)",
                "TRUE when the value is an error other than #N/A.", kElementwise);
  registry->Add(FunctionId::kIsNa, "ISNA", kCat, 1, 1, IsNa, "ISNA(value)",
                "TRUE when the value is #N/A.", kElementwise);
  registry->Add(FunctionId::kIsEven, "ISEVEN", kCat, 1, 1, IsEven, "ISEVEN(number)",
                "TRUE when the integer part of the number is even.", kElementwise);
  registry->Add(FunctionId::kIsOdd, "ISODD", kCat, 1, 1, IsOdd, "ISODD(number)",
                "TRUE when the integer part of the number is odd.", kElementwise);
  registry->Add(FunctionId::kNa, "NA", kCat, 0, 0, Na, "NA()", "Returns the #N/A error.");
  registry->Add(FunctionId::kType, "TYPE", kCat, 1, 1, Type, "TYPE(value)",
                "Type code: 1 number, 2 text, 4 logical, 16 error, 64 array.");
  registry->Add(FunctionId::kErrorType, "ERROR.TYPE", kCat, 1, 1, ErrorType,
                "ERROR.TYPE(error_val)", "Number identifying an error value, #N/A otherwise.",
                kElementwise);
  registry->Add(FunctionId::kN, "N", kCat, 1, 1, N, "N(value)", "Converts a value to a number.",
                kElementwise);
  registry->Add(FunctionId::kT, "T", kCat, 1, 1, T, "T(value)",
                "Returns text values and an empty string for anything else.", kElementwise);
}

}  // namespace cellforge::builtin
