#include "builtin/args.h"

#include <cmath>
#include <utility>

#include "runtime/coerce.h"

namespace cellforge::builtin {

using runtime::Array;
using runtime::ErrorKind;
using runtime::Scalar;
using runtime::Value;

Scalar ScalarArg(runtime::CallArgs& args, size_t i) {
  return args.Get(i).ToScalar();
}

std::optional<Value> NumberArg(runtime::CallArgs& args, size_t i, double* out) {
  Scalar n = runtime::ToNumber(ScalarArg(args, i));
  if (n.IsError()) {
    return Value::FromScalar(n);
  }
  *out = n.number;
  return std::nullopt;
}

std::optional<Value> NumberArgOr(runtime::CallArgs& args, size_t i, double fallback, double* out) {
  if (!args.Has(i)) {
    *out = fallback;
    return std::nullopt;
  }
  return NumberArg(args, i, out);
}

std::optional<Value> IntArg(runtime::CallArgs& args, size_t i, int64_t* out) {
  double value = 0.0;
  if (auto err = NumberArg(args, i, &value)) return err;
  if (std::fabs(value) > 9.0e15) {
    return Value::Error(ErrorKind::kNumber);
  }
  *out = static_cast<int64_t>(std::trunc(value));
  return std::nullopt;
}

std::optional<Value> IntArgOr(runtime::CallArgs& args, size_t i, int64_t fallback, int64_t* out) {
  if (!args.Has(i)) {
    *out = fallback;
    return std::nullopt;
  }
  return IntArg(args, i, out);
}

std::optional<Value> TextArg(runtime::CallArgs& args, size_t i, std::string* out) {
  Scalar t = runtime::ToText(ScalarArg(args, i));
  if (t.IsError()) {
    return Value::FromScalar(t);
  }
  *out = t.text;
  return std::nullopt;
}

std::optional<Value> TextArgOr(runtime::CallArgs& args, size_t i, const std::string& fallback,
                               std::string* out) {
  if (!args.Has(i)) {
    *out = fallback;
    return std::nullopt;
  }
  return TextArg(args, i, out);
}

std::optional<Value> BoolArg(runtime::CallArgs& args, size_t i, bool* out) {
  Scalar b = runtime::ToBoolean(ScalarArg(args, i));
  if (b.IsError()) {
    return Value::FromScalar(b);
  }
  *out = b.boolean;
  return std::nullopt;
}

std::optional<Value> BoolArgOr(runtime::CallArgs& args, size_t i, bool fallback, bool* out) {
  if (!args.Has(i)) {
    *out = fallback;
    return std::nullopt;
  }
  return BoolArg(args, i, out);
}

std::shared_ptr<const Array> ArrayArg(runtime::CallArgs& args, size_t i) {
  return args.Get(i).ToArray();
}

std::optional<Value> LambdaArg(runtime::CallArgs& args, size_t i,
                               std::shared_ptr<const runtime::Lambda>* out) {
  Value v = args.Get(i);
  if (v.IsError()) {
    return v;
  }
  if (!v.IsLambda()) {
    return Value::Error(ErrorKind::kValue);
  }
  *out = v.lambda;
  return std::nullopt;
}

std::optional<Value> CollectNumbersFrom(const Value& value, bool is_reference,
                                        std::vector<double>* out, CollectMode mode) {
  if (value.IsLambda()) {
    return Value::Error(ErrorKind::kValue);
  }
  if (value.IsArray()) {
    for (const Scalar& cell : value.array->cells) {
      switch (cell.kind) {
        case runtime::ValueKind::kError:
          return Value::FromScalar(cell);
        case runtime::ValueKind::kNumber:
          out->push_back(cell.number);
          break;
        case runtime::ValueKind::kBoolean:
          if (mode == CollectMode::kAllValues) out->push_back(cell.boolean ? 1.0 : 0.0);
          break;
        case runtime::ValueKind::kText:
          if (mode == CollectMode::kAllValues) out->push_back(0.0);
          break;
        default:
          break;
      }
    }
    return std::nullopt;
  }
  Scalar s = value.ToScalar();
  if (s.IsError()) {
    return Value::FromScalar(s);
  }
  if (s.IsEmpty()) {
    return std::nullopt;
  }
  if (is_reference) {
    if (s.IsNumber()) {
      out->push_back(s.number);
    } else if (mode == CollectMode::kAllValues) {
      out->push_back(s.IsBoolean() && s.boolean ? 1.0 : 0.0);
    }
    return std::nullopt;
  }
  Scalar n = runtime::ToNumber(s);
  if (n.IsError()) {
    return Value::FromScalar(n);
  }
  out->push_back(n.number);
  return std::nullopt;
}

std::optional<Value> CollectNumbers(runtime::CallArgs& args, size_t first, size_t last,
                                    std::vector<double>* out, CollectMode mode) {
  for (size_t i = first; i < last && i < args.size(); ++i) {
    if (!args.Has(i)) continue;
    if (auto err = CollectNumbersFrom(args.Get(i), args.IsReference(i), out, mode)) {
      return err;
    }
  }
  return std::nullopt;
}

std::optional<Value> NumericCells(const Array& array, std::vector<std::optional<double>>* out) {
  out->clear();
  out->reserve(array.cells.size());
  for (const Scalar& cell : array.cells) {
    if (cell.IsError()) {
      return Value::FromScalar(cell);
    }
    if (cell.IsNumber()) {
      out->push_back(cell.number);
    } else {
      out->push_back(std::nullopt);
    }
  }
  return std::nullopt;
}

bool WithinCellLimit(const runtime::CallArgs& args, int64_t rows, int64_t cols) {
  if (rows <= 0 || cols <= 0) {
    return false;
  }
  return rows <= args.options().max_array_cells / cols;
}

Value GridResult(Array array) {
  if (array.rows == 1 && array.cols == 1) {
    return Value::FromScalar(array.cells.front());
  }
  return Value::FromArray(std::move(array));
}

std::optional<Value> FirstError(const Array& array) {
  for (const Scalar& cell : array.cells) {
    if (cell.IsError()) {
      return Value::FromScalar(cell);
    }
  }
  return std::nullopt;
}

}  // namespace cellforge::builtin
