#include "runtime/value.h"

#include <cmath>
#include <cstdio>
#include <sstream>
#include <utility>

#include "util/string.h"

namespace cellforge::runtime {

std::string FormatNumber(double value) {
  if (value == 0.0) {
    return "0";
  }
  char buffer[64];
  if (std::fabs(value) < 1e15 && std::floor(value) == value) {
    std::snprintf(buffer, sizeof(buffer), "%.0f", value);
  } else {
    std::snprintf(buffer, sizeof(buffer), "%.15g", value);
  }
  return util::ToUpper(buffer);
}

Scalar Scalar::Number(double v) {
  if (!std::isfinite(v)) {
    return Error(ErrorKind::kNumber);
  }
  Scalar s;
  s.kind = ValueKind::kNumber;
  s.number = v;
  return s;
}

Scalar Scalar::Text(std::string v) {
  Scalar s;
  s.kind = ValueKind::kText;
  s.text = std::move(v);
  return s;
}

Scalar Scalar::Bool(bool v) {
  Scalar s;
  s.kind = ValueKind::kBoolean;
  s.boolean = v;
  return s;
}

Scalar Scalar::Error(ErrorKind k) {
  Scalar s;
  s.kind = ValueKind::kError;
  s.error = k;
  return s;
}

std::string Scalar::ToString() const {
  switch (kind) {
    case ValueKind::kNumber:
      return FormatNumber(number);
    case ValueKind::kText:
      return text;
    case ValueKind::kBoolean:
      return boolean ? "TRUE" : "FALSE";
    case ValueKind::kError:
      return ErrorKindToken(error);
    default:
      return "";
  }
}

Value Value::Number(double v) {
  if (!std::isfinite(v)) {
    return Error(ErrorKind::kNumber);
  }
  Value out;
  out.kind = ValueKind::kNumber;
  out.number = v;
  return out;
}

Value Value::Text(std::string v) {
  Value out;
  out.kind = ValueKind::kText;
  out.text = std::move(v);
  return out;
}

Value Value::Bool(bool v) {
  Value out;
  out.kind = ValueKind::kBoolean;
  out.boolean = v;
  return out;
}

Value Value::Error(ErrorKind k) {
  Value out;
  out.kind = ValueKind::kError;
  out.error = k;
  return out;
}

Value Value::FromScalar(const Scalar& s) {
  Value out;
  out.kind = s.kind;
  out.number = s.number;
  out.text = s.text;
  out.boolean = s.boolean;
  out.error = s.error;
  return out;
}

Value Value::FromArray(Array a) {
  Value out;
  out.kind = ValueKind::kArray;
  out.array = std::make_shared<const Array>(std::move(a));
  return out;
}

Value Value::FromLambda(std::shared_ptr<const Lambda> l) {
  Value out;
  out.kind = ValueKind::kLambda;
  out.lambda = std::move(l);
  return out;
}

Scalar Value::ToScalar() const {
  switch (kind) {
    case ValueKind::kArray:
      if (array && array->rows == 1 && array->cols == 1) {
        return array->cells.front();
      }
      return Scalar::Error(ErrorKind::kValue);
    case ValueKind::kLambda:
      return Scalar::Error(ErrorKind::kValue);
    default: {
      Scalar s;
      s.kind = kind;
      s.number = number;
      s.text = text;
      s.boolean = boolean;
      s.error = error;
      return s;
    }
  }
}

std::shared_ptr<const Array> Value::ToArray() const {
  if (kind == ValueKind::kArray && array) {
    return array;
  }
  return std::make_shared<const Array>(1, 1, ToScalar());
}

std::string Value::ToString() const {
  if (kind == ValueKind::kLambda) {
    std::string out = "LAMBDA(";
    if (lambda) {
      for (size_t i = 0; i < lambda->parameters.size(); ++i) {
        if (i > 0) out += ",";
        out += lambda->parameters[i];
      }
    }
    return out + ")";
  }
  if (kind != ValueKind::kArray) {
    return ToScalar().ToString();
  }
  std::ostringstream out;
  out << "{";
  for (int r = 0; r < array->rows; ++r) {
    if (r > 0) out << ";";
    for (int c = 0; c < array->cols; ++c) {
      if (c > 0) out << ",";
      const Scalar& cell = array->at(r, c);
      if (cell.IsText()) {
        out << "\"" << cell.text << "\"";
      } else {
        out << cell.ToString();
      }
    }
  }
  out << "}";
  return out.str();
}

}  // namespace cellforge::runtime
