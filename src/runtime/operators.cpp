#include "runtime/operators.h"

#include <cmath>
#include <utility>

#include "runtime/coerce.h"

namespace cellforge::runtime {

namespace {

bool IsScalarLike(const Value& v) {
  return !v.IsArray() || (v.array->rows == 1 && v.array->cols == 1);
}

Scalar Arithmetic(parser::BinaryOp op, double a, double b) {
  switch (op) {
    case parser::BinaryOp::kAdd:
      return Scalar::Number(a + b);
    case parser::BinaryOp::kSub:
      return Scalar::Number(a - b);
    case parser::BinaryOp::kMul:
      return Scalar::Number(a * b);
    case parser::BinaryOp::kDiv:
      if (b == 0.0) {
        return Scalar::Error(ErrorKind::kDivByZero);
      }
      return Scalar::Number(a / b);
    case parser::BinaryOp::kPow:
      if (a == 0.0 && b == 0.0) {
        return Scalar::Error(ErrorKind::kNumber);
      }
      if (a == 0.0 && b < 0.0) {
        return Scalar::Error(ErrorKind::kDivByZero);
      }
      return Scalar::Number(std::pow(a, b));
    default:
      return Scalar::Error(ErrorKind::kValue);
  }
}

bool Compare(parser::BinaryOp op, int cmp) {
  switch (op) {
    case parser::BinaryOp::kEq:
      return cmp == 0;
    case parser::BinaryOp::kNe:
      return cmp != 0;
    case parser::BinaryOp::kLt:
      return cmp < 0;
    case parser::BinaryOp::kLe:
      return cmp <= 0;
    case parser::BinaryOp::kGt:
      return cmp > 0;
    case parser::BinaryOp::kGe:
      return cmp >= 0;
    default:
      return false;
  }
}

}  // namespace

std::optional<Shape> BroadcastShape(const std::vector<const Value*>& operands) {
  std::optional<Shape> shape;
  for (const Value* v : operands) {
    if (IsScalarLike(*v)) continue;
    Shape s{v->array->rows, v->array->cols};
    if (!shape) {
      shape = s;
    } else if (shape->rows != s.rows || shape->cols != s.cols) {
      return std::nullopt;
    }
  }
  return shape.value_or(Shape{});
}

Scalar BroadcastAt(const Value& operand, int r, int c) {
  if (IsScalarLike(operand)) {
    return operand.ToScalar();
  }
  return operand.array->at(r, c);
}

bool AnyArray(const std::vector<const Value*>& operands) {
  for (const Value* v : operands) {
    if (v->IsArray()) return true;
  }
  return false;
}

Scalar ApplyUnaryScalar(parser::UnaryOp op, const Scalar& operand) {
  if (operand.IsError()) {
    return operand;
  }
  if (op == parser::UnaryOp::kPlus) {
    return operand;
  }
  Scalar n = ToNumber(operand);
  if (n.IsError()) {
    return n;
  }
  if (op == parser::UnaryOp::kNegate) {
    return Scalar::Number(n.number == 0.0 ? 0.0 : -n.number);
  }
  return Scalar::Number(n.number / 100.0);
}

Scalar ApplyBinaryScalar(parser::BinaryOp op, const Scalar& lhs, const Scalar& rhs) {
  if (lhs.IsError()) return lhs;
  if (rhs.IsError()) return rhs;
  switch (op) {
    case parser::BinaryOp::kConcat: {
      Scalar a = ToText(lhs);
      Scalar b = ToText(rhs);
      return Scalar::Text(a.text + b.text);
    }
    case parser::BinaryOp::kEq:
    case parser::BinaryOp::kNe:
    case parser::BinaryOp::kLt:
    case parser::BinaryOp::kLe:
    case parser::BinaryOp::kGt:
    case parser::BinaryOp::kGe:
      return Scalar::Bool(Compare(op, CompareScalars(lhs, rhs)));
    default: {
      Scalar a = ToNumber(lhs);
      if (a.IsError()) return a;
      Scalar b = ToNumber(rhs);
      if (b.IsError()) return b;
      return Arithmetic(op, a.number, b.number);
    }
  }
}

Value ApplyUnary(parser::UnaryOp op, const Value& operand) {
  if (operand.IsLambda()) {
    return Value::Error(ErrorKind::kValue);
  }
  if (!operand.IsArray()) {
    return Value::FromScalar(ApplyUnaryScalar(op, operand.ToScalar()));
  }
  Array out(operand.array->rows, operand.array->cols);
  for (size_t i = 0; i < out.cells.size(); ++i) {
    out.cells[i] = ApplyUnaryScalar(op, operand.array->cells[i]);
  }
  return Value::FromArray(std::move(out));
}

Value ApplyBinary(parser::BinaryOp op, const Value& lhs, const Value& rhs) {
  if (lhs.IsLambda() || rhs.IsLambda()) {
    return Value::Error(ErrorKind::kValue);
  }
  if (!lhs.IsArray() && !rhs.IsArray()) {
    return Value::FromScalar(ApplyBinaryScalar(op, lhs.ToScalar(), rhs.ToScalar()));
  }
  auto shape = BroadcastShape({&lhs, &rhs});
  if (!shape) {
    return Value::Error(ErrorKind::kValue);
  }
  Array out(shape->rows, shape->cols);
  for (int r = 0; r < shape->rows; ++r) {
    for (int c = 0; c < shape->cols; ++c) {
      out.at(r, c) = ApplyBinaryScalar(op, BroadcastAt(lhs, r, c), BroadcastAt(rhs, r, c));
    }
  }
  return Value::FromArray(std::move(out));
}

}  // namespace cellforge::runtime
