#ifndef CELLFORGE_RUNTIME_OPERATORS_H_
#define CELLFORGE_RUNTIME_OPERATORS_H_

#include <optional>
#include <vector>

#include "parser/ast.h"
#include "runtime/value.h"

namespace cellforge::runtime {

struct Shape {
  int rows = 1;
  int cols = 1;
};

/// Shape of an element-wise result. Scalars and 1x1 arrays adapt to any shape; other arrays
/// must agree exactly. Returns nullopt on a mismatch.
std::optional<Shape> BroadcastShape(const std::vector<const Value*>& operands);

/// Element (r, c) of an operand under broadcasting.
Scalar BroadcastAt(const Value& operand, int r, int c);

/// True when any operand is an array, so the result must be one too.
bool AnyArray(const std::vector<const Value*>& operands);

Scalar ApplyUnaryScalar(parser::UnaryOp op, const Scalar& operand);
Scalar ApplyBinaryScalar(parser::BinaryOp op, const Scalar& lhs, const Scalar& rhs);

/// Operator application with broadcasting; shape mismatch is #VALUE!.
Value ApplyUnary(parser::UnaryOp op, const Value& operand);
Value ApplyBinary(parser::BinaryOp op, const Value& lhs, const Value& rhs);

}  // namespace cellforge::runtime

#endif  // CELLFORGE_RUNTIME_OPERATORS_H_
