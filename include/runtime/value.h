#ifndef CELLFORGE_RUNTIME_VALUE_H_
#define CELLFORGE_RUNTIME_VALUE_H_

#include <memory>
#include <string>
#include <vector>

#include "runtime/error_kind.h"

namespace cellforge {
namespace parser {
struct Expression;
}  // namespace parser
namespace runtime {

class Environment;

enum class ValueKind { kEmpty, kNumber, kText, kBoolean, kError, kArray, kLambda };

/// Array element: one of Empty, Number, Text, Boolean or Error. Never an array.
struct Scalar {
  ValueKind kind = ValueKind::kEmpty;
  double number = 0.0;
  std::string text;
  bool boolean = false;
  ErrorKind error = ErrorKind::kValue;

  static Scalar Empty() { return Scalar{}; }
  /// NaN and infinities become #NUM!.
  static Scalar Number(double v);
  static Scalar Text(std::string v);
  static Scalar Bool(bool v);
  static Scalar Error(ErrorKind k);

  bool IsEmpty() const { return kind == ValueKind::kEmpty; }
  bool IsNumber() const { return kind == ValueKind::kNumber; }
  bool IsText() const { return kind == ValueKind::kText; }
  bool IsBoolean() const { return kind == ValueKind::kBoolean; }
  bool IsError() const { return kind == ValueKind::kError; }

  std::string ToString() const;
};

/// Rectangular row-major grid.
struct Array {
  Array() = default;
  Array(int r, int c) : rows(r), cols(c), cells(static_cast<size_t>(r) * c) {}
  Array(int r, int c, const Scalar& fill)
      : rows(r), cols(c), cells(static_cast<size_t>(r) * c, fill) {}

  const Scalar& at(int r, int c) const { return cells[static_cast<size_t>(r) * cols + c]; }
  Scalar& at(int r, int c) { return cells[static_cast<size_t>(r) * cols + c]; }
  size_t size() const { return cells.size(); }

  int rows = 0;
  int cols = 0;
  std::vector<Scalar> cells;
};

/// Closure created by LAMBDA; `captured` is the scope visible to the body.
struct Lambda {
  std::vector<std::string> parameters;
  std::shared_ptr<const parser::Expression> body;
  std::shared_ptr<Environment> captured;
};

struct Value {
  ValueKind kind = ValueKind::kEmpty;
  double number = 0.0;
  std::string text;
  bool boolean = false;
  ErrorKind error = ErrorKind::kValue;
  std::shared_ptr<const Array> array;
  std::shared_ptr<const Lambda> lambda;

  static Value Empty() { return Value{}; }
  /// NaN and infinities become #NUM!.
  static Value Number(double v);
  static Value Text(std::string v);
  static Value Bool(bool v);
  static Value Error(ErrorKind k);
  static Value FromScalar(const Scalar& s);
  static Value FromArray(Array a);
  static Value FromLambda(std::shared_ptr<const Lambda> l);

  bool IsEmpty() const { return kind == ValueKind::kEmpty; }
  bool IsNumber() const { return kind == ValueKind::kNumber; }
  bool IsText() const { return kind == ValueKind::kText; }
  bool IsBoolean() const { return kind == ValueKind::kBoolean; }
  bool IsError() const { return kind == ValueKind::kError; }
  bool IsArray() const { return kind == ValueKind::kArray; }
  bool IsLambda() const { return kind == ValueKind::kLambda; }

  /// Scalar view: a 1x1 array unwraps, larger arrays and lambdas are #VALUE!.
  Scalar ToScalar() const;

  /// Array view: scalars become a 1x1 array; a lambda becomes a 1x1 #VALUE!.
  std::shared_ptr<const Array> ToArray() const;

  /// Display text; arrays render as {1,2;3,4}.
  std::string ToString() const;
};

/// Integers print without a decimal point; other values use up to 15 significant digits.
std::string FormatNumber(double value);

}  // namespace runtime
}  // namespace cellforge

#endif  // CELLFORGE_RUNTIME_VALUE_H_
