#include <cmath>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "builtin/args.h"
#include "builtin/builtins.h"
#include "runtime/operators.h"

// Lambda helpers. Each call of the supplied lambda fills one output cell, so an error from one
// call lands in that cell instead of failing the whole result.

namespace cellforge::builtin {

namespace {

using runtime::Array;
using runtime::CallArgs;
using runtime::ErrorKind;
using runtime::Lambda;
using runtime::Scalar;
using runtime::Value;

constexpr Category kCat = Category::kArray;

std::optional<Value> CheckArity(const Lambda& lambda, size_t expected) {
  if (lambda.parameters.size() != expected) return Value::Error(ErrorKind::kValue);
  return std::nullopt;
}

/// MAP(array1, [array2, ...], lambda).
Value Map(CallArgs& args) {
  std::shared_ptr<const Lambda> fn;
  if (auto err = LambdaArg(args, args.size() - 1, &fn)) return *err;
  if (auto err = CheckArity(*fn, args.size() - 1)) return *err;
  std::vector<Value> inputs;
  for (size_t i = 0; i + 1 < args.size(); ++i) {
    Value v = args.Get(i);
    if (v.IsLambda()) return Value::Error(ErrorKind::kValue);
    inputs.push_back(std::move(v));
  }
  std::vector<const Value*> operands;
  for (const Value& v : inputs) operands.push_back(&v);
  auto shape = runtime::BroadcastShape(operands);
  if (!shape) return Value::Error(ErrorKind::kValue);
  Array out(shape->rows, shape->cols);
  std::vector<Value> call(inputs.size());
  for (int r = 0; r < shape->rows; ++r) {
    for (int c = 0; c < shape->cols; ++c) {
      for (size_t i = 0; i < inputs.size(); ++i) {
        call[i] = Value::FromScalar(runtime::BroadcastAt(inputs[i], r, c));
      }
      out.at(r, c) = args.Invoke(*fn, call).ToScalar();
    }
  }
  return GridResult(std::move(out));
}

// REDUCE / SCAN arguments: ([initial_value], array, lambda).
struct Fold {
  Value initial;
  std::shared_ptr<const Array> array;
  std::shared_ptr<const Lambda> fn;
};

std::optional<Value> ReadFold(CallArgs& args, Fold* fold) {
  const size_t array_index = args.size() == 3 ? 1 : 0;
  if (array_index == 1 && args.Has(0)) fold->initial = args.Get(0);
  if (auto err = LambdaArg(args, array_index + 1, &fold->fn)) return err;
  if (auto err = CheckArity(*fold->fn, 2)) return err;
  Value v = args.Get(array_index);
  if (v.IsLambda()) return Value::Error(ErrorKind::kValue);
  fold->array = v.ToArray();
  return std::nullopt;
}

Value Reduce(CallArgs& args) {
  Fold fold;
  if (auto err = ReadFold(args, &fold)) return *err;
  Value acc = fold.initial;
  for (const Scalar& cell : fold.array->cells) {
    acc = args.Invoke(*fold.fn, {acc, Value::FromScalar(cell)});
  }
  return acc;
}

Value Scan(CallArgs& args) {
  Fold fold;
  if (auto err = ReadFold(args, &fold)) return *err;
  Value acc = fold.initial;
  Array out(fold.array->rows, fold.array->cols);
  for (size_t i = 0; i < fold.array->size(); ++i) {
    acc = args.Invoke(*fold.fn, {acc, Value::FromScalar(fold.array->cells[i])});
    out.cells[i] = acc.ToScalar();
  }
  return GridResult(std::move(out));
}

// BYROW / BYCOL: the lambda reduces each line to one value.
Value ByLine(CallArgs& args, bool rows) {
  std::shared_ptr<const Lambda> fn;
  if (auto err = LambdaArg(args, 1, &fn)) return *err;
  if (auto err = CheckArity(*fn, 1)) return *err;
  Value v = args.Get(0);
  if (v.IsError() || v.IsLambda()) return v.IsError() ? v : Value::Error(ErrorKind::kValue);
  auto a = v.ToArray();
  const int lines = rows ? a->rows : a->cols;
  Array out(rows ? lines : 1, rows ? 1 : lines);
  for (int i = 0; i < lines; ++i) {
    Array line(rows ? 1 : a->rows, rows ? a->cols : 1);
    for (size_t k = 0; k < line.size(); ++k) {
      line.cells[k] = rows ? a->at(i, static_cast<int>(k)) : a->at(static_cast<int>(k), i);
    }
    out.cells[i] = args.Invoke(*fn, {Value::FromArray(std::move(line))}).ToScalar();
  }
  return GridResult(std::move(out));
}

Value ByRow(CallArgs& args) {
  return ByLine(args, true);
}

Value ByCol(CallArgs& args) {
  return ByLine(args, false);
}

/// MAKEARRAY(rows, columns, lambda(row, col)) with 1-based positions.
Value MakeArray(CallArgs& args) {
  double rows = 0.0;
  double cols = 0.0;
  std::shared_ptr<const Lambda> fn;
  if (auto err = NumberArg(args, 0, &rows)) return *err;
  if (auto err = NumberArg(args, 1, &cols)) return *err;
  if (auto err = LambdaArg(args, 2, &fn)) return *err;
  if (auto err = CheckArity(*fn, 2)) return *err;
  rows = std::trunc(rows);
  cols = std::trunc(cols);
  if (rows < 1 || cols < 1 || rows > 1e9 || cols > 1e9 ||
      !WithinCellLimit(args, static_cast<int64_t>(rows), static_cast<int64_t>(cols))) {
    return Value::Error(ErrorKind::kValue);
  }
  Array out(static_cast<int>(rows), static_cast<int>(cols));
  for (int r = 0; r < out.rows; ++r) {
    for (int c = 0; c < out.cols; ++c) {
      out.at(r, c) = args.Invoke(*fn, {Value::Number(r + 1), Value::Number(c + 1)}).ToScalar();
    }
  }
  return GridResult(std::move(out));
}

}  // namespace

void RegisterLambdaFunctions(FunctionRegistry* registry) {
  registry->Add(FunctionId::kMap, "MAP", kCat, 2, kVariadic, Map,
                "MAP(array1, [array2, ...], lambda)",
                "Applies a lambda to each element of one or more arrays.");
  registry->Add(FunctionId::kReduce, "REDUCE", kCat, 2, 3, Reduce,
                "REDUCE([initial_value], array, lambda(accumulator, value))",
                "Folds an array into one value.");
  registry->Add(FunctionId::kScan, "SCAN", kCat, 2, 3, Scan,
                "SCAN([initial_value], array, lambda(accumulator, value))",
                "Running fold of an array, one result per element.");
  registry->Add(FunctionId::kByRow, "BYROW", kCat, 2, 2, ByRow, "BYROW(array, lambda(row))",
                "Applies a lambda to each row.");
  registry->Add(FunctionId::kByCol, "BYCOL", kCat, 2, 2, ByCol, "BYCOL(array, lambda(column))",
                "Applies a lambda to each column.");
  registry->Add(FunctionId::kMakeArray, "MAKEARRAY", kCat, 3, 3, MakeArray,
                "MAKEARRAY(rows, columns, lambda(row, col))",
                "Builds an array by calling a lambda per position.");
}

}  // namespace cellforge::builtin
