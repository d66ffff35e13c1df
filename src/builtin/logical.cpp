#include <string>
#include <utility>
#include <vector>

#include "builtin/args.h"
#include "builtin/builtins.h"
#include "runtime/coerce.h"

namespace cellforge::builtin {

namespace {

using runtime::Array;
using runtime::CallArgs;
using runtime::ErrorKind;
using runtime::Scalar;
using runtime::Value;

constexpr Category kCat = Category::kLogical;

// Folds one AND/OR operand into `*acc`. Text and blanks inside arrays are skipped; direct text
// must read as TRUE/FALSE. Returns an error value to surface, if any.
std::optional<Value> FoldLogical(const Value& v, bool is_and, bool* acc, bool* seen) {
  auto fold_scalar = [&](const Scalar& s, bool from_array) -> std::optional<Value> {
    if (s.IsError()) return Value::FromScalar(s);
    if (s.IsEmpty() || (from_array && s.IsText())) return std::nullopt;
    Scalar b = runtime::ToBoolean(s);
    if (b.IsError()) return Value::FromScalar(b);
    *seen = true;
    *acc = is_and ? (*acc && b.boolean) : (*acc || b.boolean);
    return std::nullopt;
  };
  if (v.IsArray()) {
    for (const Scalar& cell : v.array->cells) {
      if (auto err = fold_scalar(cell, true)) return err;
    }
    return std::nullopt;
  }
  return fold_scalar(v.ToScalar(), false);
}

Value AndOr(CallArgs& args, bool is_and) {
  bool acc = is_and;
  bool seen = false;
  for (size_t i = 0; i < args.size(); ++i) {
    if (!args.Has(i)) continue;
    if (auto err = FoldLogical(args.Get(i), is_and, &acc, &seen)) return *err;
    if (seen && acc != is_and) {
      // AND met a FALSE / OR met a TRUE: the rest cannot change the result.
      break;
    }
  }
  if (!seen) {
    return Value::Error(ErrorKind::kValue);
  }
  return Value::Bool(acc);
}

Value And(CallArgs& args) {
  return AndOr(args, true);
}

Value Or(CallArgs& args) {
  return AndOr(args, false);
}

Value Xor(CallArgs& args) {
  bool seen = false;
  int trues = 0;
  for (size_t i = 0; i < args.size(); ++i) {
    if (!args.Has(i)) continue;
    Value v = args.Get(i);
    std::vector<Value> parts;
    if (v.IsArray()) {
      for (const Scalar& cell : v.array->cells) parts.push_back(Value::FromScalar(cell));
    }
    const bool from_array = v.IsArray();
    if (!from_array) parts.push_back(v);
    for (const Value& part : parts) {
      if (from_array && part.IsText()) continue;
      bool acc = false;
      if (auto err = FoldLogical(part, false, &acc, &seen)) return *err;
      if (acc) ++trues;
    }
  }
  if (!seen) {
    return Value::Error(ErrorKind::kValue);
  }
  return Value::Bool(trues % 2 == 1);
}

Value Not(CallArgs& args) {
  Value v = args.Get(0);
  if (v.IsArray()) {
    Array out(v.array->rows, v.array->cols);
    for (size_t i = 0; i < out.cells.size(); ++i) {
      Scalar b = runtime::ToBoolean(v.array->cells[i]);
      out.cells[i] = b.IsError() ? b : Scalar::Bool(!b.boolean);
    }
    return Value::FromArray(std::move(out));
  }
  Scalar b = runtime::ToBoolean(v.ToScalar());
  if (b.IsError()) return Value::FromScalar(b);
  return Value::Bool(!b.boolean);
}

// Branch value for IF: a missing else is FALSE, an omitted branch is 0.
Value Branch(CallArgs& args, size_t i) {
  if (i >= args.size()) return Value::Bool(false);
  if (!args.Has(i)) return Value::Number(0);
  return args.Get(i);
}

Value If(CallArgs& args) {
  Value cond = args.Get(0);
  if (cond.IsArray()) {
    // Array condition: both branches are needed, chosen per element.
    Value when_true = Branch(args, 1);
    Value when_false = Branch(args, 2);
    Array out(cond.array->rows, cond.array->cols);
    for (int r = 0; r < out.rows; ++r) {
      for (int c = 0; c < out.cols; ++c) {
        Scalar b = runtime::ToBoolean(cond.array->at(r, c));
        if (b.IsError()) {
          out.at(r, c) = b;
          continue;
        }
        const Value& pick = b.boolean ? when_true : when_false;
        if (pick.IsArray() && pick.array->rows == out.rows && pick.array->cols == out.cols) {
          out.at(r, c) = pick.array->at(r, c);
        } else {
          out.at(r, c) = pick.ToScalar();
        }
      }
    }
    return Value::FromArray(std::move(out));
  }
  Scalar b = runtime::ToBoolean(cond.ToScalar());
  if (b.IsError()) return Value::FromScalar(b);
  return b.boolean ? Branch(args, 1) : Branch(args, 2);
}

Value Ifs(CallArgs& args) {
  if (args.size() % 2 != 0) {
    return Value::Error(ErrorKind::kValue);
  }
  for (size_t i = 0; i + 1 < args.size(); i += 2) {
    Scalar b = runtime::ToBoolean(args.Get(i).ToScalar());
    if (b.IsError()) return Value::FromScalar(b);
    if (b.boolean) return args.Get(i + 1);
  }
  return Value::Error(ErrorKind::kNotAvailable);
}

Value Switch(CallArgs& args) {
  Scalar subject = args.Get(0).ToScalar();
  if (subject.IsError()) return Value::FromScalar(subject);
  size_t i = 1;
  for (; i + 1 < args.size(); i += 2) {
    Scalar candidate = args.Get(i).ToScalar();
    if (candidate.IsError()) return Value::FromScalar(candidate);
    if (candidate.kind == subject.kind && runtime::CompareScalars(subject, candidate) == 0) {
      return args.Get(i + 1);
    }
  }
  if (i < args.size()) {
    return args.Get(i);
  }
  return Value::Error(ErrorKind::kNotAvailable);
}

// IFERROR / IFNA: the fallback is forced only when some element needs it.
Value Trap(CallArgs& args, bool only_na) {
  auto trapped = [only_na](const Scalar& s) {
    return s.IsError() && (!only_na || s.error == ErrorKind::kNotAvailable);
  };
  Value v = args.Get(0);
  if (v.IsArray()) {
    bool any = false;
    for (const Scalar& cell : v.array->cells) any = any || trapped(cell);
    if (!any) return v;
    Scalar fallback = args.Get(1).ToScalar();
    Array out = *v.array;
    for (Scalar& cell : out.cells) {
      if (trapped(cell)) cell = fallback;
    }
    return Value::FromArray(std::move(out));
  }
  if (v.IsError() && trapped(v.ToScalar())) {
    Value fallback = args.Get(1);
    return fallback.IsEmpty() ? Value::Number(0) : fallback;
  }
  return v;
}

Value IfError(CallArgs& args) {
  return Trap(args, false);
}

Value IfNa(CallArgs& args) {
  return Trap(args, true);
}

Value True(CallArgs&) {
  return Value::Bool(true);
}

Value False(CallArgs&) {
  return Value::Bool(false);
}

// LET and LAMBDA are parsed as syntax; these entries only carry their metadata.
Value SyntaxForm(CallArgs&) {
  return Value::Error(ErrorKind::kValue);
}

}  // namespace

void RegisterLogicalFunctions(FunctionRegistry* registry) {
  registry->Add(FunctionId::kIf, "IF", kCat, 2, 3, If,
                "IF(logical_test, [value_if_true], [value_if_false])",
                "Returns one value when a condition is TRUE and another when it is FALSE.", kLazy);
  registry->Add(FunctionId::kIfs, "IFS", kCat, 2, kVariadic, Ifs,
                "IFS(condition1, value1, [condition2, value2], ...)",
                "Returns the value paired with the first TRUE condition.", kLazy);
  registry->Add(FunctionId::kSwitch, "SWITCH", kCat, 3, kVariadic, Switch,
                "SWITCH(expression, value1, result1, ..., [default])",
                "Matches an expression against values and returns the paired result.", kLazy);
  registry->Add(FunctionId::kIfError, "IFERROR", kCat, 2, 2, IfError,
                "IFERROR(value, value_if_error)",
                "Returns a fallback when the value is any error.", kLazy);
  registry->Add(FunctionId::kIfNa, "IFNA", kCat, 2, 2, IfNa, "IFNA(value, value_if_na)",
                "Returns a fallback when the value is #N/A.", kLazy);
  registry->Add(FunctionId::kAnd, "AND", kCat, 1, kVariadic, And, "AND(logical1, [logical2], ...)",
                "TRUE when every argument is TRUE.", kLazy);
  registry->Add(FunctionId::kOr, "OR", kCat, 1, kVariadic, Or, "OR(logical1, [logical2], ...)",
                "TRUE when any argument is TRUE.", kLazy);
  registry->Add(FunctionId::kNot, "NOT", kCat, 1, 1, Not, "NOT(logical)",
                "Reverses a logical value.", kLazy);
  registry->Add(FunctionId::kXor, "XOR", kCat, 1, kVariadic, Xor, "XOR(logical1, [logical2], ...)",
                "TRUE when an odd number of arguments are TRUE.");
  registry->Add(FunctionId::kTrue, "TRUE", kCat, 0, 0, True, "TRUE()", "The logical value TRUE.");
  registry->Add(FunctionId::kFalse, "FALSE", kCat, 0, 0, False, "FALSE()",
                "The logical value FALSE.");
  registry->Add(FunctionId::kLet, "LET", kCat, 3, kVariadic, SyntaxForm,
                "LET(name1, value1, [name2, value2, ...], calculation)",
                "Binds names to values for use in a final calculation.");
  registry->Add(FunctionId::kLambda, "LAMBDA", kCat, 1, kVariadic, SyntaxForm,
                "LAMBDA([parameter1, ...], calculation)",
                "Creates a reusable function from parameters and a calculation.");
}

}  // namespace cellforge::builtin
