#include <algorithm>
#include <cmath>
#include <optional>
#include <utility>
#include <vector>

#include "builtin/args.h"
#include "builtin/builtins.h"
#include "builtin/criteria.h"
#include "builtin/stats.h"
#include "runtime/coerce.h"
#include "util/string.h"

// Database functions take a table whose first row holds column labels, a field (label or
// 1-based column number) and a criteria table with labels in its first row. Criteria rows are
// alternatives; the cells of one row must all hold.

namespace cellforge::builtin {

namespace {

using runtime::Array;
using runtime::CallArgs;
using runtime::ErrorKind;
using runtime::Scalar;
using runtime::Value;

constexpr Category kCat = Category::kDatabase;

std::optional<int> FindColumn(const Array& table, const Scalar& label) {
  if (label.IsNumber()) {
    const double index = std::trunc(label.number);
    if (!(index >= 1 && index <= static_cast<double>(table.cols))) return std::nullopt;
    return static_cast<int>(index) - 1;
  }
  const std::string wanted = runtime::ToText(label).text;
  for (int c = 0; c < table.cols; ++c) {
    if (util::EqualsIgnoreCase(runtime::ToText(table.at(0, c)).text, wanted)) return c;
  }
  return std::nullopt;
}

struct Condition {
  int column = 0;
  Criterion criterion;
};

// Indices (into the table, header excluded) of records that satisfy some criteria row.
std::optional<Value> MatchingRecords(const Array& table, const Array& criteria,
                                     std::vector<int>* rows) {
  if (table.rows < 1 || criteria.rows < 2) return Value::Error(ErrorKind::kValue);
  std::vector<std::vector<Condition>> alternatives;
  for (int r = 1; r < criteria.rows; ++r) {
    std::vector<Condition> conditions;
    for (int c = 0; c < criteria.cols; ++c) {
      const Scalar& cell = criteria.at(r, c);
      if (cell.IsEmpty()) continue;
      auto column = FindColumn(table, criteria.at(0, c));
      if (!column || criteria.at(0, c).IsNumber()) return Value::Error(ErrorKind::kValue);
      auto criterion = Criterion::Parse(cell);
      if (!criterion) return Value::FromScalar(cell);
      conditions.push_back({*column, *criterion});
    }
    alternatives.push_back(std::move(conditions));
  }
  for (int r = 1; r < table.rows; ++r) {
    for (const auto& conditions : alternatives) {
      bool all = true;
      for (const Condition& condition : conditions) {
        if (!condition.criterion.Matches(table.at(r, condition.column))) {
          all = false;
          break;
        }
      }
      if (all) {
        rows->push_back(r);
        break;
      }
    }
  }
  return std::nullopt;
}

// Cells of the selected field for every matching record.
std::optional<Value> SelectField(CallArgs& args, std::vector<Scalar>* out) {
  Value table_value = args.Get(0);
  if (table_value.IsError()) return table_value;
  Value criteria_value = args.Get(2);
  if (criteria_value.IsError()) return criteria_value;
  auto table = table_value.ToArray();
  auto criteria = criteria_value.ToArray();
  std::optional<int> column;
  if (args.Has(1)) {
    Scalar field = ScalarArg(args, 1);
    if (field.IsError()) return Value::FromScalar(field);
    column = FindColumn(*table, field);
    if (!column) return Value::Error(ErrorKind::kValue);
  }
  std::vector<int> rows;
  if (auto err = MatchingRecords(*table, *criteria, &rows)) return err;
  for (int r : rows) {
    // Without a field every record counts once, as a number.
    out->push_back(column ? table->at(r, *column) : Scalar::Number(1));
  }
  return std::nullopt;
}

std::vector<double> Numbers(const std::vector<Scalar>& cells) {
  std::vector<double> xs;
  for (const Scalar& cell : cells) {
    if (cell.IsNumber()) xs.push_back(cell.number);
  }
  return xs;
}

Value DSum(CallArgs& args) {
  std::vector<Scalar> cells;
  if (auto err = SelectField(args, &cells)) return *err;
  return Value::Number(stats::Sum(Numbers(cells)));
}

Value DAverage(CallArgs& args) {
  std::vector<Scalar> cells;
  if (auto err = SelectField(args, &cells)) return *err;
  auto xs = Numbers(cells);
  if (xs.empty()) return Value::Error(ErrorKind::kDivByZero);
  return Value::Number(stats::Mean(xs));
}

Value DCount(CallArgs& args) {
  std::vector<Scalar> cells;
  if (auto err = SelectField(args, &cells)) return *err;
  return Value::Number(static_cast<double>(Numbers(cells).size()));
}

Value DCountA(CallArgs& args) {
  std::vector<Scalar> cells;
  if (auto err = SelectField(args, &cells)) return *err;
  return Value::Number(static_cast<double>(
      std::count_if(cells.begin(), cells.end(), [](const Scalar& s) { return !s.IsEmpty(); })));
}

Value DMax(CallArgs& args) {
  std::vector<Scalar> cells;
  if (auto err = SelectField(args, &cells)) return *err;
  auto xs = Numbers(cells);
  return Value::Number(xs.empty() ? 0.0 : *std::max_element(xs.begin(), xs.end()));
}

Value DMin(CallArgs& args) {
  std::vector<Scalar> cells;
  if (auto err = SelectField(args, &cells)) return *err;
  auto xs = Numbers(cells);
  return Value::Number(xs.empty() ? 0.0 : *std::min_element(xs.begin(), xs.end()));
}

Value DProduct(CallArgs& args) {
  std::vector<Scalar> cells;
  if (auto err = SelectField(args, &cells)) return *err;
  auto xs = Numbers(cells);
  if (xs.empty()) return Value::Number(0);
  double product = 1.0;
  for (double x : xs) product *= x;
  return Value::Number(product);
}

/// Exactly one matching record: zero is #VALUE!, several are #NUM!.
Value DGet(CallArgs& args) {
  std::vector<Scalar> cells;
  if (auto err = SelectField(args, &cells)) return *err;
  if (cells.empty()) return Value::Error(ErrorKind::kValue);
  if (cells.size() > 1) return Value::Error(ErrorKind::kNumber);
  return Value::FromScalar(cells.front());
}

}  // namespace

void RegisterDatabaseFunctions(FunctionRegistry* registry) {
  registry->Add(FunctionId::kDSum, "DSUM", kCat, 3, 3, DSum, "DSUM(database, field, criteria)",
                "Sums a field over matching records.");
  registry->Add(FunctionId::kDAverage, "DAVERAGE", kCat, 3, 3, DAverage,
                "DAVERAGE(database, field, criteria)", "Averages a field over matching records.");
  registry->Add(FunctionId::kDCount, "DCOUNT", kCat, 3, 3, DCount,
                "DCOUNT(database, [field], criteria)",
                "Counts numbers in a field over matching records.");
  registry->Add(FunctionId::kDCountA, "DCOUNTA", kCat, 3, 3, DCountA,
                "DCOUNTA(database, [field], criteria)",
                "Counts non-empty cells in a field over matching records.");
  registry->Add(FunctionId::kDMax, "DMAX", kCat, 3, 3, DMax, "DMAX(database, field, criteria)",
                "Largest value of a field over matching records.");
  registry->Add(FunctionId::kDMin, "DMIN", kCat, 3, 3, DMin, "DMIN(database, field, criteria)",
                "Smallest value of a field over matching records.");
  registry->Add(FunctionId::kDProduct, "DPRODUCT", kCat, 3, 3, DProduct,
                "DPRODUCT(database, field, criteria)",
                "Multiplies a field over matching records.");
  registry->Add(FunctionId::kDGet, "DGET", kCat, 3, 3, DGet, "DGET(database, field, criteria)",
                "The field of the single matching record.");
}

}  // namespace cellforge::builtin
