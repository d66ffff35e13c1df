#include <algorithm>
#include <memory>
#include <vector>

#include "builtin/args.h"
#include "builtin/builtins.h"
#include "builtin/criteria.h"

namespace cellforge::builtin {

namespace {

using runtime::Array;
using runtime::CallArgs;
using runtime::ErrorKind;
using runtime::Scalar;
using runtime::Value;

// Criteria ranges and their conditions; a cell index passes when every range matches there.
struct CriteriaSet {
  std::vector<std::shared_ptr<const Array>> ranges;
  std::vector<Criterion> criteria;

  bool Matches(size_t cell) const {
    for (size_t i = 0; i < ranges.size(); ++i) {
      if (!criteria[i].Matches(ranges[i]->cells[cell])) return false;
    }
    return true;
  }
};

bool SameShape(const Array& a, const Array& b) {
  return a.rows == b.rows && a.cols == b.cols;
}

std::optional<Value> AddCriterion(CallArgs& args, size_t range_index, size_t criterion_index,
                                  CriteriaSet* set) {
  Value range = args.Get(range_index);
  if (range.IsError()) return range;
  Scalar raw = args.Get(criterion_index).ToScalar();
  auto criterion = Criterion::Parse(raw);
  if (!criterion) return Value::FromScalar(raw);
  set->ranges.push_back(range.ToArray());
  set->criteria.push_back(*criterion);
  return std::nullopt;
}

// Reads (range, criterion) pairs from `first` onward and checks every range against `target`.
std::optional<Value> ReadPairs(CallArgs& args, size_t first, const Array& target,
                               CriteriaSet* set) {
  if (args.size() < first + 2 || (args.size() - first) % 2 != 0) {
    return Value::Error(ErrorKind::kValue);
  }
  for (size_t i = first; i + 1 < args.size(); i += 2) {
    if (auto err = AddCriterion(args, i, i + 1, set)) return err;
    if (!SameShape(*set->ranges.back(), target)) return Value::Error(ErrorKind::kValue);
  }
  return std::nullopt;
}

// Numbers of `values` at cells passing `set`; other cells are skipped.
std::vector<double> MatchingNumbers(const Array& values, const CriteriaSet& set) {
  std::vector<double> out;
  for (size_t cell = 0; cell < values.size(); ++cell) {
    if (set.Matches(cell) && values.cells[cell].IsNumber()) {
      out.push_back(values.cells[cell].number);
    }
  }
  return out;
}

enum class Reduce { kSum, kAverage, kMax, kMin };

Value Finish(const std::vector<double>& xs, Reduce reduce) {
  switch (reduce) {
    case Reduce::kSum: {
      double total = 0.0;
      for (double x : xs) total += x;
      return Value::Number(total);
    }
    case Reduce::kAverage: {
      if (xs.empty()) return Value::Error(ErrorKind::kDivByZero);
      double total = 0.0;
      for (double x : xs) total += x;
      return Value::Number(total / static_cast<double>(xs.size()));
    }
    case Reduce::kMax:
      if (xs.empty()) return Value::Error(ErrorKind::kValue);
      return Value::Number(*std::max_element(xs.begin(), xs.end()));
    case Reduce::kMin:
      if (xs.empty()) return Value::Error(ErrorKind::kValue);
      return Value::Number(*std::min_element(xs.begin(), xs.end()));
  }
  return Value::Error(ErrorKind::kValue);
}

// SUMIF / AVERAGEIF: (range, criterion, [value_range]).
Value SingleCriterion(CallArgs& args, Reduce reduce) {
  CriteriaSet set;
  if (auto err = AddCriterion(args, 0, 1, &set)) return *err;
  std::shared_ptr<const Array> values = set.ranges.front();
  if (args.Has(2)) {
    Value v = args.Get(2);
    if (v.IsError()) return v;
    values = v.ToArray();
    if (!SameShape(*values, *set.ranges.front())) return Value::Error(ErrorKind::kValue);
  }
  return Finish(MatchingNumbers(*values, set), reduce);
}

// SUMIFS / AVERAGEIFS / MAXIFS / MINIFS: (value_range, range1, criterion1, ...).
Value MultiCriteria(CallArgs& args, Reduce reduce) {
  Value target = args.Get(0);
  if (target.IsError()) return target;
  auto values = target.ToArray();
  CriteriaSet set;
  if (auto err = ReadPairs(args, 1, *values, &set)) return *err;
  return Finish(MatchingNumbers(*values, set), reduce);
}

Value SumIf(CallArgs& args) {
  return SingleCriterion(args, Reduce::kSum);
}

Value AverageIf(CallArgs& args) {
  return SingleCriterion(args, Reduce::kAverage);
}

Value SumIfs(CallArgs& args) {
  return MultiCriteria(args, Reduce::kSum);
}

Value AverageIfs(CallArgs& args) {
  return MultiCriteria(args, Reduce::kAverage);
}

Value MaxIfs(CallArgs& args) {
  return MultiCriteria(args, Reduce::kMax);
}

Value MinIfs(CallArgs& args) {
  return MultiCriteria(args, Reduce::kMin);
}

Value CountMatches(const CriteriaSet& set) {
  double count = 0;
  for (size_t cell = 0; cell < set.ranges.front()->size(); ++cell) {
    if (set.Matches(cell)) ++count;
  }
  return Value::Number(count);
}

Value CountIf(CallArgs& args) {
  CriteriaSet set;
  if (auto err = AddCriterion(args, 0, 1, &set)) return *err;
  return CountMatches(set);
}

Value CountIfs(CallArgs& args) {
  Value first = args.Get(0);
  if (first.IsError()) return first;
  CriteriaSet set;
  if (auto err = ReadPairs(args, 0, *first.ToArray(), &set)) return *err;
  return CountMatches(set);
}

}  // namespace

void RegisterCriteriaFunctions(FunctionRegistry* registry) {
  registry->Add(FunctionId::kSumIf, "SUMIF", Category::kMath, 2, 3, SumIf,
                "SUMIF(range, criteria, [sum_range])", "Sums cells that meet a condition.");
  registry->Add(FunctionId::kSumIfs, "SUMIFS", Category::kMath, 3, kVariadic, SumIfs,
                "SUMIFS(sum_range, criteria_range1, criteria1, ...)",
                "Sums cells that meet every condition.");
  registry->Add(FunctionId::kCountIf, "COUNTIF", Category::kStatistical, 2, 2, CountIf,
                "COUNTIF(range, criteria)", "Counts cells that meet a condition.");
  registry->Add(FunctionId::kCountIfs, "COUNTIFS", Category::kStatistical, 2, kVariadic,
                CountIfs, "COUNTIFS(criteria_range1, criteria1, ...)",
                "Counts cells that meet every condition.");
  registry->Add(FunctionId::kAverageIf, "AVERAGEIF", Category::kStatistical, 2, 3, AverageIf,
                "AVERAGEIF(range, criteria, [average_range])",
                "Averages cells that meet a condition.");
  registry->Add(FunctionId::kAverageIfs, "AVERAGEIFS", Category::kStatistical, 3, kVariadic,
                AverageIfs, "AVERAGEIFS(average_range, criteria_range1, criteria1, ...)",
                "Averages cells that meet every condition.");
  registry->Add(FunctionId::kMaxIfs, "MAXIFS", Category::kStatistical, 3, kVariadic, MaxIfs,
                "MAXIFS(max_range, criteria_range1, criteria1, ...)",
                "Largest value among cells that meet every condition.");
  registry->Add(FunctionId::kMinIfs, "MINIFS", Category::kStatistical, 3, kVariadic, MinIfs,
                "MINIFS(min_range, criteria_range1, criteria1, ...)",
                "Smallest value among cells that meet every condition.");
}

}  // namespace cellforge::builtin
