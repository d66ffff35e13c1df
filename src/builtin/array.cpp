#include <algorithm>
#include <cmath>
#include <memory>
#include <numeric>
#include <random>
#include <utility>
#include <vector>

#include "builtin/args.h"
#include "builtin/builtins.h"
#include "builtin/stats.h"
#include "runtime/coerce.h"

namespace cellforge::builtin {

namespace {

using runtime::Array;
using runtime::CallArgs;
using runtime::ErrorKind;
using runtime::Scalar;
using runtime::Value;

constexpr Category kCat = Category::kArray;

Value ValueError() {
  return Value::Error(ErrorKind::kValue);
}

Value Pad() {
  return Value::Error(ErrorKind::kNotAvailable);
}

// Array argument that must not be an error value.
std::optional<Value> GridArg(CallArgs& args, size_t i, std::shared_ptr<const Array>* out) {
  Value v = args.Get(i);
  if (v.IsError()) return v;
  if (v.IsLambda()) return ValueError();
  *out = v.ToArray();
  return std::nullopt;
}

Array Slice(const Array& a, int r0, int r1, int c0, int c1) {
  Array out(r1 - r0, c1 - c0);
  for (int r = r0; r < r1; ++r) {
    for (int c = c0; c < c1; ++c) out.at(r - r0, c - c0) = a.at(r, c);
  }
  return out;
}

Value Sequence(CallArgs& args) {
  double rows = 0.0;
  double cols = 1.0;
  double start = 1.0;
  double step = 1.0;
  if (auto err = NumberArg(args, 0, &rows)) return *err;
  if (auto err = NumberArgOr(args, 1, 1.0, &cols)) return *err;
  if (auto err = NumberArgOr(args, 2, 1.0, &start)) return *err;
  if (auto err = NumberArgOr(args, 3, 1.0, &step)) return *err;
  rows = std::floor(rows);
  cols = std::floor(cols);
  if (rows < 1 || cols < 1) return ValueError();
  if (rows > 1e9 || cols > 1e9 ||
      !WithinCellLimit(args, static_cast<int64_t>(rows), static_cast<int64_t>(cols))) {
    return Value::Error(ErrorKind::kNumber);
  }
  Array out(static_cast<int>(rows), static_cast<int>(cols));
  for (size_t i = 0; i < out.size(); ++i) {
    out.cells[i] = Scalar::Number(start + step * static_cast<double>(i));
  }
  return GridResult(std::move(out));
}

Value RandArray(CallArgs& args) {
  double rows = 1.0;
  double cols = 1.0;
  double lo = 0.0;
  double hi = 1.0;
  bool whole = false;
  if (auto err = NumberArgOr(args, 0, 1.0, &rows)) return *err;
  if (auto err = NumberArgOr(args, 1, 1.0, &cols)) return *err;
  if (auto err = NumberArgOr(args, 2, 0.0, &lo)) return *err;
  if (auto err = NumberArgOr(args, 3, 1.0, &hi)) return *err;
  if (auto err = BoolArgOr(args, 4, false, &whole)) return *err;
  rows = std::floor(rows);
  cols = std::floor(cols);
  if (rows < 1 || cols < 1 || lo > hi) return ValueError();
  if (rows > 1e9 || cols > 1e9 ||
      !WithinCellLimit(args, static_cast<int64_t>(rows), static_cast<int64_t>(cols))) {
    return Value::Error(ErrorKind::kNumber);
  }
  auto& engine = stats::RandomEngine(args.options());
  Array out(static_cast<int>(rows), static_cast<int>(cols));
  if (whole) {
    const auto a = static_cast<int64_t>(std::ceil(lo));
    const auto b = static_cast<int64_t>(std::floor(hi));
    if (a > b) return ValueError();
    std::uniform_int_distribution<int64_t> dist(a, b);
    for (auto& cell : out.cells) cell = Scalar::Number(static_cast<double>(dist(engine)));
  } else {
    std::uniform_real_distribution<double> dist(lo, hi);
    for (auto& cell : out.cells) cell = Scalar::Number(dist(engine));
  }
  return GridResult(std::move(out));
}

Value Transpose(CallArgs& args) {
  std::shared_ptr<const Array> a;
  if (auto err = GridArg(args, 0, &a)) return *err;
  Array out(a->cols, a->rows);
  for (int r = 0; r < a->rows; ++r) {
    for (int c = 0; c < a->cols; ++c) out.at(c, r) = a->at(r, c);
  }
  return GridResult(std::move(out));
}

// Sort order across kinds: numbers, text, logicals, errors, then blanks. Blanks stay last in
// either direction.
int KindRank(const Scalar& s) {
  switch (s.kind) {
    case runtime::ValueKind::kNumber:
      return 0;
    case runtime::ValueKind::kText:
      return 1;
    case runtime::ValueKind::kBoolean:
      return 2;
    case runtime::ValueKind::kError:
      return 3;
    default:
      return 4;
  }
}

bool SortsBefore(const Scalar& a, const Scalar& b, bool descending) {
  const int ra = KindRank(a);
  const int rb = KindRank(b);
  if (ra == 4 || rb == 4) return ra < rb;
  int cmp = ra != rb ? (ra < rb ? -1 : 1) : 0;
  if (cmp == 0 && ra < 3) cmp = runtime::CompareScalars(a, b);
  return descending ? cmp > 0 : cmp < 0;
}

struct SortKey {
  std::vector<Scalar> values;  // one per row (or column) being ordered
  bool descending = false;
};

// Stable order of `count` lines by the keys, first key most significant.
std::vector<int> StableOrder(int count, const std::vector<SortKey>& keys) {
  std::vector<int> order(count);
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [&keys](int x, int y) {
    for (const SortKey& key : keys) {
      if (SortsBefore(key.values[x], key.values[y], key.descending)) return true;
      if (SortsBefore(key.values[y], key.values[x], key.descending)) return false;
    }
    return false;
  });
  return order;
}

// Lines (rows, or columns when `by_col`) of `a` in the given order; lines may repeat.
Array Pick(const Array& a, const std::vector<int>& lines, bool by_col) {
  const int n = static_cast<int>(lines.size());
  Array out(by_col ? a.rows : n, by_col ? n : a.cols);
  for (int i = 0; i < n; ++i) {
    if (by_col) {
      for (int r = 0; r < a.rows; ++r) out.at(r, i) = a.at(r, lines[i]);
    } else {
      for (int c = 0; c < a.cols; ++c) out.at(i, c) = a.at(lines[i], c);
    }
  }
  return out;
}

std::optional<Value> SortOrderArg(CallArgs& args, size_t i, bool* descending) {
  int64_t order = 1;
  if (auto err = IntArgOr(args, i, 1, &order)) return err;
  if (order != 1 && order != -1) return ValueError();
  *descending = order == -1;
  return std::nullopt;
}

/// SORT(array, [sort_index], [sort_order], [by_col]).
Value Sort(CallArgs& args) {
  std::shared_ptr<const Array> a;
  int64_t index = 1;
  bool descending = false;
  bool by_col = false;
  if (auto err = GridArg(args, 0, &a)) return *err;
  if (auto err = IntArgOr(args, 1, 1, &index)) return *err;
  if (auto err = SortOrderArg(args, 2, &descending)) return *err;
  if (auto err = BoolArgOr(args, 3, false, &by_col)) return *err;
  const int lines = by_col ? a->cols : a->rows;
  const int width = by_col ? a->rows : a->cols;
  if (index < 1 || index > width) return ValueError();
  SortKey key;
  key.descending = descending;
  for (int i = 0; i < lines; ++i) {
    const int k = static_cast<int>(index - 1);
    key.values.push_back(by_col ? a->at(k, i) : a->at(i, k));
  }
  return GridResult(Pick(*a, StableOrder(lines, {key}), by_col));
}

/// SORTBY(array, by_array1, [sort_order1], ...). Keys are vectors matching the rows (column
/// vectors) or columns (row vectors) of the array.
Value SortBy(CallArgs& args) {
  std::shared_ptr<const Array> a;
  if (auto err = GridArg(args, 0, &a)) return *err;
  std::vector<SortKey> keys;
  std::optional<bool> by_col;
  for (size_t i = 1; i < args.size(); i += 2) {
    std::shared_ptr<const Array> by;
    if (auto err = GridArg(args, i, &by)) return *err;
    SortKey key;
    if (auto err = SortOrderArg(args, i + 1, &key.descending)) return *err;
    bool columns = false;
    if (by->cols == 1 && by->rows == a->rows) {
      columns = false;
    } else if (by->rows == 1 && by->cols == a->cols) {
      columns = true;
    } else {
      return ValueError();
    }
    if (by_col && *by_col != columns) return ValueError();
    by_col = columns;
    key.values = by->cells;
    keys.push_back(std::move(key));
  }
  const int lines = *by_col ? a->cols : a->rows;
  return GridResult(Pick(*a, StableOrder(lines, keys), *by_col));
}

bool SameLine(const Array& a, int x, int y, bool by_col) {
  const int width = by_col ? a.rows : a.cols;
  for (int k = 0; k < width; ++k) {
    const Scalar& p = by_col ? a.at(k, x) : a.at(x, k);
    const Scalar& q = by_col ? a.at(k, y) : a.at(y, k);
    if (p.kind != q.kind) return false;
    if (p.IsError()) {
      if (p.error != q.error) return false;
    } else if (!p.IsEmpty() && runtime::CompareScalars(p, q) != 0) {
      return false;
    }
  }
  return true;
}

/// UNIQUE(array, [by_col], [exactly_once]).
Value Unique(CallArgs& args) {
  std::shared_ptr<const Array> a;
  bool by_col = false;
  bool exactly_once = false;
  if (auto err = GridArg(args, 0, &a)) return *err;
  if (auto err = BoolArgOr(args, 1, false, &by_col)) return *err;
  if (auto err = BoolArgOr(args, 2, false, &exactly_once)) return *err;
  const int lines = by_col ? a->cols : a->rows;
  std::vector<int> first_of(lines);
  std::vector<int> count(lines, 0);
  for (int i = 0; i < lines; ++i) {
    first_of[i] = i;
    for (int j = 0; j < i; ++j) {
      if (first_of[j] == j && SameLine(*a, i, j, by_col)) {
        first_of[i] = j;
        break;
      }
    }
    ++count[first_of[i]];
  }
  std::vector<int> keep;
  for (int i = 0; i < lines; ++i) {
    if (first_of[i] == i && (!exactly_once || count[i] == 1)) keep.push_back(i);
  }
  if (keep.empty()) return ValueError();
  return GridResult(Pick(*a, keep, by_col));
}

/// FILTER(array, include, [if_empty]). `include` is a column matching the rows or a row
/// matching the columns; selecting nothing returns `if_empty`, or #VALUE!.
Value Filter(CallArgs& args) {
  std::shared_ptr<const Array> a;
  std::shared_ptr<const Array> include;
  if (auto err = GridArg(args, 0, &a)) return *err;
  if (auto err = GridArg(args, 1, &include)) return *err;
  bool by_col = false;
  if (include->cols == 1 && include->rows == a->rows) {
    by_col = false;
  } else if (include->rows == 1 && include->cols == a->cols) {
    by_col = true;
  } else {
    return ValueError();
  }
  std::vector<int> keep;
  for (int i = 0; i < static_cast<int>(include->size()); ++i) {
    Scalar flag = runtime::ToBoolean(include->cells[i]);
    if (flag.IsError()) return Value::FromScalar(flag);
    if (flag.boolean) keep.push_back(i);
  }
  if (keep.empty()) {
    return args.Has(2) ? args.Get(2) : ValueError();
  }
  return GridResult(Pick(*a, keep, by_col));
}

// Bounds [lo, hi) of the lines TAKE keeps (or DROP keeps after dropping) from `total`.
std::optional<Value> Span(double count, int total, bool take, int* lo, int* hi) {
  const double n = std::floor(count);
  if (take) {
    if (n == 0 || std::fabs(n) > total) return ValueError();
    *lo = n > 0 ? 0 : total + static_cast<int>(n);
    *hi = n > 0 ? static_cast<int>(n) : total;
  } else {
    if (std::fabs(n) >= total) return ValueError();
    *lo = n >= 0 ? static_cast<int>(n) : 0;
    *hi = n >= 0 ? total : total + static_cast<int>(n);
  }
  return std::nullopt;
}

Value TakeDrop(CallArgs& args, bool take) {
  std::shared_ptr<const Array> a;
  if (auto err = GridArg(args, 0, &a)) return *err;
  int r0 = 0;
  int r1 = a->rows;
  int c0 = 0;
  int c1 = a->cols;
  if (args.Has(1)) {
    double rows = 0.0;
    if (auto err = NumberArg(args, 1, &rows)) return *err;
    if (auto err = Span(rows, a->rows, take, &r0, &r1)) return *err;
  }
  if (args.Has(2)) {
    double cols = 0.0;
    if (auto err = NumberArg(args, 2, &cols)) return *err;
    if (auto err = Span(cols, a->cols, take, &c0, &c1)) return *err;
  }
  return GridResult(Slice(*a, r0, r1, c0, c1));
}

Value Take(CallArgs& args) {
  return TakeDrop(args, true);
}

Value Drop(CallArgs& args) {
  return TakeDrop(args, false);
}

// CHOOSEROWS / CHOOSECOLS: 1-based indices, negative counting from the end; index arguments may
// themselves be arrays.
Value ChooseLines(CallArgs& args, bool by_col) {
  std::shared_ptr<const Array> a;
  if (auto err = GridArg(args, 0, &a)) return *err;
  const int total = by_col ? a->cols : a->rows;
  std::vector<int> lines;
  for (size_t i = 1; i < args.size(); ++i) {
    std::vector<double> indices;
    if (auto err = CollectNumbersFrom(args.Get(i), false, &indices)) return *err;
    for (double raw : indices) {
      const double index = std::trunc(raw);
      if (index == 0 || std::fabs(index) > total) return ValueError();
      lines.push_back(index > 0 ? static_cast<int>(index) - 1 : total + static_cast<int>(index));
    }
  }
  if (lines.empty()) return ValueError();
  return GridResult(Pick(*a, lines, by_col));
}

Value ChooseRows(CallArgs& args) {
  return ChooseLines(args, false);
}

Value ChooseCols(CallArgs& args) {
  return ChooseLines(args, true);
}

// VSTACK / HSTACK; shorter inputs are padded with #N/A.
Value Stack(CallArgs& args, bool vertical) {
  std::vector<std::shared_ptr<const Array>> parts;
  int along = 0;
  int across = 0;
  for (size_t i = 0; i < args.size(); ++i) {
    std::shared_ptr<const Array> part;
    if (auto err = GridArg(args, i, &part)) return *err;
    along += vertical ? part->rows : part->cols;
    across = std::max(across, vertical ? part->cols : part->rows);
    parts.push_back(std::move(part));
  }
  if (!WithinCellLimit(args, along, across)) return Value::Error(ErrorKind::kNumber);
  Array out(vertical ? along : across, vertical ? across : along,
            Scalar::Error(ErrorKind::kNotAvailable));
  int offset = 0;
  for (const auto& part : parts) {
    for (int r = 0; r < part->rows; ++r) {
      for (int c = 0; c < part->cols; ++c) {
        if (vertical) {
          out.at(offset + r, c) = part->at(r, c);
        } else {
          out.at(r, offset + c) = part->at(r, c);
        }
      }
    }
    offset += vertical ? part->rows : part->cols;
  }
  return GridResult(std::move(out));
}

Value VStack(CallArgs& args) {
  return Stack(args, true);
}

Value HStack(CallArgs& args) {
  return Stack(args, false);
}

// TOROW / TOCOL: `ignore` 1 skips blanks, 2 skips errors, 3 skips both.
Value Flatten(CallArgs& args, bool to_row) {
  std::shared_ptr<const Array> a;
  int64_t ignore = 0;
  bool by_column = false;
  if (auto err = GridArg(args, 0, &a)) return *err;
  if (auto err = IntArgOr(args, 1, 0, &ignore)) return *err;
  if (auto err = BoolArgOr(args, 2, false, &by_column)) return *err;
  if (ignore < 0 || ignore > 3) return ValueError();
  std::vector<Scalar> cells;
  const int outer = by_column ? a->cols : a->rows;
  const int inner = by_column ? a->rows : a->cols;
  for (int i = 0; i < outer; ++i) {
    for (int j = 0; j < inner; ++j) {
      const Scalar& cell = by_column ? a->at(j, i) : a->at(i, j);
      if ((ignore & 1) && cell.IsEmpty()) continue;
      if ((ignore & 2) && cell.IsError()) continue;
      cells.push_back(cell);
    }
  }
  if (cells.empty()) return ValueError();
  const int n = static_cast<int>(cells.size());
  Array out(to_row ? 1 : n, to_row ? n : 1);
  out.cells = std::move(cells);
  return GridResult(std::move(out));
}

Value ToRow(CallArgs& args) {
  return Flatten(args, true);
}

Value ToCol(CallArgs& args) {
  return Flatten(args, false);
}

// WRAPROWS / WRAPCOLS: folds a vector into lines of `wrap_count`, padding the last one.
Value Wrap(CallArgs& args, bool rows) {
  std::shared_ptr<const Array> v;
  double count = 0.0;
  if (auto err = GridArg(args, 0, &v)) return *err;
  if (auto err = NumberArg(args, 1, &count)) return *err;
  count = std::floor(count);
  if ((v->rows != 1 && v->cols != 1) || count < 1) return ValueError();
  const Scalar pad = args.Has(2) ? ScalarArg(args, 2) : Pad().ToScalar();
  const int width = static_cast<int>(std::min<double>(count, static_cast<double>(v->size())));
  const int lines = static_cast<int>((v->size() + width - 1) / width);
  Array out(rows ? lines : width, rows ? width : lines, pad);
  for (size_t i = 0; i < v->size(); ++i) {
    const int line = static_cast<int>(i) / width;
    const int pos = static_cast<int>(i) % width;
    if (rows) {
      out.at(line, pos) = v->cells[i];
    } else {
      out.at(pos, line) = v->cells[i];
    }
  }
  return GridResult(std::move(out));
}

Value WrapRows(CallArgs& args) {
  return Wrap(args, true);
}

Value WrapCols(CallArgs& args) {
  return Wrap(args, false);
}

/// EXPAND(array, rows, [columns], [pad_with]).
Value Expand(CallArgs& args) {
  std::shared_ptr<const Array> a;
  if (auto err = GridArg(args, 0, &a)) return *err;
  double rows = a->rows;
  double cols = a->cols;
  if (args.Has(1)) {
    if (auto err = NumberArg(args, 1, &rows)) return *err;
  }
  if (args.Has(2)) {
    if (auto err = NumberArg(args, 2, &cols)) return *err;
  }
  rows = std::floor(rows);
  cols = std::floor(cols);
  if (rows < a->rows || cols < a->cols) return ValueError();
  if (rows > 1e9 || cols > 1e9 ||
      !WithinCellLimit(args, static_cast<int64_t>(rows), static_cast<int64_t>(cols))) {
    return Value::Error(ErrorKind::kNumber);
  }
  const Scalar pad = args.Has(3) ? ScalarArg(args, 3) : Pad().ToScalar();
  Array out(static_cast<int>(rows), static_cast<int>(cols), pad);
  for (int r = 0; r < a->rows; ++r) {
    for (int c = 0; c < a->cols; ++c) out.at(r, c) = a->at(r, c);
  }
  return GridResult(std::move(out));
}

Value MUnit(CallArgs& args) {
  double n = 0.0;
  if (auto err = NumberArg(args, 0, &n)) return *err;
  n = std::trunc(n);
  if (n < 1) return ValueError();
  if (n > 1e9 || !WithinCellLimit(args, static_cast<int64_t>(n), static_cast<int64_t>(n))) {
    return Value::Error(ErrorKind::kNumber);
  }
  const int size = static_cast<int>(n);
  Array out(size, size, Scalar::Number(0));
  for (int i = 0; i < size; ++i) out.at(i, i) = Scalar::Number(1);
  return GridResult(std::move(out));
}

}  // namespace

void RegisterArrayFunctions(FunctionRegistry* registry) {
  registry->Add(FunctionId::kSequence, "SEQUENCE", kCat, 1, 4, Sequence,
                "SEQUENCE(rows, [columns], [start], [step])", "Grid of sequential numbers.");
  registry->Add(FunctionId::kRandArray, "RANDARRAY", kCat, 0, 5, RandArray,
                "RANDARRAY([rows], [columns], [min], [max], [whole_number])",
                "Grid of random numbers.", kVolatile);
  registry->Add(FunctionId::kTranspose, "TRANSPOSE", kCat, 1, 1, Transpose, "TRANSPOSE(array)",
                "Swaps rows and columns.");
  registry->Add(FunctionId::kSort, "SORT", kCat, 1, 4, Sort,
                "SORT(array, [sort_index], [sort_order], [by_col])",
                "Stable sort of rows or columns.");
  registry->Add(FunctionId::kSortBy, "SORTBY", kCat, 2, kVariadic, SortBy,
                "SORTBY(array, by_array1, [sort_order1], ...)",
                "Stable sort by one or more key vectors.");
  registry->Add(FunctionId::kUnique, "UNIQUE", kCat, 1, 3, Unique,
                "UNIQUE(array, [by_col], [exactly_once])", "Distinct rows or columns.");
  registry->Add(FunctionId::kFilter, "FILTER", kCat, 2, 3, Filter,
                "FILTER(array, include, [if_empty])", "Rows or columns whose flag is TRUE.");
  registry->Add(FunctionId::kTake, "TAKE", kCat, 2, 3, Take, "TAKE(array, rows, [columns])",
                "First or last rows and columns.");
  registry->Add(FunctionId::kDrop, "DROP", kCat, 2, 3, Drop, "DROP(array, rows, [columns])",
                "Removes first or last rows and columns.");
  registry->Add(FunctionId::kChooseRows, "CHOOSEROWS", kCat, 2, kVariadic, ChooseRows,
                "CHOOSEROWS(array, row_num1, [row_num2], ...)", "Selected rows of an array.");
  registry->Add(FunctionId::kChooseCols, "CHOOSECOLS", kCat, 2, kVariadic, ChooseCols,
                "CHOOSECOLS(array, col_num1, [col_num2], ...)",
                "Selected columns of an array.");
  registry->Add(FunctionId::kVStack, "VSTACK", kCat, 1, kVariadic, VStack,
                "VSTACK(array1, [array2], ...)", "Appends arrays vertically.");
  registry->Add(FunctionId::kHStack, "HSTACK", kCat, 1, kVariadic, HStack,
                "HSTACK(array1, [array2], ...)", "Appends arrays horizontally.");
  registry->Add(FunctionId::kToRow, "TOROW", kCat, 1, 3, ToRow,
                "TOROW(array, [ignore], [scan_by_column])", "Flattens an array into one row.");
  registry->Add(FunctionId::kToCol, "TOCOL", kCat, 1, 3, ToCol,
                "TOCOL(array, [ignore], [scan_by_column])",
                "Flattens an array into one column.");
  registry->Add(FunctionId::kWrapRows, "WRAPROWS", kCat, 2, 3, WrapRows,
                "WRAPROWS(vector, wrap_count, [pad_with])", "Folds a vector into rows.");
  registry->Add(FunctionId::kWrapCols, "WRAPCOLS", kCat, 2, 3, WrapCols,
                "WRAPCOLS(vector, wrap_count, [pad_with])", "Folds a vector into columns.");
  registry->Add(FunctionId::kExpand, "EXPAND", kCat, 2, 4, Expand,
                "EXPAND(array, rows, [columns], [pad_with])", "Pads an array to a size.");
  registry->Add(FunctionId::kMUnit, "MUNIT", kCat, 1, 1, MUnit, "MUNIT(dimension)",
                "Identity matrix.");
}

}  // namespace cellforge::builtin
