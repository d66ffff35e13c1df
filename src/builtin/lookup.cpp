#include <cctype>
#include <cmath>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "builtin/args.h"
#include "builtin/builtins.h"
#include "builtin/wildcard.h"
#include "runtime/address.h"
#include "runtime/coerce.h"
#include "runtime/worksheet.h"

namespace cellforge::builtin {

namespace {

using runtime::Array;
using runtime::CallArgs;
using runtime::ErrorKind;
using runtime::Scalar;
using runtime::Value;

constexpr Category kCat = Category::kLookup;

enum class MatchMode { kExact = 0, kNextSmaller = -1, kNextLarger = 1, kWildcard = 2 };
enum class SearchMode {
  kForward = 1,
  kBackward = -1,
  kBinaryAscending = 2,
  kBinaryDescending = -2,
};

Value NotFound() {
  return Value::Error(ErrorKind::kNotAvailable);
}

// Lookups compare numbers with numbers, text with text and logicals with logicals.
bool Comparable(const Scalar& a, const Scalar& b) {
  return a.kind == b.kind && (a.IsNumber() || a.IsText() || a.IsBoolean());
}

bool KeyEquals(const Scalar& cell, const Scalar& key, bool wildcards) {
  if (wildcards && key.IsText() && cell.IsText()) {
    return WildcardMatch(key.text, cell.text);
  }
  return Comparable(cell, key) && runtime::CompareScalars(cell, key) == 0;
}

// Approximate scan used by VLOOKUP, HLOOKUP, LOOKUP and MATCH type 1: the last position whose
// key is <= the search key, stopping at the first greater key.
std::optional<size_t> ScanNotGreater(const std::vector<Scalar>& keys, const Scalar& key) {
  std::optional<size_t> found;
  for (size_t i = 0; i < keys.size(); ++i) {
    if (!Comparable(keys[i], key)) continue;
    if (runtime::CompareScalars(keys[i], key) > 0) break;
    found = i;
  }
  return found;
}

// MATCH type -1 on descending data: the last position whose key is >= the search key.
std::optional<size_t> ScanNotLess(const std::vector<Scalar>& keys, const Scalar& key) {
  std::optional<size_t> found;
  for (size_t i = 0; i < keys.size(); ++i) {
    if (!Comparable(keys[i], key)) continue;
    if (runtime::CompareScalars(keys[i], key) < 0) break;
    found = i;
  }
  return found;
}

std::optional<size_t> FindExact(const std::vector<Scalar>& keys, const Scalar& key,
                                bool wildcards) {
  for (size_t i = 0; i < keys.size(); ++i) {
    if (KeyEquals(keys[i], key, wildcards)) return i;
  }
  return std::nullopt;
}

std::optional<size_t> LinearSearch(const std::vector<Scalar>& keys, const Scalar& key,
                                   MatchMode match, bool backward) {
  std::optional<size_t> best;
  const size_t n = keys.size();
  for (size_t step = 0; step < n; ++step) {
    const size_t i = backward ? n - 1 - step : step;
    const Scalar& cell = keys[i];
    if (KeyEquals(cell, key, match == MatchMode::kWildcard)) return i;
    if (match == MatchMode::kExact || match == MatchMode::kWildcard) continue;
    if (!Comparable(cell, key)) continue;
    const int cmp = runtime::CompareScalars(cell, key);
    const bool candidate = match == MatchMode::kNextSmaller ? cmp < 0 : cmp > 0;
    if (!candidate) continue;
    if (!best) {
      best = i;
      continue;
    }
    const int vs_best = runtime::CompareScalars(cell, keys[*best]);
    if (match == MatchMode::kNextSmaller ? vs_best > 0 : vs_best < 0) best = i;
  }
  return best;
}

// Binary search over data the caller asserts is sorted.
std::optional<size_t> BinarySearch(const std::vector<Scalar>& keys, const Scalar& key,
                                   MatchMode match, bool descending) {
  size_t lo = 0;
  size_t hi = keys.size();
  std::optional<size_t> smaller;
  std::optional<size_t> larger;
  while (lo < hi) {
    const size_t mid = lo + (hi - lo) / 2;
    int cmp = Comparable(keys[mid], key) ? runtime::CompareScalars(keys[mid], key)
                                         : (keys[mid].kind < key.kind ? -1 : 1);
    if (cmp == 0) return mid;
    if (cmp < 0) smaller = mid;
    if (cmp > 0) larger = mid;
    if (descending) cmp = -cmp;
    if (cmp < 0) {
      lo = mid + 1;
    } else {
      hi = mid;
    }
  }
  if (match == MatchMode::kNextSmaller) return smaller;
  if (match == MatchMode::kNextLarger) return larger;
  return std::nullopt;
}

std::optional<size_t> Locate(const std::vector<Scalar>& keys, const Scalar& key, MatchMode match,
                             SearchMode search) {
  switch (search) {
    case SearchMode::kBinaryAscending:
      return BinarySearch(keys, key, match, false);
    case SearchMode::kBinaryDescending:
      return BinarySearch(keys, key, match, true);
    case SearchMode::kBackward:
      return LinearSearch(keys, key, match, true);
    case SearchMode::kForward:
      break;
  }
  return LinearSearch(keys, key, match, false);
}

std::optional<Value> ReadModes(CallArgs& args, size_t first, MatchMode* match,
                               SearchMode* search) {
  int64_t m = 0;
  int64_t s = 1;
  if (auto err = IntArgOr(args, first, 0, &m)) return err;
  if (auto err = IntArgOr(args, first + 1, 1, &s)) return err;
  if (m < -1 || m > 2 || (s != 1 && s != -1 && s != 2 && s != -2)) {
    return Value::Error(ErrorKind::kValue);
  }
  *match = static_cast<MatchMode>(m);
  *search = static_cast<SearchMode>(s);
  return std::nullopt;
}

bool IsVector(const Array& a) {
  return a.rows == 1 || a.cols == 1;
}

Value XLookup(CallArgs& args) {
  Scalar key = ScalarArg(args, 0);
  if (key.IsError()) return Value::FromScalar(key);
  Value lookup = args.Get(1);
  if (lookup.IsError()) return lookup;
  Value results = args.Get(2);
  if (results.IsError()) return results;
  MatchMode match = MatchMode::kExact;
  SearchMode search = SearchMode::kForward;
  if (auto err = ReadModes(args, 4, &match, &search)) return *err;
  auto keys = lookup.ToArray();
  auto table = results.ToArray();
  if (!IsVector(*keys)) return Value::Error(ErrorKind::kValue);
  const bool vertical = keys->cols == 1 && keys->rows > 1;
  if ((vertical && table->rows != keys->rows) || (!vertical && table->cols != keys->cols)) {
    return Value::Error(ErrorKind::kValue);
  }
  auto found = Locate(keys->cells, key, match, search);
  if (!found) {
    return args.Has(3) ? args.Get(3) : NotFound();
  }
  const int at = static_cast<int>(*found);
  if (vertical) {
    Array row(1, table->cols);
    for (int c = 0; c < table->cols; ++c) row.at(0, c) = table->at(at, c);
    if (row.size() == 1) return Value::FromScalar(row.cells[0]);
    return Value::FromArray(std::move(row));
  }
  Array col(table->rows, 1);
  for (int r = 0; r < table->rows; ++r) col.at(r, 0) = table->at(r, at);
  if (col.size() == 1) return Value::FromScalar(col.cells[0]);
  return Value::FromArray(std::move(col));
}

Value XMatch(CallArgs& args) {
  Scalar key = ScalarArg(args, 0);
  if (key.IsError()) return Value::FromScalar(key);
  Value lookup = args.Get(1);
  if (lookup.IsError()) return lookup;
  MatchMode match = MatchMode::kExact;
  SearchMode search = SearchMode::kForward;
  if (auto err = ReadModes(args, 2, &match, &search)) return *err;
  auto keys = lookup.ToArray();
  if (!IsVector(*keys)) return Value::Error(ErrorKind::kValue);
  auto found = Locate(keys->cells, key, match, search);
  if (!found) return NotFound();
  return Value::Number(static_cast<double>(*found + 1));
}

// VLOOKUP / HLOOKUP share everything but the orientation.
Value TableLookup(CallArgs& args, bool vertical) {
  Scalar key = ScalarArg(args, 0);
  if (key.IsError()) return Value::FromScalar(key);
  Value table_value = args.Get(1);
  if (table_value.IsError()) return table_value;
  int64_t index = 0;
  bool approximate = true;
  if (auto err = IntArg(args, 2, &index)) return *err;
  if (auto err = BoolArgOr(args, 3, true, &approximate)) return *err;
  auto table = table_value.ToArray();
  const int extent = vertical ? table->cols : table->rows;
  if (index < 1) return Value::Error(ErrorKind::kValue);
  if (index > extent) return Value::Error(ErrorKind::kReference);
  const int length = vertical ? table->rows : table->cols;
  std::vector<Scalar> keys;
  keys.reserve(length);
  for (int i = 0; i < length; ++i) {
    keys.push_back(vertical ? table->at(i, 0) : table->at(0, i));
  }
  auto found = approximate ? ScanNotGreater(keys, key) : FindExact(keys, key, true);
  if (!found) return NotFound();
  const int at = static_cast<int>(*found);
  const int pick = static_cast<int>(index - 1);
  return Value::FromScalar(vertical ? table->at(at, pick) : table->at(pick, at));
}

Value VLookup(CallArgs& args) {
  return TableLookup(args, true);
}

Value HLookup(CallArgs& args) {
  return TableLookup(args, false);
}

// Row or column `index` of a grid as a flat list of cells.
std::vector<Scalar> Line(const Array& a, bool row, int index) {
  std::vector<Scalar> out;
  const int n = row ? a.cols : a.rows;
  for (int i = 0; i < n; ++i) out.push_back(row ? a.at(index, i) : a.at(i, index));
  return out;
}

/// LOOKUP(value, lookup_vector, [result_vector]); a 2-D table without a result vector searches
/// its first row (wide tables) or column and returns from the last one.
Value Lookup(CallArgs& args) {
  Scalar key = ScalarArg(args, 0);
  if (key.IsError()) return Value::FromScalar(key);
  Value lookup = args.Get(1);
  if (lookup.IsError()) return lookup;
  auto table = lookup.ToArray();
  std::vector<Scalar> keys;
  std::vector<Scalar> results;
  if (args.Has(2)) {
    Value result_value = args.Get(2);
    if (result_value.IsError()) return result_value;
    keys = table->cells;
    results = result_value.ToArray()->cells;
  } else if (IsVector(*table)) {
    keys = table->cells;
    results = table->cells;
  } else {
    const bool wide = table->cols > table->rows;
    keys = Line(*table, wide, 0);
    results = Line(*table, wide, wide ? table->rows - 1 : table->cols - 1);
  }
  auto found = ScanNotGreater(keys, key);
  if (!found || *found >= results.size()) return NotFound();
  return Value::FromScalar(results[*found]);
}

Value Match(CallArgs& args) {
  Scalar key = ScalarArg(args, 0);
  if (key.IsError()) return Value::FromScalar(key);
  Value lookup = args.Get(1);
  if (lookup.IsError()) return lookup;
  int64_t type = 1;
  if (auto err = IntArgOr(args, 2, 1, &type)) return *err;
  auto keys = lookup.ToArray();
  if (!IsVector(*keys)) return NotFound();
  std::optional<size_t> found;
  if (type == 0) {
    found = FindExact(keys->cells, key, true);
  } else if (type > 0) {
    found = ScanNotGreater(keys->cells, key);
  } else {
    found = ScanNotLess(keys->cells, key);
  }
  if (!found) return NotFound();
  return Value::Number(static_cast<double>(*found + 1));
}

/// INDEX(array, row, [column]); 0 selects a whole column or row.
Value Index(CallArgs& args) {
  Value source = args.Get(0);
  if (source.IsError()) return source;
  auto array = source.ToArray();
  int64_t row = 0;
  int64_t col = 0;
  if (auto err = IntArgOr(args, 1, 0, &row)) return *err;
  if (auto err = IntArgOr(args, 2, 0, &col)) return *err;
  if (!args.Has(2) && array->rows == 1) {
    // A single row indexed by one number selects a column.
    col = row;
    row = 1;
  }
  if (row < 0 || col < 0) return Value::Error(ErrorKind::kValue);
  if (row > array->rows || col > array->cols) return Value::Error(ErrorKind::kReference);
  if (row > 0 && col > 0) {
    return Value::FromScalar(array->at(static_cast<int>(row - 1), static_cast<int>(col - 1)));
  }
  if (row > 0) {
    Array out(1, array->cols);
    for (int c = 0; c < array->cols; ++c) out.at(0, c) = array->at(static_cast<int>(row - 1), c);
    return Value::FromArray(std::move(out));
  }
  if (col > 0) {
    Array out(array->rows, 1);
    for (int r = 0; r < array->rows; ++r) out.at(r, 0) = array->at(r, static_cast<int>(col - 1));
    return Value::FromArray(std::move(out));
  }
  return source.IsArray() ? source : Value::FromScalar(source.ToScalar());
}

Value Choose(CallArgs& args) {
  double index = 0.0;
  if (auto err = NumberArg(args, 0, &index)) return *err;
  index = std::trunc(index);
  if (index < 1 || index > static_cast<double>(args.size() - 1)) {
    return Value::Error(ErrorKind::kValue);
  }
  return args.Get(static_cast<size_t>(index));
}

Value Rows(CallArgs& args) {
  Value v = args.Get(0);
  if (v.IsError()) return v;
  return Value::Number(v.ToArray()->rows);
}

Value Columns(CallArgs& args) {
  Value v = args.Get(0);
  if (v.IsError()) return v;
  return Value::Number(v.ToArray()->cols);
}

// ROW / COLUMN: 1-based position of a reference (or of the current cell). A multi-cell
// reference yields every position, as a column for ROW and a row for COLUMN.
Value Position(CallArgs& args, bool row) {
  runtime::Range range{args.context().current_cell, args.context().current_cell};
  if (args.Has(0)) {
    auto ref = args.Reference(0);
    if (!ref) return Value::Error(ErrorKind::kValue);
    range = ref->Normalized();
  }
  const int first = row ? range.start.row : range.start.col;
  const int count = row ? range.rows() : range.cols();
  if (count == 1) return Value::Number(first + 1);
  Array out(row ? count : 1, row ? 1 : count);
  for (int i = 0; i < count; ++i) out.cells[i] = Scalar::Number(first + 1 + i);
  return Value::FromArray(std::move(out));
}

Value Row(CallArgs& args) {
  return Position(args, true);
}

Value Column(CallArgs& args) {
  return Position(args, false);
}

std::string QuoteSheet(const std::string& sheet) {
  for (char ch : sheet) {
    if (!std::isalnum(static_cast<unsigned char>(ch)) && ch != '_') {
      return "'" + sheet + "'";
    }
  }
  return sheet;
}

/// ADDRESS(row, column, [abs_num], [a1], [sheet_text]).
Value AddressText(CallArgs& args) {
  int64_t row = 0;
  int64_t col = 0;
  int64_t abs_num = 1;
  bool a1 = true;
  std::string sheet;
  if (auto err = IntArg(args, 0, &row)) return *err;
  if (auto err = IntArg(args, 1, &col)) return *err;
  if (auto err = IntArgOr(args, 2, 1, &abs_num)) return *err;
  if (auto err = BoolArgOr(args, 3, true, &a1)) return *err;
  if (auto err = TextArgOr(args, 4, "", &sheet)) return *err;
  if (row < 1 || row > 1048576 || col < 1 || col > 16384 || abs_num < 1 || abs_num > 4) {
    return Value::Error(ErrorKind::kValue);
  }
  const bool abs_row = abs_num == 1 || abs_num == 2;
  const bool abs_col = abs_num == 1 || abs_num == 3;
  std::string text;
  if (a1) {
    text = (abs_col ? "$" : "") + runtime::ColumnLabel(static_cast<int>(col - 1)) +
           (abs_row ? "$" : "") + std::to_string(row);
  } else {
    text = "R" + (abs_row ? std::to_string(row) : "[" + std::to_string(row) + "]") + "C" +
           (abs_col ? std::to_string(col) : "[" + std::to_string(col) + "]");
  }
  if (!sheet.empty()) text = QuoteSheet(sheet) + "!" + text;
  return Value::Text(text);
}

constexpr int kSheetRows = 1048576;
constexpr int kSheetCols = 16384;

bool OnSheet(const runtime::Range& range) {
  return range.start.row >= 0 && range.start.col >= 0 && range.end.row < kSheetRows &&
         range.end.col < kSheetCols;
}

// Cell values of `range` read from the worksheet, or #NUM! past the cell limit. Without a
// worksheet every cell reads as Empty.
Value ReadRange(CallArgs& args, const runtime::Range& range) {
  if (!WithinCellLimit(args, range.rows(), range.cols())) return Value::Error(ErrorKind::kNumber);
  const runtime::Worksheet* sheet = args.context().worksheet;
  Array out(range.rows(), range.cols());
  if (sheet != nullptr) {
    for (int r = 0; r < out.rows; ++r) {
      for (int c = 0; c < out.cols; ++c) {
        runtime::Address address{range.start.row + r, range.start.col + c};
        out.at(r, c) = sheet->GetCellValue(address).ToScalar();
      }
    }
  }
  return GridResult(std::move(out));
}

/// OFFSET(reference, rows, cols, [height], [width]): the block `rows` down and `cols` right of
/// the reference, resized to height x width (default: the reference's own size).
Value Offset(CallArgs& args) {
  auto base = args.Reference(0);
  if (!base) {
    Value v = args.Get(0);
    return v.IsError() ? v : Value::Error(ErrorKind::kValue);
  }
  const runtime::Range from = base->Normalized();
  int64_t rows = 0;
  int64_t cols = 0;
  int64_t height = 0;
  int64_t width = 0;
  if (auto err = IntArg(args, 1, &rows)) return *err;
  if (auto err = IntArg(args, 2, &cols)) return *err;
  if (auto err = IntArgOr(args, 3, from.rows(), &height)) return *err;
  if (auto err = IntArgOr(args, 4, from.cols(), &width)) return *err;
  if (height < 1 || width < 1 || height > kSheetRows || width > kSheetCols ||
      std::llabs(rows) > kSheetRows || std::llabs(cols) > kSheetCols) {
    return Value::Error(ErrorKind::kReference);
  }
  const int top = from.start.row + static_cast<int>(rows);
  const int left = from.start.col + static_cast<int>(cols);
  const runtime::Range target{{top, left},
                              {top + static_cast<int>(height) - 1,
                               left + static_cast<int>(width) - 1}};
  if (!OnSheet(target)) return Value::Error(ErrorKind::kReference);
  return ReadRange(args, target);
}

// One R1C1 coordinate: "5" is absolute (1-based), "[-2]" is relative to `origin` and an empty
// part is `origin` itself.
std::optional<int> R1C1Part(std::string_view* text, int origin) {
  if (!text->empty() && text->front() == '[') {
    const size_t close = text->find(']');
    if (close == std::string_view::npos) return std::nullopt;
    auto offset = runtime::ParseNumberText(std::string(text->substr(1, close - 1)));
    if (!offset || *offset != std::trunc(*offset)) return std::nullopt;
    text->remove_prefix(close + 1);
    return origin + static_cast<int>(*offset);
  }
  size_t digits = 0;
  while (digits < text->size() && std::isdigit(static_cast<unsigned char>((*text)[digits]))) {
    ++digits;
  }
  if (digits == 0) return origin;
  if (digits > 7) return std::nullopt;
  const int index = std::stoi(std::string(text->substr(0, digits)));
  text->remove_prefix(digits);
  if (index < 1) return std::nullopt;
  return index - 1;
}

std::optional<runtime::Address> ParseR1C1(std::string_view text, const runtime::Address& origin) {
  if (text.empty() || std::toupper(static_cast<unsigned char>(text.front())) != 'R') {
    return std::nullopt;
  }
  text.remove_prefix(1);
  auto row = R1C1Part(&text, origin.row);
  if (!row || text.empty() || std::toupper(static_cast<unsigned char>(text.front())) != 'C') {
    return std::nullopt;
  }
  text.remove_prefix(1);
  auto col = R1C1Part(&text, origin.col);
  if (!col || !text.empty()) return std::nullopt;
  return runtime::Address{*row, *col};
}

/// INDIRECT(ref_text, [a1]): the cell or range named by text, in A1 style or, when `a1` is
/// FALSE, R1C1 style relative to the formula's cell.
Value Indirect(CallArgs& args) {
  std::string text;
  bool a1 = true;
  if (auto err = TextArg(args, 0, &text)) return *err;
  if (auto err = BoolArgOr(args, 1, true, &a1)) return *err;
  const runtime::Address origin = args.context().current_cell;
  auto parse = [&](std::string_view part) {
    return a1 ? runtime::ParseA1(part) : ParseR1C1(part, origin);
  };
  const std::string_view view(text);
  const size_t colon = view.find(':');
  auto start = parse(view.substr(0, colon));
  auto end = colon == std::string_view::npos ? start : parse(view.substr(colon + 1));
  if (!start || !end) return Value::Error(ErrorKind::kReference);
  const runtime::Range range = runtime::Range{*start, *end}.Normalized();
  if (!OnSheet(range)) return Value::Error(ErrorKind::kReference);
  return ReadRange(args, range);
}

}  // namespace

void RegisterLookupFunctions(FunctionRegistry* registry) {
  registry->Add(FunctionId::kXLookup, "XLOOKUP", kCat, 3, 6, XLookup,
                "XLOOKUP(lookup_value, lookup_array, return_array, [if_not_found], "
                "[match_mode], [search_mode])",
                "Searches a vector and returns the matching item of another.");
  registry->Add(FunctionId::kXMatch, "XMATCH", kCat, 2, 4, XMatch,
                "XMATCH(lookup_value, lookup_array, [match_mode], [search_mode])",
                "Position of a value in a vector.");
  registry->Add(FunctionId::kVLookup, "VLOOKUP", kCat, 3, 4, VLookup,
                "VLOOKUP(lookup_value, table_array, col_index_num, [range_lookup])",
                "Searches the first column of a table and returns a cell from the found row.");
  registry->Add(FunctionId::kHLookup, "HLOOKUP", kCat, 3, 4, HLookup,
                "HLOOKUP(lookup_value, table_array, row_index_num, [range_lookup])",
                "Searches the first row of a table and returns a cell from the found column.");
  registry->Add(FunctionId::kLookup, "LOOKUP", kCat, 2, 3, Lookup,
                "LOOKUP(lookup_value, lookup_vector, [result_vector])",
                "Approximate lookup in a sorted vector.");
  registry->Add(FunctionId::kMatch, "MATCH", kCat, 2, 3, Match,
                "MATCH(lookup_value, lookup_array, [match_type])",
                "Relative position of a value in a vector.");
  registry->Add(FunctionId::kIndex, "INDEX", kCat, 2, 3, Index,
                "INDEX(array, row_num, [column_num])", "Cell, row or column of an array.");
  registry->Add(FunctionId::kChoose, "CHOOSE", kCat, 2, kVariadic, Choose,
                "CHOOSE(index_num, value1, [value2], ...)", "Picks a value by position.", kLazy);
  registry->Add(FunctionId::kRows, "ROWS", kCat, 1, 1, Rows, "ROWS(array)",
                "Number of rows in an array or reference.");
  registry->Add(FunctionId::kColumns, "COLUMNS", kCat, 1, 1, Columns, "COLUMNS(array)",
                "Number of columns in an array or reference.");
  registry->Add(FunctionId::kRow, "ROW", kCat, 0, 1, Row, "ROW([reference])",
                "Row number of a reference.");
  registry->Add(FunctionId::kColumn, "COLUMN", kCat, 0, 1, Column, "COLUMN([reference])",
                "Column number of a reference.");
  registry->Add(FunctionId::kAddress, "ADDRESS", kCat, 2, 5, AddressText,
                "ADDRESS(row_num, column_num, [abs_num], [a1], [sheet_text])",
                "Cell address as text.");
  registry->Add(FunctionId::kOffset, "OFFSET", kCat, 3, 5, Offset,
                "OFFSET(reference, rows, cols, [height], [width])",
                "Values of a block shifted and resized from a reference.", kLazy | kVolatile);
  registry->Add(FunctionId::kIndirect, "INDIRECT", kCat, 1, 2, Indirect,
                "INDIRECT(ref_text, [a1])", "Values of the cell or range named by text.",
                kVolatile);
}

}  // namespace cellforge::builtin
