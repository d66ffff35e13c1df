#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "builtin/args.h"
#include "builtin/builtins.h"
#include "builtin/date_serial.h"
#include "builtin/number_format.h"
#include "builtin/wildcard.h"
#include "runtime/coerce.h"
#include "util/string.h"

// Text positions count characters, so multi-byte UTF-8 sequences stay whole.

namespace cellforge::builtin {

namespace {

using runtime::CallArgs;
using runtime::ErrorKind;
using runtime::Scalar;
using runtime::Value;

constexpr Category kCat = Category::kText;
constexpr size_t kMaxTextLength = 32767;

Value ValueError() {
  return Value::Error(ErrorKind::kValue);
}

Value TextResult(std::string text) {
  if (text.size() > kMaxTextLength) return ValueError();
  return Value::Text(std::move(text));
}

// Byte offset of each character start, followed by the total size.
std::vector<size_t> CharStarts(std::string_view text) {
  std::vector<size_t> starts;
  for (size_t i = 0; i < text.size(); ++i) {
    if ((static_cast<unsigned char>(text[i]) & 0xC0) != 0x80) starts.push_back(i);
  }
  starts.push_back(text.size());
  return starts;
}

size_t CharCount(std::string_view text) {
  return CharStarts(text).size() - 1;
}

// Characters [first, first + count) by character index, clamped to the text.
std::string Chars(std::string_view text, size_t first, size_t count) {
  const std::vector<size_t> starts = CharStarts(text);
  const size_t total = starts.size() - 1;
  first = std::min(first, total);
  const size_t last = count > total - first ? total : first + count;
  return std::string(text.substr(starts[first], starts[last] - starts[first]));
}

// Character index of a byte offset.
size_t CharIndexOf(std::string_view text, size_t byte) {
  const std::vector<size_t> starts = CharStarts(text);
  return static_cast<size_t>(std::lower_bound(starts.begin(), starts.end(), byte) -
                             starts.begin());
}

std::optional<char32_t> FirstCodePoint(std::string_view text) {
  if (text.empty()) return std::nullopt;
  const auto lead = static_cast<unsigned char>(text[0]);
  int length = 1;
  char32_t cp = lead;
  if (lead >= 0xF0) {
    length = 4;
    cp = lead & 0x07;
  } else if (lead >= 0xE0) {
    length = 3;
    cp = lead & 0x0F;
  } else if (lead >= 0xC0) {
    length = 2;
    cp = lead & 0x1F;
  }
  if (static_cast<int>(text.size()) < length) return std::nullopt;
  for (int i = 1; i < length; ++i) {
    cp = (cp << 6) | (static_cast<unsigned char>(text[i]) & 0x3F);
  }
  return cp;
}

std::string EncodeUtf8(char32_t cp) {
  std::string out;
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
  return out;
}

// Appends the text of every cell of argument `i`; errors stop the walk.
std::optional<Value> AppendCells(CallArgs& args, size_t i, std::vector<std::string>* out) {
  auto cells = ArrayArg(args, i);
  for (const Scalar& cell : cells->cells) {
    Scalar text = runtime::ToText(cell);
    if (text.IsError()) return Value::FromScalar(text);
    out->push_back(text.text);
  }
  return std::nullopt;
}

Value Concatenate(CallArgs& args) {
  std::string out;
  for (size_t i = 0; i < args.size(); ++i) {
    std::string piece;
    if (auto err = TextArg(args, i, &piece)) return *err;
    out += piece;
  }
  return TextResult(std::move(out));
}

Value Concat(CallArgs& args) {
  std::vector<std::string> pieces;
  for (size_t i = 0; i < args.size(); ++i) {
    if (auto err = AppendCells(args, i, &pieces)) return *err;
  }
  std::string out;
  for (const std::string& piece : pieces) out += piece;
  return TextResult(std::move(out));
}

Value TextJoin(CallArgs& args) {
  std::vector<std::string> delimiters;
  bool ignore_empty = false;
  if (auto err = AppendCells(args, 0, &delimiters)) return *err;
  if (auto err = BoolArg(args, 1, &ignore_empty)) return *err;
  std::vector<std::string> pieces;
  for (size_t i = 2; i < args.size(); ++i) {
    if (auto err = AppendCells(args, i, &pieces)) return *err;
  }
  std::string out;
  size_t joined = 0;
  for (const std::string& piece : pieces) {
    if (ignore_empty && piece.empty()) continue;
    if (joined > 0) out += delimiters[(joined - 1) % delimiters.size()];
    out += piece;
    ++joined;
  }
  return TextResult(std::move(out));
}

// Finds the earliest occurrence of any delimiter at or after `from`; returns its byte position
// and sets `length`, or npos.
size_t FindAny(std::string_view text, const std::vector<std::string>& delimiters, size_t from,
               bool ignore_case, size_t* length) {
  std::string haystack(text);
  if (ignore_case) haystack = util::ToLower(haystack);
  size_t best = std::string::npos;
  for (const std::string& d : delimiters) {
    const std::string needle = ignore_case ? util::ToLower(d) : d;
    const size_t pos = haystack.find(needle, from);
    if (pos != std::string::npos && (best == std::string::npos || pos < best ||
                                     (pos == best && needle.size() > *length))) {
      best = pos;
      *length = needle.size();
    }
  }
  return best;
}

std::vector<std::string> SplitOn(std::string_view text, const std::vector<std::string>& delimiters,
                                 bool ignore_case, bool ignore_empty) {
  std::vector<std::string> parts;
  size_t start = 0;
  for (;;) {
    size_t length = 0;
    const size_t pos = FindAny(text, delimiters, start, ignore_case, &length);
    const size_t end = pos == std::string::npos ? text.size() : pos;
    std::string part(text.substr(start, end - start));
    if (!ignore_empty || !part.empty()) parts.push_back(std::move(part));
    if (pos == std::string::npos) break;
    start = pos + length;
  }
  return parts;
}

// Delimiter list from a scalar or array argument; any empty delimiter is #VALUE!.
std::optional<Value> Delimiters(CallArgs& args, size_t i, std::vector<std::string>* out) {
  if (auto err = AppendCells(args, i, out)) return err;
  for (const std::string& d : *out) {
    if (d.empty()) return ValueError();
  }
  return std::nullopt;
}

/// TEXTSPLIT(text, col_delimiter, [row_delimiter], [ignore_empty], [match_mode], [pad_with]).
Value TextSplit(CallArgs& args) {
  std::string text;
  std::vector<std::string> col_delimiters;
  std::vector<std::string> row_delimiters;
  bool ignore_empty = false;
  int64_t match_mode = 0;
  if (auto err = TextArg(args, 0, &text)) return *err;
  if (!args.Has(1) && !args.Has(2)) return ValueError();
  if (args.Has(1)) {
    if (auto err = Delimiters(args, 1, &col_delimiters)) return *err;
  }
  if (args.Has(2)) {
    if (auto err = Delimiters(args, 2, &row_delimiters)) return *err;
  }
  if (auto err = BoolArgOr(args, 3, false, &ignore_empty)) return *err;
  if (auto err = IntArgOr(args, 4, 0, &match_mode)) return *err;
  if (match_mode != 0 && match_mode != 1) return ValueError();
  const Scalar pad = args.Has(5) ? ScalarArg(args, 5) : Scalar::Error(ErrorKind::kNotAvailable);
  const bool ignore_case = match_mode == 1;

  std::vector<std::string> lines = {text};
  if (!row_delimiters.empty()) lines = SplitOn(text, row_delimiters, ignore_case, ignore_empty);
  std::vector<std::vector<std::string>> grid;
  size_t width = 0;
  for (const std::string& line : lines) {
    std::vector<std::string> cells = {line};
    if (!col_delimiters.empty()) cells = SplitOn(line, col_delimiters, ignore_case, ignore_empty);
    width = std::max(width, cells.size());
    grid.push_back(std::move(cells));
  }
  if (grid.empty() || width == 0) return ValueError();
  runtime::Array out(static_cast<int>(grid.size()), static_cast<int>(width), pad);
  for (size_t r = 0; r < grid.size(); ++r) {
    for (size_t c = 0; c < grid[r].size(); ++c) {
      out.at(static_cast<int>(r), static_cast<int>(c)) = Scalar::Text(grid[r][c]);
    }
  }
  return GridResult(std::move(out));
}

// TEXTBEFORE / TEXTAFTER: (text, delimiter, [instance_num], [match_mode], [match_end],
// [if_not_found]).
Value TextAround(CallArgs& args, bool before) {
  std::string text;
  std::vector<std::string> delimiters;
  int64_t instance = 1;
  int64_t match_mode = 0;
  bool match_end = false;
  if (auto err = TextArg(args, 0, &text)) return *err;
  if (auto err = AppendCells(args, 1, &delimiters)) return *err;
  if (auto err = IntArgOr(args, 2, 1, &instance)) return *err;
  if (auto err = IntArgOr(args, 3, 0, &match_mode)) return *err;
  if (auto err = BoolArgOr(args, 4, false, &match_end)) return *err;
  if (instance == 0 || std::llabs(instance) > static_cast<int64_t>(text.size()) + 1 ||
      (match_mode != 0 && match_mode != 1)) {
    return ValueError();
  }
  // Every delimiter occurrence as {position, length}, left to right.
  std::vector<std::pair<size_t, size_t>> hits;
  bool has_empty = false;
  for (const std::string& d : delimiters) has_empty = has_empty || d.empty();
  if (has_empty) {
    hits.emplace_back(instance > 0 ? 0 : text.size(), 0);
  } else {
    size_t from = 0;
    for (;;) {
      size_t length = 0;
      const size_t pos = FindAny(text, delimiters, from, match_mode == 1, &length);
      if (pos == std::string::npos) break;
      hits.emplace_back(pos, length);
      from = pos + length;
    }
    if (match_end) {
      if (instance > 0) {
        hits.emplace_back(text.size(), 0);
      } else {
        hits.insert(hits.begin(), {0, 0});
      }
    }
  }
  const int64_t count = static_cast<int64_t>(hits.size());
  const int64_t index = instance > 0 ? instance - 1 : count + instance;
  if (index < 0 || index >= count) {
    if (args.Has(5)) return args.Get(5);
    return Value::Error(ErrorKind::kNotAvailable);
  }
  const auto& hit = hits[static_cast<size_t>(index)];
  if (before) return Value::Text(text.substr(0, hit.first));
  return Value::Text(text.substr(hit.first + hit.second));
}

Value TextBefore(CallArgs& args) {
  return TextAround(args, true);
}

Value TextAfter(CallArgs& args) {
  return TextAround(args, false);
}

Value Left(CallArgs& args) {
  std::string text;
  int64_t count = 1;
  if (auto err = TextArg(args, 0, &text)) return *err;
  if (auto err = IntArgOr(args, 1, 1, &count)) return *err;
  if (count < 0) return ValueError();
  return Value::Text(Chars(text, 0, static_cast<size_t>(count)));
}

Value Right(CallArgs& args) {
  std::string text;
  int64_t count = 1;
  if (auto err = TextArg(args, 0, &text)) return *err;
  if (auto err = IntArgOr(args, 1, 1, &count)) return *err;
  if (count < 0) return ValueError();
  const size_t total = CharCount(text);
  const size_t take = std::min(total, static_cast<size_t>(count));
  return Value::Text(Chars(text, total - take, take));
}

Value Mid(CallArgs& args) {
  std::string text;
  int64_t start = 0;
  int64_t count = 0;
  if (auto err = TextArg(args, 0, &text)) return *err;
  if (auto err = IntArg(args, 1, &start)) return *err;
  if (auto err = IntArg(args, 2, &count)) return *err;
  if (start < 1 || count < 0) return ValueError();
  return Value::Text(Chars(text, static_cast<size_t>(start - 1), static_cast<size_t>(count)));
}

Value Len(CallArgs& args) {
  std::string text;
  if (auto err = TextArg(args, 0, &text)) return *err;
  return Value::Number(static_cast<double>(CharCount(text)));
}

Value Upper(CallArgs& args) {
  std::string text;
  if (auto err = TextArg(args, 0, &text)) return *err;
  return Value::Text(util::ToUpper(text));
}

Value Lower(CallArgs& args) {
  std::string text;
  if (auto err = TextArg(args, 0, &text)) return *err;
  return Value::Text(util::ToLower(text));
}

Value Proper(CallArgs& args) {
  std::string text;
  if (auto err = TextArg(args, 0, &text)) return *err;
  bool word_start = true;
  for (char& ch : text) {
    const auto byte = static_cast<unsigned char>(ch);
    if (std::isalpha(byte)) {
      ch = static_cast<char>(word_start ? std::toupper(byte) : std::tolower(byte));
      word_start = false;
    } else {
      word_start = byte < 0x80;
    }
  }
  return Value::Text(text);
}

// Strips outer spaces and collapses inner runs to one.
Value Trim(CallArgs& args) {
  std::string text;
  if (auto err = TextArg(args, 0, &text)) return *err;
  std::string out;
  for (char ch : text) {
    if (ch == ' ' && (out.empty() || out.back() == ' ')) continue;
    out.push_back(ch);
  }
  if (!out.empty() && out.back() == ' ') out.pop_back();
  return Value::Text(out);
}

Value Clean(CallArgs& args) {
  std::string text;
  if (auto err = TextArg(args, 0, &text)) return *err;
  text.erase(std::remove_if(text.begin(), text.end(),
                            [](char ch) { return static_cast<unsigned char>(ch) < 32; }),
             text.end());
  return Value::Text(text);
}

/// SUBSTITUTE(text, old_text, new_text, [instance_num]): all occurrences unless an instance is
/// given.
Value Substitute(CallArgs& args) {
  std::string text;
  std::string old_text;
  std::string new_text;
  int64_t instance = 0;
  if (auto err = TextArg(args, 0, &text)) return *err;
  if (auto err = TextArg(args, 1, &old_text)) return *err;
  if (auto err = TextArg(args, 2, &new_text)) return *err;
  if (args.Has(3)) {
    if (auto err = IntArg(args, 3, &instance)) return *err;
    if (instance < 1) return ValueError();
  }
  if (old_text.empty()) return Value::Text(text);
  std::string out;
  size_t from = 0;
  int64_t seen = 0;
  for (size_t pos = text.find(old_text); pos != std::string::npos;
       pos = text.find(old_text, pos + old_text.size())) {
    ++seen;
    if (instance != 0 && seen != instance) continue;
    out += text.substr(from, pos - from) + new_text;
    from = pos + old_text.size();
    if (instance != 0) break;
  }
  out += text.substr(from);
  return TextResult(std::move(out));
}

Value Replace(CallArgs& args) {
  std::string text;
  int64_t start = 0;
  int64_t count = 0;
  std::string replacement;
  if (auto err = TextArg(args, 0, &text)) return *err;
  if (auto err = IntArg(args, 1, &start)) return *err;
  if (auto err = IntArg(args, 2, &count)) return *err;
  if (auto err = TextArg(args, 3, &replacement)) return *err;
  if (start < 1 || count < 0) return ValueError();
  const size_t first = static_cast<size_t>(start - 1);
  const size_t total = CharCount(text);
  const size_t tail = std::min(total, first + static_cast<size_t>(count));
  return TextResult(Chars(text, 0, first) + replacement + Chars(text, tail, total));
}

// FIND / SEARCH: (find_text, within_text, [start_num]); 1-based character position.
Value Locate(CallArgs& args, bool search) {
  std::string needle;
  std::string haystack;
  int64_t start = 1;
  if (auto err = TextArg(args, 0, &needle)) return *err;
  if (auto err = TextArg(args, 1, &haystack)) return *err;
  if (auto err = IntArgOr(args, 2, 1, &start)) return *err;
  const std::vector<size_t> starts = CharStarts(haystack);
  const int64_t total = static_cast<int64_t>(starts.size()) - 1;
  if (start < 1 || start > total + 1) return ValueError();
  const size_t from = starts[static_cast<size_t>(start - 1)];
  if (needle.empty()) return Value::Number(static_cast<double>(start));
  const size_t pos =
      search ? WildcardFind(needle, haystack, from) : haystack.find(needle, from);
  if (pos == std::string::npos) return ValueError();
  return Value::Number(static_cast<double>(CharIndexOf(haystack, pos) + 1));
}

Value Find(CallArgs& args) {
  return Locate(args, false);
}

Value Search(CallArgs& args) {
  return Locate(args, true);
}

Value Exact(CallArgs& args) {
  std::string a;
  std::string b;
  if (auto err = TextArg(args, 0, &a)) return *err;
  if (auto err = TextArg(args, 1, &b)) return *err;
  return Value::Bool(a == b);
}

Value Rept(CallArgs& args) {
  std::string text;
  int64_t times = 0;
  if (auto err = TextArg(args, 0, &text)) return *err;
  if (auto err = IntArg(args, 1, &times)) return *err;
  if (times < 0) return ValueError();
  if (!text.empty() && static_cast<uint64_t>(times) > kMaxTextLength / text.size()) {
    return ValueError();
  }
  std::string out;
  for (int64_t i = 0; i < times; ++i) out += text;
  return Value::Text(out);
}

Value Char(CallArgs& args) {
  int64_t code = 0;
  if (auto err = IntArg(args, 0, &code)) return *err;
  if (code < 1 || code > 255) return ValueError();
  return Value::Text(EncodeUtf8(static_cast<char32_t>(code)));
}

Value Code(CallArgs& args) {
  std::string text;
  if (auto err = TextArg(args, 0, &text)) return *err;
  auto cp = FirstCodePoint(text);
  if (!cp) return ValueError();
  return Value::Number(*cp > 255 ? '?' : static_cast<double>(*cp));
}

Value Unichar(CallArgs& args) {
  int64_t code = 0;
  if (auto err = IntArg(args, 0, &code)) return *err;
  if (code < 1 || code > 0x10FFFF || (code >= 0xD800 && code <= 0xDFFF)) return ValueError();
  return Value::Text(EncodeUtf8(static_cast<char32_t>(code)));
}

Value Unicode(CallArgs& args) {
  std::string text;
  if (auto err = TextArg(args, 0, &text)) return *err;
  auto cp = FirstCodePoint(text);
  if (!cp) return ValueError();
  return Value::Number(static_cast<double>(*cp));
}

/// VALUE(text): numbers, percentages, dates and times written as text.
Value ValueFn(CallArgs& args) {
  Scalar s = ScalarArg(args, 0);
  if (s.IsError()) return Value::FromScalar(s);
  if (s.IsNumber()) return Value::Number(s.number);
  if (!s.IsText()) return ValueError();
  if (auto number = runtime::ParseNumberText(s.text)) return Value::Number(*number);
  if (auto serial = dates::ParseDateText(s.text)) {
    return Value::Number(static_cast<double>(*serial) +
                         dates::ParseTimeText(s.text).value_or(0.0));
  }
  if (auto fraction = dates::ParseTimeText(s.text)) return Value::Number(*fraction);
  return ValueError();
}

Value NumberValue(CallArgs& args) {
  std::string text;
  std::string decimal = ".";
  std::string group = ",";
  if (auto err = TextArg(args, 0, &text)) return *err;
  if (auto err = TextArgOr(args, 1, ".", &decimal)) return *err;
  if (auto err = TextArgOr(args, 2, ",", &group)) return *err;
  if (decimal.empty()) return ValueError();
  const char decimal_char = decimal[0];
  const char group_char = group.empty() ? '\0' : group[0];
  std::string cleaned;
  int percents = 0;
  bool seen_decimal = false;
  for (char ch : text) {
    if (util::IsSpace(ch)) continue;
    if (ch == '%') {
      ++percents;
    } else if (percents > 0) {
      return ValueError();
    } else if (ch == decimal_char) {
      if (seen_decimal) return ValueError();
      seen_decimal = true;
      cleaned.push_back('.');
    } else if (ch == group_char && !seen_decimal) {
      continue;
    } else {
      cleaned.push_back(ch);
    }
  }
  if (cleaned.empty()) return Value::Number(0);
  auto number = runtime::ParseNumberText(cleaned);
  if (!number) return ValueError();
  return Value::Number(*number / std::pow(100.0, percents));
}

/// TEXT(value, format_text).
Value Text(CallArgs& args) {
  Scalar value = ScalarArg(args, 0);
  std::string code;
  if (value.IsError()) return Value::FromScalar(value);
  if (auto err = TextArg(args, 1, &code)) return *err;
  std::optional<double> number;
  if (value.IsNumber()) {
    number = value.number;
  } else if (value.IsBoolean()) {
    return Value::Text(value.boolean ? "TRUE" : "FALSE");
  } else if (value.IsEmpty()) {
    number = 0.0;
  } else {
    number = runtime::ParseNumberText(value.text);
  }
  if (!number) {
    const size_t at = code.find('@');
    if (at == std::string::npos) return Value::Text(value.text);
    return TextResult(code.substr(0, at) + value.text + code.substr(at + 1));
  }
  auto formatted = FormatWithCode(*number, code);
  if (!formatted) return ValueError();
  return TextResult(std::move(*formatted));
}

Value Fixed(CallArgs& args) {
  double number = 0.0;
  int64_t decimals = 2;
  bool no_commas = false;
  if (auto err = NumberArg(args, 0, &number)) return *err;
  if (auto err = IntArgOr(args, 1, 2, &decimals)) return *err;
  if (auto err = BoolArgOr(args, 2, false, &no_commas)) return *err;
  if (decimals > 127) return ValueError();
  return Value::Text(FormatFixed(number, static_cast<int>(std::max<int64_t>(decimals, -308)),
                                 !no_commas));
}

/// DOLLAR(number, [decimals]): "$1,234.57"; negatives in parentheses.
Value Dollar(CallArgs& args) {
  double number = 0.0;
  int64_t decimals = 2;
  if (auto err = NumberArg(args, 0, &number)) return *err;
  if (auto err = IntArgOr(args, 1, 2, &decimals)) return *err;
  if (decimals > 127) return ValueError();
  const std::string digits =
      FormatFixed(std::fabs(number), static_cast<int>(std::max<int64_t>(decimals, -308)), true);
  const bool negative = number < 0 && digits.find_first_not_of("0.,") != std::string::npos;
  return Value::Text(negative ? "($" + digits + ")" : "$" + digits);
}

}  // namespace

void RegisterTextFunctions(FunctionRegistry* registry) {
  constexpr unsigned kEw = kElementwise;
  registry->Add(FunctionId::kConcatenate, "CONCATENATE", kCat, 1, kVariadic, Concatenate,
                "CONCATENATE(text1, [text2], ...)", "Joins text items.", kEw);
  registry->Add(FunctionId::kConcat, "CONCAT", kCat, 1, kVariadic, Concat,
                "CONCAT(text1, [text2], ...)", "Joins every cell of the arguments.");
  registry->Add(FunctionId::kTextJoin, "TEXTJOIN", kCat, 3, kVariadic, TextJoin,
                "TEXTJOIN(delimiter, ignore_empty, text1, [text2], ...)",
                "Joins cells with a delimiter.");
  registry->Add(FunctionId::kTextSplit, "TEXTSPLIT", kCat, 2, 6, TextSplit,
                "TEXTSPLIT(text, col_delimiter, [row_delimiter], [ignore_empty], [match_mode], "
                "[pad_with])",
                "Splits text into a grid.");
  registry->Add(FunctionId::kTextBefore, "TEXTBEFORE", kCat, 2, 6, TextBefore,
                "TEXTBEFORE(text, delimiter, [instance_num], [match_mode], [match_end], "
                "[if_not_found])",
                "Text before a delimiter.");
  registry->Add(FunctionId::kTextAfter, "TEXTAFTER", kCat, 2, 6, TextAfter,
                "TEXTAFTER(text, delimiter, [instance_num], [match_mode], [match_end], "
                "[if_not_found])",
                "Text after a delimiter.");
  registry->Add(FunctionId::kLeft, "LEFT", kCat, 1, 2, Left, "LEFT(text, [num_chars])",
                "Leading characters.", kEw);
  registry->Add(FunctionId::kRight, "RIGHT", kCat, 1, 2, Right, "RIGHT(text, [num_chars])",
                "Trailing characters.", kEw);
  registry->Add(FunctionId::kMid, "MID", kCat, 3, 3, Mid, "MID(text, start_num, num_chars)",
                "Characters from the middle of text.", kEw);
  registry->Add(FunctionId::kLen, "LEN", kCat, 1, 1, Len, "LEN(text)", "Number of characters.",
                kEw);
  registry->Add(FunctionId::kUpper, "UPPER", kCat, 1, 1, Upper, "UPPER(text)",
                "Converts to upper case.", kEw);
  registry->Add(FunctionId::kLower, "LOWER", kCat, 1, 1, Lower, "LOWER(text)",
                "Converts to lower case.", kEw);
  registry->Add(FunctionId::kProper, "PROPER", kCat, 1, 1, Proper, "PROPER(text)",
                "Capitalizes each word.", kEw);
  registry->Add(FunctionId::kTrim, "TRIM", kCat, 1, 1, Trim, "TRIM(text)",
                "Removes extra spaces.", kEw);
  registry->Add(FunctionId::kClean, "CLEAN", kCat, 1, 1, Clean, "CLEAN(text)",
                "Removes control characters.", kEw);
  registry->Add(FunctionId::kSubstitute, "SUBSTITUTE", kCat, 3, 4, Substitute,
                "SUBSTITUTE(text, old_text, new_text, [instance_num])",
                "Replaces occurrences of text.", kEw);
  registry->Add(FunctionId::kReplace, "REPLACE", kCat, 4, 4, Replace,
                "REPLACE(old_text, start_num, num_chars, new_text)",
                "Replaces characters by position.", kEw);
  registry->Add(FunctionId::kFind, "FIND", kCat, 2, 3, Find,
                "FIND(find_text, within_text, [start_num])", "Case-sensitive position of text.",
                kEw);
  registry->Add(FunctionId::kSearch, "SEARCH", kCat, 2, 3, Search,
                "SEARCH(find_text, within_text, [start_num])",
                "Case-insensitive position of text; wildcards allowed.", kEw);
  registry->Add(FunctionId::kExact, "EXACT", kCat, 2, 2, Exact, "EXACT(text1, text2)",
                "Case-sensitive equality.", kEw);
  registry->Add(FunctionId::kRept, "REPT", kCat, 2, 2, Rept, "REPT(text, number_times)",
                "Repeats text.", kEw);
  registry->Add(FunctionId::kChar, "CHAR", kCat, 1, 1, Char, "CHAR(number)",
                "Character for a code 1-255.", kEw);
  registry->Add(FunctionId::kCode, "CODE", kCat, 1, 1, Code, "CODE(text)",
                "Code of the first character.", kEw);
  registry->Add(FunctionId::kUnichar, "UNICHAR", kCat, 1, 1, Unichar, "UNICHAR(number)",
                "Character for a Unicode code point.", kEw);
  registry->Add(FunctionId::kUnicode, "UNICODE", kCat, 1, 1, Unicode, "UNICODE(text)",
                "Code point of the first character.", kEw);
  registry->Add(FunctionId::kValue, "VALUE", kCat, 1, 1, ValueFn, "VALUE(text)",
                "Converts text to a number.", kEw);
  registry->Add(FunctionId::kNumberValue, "NUMBERVALUE", kCat, 1, 3, NumberValue,
                "NUMBERVALUE(text, [decimal_separator], [group_separator])",
                "Converts text to a number with given separators.", kEw);
  registry->Add(FunctionId::kText, "TEXT", kCat, 2, 2, Text, "TEXT(value, format_text)",
                "Formats a value with a format code.", kEw);
  registry->Add(FunctionId::kFixed, "FIXED", kCat, 1, 3, Fixed,
                "FIXED(number, [decimals], [no_commas])", "Formats a number with fixed decimals.",
                kEw);
  registry->Add(FunctionId::kDollar, "DOLLAR", kCat, 1, 2, Dollar, "DOLLAR(number, [decimals])",
                "Formats a number as currency.", kEw);
}

}  // namespace cellforge::builtin
