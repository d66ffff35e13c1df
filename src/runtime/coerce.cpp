#include "runtime/coerce.h"

#include <cctype>
#include <cstdlib>
#include <string>

#include "util/string.h"

namespace cellforge::runtime {

namespace {

bool IsDigit(char ch) {
  return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

int TypeRank(const Scalar& s) {
  switch (s.kind) {
    case ValueKind::kNumber:
      return 0;
    case ValueKind::kText:
      return 1;
    case ValueKind::kBoolean:
      return 2;
    default:
      return 0;
  }
}

}  // namespace

std::optional<double> ParseNumberText(std::string_view text) {
  std::string trimmed = util::Trim(text);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  bool percent = false;
  if (trimmed.back() == '%') {
    percent = true;
    trimmed.pop_back();
  }
  // Validate the shape: [sign] digits [. digits] [e [sign] digits]
  size_t i = 0;
  if (i < trimmed.size() && (trimmed[i] == '+' || trimmed[i] == '-')) ++i;
  size_t mantissa_digits = 0;
  while (i < trimmed.size() && IsDigit(trimmed[i])) {
    ++i;
    ++mantissa_digits;
  }
  if (i < trimmed.size() && trimmed[i] == '.') {
    ++i;
    while (i < trimmed.size() && IsDigit(trimmed[i])) {
      ++i;
      ++mantissa_digits;
    }
  }
  if (mantissa_digits == 0) {
    return std::nullopt;
  }
  if (i < trimmed.size() && (trimmed[i] == 'e' || trimmed[i] == 'E')) {
    ++i;
    if (i < trimmed.size() && (trimmed[i] == '+' || trimmed[i] == '-')) ++i;
    size_t exponent_digits = 0;
    while (i < trimmed.size() && IsDigit(trimmed[i])) {
      ++i;
      ++exponent_digits;
    }
    if (exponent_digits == 0) {
      return std::nullopt;
    }
  }
  if (i != trimmed.size()) {
    return std::nullopt;
  }
  double value = std::strtod(trimmed.c_str(), nullptr);
  return percent ? value / 100.0 : value;
}

Scalar ToNumber(const Scalar& value) {
  switch (value.kind) {
    case ValueKind::kEmpty:
      return Scalar::Number(0.0);
    case ValueKind::kNumber:
      return value;
    case ValueKind::kBoolean:
      return Scalar::Number(value.boolean ? 1.0 : 0.0);
    case ValueKind::kText: {
      if (util::Trim(value.text).empty()) {
        return Scalar::Number(0.0);
      }
      auto parsed = ParseNumberText(value.text);
      if (!parsed) {
        return Scalar::Error(ErrorKind::kValue);
      }
      return Scalar::Number(*parsed);
    }
    default:
      return value;
  }
}

Scalar ToText(const Scalar& value) {
  switch (value.kind) {
    case ValueKind::kEmpty:
      return Scalar::Text("");
    case ValueKind::kError:
      return value;
    case ValueKind::kText:
      return value;
    default:
      return Scalar::Text(value.ToString());
  }
}

Scalar ToBoolean(const Scalar& value) {
  switch (value.kind) {
    case ValueKind::kEmpty:
      return Scalar::Bool(false);
    case ValueKind::kBoolean:
      return value;
    case ValueKind::kNumber:
      return Scalar::Bool(value.number != 0.0);
    case ValueKind::kText:
      if (util::EqualsIgnoreCase(util::Trim(value.text), "TRUE")) return Scalar::Bool(true);
      if (util::EqualsIgnoreCase(util::Trim(value.text), "FALSE")) return Scalar::Bool(false);
      return Scalar::Error(ErrorKind::kValue);
    default:
      return value;
  }
}

int CompareText(std::string_view a, std::string_view b) {
  const std::string la = util::ToLower(a);
  const std::string lb = util::ToLower(b);
  if (la < lb) return -1;
  if (la > lb) return 1;
  return 0;
}

int CompareScalars(const Scalar& a, const Scalar& b) {
  Scalar left = a;
  Scalar right = b;
  if (left.IsEmpty() && right.IsEmpty()) {
    return 0;
  }
  if (left.IsEmpty()) {
    left = right.IsText() ? Scalar::Text("") : right.IsBoolean() ? Scalar::Bool(false)
                                                                   : Scalar::Number(0.0);
  }
  if (right.IsEmpty()) {
    right = left.IsText() ? Scalar::Text("") : left.IsBoolean() ? Scalar::Bool(false)
                                                                 : Scalar::Number(0.0);
  }
  int rank_a = TypeRank(left);
  int rank_b = TypeRank(right);
  if (rank_a != rank_b) {
    return rank_a < rank_b ? -1 : 1;
  }
  switch (left.kind) {
    case ValueKind::kNumber:
      if (left.number < right.number) return -1;
      if (left.number > right.number) return 1;
      return 0;
    case ValueKind::kText:
      return CompareText(left.text, right.text);
    case ValueKind::kBoolean:
      if (left.boolean == right.boolean) return 0;
      return left.boolean ? 1 : -1;
    default:
      return 0;
  }
}

}  // namespace cellforge::runtime
