#include "runtime/address.h"

#include <algorithm>
#include <cctype>

namespace cellforge::runtime {

namespace {
constexpr int kMaxRows = 1048576;
constexpr int kMaxCols = 16384;
}  // namespace

Range Range::Normalized() const {
  Range out;
  out.start.row = std::min(start.row, end.row);
  out.start.col = std::min(start.col, end.col);
  out.end.row = std::max(start.row, end.row);
  out.end.col = std::max(start.col, end.col);
  return out;
}

int Range::rows() const {
  Range n = Normalized();
  return n.end.row - n.start.row + 1;
}

int Range::cols() const {
  Range n = Normalized();
  return n.end.col - n.start.col + 1;
}

std::string ColumnLabel(int col) {
  std::string label;
  int n = col + 1;
  while (n > 0) {
    int rem = (n - 1) % 26;
    label.insert(label.begin(), static_cast<char>('A' + rem));
    n = (n - 1) / 26;
  }
  return label;
}

std::optional<int> ParseColumnLabel(std::string_view label) {
  if (label.empty() || label.size() > 3) {
    return std::nullopt;
  }
  int value = 0;
  for (char ch : label) {
    if (!std::isalpha(static_cast<unsigned char>(ch))) {
      return std::nullopt;
    }
    value = value * 26 + (std::toupper(static_cast<unsigned char>(ch)) - 'A' + 1);
  }
  if (value > kMaxCols) {
    return std::nullopt;
  }
  return value - 1;
}

std::optional<Address> ParseA1(std::string_view text) {
  size_t pos = 0;
  if (pos < text.size() && text[pos] == '$') ++pos;
  size_t letters_start = pos;
  while (pos < text.size() && std::isalpha(static_cast<unsigned char>(text[pos]))) ++pos;
  auto col = ParseColumnLabel(text.substr(letters_start, pos - letters_start));
  if (!col) {
    return std::nullopt;
  }
  if (pos < text.size() && text[pos] == '$') ++pos;
  size_t digits_start = pos;
  long row = 0;
  while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
    row = row * 10 + (text[pos] - '0');
    if (row > kMaxRows) {
      return std::nullopt;
    }
    ++pos;
  }
  if (pos == digits_start || pos != text.size() || row < 1) {
    return std::nullopt;
  }
  return Address{static_cast<int>(row - 1), *col};
}

std::string FormatA1(const Address& address) {
  return ColumnLabel(address.col) + std::to_string(address.row + 1);
}

}  // namespace cellforge::runtime
