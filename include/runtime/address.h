#ifndef CELLFORGE_RUNTIME_ADDRESS_H_
#define CELLFORGE_RUNTIME_ADDRESS_H_

#include <optional>
#include <string>
#include <string_view>

namespace cellforge::runtime {

/// Zero-based cell coordinate; A1 is {0, 0}.
struct Address {
  int row = 0;
  int col = 0;

  bool operator==(const Address& other) const { return row == other.row && col == other.col; }
  bool operator!=(const Address& other) const { return !(*this == other); }
};

/// A rectangular block of cells. `start` and `end` may arrive in any order.
struct Range {
  Address start;
  Address end;

  /// Returns the same block with start at the top-left corner and end at the bottom-right.
  Range Normalized() const;
  int rows() const;
  int cols() const;
};

/// Column label for a zero-based column index: 0 -> "A", 26 -> "AA".
std::string ColumnLabel(int col);

/// Inverse of ColumnLabel; nullopt when the text is not one to three letters.
std::optional<int> ParseColumnLabel(std::string_view label);

/// Parses "A1", "$B$10" or "c3" (absolute markers are accepted and ignored).
std::optional<Address> ParseA1(std::string_view text);

std::string FormatA1(const Address& address);

}  // namespace cellforge::runtime

#endif  // CELLFORGE_RUNTIME_ADDRESS_H_
