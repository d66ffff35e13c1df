#ifndef CELLFORGE_UTIL_STRING_H_
#define CELLFORGE_UTIL_STRING_H_

#include <cctype>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cellforge::util {

inline bool IsSpace(char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
}

inline std::string Trim(std::string_view input) {
  size_t start = 0;
  while (start < input.size() && IsSpace(input[start])) {
    ++start;
  }
  size_t end = input.size();
  while (end > start && IsSpace(input[end - 1])) {
    --end;
  }
  return std::string(input.substr(start, end - start));
}

inline std::vector<std::string> SplitLines(const std::string& input) {
  std::vector<std::string> lines;
  std::string current;
  for (char ch : input) {
    if (ch == '\n') {
      if (!current.empty() && current.back() == '\r') {
        current.pop_back();
      }
      lines.push_back(current);
      current.clear();
      continue;
    }
    current.push_back(ch);
  }
  lines.push_back(current);
  return lines;
}

inline std::string ToUpper(std::string_view input) {
  std::string out(input);
  for (char& ch : out) {
    ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
  }
  return out;
}

inline std::string ToLower(std::string_view input) {
  std::string out(input);
  for (char& ch : out) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  return out;
}

/// ASCII case-insensitive equality.
inline bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

/// Splits on the first run of whitespace: returns {head, rest-trimmed}.
inline std::pair<std::string, std::string> SplitHead(std::string_view input) {
  std::string trimmed = Trim(input);
  size_t pos = 0;
  while (pos < trimmed.size() && !IsSpace(trimmed[pos])) {
    ++pos;
  }
  return {trimmed.substr(0, pos), Trim(std::string_view(trimmed).substr(pos))};
}

}  // namespace cellforge::util

#endif  // CELLFORGE_UTIL_STRING_H_
