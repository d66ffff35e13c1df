#include "builtin/wildcard.h"

#include <cctype>
#include <string>
#include <vector>

namespace cellforge::builtin {

namespace {

struct PatternChar {
  char ch;
  bool literal;
};

std::vector<PatternChar> Compile(std::string_view pattern) {
  std::vector<PatternChar> out;
  for (size_t i = 0; i < pattern.size(); ++i) {
    if (pattern[i] == '~' && i + 1 < pattern.size()) {
      out.push_back({pattern[i + 1], true});
      ++i;
      continue;
    }
    out.push_back({pattern[i], pattern[i] != '*' && pattern[i] != '?'});
  }
  return out;
}

bool SameChar(char a, char b) {
  return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
}

// Length of the shortest prefix of `text` matched by `pattern`, or npos. With
// `anchor_end` set the match must consume all of `text`.
size_t MatchPrefix(const std::vector<PatternChar>& pattern, std::string_view text,
                   bool anchor_end) {
  // Dynamic programming over (pattern index, text index).
  const size_t n = pattern.size();
  const size_t m = text.size();
  std::vector<std::vector<char>> dp(n + 1, std::vector<char>(m + 1, 0));
  dp[0][0] = 1;
  for (size_t i = 1; i <= n; ++i) {
    const PatternChar& pc = pattern[i - 1];
    for (size_t j = 0; j <= m; ++j) {
      if (!pc.literal && pc.ch == '*') {
        dp[i][j] = dp[i - 1][j] || (j > 0 && dp[i][j - 1]);
      } else if (j > 0) {
        bool ok = (!pc.literal && pc.ch == '?') || SameChar(pc.ch, text[j - 1]);
        dp[i][j] = ok && dp[i - 1][j - 1];
      }
    }
  }
  if (anchor_end) {
    return dp[n][m] ? m : std::string_view::npos;
  }
  for (size_t j = 0; j <= m; ++j) {
    if (dp[n][j]) return j;
  }
  return std::string_view::npos;
}

}  // namespace

bool HasWildcards(std::string_view pattern) {
  for (size_t i = 0; i < pattern.size(); ++i) {
    if (pattern[i] == '~') {
      ++i;
      continue;
    }
    if (pattern[i] == '*' || pattern[i] == '?') return true;
  }
  return false;
}

bool WildcardMatch(std::string_view pattern, std::string_view text) {
  return MatchPrefix(Compile(pattern), text, true) != std::string_view::npos;
}

size_t WildcardFind(std::string_view pattern, std::string_view text, size_t start) {
  const auto compiled = Compile(pattern);
  for (size_t pos = start; pos <= text.size(); ++pos) {
    if (MatchPrefix(compiled, text.substr(pos), false) != std::string_view::npos) {
      return pos;
    }
  }
  return std::string_view::npos;
}

}  // namespace cellforge::builtin
