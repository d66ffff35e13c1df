#ifndef CELLFORGE_BUILTIN_WILDCARD_H_
#define CELLFORGE_BUILTIN_WILDCARD_H_

#include <string_view>

namespace cellforge::builtin {

/// True when `pattern` contains an unescaped `*` or `?`.
bool HasWildcards(std::string_view pattern);

/// Case-insensitive match of the whole `text`: `*` any run, `?` one character, `~` escapes the
/// next character.
bool WildcardMatch(std::string_view pattern, std::string_view text);

/// First position at or after `start` where `pattern` matches a substring of `text`
/// (case-insensitive, wildcards honored). npos when there is none.
size_t WildcardFind(std::string_view pattern, std::string_view text, size_t start);

}  // namespace cellforge::builtin

#endif  // CELLFORGE_BUILTIN_WILDCARD_H_
