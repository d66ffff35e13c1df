#ifndef CELLFORGE_LEXER_LEXER_H_
#define CELLFORGE_LEXER_LEXER_H_

#include <string>
#include <vector>

#include "lexer/token.h"
#include "util/error.h"

namespace cellforge::lexer {

class Lexer {
 public:
  /// Initializes a lexer over the provided formula text.
  explicit Lexer(const std::string& source);

  /// Returns the next token, throwing util::Error on malformed input.
  Token NextToken();

  /// Lexes the whole input, ending with a kEof token.
  std::vector<Token> Tokenize();

 private:
  char Peek() const;
  char PeekAt(size_t offset) const;
  char Advance();
  bool IsAtEnd() const;
  void SkipWhitespace();
  /// First non-whitespace character at or after the cursor, '\0' at end of input.
  char PeekPastWhitespace() const;
  Token NumberToken();
  Token IdentifierToken();
  Token StringToken();
  Token ErrorToken();

  std::string source_;
  size_t index_;
  int line_;
  int column_;
};

}  // namespace cellforge::lexer

#endif  // CELLFORGE_LEXER_LEXER_H_
