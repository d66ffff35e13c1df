#ifndef CELLFORGE_LEXER_TOKEN_H_
#define CELLFORGE_LEXER_TOKEN_H_

#include <string>

namespace cellforge::lexer {

enum class TokenType {
  kEof,
  kNumber,
  kString,
  kIdentifier,
  kCellRef,
  kError,
  kEqual,
  kNotEqual,
  kLess,
  kLessEqual,
  kGreater,
  kGreaterEqual,
  kPlus,
  kMinus,
  kStar,
  kSlash,
  kCaret,
  kAmpersand,
  kPercent,
  kComma,
  kSemicolon,
  kColon,
  kLParen,
  kRParen,
  kLBrace,
  kRBrace,
  kTrue,
  kFalse,
  kInvalid,
};

/// A lexical token with type, original lexeme, and source location.
/// String tokens carry the unescaped contents, without the surrounding quotes.
struct Token {
  TokenType type;
  std::string lexeme;
  int line;
  int column;
};

}  // namespace cellforge::lexer

#endif  // CELLFORGE_LEXER_TOKEN_H_
