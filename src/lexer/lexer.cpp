#include "lexer/lexer.h"

#include <cctype>

#include "runtime/address.h"
#include "runtime/error_kind.h"
#include "util/string.h"

namespace cellforge::lexer {

namespace {

bool IsDigit(char ch) {
  return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

bool IsIdentifierStart(char ch) {
  return std::isalpha(static_cast<unsigned char>(ch)) || ch == '_' || ch == '$';
}

bool IsIdentifierPart(char ch) {
  return std::isalnum(static_cast<unsigned char>(ch)) || ch == '_' || ch == '.' || ch == '$';
}

constexpr const char* kErrorTokens[] = {"#DIV/0!", "#N/A",  "#NAME?", "#NULL!",
                                        "#NUM!",   "#REF!", "#VALUE!"};

}  // namespace

Lexer::Lexer(const std::string& source) : source_(source), index_(0), line_(1), column_(1) {}

char Lexer::Peek() const {
  return PeekAt(0);
}

char Lexer::PeekAt(size_t offset) const {
  if (index_ + offset >= source_.size()) {
    return '\0';
  }
  return source_[index_ + offset];
}

char Lexer::Advance() {
  char ch = Peek();
  ++index_;
  if (ch == '\n') {
    ++line_;
    column_ = 1;
  } else {
    ++column_;
  }
  return ch;
}

bool Lexer::IsAtEnd() const {
  return index_ >= source_.size();
}

void Lexer::SkipWhitespace() {
  while (!IsAtEnd() && util::IsSpace(Peek())) {
    Advance();
  }
}

char Lexer::PeekPastWhitespace() const {
  size_t i = index_;
  while (i < source_.size() && util::IsSpace(source_[i])) {
    ++i;
  }
  return i < source_.size() ? source_[i] : '\0';
}

Token Lexer::NumberToken() {
  int token_line = line_;
  int token_column = column_;
  std::string lexeme;
  while (IsDigit(Peek())) {
    lexeme.push_back(Advance());
  }
  if (Peek() == '.') {
    lexeme.push_back(Advance());
    while (IsDigit(Peek())) {
      lexeme.push_back(Advance());
    }
  }
  if (lexeme == ".") {
    throw util::Error("Invalid number format", token_line, token_column);
  }
  if (Peek() == 'e' || Peek() == 'E') {
    size_t sign = (PeekAt(1) == '+' || PeekAt(1) == '-') ? 1 : 0;
    if (IsDigit(PeekAt(1 + sign))) {
      lexeme.push_back(Advance());
      if (sign) lexeme.push_back(Advance());
      while (IsDigit(Peek())) {
        lexeme.push_back(Advance());
      }
    }
  }
  return Token{TokenType::kNumber, lexeme, token_line, token_column};
}

Token Lexer::IdentifierToken() {
  int token_line = line_;
  int token_column = column_;
  std::string lexeme;
  while (IsIdentifierPart(Peek())) {
    lexeme.push_back(Advance());
  }
  const bool is_call = PeekPastWhitespace() == '(';
  if (!is_call) {
    if (util::EqualsIgnoreCase(lexeme, "TRUE")) {
      return Token{TokenType::kTrue, lexeme, token_line, token_column};
    }
    if (util::EqualsIgnoreCase(lexeme, "FALSE")) {
      return Token{TokenType::kFalse, lexeme, token_line, token_column};
    }
    if (runtime::ParseA1(lexeme).has_value()) {
      return Token{TokenType::kCellRef, lexeme, token_line, token_column};
    }
  }
  if (lexeme.find('$') != std::string::npos) {
    throw util::Error("Invalid reference '" + lexeme + "'", token_line, token_column);
  }
  return Token{TokenType::kIdentifier, lexeme, token_line, token_column};
}

Token Lexer::StringToken() {
  int token_line = line_;
  int token_column = column_;
  Advance();  // opening quote
  std::string contents;
  while (true) {
    if (IsAtEnd()) {
      throw util::Error("Unterminated string literal", token_line, token_column);
    }
    char ch = Advance();
    if (ch == '"') {
      if (Peek() == '"') {
        Advance();
        contents.push_back('"');
        continue;
      }
      break;
    }
    contents.push_back(ch);
  }
  return Token{TokenType::kString, contents, token_line, token_column};
}

Token Lexer::ErrorToken() {
  int token_line = line_;
  int token_column = column_;
  std::string_view rest(source_);
  rest.remove_prefix(index_);
  for (const char* candidate : kErrorTokens) {
    std::string_view token(candidate);
    if (rest.size() >= token.size() &&
        util::EqualsIgnoreCase(rest.substr(0, token.size()), token)) {
      for (size_t i = 0; i < token.size(); ++i) {
        Advance();
      }
      return Token{TokenType::kError, std::string(token), token_line, token_column};
    }
  }
  throw util::Error("Unknown error literal", token_line, token_column);
}

Token Lexer::NextToken() {
  SkipWhitespace();
  int token_line = line_;
  int token_column = column_;

  if (IsAtEnd()) {
    return Token{TokenType::kEof, "", token_line, token_column};
  }

  char ch = Peek();
  if (ch == '"') {
    return StringToken();
  }
  if (ch == '#') {
    return ErrorToken();
  }
  if (IsDigit(ch) || (ch == '.' && IsDigit(PeekAt(1)))) {
    return NumberToken();
  }
  if (IsIdentifierStart(ch)) {
    return IdentifierToken();
  }

  Advance();
  switch (ch) {
    case '+':
      return Token{TokenType::kPlus, "+", token_line, token_column};
    case '-':
      return Token{TokenType::kMinus, "-", token_line, token_column};
    case '*':
      return Token{TokenType::kStar, "*", token_line, token_column};
    case '/':
      return Token{TokenType::kSlash, "/", token_line, token_column};
    case '^':
      return Token{TokenType::kCaret, "^", token_line, token_column};
    case '&':
      return Token{TokenType::kAmpersand, "&", token_line, token_column};
    case '%':
      return Token{TokenType::kPercent, "%", token_line, token_column};
    case ',':
      return Token{TokenType::kComma, ",", token_line, token_column};
    case ';':
      return Token{TokenType::kSemicolon, ";", token_line, token_column};
    case ':':
      return Token{TokenType::kColon, ":", token_line, token_column};
    case '(':
      return Token{TokenType::kLParen, "(", token_line, token_column};
    case ')':
      return Token{TokenType::kRParen, ")", token_line, token_column};
    case '{':
      return Token{TokenType::kLBrace, "{", token_line, token_column};
    case '}':
      return Token{TokenType::kRBrace, "}", token_line, token_column};
    case '=':
      return Token{TokenType::kEqual, "=", token_line, token_column};
    case '<':
      if (Peek() == '=') {
        Advance();
        return Token{TokenType::kLessEqual, "<=", token_line, token_column};
      }
      if (Peek() == '>') {
        Advance();
        return Token{TokenType::kNotEqual, "<>", token_line, token_column};
      }
      return Token{TokenType::kLess, "<", token_line, token_column};
    case '>':
      if (Peek() == '=') {
        Advance();
        return Token{TokenType::kGreaterEqual, ">=", token_line, token_column};
      }
      return Token{TokenType::kGreater, ">", token_line, token_column};
    default:
      break;
  }

  return Token{TokenType::kInvalid, std::string(1, ch), token_line, token_column};
}

std::vector<Token> Lexer::Tokenize() {
  std::vector<Token> tokens;
  while (true) {
    tokens.push_back(NextToken());
    if (tokens.back().type == TokenType::kEof) {
      break;
    }
  }
  return tokens;
}

}  // namespace cellforge::lexer
