#include <vector>

#include "test_util.h"

namespace test {

namespace {

std::vector<lx::TokenType> Types(const std::string& source) {
  lx::Lexer lex(source);
  std::vector<lx::TokenType> types;
  for (const lx::Token& tok : lex.Tokenize()) {
    types.push_back(tok.type);
  }
  return types;
}

bool Throws(const std::string& source) {
  try {
    lx::Lexer lex(source);
    lex.Tokenize();
  } catch (const util::Error&) {
    return true;
  }
  return false;
}

}  // namespace

void RunLexerTests(TestContext* ctx) {
  std::vector<lx::TokenType> expected = {
      lx::TokenType::kEqual,   lx::TokenType::kIdentifier, lx::TokenType::kLParen,
      lx::TokenType::kCellRef, lx::TokenType::kColon,      lx::TokenType::kCellRef,
      lx::TokenType::kComma,   lx::TokenType::kNumber,     lx::TokenType::kRParen,
      lx::TokenType::kEof};
  ExpectTrue(Types("=SUM(A1:$B$2, 1.5)") == expected, "basic_tokenization", ctx);

  expected = {lx::TokenType::kEqual,     lx::TokenType::kNumber,       lx::TokenType::kLessEqual,
              lx::TokenType::kNumber,    lx::TokenType::kNotEqual,     lx::TokenType::kNumber,
              lx::TokenType::kAmpersand, lx::TokenType::kGreaterEqual, lx::TokenType::kPercent,
              lx::TokenType::kEof};
  ExpectTrue(Types("=1<=2<>3&>=%") == expected, "comparison_operators", ctx);

  lx::Lexer strings("=\"say \"\"hi\"\"\"");
  auto tokens = strings.Tokenize();
  ExpectTrue(tokens.size() == 3 && tokens[1].type == lx::TokenType::kString &&
                 tokens[1].lexeme == "say \"hi\"",
             "string_doubled_quotes", ctx);

  lx::Lexer errors("=#N/A+#DIV/0!");
  tokens = errors.Tokenize();
  ExpectTrue(tokens[1].type == lx::TokenType::kError && tokens[1].lexeme == "#N/A" &&
                 tokens[3].type == lx::TokenType::kError && tokens[3].lexeme == "#DIV/0!",
             "error_literals", ctx);

  // A cell-shaped name followed by '(' is a function call.
  lx::Lexer log10("=LOG10(100)");
  tokens = log10.Tokenize();
  ExpectTrue(tokens[1].type == lx::TokenType::kIdentifier && tokens[1].lexeme == "LOG10",
             "cell_shaped_function_name", ctx);

  lx::Lexer dotted("=norm.s.dist(1, TRUE)");
  tokens = dotted.Tokenize();
  ExpectTrue(tokens[1].lexeme == "norm.s.dist" && tokens[5].type == lx::TokenType::kTrue,
             "dotted_name_and_boolean", ctx);

  lx::Lexer numbers("=.5+1e3+1.5E-2");
  tokens = numbers.Tokenize();
  ExpectTrue(tokens[1].lexeme == ".5" && tokens[3].lexeme == "1e3" && tokens[5].lexeme == "1.5E-2",
             "number_forms", ctx);

  ExpectTrue(Throws("=\"unterminated"), "unterminated_string_throws", ctx);
  lx::Lexer stray("=1 @ 2");
  tokens = stray.Tokenize();
  ExpectTrue(tokens.size() > 2 && tokens[2].type == lx::TokenType::kInvalid &&
                 tokens[2].lexeme == "@",
             "unknown_character_is_invalid_token", ctx);
  ExpectTrue(!ps::ParseFormula("=1 @ 2").ok(), "unknown_character_rejected_by_parser", ctx);
}

}  // namespace test
