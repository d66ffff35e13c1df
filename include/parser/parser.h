#ifndef CELLFORGE_PARSER_PARSER_H_
#define CELLFORGE_PARSER_PARSER_H_

#include <memory>
#include <string>
#include <vector>

#include "lexer/lexer.h"
#include "parser/ast.h"
#include "util/error.h"
#include "util/status.h"

namespace cellforge::parser {

class Parser {
 public:
  /// Builds a parser with ownership of the provided lexer.
  explicit Parser(lexer::Lexer lexer);

  /// Parses `=expression` up to end of input and throws util::Error on syntax issues.
  std::unique_ptr<Expression> ParseFormula();

  /// Parses a bare expression (no leading '=') up to end of input.
  std::unique_ptr<Expression> ParseExpression();

 private:
  const lexer::Token& Peek() const;
  const lexer::Token& Next() const;
  const lexer::Token& Previous() const;
  lexer::Token Advance();
  bool Match(lexer::TokenType type);
  void Consume(lexer::TokenType type, const std::string& message);

  std::unique_ptr<Expression> Comparison();
  std::unique_ptr<Expression> Concat();
  std::unique_ptr<Expression> Term();
  std::unique_ptr<Expression> Factor();
  std::unique_ptr<Expression> Unary();
  std::unique_ptr<Expression> Power();
  std::unique_ptr<Expression> PowerOperand();
  std::unique_ptr<Expression> Percent();
  std::unique_ptr<Expression> Postfix();
  std::unique_ptr<Expression> Primary();
  std::unique_ptr<Expression> Reference();
  std::unique_ptr<Expression> ArrayConstant();
  std::unique_ptr<Expression> ArrayElement();
  std::unique_ptr<Expression> FinishCall(const lexer::Token& name);
  std::unique_ptr<Expression> FinishLambda(const lexer::Token& name,
                                           std::vector<std::unique_ptr<Expression>> args);
  std::unique_ptr<Expression> FinishLet(const lexer::Token& name,
                                        std::vector<std::unique_ptr<Expression>> args);
  std::vector<std::unique_ptr<Expression>> Arguments();

  lexer::Lexer lexer_;
  lexer::Token current_;
  lexer::Token lookahead_;
  lexer::Token previous_;
};

/// Parses formula text; syntax problems come back as kInvalidArgument with a located message.
util::StatusOr<std::unique_ptr<Expression>> ParseFormula(const std::string& text);

}  // namespace cellforge::parser

#endif  // CELLFORGE_PARSER_PARSER_H_
