#include "parser/parser.h"

#include <cstdlib>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "runtime/address.h"
#include "runtime/error_kind.h"
#include "util/string.h"

namespace cellforge::parser {

namespace {

template <typename Node>
std::unique_ptr<Node> At(std::unique_ptr<Node> node, const lexer::Token& token) {
  node->line = token.line;
  node->column = token.column;
  return node;
}

double ParseNumberLexeme(const lexer::Token& token) {
  char* end = nullptr;
  double value = std::strtod(token.lexeme.c_str(), &end);
  if (end == token.lexeme.c_str()) {
    throw util::Error("Invalid number '" + token.lexeme + "'", token.line, token.column);
  }
  return value;
}

}  // namespace

Parser::Parser(lexer::Lexer lexer)
    : lexer_(std::move(lexer)),
      current_(lexer_.NextToken()),
      lookahead_(lexer_.NextToken()),
      previous_{lexer::TokenType::kInvalid, "", 0, 0} {}

const lexer::Token& Parser::Peek() const {
  return current_;
}

const lexer::Token& Parser::Next() const {
  return lookahead_;
}

const lexer::Token& Parser::Previous() const {
  return previous_;
}

lexer::Token Parser::Advance() {
  previous_ = current_;
  current_ = lookahead_;
  if (current_.type != lexer::TokenType::kEof) {
    lookahead_ = lexer_.NextToken();
  }
  return previous_;
}

bool Parser::Match(lexer::TokenType type) {
  if (Peek().type == type) {
    Advance();
    return true;
  }
  return false;
}

void Parser::Consume(lexer::TokenType type, const std::string& message) {
  if (Peek().type == type) {
    Advance();
    return;
  }
  throw util::Error(message, Peek().line, Peek().column);
}

std::unique_ptr<Expression> Parser::ParseFormula() {
  Consume(lexer::TokenType::kEqual, "Formula must start with '='");
  return ParseExpression();
}

std::unique_ptr<Expression> Parser::ParseExpression() {
  if (Peek().type == lexer::TokenType::kEof) {
    throw util::Error("Expected expression", Peek().line, Peek().column);
  }
  auto expr = Comparison();
  if (Peek().type != lexer::TokenType::kEof) {
    throw util::Error("Unexpected token '" + Peek().lexeme + "'", Peek().line, Peek().column);
  }
  return expr;
}

std::unique_ptr<Expression> Parser::Comparison() {
  auto expr = Concat();
  while (true) {
    BinaryOp op;
    if (Match(lexer::TokenType::kEqual)) {
      op = BinaryOp::kEq;
    } else if (Match(lexer::TokenType::kNotEqual)) {
      op = BinaryOp::kNe;
    } else if (Match(lexer::TokenType::kLess)) {
      op = BinaryOp::kLt;
    } else if (Match(lexer::TokenType::kLessEqual)) {
      op = BinaryOp::kLe;
    } else if (Match(lexer::TokenType::kGreater)) {
      op = BinaryOp::kGt;
    } else if (Match(lexer::TokenType::kGreaterEqual)) {
      op = BinaryOp::kGe;
    } else {
      break;
    }
    lexer::Token op_token = Previous();
    auto rhs = Concat();
    expr = At(std::make_unique<BinaryExpression>(op, std::move(expr), std::move(rhs)), op_token);
  }
  return expr;
}

std::unique_ptr<Expression> Parser::Concat() {
  auto expr = Term();
  while (Match(lexer::TokenType::kAmpersand)) {
    lexer::Token op_token = Previous();
    auto rhs = Term();
    expr = At(std::make_unique<BinaryExpression>(BinaryOp::kConcat, std::move(expr),
                                                 std::move(rhs)),
              op_token);
  }
  return expr;
}

std::unique_ptr<Expression> Parser::Term() {
  auto expr = Factor();
  while (true) {
    if (Match(lexer::TokenType::kPlus)) {
      lexer::Token op_token = Previous();
      auto rhs = Factor();
      expr = At(std::make_unique<BinaryExpression>(BinaryOp::kAdd, std::move(expr), std::move(rhs)),
                op_token);
      continue;
    }
    if (Match(lexer::TokenType::kMinus)) {
      lexer::Token op_token = Previous();
      auto rhs = Factor();
      expr = At(std::make_unique<BinaryExpression>(BinaryOp::kSub, std::move(expr), std::move(rhs)),
                op_token);
      continue;
    }
    break;
  }
  return expr;
}

std::unique_ptr<Expression> Parser::Factor() {
  auto expr = Unary();
  while (true) {
    if (Match(lexer::TokenType::kStar)) {
      lexer::Token op_token = Previous();
      auto rhs = Unary();
      expr = At(std::make_unique<BinaryExpression>(BinaryOp::kMul, std::move(expr), std::move(rhs)),
                op_token);
      continue;
    }
    if (Match(lexer::TokenType::kSlash)) {
      lexer::Token op_token = Previous();
      auto rhs = Unary();
      expr = At(std::make_unique<BinaryExpression>(BinaryOp::kDiv, std::move(expr), std::move(rhs)),
                op_token);
      continue;
    }
    break;
  }
  return expr;
}

std::unique_ptr<Expression> Parser::Unary() {
  if (Match(lexer::TokenType::kMinus)) {
    lexer::Token op_token = Previous();
    return At(std::make_unique<UnaryExpression>(UnaryOp::kNegate, Unary()), op_token);
  }
  if (Match(lexer::TokenType::kPlus)) {
    lexer::Token op_token = Previous();
    return At(std::make_unique<UnaryExpression>(UnaryOp::kPlus, Unary()), op_token);
  }
  return Power();
}

// `^` is left-associative and binds tighter than a leading minus: -2^2 is -(2^2).
std::unique_ptr<Expression> Parser::Power() {
  auto expr = Percent();
  while (Match(lexer::TokenType::kCaret)) {
    lexer::Token op_token = Previous();
    auto rhs = PowerOperand();
    expr = At(std::make_unique<BinaryExpression>(BinaryOp::kPow, std::move(expr), std::move(rhs)),
              op_token);
  }
  return expr;
}

// The exponent may carry its own sign, as in 2^-1.
std::unique_ptr<Expression> Parser::PowerOperand() {
  if (Match(lexer::TokenType::kMinus)) {
    lexer::Token op_token = Previous();
    return At(std::make_unique<UnaryExpression>(UnaryOp::kNegate, PowerOperand()), op_token);
  }
  if (Match(lexer::TokenType::kPlus)) {
    lexer::Token op_token = Previous();
    return At(std::make_unique<UnaryExpression>(UnaryOp::kPlus, PowerOperand()), op_token);
  }
  return Percent();
}

std::unique_ptr<Expression> Parser::Percent() {
  auto expr = Postfix();
  while (Match(lexer::TokenType::kPercent)) {
    expr = At(std::make_unique<UnaryExpression>(UnaryOp::kPercent, std::move(expr)), Previous());
  }
  return expr;
}

std::unique_ptr<Expression> Parser::Postfix() {
  auto expr = Primary();
  while (Peek().type == lexer::TokenType::kLParen) {
    lexer::Token open = Advance();
    auto args = Arguments();
    expr = At(std::make_unique<InvokeExpression>(std::move(expr), std::move(args)), open);
  }
  return expr;
}

std::unique_ptr<Expression> Parser::Primary() {
  const lexer::Token token = Peek();
  if (Match(lexer::TokenType::kNumber)) {
    return At(std::make_unique<NumberLiteral>(ParseNumberLexeme(token), token.lexeme), token);
  }
  if (Match(lexer::TokenType::kString)) {
    return At(std::make_unique<StringLiteral>(token.lexeme), token);
  }
  if (Match(lexer::TokenType::kTrue)) {
    return At(std::make_unique<BoolLiteral>(true), token);
  }
  if (Match(lexer::TokenType::kFalse)) {
    return At(std::make_unique<BoolLiteral>(false), token);
  }
  if (Match(lexer::TokenType::kError)) {
    auto kind = runtime::ParseErrorToken(token.lexeme);
    if (!kind) {
      throw util::Error("Unknown error literal", token.line, token.column);
    }
    return At(std::make_unique<ErrorLiteral>(*kind), token);
  }
  if (Peek().type == lexer::TokenType::kCellRef) {
    return Reference();
  }
  if (Match(lexer::TokenType::kLBrace)) {
    return ArrayConstant();
  }
  if (Match(lexer::TokenType::kLParen)) {
    auto inner = Comparison();
    Consume(lexer::TokenType::kRParen, "Expected ')' after expression");
    return inner;
  }
  if (Match(lexer::TokenType::kIdentifier)) {
    if (Peek().type == lexer::TokenType::kLParen) {
      Advance();
      return FinishCall(token);
    }
    return At(std::make_unique<Identifier>(token.lexeme), token);
  }
  if (token.type == lexer::TokenType::kEof) {
    throw util::Error("Unexpected end of formula", token.line, token.column);
  }
  throw util::Error("Unexpected token '" + token.lexeme + "'", token.line, token.column);
}

std::unique_ptr<Expression> Parser::Reference() {
  lexer::Token first = Advance();
  auto start = runtime::ParseA1(first.lexeme);
  if (!start) {
    throw util::Error("Invalid reference '" + first.lexeme + "'", first.line, first.column);
  }
  if (!Match(lexer::TokenType::kColon)) {
    return At(std::make_unique<CellReference>(*start), first);
  }
  const lexer::Token second = Peek();
  Consume(lexer::TokenType::kCellRef, "Expected cell reference after ':'");
  auto end = runtime::ParseA1(second.lexeme);
  if (!end) {
    throw util::Error("Invalid reference '" + second.lexeme + "'", second.line, second.column);
  }
  return At(std::make_unique<RangeReference>(runtime::Range{*start, *end}), first);
}

std::unique_ptr<Expression> Parser::ArrayConstant() {
  const lexer::Token open = Previous();
  std::vector<std::unique_ptr<Expression>> elements;
  int rows = 0;
  int cols = -1;
  while (true) {
    int row_cols = 0;
    while (true) {
      elements.push_back(ArrayElement());
      ++row_cols;
      if (!Match(lexer::TokenType::kComma)) {
        break;
      }
    }
    if (cols >= 0 && row_cols != cols) {
      throw util::Error("Array constant rows must have the same length", Peek().line,
                        Peek().column);
    }
    cols = row_cols;
    ++rows;
    if (!Match(lexer::TokenType::kSemicolon)) {
      break;
    }
  }
  Consume(lexer::TokenType::kRBrace, "Expected '}' to close array constant");
  return At(std::make_unique<ArrayLiteral>(rows, cols, std::move(elements)), open);
}

std::unique_ptr<Expression> Parser::ArrayElement() {
  const lexer::Token token = Peek();
  bool negate = false;
  if (Match(lexer::TokenType::kMinus)) {
    negate = true;
  } else {
    Match(lexer::TokenType::kPlus);
  }
  const lexer::Token literal = Peek();
  if (Match(lexer::TokenType::kNumber)) {
    double value = ParseNumberLexeme(literal);
    return At(std::make_unique<NumberLiteral>(negate ? -value : value, literal.lexeme), token);
  }
  if (negate) {
    throw util::Error("Expected number after '-' in array constant", literal.line, literal.column);
  }
  if (Match(lexer::TokenType::kString)) {
    return At(std::make_unique<StringLiteral>(literal.lexeme), literal);
  }
  if (Match(lexer::TokenType::kTrue)) {
    return At(std::make_unique<BoolLiteral>(true), literal);
  }
  if (Match(lexer::TokenType::kFalse)) {
    return At(std::make_unique<BoolLiteral>(false), literal);
  }
  if (Match(lexer::TokenType::kError)) {
    auto kind = runtime::ParseErrorToken(literal.lexeme);
    if (kind) {
      return At(std::make_unique<ErrorLiteral>(*kind), literal);
    }
  }
  throw util::Error("Array constants may only contain literals", literal.line, literal.column);
}

std::vector<std::unique_ptr<Expression>> Parser::Arguments() {
  std::vector<std::unique_ptr<Expression>> args;
  if (Match(lexer::TokenType::kRParen)) {
    return args;
  }
  while (true) {
    if (Peek().type == lexer::TokenType::kComma || Peek().type == lexer::TokenType::kRParen) {
      args.push_back(At(std::make_unique<EmptyArgument>(), Peek()));
    } else {
      args.push_back(Comparison());
    }
    if (Match(lexer::TokenType::kComma)) {
      continue;
    }
    Consume(lexer::TokenType::kRParen, "Expected ')' after arguments");
    break;
  }
  return args;
}

std::unique_ptr<Expression> Parser::FinishCall(const lexer::Token& name) {
  auto args = Arguments();
  if (util::EqualsIgnoreCase(name.lexeme, "LAMBDA")) {
    return FinishLambda(name, std::move(args));
  }
  if (util::EqualsIgnoreCase(name.lexeme, "LET")) {
    return FinishLet(name, std::move(args));
  }
  return At(std::make_unique<CallExpression>(util::ToUpper(name.lexeme), std::move(args)), name);
}

std::unique_ptr<Expression> Parser::FinishLambda(const lexer::Token& name,
                                                 std::vector<std::unique_ptr<Expression>> args) {
  if (args.empty() || dynamic_cast<const EmptyArgument*>(args.back().get()) != nullptr) {
    throw util::Error("LAMBDA requires a body", name.line, name.column);
  }
  std::vector<std::string> params;
  for (size_t i = 0; i + 1 < args.size(); ++i) {
    const auto* id = dynamic_cast<const Identifier*>(args[i].get());
    if (id == nullptr) {
      throw util::Error("LAMBDA parameters must be names", args[i]->line, args[i]->column);
    }
    params.push_back(util::ToUpper(id->name));
  }
  std::shared_ptr<const Expression> body(std::move(args.back()));
  return At(std::make_unique<LambdaExpression>(std::move(params), std::move(body)), name);
}

std::unique_ptr<Expression> Parser::FinishLet(const lexer::Token& name,
                                              std::vector<std::unique_ptr<Expression>> args) {
  if (args.size() < 3 || args.size() % 2 == 0) {
    throw util::Error("LET requires name/value pairs followed by a body", name.line, name.column);
  }
  std::vector<std::string> names;
  std::vector<std::unique_ptr<Expression>> values;
  for (size_t i = 0; i + 1 < args.size(); i += 2) {
    const auto* id = dynamic_cast<const Identifier*>(args[i].get());
    if (id == nullptr) {
      throw util::Error("LET names must be identifiers", args[i]->line, args[i]->column);
    }
    names.push_back(util::ToUpper(id->name));
    values.push_back(std::move(args[i + 1]));
  }
  return At(std::make_unique<LetExpression>(std::move(names), std::move(values),
                                            std::move(args.back())),
            name);
}

util::StatusOr<std::unique_ptr<Expression>> ParseFormula(const std::string& text) {
  try {
    lexer::Lexer lex(text);
    Parser parser(std::move(lex));
    return parser.ParseFormula();
  } catch (const util::Error& err) {
    return util::Status::Invalid(err.formatted(text));
  }
}

}  // namespace cellforge::parser
