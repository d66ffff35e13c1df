#ifndef CELLFORGE_PARSER_AST_H_
#define CELLFORGE_PARSER_AST_H_

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "runtime/address.h"
#include "runtime/error_kind.h"

// AST nodes for formula expressions.

namespace cellforge::parser {

enum class UnaryOp { kNegate, kPlus, kPercent };
enum class BinaryOp { kAdd, kSub, kMul, kDiv, kPow, kConcat, kEq, kNe, kLt, kLe, kGt, kGe };

struct Expression {
  virtual ~Expression() = default;
  int line = 0;
  int column = 0;
};

/// Numeric literal value.
struct NumberLiteral : public Expression {
  NumberLiteral(double v, std::string lex) : value(v), lexeme(std::move(lex)) {}
  double value;
  std::string lexeme;
};

/// String literal, already unescaped. Wildcards are kept verbatim.
struct StringLiteral : public Expression {
  explicit StringLiteral(std::string v) : value(std::move(v)) {}
  std::string value;
};

/// Boolean literal value.
struct BoolLiteral : public Expression {
  explicit BoolLiteral(bool v) : value(v) {}
  bool value;
};

/// Error literal such as #N/A.
struct ErrorLiteral : public Expression {
  explicit ErrorLiteral(runtime::ErrorKind k) : kind(k) {}
  runtime::ErrorKind kind;
};

/// Array constant `{1,2;3,4}` stored row-major; elements are literal nodes.
struct ArrayLiteral : public Expression {
  ArrayLiteral(int r, int c, std::vector<std::unique_ptr<Expression>> items)
      : rows(r), cols(c), elements(std::move(items)) {}
  int rows;
  int cols;
  std::vector<std::unique_ptr<Expression>> elements;
};

/// Omitted argument, as in `TEXTSPLIT(a, ",", , TRUE)`.
struct EmptyArgument : public Expression {};

/// Single cell reference.
struct CellReference : public Expression {
  explicit CellReference(runtime::Address a) : address(a) {}
  runtime::Address address;
};

/// Rectangular range reference; the range is stored as written.
struct RangeReference : public Expression {
  explicit RangeReference(runtime::Range r) : range(r) {}
  runtime::Range range;
};

struct UnaryExpression : public Expression {
  UnaryExpression(UnaryOp o, std::unique_ptr<Expression> expr) : op(o), operand(std::move(expr)) {}
  UnaryOp op;
  std::unique_ptr<Expression> operand;
};

struct BinaryExpression : public Expression {
  BinaryExpression(BinaryOp o, std::unique_ptr<Expression> lhs_expr,
                   std::unique_ptr<Expression> rhs_expr)
      : op(o), lhs(std::move(lhs_expr)), rhs(std::move(rhs_expr)) {}
  BinaryOp op;
  std::unique_ptr<Expression> lhs;
  std::unique_ptr<Expression> rhs;
};

/// Bare name: a LET binding, lambda parameter or named lambda.
struct Identifier : public Expression {
  explicit Identifier(std::string n) : name(std::move(n)) {}
  std::string name;
};

/// Function call by name with positional arguments.
struct CallExpression : public Expression {
  CallExpression(std::string callee_name, std::vector<std::unique_ptr<Expression>> arguments)
      : callee(std::move(callee_name)), args(std::move(arguments)) {}
  std::string callee;
  std::vector<std::unique_ptr<Expression>> args;
};

/// Call applied to an arbitrary expression, e.g. `LAMBDA(x, x*2)(5)`.
struct InvokeExpression : public Expression {
  InvokeExpression(std::unique_ptr<Expression> t,
                   std::vector<std::unique_ptr<Expression>> arguments)
      : target(std::move(t)), args(std::move(arguments)) {}
  std::unique_ptr<Expression> target;
  std::vector<std::unique_ptr<Expression>> args;
};

/// `LAMBDA(p1, ..., body)`. The body is shared so closures can outlive the tree.
struct LambdaExpression : public Expression {
  LambdaExpression(std::vector<std::string> names, std::shared_ptr<const Expression> b)
      : params(std::move(names)), body(std::move(b)) {}
  std::vector<std::string> params;
  std::shared_ptr<const Expression> body;
};

/// `LET(name1, value1, ..., body)`.
struct LetExpression : public Expression {
  LetExpression(std::vector<std::string> n, std::vector<std::unique_ptr<Expression>> v,
                std::unique_ptr<Expression> b)
      : names(std::move(n)), values(std::move(v)), body(std::move(b)) {}
  std::vector<std::string> names;
  std::vector<std::unique_ptr<Expression>> values;
  std::unique_ptr<Expression> body;
};

}  // namespace cellforge::parser

#endif  // CELLFORGE_PARSER_AST_H_
