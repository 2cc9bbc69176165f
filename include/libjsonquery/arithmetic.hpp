#ifndef LIBJSONQUERY_ARITHMETIC_H
#define LIBJSONQUERY_ARITHMETIC_H

#include <string>      // std::string
#include <string_view> // std::string_view
#include <vector>      // std::vector

namespace libjsonquery {

enum class ArithmeticTokenType {
  eof_,
  number,
  plus,
  minus,
  times,
  divide,
  lparen,
  rparen,
};

struct ArithmeticToken {
  ArithmeticTokenType type{};
  double value{};
  std::string::size_type index{};
};

using ArithmeticTokens = std::vector<ArithmeticToken>;

// Arithmetic operator precedence, lowest first.
constexpr int ARITHMETIC_LOWEST = 1;
constexpr int ARITHMETIC_SUM = 2;
constexpr int ARITHMETIC_PRODUCT = 3;
constexpr int ARITHMETIC_PREFIX = 4;

// Split _expression_ into arithmetic tokens. Only digits, `.`, `+`, `-`, `*`,
// `/`, parentheses and whitespace are allowed. Throws an ArithmeticError for
// any other character, for a malformed number and for `++` or `--`.
ArithmeticTokens tokenize_arithmetic(std::string_view expression);

// A parser and evaluator for expressions of numbers, the four binary
// operators, unary plus and minus and parentheses. There are no names,
// calls or any other way to reach outside the expression.
class ArithmeticParser {
public:
  explicit ArithmeticParser(const ArithmeticTokens& tokens)
      : m_tokens{tokens} {};

  // Evaluate all tokens as one expression. Throws an ArithmeticError if the
  // tokens do not form a single expression.
  double evaluate();

private:
  const ArithmeticTokens& m_tokens;
  ArithmeticTokens::size_type m_position{0};

  const ArithmeticToken& current() const;
  double parse_expression(int min_precedence);
  double parse_prefix();
  double parse_group();
  int precedence(ArithmeticTokenType tt) const noexcept;
};

// Evaluate "value <tail>", like "10 * 1.1" for a value of 10 and a tail of
// "* 1.1". The result is rounded to 15 significant digits, so 10 * 1.1 is
// exactly 11. Throws an ArithmeticError if _tail_ is rejected, does not parse
// or the result is not a finite number.
double apply_arithmetic(double value, std::string_view tail);

} // namespace libjsonquery

#endif // LIBJSONQUERY_ARITHMETIC_H
