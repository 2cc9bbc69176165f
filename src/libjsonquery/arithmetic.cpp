#include "libjsonquery/arithmetic.hpp"
#include "libjsonquery/exceptions.hpp" // libjsonquery::ArithmeticError
#include <cctype>                      // std::isdigit std::isspace
#include <cmath>                       // std::isfinite
#include <cstdio>                      // std::snprintf
#include <cstdlib>                     // std::strtod

namespace libjsonquery {

using namespace std::string_literals;

namespace {

bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)); }

} // namespace

ArithmeticTokens tokenize_arithmetic(std::string_view expression) {
  ArithmeticTokens tokens{};
  std::string::size_type index{0};
  const auto length{expression.length()};

  while (index < length) {
    const char c{expression[index]};
    const auto start{index};

    if (std::isspace(static_cast<unsigned char>(c))) {
      index++;
      continue;
    }

    if (is_digit(c) || c == '.') {
      while (index < length && is_digit(expression[index])) {
        index++;
      }
      if (index < length && expression[index] == '.') {
        index++;
        while (index < length && is_digit(expression[index])) {
          index++;
        }
      }

      const std::string text{expression.substr(start, index - start)};
      if (text == ".") {
        throw ArithmeticError(
            "unexpected '.' at index "s + std::to_string(start));
      }
      tokens.push_back(ArithmeticToken{ArithmeticTokenType::number,
          std::strtod(text.c_str(), nullptr), start});
      continue;
    }

    ArithmeticTokenType type{};
    switch (c) {
    case '+':
      type = ArithmeticTokenType::plus;
      break;
    case '-':
      type = ArithmeticTokenType::minus;
      break;
    case '*':
      type = ArithmeticTokenType::times;
      break;
    case '/':
      type = ArithmeticTokenType::divide;
      break;
    case '(':
      type = ArithmeticTokenType::lparen;
      break;
    case ')':
      type = ArithmeticTokenType::rparen;
      break;
    default:
      throw ArithmeticError("disallowed character '"s + std::string(1, c) +
                            "' at index "s + std::to_string(start));
    }

    // Increment and decrement operators are not arithmetic.
    if ((c == '+' || c == '-') && index + 1 < length &&
        expression[index + 1] == c) {
      throw ArithmeticError("unexpected '"s + std::string(2, c) +
                            "' at index "s + std::to_string(start));
    }

    tokens.push_back(ArithmeticToken{type, 0, start});
    index++;
  }

  tokens.push_back(ArithmeticToken{ArithmeticTokenType::eof_, 0, length});
  return tokens;
}

double ArithmeticParser::evaluate() {
  m_position = 0;
  const auto rv{parse_expression(ARITHMETIC_LOWEST)};
  if (current().type != ArithmeticTokenType::eof_) {
    throw ArithmeticError(
        "unexpected token at index "s + std::to_string(current().index));
  }
  return rv;
}

const ArithmeticToken& ArithmeticParser::current() const {
  if (m_position >= m_tokens.size()) {
    throw ArithmeticError("unexpected end of expression");
  }
  return m_tokens[m_position];
}

double ArithmeticParser::parse_expression(int min_precedence) {
  auto left{parse_prefix()};

  while (true) {
    const auto type{current().type};
    const auto right_precedence{precedence(type)};
    if (right_precedence <= min_precedence) {
      break;
    }

    m_position++;
    const auto right{parse_expression(right_precedence)};

    switch (type) {
    case ArithmeticTokenType::plus:
      left += right;
      break;
    case ArithmeticTokenType::minus:
      left -= right;
      break;
    case ArithmeticTokenType::times:
      left *= right;
      break;
    default:
      left /= right;
      break;
    }
  }

  return left;
}

double ArithmeticParser::parse_prefix() {
  const auto& token{current()};
  switch (token.type) {
  case ArithmeticTokenType::number:
    m_position++;
    return token.value;
  case ArithmeticTokenType::minus:
    m_position++;
    return -parse_expression(ARITHMETIC_PREFIX);
  case ArithmeticTokenType::plus:
    m_position++;
    return parse_expression(ARITHMETIC_PREFIX);
  case ArithmeticTokenType::lparen:
    return parse_group();
  case ArithmeticTokenType::eof_:
    throw ArithmeticError("unexpected end of expression");
  default:
    throw ArithmeticError(
        "unexpected token at index "s + std::to_string(token.index));
  }
}

double ArithmeticParser::parse_group() {
  m_position++; // move past the left paren
  const auto rv{parse_expression(ARITHMETIC_LOWEST)};
  if (current().type != ArithmeticTokenType::rparen) {
    throw ArithmeticError("unbalanced parentheses");
  }
  m_position++;
  return rv;
}

int ArithmeticParser::precedence(ArithmeticTokenType tt) const noexcept {
  switch (tt) {
  case ArithmeticTokenType::plus:
  case ArithmeticTokenType::minus:
    return ARITHMETIC_SUM;
  case ArithmeticTokenType::times:
  case ArithmeticTokenType::divide:
    return ARITHMETIC_PRODUCT;
  default:
    return 0;
  }
}

double apply_arithmetic(double value, std::string_view tail) {
  auto tokens{tokenize_arithmetic(tail)};
  tokens.insert(tokens.begin(),
      ArithmeticToken{ArithmeticTokenType::number, value, 0});

  ArithmeticParser parser{tokens};
  const auto result{parser.evaluate()};

  if (!std::isfinite(result)) {
    throw ArithmeticError("result is not a finite number");
  }

  if (result == 0) {
    return 0; // no negative zero
  }

  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.15g", result);
  return std::strtod(buffer, nullptr);
}

} // namespace libjsonquery
