#include "libjsonquery/arithmetic.hpp"
#include "libjsonquery/exceptions.hpp"
#include <gtest/gtest.h> // EXPECT_* TEST_F testing::Test
#include <cmath>         // std::signbit
#include <string_view>   // std::string_view

using tt = libjsonquery::ArithmeticTokenType;

class ArithmeticTest : public testing::Test {
protected:
  void expect_result(double value, std::string_view tail, double want) {
    EXPECT_EQ(libjsonquery::apply_arithmetic(value, tail), want)
        << value << " " << tail;
  }

  void expect_error(
      double value, std::string_view tail, std::string_view message) {
    try {
      libjsonquery::apply_arithmetic(value, tail);
      FAIL() << "expected an ArithmeticError for '" << tail << "'";
    } catch (const libjsonquery::ArithmeticError& e) {
      EXPECT_EQ(std::string_view(e.what()), message);
    }
  }
};

TEST_F(ArithmeticTest, Tokenize) {
  const auto tokens{libjsonquery::tokenize_arithmetic("* (1.5 + .25)")};
  ASSERT_EQ(tokens.size(), 7);
  EXPECT_EQ(tokens[0].type, tt::times);
  EXPECT_EQ(tokens[1].type, tt::lparen);
  EXPECT_EQ(tokens[2].type, tt::number);
  EXPECT_EQ(tokens[2].value, 1.5);
  EXPECT_EQ(tokens[3].type, tt::plus);
  EXPECT_EQ(tokens[4].type, tt::number);
  EXPECT_EQ(tokens[4].value, 0.25);
  EXPECT_EQ(tokens[4].index, 9);
  EXPECT_EQ(tokens[5].type, tt::rparen);
  EXPECT_EQ(tokens[6].type, tt::eof_);
}

TEST_F(ArithmeticTest, MultiplyIsRoundedToFifteenDigits) {
  expect_result(10, "* 1.1", 11);
  expect_result(20, "* 1.1", 22);
  expect_result(0.1, "+ 0.2", 0.3);
}

TEST_F(ArithmeticTest, OperatorPrecedence) {
  expect_result(2, "+ 3 * 4", 14);
  expect_result(2, "* 3 + 4", 10);
  expect_result(2, "* (3 + 4)", 14);
  expect_result(20, "- 4 - 6", 10);
  expect_result(24, "/ 4 / 2", 3);
}

TEST_F(ArithmeticTest, UnaryOperators) {
  expect_result(10, "- -2", 12);
  expect_result(10, "* -1", -10);
  expect_result(10, "+ +1", 11);
}

TEST_F(ArithmeticTest, NoNegativeZero) {
  const auto result{libjsonquery::apply_arithmetic(0, "* -1")};
  EXPECT_EQ(result, 0);
  EXPECT_FALSE(std::signbit(result));
}

TEST_F(ArithmeticTest, DisallowedCharacters) {
  expect_error(1, "* x", "disallowed character 'x' at index 2");
  expect_error(1, "+ Math.PI", "disallowed character 'M' at index 2");
  expect_error(1, "; 1", "disallowed character ';' at index 0");
  expect_error(1, "** 2", "unexpected token at index 1");
}

TEST_F(ArithmeticTest, IncrementAndDecrement) {
  expect_error(1, "++ 1", "unexpected '++' at index 0");
  expect_error(1, "- --1", "unexpected '--' at index 2");
}

TEST_F(ArithmeticTest, MalformedExpressions) {
  expect_error(1, "* (2 + 3", "unbalanced parentheses");
  expect_error(1, "+", "unexpected end of expression");
  expect_error(1, "2", "unexpected token at index 0");
  expect_error(1, "+ .", "unexpected '.' at index 2");
}

TEST_F(ArithmeticTest, NonFiniteResults) {
  expect_error(10, "/ 0", "result is not a finite number");
  expect_error(0, "/ 0", "result is not a finite number");
}
