#include "libjsonquery/tokens.hpp"
#include <fmt/format.h> // fmt::format
#include <array>        // std::array

namespace libjsonquery {

namespace {

// Token type names, in TokenType declaration order.
constexpr std::array<std::string_view, 32> TOKEN_TYPE_NAMES{
    "EOF",
    "AND",
    "COLON",
    "COMMA",
    "CURRENT",
    "DOTDOT",
    "DQ_STRING",
    "EQ",
    "ERROR",
    "FALSE",
    "FILTER",
    "FLOAT",
    "FUNC",
    "GE",
    "GT",
    "INDEX",
    "INT",
    "LBRACKET",
    "LE",
    "LPAREN",
    "LT",
    "NAME",
    "NE",
    "NOT",
    "NULL",
    "OR",
    "RBRACKET",
    "ROOT",
    "RPAREN",
    "SQ_STRING",
    "TRUE",
    "WILD",
};

static_assert(static_cast<std::size_t>(TokenType::wild) + 1 ==
              TOKEN_TYPE_NAMES.size());

} // namespace

std::string token_type_to_string(TokenType tt) {
  const auto i{static_cast<std::size_t>(tt)};
  if (i >= TOKEN_TYPE_NAMES.size()) {
    return "UNDEFINED";
  }
  return std::string{TOKEN_TYPE_NAMES[i]};
}

std::ostream& operator<<(std::ostream& os, TokenType const& tt) {
  return os << token_type_to_string(tt);
}

bool operator==(const Token& lhs, const Token& rhs) {
  return lhs.type == rhs.type && lhs.value == rhs.value &&
         lhs.index == rhs.index && lhs.query == rhs.query;
}

std::string token_to_string(const Token& token) {
  return fmt::format("{}({:?}) at {} in {:?}", token_type_to_string(token.type),
      token.value, token.index, token.query);
}

std::ostream& operator<<(std::ostream& os, Token const& token) {
  return os << token_to_string(token);
}

} // namespace libjsonquery
