#ifndef LIBJSONQUERY_PARSE_H
#define LIBJSONQUERY_PARSE_H

#include "libjsonquery/selectors.hpp"
#include "libjsonquery/tokens.hpp"
#include <cstdint>       // std::int32_t std::int64_t
#include <deque>         // std::deque
#include <string>        // std::string
#include <string_view>   // std::string_view
#include <unordered_map> // std::unordered_map
#include <utility>       // std::move
#include <vector>        // std::vector

namespace libjsonquery {

using Tokens = std::deque<Token>;
using TokenIterator = std::deque<Token>::const_iterator;

// The type system used to check function calls in filter expressions.
// _value_ is a JSON value or Nothing, _logical_ is true or false and _nodes_
// is the result of a query.
enum class ExpressionType {
  value,
  logical,
  nodes,
};

// The signature of a filter function.
struct FunctionExtensionTypes {
  std::vector<ExpressionType> args;
  ExpressionType res;
};

// Filter functions available to every query. Each of these has a
// counterpart in FilterExpressionVisitor.
const std::unordered_map<std::string, FunctionExtensionTypes>
    DEFAULT_FUNCTION_EXTENSIONS{
        {"count", {{ExpressionType::nodes}, ExpressionType::value}},
        {"length", {{ExpressionType::value}, ExpressionType::value}},
        {"match", {{ExpressionType::value, ExpressionType::value},
                      ExpressionType::logical}},
        {"search", {{ExpressionType::value, ExpressionType::value},
                       ExpressionType::logical}},
        {"value", {{ExpressionType::nodes}, ExpressionType::value}},
    };

// Recursive descent parser for standard JSONPath queries. Filter expressions
// are parsed by precedence climbing.
//
// A Parser holds nothing but its function table. One instance can parse any
// number of queries, from any number of threads.
class Parser {
public:
  Parser() : m_function_extensions{DEFAULT_FUNCTION_EXTENSIONS} {};
  explicit Parser(std::unordered_map<std::string, FunctionExtensionTypes>
          function_extensions)
      : m_function_extensions{std::move(function_extensions)} {}

  // Build segments from the output of the lexer. The token sequence must
  // end with an EOF or ERROR token.
  segments_t parse(const Tokens& tokens) const;
  segments_t parse(std::string_view s) const;

protected:
  std::unordered_map<std::string, FunctionExtensionTypes> m_function_extensions;
  segments_t parse_path(TokenIterator& tokens) const;
  segments_t parse_filter_path(TokenIterator& tokens) const;
  segment_t parse_segment(TokenIterator& tokens) const;

  std::vector<selector_t> parse_bracketed_selection(
      TokenIterator& tokens) const;

  FilterSelector parse_filter_selector(TokenIterator& tokens) const;
  SliceSelector parse_slice_selector(TokenIterator& tokens) const;

  Literal parse_literal(TokenIterator& tokens) const;

  expression_t parse_logical_not(TokenIterator& tokens) const;
  expression_t parse_infix(TokenIterator& tokens, expression_t left) const;
  expression_t parse_root_query(TokenIterator& tokens) const;
  expression_t parse_relative_query(TokenIterator& tokens) const;
  expression_t parse_function_call(TokenIterator& tokens) const;
  expression_t parse_filter_token(TokenIterator& tokens) const;
  expression_t parse_grouped_expression(TokenIterator& tokens) const;

  expression_t parse_filter_expression(
      TokenIterator& tokens, int precedence) const;

  // Throw a SyntaxError unless the token at _it_ is a _tt_.
  void expect(TokenIterator it, TokenType tt) const;

  // Same as expect(), for the token after _it_.
  void expect_peek(TokenIterator it, TokenType tt) const;

  // Binding power of _tt_ when it follows an operand. Tokens that are not
  // operators bind loosest.
  int get_precedence(TokenType tt) const noexcept;

  // Throws a SyntaxError if _t_ is not a comparison or logical operator.
  BinaryOperator get_binary_operator(const Token& t) const;

  // The value of a quoted string token, with escapes decoded.
  std::string decode_string_token(const Token& t) const;

  // Comparison operands must be singular queries when they are queries.
  void throw_for_non_singular_query(const expression_t& expr) const;

  // Comparison operands must not be functions returning logical or nodes.
  void throw_for_non_comparable_function(const expression_t& expr) const;

private:
  // Value of an INT or INDEX token. Throws a SyntaxError for leading zeros
  // and values outside the int64 range.
  std::int64_t token_to_int(const Token& t) const;

  // Value of a FLOAT token.
  double token_to_double(const Token& t) const;

  // Decode JSON escape sequences in _sv_, producing UTF-8.
  std::string unescape_json_string(
      std::string_view sv, const Token& token) const;

  // The code unit spelled by the four hex digits at _sv_[_index_].
  std::int32_t decode_hex_char(
      std::string_view sv, std::string::size_type index, const Token& token) const;

  // UTF-8 bytes for _code_point_.
  std::string encode_utf8(std::int32_t code_point, const Token& token) const;

  // Throws a NameError for unknown function names.
  ExpressionType function_result_type(
      const std::string& name, const Token& t) const;

  // Check argument count and argument types against the function table.
  void throw_for_function_signature(
      const Token& t, const std::vector<expression_t>& args) const;
};

} // namespace libjsonquery

#endif // LIBJSONQUERY_PARSE_H
