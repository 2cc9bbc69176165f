#include "libjsonquery/parse.hpp"
#include "libjsonquery/coerce.hpp" // libjsonquery::json_number
#include "libjsonquery/exceptions.hpp"
#include "libjsonquery/lex.hpp"
#include "libjsonquery/jsonpath.hpp" // libjsonquery::singular_query
#include <cstdint>                // std::int32_t std::int64_t
#include <cstdlib>                // std::strtod
#include <iterator>               // std::next
#include <limits>                 // std::numeric_limits
#include <optional>               // std::optional
#include <string>                 // std::string
#include <utility>                // std::move
#include <variant>                // std::holds_alternative std::get

namespace libjsonquery {

using namespace std::string_literals;

namespace {

// Filter expression binding powers, loosest first.
constexpr int PRECEDENCE_LOWEST = 1;
constexpr int PRECEDENCE_LOGICAL_OR = 4;
constexpr int PRECEDENCE_LOGICAL_AND = 5;
constexpr int PRECEDENCE_COMPARISON = 6;
constexpr int PRECEDENCE_PREFIX = 7;

std::optional<BinaryOperator> binary_operator(TokenType tt) noexcept {
  switch (tt) {
  case TokenType::and_:
    return BinaryOperator::logical_and;
  case TokenType::or_:
    return BinaryOperator::logical_or;
  case TokenType::eq:
    return BinaryOperator::eq;
  case TokenType::ne:
    return BinaryOperator::ne;
  case TokenType::lt:
    return BinaryOperator::lt;
  case TokenType::le:
    return BinaryOperator::le;
  case TokenType::gt:
    return BinaryOperator::gt;
  case TokenType::ge:
    return BinaryOperator::ge;
  default:
    return std::nullopt;
  }
}

} // namespace

segments_t Parser::parse(const Tokens& tokens) const {
  if (tokens.empty()) {
    throw SyntaxError("empty query", Token{});
  }

  if (tokens.back().type == TokenType::error) {
    throw SyntaxError(tokens.back().value, tokens.back());
  }

  TokenIterator it = tokens.cbegin();

  if (it->type == TokenType::root) {
    it++;
  }

  auto segments{parse_path(it)};

  if (it->type != TokenType::eof_) {
    throw SyntaxError(
        "expected end of query, found '"s + std::string(it->value) + "'"s,
        *it);
  }

  return segments;
}

segments_t Parser::parse(std::string_view s) const {
  Lexer lexer{s};
  lexer.run();
  return parse(lexer.tokens());
}

segments_t Parser::parse_path(TokenIterator& tokens) const {
  segments_t segments{};

  while (true) {
    auto maybe_segment{parse_segment(tokens)};
    if (std::holds_alternative<std::monostate>(maybe_segment)) {
      break;
    }

    if (std::holds_alternative<Segment>(maybe_segment)) {
      segments.push_back(std::move(std::get<Segment>(maybe_segment)));
    } else {
      segments.push_back(std::move(std::get<RecursiveSegment>(maybe_segment)));
    }

    tokens++;
  }

  return segments;
}

segments_t Parser::parse_filter_path(TokenIterator& tokens) const {
  auto segments{parse_path(tokens)};
  // Leave the iterator on the last token of the query so the filter
  // expression parser can peek at what follows it.
  tokens--;
  return segments;
}

segment_t Parser::parse_segment(TokenIterator& tokens) const {
  Token segment_token{*tokens};
  std::vector<selector_t> selectors{};

  switch (tokens->type) {
  case TokenType::name_:
    selectors.push_back(
        NameSelector{*tokens, decode_string_token(*tokens), true});
    break;
  case TokenType::wild:
    selectors.push_back(WildSelector{*tokens, true});
    break;
  case TokenType::lbracket:
    selectors = parse_bracketed_selection(tokens);
    break;
  case TokenType::ddot: {
    tokens++;
    auto descendant{parse_segment(tokens)};
    if (!std::holds_alternative<Segment>(descendant)) {
      throw SyntaxError("bald descendant segment", segment_token);
    }
    return RecursiveSegment{
        segment_token,
        std::move(std::get<Segment>(descendant).selectors),
    };
  }
  default:
    return segment_t{}; // monostate
  }

  return Segment{segment_token, std::move(selectors)};
}

std::vector<selector_t> Parser::parse_bracketed_selection(
    TokenIterator& tokens) const {
  std::vector<selector_t> items{};
  auto segment_token{*tokens};
  tokens++; // move past left bracket
  auto current{*tokens};

  while (current.type != TokenType::rbracket) {
    switch (current.type) {
    case TokenType::dq_string:
    case TokenType::sq_string:
      items.push_back(
          NameSelector{current, decode_string_token(current), false});
      break;
    case TokenType::filter_:
      items.push_back(parse_filter_selector(tokens));
      break;
    case TokenType::index:
      if (std::next(tokens)->type == TokenType::colon) {
        items.push_back(parse_slice_selector(tokens));
      } else {
        items.push_back(IndexSelector{current, token_to_int(current)});
      }
      break;
    case TokenType::colon:
      items.push_back(parse_slice_selector(tokens));
      break;
    case TokenType::wild:
      items.push_back(WildSelector{current, false});
      break;
    case TokenType::eof_:
      throw SyntaxError("unexpected end of query", current);
    default:
      throw SyntaxError("unexpected token in bracketed selection '"s +
                            std::string(current.value) + "'"s,
          current);
    }

    if (std::next(tokens)->type != TokenType::rbracket) {
      expect_peek(tokens, TokenType::comma);
      tokens++; // move to comma
    }

    tokens++; // move past comma or right bracket
    current = *tokens;
  }

  if (items.empty()) {
    throw SyntaxError("empty bracketed segment", segment_token);
  }

  return items;
}

SliceSelector Parser::parse_slice_selector(TokenIterator& tokens) const {
  SliceSelector selector{*tokens, std::nullopt, std::nullopt, std::nullopt};

  if (tokens->type == TokenType::index) {
    selector.start = token_to_int(*tokens);
    tokens++;
  }

  expect(tokens, TokenType::colon);
  tokens++;

  if (tokens->type == TokenType::index) {
    selector.stop = token_to_int(*tokens);
    tokens++;
  }

  if (tokens->type == TokenType::colon) {
    tokens++;
    if (tokens->type == TokenType::index) {
      selector.step = token_to_int(*tokens);
      tokens++;
    }
  }

  tokens--;
  return selector;
}

FilterSelector Parser::parse_filter_selector(TokenIterator& tokens) const {
  const auto filter_token{*tokens};
  tokens++;
  auto expr{parse_filter_expression(tokens, PRECEDENCE_LOWEST)};

  if (std::holds_alternative<Box<FunctionCall>>(expr)) {
    const auto& func{std::get<Box<FunctionCall>>(expr)};
    if (function_result_type(func->name, func->token) ==
        ExpressionType::value) {
      throw TypeError(
          "result of "s + func->name + "() must be compared", func->token);
    }
  }

  return FilterSelector{filter_token, std::move(expr)};
}

Literal Parser::parse_literal(TokenIterator& tokens) const {
  const auto& token{*tokens};
  switch (token.type) {
  case TokenType::true_:
    return Literal{token, Json::Value{true}};
  case TokenType::false_:
    return Literal{token, Json::Value{false}};
  case TokenType::int_: {
    const auto integer{token_to_int(token)};
    // A negative exponent can make an int literal fractional, like `1e-2`.
    if (token.value.find_first_of("eE") != std::string_view::npos) {
      return Literal{token, json_number(token_to_double(token))};
    }
    return Literal{token, Json::Value{static_cast<Json::Int64>(integer)}};
  }
  case TokenType::float_:
    return Literal{token, Json::Value{token_to_double(token)}};
  case TokenType::dq_string:
  case TokenType::sq_string:
    return Literal{token, Json::Value{decode_string_token(token)}};
  default:
    return Literal{token, Json::Value{Json::nullValue}};
  }
}

expression_t Parser::parse_logical_not(TokenIterator& tokens) const {
  const auto token{*tokens};
  tokens++;
  return Box(LogicalNotExpression{
      token,
      parse_filter_expression(tokens, PRECEDENCE_PREFIX),
  });
}

expression_t Parser::parse_infix(
    TokenIterator& tokens, expression_t left) const {
  auto token{*tokens};
  tokens++;
  auto precedence{get_precedence(token.type)};
  auto op{get_binary_operator(token)};
  auto right{parse_filter_expression(tokens, precedence)};

  if (precedence == PRECEDENCE_COMPARISON) {
    throw_for_non_singular_query(left);
    throw_for_non_singular_query(right);
    throw_for_non_comparable_function(left);
    throw_for_non_comparable_function(right);
  }

  return Box(InfixExpression{
      token,
      std::move(left),
      op,
      std::move(right),
  });
}

expression_t Parser::parse_grouped_expression(TokenIterator& tokens) const {
  tokens++;
  auto expr{parse_filter_expression(tokens, PRECEDENCE_LOWEST)};
  tokens++;

  while (tokens->type != TokenType::rparen) {
    if (tokens->type == TokenType::eof_) {
      throw SyntaxError("unbalanced parentheses", *tokens);
    }
    expr = parse_infix(tokens, std::move(expr));
  }

  expect(tokens, TokenType::rparen);
  return expr;
}

expression_t Parser::parse_root_query(TokenIterator& tokens) const {
  const auto token{*tokens};
  tokens++;
  return Box(RootQuery{token, parse_filter_path(tokens)});
}

expression_t Parser::parse_relative_query(TokenIterator& tokens) const {
  const auto token{*tokens};
  tokens++;
  return Box(RelativeQuery{token, parse_filter_path(tokens)});
}

expression_t Parser::parse_filter_token(TokenIterator& tokens) const {
  switch (tokens->type) {
  case TokenType::false_:
  case TokenType::true_:
  case TokenType::int_:
  case TokenType::float_:
  case TokenType::null_:
  case TokenType::dq_string:
  case TokenType::sq_string:
    return parse_literal(tokens);
  case TokenType::lparen:
    return parse_grouped_expression(tokens);
  case TokenType::not_:
    return parse_logical_not(tokens);
  case TokenType::root:
    return parse_root_query(tokens);
  case TokenType::current:
    return parse_relative_query(tokens);
  case TokenType::func_:
    return parse_function_call(tokens);
  case TokenType::rbracket:
    throw SyntaxError(
        "unexpected end of filter expression, found rbracket", *tokens);
  case TokenType::eof_:
    throw SyntaxError(
        "unexpected end of filter expression, found eof", *tokens);
  default:
    throw SyntaxError("unexpected filter expression token "s +
                          token_type_to_string(tokens->type),
        *tokens);
  }
}

expression_t Parser::parse_function_call(TokenIterator& tokens) const {
  const auto token{*tokens};
  tokens++;
  std::vector<expression_t> args{};

  while (tokens->type != TokenType::rparen) {
    expression_t node{parse_filter_token(tokens)};

    // Is this argument part of a comparison or logical expression?
    while (binary_operator(std::next(tokens)->type)) {
      tokens++;
      node = parse_infix(tokens, std::move(node));
    }

    args.push_back(std::move(node));

    if (std::next(tokens)->type != TokenType::rparen) {
      expect_peek(tokens, TokenType::comma);
      tokens++; // move to the comma
    }

    tokens++;
  }

  expect(tokens, TokenType::rparen);
  throw_for_function_signature(token, args);

  return Box(FunctionCall{
      token,
      std::string{token.value},
      std::move(args),
  });
}

expression_t Parser::parse_filter_expression(
    TokenIterator& tokens, int precedence) const {
  expression_t node{parse_filter_token(tokens)};

  while (true) {
    auto peek_type{std::next(tokens)->type};
    if (peek_type == TokenType::eof_ || peek_type == TokenType::rbracket ||
        get_precedence(peek_type) < precedence) {
      break;
    }

    if (!binary_operator(peek_type)) {
      return node;
    }

    tokens++;
    node = parse_infix(tokens, std::move(node));
  }

  return node;
}

void Parser::expect(TokenIterator it, TokenType tt) const {
  if (it->type != tt) {
    throw SyntaxError("unexpected token, expected "s +
                          token_type_to_string(tt) + " found "s +
                          token_type_to_string(it->type),
        *it);
  }
}

void Parser::expect_peek(TokenIterator it, TokenType tt) const {
  expect(std::next(it), tt);
}

int Parser::get_precedence(TokenType tt) const noexcept {
  switch (tt) {
  case TokenType::or_:
    return PRECEDENCE_LOGICAL_OR;
  case TokenType::and_:
    return PRECEDENCE_LOGICAL_AND;
  case TokenType::eq:
  case TokenType::ne:
  case TokenType::lt:
  case TokenType::le:
  case TokenType::gt:
  case TokenType::ge:
    return PRECEDENCE_COMPARISON;
  case TokenType::not_:
    return PRECEDENCE_PREFIX;
  default:
    return PRECEDENCE_LOWEST;
  }
}

BinaryOperator Parser::get_binary_operator(const Token& t) const {
  const auto op{binary_operator(t.type)};
  if (!op) {
    throw SyntaxError("unknown operator "s + std::string(t.value), t);
  }
  return op.value();
}

std::string Parser::decode_string_token(const Token& t) const {
  if (t.type != TokenType::sq_string) {
    return unescape_json_string(t.value, t);
  }

  // A single quoted string may escape its own quote, which is not a JSON
  // escape sequence.
  std::string s{};
  for (std::string::size_type i = 0; i < t.value.size(); i++) {
    if (t.value[i] == '\\' && i + 1 < t.value.size() &&
        t.value[i + 1] == '\'') {
      continue;
    }
    s.push_back(t.value[i]);
  }
  return unescape_json_string(s, t);
}

void Parser::throw_for_non_singular_query(const expression_t& expr) const {
  if (std::holds_alternative<Box<RootQuery>>(expr)) {
    const auto& root_query{std::get<Box<RootQuery>>(expr)};
    if (!singular_query(root_query->query)) {
      throw TypeError(
          "non-singular query is not comparable", root_query->token);
    }
  }

  if (std::holds_alternative<Box<RelativeQuery>>(expr)) {
    const auto& relative_query{std::get<Box<RelativeQuery>>(expr)};
    if (!singular_query(relative_query->query)) {
      throw TypeError(
          "non-singular query is not comparable", relative_query->token);
    }
  }
}

void Parser::throw_for_non_comparable_function(
    const expression_t& expr) const {
  if (std::holds_alternative<Box<FunctionCall>>(expr)) {
    const auto& func{std::get<Box<FunctionCall>>(expr)};
    if (function_result_type(func->name, func->token) !=
        ExpressionType::value) {
      throw TypeError(
          "result of "s + func->name + "() is not comparable", func->token);
    }
  }
}

std::int64_t Parser::token_to_int(const Token& t) const {
  if (t.value.size() > 1 && t.value.starts_with("0")) {
    if (t.type == TokenType::index) {
      throw SyntaxError(
          "array indicies with a leading zero are not allowed", t);
    }
    throw SyntaxError("integers with a leading zero are not allowed", t);
  }

  if (t.value.starts_with("-0")) {
    if (t.type == TokenType::index) {
      throw SyntaxError("negative zero array indicies are not allowed", t);
    }

    if (t.value.size() > 2) {
      throw SyntaxError("integers with a leading zero are not allowed", t);
    }
  }

  // Integer literals can use scientific notation, so convert to a double
  // first and then check the range.
  const std::string null_terminated_str{t.value};
  const double result{std::strtod(null_terminated_str.c_str(), nullptr)};

  if (result < static_cast<double>(std::numeric_limits<std::int64_t>::min()) ||
      result >= static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
    throw SyntaxError(
        "integer conversion failed for '"s + null_terminated_str + "'"s, t);
  }

  return static_cast<std::int64_t>(result);
}

double Parser::token_to_double(const Token& t) const {
  const std::string null_terminated_str{t.value};
  char* end{nullptr};
  const double result{std::strtod(null_terminated_str.c_str(), &end)};
  if (end == null_terminated_str.c_str() || *end != '\0') {
    throw SyntaxError(
        "float conversion failed for '"s + null_terminated_str + "'"s, t);
  }
  return result;
}

std::int32_t Parser::decode_hex_char(std::string_view sv,
    std::string::size_type index, const Token& token) const {
  if (index + 4 > sv.length()) {
    throw SyntaxError("invalid \\uXXXX escape", token);
  }

  std::int32_t code_point{0};
  for (auto end = index + 4; index < end; index++) {
    const char digit{sv[index]};
    code_point <<= 4;
    if (digit >= '0' && digit <= '9') {
      code_point |= digit - '0';
    } else if (digit >= 'a' && digit <= 'f') {
      code_point |= digit - 'a' + 10;
    } else if (digit >= 'A' && digit <= 'F') {
      code_point |= digit - 'A' + 10;
    } else {
      throw SyntaxError("invalid \\uXXXX escape", token);
    }
  }
  return code_point;
}

std::string Parser::unescape_json_string(
    std::string_view sv, const Token& token) const {
  std::string rv{};
  std::string::size_type index{0};
  const auto length{sv.length()};

  while (index < length) {
    const auto byte{static_cast<unsigned char>(sv[index++])};

    if (byte != '\\') {
      if (byte <= 0x1F) {
        throw SyntaxError("invalid character in string literal", token);
      }
      rv.push_back(static_cast<char>(byte));
      continue;
    }

    if (index >= length) {
      throw SyntaxError("invalid escape", token);
    }

    switch (sv[index++]) {
    case '"':
      rv.push_back('"');
      break;
    case '\'':
      rv.push_back('\'');
      break;
    case '\\':
      rv.push_back('\\');
      break;
    case '/':
      rv.push_back('/');
      break;
    case 'b':
      rv.push_back('\b');
      break;
    case 'f':
      rv.push_back('\f');
      break;
    case 'n':
      rv.push_back('\n');
      break;
    case 'r':
      rv.push_back('\r');
      break;
    case 't':
      rv.push_back('\t');
      break;
    case 'u': {
      auto code_point{decode_hex_char(sv, index, token)};
      index += 4;

      // A high surrogate followed by a low surrogate escape?
      if (code_point >= 0xD800 && code_point <= 0xDBFF &&
          index + 6 <= length && sv[index] == '\\' && sv[index + 1] == 'u') {
        const auto low_surrogate{decode_hex_char(sv, index + 2, token)};
        index += 6;
        code_point = 0x10000 + (((code_point & 0x03FF) << 10) |
                                   (low_surrogate & 0x03FF));
      }

      rv.append(encode_utf8(code_point, token));
      break;
    }
    default:
      throw SyntaxError("invalid escape", token);
    }
  }

  return rv;
}

std::string Parser::encode_utf8(
    std::int32_t code_point, const Token& token) const {
  std::string rv;

  if (code_point <= 0x7F) {
    rv += static_cast<char>(code_point & 0x7F);
  } else if (code_point <= 0x7FF) {
    rv += static_cast<char>(0xC0 | ((code_point >> 6) & 0x1F));
    rv += static_cast<char>(0x80 | (code_point & 0x3F));
  } else if (code_point <= 0xFFFF) {
    rv += static_cast<char>(0xE0 | ((code_point >> 12) & 0x0F));
    rv += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
    rv += static_cast<char>(0x80 | (code_point & 0x3F));
  } else if (code_point <= 0x10FFFF) {
    rv += static_cast<char>(0xF0 | ((code_point >> 18) & 0x07));
    rv += static_cast<char>(0x80 | ((code_point >> 12) & 0x3F));
    rv += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
    rv += static_cast<char>(0x80 | (code_point & 0x3F));
  } else {
    throw EncodingError("invalid code point", token);
  }

  return rv;
}

ExpressionType Parser::function_result_type(
    const std::string& name, const Token& t) const {
  auto it{m_function_extensions.find(name)};
  if (it == m_function_extensions.end()) {
    throw NameError("no such function '"s + name + "'"s, t);
  }
  return it->second.res;
}

void Parser::throw_for_function_signature(
    const Token& t, const std::vector<expression_t>& args) const {
  const std::string name{t.value};
  auto it{m_function_extensions.find(name)};

  if (it == m_function_extensions.end()) {
    throw NameError("no such function '"s + name + "'"s, t);
  }

  const auto& params{it->second.args};

  if (args.size() != params.size()) {
    throw TypeError(name + "() takes "s + std::to_string(params.size()) +
                        " argument"s + (params.size() == 1 ? ""s : "s"s) +
                        ", "s + std::to_string(args.size()) + " given"s,
        t);
  }

  for (std::size_t i = 0; i < params.size(); i++) {
    const auto& arg{args[i]};
    const auto argument{name + "() argument "s + std::to_string(i)};

    const bool is_query{std::holds_alternative<Box<RelativeQuery>>(arg) ||
                        std::holds_alternative<Box<RootQuery>>(arg)};
    const bool is_function{std::holds_alternative<Box<FunctionCall>>(arg)};

    switch (params[i]) {
    case ExpressionType::value:
      if (std::holds_alternative<Box<LogicalNotExpression>>(arg) ||
          std::holds_alternative<Box<InfixExpression>>(arg)) {
        throw TypeError(argument + " must be of ValueType"s, t);
      }
      if (is_query) {
        // Both query types hold their segments in a member named _query_.
        const auto& segments{
            std::holds_alternative<Box<RelativeQuery>>(arg)
                ? std::get<Box<RelativeQuery>>(arg)->query
                : std::get<Box<RootQuery>>(arg)->query};
        if (!singular_query(segments)) {
          throw TypeError(argument + " must be of ValueType"s, t);
        }
      }
      if (is_function &&
          function_result_type(std::get<Box<FunctionCall>>(arg)->name, t) !=
              ExpressionType::value) {
        throw TypeError(argument + " must be of ValueType"s, t);
      }
      break;
    case ExpressionType::logical:
      if (!(is_query ||
              std::holds_alternative<Box<InfixExpression>>(arg) ||
              std::holds_alternative<Box<LogicalNotExpression>>(arg))) {
        throw TypeError(argument + " must be of LogicalType"s, t);
      }
      break;
    case ExpressionType::nodes:
      if (!(is_query ||
              (is_function && function_result_type(
                                  std::get<Box<FunctionCall>>(arg)->name, t) ==
                                  ExpressionType::nodes))) {
        throw TypeError(argument + " must be of NodesType"s, t);
      }
      break;
    }
  }
}

} // namespace libjsonquery
