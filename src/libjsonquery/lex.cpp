#include "libjsonquery/lex.hpp"
#include <fmt/format.h> // fmt::format
#include <string>       // std::string

namespace libjsonquery {

Lexer::Lexer(std::string_view query) : query{query}, m_length{query.length()} {};

Lexer::State Lexer::lex_root() {
  const auto c{next()};
  if (!c || c.value() != '$') {
    backup();
    error(fmt::format("expected '$', found '{}'", c.value_or(' ')));
    return ERROR;
  }
  emit(TokenType::root);
  return LEX_SEGMENT;
}

Lexer::State Lexer::lex_segment() {
  if (ignore_whitespace() && !peek()) {
    error("trailing whitespace");
    return ERROR;
  }

  const auto maybe_c{next()};
  if (!maybe_c) {
    emit(TokenType::eof_);
    return NONE;
  }

  const auto c{maybe_c.value()};
  switch (c) {
  case '.':
    if (peek().value_or('\0') == '.') {
      next();
      emit(TokenType::ddot);
      return LEX_DESCENDANT_SELECTION;
    }
    return LEX_DOT_SELECTOR;
  case '[':
    emit(TokenType::lbracket);
    return LEX_INSIDE_BRACKETED_SELECTION;
  default:
    backup();
    if (m_filter_nesting_level) {
      return LEX_INSIDE_FILTER;
    }
    error(fmt::format(
        "expected '.', '..' or a bracketed selection, found '{}'", c));
    return ERROR;
  }
}

Lexer::State Lexer::lex_descendant_selection() {
  const auto maybe_c{next()};
  if (!maybe_c) {
    error("bald descendant segment");
    return ERROR;
  }

  const auto c{maybe_c.value()};
  switch (c) {
  case '*':
    emit(TokenType::wild);
    return LEX_SEGMENT;
  case '[':
    emit(TokenType::lbracket);
    return LEX_INSIDE_BRACKETED_SELECTION;
  default:
    backup();
    if (accept_name()) {
      emit(TokenType::name_);
      return LEX_SEGMENT;
    }
    error(fmt::format("unexpected descendant selection token '{}'", c));
    return ERROR;
  }
}

Lexer::State Lexer::lex_dot_selector() {
  ignore(); // Ignore the dot.

  if (ignore_whitespace()) {
    error("unexpected whitespace after dot");
    return ERROR;
  }

  if (accept('*')) {
    emit(TokenType::wild);
    return LEX_SEGMENT;
  }

  if (accept_name()) {
    emit(TokenType::name_);
    return LEX_SEGMENT;
  }

  error(fmt::format(
      "unexpected shorthand selector '{}'", peek().value_or(' ')));
  return ERROR;
}

Lexer::State Lexer::lex_inside_bracketed_selection() {
  std::optional<char> c;
  while (true) {
    ignore_whitespace();
    c = next();

    if (!c) {
      error("unclosed bracketed selection");
      return ERROR;
    }

    switch (c.value()) {
    case ']':
      emit(TokenType::rbracket);
      return m_filter_nesting_level ? LEX_INSIDE_FILTER : LEX_SEGMENT;
    case '*':
      emit(TokenType::wild);
      continue;
    case '?':
      emit(TokenType::filter_);
      m_filter_nesting_level++;
      return LEX_INSIDE_FILTER;
    case ',':
      emit(TokenType::comma);
      continue;
    case ':':
      emit(TokenType::colon);
      continue;
    case '\'':
      return LEX_INSIDE_SINGLE_QUOTED_STRING;
    case '"':
      return LEX_INSIDE_DOUBLE_QUOTED_STRING;
    case '-':
      if (!accept_run(s_digits)) {
        error("expected at least one digit after a minus sign");
        return ERROR;
      }
      // A negative index.
      emit(TokenType::index);
      continue;
    default:
      backup();
      if (accept_run(s_digits)) {
        emit(TokenType::index);
        continue;
      }
      error("unexpected token in bracketed selection");
      return ERROR;
    }
  }
}

bool Lexer::lex_number_tail() {
  auto type{TokenType::int_};

  if (peek().value_or(' ') == '.') {
    next();
    if (!accept_run(s_digits)) {
      error("a fractional digit is required after a decimal point");
      return false;
    }
    type = TokenType::float_;
  }

  if (accept('e') || accept('E')) {
    accept(s_sign);
    if (!accept_run(s_digits)) {
      error("at least one exponent digit is required");
      return false;
    }
  }

  emit(type);
  return true;
}

Lexer::State Lexer::lex_inside_filter() {
  std::optional<char> c;
  std::string_view v;

  while (true) {
    ignore_whitespace();
    c = next();

    if (!c) {
      m_filter_nesting_level--;
      if (!m_paren_stack.empty()) {
        error("unbalanced parentheses");
        return ERROR;
      }
      return LEX_INSIDE_BRACKETED_SELECTION;
    }

    switch (c.value()) {
    case ']':
      m_filter_nesting_level--;
      if (!m_paren_stack.empty()) {
        error("unbalanced parentheses");
        return ERROR;
      }
      backup();
      return LEX_INSIDE_BRACKETED_SELECTION;
    case ',':
      emit(TokenType::comma);
      // Inside a function call a comma separates arguments. Otherwise it
      // separates selectors.
      if (!m_paren_stack.empty()) {
        continue;
      }
      m_filter_nesting_level--;
      return LEX_INSIDE_BRACKETED_SELECTION;
    case '\'':
      return LEX_INSIDE_SINGLE_QUOTED_FILTER_STRING;
    case '"':
      return LEX_INSIDE_DOUBLE_QUOTED_FILTER_STRING;
    case '(':
      emit(TokenType::lparen);
      if (!m_paren_stack.empty()) {
        m_paren_stack.top()++;
      }
      continue;
    case ')':
      emit(TokenType::rparen);
      // Closing a function call or a parenthesized expression?
      if (!m_paren_stack.empty()) {
        if (m_paren_stack.top() == 1) {
          m_paren_stack.pop();
        } else {
          m_paren_stack.top()--;
        }
      }
      continue;
    case '$':
      emit(TokenType::root);
      return LEX_SEGMENT;
    case '@':
      emit(TokenType::current);
      return LEX_SEGMENT;
    case '.':
      backup();
      return LEX_SEGMENT;
    case '!':
      if (accept('=')) {
        emit(TokenType::ne);
      } else {
        emit(TokenType::not_);
      }
      continue;
    case '=':
      if (accept('=')) {
        emit(TokenType::eq);
        continue;
      }
      backup();
      error("unexpected filter selector token '='");
      return ERROR;
    case '<':
      emit(accept('=') ? TokenType::le : TokenType::lt);
      continue;
    case '>':
      emit(accept('=') ? TokenType::ge : TokenType::gt);
      continue;
    case '-':
      if (!accept_run(s_digits)) {
        error("at least one digit is required after a minus sign");
        return ERROR;
      }
      if (!lex_number_tail()) {
        return ERROR;
      }
      continue;
    default:
      backup();

      // Non-negative int or float?
      if (accept_run(s_digits)) {
        if (!lex_number_tail()) {
          return ERROR;
        }
        continue;
      }

      v = view();

      if (v.starts_with("&&")) {
        m_pos += 2;
        emit(TokenType::and_);
        continue;
      }

      if (v.starts_with("||")) {
        m_pos += 2;
        emit(TokenType::or_);
        continue;
      }

      if (v.starts_with("true")) {
        m_pos += 4;
        emit(TokenType::true_);
        continue;
      }

      if (v.starts_with("false")) {
        m_pos += 5;
        emit(TokenType::false_);
        continue;
      }

      if (v.starts_with("null")) {
        m_pos += 4;
        emit(TokenType::null_);
        continue;
      }

      // Function call?
      if (accept(s_function_name_first)) {
        while (is_function_name_char(peek().value_or(' '))) {
          next();
        }

        if (peek().value_or(' ') != '(') {
          error("expected a function call");
          return ERROR;
        }

        m_paren_stack.push(1);
        emit(TokenType::func_);
        next(); // Discard the left paren.
        ignore();
        continue;
      }
    }

    error(fmt::format("unexpected filter selection token '{}'", c.value()));
    return ERROR;
  }
}

template <Lexer::State next_state, char quote, TokenType token_type>
Lexer::State Lexer::lex_inside_string() {
  ignore(); // Ignore the opening quote.

  while (true) {
    const auto c{next()};

    if (!c) {
      error(fmt::format("unclosed string starting at index {}", m_start));
      return ERROR;
    }

    if (c.value() == '\\') {
      if (!next()) {
        error("invalid escape");
        return ERROR;
      }
      continue;
    }

    if (c.value() == quote) {
      backup();
      emit(token_type);
      next();
      ignore(); // Ignore the closing quote.
      return next_state;
    }
  }
}

void Lexer::run() {
  auto current_state{LEX_ROOT};

  while (true) {
    switch (current_state) {
    case ERROR:
    case NONE:
      return;
    case LEX_ROOT:
      current_state = lex_root();
      break;
    case LEX_SEGMENT:
      current_state = lex_segment();
      break;
    case LEX_DESCENDANT_SELECTION:
      current_state = lex_descendant_selection();
      break;
    case LEX_DOT_SELECTOR:
      current_state = lex_dot_selector();
      break;
    case LEX_INSIDE_BRACKETED_SELECTION:
      current_state = lex_inside_bracketed_selection();
      break;
    case LEX_INSIDE_FILTER:
      current_state = lex_inside_filter();
      break;
    case LEX_INSIDE_SINGLE_QUOTED_STRING:
      current_state = lex_inside_string<LEX_INSIDE_BRACKETED_SELECTION, '\'',
          TokenType::sq_string>();
      break;
    case LEX_INSIDE_DOUBLE_QUOTED_STRING:
      current_state = lex_inside_string<LEX_INSIDE_BRACKETED_SELECTION, '"',
          TokenType::dq_string>();
      break;
    case LEX_INSIDE_SINGLE_QUOTED_FILTER_STRING:
      current_state =
          lex_inside_string<LEX_INSIDE_FILTER, '\'', TokenType::sq_string>();
      break;
    case LEX_INSIDE_DOUBLE_QUOTED_FILTER_STRING:
      current_state =
          lex_inside_string<LEX_INSIDE_FILTER, '"', TokenType::dq_string>();
      break;
    default:
      error("unknown lexer state");
      return;
    }
  }
}

void Lexer::emit(TokenType t) {
  m_tokens.push_back(
      Token{t, query.substr(m_start, m_pos - m_start), m_start, query});
  m_start = m_pos;
}

std::optional<char> Lexer::next() {
  if (m_pos >= m_length) {
    return std::nullopt;
  }
  return query[m_pos++];
}

std::string_view Lexer::view() const { return query.substr(m_pos); }

void Lexer::ignore() { m_start = m_pos; }

void Lexer::backup() {
  if (m_pos > m_start) {
    --m_pos;
  }
}

std::optional<char> Lexer::peek() {
  if (m_pos >= m_length) {
    return std::nullopt;
  }
  return query[m_pos];
}

bool Lexer::accept(const char ch) {
  if (peek() == ch) {
    next();
    return true;
  }
  return false;
}

bool Lexer::accept(const std::unordered_set<char>& valid) {
  const auto c{peek()};
  if (c && valid.contains(c.value())) {
    next();
    return true;
  }
  return false;
}

bool Lexer::accept_run(const std::unordered_set<char>& valid) {
  auto found{false};
  while (accept(valid)) {
    found = true;
  }
  return found;
}

bool Lexer::accept_name() {
  const auto c{peek()};
  if (!c || !is_name_first(c.value())) {
    return false;
  }

  next();
  while (is_name_char(peek().value_or(' '))) {
    next();
  }
  return true;
}

bool Lexer::ignore_whitespace() {
  if (accept_run(s_whitespace)) {
    ignore();
    return true;
  }
  return false;
}

void Lexer::error(std::string_view message) {
  m_error = message;
  m_tokens.push_back(Token{TokenType::error, m_error, m_pos, query});
}

bool Lexer::is_name_first(char c) noexcept {
  const auto byte{static_cast<unsigned char>(c)};
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' ||
         byte >= 0x80;
}

bool Lexer::is_name_char(char c) noexcept {
  return is_name_first(c) || (c >= '0' && c <= '9');
}

bool Lexer::is_function_name_char(char c) noexcept {
  return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
}

} // namespace libjsonquery
