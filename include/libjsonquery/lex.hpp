#ifndef LIBJSONQUERY_LEX_H
#define LIBJSONQUERY_LEX_H

#include "libjsonquery/tokens.hpp"
#include <deque>         // std::deque
#include <optional>      // std::optional
#include <stack>         // std::stack
#include <string>        // std::string
#include <string_view>   // std::string_view
#include <unordered_set> // std::unordered_set

namespace libjsonquery {

// A JSONPath query tokenizer.
//
// Call _run()_ once, then read tokens from _tokens()_. Scanning stops at the
// first error, leaving a token of type _TokenType::error_ at the end of the
// token sequence. The error token's value is the error message.
//
// Token values are views into the query string and, for error tokens, into
// the lexer itself. Both must outlive the tokens.
class Lexer {
public:
  explicit Lexer(std::string_view query);

  // The query string being tokenized.
  const std::string_view query;

  // Scan the query string and populate the token sequence.
  void run();

  const std::deque<Token>& tokens() const noexcept { return m_tokens; };

private:
  enum State {
    ERROR,
    NONE,
    LEX_ROOT,
    LEX_SEGMENT,
    LEX_DESCENDANT_SELECTION,
    LEX_DOT_SELECTOR,
    LEX_INSIDE_BRACKETED_SELECTION,
    LEX_INSIDE_FILTER,
    LEX_INSIDE_SINGLE_QUOTED_STRING,
    LEX_INSIDE_DOUBLE_QUOTED_STRING,
    LEX_INSIDE_SINGLE_QUOTED_FILTER_STRING,
    LEX_INSIDE_DOUBLE_QUOTED_FILTER_STRING,
  };

  inline static const std::unordered_set<char> s_digits{
      '0', '1', '2', '3', '4', '5', '6', '7', '8', '9'};

  inline static const std::unordered_set<char> s_sign{'+', '-'};

  inline static const std::unordered_set<char> s_whitespace{
      ' ', '\n', '\r', '\t'};

  inline static const std::unordered_set<char> s_function_name_first{'a', 'b',
      'c', 'd', 'e', 'f', 'g', 'h', 'i', 'j', 'k', 'l', 'm', 'n', 'o', 'p', 'q',
      'r', 's', 't', 'u', 'v', 'w', 'x', 'y', 'z'};

  std::string::size_type m_length{};
  std::string::size_type m_start{0};
  std::string::size_type m_pos{0};
  int m_filter_nesting_level{0};

  // Open parentheses for each function call we are currently inside of.
  std::stack<int> m_paren_stack{};

  std::deque<Token> m_tokens{};
  std::string m_error{};

  State lex_root();
  State lex_segment();
  State lex_descendant_selection();
  State lex_dot_selector();
  State lex_inside_bracketed_selection();
  State lex_inside_filter();

  template <State next_state, char quote, TokenType token_type>
  State lex_inside_string();

  // Consume the rest of a number whose integer digits have been accepted,
  // then emit an int or float token. Return false after emitting an error.
  bool lex_number_tail();

  // Append a token of type _t_ covering the text from m_start to m_pos.
  void emit(TokenType t);

  // Return the next character and advance, or nullopt at the end of the query.
  std::optional<char> next();

  // The rest of the query from the current position.
  std::string_view view() const;

  // Discard the text between m_start and m_pos.
  void ignore();

  // Step back one character, never beyond m_start.
  void backup();

  // Return the next character without consuming it.
  std::optional<char> peek();

  // Consume the next character if it is _ch_ or is in _valid_.
  bool accept(char ch);
  bool accept(const std::unordered_set<char>& valid);

  // Consume a run of characters from _valid_. Return true if at least one
  // character was consumed.
  bool accept_run(const std::unordered_set<char>& valid);

  // Consume a shorthand member name.
  bool accept_name();

  // Consume and ignore whitespace. Return true if any whitespace was found.
  bool ignore_whitespace();

  // Append an error token with _message_ as its value.
  void error(std::string_view message);

  static bool is_name_first(char c) noexcept;
  static bool is_name_char(char c) noexcept;
  static bool is_function_name_char(char c) noexcept;
};

} // namespace libjsonquery

#endif // LIBJSONQUERY_LEX_H
