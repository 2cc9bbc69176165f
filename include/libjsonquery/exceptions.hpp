#ifndef LIBJSONQUERY_EXCEPTIONS_H
#define LIBJSONQUERY_EXCEPTIONS_H

#include "libjsonquery/tokens.hpp"
#include <exception>   // std::exception
#include <string>      // std::string
#include <string_view> // std::string_view

namespace libjsonquery {

// Return _message_ followed by the query and index of _token_, like
// "unexpected token ('$.foo[':5)".
std::string format_exception(std::string_view message, const Token& token);

// Base class for all exceptions thrown from libjsonquery.
class Exception : public std::exception {
public:
  explicit Exception(std::string_view message) : m_message{message} {};
  Exception(std::string_view message, const Token& token)
      : m_message{format_exception(message, token)}, m_token{token} {};

  const char* what() const noexcept override { return m_message.c_str(); };

  // The token at which a JSONPath error occurred. Default constructed for
  // exceptions that are not tied to a position in a JSONPath query.
  const Token& token() const noexcept { return m_token; };

private:
  std::string m_message{};
  Token m_token{};
};

// An exception thrown due to an error during JSONPath tokenization.
//
// A LexerError indicates a bug in the Lexer class. During normal operation,
// invalid syntax found when scanning a JSONPath query string will leave an
// error token in the resulting _tokens_ collection.
class LexerError : public Exception {
public:
  LexerError(std::string_view message, const Token& token)
      : Exception{message, token} {};
};

// An exception thrown due to invalid JSONPath query syntax.
class SyntaxError : public Exception {
public:
  SyntaxError(std::string_view message, const Token& token)
      : Exception{message, token} {};
};

// An exception thrown when a filter expression is not well-typed.
class TypeError : public Exception {
public:
  TypeError(std::string_view message, const Token& token)
      : Exception{message, token} {};
};

// An exception thrown when a filter expression calls an unknown function.
class NameError : public Exception {
public:
  NameError(std::string_view message, const Token& token)
      : Exception{message, token} {};
};

// An exception thrown when a string literal is not valid UTF-8 or contains an
// invalid code point.
class EncodingError : public Exception {
public:
  EncodingError(std::string_view message, const Token& token)
      : Exception{message, token} {};
};

// Base class for errors raised while applying an extension operator.
class QueryError : public Exception {
public:
  explicit QueryError(std::string_view message) : Exception{message} {};
};

// An exception thrown when a regular expression given to `matches()` does
// not compile.
class RegexError : public QueryError {
public:
  explicit RegexError(std::string_view message) : QueryError{message} {};
};

// An exception thrown when a `math()` expression can not be evaluated.
class ArithmeticError : public QueryError {
public:
  explicit ArithmeticError(std::string_view message) : QueryError{message} {};
};

// An exception thrown when an aggregate needs at least one value.
class EmptyInputError : public QueryError {
public:
  explicit EmptyInputError(std::string_view message) : QueryError{message} {};
};

// An exception thrown when text is not valid JSON.
class JSONError : public Exception {
public:
  explicit JSONError(std::string_view message) : Exception{message} {};
};

// An exception thrown when a JSON document can not be read or parsed.
class DocumentError : public Exception {
public:
  explicit DocumentError(std::string_view message) : Exception{message} {};
};

// An exception thrown when a tool is called with missing or mistyped
// arguments.
class ArgumentError : public Exception {
public:
  explicit ArgumentError(std::string_view message) : Exception{message} {};
};

} // namespace libjsonquery

#endif // LIBJSONQUERY_EXCEPTIONS_H
