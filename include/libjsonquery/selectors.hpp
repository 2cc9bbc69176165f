#ifndef LIBJSONQUERY_SELECTORS_H
#define LIBJSONQUERY_SELECTORS_H

#include "libjsonquery/tokens.hpp" // Token
#include <json/json.h>             // Json::Value
#include <cstdint>                 // std::int64_t
#include <memory>                  // std::unique_ptr std::make_unique
#include <optional>                // std::optional
#include <string>                  // std::string
#include <utility>                 // std::move
#include <variant>                 // std::variant
#include <vector>                  // std::vector

namespace libjsonquery {

// Heap storage with value semantics. Filter expressions and filter selectors
// contain themselves, so the variants hold them through a Box. Copying a Box
// copies the boxed value.
template <typename T> class Box {
private:
  std::unique_ptr<T> m_ptr;

public:
  Box(T&& expr) : m_ptr{std::make_unique<T>(std::move(expr))} {}
  Box(const T& expr) : m_ptr{std::make_unique<T>(expr)} {}

  Box(const Box& other) : Box(*other.m_ptr) {}
  Box(Box&& other) : Box(std::move(*other.m_ptr)) {}

  Box& operator=(const Box& other) {
    *m_ptr = *other.m_ptr;
    return *this;
  }

  Box& operator=(Box&& other) {
    *m_ptr = std::move(*other.m_ptr);
    return *this;
  }

  ~Box() = default;

  T& operator*() { return *m_ptr; }
  const T& operator*() const { return *m_ptr; }
  T* operator->() { return m_ptr.get(); }
  const T* operator->() const { return m_ptr.get(); }
};

// Comparison and logical operators in filter expressions. _none_ is never
// produced by the parser.
enum class BinaryOperator {
  none,
  logical_and,
  logical_or,
  eq,
  ge,
  gt,
  le,
  lt,
  ne,
};

struct Segment;
struct RecursiveSegment;

// A parsed query, in order of application.
using segments_t = std::vector<std::variant<Segment, RecursiveSegment>>;

struct Literal;
struct LogicalNotExpression;
struct InfixExpression;
struct RelativeQuery;
struct RootQuery;
struct FunctionCall;

// A node in a filter expression tree.
using expression_t = std::variant<Literal, Box<LogicalNotExpression>,
    Box<InfixExpression>, Box<RelativeQuery>, Box<RootQuery>,
    Box<FunctionCall>>;

// A null, boolean, number or string literal in a filter expression.
struct Literal {
  Token token{};
  Json::Value value{};
};

// `!` applied to _right_.
struct LogicalNotExpression {
  Token token{};
  expression_t right{};
};

// A comparison or a logical `&&` / `||`.
struct InfixExpression {
  Token token{};
  expression_t left{};
  BinaryOperator op{};
  expression_t right{};
};

// A query starting with `@`, applied to the current node.
struct RelativeQuery {
  Token token{};
  segments_t query{};
};

// A query starting with `$` inside a filter, applied to the document root.
struct RootQuery {
  Token token{};
  segments_t query{};
};

// A call to one of the filter functions, such as `length(@.title)`.
struct FunctionCall {
  Token token{};
  std::string name{};
  std::vector<expression_t> args{};
};

// Selects an object member by name. _shorthand_ is set for `.name` and unset
// for `['name']`.
struct NameSelector {
  Token token{};
  std::string name{};
  bool shorthand{false};
};

// Selects an array element. Negative indices count from the end.
struct IndexSelector {
  Token token{};
  std::int64_t index{};
};

struct WildSelector {
  Token token{};
  bool shorthand{};
};

// `[start:stop:step]`, with each part optional.
struct SliceSelector {
  Token token{};
  std::optional<std::int64_t> start{};
  std::optional<std::int64_t> stop{};
  std::optional<std::int64_t> step{};
};

struct FilterSelector {
  Token token{};
  expression_t expression{};
};

using selector_t = std::variant<NameSelector, IndexSelector, WildSelector,
    SliceSelector, Box<FilterSelector>>;

// Child segment. Applies its selectors to each input node.
struct Segment {
  Token token;
  std::vector<selector_t> selectors{};
};

// Descendant segment, `..`. Applies its selectors to each input node and
// every node below it.
struct RecursiveSegment {
  Token token;
  std::vector<selector_t> selectors{};
};

// Parser result for a single segment. std::monostate means no more segments.
using segment_t = std::variant<std::monostate, Segment, RecursiveSegment>;

} // namespace libjsonquery

#endif // LIBJSONQUERY_SELECTORS_H
