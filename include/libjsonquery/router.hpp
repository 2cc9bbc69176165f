#ifndef LIBJSONQUERY_ROUTER_H
#define LIBJSONQUERY_ROUTER_H

#include <iostream>    // std::ostream
#include <string>      // std::string
#include <string_view> // std::string_view

namespace libjsonquery {

// Extension operator families in routing precedence order. An expression
// belongs to the first family, from _length_ down to _string_, that has an
// operator token in it.
enum class OperatorFamily {
  none,
  length,
  aggregate,
  numeric,
  date,
  array,
  string,
};

enum class OperatorKind {
  none,
  length,
  sort,
  distinct,
  reverse,
  slice,
  sum,
  avg,
  min,
  max,
  math,
  round,
  floor,
  ceil,
  abs,
  sqrt,
  pow2,
  format,
  is_today,
  to_lower,
  to_upper,
  starts_with,
  ends_with,
  contains,
  matches,
};

// An extended expression split into a standard JSONPath base path and the
// operator chain that follows it.
struct ParsedExtension {
  std::string base_path{};
  OperatorFamily family{};
  OperatorKind kind{};

  // The operator's argument. A field name for aggregates, the arithmetic
  // tail for `math()`, the format string for `format()` and the pattern or
  // substring for string predicates. Empty for other kinds.
  std::string args{};

  // The expression text from the first operator token to the end.
  std::string chain{};
};

// Classify _expression_ and split it into its base path and operator chain.
//
// `$.length()` is a family on its own with an empty base path. Otherwise
// the families are tried in precedence order and the first with a `.kw(`
// operator token, or a `.[start:end]` slice token for the array family,
// wins. The base path is everything before that family's first token.
// Expressions without an operator token have family `none` and the whole
// expression as their base path.
ParsedExtension route(std::string_view expression);

std::string operator_family_to_string(OperatorFamily family);
std::string operator_kind_to_string(OperatorKind kind);

std::ostream& operator<<(std::ostream& os, OperatorFamily const& family);
std::ostream& operator<<(std::ostream& os, OperatorKind const& kind);

} // namespace libjsonquery

#endif // LIBJSONQUERY_ROUTER_H
