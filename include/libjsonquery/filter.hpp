#ifndef LIBJSONQUERY_FILTER_H
#define LIBJSONQUERY_FILTER_H

#include "libjsonquery/selectors.hpp" // BinaryOperator
#include <json/json.h>                // Json::Value
#include <re2/re2.h>                  // RE2
#include <memory>                     // std::shared_ptr
#include <string>                     // std::string
#include <string_view>                // std::string_view
#include <variant>                    // std::variant

namespace libjsonquery {

enum class PredicateKind {
  contains,
  starts_with,
  ends_with,
  matches,
};

// A condition like `@.title.contains('Moby')`.
struct StringPredicate {
  std::string field{};
  PredicateKind kind{};
  std::string argument{};

  // The compiled argument of a `matches` predicate. Null for other kinds and
  // when the argument is not a valid pattern, in which case nothing matches.
  std::shared_ptr<const RE2> pattern{};
};

// A condition like `@.price > 10` or `@.category == 'fiction'`.
struct Comparison {
  std::string field{};
  BinaryOperator op{};
  std::variant<double, std::string> literal{};
};

// A condition that is neither a string predicate nor a comparison.
struct Unmatched {};

using FilterCondition = std::variant<Unmatched, StringPredicate, Comparison>;

// Parse a filter condition. String predicates are tried first, in the order
// contains, startsWith, endsWith and matches, then comparisons. A comparison
// with an operator other than >, >=, <, <=, == or != is parsed with
// BinaryOperator::none and matches nothing.
FilterCondition parse_condition(std::string_view condition);

// A _FilterCondition_ visitor returning true if _item_ satisfies the
// condition.
class ConditionVisitor {
public:
  explicit ConditionVisitor(const Json::Value& item) : m_item{item} {};

  bool operator()(const Unmatched&) const;
  bool operator()(const StringPredicate& predicate) const;
  bool operator()(const Comparison& comparison) const;

private:
  const Json::Value& m_item;
};

// Return the elements of _items_ that satisfy _condition_, in their
// original order.
Json::Value filter_array(const Json::Value& items, std::string_view condition);

} // namespace libjsonquery

#endif // LIBJSONQUERY_FILTER_H
