#ifndef LIBJSONQUERY_OPERATIONS_H
#define LIBJSONQUERY_OPERATIONS_H

#include "libjsonquery/router.hpp" // OperatorKind
#include <json/json.h>             // Json::Value
#include <cstdint>                 // std::int64_t
#include <optional>                // std::optional
#include <string>                  // std::string
#include <string_view>             // std::string_view

// The extension operator engines. Each engine takes its input by const
// reference and returns a new value.

namespace libjsonquery {

struct SortStep {
  std::string field{};
  bool descending{false};
};

struct SliceStep {
  std::optional<std::int64_t> start{};
  std::optional<std::int64_t> end{};
};

// Every array step found in an operator chain. Steps are applied in the
// order sort, distinct, reverse and slice, whatever their order in the
// chain.
struct ArrayOperations {
  std::optional<SortStep> sort{};
  bool distinct{false};
  bool reverse{false};
  std::optional<SliceStep> slice{};
};

// Find `.sort(field)`, `.sort(-field)`, `.distinct()`, `.reverse()` and
// `.[start:end]` in _chain_.
ArrayOperations parse_array_operations(std::string_view chain);

// Apply _operations_ to the array _items_.
Json::Value apply_array_operations(
    const Json::Value& items, const ArrayOperations& operations);

// Return a stable sort of _items_ by member _field_. Elements where _field_
// is missing or null go last, whatever the direction.
Json::Value sort_by(
    const Json::Value& items, std::string_view field, bool descending);

// Return _items_ without repeats, keeping the first of structurally equal
// elements.
Json::Value distinct(const Json::Value& items);

Json::Value reverse(const Json::Value& items);

// Return elements from _start_ up to, but not including, _end_. Negative
// bounds count back from the end of _items_, and bounds are clamped.
Json::Value slice(const Json::Value& items, std::optional<std::int64_t> start,
    std::optional<std::int64_t> end);

// Return the sum, average, minimum or maximum of member _field_ of each
// element in _items_, depending on _kind_. Returns 0 for an empty array or a
// kind that is not an aggregate.
double aggregate(
    const Json::Value& items, OperatorKind kind, std::string_view field);

double sum(const Json::Value& items, std::string_view field);

// Throws an EmptyInputError if _items_ is empty.
double average(const Json::Value& items, std::string_view field);

double minimum(const Json::Value& items, std::string_view field);
double maximum(const Json::Value& items, std::string_view field);

// Coerce each element of _items_ to a number and apply the transform
// _kind_. _arithmetic_ is the tail of a `math()` operator. An arithmetic
// tail that is rejected or fails gives 0 for each element.
Json::Value numeric_transform(
    const Json::Value& items, OperatorKind kind, std::string_view arithmetic);

// Apply the string operator _kind_ to _value_. Values that are not strings
// are returned unchanged. Throws a RegexError if _kind_ is `matches` and
// _argument_ is not a valid regular expression.
Json::Value string_operation(
    const Json::Value& value, OperatorKind kind, std::string_view argument);

// Format each date in _items_ with _format_, or test if it is today,
// depending on _kind_.
Json::Value date_operation(
    const Json::Value& items, OperatorKind kind, std::string_view format);

} // namespace libjsonquery

#endif // LIBJSONQUERY_OPERATIONS_H
