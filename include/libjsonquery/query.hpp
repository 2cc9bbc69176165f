#ifndef LIBJSONQUERY_QUERY_H
#define LIBJSONQUERY_QUERY_H

#include <json/json.h> // Json::Value
#include <optional>    // std::optional
#include <string_view> // std::string_view

namespace libjsonquery {

// Evaluate the extended JSONPath _expression_ against _document_.
//
// The expression is routed to an operator family, its base path is
// evaluated as standard JSONPath and the family's engine is applied to the
// result. An expression without extension operators returns an array of
// every value it selects.
//
// Throws a libjsonquery::SyntaxError, TypeError or NameError if the base
// path is not valid JSONPath, and a libjsonquery::RegexError for an invalid
// `matches()` pattern. _document_ is never modified.
Json::Value evaluate_query(
    const Json::Value& document, std::string_view expression);

// Select an array from _document_ with the JSONPath _path_ and return the
// elements that satisfy the filter _condition_.
Json::Value evaluate_filter(const Json::Value& document, std::string_view path,
    std::string_view condition);

// Evaluate a base path. An empty path or `$` selects _document_ itself. A
// singular query returns the value it selects, or nullopt if it selects
// nothing, while any other query returns an array of every selected value.
std::optional<Json::Value> evaluate_base(
    const Json::Value& document, std::string_view base_path);

// Return _value_ if it is an array, an empty array for nullopt, or an array
// holding _value_.
Json::Value as_sequence(const std::optional<Json::Value>& value);

} // namespace libjsonquery

#endif // LIBJSONQUERY_QUERY_H
