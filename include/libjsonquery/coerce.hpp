#ifndef LIBJSONQUERY_COERCE_H
#define LIBJSONQUERY_COERCE_H

#include "libjsonquery/selectors.hpp" // BinaryOperator
#include <json/json.h>                // Json::Value
#include <optional>                   // std::optional
#include <string>                     // std::string
#include <string_view>                // std::string_view

// Value coercion and comparison used by the extension operators and the
// complex filter.
//
// These functions take `const Json::Value*` where a value may be missing,
// like a field read from an object that does not have it. A null pointer is
// "missing". Missing and JSON null are loosely equal to each other and to
// nothing else, both sort last and both are falsy.
//
// The coercion rules are the loose rules of a dynamically typed host:
// numbers read from strings, booleans count as 0 and 1, and ordering
// comparisons between two strings are lexicographic while everything else
// is compared as numbers.

namespace libjsonquery {

// Return a pointer to member _field_ of _value_, or nullptr if _value_ is not
// an object or does not have the member.
const Json::Value* get_field(const Json::Value& value, std::string_view field);

// Return the shortest decimal representation of _number_ that reads back to
// the same double. Integral values have no fraction, and very large or very
// small magnitudes use exponent notation, like "1e+21" and "1.5e-7".
std::string number_to_string(double number);

// Return _value_ as a number. Strings are trimmed and read as decimal (or
// 0x/0o/0b prefixed integers), with the empty string being 0. Booleans are
// 1 and 0, null is 0, arrays convert through their string form. Missing
// values, objects and unreadable strings are NaN.
double to_number(const Json::Value* value);

// Return _number_ as a JSON value. Integral numbers that a double holds
// exactly become integers, non-finite numbers become null.
Json::Value json_number(double number);

// Like to_number, but NaN is replaced with 0.
double coerce_number(const Json::Value* value);

// Return _value_ as a string. Numbers use number_to_string, arrays join their
// elements with commas and objects are "[object Object]". Missing values are
// "undefined".
std::string coerce_string(const Json::Value* value);

// Return false for missing values, null, false, 0, NaN and the empty string.
bool truthy(const Json::Value* value);

// Return true if _value_ is missing or null.
bool is_nullish(const Json::Value* value) noexcept;

// Return a compact JSON serialization of _value_ with object members in key
// order and numbers printed by number_to_string. Structurally equal values
// have identical canonical text.
std::string canonical_json(const Json::Value& value);

// Deep equality of two JSON values. Numbers compare by value, whether they
// were read as integers or reals.
bool json_equals(const Json::Value& lhs, const Json::Value& rhs);

// Strict equality. Primitives of the same type and value are equal, arrays
// and objects only equal themselves.
bool strict_equals(const Json::Value* lhs, const Json::Value* rhs);

// Loose equality. Numbers, strings and booleans compare as numbers when their
// types differ, arrays and objects convert to strings, and null only equals
// null and missing.
bool loose_equals(const Json::Value* lhs, const Json::Value* rhs);

// The relational comparison _lhs_ < _rhs_, or nullopt if either side converts
// to NaN.
std::optional<bool> loose_less_than(
    const Json::Value* lhs, const Json::Value* rhs);

// Compare _lhs_ with _rhs_ using one of the comparison operators eq, ne, lt,
// le, gt or ge. Comparisons involving NaN are false, except for ne.
bool loose_compare(
    const Json::Value* lhs, BinaryOperator op, const Json::Value* rhs);

} // namespace libjsonquery

#endif // LIBJSONQUERY_COERCE_H
