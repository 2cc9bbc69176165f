#ifndef LIBJSONQUERY_JSONPATH_H
#define LIBJSONQUERY_JSONPATH_H

#include "libjsonquery/config.hpp"
#include "libjsonquery/selectors.hpp"
#include <string>
#include <string_view>

namespace libjsonquery {

// libjsonquery version number.
inline constexpr std::string_view VERSION{LIBJSONQUERY_VERSION};

// Parse the standard JSONPath query _s_ into a sequence of segments. Filter
// selectors hold the root of the filter expression's parse tree.
//
// Throws a libjsonquery::SyntaxError, TypeError, NameError or EncodingError.
segments_t parse(std::string_view s);

// Return the canonical form of a parsed query. Shorthand selectors are
// written in brackets, names are double quoted and logical expressions are
// parenthesized.
std::string to_string(const segments_t& path);

// Return true if _segments_ can select at most one value. A singular query is
// made of name and index selectors only, one per segment.
bool singular_query(const segments_t& segments);

} // namespace libjsonquery

#endif // LIBJSONQUERY_JSONPATH_H
