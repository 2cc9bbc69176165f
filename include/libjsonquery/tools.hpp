#ifndef LIBJSONQUERY_TOOLS_H
#define LIBJSONQUERY_TOOLS_H

#include "libjsonquery/document.hpp" // libjsonquery::DocumentCache
#include <json/json.h>               // Json::Value
#include <string>                    // std::string
#include <string_view>               // std::string_view

namespace libjsonquery {

// The text content of a tool call. When _is_error_ is true, _text_ is an
// error message starting with "Error: ".
struct ToolResult {
  std::string text{};
  bool is_error{false};
};

// Load the document named by `arguments.path` and evaluate the extended
// JSONPath `arguments.jsonPath` against it.
ToolResult query_tool(DocumentCache& cache, const Json::Value& arguments);

// Load the document named by `arguments.path`, select an array with
// `arguments.jsonPath` and keep the elements satisfying
// `arguments.condition`.
ToolResult filter_tool(DocumentCache& cache, const Json::Value& arguments);

// Dispatch to the tool called _name_. Never throws for a failed call.
ToolResult call_tool(DocumentCache& cache, std::string_view name,
    const Json::Value& arguments);

// Name, description and input schema of every tool.
Json::Value tool_definitions();

} // namespace libjsonquery

#endif // LIBJSONQUERY_TOOLS_H
