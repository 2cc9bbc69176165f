#include "libjsonquery/tools.hpp"
#include "libjsonquery/exceptions.hpp"
#include "libjsonquery/query.hpp"
#include <fmt/format.h>   // fmt::format
#include <glog/logging.h> // LOG VLOG
#include <exception>      // std::exception
#include <initializer_list> // std::initializer_list
#include <utility>          // std::move

namespace libjsonquery {

namespace {

constexpr std::string_view INDENT{"  "};

// Return the string argument _name_ or throw an ArgumentError.
std::string string_argument(const Json::Value& arguments, const char* name) {
  if (!arguments.isMember(name)) {
    throw ArgumentError(fmt::format("missing required argument '{}'", name));
  }

  const auto& value{arguments[name]};
  if (!value.isString()) {
    throw ArgumentError(fmt::format("argument '{}' must be a string", name));
  }
  return value.asString();
}

void expect_object(const Json::Value& arguments) {
  if (!arguments.isObject()) {
    throw ArgumentError("tool arguments must be an object");
  }
}

Json::Value input_schema(std::initializer_list<const char*> names) {
  Json::Value rv{Json::objectValue};
  rv["type"] = "object";
  rv["properties"] = Json::Value{Json::objectValue};
  rv["required"] = Json::Value{Json::arrayValue};

  for (const auto* name : names) {
    rv["properties"][name]["type"] = "string";
    rv["required"].append(name);
  }

  return rv;
}

Json::Value tool(const char* name, const char* description, Json::Value schema) {
  Json::Value rv{Json::objectValue};
  rv["name"] = name;
  rv["description"] = description;
  rv["inputSchema"] = std::move(schema);
  return rv;
}

} // namespace

ToolResult query_tool(DocumentCache& cache, const Json::Value& arguments) {
  expect_object(arguments);
  const auto path{string_argument(arguments, "path")};
  const auto expression{string_argument(arguments, "jsonPath")};

  const auto document{cache.load(path)};
  return ToolResult{write_json(evaluate_query(*document, expression), INDENT)};
}

ToolResult filter_tool(DocumentCache& cache, const Json::Value& arguments) {
  expect_object(arguments);
  const auto path{string_argument(arguments, "path")};
  const auto base_path{string_argument(arguments, "jsonPath")};
  const auto condition{string_argument(arguments, "condition")};

  const auto document{cache.load(path)};
  return ToolResult{
      write_json(evaluate_filter(*document, base_path, condition), INDENT)};
}

ToolResult call_tool(DocumentCache& cache, std::string_view name,
    const Json::Value& arguments) {
  VLOG(1) << "calling tool '" << name << "'";

  try {
    if (name == "query") {
      return query_tool(cache, arguments);
    }
    if (name == "filter") {
      return filter_tool(cache, arguments);
    }
    throw ArgumentError(fmt::format("Unknown tool: {}", name));
  } catch (const std::exception& e) {
    LOG(WARNING) << "tool '" << name << "' failed: " << e.what();
    return ToolResult{fmt::format("Error: {}", e.what()), true};
  }
}

Json::Value tool_definitions() {
  Json::Value rv{Json::arrayValue};
  rv.append(tool("query",
      "Query a local JSON file with extended JSONPath (sort, sum, math, etc.)",
      input_schema({"path", "jsonPath"})));
  rv.append(tool("filter", "Filter an array in a local JSON file",
      input_schema({"path", "jsonPath", "condition"})));
  return rv;
}

} // namespace libjsonquery
