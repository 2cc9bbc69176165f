#include "libjsonquery/query.hpp"
#include "libjsonquery/coerce.hpp"   // libjsonquery::json_number
#include "libjsonquery/filter.hpp"   // libjsonquery::filter_array
#include "libjsonquery/find.hpp"     // libjsonquery::find
#include "libjsonquery/jsonpath.hpp" // libjsonquery::parse libjsonquery::singular_query
#include "libjsonquery/operations.hpp"
#include "libjsonquery/router.hpp"
#include <glog/logging.h>         // VLOG

namespace libjsonquery {

namespace {

bool selects_document(std::string_view base_path) {
  return base_path.empty() || base_path == "$";
}

// The first value selected by _base_path_, or null.
Json::Value evaluate_first(
    const Json::Value& document, std::string_view base_path) {
  if (selects_document(base_path)) {
    return document;
  }

  const auto nodes{find(base_path, document)};
  if (nodes.empty()) {
    return Json::Value{Json::nullValue};
  }
  return *nodes.front();
}

Json::Value collection_length(const Json::Value& document) {
  if (document.isArray() || document.isObject()) {
    return Json::Value{document.size()};
  }
  return Json::Value{0};
}

} // namespace

std::optional<Json::Value> evaluate_base(
    const Json::Value& document, std::string_view base_path) {
  if (selects_document(base_path)) {
    return document;
  }

  const auto segments{parse(base_path)};
  const auto nodes{find(segments, document)};

  if (singular_query(segments)) {
    if (nodes.empty()) {
      return std::nullopt;
    }
    return *nodes.front();
  }

  Json::Value rv{Json::arrayValue};
  for (const auto* node : nodes) {
    rv.append(*node);
  }
  return rv;
}

Json::Value as_sequence(const std::optional<Json::Value>& value) {
  if (!value) {
    return Json::Value{Json::arrayValue};
  }

  if (value->isArray()) {
    return value.value();
  }

  Json::Value rv{Json::arrayValue};
  rv.append(value.value());
  return rv;
}

Json::Value evaluate_query(
    const Json::Value& document, std::string_view expression) {
  const auto extension{route(expression)};
  VLOG(2) << "'" << expression << "' routed to " << extension.family << "/"
          << extension.kind << " with base path '" << extension.base_path
          << "'";

  switch (extension.family) {
  case OperatorFamily::length:
    return collection_length(document);
  case OperatorFamily::aggregate:
    return json_number(aggregate(
        as_sequence(evaluate_base(document, extension.base_path)),
        extension.kind, extension.args));
  case OperatorFamily::numeric:
    return numeric_transform(
        as_sequence(evaluate_base(document, extension.base_path)),
        extension.kind, extension.args);
  case OperatorFamily::date:
    return date_operation(
        as_sequence(evaluate_base(document, extension.base_path)),
        extension.kind, extension.args);
  case OperatorFamily::array:
    return apply_array_operations(
        as_sequence(evaluate_base(document, extension.base_path)),
        parse_array_operations(extension.chain));
  case OperatorFamily::string:
    return string_operation(evaluate_first(document, extension.base_path),
        extension.kind, extension.args);
  default:
    return query(expression, document);
  }
}

Json::Value evaluate_filter(const Json::Value& document, std::string_view path,
    std::string_view condition) {
  return filter_array(
      as_sequence(evaluate_base(document, path)), condition);
}

} // namespace libjsonquery
