#include "libjsonquery/find.hpp"
#include "libjsonquery/coerce.hpp"   // libjsonquery::get_field json_equals
#include "libjsonquery/jsonpath.hpp" // libjsonquery::parse
#include <re2/re2.h>                 // RE2
#include <algorithm>                 // std::min std::max
#include <cstdint>                   // std::int64_t
#include <string>                    // std::string
#include <utility>                   // std::move
#include <variant>                   // std::visit std::holds_alternative

namespace libjsonquery {

namespace {

const Json::Value TRUE_VALUE{true};
const Json::Value FALSE_VALUE{false};

// Append _node_ and all of its descendants to _out_, in document order.
void descend(const Json::Value& node, nodes_t& out) {
  out.push_back(&node);
  if (node.isArray() || node.isObject()) {
    for (const auto& child : node) {
      descend(child, out);
    }
  }
}

void apply_selectors(const std::vector<selector_t>& selectors,
    const Json::Value& root, const Json::Value& node, nodes_t& out) {
  for (const auto& selector : selectors) {
    std::visit(SelectorVisitor(root, node, out), selector);
  }
}

// Reduce a filter result to a single value, or nullptr for Nothing. A nodes
// result has a value only if it holds exactly one node.
const Json::Value* as_value(const filter_result_t& result) {
  if (std::holds_alternative<Json::Value>(result)) {
    return &std::get<Json::Value>(result);
  }

  if (std::holds_alternative<bool>(result)) {
    return std::get<bool>(result) ? &TRUE_VALUE : &FALSE_VALUE;
  }

  if (std::holds_alternative<nodes_t>(result)) {
    const auto& nodes{std::get<nodes_t>(result)};
    return nodes.size() == 1 ? nodes.front() : nullptr;
  }

  return nullptr;
}

bool is_truthy(const filter_result_t& result) {
  if (std::holds_alternative<bool>(result)) {
    return std::get<bool>(result);
  }

  if (std::holds_alternative<nodes_t>(result)) {
    return !std::get<nodes_t>(result).empty();
  }

  if (std::holds_alternative<Json::Value>(result)) {
    const auto& value{std::get<Json::Value>(result)};
    return !value.isBool() || value.asBool();
  }

  return false;
}

bool equal_to(const Json::Value* lhs, const Json::Value* rhs) {
  if (!lhs || !rhs) {
    return !lhs && !rhs;
  }
  return json_equals(*lhs, *rhs);
}

// Only numbers with numbers and strings with strings are ordered.
bool less_than(const Json::Value* lhs, const Json::Value* rhs) {
  if (!lhs || !rhs) {
    return false;
  }

  if (lhs->isNumeric() && rhs->isNumeric()) {
    return lhs->asDouble() < rhs->asDouble();
  }

  if (lhs->isString() && rhs->isString()) {
    return lhs->asString() < rhs->asString();
  }

  return false;
}

bool compare(const Json::Value* lhs, BinaryOperator op,
    const Json::Value* rhs) {
  switch (op) {
  case BinaryOperator::eq:
    return equal_to(lhs, rhs);
  case BinaryOperator::ne:
    return !equal_to(lhs, rhs);
  case BinaryOperator::lt:
    return less_than(lhs, rhs);
  case BinaryOperator::le:
    return less_than(lhs, rhs) || equal_to(lhs, rhs);
  case BinaryOperator::gt:
    return less_than(rhs, lhs);
  case BinaryOperator::ge:
    return less_than(rhs, lhs) || equal_to(lhs, rhs);
  default:
    return false;
  }
}

std::int64_t utf8_length(const std::string& s) {
  std::int64_t count{0};
  for (const auto c : s) {
    if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
      count++;
    }
  }
  return count;
}

filter_result_t length_function(const Json::Value* value) {
  if (!value) {
    return Nothing{};
  }

  if (value->isString()) {
    return Json::Value{static_cast<Json::Int64>(utf8_length(value->asString()))};
  }

  if (value->isArray() || value->isObject()) {
    return Json::Value{value->size()};
  }

  return Nothing{};
}

// match() and search(). An invalid pattern never matches.
bool regex_function(
    const Json::Value* value, const Json::Value* pattern, bool full) {
  if (!value || !pattern || !value->isString() || !pattern->isString()) {
    return false;
  }

  RE2::Options options{};
  options.set_log_errors(false);
  const RE2 re{pattern->asString(), options};
  if (!re.ok()) {
    return false;
  }

  return full ? RE2::FullMatch(value->asString(), re)
              : RE2::PartialMatch(value->asString(), re);
}

// Apply _path_ to _node_. Root queries inside filters select from _root_.
nodes_t resolve(
    const segments_t& path, const Json::Value& node, const Json::Value& root) {
  nodes_t nodes{&node};

  for (const auto& segment : path) {
    nodes_t matched{};

    if (std::holds_alternative<Segment>(segment)) {
      const auto& selectors{std::get<Segment>(segment).selectors};
      for (const auto* current : nodes) {
        apply_selectors(selectors, root, *current, matched);
      }
    } else {
      const auto& selectors{std::get<RecursiveSegment>(segment).selectors};
      for (const auto* current : nodes) {
        nodes_t descendants{};
        descend(*current, descendants);
        for (const auto* descendant : descendants) {
          apply_selectors(selectors, root, *descendant, matched);
        }
      }
    }

    nodes = std::move(matched);
  }

  return nodes;
}

} // namespace

nodes_t find(const segments_t& path, const Json::Value& data) {
  return resolve(path, data, data);
}

nodes_t find(std::string_view path, const Json::Value& data) {
  return find(parse(path), data);
}

Json::Value query(std::string_view path, const Json::Value& data) {
  Json::Value rv{Json::arrayValue};
  for (const auto* node : find(path, data)) {
    rv.append(*node);
  }
  return rv;
}

void SelectorVisitor::operator()(const NameSelector& selector) const {
  if (const auto* value{get_field(m_node, selector.name)}) {
    m_out.push_back(value);
  }
}

void SelectorVisitor::operator()(const IndexSelector& selector) const {
  if (!m_node.isArray()) {
    return;
  }

  const auto length{static_cast<std::int64_t>(m_node.size())};
  const auto index{selector.index < 0 ? length + selector.index
                                      : selector.index};
  if (index >= 0 && index < length) {
    m_out.push_back(&m_node[static_cast<Json::ArrayIndex>(index)]);
  }
}

void SelectorVisitor::operator()(const WildSelector&) const {
  if (m_node.isArray() || m_node.isObject()) {
    for (const auto& child : m_node) {
      m_out.push_back(&child);
    }
  }
}

void SelectorVisitor::operator()(const SliceSelector& selector) const {
  if (!m_node.isArray()) {
    return;
  }

  const auto length{static_cast<std::int64_t>(m_node.size())};
  const auto step{selector.step.value_or(1)};
  if (step == 0 || length == 0) {
    return;
  }

  auto normalize{[length](std::int64_t i) { return i >= 0 ? i : length + i; }};
  auto push{[this](std::int64_t i) {
    m_out.push_back(&m_node[static_cast<Json::ArrayIndex>(i)]);
  }};

  if (step > 0) {
    const auto start{normalize(selector.start.value_or(0))};
    const auto stop{normalize(selector.stop.value_or(length))};
    const auto lower{std::min(std::max(start, std::int64_t{0}), length)};
    const auto upper{std::min(std::max(stop, std::int64_t{0}), length)};
    for (auto i = lower; i < upper; i += step) {
      push(i);
    }
  } else {
    const auto start{normalize(selector.start.value_or(length - 1))};
    const auto stop{selector.stop ? normalize(selector.stop.value()) : -1};
    const auto upper{std::min(std::max(start, std::int64_t{-1}), length - 1)};
    const auto lower{std::min(std::max(stop, std::int64_t{-1}), length - 1)};
    for (auto i = upper; lower < i; i += step) {
      push(i);
    }
  }
}

void SelectorVisitor::operator()(const Box<FilterSelector>& selector) const {
  if (!m_node.isArray() && !m_node.isObject()) {
    return;
  }

  for (const auto& child : m_node) {
    const FilterExpressionVisitor visitor{m_root, child};
    if (is_truthy(std::visit(visitor, selector->expression))) {
      m_out.push_back(&child);
    }
  }
}

filter_result_t FilterExpressionVisitor::evaluate(
    const expression_t& expression) const {
  return std::visit(*this, expression);
}

filter_result_t FilterExpressionVisitor::operator()(
    const Literal& expression) const {
  return expression.value;
}

filter_result_t FilterExpressionVisitor::operator()(
    const Box<LogicalNotExpression>& expression) const {
  return !is_truthy(evaluate(expression->right));
}

filter_result_t FilterExpressionVisitor::operator()(
    const Box<InfixExpression>& expression) const {
  switch (expression->op) {
  case BinaryOperator::logical_and:
    return is_truthy(evaluate(expression->left)) &&
           is_truthy(evaluate(expression->right));
  case BinaryOperator::logical_or:
    return is_truthy(evaluate(expression->left)) ||
           is_truthy(evaluate(expression->right));
  default: {
    const auto left{evaluate(expression->left)};
    const auto right{evaluate(expression->right)};
    return compare(as_value(left), expression->op, as_value(right));
  }
  }
}

filter_result_t FilterExpressionVisitor::operator()(
    const Box<RelativeQuery>& expression) const {
  return resolve(expression->query, m_current, m_root);
}

filter_result_t FilterExpressionVisitor::operator()(
    const Box<RootQuery>& expression) const {
  return find(expression->query, m_root);
}

filter_result_t FilterExpressionVisitor::operator()(
    const Box<FunctionCall>& expression) const {
  std::vector<filter_result_t> args{};
  for (const auto& arg : expression->args) {
    args.push_back(evaluate(arg));
  }

  const auto& name{expression->name};

  if (name == "length") {
    return length_function(as_value(args.at(0)));
  }

  if (name == "count") {
    const auto* nodes{std::get_if<nodes_t>(&args.at(0))};
    return Json::Value{static_cast<Json::UInt64>(nodes ? nodes->size() : 0)};
  }

  if (name == "match" || name == "search") {
    return regex_function(
        as_value(args.at(0)), as_value(args.at(1)), name == "match");
  }

  if (name == "value") {
    const auto* value{as_value(args.at(0))};
    if (value) {
      return *value;
    }
    return Nothing{};
  }

  return Nothing{};
}

} // namespace libjsonquery
