#include "libjsonquery/jsonpath.hpp"
#include "libjsonquery/coerce.hpp" // libjsonquery::number_to_string
#include "libjsonquery/parse.hpp"  // libjsonquery::Parser
#include <json/writer.h>           // Json::valueToQuotedString
#include <algorithm>               // std::all_of
#include <string>                  // std::string
#include <variant>                 // std::visit std::holds_alternative

namespace libjsonquery {

namespace {

// Visitors returning the canonical form of a selector, segment or filter
// expression node.
struct SelectorToStringVisitor {
  std::string operator()(const NameSelector& selector) const;
  std::string operator()(const IndexSelector& selector) const;
  std::string operator()(const WildSelector&) const;
  std::string operator()(const SliceSelector& selector) const;
  std::string operator()(const Box<FilterSelector>& selector) const;
};

struct SegmentToStringVisitor {
  std::string operator()(const Segment& segment) const;
  std::string operator()(const RecursiveSegment& segment) const;
};

struct ExpressionToStringVisitor {
  std::string operator()(const Literal& expression) const;
  std::string operator()(const Box<LogicalNotExpression>& expression) const;
  std::string operator()(const Box<InfixExpression>& expression) const;
  std::string operator()(const Box<RelativeQuery>& expression) const;
  std::string operator()(const Box<RootQuery>& expression) const;
  std::string operator()(const Box<FunctionCall>& expression) const;
};

bool singular_selector(const std::vector<selector_t>& selectors) {
  return selectors.size() == 1 &&
         (std::holds_alternative<NameSelector>(selectors.front()) ||
             std::holds_alternative<IndexSelector>(selectors.front()));
}

std::string binary_operator_to_string(BinaryOperator op) {
  switch (op) {
  case BinaryOperator::logical_and:
    return "&&";
  case BinaryOperator::logical_or:
    return "||";
  case BinaryOperator::eq:
    return "==";
  case BinaryOperator::ge:
    return ">=";
  case BinaryOperator::gt:
    return ">";
  case BinaryOperator::le:
    return "<=";
  case BinaryOperator::lt:
    return "<";
  case BinaryOperator::ne:
    return "!=";
  default:
    return "OPERATOR ERROR";
  }
}

template <typename Items, typename Visitor>
std::string join(const Items& items, Visitor visitor) {
  std::string rv{};
  for (const auto& item : items) {
    if (!rv.empty()) {
      rv.append(", ");
    }
    rv.append(std::visit(visitor, item));
  }
  return rv;
}

} // namespace

segments_t parse(std::string_view s) {
  static const Parser parser{};
  return parser.parse(s);
}

std::string to_string(const segments_t& path) {
  std::string rv{"$"};
  for (const auto& segment : path) {
    rv += std::visit(SegmentToStringVisitor(), segment);
  }
  return rv;
}

bool singular_query(const segments_t& segments) {
  return std::all_of(
      segments.cbegin(), segments.cend(), [](const auto& segment) {
        const auto* child{std::get_if<Segment>(&segment)};
        return child && singular_selector(child->selectors);
      });
}

std::string SelectorToStringVisitor::operator()(
    const NameSelector& selector) const {
  return Json::valueToQuotedString(selector.name.c_str());
}

std::string SelectorToStringVisitor::operator()(
    const IndexSelector& selector) const {
  return std::to_string(selector.index);
}

std::string SelectorToStringVisitor::operator()(const WildSelector&) const {
  return "*";
}

std::string SelectorToStringVisitor::operator()(
    const SliceSelector& selector) const {
  std::string rv{};
  if (selector.start) {
    rv += std::to_string(selector.start.value());
  }
  rv.push_back(':');
  if (selector.stop) {
    rv += std::to_string(selector.stop.value());
  }
  rv.push_back(':');
  rv += selector.step ? std::to_string(selector.step.value()) : "1";
  return rv;
}

std::string SelectorToStringVisitor::operator()(
    const Box<FilterSelector>& selector) const {
  return "?" + std::visit(ExpressionToStringVisitor(), selector->expression);
}

std::string SegmentToStringVisitor::operator()(const Segment& segment) const {
  return "[" + join(segment.selectors, SelectorToStringVisitor()) + "]";
}

std::string SegmentToStringVisitor::operator()(
    const RecursiveSegment& segment) const {
  return "..[" + join(segment.selectors, SelectorToStringVisitor()) + "]";
}

std::string ExpressionToStringVisitor::operator()(
    const Literal& expression) const {
  const auto& value{expression.value};
  if (value.isString()) {
    return Json::valueToQuotedString(value.asCString());
  }
  if (value.isBool()) {
    return value.asBool() ? "true" : "false";
  }
  if (value.isNull()) {
    return "null";
  }
  if (value.type() == Json::realValue) {
    return number_to_string(value.asDouble());
  }
  return std::to_string(value.asInt64());
}

std::string ExpressionToStringVisitor::operator()(
    const Box<LogicalNotExpression>& expression) const {
  return "!" + std::visit(ExpressionToStringVisitor(), expression->right);
}

std::string ExpressionToStringVisitor::operator()(
    const Box<InfixExpression>& expression) const {
  const auto infix{
      std::visit(ExpressionToStringVisitor(), expression->left) + " " +
      binary_operator_to_string(expression->op) + " " +
      std::visit(ExpressionToStringVisitor(), expression->right)};

  if (expression->op == BinaryOperator::logical_and ||
      expression->op == BinaryOperator::logical_or) {
    return "(" + infix + ")";
  }
  return infix;
}

std::string ExpressionToStringVisitor::operator()(
    const Box<RelativeQuery>& expression) const {
  auto path_string{to_string(expression->query)};
  path_string[0] = '@';
  return path_string;
}

std::string ExpressionToStringVisitor::operator()(
    const Box<RootQuery>& expression) const {
  return to_string(expression->query);
}

std::string ExpressionToStringVisitor::operator()(
    const Box<FunctionCall>& expression) const {
  return expression->name + "(" +
         join(expression->args, ExpressionToStringVisitor()) + ")";
}

} // namespace libjsonquery
