#ifndef LIBJSONQUERY_FIND_H
#define LIBJSONQUERY_FIND_H

#include "libjsonquery/selectors.hpp"
#include <json/json.h>  // Json::Value
#include <string_view>  // std::string_view
#include <variant>      // std::variant
#include <vector>       // std::vector

namespace libjsonquery {

// Pointers to values inside a JSON document, in the order a query selected
// them. Nodes are only valid for as long as the document they point into.
using nodes_t = std::vector<const Json::Value*>;

// The result of an empty singular query or a function that has no result.
struct Nothing {};

// The result of evaluating part of a filter expression. _bool_ is a logical
// result, _Json::Value_ a value and _nodes_t_ the nodes from a query.
using filter_result_t = std::variant<Nothing, bool, Json::Value, nodes_t>;

// Apply the JSONPath _path_ to _data_ and return the nodes it selects.
nodes_t find(const segments_t& path, const Json::Value& data);

// Parse _path_ and apply it to _data_. Throws a libjsonquery::SyntaxError,
// TypeError or NameError if _path_ is not a valid JSONPath query.
nodes_t find(std::string_view path, const Json::Value& data);

// Like find(), but return a JSON array holding a copy of each selected value.
Json::Value query(std::string_view path, const Json::Value& data);

// A _selector_t_ visitor appending the values selected from _node_ to
// _out_. _root_ is the document root, used by root queries in filters.
class SelectorVisitor {
public:
  SelectorVisitor(const Json::Value& root, const Json::Value& node,
      nodes_t& out)
      : m_root{root}, m_node{node}, m_out{out} {};

  void operator()(const NameSelector& selector) const;
  void operator()(const IndexSelector& selector) const;
  void operator()(const WildSelector&) const;
  void operator()(const SliceSelector& selector) const;
  void operator()(const Box<FilterSelector>& selector) const;

private:
  const Json::Value& m_root;
  const Json::Value& m_node;
  nodes_t& m_out;
};

// An _expression_t_ visitor evaluating a filter expression against the
// current node _current_.
class FilterExpressionVisitor {
public:
  FilterExpressionVisitor(const Json::Value& root, const Json::Value& current)
      : m_root{root}, m_current{current} {};

  filter_result_t operator()(const Literal& expression) const;
  filter_result_t operator()(const Box<LogicalNotExpression>& expression) const;
  filter_result_t operator()(const Box<InfixExpression>& expression) const;
  filter_result_t operator()(const Box<RelativeQuery>& expression) const;
  filter_result_t operator()(const Box<RootQuery>& expression) const;
  filter_result_t operator()(const Box<FunctionCall>& expression) const;

private:
  const Json::Value& m_root;
  const Json::Value& m_current;

  filter_result_t evaluate(const expression_t& expression) const;
};

} // namespace libjsonquery

#endif // LIBJSONQUERY_FIND_H
