#include "libjsonquery/filter.hpp"
#include "libjsonquery/coerce.hpp"
#include <glog/logging.h> // VLOG
#include <array>          // std::array
#include <unordered_map>  // std::unordered_map
#include <utility>        // std::move

namespace libjsonquery {

namespace {

const std::unordered_map<std::string, BinaryOperator> COMPARISON_OPERATORS{
    {">", BinaryOperator::gt},
    {">=", BinaryOperator::ge},
    {"<", BinaryOperator::lt},
    {"<=", BinaryOperator::le},
    {"==", BinaryOperator::eq},
    {"!=", BinaryOperator::ne},
};

struct PredicatePattern {
  PredicateKind kind;
  const char* keyword;
  const char* pattern;
};

constexpr std::array<PredicatePattern, 4> PREDICATE_PATTERNS{{
    {PredicateKind::contains, ".contains",
        R"(@\.(\w+)\.contains\(['"](.+?)['"]\))"},
    {PredicateKind::starts_with, ".startsWith",
        R"(@\.(\w+)\.startsWith\(['"](.+?)['"]\))"},
    {PredicateKind::ends_with, ".endsWith",
        R"(@\.(\w+)\.endsWith\(['"](.+?)['"]\))"},
    {PredicateKind::matches, ".matches",
        R"(@\.(\w+)\.matches\(['"](.+?)['"]\))"},
}};

const RE2& predicate_regex(PredicateKind kind) {
  static const RE2 contains{PREDICATE_PATTERNS[0].pattern};
  static const RE2 starts_with{PREDICATE_PATTERNS[1].pattern};
  static const RE2 ends_with{PREDICATE_PATTERNS[2].pattern};
  static const RE2 matches{PREDICATE_PATTERNS[3].pattern};

  switch (kind) {
  case PredicateKind::contains:
    return contains;
  case PredicateKind::starts_with:
    return starts_with;
  case PredicateKind::ends_with:
    return ends_with;
  default:
    return matches;
  }
}

std::shared_ptr<const RE2> compile_pattern(const std::string& argument) {
  RE2::Options options{};
  options.set_log_errors(false);
  std::shared_ptr<const RE2> re{std::make_shared<RE2>(argument, options)};
  if (!re->ok()) {
    VLOG(1) << "invalid matches() pattern /" << argument
            << "/: " << re->error();
    return nullptr;
  }
  return re;
}

// Falsy values read as the empty string.
std::string field_string(const Json::Value* value) {
  return truthy(value) ? coerce_string(value) : std::string{};
}

} // namespace

FilterCondition parse_condition(std::string_view condition) {
  static const RE2 comparison{R"(@\.(\w+)\s*([><=!]+)\s*(.+))"};

  for (const auto& candidate : PREDICATE_PATTERNS) {
    if (condition.find(candidate.keyword) == std::string_view::npos) {
      continue;
    }

    std::string field, argument;
    if (RE2::PartialMatch(
            condition, predicate_regex(candidate.kind), &field, &argument)) {
      auto pattern{candidate.kind == PredicateKind::matches
                       ? compile_pattern(argument)
                       : nullptr};
      return StringPredicate{
          std::move(field), candidate.kind, std::move(argument), pattern};
    }
  }

  std::string field, op, raw_value;
  if (!RE2::PartialMatch(condition, comparison, &field, &op, &raw_value)) {
    return Unmatched{};
  }

  auto it{COMPARISON_OPERATORS.find(op)};
  const auto binary_operator{
      it == COMPARISON_OPERATORS.end() ? BinaryOperator::none : it->second};

  if (raw_value.front() == '"' || raw_value.front() == '\'') {
    // Strip the first and last characters, whatever they are.
    const auto inner{raw_value.size() > 1
                         ? raw_value.substr(1, raw_value.size() - 2)
                         : std::string{}};
    return Comparison{std::move(field), binary_operator, inner};
  }

  const Json::Value text{raw_value};
  return Comparison{std::move(field), binary_operator, to_number(&text)};
}

bool ConditionVisitor::operator()(const Unmatched&) const { return false; }

bool ConditionVisitor::operator()(const StringPredicate& predicate) const {
  const auto value{field_string(get_field(m_item, predicate.field))};

  switch (predicate.kind) {
  case PredicateKind::contains:
    return value.find(predicate.argument) != std::string::npos;
  case PredicateKind::starts_with:
    return value.starts_with(predicate.argument);
  case PredicateKind::ends_with:
    return value.ends_with(predicate.argument);
  case PredicateKind::matches:
    return predicate.pattern && RE2::PartialMatch(value, *predicate.pattern);
  }
  return false;
}

bool ConditionVisitor::operator()(const Comparison& comparison) const {
  const auto* value{get_field(m_item, comparison.field)};
  const Json::Value literal{
      std::holds_alternative<double>(comparison.literal)
          ? Json::Value{std::get<double>(comparison.literal)}
          : Json::Value{std::get<std::string>(comparison.literal)}};
  return loose_compare(value, comparison.op, &literal);
}

Json::Value filter_array(const Json::Value& items, std::string_view condition) {
  const auto parsed{parse_condition(condition)};
  Json::Value rv{Json::arrayValue};

  for (const auto& item : items) {
    // Reading a member of null fails, so null elements never match.
    if (item.isNull()) {
      continue;
    }

    if (std::visit(ConditionVisitor(item), parsed)) {
      rv.append(item);
    }
  }

  return rv;
}

} // namespace libjsonquery
