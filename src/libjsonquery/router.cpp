#include "libjsonquery/router.hpp"
#include <re2/re2.h> // RE2
#include <memory>    // std::unique_ptr std::make_unique
#include <utility>   // std::move
#include <vector>    // std::vector

namespace libjsonquery {

namespace {

// A kind within a family and the pattern that finds it in an operator
// chain. A pattern's capture group, if it has one, is the kind's argument.
struct KindRule {
  OperatorKind kind;
  std::unique_ptr<RE2> pattern;
};

// A family, the pattern for its operator tokens and its kinds in the order
// they are tried. The token pattern's capture group starts at the token's
// leading dot.
struct FamilyRule {
  OperatorFamily family;
  std::unique_ptr<RE2> token;
  std::vector<KindRule> kinds;
};

void add_kind(FamilyRule& rule, OperatorKind kind, const char* pattern) {
  rule.kinds.push_back(KindRule{kind, std::make_unique<RE2>(pattern)});
}

std::vector<FamilyRule> make_rules() {
  std::vector<FamilyRule> rules{};

  FamilyRule aggregate{OperatorFamily::aggregate,
      std::make_unique<RE2>(R"((\.(?:sum|avg|min|max)\())"), {}};
  add_kind(aggregate, OperatorKind::sum, R"(\.sum\((\w+)\))");
  add_kind(aggregate, OperatorKind::avg, R"(\.avg\((\w+)\))");
  add_kind(aggregate, OperatorKind::min, R"(\.min\((\w+)\))");
  add_kind(aggregate, OperatorKind::max, R"(\.max\((\w+)\))");
  rules.push_back(std::move(aggregate));

  FamilyRule numeric{OperatorFamily::numeric,
      std::make_unique<RE2>(
          R"((\.(?:math|round|floor|ceil|abs|sqrt|pow2)\())"),
      {}};
  add_kind(numeric, OperatorKind::math, R"(\.math\((.*)\))");
  add_kind(numeric, OperatorKind::round, R"(\.round\(\))");
  add_kind(numeric, OperatorKind::floor, R"(\.floor\(\))");
  add_kind(numeric, OperatorKind::ceil, R"(\.ceil\(\))");
  add_kind(numeric, OperatorKind::abs, R"(\.abs\(\))");
  add_kind(numeric, OperatorKind::sqrt, R"(\.sqrt\(\))");
  add_kind(numeric, OperatorKind::pow2, R"(\.pow2\(\))");
  rules.push_back(std::move(numeric));

  FamilyRule date{OperatorFamily::date,
      std::make_unique<RE2>(R"((\.(?:format|isToday)\())"), {}};
  add_kind(date, OperatorKind::format, R"(\.format\(['"](.+)['"]\))");
  add_kind(date, OperatorKind::is_today, R"(\.isToday\(\))");
  rules.push_back(std::move(date));

  // A slice token is a bracket right after a single dot, so `$..[1:2]`
  // stays a descendant segment.
  FamilyRule array{OperatorFamily::array,
      std::make_unique<RE2>(
          R"((?:^|[^.])(\.(?:(?:sort|distinct|reverse)\(|\[(?:-?\d+)?:(?:-?\d+)?\])))"),
      {}};
  add_kind(array, OperatorKind::sort, R"(\.sort\((-?\w+)\))");
  add_kind(array, OperatorKind::distinct, R"(\.distinct\(\))");
  add_kind(array, OperatorKind::reverse, R"(\.reverse\(\))");
  add_kind(array, OperatorKind::slice, R"(\.\[((?:-?\d+)?:(?:-?\d+)?)\])");
  rules.push_back(std::move(array));

  FamilyRule string{OperatorFamily::string,
      std::make_unique<RE2>(
          R"((\.(?:toLowerCase|toUpperCase|startsWith|endsWith|contains|matches)\())"),
      {}};
  add_kind(string, OperatorKind::to_lower, R"(\.toLowerCase\(\))");
  add_kind(string, OperatorKind::to_upper, R"(\.toUpperCase\(\))");
  add_kind(string, OperatorKind::starts_with, R"(\.startsWith\(['"](.+)['"]\))");
  add_kind(string, OperatorKind::ends_with, R"(\.endsWith\(['"](.+)['"]\))");
  add_kind(string, OperatorKind::contains, R"(\.contains\(['"](.+)['"]\))");
  add_kind(string, OperatorKind::matches, R"(\.matches\(['"](.+)['"]\))");
  rules.push_back(std::move(string));

  return rules;
}

const std::vector<FamilyRule>& family_rules() {
  static const std::vector<FamilyRule> rules{make_rules()};
  return rules;
}

void match_kind(const FamilyRule& rule, ParsedExtension& extension) {
  for (const auto& kind : rule.kinds) {
    const auto& pattern{*kind.pattern};
    if (pattern.NumberOfCapturingGroups() == 0) {
      if (RE2::PartialMatch(extension.chain, pattern)) {
        extension.kind = kind.kind;
        return;
      }
    } else if (RE2::PartialMatch(
                   extension.chain, pattern, &extension.args)) {
      extension.kind = kind.kind;
      return;
    }
  }
}

} // namespace

ParsedExtension route(std::string_view expression) {
  if (expression == "$.length()") {
    return ParsedExtension{
        "", OperatorFamily::length, OperatorKind::length, "", ""};
  }

  for (const auto& rule : family_rules()) {
    re2::StringPiece token{};
    if (!RE2::PartialMatch(expression, *rule.token, &token)) {
      continue;
    }

    const auto position{
        static_cast<std::string_view::size_type>(token.data() - expression.data())};

    ParsedExtension extension{
        std::string{expression.substr(0, position)},
        rule.family,
        OperatorKind::none,
        "",
        std::string{expression.substr(position)},
    };

    match_kind(rule, extension);
    return extension;
  }

  return ParsedExtension{
      std::string{expression}, OperatorFamily::none, OperatorKind::none, "", ""};
}

std::string operator_family_to_string(OperatorFamily family) {
  switch (family) {
  case OperatorFamily::none:
    return "none";
  case OperatorFamily::length:
    return "length";
  case OperatorFamily::aggregate:
    return "aggregate";
  case OperatorFamily::numeric:
    return "numeric";
  case OperatorFamily::date:
    return "date";
  case OperatorFamily::array:
    return "array";
  case OperatorFamily::string:
    return "string";
  default:
    return "UNKNOWN FAMILY";
  }
}

std::string operator_kind_to_string(OperatorKind kind) {
  switch (kind) {
  case OperatorKind::none:
    return "none";
  case OperatorKind::length:
    return "length";
  case OperatorKind::sort:
    return "sort";
  case OperatorKind::distinct:
    return "distinct";
  case OperatorKind::reverse:
    return "reverse";
  case OperatorKind::slice:
    return "slice";
  case OperatorKind::sum:
    return "sum";
  case OperatorKind::avg:
    return "avg";
  case OperatorKind::min:
    return "min";
  case OperatorKind::max:
    return "max";
  case OperatorKind::math:
    return "math";
  case OperatorKind::round:
    return "round";
  case OperatorKind::floor:
    return "floor";
  case OperatorKind::ceil:
    return "ceil";
  case OperatorKind::abs:
    return "abs";
  case OperatorKind::sqrt:
    return "sqrt";
  case OperatorKind::pow2:
    return "pow2";
  case OperatorKind::format:
    return "format";
  case OperatorKind::is_today:
    return "isToday";
  case OperatorKind::to_lower:
    return "toLowerCase";
  case OperatorKind::to_upper:
    return "toUpperCase";
  case OperatorKind::starts_with:
    return "startsWith";
  case OperatorKind::ends_with:
    return "endsWith";
  case OperatorKind::contains:
    return "contains";
  case OperatorKind::matches:
    return "matches";
  default:
    return "UNKNOWN KIND";
  }
}

std::ostream& operator<<(std::ostream& os, OperatorFamily const& family) {
  os << operator_family_to_string(family);
  return os;
}

std::ostream& operator<<(std::ostream& os, OperatorKind const& kind) {
  os << operator_kind_to_string(kind);
  return os;
}

} // namespace libjsonquery
