#include "libjsonquery/coerce.hpp"
#include <json/writer.h> // Json::StreamWriterBuilder Json::writeString
#include <re2/re2.h>     // RE2
#include <charconv>      // std::to_chars
#include <cmath>         // std::isnan std::isinf std::isfinite std::nan std::trunc
#include <cstdlib>       // std::strtod std::strtoull
#include <iterator>      // std::begin std::end
#include <limits>        // std::numeric_limits
#include <string>        // std::string
#include <system_error>  // std::errc

namespace libjsonquery {

namespace {

// Quote a JSON string, keeping any embedded NUL bytes.
std::string quote_string(const Json::Value& value) {
  static const Json::StreamWriterBuilder builder{[] {
    Json::StreamWriterBuilder rv{};
    rv["indentation"] = "";
    return rv;
  }()};
  return Json::writeString(builder, value);
}

// Primitive kinds after conversion with ToPrimitive. Arrays and objects
// become strings.
enum class Kind { undefined, null, boolean, number, string, object };

Kind kind_of(const Json::Value* value) noexcept {
  if (!value) {
    return Kind::undefined;
  }

  switch (value->type()) {
  case Json::nullValue:
    return Kind::null;
  case Json::booleanValue:
    return Kind::boolean;
  case Json::intValue:
  case Json::uintValue:
  case Json::realValue:
    return Kind::number;
  case Json::stringValue:
    return Kind::string;
  default:
    return Kind::object;
  }
}

std::string_view trim_whitespace(std::string_view s) {
  constexpr std::string_view whitespace{" \t\n\v\f\r"};
  const auto first{s.find_first_not_of(whitespace)};
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last{s.find_last_not_of(whitespace)};
  return s.substr(first, last - first + 1);
}

double string_to_number(std::string_view s) {
  static const RE2 decimal{R"([+-]?(\d+\.?\d*|\.\d+)([eE][+-]?\d+)?)"};
  static const RE2 hex{"0[xX]([0-9a-fA-F]+)"};
  static const RE2 octal{"0[oO]([0-7]+)"};
  static const RE2 binary{"0[bB]([01]+)"};

  const auto trimmed{trim_whitespace(s)};
  if (trimmed.empty()) {
    return 0;
  }

  if (trimmed == "Infinity" || trimmed == "+Infinity") {
    return std::numeric_limits<double>::infinity();
  }

  if (trimmed == "-Infinity") {
    return -std::numeric_limits<double>::infinity();
  }

  const std::string text{trimmed};

  if (RE2::FullMatch(text, decimal)) {
    return std::strtod(text.c_str(), nullptr);
  }

  std::string digits;
  if (RE2::FullMatch(text, hex, &digits)) {
    return static_cast<double>(std::strtoull(digits.c_str(), nullptr, 16));
  }
  if (RE2::FullMatch(text, octal, &digits)) {
    return static_cast<double>(std::strtoull(digits.c_str(), nullptr, 8));
  }
  if (RE2::FullMatch(text, binary, &digits)) {
    return static_cast<double>(std::strtoull(digits.c_str(), nullptr, 2));
  }

  return std::nan("");
}

std::string primitive_string(const Json::Value& value) {
  if (value.isObject()) {
    return "[object Object]";
  }

  std::string rv{};
  for (Json::ArrayIndex i = 0; i < value.size(); i++) {
    if (i) {
      rv.push_back(',');
    }
    const auto& item{value[i]};
    if (!item.isNull()) {
      rv.append(coerce_string(&item));
    }
  }
  return rv;
}

// Loose equality with both sides already reduced to primitives, the object
// case having been handled by the caller.
bool primitive_loose_equals(const Json::Value* lhs, const Json::Value* rhs) {
  const auto lk{kind_of(lhs)};
  const auto rk{kind_of(rhs)};

  if ((lk == Kind::undefined || lk == Kind::null) &&
      (rk == Kind::undefined || rk == Kind::null)) {
    return true;
  }

  if (lk == Kind::undefined || lk == Kind::null || rk == Kind::undefined ||
      rk == Kind::null) {
    return false;
  }

  if (lk == Kind::string && rk == Kind::string) {
    return lhs->asString() == rhs->asString();
  }

  // Any other mix of numbers, strings and booleans compares as numbers.
  return to_number(lhs) == to_number(rhs);
}

} // namespace

const Json::Value* get_field(const Json::Value& value, std::string_view field) {
  if (!value.isObject()) {
    return nullptr;
  }
  return value.find(field.data(), field.data() + field.size());
}

std::string number_to_string(double number) {
  if (std::isnan(number)) {
    return "NaN";
  }

  if (std::isinf(number)) {
    return number < 0 ? "-Infinity" : "Infinity";
  }

  if (number == 0) {
    return "0";
  }

  // Shortest round trip digits in scientific form, like "1.2345e+02".
  char buffer[64];
  const auto [end, ec]{std::to_chars(std::begin(buffer), std::end(buffer),
      std::abs(number), std::chars_format::scientific)};
  if (ec != std::errc{}) {
    return std::to_string(number);
  }

  const std::string_view scientific(buffer, end - buffer);
  const auto e_pos{scientific.find('e')};
  std::string digits{scientific.substr(0, e_pos)};
  if (digits.size() > 1) {
    digits.erase(1, 1); // remove the decimal point
  }

  const int exponent{std::stoi(std::string{scientific.substr(e_pos + 1)})};
  const int k{static_cast<int>(digits.size())};
  const int n{exponent + 1};
  std::string rv{number < 0 ? "-" : ""};

  if (k <= n && n <= 21) {
    rv.append(digits);
    rv.append(static_cast<std::size_t>(n - k), '0');
  } else if (0 < n && n <= 21) {
    rv.append(digits.substr(0, n));
    rv.push_back('.');
    rv.append(digits.substr(n));
  } else if (-6 < n && n <= 0) {
    rv.append("0.");
    rv.append(static_cast<std::size_t>(-n), '0');
    rv.append(digits);
  } else {
    rv.push_back(digits[0]);
    if (k > 1) {
      rv.push_back('.');
      rv.append(digits.substr(1));
    }
    rv.push_back('e');
    rv.push_back(n - 1 < 0 ? '-' : '+');
    rv.append(std::to_string(std::abs(n - 1)));
  }

  return rv;
}

double to_number(const Json::Value* value) {
  switch (kind_of(value)) {
  case Kind::undefined:
    return std::nan("");
  case Kind::null:
    return 0;
  case Kind::boolean:
    return value->asBool() ? 1 : 0;
  case Kind::number:
    return value->asDouble();
  case Kind::string:
    return string_to_number(value->asString());
  case Kind::object:
    if (value->isObject()) {
      return std::nan("");
    }
    return string_to_number(primitive_string(*value));
  }
  return std::nan("");
}

Json::Value json_number(double number) {
  if (!std::isfinite(number)) {
    return Json::Value{Json::nullValue};
  }

  constexpr double max_safe_integer{9007199254740991.0};
  if (std::trunc(number) == number && std::abs(number) <= max_safe_integer) {
    return Json::Value{static_cast<Json::Int64>(number)};
  }

  return Json::Value{number};
}

double coerce_number(const Json::Value* value) {
  const auto number{to_number(value)};
  return std::isnan(number) ? 0 : number;
}

std::string coerce_string(const Json::Value* value) {
  switch (kind_of(value)) {
  case Kind::undefined:
    return "undefined";
  case Kind::null:
    return "null";
  case Kind::boolean:
    return value->asBool() ? "true" : "false";
  case Kind::number:
    if (value->isInt64()) {
      return std::to_string(value->asInt64());
    }
    return number_to_string(value->asDouble());
  case Kind::string:
    return value->asString();
  case Kind::object:
    return primitive_string(*value);
  }
  return "";
}

bool truthy(const Json::Value* value) {
  switch (kind_of(value)) {
  case Kind::undefined:
  case Kind::null:
    return false;
  case Kind::boolean:
    return value->asBool();
  case Kind::number: {
    const auto number{value->asDouble()};
    return number != 0 && !std::isnan(number);
  }
  case Kind::string:
    return !value->asString().empty();
  case Kind::object:
    return true;
  }
  return false;
}

bool is_nullish(const Json::Value* value) noexcept {
  return !value || value->isNull();
}

std::string canonical_json(const Json::Value& value) {
  switch (value.type()) {
  case Json::nullValue:
    return "null";
  case Json::booleanValue:
    return value.asBool() ? "true" : "false";
  case Json::intValue:
  case Json::uintValue:
  case Json::realValue:
    return coerce_string(&value);
  case Json::stringValue:
    return quote_string(value);
  case Json::arrayValue: {
    std::string rv{"["};
    for (Json::ArrayIndex i = 0; i < value.size(); i++) {
      if (i) {
        rv.push_back(',');
      }
      rv.append(canonical_json(value[i]));
    }
    rv.push_back(']');
    return rv;
  }
  case Json::objectValue: {
    std::string rv{"{"};
    bool first{true};
    for (const auto& name : value.getMemberNames()) {
      if (!first) {
        rv.push_back(',');
      }
      first = false;
      rv.append(quote_string(Json::Value{name}));
      rv.push_back(':');
      rv.append(canonical_json(value[name]));
    }
    rv.push_back('}');
    return rv;
  }
  }
  return "null";
}

bool json_equals(const Json::Value& lhs, const Json::Value& rhs) {
  if (lhs.isNumeric() && rhs.isNumeric() && !lhs.isBool() && !rhs.isBool()) {
    if (lhs.isIntegral() && rhs.isIntegral() && lhs.isInt64() &&
        rhs.isInt64()) {
      return lhs.asInt64() == rhs.asInt64();
    }
    return lhs.asDouble() == rhs.asDouble();
  }

  if (lhs.type() != rhs.type()) {
    return false;
  }

  switch (lhs.type()) {
  case Json::arrayValue:
    if (lhs.size() != rhs.size()) {
      return false;
    }
    for (Json::ArrayIndex i = 0; i < lhs.size(); i++) {
      if (!json_equals(lhs[i], rhs[i])) {
        return false;
      }
    }
    return true;
  case Json::objectValue: {
    if (lhs.size() != rhs.size()) {
      return false;
    }
    for (const auto& name : lhs.getMemberNames()) {
      const auto* other{get_field(rhs, name)};
      if (!other || !json_equals(lhs[name], *other)) {
        return false;
      }
    }
    return true;
  }
  default:
    return lhs == rhs;
  }
}

bool strict_equals(const Json::Value* lhs, const Json::Value* rhs) {
  const auto lk{kind_of(lhs)};
  const auto rk{kind_of(rhs)};

  if (lk != rk) {
    return false;
  }

  switch (lk) {
  case Kind::undefined:
  case Kind::null:
    return true;
  case Kind::boolean:
    return lhs->asBool() == rhs->asBool();
  case Kind::number:
    return lhs->asDouble() == rhs->asDouble();
  case Kind::string:
    return lhs->asString() == rhs->asString();
  case Kind::object:
    return lhs == rhs;
  }
  return false;
}

bool loose_equals(const Json::Value* lhs, const Json::Value* rhs) {
  const auto lk{kind_of(lhs)};
  const auto rk{kind_of(rhs)};

  if (lk == Kind::object && rk == Kind::object) {
    return lhs == rhs;
  }

  // An array or object compared with a primitive converts to a string first.
  // Null and missing never convert.
  if (lk == Kind::object && rk != Kind::null && rk != Kind::undefined) {
    const Json::Value primitive{primitive_string(*lhs)};
    return primitive_loose_equals(&primitive, rhs);
  }

  if (rk == Kind::object && lk != Kind::null && lk != Kind::undefined) {
    const Json::Value primitive{primitive_string(*rhs)};
    return primitive_loose_equals(lhs, &primitive);
  }

  if (lk == Kind::object || rk == Kind::object) {
    return false;
  }

  return primitive_loose_equals(lhs, rhs);
}

std::optional<bool> loose_less_than(
    const Json::Value* lhs, const Json::Value* rhs) {
  const Json::Value left{
      kind_of(lhs) == Kind::object ? Json::Value{primitive_string(*lhs)}
                                   : Json::Value{}};
  const Json::Value right{
      kind_of(rhs) == Kind::object ? Json::Value{primitive_string(*rhs)}
                                   : Json::Value{}};
  const auto* l{kind_of(lhs) == Kind::object ? &left : lhs};
  const auto* r{kind_of(rhs) == Kind::object ? &right : rhs};

  if (kind_of(l) == Kind::string && kind_of(r) == Kind::string) {
    return l->asString() < r->asString();
  }

  const auto ln{to_number(l)};
  const auto rn{to_number(r)};
  if (std::isnan(ln) || std::isnan(rn)) {
    return std::nullopt;
  }
  return ln < rn;
}

bool loose_compare(
    const Json::Value* lhs, BinaryOperator op, const Json::Value* rhs) {
  switch (op) {
  case BinaryOperator::eq:
    return loose_equals(lhs, rhs);
  case BinaryOperator::ne:
    return !loose_equals(lhs, rhs);
  case BinaryOperator::lt:
    return loose_less_than(lhs, rhs).value_or(false);
  case BinaryOperator::gt:
    return loose_less_than(rhs, lhs).value_or(false);
  case BinaryOperator::le: {
    const auto greater{loose_less_than(rhs, lhs)};
    return greater.has_value() && !greater.value();
  }
  case BinaryOperator::ge: {
    const auto less{loose_less_than(lhs, rhs)};
    return less.has_value() && !less.value();
  }
  default:
    return false;
  }
}

} // namespace libjsonquery
