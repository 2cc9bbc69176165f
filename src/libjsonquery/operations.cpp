#include "libjsonquery/operations.hpp"
#include "libjsonquery/arithmetic.hpp" // libjsonquery::apply_arithmetic
#include "libjsonquery/coerce.hpp"
#include "libjsonquery/dates.hpp"
#include "libjsonquery/exceptions.hpp"
#include <glog/logging.h> // VLOG
#include <re2/re2.h>      // RE2
#include <algorithm>      // std::min std::min_element std::copy
#include <charconv>       // std::from_chars
#include <cmath>          // std::floor std::ceil std::abs std::sqrt
#include <cstddef>        // std::size_t
#include <limits>         // std::numeric_limits
#include <system_error>   // std::errc
#include <string>         // std::string
#include <string_view>    // std::string_view
#include <unordered_set>  // std::unordered_set
#include <vector>         // std::vector

namespace libjsonquery {

using namespace std::string_literals;

namespace {

using elements_t = std::vector<const Json::Value*>;

// Read a slice bound. Bounds too big for an int64 saturate.
std::optional<std::int64_t> parse_bound(const std::string& digits) {
  if (digits.empty()) {
    return std::nullopt;
  }

  std::int64_t rv{};
  const auto [ptr, ec]{
      std::from_chars(digits.data(), digits.data() + digits.size(), rv)};
  if (ec == std::errc::result_out_of_range) {
    return digits.front() == '-' ? std::numeric_limits<std::int64_t>::min()
                                 : std::numeric_limits<std::int64_t>::max();
  }
  return rv;
}

std::int64_t relative_index(std::int64_t index, std::int64_t length) {
  if (index < 0) {
    return index < -length ? 0 : length + index;
  }
  return std::min(index, length);
}

// Compare elements the way a host sort comparator would, returning a
// negative number, zero or a positive number. Missing and null fields sort
// after everything else. The result is not a consistent ordering when mixed
// types are involved.
int compare_elements(const Json::Value* a, const Json::Value* b,
    std::string_view field, bool descending) {
  const auto* a_value{get_field(*a, field)};
  const auto* b_value{get_field(*b, field)};

  // Nullish values tie with each other and keep their input order.
  if (is_nullish(a_value) && is_nullish(b_value)) {
    return 0;
  }

  if (is_nullish(a_value)) {
    return 1;
  }

  if (is_nullish(b_value)) {
    return -1;
  }

  if (strict_equals(a_value, b_value)) {
    return 0;
  }

  const auto greater{descending ? loose_less_than(a_value, b_value)
                                : loose_less_than(b_value, a_value)};
  return greater.value_or(false) ? 1 : -1;
}

template <typename Compare>
void merge_sort(elements_t& items, elements_t& buffer, std::size_t lo,
    std::size_t hi, Compare compare) {
  if (hi - lo < 2) {
    return;
  }

  const auto mid{lo + (hi - lo) / 2};
  merge_sort(items, buffer, lo, mid, compare);
  merge_sort(items, buffer, mid, hi, compare);

  auto left{lo};
  auto right{mid};
  auto out{lo};

  while (left < mid && right < hi) {
    // Take from the left run unless the right element must come first.
    if (compare(items[left], items[right]) > 0) {
      buffer[out++] = items[right++];
    } else {
      buffer[out++] = items[left++];
    }
  }

  std::copy(items.begin() + left, items.begin() + mid, buffer.begin() + out);
  out += mid - left;
  std::copy(items.begin() + right, items.begin() + hi, buffer.begin() + out);
  std::copy(buffer.begin() + lo, buffer.begin() + hi, items.begin() + lo);
}

std::vector<double> field_values(
    const Json::Value& items, std::string_view field) {
  std::vector<double> rv{};
  rv.reserve(items.size());
  for (const auto& item : items) {
    rv.push_back(coerce_number(get_field(item, field)));
  }
  return rv;
}

double apply_numeric(double value, OperatorKind kind) {
  switch (kind) {
  case OperatorKind::round: {
    // Halves round toward positive infinity.
    const auto f{std::floor(value)};
    return value - f >= 0.5 ? f + 1 : f;
  }
  case OperatorKind::floor:
    return std::floor(value);
  case OperatorKind::ceil:
    return std::ceil(value);
  case OperatorKind::abs:
    return std::abs(value);
  case OperatorKind::sqrt:
    return std::sqrt(value);
  case OperatorKind::pow2:
    return value * value;
  default:
    return value;
  }
}

struct Utf8Char {
  char32_t code_point;
  std::size_t length;
};

// Decode the UTF-8 sequence starting at _s_[_i_]. A byte that does not start
// a well formed sequence is returned on its own with a length of one and a
// code point of U+FFFF.
Utf8Char decode_utf8(std::string_view s, std::size_t i) {
  constexpr Utf8Char malformed{0xFFFF, 1};
  const auto lead{static_cast<unsigned char>(s[i])};

  if (lead < 0x80) {
    return {lead, 1};
  }

  std::size_t length{};
  char32_t code_point{};
  if ((lead & 0xE0) == 0xC0) {
    length = 2;
    code_point = lead & 0x1F;
  } else if ((lead & 0xF0) == 0xE0) {
    length = 3;
    code_point = lead & 0x0F;
  } else if ((lead & 0xF8) == 0xF0) {
    length = 4;
    code_point = lead & 0x07;
  } else {
    return malformed;
  }

  if (i + length > s.size()) {
    return malformed;
  }

  for (std::size_t k = 1; k < length; k++) {
    const auto byte{static_cast<unsigned char>(s[i + k])};
    if ((byte & 0xC0) != 0x80) {
      return malformed;
    }
    code_point = (code_point << 6) | (byte & 0x3F);
  }

  return {code_point, length};
}

void append_utf8(std::string& out, char32_t code_point) {
  if (code_point < 0x80) {
    out.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else if (code_point < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  }
}

// Simple case mappings for Basic Latin, Latin-1 Supplement, Latin
// Extended-A, Greek and Cyrillic. Other code points map to themselves.
char32_t lower_case(char32_t c) {
  if ((c >= 'A' && c <= 'Z') || (c >= 0xC0 && c <= 0xDE && c != 0xD7)) {
    return c + 0x20;
  }

  if (c == 0x178) {
    return 0xFF;
  }

  // Latin Extended-A pairs, upper case first on even code points.
  if ((c >= 0x100 && c <= 0x137) || (c >= 0x14A && c <= 0x177)) {
    return c | 1;
  }

  // Pairs with upper case on odd code points.
  if ((c >= 0x139 && c <= 0x148) || (c >= 0x179 && c <= 0x17E)) {
    return c % 2 ? c + 1 : c;
  }

  if (c >= 0x391 && c <= 0x3AB && c != 0x3A2) {
    return c + 0x20;
  }

  switch (c) {
  case 0x386:
    return 0x3AC;
  case 0x388:
  case 0x389:
  case 0x38A:
    return c + 0x25;
  case 0x38C:
    return 0x3CC;
  case 0x38E:
  case 0x38F:
    return c + 0x3F;
  default:
    break;
  }

  if (c >= 0x410 && c <= 0x42F) {
    return c + 0x20;
  }

  if (c >= 0x400 && c <= 0x40F) {
    return c + 0x50;
  }

  return c;
}

char32_t upper_case(char32_t c) {
  if ((c >= 'a' && c <= 'z') || (c >= 0xE0 && c <= 0xFE && c != 0xF7)) {
    return c - 0x20;
  }

  switch (c) {
  case 0xB5:
    return 0x39C;
  case 0xFF:
    return 0x178;
  case 0x131:
    return 'I';
  case 0x17F:
    return 'S';
  case 0x3C2:
    return 0x3A3;
  case 0x3AC:
    return 0x386;
  case 0x3AD:
  case 0x3AE:
  case 0x3AF:
    return c - 0x25;
  case 0x3CC:
    return 0x38C;
  case 0x3CD:
  case 0x3CE:
    return c - 0x3F;
  default:
    break;
  }

  if ((c >= 0x100 && c <= 0x137) || (c >= 0x14A && c <= 0x177)) {
    return c & ~char32_t{1};
  }

  if ((c >= 0x139 && c <= 0x148) || (c >= 0x179 && c <= 0x17E)) {
    return c % 2 ? c : c - 1;
  }

  if (c >= 0x3B1 && c <= 0x3CB) {
    return c - 0x20;
  }

  if (c >= 0x430 && c <= 0x44F) {
    return c - 0x20;
  }

  if (c >= 0x450 && c <= 0x45F) {
    return c - 0x50;
  }

  return c;
}

bool is_cased(char32_t c) {
  return lower_case(c) != c || upper_case(c) != c;
}

// Change the case of every letter in the UTF-8 string _s_. Malformed bytes
// are copied unchanged. A capital sigma at the end of a word becomes a final
// sigma.
std::string fold_case(std::string_view s, bool upper) {
  std::string rv{};
  rv.reserve(s.size());
  bool after_cased{false};

  for (std::size_t i = 0; i < s.size();) {
    const auto [c, length]{decode_utf8(s, i)};
    if (c == 0xFFFF) {
      rv.append(s.substr(i, length));
    } else if (upper && c == 0xDF) {
      rv.append("SS");
    } else if (upper && c == 0x149) {
      append_utf8(rv, 0x2BC);
      rv.push_back('N');
    } else if (!upper && c == 0x130) {
      rv.push_back('i');
      append_utf8(rv, 0x307);
    } else if (!upper && c == 0x3A3) {
      const auto before_cased{i + length < s.size() &&
                              is_cased(decode_utf8(s, i + length).code_point)};
      append_utf8(rv, after_cased && !before_cased ? 0x3C2 : 0x3C3);
    } else {
      append_utf8(rv, upper ? upper_case(c) : lower_case(c));
    }
    after_cased = is_cased(c);
    i += length;
  }

  return rv;
}

} // namespace

ArrayOperations parse_array_operations(std::string_view chain) {
  static const RE2 sort_pattern{R"(\.sort\((-?)(\w+)\))"};
  static const RE2 slice_pattern{R"(\.\[(-?\d+)?:(-?\d+)?\])"};

  ArrayOperations operations{};

  std::string direction, field;
  if (RE2::PartialMatch(chain, sort_pattern, &direction, &field)) {
    operations.sort = SortStep{field, !direction.empty()};
  }

  operations.distinct = chain.find(".distinct()") != std::string_view::npos;
  operations.reverse = chain.find(".reverse()") != std::string_view::npos;

  std::string start, end;
  if (RE2::PartialMatch(chain, slice_pattern, &start, &end)) {
    operations.slice = SliceStep{parse_bound(start), parse_bound(end)};
  }

  return operations;
}

Json::Value apply_array_operations(
    const Json::Value& items, const ArrayOperations& operations) {
  Json::Value rv{items};

  if (operations.sort) {
    rv = sort_by(rv, operations.sort->field, operations.sort->descending);
  }

  if (operations.distinct) {
    rv = distinct(rv);
  }

  if (operations.reverse) {
    rv = reverse(rv);
  }

  if (operations.slice) {
    rv = slice(rv, operations.slice->start, operations.slice->end);
  }

  return rv;
}

Json::Value sort_by(
    const Json::Value& items, std::string_view field, bool descending) {
  elements_t elements{};
  for (const auto& item : items) {
    elements.push_back(&item);
  }

  elements_t buffer(elements.size());
  merge_sort(elements, buffer, 0, elements.size(),
      [field, descending](const Json::Value* a, const Json::Value* b) {
        return compare_elements(a, b, field, descending);
      });

  Json::Value rv{Json::arrayValue};
  for (const auto* element : elements) {
    rv.append(*element);
  }
  return rv;
}

Json::Value distinct(const Json::Value& items) {
  std::unordered_set<std::string> seen{};
  Json::Value rv{Json::arrayValue};
  for (const auto& item : items) {
    if (seen.insert(canonical_json(item)).second) {
      rv.append(item);
    }
  }
  return rv;
}

Json::Value reverse(const Json::Value& items) {
  Json::Value rv{Json::arrayValue};
  for (auto i = items.size(); i > 0; i--) {
    rv.append(items[i - 1]);
  }
  return rv;
}

Json::Value slice(const Json::Value& items, std::optional<std::int64_t> start,
    std::optional<std::int64_t> end) {
  const auto length{static_cast<std::int64_t>(items.size())};
  const auto from{relative_index(start.value_or(0), length)};
  const auto to{relative_index(end.value_or(length), length)};

  Json::Value rv{Json::arrayValue};
  for (auto i = from; i < to; i++) {
    rv.append(items[static_cast<Json::ArrayIndex>(i)]);
  }
  return rv;
}

double aggregate(
    const Json::Value& items, OperatorKind kind, std::string_view field) {
  if (!items.isArray() || items.empty()) {
    return 0;
  }

  switch (kind) {
  case OperatorKind::sum:
    return sum(items, field);
  case OperatorKind::avg:
    return average(items, field);
  case OperatorKind::min:
    return minimum(items, field);
  case OperatorKind::max:
    return maximum(items, field);
  default:
    return 0;
  }
}

double sum(const Json::Value& items, std::string_view field) {
  double rv{0};
  for (const auto value : field_values(items, field)) {
    rv += value;
  }
  return rv;
}

double average(const Json::Value& items, std::string_view field) {
  if (items.empty()) {
    throw EmptyInputError("can not average an empty array");
  }
  return sum(items, field) / static_cast<double>(items.size());
}

double minimum(const Json::Value& items, std::string_view field) {
  const auto values{field_values(items, field)};
  if (values.empty()) {
    return std::numeric_limits<double>::infinity();
  }
  return *std::min_element(values.begin(), values.end());
}

double maximum(const Json::Value& items, std::string_view field) {
  const auto values{field_values(items, field)};
  if (values.empty()) {
    return -std::numeric_limits<double>::infinity();
  }
  return *std::max_element(values.begin(), values.end());
}

Json::Value numeric_transform(
    const Json::Value& items, OperatorKind kind, std::string_view arithmetic) {
  Json::Value rv{Json::arrayValue};

  for (const auto& item : items) {
    const auto value{coerce_number(&item)};

    if (kind != OperatorKind::math) {
      rv.append(json_number(apply_numeric(value, kind)));
      continue;
    }

    try {
      rv.append(json_number(apply_arithmetic(value, arithmetic)));
    } catch (const ArithmeticError& e) {
      VLOG(2) << "math(" << arithmetic << ") on " << value << ": "
              << e.what();
      rv.append(Json::Value{0});
    }
  }

  return rv;
}

Json::Value string_operation(
    const Json::Value& value, OperatorKind kind, std::string_view argument) {
  if (!value.isString()) {
    return value;
  }

  const auto s{value.asString()};

  switch (kind) {
  case OperatorKind::to_lower:
    return fold_case(s, false);
  case OperatorKind::to_upper:
    return fold_case(s, true);
  case OperatorKind::starts_with:
    return s.starts_with(argument);
  case OperatorKind::ends_with:
    return s.ends_with(argument);
  case OperatorKind::contains:
    return s.find(argument) != std::string::npos;
  case OperatorKind::matches: {
    RE2::Options options{};
    options.set_log_errors(false);
    const RE2 re{argument, options};
    if (!re.ok()) {
      throw RegexError("invalid regular expression /"s +
                       std::string{argument} + "/: "s + re.error());
    }
    return RE2::PartialMatch(s, re);
  }
  default:
    return value;
  }
}

Json::Value date_operation(
    const Json::Value& items, OperatorKind kind, std::string_view format) {
  if (kind != OperatorKind::format && kind != OperatorKind::is_today) {
    return items;
  }

  Json::Value rv{Json::arrayValue};

  for (const auto& item : items) {
    const auto epoch_ms{parse_date(item)};

    if (kind == OperatorKind::is_today) {
      rv.append(epoch_ms.has_value() && is_today(epoch_ms.value()));
    } else if (epoch_ms) {
      rv.append(format_date(epoch_ms.value(), format));
    } else {
      rv.append(item);
    }
  }

  return rv;
}

} // namespace libjsonquery
