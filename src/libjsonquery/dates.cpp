#include "libjsonquery/dates.hpp"
#include <re2/re2.h>   // RE2
#include <chrono>      // std::chrono
#include <cmath>       // std::isfinite std::trunc std::abs
#include <ctime>       // std::time_t std::tm mktime localtime_r
#include <optional>    // std::optional
#include <string>      // std::string std::stoi
#include <string_view> // std::string_view

namespace libjsonquery {

using namespace std::string_literals;

namespace {

namespace chrono = std::chrono;

unsigned days_in_month(int year, int month) {
  const chrono::year_month_day_last last{chrono::year{year} /
                                         chrono::month{static_cast<unsigned>(month)} /
                                         chrono::last};
  return static_cast<unsigned>(last.day());
}

int to_int(const std::string& digits, int fallback) {
  return digits.empty() ? fallback : std::stoi(digits);
}

std::string pad(int value) {
  auto rv{std::to_string(value)};
  if (rv.size() < 2) {
    rv.insert(0, 1, '0');
  }
  return rv;
}

void replace_first(std::string& s, std::string_view token, const std::string& replacement) {
  const auto pos{s.find(token)};
  if (pos != std::string::npos) {
    s.replace(pos, token.size(), replacement);
  }
}

// An optional time of day after a non-ISO date, HH:mm or HH:mm:ss.
constexpr const char* TIME_PATTERN{
    R"((?:,?\s+(\d{1,2}):(\d{2})(?::(\d{2}))?)?)"};

// An optional zone after a non-ISO date-time: GMT, UTC, Z or +hhmm.
constexpr const char* ZONE_PATTERN{
    R"((?:\s*((?:GMT|UTC|Z)?[+-]\d{4}|GMT|UTC|Z))?)"};

struct DateFields {
  int year;
  int month;
  int day;
  int hours;
  int minutes;
  int seconds;
  int millis;
};

// Milliseconds since the epoch for _fields_. _offset_minutes_ is how far the
// fields' zone is ahead of UTC. Without an offset the fields are local time.
std::optional<std::int64_t> to_epoch_ms(
    const DateFields& fields, std::optional<int> offset_minutes) {
  if (fields.month < 1 || fields.month > 12 || fields.day < 1 ||
      static_cast<unsigned>(fields.day) >
          days_in_month(fields.year, fields.month)) {
    return std::nullopt;
  }

  if (fields.hours > 24 || fields.minutes > 59 || fields.seconds > 59 ||
      (fields.hours == 24 &&
          (fields.minutes || fields.seconds || fields.millis))) {
    return std::nullopt;
  }

  if (!offset_minutes) {
    std::tm tm_fields{};
    tm_fields.tm_year = fields.year - 1900;
    tm_fields.tm_mon = fields.month - 1;
    tm_fields.tm_mday = fields.day;
    tm_fields.tm_hour = fields.hours;
    tm_fields.tm_min = fields.minutes;
    tm_fields.tm_sec = fields.seconds;
    tm_fields.tm_isdst = -1;

    const std::time_t t{mktime(&tm_fields)};
    if (t == static_cast<std::time_t>(-1)) {
      return std::nullopt;
    }
    return static_cast<std::int64_t>(t) * 1000 + fields.millis;
  }

  const chrono::sys_days date{chrono::year{fields.year} /
                              chrono::month{static_cast<unsigned>(fields.month)} /
                              chrono::day{static_cast<unsigned>(fields.day)}};

  auto ms{chrono::duration_cast<chrono::milliseconds>(date.time_since_epoch())
              .count()};
  ms += ((fields.hours * 60 + fields.minutes) * 60 + fields.seconds) *
            std::int64_t{1000} +
        fields.millis;
  return ms - offset_minutes.value() * std::int64_t{60'000};
}

// 1 for "Jan" through 12 for "Dec", in any case. 0 for anything else.
int month_number(std::string_view name) {
  static constexpr std::string_view names{"janfebmaraprmayjunjulaugsepoctnovdec"};
  if (name.size() != 3) {
    return 0;
  }

  std::string lower{name};
  for (auto& ch : lower) {
    if (ch >= 'A' && ch <= 'Z') {
      ch = static_cast<char>(ch - 'A' + 'a');
    }
  }

  const auto pos{names.find(lower)};
  return pos == std::string_view::npos || pos % 3 ? 0 : static_cast<int>(pos / 3) + 1;
}

// Offset in minutes for a zone matched by ZONE_PATTERN. No zone is local time.
std::optional<int> zone_offset(std::string_view zone) {
  if (zone.empty()) {
    return std::nullopt;
  }

  const auto sign{zone.find_first_of("+-")};
  if (sign == std::string_view::npos) {
    return 0;
  }

  const auto digits{zone.substr(sign + 1)};
  const int offset{(digits[0] - '0') * 600 + (digits[1] - '0') * 60 +
                   (digits[2] - '0') * 10 + (digits[3] - '0')};
  return zone[sign] == '+' ? offset : -offset;
}

} // namespace

std::optional<std::int64_t> parse_iso_date(std::string_view s) {
  static const RE2 iso{
      R"((\d{4})(?:-(\d{2})(?:-(\d{2}))?)?)"
      R"((?:[T ](\d{2}):(\d{2})(?::(\d{2})(?:\.(\d+))?)?(Z|[+-]\d{2}:\d{2})?)?)"};

  std::string year_s, month_s, day_s, hours_s, minutes_s, seconds_s,
      fraction_s, zone;

  if (!RE2::FullMatch(s, iso, &year_s, &month_s, &day_s, &hours_s,
          &minutes_s, &seconds_s, &fraction_s, &zone)) {
    return std::nullopt;
  }

  // Only the first three fraction digits are significant.
  const DateFields fields{
      std::stoi(year_s),
      to_int(month_s, 1),
      to_int(day_s, 1),
      to_int(hours_s, 0),
      to_int(minutes_s, 0),
      to_int(seconds_s, 0),
      fraction_s.empty() ? 0 : std::stoi((fraction_s + "00").substr(0, 3)),
  };

  // Date-only forms are UTC, date-time forms without a zone are local.
  if (hours_s.empty() || zone == "Z") {
    return to_epoch_ms(fields, 0);
  }

  if (zone.empty()) {
    return to_epoch_ms(fields, std::nullopt);
  }

  const int offset{std::stoi(zone.substr(1, 2)) * 60 +
                   std::stoi(zone.substr(4, 2))};
  return to_epoch_ms(fields, zone[0] == '+' ? offset : -offset);
}

std::optional<std::int64_t> parse_date_string(std::string_view s) {
  if (const auto rv{parse_iso_date(s)}) {
    return rv;
  }

  static const RE2 year_first{
      R"(\s*(\d{4})/(\d{1,2})/(\d{1,2}))"s + TIME_PATTERN + R"(\s*)"};
  static const RE2 year_last{
      R"(\s*(\d{1,2})/(\d{1,2})/(\d{4}))"s + TIME_PATTERN + R"(\s*)"};
  static const RE2 day_month_year{
      R"(\s*(?:[A-Za-z]{3}[a-z]*,?\s+)?(\d{1,2})\s+([A-Za-z]{3})[a-z]*\s+(\d{4}))"s +
      TIME_PATTERN + ZONE_PATTERN + R"(\s*)"};
  static const RE2 month_day_year{
      R"(\s*(?:[A-Za-z]{3}[a-z]*,?\s+)?([A-Za-z]{3})[a-z]*\.?\s+(\d{1,2}),?\s+(\d{4}))"s +
      TIME_PATTERN + ZONE_PATTERN + R"(\s*)"};

  std::string a, b, c, hours_s, minutes_s, seconds_s, zone;

  if (RE2::FullMatch(s, year_first, &a, &b, &c, &hours_s, &minutes_s,
          &seconds_s)) {
    return to_epoch_ms(
        {std::stoi(a), std::stoi(b), std::stoi(c), to_int(hours_s, 0),
            to_int(minutes_s, 0), to_int(seconds_s, 0), 0},
        std::nullopt);
  }

  if (RE2::FullMatch(s, year_last, &a, &b, &c, &hours_s, &minutes_s,
          &seconds_s)) {
    return to_epoch_ms(
        {std::stoi(c), std::stoi(a), std::stoi(b), to_int(hours_s, 0),
            to_int(minutes_s, 0), to_int(seconds_s, 0), 0},
        std::nullopt);
  }

  int day{};
  int month{};

  if (RE2::FullMatch(s, day_month_year, &a, &b, &c, &hours_s, &minutes_s,
          &seconds_s, &zone)) {
    day = std::stoi(a);
    month = month_number(b);
  } else if (RE2::FullMatch(s, month_day_year, &b, &a, &c, &hours_s,
                 &minutes_s, &seconds_s, &zone)) {
    day = std::stoi(a);
    month = month_number(b);
  } else {
    return std::nullopt;
  }

  if (!month) {
    return std::nullopt;
  }

  const DateFields fields{std::stoi(c), month, day, to_int(hours_s, 0),
      to_int(minutes_s, 0), to_int(seconds_s, 0), 0};
  return to_epoch_ms(fields, zone_offset(zone));
}

std::optional<std::int64_t> parse_date(const Json::Value& value) {
  if (value.isNull()) {
    return 0;
  }

  if (value.isBool()) {
    return value.asBool() ? 1 : 0;
  }

  if (value.isNumeric()) {
    const double ms{value.asDouble()};
    if (!std::isfinite(ms) ||
        std::abs(ms) > static_cast<double>(MAX_EPOCH_MILLISECONDS)) {
      return std::nullopt;
    }
    return static_cast<std::int64_t>(std::trunc(ms));
  }

  if (value.isString()) {
    return parse_date_string(value.asString());
  }

  return std::nullopt;
}

LocalTime local_time(std::int64_t epoch_ms) {
  const auto secs{chrono::floor<chrono::seconds>(chrono::milliseconds{epoch_ms})};
  const std::time_t t{static_cast<std::time_t>(secs.count())};

  std::tm fields{};
  localtime_r(&t, &fields);

  return LocalTime{
      fields.tm_year + 1900,
      fields.tm_mon + 1,
      fields.tm_mday,
      fields.tm_hour,
      fields.tm_min,
      fields.tm_sec,
  };
}

std::string format_date(std::int64_t epoch_ms, std::string_view format) {
  const auto fields{local_time(epoch_ms)};
  std::string rv{format};
  replace_first(rv, "YYYY", std::to_string(fields.year));
  replace_first(rv, "MM", pad(fields.month));
  replace_first(rv, "DD", pad(fields.day));
  replace_first(rv, "HH", pad(fields.hours));
  replace_first(rv, "mm", pad(fields.minutes));
  replace_first(rv, "ss", pad(fields.seconds));
  return rv;
}

bool same_local_date(std::int64_t epoch_ms, std::int64_t now_ms) {
  const auto lhs{local_time(epoch_ms)};
  const auto rhs{local_time(now_ms)};
  return lhs.year == rhs.year && lhs.month == rhs.month && lhs.day == rhs.day;
}

bool is_today(std::int64_t epoch_ms) {
  const auto now{chrono::duration_cast<chrono::milliseconds>(
      chrono::system_clock::now().time_since_epoch())};
  return same_local_date(epoch_ms, now.count());
}

} // namespace libjsonquery
