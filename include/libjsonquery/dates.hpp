#ifndef LIBJSONQUERY_DATES_H
#define LIBJSONQUERY_DATES_H

#include <json/json.h>  // Json::Value
#include <cstdint>      // std::int64_t
#include <optional>     // std::optional
#include <string>       // std::string
#include <string_view>  // std::string_view

namespace libjsonquery {

// The largest distance from the epoch, in milliseconds, of a valid date.
constexpr std::int64_t MAX_EPOCH_MILLISECONDS = 8'640'000'000'000'000;

// Calendar fields of a point in time in the local time zone. _month_ is
// 1-based.
struct LocalTime {
  int year{};
  int month{};
  int day{};
  int hours{};
  int minutes{};
  int seconds{};
};

// Parse an ISO 8601 date or date-time string and return milliseconds since
// the Unix epoch. Accepted forms are YYYY, YYYY-MM and YYYY-MM-DD, optionally
// followed by `T` or a space and HH:mm, HH:mm:ss or HH:mm:ss.sss, optionally
// followed by `Z` or an offset like +05:30. Date-only forms are UTC, date-time
// forms without `Z` or an offset are local time.
std::optional<std::int64_t> parse_iso_date(std::string_view s);

// Parse a date string. ISO 8601 forms are tried first, then these:
//   2024/03/05 and 03/05/2024, optionally followed by HH:mm or HH:mm:ss
//   Tue, 05 Mar 2024 10:00:00 GMT (RFC 2822, weekday optional)
//   March 5, 2024 10:00
// The time and zone of the last two are optional, and the zone may be GMT,
// UTC, Z or an offset like +0100. Without a zone, non-ISO forms are local
// time. Month names are matched on their first three letters.
std::optional<std::int64_t> parse_date_string(std::string_view s);

// Return _value_ as milliseconds since the Unix epoch, or nullopt if it is
// not a date. Numbers are read as milliseconds and strings with
// parse_date_string(). null is the epoch, and false and true are 0 and 1
// milliseconds. Arrays and objects are not dates.
std::optional<std::int64_t> parse_date(const Json::Value& value);

LocalTime local_time(std::int64_t epoch_ms);

// Replace the first YYYY, MM, DD, HH, mm and ss in _format_, in that order,
// with the local time fields of _epoch_ms_. Years are not padded, all other
// fields are padded to two digits.
std::string format_date(std::int64_t epoch_ms, std::string_view format);

// Return true if _epoch_ms_ falls on the same local calendar date as
// _now_ms_.
bool same_local_date(std::int64_t epoch_ms, std::int64_t now_ms);

// Return true if _epoch_ms_ falls on today's local calendar date.
bool is_today(std::int64_t epoch_ms);

} // namespace libjsonquery

#endif // LIBJSONQUERY_DATES_H
