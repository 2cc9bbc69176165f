#include "libjsonquery/dates.hpp"
#include <gtest/gtest.h> // EXPECT_* TEST_F testing::Test
#include <chrono>        // std::chrono
#include <cstdlib>       // setenv
#include <ctime>         // tzset
#include <string_view>   // std::string_view

class DatesTest : public testing::Test {
protected:
  // 2024-01-15T10:30:00Z
  static constexpr std::int64_t MORNING{1705314600000};

  void SetUp() override {
    setenv("TZ", "UTC", 1);
    tzset();
  }

  void expect_date(std::string_view s, std::int64_t want) {
    const auto rv{libjsonquery::parse_iso_date(s)};
    ASSERT_TRUE(rv.has_value()) << s;
    EXPECT_EQ(rv.value(), want) << s;
  }

  void expect_invalid(std::string_view s) {
    EXPECT_FALSE(libjsonquery::parse_iso_date(s).has_value()) << s;
  }
};

TEST_F(DatesTest, DateOnlyFormsAreUTC) {
  expect_date("2024-01-15", 1705276800000);
  expect_date("2024-01", 1704067200000);
  expect_date("2024", 1704067200000);
  expect_date("1970-01-01", 0);
}

TEST_F(DatesTest, DateTimeForms) {
  expect_date("2024-01-15T10:30:00Z", MORNING);
  expect_date("2024-01-15T10:30Z", MORNING);
  expect_date("2024-01-15 10:30:00Z", MORNING);
  expect_date("2024-01-15T10:30:00.5Z", MORNING + 500);
  expect_date("2024-01-15T10:30:00.123456Z", MORNING + 123);
  expect_date("2024-01-15T16:00:00+05:30", MORNING);
  expect_date("2024-01-15T05:30:00-05:00", MORNING);
}

TEST_F(DatesTest, DateTimeWithoutZoneIsLocal) {
  expect_date("2024-01-15T10:30:00", MORNING);
}

TEST_F(DatesTest, InvalidDates) {
  expect_invalid("");
  expect_invalid("not a date");
  expect_invalid("2024-13-01");
  expect_invalid("2024-00-10");
  expect_invalid("2023-02-29");
  expect_invalid("2024-04-31");
  expect_invalid("2024-01-15T25:00:00Z");
  expect_invalid("2024-01-15T10:60:00Z");
  expect_invalid("15/01/2024");
  expect_invalid("2024-01-15T10:30:00Zjunk");
}

TEST_F(DatesTest, LeapDay) {
  expect_date("2024-02-29", 1709164800000);
}

TEST_F(DatesTest, ParseDateValues) {
  EXPECT_EQ(libjsonquery::parse_date(Json::Value{"2024-01-15T10:30:00Z"}),
      MORNING);
  EXPECT_EQ(libjsonquery::parse_date(Json::Value{Json::Int64{MORNING}}),
      MORNING);
  EXPECT_EQ(libjsonquery::parse_date(Json::Value{1705314600000.9}), MORNING);
  EXPECT_EQ(libjsonquery::parse_date(Json::Value{0}), 0);
  EXPECT_FALSE(libjsonquery::parse_date(Json::Value{1e300}).has_value());
  EXPECT_EQ(libjsonquery::parse_date(Json::Value{true}), 1);
  EXPECT_EQ(libjsonquery::parse_date(Json::Value{false}), 0);
  EXPECT_EQ(libjsonquery::parse_date(Json::Value{Json::nullValue}), 0);
  EXPECT_EQ(libjsonquery::parse_date(Json::Value{"01/15/2024 10:30"}), MORNING);
  EXPECT_FALSE(
      libjsonquery::parse_date(Json::Value{Json::arrayValue}).has_value());
}

TEST_F(DatesTest, OtherDateStrings) {
  const std::int64_t midnight{1705276800000};
  auto expect{[](std::string_view s, std::int64_t want) {
    const auto rv{libjsonquery::parse_date_string(s)};
    ASSERT_TRUE(rv.has_value()) << s;
    EXPECT_EQ(rv.value(), want) << s;
  }};

  expect("2024/01/15", midnight);
  expect("2024/1/15 10:30:00", MORNING);
  expect("01/15/2024 10:30", MORNING);
  expect("Mon, 15 Jan 2024 10:30:00 GMT", MORNING);
  expect("15 Jan 2024 11:30:00 +0100", MORNING);
  expect("15 jan 2024", midnight);
  expect("January 15, 2024 10:30", MORNING);
  expect("Jan 15 2024", midnight);
  expect("2024-01-15", midnight);

  EXPECT_FALSE(libjsonquery::parse_date_string("15 Foo 2024").has_value());
  EXPECT_FALSE(libjsonquery::parse_date_string("2024/02/30").has_value());
  EXPECT_FALSE(libjsonquery::parse_date_string("13/01/2024").has_value());
  EXPECT_FALSE(libjsonquery::parse_date_string("someday").has_value());
}

TEST_F(DatesTest, LocalTime) {
  const auto fields{libjsonquery::local_time(MORNING + 45'000)};
  EXPECT_EQ(fields.year, 2024);
  EXPECT_EQ(fields.month, 1);
  EXPECT_EQ(fields.day, 15);
  EXPECT_EQ(fields.hours, 10);
  EXPECT_EQ(fields.minutes, 30);
  EXPECT_EQ(fields.seconds, 45);
}

TEST_F(DatesTest, FormatDate) {
  EXPECT_EQ(libjsonquery::format_date(MORNING, "YYYY-MM-DD"), "2024-01-15");
  EXPECT_EQ(libjsonquery::format_date(MORNING + 5'000, "DD/MM/YYYY HH:mm:ss"),
      "15/01/2024 10:30:05");
  EXPECT_EQ(libjsonquery::format_date(0, "YYYY"), "1970");
  EXPECT_EQ(libjsonquery::format_date(MORNING, "no tokens"), "no tokens");
}

TEST_F(DatesTest, FormatReplacesFirstOccurrenceOnly) {
  EXPECT_EQ(libjsonquery::format_date(MORNING, "MM MM"), "01 MM");
  EXPECT_EQ(libjsonquery::format_date(MORNING, "YYYY/YYYY"), "2024/YYYY");
}

TEST_F(DatesTest, YearsAreNotPadded) {
  // 0099-06-01T00:00:00Z
  EXPECT_EQ(libjsonquery::format_date(-59029948800000, "YYYY-MM-DD"),
      "99-06-01");
}

TEST_F(DatesTest, SameLocalDate) {
  EXPECT_TRUE(libjsonquery::same_local_date(MORNING, MORNING + 3'600'000));
  EXPECT_FALSE(libjsonquery::same_local_date(MORNING, MORNING + 86'400'000));
  EXPECT_FALSE(libjsonquery::same_local_date(
      1705276800000 - 1, 1705276800000));
}

TEST_F(DatesTest, IsToday) {
  const auto now{std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now().time_since_epoch())
                     .count()};
  EXPECT_FALSE(libjsonquery::is_today(MORNING));
  EXPECT_FALSE(libjsonquery::is_today(now - 2 * 86'400'000));
}
