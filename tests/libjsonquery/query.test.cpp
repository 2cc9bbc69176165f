#include "libjsonquery/query.hpp"
#include "libjsonquery/coerce.hpp"   // libjsonquery::json_equals
#include "libjsonquery/document.hpp" // libjsonquery::parse_json
#include "libjsonquery/exceptions.hpp"
#include <gtest/gtest.h> // EXPECT_* TEST_F testing::Test
#include <cstdlib>       // setenv
#include <ctime>         // tzset
#include <string_view>   // std::string_view

class QueryTest : public testing::Test {
protected:
  const Json::Value data{libjsonquery::parse_json(R"({
    "store": {
      "book": [
        {"category": "reference", "title": "Sayings of the Century", "price": 8.95},
        {"category": "fiction", "title": "Sword of Honour", "price": 12.99},
        {"category": "fiction", "title": "Moby Dick", "price": 8.99},
        {"category": "fiction", "title": "The Lord of the Rings", "price": 22.99}
      ]
    },
    "prices": [10, 20],
    "tags": ["a", "b", "a", "c", "b"],
    "events": [
      {"name": "launch", "date": "2024-01-15T10:30:00Z"},
      {"name": "review", "date": "2024-03-02"},
      {"name": "unknown", "date": "someday"}
    ]
  })")};

  void expect_query(std::string_view expression, std::string_view want) {
    const auto rv{libjsonquery::evaluate_query(data, expression)};
    EXPECT_TRUE(
        libjsonquery::json_equals(rv, libjsonquery::parse_json(want)))
        << expression << " => " << libjsonquery::write_json(rv);
  }

  void expect_number(std::string_view expression, double want) {
    const auto rv{libjsonquery::evaluate_query(data, expression)};
    ASSERT_TRUE(rv.isNumeric()) << expression;
    EXPECT_NEAR(rv.asDouble(), want, 1e-9) << expression;
  }
};

TEST_F(QueryTest, PlainJSONPath) {
  expect_query("$.tags[0]", R"(["a"])");
  expect_query("$.prices[*]", "[10, 20]");
  expect_query("$.prices", "[[10, 20]]");
  expect_query("$.nosuchthing", "[]");
  expect_query("$.store.book[?@.price > 20].title",
      R"(["The Lord of the Rings"])");
}

TEST_F(QueryTest, Length) {
  expect_query("$.length()", "4");
  EXPECT_EQ(libjsonquery::evaluate_query(
                libjsonquery::parse_json("[1, 2, 3]"), "$.length()")
                .asInt(),
      3);
  EXPECT_EQ(libjsonquery::evaluate_query(
                libjsonquery::parse_json("\"abc\""), "$.length()")
                .asInt(),
      0);
}

TEST_F(QueryTest, Aggregates) {
  expect_number("$.store.book.sum(price)", 53.92);
  expect_number("$.store.book.avg(price)", 13.48);
  expect_number("$.store.book.min(price)", 8.95);
  expect_number("$.store.book.max(price)", 22.99);
  expect_number("$.store.book[*].sum(price)", 53.92);
  expect_number("$.store.book[?@.category == 'fiction'].avg(price)",
      (12.99 + 8.99 + 22.99) / 3);
}

TEST_F(QueryTest, AggregatesOfNothing) {
  expect_number("$.nosuchthing.sum(price)", 0);
  expect_number("$.nosuchthing.avg(price)", 0);
}

TEST_F(QueryTest, Numeric) {
  expect_query("$.prices.math(* 1.1)", "[11, 22]");
  expect_query("$.prices.math(+ 5 * 2)", "[20, 30]");
  expect_query("$.prices.math(* x)", "[0, 0]");
  expect_query("$.prices.pow2()", "[100, 400]");
  expect_query("$.store.book[*].price.round()", "[9, 13, 9, 23]");
}

TEST_F(QueryTest, ArrayOperations) {
  expect_query("$.store.book.sort(-price).[0:1]",
      R"([{"category": "fiction", "title": "The Lord of the Rings", "price": 22.99}])");
  expect_query("$.tags.distinct()", R"(["a", "b", "c"])");
  expect_query("$.tags.reverse()", R"(["b", "c", "a", "b", "a"])");
  expect_query("$.tags.distinct().reverse()", R"(["c", "b", "a"])");
  expect_query("$.tags.[1:3]", R"(["b", "a"])");
  expect_query("$.tags.[-2:]", R"(["c", "b"])");
  expect_query("$.nosuchthing.reverse()", "[]");
}

TEST_F(QueryTest, Strings) {
  expect_query("$.store.book[0].title.toUpperCase()",
      R"("SAYINGS OF THE CENTURY")");
  expect_query("$.store.book[2].title.toLowerCase()", R"("moby dick")");
  expect_query("$.store.book[2].title.contains('Dick')", "true");
  expect_query("$.store.book[2].title.startsWith('Dick')", "false");
  expect_query("$.store.book[2].title.matches('^Moby\\s')", "true");
  expect_query("$.prices.toUpperCase()", "[10, 20]");
  expect_query("$.nosuchthing.toUpperCase()", "null");
}

TEST_F(QueryTest, SortRootArrayWithMissingFields) {
  const auto items{libjsonquery::parse_json(R"([
    {"id": 1}, {"id": 2}, {"id": 3, "p": null}, {"id": 4, "p": 5}, {"id": 5}
  ])")};
  const auto rv{libjsonquery::evaluate_query(items, "$.sort(p)")};
  EXPECT_TRUE(libjsonquery::json_equals(rv, libjsonquery::parse_json(R"([
    {"id": 4, "p": 5}, {"id": 1}, {"id": 2}, {"id": 3, "p": null}, {"id": 5}
  ])"))) << libjsonquery::write_json(rv);
}

TEST_F(QueryTest, LowerCaseNonASCII) {
  const auto rv{libjsonquery::evaluate_query(
      libjsonquery::parse_json(R"(["ÉCOLE"])"), "$[0].toLowerCase()")};
  EXPECT_EQ(rv.asString(), "école");
}

TEST_F(QueryTest, InvalidPattern) {
  EXPECT_THROW(libjsonquery::evaluate_query(
                   data, "$.store.book[0].title.matches('[')"),
      libjsonquery::RegexError);
}

TEST_F(QueryTest, Dates) {
  setenv("TZ", "UTC", 1);
  tzset();

  expect_query("$.events[*].date.format('YYYY-MM-DD')",
      R"(["2024-01-15", "2024-03-02", "someday"])");
  expect_query("$.events[0].date.format('DD/MM/YYYY HH:mm')",
      R"(["15/01/2024 10:30"])");
  expect_query("$.events[*].date.isToday()", "[false, false, false]");
}

TEST_F(QueryTest, InvalidBasePath) {
  EXPECT_THROW(libjsonquery::evaluate_query(data, "store.book.sum(price)"),
      libjsonquery::SyntaxError);
  EXPECT_THROW(libjsonquery::evaluate_query(data, "$.store.book["),
      libjsonquery::SyntaxError);
}

TEST_F(QueryTest, DocumentIsNotModified) {
  const auto before{data};
  libjsonquery::evaluate_query(data, "$.store.book.sort(-price)");
  libjsonquery::evaluate_query(data, "$.tags.distinct().reverse()");
  libjsonquery::evaluate_query(data, "$.prices.math(* 2)");
  EXPECT_EQ(data, before);
}

TEST_F(QueryTest, EvaluateBase) {
  EXPECT_EQ(libjsonquery::evaluate_base(data, ""), data);
  EXPECT_EQ(libjsonquery::evaluate_base(data, "$"), data);
  EXPECT_EQ(libjsonquery::evaluate_base(data, "$.prices[1]"), Json::Value{20});
  EXPECT_FALSE(libjsonquery::evaluate_base(data, "$.nosuchthing").has_value());

  const auto prices{libjsonquery::evaluate_base(data, "$.store.book[*].price")};
  ASSERT_TRUE(prices.has_value());
  EXPECT_EQ(prices->size(), 4);
}

TEST_F(QueryTest, AsSequence) {
  EXPECT_EQ(libjsonquery::as_sequence(std::nullopt).size(), 0);
  EXPECT_TRUE(libjsonquery::as_sequence(std::nullopt).isArray());

  const auto wrapped{libjsonquery::as_sequence(Json::Value{"a"})};
  ASSERT_EQ(wrapped.size(), 1);
  EXPECT_EQ(wrapped[0], Json::Value{"a"});

  const auto items{libjsonquery::parse_json("[1, 2]")};
  EXPECT_EQ(libjsonquery::as_sequence(items), items);
}

TEST_F(QueryTest, Filter) {
  const auto rv{libjsonquery::evaluate_filter(data, "$.store.book", "@.price > 10")};
  ASSERT_EQ(rv.size(), 2);
  EXPECT_EQ(rv[0]["title"].asString(), "Sword of Honour");
  EXPECT_EQ(rv[1]["title"].asString(), "The Lord of the Rings");

  EXPECT_EQ(libjsonquery::evaluate_filter(
                data, "$.store.book[*]", "@.title.contains('Moby')")
                .size(),
      1);
  EXPECT_EQ(
      libjsonquery::evaluate_filter(data, "$.nosuchthing", "@.price > 10")
          .size(),
      0);
}
