#include "libjsonquery/coerce.hpp"
#include "libjsonquery/document.hpp" // libjsonquery::parse_json
#include <gtest/gtest.h>             // EXPECT_* TEST_F testing::Test
#include <cmath>                     // std::isnan
#include <string_view>               // std::string_view

using op = libjsonquery::BinaryOperator;

class CoerceTest : public testing::Test {
protected:
  Json::Value value(std::string_view json) {
    return libjsonquery::parse_json(json);
  }

  void expect_number(std::string_view json, double want) {
    const auto v{value(json)};
    EXPECT_EQ(libjsonquery::to_number(&v), want) << json;
  }

  void expect_nan(std::string_view json) {
    const auto v{value(json)};
    EXPECT_TRUE(std::isnan(libjsonquery::to_number(&v))) << json;
  }

  void expect_string(std::string_view json, std::string_view want) {
    const auto v{value(json)};
    EXPECT_EQ(libjsonquery::coerce_string(&v), want) << json;
  }

  void expect_compare(std::string_view lhs, op o, std::string_view rhs,
      bool want) {
    const auto l{value(lhs)};
    const auto r{value(rhs)};
    EXPECT_EQ(libjsonquery::loose_compare(&l, o, &r), want)
        << lhs << " " << static_cast<int>(o) << " " << rhs;
  }
};

TEST_F(CoerceTest, GetField) {
  const auto book{value(R"({"title": "Moby Dick", "price": 8.99})")};
  ASSERT_NE(libjsonquery::get_field(book, "title"), nullptr);
  EXPECT_EQ(libjsonquery::get_field(book, "title")->asString(), "Moby Dick");
  EXPECT_EQ(libjsonquery::get_field(book, "isbn"), nullptr);
  EXPECT_EQ(libjsonquery::get_field(value("[1, 2]"), "0"), nullptr);
}

TEST_F(CoerceTest, NumberToString) {
  EXPECT_EQ(libjsonquery::number_to_string(0), "0");
  EXPECT_EQ(libjsonquery::number_to_string(-0.0), "0");
  EXPECT_EQ(libjsonquery::number_to_string(42), "42");
  EXPECT_EQ(libjsonquery::number_to_string(8.95), "8.95");
  EXPECT_EQ(libjsonquery::number_to_string(-0.5), "-0.5");
  EXPECT_EQ(libjsonquery::number_to_string(0.1 + 0.2), "0.30000000000000004");
  EXPECT_EQ(libjsonquery::number_to_string(1e21), "1e+21");
  EXPECT_EQ(libjsonquery::number_to_string(1.5e-7), "1.5e-7");
  EXPECT_EQ(libjsonquery::number_to_string(0.000001), "0.000001");
  EXPECT_EQ(libjsonquery::number_to_string(123456789012), "123456789012");
}

TEST_F(CoerceTest, StringsToNumbers) {
  expect_number(R"("42")", 42);
  expect_number(R"("  12.5  ")", 12.5);
  expect_number(R"("")", 0);
  expect_number(R"("   ")", 0);
  expect_number(R"("1e3")", 1000);
  expect_number(R"(".5")", 0.5);
  expect_number(R"("0x1F")", 31);
  expect_number(R"("0b101")", 5);
  expect_number(R"("0o17")", 15);
  expect_nan(R"("12abc")");
  expect_nan(R"("abc")");
}

TEST_F(CoerceTest, OtherValuesToNumbers) {
  expect_number("true", 1);
  expect_number("false", 0);
  expect_number("null", 0);
  expect_number("[]", 0);
  expect_number("[7]", 7);
  expect_nan("[1, 2]");
  expect_nan("{}");
  EXPECT_TRUE(std::isnan(libjsonquery::to_number(nullptr)));
}

TEST_F(CoerceTest, CoerceNumberReplacesNaN) {
  const auto v{value(R"("n/a")")};
  EXPECT_EQ(libjsonquery::coerce_number(&v), 0);
  EXPECT_EQ(libjsonquery::coerce_number(nullptr), 0);
}

TEST_F(CoerceTest, JsonNumber) {
  EXPECT_TRUE(libjsonquery::json_number(11).isInt64());
  EXPECT_EQ(libjsonquery::json_number(11).asInt64(), 11);
  EXPECT_EQ(libjsonquery::json_number(8.95).type(), Json::realValue);
  EXPECT_TRUE(libjsonquery::json_number(std::nan("")).isNull());
  EXPECT_EQ(libjsonquery::json_number(1e300).type(), Json::realValue);
}

TEST_F(CoerceTest, CoerceString) {
  expect_string("null", "null");
  expect_string("true", "true");
  expect_string("12.99", "12.99");
  expect_string("3", "3");
  expect_string(R"("Moby Dick")", "Moby Dick");
  expect_string(R"([1, "a", null, [2, 3]])", "1,a,,2,3");
  expect_string(R"({"a": 1})", "[object Object]");
  EXPECT_EQ(libjsonquery::coerce_string(nullptr), "undefined");
}

TEST_F(CoerceTest, Truthiness) {
  for (const auto* json : {"false", "0", "null", "\"\""}) {
    const auto v{value(json)};
    EXPECT_FALSE(libjsonquery::truthy(&v)) << json;
  }
  for (const auto* json : {"true", "1", "-0.5", "\"0\"", "[]", "{}"}) {
    const auto v{value(json)};
    EXPECT_TRUE(libjsonquery::truthy(&v)) << json;
  }
  EXPECT_FALSE(libjsonquery::truthy(nullptr));
}

TEST_F(CoerceTest, CanonicalJsonIgnoresMemberOrderAndIntegerForm) {
  EXPECT_EQ(libjsonquery::canonical_json(value(R"({"b": 1, "a": [true, null]})")),
      R"({"a":[true,null],"b":1})");
  EXPECT_EQ(libjsonquery::canonical_json(value("1.0")),
      libjsonquery::canonical_json(value("1")));
}

TEST_F(CoerceTest, CanonicalJsonKeepsEmbeddedNul) {
  EXPECT_EQ(libjsonquery::canonical_json(value(R"("a\u0000b")")),
      R"("a\u0000b")");
  EXPECT_NE(libjsonquery::canonical_json(value(R"("a\u0000b")")),
      libjsonquery::canonical_json(value(R"("a\u0000c")")));
  EXPECT_NE(libjsonquery::canonical_json(value(R"({"k\u0000a": 1})")),
      libjsonquery::canonical_json(value(R"({"k\u0000b": 1})")));
}

TEST_F(CoerceTest, JsonEquals) {
  EXPECT_TRUE(libjsonquery::json_equals(value("1"), value("1.0")));
  EXPECT_TRUE(libjsonquery::json_equals(
      value(R"({"a": [1, {"b": 2}]})"), value(R"({"a": [1, {"b": 2}]})")));
  EXPECT_FALSE(libjsonquery::json_equals(value(R"({"a": 1})"), value(R"({"a": 1, "b": 2})")));
  EXPECT_FALSE(libjsonquery::json_equals(value("true"), value("1")));
  EXPECT_FALSE(libjsonquery::json_equals(value(R"("1")"), value("1")));
}

TEST_F(CoerceTest, StrictEquals) {
  const auto one{value("1")};
  const auto one_string{value(R"("1")")};
  const auto array{value("[1]")};
  const auto same_array{value("[1]")};
  EXPECT_TRUE(libjsonquery::strict_equals(&one, &one));
  EXPECT_FALSE(libjsonquery::strict_equals(&one, &one_string));
  EXPECT_TRUE(libjsonquery::strict_equals(&array, &array));
  EXPECT_FALSE(libjsonquery::strict_equals(&array, &same_array));
  EXPECT_TRUE(libjsonquery::strict_equals(nullptr, nullptr));
}

TEST_F(CoerceTest, LooseEquality) {
  expect_compare("1", op::eq, R"("1")", true);
  expect_compare("1", op::eq, "true", true);
  expect_compare("0", op::eq, R"("")", true);
  expect_compare("null", op::eq, "0", false);
  expect_compare("null", op::eq, "null", true);
  expect_compare("[2]", op::eq, "2", true);
  expect_compare(R"([1, 2])", op::eq, R"("1,2")", true);
  expect_compare(R"("fiction")", op::ne, R"("reference")", true);
  expect_compare(R"("a")", op::ne, R"("a")", false);

  const auto null_value{value("null")};
  EXPECT_TRUE(libjsonquery::loose_equals(nullptr, &null_value));
}

TEST_F(CoerceTest, RelationalComparison) {
  expect_compare("12.99", op::gt, "10", true);
  expect_compare("8.95", op::gt, "10", false);
  expect_compare(R"("12.99")", op::gt, "10", true);
  expect_compare(R"("10")", op::lt, R"("9")", true);
  expect_compare("10", op::ge, "10", true);
  expect_compare("10", op::le, "9", false);
  expect_compare("null", op::lt, "1", true);
  expect_compare("true", op::gt, "0", true);
}

TEST_F(CoerceTest, ComparisonsWithNaNAreFalse) {
  expect_compare(R"("abc")", op::gt, "1", false);
  expect_compare(R"("abc")", op::le, "1", false);
  expect_compare(R"("abc")", op::ge, "1", false);
  expect_compare(R"("abc")", op::eq, "1", false);
  expect_compare(R"("abc")", op::ne, "1", true);

  const auto ten{value("10")};
  EXPECT_FALSE(libjsonquery::loose_compare(nullptr, op::gt, &ten));
  EXPECT_FALSE(libjsonquery::loose_compare(nullptr, op::lt, &ten));
  EXPECT_FALSE(libjsonquery::loose_less_than(nullptr, &ten).has_value());
}
