#include "libjsonquery/document.hpp"
#include "libjsonquery/exceptions.hpp"
#include <gtest/gtest.h> // EXPECT_* TEST_F testing::Test
#include <chrono>        // std::chrono::hours
#include <cmath>         // std::nan
#include <filesystem>    // std::filesystem
#include <fstream>       // std::ofstream
#include <string>        // std::string
#include <string_view>   // std::string_view

namespace fs = std::filesystem;

class DocumentTest : public testing::Test {
protected:
  fs::path m_dir{};

  void SetUp() override {
    const auto* info{testing::UnitTest::GetInstance()->current_test_info()};
    m_dir = fs::temp_directory_path() /
            (std::string{"libjsonquery-"} + info->name());
    fs::remove_all(m_dir);
    fs::create_directories(m_dir);
  }

  void TearDown() override {
    std::error_code ec{};
    fs::remove_all(m_dir, ec);
  }

  std::string write_file(std::string_view name, std::string_view text) {
    const auto path{m_dir / name};
    std::ofstream out{path, std::ios::out | std::ios::trunc};
    out << text;
    return path.string();
  }

  void expect_document_error(
      libjsonquery::DocumentCache& cache, const std::string& path) {
    try {
      cache.load(path);
      FAIL() << "expected a DocumentError for " << path;
    } catch (const libjsonquery::DocumentError& e) {
      const std::string prefix{
          "Failed to read or parse JSON file at " + path + ": "};
      EXPECT_EQ(std::string(e.what()).substr(0, prefix.size()), prefix);
      EXPECT_GT(std::string(e.what()).size(), prefix.size());
    }
  }
};

TEST_F(DocumentTest, ParseJson) {
  const auto rv{libjsonquery::parse_json(R"({"a": [1, 2.5, "x", null]})")};
  ASSERT_TRUE(rv.isObject());
  EXPECT_EQ(rv["a"].size(), 4);
  EXPECT_EQ(rv["a"][1].asDouble(), 2.5);
}

TEST_F(DocumentTest, ParseJsonIsStrict) {
  EXPECT_THROW(libjsonquery::parse_json("{"), libjsonquery::JSONError);
  EXPECT_THROW(libjsonquery::parse_json("[1, 2,]"), libjsonquery::JSONError);
  EXPECT_THROW(
      libjsonquery::parse_json("// note\n{}"), libjsonquery::JSONError);
  EXPECT_THROW(libjsonquery::parse_json("{'a': 1}"), libjsonquery::JSONError);
  EXPECT_THROW(libjsonquery::parse_json("1 2"), libjsonquery::JSONError);
  EXPECT_THROW(libjsonquery::parse_json(""), libjsonquery::JSONError);
}

TEST_F(DocumentTest, ParseErrorsAreOneLine) {
  try {
    libjsonquery::parse_json("{\n  \"a\": }");
    FAIL() << "expected a JSONError";
  } catch (const libjsonquery::JSONError& e) {
    EXPECT_EQ(std::string(e.what()).find('\n'), std::string::npos);
    EXPECT_NE(std::string(e.what()).find("Line 2"), std::string::npos);
  }
}

TEST_F(DocumentTest, WriteJson) {
  const auto value{libjsonquery::parse_json(R"({"a": [1, "x"], "b": null})")};
  EXPECT_EQ(libjsonquery::write_json(value), R"({"a":[1,"x"],"b":null})");

  const auto pretty{libjsonquery::write_json(value, "  ")};
  EXPECT_NE(pretty.find("\n  \"a\": ["), std::string::npos);
  EXPECT_NE(pretty.find("\"b\": null"), std::string::npos);
}

TEST_F(DocumentTest, WriteJsonNumbers) {
  EXPECT_EQ(libjsonquery::write_json(Json::Value{0.1 + 0.2}),
      "0.30000000000000004");
  EXPECT_EQ(libjsonquery::write_json(libjsonquery::parse_json(
                "[0.1, 1e21, 12.5, 11.0, -3, 18446744073709551615]")),
      "[0.1,1e+21,12.5,11,-3,18446744073709551615]");
  EXPECT_EQ(libjsonquery::write_json(Json::Value{std::nan("")}), "null");
}

TEST_F(DocumentTest, WriteJsonPretty) {
  const auto value{
      libjsonquery::parse_json(R"({"a": [1, [], "x"], "b": {}, "c": {"d": 0.5}})")};
  EXPECT_EQ(libjsonquery::write_json(value, "  "),
      "{\n"
      "  \"a\": [\n"
      "    1,\n"
      "    [],\n"
      "    \"x\"\n"
      "  ],\n"
      "  \"b\": {},\n"
      "  \"c\": {\n"
      "    \"d\": 0.5\n"
      "  }\n"
      "}");
}

TEST_F(DocumentTest, WriteJsonKeepsUTF8) {
  EXPECT_EQ(libjsonquery::write_json(Json::Value{"caf\xc3\xa9"}),
      "\"caf\xc3\xa9\"");
}

TEST_F(DocumentTest, ResolvePath) {
  EXPECT_EQ(libjsonquery::resolve_path("a/../b.json"),
      (fs::current_path() / "b.json").string());
  EXPECT_EQ(libjsonquery::resolve_path("/tmp/./x.json"), "/tmp/x.json");
}

TEST_F(DocumentTest, ReadDocument) {
  const auto path{write_file("books.json", R"({"books": [1, 2, 3]})")};
  const auto rv{libjsonquery::read_document(path)};
  EXPECT_EQ(rv["books"].size(), 3);
}

TEST_F(DocumentTest, CachedLoadsShareADocument) {
  const auto path{write_file("books.json", R"({"books": [1, 2, 3]})")};
  libjsonquery::DocumentCache cache{};

  const auto first{cache.load(path)};
  const auto second{cache.load(path)};
  EXPECT_EQ(first.get(), second.get());
  EXPECT_EQ(cache.size(), 1);

  // A relative spelling of the same file shares the entry.
  const auto third{cache.load((m_dir / "." / "books.json").string())};
  EXPECT_EQ(first.get(), third.get());
  EXPECT_EQ(cache.size(), 1);
}

TEST_F(DocumentTest, ModifiedFilesAreReloaded) {
  const auto path{write_file("books.json", R"({"books": [1, 2, 3]})")};
  libjsonquery::DocumentCache cache{};

  const auto first{cache.load(path)};
  write_file("books.json", R"({"books": [1]})");
  fs::last_write_time(path, fs::last_write_time(path) + std::chrono::hours{1});

  const auto second{cache.load(path)};
  EXPECT_NE(first.get(), second.get());
  EXPECT_EQ((*second)["books"].size(), 1);
  EXPECT_EQ((*first)["books"].size(), 3);
  EXPECT_EQ(cache.size(), 1);
}

TEST_F(DocumentTest, Clear) {
  libjsonquery::DocumentCache cache{};
  cache.load(write_file("a.json", "[]"));
  cache.load(write_file("b.json", "{}"));
  EXPECT_EQ(cache.size(), 2);
  cache.clear();
  EXPECT_EQ(cache.size(), 0);
}

TEST_F(DocumentTest, DisabledCache) {
  const auto path{write_file("books.json", "[1]")};
  libjsonquery::DocumentCache cache{false};
  EXPECT_FALSE(cache.enabled());

  const auto first{cache.load(path)};
  const auto second{cache.load(path)};
  EXPECT_NE(first.get(), second.get());
  EXPECT_EQ(*first, *second);
  EXPECT_EQ(cache.size(), 0);
}

TEST_F(DocumentTest, MissingFile) {
  libjsonquery::DocumentCache cache{};
  expect_document_error(cache, (m_dir / "nosuchfile.json").string());

  libjsonquery::DocumentCache uncached{false};
  expect_document_error(uncached, (m_dir / "nosuchfile.json").string());
}

TEST_F(DocumentTest, InvalidJson) {
  libjsonquery::DocumentCache cache{};
  expect_document_error(cache, write_file("bad.json", "{\"a\": "));
  EXPECT_EQ(cache.size(), 0);
}

TEST_F(DocumentTest, Directory) {
  libjsonquery::DocumentCache cache{};
  expect_document_error(cache, m_dir.string());
}
