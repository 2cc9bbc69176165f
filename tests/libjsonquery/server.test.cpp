#include "libjsonquery/server.hpp"
#include "libjsonquery/document.hpp" // libjsonquery::parse_json
#include <gtest/gtest.h>             // EXPECT_* TEST_F testing::Test
#include <filesystem>                // std::filesystem
#include <fstream>                   // std::ofstream
#include <sstream>                   // std::istringstream std::ostringstream
#include <string>                    // std::string std::getline
#include <string_view>               // std::string_view
#include <vector>                    // std::vector

namespace fs = std::filesystem;

class ServerTest : public testing::Test {
protected:
  libjsonquery::Server m_server{};
  std::string m_path{};

  void SetUp() override {
    m_path = (fs::temp_directory_path() / "libjsonquery-server-test.json")
                 .string();
    std::ofstream out{m_path, std::ios::out | std::ios::trunc};
    out << R"({"prices": [10, 20]})";
  }

  void TearDown() override {
    std::error_code ec{};
    fs::remove(m_path, ec);
  }

  Json::Value handle(std::string_view line) {
    const auto rv{m_server.handle(line)};
    EXPECT_TRUE(rv.has_value()) << line;
    if (!rv) {
      return Json::Value{};
    }
    EXPECT_EQ(rv->find('\n'), std::string::npos);
    return libjsonquery::parse_json(rv.value());
  }

  void expect_error(std::string_view line, const Json::Value& id, int code) {
    const auto rv{handle(line)};
    EXPECT_EQ(rv["jsonrpc"].asString(), "2.0") << line;
    EXPECT_EQ(rv["id"], id) << line;
    EXPECT_EQ(rv["error"]["code"].asInt(), code) << line;
    EXPECT_FALSE(rv.isMember("result")) << line;
  }

  std::string call(std::string_view tool, std::string_view json_path) {
    Json::Value request{Json::objectValue};
    request["jsonrpc"] = "2.0";
    request["id"] = 7;
    request["method"] = "tools/call";
    request["params"]["name"] = std::string{tool};
    request["params"]["arguments"]["path"] = m_path;
    request["params"]["arguments"]["jsonPath"] = std::string{json_path};
    return libjsonquery::write_json(request);
  }
};

TEST_F(ServerTest, Initialize) {
  const auto rv{handle(
      R"({"jsonrpc": "2.0", "id": 1, "method": "initialize", "params": {}})")};
  EXPECT_EQ(rv["id"].asInt(), 1);
  EXPECT_EQ(rv["result"]["protocolVersion"].asString(), "2024-11-05");
  EXPECT_EQ(rv["result"]["serverInfo"]["name"].asString(), "jsonquery");
  EXPECT_EQ(rv["result"]["serverInfo"]["version"].asString(),
      std::string{libjsonquery::VERSION});
  EXPECT_TRUE(rv["result"]["capabilities"]["tools"].isObject());
}

TEST_F(ServerTest, Options) {
  libjsonquery::Server server{
      libjsonquery::ServerOptions{"books", "0.0.1", false}};
  EXPECT_FALSE(server.cache().enabled());

  const auto rv{libjsonquery::parse_json(
      server.handle(R"({"jsonrpc": "2.0", "id": "a", "method": "initialize"})")
          .value())};
  EXPECT_EQ(rv["id"].asString(), "a");
  EXPECT_EQ(rv["result"]["serverInfo"]["name"].asString(), "books");
  EXPECT_EQ(rv["result"]["serverInfo"]["version"].asString(), "0.0.1");
}

TEST_F(ServerTest, Ping) {
  const auto rv{handle(R"({"jsonrpc": "2.0", "id": 2, "method": "ping"})")};
  EXPECT_TRUE(rv["result"].isObject());
  EXPECT_TRUE(rv["result"].empty());
}

TEST_F(ServerTest, ListTools) {
  const auto rv{
      handle(R"({"jsonrpc": "2.0", "id": 3, "method": "tools/list"})")};
  const auto& tools{rv["result"]["tools"]};
  ASSERT_EQ(tools.size(), 2);
  EXPECT_EQ(tools[0]["name"].asString(), "query");
  EXPECT_EQ(tools[1]["name"].asString(), "filter");
}

TEST_F(ServerTest, CallTool) {
  const auto rv{handle(call("query", "$.prices.math(* 1.1)"))};
  EXPECT_EQ(rv["id"].asInt(), 7);
  EXPECT_FALSE(rv["result"]["isError"].asBool());

  const auto& content{rv["result"]["content"]};
  ASSERT_EQ(content.size(), 1);
  EXPECT_EQ(content[0]["type"].asString(), "text");
  EXPECT_EQ(libjsonquery::parse_json(content[0]["text"].asString()),
      libjsonquery::parse_json("[11, 22]"));
}

TEST_F(ServerTest, ToolErrorsAreResults) {
  const auto rv{handle(call("drop", "$"))};
  EXPECT_FALSE(rv.isMember("error"));
  EXPECT_TRUE(rv["result"]["isError"].asBool());
  EXPECT_EQ(rv["result"]["content"][0]["text"].asString(),
      "Error: Unknown tool: drop");
}

TEST_F(ServerTest, CallToolWithoutName) {
  expect_error(R"({"jsonrpc": "2.0", "id": 4, "method": "tools/call", "params": {}})",
      Json::Value{4}, libjsonquery::INVALID_PARAMS);
  expect_error(R"({"jsonrpc": "2.0", "id": 5, "method": "tools/call"})",
      Json::Value{5}, libjsonquery::INVALID_PARAMS);
}

TEST_F(ServerTest, MissingArgumentsDefaultToAnObject) {
  const auto rv{handle(
      R"({"jsonrpc": "2.0", "id": 6, "method": "tools/call", "params": {"name": "query"}})")};
  EXPECT_TRUE(rv["result"]["isError"].asBool());
  EXPECT_EQ(rv["result"]["content"][0]["text"].asString(),
      "Error: missing required argument 'path'");
}

TEST_F(ServerTest, ParseError) {
  expect_error("{\"jsonrpc\": ", Json::Value{}, libjsonquery::PARSE_ERROR);
}

TEST_F(ServerTest, InvalidRequests) {
  expect_error("[]", Json::Value{}, libjsonquery::INVALID_REQUEST);
  expect_error(R"({"jsonrpc": "2.0", "id": 1})", Json::Value{1},
      libjsonquery::INVALID_REQUEST);
  expect_error(R"({"jsonrpc": "1.0", "id": 1, "method": "ping"})",
      Json::Value{1}, libjsonquery::INVALID_REQUEST);
  expect_error(R"({"jsonrpc": "2.0", "id": {}, "method": "ping"})",
      Json::Value{}, libjsonquery::INVALID_REQUEST);
}

TEST_F(ServerTest, MethodNotFound) {
  const auto rv{
      handle(R"({"jsonrpc": "2.0", "id": 9, "method": "resources/list"})")};
  EXPECT_EQ(rv["error"]["code"].asInt(), libjsonquery::METHOD_NOT_FOUND);
  EXPECT_EQ(rv["error"]["message"].asString(),
      "Method not found: resources/list");
}

TEST_F(ServerTest, NotificationsHaveNoResponse) {
  EXPECT_FALSE(
      m_server
          .handle(R"({"jsonrpc": "2.0", "method": "notifications/initialized"})")
          .has_value());
  EXPECT_FALSE(m_server.handle(R"({"jsonrpc": "2.0", "method": "ping"})")
                   .has_value());
}

TEST_F(ServerTest, BlankLinesAreIgnored) {
  EXPECT_FALSE(m_server.handle("").has_value());
  EXPECT_FALSE(m_server.handle("  \t\r").has_value());
}

TEST_F(ServerTest, Run) {
  std::istringstream in{
      R"({"jsonrpc": "2.0", "id": 1, "method": "initialize"})"
      "\n"
      R"({"jsonrpc": "2.0", "method": "notifications/initialized"})"
      "\n\n" +
      call("query", "$.prices.sum(x)") + "\n" + "not json\n"};
  std::ostringstream out{};

  m_server.run(in, out);

  std::istringstream lines{out.str()};
  std::vector<Json::Value> responses{};
  std::string line{};
  while (std::getline(lines, line)) {
    responses.push_back(libjsonquery::parse_json(line));
  }

  ASSERT_EQ(responses.size(), 3);
  EXPECT_EQ(responses[0]["id"].asInt(), 1);
  EXPECT_EQ(responses[1]["id"].asInt(), 7);
  EXPECT_EQ(responses[1]["result"]["content"][0]["text"].asString(), "0");
  EXPECT_EQ(responses[2]["error"]["code"].asInt(), libjsonquery::PARSE_ERROR);
}
