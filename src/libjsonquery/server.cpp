#include "libjsonquery/server.hpp"
#include "libjsonquery/exceptions.hpp" // libjsonquery::JSONError
#include "libjsonquery/tools.hpp"
#include <fmt/format.h>   // fmt::format
#include <glog/logging.h> // LOG VLOG
#include <utility>        // std::move

namespace libjsonquery {

namespace {

Json::Value result_response(const Json::Value& id, Json::Value result) {
  Json::Value rv{Json::objectValue};
  rv["jsonrpc"] = "2.0";
  rv["id"] = id;
  rv["result"] = std::move(result);
  return rv;
}

bool valid_id(const Json::Value& id) {
  return id.isNull() || id.isString() || id.isNumeric();
}

} // namespace

Json::Value error_response(
    const Json::Value& id, int code, std::string_view message) {
  Json::Value rv{Json::objectValue};
  rv["jsonrpc"] = "2.0";
  rv["id"] = id;
  rv["error"]["code"] = code;
  rv["error"]["message"] = std::string{message};
  return rv;
}

void Server::run(std::istream& in, std::ostream& out) {
  LOG(INFO) << m_options.name << " " << m_options.version
            << " running on stdio";

  std::string line{};
  while (std::getline(in, line)) {
    if (const auto response{handle(line)}) {
      out << response.value() << '\n';
      out.flush();
    }
  }

  LOG(INFO) << m_options.name << " shutting down";
}

std::optional<std::string> Server::handle(std::string_view line) {
  if (line.find_first_not_of(" \t\r") == std::string_view::npos) {
    return std::nullopt;
  }

  Json::Value request{};
  try {
    request = parse_json(line);
  } catch (const JSONError& e) {
    LOG(WARNING) << "unparseable request: " << e.what();
    return write_json(error_response(
        Json::Value{Json::nullValue}, PARSE_ERROR, "Parse error"));
  }

  const auto response{dispatch(request)};
  if (!response) {
    return std::nullopt;
  }
  return write_json(response.value());
}

std::optional<Json::Value> Server::dispatch(const Json::Value& request) {
  if (!request.isObject() || !request["method"].isString() ||
      request.get("jsonrpc", "") != "2.0" || !valid_id(request["id"])) {
    LOG(WARNING) << "invalid request: " << write_json(request);
    const auto id{request.isObject() && valid_id(request["id"])
                      ? request["id"]
                      : Json::Value{Json::nullValue}};
    return error_response(id, INVALID_REQUEST, "Invalid Request");
  }

  const auto method{request["method"].asString()};
  const bool notification{!request.isMember("id")};
  VLOG(1) << "request '" << method << "'"
          << (notification ? " (notification)" : "");

  if (notification) {
    return std::nullopt;
  }

  const auto& id{request["id"]};

  if (method == "initialize") {
    return result_response(id, initialize());
  }
  if (method == "ping") {
    return result_response(id, Json::Value{Json::objectValue});
  }
  if (method == "tools/list") {
    return result_response(id, list_tools());
  }
  if (method == "tools/call") {
    const auto& params{request["params"]};
    if (!params.isObject() || !params["name"].isString()) {
      return error_response(
          id, INVALID_PARAMS, "tools/call requires a tool name");
    }
    return result_response(id, call_tool(params));
  }

  LOG(WARNING) << "unknown method '" << method << "'";
  return error_response(
      id, METHOD_NOT_FOUND, fmt::format("Method not found: {}", method));
}

Json::Value Server::initialize() const {
  Json::Value rv{Json::objectValue};
  rv["protocolVersion"] = std::string{PROTOCOL_VERSION};
  rv["serverInfo"]["name"] = m_options.name;
  rv["serverInfo"]["version"] = m_options.version;
  rv["capabilities"]["tools"] = Json::Value{Json::objectValue};
  return rv;
}

Json::Value Server::list_tools() const {
  Json::Value rv{Json::objectValue};
  rv["tools"] = tool_definitions();
  return rv;
}

Json::Value Server::call_tool(const Json::Value& params) {
  const auto name{params["name"].asString()};
  const auto arguments{params.get("arguments", Json::Value{Json::objectValue})};
  const auto result{libjsonquery::call_tool(m_cache, name, arguments)};

  Json::Value content{Json::objectValue};
  content["type"] = "text";
  content["text"] = result.text;

  Json::Value rv{Json::objectValue};
  rv["content"] = Json::Value{Json::arrayValue};
  rv["content"].append(content);
  rv["isError"] = result.is_error;
  return rv;
}

} // namespace libjsonquery
