#ifndef LIBJSONQUERY_SERVER_H
#define LIBJSONQUERY_SERVER_H

#include "libjsonquery/document.hpp" // libjsonquery::DocumentCache
#include "libjsonquery/jsonpath.hpp" // libjsonquery::VERSION
#include <json/json.h>               // Json::Value
#include <istream>                   // std::istream
#include <optional>                  // std::optional
#include <ostream>                   // std::ostream
#include <string>                    // std::string
#include <string_view>               // std::string_view
#include <utility>                   // std::move

namespace libjsonquery {

// JSON-RPC 2.0 error codes.
inline constexpr int PARSE_ERROR{-32700};
inline constexpr int INVALID_REQUEST{-32600};
inline constexpr int METHOD_NOT_FOUND{-32601};
inline constexpr int INVALID_PARAMS{-32602};

inline constexpr std::string_view PROTOCOL_VERSION{"2024-11-05"};

struct ServerOptions {
  std::string name{"jsonquery"};
  std::string version{VERSION};
  bool use_cache{true};
};

// A tool server speaking line delimited JSON-RPC 2.0. Each line read is one
// request or notification, and each response is written as a single line.
class Server {
public:
  explicit Server(ServerOptions options = {})
      : m_options{std::move(options)}, m_cache{m_options.use_cache} {};

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  // Serve requests from _in_ until end of input, writing responses to _out_.
  void run(std::istream& in, std::ostream& out);

  // Handle one line of input. Returns the serialized response, or nullopt if
  // _line_ is blank or a notification.
  std::optional<std::string> handle(std::string_view line);

  // Handle a parsed request.
  std::optional<Json::Value> dispatch(const Json::Value& request);

  const ServerOptions& options() const noexcept { return m_options; };
  DocumentCache& cache() noexcept { return m_cache; };

private:
  ServerOptions m_options;
  DocumentCache m_cache;

  Json::Value initialize() const;
  Json::Value list_tools() const;
  Json::Value call_tool(const Json::Value& params);
};

// Return a JSON-RPC error response.
Json::Value error_response(
    const Json::Value& id, int code, std::string_view message);

} // namespace libjsonquery

#endif // LIBJSONQUERY_SERVER_H
