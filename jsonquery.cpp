#include "libjsonquery/config.hpp"
#include "libjsonquery/document.hpp"
#include "libjsonquery/server.hpp"
#include "libjsonquery/tools.hpp"
#include <glog/logging.h>
#include <charconv>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

void usage(std::string_view program) {
  std::cout << program << " Version " << LIBJSONQUERY_VERSION_MAJOR << "."
            << LIBJSONQUERY_VERSION_MINOR << "." << LIBJSONQUERY_VERSION_PATCH
            << std::endl;
  std::cout << "Usage: " << program << " [--no-cache] [-v <level>]"
            << std::endl
            << "       " << program
            << " [--no-cache] [-v <level>] query <file> <expression>"
            << std::endl
            << "       " << program
            << " [--no-cache] [-v <level>] filter <file> <path> <condition>"
            << std::endl;
  std::cout << "With no command, serve JSON-RPC requests on stdin."
            << std::endl;
}

int run_tool(libjsonquery::DocumentCache& cache, std::string_view name,
    const Json::Value& arguments) {
  const auto result{libjsonquery::call_tool(cache, name, arguments)};
  if (result.is_error) {
    std::cerr << result.text << std::endl;
    return 1;
  }
  std::cout << result.text << std::endl;
  return 0;
}

} // namespace

int main(int argc, char* argv[]) {
  google::InitGoogleLogging(argv[0]);
  FLAGS_logtostderr = true;

  const std::string_view program{argv[0]};
  libjsonquery::ServerOptions options{};
  std::vector<std::string> args{};

  for (int i = 1; i < argc; ++i) {
    const std::string_view arg{argv[i]};

    if (arg == "--help" || arg == "-h") {
      usage(program);
      return 0;
    }

    if (arg == "--version") {
      std::cout << libjsonquery::VERSION << std::endl;
      return 0;
    }

    if (arg == "--no-cache") {
      options.use_cache = false;
      continue;
    }

    if (arg == "-v") {
      int level{0};
      const std::string_view value{i + 1 < argc ? argv[i + 1] : ""};
      const auto [end, ec]{std::from_chars(
          value.data(), value.data() + value.size(), level)};
      if (ec != std::errc{} || end != value.data() + value.size()) {
        std::cerr << "-v expects an integer log level" << std::endl;
        return 2;
      }
      FLAGS_v = level;
      ++i;
      continue;
    }

    args.emplace_back(arg);
  }

  if (args.empty()) {
    libjsonquery::Server server{options};
    server.run(std::cin, std::cout);
    return 0;
  }

  libjsonquery::DocumentCache cache{options.use_cache};
  Json::Value arguments{Json::objectValue};

  if (args[0] == "query" && args.size() == 3) {
    arguments["path"] = args[1];
    arguments["jsonPath"] = args[2];
    return run_tool(cache, "query", arguments);
  }

  if (args[0] == "filter" && args.size() == 4) {
    arguments["path"] = args[1];
    arguments["jsonPath"] = args[2];
    arguments["condition"] = args[3];
    return run_tool(cache, "filter", arguments);
  }

  usage(program);
  return 2;
}
