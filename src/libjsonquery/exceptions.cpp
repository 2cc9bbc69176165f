#include "libjsonquery/exceptions.hpp"
#include <fmt/format.h> // fmt::format

namespace libjsonquery {

std::string format_exception(std::string_view message, const Token& token) {
  return fmt::format("{} ('{}':{})", message, token.query, token.index);
}

} // namespace libjsonquery
