#include "libjsonquery/document.hpp"
#include "libjsonquery/coerce.hpp" // libjsonquery::number_to_string
#include "libjsonquery/exceptions.hpp"
#include <fmt/format.h>   // fmt::format
#include <glog/logging.h> // VLOG
#include <json/writer.h>  // Json::StreamWriterBuilder Json::writeString
#include <cerrno>         // errno
#include <cmath>          // std::isfinite
#include <cstddef>        // std::size_t
#include <fstream>        // std::ifstream
#include <sstream>        // std::ostringstream std::istringstream
#include <string>         // std::string std::to_string
#include <system_error>   // std::error_code std::generic_category
#include <utility>        // std::move

namespace libjsonquery {

namespace {

DocumentError read_error(std::string_view path, std::string_view cause) {
  return DocumentError(
      fmt::format("Failed to read or parse JSON file at {}: {}", path, cause));
}

// jsoncpp reports errors over several indented lines, starting with a
// "* Line 1, Column 1" location. Put them on one line.
std::string one_line(const std::string& errors) {
  std::istringstream lines{errors};
  std::string rv{};
  std::string line{};

  while (std::getline(lines, line)) {
    const auto first{line.find_first_not_of(" *")};
    if (first == std::string::npos) {
      continue;
    }
    if (!rv.empty()) {
      rv.append(": ");
    }
    rv.append(line, first);
  }

  return rv;
}

// Serializes a Json::Value. Numbers are printed by number_to_string, so a
// real is written in its shortest form that reads back to the same double.
// With an indentation, every array element and object member goes on its own
// line.
class JsonWriter {
public:
  explicit JsonWriter(std::string_view indentation)
      : m_indentation{indentation} {}

  std::string write(const Json::Value& value) {
    write_value(value, 0);
    return std::move(m_out);
  }

private:
  std::string_view m_indentation;
  std::string m_out{};

  void newline(std::size_t depth) {
    if (m_indentation.empty()) {
      return;
    }
    m_out.push_back('\n');
    for (std::size_t i = 0; i < depth; i++) {
      m_out.append(m_indentation);
    }
  }

  void write_string(const Json::Value& value) {
    static const Json::StreamWriterBuilder builder{[] {
      Json::StreamWriterBuilder rv{};
      rv["indentation"] = "";
      rv["emitUTF8"] = true;
      return rv;
    }()};
    m_out.append(Json::writeString(builder, value));
  }

  void write_value(const Json::Value& value, std::size_t depth) {
    switch (value.type()) {
    case Json::nullValue:
      m_out.append("null");
      break;
    case Json::booleanValue:
      m_out.append(value.asBool() ? "true" : "false");
      break;
    case Json::intValue:
      m_out.append(std::to_string(value.asLargestInt()));
      break;
    case Json::uintValue:
      m_out.append(std::to_string(value.asLargestUInt()));
      break;
    case Json::realValue: {
      const auto number{value.asDouble()};
      m_out.append(std::isfinite(number) ? number_to_string(number) : "null");
      break;
    }
    case Json::stringValue:
      write_string(value);
      break;
    case Json::arrayValue:
      write_array(value, depth);
      break;
    case Json::objectValue:
      write_object(value, depth);
      break;
    }
  }

  void write_array(const Json::Value& value, std::size_t depth) {
    if (value.empty()) {
      m_out.append("[]");
      return;
    }

    m_out.push_back('[');
    for (Json::ArrayIndex i = 0; i < value.size(); i++) {
      if (i) {
        m_out.push_back(',');
      }
      newline(depth + 1);
      write_value(value[i], depth + 1);
    }
    newline(depth);
    m_out.push_back(']');
  }

  void write_object(const Json::Value& value, std::size_t depth) {
    if (value.empty()) {
      m_out.append("{}");
      return;
    }

    m_out.push_back('{');
    bool first{true};
    for (const auto& name : value.getMemberNames()) {
      if (!first) {
        m_out.push_back(',');
      }
      first = false;
      newline(depth + 1);
      write_string(Json::Value{name});
      m_out.append(m_indentation.empty() ? ":" : ": ");
      write_value(value[name], depth + 1);
    }
    newline(depth);
    m_out.push_back('}');
  }
};

} // namespace

Json::Value parse_json(std::string_view text) {
  Json::CharReaderBuilder builder{};
  builder["collectComments"] = false;
  builder["allowComments"] = false;
  builder["allowTrailingCommas"] = false;
  builder["strictRoot"] = false;
  builder["allowDroppedNullPlaceholders"] = false;
  builder["allowNumericKeys"] = false;
  builder["allowSingleQuotes"] = false;
  builder["failIfExtra"] = true;
  builder["rejectDupKeys"] = false;
  builder["allowSpecialFloats"] = false;

  const std::unique_ptr<Json::CharReader> reader{builder.newCharReader()};
  Json::Value root{};
  std::string errors{};

  if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
    throw JSONError(one_line(errors));
  }

  return root;
}

std::string write_json(const Json::Value& value, std::string_view indentation) {
  return JsonWriter{indentation}.write(value);
}

std::string resolve_path(std::string_view path) {
  return std::filesystem::absolute(std::filesystem::path{path})
      .lexically_normal()
      .string();
}

Json::Value read_document(std::string_view path) {
  const std::filesystem::path file_path{path};

  std::error_code ec{};
  if (std::filesystem::is_directory(file_path, ec)) {
    throw read_error(
        path, std::make_error_code(std::errc::is_a_directory).message());
  }

  std::ifstream stream{file_path, std::ios::in | std::ios::binary};
  if (!stream) {
    throw read_error(path, std::generic_category().message(errno));
  }

  std::ostringstream text{};
  text << stream.rdbuf();

  try {
    return parse_json(text.str());
  } catch (const JSONError& e) {
    throw read_error(path, e.what());
  }
}

std::shared_ptr<const Json::Value> DocumentCache::load(std::string_view path) {
  if (!m_enabled) {
    return std::make_shared<Json::Value>(read_document(path));
  }

  const auto resolved{resolve_path(path)};

  std::error_code ec{};
  const auto mtime{std::filesystem::last_write_time(resolved, ec)};
  if (ec) {
    throw read_error(path, ec.message());
  }

  {
    std::lock_guard<std::mutex> lock{m_mutex};
    const auto it{m_entries.find(resolved)};
    if (it != m_entries.end() && it->second.mtime == mtime) {
      VLOG(2) << "document cache hit for " << resolved;
      return it->second.document;
    }
  }

  VLOG(1) << "document cache miss for " << resolved;
  std::shared_ptr<const Json::Value> document{
      std::make_shared<Json::Value>(read_document(path))};

  std::lock_guard<std::mutex> lock{m_mutex};
  m_entries[resolved] = Entry{mtime, document};
  return document;
}

std::size_t DocumentCache::size() const {
  std::lock_guard<std::mutex> lock{m_mutex};
  return m_entries.size();
}

void DocumentCache::clear() {
  std::lock_guard<std::mutex> lock{m_mutex};
  m_entries.clear();
}

} // namespace libjsonquery
