#ifndef LIBJSONQUERY_DOCUMENT_H
#define LIBJSONQUERY_DOCUMENT_H

#include <json/json.h>   // Json::Value
#include <cstddef>       // std::size_t
#include <filesystem>    // std::filesystem::file_time_type
#include <memory>        // std::shared_ptr
#include <mutex>         // std::mutex
#include <string>        // std::string
#include <string_view>   // std::string_view
#include <unordered_map> // std::unordered_map

namespace libjsonquery {

// Parse _text_ as strict JSON. Comments, trailing commas and anything after
// the root value are rejected. Throws a libjsonquery::JSONError.
Json::Value parse_json(std::string_view text);

// Serialize _value_. An empty _indentation_ writes everything on one line.
std::string write_json(const Json::Value& value, std::string_view indentation = "");

// Return _path_ made absolute against the current working directory and
// lexically normalized.
std::string resolve_path(std::string_view path);

// Read and parse the JSON file at _path_. Throws a libjsonquery::DocumentError
// with the message "Failed to read or parse JSON file at <path>: <cause>".
Json::Value read_document(std::string_view path);

// A read-through cache of parsed JSON documents, keyed by resolved path and
// validated against the file's modification time.
//
// load() returns the cached document while the file's mtime is unchanged, so
// repeated loads of an unchanged file return the same pointer. Files are read
// outside the lock. Concurrent loads of a stale path may both read the file,
// and the last one to finish replaces the entry.
class DocumentCache {
public:
  explicit DocumentCache(bool enabled = true) : m_enabled{enabled} {};

  DocumentCache(const DocumentCache&) = delete;
  DocumentCache& operator=(const DocumentCache&) = delete;

  // Return the parsed document at _path_. Throws a
  // libjsonquery::DocumentError if the file can not be read or parsed.
  std::shared_ptr<const Json::Value> load(std::string_view path);

  // The number of cached documents.
  std::size_t size() const;

  void clear();

  bool enabled() const noexcept { return m_enabled; };

private:
  struct Entry {
    std::filesystem::file_time_type mtime{};
    std::shared_ptr<const Json::Value> document{};
  };

  bool m_enabled{true};
  mutable std::mutex m_mutex{};
  std::unordered_map<std::string, Entry> m_entries{};
};

} // namespace libjsonquery

#endif // LIBJSONQUERY_DOCUMENT_H
