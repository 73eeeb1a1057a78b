#pragma once

#include <filesystem>
#include <initializer_list>
#include <ostream>
#include <string>
#include <utility>
#include <vector>
#include "store/store_error.hpp"

namespace vault {
namespace store {

/*
 * Hierarchical record key, e.g. {"session", project_id, session_id}.
 * Always valid once constructed: non-empty, and no segment is empty, starts
 * with '.', ends with ".json", contains "..", a path separator or a NUL byte.
 * Distinct keys therefore never share a file or directory on disk.
 */
class StorageKey {
public:
  static constexpr const char* FILE_SUFFIX = ".json";

  // ---- CONSTRUCTION ----
  // Throws ValidationError
  static StorageKey validate(std::vector<std::string> segments);
  // Splits "a/b/c" on '/' and validates the segments
  static StorageKey parse(const std::string& text);

  StorageKey(std::initializer_list<std::string> segments);


  // ---- PATH MAPPING ----
  // root/<seg>/.../<seg>.json
  std::filesystem::path to_path(const std::filesystem::path& root) const;
  // Canonical string form of to_path, used as the lock resource id
  std::string resource_id(const std::filesystem::path& root) const;


  // ---- QUERY OPERATIONS ----
  const std::vector<std::string>& segments() const { return segments_; }
  std::size_t size() const { return segments_.size(); }
  const std::string& front() const { return segments_.front(); }
  bool is_prefix_of(const StorageKey& other) const;
  // Slash-joined form, for logs and the CLI
  std::string str() const;

  // Checks a single segment, returns an empty string if valid
  static std::string segment_error(const std::string& segment);
  // Same rules for a listing prefix, which may be empty
  static void validate_prefix(const std::vector<std::string>& segments);

  friend bool operator==(const StorageKey& a, const StorageKey& b) { return a.segments_ == b.segments_; }
  friend bool operator!=(const StorageKey& a, const StorageKey& b) { return !(a == b); }
  friend bool operator<(const StorageKey& a, const StorageKey& b) { return a.segments_ < b.segments_; }

private:
  explicit StorageKey(std::vector<std::string> segments, bool /*validated*/)
    : segments_(std::move(segments)) {}

  std::vector<std::string> segments_;
};

std::ostream& operator<<(std::ostream& os, const StorageKey& key);

} // namespace store
} // namespace vault
