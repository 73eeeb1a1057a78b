#include "store/storage_key.hpp"
#include <sstream>

namespace vault {
namespace store {

//==============================================
// CONSTRUCTION
//==============================================

StorageKey StorageKey::validate(std::vector<std::string> segments) {
  if (segments.empty()) {
    throw ValidationError("storage key cannot be empty");
  }
  validate_prefix(segments);
  return StorageKey(std::move(segments), true);
}

StorageKey StorageKey::parse(const std::string& text) {
  std::vector<std::string> segments;
  std::string segment;
  std::istringstream stream(text);
  while (std::getline(stream, segment, '/')) {
    segments.push_back(segment);
  }
  // getline drops a trailing empty segment, keep it so "a/" is rejected
  if (!text.empty() && text.back() == '/') {
    segments.emplace_back();
  }
  return validate(std::move(segments));
}

StorageKey::StorageKey(std::initializer_list<std::string> segments)
  : StorageKey(validate(std::vector<std::string>(segments))) {}

void StorageKey::validate_prefix(const std::vector<std::string>& segments) {
  for (const auto& segment : segments) {
    std::string error = segment_error(segment);
    if (!error.empty()) {
      throw ValidationError(error);
    }
  }
}

std::string StorageKey::segment_error(const std::string& segment) {
  if (segment.empty()) {
    return "key segment cannot be empty";
  }
  if (segment.find("..") != std::string::npos) {
    return "key segment cannot contain '..': " + segment;
  }
  if (segment.find_first_of("/\\") != std::string::npos) {
    return "key segment cannot contain a path separator: " + segment;
  }
  if (segment.find('\0') != std::string::npos) {
    return "key segment cannot contain a NUL byte";
  }
  if (segment.front() == '.') {
    return "key segment cannot start with a dot: " + segment;
  }
  // "a.json/b" would live in the directory that holds the record for "a"
  const std::string suffix = FILE_SUFFIX;
  if (segment.size() >= suffix.size() &&
      segment.compare(segment.size() - suffix.size(), suffix.size(), suffix) == 0) {
    return "key segment cannot end with " + suffix + ": " + segment;
  }
  return {};
}

//==============================================
// PATH MAPPING
//==============================================

std::filesystem::path StorageKey::to_path(const std::filesystem::path& root) const {
  std::filesystem::path path = root;
  for (size_t i = 0; i + 1 < segments_.size(); ++i) {
    path /= segments_[i];
  }
  path /= segments_.back() + FILE_SUFFIX;
  return path;
}

std::string StorageKey::resource_id(const std::filesystem::path& root) const {
  return to_path(root).lexically_normal().string();
}

//==============================================
// QUERY OPERATIONS
//==============================================

bool StorageKey::is_prefix_of(const StorageKey& other) const {
  if (segments_.size() > other.segments_.size()) {
    return false;
  }
  for (size_t i = 0; i < segments_.size(); ++i) {
    if (segments_[i] != other.segments_[i]) {
      return false;
    }
  }
  return true;
}

std::string StorageKey::str() const {
  std::string result;
  for (size_t i = 0; i < segments_.size(); ++i) {
    if (i > 0) {
      result += '/';
    }
    result += segments_[i];
  }
  return result;
}

std::ostream& operator<<(std::ostream& os, const StorageKey& key) {
  return os << key.str();
}

} // namespace store
} // namespace vault
