#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace vault {
namespace config {

// Name of the only setting read from the environment
constexpr const char* ENCRYPTION_KEY_ENV = "VAULT_ENCRYPTION_KEY";

struct StoreConfig {
  // Root of the record tree
  std::filesystem::path data_dir;
  // Master secret for record encryption; records are stored as
  // integrity-wrapped plaintext when empty
  std::optional<std::string> master_key;
  // Bounded wait for every lock acquisition
  std::chrono::milliseconds lock_timeout{30000};
  // Lock waits longer than this are logged at warning level
  std::chrono::milliseconds slow_lock_threshold{5000};
  // Upper bound on a serialized record
  std::size_t max_record_size = 10 * 1024 * 1024;
  unsigned pbkdf2_iterations = 100000;
  // First key segments whose records are written owner read/write only
  std::vector<std::string> sensitive_namespaces{"auth"};

  // Defaults for data_dir plus the master key from VAULT_ENCRYPTION_KEY
  static StoreConfig from_environment(const std::filesystem::path& data_dir);

  bool is_sensitive(const std::string& first_segment) const;
};

} // namespace config
} // namespace vault
