#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>
#include "store/store.hpp"

namespace vault {
namespace auth {

struct OAuthCredential {
  std::string refresh;
  std::string access;
  // Expiry as milliseconds since the epoch
  std::int64_t expires = 0;
};

struct ApiCredential {
  std::string key;
};

struct WellKnownCredential {
  std::string key;
  std::string token;
};

using Credential = std::variant<OAuthCredential, ApiCredential, WellKnownCredential>;

// JSON tag stored in the "type" field
const char* credential_type(const Credential& credential);

void to_json(nlohmann::json& j, const Credential& credential);
// Throws store::ValidationError for an unknown or missing type
void from_json(const nlohmann::json& j, Credential& credential);

/*
 * Provider credentials persisted as one record per provider under
 * ["auth", <provider>]. The "auth" namespace is sensitive by default, so
 * these files are written owner read/write only.
 */
class CredentialStore {
public:
  static constexpr const char* NAMESPACE = "auth";

  explicit CredentialStore(store::Store& store) : store_(store) {}

  // Throws store::ValidationError for an empty or unaddressable provider
  void set(const std::string& provider, const Credential& credential);
  std::optional<Credential> get(const std::string& provider) const;
  bool remove(const std::string& provider);
  std::map<std::string, Credential> all() const;

  // Re-seals every record in the auth namespace with the configured key.
  // Returns the number of records rewritten, already encrypted ones are skipped.
  std::size_t migrate_to_encrypted();

private:
  store::StorageKey key_for(const std::string& provider) const;

  store::Store& store_;
};

} // namespace auth
} // namespace vault
