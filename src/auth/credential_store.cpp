#include "auth/credential_store.hpp"
#include "config/config.hpp"
#include "crypto/crypto_error.hpp"
#include <type_traits>
#include <boost/log/trivial.hpp>

namespace vault {
namespace auth {

namespace {

// Helper for exhaustive std::visit over the credential alternatives
template <typename... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <typename... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

//==============================================
// JSON CONVERSION
//==============================================

const char* credential_type(const Credential& credential) {
  return std::visit(overloaded{
    [](const OAuthCredential&) { return "oauth"; },
    [](const ApiCredential&) { return "api"; },
    [](const WellKnownCredential&) { return "wellknown"; },
  }, credential);
}

void to_json(nlohmann::json& j, const Credential& credential) {
  j = std::visit(overloaded{
    [](const OAuthCredential& c) {
      return nlohmann::json{{"refresh", c.refresh}, {"access", c.access}, {"expires", c.expires}};
    },
    [](const ApiCredential& c) {
      return nlohmann::json{{"key", c.key}};
    },
    [](const WellKnownCredential& c) {
      return nlohmann::json{{"key", c.key}, {"token", c.token}};
    },
  }, credential);
  j["type"] = credential_type(credential);
}

void from_json(const nlohmann::json& j, Credential& credential) {
  if (!j.is_object() || !j.contains("type") || !j.at("type").is_string()) {
    throw store::ValidationError("credential has no type tag");
  }

  const std::string type = j.at("type").get<std::string>();
  try {
    if (type == "oauth") {
      credential = OAuthCredential{j.at("refresh").get<std::string>(), j.at("access").get<std::string>(),
                                   j.at("expires").get<std::int64_t>()};
    } else if (type == "api") {
      credential = ApiCredential{j.at("key").get<std::string>()};
    } else if (type == "wellknown") {
      credential = WellKnownCredential{j.at("key").get<std::string>(), j.at("token").get<std::string>()};
    } else {
      throw store::ValidationError("unknown credential type: " + type);
    }
  } catch (const nlohmann::json::exception& e) {
    throw store::ValidationError("malformed " + type + " credential: " + e.what());
  }
}


//==============================================
// CREDENTIAL OPERATIONS
//==============================================

void CredentialStore::set(const std::string& provider, const Credential& credential) {
  store::StorageKey key = key_for(provider);
  store_.write(key, nlohmann::json(credential));
  BOOST_LOG_TRIVIAL(info) << "Auth: Stored " << credential_type(credential) << " credential for " << provider;
}

std::optional<Credential> CredentialStore::get(const std::string& provider) const {
  return store_.read_as<Credential>(key_for(provider));
}

bool CredentialStore::remove(const std::string& provider) {
  bool existed = store_.remove(key_for(provider));
  if (existed) {
    BOOST_LOG_TRIVIAL(info) << "Auth: Removed credential for " << provider;
  }
  return existed;
}

std::map<std::string, Credential> CredentialStore::all() const {
  std::map<std::string, Credential> result;
  for (const auto& key : store_.list({NAMESPACE})) {
    // Only direct children are providers
    if (key.size() != 2) {
      continue;
    }
    auto credential = store_.read_as<Credential>(key);
    if (credential) {
      result.emplace(key.segments()[1], std::move(*credential));
    }
  }
  return result;
}

std::size_t CredentialStore::migrate_to_encrypted() {
  if (!store_.encryption_enabled()) {
    throw crypto::KeyUnavailableError("set " + std::string(config::ENCRYPTION_KEY_ENV) +
                                      " to migrate credentials");
  }

  // Each record is re-read and rewritten under its own exclusive lock, so a
  // concurrent set() or remove() is never overwritten with a stale value
  std::size_t migrated = store_.migrate_to_encrypted({NAMESPACE});

  BOOST_LOG_TRIVIAL(info) << "Auth: Migrated " << migrated << " credentials to encrypted storage";
  return migrated;
}

store::StorageKey CredentialStore::key_for(const std::string& provider) const {
  return store::StorageKey::validate({NAMESPACE, provider});
}

} // namespace auth
} // namespace vault
