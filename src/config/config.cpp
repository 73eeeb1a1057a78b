#include "config/config.hpp"
#include "crypto/cipher.hpp"
#include <algorithm>
#include <cstdlib>
#include <boost/log/trivial.hpp>

namespace vault {
namespace config {

StoreConfig StoreConfig::from_environment(const std::filesystem::path& data_dir) {
  StoreConfig config;
  config.data_dir = data_dir;

  const char* key = std::getenv(ENCRYPTION_KEY_ENV);
  if (key && *key) {
    config.master_key = std::string(key);
    BOOST_LOG_TRIVIAL(info) << "Config: Encryption enabled from " << ENCRYPTION_KEY_ENV;
    if (!crypto::AesGcmCipher::is_valid_key(*config.master_key)) {
      BOOST_LOG_TRIVIAL(warning) << "Config: " << ENCRYPTION_KEY_ENV
                                 << " is not a base64 key of at least " << crypto::AesGcmCipher::KEY_SIZE
                                 << " bytes, use 'keygen' to create a strong one";
    }
  } else {
    if (key) {
      BOOST_LOG_TRIVIAL(warning) << "Config: " << ENCRYPTION_KEY_ENV << " is set but empty, ignoring it";
    }
    BOOST_LOG_TRIVIAL(warning) << "Config: " << ENCRYPTION_KEY_ENV << " not set, records are stored unencrypted";
  }

  return config;
}

bool StoreConfig::is_sensitive(const std::string& first_segment) const {
  return std::find(sensitive_namespaces.begin(), sensitive_namespaces.end(), first_segment)
         != sensitive_namespaces.end();
}

} // namespace config
} // namespace vault
