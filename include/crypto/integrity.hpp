#ifndef VAULT_INTEGRITY_HPP
#define VAULT_INTEGRITY_HPP

#include <string>
#include <string_view>
#include "crypto_error.hpp"

namespace vault::crypto {

/*
 * SHA-256 integrity wrapper, independent of encryption.
 *
 * Format: sha256:<64 hex checksum>:<payload>
 * The checksum covers the payload bytes exactly as stored.
 */
class Integrity {
public:
  static constexpr std::string_view MARKER = "sha256:";
  static constexpr size_t CHECKSUM_LENGTH = 64;

  // Hex SHA-256 of the data
  static std::string compute_checksum(std::string_view data);
  // Constant-time comparison against an expected hex checksum
  static bool verify_checksum(std::string_view data, std::string_view expected);

  static std::string wrap(std::string_view data);
  // Returns the payload, throws IntegrityError on a malformed wrapper or mismatch
  static std::string unwrap(std::string_view wrapped);

  // True if the data carries the wrapper marker. Says nothing about validity.
  static bool has_integrity(std::string_view data);
};

} // namespace vault::crypto

#endif // VAULT_INTEGRITY_HPP
