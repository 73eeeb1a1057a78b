#include "crypto/integrity.hpp"
#include "crypto/hex.hpp"
#include <openssl/evp.h>
#include <openssl/crypto.h>
#include <boost/log/trivial.hpp>

namespace vault::crypto {

std::string Integrity::compute_checksum(std::string_view data) {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;

  // One-shot digest, context handling is internal to OpenSSL
  if (EVP_Digest(data.data(), data.size(), hash, &hash_len, EVP_sha256(), nullptr) != 1) {
    throw CryptoError("Integrity: Failed to compute SHA-256 digest");
  }
  return Hex::encode(hash, hash_len);
}

bool Integrity::verify_checksum(std::string_view data, std::string_view expected) {
  if (expected.size() != CHECKSUM_LENGTH || !Hex::isHex(expected)) {
    return false;
  }

  auto expected_bytes = Hex::decode(expected);
  auto actual_bytes = Hex::decode(compute_checksum(data));
  if (!expected_bytes || !actual_bytes || expected_bytes->size() != actual_bytes->size()) {
    return false;
  }
  return CRYPTO_memcmp(expected_bytes->data(), actual_bytes->data(), actual_bytes->size()) == 0;
}

std::string Integrity::wrap(std::string_view data) {
  std::string wrapped;
  wrapped.reserve(MARKER.size() + CHECKSUM_LENGTH + 1 + data.size());
  wrapped.append(MARKER).append(compute_checksum(data)).append(":").append(data);
  return wrapped;
}

std::string Integrity::unwrap(std::string_view wrapped) {
  const size_t header = MARKER.size() + CHECKSUM_LENGTH + 1;

  if (!has_integrity(wrapped) || wrapped.size() < header || wrapped[header - 1] != ':') {
    BOOST_LOG_TRIVIAL(warning) << "Integrity: Malformed integrity wrapper (" << wrapped.size() << " bytes)";
    throw IntegrityError("malformed or missing checksum");
  }

  std::string_view expected = wrapped.substr(MARKER.size(), CHECKSUM_LENGTH);
  std::string_view payload = wrapped.substr(header);

  if (!verify_checksum(payload, expected)) {
    BOOST_LOG_TRIVIAL(warning) << "Integrity: Checksum mismatch, expected " << expected
                               << " got " << compute_checksum(payload);
    throw IntegrityError("checksum mismatch, data is corrupted or was modified");
  }
  return std::string(payload);
}

bool Integrity::has_integrity(std::string_view data) {
  return data.substr(0, MARKER.size()) == MARKER;
}

} // namespace vault::crypto
