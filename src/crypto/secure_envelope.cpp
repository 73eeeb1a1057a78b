#include "crypto/secure_envelope.hpp"
#include <utility>
#include <boost/log/trivial.hpp>

namespace vault::crypto {

namespace {

bool startsWith(std::string_view data, std::string_view prefix) {
  return data.substr(0, prefix.size()) == prefix;
}

constexpr std::string_view CIPHER_PREFIX = "aes256gcm:";

} // namespace

const char* to_string(SecureEnvelope::Format format) {
  switch (format) {
    case SecureEnvelope::Format::Raw:       return "raw";
    case SecureEnvelope::Format::Plaintext: return "plaintext";
    case SecureEnvelope::Format::Encrypted: return "encrypted";
  }
  return "unknown";
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

SecureEnvelope::SecureEnvelope(std::shared_ptr<const Cipher> cipher)
  : cipher_(std::move(cipher)) {
  if (!cipher_) {
    BOOST_LOG_TRIVIAL(warning) << "Secure envelope: No encryption key configured, records are stored unencrypted";
  }
}

//==============================================
// SEAL/OPEN OPERATIONS
//==============================================

std::string SecureEnvelope::seal(const std::string& data) const {
  std::string inner;
  if (cipher_) {
    inner = cipher_->encrypt(data);
  } else {
    inner.reserve(PLAINTEXT_MARKER.size() + data.size());
    inner.append(PLAINTEXT_MARKER).append(data);
  }
  return Integrity::wrap(inner);
}

std::string SecureEnvelope::open(const std::string& stored) const {
  std::string inner = stripIntegrity(stored);

  switch (classify(inner)) {
    case Format::Plaintext:
      return inner.substr(PLAINTEXT_MARKER.size());

    case Format::Encrypted:
      if (!cipher_) {
        BOOST_LOG_TRIVIAL(error) << "Secure envelope: Encrypted record found but no encryption key is configured";
        throw KeyUnavailableError("encryption key required to read an encrypted record");
      }
      return cipher_->decrypt(inner);

    case Format::Raw:
      BOOST_LOG_TRIVIAL(debug) << "Secure envelope: Reading legacy record without format marker";
      return inner;
  }
  throw IntegrityError("unrecognised record format");
}

//==============================================
// QUERY OPERATIONS
//==============================================

SecureEnvelope::Format SecureEnvelope::inspect(const std::string& stored) const {
  return classify(stripIntegrity(stored));
}

std::string SecureEnvelope::stripIntegrity(const std::string& stored) const {
  if (Integrity::has_integrity(stored)) {
    return Integrity::unwrap(stored);
  }
  BOOST_LOG_TRIVIAL(debug) << "Secure envelope: Record has no integrity wrapper";
  return stored;
}

SecureEnvelope::Format SecureEnvelope::classify(std::string_view inner) {
  if (startsWith(inner, PLAINTEXT_MARKER)) {
    return Format::Plaintext;
  }
  if (startsWith(inner, CIPHER_PREFIX)) {
    return Format::Encrypted;
  }
  return Format::Raw;
}

} // namespace vault::crypto
