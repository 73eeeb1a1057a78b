#ifndef VAULT_SECURE_ENVELOPE_HPP
#define VAULT_SECURE_ENVELOPE_HPP

#include <memory>
#include <string>
#include <string_view>
#include "crypto/cipher.hpp"
#include "crypto/integrity.hpp"

namespace vault::crypto {

/*
 * Layered record encoding:
 *
 *   sha256:<checksum>:<inner>
 *   inner := plaintext:<data>            (no cipher configured)
 *          | aes256gcm:<...>             (cipher envelope)
 *
 * open() accepts older layouts too: a bare <inner> without the integrity
 * layer, and raw data without any marker at all.
 */
class SecureEnvelope {
public:
  static constexpr std::string_view PLAINTEXT_MARKER = "plaintext:";

  enum class Format {
    Raw,        // no recognised marker
    Plaintext,  // plaintext: marker
    Encrypted   // cipher envelope marker
  };

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // A null cipher means records are sealed as integrity-wrapped plaintext
  explicit SecureEnvelope(std::shared_ptr<const Cipher> cipher = nullptr);


  // ---- SEAL/OPEN OPERATIONS ----
  std::string seal(const std::string& data) const;
  // Verifies integrity first, then decrypts. Throws IntegrityError,
  // AuthenticationError or KeyUnavailableError.
  std::string open(const std::string& stored) const;


  // ---- QUERY OPERATIONS ----
  bool has_cipher() const { return cipher_ != nullptr; }
  // Format of the inner payload, integrity layer verified if present
  Format inspect(const std::string& stored) const;
  bool is_encrypted(const std::string& stored) const { return inspect(stored) == Format::Encrypted; }

private:
  // ---- PARAMETERS ----
  std::shared_ptr<const Cipher> cipher_;

  // Strips and verifies the integrity layer when present
  std::string stripIntegrity(const std::string& stored) const;
  static Format classify(std::string_view inner);
};

const char* to_string(SecureEnvelope::Format format);

} // namespace vault::crypto

#endif // VAULT_SECURE_ENVELOPE_HPP
