#ifndef VAULT_CIPHER_HPP
#define VAULT_CIPHER_HPP

#include <array>
#include <memory>
#include <string>
#include <string_view>
#include "crypto_error.hpp"

namespace vault::crypto {

// Authenticated symmetric cipher over text envelopes
class Cipher {
public:
  virtual ~Cipher() = default;

  // Returns a self-describing envelope for the plaintext
  virtual std::string encrypt(const std::string& plaintext) const = 0;
  // Returns the plaintext or throws AuthenticationError
  virtual std::string decrypt(const std::string& envelope) const = 0;
};

// Forward declaration for OpenSSL cipher context
struct CipherContext;

/*
 * AES-256-GCM with a PBKDF2-HMAC-SHA256 derived key.
 *
 * Envelope layout (all components lower-case hex, fixed length except the
 * ciphertext):
 *   aes256gcm:<salt 32B>:<nonce 12B>:<tag 16B>:<ciphertext>
 *
 * A fresh salt and nonce are drawn for every envelope, so encrypting the same
 * plaintext twice never yields the same envelope.
 */
class AesGcmCipher : public Cipher {
public:

  static constexpr const char* MARKER = "aes256gcm";
  static constexpr size_t KEY_SIZE = 32;      // 256 bits for AES-256
  static constexpr size_t SALT_SIZE = 32;     // per-envelope PBKDF2 salt
  static constexpr size_t NONCE_SIZE = 12;    // 96-bit GCM nonce
  static constexpr size_t TAG_SIZE = 16;      // 128-bit GCM tag
  static constexpr unsigned DEFAULT_ITERATIONS = 100000;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit AesGcmCipher(std::string master_key, unsigned iterations = DEFAULT_ITERATIONS);
  ~AesGcmCipher() override;

  AesGcmCipher(const AesGcmCipher&) = delete;
  AesGcmCipher& operator=(const AesGcmCipher&) = delete;


  // ---- ENCRYPTION/DECRYPTION OPERATIONS ----
  std::string encrypt(const std::string& plaintext) const override;
  std::string decrypt(const std::string& envelope) const override;


  // ---- FORMAT DETECTION ----
  // Structural check: marker, component count, exact lengths, hex alphabet
  static bool is_encrypted(std::string_view data);


  // ---- KEY MANAGEMENT ----
  // Random 256-bit key, base64 encoded, suitable as a master key
  static std::string generate_key();
  // True for base64 text decoding to at least KEY_SIZE bytes, as generate_key produces
  static bool is_valid_key(const std::string& key);

private:
  // ---- PARAMETERS ----
  std::string master_key_;
  unsigned iterations_;


  // ---- KEY DERIVATION ----
  std::array<uint8_t, KEY_SIZE> deriveKey(const uint8_t* salt, size_t salt_len) const;

  // ---- CIPHER PROCESSING ----
  void initializeCipher(CipherContext& context, const uint8_t* key, const uint8_t* nonce,
                        bool encrypting) const;
};

} // namespace vault::crypto

#endif // VAULT_CIPHER_HPP
