#include "crypto/cipher.hpp"
#include "crypto/hex.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <openssl/rand.h>
#include <openssl/crypto.h>
#include <optional>
#include <utility>
#include <vector>
#include <boost/log/trivial.hpp>

namespace vault::crypto {

//=================================================
// RAII WRAPPER TO MANAGE CIPHER CONTEXT LIFECYCLE
//=================================================

struct CipherContext {
  EVP_CIPHER_CTX* ctx = nullptr;

  // Initialize new cipher context
  CipherContext() {
    ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
      throw EncryptionError("Cipher: Failed to create cipher context");
    }
  }

  // Free cipher context when object is destroyed
  ~CipherContext() {
    if (ctx) {
      EVP_CIPHER_CTX_free(ctx);
    }
  }

  CipherContext(const CipherContext&) = delete;
  CipherContext& operator=(const CipherContext&) = delete;

  // Access the underlying context
  EVP_CIPHER_CTX* get() { return ctx; }
};

namespace {

constexpr size_t ENVELOPE_PARTS = 5;

// Splits "marker:salt:nonce:tag:ciphertext" and validates every component.
// Returns nullopt when the structure is wrong in any way.
std::optional<std::array<std::string_view, ENVELOPE_PARTS>> splitEnvelope(std::string_view data) {
  std::array<std::string_view, ENVELOPE_PARTS> parts;
  size_t start = 0;
  for (size_t i = 0; i < ENVELOPE_PARTS; ++i) {
    size_t end = (i + 1 < ENVELOPE_PARTS) ? data.find(':', start) : data.size();
    if (end == std::string_view::npos) {
      return std::nullopt;
    }
    parts[i] = data.substr(start, end - start);
    start = end + 1;
  }

  if (parts[0] != AesGcmCipher::MARKER ||
      parts[1].size() != AesGcmCipher::SALT_SIZE * 2 ||
      parts[2].size() != AesGcmCipher::NONCE_SIZE * 2 ||
      parts[3].size() != AesGcmCipher::TAG_SIZE * 2 ||
      parts[4].size() % 2 != 0) {
    return std::nullopt;
  }

  for (size_t i = 1; i < ENVELOPE_PARTS; ++i) {
    if (!Hex::isHex(parts[i])) {
      return std::nullopt;
    }
  }
  return parts;
}

std::string opensslError() {
  unsigned long code = ERR_get_error();
  if (code == 0) {
    return "no OpenSSL error queued";
  }
  char buffer[256];
  ERR_error_string_n(code, buffer, sizeof(buffer));
  return buffer;
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

AesGcmCipher::AesGcmCipher(std::string master_key, unsigned iterations)
  : master_key_(std::move(master_key))
  , iterations_(iterations) {
  if (master_key_.empty()) {
    throw KeyUnavailableError("Cipher: master key must not be empty");
  }
  if (iterations_ == 0) {
    throw EncryptionError("Cipher: PBKDF2 iteration count must be positive");
  }
  BOOST_LOG_TRIVIAL(debug) << "Cipher: AES-256-GCM initialized with " << iterations_ << " PBKDF2 iterations";
}

AesGcmCipher::~AesGcmCipher() {
  OPENSSL_cleanse(master_key_.data(), master_key_.size());
}

//==============================================
// KEY DERIVATION
//==============================================

std::array<uint8_t, AesGcmCipher::KEY_SIZE> AesGcmCipher::deriveKey(const uint8_t* salt,
                                                                    size_t salt_len) const {
  std::array<uint8_t, KEY_SIZE> key;
  if (PKCS5_PBKDF2_HMAC(master_key_.data(), static_cast<int>(master_key_.size()),
                        salt, static_cast<int>(salt_len),
                        static_cast<int>(iterations_), EVP_sha256(),
                        static_cast<int>(key.size()), key.data()) != 1) {
    throw EncryptionError("Cipher: Key derivation failed: " + opensslError());
  }
  return key;
}

void AesGcmCipher::initializeCipher(CipherContext& context, const uint8_t* key,
                                    const uint8_t* nonce, bool encrypting) const {
  const EVP_CIPHER* cipher = EVP_aes_256_gcm();
  int ok = encrypting
    ? EVP_EncryptInit_ex(context.get(), cipher, nullptr, nullptr, nullptr)
    : EVP_DecryptInit_ex(context.get(), cipher, nullptr, nullptr, nullptr);
  if (ok != 1 ||
      EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr) != 1) {
    throw EncryptionError("Cipher: Failed to initialize cipher context: " + opensslError());
  }

  ok = encrypting
    ? EVP_EncryptInit_ex(context.get(), nullptr, nullptr, key, nonce)
    : EVP_DecryptInit_ex(context.get(), nullptr, nullptr, key, nonce);
  if (ok != 1) {
    throw EncryptionError("Cipher: Failed to set key and nonce: " + opensslError());
  }
}

//==============================================
// ENCRYPTION/DECRYPTION OPERATIONS
//==============================================

std::string AesGcmCipher::encrypt(const std::string& plaintext) const {
  BOOST_LOG_TRIVIAL(trace) << "Cipher: Encrypting " << plaintext.size() << " bytes";

  std::array<uint8_t, SALT_SIZE> salt;
  std::array<uint8_t, NONCE_SIZE> nonce;
  if (RAND_bytes(salt.data(), static_cast<int>(salt.size())) != 1 ||
      RAND_bytes(nonce.data(), static_cast<int>(nonce.size())) != 1) {
    throw EncryptionError("Cipher: Failed to generate random salt/nonce");
  }

  auto key = deriveKey(salt.data(), salt.size());
  CipherContext context;
  try {
    initializeCipher(context, key.data(), nonce.data(), true);
  } catch (const CryptoError&) {
    OPENSSL_cleanse(key.data(), key.size());
    throw;
  }
  OPENSSL_cleanse(key.data(), key.size());

  std::vector<uint8_t> ciphertext(plaintext.size() + EVP_MAX_BLOCK_LENGTH);
  int outlen = 0;
  if (EVP_EncryptUpdate(context.get(), ciphertext.data(), &outlen,
                        reinterpret_cast<const uint8_t*>(plaintext.data()),
                        static_cast<int>(plaintext.size())) != 1) {
    throw EncryptionError("Cipher: Failed to encrypt data: " + opensslError());
  }
  int total = outlen;

  if (EVP_EncryptFinal_ex(context.get(), ciphertext.data() + total, &outlen) != 1) {
    throw EncryptionError("Cipher: Failed to finalize encryption: " + opensslError());
  }
  total += outlen;
  ciphertext.resize(static_cast<size_t>(total));

  std::array<uint8_t, TAG_SIZE> tag;
  if (EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(TAG_SIZE), tag.data()) != 1) {
    throw EncryptionError("Cipher: Failed to read authentication tag: " + opensslError());
  }

  std::string envelope;
  envelope.reserve(sizeof("aes256gcm") + (SALT_SIZE + NONCE_SIZE + TAG_SIZE + ciphertext.size()) * 2 + 4);
  envelope.append(MARKER).append(":")
          .append(Hex::encode(salt.data(), salt.size())).append(":")
          .append(Hex::encode(nonce.data(), nonce.size())).append(":")
          .append(Hex::encode(tag.data(), tag.size())).append(":")
          .append(Hex::encode(ciphertext));
  return envelope;
}

std::string AesGcmCipher::decrypt(const std::string& envelope) const {
  auto parts = splitEnvelope(envelope);
  if (!parts) {
    BOOST_LOG_TRIVIAL(error) << "Cipher: Rejected malformed envelope of " << envelope.size() << " bytes";
    throw AuthenticationError("malformed cipher envelope");
  }

  // Lengths and alphabet are already validated, decoding cannot fail
  auto salt = *Hex::decode((*parts)[1]);
  auto nonce = *Hex::decode((*parts)[2]);
  auto tag = *Hex::decode((*parts)[3]);
  auto ciphertext = *Hex::decode((*parts)[4]);

  auto key = deriveKey(salt.data(), salt.size());
  CipherContext context;
  try {
    initializeCipher(context, key.data(), nonce.data(), false);
  } catch (const CryptoError&) {
    OPENSSL_cleanse(key.data(), key.size());
    throw;
  }
  OPENSSL_cleanse(key.data(), key.size());

  std::vector<uint8_t> plaintext(ciphertext.size() + EVP_MAX_BLOCK_LENGTH);
  int outlen = 0;
  if (EVP_DecryptUpdate(context.get(), plaintext.data(), &outlen,
                        ciphertext.data(), static_cast<int>(ciphertext.size())) != 1) {
    OPENSSL_cleanse(plaintext.data(), plaintext.size());
    throw AuthenticationError("failed to decrypt data block");
  }
  int total = outlen;

  if (EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(tag.size()), tag.data()) != 1) {
    OPENSSL_cleanse(plaintext.data(), plaintext.size());
    throw AuthenticationError("failed to set authentication tag");
  }

  // Tag verification happens here; on failure nothing is returned
  if (EVP_DecryptFinal_ex(context.get(), plaintext.data() + total, &outlen) != 1) {
    OPENSSL_cleanse(plaintext.data(), plaintext.size());
    ERR_clear_error();
    BOOST_LOG_TRIVIAL(error) << "Cipher: Tag verification failed, wrong key or tampered data";
    throw AuthenticationError("wrong key or tampered data");
  }
  total += outlen;

  std::string result(reinterpret_cast<const char*>(plaintext.data()), static_cast<size_t>(total));
  OPENSSL_cleanse(plaintext.data(), plaintext.size());
  return result;
}

//==============================================
// FORMAT DETECTION
//==============================================

bool AesGcmCipher::is_encrypted(std::string_view data) {
  return splitEnvelope(data).has_value();
}

//==============================================
// KEY MANAGEMENT
//==============================================

std::string AesGcmCipher::generate_key() {
  std::array<uint8_t, KEY_SIZE> raw;
  if (RAND_bytes(raw.data(), static_cast<int>(raw.size())) != 1) {
    throw EncryptionError("Cipher: Failed to generate random key");
  }

  // base64 of 32 bytes is 44 characters plus the terminator
  std::array<unsigned char, 4 * ((KEY_SIZE + 2) / 3) + 1> encoded;
  int len = EVP_EncodeBlock(encoded.data(), raw.data(), static_cast<int>(raw.size()));
  OPENSSL_cleanse(raw.data(), raw.size());
  return std::string(reinterpret_cast<const char*>(encoded.data()), static_cast<size_t>(len));
}

bool AesGcmCipher::is_valid_key(const std::string& key) {
  if (key.empty() || key.size() % 4 != 0) {
    return false;
  }

  std::vector<unsigned char> decoded(3 * key.size() / 4);
  int len = EVP_DecodeBlock(decoded.data(), reinterpret_cast<const unsigned char*>(key.data()),
                            static_cast<int>(key.size()));
  OPENSSL_cleanse(decoded.data(), decoded.size());
  if (len < 0) {
    return false;
  }

  // EVP_DecodeBlock counts padding as zero bytes
  size_t padding = 0;
  if (key[key.size() - 1] == '=') {
    ++padding;
    if (key[key.size() - 2] == '=') {
      ++padding;
    }
  }
  return static_cast<size_t>(len) - padding >= KEY_SIZE;
}

} // namespace vault::crypto
