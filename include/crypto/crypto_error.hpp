#ifndef VAULT_CRYPTO_ERROR_HPP
#define VAULT_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace vault::crypto {

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message)
        : std::runtime_error(message) {}
};

class EncryptionError : public CryptoError {
public:
    explicit EncryptionError(const std::string& message)
        : CryptoError("Encryption error: " + message) {}
};

// Wrong key, tampered ciphertext/tag or a malformed cipher envelope.
// Never accompanied by partially decrypted output.
class AuthenticationError : public CryptoError {
public:
    explicit AuthenticationError(const std::string& message)
        : CryptoError("Authentication error: " + message) {}
};

// Outer checksum mismatch or a corrupted record, detected before decryption
class IntegrityError : public CryptoError {
public:
    explicit IntegrityError(const std::string& message)
        : CryptoError("Integrity error: " + message) {}
};

// An encrypted record was met but no master key is configured
class KeyUnavailableError : public CryptoError {
public:
    explicit KeyUnavailableError(const std::string& message)
        : CryptoError("Key unavailable: " + message) {}
};

} // namespace vault::crypto

#endif // VAULT_CRYPTO_ERROR_HPP
