#ifndef VAULT_STORE_ERROR_HPP
#define VAULT_STORE_ERROR_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace vault::store {

// Filesystem failures while reading or persisting records
class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

// Bad key, unserializable or oversized record. Raised before any I/O.
class ValidationError : public StoreError {
public:
  explicit ValidationError(const std::string& message)
    : StoreError("Validation error: " + message) {}
};

// Only raised by operations that require an existing record (update)
class NotFoundError : public StoreError {
public:
  explicit NotFoundError(const std::string& key)
    : StoreError("Record not found: " + key) {}
};

class TransactionFinalizedError : public StoreError {
public:
  explicit TransactionFinalizedError(const std::string& state)
    : StoreError("Transaction already finalized (" + state + ")") {}
};

// A staged mutation failed after validation succeeded. Operations before
// the failing one were applied and are not undone.
class PartialCommitError : public StoreError {
public:
  PartialCommitError(std::size_t applied, std::size_t total, const std::string& key,
                     const std::string& cause)
    : StoreError("Partial commit: applied " + std::to_string(applied) + " of " +
                 std::to_string(total) + " operations, failed at " + key + ": " + cause)
    , applied_(applied)
    , total_(total)
    , key_(key) {}

  std::size_t applied() const { return applied_; }
  std::size_t total() const { return total_; }
  const std::string& failed_key() const { return key_; }

private:
  std::size_t applied_;
  std::size_t total_;
  std::string key_;
};

} // namespace vault::store

#endif // VAULT_STORE_ERROR_HPP
