#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <iterator>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "config/config.hpp"
#include "crypto/secure_envelope.hpp"
#include "lock/lock_manager.hpp"
#include "store/storage_key.hpp"
#include "store/store_error.hpp"

namespace vault {
namespace store {

class Transaction;

/*
 * Lazy listing of the keys below a prefix. Every begin() walks the directory
 * tree again, so a range can be iterated repeatedly and always reflects the
 * current on-disk state. Files that do not map back to a valid key are skipped.
 */
class KeyRange {
public:
  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = StorageKey;
    using difference_type = std::ptrdiff_t;
    using pointer = const StorageKey*;
    using reference = const StorageKey&;

    // End iterator
    iterator() = default;

    reference operator*() const { return *current_; }
    pointer operator->() const { return &*current_; }
    iterator& operator++();

    friend bool operator==(const iterator& a, const iterator& b) {
      return !a.current_ && !b.current_;
    }
    friend bool operator!=(const iterator& a, const iterator& b) { return !(a == b); }

  private:
    friend class KeyRange;
    iterator(const std::filesystem::path& walk_root, std::vector<std::string> prefix);

    // Moves to the next entry that maps to a valid key, or to the end
    void advance(bool first);

    std::filesystem::path walk_root_;
    std::vector<std::string> prefix_;
    std::filesystem::recursive_directory_iterator walker_;
    std::optional<StorageKey> current_;
  };

  iterator begin() const;
  iterator end() const { return iterator(); }

private:
  friend class Store;
  KeyRange(std::filesystem::path root, std::vector<std::string> prefix);

  std::filesystem::path root_;
  std::vector<std::string> prefix_;
};

/*
 * File-backed JSON record store.
 *
 * Each key maps to root/<seg>/.../<seg>.json holding a sealed envelope
 * (integrity checksum around plaintext or ciphertext). Reads take a shared
 * lock on the key's canonical path, mutations take an exclusive one; files are
 * replaced atomically by writing a temporary file and renaming it.
 */
class Store {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Store(config::StoreConfig config);
  ~Store();

  Store(const Store&) = delete;
  Store& operator=(const Store&) = delete;


  // ---- CORE STORAGE OPERATIONS ----
  // Returns nullopt for a missing record
  std::optional<nlohmann::json> read(const StorageKey& key) const;
  // Typed read through nlohmann conversions, ValidationError on a shape mismatch
  template <typename T>
  std::optional<T> read_as(const StorageKey& key) const;
  bool has(const StorageKey& key) const;
  // Creates parent directories as needed
  void write(const StorageKey& key, const nlohmann::json& record);
  // Read-modify-write under one exclusive lock, NotFoundError if missing
  nlohmann::json update(const StorageKey& key, const std::function<void(nlohmann::json&)>& mutate);
  // Returns false when there was nothing to remove
  bool remove(const StorageKey& key);


  // ---- QUERY OPERATIONS ----
  KeyRange list(const std::vector<std::string>& prefix = {}) const;
  // Materialized, sorted listing
  std::vector<StorageKey> keys(const std::vector<std::string>& prefix = {}) const;


  // ---- TRANSACTIONS ----
  Transaction begin_transaction();


  // ---- ENCRYPTION MIGRATION ----
  // Re-seals every record below prefix that is not yet encrypted or lacks the
  // integrity layer, each under its own exclusive lock. Returns how many were
  // rewritten. Throws KeyUnavailableError when no master key is configured.
  std::size_t migrate_to_encrypted(const std::vector<std::string>& prefix = {});


  // ---- GETTERS ----
  const std::filesystem::path& root() const { return root_; }
  const config::StoreConfig& config() const { return config_; }
  lock::LockManager& lock_manager() const { return locks_; }
  bool encryption_enabled() const { return envelope_.has_cipher(); }

private:
  friend class Transaction;

  // ---- PARAMETERS ----
  config::StoreConfig config_;
  std::filesystem::path root_;
  mutable lock::LockManager locks_;
  crypto::SecureEnvelope envelope_;


  // ---- RECORD ENCODING ----
  // Serializes, size-checks and seals. Throws ValidationError.
  std::string encode(const StorageKey& key, const nlohmann::json& record) const;
  // Opens the envelope and parses JSON
  nlohmann::json decode(const StorageKey& key, const std::string& stored) const;


  // ---- FILE OPERATIONS (caller holds the key's lock) ----
  std::optional<std::string> read_file(const StorageKey& key) const;
  void write_file(const StorageKey& key, const std::string& payload);
  bool remove_file(const StorageKey& key);
  // Logs instead of throwing, used on error paths
  void discard_temp(const std::filesystem::path& temp) const;


  // ---- UTILITY METHODS ----
  void check_directory_exists(const std::filesystem::path& path) const;
  std::filesystem::path resolve_key_path(const StorageKey& key) const { return key.to_path(root_); }
  std::string resource_for(const StorageKey& key) const { return key.resource_id(root_); }
};

template <typename T>
std::optional<T> Store::read_as(const StorageKey& key) const {
  auto record = read(key);
  if (!record) {
    return std::nullopt;
  }
  try {
    return record->template get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw ValidationError("record " + key.str() + " has unexpected shape: " + e.what());
  }
}

} // namespace store
} // namespace vault
