#include "store/store.hpp"
#include "store/transaction.hpp"
#include "crypto/integrity.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <system_error>
#include <boost/log/trivial.hpp>

namespace vault {
namespace store {

namespace {

// Random suffix for temporary files so a crashed writer never collides
// with the next one
std::string temp_suffix() {
  thread_local std::mt19937_64 gen(std::random_device{}());
  std::stringstream ss;
  ss << std::hex << std::setw(16) << std::setfill('0') << gen();
  return ss.str();
}

std::shared_ptr<const crypto::Cipher> make_cipher(const config::StoreConfig& config) {
  if (!config.master_key) {
    return nullptr;
  }
  return std::make_shared<crypto::AesGcmCipher>(*config.master_key, config.pbkdf2_iterations);
}

} // namespace

//==============================================
// KEY RANGE
//==============================================

KeyRange::KeyRange(std::filesystem::path root, std::vector<std::string> prefix)
  : root_(std::move(root)), prefix_(std::move(prefix)) {}

KeyRange::iterator KeyRange::begin() const {
  std::filesystem::path walk_root = root_;
  for (const auto& segment : prefix_) {
    walk_root /= segment;
  }

  std::error_code ec;
  if (!std::filesystem::is_directory(walk_root, ec)) {
    BOOST_LOG_TRIVIAL(debug) << "Store: Nothing to list under " << walk_root.string();
    return end();
  }
  return iterator(walk_root, prefix_);
}

KeyRange::iterator::iterator(const std::filesystem::path& walk_root, std::vector<std::string> prefix)
  : walk_root_(walk_root), prefix_(std::move(prefix)) {
  std::error_code ec;
  walker_ = std::filesystem::recursive_directory_iterator(walk_root_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Store: Failed to list " << walk_root_.string() << ": " << ec.message();
    return;
  }
  advance(true);
}

KeyRange::iterator& KeyRange::iterator::operator++() {
  advance(false);
  return *this;
}

void KeyRange::iterator::advance(bool first) {
  const std::filesystem::recursive_directory_iterator end;
  current_.reset();

  std::error_code ec;
  if (!first && walker_ != end) {
    walker_.increment(ec);
  }

  for (; !ec && walker_ != end; walker_.increment(ec)) {
    const auto& entry = *walker_;
    std::string name = entry.path().filename().string();

    std::error_code type_ec;
    if (entry.is_directory(type_ec)) {
      // Hidden or otherwise unaddressable directories cannot hold valid keys
      if (!StorageKey::segment_error(name).empty()) {
        walker_.disable_recursion_pending();
      }
      continue;
    }
    if (!entry.is_regular_file(type_ec) || entry.path().extension().string() != StorageKey::FILE_SUFFIX) {
      continue;
    }

    std::vector<std::string> segments = prefix_;
    auto relative = entry.path().lexically_relative(walk_root_);
    for (const auto& part : relative.parent_path()) {
      segments.push_back(part.string());
    }
    segments.push_back(relative.stem().string());

    bool valid = std::all_of(segments.begin(), segments.end(), [](const std::string& segment) {
      return StorageKey::segment_error(segment).empty();
    });
    if (!valid) {
      BOOST_LOG_TRIVIAL(debug) << "Store: Skipping unaddressable file " << entry.path().string();
      continue;
    }

    current_ = StorageKey::validate(std::move(segments));
    return;
  }

  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Store: Listing of " << walk_root_.string()
                               << " stopped early: " << ec.message();
  }
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Store::Store(config::StoreConfig config)
  : config_(std::move(config))
  , locks_(config_.slow_lock_threshold)
  , envelope_(make_cipher(config_)) {
  BOOST_LOG_TRIVIAL(info) << "Store: Initializing Store with data directory: " << config_.data_dir.string();

  try {
    check_directory_exists(config_.data_dir);
    root_ = std::filesystem::weakly_canonical(config_.data_dir);
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to prepare data directory: " << e.what();
    throw StoreError("Store: Failed to prepare data directory: " + std::string(e.what()));
  }

  BOOST_LOG_TRIVIAL(debug) << "Store: Store directory created/verified at: " << root_.string()
                           << (envelope_.has_cipher() ? " (encrypted)" : " (unencrypted)");
}

Store::~Store() {
  BOOST_LOG_TRIVIAL(debug) << "Store: Shutting down store at " << root_.string();
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

std::optional<nlohmann::json> Store::read(const StorageKey& key) const {
  BOOST_LOG_TRIVIAL(debug) << "Store: Reading record: " << key;

  auto lock = locks_.acquire(resource_for(key), lock::LockMode::Shared, config_.lock_timeout);
  auto stored = read_file(key);
  if (!stored) {
    BOOST_LOG_TRIVIAL(debug) << "Store: Record not found: " << key;
    return std::nullopt;
  }
  return decode(key, *stored);
}

bool Store::has(const StorageKey& key) const {
  auto lock = locks_.acquire(resource_for(key), lock::LockMode::Shared, config_.lock_timeout);

  std::error_code ec;
  bool exists = std::filesystem::is_regular_file(resolve_key_path(key), ec);
  BOOST_LOG_TRIVIAL(debug) << "Store: Key " << key << (exists ? " exists" : " not found");
  return exists;
}

void Store::write(const StorageKey& key, const nlohmann::json& record) {
  BOOST_LOG_TRIVIAL(info) << "Store: Writing record: " << key;

  // Encode before locking so invalid records never touch the lock table
  std::string payload = encode(key, record);

  auto lock = locks_.acquire(resource_for(key), lock::LockMode::Exclusive, config_.lock_timeout);
  write_file(key, payload);
}

nlohmann::json Store::update(const StorageKey& key, const std::function<void(nlohmann::json&)>& mutate) {
  BOOST_LOG_TRIVIAL(info) << "Store: Updating record: " << key;

  auto lock = locks_.acquire(resource_for(key), lock::LockMode::Exclusive, config_.lock_timeout);
  auto stored = read_file(key);
  if (!stored) {
    BOOST_LOG_TRIVIAL(error) << "Store: Cannot update missing record: " << key;
    throw NotFoundError(key.str());
  }

  nlohmann::json record = decode(key, *stored);
  mutate(record);
  write_file(key, encode(key, record));
  return record;
}

bool Store::remove(const StorageKey& key) {
  BOOST_LOG_TRIVIAL(info) << "Store: Removing record: " << key;

  auto lock = locks_.acquire(resource_for(key), lock::LockMode::Exclusive, config_.lock_timeout);
  return remove_file(key);
}


//==============================================
// QUERY OPERATIONS
//==============================================

KeyRange Store::list(const std::vector<std::string>& prefix) const {
  StorageKey::validate_prefix(prefix);
  return KeyRange(root_, prefix);
}

std::vector<StorageKey> Store::keys(const std::vector<std::string>& prefix) const {
  std::vector<StorageKey> result;
  for (const auto& key : list(prefix)) {
    result.push_back(key);
  }
  std::sort(result.begin(), result.end());
  BOOST_LOG_TRIVIAL(debug) << "Store: Listed " << result.size() << " keys";
  return result;
}


//==============================================
// TRANSACTIONS
//==============================================

Transaction Store::begin_transaction() {
  return Transaction(*this);
}


//==============================================
// ENCRYPTION MIGRATION
//==============================================

std::size_t Store::migrate_to_encrypted(const std::vector<std::string>& prefix) {
  if (!envelope_.has_cipher()) {
    BOOST_LOG_TRIVIAL(error) << "Store: Migration requested without an encryption key";
    throw crypto::KeyUnavailableError("set " + std::string(config::ENCRYPTION_KEY_ENV) + " to migrate records");
  }

  BOOST_LOG_TRIVIAL(info) << "Store: Migrating records to encrypted storage";

  // Snapshot first, files are replaced while we go
  std::size_t migrated = 0;
  for (const auto& key : keys(prefix)) {
    auto lock = locks_.acquire(resource_for(key), lock::LockMode::Exclusive, config_.lock_timeout);
    // Re-read under the lock, the record may have changed or gone since the snapshot
    auto stored = read_file(key);
    if (!stored) {
      continue;
    }
    // Bare legacy envelopes still need the integrity layer
    if (crypto::Integrity::has_integrity(*stored) && envelope_.is_encrypted(*stored)) {
      continue;
    }
    write_file(key, encode(key, decode(key, *stored)));
    ++migrated;
    BOOST_LOG_TRIVIAL(debug) << "Store: Encrypted record: " << key;
  }

  BOOST_LOG_TRIVIAL(info) << "Store: Migration complete, " << migrated << " records encrypted";
  return migrated;
}


//==============================================
// RECORD ENCODING
//==============================================

std::string Store::encode(const StorageKey& key, const nlohmann::json& record) const {
  std::string serialized;
  try {
    serialized = record.dump(2);
  } catch (const nlohmann::json::type_error& e) {
    throw ValidationError("record " + key.str() + " is not serializable: " + e.what());
  }

  if (serialized.size() > config_.max_record_size) {
    throw ValidationError("record " + key.str() + " is " + std::to_string(serialized.size()) +
                          " bytes, limit is " + std::to_string(config_.max_record_size));
  }
  return envelope_.seal(serialized);
}

nlohmann::json Store::decode(const StorageKey& key, const std::string& stored) const {
  std::string data = envelope_.open(stored);
  try {
    return nlohmann::json::parse(data);
  } catch (const nlohmann::json::parse_error& e) {
    BOOST_LOG_TRIVIAL(warning) << "Store: Record " << key << " does not hold valid JSON";
    throw crypto::IntegrityError("record " + key.str() + " is corrupted: " + e.what());
  }
}


//==============================================
// FILE OPERATIONS
//==============================================

std::optional<std::string> Store::read_file(const StorageKey& key) const {
  std::filesystem::path file_path = resolve_key_path(key);

  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    std::error_code ec;
    if (!std::filesystem::exists(file_path, ec)) {
      return std::nullopt;
    }
    throw StoreError("Store: Failed to open file: " + file_path.string());
  }

  std::stringstream contents;
  contents << file.rdbuf();
  if (file.bad()) {
    throw StoreError("Store: Failed to read file: " + file_path.string());
  }
  return contents.str();
}

void Store::write_file(const StorageKey& key, const std::string& payload) {
  std::filesystem::path file_path = resolve_key_path(key);
  std::filesystem::path temp_path =
    file_path.parent_path() / ("." + file_path.filename().string() + ".tmp-" + temp_suffix());

  try {
    check_directory_exists(file_path.parent_path());
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to create directory for " << key << ": " << e.what();
    throw StoreError("Store: Failed to create directory: " + std::string(e.what()));
  }

  {
    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    if (!file) {
      throw StoreError("Store: Failed to create file: " + temp_path.string());
    }

    // Restrict before any data lands in the file
    if (config_.is_sensitive(key.front())) {
      std::error_code ec;
      std::filesystem::permissions(temp_path,
                                   std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                   std::filesystem::perm_options::replace, ec);
      if (ec) {
        file.close();
        discard_temp(temp_path);
        throw StoreError("Store: Failed to restrict permissions on " + temp_path.string() + ": " + ec.message());
      }
    }

    file.write(payload.data(), static_cast<std::streamsize>(payload.size()));
    file.flush();
    if (!file) {
      file.close();
      discard_temp(temp_path);
      throw StoreError("Store: Failed to write file: " + temp_path.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, file_path, ec);
  if (ec) {
    discard_temp(temp_path);
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to replace " << file_path.string() << ": " << ec.message();
    throw StoreError("Store: Failed to replace file: " + file_path.string() + ": " + ec.message());
  }

  BOOST_LOG_TRIVIAL(debug) << "Store: Wrote " << payload.size() << " bytes for key: " << key;
}

bool Store::remove_file(const StorageKey& key) {
  std::filesystem::path file_path = resolve_key_path(key);

  std::error_code ec;
  bool removed = std::filesystem::remove(file_path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to remove file with key " << key << ": " << ec.message();
    throw StoreError("Store: Failed to remove file: " + file_path.string() + ": " + ec.message());
  }

  BOOST_LOG_TRIVIAL(debug) << "Store: " << (removed ? "Removed" : "Nothing to remove for") << " key: " << key;
  return removed;
}

void Store::discard_temp(const std::filesystem::path& temp) const {
  std::error_code ec;
  std::filesystem::remove(temp, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(debug) << "Store: Could not clean up " << temp.string() << ": " << ec.message();
  }
}


//==============================================
// UTILITY METHODS
//==============================================

void Store::check_directory_exists(const std::filesystem::path& path) const {
  if (!std::filesystem::exists(path)) {
    std::filesystem::create_directories(path);
  }
}

} // namespace store
} // namespace vault
