#ifndef VAULT_LOCK_MANAGER_HPP
#define VAULT_LOCK_MANAGER_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "lock/lock_error.hpp"

namespace vault::lock {

enum class LockMode {
  Shared,
  Exclusive
};

const char* to_string(LockMode mode);

// Snapshot of one resource in the lock table
struct LockDiagnostics {
  std::size_t shared_holders = 0;
  bool exclusive = false;
  std::size_t waiting_shared = 0;
  std::size_t waiting_exclusive = 0;
  // Time since the resource went from free to held, empty when not held
  std::optional<std::chrono::milliseconds> held_for;
};

class LockManager;

/*
 * Ownership of one granted lock. Move-only; the lock is released when the
 * handle is destroyed unless it was released explicitly before. Releasing the
 * same handle twice throws LockError.
 */
class LockHandle {
public:
  LockHandle() = default;
  ~LockHandle();

  LockHandle(LockHandle&& other) noexcept;
  LockHandle& operator=(LockHandle&& other) noexcept;
  LockHandle(const LockHandle&) = delete;
  LockHandle& operator=(const LockHandle&) = delete;

  void release();

  bool held() const { return manager_ != nullptr; }
  const std::string& resource() const { return resource_; }
  LockMode mode() const { return mode_; }

private:
  friend class LockManager;
  LockHandle(LockManager* manager, std::string resource, LockMode mode);

  LockManager* manager_ = nullptr;
  std::string resource_;
  LockMode mode_ = LockMode::Shared;
  bool released_ = false;
};

// Handles acquired in order, released in reverse order on scope exit
class LockSet {
public:
  LockSet() = default;
  ~LockSet() { release_all(); }

  LockSet(LockSet&&) noexcept = default;
  LockSet& operator=(LockSet&& other) noexcept;
  LockSet(const LockSet&) = delete;
  LockSet& operator=(const LockSet&) = delete;

  void add(LockHandle handle) { handles_.push_back(std::move(handle)); }
  void release_all() noexcept;

  std::size_t size() const { return handles_.size(); }
  bool empty() const { return handles_.empty(); }

private:
  std::vector<LockHandle> handles_;
};

/*
 * In-memory table of shared/exclusive locks keyed by resource path.
 *
 * Waiters are served strictly in arrival order: a request is granted
 * immediately only if nobody is queued and the mode is compatible with the
 * current holders. Consecutive shared waiters at the head of the queue are
 * granted together. Idle resources are dropped from the table.
 *
 * The manager must outlive every handle it hands out.
 */
class LockManager {
public:
  static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{30000};

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit LockManager(std::chrono::milliseconds slow_wait_threshold = std::chrono::milliseconds(5000));
  ~LockManager();

  LockManager(const LockManager&) = delete;
  LockManager& operator=(const LockManager&) = delete;


  // ---- ACQUISITION ----
  // Blocks until granted or the timeout elapses (LockTimeoutError)
  LockHandle acquire(const std::string& resource, LockMode mode,
                     std::chrono::milliseconds timeout = DEFAULT_TIMEOUT);
  // Sorts and de-duplicates the resources, then acquires them in that order
  // within one overall deadline. Nothing stays held if any acquisition fails.
  LockSet acquire_ordered(std::vector<std::string> resources, LockMode mode,
                          std::chrono::milliseconds timeout = DEFAULT_TIMEOUT);


  // ---- DIAGNOSTICS ----
  std::map<std::string, LockDiagnostics> diagnostics() const;
  std::size_t resource_count() const;

private:
  friend class LockHandle;

  struct Waiter {
    LockMode mode;
    bool granted = false;
  };

  struct ResourceState {
    std::size_t shared_holders = 0;
    bool exclusive = false;
    std::deque<std::shared_ptr<Waiter>> queue;
    std::condition_variable cv;
    std::optional<std::chrono::steady_clock::time_point> acquired_at;
  };

  // ---- PARAMETERS ----
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::unique_ptr<ResourceState>> resources_;
  std::chrono::milliseconds slow_wait_threshold_;


  // ---- LOCK TABLE MAINTENANCE (mutex_ held) ----
  static bool compatible(const ResourceState& state, LockMode mode);
  static void grant(ResourceState& state, LockMode mode);
  // Grants queued waiters from the head while compatible, returns true if any
  static bool grantWaiters(ResourceState& state);
  void eraseIfIdle(const std::string& resource);

  // Called by LockHandle
  void unlock(const std::string& resource, LockMode mode) noexcept;
};

} // namespace vault::lock

#endif // VAULT_LOCK_MANAGER_HPP
