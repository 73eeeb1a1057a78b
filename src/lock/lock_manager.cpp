#include "lock/lock_manager.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace vault::lock {

const char* to_string(LockMode mode) {
  switch (mode) {
    case LockMode::Shared:    return "shared";
    case LockMode::Exclusive: return "exclusive";
  }
  return "unknown";
}

//==============================================
// LOCK HANDLE
//==============================================

LockHandle::LockHandle(LockManager* manager, std::string resource, LockMode mode)
  : manager_(manager)
  , resource_(std::move(resource))
  , mode_(mode) {}

LockHandle::~LockHandle() {
  if (manager_) {
    manager_->unlock(resource_, mode_);
  }
}

LockHandle::LockHandle(LockHandle&& other) noexcept
  : manager_(other.manager_)
  , resource_(std::move(other.resource_))
  , mode_(other.mode_)
  , released_(other.released_) {
  other.manager_ = nullptr;
}

LockHandle& LockHandle::operator=(LockHandle&& other) noexcept {
  if (this != &other) {
    if (manager_) {
      manager_->unlock(resource_, mode_);
    }
    manager_ = other.manager_;
    resource_ = std::move(other.resource_);
    mode_ = other.mode_;
    released_ = other.released_;
    other.manager_ = nullptr;
  }
  return *this;
}

void LockHandle::release() {
  if (released_) {
    BOOST_LOG_TRIVIAL(fatal) << "Lock manager: Double release of " << to_string(mode_)
                             << " lock on " << resource_;
    throw LockError("lock on '" + resource_ + "' already released");
  }
  if (!manager_) {
    throw LockError("handle does not own a lock");
  }
  manager_->unlock(resource_, mode_);
  manager_ = nullptr;
  released_ = true;
}

//==============================================
// LOCK SET
//==============================================

LockSet& LockSet::operator=(LockSet&& other) noexcept {
  if (this != &other) {
    release_all();
    handles_ = std::move(other.handles_);
    other.handles_.clear();
  }
  return *this;
}

void LockSet::release_all() noexcept {
  while (!handles_.empty()) {
    handles_.pop_back();
  }
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

LockManager::LockManager(std::chrono::milliseconds slow_wait_threshold)
  : slow_wait_threshold_(slow_wait_threshold) {
  BOOST_LOG_TRIVIAL(debug) << "Lock manager: Initialized, slow wait threshold "
                           << slow_wait_threshold_.count() << "ms";
}

LockManager::~LockManager() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!resources_.empty()) {
    BOOST_LOG_TRIVIAL(warning) << "Lock manager: Destroyed with " << resources_.size()
                               << " resource(s) still locked";
  }
}

//==============================================
// ACQUISITION
//==============================================

LockHandle LockManager::acquire(const std::string& resource, LockMode mode,
                                std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);

  auto& slot = resources_[resource];
  if (!slot) {
    slot = std::make_unique<ResourceState>();
  }
  ResourceState& state = *slot;

  // Fast path, only when nobody is queued ahead of us
  if (state.queue.empty() && compatible(state, mode)) {
    grant(state, mode);
    BOOST_LOG_TRIVIAL(trace) << "Lock manager: Granted " << to_string(mode) << " lock on " << resource;
    return LockHandle(this, resource, mode);
  }

  auto waiter = std::make_shared<Waiter>();
  waiter->mode = mode;
  state.queue.push_back(waiter);

  BOOST_LOG_TRIVIAL(debug) << "Lock manager: Waiting for " << to_string(mode) << " lock on " << resource
                           << " (" << state.queue.size() << " queued)";

  const auto started = std::chrono::steady_clock::now();
  const bool granted = state.cv.wait_until(lock, started + timeout, [&waiter] { return waiter->granted; });

  if (!granted) {
    state.queue.erase(std::remove(state.queue.begin(), state.queue.end(), waiter), state.queue.end());

    // Our departure may unblock the waiters queued behind us
    if (grantWaiters(state)) {
      state.cv.notify_all();
    }
    eraseIfIdle(resource);

    BOOST_LOG_TRIVIAL(warning) << "Lock manager: Timed out after " << timeout.count() << "ms waiting for "
                               << to_string(mode) << " lock on " << resource;
    throw LockTimeoutError(resource, timeout);
  }

  const auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::steady_clock::now() - started);
  if (waited >= slow_wait_threshold_) {
    BOOST_LOG_TRIVIAL(warning) << "Lock manager: Slow acquisition of " << to_string(mode) << " lock on "
                               << resource << " took " << waited.count() << "ms";
  }

  return LockHandle(this, resource, mode);
}

LockSet LockManager::acquire_ordered(std::vector<std::string> resources, LockMode mode,
                                     std::chrono::milliseconds timeout) {
  std::sort(resources.begin(), resources.end());
  resources.erase(std::unique(resources.begin(), resources.end()), resources.end());

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  LockSet locks;

  for (const auto& resource : resources) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
    if (remaining.count() < 0) {
      remaining = std::chrono::milliseconds(0);
    }

    try {
      locks.add(acquire(resource, mode, remaining));
    } catch (const LockTimeoutError&) {
      BOOST_LOG_TRIVIAL(warning) << "Lock manager: Releasing " << locks.size()
                                 << " lock(s) after ordered acquisition failed at " << resource;
      locks.release_all();
      throw LockTimeoutError(resource, timeout);
    }
  }

  return locks;
}

//==============================================
// DIAGNOSTICS
//==============================================

std::map<std::string, LockDiagnostics> LockManager::diagnostics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto now = std::chrono::steady_clock::now();

  std::map<std::string, LockDiagnostics> result;
  for (const auto& [resource, state] : resources_) {
    LockDiagnostics diag;
    diag.shared_holders = state->shared_holders;
    diag.exclusive = state->exclusive;
    for (const auto& waiter : state->queue) {
      if (waiter->mode == LockMode::Exclusive) {
        ++diag.waiting_exclusive;
      } else {
        ++diag.waiting_shared;
      }
    }
    if (state->acquired_at) {
      diag.held_for = std::chrono::duration_cast<std::chrono::milliseconds>(now - *state->acquired_at);
    }
    result.emplace(resource, diag);
  }
  return result;
}

std::size_t LockManager::resource_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return resources_.size();
}

//==============================================
// LOCK TABLE MAINTENANCE
//==============================================

bool LockManager::compatible(const ResourceState& state, LockMode mode) {
  if (mode == LockMode::Exclusive) {
    return !state.exclusive && state.shared_holders == 0;
  }
  return !state.exclusive;
}

void LockManager::grant(ResourceState& state, LockMode mode) {
  if (!state.exclusive && state.shared_holders == 0) {
    state.acquired_at = std::chrono::steady_clock::now();
  }
  if (mode == LockMode::Exclusive) {
    state.exclusive = true;
  } else {
    ++state.shared_holders;
  }
}

bool LockManager::grantWaiters(ResourceState& state) {
  bool any = false;
  while (!state.queue.empty() && compatible(state, state.queue.front()->mode)) {
    auto next = state.queue.front();
    state.queue.pop_front();
    grant(state, next->mode);
    next->granted = true;
    any = true;
  }
  return any;
}

void LockManager::eraseIfIdle(const std::string& resource) {
  auto it = resources_.find(resource);
  if (it == resources_.end()) {
    return;
  }
  const ResourceState& state = *it->second;
  if (!state.exclusive && state.shared_holders == 0 && state.queue.empty()) {
    resources_.erase(it);
  }
}

void LockManager::unlock(const std::string& resource, LockMode mode) noexcept {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = resources_.find(resource);
  if (it == resources_.end()) {
    BOOST_LOG_TRIVIAL(error) << "Lock manager: Unlock of unknown resource " << resource;
    return;
  }

  ResourceState& state = *it->second;
  if (mode == LockMode::Exclusive) {
    state.exclusive = false;
  } else if (state.shared_holders > 0) {
    --state.shared_holders;
  }

  if (!state.exclusive && state.shared_holders == 0) {
    state.acquired_at.reset();
  }

  if (grantWaiters(state)) {
    state.cv.notify_all();
  }
  eraseIfIdle(resource);
  BOOST_LOG_TRIVIAL(trace) << "Lock manager: Released " << to_string(mode) << " lock on " << resource;
}

} // namespace vault::lock
