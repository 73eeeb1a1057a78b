#ifndef VAULT_LOCK_ERROR_HPP
#define VAULT_LOCK_ERROR_HPP

#include <chrono>
#include <stdexcept>
#include <string>

namespace vault::lock {

// Misuse of a lock handle, e.g. releasing it twice
class LockError : public std::logic_error {
public:
    explicit LockError(const std::string& message)
        : std::logic_error("Lock error: " + message) {}
};

// Bounded wait exceeded. No lock state is left behind for the attempt,
// so the caller may retry.
class LockTimeoutError : public std::runtime_error {
public:
    LockTimeoutError(const std::string& resource, std::chrono::milliseconds timeout)
        : std::runtime_error("Lock timeout after " + std::to_string(timeout.count()) +
                             "ms for resource: " + resource)
        , resource_(resource)
        , timeout_(timeout) {}

    const std::string& resource() const { return resource_; }
    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    std::string resource_;
    std::chrono::milliseconds timeout_;
};

} // namespace vault::lock

#endif // VAULT_LOCK_ERROR_HPP
