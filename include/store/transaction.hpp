#ifndef VAULT_TRANSACTION_HPP
#define VAULT_TRANSACTION_HPP

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "lock/lock_manager.hpp"
#include "store/storage_key.hpp"

namespace vault {
namespace store {

class Store;

/**
 * Batch of writes and removes applied under one set of exclusive locks.
 *
 * Nothing touches disk until commit(). Commit acquires the locks for every
 * staged key in sorted order, validates and seals every write, and only then
 * applies the operations in staging order. A transaction is used from a
 * single thread.
 */
class Transaction {
public:
    /**
     * Transaction states:
     * OPEN        - Accepting staged operations
     * COMMITTED   - Operations applied (possibly partially, see PartialCommitError)
     * ROLLED_BACK - Staged operations discarded
     */
    enum class State {
        OPEN,
        COMMITTED,
        ROLLED_BACK
    };

    Transaction(Transaction&& other) noexcept;
    Transaction& operator=(Transaction&&) = delete;
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    // An open transaction is discarded
    ~Transaction();

    // ---- STAGING ----
    void stage_write(const StorageKey& key, nlohmann::json record);
    void stage_remove(const StorageKey& key);

    // ---- FINALIZATION ----
    // Uses the store's configured lock timeout
    void commit();
    void commit(std::chrono::milliseconds timeout);
    void rollback();

    State get_state() const { return state_; }
    bool is_open() const { return state_ == State::OPEN; }
    std::size_t staged() const { return operations_.size(); }
    std::uint64_t id() const { return id_; }

    static bool is_valid_transition(State from, State to) {
        return from == State::OPEN && to != State::OPEN;
    }

    static std::string state_to_string(State state) {
        switch (state) {
            case State::OPEN:        return "OPEN";
            case State::COMMITTED:   return "COMMITTED";
            case State::ROLLED_BACK: return "ROLLED_BACK";
            default:                 return "UNKNOWN";
        }
    }

private:
    friend class Store;
    explicit Transaction(Store& store);

    struct Operation {
        enum class Type { WRITE, REMOVE };
        Type type;
        StorageKey key;
        nlohmann::json record;
    };

    // Throws TransactionFinalizedError unless OPEN
    void ensure_open(const char* operation) const;
    void transition_to(State new_state);
    // Staging order with operations superseded by a later one on the same key dropped
    std::vector<const Operation*> effective_operations() const;

    Store* store_;
    std::vector<Operation> operations_;
    lock::LockSet locks_;
    State state_ = State::OPEN;
    std::uint64_t id_;
};

// Stream operator for Transaction::State to support test assertions and logging
inline std::ostream& operator<<(std::ostream& os, const Transaction::State& state) {
    os << Transaction::state_to_string(state);
    return os;
}

} // namespace store
} // namespace vault

#endif // VAULT_TRANSACTION_HPP
