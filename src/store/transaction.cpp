#include "store/transaction.hpp"
#include "store/store.hpp"
#include <atomic>
#include <set>
#include <boost/log/trivial.hpp>

namespace vault {
namespace store {

namespace {
std::atomic<std::uint64_t> next_transaction_id{1};
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Transaction::Transaction(Store& store)
  : store_(&store)
  , id_(next_transaction_id.fetch_add(1)) {
  BOOST_LOG_TRIVIAL(debug) << "Transaction " << id_ << ": Started";
}

Transaction::Transaction(Transaction&& other) noexcept
  : store_(other.store_)
  , operations_(std::move(other.operations_))
  , locks_(std::move(other.locks_))
  , state_(other.state_)
  , id_(other.id_) {
  other.store_ = nullptr;
  other.operations_.clear();
}

Transaction::~Transaction() {
  if (store_ && state_ == State::OPEN) {
    BOOST_LOG_TRIVIAL(debug) << "Transaction " << id_ << ": Discarding " << operations_.size()
                             << " staged operations";
  }
}


//==============================================
// STAGING
//==============================================

void Transaction::stage_write(const StorageKey& key, nlohmann::json record) {
  ensure_open("stage_write");
  operations_.push_back(Operation{Operation::Type::WRITE, key, std::move(record)});
  BOOST_LOG_TRIVIAL(debug) << "Transaction " << id_ << ": Staged write of " << key;
}

void Transaction::stage_remove(const StorageKey& key) {
  ensure_open("stage_remove");
  operations_.push_back(Operation{Operation::Type::REMOVE, key, nullptr});
  BOOST_LOG_TRIVIAL(debug) << "Transaction " << id_ << ": Staged removal of " << key;
}


//==============================================
// FINALIZATION
//==============================================

void Transaction::commit() {
  ensure_open("commit");
  commit(store_->config().lock_timeout);
}

void Transaction::commit(std::chrono::milliseconds timeout) {
  ensure_open("commit");

  if (operations_.empty()) {
    transition_to(State::COMMITTED);
    BOOST_LOG_TRIVIAL(debug) << "Transaction " << id_ << ": Committed with nothing staged";
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "Transaction " << id_ << ": Committing " << operations_.size() << " operations";

  std::vector<std::string> resources;
  resources.reserve(operations_.size());
  for (const auto& op : operations_) {
    resources.push_back(store_->resource_for(op.key));
  }

  // Throws LockTimeoutError with nothing held, the transaction stays open
  locks_ = store_->locks_.acquire_ordered(std::move(resources), lock::LockMode::Exclusive, timeout);

  std::vector<const Operation*> ops = effective_operations();
  std::vector<std::string> payloads(ops.size());

  // Validate and seal everything before the first file is touched
  try {
    for (std::size_t i = 0; i < ops.size(); ++i) {
      if (ops[i]->type == Operation::Type::WRITE) {
        payloads[i] = store_->encode(ops[i]->key, ops[i]->record);
      }
    }
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Transaction " << id_ << ": Rejected before applying: " << e.what();
    locks_.release_all();
    throw;
  }

  std::size_t applied = 0;
  for (std::size_t i = 0; i < ops.size(); ++i) {
    try {
      if (ops[i]->type == Operation::Type::WRITE) {
        store_->write_file(ops[i]->key, payloads[i]);
      } else {
        store_->remove_file(ops[i]->key);
      }
      ++applied;
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(fatal) << "Transaction " << id_ << ": Partial commit, " << applied << " of "
                               << ops.size() << " operations applied, failed at " << ops[i]->key
                               << ": " << e.what();
      locks_.release_all();
      transition_to(State::COMMITTED);
      throw PartialCommitError(applied, ops.size(), ops[i]->key.str(), e.what());
    }
  }

  locks_.release_all();
  transition_to(State::COMMITTED);
  BOOST_LOG_TRIVIAL(info) << "Transaction " << id_ << ": Committed " << applied << " operations";
}

void Transaction::rollback() {
  ensure_open("rollback");
  BOOST_LOG_TRIVIAL(info) << "Transaction " << id_ << ": Rolling back " << operations_.size()
                          << " staged operations";
  operations_.clear();
  locks_.release_all();
  transition_to(State::ROLLED_BACK);
}


//==============================================
// UTILITY METHODS
//==============================================

void Transaction::ensure_open(const char* operation) const {
  if (!store_) {
    throw StoreError("Transaction: " + std::string(operation) + " on a moved-from transaction");
  }
  if (state_ != State::OPEN) {
    BOOST_LOG_TRIVIAL(warning) << "Transaction " << id_ << ": " << operation << " after finalization ("
                               << state_ << ")";
    throw TransactionFinalizedError(state_to_string(state_));
  }
}

void Transaction::transition_to(State new_state) {
  if (!is_valid_transition(state_, new_state)) {
    throw TransactionFinalizedError(state_to_string(state_));
  }
  state_ = new_state;
}

std::vector<const Transaction::Operation*> Transaction::effective_operations() const {
  std::vector<const Operation*> result;
  std::set<StorageKey> seen;
  for (auto it = operations_.rbegin(); it != operations_.rend(); ++it) {
    if (seen.insert(it->key).second) {
      result.push_back(&*it);
    }
  }
  return std::vector<const Operation*>(result.rbegin(), result.rend());
}

} // namespace store
} // namespace vault
