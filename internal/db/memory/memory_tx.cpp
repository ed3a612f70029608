#include "memory_tx.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace settlement::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  copy_         = repo_.committed_;
  base_version_ = repo_.committed_version_;
}

void MemoryTransaction::Commit() {
  if (state_ != Phase::kOpen) {
    throw std::logic_error("memory transaction already finished");
  }

  if (writes_) {
    std::scoped_lock lock(repo_.mutex_);
    if (repo_.committed_version_ != base_version_) {
      state_ = Phase::kAbandoned;
      throw util::Transient("transaction conflict: ledger changed since version " + std::to_string(base_version_));
    }
    repo_.committed_ = std::move(copy_);
    ++repo_.committed_version_;
  }
  state_ = Phase::kCommitted;
}

void MemoryTransaction::Rollback() {
  if (state_ == Phase::kOpen) state_ = Phase::kAbandoned;
}

} // namespace settlement::db::memory
