#pragma once

#include <cstdint>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace settlement::db::memory {

/*
  Optimistic transaction over the in-memory ledger.

  Begin copies the committed state; reads and writes go to that copy.
  Commit of a writing transaction fails with util::Transient when another
  writer committed after the copy was taken, which the engine retries
  the same way it retries a SQLite busy error.
*/
class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override = default;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return state_ == Phase::kCommitted;
  }

  // Marks the transaction as writing.
  MemoryRepository::State& Mutable() {
    writes_ = true;
    return copy_;
  }

  const MemoryRepository::State& View() const {
    return copy_;
  }

 private:
  enum class Phase { kOpen, kCommitted, kAbandoned };

  MemoryRepository&       repo_;
  MemoryRepository::State copy_;
  uint64_t                base_version_ = 0;
  bool                    writes_       = false;
  Phase                   state_        = Phase::kOpen;
};

} // namespace settlement::db::memory
