#pragma once

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace docrev::db::memory {

/*
  Transaction = private copy of the committed state.

  Only a transaction that wrote (Mutable() was called) publishes on commit
  and can conflict; read-only transactions (get, list) commit as no-ops.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable() {
    dirty_ = true;
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  uint64_t                snapshot_version_ = 0;
  bool                    dirty_            = false;
  bool                    committed_        = false;
  bool                    rolled_back_      = false;
};

} // namespace docrev::db::memory
