#pragma once

#include <cstdint>
#include <set>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace asyncquery::db::memory {

/*
  Transaction = snapshot + write set

  Commit fails with TransactionConflict if a row this transaction wrote was
  committed by another transaction after the snapshot was taken. Only the
  written rows are published.
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

  MemoryRepository::State& Mutable(MemoryRepository::Table table, const std::string& key) {
    writes_.emplace(table, key);
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  uint64_t                snapshot_version_ = 0;
  std::set<MemoryRepository::RowKey> writes_;
  bool                    committed_        = false;
  bool                    rolled_back_      = false;
};

} // namespace asyncquery::db::memory
