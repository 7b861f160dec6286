#include "memory_tx.hpp"

namespace asyncquery::db::memory {

namespace {

template <typename Map>
void Publish(Map& committed, const Map& working, const std::string& key) {
  auto it = working.find(key);
  if (it == working.end()) {
    committed.erase(key);
  } else {
    committed[key] = it->second;
  }
}

} // namespace

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_          = repo_.committed_; // snapshot copy
  snapshot_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  if (writes_.empty()) {
    // read-only; nothing to publish
    committed_ = true;
    return;
  }

  std::scoped_lock lock(repo_.mutex_);
  for (const auto& row : writes_) {
    auto it = repo_.row_versions_.find(row);
    if (it != repo_.row_versions_.end() && it->second > snapshot_version_) {
      throw TransactionConflict("transaction conflict: row " + row.second + " was modified by a concurrent transaction");
    }
  }

  const auto version = ++repo_.committed_version_;
  for (const auto& row : writes_) {
    using Table = MemoryRepository::Table;
    switch (row.first) {
      case Table::kSessions:
        Publish(repo_.committed_.sessions, working_.sessions, row.second);
        break;
      case Table::kStatements:
        Publish(repo_.committed_.statements, working_.statements, row.second);
        break;
      case Table::kJobMetadata:
        Publish(repo_.committed_.job_metadata, working_.job_metadata, row.second);
        break;
      case Table::kResults:
        Publish(repo_.committed_.results, working_.results, row.second);
        break;
      case Table::kIndexMetadata:
        Publish(repo_.committed_.index_metadata, working_.index_metadata, row.second);
        break;
    }
    repo_.row_versions_[row] = version;
  }
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
}

} // namespace asyncquery::db::memory
