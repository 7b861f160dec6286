#pragma once

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace asyncquery::session {

/*
  Id -> shared entry map that never erases.

  Lookups take a shared lock and may run alongside an insert. Entries are
  handed out as shared_ptr, so a caller keeps a stable object after the lock
  is released. Iteration order is insertion order.
*/
template <typename T>
class AppendOnlyMap {
 public:
  // Returns the entry stored under id: the new one, or the one that won.
  std::shared_ptr<T> Insert(const std::string& id, std::shared_ptr<T> entry) {
    std::unique_lock lock(mutex_);
    auto [it, inserted] = by_id_.emplace(id, entry);
    if (inserted) {
      ordered_.push_back(std::move(entry));
    }
    return it->second;
  }

  std::shared_ptr<T> Find(const std::string& id) const {
    std::shared_lock lock(mutex_);
    auto             it = by_id_.find(id);
    return it == by_id_.end() ? nullptr : it->second;
  }

  std::vector<std::shared_ptr<T>> Snapshot() const {
    std::shared_lock lock(mutex_);
    return ordered_;
  }

  std::size_t Size() const {
    std::shared_lock lock(mutex_);
    return ordered_.size();
  }

 private:
  mutable std::shared_mutex                           mutex_;
  std::unordered_map<std::string, std::shared_ptr<T>> by_id_;
  std::vector<std::shared_ptr<T>>                     ordered_;
};

} // namespace asyncquery::session
