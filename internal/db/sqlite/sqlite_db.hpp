#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace asyncquery::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by every transaction; TransactionLock() serializes
  them since sqlite allows a single open transaction per connection.
*/
class SqliteDB {
 public:
  SqliteDB(std::string path, bool wal_mode);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (used for pragmas/schema)
  void Exec(const std::string& sql);

  // Creates the tables if missing.
  void ApplySchema();

  std::unique_lock<std::mutex> TransactionLock() {
    return std::unique_lock<std::mutex>(tx_mutex_);
  }

 private:
  void Configure(bool wal_mode);

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace asyncquery::db::sqlite
