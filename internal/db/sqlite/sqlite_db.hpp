#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace txcluster::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by every worker; transactions on it are
  serialized through TransactionMutex().
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure(bool wal_mode);

  std::mutex& TransactionMutex() {
    return tx_mutex_;
  }

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

// Throws util::StorageIOError / util::CapacityExceededError for rc != SQLITE_OK.
void ThrowIf(int rc, sqlite3* db, const char* what);

} // namespace txcluster::db::sqlite
