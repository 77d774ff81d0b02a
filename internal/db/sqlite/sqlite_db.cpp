#include "sqlite_db.hpp"

#include "internal/util/errors.hpp"

namespace txcluster::db::sqlite {

namespace {

bool IsTransient(int rc) {
  const int primary = rc & 0xFF;
  return primary == SQLITE_BUSY || primary == SQLITE_LOCKED || primary == SQLITE_IOERR;
}

[[noreturn]] void Raise(int rc, const std::string& msg) {
  if ((rc & 0xFF) == SQLITE_FULL) {
    throw util::CapacityExceededError(msg);
  }
  throw util::StorageIOError(msg, IsTransient(rc));
}

} // namespace

void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    Raise(rc, std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path, bool wal_mode) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::StorageIOError("sqlite open " + path_ + ": " + msg, false);
  }

  Configure(wal_mode);
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    Raise(rc, msg);
  }
}

void SqliteDB::Configure(bool wal_mode) {
  // WAL keeps the last committed snapshot readable while the next is written
  if (wal_mode) Exec("PRAGMA journal_mode=WAL;");

  Exec("PRAGMA synchronous=NORMAL;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
  Exec("PRAGMA cache_size=-20000;"); // ~20MB (negative means KB)
}

} // namespace txcluster::db::sqlite
