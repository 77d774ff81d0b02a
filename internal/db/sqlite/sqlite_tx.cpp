#include "sqlite_tx.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace txcluster::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->TransactionMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      TXCLUSTER_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
  lock_.unlock();
}

void SqliteTransaction::Rollback() {
  db_->Exec("ROLLBACK;");
  finished_ = true;
  lock_.unlock();
}

} // namespace txcluster::db::sqlite
