#include "memory_tx.hpp"

#include <mutex>

#include "internal/util/errors.hpp"

namespace txcluster::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Stage(Mutation mutation, uint64_t added_rows) {
  if (committed_ || rolled_back_) {
    throw util::InvalidState("write staged on a finished transaction");
  }
  writes_.push_back(std::move(mutation));
  pending_rows_ += added_rows;
}

void MemoryTransaction::Commit() {
  if (rolled_back_) throw util::InvalidState("commit after rollback");

  std::unique_lock lock(repo_.mutex_);
  for (auto& write : writes_) {
    write(repo_.committed_);
  }
  writes_.clear();
  pending_rows_ = 0;
  committed_    = true;
}

void MemoryTransaction::Rollback() {
  writes_.clear();
  pending_rows_ = 0;
  rolled_back_  = true;
}

} // namespace txcluster::db::memory
