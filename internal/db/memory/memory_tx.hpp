#pragma once

#include <functional>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace txcluster::db::memory {

/*
  Transaction = buffered write set
*/

class MemoryTransaction final : public db::Transaction {
 public:
  using Mutation = std::function<void(MemoryRepository::State&)>;

  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  void Stage(Mutation mutation, uint64_t added_rows);

  uint64_t PendingRows() const {
    return pending_rows_;
  }

 private:
  MemoryRepository&     repo_;
  std::vector<Mutation> writes_;
  uint64_t              pending_rows_ = 0;
  bool                  committed_    = false;
  bool                  rolled_back_  = false;
};

} // namespace txcluster::db::memory
