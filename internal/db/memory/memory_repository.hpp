#pragma once

#include <array>
#include <map>
#include <shared_mutex>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace txcluster::db::memory {

class MemoryTransaction;

/*
  In-process repository.

  Reads observe committed state only; writes are buffered by the
  transaction and applied atomically under the exclusive lock on Commit().
  max_rows bounds adjacency pairs + assignment rows (0 = unbounded) and
  surfaces as ErrorCode::Full, mirroring a store running out of space.
*/
class MemoryRepository final : public db::Repository {
public:
  explicit MemoryRepository(uint64_t max_rows = 0);

  std::unique_ptr<Transaction> Begin() override;

  Result AccumulateEdges(Transaction&, util::Side side, const std::vector<model::EdgeRecord>& edges) override;
  std::vector<model::AdjacencyRecord> ReadAdjacency(Transaction&, util::Side side, const std::string& after, uint64_t limit) override;
  std::vector<model::AdjacencyRecord> GetAdjacency(Transaction&, util::Side side, const std::vector<std::string>& entity_ids) override;
  uint64_t CountEntities(Transaction&, util::Side side) override;
  Result ClearAdjacency(Transaction&) override;

  Result InsertAssignments(Transaction&, uint32_t iteration, const std::vector<model::AssignmentRecord>& rows) override;
  std::vector<model::AssignmentRecord> ReadAssignments(Transaction&, uint32_t iteration, const std::string& after, uint64_t limit) override;
  std::vector<model::AssignmentRecord> GetAssignments(Transaction&, uint32_t iteration, const std::vector<std::string>& entity_ids) override;
  Result DeleteAssignments(Transaction&, uint32_t iteration) override;

  Result InsertSnapshot(Transaction&, const model::SnapshotRecord&) override;
  std::optional<model::SnapshotRecord> GetSnapshot(Transaction&, uint32_t iteration) override;
  std::vector<model::SnapshotRecord> ListSnapshots(Transaction&) override;
  Result DeleteSnapshot(Transaction&, uint32_t iteration) override;

  Result UpsertRunState(Transaction&, const model::RunStateRecord&) override;
  std::optional<model::RunStateRecord> GetRunState(Transaction&) override;

  uint64_t RowCount() const;

private:
  friend class MemoryTransaction;

  using NeighborMap = std::map<std::string, uint64_t>;
  using EntityRows  = std::vector<model::AssignmentRecord>;

  struct State {
    std::array<std::map<std::string, NeighborMap>, 2>          adjacency;
    std::map<uint32_t, std::map<std::string, EntityRows>>      assignments;
    std::map<uint32_t, model::SnapshotRecord>                  snapshots;
    std::optional<model::RunStateRecord>                       run_state;
    uint64_t                                                   rows = 0;
  };

  Result CheckCapacity(MemoryTransaction& tx, uint64_t new_rows) const;

  uint64_t                  max_rows_;
  mutable std::shared_mutex mutex_;
  State                     committed_;
};

}
