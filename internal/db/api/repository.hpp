#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/adjacency_record.hpp"
#include "internal/db/model/assignment_record.hpp"
#include "internal/db/model/run_state_record.hpp"
#include "internal/db/model/snapshot_record.hpp"
#include "internal/util/entity_id.hpp"

namespace txcluster::db {

/*
  Repository abstraction over the external store.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Range reads return entities in ascending id order
  - A snapshot's assignment rows become visible to the pipeline only
    through its SnapshotRecord (the commit marker); the repository itself
    does not hide unmarked rows, AssignmentStore does
  - Adjacency is append-only while building and read-only afterwards

  The store is the source of truth for:
    adjacency (one mapping per side)
    per-iteration assignment snapshots
    run state
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Adjacency
  // ---------------------------------------------------------------------

  // Adds each edge's weight onto the stored (entity, neighbor) weight.
  virtual Result AccumulateEdges(Transaction&, util::Side side, const std::vector<model::EdgeRecord>& edges) = 0;

  // Up to `limit` entities of `side` with id strictly greater than `after`.
  virtual std::vector<model::AdjacencyRecord> ReadAdjacency(Transaction&, util::Side side, const std::string& after, uint64_t limit) = 0;

  // Adjacency of the given entities; unknown ids are omitted. Ascending order.
  virtual std::vector<model::AdjacencyRecord> GetAdjacency(Transaction&, util::Side side, const std::vector<std::string>& entity_ids) = 0;

  virtual uint64_t CountEntities(Transaction&, util::Side side) = 0;

  virtual Result ClearAdjacency(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Assignment snapshots
  // ---------------------------------------------------------------------

  virtual Result InsertAssignments(Transaction&, uint32_t iteration, const std::vector<model::AssignmentRecord>& rows) = 0;

  // All rows of up to `limit` entities with id greater than `after`.
  virtual std::vector<model::AssignmentRecord> ReadAssignments(Transaction&, uint32_t iteration, const std::string& after, uint64_t limit) = 0;

  virtual std::vector<model::AssignmentRecord> GetAssignments(Transaction&, uint32_t iteration, const std::vector<std::string>& entity_ids) = 0;

  virtual Result DeleteAssignments(Transaction&, uint32_t iteration) = 0;

  // ---------------------------------------------------------------------
  // Snapshot commit markers
  // ---------------------------------------------------------------------

  virtual Result InsertSnapshot(Transaction&, const model::SnapshotRecord&) = 0;

  virtual std::optional<model::SnapshotRecord> GetSnapshot(Transaction&, uint32_t iteration) = 0;

  // Ascending by iteration.
  virtual std::vector<model::SnapshotRecord> ListSnapshots(Transaction&) = 0;

  virtual Result DeleteSnapshot(Transaction&, uint32_t iteration) = 0;

  // ---------------------------------------------------------------------
  // Run state
  // ---------------------------------------------------------------------

  virtual Result UpsertRunState(Transaction&, const model::RunStateRecord&) = 0;

  virtual std::optional<model::RunStateRecord> GetRunState(Transaction&) = 0;
};

} // namespace txcluster::db
