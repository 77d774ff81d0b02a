#include "internal/db/memory/memory_repository.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

namespace {

using txcluster::db::ErrorCode;
using txcluster::db::memory::MemoryRepository;
using txcluster::db::model::AssignmentRecord;
using txcluster::db::model::EdgeRecord;
using txcluster::db::model::Role;
using txcluster::db::model::SnapshotRecord;
using txcluster::util::Side;

void TestWritesAreInvisibleUntilCommit() {
  MemoryRepository repo;

  auto writer = repo.Begin();
  assert(repo.AccumulateEdges(*writer, Side::kCardholder, {{"C:C1", "M:M1", 1}}));

  auto reader = repo.Begin();
  assert(repo.CountEntities(*reader, Side::kCardholder) == 0);

  writer->Commit();
  assert(writer->IsCommitted());
  assert(repo.CountEntities(*reader, Side::kCardholder) == 1);
}

void TestRollbackAndDestructorDiscardWrites() {
  MemoryRepository repo;
  {
    auto tx = repo.Begin();
    assert(repo.AccumulateEdges(*tx, Side::kMerchant, {{"M:M1", "C:C1", 1}}));
    tx->Rollback();
  }
  {
    auto tx = repo.Begin();
    assert(repo.AccumulateEdges(*tx, Side::kMerchant, {{"M:M1", "C:C1", 1}}));
    // dropped without commit
  }
  auto tx = repo.Begin();
  assert(repo.CountEntities(*tx, Side::kMerchant) == 0);
  assert(repo.RowCount() == 0);
}

void TestAccumulateSumsWeightsAndOrdersNeighbors() {
  MemoryRepository repo;
  for (int i = 0; i < 3; ++i) {
    auto tx = repo.Begin();
    assert(repo.AccumulateEdges(*tx, Side::kCardholder, {{"C:C1", "M:M2", 2}, {"C:C1", "M:M1", 1}}));
    tx->Commit();
  }

  auto tx   = repo.Begin();
  auto rows = repo.GetAdjacency(*tx, Side::kCardholder, {"C:C1", "C:unknown"});
  assert(rows.size() == 1);
  assert(rows[0].neighbors.size() == 2);
  assert(rows[0].neighbors[0].id == "M:M1" && rows[0].neighbors[0].weight == 3);
  assert(rows[0].neighbors[1].id == "M:M2" && rows[0].neighbors[1].weight == 6);
  assert(repo.RowCount() == 2);

  auto bad = repo.AccumulateEdges(*tx, Side::kCardholder, {{"C:C1", "M:M3", 0}});
  assert(!bad && bad.code == ErrorCode::ConstraintViolation);
}

void TestAdjacencyPagingIsAscending() {
  MemoryRepository repo;
  {
    auto tx = repo.Begin();
    std::vector<EdgeRecord> edges;
    for (const char* id : {"C:d", "C:a", "C:c", "C:b", "C:e"}) edges.push_back({id, "M:m", 1});
    assert(repo.AccumulateEdges(*tx, Side::kCardholder, edges));
    tx->Commit();
  }

  auto tx    = repo.Begin();
  auto first = repo.ReadAdjacency(*tx, Side::kCardholder, "", 2);
  assert(first.size() == 2 && first[0].entity_id == "C:a" && first[1].entity_id == "C:b");
  auto second = repo.ReadAdjacency(*tx, Side::kCardholder, "C:b", 2);
  assert(second.size() == 2 && second[0].entity_id == "C:c" && second[1].entity_id == "C:d");
  auto last = repo.ReadAdjacency(*tx, Side::kCardholder, "C:d", 2);
  assert(last.size() == 1 && last[0].entity_id == "C:e");
  assert(repo.ReadAdjacency(*tx, Side::kCardholder, "C:e", 2).empty());
}

void TestCapacityExhaustionReportsFull() {
  MemoryRepository repo(3);
  {
    auto tx = repo.Begin();
    assert(repo.AccumulateEdges(*tx, Side::kCardholder, {{"C:C1", "M:M1", 1}, {"C:C1", "M:M2", 1}}));
    tx->Commit();
  }

  auto tx = repo.Begin();
  // re-weighting an existing pair needs no new row
  assert(repo.AccumulateEdges(*tx, Side::kCardholder, {{"C:C1", "M:M1", 5}}));
  assert(repo.InsertAssignments(*tx, 0, {{"C:C1", "C:C1", Role::kPrimary, 0}}));

  auto full = repo.InsertAssignments(*tx, 0, {{"C:C2", "C:C2", Role::kPrimary, 0}});
  assert(!full && full.code == ErrorCode::Full);
}

void TestAssignmentRowsAndSnapshotMarkers() {
  MemoryRepository repo;
  {
    auto tx = repo.Begin();
    assert(repo.InsertAssignments(*tx, 4,
                                  {{"M:M1", "M:M3", Role::kDuplicate, 1},
                                   {"C:C1", "M:M1", Role::kPrimary, 2},
                                   {"M:M1", "M:M1", Role::kPrimary, 1},
                                   {"M:M1", "M:M0", Role::kDuplicate, 1}}));
    SnapshotRecord marker;
    marker.iteration = 4;
    assert(repo.InsertSnapshot(*tx, marker));
    tx->Commit();
  }

  auto tx   = repo.Begin();
  auto rows = repo.GetAssignments(*tx, 4, {"M:M1"});
  assert(rows.size() == 3);
  assert(rows[0].role == Role::kPrimary && rows[0].cluster_id == "M:M1");
  assert(rows[1].cluster_id == "M:M0" && rows[2].cluster_id == "M:M3");

  auto page = repo.ReadAssignments(*tx, 4, "", 1);
  assert(page.size() == 1 && page[0].entity_id == "C:C1");
  page = repo.ReadAssignments(*tx, 4, "C:C1", 10);
  assert(page.size() == 3);
  assert(repo.GetAssignments(*tx, 3, {"M:M1"}).empty());

  SnapshotRecord again;
  again.iteration = 4;
  auto dup        = repo.InsertSnapshot(*tx, again);
  assert(!dup && dup.code == ErrorCode::AlreadyExists);

  assert(repo.DeleteSnapshot(*tx, 4));
  assert(repo.DeleteAssignments(*tx, 4));
  tx->Commit();

  auto check = repo.Begin();
  assert(repo.ListSnapshots(*check).empty());
  assert(repo.GetAssignments(*check, 4, {"M:M1"}).empty());
  assert(repo.RowCount() == 0);
}

void TestRunStateUpsert() {
  MemoryRepository repo;
  auto             tx = repo.Begin();
  assert(!repo.GetRunState(*tx).has_value());

  txcluster::db::model::RunStateRecord state;
  state.records_read = 5;
  assert(repo.UpsertRunState(*tx, state));
  state.adjacency_complete = true;
  assert(repo.UpsertRunState(*tx, state));
  tx->Commit();

  auto read  = repo.Begin();
  auto saved = repo.GetRunState(*read);
  assert(saved && saved->adjacency_complete && saved->records_read == 5);
}

} // namespace

int main() {
  TestWritesAreInvisibleUntilCommit();
  TestRollbackAndDestructorDiscardWrites();
  TestAccumulateSumsWeightsAndOrdersNeighbors();
  TestAdjacencyPagingIsAscending();
  TestCapacityExhaustionReportsFull();
  TestAssignmentRowsAndSnapshotMarkers();
  TestRunStateUpsert();

  std::cout << "txcluster_unit_memory_repository: pass\n";
  return 0;
}
