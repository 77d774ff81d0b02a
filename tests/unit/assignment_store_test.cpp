#include "internal/assignment/assignment_store.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/test_graphs.hpp"

namespace {

using txcluster::assignment::AssignmentStore;
using txcluster::db::memory::MemoryRepository;
using txcluster::db::model::AssignmentRecord;
using txcluster::db::model::Role;
using txcluster::util::Side;

AssignmentRecord Primary(const std::string& entity, const std::string& cluster, uint64_t weight = 0) {
  return AssignmentRecord{entity, cluster, Role::kPrimary, weight};
}

void CommitSnapshot(AssignmentStore& store, uint32_t iteration, bool resolved = false) {
  auto writer = store.BeginSnapshot(iteration);
  writer->Write({Primary("C:C1", "C:C1"), Primary("M:M1", "C:C1")}, 2, iteration == 0 ? 0 : 1);
  writer->Commit(resolved);
}

void TestRowsInvisibleUntilCommit() {
  auto            repo = std::make_shared<MemoryRepository>();
  AssignmentStore store(repo, txcluster::testing::TestOptions().retry);

  auto writer = store.BeginSnapshot(0);
  writer->Write({Primary("C:C1", "C:C1"), Primary("M:M1", "C:C1")}, 2, 0);

  assert(!store.Latest().has_value());
  bool threw = false;
  try {
    store.Open(0);
  } catch (const txcluster::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  auto record = writer->Commit(false);
  assert(record.entity_count == 2);
  assert(record.churn == 0.0);

  auto handle = store.Open(0);
  auto page   = handle.ReadPage("", 10);
  assert(page.size() == 2);
  assert(page[0].entity_id == "C:C1" && page[1].entity_id == "M:M1");
  assert(handle.Primaries({"M:M1", "M:unknown"}).at("M:M1") == "C:C1");
  assert(handle.Primaries({"M:M1", "M:unknown"}).size() == 1);
}

void TestChurnIsChangedOverEntities() {
  auto            repo = std::make_shared<MemoryRepository>();
  AssignmentStore store(repo, txcluster::testing::TestOptions().retry);

  auto writer = store.BeginSnapshot(1);
  writer->Write({Primary("C:C1", "M:M1"), Primary("C:C2", "M:M1")}, 2, 1);
  writer->Write({Primary("M:M1", "M:M1"), Primary("M:M2", "M:M1")}, 2, 2);
  auto record = writer->Commit(false);

  assert(record.entity_count == 4);
  assert(record.changed_count == 3);
  assert(record.churn == 0.75);
  assert(!record.resolved);

  bool threw = false;
  try {
    writer->Write({Primary("C:C3", "C:C3")}, 1, 0);
  } catch (const txcluster::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestBeginOnCommittedSnapshotFails() {
  auto            repo = std::make_shared<MemoryRepository>();
  AssignmentStore store(repo, txcluster::testing::TestOptions().retry);
  CommitSnapshot(store, 0);

  bool threw = false;
  try {
    store.BeginSnapshot(0);
  } catch (const txcluster::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestBeginDiscardsAbandonedRows() {
  auto            repo = std::make_shared<MemoryRepository>();
  AssignmentStore store(repo, txcluster::testing::TestOptions().retry);

  {
    auto abandoned = store.BeginSnapshot(0);
    abandoned->Write({Primary("C:C9", "C:C9")}, 1, 0);
  }

  auto writer = store.BeginSnapshot(0);
  writer->Write({Primary("C:C1", "C:C1")}, 1, 0);
  writer->Commit(false);

  auto page = store.Open(0).ReadPage("", 10);
  assert(page.size() == 1);
  assert(page[0].entity_id == "C:C1");
}

void TestSealedSideIsReadable() {
  auto            repo = std::make_shared<MemoryRepository>();
  AssignmentStore store(repo, txcluster::testing::TestOptions().retry);

  auto writer = store.BeginSnapshot(1);
  writer->Write({Primary("C:C1", "M:M2")}, 1, 1);

  bool threw = false;
  try {
    writer->SealedPrimaries(Side::kCardholder, {"C:C1"});
  } catch (const txcluster::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  writer->Seal(Side::kCardholder);
  assert(writer->Sealed(Side::kCardholder));
  assert(!writer->Sealed(Side::kMerchant));
  assert(writer->SealedPrimaries(Side::kCardholder, {"C:C1"}).at("C:C1") == "M:M2");
}

void TestGarbageCollectionKeepsNewestUnresolvedAndResolved() {
  auto            repo = std::make_shared<MemoryRepository>();
  AssignmentStore store(repo, txcluster::testing::TestOptions().retry);

  CommitSnapshot(store, 0);
  CommitSnapshot(store, 1);
  CommitSnapshot(store, 2);
  CommitSnapshot(store, 3, true);

  assert(store.LatestUnresolved()->iteration == 2);
  assert(store.Latest()->iteration == 3);

  assert(store.CollectGarbage() == 2);
  auto left = store.ListCommitted();
  assert(left.size() == 2);
  assert(left[0].iteration == 2 && left[1].iteration == 3 && left[1].resolved);

  // rows of collected snapshots are gone as well
  assert(repo->RowCount() == 4);
}

void TestPinnedSnapshotsSurviveCollection() {
  auto            repo = std::make_shared<MemoryRepository>();
  AssignmentStore store(repo, txcluster::testing::TestOptions().retry);

  CommitSnapshot(store, 0);
  CommitSnapshot(store, 1);
  {
    auto reader = store.Open(0);
    auto copy   = reader;
    CommitSnapshot(store, 2);
    assert(store.IsPinned(0));
    assert(store.CollectGarbage() == 1);
    assert(copy.ReadPage("", 10).size() == 2);

    bool threw = false;
    try {
      store.Discard(0);
    } catch (const txcluster::util::InvalidState&) {
      threw = true;
    }
    assert(threw);
  }
  assert(!store.IsPinned(0));
  assert(store.CollectGarbage() == 1);
  assert(store.ListCommitted().size() == 1);
}

void TestRetainedSnapshotsAreNeverCollected() {
  auto            repo = std::make_shared<MemoryRepository>();
  AssignmentStore store(repo, txcluster::testing::TestOptions().retry, true);

  CommitSnapshot(store, 0);
  CommitSnapshot(store, 1);
  CommitSnapshot(store, 2);
  assert(store.CollectGarbage() == 0);
  assert(store.ListCommitted().size() == 3);
}

void TestGroupingRequiresPrimaryFirst() {
  auto grouped = txcluster::assignment::GroupByEntity(
      {Primary("C:C1", "M:M1", 2), AssignmentRecord{"C:C1", "M:M3", Role::kDuplicate, 1}, Primary("C:C2", "M:M3", 5)});
  assert(grouped.size() == 2);
  assert(grouped[0].rows.size() == 2);
  assert(grouped[0].Primary().cluster_id == "M:M1");

  bool threw = false;
  try {
    txcluster::assignment::GroupByEntity({AssignmentRecord{"C:C1", "M:M3", Role::kDuplicate, 1}});
  } catch (const txcluster::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestRowsInvisibleUntilCommit();
  TestChurnIsChangedOverEntities();
  TestBeginOnCommittedSnapshotFails();
  TestBeginDiscardsAbandonedRows();
  TestSealedSideIsReadable();
  TestGarbageCollectionKeepsNewestUnresolvedAndResolved();
  TestPinnedSnapshotsSurviveCollection();
  TestRetainedSnapshotsAreNeverCollected();
  TestGroupingRequiresPrimaryFirst();

  std::cout << "txcluster_unit_assignment_store: pass\n";
  return 0;
}
