#include "internal/adjacency/adjacency_builder.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "internal/adjacency/adjacency_reader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/test_graphs.hpp"

namespace {

using txcluster::adjacency::AdjacencyBuilder;
using txcluster::adjacency::AdjacencyReader;
using txcluster::adjacency::BuildOptions;
using txcluster::db::memory::MemoryRepository;
using txcluster::util::Side;

BuildOptions Options(uint32_t batch_size, uint32_t writers, bool strict = false) {
  BuildOptions options;
  options.batch_size     = batch_size;
  options.writer_threads = writers;
  options.strict         = strict;
  options.retry          = txcluster::testing::TestOptions().retry;
  return options;
}

txcluster::db::model::RunStateRecord Build(std::shared_ptr<MemoryRepository> repo, const std::string& records, BuildOptions options) {
  std::istringstream                    in(records);
  txcluster::ingest::StreamRecordSource source(in);
  return AdjacencyBuilder(repo, options).Build(source);
}

void TestBothMappingsAreBuilt() {
  auto repo  = std::make_shared<MemoryRepository>();
  auto state = Build(repo, txcluster::testing::kScenarioA, Options(2, 3));

  assert(state.adjacency_complete);
  assert(state.records_read == 5);
  assert(state.malformed_records == 0);
  assert(state.distinct_cardholders == 3);
  assert(state.distinct_merchants == 4);
  assert(state.total_edge_weight == 5);

  AdjacencyReader reader(repo, txcluster::testing::TestOptions().retry);
  auto            m1 = reader.Lookup(Side::kMerchant, {"M:M1"});
  assert(m1.size() == 1);
  assert(m1[0].neighbors.size() == 2);
  assert(m1[0].neighbors[0].id == "C:C1" && m1[0].neighbors[1].id == "C:C2");

  auto c3 = reader.Lookup(Side::kCardholder, {"C:C3"});
  assert(c3[0].neighbors.size() == 2 && c3[0].neighbors[0].id == "M:M3" && c3[0].neighbors[1].id == "M:M4");

  // persisted for restarts
  auto tx    = repo->Begin();
  auto saved = repo->GetRunState(*tx);
  assert(saved && saved->adjacency_complete && saved->distinct_merchants == 4);
}

void TestRepeatedPairsAccumulate() {
  auto repo  = std::make_shared<MemoryRepository>();
  auto state = Build(repo, "C1 M1 2\nC1 M1\nC1,M1,4\nC2 M1\n", Options(1, 2));

  assert(state.records_read == 4);
  assert(state.distinct_cardholders == 2);
  assert(state.distinct_merchants == 1);
  assert(state.total_edge_weight == 8);

  AdjacencyReader reader(repo, txcluster::testing::TestOptions().retry);
  auto            c1 = reader.Lookup(Side::kCardholder, {"C:C1"});
  assert(c1[0].neighbors.size() == 1 && c1[0].neighbors[0].weight == 7);
  auto m1 = reader.Lookup(Side::kMerchant, {"M:M1"});
  assert(m1[0].neighbors[0].weight == 7 && m1[0].neighbors[1].weight == 1);
}

void TestResultIsIndependentOfWritersAndBatching() {
  std::string records;
  for (int i = 0; i < 200; ++i) {
    records += "c" + std::to_string(i % 17) + " m" + std::to_string(i % 11) + " " + std::to_string(1 + i % 3) + "\n";
  }

  auto one  = std::make_shared<MemoryRepository>();
  auto many = std::make_shared<MemoryRepository>();
  Build(one, records, Options(1000, 1));
  Build(many, records, Options(3, 4));

  AdjacencyReader a(one, txcluster::testing::TestOptions().retry);
  AdjacencyReader b(many, txcluster::testing::TestOptions().retry);
  for (auto side : {Side::kCardholder, Side::kMerchant}) {
    auto pa = a.ReadPage(side, "", 100);
    auto pb = b.ReadPage(side, "", 100);
    assert(pa.records.size() == pb.records.size());
    for (std::size_t i = 0; i < pa.records.size(); ++i) {
      assert(pa.records[i].entity_id == pb.records[i].entity_id);
      assert(pa.records[i].neighbors.size() == pb.records[i].neighbors.size());
      for (std::size_t j = 0; j < pa.records[i].neighbors.size(); ++j) {
        assert(pa.records[i].neighbors[j].id == pb.records[i].neighbors[j].id);
        assert(pa.records[i].neighbors[j].weight == pb.records[i].neighbors[j].weight);
      }
    }
  }
}

void TestMalformedRecordsAreSkippedAndCounted() {
  auto repo  = std::make_shared<MemoryRepository>();
  auto state = Build(repo, "C1 M1\nC1\nC2 M2 zero\n# comment\nC2 M2\n", Options(10, 2));

  assert(state.records_read == 2);
  assert(state.malformed_records == 2);
  assert(state.distinct_cardholders == 2);
}

void TestStrictModeFailsOnFirstMalformedRecord() {
  auto repo  = std::make_shared<MemoryRepository>();
  bool threw = false;
  try {
    Build(repo, "C1 M1\nC1 M1 -3\nC2 M2\n", Options(10, 2, true));
  } catch (const txcluster::util::MalformedRecordError& e) {
    threw = e.LineNumber() == 2;
  }
  assert(threw);

  auto tx    = repo->Begin();
  auto state = repo->GetRunState(*tx);
  assert(state && !state->adjacency_complete);
}

void TestWriterCapacityFailureStopsTheBuild() {
  auto repo = std::make_shared<MemoryRepository>(3);

  std::string records;
  for (int i = 0; i < 100; ++i) records += "c" + std::to_string(i) + " m" + std::to_string(i) + "\n";

  bool threw = false;
  try {
    Build(repo, records, Options(2, 2));
  } catch (const txcluster::util::CapacityExceededError&) {
    threw = true;
  }
  assert(threw);
}

void TestRebuildStartsFromEmptyMappings() {
  auto repo = std::make_shared<MemoryRepository>();
  Build(repo, "C1 M1 5\n", Options(10, 1));
  auto state = Build(repo, "C1 M1 2\n", Options(10, 1));
  assert(state.total_edge_weight == 2);

  AdjacencyReader reader(repo, txcluster::testing::TestOptions().retry);
  assert(reader.Lookup(Side::kCardholder, {"C:C1"})[0].neighbors[0].weight == 2);
}

} // namespace

int main() {
  TestBothMappingsAreBuilt();
  TestRepeatedPairsAccumulate();
  TestResultIsIndependentOfWritersAndBatching();
  TestMalformedRecordsAreSkippedAndCounted();
  TestStrictModeFailsOnFirstMalformedRecord();
  TestWriterCapacityFailureStopsTheBuild();
  TestRebuildStartsFromEmptyMappings();

  std::cout << "txcluster_unit_adjacency_builder: pass\n";
  return 0;
}
