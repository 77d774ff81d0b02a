#include "internal/output/output_collector.hpp"

#include <cassert>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/output/assignment_writer.hpp"
#include "internal/propagation/label_propagation.hpp"
#include "internal/resolver/duplication_resolver.hpp"
#include "internal/seed/seed_stage.hpp"
#include "tests/support/test_graphs.hpp"

namespace {

using txcluster::config::SeedMode;
using txcluster::db::memory::MemoryRepository;
using txcluster::output::OutputCollector;
using txcluster::v1::ClusterReport;
using txcluster::v1::RunReport;

// Records every entity handed to the sink.
class RecordingSink final : public txcluster::output::AssignmentSink {
 public:
  void Write(const txcluster::assignment::EntityAssignment& entity) override {
    entities.push_back(entity);
  }

  std::vector<txcluster::assignment::EntityAssignment> entities;
};

struct Fixture {
  std::shared_ptr<MemoryRepository>      repo = std::make_shared<MemoryRepository>();
  txcluster::adjacency::AdjacencyReader  reader{repo, txcluster::testing::TestOptions().retry};
  txcluster::assignment::AssignmentStore store{repo, txcluster::testing::TestOptions().retry};
  txcluster::runtime::WorkerPool         pool{2};
  uint32_t                               resolved = 0;

  Fixture(const std::string& records, SeedMode mode, double threshold) {
    txcluster::testing::BuildAdjacency(repo, records);

    txcluster::seed::SeedOptions seed;
    seed.mode       = mode;
    seed.batch_size = 2;
    txcluster::seed::SeedStage(reader, store, seed).Run();

    txcluster::propagation::PropagationOptions propagation;
    propagation.batch_size = 2;
    auto propagated = txcluster::propagation::LabelPropagation(reader, store, pool, propagation).Run(0, txcluster::util::Deadline());

    txcluster::resolver::ResolverOptions options;
    options.duplication_threshold = threshold;
    options.batch_size            = 2;
    resolved = txcluster::resolver::DuplicationResolver(reader, store, pool, options).Resolve(propagated.final_iteration).record.iteration;
  }

  RunReport Collect(txcluster::output::AssignmentSink* sink) {
    RunReport report;
    OutputCollector(reader, 2).Collect(store.Open(resolved), sink, &report);
    return report;
  }
};

const ClusterReport& Cluster(const RunReport& report, const std::string& id) {
  for (const auto& cluster : report.clusters()) {
    if (cluster.cluster_id() == id) return cluster;
  }
  throw std::runtime_error("no cluster " + id);
}

void TestChattinessRatio() {
  assert(txcluster::output::Chattiness(0, 0) == 0.0);
  assert(txcluster::output::Chattiness(9, 1) == 0.1);
  assert(txcluster::output::Chattiness(0, 4) == 1.0);
}

void TestDuplicatedBridgeKeepsEdgesInternal() {
  Fixture       f(txcluster::testing::kScenarioB, SeedMode::kUnique, 0.3);
  RecordingSink sink;
  auto          report = f.Collect(&sink);

  assert(report.cross_cluster_edge_weight() == 0);
  assert(report.chattiness() == 0.0);
  assert(report.clusters_size() == 2);

  const auto& m1 = Cluster(report, "M:M1");
  assert(m1.primary_members() == 3);
  assert(m1.duplicate_members() == 0);
  assert(m1.internal_edge_weight() == 2);
  assert(m1.external_edge_weight() == 0);

  const auto& m3 = Cluster(report, "M:M3");
  assert(m3.primary_members() == 4);
  assert(m3.duplicate_members() == 1);
  assert(m3.internal_edge_weight() == 8);
  assert(m3.chattiness() == 0.0);

  // ascending entity order, every entity once
  assert(sink.entities.size() == 7);
  for (std::size_t i = 1; i < sink.entities.size(); ++i) assert(sink.entities[i - 1].entity_id < sink.entities[i].entity_id);
  assert(sink.entities.front().entity_id == "C:C1");
  assert(sink.entities.back().entity_id == "M:M4");
}

void TestUnduplicatedBridgeIsCrossClusterWeight() {
  Fixture f(txcluster::testing::kScenarioB, SeedMode::kUnique, 0.6);
  auto    report = f.Collect(nullptr);

  assert(report.cross_cluster_edge_weight() == 1);
  assert(std::fabs(report.chattiness() - 0.1) < 1e-12);

  const auto& m1 = Cluster(report, "M:M1");
  assert(m1.internal_edge_weight() == 2);
  assert(m1.external_edge_weight() == 1);
  assert(std::fabs(m1.chattiness() - 1.0 / 3.0) < 1e-12);

  const auto& m3 = Cluster(report, "M:M3");
  assert(m3.internal_edge_weight() == 7);
  assert(m3.external_edge_weight() == 1);
  assert(m3.duplicate_members() == 0);
}

void TestCsvIsWrittenInEntityOrder() {
  Fixture f(txcluster::testing::kScenarioB, SeedMode::kUnique, 0.3);
  auto    dir = txcluster::testing::FreshDir("output_collector_csv");

  txcluster::output::CsvAssignmentWriter csv(dir / "assignments.csv");
  f.Collect(&csv);
  assert(!std::filesystem::exists(dir / "assignments.csv"));
  csv.Close();
  assert(csv.RowsWritten() == 8);
  assert(!std::filesystem::exists(dir / "assignments.csv.tmp"));

  auto rows = txcluster::testing::ReadAssignmentsCsv(dir / "assignments.csv");
  assert(rows.size() == 8);
  assert(rows[0].entity_id == "C:C1" && rows[0].cluster_id == "M:M1" && rows[0].role == "primary" && rows[0].weight == 2);

  // M1: primary row first, then its duplicate
  std::size_t m1 = 0;
  while (rows[m1].entity_id != "M:M1") ++m1;
  assert(rows[m1].role == "primary" && rows[m1].cluster_id == "M:M1");
  assert(rows[m1 + 1].entity_id == "M:M1" && rows[m1 + 1].role == "duplicate" && rows[m1 + 1].cluster_id == "M:M3");
}

void TestAbandonedCsvLeavesNoFile() {
  auto dir = txcluster::testing::FreshDir("output_collector_abandoned");
  {
    txcluster::output::CsvAssignmentWriter csv(dir / "assignments.csv");
    csv.Write(txcluster::assignment::EntityAssignment{"C:C1", {{"C:C1", "C:C1", txcluster::db::model::Role::kPrimary, 0}}});
  }
  assert(!std::filesystem::exists(dir / "assignments.csv"));
  assert(!std::filesystem::exists(dir / "assignments.csv.tmp"));
}

void TestReportJsonUsesFieldNames() {
  auto      dir = txcluster::testing::FreshDir("output_collector_json");
  RunReport report;
  report.set_bridge_entities(2);
  report.add_warnings(txcluster::v1::RUN_WARNING_NON_CONVERGENCE);

  txcluster::output::WriteReportJson(report, dir / "report.json");
  auto json = txcluster::testing::ReadFile(dir / "report.json");
  assert(json.find("\"bridge_entities\"") != std::string::npos);
  assert(json.find("RUN_WARNING_NON_CONVERGENCE") != std::string::npos);
  assert(json.find("\"cross_cluster_edge_weight\"") != std::string::npos);
}

} // namespace

int main() {
  TestChattinessRatio();
  TestDuplicatedBridgeKeepsEdgesInternal();
  TestUnduplicatedBridgeIsCrossClusterWeight();
  TestCsvIsWrittenInEntityOrder();
  TestAbandonedCsvLeavesNoFile();
  TestReportJsonUsesFieldNames();

  std::cout << "txcluster_unit_output_collector: pass\n";
  return 0;
}
