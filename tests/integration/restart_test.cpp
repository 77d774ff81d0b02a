#include <cassert>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/core/clustering_engine.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/ingest/record_source.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "tests/support/test_graphs.hpp"

#if TXCLUSTER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

namespace {

using txcluster::config::EngineOptions;
using txcluster::core::ClusteringEngine;
using txcluster::db::Repository;
using txcluster::db::memory::MemoryRepository;
using txcluster::testing::FreshDir;
using txcluster::testing::ReadFile;

struct Interrupted : std::runtime_error {
  Interrupted() : std::runtime_error("interrupted") {
  }
};

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

EngineOptions Options() {
  auto options      = txcluster::testing::TestOptions();
  options.seed_mode = txcluster::config::SeedMode::kUnique;
  return options;
}

// Runs scenario B and throws out of the engine once `stop_after` is committed.
void RunUntil(std::shared_ptr<Repository> repo, uint32_t stop_after, const std::filesystem::path& dir) {
  std::istringstream                    in(txcluster::testing::kScenarioB);
  txcluster::ingest::StreamRecordSource source(in);

  ClusteringEngine engine(std::move(repo), Options());
  engine.OnIterationCommitted([stop_after](const txcluster::db::model::SnapshotRecord& record) {
    if (record.iteration == stop_after) throw Interrupted();
  });

  bool interrupted = false;
  try {
    engine.Run(&source, dir);
  } catch (const Interrupted&) {
    interrupted = true;
  }
  assert(interrupted);
  assert(!std::filesystem::exists(dir / "assignments.csv"));
}

txcluster::v1::RunReport Resume(std::shared_ptr<Repository> repo, const std::filesystem::path& dir, std::vector<uint32_t>* iterations) {
  // seed_mode only matters for seeding; the report keeps the mode snapshot 0 came from
  auto options      = Options();
  options.resume    = true;
  options.seed_mode = txcluster::config::SeedMode::kComponents;

  ClusteringEngine engine(std::move(repo), options);
  engine.OnIterationCommitted([iterations](const txcluster::db::model::SnapshotRecord& record) { iterations->push_back(record.iteration); });
  return engine.Run(nullptr, dir);
}

void VerifyResumeAfterInterruptedPropagation(BackendFactory& backend, const std::string& expected_csv) {
  auto repo = backend.make_repository();
  RunUntil(repo, 1, FreshDir("restart_interrupted_" + backend.name));

  backend.restart(repo);

  auto                  dir = FreshDir("restart_resumed_" + backend.name);
  std::vector<uint32_t> iterations;
  auto                  report = Resume(repo, dir, &iterations);

  // adjacency came from storage, propagation continued after iteration 1
  assert((iterations == std::vector<uint32_t>{2}));
  assert(report.ingest().records_read() == 6);
  assert(report.propagation().seed_mode() == "unique");
  assert(report.propagation().converged());
  assert(report.propagation().final_iteration() == 2);
  assert(report.bridge_entities() == 2);
  assert(report.duplicate_entries() == 1);
  assert(ReadFile(dir / "assignments.csv") == expected_csv);
}

void VerifyResumeAfterCompletedRun(BackendFactory& backend, const std::string& expected_csv) {
  auto repo = backend.make_repository();
  txcluster::testing::RunEngine(repo, Options(), txcluster::testing::kScenarioB, FreshDir("restart_complete_first_" + backend.name));

  backend.restart(repo);

  // the resolved snapshot is rebuilt from the converged one
  auto                  dir = FreshDir("restart_complete_again_" + backend.name);
  std::vector<uint32_t> iterations;
  auto                  report = Resume(repo, dir, &iterations);

  assert(iterations.empty());
  assert(report.propagation().seed_mode() == "unique");
  assert(report.propagation().converged());
  assert(report.duplicate_entries() == 1);
  assert(ReadFile(dir / "assignments.csv") == expected_csv);
}

void VerifyResumeWithoutAdjacencyNeedsInput(BackendFactory& backend) {
  auto repo = backend.make_repository();

  bool threw = false;
  try {
    std::vector<uint32_t> iterations;
    Resume(repo, FreshDir("restart_nothing_" + backend.name), &iterations);
  } catch (const txcluster::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

BackendFactory MakeMemoryFactory() {
  // the same repository object survives the "restart"
  return BackendFactory{
      .name            = "memory",
      .make_repository = []() { return std::make_shared<MemoryRepository>(); },
      .restart         = [](std::shared_ptr<Repository>&) {},
      .cleanup         = []() {},
  };
}

#if TXCLUSTER_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("txcluster_restart_sqlite_" + std::to_string(txcluster::util::NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<txcluster::db::sqlite::SqliteDB>(db_path);
    txcluster::db::sqlite::BootstrapSchema(*db);
    return std::make_shared<txcluster::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name            = "sqlite",
      .make_repository = make_repo,
      .restart         = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
  };
}
#endif

} // namespace

int main() {
  auto reference_dir = FreshDir("restart_reference");
  txcluster::testing::RunEngine(std::make_shared<MemoryRepository>(), Options(), txcluster::testing::kScenarioB, reference_dir);
  const auto expected_csv = ReadFile(reference_dir / "assignments.csv");

  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if TXCLUSTER_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

  for (auto& backend : backends) {
    std::cout << "running restart suite: " << backend.name << "\n";

    backend.cleanup();
    VerifyResumeAfterInterruptedPropagation(backend, expected_csv);
    backend.cleanup();
    VerifyResumeAfterCompletedRun(backend, expected_csv);
    backend.cleanup();
    VerifyResumeWithoutAdjacencyNeedsInput(backend);
    backend.cleanup();
  }

  std::cout << "txcluster_integration_restart: pass\n";
  return 0;
}
