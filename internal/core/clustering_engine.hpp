#pragma once

#include <filesystem>
#include <functional>
#include <memory>

#include "api/txcluster/v1.hpp"
#include "internal/config/options.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/model/snapshot_record.hpp"
#include "internal/ingest/record_source.hpp"

namespace txcluster::core {

/*
  Runs one clustering job end to end:

    ingest -> adjacency -> seed -> propagation -> resolver -> output

  Every stage goes through the repository, so a run over a persistent
  backend can be resumed (clustering.resume): a completed adjacency is
  reused, propagation continues from the newest unresolved snapshot, and
  a leftover resolved snapshot is discarded and resolved again.

  Non-convergence and deadline expiry are warnings in the report, not
  errors; the output is produced from the last committed snapshot.
*/
class ClusteringEngine {
 public:
  ClusteringEngine(std::shared_ptr<db::Repository> repository, config::EngineOptions options);

  // `source` may be null only when resuming over a completed adjacency.
  // Writes assignments.csv and report.json into output_dir.
  txcluster::v1::RunReport Run(ingest::RecordSource* source, const std::filesystem::path& output_dir);

  // Invoked after every committed propagation iteration.
  void OnIterationCommitted(std::function<void(const db::model::SnapshotRecord&)> callback) {
    on_iteration_committed_ = std::move(callback);
  }

  const config::EngineOptions& Options() const {
    return options_;
  }

 private:
  std::shared_ptr<db::Repository>                        repository_;
  config::EngineOptions                                  options_;
  std::function<void(const db::model::SnapshotRecord&)> on_iteration_committed_;
};

} // namespace txcluster::core
