#include "clustering_engine.hpp"

#include <string>
#include <system_error>

#include "internal/adjacency/adjacency_builder.hpp"
#include "internal/adjacency/adjacency_reader.hpp"
#include "internal/assignment/assignment_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/output/assignment_writer.hpp"
#include "internal/output/output_collector.hpp"
#include "internal/propagation/label_propagation.hpp"
#include "internal/resolver/duplication_resolver.hpp"
#include "internal/runtime/worker_pool.hpp"
#include "internal/seed/seed_stage.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/retry.hpp"
#include "internal/util/time.hpp"

namespace txcluster::core {

using db::model::RunStateRecord;
using txcluster::v1::RunReport;

namespace {

void FillIngest(const RunStateRecord& state, RunReport* report) {
  auto* ingest = report->mutable_ingest();
  ingest->set_records_read(state.records_read);
  ingest->set_malformed_records(state.malformed_records);
  ingest->set_distinct_cardholders(state.distinct_cardholders);
  ingest->set_distinct_merchants(state.distinct_merchants);
  ingest->set_total_edge_weight(state.total_edge_weight);
}

} // namespace

ClusteringEngine::ClusteringEngine(std::shared_ptr<db::Repository> repository, config::EngineOptions options)
    : repository_(std::move(repository)), options_(std::move(options)) {
}

RunReport ClusteringEngine::Run(ingest::RecordSource* source, const std::filesystem::path& output_dir) {
  const auto&    o        = options_;
  util::Deadline deadline = o.deadline ? util::Deadline(*o.deadline) : util::Deadline();

  RunReport report;

  std::error_code ec;
  std::filesystem::create_directories(output_dir, ec);
  if (ec) {
    throw util::StorageIOError("cannot create output directory " + output_dir.string() + ": " + ec.message(), false);
  }

  assignment::AssignmentStore store(repository_, o.retry, o.retain_snapshots);
  adjacency::AdjacencyReader  reader(repository_, o.retry);

  // ------------------------------------------------------------------
  // Adjacency
  // ------------------------------------------------------------------
  std::optional<RunStateRecord> state;
  if (o.resume) {
    state = util::InTransaction(*repository_, o.retry, "read run state", [&](db::Transaction& tx) { return repository_->GetRunState(tx); });
    if (state && !state->adjacency_complete) state.reset();
  } else {
    // a fresh run must not see snapshots of an earlier one
    for (const auto& record : store.ListCommitted()) store.Discard(record.iteration);
  }

  if (state) {
    TXCLUSTER_LOG_INFO("reusing persisted adjacency", {observability::IntField("records", static_cast<int64_t>(state->records_read))});
  } else {
    if (!source) {
      throw util::InvalidState("no input records and no completed adjacency to resume from");
    }
    adjacency::BuildOptions build;
    build.batch_size     = o.batch_size;
    build.writer_threads = o.writer_threads;
    build.strict         = o.strict;
    build.retry          = o.retry;

    state = adjacency::AdjacencyBuilder(repository_, build).Build(*source);
  }
  FillIngest(*state, &report);
  if (state->malformed_records > 0) report.add_warnings(txcluster::v1::RUN_WARNING_MALFORMED_RECORDS);

  // ------------------------------------------------------------------
  // Seed (or pick up where an earlier run stopped)
  // ------------------------------------------------------------------
  std::optional<db::model::SnapshotRecord> start;
  if (o.resume) {
    for (const auto& record : store.ListCommitted()) {
      if (record.resolved) store.Discard(record.iteration);
    }
    start = store.LatestUnresolved();
  }

  std::string seed_mode;
  if (start) {
    seed_mode = state->seed_mode;
    if (seed_mode.empty()) {
      // state written before seeding finished; report the configured choice
      const uint64_t entities = state->distinct_cardholders + state->distinct_merchants;
      seed_mode               = config::SeedModeName(seed::ResolveSeedMode(o.seed_mode, entities, o.components_max_entities));
    }
    TXCLUSTER_LOG_INFO("resuming propagation", {observability::IntField("from_iteration", start->iteration),
                                                observability::StringField("seed_mode", seed_mode)});
  } else {
    seed::SeedOptions seed_options;
    seed_options.mode                    = o.seed_mode;
    seed_options.components_max_entities = o.components_max_entities;
    seed_options.batch_size              = o.batch_size;

    auto seeded = seed::SeedStage(reader, store, seed_options).Run();
    seed_mode   = config::SeedModeName(seeded.mode);
    start       = seeded.record;

    state->seed_mode     = seed_mode;
    state->updated_at_ms = util::NowMs();
    util::InTransaction(*repository_, o.retry, "persist seed mode",
                        [&](db::Transaction& tx) { util::ThrowIfError(repository_->UpsertRunState(tx, *state), "persist seed mode"); });
  }

  // ------------------------------------------------------------------
  // Propagation
  // ------------------------------------------------------------------
  runtime::WorkerPool pool(o.propagation_threads);

  propagation::PropagationOptions prop_options;
  prop_options.max_iterations        = o.max_iterations;
  prop_options.convergence_tolerance = o.convergence_tolerance;
  prop_options.self_vote_weight      = o.self_vote_weight;
  prop_options.batch_size            = o.batch_size;

  propagation::LabelPropagation propagation(reader, store, pool, prop_options);
  if (on_iteration_committed_) propagation.OnIterationCommitted(on_iteration_committed_);
  auto propagated = propagation.Run(start->iteration, deadline);

  auto* summary = report.mutable_propagation();
  summary->set_seed_mode(seed_mode);
  summary->set_iterations(propagated.iterations_run);
  summary->set_final_iteration(propagated.final_iteration);
  summary->set_final_churn(propagated.final_churn);
  summary->set_converged(propagated.converged);
  if (!propagated.converged) report.add_warnings(txcluster::v1::RUN_WARNING_NON_CONVERGENCE);
  if (propagated.deadline_exceeded) report.add_warnings(txcluster::v1::RUN_WARNING_DEADLINE_EXCEEDED);

  // ------------------------------------------------------------------
  // Resolve
  // ------------------------------------------------------------------
  resolver::ResolverOptions resolver_options;
  resolver_options.duplication_threshold = o.duplication_threshold;
  resolver_options.batch_size            = o.batch_size;

  auto resolved = resolver::DuplicationResolver(reader, store, pool, resolver_options).Resolve(propagated.final_iteration);
  report.set_bridge_entities(resolved.bridge_entities);
  report.set_duplicate_entries(resolved.duplicate_entries);

  // ------------------------------------------------------------------
  // Output
  // ------------------------------------------------------------------
  auto snapshot = store.Open(resolved.record.iteration);

  output::CsvAssignmentWriter csv(output_dir / "assignments.csv");
  output::OutputCollector(reader, o.batch_size).Collect(snapshot, &csv, &report);
  csv.Close();
  output::WriteReportJson(report, output_dir / "report.json");

  TXCLUSTER_LOG_INFO("run complete", {observability::StringField("output", output_dir.string()),
                                      observability::IntField("rows", static_cast<int64_t>(csv.RowsWritten())),
                                      observability::BoolField("converged", propagated.converged),
                                      observability::DoubleField("chattiness", report.chattiness())});
  return report;
}

} // namespace txcluster::core
