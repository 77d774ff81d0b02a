#pragma once

#include <cstdint>
#include <functional>

#include "internal/adjacency/adjacency_reader.hpp"
#include "internal/assignment/assignment_store.hpp"
#include "internal/runtime/worker_pool.hpp"
#include "internal/util/time.hpp"

namespace txcluster::propagation {

struct PropagationOptions {
  uint32_t max_iterations        = 10;
  double   convergence_tolerance = 0.01;
  uint64_t self_vote_weight      = 0;
  uint32_t batch_size            = 10000;
};

struct PropagationResult {
  uint32_t start_iteration   = 0;
  uint32_t final_iteration   = 0;
  uint32_t iterations_run    = 0;
  double   final_churn       = 1.0;
  bool     converged         = false;
  bool     deadline_exceeded = false;
};

/*
  Weighted-vote label propagation over the frozen adjacency.

  Iteration k (snapshot k from snapshot k-1) runs two half-steps separated
  by a barrier:

    1. every cardholder votes over its merchants' primaries in k-1
    2. every merchant votes over its cardholders' primaries in k

  New primary = heaviest cluster, ties to the lowest id; an empty tally
  keeps the previous primary. Duplicates are carried over unchanged.
  Shards of batch_size entities run in parallel on the pool; the result
  does not depend on the number of workers.

  Stops when churn <= convergence_tolerance, when max_iterations
  (absolute) is reached, or when the deadline expires before an
  iteration starts.
*/
class LabelPropagation {
 public:
  LabelPropagation(const adjacency::AdjacencyReader& reader, assignment::AssignmentStore& store, runtime::WorkerPool& pool,
                   PropagationOptions options);

  // Continues from committed snapshot `start_iteration`.
  PropagationResult Run(uint32_t start_iteration, const util::Deadline& deadline);

  // Called after each committed iteration (tests use it to interrupt a run).
  void OnIterationCommitted(std::function<void(const db::model::SnapshotRecord&)> callback) {
    on_committed_ = std::move(callback);
  }

 private:
  db::model::SnapshotRecord RunIteration(uint32_t iteration);

  void RunHalfStep(util::Side side, const assignment::SnapshotHandle& previous, assignment::SnapshotWriter& writer);

  const adjacency::AdjacencyReader&                      reader_;
  assignment::AssignmentStore&                           store_;
  runtime::WorkerPool&                                   pool_;
  PropagationOptions                                     options_;
  std::function<void(const db::model::SnapshotRecord&)> on_committed_;
};

} // namespace txcluster::propagation
