#pragma once

#include <cstdint>

#include "internal/adjacency/adjacency_reader.hpp"
#include "internal/assignment/assignment_store.hpp"
#include "internal/runtime/worker_pool.hpp"

namespace txcluster::resolver {

struct ResolverOptions {
  double   duplication_threshold = 0.3;
  uint32_t batch_size            = 10000;
};

struct ResolveResult {
  db::model::SnapshotRecord record;
  uint64_t                  bridge_entities   = 0;
  uint64_t                  duplicate_entries = 0;
};

/*
  One-shot bridge detection and duplication on the final snapshot F.

  For every entity the tally over its neighbors' primaries in F is rebuilt
  (no self vote). With primary P and total T, every other cluster Q with
  V_Q / T >= threshold becomes a duplicate row (e, Q, V_Q); the primary
  row's weight becomes V_P. Entities voted for by more than one cluster
  are bridges. The result is committed as snapshot F+1, marked resolved.
*/
class DuplicationResolver {
 public:
  DuplicationResolver(const adjacency::AdjacencyReader& reader, assignment::AssignmentStore& store, runtime::WorkerPool& pool,
                      ResolverOptions options);

  ResolveResult Resolve(uint32_t final_iteration);

 private:
  const adjacency::AdjacencyReader& reader_;
  assignment::AssignmentStore&      store_;
  runtime::WorkerPool&              pool_;
  ResolverOptions                   options_;
};

} // namespace txcluster::resolver
