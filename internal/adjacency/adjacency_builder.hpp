#pragma once

#include <cstdint>
#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/run_state_record.hpp"
#include "internal/ingest/record_source.hpp"
#include "internal/util/retry.hpp"

namespace txcluster::adjacency {

struct BuildOptions {
  uint32_t          batch_size     = 10000;
  uint32_t          writer_threads = 2;
  bool              strict         = false;
  util::RetryPolicy retry;
};

/*
  Streams interaction records into the two external adjacency mappings.

  The calling thread reads the source and routes every half-edge
  (cardholder -> merchant, merchant -> cardholder) to the writer that owns
  its key entity. Writers own disjoint key sets, sum repeated pairs in a
  bounded buffer and flush it with one upsert transaction per batch.

  Malformed records are skipped and counted, or rethrown when strict.
  The first writer failure stops the build and is rethrown from Build().
  On success the returned RunStateRecord is persisted with
  adjacency_complete = true.
*/
class AdjacencyBuilder {
 public:
  AdjacencyBuilder(std::shared_ptr<db::Repository> repo, BuildOptions options);

  db::model::RunStateRecord Build(ingest::RecordSource& source);

 private:
  std::shared_ptr<db::Repository> repo_;
  BuildOptions                    options_;
};

} // namespace txcluster::adjacency
