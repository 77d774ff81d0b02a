#pragma once

#include <cstdint>
#include <memory>

#include "internal/adjacency/adjacency_reader.hpp"
#include "internal/assignment/assignment_store.hpp"
#include "internal/config/options.hpp"

namespace txcluster::seed {

struct SeedOptions {
  config::SeedMode  mode                    = config::SeedMode::kAuto;
  uint64_t          components_max_entities = 1000000;
  uint32_t          batch_size              = 10000;
};

struct SeedResult {
  config::SeedMode          mode = config::SeedMode::kUnique;
  uint64_t                  clusters = 0;
  db::model::SnapshotRecord record;
};

// kAuto -> kComponents when entity_count <= max_entities, else kUnique.
config::SeedMode ResolveSeedMode(config::SeedMode requested, uint64_t entity_count, uint64_t max_entities);

/*
  Writes the iteration-0 snapshot: one primary row (weight 0) per entity.

  Components mode walks entities in ascending id order and grows each
  unassigned one into its connected component with a FIFO frontier,
  fetching neighbors from the external adjacency one batch at a time.
  The cluster id is the start entity, the smallest id of its component.
  The visited set is held in memory, which is what bounds this mode to
  components_max_entities under kAuto.

  Unique mode gives every entity its own cluster in one paged pass.
*/
class SeedStage {
 public:
  SeedStage(const adjacency::AdjacencyReader& reader, assignment::AssignmentStore& store, SeedOptions options);

  SeedResult Run();

 private:
  uint64_t SeedComponents(assignment::SnapshotWriter& writer);
  uint64_t SeedUnique(assignment::SnapshotWriter& writer);

  const adjacency::AdjacencyReader& reader_;
  assignment::AssignmentStore&      store_;
  SeedOptions                       options_;
};

} // namespace txcluster::seed
