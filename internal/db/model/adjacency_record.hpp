#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace txcluster::db::model {

// One accumulated half-edge: entity -> neighbor. Keys are namespaced ids.
struct EdgeRecord {
  std::string entity_id;
  std::string neighbor_id;
  uint64_t    weight = 0;
};

struct Neighbor {
  std::string id;
  uint64_t    weight = 0;
};

/*
  Frozen adjacency of one entity.

  Neighbors are ordered by id; weights are the sum of every record
  between the pair.
*/
struct AdjacencyRecord {
  std::string           entity_id;
  std::vector<Neighbor> neighbors;
};

} // namespace txcluster::db::model
