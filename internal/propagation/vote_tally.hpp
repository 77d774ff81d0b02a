#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "internal/assignment/assignment_store.hpp"
#include "internal/db/model/adjacency_record.hpp"

namespace txcluster::propagation {

struct Vote {
  std::string cluster_id;
  uint64_t    weight = 0;
};

/*
  Per-entity accumulator: cluster id -> summed vote weight.
  Lives for one entity of one iteration.
*/
class VoteTally {
 public:
  void Add(const std::string& cluster_id, uint64_t weight);

  bool Empty() const {
    return weights_.empty();
  }

  std::size_t ClusterCount() const {
    return weights_.size();
  }

  uint64_t Total() const {
    return total_;
  }

  uint64_t WeightOf(const std::string& cluster_id) const;

  // Highest weight; ties go to the lowest cluster id. std::nullopt if empty.
  std::optional<Vote> Winner() const;

  // ascending cluster id
  const std::map<std::string, uint64_t>& Weights() const {
    return weights_;
  }

 private:
  std::map<std::string, uint64_t> weights_;
  uint64_t                        total_ = 0;
};

// One vote per neighbor, for the neighbor's primary, weighted by the edge.
// Throws util::InvalidState if a neighbor has no primary.
VoteTally TallyNeighbors(const db::model::AdjacencyRecord& entity, const assignment::PrimaryMap& neighbor_primaries);

} // namespace txcluster::propagation
