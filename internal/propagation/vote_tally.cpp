#include "vote_tally.hpp"

#include "internal/util/errors.hpp"

namespace txcluster::propagation {

void VoteTally::Add(const std::string& cluster_id, uint64_t weight) {
  if (weight == 0) return;
  weights_[cluster_id] += weight;
  total_ += weight;
}

uint64_t VoteTally::WeightOf(const std::string& cluster_id) const {
  auto it = weights_.find(cluster_id);
  return it == weights_.end() ? 0 : it->second;
}

std::optional<Vote> VoteTally::Winner() const {
  std::optional<Vote> best;
  for (const auto& [cluster, weight] : weights_) {
    if (!best || weight > best->weight) best = Vote{cluster, weight};
  }
  return best;
}

VoteTally TallyNeighbors(const db::model::AdjacencyRecord& entity, const assignment::PrimaryMap& neighbor_primaries) {
  VoteTally tally;
  for (const auto& neighbor : entity.neighbors) {
    auto it = neighbor_primaries.find(neighbor.id);
    if (it == neighbor_primaries.end()) {
      throw util::InvalidState("neighbor " + neighbor.id + " of " + entity.entity_id + " has no primary cluster");
    }
    tally.Add(it->second, neighbor.weight);
  }
  return tally;
}

} // namespace txcluster::propagation
