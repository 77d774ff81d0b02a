#pragma once

#include <cstdint>
#include <map>
#include <string>

#include "api/txcluster/v1.hpp"
#include "internal/adjacency/adjacency_reader.hpp"
#include "internal/assignment/assignment_store.hpp"
#include "internal/output/assignment_writer.hpp"

namespace txcluster::output {

struct ClusterTotals {
  uint64_t primary_members      = 0;
  uint64_t duplicate_members    = 0;
  uint64_t internal_edge_weight = 0;
  uint64_t external_edge_weight = 0;
};

// external / (internal + external); 0 for a cluster with no edges
double Chattiness(uint64_t internal_weight, uint64_t external_weight);

/*
  Read-only pass over the resolved snapshot.

  Streams the mapping to the sink and accounts every edge once, from the
  cardholder side: an edge whose endpoints share clusters counts as
  internal weight of each shared cluster; any other edge is cross-cluster
  and counts as external weight of both endpoints' primary clusters.
  Membership is the primary plus every duplicate.

  Fills clusters, cross_cluster_edge_weight and chattiness of the report.
*/
class OutputCollector {
 public:
  OutputCollector(const adjacency::AdjacencyReader& reader, uint32_t batch_size);

  void Collect(const assignment::SnapshotHandle& snapshot, AssignmentSink* sink, txcluster::v1::RunReport* report) const;

 private:
  const adjacency::AdjacencyReader& reader_;
  uint32_t                          batch_size_;
};

} // namespace txcluster::output
