#include "output_collector.hpp"

#include <algorithm>
#include <iterator>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace txcluster::output {

using db::model::Role;

namespace {

struct Membership {
  std::string              primary;
  std::vector<std::string> clusters; // sorted, primary included
};

std::map<std::string, Membership> Memberships(const assignment::SnapshotHandle& snapshot, const std::vector<std::string>& ids) {
  std::map<std::string, Membership> out;
  for (const auto& row : snapshot.Get(ids)) {
    auto& m = out[row.entity_id];
    if (row.role == Role::kPrimary) m.primary = row.cluster_id;
    m.clusters.push_back(row.cluster_id);
  }
  for (auto& [id, m] : out) {
    if (m.primary.empty()) throw util::InvalidState("entity " + id + " has no primary cluster");
    std::sort(m.clusters.begin(), m.clusters.end());
  }
  return out;
}

const Membership& Require(const std::map<std::string, Membership>& memberships, const std::string& id) {
  auto it = memberships.find(id);
  if (it == memberships.end()) throw util::InvalidState("entity " + id + " missing from resolved snapshot");
  return it->second;
}

} // namespace

double Chattiness(uint64_t internal_weight, uint64_t external_weight) {
  const uint64_t total = internal_weight + external_weight;
  return total == 0 ? 0.0 : static_cast<double>(external_weight) / static_cast<double>(total);
}

OutputCollector::OutputCollector(const adjacency::AdjacencyReader& reader, uint32_t batch_size)
    : reader_(reader), batch_size_(batch_size == 0 ? 1 : batch_size) {
}

void OutputCollector::Collect(const assignment::SnapshotHandle& snapshot, AssignmentSink* sink, txcluster::v1::RunReport* report) const {
  std::map<std::string, ClusterTotals> clusters;

  // ---------------- mapping + member counts ----------------
  std::string after;
  for (;;) {
    auto page = snapshot.ReadPage(after, batch_size_);
    if (page.empty()) break;
    after = page.back().entity_id;

    for (const auto& entity : page) {
      for (const auto& row : entity.rows) {
        auto& totals = clusters[row.cluster_id];
        if (row.role == Role::kPrimary) {
          ++totals.primary_members;
        } else {
          ++totals.duplicate_members;
        }
      }
      if (sink) sink->Write(entity);
    }
    if (page.size() < batch_size_) break;
  }

  // ---------------- edge accounting ----------------
  uint64_t total_weight = 0;
  uint64_t cross_weight = 0;

  reader_.ForEachPage(util::Side::kCardholder, batch_size_, [&](const adjacency::AdjacencyPage& page) {
    std::vector<std::string> cardholders;
    std::vector<std::string> merchants;
    for (const auto& record : page.records) {
      cardholders.push_back(record.entity_id);
      for (const auto& neighbor : record.neighbors) merchants.push_back(neighbor.id);
    }
    auto cardholder_memberships = Memberships(snapshot, cardholders);
    auto merchant_memberships   = Memberships(snapshot, merchants);

    std::vector<std::string> shared;
    for (const auto& record : page.records) {
      const auto& c = Require(cardholder_memberships, record.entity_id);
      for (const auto& neighbor : record.neighbors) {
        const auto& m = Require(merchant_memberships, neighbor.id);
        total_weight += neighbor.weight;

        shared.clear();
        std::set_intersection(c.clusters.begin(), c.clusters.end(), m.clusters.begin(), m.clusters.end(), std::back_inserter(shared));

        if (!shared.empty()) {
          for (const auto& cluster : shared) clusters[cluster].internal_edge_weight += neighbor.weight;
          continue;
        }

        cross_weight += neighbor.weight;
        clusters[c.primary].external_edge_weight += neighbor.weight;
        clusters[m.primary].external_edge_weight += neighbor.weight;
      }
    }
  });

  // ---------------- report ----------------
  report->clear_clusters();
  for (const auto& [cluster_id, totals] : clusters) {
    auto* out = report->add_clusters();
    out->set_cluster_id(cluster_id);
    out->set_primary_members(totals.primary_members);
    out->set_duplicate_members(totals.duplicate_members);
    out->set_internal_edge_weight(totals.internal_edge_weight);
    out->set_external_edge_weight(totals.external_edge_weight);
    out->set_chattiness(Chattiness(totals.internal_edge_weight, totals.external_edge_weight));
  }
  report->set_cross_cluster_edge_weight(cross_weight);
  report->set_chattiness(total_weight == 0 ? 0.0 : static_cast<double>(cross_weight) / static_cast<double>(total_weight));

  TXCLUSTER_LOG_INFO("output collected", {observability::IntField("clusters", static_cast<int64_t>(clusters.size())),
                                          observability::IntField("cross_weight", static_cast<int64_t>(cross_weight)),
                                          observability::DoubleField("chattiness", report->chattiness())});
}

} // namespace txcluster::output
