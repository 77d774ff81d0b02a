#include "duplication_resolver.hpp"

#include <atomic>
#include <memory>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/propagation/vote_tally.hpp"
#include "internal/util/errors.hpp"

namespace txcluster::resolver {

using db::model::AdjacencyRecord;
using db::model::AssignmentRecord;
using db::model::Role;

DuplicationResolver::DuplicationResolver(const adjacency::AdjacencyReader& reader, assignment::AssignmentStore& store,
                                         runtime::WorkerPool& pool, ResolverOptions options)
    : reader_(reader), store_(store), pool_(pool), options_(options) {
  if (options_.batch_size == 0) options_.batch_size = 1;
}

ResolveResult DuplicationResolver::Resolve(uint32_t final_iteration) {
  auto final_snapshot = store_.Open(final_iteration);
  auto writer         = store_.BeginSnapshot(final_iteration + 1);

  std::atomic<uint64_t> bridges{0};
  std::atomic<uint64_t> duplicates{0};
  const double          threshold = options_.duplication_threshold;

  auto submit_shards = [&](const adjacency::AdjacencyPage& page) {
    auto shard = std::make_shared<std::vector<AdjacencyRecord>>(page.records);

    pool_.Submit([&, shard] {
      std::vector<std::string> neighbor_ids;
      std::vector<std::string> entity_ids;
      for (const auto& record : *shard) {
        entity_ids.push_back(record.entity_id);
        for (const auto& neighbor : record.neighbors) neighbor_ids.push_back(neighbor.id);
      }

      auto neighbor_primaries = final_snapshot.Primaries(neighbor_ids);
      auto own                = final_snapshot.Primaries(entity_ids);

      std::vector<AssignmentRecord> rows;

      for (const auto& entity : *shard) {
        auto primary = own.find(entity.entity_id);
        if (primary == own.end()) {
          throw util::InvalidState("entity " + entity.entity_id + " missing from snapshot " + std::to_string(final_iteration));
        }
        const std::string& p = primary->second;

        auto tally = propagation::TallyNeighbors(entity, neighbor_primaries);
        if (tally.ClusterCount() > 1) ++bridges;

        rows.push_back(AssignmentRecord{entity.entity_id, p, Role::kPrimary, tally.WeightOf(p)});

        const auto total = static_cast<double>(tally.Total());
        for (const auto& [cluster, weight] : tally.Weights()) {
          if (cluster == p) continue;
          if (static_cast<double>(weight) / total >= threshold) {
            rows.push_back(AssignmentRecord{entity.entity_id, cluster, Role::kDuplicate, weight});
            ++duplicates;
          }
        }
      }

      // duplicates are not membership changes
      writer->Write(rows, shard->size(), 0);
    });
  };

  for (auto side : {util::Side::kCardholder, util::Side::kMerchant}) {
    try {
      reader_.ForEachPage(side, options_.batch_size, submit_shards);
    } catch (const std::exception&) {
      try {
        pool_.WaitIdle();
      } catch (const std::exception& e) {
        TXCLUSTER_LOG_WARN("shard failed while aborting resolution", {observability::StringField("error", e.what())});
      }
      throw;
    }
  }
  pool_.WaitIdle();

  writer->Seal(util::Side::kCardholder);
  writer->Seal(util::Side::kMerchant);

  ResolveResult result;
  result.record            = writer->Commit(true);
  result.bridge_entities   = bridges.load();
  result.duplicate_entries = duplicates.load();

  TXCLUSTER_LOG_INFO("duplication resolved", {observability::IntField("snapshot", result.record.iteration),
                                              observability::IntField("bridges", static_cast<int64_t>(result.bridge_entities)),
                                              observability::IntField("duplicates", static_cast<int64_t>(result.duplicate_entries))});
  return result;
}

} // namespace txcluster::resolver
