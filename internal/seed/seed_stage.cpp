#include "seed_stage.hpp"

#include <deque>
#include <unordered_set>
#include <vector>

#include "internal/observability/logging.hpp"

namespace txcluster::seed {

using db::model::AssignmentRecord;
using db::model::Role;

config::SeedMode ResolveSeedMode(config::SeedMode requested, uint64_t entity_count, uint64_t max_entities) {
  if (requested != config::SeedMode::kAuto) return requested;
  return entity_count <= max_entities ? config::SeedMode::kComponents : config::SeedMode::kUnique;
}

namespace {

// Buffers seed rows and writes them in batch_size chunks.
class RowBuffer {
 public:
  RowBuffer(assignment::SnapshotWriter& writer, uint32_t batch_size) : writer_(writer), batch_size_(batch_size) {
  }

  void Add(const std::string& entity_id, const std::string& cluster_id) {
    rows_.push_back(AssignmentRecord{entity_id, cluster_id, Role::kPrimary, 0});
    if (rows_.size() >= batch_size_) Flush();
  }

  void Flush() {
    if (rows_.empty()) return;
    writer_.Write(rows_, rows_.size(), 0);
    rows_.clear();
  }

 private:
  assignment::SnapshotWriter&   writer_;
  std::size_t                   batch_size_;
  std::vector<AssignmentRecord> rows_;
};

} // namespace

SeedStage::SeedStage(const adjacency::AdjacencyReader& reader, assignment::AssignmentStore& store, SeedOptions options)
    : reader_(reader), store_(store), options_(options) {
  if (options_.batch_size == 0) options_.batch_size = 1;
}

SeedResult SeedStage::Run() {
  SeedResult result;

  uint64_t entities = reader_.Count(util::Side::kCardholder) + reader_.Count(util::Side::kMerchant);
  result.mode       = ResolveSeedMode(options_.mode, entities, options_.components_max_entities);

  auto writer = store_.BeginSnapshot(0);
  result.clusters = result.mode == config::SeedMode::kComponents ? SeedComponents(*writer) : SeedUnique(*writer);
  result.record   = writer->Commit(false);

  TXCLUSTER_LOG_INFO("seed snapshot committed", {observability::StringField("mode", config::SeedModeName(result.mode)),
                                                 observability::IntField("entities", static_cast<int64_t>(result.record.entity_count)),
                                                 observability::IntField("clusters", static_cast<int64_t>(result.clusters))});
  return result;
}

uint64_t SeedStage::SeedComponents(assignment::SnapshotWriter& writer) {
  RowBuffer                       rows(writer, options_.batch_size);
  std::unordered_set<std::string> visited;
  uint64_t                        clusters = 0;

  // "C:" ids sort before "M:" ids, so this is the global ascending order
  for (auto side : {util::Side::kCardholder, util::Side::kMerchant}) {
    reader_.ForEachPage(side, options_.batch_size, [&](const adjacency::AdjacencyPage& page) {
      for (const auto& start : page.records) {
        if (visited.contains(start.entity_id)) continue;

        const std::string& cluster_id = start.entity_id;
        ++clusters;
        visited.insert(cluster_id);
        rows.Add(cluster_id, cluster_id);

        std::deque<std::string> frontier{cluster_id};
        while (!frontier.empty()) {
          // pop one batch; ids of a single side per lookup
          std::vector<std::string> cardholders;
          std::vector<std::string> merchants;
          while (!frontier.empty() && cardholders.size() + merchants.size() < options_.batch_size) {
            auto& id = frontier.front();
            (util::SideOf(id) == util::Side::kCardholder ? cardholders : merchants).push_back(std::move(id));
            frontier.pop_front();
          }

          for (auto [ids, side_of_ids] : {std::pair{&cardholders, util::Side::kCardholder}, std::pair{&merchants, util::Side::kMerchant}}) {
            if (ids->empty()) continue;
            for (const auto& record : reader_.Lookup(side_of_ids, *ids)) {
              for (const auto& neighbor : record.neighbors) {
                if (!visited.insert(neighbor.id).second) continue;
                rows.Add(neighbor.id, cluster_id);
                frontier.push_back(neighbor.id);
              }
            }
          }
        }
      }
    });
  }

  rows.Flush();
  return clusters;
}

uint64_t SeedStage::SeedUnique(assignment::SnapshotWriter& writer) {
  RowBuffer rows(writer, options_.batch_size);
  uint64_t  clusters = 0;

  for (auto side : {util::Side::kCardholder, util::Side::kMerchant}) {
    reader_.ForEachPage(side, options_.batch_size, [&](const adjacency::AdjacencyPage& page) {
      for (const auto& record : page.records) {
        rows.Add(record.entity_id, record.entity_id);
        ++clusters;
      }
    });
  }

  rows.Flush();
  return clusters;
}

} // namespace txcluster::seed
