#include "adjacency_reader.hpp"

namespace txcluster::adjacency {

AdjacencyReader::AdjacencyReader(std::shared_ptr<db::Repository> repo, util::RetryPolicy retry)
    : repo_(std::move(repo)), retry_(retry) {
}

AdjacencyPage AdjacencyReader::ReadPage(util::Side side, const std::string& after, uint64_t limit) const {
  AdjacencyPage page;
  page.records = util::InTransaction(*repo_, retry_, "read adjacency page",
                                     [&](db::Transaction& tx) { return repo_->ReadAdjacency(tx, side, after, limit); });
  if (!page.records.empty()) page.last_id = page.records.back().entity_id;
  return page;
}

std::vector<db::model::AdjacencyRecord> AdjacencyReader::Lookup(util::Side side, const std::vector<std::string>& entity_ids) const {
  if (entity_ids.empty()) return {};
  return util::InTransaction(*repo_, retry_, "lookup adjacency",
                             [&](db::Transaction& tx) { return repo_->GetAdjacency(tx, side, entity_ids); });
}

uint64_t AdjacencyReader::Count(util::Side side) const {
  return util::InTransaction(*repo_, retry_, "count entities", [&](db::Transaction& tx) { return repo_->CountEntities(tx, side); });
}

} // namespace txcluster::adjacency
