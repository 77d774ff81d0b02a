#include "label_propagation.hpp"

#include <memory>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/propagation/vote_tally.hpp"
#include "internal/util/errors.hpp"

namespace txcluster::propagation {

using db::model::AdjacencyRecord;
using db::model::AssignmentRecord;
using db::model::Role;
using db::model::SnapshotRecord;

namespace {

std::vector<std::string> NeighborIds(const std::vector<AdjacencyRecord>& shard) {
  std::vector<std::string> ids;
  for (const auto& record : shard) {
    for (const auto& neighbor : record.neighbors) ids.push_back(neighbor.id);
  }
  return ids;
}

std::vector<std::string> EntityIds(const std::vector<AdjacencyRecord>& shard) {
  std::vector<std::string> ids;
  ids.reserve(shard.size());
  for (const auto& record : shard) ids.push_back(record.entity_id);
  return ids;
}

} // namespace

LabelPropagation::LabelPropagation(const adjacency::AdjacencyReader& reader, assignment::AssignmentStore& store,
                                   runtime::WorkerPool& pool, PropagationOptions options)
    : reader_(reader), store_(store), pool_(pool), options_(options) {
  if (options_.batch_size == 0) options_.batch_size = 1;
}

PropagationResult LabelPropagation::Run(uint32_t start_iteration, const util::Deadline& deadline) {
  PropagationResult result;
  result.start_iteration = start_iteration;
  result.final_iteration = start_iteration;

  // resuming from a snapshot that already met the tolerance
  if (start_iteration > 0) {
    auto start = store_.Open(start_iteration).Record();
    result.final_churn = start.churn;
    if (start.churn <= options_.convergence_tolerance) {
      result.converged = true;
      return result;
    }
  }

  auto deadline_expired = [&] {
    if (!deadline.Expired()) return false;
    result.deadline_exceeded = true;
    TXCLUSTER_LOG_WARN("deadline expired, stopping propagation", {observability::IntField("last_iteration", result.final_iteration)});
    return true;
  };

  for (uint32_t k = start_iteration + 1; k <= options_.max_iterations; ++k) {
    if (deadline_expired()) break;

    auto record = RunIteration(k);
    ++result.iterations_run;
    result.final_iteration = k;
    result.final_churn     = record.churn;

    TXCLUSTER_LOG_INFO("iteration committed", {observability::IntField("iteration", k),
                                               observability::IntField("changed", static_cast<int64_t>(record.changed_count)),
                                               observability::DoubleField("churn", record.churn)});

    store_.CollectGarbage();
    if (on_committed_) on_committed_(record);

    // expiry during the iteration leaves the run non-converged
    if (deadline_expired()) break;

    if (record.churn <= options_.convergence_tolerance) {
      result.converged = true;
      break;
    }
  }

  if (!result.converged) {
    TXCLUSTER_LOG_WARN("propagation did not converge", {observability::IntField("final_iteration", result.final_iteration),
                                                        observability::DoubleField("final_churn", result.final_churn),
                                                        observability::BoolField("deadline_exceeded", result.deadline_exceeded)});
  }
  return result;
}

SnapshotRecord LabelPropagation::RunIteration(uint32_t iteration) {
  auto previous = store_.Open(iteration - 1);
  auto writer   = store_.BeginSnapshot(iteration);

  RunHalfStep(util::Side::kCardholder, previous, *writer);
  writer->Seal(util::Side::kCardholder);

  RunHalfStep(util::Side::kMerchant, previous, *writer);
  writer->Seal(util::Side::kMerchant);

  return writer->Commit(false);
}

void LabelPropagation::RunHalfStep(util::Side side, const assignment::SnapshotHandle& previous, assignment::SnapshotWriter& writer) {
  const uint64_t self_vote = options_.self_vote_weight;

  auto submit_shards = [&](const adjacency::AdjacencyPage& page) {
    auto shard = std::make_shared<std::vector<AdjacencyRecord>>(page.records);

    pool_.Submit([&previous, &writer, shard, side, self_vote] {
      // cardholders read merchants from k-1, merchants read the sealed
      // cardholder side of k
      auto neighbor_ids       = NeighborIds(*shard);
      auto neighbor_primaries = side == util::Side::kCardholder ? previous.Primaries(neighbor_ids)
                                                                : writer.SealedPrimaries(util::Side::kCardholder, neighbor_ids);
      auto own = assignment::GroupByEntity(previous.Get(EntityIds(*shard)));

      std::vector<AssignmentRecord> rows;
      uint64_t                      changed = 0;
      std::size_t                   cursor  = 0;

      for (const auto& entity : *shard) {
        while (cursor < own.size() && own[cursor].entity_id < entity.entity_id) ++cursor;
        if (cursor == own.size() || own[cursor].entity_id != entity.entity_id) {
          throw util::InvalidState("entity " + entity.entity_id + " missing from snapshot " + std::to_string(previous.Iteration()));
        }
        const auto& prev = own[cursor];

        auto tally = TallyNeighbors(entity, neighbor_primaries);
        if (self_vote > 0) tally.Add(prev.Primary().cluster_id, self_vote);

        Vote primary{prev.Primary().cluster_id, prev.Primary().weight};
        if (auto winner = tally.Winner()) primary = *winner;
        if (primary.cluster_id != prev.Primary().cluster_id) ++changed;

        rows.push_back(AssignmentRecord{entity.entity_id, primary.cluster_id, Role::kPrimary, primary.weight});
        for (std::size_t i = 1; i < prev.rows.size(); ++i) {
          if (prev.rows[i].cluster_id != primary.cluster_id) rows.push_back(prev.rows[i]);
        }
      }

      writer.Write(rows, shard->size(), changed);
    });
  };

  try {
    reader_.ForEachPage(side, options_.batch_size, submit_shards);
  } catch (const std::exception&) {
    // shards already queued reference previous and writer; let them drain
    try {
      pool_.WaitIdle();
    } catch (const std::exception& e) {
      TXCLUSTER_LOG_WARN("shard failed while aborting half-step", {observability::StringField("error", e.what())});
    }
    throw;
  }

  // barrier
  pool_.WaitIdle();
}

} // namespace txcluster::propagation
