#include "adjacency_builder.hpp"

#include <array>
#include <atomic>
#include <exception>
#include <map>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/runtime/work_queue.hpp"
#include "internal/util/entity_id.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace txcluster::adjacency {

using db::model::EdgeRecord;
using db::model::RunStateRecord;

namespace {

struct HalfEdge {
  util::Side side;
  EdgeRecord edge;
};

/*
  One writer: drains its queue into a per-side buffer keyed by
  (entity, neighbor), flushing every batch_size half-edges.
*/
class EdgeWriter {
 public:
  EdgeWriter(db::Repository& repo, const BuildOptions& options)
      : repo_(repo), options_(options), queue_(static_cast<std::size_t>(options.batch_size) * 2) {
  }

  runtime::WorkQueue<HalfEdge>& Queue() {
    return queue_;
  }

  // Returns normally on shutdown; throws on storage failure.
  void Run(const std::atomic<bool>& failed) {
    while (auto item = queue_.Pop()) {
      if (failed.load()) continue;

      auto& buffer = buffers_[static_cast<std::size_t>(item->side)];
      buffer[{std::move(item->edge.entity_id), std::move(item->edge.neighbor_id)}] += item->edge.weight;
      if (++buffered_ >= options_.batch_size) Flush();
    }
    if (!failed.load()) Flush();
  }

 private:
  using Buffer = std::map<std::pair<std::string, std::string>, uint64_t>;

  void Flush() {
    if (buffered_ == 0) return;

    std::array<std::vector<EdgeRecord>, 2> batches;
    for (std::size_t side = 0; side < 2; ++side) {
      batches[side].reserve(buffers_[side].size());
      for (auto& [key, weight] : buffers_[side]) {
        batches[side].push_back(EdgeRecord{key.first, key.second, weight});
      }
    }

    util::InTransaction(repo_, options_.retry, "adjacency flush", [&](db::Transaction& tx) {
      for (auto side : {util::Side::kCardholder, util::Side::kMerchant}) {
        const auto& batch = batches[static_cast<std::size_t>(side)];
        if (batch.empty()) continue;
        util::ThrowIfError(repo_.AccumulateEdges(tx, side, batch), "accumulate edges");
      }
    });

    buffers_[0].clear();
    buffers_[1].clear();
    buffered_ = 0;
  }

  db::Repository&              repo_;
  const BuildOptions&          options_;
  runtime::WorkQueue<HalfEdge> queue_;
  std::array<Buffer, 2>        buffers_;
  uint32_t                     buffered_ = 0;
};

} // namespace

AdjacencyBuilder::AdjacencyBuilder(std::shared_ptr<db::Repository> repo, BuildOptions options)
    : repo_(std::move(repo)), options_(std::move(options)) {
  if (options_.batch_size == 0) options_.batch_size = 1;
  if (options_.writer_threads == 0) options_.writer_threads = 1;
}

RunStateRecord AdjacencyBuilder::Build(ingest::RecordSource& source) {
  RunStateRecord state;

  // start from empty mappings; a half-finished earlier build is discarded
  util::InTransaction(*repo_, options_.retry, "adjacency reset", [&](db::Transaction& tx) {
    util::ThrowIfError(repo_->ClearAdjacency(tx), "clear adjacency");
    state.updated_at_ms = util::NowMs();
    util::ThrowIfError(repo_->UpsertRunState(tx, state), "reset run state");
  });

  std::vector<std::unique_ptr<EdgeWriter>> writers;
  for (uint32_t i = 0; i < options_.writer_threads; ++i) {
    writers.push_back(std::make_unique<EdgeWriter>(*repo_, options_));
  }

  std::atomic<bool>  failed{false};
  std::mutex         error_mutex;
  std::exception_ptr first_error;

  auto shutdown_all = [&] {
    for (auto& w : writers) w->Queue().Shutdown();
  };

  std::vector<std::thread> threads;
  threads.reserve(writers.size());
  for (auto& writer : writers) {
    threads.emplace_back([&, w = writer.get()] {
      try {
        w->Run(failed);
      } catch (const std::exception&) {
        {
          std::lock_guard lock(error_mutex);
          if (!first_error) first_error = std::current_exception();
        }
        failed = true;
        shutdown_all();
      }
    });
  }

  auto route = [&](util::Side side, const std::string& key, const std::string& neighbor, uint64_t weight) {
    auto& writer = *writers[util::PartitionOf(key, writers.size())];
    return writer.Queue().Push(HalfEdge{side, EdgeRecord{key, neighbor, weight}});
  };

  std::exception_ptr reader_error;
  try {
    for (;;) {
      std::optional<ingest::InteractionRecord> record;
      try {
        record = source.Next();
      } catch (const util::MalformedRecordError& e) {
        ++state.malformed_records;
        if (options_.strict) throw;
        TXCLUSTER_LOG_WARN("skipping malformed record", {observability::IntField("line", static_cast<int64_t>(e.LineNumber())),
                                                         observability::StringField("error", e.what())});
        continue;
      }
      if (!record) break;

      ++state.records_read;
      state.total_edge_weight += record->weight;

      if (!route(util::Side::kCardholder, record->cardholder_id, record->merchant_id, record->weight) ||
          !route(util::Side::kMerchant, record->merchant_id, record->cardholder_id, record->weight)) {
        break; // a writer failed and closed the queues
      }
    }
  } catch (const std::exception&) {
    reader_error = std::current_exception();
    failed       = true;
  }

  shutdown_all();
  for (auto& t : threads) t.join();

  if (reader_error) std::rethrow_exception(reader_error);
  if (first_error) std::rethrow_exception(first_error);

  util::InTransaction(*repo_, options_.retry, "adjacency complete", [&](db::Transaction& tx) {
    state.distinct_cardholders = repo_->CountEntities(tx, util::Side::kCardholder);
    state.distinct_merchants   = repo_->CountEntities(tx, util::Side::kMerchant);
    state.adjacency_complete   = true;
    state.updated_at_ms        = util::NowMs();
    util::ThrowIfError(repo_->UpsertRunState(tx, state), "persist run state");
  });

  TXCLUSTER_LOG_INFO("adjacency built", {observability::IntField("records", static_cast<int64_t>(state.records_read)),
                                         observability::IntField("malformed", static_cast<int64_t>(state.malformed_records)),
                                         observability::IntField("cardholders", static_cast<int64_t>(state.distinct_cardholders)),
                                         observability::IntField("merchants", static_cast<int64_t>(state.distinct_merchants)),
                                         observability::IntField("total_weight", static_cast<int64_t>(state.total_edge_weight))});
  return state;
}

} // namespace txcluster::adjacency
