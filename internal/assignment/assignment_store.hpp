#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/assignment_record.hpp"
#include "internal/db/model/snapshot_record.hpp"
#include "internal/util/entity_id.hpp"
#include "internal/util/retry.hpp"

namespace txcluster::assignment {

// Per-entity view of a snapshot: primary first, then duplicates.
struct EntityAssignment {
  std::string                               entity_id;
  std::vector<db::model::AssignmentRecord> rows;

  const db::model::AssignmentRecord& Primary() const {
    return rows.front();
  }
};

// Groups rows (already ordered by entity) into one entry per entity.
std::vector<EntityAssignment> GroupByEntity(std::vector<db::model::AssignmentRecord> rows);

// entity id -> primary cluster id
using PrimaryMap = std::map<std::string, std::string>;

namespace detail {

class PinTable {
 public:
  void Pin(uint32_t iteration);
  void Unpin(uint32_t iteration);
  bool Pinned(uint32_t iteration) const;

 private:
  mutable std::mutex           mutex_;
  std::map<uint32_t, uint32_t> pins_;
};

} // namespace detail

/*
  Read access to one committed snapshot.

  While any copy of a handle is alive the snapshot is pinned and garbage
  collection leaves it alone.
*/
class SnapshotHandle {
 public:
  SnapshotHandle(std::shared_ptr<db::Repository> repo, util::RetryPolicy retry, std::shared_ptr<detail::PinTable> pins,
                 db::model::SnapshotRecord record);

  uint32_t Iteration() const {
    return record_.iteration;
  }

  const db::model::SnapshotRecord& Record() const {
    return record_;
  }

  // All rows of the given entities; unknown ids are skipped.
  std::vector<db::model::AssignmentRecord> Get(const std::vector<std::string>& entity_ids) const;

  PrimaryMap Primaries(const std::vector<std::string>& entity_ids) const;

  // Up to `limit` entities with id greater than `after`.
  std::vector<EntityAssignment> ReadPage(const std::string& after, uint64_t limit) const;

 private:
  struct Pin {
    Pin(std::shared_ptr<detail::PinTable> t, uint32_t it) : table(std::move(t)), iteration(it) {
    }
    Pin(const Pin&)            = delete;
    Pin& operator=(const Pin&) = delete;
    ~Pin();

    std::shared_ptr<detail::PinTable> table;
    uint32_t                          iteration;
  };

  std::shared_ptr<db::Repository> repo_;
  util::RetryPolicy               retry_;
  db::model::SnapshotRecord       record_;
  std::shared_ptr<Pin>            pin_;
};

/*
  Builds snapshot `iteration`. Rows are written shard by shard from many
  workers; nothing is visible through the store until Commit() inserts the
  SnapshotRecord.

  A side of the in-progress snapshot may be read back only after Seal(side);
  this is the barrier between the two half-steps of an iteration.
*/
class SnapshotWriter {
 public:
  SnapshotWriter(std::shared_ptr<db::Repository> repo, util::RetryPolicy retry, uint32_t iteration);

  SnapshotWriter(const SnapshotWriter&)            = delete;
  SnapshotWriter& operator=(const SnapshotWriter&) = delete;

  uint32_t Iteration() const {
    return iteration_;
  }

  // Thread-safe. `entities` and `changed` feed the churn statistics.
  void Write(const std::vector<db::model::AssignmentRecord>& rows, uint64_t entities, uint64_t changed);

  void Seal(util::Side side);
  bool Sealed(util::Side side) const;

  // Reads rows of a sealed side; throws util::InvalidState otherwise.
  PrimaryMap SealedPrimaries(util::Side side, const std::vector<std::string>& entity_ids) const;

  uint64_t EntityCount() const {
    return entities_.load();
  }

  uint64_t ChangedCount() const {
    return changed_.load();
  }

  // Publishes the snapshot; the writer is unusable afterwards.
  db::model::SnapshotRecord Commit(bool resolved);

 private:
  std::shared_ptr<db::Repository> repo_;
  util::RetryPolicy               retry_;
  uint32_t                        iteration_;
  std::atomic<uint64_t>           entities_{0};
  std::atomic<uint64_t>           changed_{0};
  std::array<std::atomic<bool>, 2> sealed_{};
  bool                            committed_ = false;
};

/*
  Versioned assignment snapshots on top of the repository.

  One immutable snapshot per iteration; rows are never updated in place.
  Readers pin snapshots; CollectGarbage() drops unpinned committed
  snapshots older than the newest unresolved one. Resolved snapshots and
  the newest unresolved snapshot are always kept.
*/
class AssignmentStore {
 public:
  AssignmentStore(std::shared_ptr<db::Repository> repo, util::RetryPolicy retry, bool retain_snapshots = false);

  std::vector<db::model::SnapshotRecord> ListCommitted() const;

  std::optional<db::model::SnapshotRecord> Latest() const;

  // newest snapshot not produced by the resolver
  std::optional<db::model::SnapshotRecord> LatestUnresolved() const;

  // throws util::NotFound when the snapshot is not committed
  SnapshotHandle Open(uint32_t iteration) const;

  // Discards leftovers of an earlier attempt at `iteration`; throws
  // util::InvalidState if that snapshot is already committed.
  std::unique_ptr<SnapshotWriter> BeginSnapshot(uint32_t iteration);

  // Removes a committed snapshot and its rows.
  void Discard(uint32_t iteration);

  // Returns the number of snapshots removed.
  uint64_t CollectGarbage();

  bool IsPinned(uint32_t iteration) const {
    return pins_->Pinned(iteration);
  }

 private:
  std::shared_ptr<db::Repository>   repo_;
  util::RetryPolicy                 retry_;
  bool                              retain_snapshots_;
  std::shared_ptr<detail::PinTable> pins_;
};

} // namespace txcluster::assignment
