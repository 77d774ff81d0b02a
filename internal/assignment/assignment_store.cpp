#include "assignment_store.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace txcluster::assignment {

using db::model::AssignmentRecord;
using db::model::Role;
using db::model::SnapshotRecord;

std::vector<EntityAssignment> GroupByEntity(std::vector<AssignmentRecord> rows) {
  std::vector<EntityAssignment> out;
  for (auto& row : rows) {
    if (out.empty() || out.back().entity_id != row.entity_id) {
      out.push_back(EntityAssignment{row.entity_id, {}});
    }
    out.back().rows.push_back(std::move(row));
  }
  for (const auto& entity : out) {
    if (entity.rows.front().role != Role::kPrimary) {
      throw util::InvalidState("entity " + entity.entity_id + " has no primary assignment");
    }
  }
  return out;
}

static PrimaryMap PrimariesOf(const std::vector<AssignmentRecord>& rows) {
  PrimaryMap out;
  for (const auto& row : rows) {
    if (row.role == Role::kPrimary) out.emplace(row.entity_id, row.cluster_id);
  }
  return out;
}

// ------------------------------------------------------------------
// Pins
// ------------------------------------------------------------------

namespace detail {

void PinTable::Pin(uint32_t iteration) {
  std::lock_guard lock(mutex_);
  ++pins_[iteration];
}

void PinTable::Unpin(uint32_t iteration) {
  std::lock_guard lock(mutex_);
  auto            it = pins_.find(iteration);
  if (it == pins_.end()) return;
  if (--it->second == 0) pins_.erase(it);
}

bool PinTable::Pinned(uint32_t iteration) const {
  std::lock_guard lock(mutex_);
  return pins_.contains(iteration);
}

} // namespace detail

// ------------------------------------------------------------------
// SnapshotHandle
// ------------------------------------------------------------------

SnapshotHandle::Pin::~Pin() {
  table->Unpin(iteration);
}

SnapshotHandle::SnapshotHandle(std::shared_ptr<db::Repository> repo, util::RetryPolicy retry, std::shared_ptr<detail::PinTable> pins,
                               SnapshotRecord record)
    : repo_(std::move(repo)), retry_(retry), record_(record) {
  pins->Pin(record_.iteration);
  pin_ = std::make_shared<Pin>(std::move(pins), record_.iteration);
}

std::vector<AssignmentRecord> SnapshotHandle::Get(const std::vector<std::string>& entity_ids) const {
  if (entity_ids.empty()) return {};
  return util::InTransaction(*repo_, retry_, "read assignments",
                             [&](db::Transaction& tx) { return repo_->GetAssignments(tx, record_.iteration, entity_ids); });
}

PrimaryMap SnapshotHandle::Primaries(const std::vector<std::string>& entity_ids) const {
  return PrimariesOf(Get(entity_ids));
}

std::vector<EntityAssignment> SnapshotHandle::ReadPage(const std::string& after, uint64_t limit) const {
  auto rows = util::InTransaction(*repo_, retry_, "read assignment page",
                                  [&](db::Transaction& tx) { return repo_->ReadAssignments(tx, record_.iteration, after, limit); });
  return GroupByEntity(std::move(rows));
}

// ------------------------------------------------------------------
// SnapshotWriter
// ------------------------------------------------------------------

SnapshotWriter::SnapshotWriter(std::shared_ptr<db::Repository> repo, util::RetryPolicy retry, uint32_t iteration)
    : repo_(std::move(repo)), retry_(retry), iteration_(iteration) {
}

void SnapshotWriter::Write(const std::vector<AssignmentRecord>& rows, uint64_t entities, uint64_t changed) {
  if (committed_) {
    throw util::InvalidState("snapshot " + std::to_string(iteration_) + " already committed");
  }
  if (!rows.empty()) {
    util::InTransaction(*repo_, retry_, "write assignments", [&](db::Transaction& tx) {
      util::ThrowIfError(repo_->InsertAssignments(tx, iteration_, rows), "insert assignments");
    });
  }
  entities_ += entities;
  changed_ += changed;
}

void SnapshotWriter::Seal(util::Side side) {
  sealed_[static_cast<std::size_t>(side)] = true;
}

bool SnapshotWriter::Sealed(util::Side side) const {
  return sealed_[static_cast<std::size_t>(side)].load();
}

PrimaryMap SnapshotWriter::SealedPrimaries(util::Side side, const std::vector<std::string>& entity_ids) const {
  if (!Sealed(side)) {
    throw util::InvalidState(std::string(util::SideName(side)) + " side of snapshot " + std::to_string(iteration_) + " is not sealed");
  }
  if (entity_ids.empty()) return {};

  auto rows = util::InTransaction(*repo_, retry_, "read sealed assignments",
                                  [&](db::Transaction& tx) { return repo_->GetAssignments(tx, iteration_, entity_ids); });
  return PrimariesOf(rows);
}

SnapshotRecord SnapshotWriter::Commit(bool resolved) {
  if (committed_) {
    throw util::InvalidState("snapshot " + std::to_string(iteration_) + " already committed");
  }

  SnapshotRecord record;
  record.iteration       = iteration_;
  record.entity_count    = entities_.load();
  record.changed_count   = changed_.load();
  record.churn           = record.entity_count == 0 ? 0.0 : static_cast<double>(record.changed_count) / static_cast<double>(record.entity_count);
  record.resolved        = resolved;
  record.committed_at_ms = util::NowMs();

  util::InTransaction(*repo_, retry_, "commit snapshot", [&](db::Transaction& tx) {
    // a retried commit may find its own marker from an attempt whose
    // acknowledgement was lost
    if (auto existing = repo_->GetSnapshot(tx, iteration_)) {
      if (existing->entity_count == record.entity_count && existing->resolved == record.resolved) return;
    }
    util::ThrowIfError(repo_->InsertSnapshot(tx, record), "insert snapshot");
  });

  committed_ = true;
  return record;
}

// ------------------------------------------------------------------
// AssignmentStore
// ------------------------------------------------------------------

AssignmentStore::AssignmentStore(std::shared_ptr<db::Repository> repo, util::RetryPolicy retry, bool retain_snapshots)
    : repo_(std::move(repo)), retry_(retry), retain_snapshots_(retain_snapshots), pins_(std::make_shared<detail::PinTable>()) {
}

std::vector<SnapshotRecord> AssignmentStore::ListCommitted() const {
  return util::InTransaction(*repo_, retry_, "list snapshots", [&](db::Transaction& tx) { return repo_->ListSnapshots(tx); });
}

std::optional<SnapshotRecord> AssignmentStore::Latest() const {
  auto all = ListCommitted();
  if (all.empty()) return std::nullopt;
  return all.back();
}

std::optional<SnapshotRecord> AssignmentStore::LatestUnresolved() const {
  auto all = ListCommitted();
  for (auto it = all.rbegin(); it != all.rend(); ++it) {
    if (!it->resolved) return *it;
  }
  return std::nullopt;
}

SnapshotHandle AssignmentStore::Open(uint32_t iteration) const {
  auto record = util::InTransaction(*repo_, retry_, "open snapshot", [&](db::Transaction& tx) { return repo_->GetSnapshot(tx, iteration); });
  if (!record) {
    throw util::NotFound("snapshot " + std::to_string(iteration) + " is not committed");
  }
  return SnapshotHandle(repo_, retry_, pins_, *record);
}

std::unique_ptr<SnapshotWriter> AssignmentStore::BeginSnapshot(uint32_t iteration) {
  util::InTransaction(*repo_, retry_, "begin snapshot", [&](db::Transaction& tx) {
    if (repo_->GetSnapshot(tx, iteration)) {
      throw util::InvalidState("snapshot " + std::to_string(iteration) + " is already committed");
    }
    util::ThrowIfError(repo_->DeleteAssignments(tx, iteration), "purge uncommitted assignments");
  });
  return std::make_unique<SnapshotWriter>(repo_, retry_, iteration);
}

void AssignmentStore::Discard(uint32_t iteration) {
  if (pins_->Pinned(iteration)) {
    throw util::InvalidState("snapshot " + std::to_string(iteration) + " is pinned");
  }
  util::InTransaction(*repo_, retry_, "discard snapshot", [&](db::Transaction& tx) {
    util::ThrowIfError(repo_->DeleteSnapshot(tx, iteration), "delete snapshot");
    util::ThrowIfError(repo_->DeleteAssignments(tx, iteration), "delete assignments");
  });
}

uint64_t AssignmentStore::CollectGarbage() {
  if (retain_snapshots_) return 0;

  auto keep = LatestUnresolved();
  if (!keep) return 0;

  uint64_t removed = 0;
  for (const auto& record : ListCommitted()) {
    if (record.iteration >= keep->iteration || record.resolved) continue;
    if (pins_->Pinned(record.iteration)) continue;
    Discard(record.iteration);
    ++removed;
  }

  if (removed > 0) {
    TXCLUSTER_LOG_DEBUG("snapshots collected", {observability::IntField("removed", static_cast<int64_t>(removed)),
                                                observability::IntField("kept", keep->iteration)});
  }
  return removed;
}

} // namespace txcluster::assignment
