#include "memory_repository.hpp"

#include <algorithm>
#include <mutex>

#include "memory_tx.hpp"

namespace txcluster::db::memory {

namespace {

std::size_t SideIndex(util::Side side) {
  return static_cast<std::size_t>(side);
}

model::AdjacencyRecord ToRecord(const std::string& entity_id, const std::map<std::string, uint64_t>& neighbors) {
  model::AdjacencyRecord record;
  record.entity_id = entity_id;
  record.neighbors.reserve(neighbors.size());
  for (const auto& [id, weight] : neighbors) {
    record.neighbors.push_back({id, weight});
  }
  return record;
}

bool RowOrder(const model::AssignmentRecord& a, const model::AssignmentRecord& b) {
  if (a.role != b.role) return a.role < b.role;
  return a.cluster_id < b.cluster_id;
}

} // namespace

MemoryRepository::MemoryRepository(uint64_t max_rows) : max_rows_(max_rows) {
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

uint64_t MemoryRepository::RowCount() const {
  std::shared_lock lock(mutex_);
  return committed_.rows;
}

Result MemoryRepository::CheckCapacity(MemoryTransaction& tx, uint64_t new_rows) const {
  if (max_rows_ == 0) return Result::Ok();
  if (committed_.rows + tx.PendingRows() + new_rows > max_rows_) {
    return Result::Err(ErrorCode::Full, "memory repository capacity of " + std::to_string(max_rows_) + " rows exceeded");
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Adjacency
// ------------------------------------------------------------------

Result MemoryRepository::AccumulateEdges(Transaction& t, util::Side side, const std::vector<model::EdgeRecord>& edges) {
  for (const auto& edge : edges) {
    if (edge.weight == 0) return Result::Err(ErrorCode::ConstraintViolation, "edge weight must be positive");
  }

  uint64_t new_rows = 0;
  {
    std::shared_lock lock(mutex_);
    const auto&      map = committed_.adjacency[SideIndex(side)];
    for (const auto& edge : edges) {
      auto it = map.find(edge.entity_id);
      if (it == map.end() || !it->second.contains(edge.neighbor_id)) ++new_rows;
    }
    if (auto capacity = CheckCapacity(TX(t), new_rows); !capacity) return capacity;
  }

  TX(t).Stage(
      [side, edges](State& s) {
        auto& map = s.adjacency[SideIndex(side)];
        for (const auto& edge : edges) {
          auto& neighbors = map[edge.entity_id];
          auto [it, inserted] = neighbors.try_emplace(edge.neighbor_id, 0);
          it->second += edge.weight;
          if (inserted) ++s.rows;
        }
      },
      new_rows);
  return Result::Ok();
}

std::vector<model::AdjacencyRecord> MemoryRepository::ReadAdjacency(Transaction&, util::Side side, const std::string& after, uint64_t limit) {
  std::shared_lock lock(mutex_);
  const auto&      map = committed_.adjacency[SideIndex(side)];

  std::vector<model::AdjacencyRecord> out;
  for (auto it = map.upper_bound(after); it != map.end() && out.size() < limit; ++it) {
    out.push_back(ToRecord(it->first, it->second));
  }
  return out;
}

std::vector<model::AdjacencyRecord> MemoryRepository::GetAdjacency(Transaction&, util::Side side, const std::vector<std::string>& entity_ids) {
  std::vector<std::string> ids = entity_ids;
  std::sort(ids.begin(), ids.end());
  ids.erase(std::unique(ids.begin(), ids.end()), ids.end());

  std::shared_lock lock(mutex_);
  const auto&      map = committed_.adjacency[SideIndex(side)];

  std::vector<model::AdjacencyRecord> out;
  for (const auto& id : ids) {
    auto it = map.find(id);
    if (it != map.end()) out.push_back(ToRecord(it->first, it->second));
  }
  return out;
}

uint64_t MemoryRepository::CountEntities(Transaction&, util::Side side) {
  std::shared_lock lock(mutex_);
  return committed_.adjacency[SideIndex(side)].size();
}

Result MemoryRepository::ClearAdjacency(Transaction& t) {
  TX(t).Stage(
      [](State& s) {
        for (auto& map : s.adjacency) {
          for (const auto& [_, neighbors] : map) s.rows -= neighbors.size();
          map.clear();
        }
      },
      0);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Assignment snapshots
// ------------------------------------------------------------------

Result MemoryRepository::InsertAssignments(Transaction& t, uint32_t iteration, const std::vector<model::AssignmentRecord>& rows) {
  {
    std::shared_lock lock(mutex_);
    if (auto capacity = CheckCapacity(TX(t), rows.size()); !capacity) return capacity;
  }

  TX(t).Stage(
      [iteration, rows](State& s) {
        auto& snapshot = s.assignments[iteration];
        for (const auto& row : rows) {
          auto& entity_rows = snapshot[row.entity_id];
          auto  existing    = std::find_if(entity_rows.begin(), entity_rows.end(), [&](const model::AssignmentRecord& r) {
            return r.cluster_id == row.cluster_id && r.role == row.role;
          });
          if (existing != entity_rows.end()) {
            *existing = row;
            continue;
          }
          entity_rows.push_back(row);
          std::sort(entity_rows.begin(), entity_rows.end(), RowOrder);
          ++s.rows;
        }
      },
      rows.size());
  return Result::Ok();
}

std::vector<model::AssignmentRecord> MemoryRepository::ReadAssignments(Transaction&, uint32_t iteration, const std::string& after, uint64_t limit) {
  std::shared_lock lock(mutex_);

  std::vector<model::AssignmentRecord> out;
  auto                                 snapshot = committed_.assignments.find(iteration);
  if (snapshot == committed_.assignments.end()) return out;

  uint64_t entities = 0;
  for (auto it = snapshot->second.upper_bound(after); it != snapshot->second.end() && entities < limit; ++it, ++entities) {
    out.insert(out.end(), it->second.begin(), it->second.end());
  }
  return out;
}

std::vector<model::AssignmentRecord> MemoryRepository::GetAssignments(Transaction&, uint32_t iteration, const std::vector<std::string>& entity_ids) {
  std::vector<std::string> ids = entity_ids;
  std::sort(ids.begin(), ids.end());
  ids.erase(std::unique(ids.begin(), ids.end()), ids.end());

  std::shared_lock lock(mutex_);

  std::vector<model::AssignmentRecord> out;
  auto                                 snapshot = committed_.assignments.find(iteration);
  if (snapshot == committed_.assignments.end()) return out;

  for (const auto& id : ids) {
    auto it = snapshot->second.find(id);
    if (it != snapshot->second.end()) out.insert(out.end(), it->second.begin(), it->second.end());
  }
  return out;
}

Result MemoryRepository::DeleteAssignments(Transaction& t, uint32_t iteration) {
  TX(t).Stage(
      [iteration](State& s) {
        auto it = s.assignments.find(iteration);
        if (it == s.assignments.end()) return;
        for (const auto& [_, rows] : it->second) s.rows -= rows.size();
        s.assignments.erase(it);
      },
      0);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Snapshot commit markers
// ------------------------------------------------------------------

Result MemoryRepository::InsertSnapshot(Transaction& t, const model::SnapshotRecord& r) {
  {
    std::shared_lock lock(mutex_);
    if (committed_.snapshots.contains(r.iteration)) {
      return Result::Err(ErrorCode::AlreadyExists, "snapshot " + std::to_string(r.iteration) + " already committed");
    }
  }
  TX(t).Stage([r](State& s) { s.snapshots[r.iteration] = r; }, 0);
  return Result::Ok();
}

std::optional<model::SnapshotRecord> MemoryRepository::GetSnapshot(Transaction&, uint32_t iteration) {
  std::shared_lock lock(mutex_);
  auto             it = committed_.snapshots.find(iteration);
  if (it == committed_.snapshots.end()) return std::nullopt;
  return it->second;
}

std::vector<model::SnapshotRecord> MemoryRepository::ListSnapshots(Transaction&) {
  std::shared_lock                   lock(mutex_);
  std::vector<model::SnapshotRecord> out;
  out.reserve(committed_.snapshots.size());
  for (const auto& [_, record] : committed_.snapshots) out.push_back(record);
  return out;
}

Result MemoryRepository::DeleteSnapshot(Transaction& t, uint32_t iteration) {
  TX(t).Stage([iteration](State& s) { s.snapshots.erase(iteration); }, 0);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Run state
// ------------------------------------------------------------------

Result MemoryRepository::UpsertRunState(Transaction& t, const model::RunStateRecord& r) {
  TX(t).Stage([r](State& s) { s.run_state = r; }, 0);
  return Result::Ok();
}

std::optional<model::RunStateRecord> MemoryRepository::GetRunState(Transaction&) {
  std::shared_lock lock(mutex_);
  return committed_.run_state;
}

} // namespace txcluster::db::memory
