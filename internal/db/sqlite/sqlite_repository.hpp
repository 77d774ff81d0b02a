#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace txcluster::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result AccumulateEdges(Transaction&, util::Side side, const std::vector<model::EdgeRecord>& edges) override;
  std::vector<model::AdjacencyRecord> ReadAdjacency(Transaction&, util::Side side, const std::string& after, uint64_t limit) override;
  std::vector<model::AdjacencyRecord> GetAdjacency(Transaction&, util::Side side, const std::vector<std::string>& entity_ids) override;
  uint64_t CountEntities(Transaction&, util::Side side) override;
  Result ClearAdjacency(Transaction&) override;

  Result InsertAssignments(Transaction&, uint32_t iteration, const std::vector<model::AssignmentRecord>& rows) override;
  std::vector<model::AssignmentRecord> ReadAssignments(Transaction&, uint32_t iteration, const std::string& after, uint64_t limit) override;
  std::vector<model::AssignmentRecord> GetAssignments(Transaction&, uint32_t iteration, const std::vector<std::string>& entity_ids) override;
  Result DeleteAssignments(Transaction&, uint32_t iteration) override;

  Result InsertSnapshot(Transaction&, const model::SnapshotRecord&) override;
  std::optional<model::SnapshotRecord> GetSnapshot(Transaction&, uint32_t iteration) override;
  std::vector<model::SnapshotRecord> ListSnapshots(Transaction&) override;
  Result DeleteSnapshot(Transaction&, uint32_t iteration) override;

  Result UpsertRunState(Transaction&, const model::RunStateRecord&) override;
  std::optional<model::RunStateRecord> GetRunState(Transaction&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

} // namespace txcluster::db::sqlite
