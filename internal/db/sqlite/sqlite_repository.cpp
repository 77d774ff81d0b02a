#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <limits>

#include "internal/util/errors.hpp"

namespace txcluster::db::sqlite {

using txcluster::db::ErrorCode;
using txcluster::db::Result;

namespace {

using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

StmtPtr PrepareOrThrow(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  ThrowIf(sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr), db, "sqlite prepare");
  return StmtPtr(st, &sqlite3_finalize);
}

// Steps a read statement; returns false when exhausted, throws on error.
bool StepRow(sqlite3* db, sqlite3_stmt* st) {
  int rc = sqlite3_step(st);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  ThrowIf(rc, db, "sqlite step");
  return false;
}

const char* AdjacencyTable(util::Side side) {
  return side == util::Side::kCardholder ? "cardholder_adjacency" : "merchant_adjacency";
}

sqlite3_int64 ClampLimit(uint64_t limit) {
  return static_cast<sqlite3_int64>(std::min<uint64_t>(limit, std::numeric_limits<sqlite3_int64>::max()));
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

// Rows arrive ordered by entity; folds them into one record per entity.
std::vector<model::AdjacencyRecord> CollectAdjacency(sqlite3* db, sqlite3_stmt* st) {
  std::vector<model::AdjacencyRecord> out;
  while (StepRow(db, st)) {
    auto entity_id = ColText(st, 0);
    if (out.empty() || out.back().entity_id != entity_id) {
      out.push_back(model::AdjacencyRecord{std::move(entity_id), {}});
    }
    out.back().neighbors.push_back({ColText(st, 1), ColU64(st, 2)});
  }
  return out;
}

model::AssignmentRecord ReadAssignmentRow(sqlite3_stmt* st) {
  model::AssignmentRecord r;
  r.entity_id  = ColText(st, 0);
  r.cluster_id = ColText(st, 1);
  r.role       = static_cast<model::Role>(sqlite3_column_int(st, 2));
  r.weight     = ColU64(st, 3);
  return r;
}

model::SnapshotRecord ReadSnapshotRow(sqlite3_stmt* st) {
  model::SnapshotRecord r;
  r.iteration       = static_cast<uint32_t>(sqlite3_column_int64(st, 0));
  r.entity_count    = ColU64(st, 1);
  r.changed_count   = ColU64(st, 2);
  r.churn           = sqlite3_column_double(st, 3);
  r.resolved        = sqlite3_column_int(st, 4) != 0;
  r.committed_at_ms = ColU64(st, 5);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_FULL:
            return Result::Err(ErrorCode::Full, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Adjacency
// ------------------------------------------------------------------

Result SqliteRepository::AccumulateEdges(Transaction& t, util::Side side, const std::vector<model::EdgeRecord>& edges) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("INSERT INTO ") + AdjacencyTable(side) +
        "(entity_id,neighbor_id,weight) VALUES(?,?,?) "
        "ON CONFLICT(entity_id,neighbor_id) DO UPDATE SET weight = weight + excluded.weight;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    for (const auto& edge : edges) {
        BindText(st, 1, edge.entity_id);
        BindText(st, 2, edge.neighbor_id);
        BindU64(st, 3, edge.weight);

        int rc = sqlite3_step(st);
        if (rc != SQLITE_DONE) {
            auto result = Translate(db, rc);
            sqlite3_finalize(st);
            return result;
        }
        sqlite3_reset(st);
        sqlite3_clear_bindings(st);
    }

    sqlite3_finalize(st);
    return Result::Ok();
}

std::vector<model::AdjacencyRecord>
SqliteRepository::ReadAdjacency(Transaction& t, util::Side side, const std::string& after, uint64_t limit) {
    auto* db = TX(t).Handle();
    const std::string table = AdjacencyTable(side);

    const std::string sql =
        "SELECT entity_id,neighbor_id,weight FROM " + table +
        " WHERE entity_id IN (SELECT DISTINCT entity_id FROM " + table +
        " WHERE entity_id > ? ORDER BY entity_id LIMIT ?) ORDER BY entity_id, neighbor_id;";

    auto st = PrepareOrThrow(db, sql);
    BindText(st.get(), 1, after);
    sqlite3_bind_int64(st.get(), 2, ClampLimit(limit));

    return CollectAdjacency(db, st.get());
}

std::vector<model::AdjacencyRecord>
SqliteRepository::GetAdjacency(Transaction& t, util::Side side, const std::vector<std::string>& entity_ids) {
    auto* db = TX(t).Handle();

    std::vector<std::string> ids = entity_ids;
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());

    const std::string sql = std::string("SELECT entity_id,neighbor_id,weight FROM ") + AdjacencyTable(side) +
        " WHERE entity_id=? ORDER BY neighbor_id;";
    auto st = PrepareOrThrow(db, sql);

    std::vector<model::AdjacencyRecord> out;
    for (const auto& id : ids) {
        BindText(st.get(), 1, id);
        auto found = CollectAdjacency(db, st.get());
        if (!found.empty()) out.push_back(std::move(found.front()));
        sqlite3_reset(st.get());
    }
    return out;
}

uint64_t SqliteRepository::CountEntities(Transaction& t, util::Side side) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, std::string("SELECT COUNT(DISTINCT entity_id) FROM ") + AdjacencyTable(side) + ";");
    if (!StepRow(db, st.get())) return 0;
    return ColU64(st.get(), 0);
}

Result SqliteRepository::ClearAdjacency(Transaction& t) {
    auto* db = TX(t).Handle();

    for (auto side : {util::Side::kCardholder, util::Side::kMerchant}) {
        const std::string sql = std::string("DELETE FROM ") + AdjacencyTable(side) + ";";
        int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, nullptr);
        if (rc != SQLITE_OK) return Translate(db, rc);
    }
    return Result::Ok();
}

// ------------------------------------------------------------------
// Assignment snapshots
// ------------------------------------------------------------------

Result SqliteRepository::InsertAssignments(Transaction& t, uint32_t iteration, const std::vector<model::AssignmentRecord>& rows) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO assignments(iteration,entity_id,role,cluster_id,weight) VALUES(?,?,?,?,?) "
        "ON CONFLICT(iteration,entity_id,role,cluster_id) DO UPDATE SET weight=excluded.weight;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    for (const auto& r : rows) {
        sqlite3_bind_int64(st, 1, iteration);
        BindText(st, 2, r.entity_id);
        sqlite3_bind_int(st, 3, static_cast<int>(r.role));
        BindText(st, 4, r.cluster_id);
        BindU64(st, 5, r.weight);

        int rc = sqlite3_step(st);
        if (rc != SQLITE_DONE) {
            auto result = Translate(db, rc);
            sqlite3_finalize(st);
            return result;
        }
        sqlite3_reset(st);
    }

    sqlite3_finalize(st);
    return Result::Ok();
}

std::vector<model::AssignmentRecord>
SqliteRepository::ReadAssignments(Transaction& t, uint32_t iteration, const std::string& after, uint64_t limit) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT entity_id,cluster_id,role,weight FROM assignments WHERE iteration=?1 AND entity_id IN "
        "(SELECT DISTINCT entity_id FROM assignments WHERE iteration=?1 AND entity_id > ?2 ORDER BY entity_id LIMIT ?3) "
        "ORDER BY entity_id, role, cluster_id;";

    auto st = PrepareOrThrow(db, sql);
    sqlite3_bind_int64(st.get(), 1, iteration);
    BindText(st.get(), 2, after);
    sqlite3_bind_int64(st.get(), 3, ClampLimit(limit));

    std::vector<model::AssignmentRecord> out;
    while (StepRow(db, st.get())) out.push_back(ReadAssignmentRow(st.get()));
    return out;
}

std::vector<model::AssignmentRecord>
SqliteRepository::GetAssignments(Transaction& t, uint32_t iteration, const std::vector<std::string>& entity_ids) {
    auto* db = TX(t).Handle();

    std::vector<std::string> ids = entity_ids;
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());

    auto st = PrepareOrThrow(db,
        "SELECT entity_id,cluster_id,role,weight FROM assignments WHERE iteration=? AND entity_id=? ORDER BY role, cluster_id;");

    std::vector<model::AssignmentRecord> out;
    for (const auto& id : ids) {
        sqlite3_bind_int64(st.get(), 1, iteration);
        BindText(st.get(), 2, id);
        while (StepRow(db, st.get())) out.push_back(ReadAssignmentRow(st.get()));
        sqlite3_reset(st.get());
    }
    return out;
}

Result SqliteRepository::DeleteAssignments(Transaction& t, uint32_t iteration) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, "DELETE FROM assignments WHERE iteration=?;", -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    sqlite3_bind_int64(st, 1, iteration);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

// ------------------------------------------------------------------
// Snapshot commit markers
// ------------------------------------------------------------------

Result SqliteRepository::InsertSnapshot(Transaction& t, const model::SnapshotRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO snapshots(iteration,entity_count,changed_count,churn,resolved,committed_at_ms) VALUES(?,?,?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    sqlite3_bind_int64(st, 1, r.iteration);
    BindU64(st, 2, r.entity_count);
    BindU64(st, 3, r.changed_count);
    sqlite3_bind_double(st, 4, r.churn);
    sqlite3_bind_int(st, 5, r.resolved ? 1 : 0);
    BindU64(st, 6, r.committed_at_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if ((rc & 0xFF) == SQLITE_CONSTRAINT)
        return Result::Err(ErrorCode::AlreadyExists, "snapshot " + std::to_string(r.iteration) + " already committed");
    return Translate(db, rc);
}

std::optional<model::SnapshotRecord> SqliteRepository::GetSnapshot(Transaction& t, uint32_t iteration) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db,
        "SELECT iteration,entity_count,changed_count,churn,resolved,committed_at_ms FROM snapshots WHERE iteration=?;");
    sqlite3_bind_int64(st.get(), 1, iteration);

    if (!StepRow(db, st.get())) return std::nullopt;
    return ReadSnapshotRow(st.get());
}

std::vector<model::SnapshotRecord> SqliteRepository::ListSnapshots(Transaction& t) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db,
        "SELECT iteration,entity_count,changed_count,churn,resolved,committed_at_ms FROM snapshots ORDER BY iteration;");

    std::vector<model::SnapshotRecord> out;
    while (StepRow(db, st.get())) out.push_back(ReadSnapshotRow(st.get()));
    return out;
}

Result SqliteRepository::DeleteSnapshot(Transaction& t, uint32_t iteration) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, "DELETE FROM snapshots WHERE iteration=?;", -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    sqlite3_bind_int64(st, 1, iteration);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

// ------------------------------------------------------------------
// Run state
// ------------------------------------------------------------------

Result SqliteRepository::UpsertRunState(Transaction& t, const model::RunStateRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO run_state(id,adjacency_complete,records_read,malformed_records,distinct_cardholders,distinct_merchants,total_edge_weight,seed_mode,updated_at_ms) "
        "VALUES(1,?,?,?,?,?,?,?,?) "
        "ON CONFLICT(id) DO UPDATE SET adjacency_complete=excluded.adjacency_complete, records_read=excluded.records_read, "
        "malformed_records=excluded.malformed_records, distinct_cardholders=excluded.distinct_cardholders, "
        "distinct_merchants=excluded.distinct_merchants, total_edge_weight=excluded.total_edge_weight, "
        "seed_mode=excluded.seed_mode, updated_at_ms=excluded.updated_at_ms;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    sqlite3_bind_int(st, 1, r.adjacency_complete ? 1 : 0);
    BindU64(st, 2, r.records_read);
    BindU64(st, 3, r.malformed_records);
    BindU64(st, 4, r.distinct_cardholders);
    BindU64(st, 5, r.distinct_merchants);
    BindU64(st, 6, r.total_edge_weight);
    BindText(st, 7, r.seed_mode);
    BindU64(st, 8, r.updated_at_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

std::optional<model::RunStateRecord> SqliteRepository::GetRunState(Transaction& t) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db,
        "SELECT adjacency_complete,records_read,malformed_records,distinct_cardholders,distinct_merchants,total_edge_weight,seed_mode,updated_at_ms "
        "FROM run_state WHERE id=1;");

    if (!StepRow(db, st.get())) return std::nullopt;

    model::RunStateRecord r;
    r.adjacency_complete   = sqlite3_column_int(st.get(), 0) != 0;
    r.records_read         = ColU64(st.get(), 1);
    r.malformed_records    = ColU64(st.get(), 2);
    r.distinct_cardholders = ColU64(st.get(), 3);
    r.distinct_merchants   = ColU64(st.get(), 4);
    r.total_edge_weight    = ColU64(st.get(), 5);
    r.seed_mode            = ColText(st.get(), 6);
    r.updated_at_ms        = ColU64(st.get(), 7);
    return r;
}

} // namespace txcluster::db::sqlite
