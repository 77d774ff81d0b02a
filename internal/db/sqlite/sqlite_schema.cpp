#include "sqlite_schema.hpp"

#include <string>
#include <vector>

namespace txcluster::db::sqlite {

namespace {

constexpr int kSchemaVersion = 1;

} // namespace

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS cardholder_adjacency (entity_id TEXT NOT NULL, neighbor_id TEXT NOT NULL, weight INTEGER NOT NULL CHECK (weight > 0), PRIMARY KEY (entity_id, neighbor_id)) WITHOUT ROWID;",
      "CREATE TABLE IF NOT EXISTS merchant_adjacency (entity_id TEXT NOT NULL, neighbor_id TEXT NOT NULL, weight INTEGER NOT NULL CHECK (weight > 0), PRIMARY KEY (entity_id, neighbor_id)) WITHOUT ROWID;",
      "CREATE TABLE IF NOT EXISTS assignments (iteration INTEGER NOT NULL, entity_id TEXT NOT NULL, role INTEGER NOT NULL, cluster_id TEXT NOT NULL, weight INTEGER NOT NULL, PRIMARY KEY (iteration, entity_id, role, cluster_id)) WITHOUT ROWID;",
      "CREATE TABLE IF NOT EXISTS snapshots (iteration INTEGER PRIMARY KEY, entity_count INTEGER NOT NULL, changed_count INTEGER NOT NULL, churn REAL NOT NULL, resolved INTEGER NOT NULL, committed_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS run_state (id INTEGER PRIMARY KEY CHECK (id = 1), adjacency_complete INTEGER NOT NULL, records_read INTEGER NOT NULL, malformed_records INTEGER NOT NULL, distinct_cardholders INTEGER NOT NULL, distinct_merchants INTEGER NOT NULL, total_edge_weight INTEGER NOT NULL, seed_mode TEXT NOT NULL DEFAULT '', updated_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL DEFAULT (unixepoch() * 1000));"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }

  db.Exec("INSERT OR IGNORE INTO schema_migrations(version) VALUES(" + std::to_string(kSchemaVersion) + ");");
}

} // namespace txcluster::db::sqlite
