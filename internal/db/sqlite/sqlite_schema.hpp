#pragma once

#include <memory>

#include "sqlite_db.hpp"

namespace txcluster::db::sqlite {

/*
  Creates the tables used by SqliteRepository if missing.

  Tables:
    cardholder_adjacency / merchant_adjacency   (entity_id, neighbor_id) -> weight
    assignments                                  (iteration, entity_id, role, cluster_id) -> weight
    snapshots                                    commit markers, one per iteration
    run_state                                    single row
*/
void BootstrapSchema(SqliteDB& db);

} // namespace txcluster::db::sqlite
