#pragma once

#include <cstdint>

namespace txcluster::db::model {

/*
  Commit marker of an assignment snapshot.

  A snapshot's rows are visible to readers only once this record exists;
  inserting it is the atomic commit point.
*/
struct SnapshotRecord {
  uint32_t iteration     = 0;
  uint64_t entity_count  = 0;
  uint64_t changed_count = 0;
  double   churn         = 0.0;

  // true for the snapshot produced by the duplication resolver
  bool resolved = false;

  uint64_t committed_at_ms = 0;
};

} // namespace txcluster::db::model
