#pragma once

#include <cstdint>
#include <string>

namespace txcluster::db::model {

// Persisted ingestion summary, used to restart without re-reading input.
struct RunStateRecord {
  bool     adjacency_complete   = false;
  uint64_t records_read         = 0;
  uint64_t malformed_records    = 0;
  uint64_t distinct_cardholders = 0;
  uint64_t distinct_merchants   = 0;
  uint64_t total_edge_weight    = 0;

  // seed mode that produced snapshot 0; empty until seeding commits
  std::string seed_mode;

  uint64_t updated_at_ms = 0;
};

} // namespace txcluster::db::model
