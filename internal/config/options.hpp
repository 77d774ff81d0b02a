#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "config/config.pb.h"
#include "internal/util/retry.hpp"

namespace txcluster::config {

enum class SeedMode { kAuto, kComponents, kUnique };

const char* SeedModeName(SeedMode mode);

/*
  Validated, defaulted view of RuntimeConfig consumed by the engine.
  The protobuf message stays the on-disk representation.
*/
struct EngineOptions {
  // ingest
  uint32_t batch_size = 10000;
  bool     strict     = false;

  // clustering
  uint32_t                                 max_iterations          = 10;
  double                                   convergence_tolerance   = 0.01;
  double                                   duplication_threshold   = 0.3;
  SeedMode                                 seed_mode               = SeedMode::kAuto;
  uint64_t                                 components_max_entities = 1000000;
  uint64_t                                 self_vote_weight        = 0;
  std::optional<std::chrono::milliseconds> deadline;
  bool                                     retain_snapshots = false;
  bool                                     resume           = false;

  // workers
  uint32_t propagation_threads = 1;
  uint32_t writer_threads      = 2;

  util::RetryPolicy retry;
};

// Applies defaults and validates; throws util::ConfigurationError.
EngineOptions ResolveOptions(const txcluster::runtime::config::RuntimeConfig& config);

} // namespace txcluster::config
