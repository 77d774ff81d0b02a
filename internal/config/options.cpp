#include "options.hpp"

#include <limits>
#include <thread>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace txcluster::config {

using txcluster::runtime::config::RuntimeConfig;

namespace {

void Require(bool ok, const std::string& what) {
  if (!ok) {
    throw util::ConfigurationError(what);
  }
}

SeedMode ParseSeedMode(const std::string& s) {
  if (s.empty() || s == "auto") return SeedMode::kAuto;
  if (s == "components") return SeedMode::kComponents;
  if (s == "unique") return SeedMode::kUnique;
  throw util::ConfigurationError("clustering.seed_mode must be auto, components or unique, got '" + s + "'");
}

uint32_t DefaultPropagationThreads() {
  auto n = std::thread::hardware_concurrency();
  return n == 0 ? 1 : n;
}

} // namespace

const char* SeedModeName(SeedMode mode) {
  switch (mode) {
    case SeedMode::kAuto:
      return "auto";
    case SeedMode::kComponents:
      return "components";
    case SeedMode::kUnique:
      return "unique";
  }
  return "unknown";
}

EngineOptions ResolveOptions(const RuntimeConfig& config) {
  EngineOptions o;

  // ---------------- ingest ----------------
  const auto& ingest = config.ingest();
  if (ingest.has_batch_size()) {
    Require(ingest.batch_size() >= 1, "ingest.batch_size must be >= 1");
    o.batch_size = ingest.batch_size();
  }
  o.strict = ingest.strict();

  // ---------------- clustering ----------------
  const auto& c = config.clustering();
  if (c.has_max_iterations()) {
    Require(c.max_iterations() >= 1, "clustering.max_iterations must be >= 1");
    // the resolved snapshot takes the iteration after the last one
    Require(c.max_iterations() < std::numeric_limits<uint32_t>::max(), "clustering.max_iterations is too large");
    o.max_iterations = c.max_iterations();
  }
  if (c.has_convergence_tolerance()) {
    Require(c.convergence_tolerance() >= 0.0 && c.convergence_tolerance() <= 1.0,
            "clustering.convergence_tolerance must be in [0, 1]");
    o.convergence_tolerance = c.convergence_tolerance();
  }
  if (c.has_duplication_threshold()) {
    Require(c.duplication_threshold() > 0.0 && c.duplication_threshold() <= 1.0,
            "clustering.duplication_threshold must be in (0, 1]");
    o.duplication_threshold = c.duplication_threshold();
  }
  o.seed_mode = ParseSeedMode(c.seed_mode());
  if (c.has_components_max_entities()) {
    o.components_max_entities = c.components_max_entities();
  }
  if (c.has_self_vote_weight()) {
    o.self_vote_weight = c.self_vote_weight();
  }
  if (c.has_deadline()) {
    auto budget = util::FromProto(c.deadline());
    Require(budget.count() > 0, "clustering.deadline must be positive");
    o.deadline = budget;
  }
  o.retain_snapshots = c.retain_snapshots();
  o.resume           = c.resume();

  // ---------------- workers ----------------
  const auto& w = config.workers();
  o.propagation_threads = DefaultPropagationThreads();
  if (w.has_propagation_threads()) {
    Require(w.propagation_threads() >= 1, "workers.propagation_threads must be >= 1");
    o.propagation_threads = w.propagation_threads();
  }
  if (w.has_writer_threads()) {
    Require(w.writer_threads() >= 1, "workers.writer_threads must be >= 1");
    o.writer_threads = w.writer_threads();
  }

  // ---------------- retry ----------------
  const auto& r = config.retry();
  if (r.has_max_attempts()) {
    Require(r.max_attempts() >= 1, "retry.max_attempts must be >= 1");
    o.retry.max_attempts = r.max_attempts();
  }
  if (r.has_initial_backoff()) {
    o.retry.initial_backoff = util::FromProto(r.initial_backoff());
    Require(o.retry.initial_backoff.count() >= 0, "retry.initial_backoff must not be negative");
  }
  if (r.has_max_backoff()) {
    o.retry.max_backoff = util::FromProto(r.max_backoff());
  }
  Require(o.retry.max_backoff >= o.retry.initial_backoff, "retry.max_backoff must be >= retry.initial_backoff");

  // ---------------- storage ----------------
  if (config.storage().has_sqlite()) {
    Require(!config.storage().sqlite().path().empty(), "storage.sqlite.path must be set");
  }
  Require(!o.resume || config.storage().has_sqlite(), "clustering.resume requires a persistent storage backend");

  return o;
}

} // namespace txcluster::config
