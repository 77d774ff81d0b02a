#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/config/options.hpp"
#include "internal/core/clustering_engine.hpp"
#include "internal/db/api/repository.hpp"

namespace txcluster::factory {

/*
  Application

  Everything one CLI invocation needs, built from the runtime config.
*/
struct Application {
  config::EngineOptions                   options;
  std::shared_ptr<db::Repository>         repository;
  std::unique_ptr<core::ClusteringEngine> engine;
};

/*
  Composition root: the only place that knows concrete repository types.
  Throws util::ConfigurationError for invalid or unsupported settings.
*/
std::shared_ptr<db::Repository> BuildRepository(const txcluster::runtime::config::StorageConfig& storage);

Application Build(const txcluster::runtime::config::RuntimeConfig& config);

} // namespace txcluster::factory
