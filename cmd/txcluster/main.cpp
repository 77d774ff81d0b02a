#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/ingest/record_source.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace {

constexpr int kExitOk           = 0;
constexpr int kExitUsage        = 1;
constexpr int kExitConfig       = 2;
constexpr int kExitRuntimeError = 3;

struct Args {
  std::string config_path;
  std::string input_path;
  std::string output_dir;
};

void PrintUsage() {
  std::cerr << "Usage: txcluster --config <config.yaml> --input <records|-> --output <dir>" << std::endl;
}

bool ParseArgs(int argc, char** argv, Args* args) {
  for (int i = 1; i < argc; ++i) {
    std::string flag = argv[i];
    if (i + 1 >= argc) return false;

    if (flag == "--config") {
      args->config_path = argv[++i];
    } else if (flag == "--input") {
      args->input_path = argv[++i];
    } else if (flag == "--output") {
      args->output_dir = argv[++i];
    } else {
      return false;
    }
  }
  return !args->config_path.empty() && !args->input_path.empty() && !args->output_dir.empty();
}

} // namespace

int main(int argc, char** argv) {
  Args args;
  if (!ParseArgs(argc, argv, &args)) {
    PrintUsage();
    return kExitUsage;
  }

  // ------------------------------------------------------------
  // Load configuration
  // ------------------------------------------------------------
  txcluster::factory::Application app;
  try {
    auto config = txcluster::config::ConfigLoader::LoadFromYaml(args.config_path);
    txcluster::observability::InitializeLogging(config);
    app = txcluster::factory::Build(config);
  } catch (const txcluster::util::ConfigurationError& e) {
    std::cerr << "txcluster: configuration error: " << e.what() << std::endl;
    return kExitConfig;
  } catch (const std::exception& e) {
    std::cerr << "txcluster: startup failed: " << e.what() << std::endl;
    return kExitRuntimeError;
  }

  // ------------------------------------------------------------
  // Open input
  // ------------------------------------------------------------
  std::unique_ptr<txcluster::ingest::RecordSource> source;
  try {
    source = txcluster::ingest::OpenRecordSource(args.input_path);
  } catch (const txcluster::util::NotFound& e) {
    TXCLUSTER_LOG_ERROR("cannot open input", {txcluster::observability::StringField("error", e.what())});
    txcluster::observability::ShutdownLogging();
    return kExitUsage;
  }

  // ------------------------------------------------------------
  // Run
  // ------------------------------------------------------------
  try {
    TXCLUSTER_LOG_INFO("txcluster started", {txcluster::observability::StringField("input", args.input_path),
                                             txcluster::observability::StringField("output", args.output_dir)});

    auto report = app.engine->Run(source.get(), std::filesystem::path(args.output_dir));

    TXCLUSTER_LOG_INFO("txcluster finished", {txcluster::observability::IntField("clusters", report.clusters_size()),
                                              txcluster::observability::BoolField("converged", report.propagation().converged())});
  } catch (const std::exception& e) {
    TXCLUSTER_LOG_ERROR("fatal error", {txcluster::observability::StringField("error", e.what())});
    txcluster::observability::ShutdownLogging();
    return kExitRuntimeError;
  }

  txcluster::observability::ShutdownLogging();
  return kExitOk;
}
