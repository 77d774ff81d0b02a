#include "factory.hpp"

#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#if TXCLUSTER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

namespace txcluster::factory {

std::shared_ptr<db::Repository> BuildRepository(const txcluster::runtime::config::StorageConfig& storage) {
  if (storage.has_sqlite()) {
#if TXCLUSTER_DB_SQLITE
    const auto& sqlite = storage.sqlite();
    const bool  wal    = sqlite.has_wal_mode() ? sqlite.wal_mode() : true;

    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), wal);
    db::sqlite::BootstrapSchema(*sqlite_db);

    TXCLUSTER_LOG_INFO("storage backend ready", {observability::StringField("backend", "sqlite"), observability::StringField("path", sqlite.path()),
                                                 observability::BoolField("wal", wal)});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw util::ConfigurationError("sqlite backend requested but not enabled at build time");
#endif
  }

  const uint64_t max_rows = storage.has_memory() ? storage.memory().max_rows() : 0;
  TXCLUSTER_LOG_INFO("storage backend ready", {observability::StringField("backend", "memory"),
                                               observability::IntField("max_rows", static_cast<int64_t>(max_rows))});
  return std::make_shared<db::memory::MemoryRepository>(max_rows);
}

Application Build(const txcluster::runtime::config::RuntimeConfig& config) {
  Application app;

  // validate before touching storage
  app.options    = config::ResolveOptions(config);
  app.repository = BuildRepository(config.storage());
  app.engine     = std::make_unique<core::ClusteringEngine>(app.repository, app.options);

  return app;
}

} // namespace txcluster::factory
