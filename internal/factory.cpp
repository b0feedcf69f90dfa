#include "factory.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_pool.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/observability/logging.hpp"

namespace backupmon::factory {

using observability::StringField;

namespace {

// Parent directories of the database and the metrics file must exist.
void EnsureParentDirectory(const std::string& path) {
  if (path.empty() || path == ":memory:") return;

  const auto parent = std::filesystem::path(path).parent_path();
  if (parent.empty()) return;

  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  if (ec) {
    BACKUPMON_LOG_WARN("Could not create directory", {StringField("path", parent.string()), StringField("error", ec.message())});
  }
}

std::shared_ptr<db::Repository> BuildRepository(const backupmon::runtime::config::RuntimeConfig& config,
                                                const ingest::IngestSettings&                   settings) {
  if (config.database().has_memory()) {
    BACKUPMON_LOG_INFO("Using in-memory backup store");
    return std::make_shared<db::memory::MemoryRepository>();
  }

  EnsureParentDirectory(settings.database_path);
  auto pool = std::make_shared<db::sqlite::SqlitePool>(settings.database_path);
  BACKUPMON_LOG_INFO("Using sqlite backup store", {StringField("path", settings.database_path)});
  return std::make_shared<db::sqlite::SqliteRepository>(std::move(pool));
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const backupmon::runtime::config::RuntimeConfig& config) {
  Application app;
  app.settings = backupmon::config::ConfigLoader::ResolveIngestSettings(config);

  EnsureParentDirectory(app.settings.metrics_file);

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config, app.settings);
  app.store      = std::make_shared<store::BackupStore>(app.repository);

  for (const auto& column : app.store->EnsureSchema()) {
    BACKUPMON_LOG_INFO("Added column to backups table", {StringField("column", column)});
  }

  // ------------------------------------------------------------------
  // Ingestion and statistics
  // ------------------------------------------------------------------
  app.importer   = std::make_shared<ingest::Importer>(app.store, app.settings);
  app.aggregator = std::make_shared<stats::Aggregator>(app.store);

  app.scheduler = std::make_shared<ingest::ImportScheduler>([importer = app.importer]() { return importer->ImportFromSource(); },
                                                            app.settings.import_interval);

  return app;
}

} // namespace backupmon::factory
