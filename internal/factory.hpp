#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/ingest/import_scheduler.hpp"
#include "internal/ingest/importer.hpp"
#include "internal/ingest/ingest_settings.hpp"
#include "internal/stats/aggregator.hpp"
#include "internal/store/backup_store.hpp"

namespace backupmon::factory {

/*
  Application

  Owns all long-lived components used by the daemon and the CLI.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  ingest::IngestSettings settings;

  std::shared_ptr<db::Repository>    repository;
  std::shared_ptr<store::BackupStore> store;
  std::shared_ptr<ingest::Importer>  importer;
  std::shared_ptr<stats::Aggregator> aggregator;

  // built, not started
  std::shared_ptr<ingest::ImportScheduler> scheduler;
};

/*
  Build

  Constructs the whole backend from runtime config and brings the
  schema up to date.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const backupmon::runtime::config::RuntimeConfig& config);

} // namespace backupmon::factory
