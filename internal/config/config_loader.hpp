#pragma once

#include <string>

#include "config/config.pb.h"
#include "internal/ingest/ingest_settings.hpp"

namespace backupmon::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf; unknown fields
  are rejected. A mistyped value in the ingest section is dropped with a
  warning so its default applies.
*/
class ConfigLoader {
 public:
  static backupmon::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  /*
    Resolves ingestion settings from environment overrides
    (BACKUPMON_IMPORT_INTERVAL_HOURS, BACKUPMON_RETENTION_DAYS,
    BACKUPMON_DB_PATH, BACKUPMON_METRICS_FILE), then the config, then
    defaults. Invalid values fall back to the default with a warning;
    this never throws.
  */
  static ingest::IngestSettings ResolveIngestSettings(const backupmon::runtime::config::RuntimeConfig& config);
};

} // namespace backupmon::config
