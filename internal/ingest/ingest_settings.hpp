#pragma once

#include <chrono>
#include <string>

namespace backupmon::ingest {

// Lower bound for the polling interval; smaller values are clamped.
inline constexpr std::chrono::seconds kMinImportInterval{60};

inline constexpr std::chrono::seconds kDefaultImportInterval{12 * 60 * 60};
inline constexpr int                  kDefaultRetentionDays = 90;

/*
  Resolved ingestion settings. Built once by the config layer and passed
  to the importer, scheduler and composition root by value.
*/
struct IngestSettings {
  std::string database_path = "/data/backups.db";
  std::string metrics_file  = "/data/metrics.jsonl";

  std::chrono::seconds import_interval = kDefaultImportInterval;
  int                  retention_days  = kDefaultRetentionDays;
};

} // namespace backupmon::ingest
