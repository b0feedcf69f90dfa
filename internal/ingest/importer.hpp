#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "ingest_settings.hpp"
#include "internal/util/time.hpp"

namespace backupmon::store {
class BackupStore;
}

namespace backupmon::ingest {

struct ImportReport {
  uint64_t inserted   = 0;
  uint64_t duplicates = 0;
  uint64_t rejected   = 0;
  uint64_t evicted    = 0;

  // ISO-8601 UTC time the pass started
  std::string imported_at;
};

/*
  Importer

  One pass = decode every line, insert the valid records in a single
  write transaction, then evict rows older than the retention window.

  Passes are serialized; scheduled and manual imports may be requested
  concurrently. Bad lines are logged and counted, never fatal. A storage
  failure other than a duplicate aborts the pass with util::StorageError.
*/
class Importer {
 public:
  Importer(std::shared_ptr<store::BackupStore> store, IngestSettings settings, util::ClockFn clock = util::Now);

  ImportReport ImportBatch(const std::vector<std::string>& lines);

  // Reads settings.metrics_file. A missing file imports nothing but still evicts.
  ImportReport ImportFromSource();

  const IngestSettings& Settings() const {
    return settings_;
  }

 private:
  ImportReport RunPass(const std::vector<std::string>& lines, util::TimePoint started);

  std::shared_ptr<store::BackupStore> store_;
  IngestSettings                      settings_;
  util::ClockFn                       clock_;

  std::mutex pass_mutex_;
};

} // namespace backupmon::ingest
