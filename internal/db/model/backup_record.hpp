#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace backupmon::db::model {

/*
  Persistent backup run row.

  IMPORTANT:
  - backup_id is the dedup key; rows are never updated after insert.
  - timestamp is ISO-8601 text; lexicographic order == chronological order.
  - error fields are only set for failed runs.
*/

struct BackupRecord {
  std::string timestamp;
  std::string backup_id;
  bool        success = false;

  // seconds
  uint64_t duration_total    = 0;
  uint64_t duration_snapshot = 0;
  uint64_t duration_archive  = 0;
  uint64_t duration_volumes  = 0;
  uint64_t duration_upload   = 0;

  uint64_t size_bytes   = 0;
  uint64_t volume_bytes = 0; // subset of size_bytes

  std::optional<std::string> error_category;
  std::optional<std::string> error_message;
};

inline bool operator==(const BackupRecord& a, const BackupRecord& b) {
  return a.timestamp == b.timestamp && a.backup_id == b.backup_id && a.success == b.success && a.duration_total == b.duration_total &&
         a.duration_snapshot == b.duration_snapshot && a.duration_archive == b.duration_archive &&
         a.duration_volumes == b.duration_volumes && a.duration_upload == b.duration_upload && a.size_bytes == b.size_bytes &&
         a.volume_bytes == b.volume_bytes && a.error_category == b.error_category && a.error_message == b.error_message;
}

} // namespace backupmon::db::model
