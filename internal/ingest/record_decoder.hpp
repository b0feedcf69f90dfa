#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "internal/db/model/backup_record.hpp"

namespace backupmon::ingest {

enum class RejectReason {
  kNone = 0,

  kMalformedJson,
  kNotAnObject,
  kMissingField,
  kInvalidField,
};

const char* ToString(RejectReason reason);

/*
  Outcome of decoding one metrics log line: a record, or the reason it
  was rejected. Never partially filled.
*/
struct RecordDecodeResult {
  std::optional<db::model::BackupRecord> record;

  RejectReason reason = RejectReason::kNone;
  std::string  detail;

  explicit operator bool() const {
    return record.has_value();
  }
};

/*
  Validating decode of one JSON line.

  Required: timestamp, backup_id, success, duration_total, size_bytes.
  Optional counters default to 0 when absent, null or "".
  Error fields are kept only for failed runs; a failed run without a
  category gets "unknown".
*/
RecordDecodeResult DecodeRecord(std::string_view line);

// True for lines that carry no record at all (empty or whitespace only).
bool IsBlankLine(std::string_view line);

} // namespace backupmon::ingest
