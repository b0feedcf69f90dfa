#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/backup_record.hpp"
#include "internal/util/time.hpp"

namespace backupmon::store {
class BackupStore;
}

namespace backupmon::stats {

inline constexpr int      kDefaultWindowDays    = 30;
inline constexpr uint64_t kDefaultRecentLimit   = 30;
inline constexpr uint64_t kDefaultFailuresLimit = 10;

/*
  Windowed statistics. Rates are bytes per second.

  Counts cover every record in the window. Duration, size and rate
  figures only use runs with duration_total > 0, and each rate average
  only runs whose own denominator is positive. Averages of rates are
  means of per-record ratios.
*/
struct Summary {
  uint64_t total      = 0;
  uint64_t successful = 0;
  uint64_t failed     = 0;

  double   avg_duration = 0.0;
  uint64_t min_duration = 0;
  uint64_t max_duration = 0;
  double   avg_size_bytes = 0.0;

  double avg_rate_bps         = 0.0; // size_bytes / duration_total
  double avg_archive_rate_bps = 0.0; // size_bytes / duration_archive
  double avg_upload_rate_bps  = 0.0; // size_bytes / duration_upload
  double avg_volumes_rate_bps = 0.0; // volume_bytes / duration_volumes
};

struct FailureTrend {
  std::string period_key; // "YYYY-Www" or "unknown"
  std::string category;
  uint64_t    count = 0;
};

struct FailureDetail {
  std::string                timestamp;
  std::string                backup_id;
  std::string                error_category;
  std::optional<std::string> error_message;
};

struct RecordView {
  db::model::BackupRecord record;

  double rate_bps         = 0.0;
  double archive_rate_bps = 0.0;
  double upload_rate_bps  = 0.0;
  double volumes_rate_bps = 0.0;
};

// bytes / seconds, 0 when seconds is 0
double Rate(uint64_t bytes, uint64_t seconds);

Summary                   ComputeSummary(const std::vector<db::model::BackupRecord>& records);
std::vector<FailureTrend> ComputeFailureTrends(const std::vector<db::model::BackupRecord>& records);
RecordView                ToRecordView(const db::model::BackupRecord& record);

/*
  Aggregator

  Read-only view over the store. Windows are anchored on the injected
  clock so tests can pin "now".
*/
class Aggregator {
 public:
  explicit Aggregator(std::shared_ptr<store::BackupStore> store, util::ClockFn clock = util::Now);

  Summary                    Summarize(int window_days = kDefaultWindowDays);
  std::vector<FailureTrend>  FailureTrends(int window_days = kDefaultWindowDays);
  std::vector<FailureDetail> RecentFailures(uint64_t limit = kDefaultFailuresLimit);
  std::vector<RecordView>    RecentRecords(uint64_t limit = kDefaultRecentLimit);

 private:
  std::vector<db::model::BackupRecord> Window(int window_days);

  std::shared_ptr<store::BackupStore> store_;
  util::ClockFn                       clock_;
};

} // namespace backupmon::stats
