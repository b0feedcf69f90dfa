#include "aggregator.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>
#include <utility>

#include "internal/store/backup_store.hpp"

namespace backupmon::stats {

namespace {

constexpr const char* kUnknown = "unknown";

// Running mean of per-record ratios; zero-denominator records are skipped.
class RateMean {
 public:
  void Add(uint64_t bytes, uint64_t seconds) {
    if (seconds == 0) return;
    sum_ += Rate(bytes, seconds);
    ++count_;
  }

  double Value() const {
    return count_ == 0 ? 0.0 : sum_ / static_cast<double>(count_);
  }

 private:
  double   sum_   = 0.0;
  uint64_t count_ = 0;
};

} // namespace

double Rate(uint64_t bytes, uint64_t seconds) {
  if (seconds == 0) return 0.0;
  return static_cast<double>(bytes) / static_cast<double>(seconds);
}

Summary ComputeSummary(const std::vector<db::model::BackupRecord>& records) {
  Summary summary;

  uint64_t timed          = 0;
  double   duration_sum   = 0.0;
  double   size_sum       = 0.0;
  RateMean overall, archive, upload, volumes;

  for (const auto& r : records) {
    ++summary.total;
    if (r.success) ++summary.successful;

    if (r.duration_total == 0) continue;

    if (timed == 0) {
      summary.min_duration = r.duration_total;
      summary.max_duration = r.duration_total;
    } else {
      summary.min_duration = std::min(summary.min_duration, r.duration_total);
      summary.max_duration = std::max(summary.max_duration, r.duration_total);
    }
    ++timed;
    duration_sum += static_cast<double>(r.duration_total);
    size_sum += static_cast<double>(r.size_bytes);

    overall.Add(r.size_bytes, r.duration_total);
    archive.Add(r.size_bytes, r.duration_archive);
    upload.Add(r.size_bytes, r.duration_upload);
    volumes.Add(r.volume_bytes, r.duration_volumes);
  }

  summary.failed = summary.total - summary.successful;
  if (timed > 0) {
    summary.avg_duration   = duration_sum / static_cast<double>(timed);
    summary.avg_size_bytes = size_sum / static_cast<double>(timed);
  }
  summary.avg_rate_bps         = overall.Value();
  summary.avg_archive_rate_bps = archive.Value();
  summary.avg_upload_rate_bps  = upload.Value();
  summary.avg_volumes_rate_bps = volumes.Value();
  return summary;
}

std::vector<FailureTrend> ComputeFailureTrends(const std::vector<db::model::BackupRecord>& records) {
  // std::map keeps (period, category) ascending
  std::map<std::pair<std::string, std::string>, uint64_t> counts;

  for (const auto& r : records) {
    if (r.success) continue;

    auto period   = util::IsoWeekKey(r.timestamp).value_or(kUnknown);
    auto category = r.error_category.value_or(kUnknown);
    ++counts[{std::move(period), std::move(category)}];
  }

  std::vector<FailureTrend> trends;
  trends.reserve(counts.size());
  for (const auto& [key, count] : counts) {
    trends.push_back(FailureTrend{key.first, key.second, count});
  }
  return trends;
}

RecordView ToRecordView(const db::model::BackupRecord& record) {
  RecordView view;
  view.record           = record;
  view.rate_bps         = Rate(record.size_bytes, record.duration_total);
  view.archive_rate_bps = Rate(record.size_bytes, record.duration_archive);
  view.upload_rate_bps  = Rate(record.size_bytes, record.duration_upload);
  view.volumes_rate_bps = Rate(record.volume_bytes, record.duration_volumes);
  return view;
}

Aggregator::Aggregator(std::shared_ptr<store::BackupStore> store, util::ClockFn clock) : store_(std::move(store)), clock_(std::move(clock)) {
  if (!store_) throw std::invalid_argument("aggregator requires a store");
  if (!clock_) clock_ = util::Now;
}

std::vector<db::model::BackupRecord> Aggregator::Window(int window_days) {
  return store_->QueryWindow(util::CutoffForDays(clock_(), window_days));
}

Summary Aggregator::Summarize(int window_days) {
  return ComputeSummary(Window(window_days));
}

std::vector<FailureTrend> Aggregator::FailureTrends(int window_days) {
  return ComputeFailureTrends(Window(window_days));
}

std::vector<FailureDetail> Aggregator::RecentFailures(uint64_t limit) {
  std::vector<FailureDetail> out;
  for (auto& r : store_->QueryFailures(limit)) {
    out.push_back(FailureDetail{std::move(r.timestamp), std::move(r.backup_id), r.error_category.value_or(kUnknown),
                                std::move(r.error_message)});
  }
  return out;
}

std::vector<RecordView> Aggregator::RecentRecords(uint64_t limit) {
  std::vector<RecordView> out;
  for (const auto& r : store_->QueryRecent(limit)) out.push_back(ToRecordView(r));
  return out;
}

} // namespace backupmon::stats
