#include "internal/stats/aggregator.hpp"

#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/stats/units.hpp"
#include "internal/store/backup_store.hpp"

namespace {

using namespace std::chrono;
using backupmon::db::model::BackupRecord;
using backupmon::stats::Aggregator;

const auto kNow = backupmon::util::TimePoint{sys_days{2026y / October / 16}} + hours(12);

std::shared_ptr<backupmon::store::BackupStore> MakeStore() {
  return std::make_shared<backupmon::store::BackupStore>(std::make_shared<backupmon::db::memory::MemoryRepository>());
}

Aggregator MakeAggregator(const std::shared_ptr<backupmon::store::BackupStore>& store) {
  return Aggregator(store, [] { return kNow; });
}

BackupRecord Run(const std::string& id, const std::string& timestamp, bool success, uint64_t duration_total, uint64_t size_bytes) {
  BackupRecord r;
  r.backup_id      = id;
  r.timestamp      = timestamp;
  r.success        = success;
  r.duration_total = duration_total;
  r.size_bytes     = size_bytes;
  return r;
}

BackupRecord Failure(const std::string& id, const std::string& timestamp, std::optional<std::string> category) {
  auto r           = Run(id, timestamp, false, 0, 0);
  r.error_category = std::move(category);
  r.error_message  = "failed: " + id;
  return r;
}

void TestArchiveRateSkipsZeroDenominators() {
  auto store = MakeStore();

  auto fast             = Run("fast", "2026-10-15T02:00:00", true, 200, 104857600);
  fast.duration_archive = 100;
  auto empty            = Run("empty", "2026-10-15T03:00:00", true, 50, 0);
  store->UpsertAllIfAbsent({fast, empty});

  const auto summary = MakeAggregator(store).Summarize(30);
  assert(summary.total == 2);
  assert(backupmon::stats::ToMebibytesPerSecond(summary.avg_archive_rate_bps) == 1.0);
  // mean of 0.5 MiB/s and 0 MiB/s
  assert(backupmon::stats::ToMebibytesPerSecond(summary.avg_rate_bps) == 0.25);
  assert(summary.avg_upload_rate_bps == 0.0);
  assert(summary.avg_volumes_rate_bps == 0.0);
}

void TestSuccessRateAndCounts() {
  auto store = MakeStore();
  for (int i = 0; i < 5; ++i) {
    store->UpsertIfAbsent(Run("ok-" + std::to_string(i), "2026-10-1" + std::to_string(i) + "T01:00:00", true, 100 + i * 10, 1000));
  }
  store->UpsertIfAbsent(Failure("bad-1", "2026-10-12T05:00:00", "archive"));
  store->UpsertIfAbsent(Failure("bad-2", "2026-10-13T05:00:00", std::nullopt));

  const auto summary = MakeAggregator(store).Summarize(30);
  assert(summary.total == 7);
  assert(summary.successful == 5);
  assert(summary.failed == 2);
  assert(backupmon::stats::SuccessRatePercent(summary) == 71);

  // failed runs with zero duration stay out of duration statistics
  assert(summary.min_duration == 100);
  assert(summary.max_duration == 140);
  assert(summary.avg_duration == 120.0);
  assert(summary.avg_size_bytes == 1000.0);
}

void TestEmptyWindowIsAllZero() {
  auto store = MakeStore();
  store->UpsertIfAbsent(Run("old", "2026-08-01T00:00:00", true, 100, 1000));

  const auto summary = MakeAggregator(store).Summarize(30);
  assert(summary.total == 0);
  assert(summary.successful == 0);
  assert(summary.failed == 0);
  assert(summary.avg_duration == 0.0);
  assert(summary.min_duration == 0);
  assert(summary.max_duration == 0);
  assert(summary.avg_rate_bps == 0.0);
  assert(backupmon::stats::SuccessRatePercent(summary) == 0);

  // the wider window sees it
  assert(MakeAggregator(store).Summarize(120).total == 1);
}

void TestFailureTrendsGroupByIsoWeekAndCategory() {
  auto store = MakeStore();
  store->UpsertAllIfAbsent({
      Failure("a", "2026-10-05T01:00:00", "upload"), // W41
      Failure("b", "2026-10-06T01:00:00", "upload"), // W41
      Failure("c", "2026-10-07T01:00:00", "archive"), // W41
      Failure("d", "2026-10-12T01:00:00", std::nullopt), // W42
      Run("e", "2026-10-12T02:00:00", true, 10, 10),
      Failure("f", "2026-08-01T01:00:00", "upload"), // outside window
  });

  const auto trends = MakeAggregator(store).FailureTrends(30);
  assert(trends.size() == 3);
  assert(trends[0].period_key == "2026-W41" && trends[0].category == "archive" && trends[0].count == 1);
  assert(trends[1].period_key == "2026-W41" && trends[1].category == "upload" && trends[1].count == 2);
  assert(trends[2].period_key == "2026-W42" && trends[2].category == "unknown" && trends[2].count == 1);
}

void TestTrendsWithUnparseableDate() {
  const auto trends = backupmon::stats::ComputeFailureTrends({Failure("x", "sometime", "network")});
  assert(trends.size() == 1);
  assert(trends[0].period_key == "unknown");
  assert(trends[0].category == "network");
}

void TestRecentFailuresNewestFirst() {
  auto store = MakeStore();
  store->UpsertAllIfAbsent({
      Failure("old", "2026-10-01T01:00:00", "archive"),
      Run("ok", "2026-10-02T01:00:00", true, 10, 10),
      Failure("new", "2026-10-03T01:00:00", std::nullopt),
  });

  const auto failures = MakeAggregator(store).RecentFailures(10);
  assert(failures.size() == 2);
  assert(failures[0].backup_id == "new");
  assert(failures[0].error_category == "unknown");
  assert(failures[0].error_message == std::string("failed: new"));
  assert(failures[1].backup_id == "old");
  assert(failures[1].error_category == "archive");

  assert(MakeAggregator(store).RecentFailures(1).size() == 1);
}

void TestRecentRecordsAscendingWithRates() {
  auto store = MakeStore();
  auto a     = Run("a", "2026-10-14T01:00:00", true, 10, 1048576 * 10);
  a.duration_upload = 5;
  a.volume_bytes    = 1048576;
  a.duration_volumes = 4;
  store->UpsertAllIfAbsent({Run("c", "2026-10-15T01:00:00", true, 0, 5), a, Run("b", "2026-10-13T01:00:00", true, 1, 1)});

  const auto views = MakeAggregator(store).RecentRecords(2);
  assert(views.size() == 2);
  assert(views[0].record.backup_id == "a");
  assert(views[1].record.backup_id == "c");

  assert(backupmon::stats::ToMebibytesPerSecond(views[0].rate_bps) == 1.0);
  assert(backupmon::stats::ToMebibytesPerSecond(views[0].upload_rate_bps) == 2.0);
  assert(backupmon::stats::ToMebibytesPerSecond(views[0].volumes_rate_bps) == 0.25);
  assert(views[0].archive_rate_bps == 0.0);
  assert(views[1].rate_bps == 0.0);
}

void TestUnitConversions() {
  assert(backupmon::stats::ToMebibytesPerSecond(1572864.0) == 1.5);
  assert(backupmon::stats::ToMebibytesPerSecond(10000.0) == 0.01);
  assert(backupmon::stats::ToMebibytes(734003200.0) == 700);
  assert(backupmon::stats::ToMebibytes(1048575.0) == 0);
}

} // namespace

int main() {
  TestArchiveRateSkipsZeroDenominators();
  TestSuccessRateAndCounts();
  TestEmptyWindowIsAllZero();
  TestFailureTrendsGroupByIsoWeekAndCategory();
  TestTrendsWithUnparseableDate();
  TestRecentFailuresNewestFirst();
  TestRecentRecordsAscendingWithRates();
  TestUnitConversions();

  std::cout << "backupmon_unit_aggregator: pass\n";
  return 0;
}
