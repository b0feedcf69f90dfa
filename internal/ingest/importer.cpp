#include "importer.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/store/backup_store.hpp"
#include "record_decoder.hpp"

namespace backupmon::ingest {

using observability::DoubleField;
using observability::IntField;
using observability::StringField;

namespace {

std::vector<std::string> ReadLines(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) throw std::runtime_error("cannot open metrics file: " + path.string());

  std::vector<std::string> lines;
  std::string              line;
  while (std::getline(in, line)) lines.push_back(std::move(line));
  if (in.bad()) throw std::runtime_error("read failed on metrics file: " + path.string());
  return lines;
}

double ElapsedMs(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

Importer::Importer(std::shared_ptr<store::BackupStore> store, IngestSettings settings, util::ClockFn clock)
    : store_(std::move(store)), settings_(std::move(settings)), clock_(std::move(clock)) {
  if (!store_) throw std::invalid_argument("importer requires a store");
  if (!clock_) clock_ = util::Now;
}

ImportReport Importer::ImportBatch(const std::vector<std::string>& lines) {
  std::scoped_lock lock(pass_mutex_);
  return RunPass(lines, clock_());
}

ImportReport Importer::ImportFromSource() {
  std::scoped_lock lock(pass_mutex_);

  const auto                started = clock_();
  const std::filesystem::path source(settings_.metrics_file);

  // a missing file is "no data yet"; the pass still runs eviction
  std::vector<std::string> lines;
  std::error_code          ec;
  if (std::filesystem::exists(source, ec)) {
    lines = ReadLines(source);
  } else {
    BACKUPMON_LOG_INFO("Metrics file not found, nothing to import", {StringField("path", settings_.metrics_file)});
  }

  return RunPass(lines, started);
}

ImportReport Importer::RunPass(const std::vector<std::string>& lines, util::TimePoint started) {
  auto& metrics    = observability::Metrics::Instance();
  auto  pass_start = std::chrono::steady_clock::now();

  ImportReport report;
  report.imported_at = util::FormatIsoTimestamp(started);

  std::vector<db::model::BackupRecord> records;
  records.reserve(lines.size());

  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (IsBlankLine(lines[i])) continue;

    auto decoded = DecodeRecord(lines[i]);
    if (!decoded) {
      ++report.rejected;
      BACKUPMON_LOG_WARN("Skipping invalid metrics line", {IntField("line", static_cast<std::int64_t>(i + 1)),
                                                           StringField("reason", ToString(decoded.reason)),
                                                           StringField("detail", decoded.detail)});
      continue;
    }
    records.push_back(std::move(*decoded.record));
  }

  try {
    report.inserted   = store_->UpsertAllIfAbsent(records);
    report.duplicates = records.size() - report.inserted;
    report.evicted    = store_->EvictOlderThan(util::CutoffForDays(started, settings_.retention_days));
  } catch (const std::exception&) {
    metrics.RecordImportPass(false, ElapsedMs(pass_start));
    throw;
  }

  metrics.AddImportedRecords("inserted", report.inserted);
  metrics.AddImportedRecords("duplicate", report.duplicates);
  metrics.AddImportedRecords("rejected", report.rejected);
  metrics.AddEvictedRecords(report.evicted);
  const double elapsed_ms = ElapsedMs(pass_start);
  metrics.RecordImportPass(true, elapsed_ms);

  BACKUPMON_LOG_INFO("Import pass finished", {IntField("inserted", static_cast<std::int64_t>(report.inserted)),
                                              IntField("duplicates", static_cast<std::int64_t>(report.duplicates)),
                                              IntField("rejected", static_cast<std::int64_t>(report.rejected)),
                                              IntField("evicted", static_cast<std::int64_t>(report.evicted)),
                                              DoubleField("duration_ms", elapsed_ms)});
  return report;
}

} // namespace backupmon::ingest
