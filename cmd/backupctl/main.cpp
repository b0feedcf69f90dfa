#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/stats/units.hpp"
#include "internal/util/errors.hpp"

using google::protobuf::ListValue;
using google::protobuf::Struct;
using google::protobuf::Value;

namespace stats = backupmon::stats;

static void Usage() {
  std::cout << "Usage:\n"
            << "  backupctl [--config <file>] import\n"
            << "  backupctl [--config <file>] recent [limit]\n"
            << "  backupctl [--config <file>] summary [days]\n"
            << "  backupctl [--config <file>] failures [limit]\n"
            << "  backupctl [--config <file>] trends [days]\n";
}

static uint64_t ParseCount(const std::string& value, const char* what) {
  uint64_t   parsed = 0;
  const auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (ec != std::errc{} || end != value.data() + value.size() || parsed == 0) {
    throw backupmon::util::InvalidArgument(std::string("invalid ") + what + ": '" + value + "'");
  }
  return parsed;
}

static int ParseDays(const std::string& value) {
  const auto days = ParseCount(value, "days");
  if (days > 36500) throw backupmon::util::InvalidArgument("invalid days: '" + value + "'");
  return static_cast<int>(days);
}

// ------------------------------------------------------------
// JSON builders
// ------------------------------------------------------------

static void Set(Struct& out, const std::string& key, double value) {
  (*out.mutable_fields())[key].set_number_value(value);
}

static void Set(Struct& out, const std::string& key, const std::string& value) {
  (*out.mutable_fields())[key].set_string_value(value);
}

static void SetBool(Struct& out, const std::string& key, bool value) {
  (*out.mutable_fields())[key].set_bool_value(value);
}

static void SetOptional(Struct& out, const std::string& key, const std::optional<std::string>& value) {
  if (value) {
    Set(out, key, *value);
  } else {
    (*out.mutable_fields())[key].set_null_value(google::protobuf::NULL_VALUE);
  }
}

static void Print(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) throw std::runtime_error("JSON encoding failed: " + std::string(status.message()));
  std::cout << json;
}

static Struct ImportReportJson(const backupmon::ingest::ImportReport& report) {
  Struct out;
  Set(out, "inserted", static_cast<double>(report.inserted));
  Set(out, "duplicates", static_cast<double>(report.duplicates));
  Set(out, "rejected", static_cast<double>(report.rejected));
  Set(out, "evicted", static_cast<double>(report.evicted));
  Set(out, "imported_at", report.imported_at);
  return out;
}

static Struct RecordJson(const stats::RecordView& view) {
  const auto& r = view.record;

  Struct out;
  Set(out, "timestamp", r.timestamp);
  Set(out, "backup_id", r.backup_id);
  SetBool(out, "success", r.success);
  Set(out, "duration_total", static_cast<double>(r.duration_total));
  Set(out, "duration_snapshot", static_cast<double>(r.duration_snapshot));
  Set(out, "duration_archive", static_cast<double>(r.duration_archive));
  Set(out, "duration_volumes", static_cast<double>(r.duration_volumes));
  Set(out, "duration_upload", static_cast<double>(r.duration_upload));
  Set(out, "size_mib", static_cast<double>(stats::ToMebibytes(static_cast<double>(r.size_bytes))));
  Set(out, "volume_mib", static_cast<double>(stats::ToMebibytes(static_cast<double>(r.volume_bytes))));
  Set(out, "rate_mibps", stats::ToMebibytesPerSecond(view.rate_bps));
  Set(out, "archive_rate_mibps", stats::ToMebibytesPerSecond(view.archive_rate_bps));
  Set(out, "upload_rate_mibps", stats::ToMebibytesPerSecond(view.upload_rate_bps));
  Set(out, "volumes_rate_mibps", stats::ToMebibytesPerSecond(view.volumes_rate_bps));
  SetOptional(out, "error_category", r.error_category);
  SetOptional(out, "error_message", r.error_message);
  return out;
}

static Struct SummaryJson(const stats::Summary& s, int days) {
  Struct out;
  Set(out, "window_days", static_cast<double>(days));
  Set(out, "total", static_cast<double>(s.total));
  Set(out, "successful", static_cast<double>(s.successful));
  Set(out, "failed", static_cast<double>(s.failed));
  Set(out, "success_rate_percent", static_cast<double>(stats::SuccessRatePercent(s)));
  Set(out, "avg_duration", s.avg_duration);
  Set(out, "min_duration", static_cast<double>(s.min_duration));
  Set(out, "max_duration", static_cast<double>(s.max_duration));
  Set(out, "avg_size_mib", static_cast<double>(stats::ToMebibytes(s.avg_size_bytes)));
  Set(out, "avg_rate_mibps", stats::ToMebibytesPerSecond(s.avg_rate_bps));
  Set(out, "avg_archive_rate_mibps", stats::ToMebibytesPerSecond(s.avg_archive_rate_bps));
  Set(out, "avg_upload_rate_mibps", stats::ToMebibytesPerSecond(s.avg_upload_rate_bps));
  Set(out, "avg_volumes_rate_mibps", stats::ToMebibytesPerSecond(s.avg_volumes_rate_bps));
  return out;
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  std::string config_path;
  if (args.size() >= 2 && args[0] == "--config") {
    config_path = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }

  if (args.empty() || args.size() > 2) {
    Usage();
    return 1;
  }

  const std::string cmd = args[0];
  const std::string arg = args.size() == 2 ? args[1] : std::string();

  try {
    backupmon::runtime::config::RuntimeConfig config;
    if (!config_path.empty()) config = backupmon::config::ConfigLoader::LoadFromYaml(config_path);

    // stdout carries the JSON result; logs go to stderr
    spdlog::stderr_color_mt("backup-monitor");
    if (config.logging().level().empty()) config.mutable_logging()->set_level("warn");
    backupmon::observability::InitializeLogging(config);

    auto app = backupmon::factory::Build(config);

    // ------------------------------------------------------------

    if (cmd == "import") {
      if (!arg.empty()) throw backupmon::util::InvalidArgument("import takes no arguments");
      Print(ImportReportJson(app.importer->ImportFromSource()));
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "recent") {
      const uint64_t limit = arg.empty() ? stats::kDefaultRecentLimit : ParseCount(arg, "limit");

      ListValue out;
      for (const auto& view : app.aggregator->RecentRecords(limit)) {
        *out.add_values()->mutable_struct_value() = RecordJson(view);
      }
      Print(out);
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "summary") {
      const int days = arg.empty() ? stats::kDefaultWindowDays : ParseDays(arg);
      Print(SummaryJson(app.aggregator->Summarize(days), days));
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "failures") {
      const uint64_t limit = arg.empty() ? stats::kDefaultFailuresLimit : ParseCount(arg, "limit");

      ListValue out;
      for (const auto& failure : app.aggregator->RecentFailures(limit)) {
        Struct entry;
        Set(entry, "timestamp", failure.timestamp);
        Set(entry, "backup_id", failure.backup_id);
        Set(entry, "error_category", failure.error_category);
        SetOptional(entry, "error_message", failure.error_message);
        *out.add_values()->mutable_struct_value() = std::move(entry);
      }
      Print(out);
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "trends") {
      const int days = arg.empty() ? stats::kDefaultWindowDays : ParseDays(arg);

      ListValue out;
      for (const auto& trend : app.aggregator->FailureTrends(days)) {
        Struct entry;
        Set(entry, "period", trend.period_key);
        Set(entry, "category", trend.category);
        Set(entry, "count", static_cast<double>(trend.count));
        *out.add_values()->mutable_struct_value() = std::move(entry);
      }
      Print(out);
      return 0;
    }

    Usage();
    return 1;
  } catch (const backupmon::util::InvalidArgument& e) {
    std::cerr << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 2;
  }
}
