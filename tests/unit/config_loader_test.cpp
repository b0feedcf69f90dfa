#include "internal/config/config_loader.hpp"

#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using backupmon::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "backupmon_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void ClearEnv() {
  ::unsetenv("BACKUPMON_IMPORT_INTERVAL_HOURS");
  ::unsetenv("BACKUPMON_RETENTION_DAYS");
  ::unsetenv("BACKUPMON_DB_PATH");
  ::unsetenv("BACKUPMON_METRICS_FILE");
}

void TestLoadsAllSections() {
  const auto yaml_path = WriteYaml("all_sections",
                                   R"(logging:
  level: debug
database:
  sqlite:
    path: "/var/lib/backup monitor/backups.db"
ingest:
  metrics_file: /var/log/backup/metrics.jsonl
  import_interval_hours: 0.5
  retention_days: 30
observability:
  metrics_enabled: false
  transport: OTLP_TRANSPORT_HTTP
  metrics:
    collection_interval_ms: 5000
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.database().sqlite().path() == "/var/lib/backup monitor/backups.db");
  assert(config.ingest().metrics_file() == "/var/log/backup/metrics.jsonl");
  assert(config.ingest().has_import_interval_hours());
  assert(config.ingest().import_interval_hours() == 0.5);
  assert(config.ingest().retention_days() == 30);
  assert(config.observability().transport() == backupmon::runtime::config::OTLP_TRANSPORT_HTTP);
  assert(config.observability().metrics().collection_interval_ms() == 5000);

  ClearEnv();
  const auto settings = ConfigLoader::ResolveIngestSettings(config);
  assert(settings.database_path == "/var/lib/backup monitor/backups.db");
  assert(settings.metrics_file == "/var/log/backup/metrics.jsonl");
  assert(settings.import_interval == std::chrono::seconds(1800));
  assert(settings.retention_days == 30);
}

void TestEmptyFileMeansDefaults() {
  const auto yaml_path = WriteYaml("empty", "");

  ClearEnv();
  const auto settings = ConfigLoader::ResolveIngestSettings(ConfigLoader::LoadFromYaml(yaml_path.string()));
  assert(settings.database_path == "/data/backups.db");
  assert(settings.metrics_file == "/data/metrics.jsonl");
  assert(settings.import_interval == std::chrono::hours(12));
  assert(settings.retention_days == 90);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(ingest:
  metrics_file: /tmp/metrics.jsonl
  import_every: 3
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMistypedIngestValuesFallBackToDefaults() {
  const auto yaml_path = WriteYaml("mistyped_ingest",
                                   R"(logging:
  level: warn
ingest:
  metrics_file: /tmp/metrics.jsonl
  import_interval_hours: soon
  retention_days: 0.5
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "warn");
  assert(config.ingest().metrics_file() == "/tmp/metrics.jsonl");
  assert(!config.ingest().has_import_interval_hours());
  assert(!config.ingest().has_retention_days());

  ClearEnv();
  const auto settings = ConfigLoader::ResolveIngestSettings(config);
  assert(settings.metrics_file == "/tmp/metrics.jsonl");
  assert(settings.import_interval == std::chrono::hours(12));
  assert(settings.retention_days == 90);
}

void TestIngestSectionThatIsNotAMappingUsesDefaults() {
  const auto yaml_path = WriteYaml("scalar_ingest", "ingest: nightly\n");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(!config.ingest().has_retention_days());
  assert(config.ingest().metrics_file().empty());
}

void TestMissingFileIsAnError() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml((std::filesystem::temp_directory_path() / "backupmon_no_such_config.yaml").string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestInvalidRetentionFallsBackToDefault() {
  ClearEnv();

  backupmon::runtime::config::RuntimeConfig config;
  config.mutable_ingest()->set_retention_days(0);
  assert(ConfigLoader::ResolveIngestSettings(config).retention_days == 90);

  config.mutable_ingest()->set_retention_days(-5);
  assert(ConfigLoader::ResolveIngestSettings(config).retention_days == 90);

  config.mutable_ingest()->set_retention_days(400);
  assert(ConfigLoader::ResolveIngestSettings(config).retention_days == 400);

  ::setenv("BACKUPMON_RETENTION_DAYS", "forever", 1);
  assert(ConfigLoader::ResolveIngestSettings(config).retention_days == 90);

  ::setenv("BACKUPMON_RETENTION_DAYS", "7.5", 1);
  assert(ConfigLoader::ResolveIngestSettings(config).retention_days == 90);
  ClearEnv();
}

void TestInvalidIntervalFallsBackToDefault() {
  ClearEnv();

  backupmon::runtime::config::RuntimeConfig config;
  config.mutable_ingest()->set_import_interval_hours(2);

  ::setenv("BACKUPMON_IMPORT_INTERVAL_HOURS", "often", 1);
  assert(ConfigLoader::ResolveIngestSettings(config).import_interval == std::chrono::hours(12));

  ::setenv("BACKUPMON_IMPORT_INTERVAL_HOURS", "nan", 1);
  assert(ConfigLoader::ResolveIngestSettings(config).import_interval == std::chrono::hours(12));
  ClearEnv();

  assert(ConfigLoader::ResolveIngestSettings(config).import_interval == std::chrono::hours(2));
}

void TestEnvironmentOverridesFile() {
  ClearEnv();

  backupmon::runtime::config::RuntimeConfig config;
  config.mutable_database()->mutable_sqlite()->set_path("/from/config.db");
  config.mutable_ingest()->set_metrics_file("/from/config.jsonl");
  config.mutable_ingest()->set_import_interval_hours(24);
  config.mutable_ingest()->set_retention_days(10);

  ::setenv("BACKUPMON_DB_PATH", "/from/env.db", 1);
  ::setenv("BACKUPMON_METRICS_FILE", "/from/env.jsonl", 1);
  ::setenv("BACKUPMON_IMPORT_INTERVAL_HOURS", "1", 1);
  ::setenv("BACKUPMON_RETENTION_DAYS", "14", 1);

  const auto settings = ConfigLoader::ResolveIngestSettings(config);
  assert(settings.database_path == "/from/env.db");
  assert(settings.metrics_file == "/from/env.jsonl");
  assert(settings.import_interval == std::chrono::hours(1));
  assert(settings.retention_days == 14);
  ClearEnv();
}

} // namespace

int main() {
  TestLoadsAllSections();
  TestEmptyFileMeansDefaults();
  TestUnknownFieldsAreRejected();
  TestMistypedIngestValuesFallBackToDefaults();
  TestIngestSectionThatIsNotAMappingUsesDefaults();
  TestMissingFileIsAnError();
  TestInvalidRetentionFallsBackToDefault();
  TestInvalidIntervalFallsBackToDefault();
  TestEnvironmentOverridesFile();

  std::cout << "backupmon_unit_config_loader: pass\n";
  return 0;
}
