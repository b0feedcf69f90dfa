#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"

using backupmon::factory::Build;
using backupmon::observability::BoolField;
using backupmon::observability::IntField;
using backupmon::observability::StringField;

static volatile std::sig_atomic_t g_running        = 1;
static volatile std::sig_atomic_t g_import_request = 0;

void HandleSignal(int) {
  g_running = 0;
}

void HandleImportSignal(int) {
  g_import_request = 1;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 1) {
    // defaults + environment only
  } else if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: backup-monitor [<config.yaml>] OR backup-monitor --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    backupmon::runtime::config::RuntimeConfig config;
    if (!config_path.empty()) config = backupmon::config::ConfigLoader::LoadFromYaml(config_path);

    backupmon::observability::InitializeMetrics(config);
    backupmon::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    BACKUPMON_LOG_INFO("Backup monitor configuration",
                       {StringField("config", config_path.empty() ? "<defaults>" : config_path),
                        StringField("database", config.database().has_memory() ? ":memory:" : app.settings.database_path),
                        StringField("metrics_file", app.settings.metrics_file),
                        IntField("import_interval_seconds", app.scheduler->Interval().count()),
                        IntField("retention_days", app.settings.retention_days),
                        BoolField("metrics_enabled", config.observability().metrics_enabled())});

    // Register signal handlers before starting the scheduler to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);
    std::signal(SIGUSR1, HandleImportSignal);

    app.scheduler->Start();
    BACKUPMON_LOG_INFO("Backup monitor started");

    while (g_running) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
      if (g_import_request) {
        g_import_request = 0;
        BACKUPMON_LOG_INFO("Manual import requested");
        app.scheduler->RequestImport();
      }
    }

    BACKUPMON_LOG_INFO("Shutting down backup monitor");

    app.scheduler->Stop();
    backupmon::observability::ShutdownLogging();
    backupmon::observability::ShutdownMetrics();
  } catch (const std::exception& e) {
    BACKUPMON_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    backupmon::observability::ShutdownLogging();
    backupmon::observability::ShutdownMetrics();
    return 2;
  }

  return 0;
}
