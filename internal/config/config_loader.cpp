#include "config_loader.hpp"

#include <google/protobuf/descriptor.h>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <optional>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace backupmon::config {

using backupmon::observability::StringField;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

// The ingest section is read field by field: a mistyped value falls back to
// its default with a warning instead of failing startup. Unknown keys are
// still rejected.
static void ApplyIngestSection(const google::protobuf::Value& section, backupmon::runtime::config::IngestConfig* ingest) {
  if (section.kind_case() == google::protobuf::Value::kNullValue) {
    return;
  }
  if (section.kind_case() != google::protobuf::Value::kStructValue) {
    BACKUPMON_LOG_WARN("Config section is not a mapping, using defaults", {StringField("section", "ingest")});
    return;
  }

  const auto* descriptor = backupmon::runtime::config::IngestConfig::descriptor();
  for (const auto& [key, value] : section.struct_value().fields()) {
    if (!descriptor->FindFieldByName(key) && !descriptor->FindFieldByCamelcaseName(key)) {
      throw std::runtime_error("Invalid configuration: unknown field ingest." + key);
    }

    google::protobuf::Value single;
    (*single.mutable_struct_value()->mutable_fields())[key] = value;

    std::string json;
    backupmon::runtime::config::IngestConfig parsed;
    auto status = google::protobuf::util::MessageToJsonString(single, &json);
    if (status.ok()) {
      status = google::protobuf::util::JsonStringToMessage(json, &parsed);
    }
    if (!status.ok()) {
      BACKUPMON_LOG_WARN("Invalid config value, using default",
                         {StringField("field", "ingest." + key), StringField("error", std::string(status.message()))});
      continue;
    }
    ingest->MergeFrom(parsed);
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

backupmon::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  // An empty file is a valid "all defaults" config.
  if (yaml.IsNull()) {
    return {};
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::optional<google::protobuf::Value> ingest_section;
  if (json_value.kind_case() == google::protobuf::Value::kStructValue) {
    auto* fields = json_value.mutable_struct_value()->mutable_fields();
    if (auto it = fields->find("ingest"); it != fields->end()) {
      ingest_section = std::move(it->second);
      fields->erase(it);
    }
  }

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  backupmon::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  if (ingest_section) {
    ApplyIngestSection(*ingest_section, config.mutable_ingest());
  }

  return config;
}

// ------------------------------------------------------------
// Ingest settings
// ------------------------------------------------------------

namespace {

std::optional<std::string> Env(const char* name) {
  const char* value = std::getenv(name);
  if (!value) return std::nullopt;
  return std::string(value);
}

std::optional<double> ParseDouble(const std::string& text) {
  if (text.empty()) return std::nullopt;
  char*        endptr = nullptr;
  errno               = 0;
  const double value  = std::strtod(text.c_str(), &endptr);
  if (errno != 0 || !endptr || *endptr != '\0') return std::nullopt;
  return value;
}

std::optional<long long> ParseInteger(const std::string& text) {
  if (text.empty()) return std::nullopt;
  char*           endptr = nullptr;
  errno                  = 0;
  const long long value  = std::strtoll(text.c_str(), &endptr, 10);
  if (errno != 0 || !endptr || *endptr != '\0') return std::nullopt;
  return value;
}

std::chrono::seconds ResolveImportInterval(const backupmon::runtime::config::IngestConfig& ingest) {
  std::optional<double> hours;
  std::string           source = "config";

  if (auto env = Env("BACKUPMON_IMPORT_INTERVAL_HOURS")) {
    source = "BACKUPMON_IMPORT_INTERVAL_HOURS";
    hours  = ParseDouble(*env);
    if (!hours) {
      BACKUPMON_LOG_WARN("Invalid import interval, using default 12h", {StringField("source", source), StringField("value", *env)});
      return ingest::kDefaultImportInterval;
    }
  } else if (ingest.has_import_interval_hours()) {
    hours = ingest.import_interval_hours();
  }

  if (!hours) return ingest::kDefaultImportInterval;

  if (!std::isfinite(*hours)) {
    BACKUPMON_LOG_WARN("Invalid import interval, using default 12h", {StringField("source", source)});
    return ingest::kDefaultImportInterval;
  }

  // Below-floor values are clamped by the scheduler, which owns the floor.
  const double seconds = *hours * 60.0 * 60.0;
  if (seconds <= 0.0) return std::chrono::seconds(0);
  if (seconds >= static_cast<double>(std::numeric_limits<std::int32_t>::max())) {
    return std::chrono::seconds(std::numeric_limits<std::int32_t>::max());
  }
  return std::chrono::seconds(static_cast<std::int64_t>(seconds));
}

int ResolveRetentionDays(const backupmon::runtime::config::IngestConfig& ingest) {
  std::optional<long long> days;
  std::string              source = "config";

  if (auto env = Env("BACKUPMON_RETENTION_DAYS")) {
    source = "BACKUPMON_RETENTION_DAYS";
    days   = ParseInteger(*env);
    if (!days) {
      BACKUPMON_LOG_WARN("Invalid retention days, using default 90", {StringField("source", source), StringField("value", *env)});
      return ingest::kDefaultRetentionDays;
    }
  } else if (ingest.has_retention_days()) {
    days = ingest.retention_days();
  }

  if (!days) return ingest::kDefaultRetentionDays;

  if (*days < 1 || *days > 36500) {
    BACKUPMON_LOG_WARN("Retention days out of range, using default 90",
                       {StringField("source", source), StringField("value", std::to_string(*days))});
    return ingest::kDefaultRetentionDays;
  }
  return static_cast<int>(*days);
}

} // namespace

ingest::IngestSettings ConfigLoader::ResolveIngestSettings(const backupmon::runtime::config::RuntimeConfig& config) {
  ingest::IngestSettings settings;

  if (auto path = Env("BACKUPMON_DB_PATH"); path && !path->empty()) {
    settings.database_path = *path;
  } else if (config.database().has_sqlite() && !config.database().sqlite().path().empty()) {
    settings.database_path = config.database().sqlite().path();
  }

  if (auto path = Env("BACKUPMON_METRICS_FILE"); path && !path->empty()) {
    settings.metrics_file = *path;
  } else if (!config.ingest().metrics_file().empty()) {
    settings.metrics_file = config.ingest().metrics_file();
  }

  settings.import_interval = ResolveImportInterval(config.ingest());
  settings.retention_days  = ResolveRetentionDays(config.ingest());
  return settings;
}

} // namespace backupmon::config
