#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace backupmon::runtime::config {
class RuntimeConfig;
}

namespace backupmon::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"backup-monitor"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

bool InitializeMetrics(const backupmon::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

/*
  Import pipeline instruments. Without ENABLE_OTEL every call is a no-op.
*/
class Metrics {
 public:
  static Metrics& Instance();

  // outcome: "inserted" | "duplicate" | "rejected"
  void AddImportedRecords(std::string_view outcome, std::uint64_t count);
  void RecordImportPass(bool success, double duration_ms);
  void AddEvictedRecords(std::uint64_t count);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const backupmon::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownMetrics() {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::AddImportedRecords(std::string_view, std::uint64_t) {
}

inline void Metrics::RecordImportPass(bool, double) {
}

inline void Metrics::AddEvictedRecords(std::uint64_t) {
}
#endif

} // namespace backupmon::observability
