#pragma once

#include <cmath>
#include <cstdint>

#include "aggregator.hpp"

namespace backupmon::stats {

// Presentation conversions. 1 MiB = 1048576 bytes.

inline constexpr double kBytesPerMebibyte = 1024.0 * 1024.0;

// MiB/s rounded to 2 decimals
inline double ToMebibytesPerSecond(double bytes_per_second) {
  return std::round(bytes_per_second / kBytesPerMebibyte * 100.0) / 100.0;
}

// whole MiB, rounded down
inline uint64_t ToMebibytes(double bytes) {
  if (bytes <= 0.0) return 0;
  return static_cast<uint64_t>(std::floor(bytes / kBytesPerMebibyte));
}

// integer percent, rounded down; 0 for an empty window
inline uint64_t SuccessRatePercent(const Summary& summary) {
  if (summary.total == 0) return 0;
  return summary.successful * 100 / summary.total;
}

} // namespace backupmon::stats
