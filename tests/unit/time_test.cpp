#include "internal/util/time.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

namespace {

using namespace std::chrono;
using backupmon::util::TimePoint;

TimePoint At(year_month_day date, hours h, minutes m, seconds s) {
  return TimePoint{sys_days{date}} + h + m + s;
}

void TestFormatIsoTimestamp() {
  const auto tp = At(2026y / October / 16, hours(2), minutes(0), seconds(5)) + milliseconds(999);
  assert(backupmon::util::FormatIsoTimestamp(tp) == "2026-10-16T02:00:05");
}

void TestCutoffForDays() {
  const auto now = At(2026y / March / 1, hours(10), minutes(30), seconds(0));
  assert(backupmon::util::CutoffForDays(now, 1) == "2026-02-28T10:30:00");
  assert(backupmon::util::CutoffForDays(now, 90) == "2025-12-01T10:30:00");
}

void TestIsoWeekKey() {
  using backupmon::util::IsoWeekKey;

  assert(IsoWeekKey("2026-10-16T02:00:05+02:00") == std::string("2026-W42"));
  assert(IsoWeekKey("2026-01-01") == std::string("2026-W01"));
  // belongs to the last week of the previous ISO year
  assert(IsoWeekKey("2021-01-01T00:00:00") == std::string("2020-W53"));
  // belongs to the first week of the next ISO year
  assert(IsoWeekKey("2024-12-30T12:00:00") == std::string("2025-W01"));

  assert(!IsoWeekKey("yesterday").has_value());
  assert(!IsoWeekKey("2026-02-30T00:00:00").has_value());
  assert(!IsoWeekKey("2026-1-1").has_value());
}

void TestNormalizeIsoTimestamp() {
  using backupmon::util::NormalizeIsoTimestamp;

  assert(NormalizeIsoTimestamp("2026-10-16T02:00:05+02:00") == std::string("2026-10-16T00:00:05"));
  assert(NormalizeIsoTimestamp("2026-10-16T02:00:05Z") == std::string("2026-10-16T02:00:05"));
  assert(NormalizeIsoTimestamp("2026-10-16T02:00:05") == std::string("2026-10-16T02:00:05"));
  assert(NormalizeIsoTimestamp("2026-10-16 02:00") == std::string("2026-10-16T02:00:00"));
  assert(NormalizeIsoTimestamp("2026-10-16") == std::string("2026-10-16T00:00:00"));
  // crosses midnight and the year boundary
  assert(NormalizeIsoTimestamp("2026-12-31T22:00:00-0530") == std::string("2027-01-01T03:30:00"));
  assert(NormalizeIsoTimestamp("2026-03-01T01:00:00+03") == std::string("2026-02-28T22:00:00"));
  assert(NormalizeIsoTimestamp("2026-10-16T02:00:05.125+01:00") == std::string("2026-10-16T01:00:05.125"));

  assert(!NormalizeIsoTimestamp("yesterday").has_value());
  assert(!NormalizeIsoTimestamp("2026-02-30T00:00:00").has_value());
  assert(!NormalizeIsoTimestamp("2026-10-16T25:00:00").has_value());
  assert(!NormalizeIsoTimestamp("2026-10-16T02:00:05+2").has_value());
  assert(!NormalizeIsoTimestamp("2026-10-16T02:00:05 junk").has_value());
}

} // namespace

int main() {
  TestFormatIsoTimestamp();
  TestCutoffForDays();
  TestIsoWeekKey();
  TestNormalizeIsoTimestamp();

  std::cout << "backupmon_unit_time: pass\n";
  return 0;
}
