#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace backupmon::util {

/*
  Time utilities. Single place to control the clock source.

  Stored record timestamps are ISO-8601 text and are compared
  lexicographically, so incoming timestamps are normalized to UTC and
  every cutoff produced here is formatted the same way (UTC, second
  precision, no zone suffix).
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Injectable clock; components default to Now().
using ClockFn = std::function<TimePoint()>;

TimePoint Now();

// "YYYY-MM-DDTHH:MM:SS"
std::string FormatIsoTimestamp(TimePoint tp);

// Rewrites an ISO-8601 timestamp as UTC "YYYY-MM-DDTHH:MM:SS[.fff]".
// Accepts a bare date, a 'T' or space separator, optional seconds and
// fraction, and a "Z" / "+HH:MM" / "-HHMM" / "+HH" zone. A timestamp
// without a zone is taken as UTC. nullopt when the text is not ISO-8601.
std::optional<std::string> NormalizeIsoTimestamp(std::string_view timestamp);

// Cutoff string for "everything older than `days` before `now`".
std::string CutoffForDays(TimePoint now, int days);

// ISO-8601 week key ("2026-W42") of the calendar date leading the timestamp.
// nullopt when the timestamp does not start with YYYY-MM-DD.
std::optional<std::string> IsoWeekKey(std::string_view timestamp);

} // namespace backupmon::util
