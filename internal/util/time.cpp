#include "time.hpp"

#include <cstdio>

namespace backupmon::util {

namespace {

bool IsDigit(char c) {
  return c >= '0' && c <= '9';
}

int Digits(std::string_view s, std::size_t pos, std::size_t count) {
  int value = 0;
  for (std::size_t i = pos; i < pos + count; ++i) {
    value = value * 10 + (s[i] - '0');
  }
  return value;
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

std::string FormatIsoTimestamp(TimePoint tp) {
  using namespace std::chrono;

  const auto day  = floor<days>(tp);
  const auto ymd  = year_month_day{day};
  const auto time = hh_mm_ss<seconds>{floor<seconds>(tp - day)};

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d", static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                static_cast<unsigned>(ymd.day()), static_cast<int>(time.hours().count()), static_cast<int>(time.minutes().count()),
                static_cast<int>(time.seconds().count()));
  return buf;
}

std::optional<std::string> NormalizeIsoTimestamp(std::string_view ts) {
  using namespace std::chrono;

  const auto digits_at = [&](std::size_t pos, std::size_t count) {
    if (ts.size() < pos + count) return false;
    for (std::size_t i = pos; i < pos + count; ++i) {
      if (!IsDigit(ts[i])) return false;
    }
    return true;
  };

  if (!digits_at(0, 4) || ts.size() < 10 || ts[4] != '-' || !digits_at(5, 2) || ts[7] != '-' || !digits_at(8, 2)) {
    return std::nullopt;
  }
  const year_month_day ymd{year{Digits(ts, 0, 4)}, month{static_cast<unsigned>(Digits(ts, 5, 2))},
                           day{static_cast<unsigned>(Digits(ts, 8, 2))}};
  if (!ymd.ok()) return std::nullopt;

  int         hh = 0, mm = 0, ss = 0;
  std::string fraction;
  std::size_t pos = 10;

  if (pos < ts.size()) {
    if (ts[pos] != 'T' && ts[pos] != 't' && ts[pos] != ' ') return std::nullopt;
    if (!digits_at(pos + 1, 2) || ts.size() < pos + 6 || ts[pos + 3] != ':' || !digits_at(pos + 4, 2)) return std::nullopt;
    hh  = Digits(ts, pos + 1, 2);
    mm  = Digits(ts, pos + 4, 2);
    pos += 6;

    if (pos < ts.size() && ts[pos] == ':') {
      if (!digits_at(pos + 1, 2)) return std::nullopt;
      ss  = Digits(ts, pos + 1, 2);
      pos += 3;

      if (pos < ts.size() && (ts[pos] == '.' || ts[pos] == ',')) {
        ++pos;
        while (pos < ts.size() && IsDigit(ts[pos])) fraction.push_back(ts[pos++]);
        if (fraction.empty()) return std::nullopt;
      }
    }
  }
  if (hh > 23 || mm > 59 || ss > 59) return std::nullopt;

  minutes offset{0};
  if (pos < ts.size()) {
    const char zone = ts[pos];
    if (zone == 'Z' || zone == 'z') {
      ++pos;
    } else if (zone == '+' || zone == '-') {
      if (!digits_at(pos + 1, 2)) return std::nullopt;
      const int oh = Digits(ts, pos + 1, 2);
      int       om = 0;
      pos += 3;
      if (pos < ts.size() && ts[pos] == ':') ++pos;
      if (pos < ts.size()) {
        if (!digits_at(pos, 2)) return std::nullopt;
        om  = Digits(ts, pos, 2);
        pos += 2;
      }
      if (oh > 23 || om > 59) return std::nullopt;
      offset = hours(oh) + minutes(om);
      if (zone == '-') offset = -offset;
    } else {
      return std::nullopt;
    }
  }
  if (pos != ts.size()) return std::nullopt;

  const TimePoint local{sys_days{ymd} + hours(hh) + minutes(mm) + seconds(ss)};
  std::string     normalized = FormatIsoTimestamp(local - offset);
  if (!fraction.empty()) normalized += "." + fraction;
  return normalized;
}

std::string CutoffForDays(TimePoint now, int days) {
  return FormatIsoTimestamp(now - std::chrono::hours(24) * days);
}

std::optional<std::string> IsoWeekKey(std::string_view timestamp) {
  using namespace std::chrono;

  if (timestamp.size() < 10) return std::nullopt;
  for (std::size_t i : {0, 1, 2, 3, 5, 6, 8, 9}) {
    if (!IsDigit(timestamp[i])) return std::nullopt;
  }
  if (timestamp[4] != '-' || timestamp[7] != '-') return std::nullopt;

  const year_month_day ymd{year{Digits(timestamp, 0, 4)}, month{static_cast<unsigned>(Digits(timestamp, 5, 2))},
                           day{static_cast<unsigned>(Digits(timestamp, 8, 2))}};
  if (!ymd.ok()) return std::nullopt;

  // The ISO week belongs to the year that contains its Thursday.
  const sys_days date{ymd};
  const auto     iso_weekday = weekday{date}.iso_encoding();
  const sys_days thursday    = date + days{4 - static_cast<int>(iso_weekday)};
  const auto     iso_year    = year_month_day{thursday}.year();
  const auto     week        = (thursday - sys_days{iso_year / January / 1}).count() / 7 + 1;

  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-W%02d", static_cast<int>(iso_year), static_cast<int>(week));
  return std::string(buf);
}

} // namespace backupmon::util
