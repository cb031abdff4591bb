// File: src/core/util/time_format.cpp
#include "nm/core/util/time_format.hpp"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <string>

namespace nm {
namespace {

using Millis = std::chrono::duration<std::int64_t, std::milli>;
using SysMs = std::chrono::time_point<std::chrono::system_clock, Millis>;

// Reads exactly n digits at s[pos]. Returns -1 on any non-digit or short input.
int read_digits(std::string_view s, std::size_t pos, std::size_t n) {
  if (pos + n > s.size()) return -1;
  int v = 0;
  for (std::size_t i = 0; i < n; ++i) {
    const char c = s[pos + i];
    if (c < '0' || c > '9') return -1;
    v = v * 10 + (c - '0');
  }
  return v;
}

Result<TimestampMs> bad(std::string_view text, const char* why) {
  return Result<TimestampMs>::err(
      Status::parse_error("invalid timestamp '" + std::string(text) + "': " + why));
}

struct Civil {
  int year;
  unsigned month;
  unsigned day;
  int hour;
  int minute;
  int second;
  int millis;
};

Civil to_civil(TimestampMs t) {
  namespace chr = std::chrono;
  const SysMs tp{Millis{t.ms}};
  const chr::sys_days day = chr::floor<chr::days>(tp);
  const chr::year_month_day ymd{day};
  const std::int64_t ms_of_day = (tp - SysMs(day)).count();

  Civil c{};
  c.year = static_cast<int>(ymd.year());
  c.month = static_cast<unsigned>(ymd.month());
  c.day = static_cast<unsigned>(ymd.day());
  c.hour = static_cast<int>(ms_of_day / 3'600'000);
  c.minute = static_cast<int>((ms_of_day / 60'000) % 60);
  c.second = static_cast<int>((ms_of_day / 1'000) % 60);
  c.millis = static_cast<int>(ms_of_day % 1'000);
  return c;
}

}  // namespace

Result<TimestampMs> parse_timestamp(std::string_view text) {
  namespace chr = std::chrono;

  if (text.size() < 10) return bad(text, "too short");
  const int year = read_digits(text, 0, 4);
  const int month = read_digits(text, 5, 2);
  const int day = read_digits(text, 8, 2);
  if (year < 0 || month < 0 || day < 0 || text[4] != '-' || text[7] != '-') {
    return bad(text, "expected YYYY-MM-DD");
  }

  const chr::year_month_day ymd{chr::year{year}, chr::month{static_cast<unsigned>(month)},
                                chr::day{static_cast<unsigned>(day)}};
  if (!ymd.ok()) return bad(text, "date out of range");

  int hour = 0;
  int minute = 0;
  int second = 0;
  int millis = 0;
  std::int64_t offset_ms = 0;

  std::size_t pos = 10;
  if (pos < text.size()) {
    if (text[pos] != 'T' && text[pos] != ' ') return bad(text, "expected 'T' or ' ' after date");
    hour = read_digits(text, 11, 2);
    minute = read_digits(text, 14, 2);
    second = read_digits(text, 17, 2);
    if (hour < 0 || minute < 0 || second < 0 || text[13] != ':' || text[16] != ':') {
      return bad(text, "expected HH:MM:SS");
    }
    if (hour > 23 || minute > 59 || second > 59) return bad(text, "time out of range");
    pos = 19;

    if (pos < text.size() && text[pos] == '.') {
      ++pos;
      int scale = 100;
      std::size_t ndigits = 0;
      while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
        if (scale > 0) {
          millis += (text[pos] - '0') * scale;
          scale /= 10;
        }
        ++pos;
        ++ndigits;
      }
      if (ndigits == 0) return bad(text, "empty fraction");
    }

    if (pos < text.size()) {
      const char z = text[pos];
      if (z == 'Z' || z == 'z') {
        ++pos;
      } else if (z == '+' || z == '-') {
        const int oh = read_digits(text, pos + 1, 2);
        std::size_t mpos = pos + 3;
        if (mpos < text.size() && text[mpos] == ':') ++mpos;
        const int om = read_digits(text, mpos, 2);
        if (oh < 0 || om < 0 || oh > 23 || om > 59) return bad(text, "bad UTC offset");
        offset_ms = (static_cast<std::int64_t>(oh) * 60 + om) * 60'000;
        if (z == '-') offset_ms = -offset_ms;
        pos = mpos + 2;
      }
    }
  }
  if (pos != text.size()) return bad(text, "trailing characters");

  const chr::sys_days days{ymd};
  const std::int64_t day_ms =
      chr::duration_cast<Millis>(days.time_since_epoch()).count();
  const std::int64_t tod_ms =
      ((static_cast<std::int64_t>(hour) * 60 + minute) * 60 + second) * 1'000 + millis;

  // Local time = UTC + offset.
  return Result<TimestampMs>::ok(TimestampMs{day_ms + tod_ms - offset_ms});
}

std::string format_timestamp(TimestampMs t) {
  const Civil c = to_civil(t);
  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d.%03dZ", c.year, c.month, c.day,
                c.hour, c.minute, c.second, c.millis);
  return buf;
}

std::string format_minute(TimestampMs t) {
  const Civil c = to_civil(t);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d", c.year, c.month, c.day, c.hour,
                c.minute);
  return buf;
}

}  // namespace nm
