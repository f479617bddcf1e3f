#pragma once

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>

namespace Common {

/// Wall-clock time as nanoseconds since the UTC epoch
using EpochNanos = int64_t;

constexpr EpochNanos NANOS_PER_SECOND = 1'000'000'000LL;
constexpr EpochNanos NANOS_PER_MINUTE = 60 * NANOS_PER_SECOND;
constexpr EpochNanos NANOS_PER_HOUR = 60 * NANOS_PER_MINUTE;

constexpr auto hoursToNanos(int64_t hours) noexcept -> EpochNanos {
  return hours * NANOS_PER_HOUR;
}

constexpr auto secondsToNanos(int64_t seconds) noexcept -> EpochNanos {
  return seconds * NANOS_PER_SECOND;
}

// Get nanoseconds using CLOCK_REALTIME for wall clock
inline auto getWallClockNanos() noexcept -> EpochNanos {
  struct timespec ts;
  clock_gettime(CLOCK_REALTIME, &ts);
  return static_cast<EpochNanos>(ts.tv_sec) * NANOS_PER_SECOND + static_cast<EpochNanos>(ts.tv_nsec);
}

/// Parses ISO-8601 date-times: "YYYY-MM-DD[T| ]HH:MM:SS[.frac][Z|+HH:MM|-HH:MM|+HHMM]".
/// A timestamp without an offset is taken as UTC.
inline auto parseIso8601(const char* text, EpochNanos* out) noexcept -> bool {
  if (!text || !out) return false;

  int year, month, day, hour, minute, second;
  char sep;
  int consumed = 0;
  if (std::sscanf(text, "%4d-%2d-%2d%c%2d:%2d:%2d%n",
                  &year, &month, &day, &sep, &hour, &minute, &second, &consumed) != 7) {
    return false;
  }
  if (sep != 'T' && sep != 't' && sep != ' ') return false;
  if (month < 1 || month > 12 || day < 1 || day > 31 ||
      hour > 23 || minute > 59 || second > 60) {
    return false;
  }

  const char* p = text + consumed;

  int64_t frac_nanos = 0;
  if (*p == '.') {
    ++p;
    int64_t scale = 100'000'000;
    while (*p >= '0' && *p <= '9') {
      frac_nanos += (*p - '0') * scale;
      scale /= 10;
      ++p;
    }
  }

  int64_t offset_seconds = 0;
  if (*p == 'Z' || *p == 'z') {
    ++p;
  } else if (*p == '+' || *p == '-') {
    const int sign = (*p == '-') ? -1 : 1;
    ++p;
    int off_h = 0, off_m = 0;
    if (std::sscanf(p, "%2d:%2d", &off_h, &off_m) == 2) {
      p += 5;
    } else if (std::sscanf(p, "%2d%2d", &off_h, &off_m) == 2) {
      p += 4;
    } else if (std::sscanf(p, "%2d", &off_h) == 1) {
      p += 2;
    } else {
      return false;
    }
    offset_seconds = sign * (off_h * 3600 + off_m * 60);
  }
  if (*p != '\0') return false;

  struct tm tm_time;
  std::memset(&tm_time, 0, sizeof(tm_time));
  tm_time.tm_year = year - 1900;
  tm_time.tm_mon = month - 1;
  tm_time.tm_mday = day;
  tm_time.tm_hour = hour;
  tm_time.tm_min = minute;
  tm_time.tm_sec = second;

  const time_t utc_seconds = timegm(&tm_time);
  *out = (static_cast<EpochNanos>(utc_seconds) - offset_seconds) * NANOS_PER_SECOND + frac_nanos;
  return true;
}

// Fast date/time formatting without allocation
class FastDateTime {
public:
  /// RFC 3339 UTC form: YYYY-MM-DDTHH:MM:SSZ, with microseconds when present
  static auto formatIso8601(EpochNanos nanos, char* buffer, size_t size) noexcept -> void {
    EpochNanos seconds = nanos / NANOS_PER_SECOND;
    EpochNanos rem = nanos % NANOS_PER_SECOND;
    if (rem < 0) {
      rem += NANOS_PER_SECOND;
      --seconds;
    }
    const time_t t = static_cast<time_t>(seconds);

    struct tm tm_time;
    gmtime_r(&t, &tm_time);

    const auto micros = static_cast<unsigned>(rem / 1000);
    if (micros == 0) {
      std::snprintf(buffer, size, "%04d-%02d-%02dT%02d:%02d:%02dZ",
                    tm_time.tm_year + 1900, tm_time.tm_mon + 1, tm_time.tm_mday,
                    tm_time.tm_hour, tm_time.tm_min, tm_time.tm_sec);
    } else {
      std::snprintf(buffer, size, "%04d-%02d-%02dT%02d:%02d:%02d.%06uZ",
                    tm_time.tm_year + 1900, tm_time.tm_mon + 1, tm_time.tm_mday,
                    tm_time.tm_hour, tm_time.tm_min, tm_time.tm_sec, micros);
    }
  }

  /// Compact local-time stamp for file names: YYYYmmdd_HHMMSS
  static auto formatFileStamp(char* buffer, size_t size) noexcept -> void {
    const time_t now = std::time(nullptr);
    struct tm tm_time;
    localtime_r(&now, &tm_time);
    std::strftime(buffer, size, "%Y%m%d_%H%M%S", &tm_time);
  }
};

} // namespace Common
