#include "time.hpp"

#include <cstdio>
#include <ctime>

namespace practicedb::util {

namespace {

// days since 1970-01-01 for a proleptic Gregorian date
int64_t DaysFromCivil(int64_t y, unsigned m, unsigned d) {
  y -= m <= 2;
  const int64_t  era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

std::tm ToUtc(TimePoint tp) {
  const std::time_t secs = Clock::to_time_t(tp);
  std::tm           out{};
  gmtime_r(&secs, &out);
  return out;
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::string ToIso8601(TimePoint tp) {
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
  auto       ms     = millis % 1000;
  auto       secs   = TimePoint{} + std::chrono::seconds(millis / 1000);
  if (ms < 0) {
    ms += 1000;
    secs -= std::chrono::seconds(1);
  }

  const std::tm utc = ToUtc(secs);
  char          buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                utc.tm_hour, utc.tm_min, utc.tm_sec, static_cast<int>(ms));
  return buf;
}

std::string NowIso8601() {
  return ToIso8601(Now());
}

std::optional<TimePoint> ParseIso8601(const std::string& text) {
  int year = 0, month = 0, day = 0;
  int consumed = 0;
  if (std::sscanf(text.c_str(), "%4d-%2d-%2d%n", &year, &month, &day, &consumed) != 3 || consumed != 10) {
    return std::nullopt;
  }
  if (month < 1 || month > 12 || day < 1 || day > 31) {
    return std::nullopt;
  }

  int64_t     seconds = DaysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day)) * 86400;
  int64_t     millis  = 0;
  std::size_t pos     = 10;

  if (pos < text.size() && (text[pos] == 'T' || text[pos] == ' ')) {
    int hour = 0, minute = 0, second = 0;
    int n    = 0;
    if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d%n", &hour, &minute, &n) != 2) {
      return std::nullopt;
    }
    pos += 1 + n;
    if (pos < text.size() && text[pos] == ':') {
      if (std::sscanf(text.c_str() + pos + 1, "%2d%n", &second, &n) != 1) {
        return std::nullopt;
      }
      pos += 1 + n;
    }
    if (pos < text.size() && text[pos] == '.') {
      ++pos;
      int digits = 0;
      while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
        if (digits < 3) {
          millis = millis * 10 + (text[pos] - '0');
        }
        ++digits;
        ++pos;
      }
      for (; digits < 3; ++digits) millis *= 10;
    }
    seconds += hour * 3600 + minute * 60 + second;

    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
      const int sign = text[pos] == '+' ? 1 : -1;
      int       oh = 0, om = 0;
      if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d", &oh, &om) != 2) {
        return std::nullopt;
      }
      seconds -= sign * (oh * 3600 + om * 60);
    }
  }

  return TimePoint{} + std::chrono::seconds(seconds) + std::chrono::milliseconds(millis);
}

std::string FormatDate(TimePoint tp, int offset_days) {
  const std::tm utc = ToUtc(tp + std::chrono::hours(24 * offset_days));
  char          buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday);
  return buf;
}

} // namespace practicedb::util
