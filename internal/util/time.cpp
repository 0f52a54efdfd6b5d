#include "time.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>

#include "errors.hpp"

namespace tempo::util {

namespace {

// Reads exactly `width` digits starting at pos.
bool ReadDigits(const std::string& text, std::size_t& pos, std::size_t width, int& out) {
  if (pos + width > text.size()) return false;
  int value = 0;
  for (std::size_t i = 0; i < width; ++i) {
    const char c = text[pos + i];
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    value = value * 10 + (c - '0');
  }
  pos += width;
  out = value;
  return true;
}

bool Expect(const std::string& text, std::size_t& pos, char c) {
  if (pos >= text.size() || text[pos] != c) return false;
  ++pos;
  return true;
}

[[noreturn]] void Malformed(const std::string& text) {
  throw ValidationError("malformed ISO-8601 timestamp: '" + text + "'");
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

int64_t ToUnixMicros(TimePoint tp) {
  return std::chrono::floor<std::chrono::microseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMicros(int64_t micros) {
  return TimePoint{} + std::chrono::microseconds(micros);
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

Duration FromSeconds(double seconds) {
  return Duration(static_cast<int64_t>(std::llround(seconds * 1e6)));
}

double ToSeconds(Duration duration) {
  return static_cast<double>(duration.count()) / 1e6;
}

TimePoint StartOfDayUtc(TimePoint tp) {
  return std::chrono::floor<std::chrono::days>(tp);
}

TimePoint ParseIso8601(const std::string& text) {
  std::size_t pos = 0;
  int         year = 0, month = 0, day = 0;
  if (!ReadDigits(text, pos, 4, year) || !Expect(text, pos, '-') || !ReadDigits(text, pos, 2, month) || !Expect(text, pos, '-') ||
      !ReadDigits(text, pos, 2, day)) {
    Malformed(text);
  }

  const std::chrono::year_month_day ymd{std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)},
                                        std::chrono::day{static_cast<unsigned>(day)}};
  if (!ymd.ok()) Malformed(text);

  int     hour = 0, minute = 0, second = 0;
  int64_t micros = 0;

  if (pos < text.size() && (text[pos] == 'T' || text[pos] == 't' || text[pos] == ' ')) {
    ++pos;
    if (!ReadDigits(text, pos, 2, hour) || !Expect(text, pos, ':') || !ReadDigits(text, pos, 2, minute)) {
      Malformed(text);
    }
    if (pos < text.size() && text[pos] == ':') {
      ++pos;
      if (!ReadDigits(text, pos, 2, second)) Malformed(text);
    }
    if (pos < text.size() && (text[pos] == '.' || text[pos] == ',')) {
      ++pos;
      int64_t     scale  = 100000;
      std::size_t digits = 0;
      while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        if (scale > 0) {
          micros += (text[pos] - '0') * scale;
          scale /= 10;
        }
        ++pos;
        ++digits;
      }
      if (digits == 0) Malformed(text);
    }
    if (hour > 23 || minute > 59 || second > 60) Malformed(text);
  }

  std::chrono::minutes offset{0};
  if (pos < text.size()) {
    const char sign = text[pos];
    if (sign == 'Z' || sign == 'z') {
      ++pos;
    } else if (sign == '+' || sign == '-') {
      ++pos;
      int off_h = 0, off_m = 0;
      if (!ReadDigits(text, pos, 2, off_h)) Malformed(text);
      if (pos < text.size() && text[pos] == ':') {
        // +hh: must carry its minutes
        ++pos;
        if (!ReadDigits(text, pos, 2, off_m)) Malformed(text);
      } else if (pos < text.size() && !ReadDigits(text, pos, 2, off_m)) {
        Malformed(text);
      }
      if (off_h > 23 || off_m > 59) Malformed(text);
      offset = std::chrono::hours(off_h) + std::chrono::minutes(off_m);
      if (sign == '-') offset = -offset;
    } else {
      Malformed(text);
    }
  }
  if (pos != text.size()) Malformed(text);

  // Local wall time minus its offset is the UTC instant.
  const auto local = std::chrono::sys_days{ymd} + std::chrono::hours(hour) + std::chrono::minutes(minute) + std::chrono::seconds(second) +
                     std::chrono::microseconds(micros);
  return TimePoint{local - offset};
}

std::string FormatIso8601(TimePoint tp) {
  const auto micros_tp = std::chrono::floor<std::chrono::microseconds>(tp);
  const auto day_tp    = std::chrono::floor<std::chrono::days>(micros_tp);
  const std::chrono::year_month_day ymd{day_tp};
  const std::chrono::hh_mm_ss       hms{micros_tp - day_tp};

  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d.%06lldZ", static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                static_cast<unsigned>(ymd.day()), static_cast<int>(hms.hours().count()), static_cast<int>(hms.minutes().count()),
                static_cast<int>(hms.seconds().count()), static_cast<long long>(hms.subseconds().count()));
  return buf;
}

} // namespace tempo::util
