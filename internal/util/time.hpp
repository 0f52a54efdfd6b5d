#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace tempo::util {

/*
  Time utilities. Single place to control the clock source.

  Every instant in the store is UTC. system_clock counts from the Unix
  epoch in UTC, so a TimePoint never carries a local offset; offsets only
  exist in text and are removed by ParseIso8601.

  Stored resolution is microseconds.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Duration  = std::chrono::microseconds;

// Injectable clock, used wherever a component needs "now".
using NowFn = std::function<TimePoint()>;

TimePoint Now();

int64_t   ToUnixMicros(TimePoint tp);
TimePoint FromUnixMicros(int64_t micros);
uint64_t  ToUnixMillis(TimePoint tp);

Duration FromSeconds(double seconds);
double   ToSeconds(Duration duration);

// Midnight UTC of the calendar day containing tp.
TimePoint StartOfDayUtc(TimePoint tp);

// Accepts "YYYY-MM-DD", "YYYY-MM-DDTHH:MM:SS[.ffffff]" (space also allowed
// as separator) with an optional "Z", "+HH:MM", "+HHMM" or "+HH" suffix.
// Text without an offset is read as UTC. Throws ValidationError.
TimePoint ParseIso8601(const std::string& text);

// Always UTC, e.g. "2024-03-01T09:30:00.250000Z".
std::string FormatIso8601(TimePoint tp);

} // namespace tempo::util
