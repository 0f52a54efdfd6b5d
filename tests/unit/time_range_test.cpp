#include "internal/core/time_range.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

namespace {

using tempo::core::Clip;
using tempo::core::Overlaps;
using tempo::core::TimeRange;
using tempo::model::Event;
using tempo::util::Duration;
using tempo::util::FromUnixMicros;
using tempo::util::TimePoint;

TimePoint At(int64_t seconds) {
  return FromUnixMicros(seconds * 1'000'000);
}

Event MakeEvent(int64_t start_s, int64_t duration_s) {
  Event e;
  e.timestamp = At(start_s);
  e.duration  = std::chrono::seconds(duration_s);
  (*e.data.mutable_fields())["label"].set_string_value("x");
  return e;
}

void TestOverlapBoundariesAreInclusive() {
  const auto e = MakeEvent(100, 10);

  assert(Overlaps(e, TimeRange{}));
  assert(Overlaps(e, TimeRange{.start = At(110), .end = std::nullopt}));
  assert(Overlaps(e, TimeRange{.start = std::nullopt, .end = At(100)}));
  assert(!Overlaps(e, TimeRange{.start = At(111), .end = std::nullopt}));
  assert(!Overlaps(e, TimeRange{.start = std::nullopt, .end = At(99)}));
}

void TestClipInsideWindowIsUnchanged() {
  const auto e       = MakeEvent(200, 5);
  const auto clipped = Clip(e, TimeRange{.start = At(150), .end = At(250)});
  assert(clipped.timestamp == e.timestamp);
  assert(clipped.duration == e.duration);
}

void TestClipCutsBothEnds() {
  const auto head = Clip(MakeEvent(100, 10), TimeRange{.start = At(105), .end = At(150)});
  assert(head.timestamp == At(105));
  assert(head.duration == std::chrono::seconds(5));

  const auto tail = Clip(MakeEvent(100, 10), TimeRange{.start = At(90), .end = At(104)});
  assert(tail.timestamp == At(100));
  assert(tail.duration == std::chrono::seconds(4));

  const auto both = Clip(MakeEvent(100, 10), TimeRange{.start = At(102), .end = At(107)});
  assert(both.timestamp == At(102));
  assert(both.duration == std::chrono::seconds(5));
}

void TestClipKeepsIdAndPayload() {
  auto e = MakeEvent(100, 10);
  e.id   = 42;

  const auto clipped = Clip(e, TimeRange{.start = At(105), .end = std::nullopt});
  assert(clipped.id == 42);
  assert(clipped.data.fields().at("label").string_value() == "x");
}

void TestClipTouchingBoundaryGivesZeroDuration() {
  const auto clipped = Clip(MakeEvent(100, 10), TimeRange{.start = At(110), .end = std::nullopt});
  assert(clipped.timestamp == At(110));
  assert(clipped.duration == Duration(0));
}

} // namespace

int main() {
  TestOverlapBoundariesAreInclusive();
  TestClipInsideWindowIsUnchanged();
  TestClipCutsBothEnds();
  TestClipKeepsIdAndPayload();
  TestClipTouchingBoundaryGivesZeroDuration();

  std::cout << "tempo_store_unit_time_range: pass\n";
  return 0;
}
