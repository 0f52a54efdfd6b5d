#pragma once

#include <optional>

#include "internal/model/event.hpp"
#include "internal/util/time.hpp"

namespace tempo::core {

// Query window; either bound may be open.
struct TimeRange {
  std::optional<util::TimePoint> start;
  std::optional<util::TimePoint> end;
};

// timestamp <= end (if given) and timestamp + duration >= start (if given).
bool Overlaps(const model::Event& event, const TimeRange& range);

// Cuts the event to the window. Payload and id are untouched.
model::Event Clip(model::Event event, const TimeRange& range);

} // namespace tempo::core
