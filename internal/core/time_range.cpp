#include "time_range.hpp"

namespace tempo::core {

bool Overlaps(const model::Event& event, const TimeRange& range) {
  if (range.end.has_value() && event.timestamp > *range.end) return false;
  if (range.start.has_value() && event.End() < *range.start) return false;
  return true;
}

model::Event Clip(model::Event event, const TimeRange& range) {
  if (range.start.has_value() && event.timestamp < *range.start) {
    const auto end_point = event.End();
    event.timestamp      = *range.start;
    event.duration       = std::chrono::duration_cast<util::Duration>(end_point - *range.start);
  }
  if (range.end.has_value() && event.End() > *range.end) {
    event.duration = std::chrono::duration_cast<util::Duration>(*range.end - event.timestamp);
  }
  return event;
}

} // namespace tempo::core
