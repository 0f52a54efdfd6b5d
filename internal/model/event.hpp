#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include "internal/util/time.hpp"

namespace tempo::model {

using EventId = int64_t;

/*
  A timestamped interval with an opaque payload.

  The event covers [timestamp, timestamp + duration]. `data` is carried
  as-is; the store never looks inside it.
*/
struct Event {
  std::optional<EventId> id;  // empty until persisted

  util::TimePoint timestamp{};
  util::Duration  duration{0};

  google::protobuf::Struct data;

  util::TimePoint End() const {
    return timestamp + duration;
  }
};

/*
  Write intents accepted by EventStore::InsertMany.

  Pending   -> bulk insert, backend assigns the id
  Persisted -> full overwrite of an existing event (same path as Replace)
*/
struct PendingEvent {
  Event event;
};

struct PersistedEvent {
  EventId id = 0;
  Event   event;
};

using EventWrite = std::variant<PendingEvent, PersistedEvent>;

// For callers holding events with a nullable id.
EventWrite ToWrite(Event event);

// Payload <-> JSON text. DataFromJson throws ValidationError unless the
// text is a JSON object.
google::protobuf::Struct DataFromJson(const std::string& json);
std::string              DataToJson(const google::protobuf::Struct& data);

// Equal timestamp, duration and payload (id ignored).
bool SameContent(const Event& a, const Event& b);

} // namespace tempo::model
