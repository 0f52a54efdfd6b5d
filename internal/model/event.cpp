#include "event.hpp"

#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/message_differencer.h>

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace tempo::model {

EventWrite ToWrite(Event event) {
  if (event.id.has_value()) {
    const auto id = *event.id;
    return PersistedEvent{.id = id, .event = std::move(event)};
  }
  return PendingEvent{.event = std::move(event)};
}

google::protobuf::Struct DataFromJson(const std::string& json) {
  google::protobuf::Struct data;
  if (json.empty()) {
    return data;
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &data, options);
  if (!status.ok()) {
    throw util::ValidationError("event data must be a JSON object: " + std::string(status.message()));
  }
  return data;
}

std::string DataToJson(const google::protobuf::Struct& data) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(data, &json);
  if (!status.ok()) {
    throw util::ValidationError("event data cannot be serialized: " + std::string(status.message()));
  }
  return json;
}

bool SameContent(const Event& a, const Event& b) {
  return a.timestamp == b.timestamp && a.duration == b.duration && google::protobuf::util::MessageDifferencer::Equals(a.data, b.data);
}

} // namespace tempo::model
