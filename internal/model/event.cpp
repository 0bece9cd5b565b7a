#include "event.hpp"

#include "internal/util/uuid.hpp"
#include "relay/v1.hpp"

namespace relay::model {

std::string_view ToString(EventType type) {
  switch (type) {
    case EventType::kStart:
      return "start";
    case EventType::kChunk:
      return "chunk";
    case EventType::kHeartbeat:
      return "heartbeat";
    case EventType::kComplete:
      return "complete";
    case EventType::kError:
      return "error";
  }
  return "unknown";
}

Event MakeEvent(EventType type, google::protobuf::Struct data) {
  Event event;
  event.type      = type;
  event.data      = std::move(data);
  event.timestamp = util::Now();
  event.event_id  = util::RandomHex(8);
  return event;
}

relay::v1::StreamEvent ToProto(const Event& event) {
  relay::v1::StreamEvent out;
  out.set_event_id(event.event_id);
  switch (event.type) {
    case EventType::kStart:
      out.set_type(relay::v1::EVENT_TYPE_START);
      break;
    case EventType::kChunk:
      out.set_type(relay::v1::EVENT_TYPE_CHUNK);
      break;
    case EventType::kHeartbeat:
      out.set_type(relay::v1::EVENT_TYPE_HEARTBEAT);
      break;
    case EventType::kComplete:
      out.set_type(relay::v1::EVENT_TYPE_COMPLETE);
      break;
    case EventType::kError:
      out.set_type(relay::v1::EVENT_TYPE_ERROR);
      break;
  }
  *out.mutable_data()      = event.data;
  *out.mutable_timestamp() = util::ToProto(event.timestamp);
  return out;
}

} // namespace relay::model
