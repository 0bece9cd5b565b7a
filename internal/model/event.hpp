#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <google/protobuf/struct.pb.h>

#include "internal/util/time.hpp"

namespace relay::v1 {
class StreamEvent;
}

namespace relay::model {

enum class EventType : std::uint8_t {
  kStart     = 0,
  kChunk     = 1,
  kHeartbeat = 2,
  kComplete  = 3,
  kError     = 4,
};

std::string_view ToString(EventType type);

// Ephemeral; emitted to the connection's channel and never persisted.
struct Event {
  EventType                type = EventType::kHeartbeat;
  google::protobuf::Struct data;
  util::TimePoint          timestamp{};
  std::string              event_id;
};

// Stamps a fresh event id and the current time.
Event MakeEvent(EventType type, google::protobuf::Struct data);

relay::v1::StreamEvent ToProto(const Event& event);

} // namespace relay::model
