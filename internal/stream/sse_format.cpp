#include "sse_format.hpp"

#include "internal/model/chunk.hpp"
#include "internal/util/time.hpp"

namespace relay::stream {

std::string FormatSse(const model::Event& event) {
  std::string frame;
  frame.append("event: ").append(model::ToString(event.type)).append("\n");
  frame.append("id: ").append(event.event_id).append("\n");
  frame.append("data: ").append(model::ToJson(event.data)).append("\n");
  frame.append("timestamp: ").append(util::ToIso8601(event.timestamp)).append("\n\n");
  return frame;
}

} // namespace relay::stream
