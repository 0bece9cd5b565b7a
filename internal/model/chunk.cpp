#include "chunk.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/util/uuid.hpp"
#include "relay/v1.hpp"

namespace relay::model {

std::string_view ToString(ChunkType type) {
  switch (type) {
    case ChunkType::kContent:
      return "content";
    case ChunkType::kMetadata:
      return "metadata";
    case ChunkType::kControl:
      return "control";
  }
  return "content";
}

std::optional<ChunkType> ParseChunkType(std::string_view value) {
  if (value == "content") return ChunkType::kContent;
  if (value == "metadata") return ChunkType::kMetadata;
  if (value == "control") return ChunkType::kControl;
  return std::nullopt;
}

Fragment FromProto(const relay::v1::Fragment& fragment) {
  Fragment out;
  out.content = fragment.content();
  out.delta   = fragment.delta();
  if (!fragment.finish_reason().empty()) {
    out.finish_reason = fragment.finish_reason();
  }
  if (fragment.has_usage()) {
    out.usage = Usage{fragment.usage().prompt_tokens(), fragment.usage().completion_tokens(), fragment.usage().total_tokens()};
  }
  return out;
}

google::protobuf::Struct FragmentToStruct(const Fragment& fragment) {
  google::protobuf::Struct out;
  auto&                    fields = *out.mutable_fields();
  fields["content"].set_string_value(fragment.content);
  fields["delta"].set_string_value(fragment.delta);
  if (fragment.finish_reason) {
    fields["finishReason"].set_string_value(*fragment.finish_reason);
  }
  if (fragment.usage) {
    auto& usage = *fields["usage"].mutable_struct_value()->mutable_fields();
    usage["promptTokens"].set_number_value(fragment.usage->prompt_tokens);
    usage["completionTokens"].set_number_value(fragment.usage->completion_tokens);
    usage["totalTokens"].set_number_value(fragment.usage->total_tokens);
  }
  return out;
}

std::string ToJson(const google::protobuf::Struct& value) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(value, &json);
  if (!status.ok()) {
    throw std::runtime_error("failed to serialize JSON: " + std::string(status.message()));
  }
  return json;
}

Chunk MakeChunk(const std::string& connection_id, uint64_t sequence, const Fragment& fragment, util::TimePoint now) {
  Chunk chunk;
  chunk.id            = util::NewId();
  chunk.connection_id = connection_id;
  chunk.sequence      = sequence;
  chunk.type          = ChunkType::kContent;
  chunk.payload       = ToJson(FragmentToStruct(fragment));
  chunk.timestamp     = now;
  chunk.size_bytes    = chunk.payload.size();
  return chunk;
}

} // namespace relay::model
