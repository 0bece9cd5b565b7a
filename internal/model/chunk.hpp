#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <google/protobuf/struct.pb.h>

#include "internal/util/time.hpp"

namespace relay::v1 {
class Fragment;
}

namespace relay::model {

enum class ChunkType : std::uint8_t {
  kContent  = 0,
  kMetadata = 1,
  kControl  = 2,
};

std::string_view         ToString(ChunkType type);
std::optional<ChunkType> ParseChunkType(std::string_view value);

struct Usage {
  uint32_t prompt_tokens     = 0;
  uint32_t completion_tokens = 0;
  uint32_t total_tokens      = 0;
};

// One record pulled from the upstream generation sequence.
struct Fragment {
  std::string                content;
  std::string                delta;
  std::optional<std::string> finish_reason;
  std::optional<Usage>       usage;
};

Fragment FromProto(const relay::v1::Fragment& fragment);

// {content, delta, finishReason?, usage?}
google::protobuf::Struct FragmentToStruct(const Fragment& fragment);

/*
  Chunk

  One ordered unit of a connection's stream. payload holds the fragment
  record as JSON until flush, after which the stored copy is an opaque
  transformed blob.
*/
struct Chunk {
  std::string                id;
  std::string                connection_id;
  uint64_t                   sequence = 0;
  ChunkType                  type     = ChunkType::kContent;
  std::string                payload;
  util::TimePoint            timestamp{};
  uint64_t                   size_bytes = 0;
  std::optional<std::string> checksum;
};

Chunk MakeChunk(const std::string& connection_id, uint64_t sequence, const Fragment& fragment, util::TimePoint now);

std::string ToJson(const google::protobuf::Struct& value);

} // namespace relay::model
