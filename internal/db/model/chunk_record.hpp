#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace relay::db::model {

/*
  Flushed chunk row (stream_chunks), keyed by (connection_id, sequence).

  data is the transformed payload. compression names the codec that
  framed it ("none" when stored raw); key_epoch is set only when the
  data is encrypted. checksum is SHA-256 hex of the untransformed
  payload.
*/
struct ChunkRecord {
  std::string                  id;
  std::string                  connection_id;
  uint64_t                     sequence = 0;
  std::string                  type;
  std::string                  data;
  std::string                  compression = "none";
  std::optional<uint32_t>      key_epoch;
  uint64_t                     original_size = 0;
  uint64_t                     size_bytes    = 0;
  std::string                  checksum;
  uint64_t                     timestamp_ms = 0;
};

} // namespace relay::db::model
