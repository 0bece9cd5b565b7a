#pragma once

#include <cstdint>
#include <string>

namespace relay::db::model {

// One row per open connection (stream_buffers).
struct BufferRecord {
  std::string connection_id;
  uint64_t    max_size_bytes      = 0;
  double      flush_threshold     = 0.0;
  bool        compression_enabled = false;
  bool        encryption_enabled  = false;
  uint64_t    resident_chunks     = 0;
  uint64_t    resident_bytes      = 0;
  uint64_t    flush_count         = 0;
  uint64_t    last_flush_ms       = 0;
  uint64_t    updated_at_ms       = 0;
};

} // namespace relay::db::model
