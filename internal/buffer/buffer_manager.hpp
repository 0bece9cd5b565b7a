#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/chunk.hpp"
#include "internal/transform/transform_pipeline.hpp"
#include "internal/util/time.hpp"
#include "internal/worker/transform_pool.hpp"

namespace relay::buffer {

struct BufferOptions {
  uint64_t                  max_size_bytes  = 8192;
  double                    flush_threshold = 0.8;
  std::chrono::milliseconds flush_interval{1'000};
  bool                      compression_enabled = false;
  bool                      encryption_enabled  = false;
};

struct BufferStats {
  std::size_t     resident_chunks = 0;
  uint64_t        resident_bytes  = 0;
  util::TimePoint last_flush{};
  uint64_t        flush_count    = 0;
  uint64_t        flushed_chunks = 0;
  uint64_t        failed_flushes = 0;
};

// Count threshold rounds down, byte threshold rounds up.
uint64_t CountThreshold(const BufferOptions& options);
uint64_t ByteThreshold(const BufferOptions& options);

/*
  BufferManager

  One ordered, size-bounded chunk queue per open connection.

  Append flushes first when the new chunk would overflow max_size, and
  flushes after appending once resident count or bytes reach the
  threshold. A flush transforms every resident chunk on the transform
  pool (compress, then encrypt), writes the batch with a single
  SaveChunkBatch, and clears the queue. On failure the queue is kept
  intact for the next attempt.

  Flushes for one connection are serialized by that buffer's mutex,
  which is held across the store write. Close takes the buffer out of
  the map before its final flush, so no append can slip in between.
*/
class BufferManager {
 public:
  BufferManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<transform::TransformPipeline> pipeline,
                std::shared_ptr<worker::TransformPool> pool);

  // Record persisted alongside the connection on creation.
  static db::model::BufferRecord InitialRecord(const std::string& connection_id, const BufferOptions& options, util::TimePoint now);

  void Open(const std::string& connection_id, const BufferOptions& options, util::TimePoint now = util::Now());

  // Removes the buffer and runs its final flush in one step; later
  // appends throw ConnectionNotFound. True when nothing was left behind.
  bool Close(const std::string& connection_id);

  // True when a flush ran and succeeded during the call.
  bool Append(const std::string& connection_id, model::Chunk chunk);

  // True when the buffer is empty afterwards.
  bool Flush(const std::string& connection_id);

  // Flushes non-empty buffers idle past their flush interval. Returns
  // how many were flushed.
  std::size_t FlushStale(util::TimePoint now);

  std::optional<BufferStats> Stats(const std::string& connection_id) const;
  std::size_t                OpenCount() const;

 private:
  struct Buffer {
    std::mutex               mutex;
    std::string              connection_id;
    BufferOptions            options;
    std::deque<model::Chunk> chunks;
    uint64_t                 resident_bytes = 0;
    util::TimePoint          last_flush{};
    uint64_t                 flush_count    = 0;
    uint64_t                 flushed_chunks = 0;
    uint64_t                 failed_flushes = 0;
    bool                     closed         = false;
  };

  std::shared_ptr<Buffer> Find(const std::string& connection_id) const;

  bool                    FlushLocked(Buffer& buffer, util::TimePoint now);
  db::model::ChunkRecord  TransformChunk(const model::Chunk& chunk, const BufferOptions& options) const;
  std::vector<db::model::ChunkRecord> TransformAll(const Buffer& buffer) const;

  std::shared_ptr<db::Repository>               repository_;
  std::shared_ptr<transform::TransformPipeline> pipeline_;
  std::shared_ptr<worker::TransformPool>        pool_;

  mutable std::shared_mutex                                mutex_;
  std::unordered_map<std::string, std::shared_ptr<Buffer>> buffers_;
};

} // namespace relay::buffer
