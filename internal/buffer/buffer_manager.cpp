#include "buffer_manager.hpp"

#include <cmath>
#include <future>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/transform/checksum.hpp"
#include "internal/util/errors.hpp"

namespace relay::buffer {

namespace {

void ThrowIfError(const db::Result& result, const std::string& what) {
  if (!result) {
    throw util::FlushFailure(what + ": " + result.Describe());
  }
}

} // namespace

uint64_t CountThreshold(const BufferOptions& options) {
  const auto threshold = static_cast<uint64_t>(std::floor(static_cast<double>(options.max_size_bytes) * options.flush_threshold));
  return threshold == 0 ? 1 : threshold;
}

uint64_t ByteThreshold(const BufferOptions& options) {
  const auto threshold = static_cast<uint64_t>(std::ceil(static_cast<double>(options.max_size_bytes) * options.flush_threshold));
  return threshold == 0 ? 1 : threshold;
}

BufferManager::BufferManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<transform::TransformPipeline> pipeline,
                             std::shared_ptr<worker::TransformPool> pool)
    : repository_(std::move(repository)), pipeline_(std::move(pipeline)), pool_(std::move(pool)) {
}

db::model::BufferRecord BufferManager::InitialRecord(const std::string& connection_id, const BufferOptions& options, util::TimePoint now) {
  db::model::BufferRecord record;
  record.connection_id       = connection_id;
  record.max_size_bytes      = options.max_size_bytes;
  record.flush_threshold     = options.flush_threshold;
  record.compression_enabled = options.compression_enabled;
  record.encryption_enabled  = options.encryption_enabled;
  record.last_flush_ms       = util::ToUnixMillis(now);
  record.updated_at_ms       = record.last_flush_ms;
  return record;
}

void BufferManager::Open(const std::string& connection_id, const BufferOptions& options, util::TimePoint now) {
  auto buffer           = std::make_shared<Buffer>();
  buffer->connection_id = connection_id;
  buffer->options       = options;
  buffer->last_flush    = now;

  std::unique_lock lock(mutex_);
  if (!buffers_.emplace(connection_id, std::move(buffer)).second) {
    throw util::InvalidState("buffer already open for connection " + connection_id);
  }
}

bool BufferManager::Close(const std::string& connection_id) {
  std::shared_ptr<Buffer> buffer;
  {
    std::unique_lock lock(mutex_);
    auto             it = buffers_.find(connection_id);
    if (it == buffers_.end()) return true;
    buffer = std::move(it->second);
    buffers_.erase(it);
  }

  // An Append that found the buffer before the erase waits on this mutex
  // and sees closed, so nothing lands after the final flush.
  std::lock_guard buffer_lock(buffer->mutex);
  buffer->closed = true;
  if (FlushLocked(*buffer, util::Now())) {
    return true;
  }
  RELAY_LOG_WARN("buffer closed with unflushed chunks", {observability::StringField("connection_id", connection_id),
                                                         observability::IntField("chunks", static_cast<std::int64_t>(buffer->chunks.size()))});
  return false;
}

std::shared_ptr<BufferManager::Buffer> BufferManager::Find(const std::string& connection_id) const {
  std::shared_lock lock(mutex_);
  auto             it = buffers_.find(connection_id);
  if (it == buffers_.end()) {
    throw util::ConnectionNotFound("no buffer for connection " + connection_id);
  }
  return it->second;
}

bool BufferManager::Append(const std::string& connection_id, model::Chunk chunk) {
  auto            buffer = Find(connection_id);
  std::lock_guard lock(buffer->mutex);
  if (buffer->closed) {
    throw util::ConnectionNotFound("buffer closed for connection " + connection_id);
  }

  bool       flushed = false;
  const auto now     = util::Now();

  // Make room first. If the store is down the chunk is still accepted
  // and the bound is exceeded until a flush succeeds.
  if (!buffer->chunks.empty() && buffer->resident_bytes + chunk.size_bytes > buffer->options.max_size_bytes) {
    flushed = FlushLocked(*buffer, now);
  }

  buffer->resident_bytes += chunk.size_bytes;
  buffer->chunks.push_back(std::move(chunk));

  if (buffer->chunks.size() >= CountThreshold(buffer->options) || buffer->resident_bytes >= ByteThreshold(buffer->options)) {
    flushed = FlushLocked(*buffer, now) || flushed;
  }
  return flushed;
}

bool BufferManager::Flush(const std::string& connection_id) {
  auto            buffer = Find(connection_id);
  std::lock_guard lock(buffer->mutex);
  return FlushLocked(*buffer, util::Now());
}

std::size_t BufferManager::FlushStale(util::TimePoint now) {
  std::vector<std::shared_ptr<Buffer>> snapshot;
  {
    std::shared_lock lock(mutex_);
    snapshot.reserve(buffers_.size());
    for (const auto& [_, buffer] : buffers_) {
      snapshot.push_back(buffer);
    }
  }

  std::size_t flushed = 0;
  for (const auto& buffer : snapshot) {
    std::lock_guard lock(buffer->mutex);
    if (buffer->chunks.empty() || now - buffer->last_flush < buffer->options.flush_interval) {
      continue;
    }
    if (FlushLocked(*buffer, now)) {
      ++flushed;
    }
  }
  return flushed;
}

std::optional<BufferStats> BufferManager::Stats(const std::string& connection_id) const {
  std::shared_ptr<Buffer> buffer;
  {
    std::shared_lock lock(mutex_);
    auto             it = buffers_.find(connection_id);
    if (it == buffers_.end()) return std::nullopt;
    buffer = it->second;
  }

  std::lock_guard lock(buffer->mutex);
  BufferStats     stats;
  stats.resident_chunks = buffer->chunks.size();
  stats.resident_bytes  = buffer->resident_bytes;
  stats.last_flush      = buffer->last_flush;
  stats.flush_count     = buffer->flush_count;
  stats.flushed_chunks  = buffer->flushed_chunks;
  stats.failed_flushes  = buffer->failed_flushes;
  return stats;
}

std::size_t BufferManager::OpenCount() const {
  std::shared_lock lock(mutex_);
  return buffers_.size();
}

db::model::ChunkRecord BufferManager::TransformChunk(const model::Chunk& chunk, const BufferOptions& options) const {
  db::model::ChunkRecord record;
  record.id            = chunk.id;
  record.connection_id = chunk.connection_id;
  record.sequence      = chunk.sequence;
  // transformed chunks are opaque blobs; finer typing does not survive
  record.type          = std::string(model::ToString(model::ChunkType::kContent));
  record.original_size = chunk.payload.size();
  record.size_bytes    = chunk.size_bytes;
  record.checksum      = chunk.checksum ? *chunk.checksum : transform::Sha256Hex(chunk.payload);
  record.timestamp_ms  = util::ToUnixMillis(chunk.timestamp);

  if (!pipeline_) {
    if (options.encryption_enabled) {
      throw util::InvalidState("encryption enabled without a transform pipeline");
    }
    record.data = chunk.payload;
    return record;
  }

  auto transformed   = pipeline_->Encode(chunk.payload, options.compression_enabled, options.encryption_enabled);
  record.data        = std::move(transformed.data);
  record.compression = std::string(transform::ToString(transformed.compression));
  record.key_epoch   = transformed.key_epoch;
  return record;
}

std::vector<db::model::ChunkRecord> BufferManager::TransformAll(const Buffer& buffer) const {
  std::vector<db::model::ChunkRecord> records;
  records.reserve(buffer.chunks.size());

  if (!pool_) {
    for (const auto& chunk : buffer.chunks) {
      records.push_back(TransformChunk(chunk, buffer.options));
    }
    return records;
  }

  std::exception_ptr                               failure;
  std::vector<std::future<db::model::ChunkRecord>> pending;
  pending.reserve(buffer.chunks.size());
  for (const auto& chunk : buffer.chunks) {
    try {
      pending.push_back(pool_->Submit([this, &chunk, &options = buffer.options] { return TransformChunk(chunk, options); }));
    } catch (const std::exception&) {
      failure = std::current_exception();
      break;
    }
  }

  // get() in submission order keeps arrival order; wait on everything
  // even after a failure so no task outlives the referenced chunks
  for (auto& future : pending) {
    try {
      records.push_back(future.get());
    } catch (const std::exception&) {
      if (!failure) failure = std::current_exception();
    }
  }
  if (failure) std::rethrow_exception(failure);
  return records;
}

bool BufferManager::FlushLocked(Buffer& buffer, util::TimePoint now) {
  if (buffer.chunks.empty()) {
    return true;
  }

  const auto start  = std::chrono::steady_clock::now();
  const auto chunks = buffer.chunks.size();

  observability::SpanScope span("buffer.flush");
  span.SetAttribute("connection.id", buffer.connection_id);
  span.SetAttribute("flush.chunks", static_cast<std::int64_t>(chunks));
  span.SetAttribute("flush.resident_bytes", static_cast<std::int64_t>(buffer.resident_bytes));

  try {
    auto records = TransformAll(buffer);

    auto record            = InitialRecord(buffer.connection_id, buffer.options, now);
    record.flush_count     = buffer.flush_count + 1;
    record.resident_chunks = 0;
    record.resident_bytes  = 0;

    auto tx = repository_->Begin();
    ThrowIfError(repository_->SaveChunkBatch(*tx, records), "save chunk batch");
    ThrowIfError(repository_->UpsertBuffer(*tx, record), "update buffer record");
    tx->Commit();
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    buffer.failed_flushes++;
    observability::Metrics::Instance().RecordFlush(false, chunks);
    RELAY_LOG_ERROR("FlushFailure: buffer kept for retry", {observability::StringField("connection_id", buffer.connection_id),
                                                            observability::IntField("chunks", static_cast<std::int64_t>(chunks)),
                                                            observability::StringField("error", e.what())});
    return false;
  }

  buffer.chunks.clear();
  buffer.resident_bytes = 0;
  buffer.last_flush     = now;
  buffer.flush_count++;
  buffer.flushed_chunks += chunks;

  const double elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
  span.SetAttribute("flush.duration_ms", elapsed_ms);
  observability::Metrics::Instance().RecordFlush(true, chunks);
  observability::Metrics::Instance().ObserveFlushDurationMs(elapsed_ms);
  RELAY_LOG_DEBUG("buffer flushed", {observability::StringField("connection_id", buffer.connection_id),
                                     observability::IntField("chunks", static_cast<std::int64_t>(chunks)),
                                     observability::DoubleField("duration_ms", elapsed_ms)});
  return true;
}

} // namespace relay::buffer
