#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"

namespace relay::testing {

/*
  Repository decorator over the in-memory backend for tests.

  Records the size of every SaveChunkBatch and can be told to fail
  chunk writes or connection updates.
*/
class RecordingRepository final : public db::Repository {
 public:
  RecordingRepository() : inner_(std::make_shared<db::memory::MemoryRepository>()) {
  }

  std::atomic<bool> fail_chunk_writes{false};
  std::atomic<bool> fail_connection_updates{false};

  std::vector<std::size_t> Batches() const {
    std::lock_guard lock(mutex_);
    return batches_;
  }

  std::unique_ptr<db::Transaction> Begin() override {
    return inner_->Begin();
  }

  db::Result InsertConnection(db::Transaction& tx, const db::model::ConnectionRecord& record) override {
    return inner_->InsertConnection(tx, record);
  }
  db::Result UpdateConnection(db::Transaction& tx, const db::model::ConnectionRecord& record) override {
    if (fail_connection_updates) return db::Result::Err(db::ErrorCode::IOError, "injected update failure");
    return inner_->UpdateConnection(tx, record);
  }
  std::optional<db::model::ConnectionRecord> GetConnection(db::Transaction& tx, const std::string& id) override {
    return inner_->GetConnection(tx, id);
  }

  db::Result UpsertBuffer(db::Transaction& tx, const db::model::BufferRecord& record) override {
    return inner_->UpsertBuffer(tx, record);
  }
  std::optional<db::model::BufferRecord> GetBuffer(db::Transaction& tx, const std::string& connection_id) override {
    return inner_->GetBuffer(tx, connection_id);
  }

  db::Result SaveChunkBatch(db::Transaction& tx, const std::vector<db::model::ChunkRecord>& chunks) override {
    if (fail_chunk_writes) return db::Result::Err(db::ErrorCode::IOError, "injected write failure");
    {
      std::lock_guard lock(mutex_);
      batches_.push_back(chunks.size());
    }
    return inner_->SaveChunkBatch(tx, chunks);
  }
  std::vector<db::model::ChunkRecord> ReadChunks(db::Transaction& tx, const std::string& connection_id, uint64_t from_sequence,
                                                 std::optional<uint64_t> max_chunks, std::optional<uint64_t> min_timestamp_ms) override {
    return inner_->ReadChunks(tx, connection_id, from_sequence, max_chunks, min_timestamp_ms);
  }

  // Committed chunks for one connection, in sequence order.
  std::vector<db::model::ChunkRecord> Stored(const std::string& connection_id) {
    auto tx     = Begin();
    auto chunks = ReadChunks(*tx, connection_id, 0, std::nullopt, std::nullopt);
    tx->Commit();
    return chunks;
  }

 private:
  std::shared_ptr<db::memory::MemoryRepository> inner_;

  mutable std::mutex       mutex_;
  std::vector<std::size_t> batches_;
};

} // namespace relay::testing
