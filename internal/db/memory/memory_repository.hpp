#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace relay::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertConnection(Transaction&, const model::ConnectionRecord&) override;
  Result UpdateConnection(Transaction&, const model::ConnectionRecord&) override;
  std::optional<model::ConnectionRecord> GetConnection(Transaction&, const std::string&) override;

  Result UpsertBuffer(Transaction&, const model::BufferRecord&) override;
  std::optional<model::BufferRecord> GetBuffer(Transaction&, const std::string&) override;

  Result SaveChunkBatch(Transaction&, const std::vector<model::ChunkRecord>&) override;
  std::vector<model::ChunkRecord> ReadChunks(Transaction&, const std::string& connection_id, uint64_t from_sequence,
                                             std::optional<uint64_t> max_chunks,
                                             std::optional<uint64_t> min_timestamp_ms) override;

private:
  friend class MemoryTransaction;

  // Chunk history per connection is shared between snapshots and only
  // copied when a transaction writes to that connection.
  using ChunkTable = std::map<uint64_t, model::ChunkRecord>;

  struct State {
    std::unordered_map<std::string, model::ConnectionRecord>          connections;
    std::unordered_map<std::string, model::BufferRecord>              buffers;
    std::unordered_map<std::string, std::shared_ptr<const ChunkTable>> chunks;
  };

  // serializes transactions
  std::mutex tx_mutex_;

  std::mutex mutex_;
  State committed_;
};

}
