#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/buffer_record.hpp"
#include "internal/db/model/chunk_record.hpp"
#include "internal/db/model/connection_record.hpp"

namespace relay::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - SaveChunkBatch is all-or-nothing for the batch
  - (connection_id, sequence) is unique across stored chunks

  The DB holds the durable copy of:
    connection records (other replicas may look them up)
    buffer bookkeeping
    flushed chunk history
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Connections
  // ---------------------------------------------------------------------

  virtual Result InsertConnection(Transaction&, const model::ConnectionRecord&) = 0;

  virtual Result UpdateConnection(Transaction&, const model::ConnectionRecord&) = 0;

  virtual std::optional<model::ConnectionRecord> GetConnection(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Buffers
  // ---------------------------------------------------------------------

  virtual Result UpsertBuffer(Transaction&, const model::BufferRecord&) = 0;

  virtual std::optional<model::BufferRecord> GetBuffer(Transaction&, const std::string& connection_id) = 0;

  // ---------------------------------------------------------------------
  // Chunks
  // ---------------------------------------------------------------------

  virtual Result SaveChunkBatch(Transaction&, const std::vector<model::ChunkRecord>& chunks) = 0;

  // Ordered by sequence, starting at from_sequence.
  virtual std::vector<model::ChunkRecord> ReadChunks(Transaction&, const std::string& connection_id, uint64_t from_sequence,
                                                     std::optional<uint64_t> max_chunks,
                                                     std::optional<uint64_t> min_timestamp_ms = std::nullopt) = 0;
};

} // namespace relay::db
