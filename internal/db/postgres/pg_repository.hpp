#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace relay::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception& e);
};

} // namespace relay::db::postgres
