#include "pg_repository.hpp"

#include <cstddef>

namespace relay::db::postgres {

namespace {

model::ChunkRecord ChunkFromRow(const pqxx::row& row) {
  model::ChunkRecord c;
  c.id            = row[0].c_str();
  c.connection_id = row[1].c_str();
  c.sequence      = row[2].as<uint64_t>();
  c.type          = row[3].c_str();
  const auto data = row[4].as<std::basic_string<std::byte>>();
  c.data.assign(reinterpret_cast<const char*>(data.data()), data.size());
  c.compression = row[5].c_str();
  if (!row[6].is_null()) {
    c.key_epoch = row[6].as<uint32_t>();
  }
  c.original_size = row[7].as<uint64_t>();
  c.size_bytes    = row[8].as<uint64_t>();
  c.checksum      = row[9].is_null() ? "" : row[9].c_str();
  c.timestamp_ms  = row[10].as<uint64_t>();
  return c;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::InsertConnection(Transaction& t, const model::ConnectionRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_connection", r.id, r.client_id, r.user_id, r.session_id, r.request_id, r.status, r.provider, r.model,
                               r.connected_at_ms, r.last_activity_ms, r.chunks_received, r.bytes_received, r.average_latency_ms,
                               r.options_json, r.created_at_ms, r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateConnection(Transaction& t, const model::ConnectionRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_connection", r.id, r.client_id, r.user_id, r.session_id, r.request_id, r.status, r.provider,
                                          r.model, r.connected_at_ms, r.last_activity_ms, r.chunks_received, r.bytes_received,
                                          r.average_latency_ms, r.options_json, r.created_at_ms, r.updated_at_ms);
    if (res.affected_rows() == 0) {
      return Result::Err(ErrorCode::NotFound, "connection " + r.id);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ConnectionRecord> PgRepository::GetConnection(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_connection", id);
  if (res.empty()) return std::nullopt;

  const auto&             row = res[0];
  model::ConnectionRecord r;
  r.id                 = row[0].c_str();
  r.client_id          = row[1].c_str();
  r.user_id            = row[2].c_str();
  r.session_id         = row[3].c_str();
  r.request_id         = row[4].c_str();
  r.status             = row[5].c_str();
  r.provider           = row[6].c_str();
  r.model              = row[7].c_str();
  r.connected_at_ms    = row[8].as<uint64_t>();
  r.last_activity_ms   = row[9].as<uint64_t>();
  r.chunks_received    = row[10].as<uint64_t>();
  r.bytes_received     = row[11].as<uint64_t>();
  r.average_latency_ms = row[12].as<double>();
  r.options_json       = row[13].c_str();
  r.created_at_ms      = row[14].as<uint64_t>();
  r.updated_at_ms      = row[15].as<uint64_t>();
  return r;
}

Result PgRepository::UpsertBuffer(Transaction& t, const model::BufferRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_buffer", r.connection_id, r.max_size_bytes, r.flush_threshold, r.compression_enabled,
                               r.encryption_enabled, r.resident_chunks, r.resident_bytes, r.flush_count, r.last_flush_ms, r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::BufferRecord> PgRepository::GetBuffer(Transaction& t, const std::string& connection_id) {
  auto res = TX(t).Work().exec_prepared("get_buffer", connection_id);
  if (res.empty()) return std::nullopt;

  const auto&         row = res[0];
  model::BufferRecord r;
  r.connection_id       = row[0].c_str();
  r.max_size_bytes      = row[1].as<uint64_t>();
  r.flush_threshold     = row[2].as<double>();
  r.compression_enabled = row[3].as<bool>();
  r.encryption_enabled  = row[4].as<bool>();
  r.resident_chunks     = row[5].as<uint64_t>();
  r.resident_bytes      = row[6].as<uint64_t>();
  r.flush_count         = row[7].as<uint64_t>();
  r.last_flush_ms       = row[8].as<uint64_t>();
  r.updated_at_ms       = row[9].as<uint64_t>();
  return r;
}

Result PgRepository::SaveChunkBatch(Transaction& t, const std::vector<model::ChunkRecord>& chunks) {
  try {
    auto& work = TX(t).Work();
    for (const auto& c : chunks) {
      std::optional<int64_t> key_epoch;
      if (c.key_epoch) key_epoch = static_cast<int64_t>(*c.key_epoch);

      work.exec_prepared("insert_chunk", c.id, c.connection_id, c.sequence, c.type, pqxx::binary_cast(c.data), c.compression, key_epoch,
                         c.original_size, c.size_bytes, c.checksum, c.timestamp_ms);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ChunkRecord> PgRepository::ReadChunks(Transaction& t, const std::string& connection_id, uint64_t from_sequence,
                                                         std::optional<uint64_t> max_chunks, std::optional<uint64_t> min_timestamp_ms) {
  std::string sql =
      "SELECT id,connection_id,sequence,type,data,compression,key_epoch,original_size,size_bytes,checksum,timestamp_ms "
      "FROM stream_chunks WHERE connection_id=$1 AND sequence>=$2 AND ($3::BIGINT IS NULL OR timestamp_ms>=$3) "
      "ORDER BY sequence ASC";
  if (max_chunks.has_value()) {
    sql += " LIMIT " + std::to_string(*max_chunks);
  }
  sql += ";";

  std::optional<int64_t> min_ts;
  if (min_timestamp_ms) min_ts = static_cast<int64_t>(*min_timestamp_ms);

  auto res = TX(t).Work().exec_params(sql, connection_id, from_sequence, min_ts);

  std::vector<model::ChunkRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ChunkFromRow(row));
  }
  return out;
}

} // namespace relay::db::postgres
