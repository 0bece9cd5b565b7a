#include "pg_pool.hpp"

namespace relay::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto* conn = new pqxx::connection(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn);
        } catch (...) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("insert_connection",
               "INSERT INTO stream_connections(id,client_id,user_id,session_id,request_id,status,provider,model,"
               "connected_at_ms,last_activity_ms,chunks_received,bytes_received,average_latency_ms,options,created_at_ms,updated_at_ms) "
               "VALUES($1,$2,NULLIF($3,''),NULLIF($4,''),$5,$6,$7,$8,$9,$10,$11,$12,$13,$14::jsonb,$15,$16)");

  conn.prepare("update_connection",
               "UPDATE stream_connections SET client_id=$2,user_id=NULLIF($3,''),session_id=NULLIF($4,''),request_id=$5,status=$6,"
               "provider=$7,model=$8,connected_at_ms=$9,last_activity_ms=$10,chunks_received=$11,bytes_received=$12,"
               "average_latency_ms=$13,options=$14::jsonb,created_at_ms=$15,updated_at_ms=$16 WHERE id=$1");

  conn.prepare("get_connection",
               "SELECT id,client_id,COALESCE(user_id,''),COALESCE(session_id,''),request_id,status,provider,model,"
               "connected_at_ms,last_activity_ms,chunks_received,bytes_received,average_latency_ms,options::text,created_at_ms,updated_at_ms "
               "FROM stream_connections WHERE id=$1");

  conn.prepare("upsert_buffer",
               "INSERT INTO stream_buffers(connection_id,max_size_bytes,flush_threshold,compression_enabled,encryption_enabled,"
               "resident_chunks,resident_bytes,flush_count,last_flush_ms,updated_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10) "
               "ON CONFLICT(connection_id) DO UPDATE SET max_size_bytes=EXCLUDED.max_size_bytes,flush_threshold=EXCLUDED.flush_threshold,"
               "compression_enabled=EXCLUDED.compression_enabled,encryption_enabled=EXCLUDED.encryption_enabled,"
               "resident_chunks=EXCLUDED.resident_chunks,resident_bytes=EXCLUDED.resident_bytes,flush_count=EXCLUDED.flush_count,"
               "last_flush_ms=EXCLUDED.last_flush_ms,updated_at_ms=EXCLUDED.updated_at_ms");

  conn.prepare("get_buffer",
               "SELECT connection_id,max_size_bytes,flush_threshold,compression_enabled,encryption_enabled,"
               "resident_chunks,resident_bytes,flush_count,last_flush_ms,updated_at_ms FROM stream_buffers WHERE connection_id=$1");

  conn.prepare("insert_chunk",
               "INSERT INTO stream_chunks(id,connection_id,sequence,type,data,compression,key_epoch,original_size,size_bytes,checksum,timestamp_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,NULLIF($10,''),$11)");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace relay::db::postgres
