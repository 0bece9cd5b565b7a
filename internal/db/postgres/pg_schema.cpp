#include "pg_schema.hpp"

namespace relay::db::postgres {

void BootstrapSchema(const std::shared_ptr<PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  tx.exec("CREATE TABLE IF NOT EXISTS stream_connections (id TEXT PRIMARY KEY, client_id TEXT NOT NULL, user_id TEXT, session_id TEXT, request_id TEXT NOT NULL, status TEXT NOT NULL, provider TEXT NOT NULL, model TEXT NOT NULL, connected_at_ms BIGINT NOT NULL, last_activity_ms BIGINT NOT NULL, chunks_received BIGINT NOT NULL DEFAULT 0, bytes_received BIGINT NOT NULL DEFAULT 0, average_latency_ms DOUBLE PRECISION NOT NULL DEFAULT 0, options JSONB NOT NULL, created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL);");
  tx.exec("CREATE INDEX IF NOT EXISTS idx_stream_connections_client ON stream_connections(client_id);");
  tx.exec("CREATE INDEX IF NOT EXISTS idx_stream_connections_status ON stream_connections(status);");
  tx.exec("CREATE TABLE IF NOT EXISTS stream_buffers (connection_id TEXT PRIMARY KEY REFERENCES stream_connections(id) ON DELETE CASCADE, max_size_bytes BIGINT NOT NULL, flush_threshold DOUBLE PRECISION NOT NULL, compression_enabled BOOLEAN NOT NULL, encryption_enabled BOOLEAN NOT NULL, resident_chunks BIGINT NOT NULL DEFAULT 0, resident_bytes BIGINT NOT NULL DEFAULT 0, flush_count BIGINT NOT NULL DEFAULT 0, last_flush_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL);");
  tx.exec("CREATE TABLE IF NOT EXISTS stream_chunks (id TEXT NOT NULL UNIQUE, connection_id TEXT NOT NULL REFERENCES stream_connections(id) ON DELETE CASCADE, sequence BIGINT NOT NULL, type TEXT NOT NULL, data BYTEA NOT NULL, compression TEXT NOT NULL DEFAULT 'none', key_epoch BIGINT, original_size BIGINT NOT NULL, size_bytes BIGINT NOT NULL, checksum TEXT, timestamp_ms BIGINT NOT NULL, PRIMARY KEY (connection_id, sequence));");
  tx.exec("CREATE INDEX IF NOT EXISTS idx_stream_chunks_timestamp ON stream_chunks(connection_id, timestamp_ms);");

  tx.exec("SELECT id,client_id,user_id,session_id,request_id,status,provider,model,connected_at_ms,last_activity_ms,chunks_received,bytes_received,average_latency_ms,options,created_at_ms,updated_at_ms FROM stream_connections LIMIT 1;");
  tx.exec("SELECT connection_id,max_size_bytes,flush_threshold,compression_enabled,encryption_enabled,resident_chunks,resident_bytes,flush_count,last_flush_ms,updated_at_ms FROM stream_buffers LIMIT 1;");
  tx.exec("SELECT id,connection_id,sequence,type,data,compression,key_epoch,original_size,size_bytes,checksum,timestamp_ms FROM stream_chunks LIMIT 1;");
  tx.commit();
}

} // namespace relay::db::postgres
