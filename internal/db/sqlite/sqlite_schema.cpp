#include "sqlite_schema.hpp"

#include <string>
#include <vector>

namespace relay::db::sqlite {

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS stream_connections (id TEXT PRIMARY KEY, client_id TEXT NOT NULL, user_id TEXT, session_id TEXT, request_id TEXT NOT NULL, status TEXT NOT NULL, provider TEXT NOT NULL, model TEXT NOT NULL, connected_at_ms INTEGER NOT NULL, last_activity_ms INTEGER NOT NULL, chunks_received INTEGER NOT NULL DEFAULT 0, bytes_received INTEGER NOT NULL DEFAULT 0, average_latency_ms REAL NOT NULL DEFAULT 0, options TEXT NOT NULL, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_stream_connections_client ON stream_connections(client_id);",
      "CREATE INDEX IF NOT EXISTS idx_stream_connections_status ON stream_connections(status);",
      "CREATE TABLE IF NOT EXISTS stream_buffers (connection_id TEXT PRIMARY KEY REFERENCES stream_connections(id) ON DELETE CASCADE, max_size_bytes INTEGER NOT NULL, flush_threshold REAL NOT NULL, compression_enabled INTEGER NOT NULL, encryption_enabled INTEGER NOT NULL, resident_chunks INTEGER NOT NULL DEFAULT 0, resident_bytes INTEGER NOT NULL DEFAULT 0, flush_count INTEGER NOT NULL DEFAULT 0, last_flush_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS stream_chunks (id TEXT NOT NULL UNIQUE, connection_id TEXT NOT NULL REFERENCES stream_connections(id) ON DELETE CASCADE, sequence INTEGER NOT NULL, type TEXT NOT NULL, data BLOB NOT NULL, compression TEXT NOT NULL DEFAULT 'none', key_epoch INTEGER, original_size INTEGER NOT NULL, size_bytes INTEGER NOT NULL, checksum TEXT, timestamp_ms INTEGER NOT NULL, PRIMARY KEY (connection_id, sequence));",
      "CREATE INDEX IF NOT EXISTS idx_stream_chunks_timestamp ON stream_chunks(connection_id, timestamp_ms);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }

  db.Exec("SELECT id,client_id,user_id,session_id,request_id,status,provider,model,connected_at_ms,last_activity_ms,chunks_received,bytes_received,average_latency_ms,options,created_at_ms,updated_at_ms FROM stream_connections LIMIT 1;");
  db.Exec("SELECT connection_id,max_size_bytes,flush_threshold,compression_enabled,encryption_enabled,resident_chunks,resident_bytes,flush_count,last_flush_ms,updated_at_ms FROM stream_buffers LIMIT 1;");
  db.Exec("SELECT id,connection_id,sequence,type,data,compression,key_epoch,original_size,size_bytes,checksum,timestamp_ms FROM stream_chunks LIMIT 1;");
}

} // namespace relay::db::sqlite
