#pragma once

#include <cstdint>
#include <string>

namespace relay::db::model {

/*
  Persistent connection row (stream_connections).

  user_id / session_id are empty when absent; the SQL backends store
  NULL for them. options_json is the ConnectionOptions message in
  protobuf JSON form.
*/
struct ConnectionRecord {
  std::string id;
  std::string client_id;
  std::string user_id;
  std::string session_id;
  std::string request_id;

  std::string status;
  std::string provider;
  std::string model;

  uint64_t connected_at_ms    = 0;
  uint64_t last_activity_ms   = 0;
  uint64_t chunks_received    = 0;
  uint64_t bytes_received     = 0;
  double   average_latency_ms = 0.0;

  std::string options_json;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace relay::db::model
