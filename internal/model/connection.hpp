#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/model/state_machine.hpp"
#include "internal/util/time.hpp"

namespace relay::v1 {
class Connection;
}

namespace relay::model {

std::string_view                ToString(ConnectionStatus status);
std::optional<ConnectionStatus> ParseConnectionStatus(std::string_view value);

// Captured at creation; never changes for the life of the connection.
struct ConnectionOptions {
  uint64_t buffer_size_bytes     = 0;
  uint64_t flush_interval_ms     = 0;
  bool     compression_enabled   = false;
  bool     encryption_enabled    = false;
  uint64_t heartbeat_interval_ms = 0;
};

struct ActivityMetadata {
  util::TimePoint connected_at{};
  util::TimePoint last_activity{};
  uint64_t        chunks_received  = 0;
  uint64_t        bytes_received   = 0;
  double          total_latency_ms = 0.0;
  double          average_latency_ms = 0.0;
  util::TimePoint last_fragment_at{};
};

struct Connection {
  std::string                id;
  std::string                client_id;
  std::optional<std::string> user_id;
  std::optional<std::string> session_id;
  std::string                request_id;

  ConnectionStatus status = ConnectionStatus::kConnecting;
  std::string      provider;
  std::string      model;

  ActivityMetadata  activity;
  ConnectionOptions options;

  util::TimePoint created_at{};
  util::TimePoint updated_at{};

  // Set once the stream finished; the reaper closes the connection after it.
  std::optional<util::TimePoint> dispose_at;
};

// Adds one fragment's worth of activity. latency accumulates the gap
// since the previous fragment (or since connect for the first one).
void RecordFragment(ActivityMetadata& activity, uint64_t bytes, util::TimePoint now);

relay::v1::Connection ToProto(const Connection& connection);

} // namespace relay::model
