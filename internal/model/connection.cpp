#include "connection.hpp"

#include "relay/v1.hpp"

namespace relay::model {

std::string_view ToString(ConnectionStatus status) {
  switch (status) {
    case ConnectionStatus::kConnecting:
      return "connecting";
    case ConnectionStatus::kStreaming:
      return "streaming";
    case ConnectionStatus::kCompleted:
      return "completed";
    case ConnectionStatus::kError:
      return "error";
    case ConnectionStatus::kDisconnected:
      return "disconnected";
  }
  return "unknown";
}

std::optional<ConnectionStatus> ParseConnectionStatus(std::string_view value) {
  if (value == "connecting") return ConnectionStatus::kConnecting;
  if (value == "streaming") return ConnectionStatus::kStreaming;
  if (value == "completed") return ConnectionStatus::kCompleted;
  if (value == "error") return ConnectionStatus::kError;
  if (value == "disconnected") return ConnectionStatus::kDisconnected;
  return std::nullopt;
}

void RecordFragment(ActivityMetadata& activity, uint64_t bytes, util::TimePoint now) {
  const auto previous = activity.chunks_received == 0 ? activity.connected_at : activity.last_fragment_at;
  const auto gap_ms   = util::MillisBetween(previous, now);

  activity.chunks_received += 1;
  activity.bytes_received += bytes;
  activity.total_latency_ms += gap_ms > 0.0 ? gap_ms : 0.0;
  activity.average_latency_ms = activity.total_latency_ms / static_cast<double>(activity.chunks_received);
  activity.last_fragment_at   = now;
  activity.last_activity      = now;
}

namespace {

relay::v1::ConnectionStatus ToProtoStatus(ConnectionStatus status) {
  switch (status) {
    case ConnectionStatus::kConnecting:
      return relay::v1::CONNECTION_STATUS_CONNECTING;
    case ConnectionStatus::kStreaming:
      return relay::v1::CONNECTION_STATUS_STREAMING;
    case ConnectionStatus::kCompleted:
      return relay::v1::CONNECTION_STATUS_COMPLETED;
    case ConnectionStatus::kError:
      return relay::v1::CONNECTION_STATUS_ERROR;
    case ConnectionStatus::kDisconnected:
      return relay::v1::CONNECTION_STATUS_DISCONNECTED;
  }
  return relay::v1::CONNECTION_STATUS_UNSPECIFIED;
}

} // namespace

relay::v1::Connection ToProto(const Connection& connection) {
  relay::v1::Connection out;
  out.set_id(connection.id);
  out.set_client_id(connection.client_id);
  if (connection.user_id) out.set_user_id(*connection.user_id);
  if (connection.session_id) out.set_session_id(*connection.session_id);
  out.set_request_id(connection.request_id);
  out.set_status(ToProtoStatus(connection.status));
  out.set_provider(connection.provider);
  out.set_model(connection.model);

  *out.mutable_connected_at()  = util::ToProto(connection.activity.connected_at);
  *out.mutable_last_activity() = util::ToProto(connection.activity.last_activity);
  out.set_chunks_received(connection.activity.chunks_received);
  out.set_bytes_received(connection.activity.bytes_received);
  out.set_average_latency_ms(connection.activity.average_latency_ms);

  auto* options = out.mutable_options();
  options->set_buffer_size_bytes(connection.options.buffer_size_bytes);
  options->set_flush_interval_ms(connection.options.flush_interval_ms);
  options->set_compression_enabled(connection.options.compression_enabled);
  options->set_encryption_enabled(connection.options.encryption_enabled);
  options->set_heartbeat_interval_ms(connection.options.heartbeat_interval_ms);

  *out.mutable_created_at() = util::ToProto(connection.created_at);
  *out.mutable_updated_at() = util::ToProto(connection.updated_at);
  return out;
}

} // namespace relay::model
