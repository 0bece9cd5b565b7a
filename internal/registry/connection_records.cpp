#include "connection_records.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "relay/v1.hpp"

namespace relay::registry {

namespace {

std::string OptionsToJson(const model::ConnectionOptions& options) {
  relay::v1::ConnectionOptions message;
  message.set_buffer_size_bytes(options.buffer_size_bytes);
  message.set_flush_interval_ms(options.flush_interval_ms);
  message.set_compression_enabled(options.compression_enabled);
  message.set_encryption_enabled(options.encryption_enabled);
  message.set_heartbeat_interval_ms(options.heartbeat_interval_ms);

  std::string                                json;
  google::protobuf::util::JsonPrintOptions print_options;
  print_options.preserve_proto_field_names = true;
  const auto status                        = google::protobuf::util::MessageToJsonString(message, &json, print_options);
  if (!status.ok()) {
    throw std::runtime_error("connection options to JSON: " + std::string(status.message()));
  }
  return json;
}

model::ConnectionOptions OptionsFromJson(const std::string& json) {
  relay::v1::ConnectionOptions message;
  if (!json.empty()) {
    google::protobuf::util::JsonParseOptions parse_options;
    parse_options.ignore_unknown_fields = true;
    const auto status                   = google::protobuf::util::JsonStringToMessage(json, &message, parse_options);
    if (!status.ok()) {
      throw std::runtime_error("connection options from JSON: " + std::string(status.message()));
    }
  }

  model::ConnectionOptions options;
  options.buffer_size_bytes     = message.buffer_size_bytes();
  options.flush_interval_ms     = message.flush_interval_ms();
  options.compression_enabled   = message.compression_enabled();
  options.encryption_enabled    = message.encryption_enabled();
  options.heartbeat_interval_ms = message.heartbeat_interval_ms();
  return options;
}

} // namespace

db::model::ConnectionRecord ToRecord(const model::Connection& connection) {
  db::model::ConnectionRecord record;
  record.id                 = connection.id;
  record.client_id          = connection.client_id;
  record.user_id            = connection.user_id.value_or("");
  record.session_id         = connection.session_id.value_or("");
  record.request_id         = connection.request_id;
  record.status             = std::string(model::ToString(connection.status));
  record.provider           = connection.provider;
  record.model              = connection.model;
  record.connected_at_ms    = util::ToUnixMillis(connection.activity.connected_at);
  record.last_activity_ms   = util::ToUnixMillis(connection.activity.last_activity);
  record.chunks_received    = connection.activity.chunks_received;
  record.bytes_received     = connection.activity.bytes_received;
  record.average_latency_ms = connection.activity.average_latency_ms;
  record.options_json       = OptionsToJson(connection.options);
  record.created_at_ms      = util::ToUnixMillis(connection.created_at);
  record.updated_at_ms      = util::ToUnixMillis(connection.updated_at);
  return record;
}

model::Connection FromRecord(const db::model::ConnectionRecord& record) {
  const auto status = model::ParseConnectionStatus(record.status);
  if (!status) {
    throw std::runtime_error("connection " + record.id + " has unknown status '" + record.status + "'");
  }

  model::Connection connection;
  connection.id         = record.id;
  connection.client_id  = record.client_id;
  if (!record.user_id.empty()) connection.user_id = record.user_id;
  if (!record.session_id.empty()) connection.session_id = record.session_id;
  connection.request_id = record.request_id;
  connection.status     = *status;
  connection.provider   = record.provider;
  connection.model      = record.model;

  connection.activity.connected_at       = util::FromUnixMillis(record.connected_at_ms);
  connection.activity.last_activity      = util::FromUnixMillis(record.last_activity_ms);
  connection.activity.last_fragment_at   = connection.activity.last_activity;
  connection.activity.chunks_received    = record.chunks_received;
  connection.activity.bytes_received     = record.bytes_received;
  connection.activity.average_latency_ms = record.average_latency_ms;
  connection.activity.total_latency_ms   = record.average_latency_ms * static_cast<double>(record.chunks_received);

  connection.options    = OptionsFromJson(record.options_json);
  connection.created_at = util::FromUnixMillis(record.created_at_ms);
  connection.updated_at = util::FromUnixMillis(record.updated_at_ms);
  return connection;
}

} // namespace relay::registry
