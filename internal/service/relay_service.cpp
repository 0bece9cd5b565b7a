#include "relay_service.hpp"

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

#include "internal/db/api/repository.hpp"
#include "internal/metrics/stream_metrics.hpp"
#include "internal/model/chunk.hpp"
#include "internal/model/connection.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/registry/connection_registry.hpp"
#include "internal/stream/cancellation.hpp"
#include "internal/transform/transform_pipeline.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace relay::service {

using namespace relay::v1;

namespace {

template <typename Fn>
auto ObserveRpc(std::string_view route, const std::string& connection_id, Fn&& fn) {
  relay::observability::SpanScope span(route);
  if (!connection_id.empty()) {
    span.SetAttribute("connection.id", connection_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      relay::observability::Metrics::Instance().RecordRequest(route, true);
      relay::observability::Metrics::Instance().ObserveRequestLatencyMs(
          route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
      return;
    } else {
      auto result = fn();
      relay::observability::Metrics::Instance().RecordRequest(route, true);
      relay::observability::Metrics::Instance().ObserveRequestLatencyMs(
          route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    RELAY_LOG_ERROR("RPC failed", {relay::observability::StringField("route", route), relay::observability::StringField("error", ex.what()),
                                   relay::observability::StringField("connection_id", connection_id)});
    relay::observability::Metrics::Instance().RecordRequest(route, false);
    relay::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    throw;
  }
}

void RequireConnectionId(const std::string& connection_id, const std::string& op) {
  if (connection_id.empty()) {
    throw relay::util::InvalidState(op + ": missing connection_id");
  }
}

// Sessions exist only for connections open on this relay. A close that
// races the acquire either removes the session through the registry
// observer or is seen by the second check.
std::shared_ptr<stream::StreamSession> AcquireOpenSession(const ServiceContext& ctx, const std::string& connection_id,
                                                          const std::string& op) {
  if (!ctx.registry->IsOpen(connection_id)) {
    auto connection = ctx.registry->Get(connection_id);
    if (!connection) {
      throw relay::util::ConnectionNotFound(op + ": connection " + connection_id + " not found");
    }
    throw relay::util::InvalidState(op + ": connection " + connection_id + " is " + std::string(model::ToString(connection->status)));
  }

  auto session = ctx.sessions->Acquire(connection_id);
  if (!ctx.registry->IsOpen(connection_id)) {
    ctx.sessions->Remove(connection_id);
    throw relay::util::InvalidState(op + ": connection " + connection_id + " closed");
  }
  return session;
}

std::optional<std::string> NonEmpty(const std::string& value) {
  if (value.empty()) return std::nullopt;
  return value;
}

registry::CreateRequest ToCreateRequest(const CreateConnectionRequest& req) {
  registry::CreateRequest out;
  out.client_id  = req.client_id();
  out.user_id    = NonEmpty(req.user_id());
  out.session_id = NonEmpty(req.session_id());
  out.request_id = req.request_id();
  out.provider   = req.provider();
  out.model      = req.model();

  const auto& options = req.options();
  if (options.has_buffer_size_bytes()) out.buffer_size_bytes = options.buffer_size_bytes();
  if (options.has_flush_interval_ms()) out.flush_interval_ms = options.flush_interval_ms();
  if (options.has_compression_enabled()) out.compression_enabled = options.compression_enabled();
  if (options.has_encryption_enabled()) out.encryption_enabled = options.encryption_enabled();
  if (options.has_heartbeat_interval_ms()) out.heartbeat_interval_ms = options.heartbeat_interval_ms();
  return out;
}

ChunkType ToProtoChunkType(const std::string& type) {
  switch (model::ParseChunkType(type).value_or(model::ChunkType::kContent)) {
    case model::ChunkType::kContent:
      return CHUNK_TYPE_CONTENT;
    case model::ChunkType::kMetadata:
      return CHUNK_TYPE_METADATA;
    case model::ChunkType::kControl:
      return CHUNK_TYPE_CONTROL;
  }
  return CHUNK_TYPE_UNSPECIFIED;
}

metrics::MetricsPeriod FromProto(MetricsPeriod period) {
  switch (period) {
    case METRICS_PERIOD_MINUTE:
      return metrics::MetricsPeriod::kMinute;
    case METRICS_PERIOD_DAY:
      return metrics::MetricsPeriod::kDay;
    default:
      return metrics::MetricsPeriod::kHour;
  }
}

} // namespace

RelayService::RelayService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  // A closed connection takes its producer and channel with it.
  auto sessions = ctx_.sessions;
  ctx_.registry->AddObserver([sessions](registry::RegistryEvent event, const model::Connection& connection) {
    if (event == registry::RegistryEvent::kConnectionClosed) {
      if (auto session = sessions->Find(connection.id)) {
        session->producer->Close();
      }
      sessions->Remove(connection.id);
    }
  });
}

CreateConnectionResponse RelayService::CreateConnection(const CreateConnectionRequest& req) {
  return ObserveRpc("StreamRelayService.CreateConnection", "", [&] {
    if (req.client_id().empty()) {
      throw relay::util::InvalidState("create connection: missing client_id");
    }

    auto                     connection = ctx_.registry->Create(ToCreateRequest(req));
    CreateConnectionResponse resp;
    *resp.mutable_connection() = model::ToProto(connection);
    return resp;
  });
}

GetConnectionResponse RelayService::GetConnection(const GetConnectionRequest& req) {
  return ObserveRpc("StreamRelayService.GetConnection", req.connection_id(), [&] {
    RequireConnectionId(req.connection_id(), "get connection");

    auto connection = ctx_.registry->Get(req.connection_id());
    if (!connection) {
      throw relay::util::ConnectionNotFound("connection " + req.connection_id() + " not found");
    }

    GetConnectionResponse resp;
    *resp.mutable_connection() = model::ToProto(*connection);
    return resp;
  });
}

void RelayService::CloseConnection(const CloseConnectionRequest& req) {
  ObserveRpc("StreamRelayService.CloseConnection", req.connection_id(), [&] {
    RequireConnectionId(req.connection_id(), "close connection");

    if (!ctx_.registry->Close(req.connection_id())) {
      // Closing twice is fine; an id that never existed is not.
      if (!ctx_.registry->Get(req.connection_id())) {
        throw relay::util::ConnectionNotFound("connection " + req.connection_id() + " not found");
      }
    }
  });
}

PublishResponse RelayService::Publish(const PublishReader& reader) {
  return ObserveRpc("StreamRelayService.Publish", "", [&] {
    PublishRequest                         msg;
    std::string                            connection_id;
    std::shared_ptr<stream::StreamSession> session;
    uint64_t                               accepted = 0;
    bool                                   finished = false;

    while (!finished && reader(msg)) {
      if (!session) {
        RequireConnectionId(msg.connection_id(), "publish");
        connection_id = msg.connection_id();

        auto connection = ctx_.registry->Get(connection_id);
        if (connection && model::IsFinished(connection->status)) {
          throw relay::util::InvalidState("publish: connection " + connection_id + " is " + std::string(model::ToString(connection->status)));
        }
        session = AcquireOpenSession(ctx_, connection_id, "publish");
      } else if (!msg.connection_id().empty() && msg.connection_id() != connection_id) {
        throw relay::util::InvalidState("publish: one stream carries one connection");
      }

      if (msg.abort()) {
        session->producer->Fail(msg.abort_message().empty() ? "upstream generation aborted" : msg.abort_message());
        finished = true;
        continue;
      }

      if (!msg.has_fragment()) continue;

      auto       fragment = model::FromProto(msg.fragment());
      const bool terminal = fragment.finish_reason && !fragment.finish_reason->empty();
      if (!session->producer->Push(std::move(fragment))) {
        RELAY_LOG_DEBUG("publish rejected by closed producer", {relay::observability::StringField("connection_id", connection_id)});
        finished = true;
        continue;
      }
      ++accepted;
      if (terminal) {
        session->producer->Finish();
        finished = true;
      }
    }

    // ending without a finish reason exhausts the producer
    if (session && !finished) {
      session->producer->Finish();
    }

    PublishResponse resp;
    resp.set_fragments_accepted(accepted);
    return resp;
  });
}

stream::StreamOutcome RelayService::Subscribe(const SubscribeRequest& req, stream::EventChannel::Writer writer,
                                              std::function<bool()> is_cancelled) {
  return ObserveRpc("StreamRelayService.Subscribe", req.connection_id(), [&] {
    RequireConnectionId(req.connection_id(), "subscribe");
    const auto& connection_id = req.connection_id();

    auto session = AcquireOpenSession(ctx_, connection_id, "subscribe");
    if (!session->channel->Attach(std::move(writer))) {
      throw relay::util::InvalidState("subscribe: connection " + connection_id + " already has a subscriber");
    }

    auto token = std::make_shared<stream::CancellationToken>();
    if (is_cancelled) token->SetProbe(std::move(is_cancelled));

    stream::StreamOutcome outcome;
    try {
      outcome = ctx_.orchestrator->StartStream(connection_id, stream::StreamRequest{}, *session->producer, *session->channel, token);
    } catch (const std::exception&) {
      session->channel->Detach();
      throw;
    }
    session->channel->Detach();
    return outcome;
  });
}

ReplayResponse RelayService::Replay(const ReplayRequest& req) {
  return ObserveRpc("StreamRelayService.Replay", req.connection_id(), [&] {
    RequireConnectionId(req.connection_id(), "replay");
    if (!ctx_.registry->Get(req.connection_id())) {
      throw relay::util::ConnectionNotFound("replay: connection " + req.connection_id() + " not found");
    }

    std::optional<uint64_t> max_chunks;
    if (req.max_chunks() > 0) max_chunks = req.max_chunks();

    auto tx      = ctx_.repository->Begin();
    auto records = ctx_.repository->ReadChunks(*tx, req.connection_id(), req.from_sequence(), max_chunks);
    tx->Commit();

    ReplayResponse resp;
    for (const auto& record : records) {
      auto compression = transform::ParseCompressionAlgorithm(record.compression);
      if (!compression) {
        throw std::runtime_error("replay: chunk " + std::to_string(record.sequence) + " has unknown codec " + record.compression);
      }

      transform::TransformedPayload stored;
      stored.data          = record.data;
      stored.compression   = *compression;
      stored.key_epoch     = record.key_epoch;
      stored.original_size = record.original_size;

      auto* chunk = resp.add_chunks();
      chunk->set_id(record.id);
      chunk->set_sequence(record.sequence);
      chunk->set_type(ToProtoChunkType(record.type));
      chunk->set_payload_json(ctx_.pipeline->Decode(stored));
      *chunk->mutable_timestamp() = relay::util::ToProto(relay::util::FromUnixMillis(record.timestamp_ms));
      chunk->set_size_bytes(record.size_bytes);
      chunk->set_checksum(record.checksum);
    }
    return resp;
  });
}

GetMetricsResponse RelayService::GetMetrics(const GetMetricsRequest& req) {
  return ObserveRpc("StreamRelayService.GetMetrics", req.connection_id(), [&] {
    GetMetricsResponse resp;
    if (req.connection_id().empty()) {
      if (auto cached = ctx_.metrics->CachedAggregate()) {
        *resp.mutable_aggregate() = std::move(*cached);
      } else {
        *resp.mutable_aggregate() = metrics::ToProto(ctx_.metrics->Aggregate());
      }
      return resp;
    }

    *resp.mutable_connection() = metrics::ToProto(ctx_.metrics->ForConnection(req.connection_id(), FromProto(req.period())));
    return resp;
  });
}

} // namespace relay::service
