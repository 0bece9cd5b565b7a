#pragma once

#include <functional>

#include "internal/stream/event_channel.hpp"
#include "internal/stream/stream_orchestrator.hpp"
#include "relay/v1.hpp"
#include "service_context.hpp"

namespace relay::service {

/*
  Transport-independent StreamRelayService.

  Streaming RPCs take callbacks instead of gRPC reader/writer types so
  the service can be driven directly from tests.
*/
class RelayService {
 public:
  // Fills the next message; false at end of stream.
  using PublishReader = std::function<bool(relay::v1::PublishRequest&)>;

  explicit RelayService(ServiceContext ctx);

  relay::v1::CreateConnectionResponse CreateConnection(const relay::v1::CreateConnectionRequest& req);
  relay::v1::GetConnectionResponse    GetConnection(const relay::v1::GetConnectionRequest& req);
  void                                CloseConnection(const relay::v1::CloseConnectionRequest& req);

  relay::v1::PublishResponse Publish(const PublishReader& reader);

  // Runs the stream on the calling thread until it completes, fails or
  // is_cancelled reports true.
  stream::StreamOutcome Subscribe(const relay::v1::SubscribeRequest& req, stream::EventChannel::Writer writer,
                                  std::function<bool()> is_cancelled);

  relay::v1::ReplayResponse     Replay(const relay::v1::ReplayRequest& req);
  relay::v1::GetMetricsResponse GetMetrics(const relay::v1::GetMetricsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace relay::service
