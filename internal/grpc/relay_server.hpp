#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/relay_service.hpp"
#include "relay/v1/relay_service.grpc.pb.h"
#include "relay/v1.hpp"

namespace relay::grpc {

class RelayServer final : public relay::v1::StreamRelayService::Service {
public:
  explicit RelayServer(std::shared_ptr<relay::service::RelayService> svc);

  ::grpc::Status CreateConnection(::grpc::ServerContext*,
                                  const relay::v1::CreateConnectionRequest*,
                                  relay::v1::CreateConnectionResponse*) override;

  ::grpc::Status GetConnection(::grpc::ServerContext*,
                               const relay::v1::GetConnectionRequest*,
                               relay::v1::GetConnectionResponse*) override;

  ::grpc::Status CloseConnection(::grpc::ServerContext*,
                                 const relay::v1::CloseConnectionRequest*,
                                 google::protobuf::Empty*) override;

  ::grpc::Status Publish(::grpc::ServerContext*,
                         ::grpc::ServerReader<relay::v1::PublishRequest>*,
                         relay::v1::PublishResponse*) override;

  ::grpc::Status Subscribe(::grpc::ServerContext*,
                           const relay::v1::SubscribeRequest*,
                           ::grpc::ServerWriter<relay::v1::StreamEvent>*) override;

  ::grpc::Status Replay(::grpc::ServerContext*,
                        const relay::v1::ReplayRequest*,
                        relay::v1::ReplayResponse*) override;

  ::grpc::Status GetMetrics(::grpc::ServerContext*,
                            const relay::v1::GetMetricsRequest*,
                            relay::v1::GetMetricsResponse*) override;

private:
  std::shared_ptr<relay::service::RelayService> service_;
};

} // namespace relay::grpc
