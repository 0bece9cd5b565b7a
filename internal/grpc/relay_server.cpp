#include "relay_server.hpp"

#include "grpc_error.hpp"
#include "internal/model/event.hpp"

namespace relay::grpc {

RelayServer::RelayServer(std::shared_ptr<relay::service::RelayService> svc)
    : service_(std::move(svc)) {}

::grpc::Status RelayServer::CreateConnection(::grpc::ServerContext*,
                                             const relay::v1::CreateConnectionRequest* req,
                                             relay::v1::CreateConnectionResponse* resp) {
  try {
    *resp = service_->CreateConnection(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RelayServer::GetConnection(::grpc::ServerContext*,
                                          const relay::v1::GetConnectionRequest* req,
                                          relay::v1::GetConnectionResponse* resp) {
  try {
    *resp = service_->GetConnection(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RelayServer::CloseConnection(::grpc::ServerContext*,
                                            const relay::v1::CloseConnectionRequest* req,
                                            google::protobuf::Empty*) {
  try {
    service_->CloseConnection(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RelayServer::Publish(::grpc::ServerContext*,
                                    ::grpc::ServerReader<relay::v1::PublishRequest>* reader,
                                    relay::v1::PublishResponse* resp) {
  try {
    *resp = service_->Publish([reader](relay::v1::PublishRequest& msg) { return reader->Read(&msg); });
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RelayServer::Subscribe(::grpc::ServerContext* ctx,
                                      const relay::v1::SubscribeRequest* req,
                                      ::grpc::ServerWriter<relay::v1::StreamEvent>* writer) {
  try {
    // Writes are serialized by the connection's EventChannel.
    auto outcome = service_->Subscribe(
        *req,
        [writer](const relay::model::Event& event, const std::string& sse) {
          auto proto = relay::model::ToProto(event);
          proto.set_sse_frame(sse);
          return writer->Write(proto);
        },
        [ctx] { return ctx->IsCancelled(); });

    if (outcome == relay::stream::StreamOutcome::kCancelled) {
      return ::grpc::Status(::grpc::StatusCode::CANCELLED, "stream cancelled");
    }
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RelayServer::Replay(::grpc::ServerContext*,
                                   const relay::v1::ReplayRequest* req,
                                   relay::v1::ReplayResponse* resp) {
  try {
    *resp = service_->Replay(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RelayServer::GetMetrics(::grpc::ServerContext*,
                                       const relay::v1::GetMetricsRequest* req,
                                       relay::v1::GetMetricsResponse* resp) {
  try {
    *resp = service_->GetMetrics(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace relay::grpc
