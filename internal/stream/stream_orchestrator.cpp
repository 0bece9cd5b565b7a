#include "stream_orchestrator.hpp"

#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace relay::stream {

namespace {

void SetString(google::protobuf::Struct& data, const std::string& key, const std::string& value) {
  (*data.mutable_fields())[key].set_string_value(value);
}

void SetNumber(google::protobuf::Struct& data, const std::string& key, double value) {
  (*data.mutable_fields())[key].set_number_value(value);
}

} // namespace

std::string_view ToString(StreamOutcome outcome) {
  switch (outcome) {
    case StreamOutcome::kCompleted:
      return "completed";
    case StreamOutcome::kFailed:
      return "failed";
    case StreamOutcome::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

StreamOrchestrator::StreamOrchestrator(std::shared_ptr<registry::ConnectionRegistry> registry,
                                       std::shared_ptr<buffer::BufferManager> buffers, std::chrono::milliseconds completion_grace)
    : registry_(std::move(registry)), buffers_(std::move(buffers)), completion_grace_(completion_grace) {
}

StreamOutcome StreamOrchestrator::StartStream(const std::string& connection_id, const StreamRequest& request, FragmentProducer& producer,
                                              EventChannel& channel, const CancellationTokenPtr& token) {
  auto connection = registry_->Transition(connection_id, model::ConnectionStatus::kStreaming, model::ConnectionStatus::kConnecting);
  registry_->AttachCancellation(connection_id, token);

  observability::SpanScope span("stream.run");
  span.SetAttribute("connection.id", connection_id);

  google::protobuf::Struct start;
  SetString(start, "connectionId", connection_id);
  SetString(start, "provider", request.provider.empty() ? connection.provider : request.provider);
  SetString(start, "model", request.model.empty() ? connection.model : request.model);
  SetString(start, "timestamp", util::ToIso8601(util::Now()));
  channel.Publish(model::MakeEvent(model::EventType::kStart, std::move(start)));

  StreamOutcome outcome;
  try {
    outcome = Consume(connection, producer, channel, *token);
  } catch (const std::exception& e) {
    if (token->IsCancelled()) {
      outcome = Cancel(connection_id, producer);
    } else {
      span.RecordException(e.what());
      outcome = Fail(connection_id, e, producer, channel);
    }
  }

  span.SetAttribute("stream.outcome", ToString(outcome));
  return outcome;
}

StreamOutcome StreamOrchestrator::Consume(const model::Connection& connection, FragmentProducer& producer, EventChannel& channel,
                                          const CancellationToken& token) {
  const auto& connection_id = connection.id;
  uint64_t    sequence      = 0;

  while (true) {
    if (token.IsCancelled()) {
      return Cancel(connection_id, producer);
    }

    auto fragment = producer.Next(token);
    if (!fragment) {
      if (token.IsCancelled()) {
        return Cancel(connection_id, producer);
      }
      throw util::UpstreamGenerationError("upstream sequence ended without a finish reason");
    }

    const auto now   = util::Now();
    auto       chunk = model::MakeChunk(connection_id, sequence, *fragment, now);
    const auto bytes = chunk.size_bytes;

    buffers_->Append(connection_id, std::move(chunk));
    registry_->Update(connection_id, [bytes, now](model::Connection& c) { model::RecordFragment(c.activity, bytes, now); });

    auto data = model::FragmentToStruct(*fragment);
    SetNumber(data, "sequence", static_cast<double>(sequence));
    channel.Publish(model::MakeEvent(model::EventType::kChunk, std::move(data)));
    ++sequence;

    if (fragment->finish_reason && !fragment->finish_reason->empty()) {
      return Complete(connection_id, *fragment->finish_reason, producer, channel);
    }
  }
}

StreamOutcome StreamOrchestrator::Complete(const std::string& connection_id, const std::string& finish_reason, FragmentProducer& producer,
                                           EventChannel& channel) {
  if (!buffers_->Flush(connection_id)) {
    RELAY_LOG_WARN("final flush failed; chunks stay buffered until close", {observability::StringField("connection_id", connection_id)});
  }

  auto       connection = registry_->Transition(connection_id, model::ConnectionStatus::kCompleted);
  const auto now        = util::Now();

  google::protobuf::Struct data;
  SetString(data, "connectionId", connection_id);
  SetString(data, "finishReason", finish_reason);
  SetNumber(data, "totalChunks", static_cast<double>(connection.activity.chunks_received));
  SetNumber(data, "totalBytes", static_cast<double>(connection.activity.bytes_received));
  SetNumber(data, "duration", util::MillisBetween(connection.activity.connected_at, now));
  channel.Publish(model::MakeEvent(model::EventType::kComplete, std::move(data)));

  registry_->ScheduleDisposal(connection_id, now + completion_grace_);
  producer.Close();

  RELAY_LOG_INFO("stream completed", {observability::StringField("connection_id", connection_id),
                                      observability::StringField("finish_reason", finish_reason),
                                      observability::IntField("chunks", static_cast<std::int64_t>(connection.activity.chunks_received))});
  return StreamOutcome::kCompleted;
}

StreamOutcome StreamOrchestrator::Fail(const std::string& connection_id, const std::exception& error, FragmentProducer& producer,
                                       EventChannel& channel) {
  producer.Close();

  const char* code = util::ErrorCode(error);
  RELAY_LOG_ERROR("stream failed", {observability::StringField("connection_id", connection_id), observability::StringField("code", code),
                                    observability::StringField("error", error.what())});

  try {
    registry_->Transition(connection_id, model::ConnectionStatus::kError);
  } catch (const std::exception& e) {
    RELAY_LOG_WARN("could not mark stream as failed", {observability::StringField("connection_id", connection_id),
                                                       observability::StringField("error", e.what())});
  }

  google::protobuf::Struct data;
  SetString(data, "connectionId", connection_id);
  SetString(data, "error", error.what());
  SetString(data, "code", code);
  SetString(data, "timestamp", util::ToIso8601(util::Now()));
  channel.Publish(model::MakeEvent(model::EventType::kError, std::move(data)));

  registry_->ScheduleDisposal(connection_id, util::Now() + completion_grace_);
  return StreamOutcome::kFailed;
}

StreamOutcome StreamOrchestrator::Cancel(const std::string& connection_id, FragmentProducer& producer) {
  producer.Close();
  RELAY_LOG_INFO("stream cancelled", {observability::StringField("connection_id", connection_id)});
  registry_->Close(connection_id);
  return StreamOutcome::kCancelled;
}

} // namespace relay::stream
