#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

#include "internal/buffer/buffer_manager.hpp"
#include "internal/registry/connection_registry.hpp"
#include "internal/stream/cancellation.hpp"
#include "internal/stream/event_channel.hpp"
#include "internal/stream/fragment_producer.hpp"

namespace relay::stream {

// Empty fields fall back to the connection's provider and model.
struct StreamRequest {
  std::string provider;
  std::string model;
};

enum class StreamOutcome {
  kCompleted,
  kFailed,
  kCancelled,
};

std::string_view ToString(StreamOutcome outcome);

/*
  StreamOrchestrator

  Drives one connection through connecting -> streaming -> completed |
  error, pulling fragments from the producer and turning each into a
  sequenced chunk (buffered) and a chunk event (published).

  Only the precondition checks throw. Anything that fails once the
  stream is live becomes a single error event; a cancelled token closes
  the connection through the registry.
*/
class StreamOrchestrator {
 public:
  StreamOrchestrator(std::shared_ptr<registry::ConnectionRegistry> registry, std::shared_ptr<buffer::BufferManager> buffers,
                     std::chrono::milliseconds completion_grace);

  // Throws util::ConnectionNotFound, or util::InvalidState unless the
  // connection is still connecting.
  StreamOutcome StartStream(const std::string& connection_id, const StreamRequest& request, FragmentProducer& producer,
                            EventChannel& channel, const CancellationTokenPtr& token);

 private:
  StreamOutcome Consume(const model::Connection& connection, FragmentProducer& producer, EventChannel& channel,
                        const CancellationToken& token);
  StreamOutcome Complete(const std::string& connection_id, const std::string& finish_reason, FragmentProducer& producer,
                         EventChannel& channel);
  StreamOutcome Fail(const std::string& connection_id, const std::exception& error, FragmentProducer& producer, EventChannel& channel);
  StreamOutcome Cancel(const std::string& connection_id, FragmentProducer& producer);

  std::shared_ptr<registry::ConnectionRegistry> registry_;
  std::shared_ptr<buffer::BufferManager>        buffers_;
  const std::chrono::milliseconds               completion_grace_;
};

} // namespace relay::stream
