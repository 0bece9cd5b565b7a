#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/model/event.hpp"
#include "internal/stream/channel_fragment_producer.hpp"

namespace relay::stream {

/*
  EventChannel

  Serializes every event of one connection into at most one transport
  writer. The orchestrator and the heartbeat timer publish from
  different threads; writes never interleave.

  A writer returning false is treated as a gone client and detached.
  Events published without a writer are dropped.
*/
class EventChannel {
 public:
  // Receives the structured event and its SSE frame.
  using Writer = std::function<bool(const model::Event&, const std::string& sse)>;

  // False when another writer is already attached.
  bool Attach(Writer writer);
  void Detach();
  bool HasWriter() const;

  // True when a writer accepted the event.
  bool Publish(const model::Event& event);

  uint64_t Published() const;
  uint64_t Dropped() const;

 private:
  mutable std::mutex mutex_;
  Writer             writer_;
  uint64_t           published_ = 0;
  uint64_t           dropped_   = 0;
};

// Producer and channel of one connection, shared by Subscribe and Publish.
struct StreamSession {
  std::shared_ptr<ChannelFragmentProducer> producer;
  std::shared_ptr<EventChannel>            channel;
};

/*
  Connection id -> StreamSession. Whichever RPC arrives first creates
  the session.
*/
class SessionDirectory {
 public:
  std::shared_ptr<StreamSession> Acquire(const std::string& connection_id);
  std::shared_ptr<StreamSession> Find(const std::string& connection_id) const;
  void                           Remove(const std::string& connection_id);
  std::size_t                    Size() const;

 private:
  mutable std::mutex                                              mutex_;
  std::unordered_map<std::string, std::shared_ptr<StreamSession>> sessions_;
};

} // namespace relay::stream
