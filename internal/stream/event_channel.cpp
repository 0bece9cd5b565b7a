#include "event_channel.hpp"

#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/stream/sse_format.hpp"

namespace relay::stream {

bool EventChannel::Attach(Writer writer) {
  std::lock_guard lock(mutex_);
  if (writer_) return false;
  writer_ = std::move(writer);
  return true;
}

void EventChannel::Detach() {
  std::lock_guard lock(mutex_);
  writer_ = nullptr;
}

bool EventChannel::HasWriter() const {
  std::lock_guard lock(mutex_);
  return static_cast<bool>(writer_);
}

bool EventChannel::Publish(const model::Event& event) {
  const auto frame = FormatSse(event);

  std::lock_guard lock(mutex_);
  if (!writer_) {
    ++dropped_;
    return false;
  }

  if (!writer_(event, frame)) {
    RELAY_LOG_DEBUG("event writer closed; detaching", {observability::StringField("event", model::ToString(event.type)),
                                                       observability::StringField("event_id", event.event_id)});
    writer_ = nullptr;
    ++dropped_;
    return false;
  }

  ++published_;
  observability::Metrics::Instance().RecordEvent(model::ToString(event.type));
  return true;
}

uint64_t EventChannel::Published() const {
  std::lock_guard lock(mutex_);
  return published_;
}

uint64_t EventChannel::Dropped() const {
  std::lock_guard lock(mutex_);
  return dropped_;
}

std::shared_ptr<StreamSession> SessionDirectory::Acquire(const std::string& connection_id) {
  std::lock_guard lock(mutex_);
  auto&           session = sessions_[connection_id];
  if (!session) {
    session           = std::make_shared<StreamSession>();
    session->producer = std::make_shared<ChannelFragmentProducer>();
    session->channel  = std::make_shared<EventChannel>();
  }
  return session;
}

std::shared_ptr<StreamSession> SessionDirectory::Find(const std::string& connection_id) const {
  std::lock_guard lock(mutex_);
  auto            it = sessions_.find(connection_id);
  if (it == sessions_.end()) return nullptr;
  return it->second;
}

void SessionDirectory::Remove(const std::string& connection_id) {
  std::lock_guard lock(mutex_);
  sessions_.erase(connection_id);
}

std::size_t SessionDirectory::Size() const {
  std::lock_guard lock(mutex_);
  return sessions_.size();
}

} // namespace relay::stream
