#include "lifecycle_timers.hpp"

#include <algorithm>
#include <unordered_set>
#include <utility>

#include "internal/model/event.hpp"
#include "internal/observability/logging.hpp"

namespace relay::lifecycle {

LifecycleTimers::LifecycleTimers(config::RelaySettings settings, std::shared_ptr<registry::ConnectionRegistry> registry,
                                 std::shared_ptr<buffer::BufferManager> buffers, std::shared_ptr<stream::SessionDirectory> sessions,
                                 std::shared_ptr<metrics::StreamMetrics>        metrics,
                                 std::shared_ptr<transform::EncryptionStrategy> encryption)
    : settings_(std::move(settings)),
      registry_(std::move(registry)),
      buffers_(std::move(buffers)),
      sessions_(std::move(sessions)),
      metrics_(std::move(metrics)),
      encryption_(std::move(encryption)) {
}

LifecycleTimers::~LifecycleTimers() {
  Stop();
}

void LifecycleTimers::Start() {
  {
    std::lock_guard lock(mutex_);
    if (running_) return;
    running_ = true;
  }

  RunEvery("reaper", settings_.cleanup_interval, [this] { ReapOnce(util::Now()); });
  RunEvery("heartbeat", std::min(settings_.heartbeat_interval, settings_.flush_check_interval), [this] { HeartbeatOnce(util::Now()); });
  RunEvery("aggregator", settings_.metrics_interval, [this] { AggregateOnce(util::Now()); });
  RunEvery("flusher", settings_.flush_check_interval, [this] { FlushStaleOnce(util::Now()); });
  if (encryption_) {
    RunEvery("key-rotation", settings_.heartbeat_interval, [this] { RotateKeysOnce(util::Now()); });
  }

  RELAY_LOG_INFO("lifecycle timers started", {observability::IntField("threads", static_cast<std::int64_t>(threads_.size()))});
}

void LifecycleTimers::Stop() {
  {
    std::lock_guard lock(mutex_);
    if (!running_) return;
    running_ = false;
  }
  cv_.notify_all();

  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
}

void LifecycleTimers::RunEvery(const std::string& name, std::chrono::milliseconds interval, std::function<void()> tick) {
  threads_.emplace_back([this, name, interval, tick = std::move(tick)] {
    while (true) {
      {
        std::unique_lock lock(mutex_);
        if (cv_.wait_for(lock, interval, [this] { return !running_; })) {
          return;
        }
      }

      try {
        tick();
      } catch (const std::exception& e) {
        RELAY_LOG_ERROR("lifecycle task failed", {observability::StringField("task", name), observability::StringField("error", e.what())});
      }
    }
  });
}

std::size_t LifecycleTimers::ReapOnce(util::TimePoint now) {
  std::size_t closed = 0;
  for (const auto& connection : registry_->Snapshot()) {
    const char* reason = nullptr;
    if (connection.dispose_at && now >= *connection.dispose_at) {
      reason = "disposal";
    } else if (now - connection.activity.last_activity > settings_.connection_timeout) {
      reason = "idle timeout";
    }
    if (!reason) continue;

    if (registry_->Close(connection.id)) {
      ++closed;
      RELAY_LOG_INFO("reaper closed connection", {observability::StringField("connection_id", connection.id),
                                                  observability::StringField("reason", reason)});
    }
  }

  std::unordered_set<std::string> live;
  for (const auto& connection : registry_->Snapshot()) live.insert(connection.id);
  {
    std::lock_guard lock(heartbeat_mutex_);
    for (auto it = last_heartbeat_.begin(); it != last_heartbeat_.end();) {
      if (live.count(it->first) == 0) {
        it = last_heartbeat_.erase(it);
      } else {
        ++it;
      }
    }
  }
  return closed;
}

std::size_t LifecycleTimers::HeartbeatOnce(util::TimePoint now) {
  std::size_t sent = 0;
  for (const auto& connection : registry_->Snapshot()) {
    if (connection.status != model::ConnectionStatus::kStreaming) continue;

    auto session = sessions_->Find(connection.id);
    if (!session) continue;

    {
      std::lock_guard lock(heartbeat_mutex_);
      auto&           last = last_heartbeat_[connection.id];
      if (last == util::TimePoint{}) last = connection.activity.connected_at;
      if (now - last < std::chrono::milliseconds(connection.options.heartbeat_interval_ms)) continue;
      last = now;
    }

    google::protobuf::Struct data;
    (*data.mutable_fields())["connectionId"].set_string_value(connection.id);
    (*data.mutable_fields())["timestamp"].set_string_value(util::ToIso8601(now));
    (*data.mutable_fields())["chunksReceived"].set_number_value(static_cast<double>(connection.activity.chunks_received));
    (*data.mutable_fields())["bytesReceived"].set_number_value(static_cast<double>(connection.activity.bytes_received));
    if (session->channel->Publish(model::MakeEvent(model::EventType::kHeartbeat, std::move(data)))) {
      ++sent;
    }
  }
  return sent;
}

void LifecycleTimers::AggregateOnce(util::TimePoint now) {
  metrics_->PublishAggregate(now);
}

std::size_t LifecycleTimers::FlushStaleOnce(util::TimePoint now) {
  return buffers_->FlushStale(now);
}

bool LifecycleTimers::RotateKeysOnce(util::TimePoint now) {
  if (!encryption_ || !encryption_->ShouldRotate(now)) return false;
  encryption_->Rotate(now);
  return true;
}

} // namespace relay::lifecycle
