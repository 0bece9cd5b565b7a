#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "internal/buffer/buffer_manager.hpp"
#include "internal/config/relay_settings.hpp"
#include "internal/metrics/stream_metrics.hpp"
#include "internal/registry/connection_registry.hpp"
#include "internal/stream/event_channel.hpp"
#include "internal/transform/encryption_strategy.hpp"
#include "internal/util/time.hpp"

namespace relay::lifecycle {

/*
  Periodic housekeeping, one thread per task:

    reaper       cleanup_interval       idle and disposed connections
    heartbeat    heartbeat tick         heartbeat events on streaming connections
    aggregator   metrics_interval       aggregate metrics -> cache + gauges
    flusher      flush_check_interval   BufferManager::FlushStale
    key rotation heartbeat_interval     EncryptionStrategy::Rotate when due

  A failing tick is logged and the task keeps running.
*/
class LifecycleTimers {
 public:
  LifecycleTimers(config::RelaySettings settings, std::shared_ptr<registry::ConnectionRegistry> registry,
                  std::shared_ptr<buffer::BufferManager> buffers, std::shared_ptr<stream::SessionDirectory> sessions,
                  std::shared_ptr<metrics::StreamMetrics> metrics, std::shared_ptr<transform::EncryptionStrategy> encryption);
  ~LifecycleTimers();

  LifecycleTimers(const LifecycleTimers&)            = delete;
  LifecycleTimers& operator=(const LifecycleTimers&) = delete;

  void Start();
  void Stop();

  // Single ticks, also used by the threads.
  std::size_t ReapOnce(util::TimePoint now);
  std::size_t HeartbeatOnce(util::TimePoint now);
  void        AggregateOnce(util::TimePoint now);
  std::size_t FlushStaleOnce(util::TimePoint now);
  bool        RotateKeysOnce(util::TimePoint now);

 private:
  void RunEvery(const std::string& name, std::chrono::milliseconds interval, std::function<void()> tick);

  const config::RelaySettings                    settings_;
  std::shared_ptr<registry::ConnectionRegistry>  registry_;
  std::shared_ptr<buffer::BufferManager>         buffers_;
  std::shared_ptr<stream::SessionDirectory>      sessions_;
  std::shared_ptr<metrics::StreamMetrics>        metrics_;
  std::shared_ptr<transform::EncryptionStrategy> encryption_;

  std::mutex                                       heartbeat_mutex_;
  std::unordered_map<std::string, util::TimePoint> last_heartbeat_;

  std::mutex               mutex_;
  std::condition_variable  cv_;
  bool                     running_ = false;
  std::vector<std::thread> threads_;
};

} // namespace relay::lifecycle
