#include "relay_settings.hpp"

#include <stdexcept>
#include <thread>

namespace relay::config {

namespace {

template <typename Duration, typename Value>
void ApplyIfSet(Duration& target, Value value) {
  if (value > 0) {
    target = Duration(static_cast<typename Duration::rep>(value));
  }
}

} // namespace

RelaySettings ResolveRelaySettings(const relay::runtime::config::RuntimeConfig& config) {
  RelaySettings settings;
  const auto&   relay = config.relay();

  if (relay.max_connections() > 0) {
    settings.max_connections = relay.max_connections();
  }
  if (relay.buffer_size_bytes() > 0) {
    settings.buffer_size_bytes = relay.buffer_size_bytes();
  }
  // proto3 cannot tell 0 from unset; both keep the default.
  if (relay.flush_threshold_fraction() != 0.0) {
    if (relay.flush_threshold_fraction() < 0.0 || relay.flush_threshold_fraction() > 1.0) {
      throw std::runtime_error("Invalid configuration: relay.flush_threshold_fraction must be within (0, 1], or 0 for the default");
    }
    settings.flush_threshold_fraction = relay.flush_threshold_fraction();
  }

  ApplyIfSet(settings.connection_timeout, relay.connection_timeout_ms());
  ApplyIfSet(settings.heartbeat_interval, relay.heartbeat_interval_ms());
  ApplyIfSet(settings.flush_interval, relay.flush_interval_ms());
  ApplyIfSet(settings.flush_check_interval, relay.flush_check_interval_ms());
  ApplyIfSet(settings.cleanup_interval, relay.cleanup_interval_ms());
  ApplyIfSet(settings.metrics_interval, relay.metrics_interval_ms());
  ApplyIfSet(settings.completion_grace, relay.completion_grace_ms());
  ApplyIfSet(settings.metrics_cache_ttl, relay.metrics_cache_ttl_sec());

  settings.compression_enabled = config.compression().enabled();
  settings.encryption_enabled  = config.encryption().enabled();
  return settings;
}

TransformSettings ResolveTransformSettings(const relay::runtime::config::RuntimeConfig& config) {
  TransformSettings settings;

  if (config.compression().algorithm() != relay::runtime::config::COMPRESSION_ALGORITHM_UNSPECIFIED) {
    settings.algorithm = config.compression().algorithm();
  }
  settings.level = config.compression().level();

  for (const auto candidate : config.compression().adaptive_candidates()) {
    const auto algorithm = static_cast<relay::runtime::config::CompressionAlgorithm>(candidate);
    if (algorithm == relay::runtime::config::COMPRESSION_ALGORITHM_UNSPECIFIED ||
        algorithm == relay::runtime::config::COMPRESSION_ALGORITHM_ADAPTIVE) {
      throw std::runtime_error("Invalid configuration: compression.adaptive_candidates must name concrete algorithms");
    }
    settings.adaptive_candidates.push_back(algorithm);
  }
  if (settings.adaptive_candidates.empty()) {
    settings.adaptive_candidates = {relay::runtime::config::COMPRESSION_ALGORITHM_GZIP, relay::runtime::config::COMPRESSION_ALGORITHM_ZSTD,
                                    relay::runtime::config::COMPRESSION_ALGORITHM_LZ4};
  }

  if (config.encryption().enabled() && config.encryption().algorithm() != relay::runtime::config::ENCRYPTION_ALGORITHM_UNSPECIFIED &&
      config.encryption().algorithm() != relay::runtime::config::ENCRYPTION_ALGORITHM_AES_256_GCM) {
    throw std::runtime_error("Invalid configuration: unsupported encryption algorithm");
  }
  ApplyIfSet(settings.key_rotation_interval, config.encryption().key_rotation_interval_ms());
  ApplyIfSet(settings.key_retention, config.encryption().key_retention_ms());

  if (config.transform_workers().threads() > 0) {
    settings.worker_threads = config.transform_workers().threads();
  } else if (const auto hw = std::thread::hardware_concurrency(); hw > 0) {
    settings.worker_threads = hw;
  }
  if (config.transform_workers().queue_capacity() > 0) {
    settings.queue_capacity = config.transform_workers().queue_capacity();
  }
  return settings;
}

std::string DefaultBindAddress(const relay::runtime::config::RuntimeConfig& config) {
  if (!config.server().bind_address().empty()) {
    return config.server().bind_address();
  }
  return "0.0.0.0:50061";
}

} // namespace relay::config
