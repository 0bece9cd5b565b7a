#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "config/config.pb.h"

namespace relay::config {

/*
  Effective relay settings.

  RuntimeConfig leaves unset numeric fields at zero; this resolves them
  to the documented defaults once so that the rest of the code never
  re-checks for zero.
*/
struct RelaySettings {
  uint32_t                  max_connections{1000};
  std::chrono::milliseconds connection_timeout{300'000};
  std::chrono::milliseconds heartbeat_interval{30'000};
  uint64_t                  buffer_size_bytes{8192};
  double                    flush_threshold_fraction{0.8};
  std::chrono::milliseconds flush_interval{1'000};
  std::chrono::milliseconds flush_check_interval{1'000};
  std::chrono::milliseconds cleanup_interval{60'000};
  std::chrono::milliseconds metrics_interval{60'000};
  std::chrono::milliseconds completion_grace{5'000};
  std::chrono::seconds      metrics_cache_ttl{300};

  bool compression_enabled{false};
  bool encryption_enabled{false};
};

struct TransformSettings {
  relay::runtime::config::CompressionAlgorithm algorithm{relay::runtime::config::COMPRESSION_ALGORITHM_GZIP};
  int32_t                                      level{0};
  // Empty in config means gzip, zstd, lz4.
  std::vector<relay::runtime::config::CompressionAlgorithm> adaptive_candidates;
  std::chrono::milliseconds                    key_rotation_interval{86'400'000};
  std::chrono::milliseconds                    key_retention{7 * 86'400'000LL};
  uint32_t                                     worker_threads{2};
  uint32_t                                     queue_capacity{256};
};

RelaySettings     ResolveRelaySettings(const relay::runtime::config::RuntimeConfig& config);
TransformSettings ResolveTransformSettings(const relay::runtime::config::RuntimeConfig& config);

std::string DefaultBindAddress(const relay::runtime::config::RuntimeConfig& config);

} // namespace relay::config
