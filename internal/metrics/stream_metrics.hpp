#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/cache/metrics_cache.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/registry/connection_registry.hpp"
#include "internal/util/time.hpp"

namespace relay::v1 {
class ConnectionMetrics;
class AggregateMetrics;
}

namespace relay::metrics {

inline constexpr const char* kAggregateCacheKey = "streaming_metrics";

enum class MetricsPeriod {
  kMinute,
  kHour,
  kDay,
};

std::chrono::milliseconds PeriodLength(MetricsPeriod period);

struct LatencyStats {
  double min_ms = 0.0;
  double max_ms = 0.0;
  double avg_ms = 0.0;
  double p95_ms = 0.0;
  double p99_ms = 0.0;
};

struct ConnectionMetrics {
  std::string     connection_id;
  uint64_t        total_chunks       = 0;
  uint64_t        total_bytes        = 0;
  double          average_chunk_size = 0.0;
  double          chunks_per_second  = 0.0;
  double          bytes_per_second   = 0.0;
  LatencyStats    latency;
  double          running_average_latency_ms = 0.0;
  util::TimePoint period_start{};
  util::TimePoint period_end{};
};

struct AggregateMetrics {
  uint64_t                   open_connections      = 0;
  uint64_t                   streaming_connections = 0;
  double                     mean_latency_ms       = 0.0;
  double                     error_rate            = 0.0;
  double                     completion_rate       = 0.0;
  double                     reconnection_rate     = 0.0;
  uint64_t                   total_bytes           = 0;
  registry::RegistryCounters counters;
  util::TimePoint            computed_at{};
};

// Inter-arrival gaps of consecutive samples; percentiles interpolate
// between the closest ranks. Empty input gives all zeros.
LatencyStats ComputeLatencyStats(std::vector<double> gaps_ms);

relay::v1::ConnectionMetrics ToProto(const ConnectionMetrics& metrics);
relay::v1::AggregateMetrics  ToProto(const AggregateMetrics& metrics);

/*
  StreamMetrics

  Per-connection metrics come from the stored chunk history inside the
  requested period, so they only see flushed chunks. The aggregate is a
  view over the registry and its lifetime counters; PublishAggregate
  also writes it to the metrics cache as JSON.
*/
class StreamMetrics {
 public:
  StreamMetrics(std::shared_ptr<registry::ConnectionRegistry> registry, std::shared_ptr<db::Repository> repository,
                std::shared_ptr<cache::MetricsCache> cache, std::chrono::seconds cache_ttl);

  // Throws util::ConnectionNotFound.
  ConnectionMetrics ForConnection(const std::string& connection_id, MetricsPeriod period, util::TimePoint now = util::Now()) const;

  AggregateMetrics Aggregate(util::TimePoint now = util::Now()) const;

  AggregateMetrics PublishAggregate(util::TimePoint now = util::Now());

  // Last published aggregate, while the cache entry lives.
  std::optional<relay::v1::AggregateMetrics> CachedAggregate() const;

 private:
  std::shared_ptr<registry::ConnectionRegistry> registry_;
  std::shared_ptr<db::Repository>               repository_;
  std::shared_ptr<cache::MetricsCache>          cache_;
  const std::chrono::seconds                    cache_ttl_;
};

} // namespace relay::metrics
