#include "stream_metrics.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <utility>

#include "internal/model/connection.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "relay/v1.hpp"

namespace relay::metrics {

namespace {

double Percentile(const std::vector<double>& sorted, double fraction) {
  if (sorted.size() == 1) return sorted.front();
  const double rank  = fraction * static_cast<double>(sorted.size() - 1);
  const auto   lower = static_cast<std::size_t>(std::floor(rank));
  const auto   upper = static_cast<std::size_t>(std::ceil(rank));
  const double mix   = rank - static_cast<double>(lower);
  return sorted[lower] + (sorted[upper] - sorted[lower]) * mix;
}

double Ratio(uint64_t part, uint64_t whole) {
  return whole == 0 ? 0.0 : static_cast<double>(part) / static_cast<double>(whole);
}

} // namespace

std::chrono::milliseconds PeriodLength(MetricsPeriod period) {
  switch (period) {
    case MetricsPeriod::kMinute:
      return std::chrono::minutes(1);
    case MetricsPeriod::kHour:
      return std::chrono::hours(1);
    case MetricsPeriod::kDay:
      return std::chrono::hours(24);
  }
  return std::chrono::hours(1);
}

LatencyStats ComputeLatencyStats(std::vector<double> gaps_ms) {
  LatencyStats stats;
  if (gaps_ms.empty()) return stats;

  std::sort(gaps_ms.begin(), gaps_ms.end());
  stats.min_ms = gaps_ms.front();
  stats.max_ms = gaps_ms.back();
  stats.avg_ms = std::accumulate(gaps_ms.begin(), gaps_ms.end(), 0.0) / static_cast<double>(gaps_ms.size());
  stats.p95_ms = Percentile(gaps_ms, 0.95);
  stats.p99_ms = Percentile(gaps_ms, 0.99);
  return stats;
}

relay::v1::ConnectionMetrics ToProto(const ConnectionMetrics& metrics) {
  relay::v1::ConnectionMetrics out;
  out.set_connection_id(metrics.connection_id);
  out.set_total_chunks(metrics.total_chunks);
  out.set_total_bytes(metrics.total_bytes);
  out.set_average_chunk_size(metrics.average_chunk_size);
  out.set_chunks_per_second(metrics.chunks_per_second);
  out.set_bytes_per_second(metrics.bytes_per_second);

  auto* latency = out.mutable_latency();
  latency->set_min_ms(metrics.latency.min_ms);
  latency->set_max_ms(metrics.latency.max_ms);
  latency->set_avg_ms(metrics.latency.avg_ms);
  latency->set_p95_ms(metrics.latency.p95_ms);
  latency->set_p99_ms(metrics.latency.p99_ms);

  out.set_running_average_latency_ms(metrics.running_average_latency_ms);
  *out.mutable_period_start() = util::ToProto(metrics.period_start);
  *out.mutable_period_end()   = util::ToProto(metrics.period_end);
  return out;
}

relay::v1::AggregateMetrics ToProto(const AggregateMetrics& metrics) {
  relay::v1::AggregateMetrics out;
  out.set_open_connections(metrics.open_connections);
  out.set_streaming_connections(metrics.streaming_connections);
  out.set_mean_latency_ms(metrics.mean_latency_ms);
  out.set_error_rate(metrics.error_rate);
  out.set_completion_rate(metrics.completion_rate);
  out.set_total_bytes(metrics.total_bytes);
  out.set_connections_created(metrics.counters.created);
  out.set_connections_completed(metrics.counters.completed);
  out.set_connections_errored(metrics.counters.errored);
  out.set_connections_closed(metrics.counters.closed);
  out.set_connections_rejected(metrics.counters.rejected);
  out.set_connections_reconnected(metrics.counters.reconnected);
  out.set_reconnection_rate(metrics.reconnection_rate);
  *out.mutable_computed_at() = util::ToProto(metrics.computed_at);
  return out;
}

StreamMetrics::StreamMetrics(std::shared_ptr<registry::ConnectionRegistry> registry, std::shared_ptr<db::Repository> repository,
                             std::shared_ptr<cache::MetricsCache> cache, std::chrono::seconds cache_ttl)
    : registry_(std::move(registry)), repository_(std::move(repository)), cache_(std::move(cache)), cache_ttl_(cache_ttl) {
}

ConnectionMetrics StreamMetrics::ForConnection(const std::string& connection_id, MetricsPeriod period, util::TimePoint now) const {
  auto connection = registry_->Get(connection_id);
  if (!connection) {
    throw util::ConnectionNotFound("connection " + connection_id + " not found");
  }

  ConnectionMetrics metrics;
  metrics.connection_id              = connection_id;
  metrics.period_end                 = now;
  metrics.period_start               = now - PeriodLength(period);
  metrics.running_average_latency_ms = connection->activity.average_latency_ms;

  auto tx     = repository_->Begin();
  auto chunks = repository_->ReadChunks(*tx, connection_id, 0, std::nullopt, util::ToUnixMillis(metrics.period_start));
  tx->Commit();

  const auto end_ms = util::ToUnixMillis(now);
  std::vector<double> gaps;
  gaps.reserve(chunks.size());
  std::optional<uint64_t> previous_ms;
  for (const auto& chunk : chunks) {
    if (chunk.timestamp_ms > end_ms) continue;
    ++metrics.total_chunks;
    metrics.total_bytes += chunk.size_bytes;
    if (previous_ms && chunk.timestamp_ms >= *previous_ms) {
      gaps.push_back(static_cast<double>(chunk.timestamp_ms - *previous_ms));
    }
    previous_ms = chunk.timestamp_ms;
  }

  metrics.latency = ComputeLatencyStats(std::move(gaps));
  if (metrics.total_chunks > 0) {
    metrics.average_chunk_size = static_cast<double>(metrics.total_bytes) / static_cast<double>(metrics.total_chunks);
  }

  const double seconds = std::chrono::duration<double>(PeriodLength(period)).count();
  metrics.chunks_per_second = static_cast<double>(metrics.total_chunks) / seconds;
  metrics.bytes_per_second  = static_cast<double>(metrics.total_bytes) / seconds;
  return metrics;
}

AggregateMetrics StreamMetrics::Aggregate(util::TimePoint now) const {
  const auto connections = registry_->Snapshot();

  AggregateMetrics metrics;
  metrics.computed_at      = now;
  metrics.open_connections = connections.size();
  metrics.counters         = registry_->Counters();

  double latency_sum = 0.0;
  for (const auto& connection : connections) {
    if (connection.status == model::ConnectionStatus::kStreaming) ++metrics.streaming_connections;
    latency_sum += connection.activity.average_latency_ms;
    metrics.total_bytes += connection.activity.bytes_received;
  }
  if (!connections.empty()) {
    metrics.mean_latency_ms = latency_sum / static_cast<double>(connections.size());
  }

  const auto finished       = metrics.counters.completed + metrics.counters.errored;
  metrics.error_rate        = Ratio(metrics.counters.errored, finished);
  metrics.completion_rate   = Ratio(metrics.counters.completed, finished);
  metrics.reconnection_rate = Ratio(metrics.counters.reconnected, metrics.counters.created);
  return metrics;
}

AggregateMetrics StreamMetrics::PublishAggregate(util::TimePoint now) {
  auto metrics = Aggregate(now);

  auto& gauges = observability::Metrics::Instance();
  gauges.SetConnectionCount("open", metrics.open_connections);
  gauges.SetConnectionCount("streaming", metrics.streaming_connections);

  if (cache_) {
    std::string json;
    auto        status = google::protobuf::util::MessageToJsonString(ToProto(metrics), &json);
    if (!status.ok()) {
      throw std::runtime_error("failed to serialize aggregate metrics: " + std::string(status.message()));
    }
    cache_->Set(kAggregateCacheKey, json, cache_ttl_);
  }

  RELAY_LOG_DEBUG("aggregate metrics published", {observability::IntField("open", static_cast<std::int64_t>(metrics.open_connections)),
                                                  observability::IntField("streaming", static_cast<std::int64_t>(metrics.streaming_connections)),
                                                  observability::DoubleField("mean_latency_ms", metrics.mean_latency_ms)});
  return metrics;
}

std::optional<relay::v1::AggregateMetrics> StreamMetrics::CachedAggregate() const {
  if (!cache_) return std::nullopt;
  auto raw = cache_->Get(kAggregateCacheKey);
  if (!raw) return std::nullopt;

  relay::v1::AggregateMetrics out;
  auto                        status = google::protobuf::util::JsonStringToMessage(*raw, &out);
  if (!status.ok()) {
    RELAY_LOG_WARN("discarding unreadable cached metrics", {observability::StringField("error", std::string(status.message()))});
    return std::nullopt;
  }
  return out;
}

} // namespace relay::metrics
