#pragma once

#include <chrono>
#include <memory>

#include "internal/buffer/buffer_manager.hpp"
#include "internal/cache/metrics_cache.hpp"
#include "internal/metrics/stream_metrics.hpp"
#include "internal/registry/connection_registry.hpp"
#include "internal/service/relay_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/stream/event_channel.hpp"
#include "internal/stream/stream_orchestrator.hpp"
#include "internal/transform/transform_pipeline.hpp"
#include "tests/support/recording_repository.hpp"

namespace relay::testing {

/*
  Wires a RelayService over the in-memory repository, the way the
  factory does, without the worker pool or timers.
*/
struct RelayFixture {
  explicit RelayFixture(relay::config::RelaySettings settings = {}, std::shared_ptr<relay::transform::TransformPipeline> pipeline = nullptr)
      : settings(settings) {
    if (!pipeline) pipeline = std::make_shared<relay::transform::TransformPipeline>(nullptr, nullptr);

    repo     = std::make_shared<RecordingRepository>();
    buffers  = std::make_shared<relay::buffer::BufferManager>(repo, pipeline, nullptr);
    registry = std::make_shared<relay::registry::ConnectionRegistry>(settings, repo, buffers);
    cache    = std::make_shared<relay::cache::InMemoryMetricsCache>();

    ctx.registry     = registry;
    ctx.orchestrator = std::make_shared<relay::stream::StreamOrchestrator>(registry, buffers, settings.completion_grace);
    ctx.sessions     = std::make_shared<relay::stream::SessionDirectory>();
    ctx.pipeline     = pipeline;
    ctx.metrics      = std::make_shared<relay::metrics::StreamMetrics>(registry, repo, cache, settings.metrics_cache_ttl);
    ctx.repository   = repo;

    service = std::make_shared<relay::service::RelayService>(ctx);
  }

  relay::config::RelaySettings                    settings;
  std::shared_ptr<RecordingRepository>     repo;
  std::shared_ptr<relay::buffer::BufferManager>   buffers;
  std::shared_ptr<relay::registry::ConnectionRegistry> registry;
  std::shared_ptr<relay::cache::InMemoryMetricsCache>  cache;
  relay::service::ServiceContext                  ctx;
  std::shared_ptr<relay::service::RelayService>   service;
};

} // namespace relay::testing
