#pragma once

#include <memory>

namespace relay::registry { class ConnectionRegistry; }
namespace relay::stream { class StreamOrchestrator; class SessionDirectory; }
namespace relay::transform { class TransformPipeline; }
namespace relay::metrics { class StreamMetrics; }
namespace relay::db { class Repository; }

namespace relay::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<relay::registry::ConnectionRegistry> registry;
  std::shared_ptr<relay::stream::StreamOrchestrator> orchestrator;
  std::shared_ptr<relay::stream::SessionDirectory> sessions;
  std::shared_ptr<relay::transform::TransformPipeline> pipeline;
  std::shared_ptr<relay::metrics::StreamMetrics> metrics;
  std::shared_ptr<relay::db::Repository> repository;
};

}
