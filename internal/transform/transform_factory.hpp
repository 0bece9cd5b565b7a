#pragma once

#include <memory>

#include "internal/config/relay_settings.hpp"
#include "internal/transform/compression_history.hpp"
#include "internal/transform/transform_pipeline.hpp"

namespace relay::transform {

CompressionAlgorithm FromConfig(relay::runtime::config::CompressionAlgorithm algorithm);

std::shared_ptr<CompressionStrategy> BuildCompression(const config::TransformSettings& settings,
                                                      std::shared_ptr<CompressionHistory> history = nullptr);

// Compression is always available to the pipeline; encryption only when
// enabled, since a key ring without callers would rotate for nothing.
std::shared_ptr<TransformPipeline> BuildTransformPipeline(const config::RelaySettings& relay, const config::TransformSettings& settings);

} // namespace relay::transform
