#include "transform_factory.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/transform/adaptive_compressor.hpp"
#include "internal/transform/aes_gcm_encryptor.hpp"
#include "internal/transform/codec_compressor.hpp"
#include "internal/transform/key_ring.hpp"

namespace relay::transform {

CompressionAlgorithm FromConfig(relay::runtime::config::CompressionAlgorithm algorithm) {
  switch (algorithm) {
    case relay::runtime::config::COMPRESSION_ALGORITHM_GZIP:
      return CompressionAlgorithm::kGzip;
    case relay::runtime::config::COMPRESSION_ALGORITHM_ZSTD:
      return CompressionAlgorithm::kZstd;
    case relay::runtime::config::COMPRESSION_ALGORITHM_LZ4:
      return CompressionAlgorithm::kLz4;
    case relay::runtime::config::COMPRESSION_ALGORITHM_BROTLI:
      return CompressionAlgorithm::kBrotli;
    case relay::runtime::config::COMPRESSION_ALGORITHM_SNAPPY:
      return CompressionAlgorithm::kSnappy;
    default:
      break;
  }
  throw std::runtime_error("Invalid configuration: compression algorithm has no codec");
}

std::shared_ptr<CompressionStrategy> BuildCompression(const config::TransformSettings& settings, std::shared_ptr<CompressionHistory> history) {
  if (settings.algorithm == relay::runtime::config::COMPRESSION_ALGORITHM_ADAPTIVE) {
    std::vector<CompressionAlgorithm> candidates;
    for (auto candidate : settings.adaptive_candidates) {
      candidates.push_back(FromConfig(candidate));
    }
    if (!history) {
      history = std::make_shared<CompressionHistory>();
    }
    return std::make_shared<AdaptiveCompressor>(std::move(candidates), std::move(history), settings.level);
  }
  return std::make_shared<CodecCompressor>(FromConfig(settings.algorithm), settings.level);
}

std::shared_ptr<TransformPipeline> BuildTransformPipeline(const config::RelaySettings& relay, const config::TransformSettings& settings) {
  auto compression = BuildCompression(settings);

  std::shared_ptr<EncryptionStrategy> encryption;
  if (relay.encryption_enabled) {
    auto keys  = std::make_shared<KeyRing>(settings.key_rotation_interval, settings.key_retention);
    encryption = std::make_shared<AesGcmEncryptor>(std::move(keys));
  }

  RELAY_LOG_INFO("transform pipeline ready", {observability::StringField("compression", compression->Name()),
                                              observability::StringField("encryption", encryption ? encryption->Name() : "none")});
  return std::make_shared<TransformPipeline>(std::move(compression), std::move(encryption));
}

} // namespace relay::transform
