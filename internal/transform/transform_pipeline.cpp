#include "transform_pipeline.hpp"

#include "internal/observability/logging.hpp"
#include "internal/transform/compression_frame.hpp"
#include "internal/util/errors.hpp"

namespace relay::transform {

TransformPipeline::TransformPipeline(std::shared_ptr<CompressionStrategy> compression, std::shared_ptr<EncryptionStrategy> encryption)
    : compression_(std::move(compression)), encryption_(std::move(encryption)) {
}

TransformedPayload TransformPipeline::Encode(std::string_view payload, bool compress, bool encrypt) const {
  TransformedPayload out;
  out.original_size = payload.size();
  out.data.assign(payload);

  if (compress && compression_) {
    try {
      auto framed     = compression_->Encode(payload);
      out.compression = ReadFrame(framed).algorithm;
      out.data        = std::move(framed);
    } catch (const util::CompressionFailure& e) {
      RELAY_LOG_WARN("compression failed, storing uncompressed",
                     {observability::StringField("strategy", compression_->Name()), observability::StringField("error", e.what())});
      out.compression = CompressionAlgorithm::kNone;
      out.data.assign(payload);
    }
  }

  if (encrypt) {
    if (!encryption_) {
      throw util::InvalidState("encryption requested but no encryption strategy is configured");
    }
    auto sealed   = encryption_->Encode(out.data);
    out.data      = std::move(sealed.bytes);
    out.key_epoch = sealed.key_epoch;
  }

  return out;
}

std::string TransformPipeline::Decode(const TransformedPayload& stored) const {
  std::string bytes;
  if (stored.key_epoch) {
    if (!encryption_) {
      throw util::DecryptionError("payload is encrypted but no encryption strategy is configured");
    }
    bytes = encryption_->Decode(stored.data, *stored.key_epoch);
  } else {
    bytes = stored.data;
  }

  if (stored.compression != CompressionAlgorithm::kNone) {
    // Frames are self-describing; decode regardless of the current strategy.
    bytes = DecodeFramed(bytes);
  }
  return bytes;
}

} // namespace relay::transform
