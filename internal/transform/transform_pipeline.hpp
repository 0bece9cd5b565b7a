#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "internal/transform/compression_strategy.hpp"
#include "internal/transform/encryption_strategy.hpp"

namespace relay::transform {

// Stored form of one payload plus what is needed to reverse it.
struct TransformedPayload {
  std::string                  data;
  CompressionAlgorithm         compression = CompressionAlgorithm::kNone;
  std::optional<std::uint32_t> key_epoch;
  std::uint64_t                original_size = 0;
};

/*
  TransformPipeline

  Write path: compress, then encrypt. Read path: decrypt, then
  decompress. The order is fixed; nothing compresses ciphertext.

  A compression failure stores the payload uncompressed and logs a
  warning. Decryption failures propagate as util::DecryptionError.
*/
class TransformPipeline {
 public:
  TransformPipeline(std::shared_ptr<CompressionStrategy> compression, std::shared_ptr<EncryptionStrategy> encryption);

  TransformedPayload Encode(std::string_view payload, bool compress, bool encrypt) const;
  std::string        Decode(const TransformedPayload& stored) const;

  bool HasCompression() const {
    return compression_ != nullptr;
  }
  bool HasEncryption() const {
    return encryption_ != nullptr;
  }

  const std::shared_ptr<EncryptionStrategy>& Encryption() const {
    return encryption_;
  }
  const std::shared_ptr<CompressionStrategy>& Compression() const {
    return compression_;
  }

 private:
  std::shared_ptr<CompressionStrategy> compression_;
  std::shared_ptr<EncryptionStrategy>  encryption_;
};

} // namespace relay::transform
