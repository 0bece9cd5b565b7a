#pragma once

#include "internal/transform/compression_strategy.hpp"

namespace relay::transform {

/*
  Fixed single-algorithm compressor (gzip, zstd, lz4, brotli or snappy).
  level 0 keeps the codec's default.
*/
class CodecCompressor : public CompressionStrategy {
 public:
  explicit CodecCompressor(CompressionAlgorithm algorithm, int level = 0);

  std::string Encode(std::string_view input) override;
  std::string Decode(std::string_view framed) const override;
  std::string Name() const override;

  CompressionAlgorithm Algorithm() const {
    return algorithm_;
  }

 private:
  CompressionAlgorithm algorithm_;
  int                  level_;
};

} // namespace relay::transform
