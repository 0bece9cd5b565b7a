#pragma once

#include <memory>
#include <vector>

#include "internal/transform/compression_history.hpp"
#include "internal/transform/compression_strategy.hpp"

namespace relay::transform {

/*
  AdaptiveCompressor

  Small payloads always go to the first candidate. For the medium and
  large buckets the first payload is compressed with every candidate,
  the scores are recorded, and the smallest output is kept. Later
  payloads use the history's best algorithm for their bucket and keep
  feeding it samples.
*/
class AdaptiveCompressor : public CompressionStrategy {
 public:
  AdaptiveCompressor(std::vector<CompressionAlgorithm> candidates, std::shared_ptr<CompressionHistory> history, int level = 0);

  std::string Encode(std::string_view input) override;
  std::string Decode(std::string_view framed) const override;
  std::string Name() const override;

  const std::shared_ptr<CompressionHistory>& History() const {
    return history_;
  }

 private:
  struct Attempt {
    std::string framed;
    double      ratio      = 0.0;
    double      throughput = 0.0;
  };

  Attempt     Compress(CompressionAlgorithm algorithm, std::string_view input) const;
  std::string SampleAll(SizeBucket bucket, std::string_view input);

  std::vector<CompressionAlgorithm>   candidates_;
  std::shared_ptr<CompressionHistory> history_;
  int                                 level_;
};

} // namespace relay::transform
