#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <utility>

#include "internal/transform/compression_strategy.hpp"

namespace relay::transform {

enum class SizeBucket : std::uint8_t {
  kSmall  = 0, // < 1 KiB
  kMedium = 1, // < 10 KiB
  kLarge  = 2,
};

SizeBucket BucketFor(std::size_t bytes);

struct AlgorithmScore {
  uint64_t samples          = 0;
  double   total_ratio      = 0.0;
  double   total_throughput = 0.0;

  // original / compressed, higher is better
  double AverageRatio() const {
    return samples == 0 ? 0.0 : total_ratio / static_cast<double>(samples);
  }
  // MB/s
  double AverageThroughput() const {
    return samples == 0 ? 0.0 : total_throughput / static_cast<double>(samples);
  }
};

/*
  Running per-bucket compression scores.

  Kept apart from the compressors so selection can be driven from
  recorded (or injected) history in isolation. Thread-safe.
*/
class CompressionHistory {
 public:
  void Record(SizeBucket bucket, CompressionAlgorithm algorithm, double ratio, double throughput_mb_s);

  bool HasSamples(SizeBucket bucket) const;

  // Best average ratio, higher average throughput on a tie.
  std::optional<CompressionAlgorithm> Best(SizeBucket bucket) const;

  std::optional<AlgorithmScore> Score(SizeBucket bucket, CompressionAlgorithm algorithm) const;

 private:
  mutable std::mutex                                                  mutex_;
  std::map<std::pair<SizeBucket, CompressionAlgorithm>, AlgorithmScore> scores_;
};

} // namespace relay::transform
