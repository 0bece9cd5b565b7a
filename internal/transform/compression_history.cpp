#include "compression_history.hpp"

namespace relay::transform {

namespace {
constexpr std::size_t kSmallLimit  = 1024;
constexpr std::size_t kMediumLimit = 10 * 1024;
} // namespace

SizeBucket BucketFor(std::size_t bytes) {
  if (bytes < kSmallLimit) return SizeBucket::kSmall;
  if (bytes < kMediumLimit) return SizeBucket::kMedium;
  return SizeBucket::kLarge;
}

void CompressionHistory::Record(SizeBucket bucket, CompressionAlgorithm algorithm, double ratio, double throughput_mb_s) {
  std::lock_guard lock(mutex_);
  auto&           score = scores_[{bucket, algorithm}];
  score.samples++;
  score.total_ratio += ratio;
  score.total_throughput += throughput_mb_s;
}

bool CompressionHistory::HasSamples(SizeBucket bucket) const {
  std::lock_guard lock(mutex_);
  for (const auto& [key, score] : scores_) {
    if (key.first == bucket && score.samples > 0) {
      return true;
    }
  }
  return false;
}

std::optional<CompressionAlgorithm> CompressionHistory::Best(SizeBucket bucket) const {
  std::lock_guard lock(mutex_);

  std::optional<CompressionAlgorithm> best;
  double                              best_ratio      = 0.0;
  double                              best_throughput = 0.0;

  for (const auto& [key, score] : scores_) {
    if (key.first != bucket || score.samples == 0) continue;

    const double ratio      = score.AverageRatio();
    const double throughput = score.AverageThroughput();
    if (!best || ratio > best_ratio || (ratio == best_ratio && throughput > best_throughput)) {
      best            = key.second;
      best_ratio      = ratio;
      best_throughput = throughput;
    }
  }
  return best;
}

std::optional<AlgorithmScore> CompressionHistory::Score(SizeBucket bucket, CompressionAlgorithm algorithm) const {
  std::lock_guard lock(mutex_);
  auto            it = scores_.find({bucket, algorithm});
  if (it == scores_.end()) return std::nullopt;
  return it->second;
}

} // namespace relay::transform
