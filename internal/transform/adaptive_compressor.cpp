#include "adaptive_compressor.hpp"

#include <chrono>
#include <optional>
#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/transform/compression_frame.hpp"
#include "internal/util/errors.hpp"

namespace relay::transform {

AdaptiveCompressor::AdaptiveCompressor(std::vector<CompressionAlgorithm> candidates, std::shared_ptr<CompressionHistory> history, int level)
    : candidates_(std::move(candidates)), history_(std::move(history)), level_(level) {
  if (candidates_.empty()) {
    throw std::invalid_argument("AdaptiveCompressor requires at least one candidate");
  }
  if (!history_) {
    history_ = std::make_shared<CompressionHistory>();
  }
}

AdaptiveCompressor::Attempt AdaptiveCompressor::Compress(CompressionAlgorithm algorithm, std::string_view input) const {
  const auto start = std::chrono::steady_clock::now();

  Attempt attempt;
  attempt.framed = EncodeFramed(algorithm, input, level_);

  const double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
  attempt.ratio        = attempt.framed.empty() ? 0.0 : static_cast<double>(input.size()) / static_cast<double>(attempt.framed.size());
  attempt.throughput   = seconds > 0.0 ? (static_cast<double>(input.size()) / (1024.0 * 1024.0)) / seconds : 0.0;
  return attempt;
}

std::string AdaptiveCompressor::SampleAll(SizeBucket bucket, std::string_view input) {
  std::optional<Attempt> best;

  for (auto algorithm : candidates_) {
    try {
      auto attempt = Compress(algorithm, input);
      history_->Record(bucket, algorithm, attempt.ratio, attempt.throughput);
      if (!best || attempt.ratio > best->ratio || (attempt.ratio == best->ratio && attempt.throughput > best->throughput)) {
        best = std::move(attempt);
      }
    } catch (const util::CompressionFailure& e) {
      RELAY_LOG_WARN("adaptive sample failed",
                     {observability::StringField("algorithm", ToString(algorithm)), observability::StringField("error", e.what())});
    }
  }

  if (!best) {
    throw util::CompressionFailure("no adaptive candidate could compress the payload");
  }
  return std::move(best->framed);
}

std::string AdaptiveCompressor::Encode(std::string_view input) {
  const auto bucket = BucketFor(input.size());

  if (bucket == SizeBucket::kSmall) {
    return EncodeFramed(candidates_.front(), input, level_);
  }

  const auto chosen = history_->Best(bucket);
  if (!chosen) {
    return SampleAll(bucket, input);
  }

  auto attempt = Compress(*chosen, input);
  history_->Record(bucket, *chosen, attempt.ratio, attempt.throughput);
  return std::move(attempt.framed);
}

std::string AdaptiveCompressor::Decode(std::string_view framed) const {
  return DecodeFramed(framed);
}

std::string AdaptiveCompressor::Name() const {
  return "adaptive";
}

} // namespace relay::transform
