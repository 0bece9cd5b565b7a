#include <cassert>
#include <cstdint>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/transform/adaptive_compressor.hpp"
#include "internal/transform/codec_compressor.hpp"
#include "internal/transform/compression_frame.hpp"
#include "internal/transform/compression_history.hpp"
#include "internal/util/errors.hpp"

namespace {

using relay::transform::AdaptiveCompressor;
using relay::transform::CodecCompressor;
using relay::transform::CompressionAlgorithm;
using relay::transform::CompressionHistory;
using relay::transform::SizeBucket;

std::string RepetitiveText(std::size_t bytes) {
  const std::string phrase = "{\"content\":\"the quick brown fox\",\"delta\":\" fox\"}";
  std::string       out;
  while (out.size() < bytes) out += phrase;
  out.resize(bytes);
  return out;
}

std::vector<CompressionAlgorithm> AvailableAlgorithms() {
  std::vector<CompressionAlgorithm> out;
  for (auto algorithm : {CompressionAlgorithm::kGzip, CompressionAlgorithm::kZstd, CompressionAlgorithm::kLz4, CompressionAlgorithm::kBrotli,
                         CompressionAlgorithm::kSnappy}) {
    if (relay::transform::IsAlgorithmAvailable(algorithm)) out.push_back(algorithm);
  }
  return out;
}

void TestFrameHeaderLayout() {
  const auto framed = relay::transform::WriteFrame(CompressionAlgorithm::kZstd, 0x01020304u, "body");
  assert(framed.size() == relay::transform::kFrameHeaderSize + 4);
  assert(static_cast<std::uint8_t>(framed[0]) == relay::transform::kFrameMagic);
  assert(static_cast<std::uint8_t>(framed[1]) == static_cast<std::uint8_t>(CompressionAlgorithm::kZstd));
  assert(static_cast<std::uint8_t>(framed[2]) == 0x04);
  assert(static_cast<std::uint8_t>(framed[5]) == 0x01);

  const auto view = relay::transform::ReadFrame(framed);
  assert(view.algorithm == CompressionAlgorithm::kZstd);
  assert(view.original_size == 0x01020304u);
  assert(view.body == "body");
}

void TestGarbageIsNotAFrame() {
  bool threw = false;
  try {
    (void)relay::transform::DecodeFramed("not a frame at all");
  } catch (const relay::util::CompressionFailure&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)relay::transform::ReadFrame(std::string("\xC5\x09\x00\x00\x00\x00", 6));
  } catch (const relay::util::CompressionFailure&) {
    threw = true;
  }
  assert(threw && "unknown algorithm ids must be rejected");
}

void TestEveryAvailableCodecRoundTrips() {
  const auto input = RepetitiveText(4096);
  for (auto algorithm : AvailableAlgorithms()) {
    CodecCompressor codec(algorithm);
    const auto      framed = codec.Encode(input);
    assert(framed.size() < input.size());
    assert(codec.Decode(framed) == input);
    assert(codec.Name() == std::string(relay::transform::ToString(algorithm)));
  }
}

void TestAnyStrategyDecodesAnyFrame() {
  const auto available = AvailableAlgorithms();
  if (available.size() < 2) return;

  const auto      input = RepetitiveText(2048);
  CodecCompressor first(available[0]);
  CodecCompressor second(available[1]);
  assert(second.Decode(first.Encode(input)) == input);
}

void TestEmptyPayloadRoundTrips() {
  const auto available = AvailableAlgorithms();
  if (available.empty()) return;

  CodecCompressor codec(available.front());
  const auto      framed = codec.Encode("");
  assert(framed.size() == relay::transform::kFrameHeaderSize);
  assert(codec.Decode(framed).empty());
}

void TestNoneIsNotACodec() {
  bool threw = false;
  try {
    CodecCompressor codec(CompressionAlgorithm::kNone);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestParseAndNames() {
  assert(relay::transform::ParseCompressionAlgorithm("zstd") == CompressionAlgorithm::kZstd);
  assert(relay::transform::ParseCompressionAlgorithm("none") == CompressionAlgorithm::kNone);
  assert(!relay::transform::ParseCompressionAlgorithm("xz").has_value());
  assert(relay::transform::ToString(CompressionAlgorithm::kLz4) == "lz4");
}

void TestBucketBoundaries() {
  assert(relay::transform::BucketFor(0) == SizeBucket::kSmall);
  assert(relay::transform::BucketFor(1023) == SizeBucket::kSmall);
  assert(relay::transform::BucketFor(1024) == SizeBucket::kMedium);
  assert(relay::transform::BucketFor(10239) == SizeBucket::kMedium);
  assert(relay::transform::BucketFor(10240) == SizeBucket::kLarge);
}

void TestHistoryPrefersRatioThenThroughput() {
  CompressionHistory history;
  assert(!history.Best(SizeBucket::kMedium).has_value());

  history.Record(SizeBucket::kMedium, CompressionAlgorithm::kGzip, 3.0, 50.0);
  history.Record(SizeBucket::kMedium, CompressionAlgorithm::kLz4, 2.0, 400.0);
  assert(history.Best(SizeBucket::kMedium) == CompressionAlgorithm::kGzip);

  history.Record(SizeBucket::kMedium, CompressionAlgorithm::kZstd, 3.0, 200.0);
  assert(history.Best(SizeBucket::kMedium) == CompressionAlgorithm::kZstd);

  // buckets are independent
  assert(!history.HasSamples(SizeBucket::kLarge));

  auto score = history.Score(SizeBucket::kMedium, CompressionAlgorithm::kGzip);
  assert(score.has_value());
  assert(score->samples == 1);
  assert(score->AverageRatio() == 3.0);
}

void TestAdaptiveUsesInjectedHistory() {
  const auto available = AvailableAlgorithms();
  if (available.size() < 2) return;

  auto history = std::make_shared<CompressionHistory>();
  history->Record(SizeBucket::kMedium, available[1], 10.0, 100.0);
  history->Record(SizeBucket::kMedium, available[0], 1.5, 100.0);

  AdaptiveCompressor adaptive(available, history);
  const auto         input  = RepetitiveText(4096);
  const auto         framed = adaptive.Encode(input);

  assert(relay::transform::ReadFrame(framed).algorithm == available[1]);
  assert(adaptive.Decode(framed) == input);
  assert(history->Score(SizeBucket::kMedium, available[1])->samples == 2);
}

void TestAdaptiveSamplesEveryCandidateOnce() {
  const auto available = AvailableAlgorithms();
  if (available.empty()) return;

  auto               history = std::make_shared<CompressionHistory>();
  AdaptiveCompressor adaptive(available, history);

  const auto input = RepetitiveText(20'000);
  assert(adaptive.Decode(adaptive.Encode(input)) == input);

  for (auto algorithm : available) {
    auto score = history->Score(SizeBucket::kLarge, algorithm);
    assert(score.has_value());
    assert(score->samples == 1);
  }

  // the second payload only feeds the winner
  assert(adaptive.Decode(adaptive.Encode(input)) == input);
  const auto best = history->Best(SizeBucket::kLarge);
  assert(best.has_value());
  std::uint64_t total = 0;
  for (auto algorithm : available) total += history->Score(SizeBucket::kLarge, algorithm)->samples;
  assert(total == available.size() + 1);
}

void TestAdaptiveSmallPayloadUsesFirstCandidate() {
  const auto available = AvailableAlgorithms();
  if (available.empty()) return;

  auto               history = std::make_shared<CompressionHistory>();
  AdaptiveCompressor adaptive(available, history);

  const auto framed = adaptive.Encode(RepetitiveText(200));
  assert(relay::transform::ReadFrame(framed).algorithm == available.front());
  assert(!history->HasSamples(SizeBucket::kSmall));
}

} // namespace

int main() {
  TestFrameHeaderLayout();
  TestGarbageIsNotAFrame();
  TestEveryAvailableCodecRoundTrips();
  TestAnyStrategyDecodesAnyFrame();
  TestEmptyPayloadRoundTrips();
  TestNoneIsNotACodec();
  TestParseAndNames();
  TestBucketBoundaries();
  TestHistoryPrefersRatioThenThroughput();
  TestAdaptiveUsesInjectedHistory();
  TestAdaptiveSamplesEveryCandidateOnce();
  TestAdaptiveSmallPayloadUsesFirstCandidate();

  std::cout << "relay_unit_compression: pass\n";
  return 0;
}
