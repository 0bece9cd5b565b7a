#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace relay::transform {

enum class CompressionAlgorithm : std::uint8_t {
  kNone   = 0,
  kGzip   = 1,
  kZstd   = 2,
  kLz4    = 3,
  kBrotli = 4,
  kSnappy = 5,
};

std::string_view                    ToString(CompressionAlgorithm algorithm);
std::optional<CompressionAlgorithm> ParseCompressionAlgorithm(std::string_view name);

/*
  Lossless byte compressor.

  Encode output is self-describing (see compression_frame.hpp) so any
  strategy can decode data written by any other, including algorithms
  an adaptive strategy picked for historical batches.

  Implementations throw util::CompressionFailure.
*/
class CompressionStrategy {
 public:
  virtual ~CompressionStrategy() = default;

  virtual std::string Encode(std::string_view input) = 0;
  virtual std::string Decode(std::string_view framed) const = 0;
  virtual std::string Name() const = 0;
};

} // namespace relay::transform
