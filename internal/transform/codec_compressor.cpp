#include "codec_compressor.hpp"

#include <stdexcept>

#include "internal/transform/compression_frame.hpp"
#include "internal/util/errors.hpp"

namespace relay::transform {

CodecCompressor::CodecCompressor(CompressionAlgorithm algorithm, int level) : algorithm_(algorithm), level_(level) {
  if (algorithm_ == CompressionAlgorithm::kNone) {
    throw std::invalid_argument("CodecCompressor needs a real algorithm");
  }
}

std::string CodecCompressor::Encode(std::string_view input) {
  return EncodeFramed(algorithm_, input, level_);
}

std::string CodecCompressor::Decode(std::string_view framed) const {
  return DecodeFramed(framed);
}

std::string CodecCompressor::Name() const {
  return std::string(ToString(algorithm_));
}

} // namespace relay::transform
