#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "internal/transform/compression_strategy.hpp"

namespace relay::transform {

/*
  Frame layout:

    [0]    magic 0xC5
    [1]    algorithm id (CompressionAlgorithm)
    [2..5] original length, little endian u32
    [6..]  codec output
*/
inline constexpr std::uint8_t kFrameMagic      = 0xC5;
inline constexpr std::size_t  kFrameHeaderSize = 6;

struct FrameView {
  CompressionAlgorithm algorithm = CompressionAlgorithm::kNone;
  std::uint32_t        original_size = 0;
  std::string_view     body;
};

FrameView   ReadFrame(std::string_view framed);
std::string WriteFrame(CompressionAlgorithm algorithm, std::uint32_t original_size, std::string_view body);

// Raw codec calls backed by arrow::util::Codec.
std::string CompressRaw(CompressionAlgorithm algorithm, std::string_view input, int level);
std::string DecompressRaw(CompressionAlgorithm algorithm, std::string_view body, std::uint32_t original_size);

std::string EncodeFramed(CompressionAlgorithm algorithm, std::string_view input, int level);
std::string DecodeFramed(std::string_view framed);

bool IsAlgorithmAvailable(CompressionAlgorithm algorithm);

} // namespace relay::transform
