#include "compression_frame.hpp"

#include <arrow/result.h>
#include <arrow/status.h>
#include <arrow/util/compression.h>

#include <limits>

#include "internal/util/errors.hpp"

namespace relay::transform {

namespace {

arrow::Compression::type ToArrow(CompressionAlgorithm algorithm) {
  switch (algorithm) {
    case CompressionAlgorithm::kGzip:
      return arrow::Compression::GZIP;
    case CompressionAlgorithm::kZstd:
      return arrow::Compression::ZSTD;
    case CompressionAlgorithm::kLz4:
      return arrow::Compression::LZ4_FRAME;
    case CompressionAlgorithm::kBrotli:
      return arrow::Compression::BROTLI;
    case CompressionAlgorithm::kSnappy:
      return arrow::Compression::SNAPPY;
    case CompressionAlgorithm::kNone:
      break;
  }
  return arrow::Compression::UNCOMPRESSED;
}

std::unique_ptr<arrow::util::Codec> MakeCodec(CompressionAlgorithm algorithm, int level) {
  const int resolved_level = level == 0 ? arrow::util::kUseDefaultCompressionLevel : level;
  auto      codec          = arrow::util::Codec::Create(ToArrow(algorithm), resolved_level);
  if (!codec.ok()) {
    throw util::CompressionFailure("codec " + std::string(ToString(algorithm)) + " unavailable: " + codec.status().ToString());
  }
  return std::move(codec).ValueOrDie();
}

} // namespace

std::string_view ToString(CompressionAlgorithm algorithm) {
  switch (algorithm) {
    case CompressionAlgorithm::kNone:
      return "none";
    case CompressionAlgorithm::kGzip:
      return "gzip";
    case CompressionAlgorithm::kZstd:
      return "zstd";
    case CompressionAlgorithm::kLz4:
      return "lz4";
    case CompressionAlgorithm::kBrotli:
      return "brotli";
    case CompressionAlgorithm::kSnappy:
      return "snappy";
  }
  return "none";
}

std::optional<CompressionAlgorithm> ParseCompressionAlgorithm(std::string_view name) {
  if (name == "none") return CompressionAlgorithm::kNone;
  if (name == "gzip") return CompressionAlgorithm::kGzip;
  if (name == "zstd") return CompressionAlgorithm::kZstd;
  if (name == "lz4") return CompressionAlgorithm::kLz4;
  if (name == "brotli") return CompressionAlgorithm::kBrotli;
  if (name == "snappy") return CompressionAlgorithm::kSnappy;
  return std::nullopt;
}

bool IsAlgorithmAvailable(CompressionAlgorithm algorithm) {
  return algorithm != CompressionAlgorithm::kNone && arrow::util::Codec::IsAvailable(ToArrow(algorithm));
}

FrameView ReadFrame(std::string_view framed) {
  if (framed.size() < kFrameHeaderSize || static_cast<std::uint8_t>(framed[0]) != kFrameMagic) {
    throw util::CompressionFailure("payload is not a compression frame");
  }

  const auto id = static_cast<std::uint8_t>(framed[1]);
  if (id == 0 || id > static_cast<std::uint8_t>(CompressionAlgorithm::kSnappy)) {
    throw util::CompressionFailure("unknown compression algorithm id " + std::to_string(id));
  }

  FrameView view;
  view.algorithm     = static_cast<CompressionAlgorithm>(id);
  view.original_size = static_cast<std::uint32_t>(static_cast<std::uint8_t>(framed[2])) |
                       static_cast<std::uint32_t>(static_cast<std::uint8_t>(framed[3])) << 8 |
                       static_cast<std::uint32_t>(static_cast<std::uint8_t>(framed[4])) << 16 |
                       static_cast<std::uint32_t>(static_cast<std::uint8_t>(framed[5])) << 24;
  view.body = framed.substr(kFrameHeaderSize);
  return view;
}

std::string WriteFrame(CompressionAlgorithm algorithm, std::uint32_t original_size, std::string_view body) {
  std::string out;
  out.reserve(kFrameHeaderSize + body.size());
  out.push_back(static_cast<char>(kFrameMagic));
  out.push_back(static_cast<char>(algorithm));
  for (int shift = 0; shift < 32; shift += 8) {
    out.push_back(static_cast<char>((original_size >> shift) & 0xFF));
  }
  out.append(body);
  return out;
}

std::string CompressRaw(CompressionAlgorithm algorithm, std::string_view input, int level) {
  if (input.empty()) {
    return {};
  }

  auto       codec   = MakeCodec(algorithm, level);
  const auto* data   = reinterpret_cast<const uint8_t*>(input.data());
  const auto  in_len = static_cast<int64_t>(input.size());

  std::string out(static_cast<std::size_t>(codec->MaxCompressedLen(in_len, data)), '\0');
  auto        written = codec->Compress(in_len, data, static_cast<int64_t>(out.size()), reinterpret_cast<uint8_t*>(out.data()));
  if (!written.ok()) {
    throw util::CompressionFailure(std::string(ToString(algorithm)) + " compress failed: " + written.status().ToString());
  }
  out.resize(static_cast<std::size_t>(*written));
  return out;
}

std::string DecompressRaw(CompressionAlgorithm algorithm, std::string_view body, std::uint32_t original_size) {
  if (original_size == 0) {
    return {};
  }

  auto        codec = MakeCodec(algorithm, 0);
  std::string out(original_size, '\0');
  auto        written = codec->Decompress(static_cast<int64_t>(body.size()), reinterpret_cast<const uint8_t*>(body.data()),
                                          static_cast<int64_t>(out.size()), reinterpret_cast<uint8_t*>(out.data()));
  if (!written.ok()) {
    throw util::CompressionFailure(std::string(ToString(algorithm)) + " decompress failed: " + written.status().ToString());
  }
  if (static_cast<std::uint32_t>(*written) != original_size) {
    throw util::CompressionFailure(std::string(ToString(algorithm)) + " decompress produced " + std::to_string(*written) + " bytes, expected " +
                                   std::to_string(original_size));
  }
  return out;
}

std::string EncodeFramed(CompressionAlgorithm algorithm, std::string_view input, int level) {
  if (input.size() > std::numeric_limits<std::uint32_t>::max()) {
    throw util::CompressionFailure("payload too large for a compression frame");
  }
  return WriteFrame(algorithm, static_cast<std::uint32_t>(input.size()), CompressRaw(algorithm, input, level));
}

std::string DecodeFramed(std::string_view framed) {
  const auto view = ReadFrame(framed);
  return DecompressRaw(view.algorithm, view.body, view.original_size);
}

} // namespace relay::transform
