#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/config/relay_settings.hpp"
#include "internal/transform/aes_gcm_encryptor.hpp"
#include "internal/transform/codec_compressor.hpp"
#include "internal/transform/compression_frame.hpp"
#include "internal/transform/key_ring.hpp"
#include "internal/transform/transform_factory.hpp"
#include "internal/transform/transform_pipeline.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using relay::transform::CompressionAlgorithm;
using relay::transform::TransformPipeline;

// Compresses to a frame tagged with the given algorithm, or fails on demand.
class ScriptedCompressor : public relay::transform::CompressionStrategy {
 public:
  bool fail = false;

  std::string Encode(std::string_view input) override {
    if (fail) throw relay::util::CompressionFailure("scripted failure");
    ++encodes;
    return relay::transform::EncodeFramed(CompressionAlgorithm::kGzip, input, 0);
  }
  std::string Decode(std::string_view framed) const override {
    return relay::transform::DecodeFramed(framed);
  }
  std::string Name() const override {
    return "scripted";
  }

  int encodes = 0;
};

std::shared_ptr<relay::transform::EncryptionStrategy> MakeEncryptor() {
  return std::make_shared<relay::transform::AesGcmEncryptor>(std::make_shared<relay::transform::KeyRing>(24h, 24h));
}

std::string Body() {
  std::string body;
  for (int i = 0; i < 200; ++i) body += "{\"content\":\"token\"}";
  return body;
}

void TestPassThrough() {
  TransformPipeline pipeline(std::make_shared<ScriptedCompressor>(), nullptr);
  auto              stored = pipeline.Encode("plain", false, false);
  assert(stored.data == "plain");
  assert(stored.compression == CompressionAlgorithm::kNone);
  assert(!stored.key_epoch.has_value());
  assert(stored.original_size == 5);
  assert(pipeline.Decode(stored) == "plain");
}

void TestCompressOnly() {
  if (!relay::transform::IsAlgorithmAvailable(CompressionAlgorithm::kGzip)) return;

  TransformPipeline pipeline(std::make_shared<ScriptedCompressor>(), nullptr);
  const auto        body   = Body();
  auto              stored = pipeline.Encode(body, true, false);
  assert(stored.compression == CompressionAlgorithm::kGzip);
  assert(stored.data.size() < body.size());
  assert(stored.original_size == body.size());
  assert(pipeline.Decode(stored) == body);
}

void TestCompressThenEncrypt() {
  if (!relay::transform::IsAlgorithmAvailable(CompressionAlgorithm::kGzip)) return;

  TransformPipeline pipeline(std::make_shared<ScriptedCompressor>(), MakeEncryptor());
  const auto        body   = Body();
  auto              stored = pipeline.Encode(body, true, true);
  assert(stored.key_epoch == 1u);
  assert(stored.compression == CompressionAlgorithm::kGzip);

  // ciphertext of a small frame, not of the raw body
  assert(stored.data.size() < body.size());
  assert(stored.data.find("token") == std::string::npos);
  assert(pipeline.Decode(stored) == body);
}

void TestCompressionFailureStoresUncompressed() {
  auto compressor  = std::make_shared<ScriptedCompressor>();
  compressor->fail = true;

  TransformPipeline pipeline(compressor, MakeEncryptor());
  auto              stored = pipeline.Encode("keep me", true, true);
  assert(stored.compression == CompressionAlgorithm::kNone);
  assert(stored.key_epoch.has_value());
  assert(pipeline.Decode(stored) == "keep me");
}

void TestEncryptWithoutStrategyIsRejected() {
  TransformPipeline pipeline(std::make_shared<ScriptedCompressor>(), nullptr);
  bool              threw = false;
  try {
    (void)pipeline.Encode("x", false, true);
  } catch (const relay::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestEncryptedPayloadWithoutStrategyFailsDecode() {
  TransformPipeline writer(std::make_shared<ScriptedCompressor>(), MakeEncryptor());
  TransformPipeline reader(std::make_shared<ScriptedCompressor>(), nullptr);

  auto stored = writer.Encode("secret", false, true);
  bool threw  = false;
  try {
    (void)reader.Decode(stored);
  } catch (const relay::util::DecryptionError&) {
    threw = true;
  }
  assert(threw);
}

void TestFactoryHonorsEncryptionSwitch() {
  relay::config::RelaySettings     relay_settings;
  relay::config::TransformSettings transform_settings;
  transform_settings.algorithm = relay::runtime::config::COMPRESSION_ALGORITHM_GZIP;

  relay_settings.encryption_enabled = false;
  auto plain                        = relay::transform::BuildTransformPipeline(relay_settings, transform_settings);
  assert(plain->HasCompression());
  assert(!plain->HasEncryption());

  relay_settings.encryption_enabled = true;
  auto sealed                       = relay::transform::BuildTransformPipeline(relay_settings, transform_settings);
  assert(sealed->HasEncryption());
  assert(sealed->Encryption()->Name() == "aes-256-gcm");
  assert(sealed->Compression()->Name() == "gzip");
}

void TestFactoryBuildsAdaptive() {
  relay::config::TransformSettings settings;
  settings.algorithm           = relay::runtime::config::COMPRESSION_ALGORITHM_ADAPTIVE;
  settings.adaptive_candidates = {relay::runtime::config::COMPRESSION_ALGORITHM_ZSTD, relay::runtime::config::COMPRESSION_ALGORITHM_LZ4};
  assert(relay::transform::BuildCompression(settings)->Name() == "adaptive");
}

} // namespace

int main() {
  TestPassThrough();
  TestCompressOnly();
  TestCompressThenEncrypt();
  TestCompressionFailureStoresUncompressed();
  TestEncryptWithoutStrategyIsRejected();
  TestEncryptedPayloadWithoutStrategyFailsDecode();
  TestFactoryHonorsEncryptionSwitch();
  TestFactoryBuildsAdaptive();

  std::cout << "relay_unit_transform_pipeline: pass\n";
  return 0;
}
