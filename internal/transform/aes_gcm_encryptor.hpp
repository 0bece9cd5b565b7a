#pragma once

#include <memory>

#include "internal/transform/encryption_strategy.hpp"
#include "internal/transform/key_ring.hpp"

namespace relay::transform {

/*
  AES-256-GCM over OpenSSL EVP.

  Output: nonce(12) || tag(16) || ciphertext. The key epoch is bound as
  additional authenticated data, so decoding with the wrong epoch fails
  authentication instead of producing garbage.
*/
class AesGcmEncryptor : public EncryptionStrategy {
 public:
  static constexpr std::size_t kNonceSize = 12;
  static constexpr std::size_t kTagSize   = 16;

  explicit AesGcmEncryptor(std::shared_ptr<KeyRing> keys);

  EncryptedPayload Encode(std::string_view plaintext) override;
  std::string      Decode(std::string_view ciphertext, std::uint32_t key_epoch) const override;

  bool          ShouldRotate(util::TimePoint now) const override;
  std::uint32_t Rotate(util::TimePoint now) override;
  KeyInfo       CurrentKey() const override;
  std::string   Name() const override;

 private:
  std::shared_ptr<KeyRing> keys_;
};

} // namespace relay::transform
