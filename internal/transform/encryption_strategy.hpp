#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"

namespace relay::transform {

struct EncryptedPayload {
  std::string   bytes;
  std::uint32_t key_epoch = 0;
};

struct KeyInfo {
  std::uint32_t             epoch = 0;
  util::TimePoint           created_at{};
  util::TimePoint           last_rotation{};
  std::chrono::milliseconds rotation_interval{0};
  std::size_t               retained_keys = 0;
};

/*
  Authenticated symmetric encryption with key epochs.

  Every Encode result names the epoch whose key produced it; Decode
  needs that epoch back. Rotation is forward-only: already stored
  ciphertext keeps its epoch and stays decodable while the retired key
  is retained.

  Decode throws util::DecryptionError, never returns unauthenticated bytes.
*/
class EncryptionStrategy {
 public:
  virtual ~EncryptionStrategy() = default;

  virtual EncryptedPayload Encode(std::string_view plaintext) = 0;
  virtual std::string      Decode(std::string_view ciphertext, std::uint32_t key_epoch) const = 0;

  virtual bool          ShouldRotate(util::TimePoint now) const = 0;
  virtual std::uint32_t Rotate(util::TimePoint now)             = 0;
  virtual KeyInfo       CurrentKey() const                      = 0;
  virtual std::string   Name() const                            = 0;
};

} // namespace relay::transform
