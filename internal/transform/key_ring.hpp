#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>

#include "internal/util/time.hpp"

namespace relay::transform {

inline constexpr std::size_t kKeySize = 32;
using KeyBytes                        = std::array<std::uint8_t, kKeySize>;

struct KeyMaterial {
  std::uint32_t                  epoch = 0;
  KeyBytes                       key{};
  util::TimePoint                created_at{};
  std::optional<util::TimePoint> retired_at;
};

/*
  KeyRing

  Epoch-numbered symmetric keys. Epochs start at 1 and increase by one
  per rotation. A retired key is kept until retired_at + retention, then
  pruned on the next rotation.
*/
class KeyRing {
 public:
  KeyRing(std::chrono::milliseconds rotation_interval, std::chrono::milliseconds retention, util::TimePoint now = util::Now());

  // Seeds epoch 1 with a caller supplied key.
  KeyRing(const KeyBytes& initial_key, std::chrono::milliseconds rotation_interval, std::chrono::milliseconds retention,
          util::TimePoint now = util::Now());

  KeyMaterial                Current() const;
  std::optional<KeyMaterial> Find(std::uint32_t epoch) const;

  bool          ShouldRotate(util::TimePoint now) const;
  std::uint32_t Rotate(util::TimePoint now);

  util::TimePoint           LastRotation() const;
  std::chrono::milliseconds RotationInterval() const {
    return rotation_interval_;
  }
  std::size_t Size() const;

 private:
  void Prune(util::TimePoint now);

  const std::chrono::milliseconds rotation_interval_;
  const std::chrono::milliseconds retention_;

  mutable std::shared_mutex               mutex_;
  std::map<std::uint32_t, KeyMaterial>    keys_;
  std::uint32_t                           current_epoch_ = 0;
  util::TimePoint                         last_rotation_{};
};

KeyBytes GenerateKey();

} // namespace relay::transform
