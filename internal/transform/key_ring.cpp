#include "key_ring.hpp"

#include <openssl/rand.h>

#include <mutex>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace relay::transform {

KeyBytes GenerateKey() {
  KeyBytes key{};
  if (RAND_bytes(key.data(), static_cast<int>(key.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed generating an encryption key");
  }
  return key;
}

KeyRing::KeyRing(std::chrono::milliseconds rotation_interval, std::chrono::milliseconds retention, util::TimePoint now)
    : KeyRing(GenerateKey(), rotation_interval, retention, now) {
}

KeyRing::KeyRing(const KeyBytes& initial_key, std::chrono::milliseconds rotation_interval, std::chrono::milliseconds retention,
                 util::TimePoint now)
    : rotation_interval_(rotation_interval), retention_(retention), current_epoch_(1), last_rotation_(now) {
  keys_[1] = KeyMaterial{.epoch = 1, .key = initial_key, .created_at = now, .retired_at = std::nullopt};
}

KeyMaterial KeyRing::Current() const {
  std::shared_lock lock(mutex_);
  return keys_.at(current_epoch_);
}

std::optional<KeyMaterial> KeyRing::Find(std::uint32_t epoch) const {
  std::shared_lock lock(mutex_);
  auto             it = keys_.find(epoch);
  if (it == keys_.end()) return std::nullopt;
  return it->second;
}

bool KeyRing::ShouldRotate(util::TimePoint now) const {
  std::shared_lock lock(mutex_);
  return now - last_rotation_ > rotation_interval_;
}

std::uint32_t KeyRing::Rotate(util::TimePoint now) {
  auto fresh = GenerateKey();

  std::unique_lock lock(mutex_);
  keys_.at(current_epoch_).retired_at = now;

  const auto epoch = current_epoch_ + 1;
  keys_[epoch]     = KeyMaterial{.epoch = epoch, .key = fresh, .created_at = now, .retired_at = std::nullopt};
  current_epoch_   = epoch;
  last_rotation_   = now;

  Prune(now);

  RELAY_LOG_INFO("encryption key rotated",
                 {observability::IntField("epoch", epoch), observability::IntField("retained_keys", static_cast<std::int64_t>(keys_.size()))});
  return epoch;
}

void KeyRing::Prune(util::TimePoint now) {
  for (auto it = keys_.begin(); it != keys_.end();) {
    const auto& material = it->second;
    if (material.retired_at && *material.retired_at + retention_ < now) {
      it = keys_.erase(it);
    } else {
      ++it;
    }
  }
}

util::TimePoint KeyRing::LastRotation() const {
  std::shared_lock lock(mutex_);
  return last_rotation_;
}

std::size_t KeyRing::Size() const {
  std::shared_lock lock(mutex_);
  return keys_.size();
}

} // namespace relay::transform
