#include "metrics_cache.hpp"

#include <mutex>

namespace relay::cache {

InMemoryMetricsCache::InMemoryMetricsCache(ClockFn clock) : clock_(std::move(clock)) {
}

// ------------------------------------------------------------
// Set
// ------------------------------------------------------------

void InMemoryMetricsCache::Set(const std::string& key, std::string value, std::chrono::seconds ttl) {
  const auto       now = clock_();
  std::unique_lock lock(mutex_);
  EvictExpired(now);
  entries_[key] = Entry{std::move(value), now + ttl};
}

// ------------------------------------------------------------
// Get
// ------------------------------------------------------------

std::optional<std::string> InMemoryMetricsCache::Get(const std::string& key) const {
  const auto       now = clock_();
  std::shared_lock lock(mutex_);

  auto it = entries_.find(key);
  if (it == entries_.end() || it->second.expires_at <= now) return std::nullopt;

  return it->second.value;
}

void InMemoryMetricsCache::Remove(const std::string& key) {
  std::unique_lock lock(mutex_);
  entries_.erase(key);
}

std::size_t InMemoryMetricsCache::Size() const {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

void InMemoryMetricsCache::EvictExpired(util::TimePoint now) {
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (it->second.expires_at <= now) {
      it = entries_.erase(it);
    } else {
      ++it;
    }
  }
}

} // namespace relay::cache
