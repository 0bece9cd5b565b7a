#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/util/time.hpp"

namespace relay::cache {

/*
  Short-TTL key/value store for published metrics snapshots.
  Values are opaque strings (JSON documents in practice).
*/
class MetricsCache {
 public:
  virtual ~MetricsCache() = default;

  virtual void                       Set(const std::string& key, std::string value, std::chrono::seconds ttl) = 0;
  virtual std::optional<std::string> Get(const std::string& key) const                                        = 0;
  virtual void                       Remove(const std::string& key)                                           = 0;
};

/*
  In-process MetricsCache.

  Expired entries read as missing and are dropped lazily on the next
  write.
*/
class InMemoryMetricsCache final : public MetricsCache {
 public:
  using ClockFn = std::function<util::TimePoint()>;

  explicit InMemoryMetricsCache(ClockFn clock = util::Now);

  void                       Set(const std::string& key, std::string value, std::chrono::seconds ttl) override;
  std::optional<std::string> Get(const std::string& key) const override;
  void                       Remove(const std::string& key) override;

  std::size_t Size() const;

 private:
  struct Entry {
    std::string     value;
    util::TimePoint expires_at;
  };

  void EvictExpired(util::TimePoint now);

  ClockFn                                clock_;
  mutable std::shared_mutex              mutex_;
  std::unordered_map<std::string, Entry> entries_;
};

} // namespace relay::cache
