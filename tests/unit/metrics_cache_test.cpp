#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

#include "internal/cache/metrics_cache.hpp"

namespace {

using namespace std::chrono_literals;
using relay::cache::InMemoryMetricsCache;

struct ManualClock {
  relay::util::TimePoint now = relay::util::TimePoint{} + 1000h;
};

void TestSetGetRemove() {
  ManualClock          clock;
  InMemoryMetricsCache cache([&] { return clock.now; });

  assert(!cache.Get("streaming_metrics").has_value());
  cache.Set("streaming_metrics", "{\"totalConnections\":3}", 300s);
  assert(cache.Get("streaming_metrics") == std::string("{\"totalConnections\":3}"));

  cache.Set("streaming_metrics", "{\"totalConnections\":4}", 300s);
  assert(cache.Get("streaming_metrics") == std::string("{\"totalConnections\":4}"));
  assert(cache.Size() == 1);

  cache.Remove("streaming_metrics");
  assert(!cache.Get("streaming_metrics").has_value());
}

void TestEntriesExpire() {
  ManualClock          clock;
  InMemoryMetricsCache cache([&] { return clock.now; });

  cache.Set("a", "1", 10s);
  clock.now += 9s;
  assert(cache.Get("a").has_value());
  clock.now += 1s;
  assert(!cache.Get("a").has_value());

  // expired entries are dropped on the next write
  assert(cache.Size() == 1);
  cache.Set("b", "2", 10s);
  assert(cache.Size() == 1);
}

} // namespace

int main() {
  TestSetGetRemove();
  TestEntriesExpire();

  std::cout << "relay_unit_metrics_cache: pass\n";
  return 0;
}
