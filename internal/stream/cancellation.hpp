#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>

namespace relay::stream {

/*
  Cooperative cancellation signal for one stream.

  Cancel() is sticky. A probe can be attached so an external condition
  (e.g. the transport reporting a disconnected client) also reads as
  cancelled without anyone calling Cancel().
*/
class CancellationToken {
 public:
  void Cancel();
  bool IsCancelled() const;

  void SetProbe(std::function<bool()> probe);

 private:
  mutable std::atomic<bool> cancelled_{false};
  mutable std::mutex    mutex_;
  std::function<bool()> probe_;
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

} // namespace relay::stream
