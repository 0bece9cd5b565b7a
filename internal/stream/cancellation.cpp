#include "cancellation.hpp"

#include <utility>

namespace relay::stream {

void CancellationToken::Cancel() {
  cancelled_.store(true);
}

bool CancellationToken::IsCancelled() const {
  if (cancelled_.load()) return true;

  std::lock_guard lock(mutex_);
  if (probe_ && probe_()) {
    cancelled_.store(true);
    return true;
  }
  return false;
}

void CancellationToken::SetProbe(std::function<bool()> probe) {
  std::lock_guard lock(mutex_);
  probe_ = std::move(probe);
}

} // namespace relay::stream
