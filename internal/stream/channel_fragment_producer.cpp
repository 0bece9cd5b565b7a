#include "channel_fragment_producer.hpp"

#include <utility>

#include "internal/util/errors.hpp"

namespace relay::stream {

ChannelFragmentProducer::ChannelFragmentProducer(std::chrono::milliseconds poll_interval) : poll_interval_(poll_interval) {
}

bool ChannelFragmentProducer::Push(model::Fragment fragment) {
  {
    std::lock_guard lock(mutex_);
    if (finished_ || closed_ || failure_) return false;
    queue_.push_back(std::move(fragment));
  }
  cv_.notify_one();
  return true;
}

void ChannelFragmentProducer::Finish() {
  {
    std::lock_guard lock(mutex_);
    finished_ = true;
  }
  cv_.notify_all();
}

void ChannelFragmentProducer::Fail(std::string message) {
  {
    std::lock_guard lock(mutex_);
    if (!failure_) failure_ = std::move(message);
  }
  cv_.notify_all();
}

void ChannelFragmentProducer::Close() {
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
    queue_.clear();
  }
  cv_.notify_all();
}

bool ChannelFragmentProducer::IsClosed() const {
  std::lock_guard lock(mutex_);
  return closed_;
}

std::optional<model::Fragment> ChannelFragmentProducer::Next(const CancellationToken& token) {
  std::unique_lock lock(mutex_);
  while (true) {
    // poll so a token cancelled without a notify is still noticed
    cv_.wait_for(lock, poll_interval_, [this] { return closed_ || finished_ || failure_ || !queue_.empty(); });

    if (closed_ || token.IsCancelled()) {
      return std::nullopt;
    }
    if (!queue_.empty()) {
      auto fragment = std::move(queue_.front());
      queue_.pop_front();
      return fragment;
    }
    if (failure_) {
      throw util::UpstreamGenerationError(*failure_);
    }
    if (finished_) {
      return std::nullopt;
    }
  }
}

} // namespace relay::stream
