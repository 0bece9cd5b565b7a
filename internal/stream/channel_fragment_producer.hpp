#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

#include "internal/stream/fragment_producer.hpp"

namespace relay::stream {

/*
  FragmentProducer fed by another thread (the Publish RPC).

  Fragments pushed before Finish() or Fail() are still delivered; a
  failure is raised only once the queue is drained.
*/
class ChannelFragmentProducer : public FragmentProducer {
 public:
  explicit ChannelFragmentProducer(std::chrono::milliseconds poll_interval = std::chrono::milliseconds(50));

  // False once the producer is finished, failed or closed.
  bool Push(model::Fragment fragment);
  void Finish();
  void Fail(std::string message);

  std::optional<model::Fragment> Next(const CancellationToken& token) override;
  void                           Close() override;

  bool IsClosed() const;

 private:
  const std::chrono::milliseconds poll_interval_;

  mutable std::mutex          mutex_;
  std::condition_variable     cv_;
  std::deque<model::Fragment> queue_;
  bool                        finished_ = false;
  bool                        closed_   = false;
  std::optional<std::string>  failure_;
};

} // namespace relay::stream
