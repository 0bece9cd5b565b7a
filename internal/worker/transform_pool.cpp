#include "transform_pool.hpp"

#include "internal/observability/logging.hpp"

namespace relay::worker {

TransformPool::TransformPool(std::size_t threads, std::size_t queue_capacity)
    : thread_count_(threads == 0 ? 1 : threads), queue_(queue_capacity) {
}

TransformPool::~TransformPool() {
  Stop();
}

void TransformPool::Start() {
  if (running_.exchange(true)) return;

  threads_.reserve(thread_count_);
  for (std::size_t i = 0; i < thread_count_; ++i) {
    threads_.emplace_back(&TransformPool::Run, this);
  }
  RELAY_LOG_INFO("transform pool started", {observability::IntField("threads", static_cast<std::int64_t>(thread_count_)),
                                            observability::IntField("queue_capacity", static_cast<std::int64_t>(queue_.Capacity()))});
}

void TransformPool::Stop() {
  queue_.Shutdown();
  running_ = false;
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
}

void TransformPool::Run() {
  while (true) {
    auto task = queue_.Dequeue();
    if (!task) break;

    // packaged_task stores the exception in the future
    (*task)();
  }
}

} // namespace relay::worker
