#pragma once

#include <atomic>
#include <cstddef>
#include <future>
#include <memory>
#include <thread>
#include <stdexcept>
#include <type_traits>
#include <vector>

#include "internal/worker/task_queue.hpp"

namespace relay::worker {

/*
  Fixed-size worker pool for CPU-bound transform work (compression,
  encryption) so it cannot stall RPC threads of unrelated connections.

  Submit blocks while the queue is full. Exceptions thrown by a task
  surface through its future.
*/
class TransformPool {
 public:
  TransformPool(std::size_t threads, std::size_t queue_capacity);
  ~TransformPool();

  TransformPool(const TransformPool&)            = delete;
  TransformPool& operator=(const TransformPool&) = delete;

  void Start();
  void Stop();

  template <typename F>
  std::future<std::invoke_result_t<F>> Submit(F&& fn) {
    using R   = std::invoke_result_t<F>;
    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
    auto fut  = task->get_future();
    if (!queue_.Enqueue([task] { (*task)(); })) {
      throw std::runtime_error("transform pool is stopped");
    }
    return fut;
  }

  std::size_t Threads() const {
    return thread_count_;
  }
  std::size_t Pending() const {
    return queue_.Size();
  }

 private:
  void Run();

  const std::size_t        thread_count_;
  TaskQueue                queue_;
  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};
};

} // namespace relay::worker
