#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>

namespace relay::worker {

using Task = std::function<void()>;

/*
  Bounded blocking queue for transform workers.

  Enqueue blocks while the queue is at capacity. After Shutdown,
  Enqueue returns false and Dequeue drains what is left, then returns
  nullopt.
*/
class TaskQueue {
 public:
  explicit TaskQueue(std::size_t capacity);

  bool Enqueue(Task task);

  // blocking wait
  std::optional<Task> Dequeue();

  void Shutdown();

  std::size_t Size() const;
  std::size_t Capacity() const {
    return capacity_;
  }

 private:
  const std::size_t       capacity_;
  mutable std::mutex      mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::queue<Task>        queue_;
  bool                    shutdown_ = false;
};

} // namespace relay::worker
