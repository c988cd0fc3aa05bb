#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>

namespace castproxy::dispatch {

using Task = std::function<void()>;

/*
  Thread-safe bounded queue feeding the worker pool.

  TryEnqueue never blocks: when the queue is full the task is refused so
  the receive loop is never held up by slow workers.
*/
class WorkQueue {
 public:
  explicit WorkQueue(size_t capacity);

  bool TryEnqueue(Task task);

  // blocking wait; nullopt once shut down
  std::optional<Task> Dequeue();

  // Wakes all waiters. Tasks still queued are abandoned.
  void Shutdown();

  size_t Size();

 private:
  const size_t            capacity_;
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::queue<Task>        queue_;
  bool                    shutdown_ = false;
};

} // namespace castproxy::dispatch
