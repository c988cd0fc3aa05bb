#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include "work_queue.hpp"

namespace castproxy::dispatch {

/*
  Fixed set of threads running queued datagram work.

  Each task is independent; a task blocked on a slow store read or a
  firewall command occupies one thread and leaves the others free.
*/
class WorkerPool {
 public:
  WorkerPool(std::shared_ptr<WorkQueue> queue, size_t threads);
  ~WorkerPool();

  WorkerPool(const WorkerPool&)            = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void Start();
  void Stop();

  // false when the queue is full or the pool is stopped
  bool Submit(Task task);

 private:
  void Run();

  std::shared_ptr<WorkQueue> queue_;
  size_t                     thread_count_;

  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};
};

} // namespace castproxy::dispatch
