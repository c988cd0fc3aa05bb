#include "worker_pool.hpp"

#include "internal/observability/logging.hpp"

namespace castproxy::dispatch {

WorkerPool::WorkerPool(std::shared_ptr<WorkQueue> queue, size_t threads) : queue_(std::move(queue)), thread_count_(threads) {
}

WorkerPool::~WorkerPool() {
  Stop();
}

void WorkerPool::Start() {
  if (running_.exchange(true)) return;
  threads_.reserve(thread_count_);
  for (size_t i = 0; i < thread_count_; ++i) {
    threads_.emplace_back(&WorkerPool::Run, this);
  }
}

void WorkerPool::Stop() {
  if (!running_.exchange(false)) return;
  queue_->Shutdown();
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
}

bool WorkerPool::Submit(Task task) {
  if (!running_) return false;
  return queue_->TryEnqueue(std::move(task));
}

void WorkerPool::Run() {
  while (running_) {
    auto task = queue_->Dequeue();
    if (!task) break;

    try {
      (*task)();
    } catch (const std::exception& e) {
      CASTPROXY_LOG_ERROR("worker task failed", {castproxy::observability::StringField("error", e.what())});
    }
  }
}

} // namespace castproxy::dispatch
