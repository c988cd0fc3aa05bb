#include "work_queue.hpp"

namespace castproxy::dispatch {

WorkQueue::WorkQueue(size_t capacity) : capacity_(capacity) {
}

bool WorkQueue::TryEnqueue(Task task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_ || queue_.size() >= capacity_) return false;
    queue_.push(std::move(task));
  }
  cv_.notify_one();
  return true;
}

std::optional<Task> WorkQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_) return std::nullopt;

  Task task = std::move(queue_.front());
  queue_.pop();
  return task;
}

void WorkQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
    std::queue<Task>().swap(queue_);
  }
  cv_.notify_all();
}

size_t WorkQueue::Size() {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace castproxy::dispatch
