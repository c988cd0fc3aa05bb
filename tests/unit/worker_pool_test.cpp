#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>

#include "internal/dispatch/work_queue.hpp"
#include "internal/dispatch/worker_pool.hpp"

namespace {

using namespace std::chrono_literals;
using castproxy::dispatch::WorkerPool;
using castproxy::dispatch::WorkQueue;

// Blocks tasks until released so tests can observe concurrency.
class Gate {
 public:
  void Wait() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return open_; });
  }

  void Open() {
    {
      std::lock_guard lock(mutex_);
      open_ = true;
    }
    cv_.notify_all();
  }

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    open_ = false;
};

template <typename Pred>
bool WaitFor(Pred pred, std::chrono::milliseconds limit = 2000ms) {
  const auto deadline = std::chrono::steady_clock::now() + limit;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(2ms);
  }
  return pred();
}

void TestQueueRefusesBeyondCapacity() {
  WorkQueue queue(2);
  assert(queue.TryEnqueue([] {}));
  assert(queue.TryEnqueue([] {}));
  assert(!queue.TryEnqueue([] {}));
  assert(queue.Size() == 2);

  assert(queue.Dequeue().has_value());
  assert(queue.TryEnqueue([] {}));
}

void TestShutdownReleasesWaiters() {
  WorkQueue   queue(4);
  std::thread waiter([&queue] { assert(!queue.Dequeue().has_value()); });
  std::this_thread::sleep_for(20ms);
  queue.Shutdown();
  waiter.join();
  assert(!queue.TryEnqueue([] {}));
}

void TestBlockedTaskDoesNotStallOthers() {
  auto       queue = std::make_shared<WorkQueue>(16);
  WorkerPool pool(queue, 2);
  pool.Start();

  Gate             gate;
  std::atomic<int> completed{0};

  // a slow store read on one datagram
  assert(pool.Submit([&] {
    gate.Wait();
    ++completed;
  }));

  // other datagrams keep flowing on the remaining thread
  for (int i = 0; i < 5; ++i) {
    assert(pool.Submit([&] { ++completed; }));
  }
  assert(WaitFor([&] { return completed.load() == 5; }));

  gate.Open();
  assert(WaitFor([&] { return completed.load() == 6; }));
  pool.Stop();
}

void TestThrowingTaskDoesNotKillWorker() {
  auto       queue = std::make_shared<WorkQueue>(4);
  WorkerPool pool(queue, 1);
  pool.Start();

  std::atomic<bool> ran{false};
  assert(pool.Submit([] { throw std::runtime_error("boom"); }));
  assert(pool.Submit([&] { ran = true; }));
  assert(WaitFor([&] { return ran.load(); }));
  pool.Stop();
}

void TestSubmitAfterStopIsRefused() {
  auto       queue = std::make_shared<WorkQueue>(4);
  WorkerPool pool(queue, 1);
  assert(!pool.Submit([] {}));

  pool.Start();
  pool.Stop();
  assert(!pool.Submit([] {}));
}

} // namespace

int main() {
  TestQueueRefusesBeyondCapacity();
  TestShutdownReleasesWaiters();
  TestBlockedTaskDoesNotStallOthers();
  TestThrowingTaskDoesNotKillWorker();
  TestSubmitAfterStopIsRefused();

  std::cout << "cast_proxy_unit_worker_pool: pass\n";
  return 0;
}
